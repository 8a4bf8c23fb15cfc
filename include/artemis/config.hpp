#pragma once
#include <string>

namespace artemis {

struct Config {
    bool trace = false;      // ARTEMIS_TRACE: phase/count lines on stderr
    bool diagJson = false;   // ARTEMIS_DIAG_JSON: errors reported as JSON on stderr
    std::string indent{"\t"}; // ARTEMIS_INDENT: "tab" or a number of spaces
};

// Flags accept 1/t/T/y/Y as enabled.
bool env_flag_enabled(const char* name);

// Reads process env vars and constructs a Config.
Config detect_config();

// Process-wide trace switch, read once from ARTEMIS_TRACE.
bool trace_enabled();

} // namespace artemis
