// diagnostics_json.hpp - error reports for the console and for tooling
#pragma once
#include "artemis/errors.hpp"
#include <string>

namespace artemis {

// Serialize one failure (with the file it came from) as a compact JSON report.
std::string error_to_json(const error& e, const std::string& file);

// "<prog>: <file>:<line>:<col>: <category> error [<code>]: <message>"; the position is
// left out when the error has none.
std::string format_error(const char* prog, const error& e, const std::string& file);

// Report `e` on stderr, as JSON when `as_json` (ARTEMIS_DIAG_JSON) is set.
void report_error(const char* prog, const error& e, const std::string& file, bool as_json);

} // namespace artemis
