#include "artemis/config.hpp"
#include <cstdlib>
#include <cstdio>
#include <string>
#include <algorithm>
#include <cctype>

namespace artemis {

bool env_flag_enabled(const char* name){
    const char* v = std::getenv(name);
    return v && (v[0] == '1' || v[0] == 't' || v[0] == 'T' || v[0] == 'y' || v[0] == 'Y');
}

Config detect_config(){
    Config c{};
    auto get = [](const char* k)->const char*{ const char* v = std::getenv(k); return (v && *v) ? v : nullptr; };

    c.trace = env_flag_enabled("ARTEMIS_TRACE");
    c.diagJson = env_flag_enabled("ARTEMIS_DIAG_JSON");

    if (const char* v = get("ARTEMIS_INDENT")) {
        std::string s = v;
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char ch){ return (char)std::tolower(ch); });
        if (s == "tab") {
            c.indent = "\t";
        } else {
            char* end = nullptr;
            long n = std::strtol(v, &end, 10);
            if (end && *end == '\0' && n >= 0 && n <= 16) c.indent.assign(static_cast<size_t>(n), ' ');
            else std::fprintf(stderr, "[warn][config] ignoring ARTEMIS_INDENT='%s' (expected 'tab' or 0-16)\n", v);
        }
    }
    return c;
}

bool trace_enabled(){
    static const bool enabled = env_flag_enabled("ARTEMIS_TRACE");
    return enabled;
}

} // namespace artemis
