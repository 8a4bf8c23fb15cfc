#include "artemis/diagnostics_json.hpp"
#include <nlohmann/json.hpp>
#include <sstream>
#include <cstdio>

namespace artemis {

using ordered_json = nlohmann::ordered_json;

std::string error_to_json(const error& e, const std::string& file){
    ordered_json entry;
    entry["category"] = e.category();
    entry["code"] = e.code_name();
    entry["message"] = e.what();
    entry["file"] = file;
    entry["line"] = e.line();
    entry["col"] = e.col();
    ordered_json report;
    report["success"] = false;
    report["errors"] = ordered_json::array({entry});
    // messages can quote raw input bytes
    return report.dump(-1, ' ', false, ordered_json::error_handler_t::replace);
}

std::string format_error(const char* prog, const error& e, const std::string& file){
    std::ostringstream os;
    os<<prog<<": "<<file;
    if(e.line()>0) os<<":"<<e.line()<<":"<<e.col();
    os<<": "<<e.category()<<" error ["<<e.code_name()<<"]: "<<e.what();
    return os.str();
}

void report_error(const char* prog, const error& e, const std::string& file, bool as_json){
    const std::string out = as_json ? error_to_json(e, file) : format_error(prog, e, file);
    std::fprintf(stderr, "%s\n", out.c_str());
}

} // namespace artemis
