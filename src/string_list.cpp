#include "artemis/string_list.hpp"
#include "artemis/errors.hpp"
#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>
#include <regex>

namespace artemis {

using json = nlohmann::json;

namespace {

const char* yaml_kind(const YAML::Node& n){
    switch (n.Type()) {
    case YAML::NodeType::Null: return "null";
    case YAML::NodeType::Scalar: return "scalar";
    case YAML::NodeType::Sequence: return "sequence";
    case YAML::NodeType::Map: return "mapping";
    case YAML::NodeType::Undefined: return "nothing";
    }
    return "unknown";
}

// Plain (unquoted) scalars that the YAML 1.2 core schema resolves to a boolean or a number.
bool resolves_to_non_string(const std::string& plain){
    static const std::regex non_string(
        "true|True|TRUE|false|False|FALSE"
        "|[-+]?[0-9]+|0o[0-7]+|0x[0-9a-fA-F]+"
        "|[-+]?(\\.[0-9]+|[0-9]+(\\.[0-9]*)?)([eE][-+]?[0-9]+)?"
        "|[-+]?\\.(inf|Inf|INF)|\\.(nan|NaN|NAN)");
    return std::regex_match(plain, non_string);
}

} // namespace

std::string write_string_list(const string_list& lines){
    json arr = json::array();
    for (const auto& s : lines) arr.push_back(s);
    try {
        return arr.dump(2, ' ', false) + "\n";
    } catch (const json::type_error& e) {
        throw string_list_error(std::string("string list is not valid UTF-8: ") + e.what());
    }
}

string_list read_string_list(std::string_view text){
    YAML::Node doc;
    try {
        doc = YAML::Load(std::string(text));
    } catch (const YAML::Exception& e) {
        throw string_list_error(std::string("malformed string list: ") + e.what());
    }
    if (!doc.IsSequence())
        throw string_list_error(std::string("string list must be a sequence, got ") + yaml_kind(doc));
    string_list out;
    out.reserve(doc.size());
    for (size_t i = 0; i < doc.size(); ++i) {
        const YAML::Node entry = doc[i];
        // "!" marks a quoted scalar, "?" a plain one
        const bool is_string = entry.IsScalar() && (entry.Tag() == "!" || entry.Tag() == "tag:yaml.org,2002:str" ||
            (entry.Tag() == "?" && !resolves_to_non_string(entry.Scalar())));
        if (!is_string)
            throw string_list_error("entry " + std::to_string(i) + " must be a string, got " +
                (entry.IsScalar() ? std::string("'") + entry.Scalar() + "'" : std::string(yaml_kind(entry))));
        out.push_back(entry.Scalar());
    }
    return out;
}

} // namespace artemis
