#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include <cstdio>
#include "artemis/parser.hpp"
#include "artemis/printer.hpp"
#include "artemis/scenario.hpp"
#include "artemis/string_list.hpp"
#include "artemis/config.hpp"
#include "artemis/diagnostics_json.hpp"

using namespace artemis;

namespace {

const char* kProg = "artemis_ast";

void usage(){
    std::cerr << "usage: " << kProg << " <command> ...\n"
              << "  extract <input.ast> <output.json>                 write all scenario text to a string list\n"
              << "  prune   <input.ast> <output.ast>                  strip items down to linknext/line\n"
              << "  merge   <input.ast> <strings.json> <output.ast>   put translated text back\n";
}

// Thrown for I/O failures; carries the path for the report.
struct io_failure { std::string path; std::string what; };

std::string read_file(const std::string& path){
    std::ifstream f(path, std::ios::binary);
    if(!f) throw io_failure{path, "cannot open for reading"};
    std::ostringstream ss; ss << f.rdbuf();
    return ss.str();
}

void write_file(const std::string& path, const std::string& data){
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if(!f) throw io_failure{path, "cannot open for writing"};
    f.write(data.data(), static_cast<std::streamsize>(data.size()));
    if(!f) throw io_failure{path, "write failed"};
}

} // namespace

int main(int argc, char** argv){
    if(argc < 2){ usage(); return 2; }
    const std::string cmd = argv[1];
    const bool is_extract = cmd == "extract", is_prune = cmd == "prune", is_merge = cmd == "merge";
    if(!is_extract && !is_prune && !is_merge){ std::cerr << kProg << ": unknown command '" << cmd << "'\n"; usage(); return 2; }
    if((is_merge && argc != 5) || (!is_merge && argc != 4)){ usage(); return 2; }

    const Config cfg = detect_config();
    print_options popts; popts.indent = cfg.indent;
    const std::string input = argv[2];
    std::string current = input; // file named in error reports

    try{
        auto doc = parse(read_file(input), input);
        if(is_extract){
            current = argv[3];
            write_file(argv[3], write_string_list(extract(doc)));
        } else if(is_prune){
            prune(doc);
            current = argv[3];
            write_file(argv[3], document_to_script(doc, popts));
        } else {
            current = argv[3];
            const auto lines = read_string_list(read_file(argv[3]));
            current = input;
            merge(doc, lines);
            current = argv[4];
            write_file(argv[4], document_to_script(doc, popts));
        }
        if(cfg.trace) std::fprintf(stderr, "[dbg][%s] %s done\n", kProg, cmd.c_str());
        return 0;
    } catch(const error& e){
        report_error(kProg, e, current, cfg.diagJson);
        return 1;
    } catch(const io_failure& e){
        std::cerr << kProg << ": " << e.path << ": " << e.what << "\n";
        return 1;
    } catch(const std::exception& e){
        std::cerr << kProg << ": exception: " << e.what() << "\n";
        return 1;
    }
}
