#include <gtest/gtest.h>
#include <array>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#if !defined(_WIN32)
#include <sys/wait.h>
#endif
#include "artemis/parser.hpp"
#include "artemis/scenario.hpp"
#include "artemis/string_list.hpp"

using namespace artemis;
namespace fs = std::filesystem;

// End-to-end runs of the artemis_ast driver; the build passes its path in ARTEMIS_AST_EXE.
namespace {

struct run_result { int status; std::string output; };

run_result run_driver(const std::string& args){
    std::string cmd = std::string("\"") + ARTEMIS_AST_EXE + "\" " + args + " 2>&1";
    std::array<char, 512> buf{};
#if defined(_WIN32)
    FILE* p = _popen(cmd.c_str(), "r");
#else
    FILE* p = popen(cmd.c_str(), "r");
#endif
    if(!p) return {-1, "popen failed"};
    std::string out;
    while(fgets(buf.data(), (int)buf.size(), p)) out += buf.data();
#if defined(_WIN32)
    int rc = _pclose(p);
#else
    int st = pclose(p);
    int rc = WIFEXITED(st) ? WEXITSTATUS(st) : -1;
#endif
    return {rc, out};
}

std::string quoted(const fs::path& p){ return "\"" + p.string() + "\""; }

void write_text(const fs::path& p, const std::string& text){
    std::ofstream f(p, std::ios::binary); f << text;
}

std::string read_text(const fs::path& p){
    std::ifstream f(p, std::ios::binary);
    std::ostringstream ss; ss << f.rdbuf();
    return ss.str();
}

const char* kScene = "astver = 2.0\nast = {block_00000 = {{\"x\"}, text = {ja = {{\"hello\"}}}, line = 1}}\n";

class Driver : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() / ("artemis_cli_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(dir_);
        fs::create_directories(dir_);
        write_text(dir_ / "scene.ast", kScene);
    }
    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }
    fs::path dir_;
};

} // namespace

TEST_F(Driver, UsageErrorsExitTwo){
    EXPECT_EQ(run_driver("").status, 2);
    auto r = run_driver("translate a b");
    EXPECT_EQ(r.status, 2);
    EXPECT_NE(r.output.find("unknown command 'translate'"), std::string::npos) << r.output;
    EXPECT_EQ(run_driver("extract " + quoted(dir_ / "scene.ast")).status, 2);
    EXPECT_EQ(run_driver("merge a b").status, 2);
}

TEST_F(Driver, ExtractMergePrune){
    auto r = run_driver("extract " + quoted(dir_ / "scene.ast") + " " + quoted(dir_ / "lines.json"));
    ASSERT_EQ(r.status, 0) << r.output;
    EXPECT_EQ(read_string_list(read_text(dir_ / "lines.json")), (string_list{"hello"}));

    // block-style list, as older translation files are written
    write_text(dir_ / "lines.yaml", "- \"world\"\n");
    r = run_driver("merge " + quoted(dir_ / "scene.ast") + " " + quoted(dir_ / "lines.yaml") + " " + quoted(dir_ / "merged.ast"));
    ASSERT_EQ(r.status, 0) << r.output;
    EXPECT_EQ(extract(parse(read_text(dir_ / "merged.ast"))), (string_list{"world"}));

    r = run_driver("prune " + quoted(dir_ / "scene.ast") + " " + quoted(dir_ / "pruned.ast"));
    ASSERT_EQ(r.status, 0) << r.output;
    EXPECT_TRUE(equal(parse(read_text(dir_ / "pruned.ast")), parse("astver = 2.0\nast = {block_00000 = {line = 1}}\n")));
}

TEST_F(Driver, FailuresExitOne){
    write_text(dir_ / "broken.ast", "a = \"abc");
    auto r = run_driver("prune " + quoted(dir_ / "broken.ast") + " " + quoted(dir_ / "out.ast"));
    EXPECT_EQ(r.status, 1);
    EXPECT_NE(r.output.find("broken.ast:1:5: lex error [unterminated-string]: "), std::string::npos) << r.output;
    EXPECT_FALSE(fs::exists(dir_ / "out.ast"));

    write_text(dir_ / "short.json", "[]\n");
    r = run_driver("merge " + quoted(dir_ / "scene.ast") + " " + quoted(dir_ / "short.json") + " " + quoted(dir_ / "out.ast"));
    EXPECT_EQ(r.status, 1);
    EXPECT_NE(r.output.find("tree error [exhausted-input]"), std::string::npos) << r.output;

    r = run_driver("extract " + quoted(dir_ / "missing.ast") + " " + quoted(dir_ / "out.json"));
    EXPECT_EQ(r.status, 1);
    EXPECT_NE(r.output.find("cannot open for reading"), std::string::npos) << r.output;
}

TEST_F(Driver, JsonReportWhenConfigured){
    write_text(dir_ / "broken.ast", "a = \"abc");
#if defined(_WIN32)
    _putenv_s("ARTEMIS_DIAG_JSON", "1");
#else
    setenv("ARTEMIS_DIAG_JSON", "1", 1);
#endif
    auto r = run_driver("prune " + quoted(dir_ / "broken.ast") + " " + quoted(dir_ / "out.ast"));
#if defined(_WIN32)
    _putenv_s("ARTEMIS_DIAG_JSON", "");
#else
    unsetenv("ARTEMIS_DIAG_JSON");
#endif
    EXPECT_EQ(r.status, 1);
    EXPECT_EQ(r.output.find("{\"success\":false,\"errors\":[{\"category\":\"lex\",\"code\":\"unterminated-string\""), 0u) << r.output;
}
