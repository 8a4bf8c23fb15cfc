#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include "artemis/parser.hpp"
#include "artemis/printer.hpp"
#include "artemis/errors.hpp"

using namespace artemis;

TEST(Printer, Floats){
    EXPECT_EQ(format_float(2.0), "2.0");
    EXPECT_EQ(format_float(100.0), "100.0");
    EXPECT_EQ(format_float(2.2), "2.2");
    EXPECT_EQ(format_float(0.1), "0.1");
    EXPECT_EQ(format_float(-0.5), "-0.5");
    EXPECT_EQ(format_float(1e21), "1000000000000000000000.0");
    try {
        (void)format_float(std::numeric_limits<double>::quiet_NaN());
        FAIL() << "expected tree_error";
    } catch(const tree_error& e){
        EXPECT_EQ(e.code(), tree_errc::type_mismatch);
    }
    EXPECT_THROW((void)format_float(std::numeric_limits<double>::infinity()), tree_error);
}

TEST(Printer, QuoteInvertsLexerEscapes){
    EXPECT_EQ(quote("plain"), "\"plain\"");
    EXPECT_EQ(quote("say \"hi\"\\\n\t"), "\"say \\\"hi\\\"\\\\\\n\\t\"");
    EXPECT_EQ(quote("妃愛"), "\"妃愛\"");
}

TEST(Printer, Scalars){
    EXPECT_EQ(to_script(*n_i64(-42), 0), "-42");
    EXPECT_EQ(to_script(*n_f64(2.0), 0), "2.0");
    EXPECT_EQ(to_script(*n_str("x"), 0), "\"x\"");
}

TEST(Printer, DocumentLayout){
    EXPECT_EQ(document_to_script(parse("astver = 2.0\n")), "astver = 2.0\n");
    EXPECT_EQ(document_to_script(parse("a = {1, 2}")), "a = {\n\t1,\n\t2\n}\n");
    EXPECT_EQ(document_to_script(parse("a = {}")), "a = {}\n");
    EXPECT_EQ(document_to_script(parse("a = {x = 1}")), "a = {\n\t\n\t\tx=1\n\t\n}\n");
    EXPECT_EQ(document_to_script(parse("a = {{1}}")), "a = {\n\t{\n\t\t1\n\t}\n}\n");
}

TEST(Printer, KeepsSourceKeyOrder){
    const char* src = "b = 1\na = 2\nastver = 2.0\n";
    EXPECT_EQ(document_to_script(parse(src)), src);
}

TEST(Printer, IndentOption){
    print_options opts; opts.indent = "  ";
    EXPECT_EQ(document_to_script(parse("a = {1, {2}}"), opts), "a = {\n  1,\n  {\n    2\n  }\n}\n");
}

TEST(Printer, DocumentMustBeDictionary){
    EXPECT_THROW((void)document_to_script(n_i64(1)), tree_error);
}

TEST(Printer, RoundTrip){
    const char* src = R"(astver = 2.0
ast = {
    block_00000 = {
        {"fg", ch="妃愛", lv=2.2, id=20, mode=-1},
        text = {
            ja = {
                { name = {"妃愛"}, "「お兄、\"あさ\"ー」\n\\", {rt2}, },
            },
        },
        linknext = "block_00001",
        line = 18,
    },
}
)";
    auto doc = parse(src);
    auto text = document_to_script(doc);
    auto again = parse(text);
    EXPECT_TRUE(equal(doc, again)) << text;
    // printing is stable once the source has been normalized
    EXPECT_EQ(document_to_script(again), text);
}

TEST(Printer, CompactToString){
    auto doc = parse("x = {1, a = \"s\", 2.5}");
    EXPECT_EQ(to_string(doc), "[x={1, [a=\"s\"], 2.5}]");
}
