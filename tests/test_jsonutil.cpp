#include <gtest/gtest.h>
#include "../src/core/JsonUtil.h"
#include <nlohmann/json.hpp>
#include <limits>

namespace netgrave {

using jsonutil::escape;
using jsonutil::pretty;
using jsonutil::format_double;

TEST(JsonUtilTest, EscapesQuotesAndBackslashes) {
    EXPECT_EQ(escape("a\"b\\c"), "a\\\"b\\\\c");
}

TEST(JsonUtilTest, EscapesControlCharacters) {
    EXPECT_EQ(escape("line\nnext\ttab"), "line\\nnext\\ttab");
    EXPECT_EQ(escape(std::string("\x01", 1)), "\\u0001");
    EXPECT_EQ(escape(std::string("\x1f", 1)), "\\u001f");
}

TEST(JsonUtilTest, PassesUtf8Through) {
    EXPECT_EQ(escape("caf\xc3\xa9"), "caf\xc3\xa9");
}

TEST(JsonUtilTest, PrettyKeepsDocumentEquivalent) {
    std::string compact = R"({"a":[1,2,{"b":"x,y:{z}"}],"c":{},"d":[]})";
    std::string out = pretty(compact);
    EXPECT_EQ(nlohmann::json::parse(out), nlohmann::json::parse(compact));
    EXPECT_NE(out.find("\n  \"a\": ["), std::string::npos);
    EXPECT_NE(out.find("\"c\": {}"), std::string::npos);
    EXPECT_EQ(out.back(), '\n');
}

TEST(JsonUtilTest, PrettyIgnoresEscapedQuotesInStrings) {
    std::string compact = R"({"k":"say \"hi\", {ok}"})";
    EXPECT_EQ(nlohmann::json::parse(pretty(compact))["k"], "say \"hi\", {ok}");
}

TEST(JsonUtilTest, FormatDouble) {
    EXPECT_EQ(format_double(1.5), "1.500");
    EXPECT_EQ(format_double(-0.25), "-0.250");
    EXPECT_EQ(format_double(std::numeric_limits<double>::infinity()), "0");
}

} // namespace netgrave

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
