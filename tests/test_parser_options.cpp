#include <gtest/gtest.h>
#include "sbeir/parser_options.hpp"

#include <filesystem>
#include <fstream>

using namespace sbeir;

TEST(ParserOptionsTest, Defaults) {
    ParserOptions options;
    EXPECT_TRUE(options.validate);
    EXPECT_FALSE(options.warningsFatal);
    EXPECT_FALSE(options.suppressOutput);
    EXPECT_FALSE(options.xincludeAware);
    EXPECT_EQ(options.defaultCharacterEncoding, "US-ASCII");
    EXPECT_FALSE(options.headerType.has_value());
}

TEST(ParserOptionsTest, FromConfig) {
    ConfigParser parser;
    auto doc = parser.parseString(
        "validation.enabled: false\n"
        "validation.warnings_fatal: yes\n"
        "output.suppress: on\n"
        "xml.xinclude: true\n"
        "encoding.default: ISO-8859-1\n"
        "schema.header_type: customHeader\n"
    );

    auto options = ParserOptions::fromConfig(doc);
    EXPECT_FALSE(options.validate);
    EXPECT_TRUE(options.warningsFatal);
    EXPECT_TRUE(options.suppressOutput);
    EXPECT_TRUE(options.xincludeAware);
    EXPECT_EQ(options.defaultCharacterEncoding, "ISO-8859-1");
    ASSERT_TRUE(options.headerType.has_value());
    EXPECT_EQ(*options.headerType, "customHeader");
}

TEST(ParserOptionsTest, MissingKeysKeepDefaults) {
    ConfigParser parser;
    auto doc = parser.parseString("validation.warnings_fatal: true\n");

    auto options = ParserOptions::fromConfig(doc);
    EXPECT_TRUE(options.validate);
    EXPECT_TRUE(options.warningsFatal);
    EXPECT_EQ(options.defaultCharacterEncoding, "US-ASCII");
    EXPECT_FALSE(options.headerType.has_value());
}

TEST(ParserOptionsTest, UnknownKeysIgnored) {
    ConfigParser parser;
    auto doc = parser.parseString(
        "output.suppress: true\n"
        "no.such.option: 5\n"
    );

    auto options = ParserOptions::fromConfig(doc);
    EXPECT_TRUE(options.suppressOutput);
    EXPECT_TRUE(options.validate);
}

TEST(ParserOptionsTest, EmptyHeaderTypeIgnored) {
    ConfigParser parser;
    auto doc = parser.parseString("schema.header_type:\n");

    EXPECT_FALSE(ParserOptions::fromConfig(doc).headerType.has_value());
}

TEST(ParserOptionsTest, LoadFile) {
    auto path = std::filesystem::temp_directory_path() / "sbeir_parser_options_test.conf";
    std::ofstream(path) << "# options\nxml.xinclude: yes\nencoding.default: UTF-8\n";

    auto options = ParserOptions::loadFile(path.string());
    std::filesystem::remove(path);

    ASSERT_TRUE(options.has_value());
    EXPECT_TRUE(options->xincludeAware);
    EXPECT_EQ(options->defaultCharacterEncoding, "UTF-8");
}

TEST(ParserOptionsTest, LoadMissingFile) {
    EXPECT_FALSE(ParserOptions::loadFile("/nonexistent/sbeir.conf").has_value());
}
