// Copyright (c) 2025 The Bitwire Core developers
// Distributed under the MIT software license

/**
 * Configuration Tests
 *
 * Tests for CConfigParser: file syntax, typed getters and
 * BITWIRE_* environment overrides.
 */

#include <boost/test/unit_test.hpp>

#include <util/config.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace {

struct ScopedEnv {
    std::string name;
    ScopedEnv(const std::string& nameIn, const std::string& value) : name(nameIn) {
        setenv(name.c_str(), value.c_str(), 1);
    }
    ~ScopedEnv() {
        unsetenv(name.c_str());
    }
};

} // namespace

BOOST_AUTO_TEST_SUITE(config_tests)

BOOST_AUTO_TEST_CASE(parse_syntax) {
    CConfigParser parser;
    parser.LoadConfigString(
        "# full line comment\n"
        "; another comment\n"
        "[main]\n"
        "loglevel = debug   # trailing comment\n"
        "LogFile=\"/tmp/bitwire test.log\"\n"
        "format=json\n"
        "this line has no separator\n"
        "=orphan\n"
        "\n");

    BOOST_CHECK(parser.IsLoaded());
    BOOST_CHECK_EQUAL(parser.size(), 3U);
    BOOST_CHECK_EQUAL(parser.GetString("loglevel"), "debug");
    BOOST_CHECK_EQUAL(parser.GetString("logfile"), "/tmp/bitwire test.log");
    BOOST_CHECK_EQUAL(parser.GetString("FORMAT"), "json");
    BOOST_CHECK_EQUAL(parser.GetString("missing", "fallback"), "fallback");
}

BOOST_AUTO_TEST_CASE(last_value_wins) {
    CConfigParser parser;
    parser.LoadConfigString("format=text\nformat=json\n");
    BOOST_CHECK_EQUAL(parser.GetString("format"), "json");

    std::vector<std::string> all = parser.GetList("format");
    BOOST_REQUIRE_EQUAL(all.size(), 2U);
    BOOST_CHECK_EQUAL(all[0], "text");
    BOOST_CHECK_EQUAL(all[1], "json");
    BOOST_CHECK(parser.GetList("absent").empty());
}

BOOST_AUTO_TEST_CASE(integer_values) {
    CConfigParser parser;
    parser.LoadConfigString("good=42\nnegative=-7\nbad=12abc\nempty=\n");
    BOOST_CHECK_EQUAL(parser.GetInt64("good", 0), 42);
    BOOST_CHECK_EQUAL(parser.GetInt64("negative", 0), -7);
    BOOST_CHECK_EQUAL(parser.GetInt64("bad", 5), 5);
    BOOST_CHECK_EQUAL(parser.GetInt64("empty", 9), 9);
    BOOST_CHECK_EQUAL(parser.GetInt64("absent", 11), 11);
}

BOOST_AUTO_TEST_CASE(boolean_values) {
    CConfigParser parser;
    parser.LoadConfigString("a=1\nb=yes\nc=On\nd=0\ne=no\nf=OFF\ng=maybe\n");
    BOOST_CHECK(parser.GetBool("a"));
    BOOST_CHECK(parser.GetBool("b"));
    BOOST_CHECK(parser.GetBool("c"));
    BOOST_CHECK(!parser.GetBool("d", true));
    BOOST_CHECK(!parser.GetBool("e", true));
    BOOST_CHECK(!parser.GetBool("f", true));
    BOOST_CHECK(parser.GetBool("g", true));
    BOOST_CHECK(!parser.GetBool("g", false));
    BOOST_CHECK(parser.GetBool("absent", true));
}

BOOST_AUTO_TEST_CASE(environment_overrides_file) {
    CConfigParser parser;
    parser.LoadConfigString("bwtestlevel=info\nbwtestlist=a\n");
    BOOST_CHECK_EQUAL(parser.GetString("bwtestlevel"), "info");

    {
        ScopedEnv level("BITWIRE_BWTESTLEVEL", "error");
        ScopedEnv list("BITWIRE_BWTESTLIST", "x, y,,z");
        BOOST_CHECK_EQUAL(parser.GetString("bwtestlevel"), "error");

        std::vector<std::string> items = parser.GetList("bwtestlist");
        BOOST_REQUIRE_EQUAL(items.size(), 3U);
        BOOST_CHECK_EQUAL(items[0], "x");
        BOOST_CHECK_EQUAL(items[1], "y");
        BOOST_CHECK_EQUAL(items[2], "z");
    }

    BOOST_CHECK_EQUAL(parser.GetString("bwtestlevel"), "info");
}

BOOST_AUTO_TEST_CASE(missing_file_uses_defaults) {
    std::filesystem::path path = std::filesystem::temp_directory_path() / "bitwire_config_tests_missing.conf";
    std::filesystem::remove(path);

    CConfigParser parser;
    BOOST_CHECK(parser.LoadConfigFile(path.string()));
    BOOST_CHECK(parser.IsLoaded());
    BOOST_CHECK_EQUAL(parser.size(), 0U);
    BOOST_CHECK_EQUAL(parser.GetConfigFilePath(), path.string());
    BOOST_CHECK_EQUAL(parser.GetString("format", "text"), "text");
}

BOOST_AUTO_TEST_CASE(load_from_file) {
    std::filesystem::path path = std::filesystem::temp_directory_path() / "bitwire_config_tests.conf";
    {
        std::ofstream out(path);
        out << "format=json\nprinttoconsole=1\n";
    }

    CConfigParser parser;
    BOOST_REQUIRE(parser.LoadConfigFile(path.string()));
    BOOST_CHECK_EQUAL(parser.GetString("format"), "json");
    BOOST_CHECK(parser.GetBool("printtoconsole"));

    // Reloading replaces earlier settings
    {
        std::ofstream out(path, std::ios::trunc);
        out << "loglevel=warn\n";
    }
    BOOST_REQUIRE(parser.LoadConfigFile(path.string()));
    BOOST_CHECK_EQUAL(parser.GetString("format", "text"), "text");
    BOOST_CHECK_EQUAL(parser.GetString("loglevel"), "warn");

    std::filesystem::remove(path);
}

BOOST_AUTO_TEST_CASE(config_file_path) {
    BOOST_CHECK_EQUAL(GetConfigFilePath("/srv/bitwire"), "/srv/bitwire/bitwire.conf");

    const std::string defaultDir = GetDefaultDataDir();
    BOOST_CHECK(defaultDir.size() >= 8);
    BOOST_CHECK_EQUAL(defaultDir.substr(defaultDir.size() - 8), ".bitwire");
    BOOST_CHECK_EQUAL(GetConfigFilePath(), defaultDir + "/bitwire.conf");
}

BOOST_AUTO_TEST_SUITE_END()
