#include <catch2/catch_test_macros.hpp>

#include "common/test_helpers_catch2.h"

#include <ragline/config/config_helpers.h>

#include <string>

using namespace ragline::config;
using ragline::ErrorCode;
using ragline::test::ScopedEnvVar;
using ragline::test::TempDir;
using ragline::test::write_file;

TEST_CASE("Config helpers - string utilities", "[config][helpers]") {
    std::string s = "  padded \t";
    trim(s);
    CHECK(s == "padded");
    CHECK(unquote("\"quoted\"") == "quoted");
    CHECK(unquote("'single'") == "single");
    CHECK(unquote("bare") == "bare");

    CHECK(parse_bool("TRUE") == true);
    CHECK(parse_bool(" off ") == false);
    CHECK(parse_bool("1") == true);
    CHECK_FALSE(parse_bool("maybe").has_value());
}

TEST_CASE("Config helpers - parse_config_file", "[config][helpers]") {
    TempDir dir;

    SECTION("sections, quotes and inline comments") {
        auto path = write_file(dir.path() / "config.toml", R"(# top comment
root_key = 1

[pipeline]
max_log_queue_size = 50   # trailing comment
log_level = "debug"

[ search ]
filter = 'a # not a comment'
)");
        auto parsed = parse_config_file(path);
        REQUIRE(parsed);
        const auto& cfg = parsed.value();
        CHECK(cfg.at("").at("root_key") == "1");
        CHECK(cfg.at("pipeline").at("max_log_queue_size") == "50");
        CHECK(cfg.at("pipeline").at("log_level") == "debug");
        CHECK(cfg.at("search").at("filter") == "a # not a comment");

        CHECK(parse_config_value(path, "pipeline", "log_level") == "debug");
        CHECK(parse_config_value(path, "pipeline", "absent").empty());
    }

    SECTION("missing file") {
        auto parsed = parse_config_file(dir.path() / "nope.toml");
        REQUIRE_FALSE(parsed);
        CHECK(parsed.error().code == ErrorCode::NotFound);
    }

    SECTION("malformed lines report the line number") {
        auto path = write_file(dir.path() / "bad.toml", "[pipeline]\njust words\n");
        auto parsed = parse_config_file(path);
        REQUIRE_FALSE(parsed);
        CHECK(parsed.error().code == ErrorCode::ParseError);
        CHECK(parsed.error().message.find(":2:") != std::string::npos);

        auto header = write_file(dir.path() / "header.toml", "[pipeline\n");
        CHECK(parse_config_file(header).error().code == ErrorCode::ParseError);

        auto emptyKey = write_file(dir.path() / "key.toml", " = 3\n");
        CHECK(parse_config_file(emptyKey).error().code == ErrorCode::ParseError);
    }
}

TEST_CASE("Config helpers - config locations", "[config][helpers]") {
    SECTION("XDG_CONFIG_HOME wins over HOME") {
        ScopedEnvVar xdg("XDG_CONFIG_HOME", std::string("/tmp/xdg"));
        ScopedEnvVar home("HOME", std::string("/home/someone"));
        CHECK(get_config_dir() == std::filesystem::path("/tmp/xdg/ragline"));
    }

    SECTION("falls back to HOME/.config") {
        ScopedEnvVar xdg("XDG_CONFIG_HOME", std::nullopt);
        ScopedEnvVar home("HOME", std::string("/home/someone"));
        CHECK(get_config_dir() == std::filesystem::path("/home/someone/.config/ragline"));
    }

    SECTION("override, then RAGLINE_CONFIG, then the default") {
        ScopedEnvVar xdg("XDG_CONFIG_HOME", std::string("/tmp/xdg"));
        {
            ScopedEnvVar env("RAGLINE_CONFIG", std::string("/etc/ragline.toml"));
            CHECK(get_config_path("/opt/custom.toml") == std::filesystem::path("/opt/custom.toml"));
            CHECK(get_config_path() == std::filesystem::path("/etc/ragline.toml"));
        }
        ScopedEnvVar unset("RAGLINE_CONFIG", std::nullopt);
        CHECK(get_config_path() == std::filesystem::path("/tmp/xdg/ragline/config.toml"));
    }

    SECTION("tilde expansion") {
        ScopedEnvVar home("HOME", std::string("/home/someone"));
        CHECK(expand_tilde("~/runs.jsonl") == std::filesystem::path("/home/someone/runs.jsonl"));
        CHECK(expand_tilde("/abs/path") == std::filesystem::path("/abs/path"));
    }
}
