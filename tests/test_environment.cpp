#include <catch2/catch_test_macros.hpp>
#include "cli/clipboard.hpp"
#include "cli/environment.hpp"

#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace biip;

namespace fs = std::filesystem;

TEST_CASE("Environment: snapshot", "[environment]") {

    SECTION("KEY=VALUE pairs split on the first '='") {
        const char* envp[] = {"A=1", "URL=https://x?a=b", "EMPTY=", "NOEQUALS", "=bad", nullptr};
        const auto env = collect_environment(envp);
        CHECK(env.size() == 3);
        CHECK(env.at("A") == "1");
        CHECK(env.at("URL") == "https://x?a=b");
        CHECK(env.at("EMPTY").empty());
    }

    SECTION("Null environment") {
        CHECK(collect_environment(nullptr).empty());
    }
}

TEST_CASE("Environment: identity lookup", "[environment]") {

    SECTION("USER then LOGNAME") {
        CHECK(current_username({{"USER", "alice"}, {"LOGNAME", "bob"}}) == "alice");
        CHECK(current_username({{"USER", ""}, {"LOGNAME", "bob"}}) == "bob");
    }

    SECTION("HOME from the environment") {
        CHECK(home_directory({{"HOME", "/home/alice"}}) == "/home/alice");
    }
}

TEST_CASE("Environment: .env file", "[environment]") {
    const auto dir = fs::temp_directory_path() / ("biip_env_" + std::to_string(::getpid()));
    fs::create_directories(dir);

    SECTION("Missing file is not an error") {
        const auto result = read_dotenv(dir / "absent.env");
        REQUIRE(result.is_ok());
        CHECK_FALSE(result.value().has_value());
    }

    SECTION("Existing file is read whole") {
        {
            std::ofstream out(dir / ".env");
            out << "API_TOKEN=xyz\n";
        }
        const auto result = read_dotenv(dir / ".env");
        REQUIRE(result.is_ok());
        REQUIRE(result.value().has_value());
        CHECK(*result.value() == "API_TOKEN=xyz\n");
    }

    std::error_code ec;
    fs::remove_all(dir, ec);
}

TEST_CASE("Clipboard: helper discovery", "[clipboard]") {
    const auto dir = fs::temp_directory_path() / ("biip_path_" + std::to_string(::getpid()));
    fs::create_directories(dir);

    auto make_exe = [&](const std::string& name) {
        const auto p = dir / name;
        std::ofstream(p) << "#!/bin/sh\nexit 0\n";
        fs::permissions(p, fs::perms::owner_all);
    };

    SECTION("Executable found on PATH, non-executable ignored") {
        make_exe("biip-helper");
        std::ofstream(dir / "plain-file") << "x";
        const std::string path_env = "/nonexistent:" + dir.string();

        CHECK(find_in_path("biip-helper", path_env) == (dir / "biip-helper").string());
        CHECK_FALSE(find_in_path("plain-file", path_env).has_value());
        CHECK_FALSE(find_in_path("biip-helper", "/nonexistent").has_value());
    }

    SECTION("First complete tool wins") {
        make_exe("xsel");
        make_exe("xclip");
        const auto clipboard = Clipboard::detect(dir.string());
        REQUIRE(clipboard.is_ok());
        CHECK(clipboard.value().tool().name == "xclip");
    }

    SECTION("Helper that exits without reading reports an error") {
        const Clipboard clipboard(Clipboard::Tool{"early-exit", {"true"}, {"true"}});
        const std::string payload(1 << 20, 'x');
        const auto written = clipboard.write(payload);
        REQUIRE(written.is_error());
        CHECK(written.error_category() == ErrorCategory::CLIPBOARD_ERROR);
    }

    SECTION("No helper installed") {
        const auto clipboard = Clipboard::detect("/nonexistent");
        REQUIRE(clipboard.is_error());
        CHECK(clipboard.error_category() == ErrorCategory::CLIPBOARD_ERROR);
    }

    std::error_code ec;
    fs::remove_all(dir, ec);
}
