#include <catch2/catch_test_macros.hpp>
#include "config/config_loader.hpp"

#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace biip;

TEST_CASE("ConfigLoader: defaults", "[config]") {

    SECTION("Empty document yields defaults") {
        const auto result = ConfigLoader::load_from_string("");
        REQUIRE(result.success);
        const auto& cfg = result.config;
        CHECK(cfg.logging.level == "warn");
        CHECK(cfg.secrets.custom_prefix == "BIIP_");
        CHECK(cfg.secrets.keywords.size() == 6);
        CHECK(cfg.secrets.min_length == 1);
        CHECK(cfg.secrets.dotenv);
        CHECK(cfg.input.max_file_size == 10485760);
        CHECK(cfg.input.jobs == 0);
        CHECK(cfg.input.header);
        CHECK(cfg.binary.sample_size == 8192);
        CHECK(cfg.token_overrides.empty());
        CHECK(cfg.api_keys.empty());
    }

    SECTION("Default path prefers XDG_CONFIG_HOME") {
        CHECK(ConfigLoader::default_path("/xdg", "/home/alice") ==
              std::filesystem::path("/xdg/biip/config.toml"));
        CHECK(ConfigLoader::default_path(nullptr, "/home/alice") ==
              std::filesystem::path("/home/alice/.config/biip/config.toml"));
        CHECK(ConfigLoader::default_path("", "/home/alice") ==
              std::filesystem::path("/home/alice/.config/biip/config.toml"));
        CHECK_FALSE(ConfigLoader::default_path(nullptr, nullptr).has_value());
    }
}

TEST_CASE("ConfigLoader: full document", "[config]") {
    const std::string toml = R"(
[logging]
level = "debug"

[tokens]
email = "<email>"
env_secret = "[redacted]"

[secrets]
keywords = ["password", "dsn"]
custom_prefix = "ACME_"
min_length = 4
dotenv = false

[input]
max_file_size = 2048
jobs = 3
header = false

[binary]
sample_size = 512
max_non_printable_ratio = 0.1

[[api_keys]]
provider = "acme"
prefix = "acme_"
alphabet = "alnum"
min_length = 20
max_length = 40

[[api_keys]]
provider = "internal"
prefix = ["int_live_", "int_test_"]
alphabet = "hex"
min_length = 32
)";

    const auto result = ConfigLoader::load_from_string(toml);
    REQUIRE(result.success);
    const auto& cfg = result.config;

    CHECK(cfg.logging.level == "debug");
    CHECK(cfg.secrets.keywords == std::vector<std::string>{"password", "dsn"});
    CHECK(cfg.secrets.custom_prefix == "ACME_");
    CHECK(cfg.secrets.min_length == 4);
    CHECK_FALSE(cfg.secrets.dotenv);
    CHECK(cfg.input.max_file_size == 2048);
    CHECK(cfg.input.jobs == 3);
    CHECK_FALSE(cfg.input.header);
    CHECK(cfg.binary.sample_size == 512);
    CHECK(cfg.binary.max_non_printable_ratio == 0.1);

    SECTION("Token overrides applied on top of defaults") {
        const auto tokens = ConfigLoader::build_token_set(cfg);
        CHECK(tokens.get(Category::EMAIL) == "<email>");
        CHECK(tokens.get(Category::ENV_SECRET) == "[redacted]");
        CHECK(tokens.get(Category::IPV4) == TokenSet::defaults().get(Category::IPV4));
    }

    SECTION("API key entries become shapes") {
        const auto shapes = ConfigLoader::build_api_key_shapes(cfg);
        REQUIRE(shapes.size() == 2);
        CHECK(shapes[0].provider == "acme");
        CHECK(shapes[0].prefixes == std::vector<std::string>{"acme_"});
        CHECK(shapes[0].alphabet == KeyAlphabet::ALNUM);
        CHECK(shapes[0].min_length == 20);
        CHECK(shapes[0].max_length == 40);

        CHECK(shapes[1].prefixes.size() == 2);
        CHECK(shapes[1].alphabet == KeyAlphabet::HEX);
        // max_length defaults to min_length
        CHECK(shapes[1].max_length == 32);
    }
}

TEST_CASE("ConfigLoader: validation errors", "[config]") {

    SECTION("Unknown token category") {
        const auto result = ConfigLoader::load_from_string("[tokens]\nzipcode = \"#\"\n");
        REQUIRE_FALSE(result.success);
        CHECK(result.error_message.find("tokens.zipcode") != std::string::npos);
    }

    SECTION("Unknown alphabet") {
        const auto result = ConfigLoader::load_from_string(
            "[[api_keys]]\nprovider = \"x\"\nprefix = \"x_\"\nalphabet = \"emoji\"\nmin_length = 8\n");
        REQUIRE_FALSE(result.success);
        CHECK(result.error_message.find("alphabet") != std::string::npos);
    }

    SECTION("Empty prefix") {
        const auto result = ConfigLoader::load_from_string(
            "[[api_keys]]\nprovider = \"x\"\nprefix = \"\"\nmin_length = 8\n");
        REQUIRE_FALSE(result.success);
        CHECK(result.error_message.find("prefix") != std::string::npos);
    }

    SECTION("Bad log level and ratio are both reported") {
        const auto result = ConfigLoader::load_from_string(
            "[logging]\nlevel = \"loud\"\n[binary]\nmax_non_printable_ratio = 1.5\n");
        REQUIRE_FALSE(result.success);
        CHECK(result.error_message.find("Config validation failed") != std::string::npos);
        CHECK(result.error_message.find("logging.level") != std::string::npos);
        CHECK(result.error_message.find("max_non_printable_ratio") != std::string::npos);
    }

    SECTION("Negative sizes rejected") {
        const auto result = ConfigLoader::load_from_string("[input]\nmax_file_size = -1\n");
        REQUIRE_FALSE(result.success);
        CHECK(result.error_message.find("input.max_file_size") != std::string::npos);
    }

    SECTION("TOML syntax error") {
        const auto result = ConfigLoader::load_from_string("[logging\nlevel = ");
        REQUIRE_FALSE(result.success);
        CHECK(result.error_message.find("Failed to parse config") != std::string::npos);
    }
}

TEST_CASE("ConfigLoader: files", "[config]") {

    SECTION("Load from disk") {
        const auto path = std::filesystem::temp_directory_path() /
            ("biip_config_" + std::to_string(::getpid()) + ".toml");
        {
            std::ofstream out(path);
            out << "[input]\njobs = 2\n";
        }
        const auto result = ConfigLoader::load_from_file(path.string());
        std::filesystem::remove(path);

        REQUIRE(result.success);
        CHECK(result.config.input.jobs == 2);
    }

    SECTION("Missing file reported, not thrown") {
        const auto result = ConfigLoader::load_from_file("/nonexistent/biip/config.toml");
        REQUIRE_FALSE(result.success);
        CHECK(result.error_message.find("Failed to load config") != std::string::npos);
    }
}
