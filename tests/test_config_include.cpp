#include <catch2/catch_test_macros.hpp>
#include "config/config_loader.hpp"
#include <filesystem>
#include <fstream>
#include <format>

using namespace doubleblind;

namespace {

// RAII temporary directory
struct TmpDir {
    std::filesystem::path path;
    TmpDir() : path(std::filesystem::temp_directory_path() / "doubleblind_test_include") {
        std::filesystem::create_directories(path);
    }
    ~TmpDir() { std::filesystem::remove_all(path); }
    std::string file(const std::string& name, const std::string& content) {
        auto p = path / name;
        std::ofstream f(p);
        f << content;
        return p.string();
    }
};

} // namespace

TEST_CASE("ConfigInclude: single include file loads and merges", "[config][include]") {
    TmpDir tmp;

    tmp.file("schemas.toml", R"(
[[schemas]]
name = "User"

[[schemas.fields]]
name = "email"
category = "email"
)");

    auto main_path = tmp.file("main.toml", R"(
include = "schemas.toml"

[session]
seed = 7
)");

    auto result = ConfigLoader::load_from_file(main_path);
    REQUIRE(result.success);
    REQUIRE(result.config.schemas.size() == 1);
    CHECK(result.config.schemas[0].name == "User");
    CHECK(result.config.session.seed == 7);
}

TEST_CASE("ConfigInclude: array includes concatenate schemas", "[config][include]") {
    TmpDir tmp;

    tmp.file("users.toml", R"(
[[schemas]]
name = "User"
)");

    tmp.file("orders.toml", R"(
[[schemas]]
name = "Order"
)");

    auto main_path = tmp.file("main.toml", R"(
include = ["users.toml", "orders.toml"]

[[schemas]]
name = "Address"

[[classifier.patterns]]
match = "suffix"
pattern = "_mail"
category = "email"
)");

    auto result = ConfigLoader::load_from_file(main_path);
    REQUIRE(result.success);
    // Main + both included schemas
    CHECK(result.config.schemas.size() == 3);
    CHECK(result.config.classifier.patterns.size() == 1);
}

TEST_CASE("ConfigInclude: main config scalars override included", "[config][include]") {
    TmpDir tmp;

    tmp.file("base.toml", R"(
[logging]
level = "debug"

[session]
mode = "persistent"
locale = "fr_FR"
max_depth = 8
)");

    auto main_path = tmp.file("main.toml", R"(
include = "base.toml"

[session]
locale = "de_DE"
)");

    auto result = ConfigLoader::load_from_file(main_path);
    REQUIRE(result.success);
    // Main config wins, untouched keys of the include survive
    CHECK(result.config.session.locale == "de_DE");
    CHECK(result.config.session.mode == "persistent");
    CHECK(result.config.session.max_depth == 8);
    CHECK(result.config.logging.level == "debug");
}

TEST_CASE("ConfigInclude: nested includes resolve relative to the including file", "[config][include]") {
    TmpDir tmp;
    std::filesystem::create_directories(tmp.path / "conf.d");

    tmp.file("conf.d/patterns.toml", R"(
[[classifier.patterns]]
pattern = "handle"
category = "username"
)");
    tmp.file("conf.d/classifier.toml", R"(
include = "patterns.toml"

[classifier]
default_patterns = false
)");

    auto main_path = tmp.file("main.toml", "include = \"conf.d/classifier.toml\"\n");

    auto result = ConfigLoader::load_from_file(main_path);
    REQUIRE(result.success);
    CHECK_FALSE(result.config.classifier.default_patterns);
    REQUIRE(result.config.classifier.patterns.size() == 1);
    CHECK(result.config.classifier.patterns[0].pattern == "handle");
}

TEST_CASE("ConfigInclude: circular include detection throws", "[config][include]") {
    TmpDir tmp;

    // a.toml includes b.toml, b.toml includes a.toml
    auto a_path = (tmp.path / "a.toml").string();
    auto b_path = (tmp.path / "b.toml").string();

    {
        std::ofstream f(a_path);
        f << "include = \"b.toml\"\n[session]\nseed = 1\n";
    }
    {
        std::ofstream f(b_path);
        f << "include = \"a.toml\"\n";
    }

    auto result = ConfigLoader::load_from_file(a_path);
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("ircular") != std::string::npos);
}

TEST_CASE("ConfigInclude: include depth is bounded", "[config][include]") {
    TmpDir tmp;

    // main -> f1 -> ... -> f11: the last file sits one level too deep
    for (int i = 1; i <= 11; ++i) {
        const std::string next = i < 11 ? std::format("include = \"f{}.toml\"\n", i + 1) : "";
        tmp.file(std::format("f{}.toml", i), next + std::format("[session]\nmax_depth = {}\n", i));
    }
    auto main_path = tmp.file("main.toml", "include = \"f1.toml\"\n");

    auto result = ConfigLoader::load_from_file(main_path);
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("depth") != std::string::npos);

    // Ten levels are fine
    tmp.file("f10.toml", "[session]\nmax_depth = 10\n");
    auto ok = ConfigLoader::load_from_file(main_path);
    REQUIRE(ok.success);
    CHECK(ok.config.session.max_depth == 1);
}

TEST_CASE("ConfigInclude: non-string include entries fail", "[config][include]") {
    TmpDir tmp;
    auto main_path = tmp.file("main.toml", "include = [\"a.toml\", 3]\n");

    auto result = ConfigLoader::load_from_file(main_path);
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("must be strings") != std::string::npos);
}

TEST_CASE("ConfigInclude: missing include file throws with path", "[config][include]") {
    TmpDir tmp;

    auto main_path = tmp.file("main.toml", R"(
include = "nonexistent.toml"

[session]
seed = 1
)");

    auto result = ConfigLoader::load_from_file(main_path);
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("nonexistent.toml") != std::string::npos);
}
