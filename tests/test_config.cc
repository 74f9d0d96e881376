#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>

#include "callbridge/BridgeClient.hpp"
#include "callbridge/BridgeConfig.hpp"
#include "callbridge/BridgeError.hpp"
#include "callbridge/Log.hpp"

namespace fs = std::filesystem;
using namespace callbridge;

class ConfigTest : public ::testing::Test {
   protected:
    void SetUp() override {
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        dir = fs::temp_directory_path() /
            ("callbridge_config_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()) +
                "_" + std::to_string(stamp));
        fs::create_directories(dir);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    void write_file(const fs::path& path, const std::string& content) {
        fs::create_directories(path.parent_path());
        std::ofstream out(path, std::ios::binary);
        out << content;
    }

    fs::path dir;
};

TEST_F(ConfigTest, ParsesEveryField) {
    write_file(dir / "callbridge.json", R"({
        "native_library": "lib/libruntime.so",
        "root_path": "baml_src",
        "source_extension": ".txt",
        "log_level": "debug",
        "call_timeout_ms": 2500,
        "env": {"OPENAI_API_KEY": "sk-test", "IGNORED": 5}
    })");

    auto config = parse_bridge_config((dir / "callbridge.json").string());
    ASSERT_TRUE(config.has_value());
    EXPECT_TRUE(config->is_valid);
    EXPECT_EQ(fs::path(config->native_library), (fs::absolute(dir) / "lib/libruntime.so").lexically_normal());
    EXPECT_EQ(fs::path(config->root_path), (fs::absolute(dir) / "baml_src").lexically_normal());
    EXPECT_EQ(config->source_extension, ".txt");
    EXPECT_EQ(config->log_level, "debug");
    EXPECT_EQ(config->call_timeout_ms, 2500u);
    EXPECT_EQ(config->env.size(), 1u);
    EXPECT_EQ(config->env.at("OPENAI_API_KEY"), "sk-test");
}

TEST_F(ConfigTest, AbsolutePathsAreKept) {
    write_file(dir / "callbridge.json", R"({"native_library": "/opt/runtime/libr.so"})");
    auto config = parse_bridge_config((dir / "callbridge.json").string());
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->native_library, "/opt/runtime/libr.so");
    EXPECT_EQ(config->source_extension, ".baml");
    EXPECT_EQ(config->call_timeout_ms, 0u);
}

TEST_F(ConfigTest, RejectsMissingAndBrokenFiles) {
    EXPECT_FALSE(parse_bridge_config((dir / "nope.json").string()).has_value());

    write_file(dir / "broken.json", "{ not json");
    EXPECT_FALSE(parse_bridge_config((dir / "broken.json").string()).has_value());

    write_file(dir / "array.json", "[1, 2]");
    EXPECT_FALSE(parse_bridge_config((dir / "array.json").string()).has_value());

    write_file(dir / "wrong_type.json", R"({"native_library": 12})");
    EXPECT_FALSE(parse_bridge_config((dir / "wrong_type.json").string()).has_value());
}

TEST_F(ConfigTest, FindsConfigInParentDirectory) {
    write_file(dir / "callbridge.json", R"({"root_path": "src"})");
    fs::create_directories(dir / "a" / "b");

    auto config = find_and_parse_bridge_config((dir / "a" / "b").string());
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(fs::path(config->base_dir), fs::absolute(dir));
}

TEST_F(ConfigTest, LoadsSourceFilesRecursively) {
    write_file(dir / "src" / "main.baml", "function A() {}");
    write_file(dir / "src" / "clients" / "openai.baml", "client B {}");
    write_file(dir / "src" / "README.md", "not a source file");

    auto files = load_source_files((dir / "src").string(), ".baml");
    ASSERT_EQ(files.size(), 2u);
    EXPECT_EQ(files.at("main.baml"), "function A() {}");
    EXPECT_EQ(files.at("clients/openai.baml"), "client B {}");
}

TEST_F(ConfigTest, LoadSourceFilesNeedsADirectory) {
    try {
        load_source_files((dir / "missing").string(), ".baml");
        FAIL() << "expected InvalidArgument";
    } catch (const BridgeError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::InvalidArgument);
    }
}

TEST_F(ConfigTest, JsonObjectEscapesValues) {
    std::string text = to_json_object({{"a", "quote \" and\nnewline"}, {"b", ""}});
    auto j = nlohmann::json::parse(text);
    EXPECT_EQ(j["a"].get<std::string>(), "quote \" and\nnewline");
    EXPECT_EQ(j["b"].get<std::string>(), "");
    EXPECT_EQ(to_json_object({}), "{}");
}

TEST_F(ConfigTest, ContextFromConfigLoadsLibraryAndSources) {
    write_file(dir / "baml_src" / "main.baml", "function Extract() {}");

    BridgeConfig config;
    config.native_library = CALLBRIDGE_LOOPBACK_MODULE;
    config.root_path = (dir / "baml_src").string();
    config.env = {{"MODE", "configured"}};

    auto ctx = BridgeContext::from_config(config);
    BridgeClient client(*ctx);
    EXPECT_EQ(std::get<std::string>(client.call("source_file", {{"path", Arg{std::string("main.baml")}}})),
        "function Extract() {}");
    EXPECT_EQ(std::get<std::string>(client.call("env", {{"name", Arg{std::string("MODE")}}})), "configured");
}

TEST_F(ConfigTest, ContextFromConfigAppliesLogLevel) {
    log::Level before = log::level();

    BridgeConfig config;
    config.native_library = CALLBRIDGE_LOOPBACK_MODULE;
    config.log_level = "error";
    auto ctx = BridgeContext::from_config(config);
    EXPECT_EQ(log::level(), log::Level::Error);

    log::set_level(before);
}

TEST_F(ConfigTest, ContextFromConfigNeedsLibrary) {
    BridgeConfig config;
    try {
        BridgeContext::from_config(config);
        FAIL() << "expected InvalidArgument";
    } catch (const BridgeError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::InvalidArgument);
    }
}

TEST(LogTest, ParsesLevelNames) {
    EXPECT_EQ(*log::parse_level("trace"), log::Level::Trace);
    EXPECT_EQ(*log::parse_level("warning"), log::Level::Warn);
    EXPECT_EQ(*log::parse_level("off"), log::Level::Off);
    EXPECT_FALSE(log::parse_level("loud").has_value());
}

TEST(LogTest, EnabledFollowsLevel) {
    log::Level before = log::level();
    log::set_level(log::Level::Warn);
    EXPECT_FALSE(log::enabled(log::Level::Info));
    EXPECT_TRUE(log::enabled(log::Level::Warn));
    EXPECT_TRUE(log::enabled(log::Level::Error));
    log::set_level(before);
}
