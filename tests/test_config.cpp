#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

#include "config/remote_execution_config.h"
#include "errors.h"

using namespace pyremote;
namespace fs = std::filesystem;

// ── Defaults and identity ───────────────────────────────────────────────────

TEST(RemoteExecutionConfig, Defaults) {
    const RemoteExecutionConfig config;

    EXPECT_EQ(config.buffer_size(), 2'097'152u);
    EXPECT_EQ(config.multicast_group(), (Endpoint{"239.0.0.1", 6766}));
    EXPECT_EQ(config.multicast_bind_address(), "0.0.0.0");
    EXPECT_EQ(config.multicast_ttl(), 0u);
    EXPECT_FALSE(config.has_target_name());
    EXPECT_EQ(config.command_address().ip, "127.0.0.1");
    EXPECT_NE(config.command_address().port, 0);
}

TEST(RemoteExecutionConfig, EachConfigGetsItsOwnId) {
    const RemoteExecutionConfig a;
    const RemoteExecutionConfig b;

    EXPECT_EQ(a.local_id().size(), 36u);
    EXPECT_NE(a.local_id(), b.local_id());
}

TEST(RemoteExecutionConfig, CopiesKeepIdentity) {
    const RemoteExecutionConfig config;
    const RemoteExecutionConfig copy = config;

    EXPECT_EQ(copy.local_id(), config.local_id());
    EXPECT_EQ(copy.command_address(), config.command_address());
}

TEST(RemoteExecutionConfig, WithTargetName) {
    const RemoteExecutionConfig config;
    const auto targeted = config.with_target_name("Foo");

    EXPECT_EQ(targeted.target_name(), "Foo");
    EXPECT_TRUE(targeted.has_target_name());
    EXPECT_EQ(targeted.local_id(), config.local_id());
    EXPECT_FALSE(config.has_target_name());
}

TEST(RemoteExecutionConfig, RejectsOutOfRangeValues) {
    EXPECT_THROW(RemoteExecutionConfig(0, Endpoint{"239.0.0.1", 6766}, "0.0.0.0", 0), InvalidConfigError);
    EXPECT_THROW(RemoteExecutionConfig(1024, Endpoint{"239.0.0.1", 6766}, "0.0.0.0", 256), InvalidConfigError);
}

// ── JSON ────────────────────────────────────────────────────────────────────

TEST(RemoteExecutionConfig, FromJson) {
    const auto config = RemoteExecutionConfig::from_json({
        {"buffer_size", 4096},
        {"multicast_group", "239.0.0.2:7000"},
        {"multicast_ttl", 1},
        {"project_name", "Foo"},
        {"local_id", "controller-1"},
    });

    EXPECT_EQ(config.buffer_size(), 4096u);
    EXPECT_EQ(config.multicast_group(), (Endpoint{"239.0.0.2", 7000}));
    EXPECT_EQ(config.multicast_bind_address(), "0.0.0.0");
    EXPECT_EQ(config.multicast_ttl(), 1u);
    EXPECT_EQ(config.target_name(), "Foo");
    EXPECT_EQ(config.local_id(), "controller-1");
}

TEST(RemoteExecutionConfig, FromJsonRejectsBadInput) {
    EXPECT_THROW(RemoteExecutionConfig::from_json(nlohmann::json::array()), InvalidConfigError);
    EXPECT_THROW(RemoteExecutionConfig::from_json({{"buffer_size", "big"}}), InvalidConfigError);
    EXPECT_THROW(RemoteExecutionConfig::from_json({{"multicast_group", "239.0.0.1"}}), InvalidConfigError);
}

TEST(Endpoint, Parse) {
    EXPECT_EQ(Endpoint::parse("239.0.0.1:6766"), (Endpoint{"239.0.0.1", 6766}));
    EXPECT_EQ(Endpoint::parse("127.0.0.1:6776").to_string(), "127.0.0.1:6776");

    EXPECT_THROW(Endpoint::parse("239.0.0.1"), InvalidConfigError);
    EXPECT_THROW(Endpoint::parse("239.0.0.1:port"), InvalidConfigError);
    EXPECT_THROW(Endpoint::parse("239.0.0.1:70000"), InvalidConfigError);
    EXPECT_THROW(Endpoint::parse("not-an-ip:6766"), InvalidConfigError);
}

// ── Project settings ────────────────────────────────────────────────────────

class UprojectConfig : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = fs::temp_directory_path() /
                ("pyremote_uproject_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(root_);
        fs::create_directories(root_ / "Config");
        uproject_ = root_ / "Foo.uproject";
        std::ofstream(uproject_) << "{}";
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    void write_ini(const std::string& body) {
        std::ofstream(root_ / "Config" / "DefaultEngine.ini") << body;
    }

    fs::path root_;
    fs::path uproject_;
};

TEST_F(UprojectConfig, ReadsPluginSettings) {
    write_ini("[/Script/EngineSettings.GameMapsSettings]\n"
              "GameDefaultMap=/Game/Main\n"
              "\n"
              "[/Script/PythonScriptPlugin.PythonScriptPluginSettings]\n"
              "; comment\n"
              "+AdditionalPaths=(Path=\"Scripts\")\n"
              "bRemoteExecution=True\n"
              "RemoteExecutionMulticastGroupEndpoint=239.0.0.3:6800\n"
              "RemoteExecutionMulticastBindAddress=127.0.0.1\n"
              "RemoteExecutionMulticastTtl=2\n"
              "RemoteExecutionReceiveBufferSizeBytes=65536\n");

    const auto config = RemoteExecutionConfig::from_uproject_path(uproject_);

    EXPECT_EQ(config.target_name(), "Foo");
    EXPECT_EQ(config.multicast_group(), (Endpoint{"239.0.0.3", 6800}));
    EXPECT_EQ(config.multicast_bind_address(), "127.0.0.1");
    EXPECT_EQ(config.multicast_ttl(), 2u);
    EXPECT_EQ(config.buffer_size(), 65536u);
}

TEST_F(UprojectConfig, MissingKeysUseDefaults) {
    write_ini("[/Script/PythonScriptPlugin.PythonScriptPluginSettings]\n"
              "bRemoteExecution=1\n");

    const auto config = RemoteExecutionConfig::from_uproject_path(uproject_);

    EXPECT_EQ(config.multicast_group(), (Endpoint{"239.0.0.1", 6766}));
    EXPECT_EQ(config.buffer_size(), RemoteExecutionConfig::kDefaultBufferSize);
}

TEST_F(UprojectConfig, DisabledRemoteExecution) {
    write_ini("[/Script/PythonScriptPlugin.PythonScriptPluginSettings]\n"
              "bRemoteExecution=False\n");

    EXPECT_THROW(RemoteExecutionConfig::from_uproject_path(uproject_), InvalidConfigError);
}

TEST_F(UprojectConfig, SettingInAnotherSectionIsIgnored) {
    write_ini("[/Script/Other.Settings]\n"
              "bRemoteExecution=True\n");

    EXPECT_THROW(RemoteExecutionConfig::from_uproject_path(uproject_), InvalidConfigError);
}

TEST_F(UprojectConfig, MissingIni) {
    EXPECT_THROW(RemoteExecutionConfig::from_uproject_path(uproject_), InvalidUprojectPathError);
}

TEST_F(UprojectConfig, WrongExtensionOrMissingFile) {
    const auto other = root_ / "Foo.txt";
    std::ofstream(other) << "{}";

    EXPECT_THROW(RemoteExecutionConfig::from_uproject_path(other), InvalidUprojectPathError);
    EXPECT_THROW(RemoteExecutionConfig::from_uproject_path(root_ / "Missing.uproject"), InvalidUprojectPathError);
}
