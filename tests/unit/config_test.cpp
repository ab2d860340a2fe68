#include "runtime/config.hpp"

#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

namespace fs = std::filesystem;
using namespace tether;
using namespace tether::runtime;

class ConfigTest : public ::testing::Test {
protected:
    fs::path temp_dir;

    void SetUp() override {
        // Create temporary test directory
        temp_dir = fs::temp_directory_path() / "tether_config_test";
        fs::create_directories(temp_dir);
    }

    void TearDown() override {
        // Clean up temporary files
        if (fs::exists(temp_dir)) {
            fs::remove_all(temp_dir);
        }
    }

    std::string create_config_file(const std::string &name, const std::string &content) {
        fs::path config_path = temp_dir / name;
        std::ofstream file(config_path);
        file << content;
        file.close();
        return config_path.string();
    }

    bool load(const std::string &content, CliConfig &config, std::string &error) {
        return load_config(create_config_file("config.yaml", content), config, error);
    }
};

TEST_F(ConfigTest, ValidMinimalConfig) {
    CliConfig config;
    std::string error;
    ASSERT_TRUE(load(R"(
connection:
  endpoint: ws://127.0.0.1:8765/agent
)",
                     config, error))
        << "Error: " << error;

    EXPECT_EQ(config.connection.endpoint, "ws://127.0.0.1:8765/agent");
    EXPECT_EQ(config.connection.ping_interval_ms, 15000);
    EXPECT_TRUE(config.connection.append_newline);
    EXPECT_TRUE(config.connection.include_jsonrpc_header);
    EXPECT_FALSE(config.connection.requires_unescaped_slashes);
    EXPECT_TRUE(config.reconnect.enabled);
    EXPECT_EQ(config.reconnect.max_attempts, 3);
    EXPECT_EQ(config.reconnect.base_delay_ms, 1000);
    EXPECT_EQ(config.reconnect.health_check_timeout_ms, 8000);
    EXPECT_FALSE(config.initialize.auto_initialize);
    EXPECT_EQ(config.initialize.method, "initialize");
    EXPECT_EQ(config.logging.level, "info");
}

TEST_F(ConfigTest, FullConfig) {
    CliConfig config;
    std::string error;
    ASSERT_TRUE(load(R"(
connection:
  endpoint: wss://relay.example.com/agent
  auth_token_env: TETHER_TEST_TOKEN
  cf_access_client_id: cf-id
  cf_access_client_secret_env: TETHER_TEST_CF_SECRET
  headers:
    X-Agent: codex
  ping_interval_ms: 0
  append_newline: false
  include_jsonrpc_header: false
  requires_unescaped_slashes: true
reconnect:
  enabled: false
  max_attempts: 5
  base_delay_ms: 250
  health_check_timeout_ms: 2000
  health_check_interval_ms: 0
initialize:
  auto: true
  method: session/initialize
  params:
    clientInfo:
      name: tether-cli
      version: "0.1.0"
    capabilities: [streaming, 2, true]
identity:
  store_path: /tmp/tether-identity.yaml
  client_id: fixed-client
logging:
  level: debug
)",
                     config, error))
        << "Error: " << error;

    const auto &connection = config.connection;
    EXPECT_EQ(connection.endpoint, "wss://relay.example.com/agent");
    EXPECT_EQ(connection.auth_token_env, "TETHER_TEST_TOKEN");
    EXPECT_EQ(connection.cf_access_client_id, "cf-id");
    EXPECT_EQ(connection.cf_access_client_secret_env, "TETHER_TEST_CF_SECRET");
    EXPECT_EQ(connection.headers.at("X-Agent"), "codex");
    EXPECT_EQ(connection.ping_interval_ms, 0);
    EXPECT_FALSE(connection.append_newline);
    EXPECT_FALSE(connection.include_jsonrpc_header);
    EXPECT_TRUE(connection.requires_unescaped_slashes);

    EXPECT_FALSE(config.reconnect.enabled);
    EXPECT_EQ(config.reconnect.max_attempts, 5);
    EXPECT_EQ(config.reconnect.base_delay_ms, 250);
    EXPECT_EQ(config.reconnect.health_check_timeout_ms, 2000);
    EXPECT_EQ(config.reconnect.health_check_interval_ms, 0);

    EXPECT_TRUE(config.initialize.auto_initialize);
    EXPECT_EQ(config.initialize.method, "session/initialize");
    ASSERT_TRUE(config.initialize.params.has_value());
    const auto &params = *config.initialize.params;
    EXPECT_EQ(params["clientInfo"]["name"], "tether-cli");
    EXPECT_EQ(params["clientInfo"]["version"], "0.1.0");
    EXPECT_EQ(params["capabilities"][0], "streaming");
    EXPECT_EQ(params["capabilities"][1], 2);
    EXPECT_EQ(params["capabilities"][2], true);

    EXPECT_EQ(config.identity.store_path, "/tmp/tether-identity.yaml");
    EXPECT_EQ(config.identity.client_id, "fixed-client");
    EXPECT_EQ(config.logging.level, "debug");
}

TEST_F(ConfigTest, UnknownKeysDoNotFailLoad) {
    CliConfig config;
    std::string error;
    EXPECT_TRUE(load(R"(
connection:
  endpoint: ws://localhost:1
  mystery: 1
telemetry:
  enabled: true
)",
                     config, error))
        << "Error: " << error;
}

TEST_F(ConfigTest, MissingEndpoint) {
    CliConfig config;
    std::string error;
    EXPECT_FALSE(load(R"(
logging:
  level: info
)",
                      config, error));
    EXPECT_NE(error.find("connection.endpoint is required"), std::string::npos);
}

TEST_F(ConfigTest, NonWebSocketEndpoint) {
    CliConfig config;
    std::string error;
    EXPECT_FALSE(load(R"(
connection:
  endpoint: http://localhost:8080
)",
                      config, error));
    EXPECT_NE(error.find("ws:// or wss://"), std::string::npos);
}

TEST_F(ConfigTest, NegativePingInterval) {
    CliConfig config;
    std::string error;
    EXPECT_FALSE(load(R"(
connection:
  endpoint: ws://localhost:1
  ping_interval_ms: -5
)",
                      config, error));
    EXPECT_NE(error.find("ping_interval_ms"), std::string::npos);
}

TEST_F(ConfigTest, InvalidReconnectPolicy) {
    CliConfig config;
    std::string error;
    EXPECT_FALSE(load(R"(
connection:
  endpoint: ws://localhost:1
reconnect:
  max_attempts: -1
)",
                      config, error));
    EXPECT_NE(error.find("max_attempts must be >= 0"), std::string::npos);

    config = CliConfig{};
    EXPECT_FALSE(load(R"(
connection:
  endpoint: ws://localhost:1
reconnect:
  base_delay_ms: 0
)",
                      config, error));
    EXPECT_NE(error.find("base_delay_ms must be >= 1"), std::string::npos);

    config = CliConfig{};
    EXPECT_FALSE(load(R"(
connection:
  endpoint: ws://localhost:1
reconnect:
  health_check_timeout_ms: 50
)",
                      config, error));
    EXPECT_NE(error.find("health_check_timeout_ms must be >= 100"), std::string::npos);
}

TEST_F(ConfigTest, InvalidLogLevel) {
    CliConfig config;
    std::string error;
    EXPECT_FALSE(load(R"(
connection:
  endpoint: ws://localhost:1
logging:
  level: verbose
)",
                      config, error));
    EXPECT_FALSE(error.empty());
    EXPECT_NE(error.find("logging.level"), std::string::npos);
}

TEST_F(ConfigTest, ValidLogLevels) {
    for (const std::string level : {"debug", "info", "warn", "error", "none"}) {
        CliConfig config;
        std::string error;
        EXPECT_TRUE(load("connection:\n  endpoint: ws://localhost:1\nlogging:\n  level: " + level + "\n", config, error))
            << level << ": " << error;
    }
}

TEST_F(ConfigTest, HeadersMustBeMap) {
    CliConfig config;
    std::string error;
    EXPECT_FALSE(load(R"(
connection:
  endpoint: ws://localhost:1
  headers: [a, b]
)",
                      config, error));
    EXPECT_NE(error.find("headers must be a map"), std::string::npos);
}

TEST_F(ConfigTest, FileNotFound) {
    CliConfig config;
    std::string error;
    EXPECT_FALSE(load_config("/nonexistent/path/config.yaml", config, error));
    EXPECT_FALSE(error.empty());
}

TEST_F(ConfigTest, MalformedYaml) {
    CliConfig config;
    std::string error;
    EXPECT_FALSE(load("connection: [unterminated\n", config, error));
    EXPECT_FALSE(error.empty());
}

TEST_F(ConfigTest, ExpandHome) {
    const char *home = std::getenv("HOME");
    if (home == nullptr) {
        GTEST_SKIP() << "HOME not set";
    }
    EXPECT_EQ(expand_home("~/.tether/identity.yaml"), std::string(home) + "/.tether/identity.yaml");
    EXPECT_EQ(expand_home("/abs/path"), "/abs/path");
    EXPECT_EQ(expand_home("~other/file"), "~other/file");
}

// ---------------------------------------------------------------------------
// Conversion to manager inputs
// ---------------------------------------------------------------------------

TEST_F(ConfigTest, ManagerOptionsFollowConfig) {
    CliConfig config;
    config.reconnect.enabled = false;
    config.reconnect.max_attempts = 7;
    config.reconnect.base_delay_ms = 300;
    config.reconnect.health_check_timeout_ms = 1500;
    config.initialize.auto_initialize = true;
    config.initialize.method = "hello";

    auto options = to_manager_options(config);
    EXPECT_FALSE(options.reconnect.enabled);
    EXPECT_EQ(options.reconnect.max_attempts, 7);
    EXPECT_EQ(options.reconnect.base_delay_ms, 300);
    EXPECT_EQ(options.health_check_timeout_ms, 1500);
    EXPECT_TRUE(options.auto_initialize);
    EXPECT_EQ(options.initialize_method, "hello");
    EXPECT_FALSE(options.client_id.has_value());

    config.identity.client_id = "pinned";
    EXPECT_EQ(to_manager_options(config).client_id, std::optional<std::string>("pinned"));
}

TEST_F(ConfigTest, ClientConfigReadsSecretsFromEnvironment) {
    ::setenv("TETHER_TEST_TOKEN", "token-value", 1);
    ::setenv("TETHER_TEST_CF_SECRET", "cf-secret", 1);

    CliConfig config;
    config.connection.endpoint = "ws://localhost:1";
    config.connection.auth_token_env = "TETHER_TEST_TOKEN";
    config.connection.cf_access_client_id = "cf-id";
    config.connection.cf_access_client_secret_env = "TETHER_TEST_CF_SECRET";
    config.connection.ping_interval_ms = 0;

    auto client = to_client_config(config);
    EXPECT_EQ(client.cf_access_client_id, "cf-id");
    EXPECT_EQ(client.cf_access_client_secret, "cf-secret");
    EXPECT_FALSE(client.ping_interval_ms.has_value());
    ASSERT_TRUE(static_cast<bool>(client.token_provider));

    std::string token;
    std::string error;
    ASSERT_TRUE(client.token_provider(token, error));
    EXPECT_EQ(token, "token-value");

    // Read again on every connect
    ::unsetenv("TETHER_TEST_TOKEN");
    EXPECT_FALSE(client.token_provider(token, error));
    EXPECT_NE(error.find("TETHER_TEST_TOKEN"), std::string::npos);

    ::unsetenv("TETHER_TEST_CF_SECRET");
}
