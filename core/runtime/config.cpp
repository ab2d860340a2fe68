#include "config.hpp"

#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <sstream>
#include <vector>

#include "logging/logger.hpp"

namespace tether {
namespace runtime {

namespace {

// Quoted scalars stay strings; plain scalars become numbers or booleans
// when they parse as such.
rpc::Json yaml_to_json(const YAML::Node &node) {
    switch (node.Type()) {
        case YAML::NodeType::Map: {
            rpc::Json object = rpc::Json::object();
            for (const auto &entry : node) {
                object[entry.first.as<std::string>()] = yaml_to_json(entry.second);
            }
            return object;
        }
        case YAML::NodeType::Sequence: {
            rpc::Json array = rpc::Json::array();
            for (const auto &item : node) {
                array.push_back(yaml_to_json(item));
            }
            return array;
        }
        case YAML::NodeType::Scalar: {
            if (node.Tag() == "!") {
                return node.as<std::string>();
            }
            int64_t integer = 0;
            if (YAML::convert<int64_t>::decode(node, integer)) {
                return integer;
            }
            double number = 0.0;
            if (YAML::convert<double>::decode(node, number)) {
                return number;
            }
            bool flag = false;
            if (YAML::convert<bool>::decode(node, flag)) {
                return flag;
            }
            return node.as<std::string>();
        }
        case YAML::NodeType::Null:
        case YAML::NodeType::Undefined:
            break;
    }
    return nullptr;
}

void warn_unknown_keys(const YAML::Node &node, const std::string &section, const std::vector<std::string> &valid_keys) {
    for (const auto &key_node : node) {
        std::string key = key_node.first.as<std::string>();
        bool known = false;
        for (const auto &valid_key : valid_keys) {
            if (key == valid_key) {
                known = true;
                break;
            }
        }
        if (!known) {
            LOG_WARN("[Config] Unknown " << section << " key: '" << key << "' (will be ignored)");
        }
    }
}

std::optional<std::string> read_env(const std::string &name) {
    if (name.empty()) {
        return std::nullopt;
    }
    const char *value = std::getenv(name.c_str());
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string(value);
}

}  // namespace

std::string expand_home(const std::string &path) {
    if (path == "~" || path.rfind("~/", 0) == 0) {
        const char *home = std::getenv("HOME");
        if (home != nullptr) {
            return std::string(home) + path.substr(1);
        }
    }
    return path;
}

bool validate_config(const CliConfig &config, std::string &error) {
    const auto &connection = config.connection;
    if (connection.endpoint.empty()) {
        error = "connection.endpoint is required";
        return false;
    }
    if (connection.endpoint.rfind("ws://", 0) != 0 && connection.endpoint.rfind("wss://", 0) != 0) {
        error = "connection.endpoint must start with ws:// or wss:// (got '" + connection.endpoint + "')";
        return false;
    }
    if (connection.ping_interval_ms < 0) {
        error = "connection.ping_interval_ms must be >= 0";
        return false;
    }

    const auto &reconnect = config.reconnect;
    if (reconnect.max_attempts < 0) {
        error = "reconnect.max_attempts must be >= 0";
        return false;
    }
    if (reconnect.base_delay_ms < 1) {
        error = "reconnect.base_delay_ms must be >= 1";
        return false;
    }
    if (reconnect.health_check_timeout_ms < 100) {
        error = "reconnect.health_check_timeout_ms must be >= 100";
        return false;
    }
    if (reconnect.health_check_interval_ms < 0) {
        error = "reconnect.health_check_interval_ms must be >= 0";
        return false;
    }

    if (config.initialize.method.empty()) {
        error = "initialize.method must not be empty";
        return false;
    }

    if (config.identity.store_path.empty()) {
        error = "identity.store_path must not be empty";
        return false;
    }

    const auto &level = config.logging.level;
    if (level != "debug" && level != "info" && level != "warn" && level != "error" && level != "none") {
        error = "logging.level must be one of debug, info, warn, error, none (got '" + level + "')";
        return false;
    }

    return true;
}

bool load_config(const std::string &config_path, CliConfig &config, std::string &error) {
    try {
        YAML::Node yaml = YAML::LoadFile(config_path);
        if (!yaml.IsMap()) {
            error = "Config root must be a map";
            return false;
        }

        warn_unknown_keys(yaml, "top-level", {"connection", "reconnect", "initialize", "identity", "logging"});

        // Connection
        if (const auto node = yaml["connection"]) {
            warn_unknown_keys(node, "connection",
                              {"endpoint", "auth_token_env", "cf_access_client_id", "cf_access_client_secret_env",
                               "headers", "ping_interval_ms", "append_newline", "include_jsonrpc_header",
                               "requires_unescaped_slashes"});
            auto &connection = config.connection;
            if (node["endpoint"]) {
                connection.endpoint = node["endpoint"].as<std::string>();
            }
            if (node["auth_token_env"]) {
                connection.auth_token_env = node["auth_token_env"].as<std::string>();
            }
            if (node["cf_access_client_id"]) {
                connection.cf_access_client_id = node["cf_access_client_id"].as<std::string>();
            }
            if (node["cf_access_client_secret_env"]) {
                connection.cf_access_client_secret_env = node["cf_access_client_secret_env"].as<std::string>();
            }
            if (node["headers"]) {
                if (!node["headers"].IsMap()) {
                    error = "connection.headers must be a map";
                    return false;
                }
                for (const auto &header : node["headers"]) {
                    connection.headers[header.first.as<std::string>()] = header.second.as<std::string>();
                }
            }
            if (node["ping_interval_ms"]) {
                connection.ping_interval_ms = node["ping_interval_ms"].as<int>();
            }
            if (node["append_newline"]) {
                connection.append_newline = node["append_newline"].as<bool>();
            }
            if (node["include_jsonrpc_header"]) {
                connection.include_jsonrpc_header = node["include_jsonrpc_header"].as<bool>();
            }
            if (node["requires_unescaped_slashes"]) {
                connection.requires_unescaped_slashes = node["requires_unescaped_slashes"].as<bool>();
            }
        }

        // Reconnect policy and health probes
        if (const auto node = yaml["reconnect"]) {
            warn_unknown_keys(node, "reconnect",
                              {"enabled", "max_attempts", "base_delay_ms", "health_check_timeout_ms",
                               "health_check_interval_ms"});
            auto &reconnect = config.reconnect;
            if (node["enabled"]) {
                reconnect.enabled = node["enabled"].as<bool>();
            }
            if (node["max_attempts"]) {
                reconnect.max_attempts = node["max_attempts"].as<int>();
            }
            if (node["base_delay_ms"]) {
                reconnect.base_delay_ms = node["base_delay_ms"].as<int>();
            }
            if (node["health_check_timeout_ms"]) {
                reconnect.health_check_timeout_ms = node["health_check_timeout_ms"].as<int>();
            }
            if (node["health_check_interval_ms"]) {
                reconnect.health_check_interval_ms = node["health_check_interval_ms"].as<int>();
            }
        }

        if (const auto node = yaml["initialize"]) {
            warn_unknown_keys(node, "initialize", {"auto", "method", "params"});
            if (node["auto"]) {
                config.initialize.auto_initialize = node["auto"].as<bool>();
            }
            if (node["method"]) {
                config.initialize.method = node["method"].as<std::string>();
            }
            if (node["params"]) {
                config.initialize.params = yaml_to_json(node["params"]);
            }
        }

        if (const auto node = yaml["identity"]) {
            warn_unknown_keys(node, "identity", {"store_path", "client_id"});
            if (node["store_path"]) {
                config.identity.store_path = node["store_path"].as<std::string>();
            }
            if (node["client_id"]) {
                config.identity.client_id = node["client_id"].as<std::string>();
            }
        }
        config.identity.store_path = expand_home(config.identity.store_path);

        if (const auto node = yaml["logging"]) {
            if (node["level"]) {
                config.logging.level = node["level"].as<std::string>();
            }
        }

        if (!validate_config(config, error)) {
            return false;
        }

        LOG_INFO("[Config] Endpoint: " << config.connection.endpoint);

        std::stringstream heartbeat_msg;
        heartbeat_msg << "[Config] Heartbeat: ";
        if (config.connection.ping_interval_ms > 0) {
            heartbeat_msg << config.connection.ping_interval_ms << "ms";
        } else {
            heartbeat_msg << "disabled";
        }
        LOG_INFO(heartbeat_msg.str());

        std::stringstream reconnect_msg;
        reconnect_msg << "[Config] Reconnect: " << (config.reconnect.enabled ? "enabled" : "disabled");
        if (config.reconnect.enabled) {
            reconnect_msg << " (max_attempts=" << config.reconnect.max_attempts
                          << ", base_delay=" << config.reconnect.base_delay_ms << "ms)";
        }
        LOG_INFO(reconnect_msg.str());

        LOG_INFO("[Config] Auto-initialize: " << (config.initialize.auto_initialize ? "on" : "off") << " (method '"
                                              << config.initialize.method << "')");
        LOG_INFO("[Config] Identity store: " << config.identity.store_path);
        LOG_INFO("[Config] Log level: " << config.logging.level);

        return true;
    } catch (const YAML::BadFile &e) {
        error = "Cannot open config file: " + config_path;
        return false;
    } catch (const YAML::ParserException &e) {
        error = "YAML parse error: " + std::string(e.what());
        return false;
    } catch (const std::exception &e) {
        error = "Config load error: " + std::string(e.what());
        return false;
    }
}

session::ManagerOptions to_manager_options(const CliConfig &config) {
    session::ManagerOptions options;
    options.reconnect.enabled = config.reconnect.enabled;
    options.reconnect.max_attempts = config.reconnect.max_attempts;
    options.reconnect.base_delay_ms = config.reconnect.base_delay_ms;
    options.health_check_timeout_ms = config.reconnect.health_check_timeout_ms;
    options.auto_initialize = config.initialize.auto_initialize;
    options.initialize_method = config.initialize.method;
    if (!config.identity.client_id.empty()) {
        options.client_id = config.identity.client_id;
    }
    return options;
}

session::ClientConfig to_client_config(const CliConfig &config) {
    const auto &connection = config.connection;

    session::ClientConfig client;
    client.endpoint = connection.endpoint;
    client.additional_headers = connection.headers;
    client.cf_access_client_id = connection.cf_access_client_id;
    client.cf_access_client_secret = read_env(connection.cf_access_client_secret_env).value_or("");
    client.append_newline = connection.append_newline;
    client.include_jsonrpc_header = connection.include_jsonrpc_header;
    client.requires_unescaped_slashes = connection.requires_unescaped_slashes;
    if (connection.ping_interval_ms > 0) {
        client.ping_interval_ms = connection.ping_interval_ms;
    } else {
        client.ping_interval_ms = std::nullopt;
    }

    if (!connection.auth_token_env.empty()) {
        const std::string env_name = connection.auth_token_env;
        client.token_provider = [env_name](std::string &token, std::string &error) {
            auto value = read_env(env_name);
            if (!value || value->empty()) {
                error = "Environment variable " + env_name + " is not set";
                return false;
            }
            token = *value;
            return true;
        };
    }
    return client;
}

}  // namespace runtime
}  // namespace tether
