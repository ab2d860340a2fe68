#include "client_config.hpp"

#include <cctype>

namespace tether {
namespace session {

namespace {

std::string trim(const std::string &value) {
    size_t begin = 0;
    size_t end = value.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(value[begin]))) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(value[end - 1]))) {
        --end;
    }
    return value.substr(begin, end - begin);
}

}  // namespace

transport::ConnectionConfig build_connection_config(const ClientConfig &config, const std::string &client_id) {
    transport::ConnectionConfig out;
    out.endpoint = config.endpoint;
    out.additional_headers = config.additional_headers;

    std::string cf_id = trim(config.cf_access_client_id);
    if (!cf_id.empty()) {
        out.additional_headers[kCfAccessClientIdHeader] = cf_id;
    }
    std::string cf_secret = trim(config.cf_access_client_secret);
    if (!cf_secret.empty()) {
        out.additional_headers[kCfAccessClientSecretHeader] = cf_secret;
    }

    out.additional_headers[kClientIdHeader] = client_id;

    if (config.token_provider) {
        out.token_provider = config.token_provider;
    } else if (config.auth_token && !config.auth_token->empty()) {
        std::string token = *config.auth_token;
        out.token_provider = [token](std::string &value, std::string &) {
            value = token;
            return true;
        };
    }

    if (config.ping_interval_ms && *config.ping_interval_ms > 0) {
        out.ping_interval_ms = config.ping_interval_ms;
    }
    out.append_newline = config.append_newline;
    out.include_jsonrpc_header = config.include_jsonrpc_header;
    out.escape_forward_slashes = !config.requires_unescaped_slashes;
    return out;
}

}  // namespace session
}  // namespace tether
