// SPDX-License-Identifier: Apache-2.0
#include "common/config.hpp"

#include "common/errors.hpp"

#include <yaml-cpp/yaml.h>

namespace firetick {

namespace {

Config from_node(const YAML::Node &root)
{
    Config cfg;
    if (!root || root.IsNull())
        return cfg;
    if (root["project_id"])
        cfg.project_id = root["project_id"].as<std::string>();
    if (root["redirect_port"])
        cfg.redirect_port = root["redirect_port"].as<uint16_t>();
    if (root["refresh_margin_seconds"])
        cfg.refresh_margin_seconds = root["refresh_margin_seconds"].as<uint32_t>();
    if (root["flow_timeout_seconds"])
        cfg.flow_timeout_seconds = root["flow_timeout_seconds"].as<uint32_t>();
    if (root["reauth_wait_ms"])
        cfg.reauth_wait_ms = root["reauth_wait_ms"].as<uint32_t>();
    if (root["tick_rate"])
        cfg.tick_rate = root["tick_rate"].as<uint32_t>();
    if (root["log_level"])
        cfg.log_level = root["log_level"].as<std::string>();
    if (root["log_json"])
        cfg.log_json = root["log_json"].as<bool>();
    if (root["metrics_port"])
        cfg.metrics_port = root["metrics_port"].as<uint16_t>();
    if (root["document_endpoint"])
        cfg.document_endpoint = root["document_endpoint"].as<std::string>();
    if (root["emulator_port"])
        cfg.emulator_port = root["emulator_port"].as<uint16_t>();
    if (const auto providers = root["providers"]) {
        if (!providers.IsMap())
            throw ConfigError("'providers' must be a map of provider id -> settings");
        for (const auto &kv : providers) {
            auto id = kv.first.as<std::string>();
            const auto &node = kv.second;
            ProviderSettings ps;
            if (node["client_id"])
                ps.client_id = node["client_id"].as<std::string>();
            if (node["client_secret"])
                ps.client_secret = node["client_secret"].as<std::string>();
            if (node["auth_endpoint"])
                ps.auth_endpoint = node["auth_endpoint"].as<std::string>();
            if (node["token_endpoint"])
                ps.token_endpoint = node["token_endpoint"].as<std::string>();
            if (node["scopes"])
                ps.scopes = node["scopes"].as<std::vector<std::string>>();
            if (node["account_endpoint"])
                ps.account_endpoint = node["account_endpoint"].as<std::string>();
            if (node["api_key"])
                ps.api_key = node["api_key"].as<std::string>();
            if (ps.client_id.empty())
                throw ConfigError("provider '" + id + "' has no client_id");
            cfg.providers[id] = std::move(ps);
        }
    }
    if (cfg.tick_rate == 0)
        throw ConfigError("tick_rate must be > 0");
    return cfg;
}

} // namespace

std::optional<uint16_t> parse_port(const std::string &text)
{
    if (text.empty() || text.size() > 5)
        return std::nullopt;
    uint32_t v = 0;
    for (char c : text) {
        if (c < '0' || c > '9')
            return std::nullopt;
        v = v * 10 + static_cast<uint32_t>(c - '0');
    }
    if (v > 65535)
        return std::nullopt;
    return static_cast<uint16_t>(v);
}

Config load_config(const std::string &path)
{
    try {
        return from_node(YAML::LoadFile(path));
    } catch (const YAML::Exception &ex) {
        throw ConfigError("config '" + path + "': " + ex.what());
    }
}

Config parse_config(const std::string &yaml_text)
{
    try {
        return from_node(YAML::Load(yaml_text));
    } catch (const YAML::Exception &ex) {
        throw ConfigError(std::string("config: ") + ex.what());
    }
}

} // namespace firetick
