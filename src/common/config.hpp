// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace firetick {

// Per-provider settings as supplied by the host. Endpoints and scopes are
// optional; built-in defaults exist for well-known providers.
struct ProviderSettings
{
    std::string client_id;
    std::string client_secret;
    std::optional<std::string> auth_endpoint;
    std::optional<std::string> token_endpoint;
    std::optional<std::vector<std::string>> scopes;
    // Identity service accounts:delete URL; "none" disables account deletion.
    std::optional<std::string> account_endpoint;
    std::string api_key; // appended to account_endpoint as ?key=
};

struct Config
{
    std::string project_id{"demo-firetick"};
    uint16_t redirect_port{8085};
    uint32_t refresh_margin_seconds{60};
    uint32_t flow_timeout_seconds{300};
    uint32_t reauth_wait_ms{10000};
    uint32_t tick_rate{60};
    std::string log_level{"info"};
    bool log_json{false};
    uint16_t metrics_port{0}; // 0 disables
    // "memory" keeps documents in-process; otherwise host:port of a document server.
    std::string document_endpoint{"memory"};
    uint16_t emulator_port{0}; // >0 starts the local document emulator on this port
    std::map<std::string, ProviderSettings> providers;
};

// Decimal TCP port in [0, 65535]; nullopt for anything else (sign, junk,
// overflow).
std::optional<uint16_t> parse_port(const std::string &text);

// Loads a YAML config file; every key is optional. Throws ConfigError when the
// file cannot be read or a value has the wrong type.
Config load_config(const std::string &path);

// Same as load_config but from an in-memory YAML document.
Config parse_config(const std::string &yaml_text);

} // namespace firetick
