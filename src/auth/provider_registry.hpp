// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "common/config.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace firetick::auth {

struct ProviderConfig
{
    std::string id; // normalized (lower case)
    std::string auth_endpoint;
    std::string token_endpoint;
    std::string client_id;
    std::string client_secret;
    std::vector<std::string> scopes;
    std::string account_endpoint; // full accounts:delete URL, empty when unsupported
    uint16_t redirect_port{0};

    // "http://localhost:<port>/"
    std::string redirect_uri() const;
};

// Read-only after construction. Lookups are case-insensitive so "Google" and
// "google" name the same provider.
class ProviderRegistry
{
public:
    ProviderRegistry() = default;

    // Builds one ProviderConfig per configured provider, filling endpoints and
    // scopes from built-in defaults where the settings omit them. Throws
    // ConfigError for an unknown provider without explicit endpoints.
    ProviderRegistry(const std::map<std::string, ProviderSettings> &providers, uint16_t redirect_port);

    void add(ProviderConfig cfg);

    const ProviderConfig *find(std::string_view id) const;
    bool contains(std::string_view id) const { return find(id) != nullptr; }
    std::vector<std::string> ids() const;
    size_t size() const noexcept { return m_by_id.size(); }

    static std::string normalize(std::string_view id);

private:
    std::map<std::string, ProviderConfig> m_by_id;
};

} // namespace firetick::auth
