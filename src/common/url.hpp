// SPDX-License-Identifier: Apache-2.0
// Minimal URL helpers for OAuth2 query strings and form bodies.
#pragma once

#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace firetick::url {

using Params = std::vector<std::pair<std::string, std::string>>;

// Percent-encodes everything outside RFC 3986 unreserved characters, except
// ':' and '/' which are legal inside a query component and keep redirect URIs
// readable.
std::string encode_component(std::string_view s);

// Decodes %XX escapes and '+' (form encoding) into the raw bytes. Malformed
// escapes are kept literally.
std::string decode_component(std::string_view s);

// "a=1&b=two" in the given order.
std::string build_query(const Params &params);

// Parses "a=1&b=two" (no leading '?'). Later duplicates win.
std::map<std::string, std::string> parse_query(std::string_view query);

// Splits a request target "/path?query" into path and query.
std::pair<std::string, std::string> split_target(std::string_view target);

} // namespace firetick::url
