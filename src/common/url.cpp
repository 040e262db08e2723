// SPDX-License-Identifier: Apache-2.0
#include "common/url.hpp"

#include <cctype>

namespace firetick::url {

namespace {
bool keep_literal(unsigned char c)
{
    return std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~' || c == ':' || c == '/';
}

int hex_value(char c)
{
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}
} // namespace

std::string encode_component(std::string_view s)
{
    static const char *hex = "0123456789ABCDEF";
    std::string out;
    out.reserve(s.size() * 3 / 2);
    for (char ch : s) {
        auto c = static_cast<unsigned char>(ch);
        if (keep_literal(c)) {
            out.push_back(ch);
        } else {
            out.push_back('%');
            out.push_back(hex[c >> 4]);
            out.push_back(hex[c & 0x0F]);
        }
    }
    return out;
}

std::string decode_component(std::string_view s)
{
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        if (c == '+') {
            out.push_back(' ');
        } else if (c == '%' && i + 2 < s.size()) {
            int hi = hex_value(s[i + 1]);
            int lo = hex_value(s[i + 2]);
            if (hi < 0 || lo < 0) {
                out.push_back(c);
                continue;
            }
            out.push_back(static_cast<char>((hi << 4) | lo));
            i += 2;
        } else {
            out.push_back(c);
        }
    }
    return out;
}

std::string build_query(const Params &params)
{
    std::string out;
    for (const auto &[k, v] : params) {
        if (!out.empty())
            out.push_back('&');
        out += encode_component(k);
        out.push_back('=');
        out += encode_component(v);
    }
    return out;
}

std::map<std::string, std::string> parse_query(std::string_view query)
{
    std::map<std::string, std::string> out;
    while (!query.empty()) {
        size_t amp = query.find('&');
        std::string_view pair = query.substr(0, amp);
        query = amp == std::string_view::npos ? std::string_view{} : query.substr(amp + 1);
        if (pair.empty())
            continue;
        size_t eq = pair.find('=');
        if (eq == std::string_view::npos)
            out[decode_component(pair)] = std::string();
        else
            out[decode_component(pair.substr(0, eq))] = decode_component(pair.substr(eq + 1));
    }
    return out;
}

std::pair<std::string, std::string> split_target(std::string_view target)
{
    size_t q = target.find('?');
    if (q == std::string_view::npos)
        return {std::string(target), std::string()};
    std::string_view query = target.substr(q + 1);
    size_t hash = query.find('#');
    if (hash != std::string_view::npos)
        query = query.substr(0, hash);
    return {std::string(target.substr(0, q)), std::string(query)};
}

} // namespace firetick::url
