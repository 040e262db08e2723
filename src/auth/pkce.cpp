// SPDX-License-Identifier: Apache-2.0
#include "auth/pkce.hpp"

#include <openssl/evp.h>
#include <openssl/rand.h>

#include <array>
#include <cstdint>
#include <stdexcept>
#include <vector>

namespace firetick::auth::pkce {

namespace {
constexpr char k_alphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";

int decode_char(char c)
{
    if (c >= 'A' && c <= 'Z')
        return c - 'A';
    if (c >= 'a' && c <= 'z')
        return c - 'a' + 26;
    if (c >= '0' && c <= '9')
        return c - '0' + 52;
    if (c == '-' || c == '+')
        return 62;
    if (c == '_' || c == '/')
        return 63;
    return -1;
}
} // namespace

std::string base64url_encode(std::string_view bytes)
{
    std::string out;
    out.reserve((bytes.size() + 2) / 3 * 4);
    size_t i = 0;
    for (; i + 2 < bytes.size(); i += 3) {
        uint32_t v = (static_cast<unsigned char>(bytes[i]) << 16) | (static_cast<unsigned char>(bytes[i + 1]) << 8)
            | static_cast<unsigned char>(bytes[i + 2]);
        out.push_back(k_alphabet[(v >> 18) & 0x3F]);
        out.push_back(k_alphabet[(v >> 12) & 0x3F]);
        out.push_back(k_alphabet[(v >> 6) & 0x3F]);
        out.push_back(k_alphabet[v & 0x3F]);
    }
    size_t rest = bytes.size() - i;
    if (rest == 1) {
        uint32_t v = static_cast<unsigned char>(bytes[i]) << 16;
        out.push_back(k_alphabet[(v >> 18) & 0x3F]);
        out.push_back(k_alphabet[(v >> 12) & 0x3F]);
    } else if (rest == 2) {
        uint32_t v = (static_cast<unsigned char>(bytes[i]) << 16) | (static_cast<unsigned char>(bytes[i + 1]) << 8);
        out.push_back(k_alphabet[(v >> 18) & 0x3F]);
        out.push_back(k_alphabet[(v >> 12) & 0x3F]);
        out.push_back(k_alphabet[(v >> 6) & 0x3F]);
    }
    return out;
}

std::string base64url_decode(std::string_view text)
{
    while (!text.empty() && text.back() == '=')
        text.remove_suffix(1);
    if (text.size() % 4 == 1)
        return {};
    std::string out;
    out.reserve(text.size() * 3 / 4);
    uint32_t acc = 0;
    int bits = 0;
    for (char c : text) {
        int v = decode_char(c);
        if (v < 0)
            return {};
        acc = (acc << 6) | static_cast<uint32_t>(v);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<char>((acc >> bits) & 0xFF));
        }
    }
    return out;
}

std::string random_token(size_t n)
{
    std::vector<unsigned char> buf(n);
    if (RAND_bytes(buf.data(), static_cast<int>(buf.size())) != 1)
        throw std::runtime_error("RAND_bytes failed");
    return base64url_encode(std::string_view(reinterpret_cast<const char *>(buf.data()), buf.size()));
}

std::string make_verifier()
{
    return random_token(32);
}

std::string s256_challenge(std::string_view verifier)
{
    std::array<unsigned char, EVP_MAX_MD_SIZE> md{};
    unsigned int md_len = 0;
    if (EVP_Digest(verifier.data(), verifier.size(), md.data(), &md_len, EVP_sha256(), nullptr) != 1)
        throw std::runtime_error("EVP_Digest(sha256) failed");
    return base64url_encode(std::string_view(reinterpret_cast<const char *>(md.data()), md_len));
}

std::string make_state_nonce()
{
    return random_token(24);
}

} // namespace firetick::auth::pkce
