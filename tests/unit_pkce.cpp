// SPDX-License-Identifier: Apache-2.0
#include "auth/pkce.hpp"

#include <cassert>
#include <cctype>
#include <iostream>
#include <set>
#include <string>

int main()
{
    using namespace firetick::auth::pkce;
    // RFC 7636 appendix B
    assert(s256_challenge("dBjftJeZ4CVP-mB92K27uhbUJU1p1r_wW1gFWFOEjXk") == "E9Melhoa2OwvFrEMTJguCHaoeK1t8URWbuGJSstw-cM");

    assert(base64url_encode("") == "");
    assert(base64url_encode("f") == "Zg");
    assert(base64url_encode("fo") == "Zm8");
    assert(base64url_encode("foo") == "Zm9v");
    assert(base64url_encode("\xfb\xff") == "-_8");
    assert(base64url_decode("Zm9vYmFy") == "foobar");
    assert(base64url_decode("Zm9vYg==") == "foob");
    assert(base64url_decode("-_8") == "\xfb\xff");
    assert(base64url_decode("a*b") == "");

    auto v = make_verifier();
    assert(v.size() == 43); // 32 bytes, unpadded
    for (char c : v)
        assert(std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_');

    std::set<std::string> nonces;
    for (int i = 0; i < 64; ++i)
        nonces.insert(make_state_nonce());
    assert(nonces.size() == 64);

    std::cout << "unit_pkce OK" << std::endl;
    return 0;
}
