// Authentication context construction

#include "auth_context.h"

bool parse_auth_mode(long mode, AuthMode& out) {
    switch (mode) {
        case 1: out = AuthMode::COOKIE_VS_NONE; return true;
        case 2: out = AuthMode::COOKIE_VS_COOKIE; return true;
        case 3: out = AuthMode::BEARER_VS_NONE; return true;
        case 4: out = AuthMode::BEARER_VS_BEARER; return true;
    }
    return false;
}

std::string validate_credentials(AuthMode mode, const AuthCredentials& creds) {
    switch (mode) {
        case AuthMode::COOKIE_VS_NONE:
            if (creds.cookie1.empty()) {
                return "Error: Cookie (-c1) is required for mode 1";
            }
            break;
        case AuthMode::COOKIE_VS_COOKIE:
            if (creds.cookie1.empty() || creds.cookie2.empty()) {
                return "Error: Both cookies (-c1 and -c2) are required for mode 2";
            }
            break;
        case AuthMode::BEARER_VS_NONE:
            if (creds.token1.empty()) {
                return "Error: Bearer token (-t1) is required for mode 3";
            }
            break;
        case AuthMode::BEARER_VS_BEARER:
            if (creds.token1.empty() || creds.token2.empty()) {
                return "Error: Both tokens (-t1 and -t2) are required for mode 4";
            }
            break;
    }
    return "";
}

std::string bearer_header(const std::string& token) {
    return "Bearer " + token;
}

std::pair<AuthContext, AuthContext> make_auth_contexts(AuthMode mode, const AuthCredentials& creds) {
    AuthContext a;
    AuthContext b;

    switch (mode) {
        case AuthMode::COOKIE_VS_NONE:
            a.label = "With Cookie";
            a.headers["Cookie"] = creds.cookie1;
            b.label = "Without Cookie";
            break;
        case AuthMode::COOKIE_VS_COOKIE:
            a.label = "Cookie 1";
            a.headers["Cookie"] = creds.cookie1;
            b.label = "Cookie 2";
            b.headers["Cookie"] = creds.cookie2;
            break;
        case AuthMode::BEARER_VS_NONE:
            a.label = "With Token";
            a.headers["Authorization"] = bearer_header(creds.token1);
            b.label = "Without Token";
            break;
        case AuthMode::BEARER_VS_BEARER:
            a.label = "Token 1";
            a.headers["Authorization"] = bearer_header(creds.token1);
            b.label = "Token 2";
            b.headers["Authorization"] = bearer_header(creds.token2);
            break;
    }

    return {a, b};
}
