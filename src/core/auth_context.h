#pragma once
#include <string>
#include <map>
#include <utility>

// Authentication contexts compared by a run.
// A context is a display label plus the request headers that carry (or omit)
// a credential. Contexts are built once before any request and only read
// afterwards, so they are shared across worker threads without locking.

enum class AuthMode {
    COOKIE_VS_NONE = 1,   // Cookie header vs no credential
    COOKIE_VS_COOKIE = 2, // Two different Cookie headers
    BEARER_VS_NONE = 3,   // Bearer token vs no credential
    BEARER_VS_BEARER = 4  // Two different bearer tokens
};

struct AuthContext {
    std::string label;
    std::map<std::string, std::string> headers;
};

struct AuthCredentials {
    std::string cookie1;
    std::string cookie2;
    std::string token1;
    std::string token2;
};

/**
 * @brief Map a numeric CLI mode to an AuthMode
 * @param mode Mode number (1-4)
 * @param out Populated on success
 * @return false if the number is not a known mode
 */
bool parse_auth_mode(long mode, AuthMode& out);

/**
 * @brief Check that the credentials required by a mode are present
 * @param mode Operation mode
 * @param creds Credentials supplied on the command line
 * @return Empty string if valid, otherwise the message to show the user
 */
std::string validate_credentials(AuthMode mode, const AuthCredentials& creds);

/**
 * @brief Build the pair of contexts (A, B) for a mode
 * @param mode Operation mode
 * @param creds Credentials; must have passed validate_credentials
 * @return Context A and context B
 */
std::pair<AuthContext, AuthContext> make_auth_contexts(AuthMode mode, const AuthCredentials& creds);

/// Value of an Authorization header carrying a bearer token.
std::string bearer_header(const std::string& token);
