#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <string>

#include <spdlog/spdlog.h>

#include "http_transport.hpp"

namespace hubbridge::afero {

/**
 * @brief Account credentials handed to the session.
 */
struct Credentials {
    std::string email;
    std::string password;
    std::string refresh_token;

    /**
     * @brief Whether enough is present to attempt a connection.
     */
    bool present() const {
        return !refresh_token.empty() || (!email.empty() && !password.empty());
    }
};

/**
 * @brief A bearer token and the moment it stops being usable.
 */
struct AccessToken {
    std::string value;
    std::chrono::steady_clock::time_point expires_at;

    /**
     * @brief True when the token expires within `margin` of `now`.
     */
    bool expired(std::chrono::steady_clock::time_point now =
                     std::chrono::steady_clock::now(),
                 std::chrono::seconds margin = std::chrono::seconds(30)) const {
        return value.empty() || now + margin >= expires_at;
    }
};

/**
 * @brief Turns credentials into a bearer token.
 *
 * Implementations throw device::AuthenticationException when the platform
 * rejects the credentials and device::BackendException when it cannot be
 * reached.
 */
class TokenSource {
public:
    virtual ~TokenSource() = default;

    virtual AccessToken fetch(const Credentials& credentials) = 0;
};

/**
 * @brief Configuration for the OAuth2 token endpoint.
 */
struct TokenEndpointConfig {
    std::string token_url =
        "https://accounts.hubspaceconnect.com/auth/realms/thd/protocol/"
        "openid-connect/token";             ///< Token endpoint.
    std::string client_id = "hubspace_android";  ///< OAuth2 client id.
    std::chrono::milliseconds timeout{10000};     ///< Request timeout.
};

/**
 * @brief OAuth2 `refresh_token` grant against the account realm.
 *
 * The refresh token is taken from the credentials on first use; a rotated
 * token returned by the endpoint replaces it for subsequent fetches.
 * Email/password-only credentials are rejected, as the interactive login
 * flow is not implemented.
 */
class RefreshTokenSource final : public TokenSource {
public:
    RefreshTokenSource(std::shared_ptr<HttpTransport> transport,
                       TokenEndpointConfig config = {});

    AccessToken fetch(const Credentials& credentials) override;

private:
    std::shared_ptr<HttpTransport> transport_;
    TokenEndpointConfig config_;
    std::shared_ptr<spdlog::logger> logger_;
    std::mutex mutex_;
    std::string rotated_refresh_token_;
};

}  // namespace hubbridge::afero
