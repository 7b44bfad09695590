#include "token_source.hpp"

#include <cctype>
#include <cstdio>

#include <nlohmann/json.hpp>

#include "device/common/device_exceptions.hpp"
#include "logging/logging.hpp"

namespace hubbridge::afero {

using json = nlohmann::json;

namespace {

std::string form_encode(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out += static_cast<char>(c);
        } else {
            char buf[4];
            std::snprintf(buf, sizeof(buf), "%%%02X", c);
            out += buf;
        }
    }
    return out;
}

}  // namespace

RefreshTokenSource::RefreshTokenSource(std::shared_ptr<HttpTransport> transport,
                                       TokenEndpointConfig config)
    : transport_(std::move(transport)),
      config_(std::move(config)),
      logger_(logging::get("afero")) {}

AccessToken RefreshTokenSource::fetch(const Credentials& credentials) {
    std::lock_guard<std::mutex> lock(mutex_);

    const std::string& refresh_token = rotated_refresh_token_.empty()
                                           ? credentials.refresh_token
                                           : rotated_refresh_token_;
    if (refresh_token.empty()) {
        throw device::AuthenticationException(
            "No refresh token configured; interactive login is not "
            "supported");
    }

    HttpRequest request;
    request.method = HttpMethod::Post;
    request.url = config_.token_url;
    request.timeout = config_.timeout;
    request.headers["Content-Type"] = "application/x-www-form-urlencoded";
    request.headers["Accept"] = "application/json";
    request.body = "grant_type=refresh_token&client_id=" +
                   form_encode(config_.client_id) +
                   "&refresh_token=" + form_encode(refresh_token) +
                   "&scope=openid";

    logger_->debug("Requesting access token from {}", config_.token_url);
    HttpResponse response = transport_->send(request);

    if (response.status == 400 || response.status == 401) {
        throw device::AuthenticationException(
            "Token endpoint rejected the refresh token (HTTP " +
            std::to_string(response.status) + ")");
    }
    if (!response.is_success()) {
        throw device::BackendException("Token endpoint failed",
                                       response.status);
    }

    json body;
    try {
        body = json::parse(response.body);
    } catch (const json::parse_error& e) {
        throw device::ProtocolException(
            std::string("Token response is not JSON: ") + e.what());
    }

    if (!body.is_object() || !body.contains("access_token") ||
        !body["access_token"].is_string()) {
        throw device::AuthenticationException(
            "Token response carries no access_token");
    }

    AccessToken token;
    token.value = body["access_token"].get<std::string>();
    const auto expires_in = body.value("expires_in", 120);
    token.expires_at =
        std::chrono::steady_clock::now() + std::chrono::seconds(expires_in);

    if (body.contains("refresh_token") && body["refresh_token"].is_string()) {
        rotated_refresh_token_ = body["refresh_token"].get<std::string>();
    }

    logger_->info("Obtained access token (expires in {}s)", expires_in);
    return token;
}

}  // namespace hubbridge::afero
