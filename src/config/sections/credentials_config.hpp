/*
 * credentials_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10

Description: Platform account credentials

**************************************************/

#ifndef HUBBRIDGE_CONFIG_SECTIONS_CREDENTIALS_CONFIG_HPP
#define HUBBRIDGE_CONFIG_SECTIONS_CREDENTIALS_CONFIG_HPP

#include <string>

#include "../core/config_section.hpp"

namespace hubbridge::config {

/**
 * @brief Account credentials
 *
 * Normally supplied through HUBSPACE_EMAIL, HUBSPACE_PASSWORD and
 * HUBSPACE_REFRESH_TOKEN rather than the configuration file.
 */
struct CredentialsConfig : ConfigSection<CredentialsConfig> {
    static constexpr std::string_view PATH = "credentials";

    std::string email;
    std::string password;
    std::string refreshToken;

    /**
     * @brief Whether enough is present to attempt a connection
     */
    [[nodiscard]] bool present() const {
        return !refreshToken.empty() || (!email.empty() && !password.empty());
    }

    [[nodiscard]] json serialize() const {
        return {{"email", email},
                {"password", password},
                {"refreshToken", refreshToken}};
    }

    /**
     * @brief Serialized form with secrets masked, for logs and dumps
     */
    [[nodiscard]] json redacted() const {
        return {{"email", email},
                {"password", password.empty() ? "" : "***"},
                {"refreshToken", refreshToken.empty() ? "" : "***"}};
    }

    [[nodiscard]] static CredentialsConfig deserialize(const json& j) {
        CredentialsConfig cfg;
        cfg.email = j.value("email", cfg.email);
        cfg.password = j.value("password", cfg.password);
        cfg.refreshToken = j.value("refreshToken", cfg.refreshToken);
        return cfg;
    }
};

}  // namespace hubbridge::config

#endif  // HUBBRIDGE_CONFIG_SECTIONS_CREDENTIALS_CONFIG_HPP
