#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <spdlog/spdlog.h>

#include "afero_protocol.hpp"
#include "session.hpp"

namespace hubbridge::afero {

/**
 * @brief Endpoints and limits of a cloud session.
 */
struct CloudSessionConfig {
    std::string api_host = "https://api2.afero.net";  ///< Account API.
    std::string data_host =
        "https://semantics2.afero.net";  ///< Metadevice/state API.
    std::chrono::milliseconds http_timeout{10000};  ///< Per-request cap.
};

class AferoCloudSession;

/**
 * @brief Controller for one device class of a cloud session.
 *
 * Holds the devices discovered by the session together with the power
 * function instance each one advertises, and writes power changes through
 * the state endpoint.
 */
class AferoDeviceController final : public DeviceController {
public:
    AferoDeviceController(AferoCloudSession& session, device::DeviceClass cls);

    device::DeviceClass deviceClass() const override { return class_; }
    std::vector<DeviceHandle> listDevices() override;
    std::optional<DeviceHandle> getDevice(const std::string& id) override;
    void turnOn(const std::string& id) override;
    void turnOff(const std::string& id) override;
    void applyState(const std::string& id, std::string_view function_class,
                    const json& value) override;

    /**
     * @brief Replace the held inventory with a fresh listing.
     */
    void load(const std::vector<Metadevice>& devices);

    void clear();

private:
    struct Entry {
        DeviceHandle handle;
        std::optional<std::string> power_instance;
    };

    void set_power(const std::string& id, bool on);

    AferoCloudSession& session_;
    device::DeviceClass class_;
    std::vector<std::string> order_;
    std::map<std::string, Entry> devices_;
};

/**
 * @brief SessionProvider backed by the Afero cloud REST API.
 *
 * initialize() obtains a token, resolves the account id from
 * `/v1/users/me` and loads the metadevice inventory into per-class
 * controllers. A failure at any step leaves the session object in place
 * with whatever was loaded; later requests then fail individually.
 */
class AferoCloudSession final : public SessionProvider {
public:
    AferoCloudSession(std::shared_ptr<HttpTransport> transport,
                      std::unique_ptr<TokenSource> token_source,
                      CloudSessionConfig config = {});
    ~AferoCloudSession() override;

    AferoCloudSession(const AferoCloudSession&) = delete;
    AferoCloudSession& operator=(const AferoCloudSession&) = delete;

    device::DeviceVoidResult initialize(
        const Credentials& credentials,
        std::chrono::milliseconds budget) override;
    DeviceController* controller(device::DeviceClass cls) override;
    std::string accessToken() override;
    std::string accountId() const override { return account_id_; }
    HttpResponse rawRequest(HttpRequest request) override;
    device::DeviceVoidResult close(std::chrono::milliseconds budget) override;

    const CloudSessionConfig& config() const { return config_; }

private:
    using Clock = std::chrono::steady_clock;

    void check_deadline(Clock::time_point deadline,
                        const std::string& stage) const;
    std::chrono::milliseconds request_timeout(
        Clock::time_point deadline) const;
    void resolve_account(Clock::time_point deadline);
    void load_inventory(Clock::time_point deadline);

    std::shared_ptr<HttpTransport> transport_;
    std::unique_ptr<TokenSource> token_source_;
    CloudSessionConfig config_;
    std::shared_ptr<spdlog::logger> logger_;

    Credentials credentials_;
    AccessToken token_;
    std::string account_id_;
    std::map<device::DeviceClass, std::unique_ptr<AferoDeviceController>>
        controllers_;
};

}  // namespace hubbridge::afero
