#include "cloud_session.hpp"

#include <algorithm>

#include "device/common/device_exceptions.hpp"
#include "logging/logging.hpp"

namespace hubbridge::afero {

using device::BackendException;
using device::DeviceClass;
using device::DeviceErrorCode;

namespace {

bool is_accepted_state_write(long status) {
    return status == 200 || status == 202 || status == 204;
}

json parse_body(const HttpResponse& response, const std::string& what) {
    try {
        return json::parse(response.body);
    } catch (const json::parse_error& e) {
        throw device::ProtocolException(what + " is not JSON: " + e.what());
    }
}

}  // namespace

// ==================== AferoDeviceController ====================

AferoDeviceController::AferoDeviceController(AferoCloudSession& session,
                                             DeviceClass cls)
    : session_(session), class_(cls) {}

std::vector<DeviceHandle> AferoDeviceController::listDevices() {
    std::vector<DeviceHandle> result;
    result.reserve(order_.size());
    for (const auto& id : order_) {
        result.push_back(devices_.at(id).handle);
    }
    return result;
}

std::optional<DeviceHandle> AferoDeviceController::getDevice(
    const std::string& id) {
    auto it = devices_.find(id);
    if (it == devices_.end()) {
        return std::nullopt;
    }
    return it->second.handle;
}

void AferoDeviceController::turnOn(const std::string& id) {
    set_power(id, true);
}

void AferoDeviceController::turnOff(const std::string& id) {
    set_power(id, false);
}

void AferoDeviceController::applyState(const std::string& id,
                                       std::string_view function_class,
                                       const json& value) {
    auto it = devices_.find(id);
    if (it == devices_.end()) {
        return;
    }
    apply_state_value(it->second.handle.state,
                      StateValue{std::string(function_class), std::nullopt,
                                 value});
}

void AferoDeviceController::load(const std::vector<Metadevice>& devices) {
    clear();
    for (const auto& metadevice : devices) {
        Entry entry;
        entry.handle.id = metadevice.id;
        entry.handle.name = metadevice.friendly_name;
        entry.handle.device_class = class_;
        entry.handle.state = snapshot_from_state(metadevice.values);
        if (const auto* power = find_value(metadevice.values,
                                           function_class::kPower)) {
            entry.power_instance = power->function_instance;
        }
        if (devices_.emplace(metadevice.id, std::move(entry)).second) {
            order_.push_back(metadevice.id);
        }
    }
}

void AferoDeviceController::clear() {
    order_.clear();
    devices_.clear();
}

void AferoDeviceController::set_power(const std::string& id, bool on) {
    auto it = devices_.find(id);
    if (it == devices_.end()) {
        throw device::DeviceException(
            "Device not held by the " + device::deviceClassToString(class_) +
                " controller",
            id, DeviceErrorCode::UnknownDevice);
    }

    StateValue value{std::string(function_class::kPower),
                     it->second.power_instance, on ? "on" : "off"};
    HttpRequest request;
    request.method = HttpMethod::Put;
    request.url = state_url(session_.config().data_host, session_.accountId(),
                            id);
    request.headers["Content-Type"] = "application/json; charset=utf-8";
    request.body = build_state_payload(id, {value}, now_epoch_ms()).dump();

    auto response = session_.rawRequest(std::move(request));
    if (!is_accepted_state_write(response.status)) {
        throw BackendException("Power change rejected for " + id,
                               response.status);
    }
    apply_state_value(it->second.handle.state, value);
}

// ==================== AferoCloudSession ====================

AferoCloudSession::AferoCloudSession(std::shared_ptr<HttpTransport> transport,
                                     std::unique_ptr<TokenSource> token_source,
                                     CloudSessionConfig config)
    : transport_(std::move(transport)),
      token_source_(std::move(token_source)),
      config_(std::move(config)),
      logger_(logging::get("afero")) {
    for (auto cls : device::kAllDeviceClasses) {
        controllers_.emplace(
            cls, std::make_unique<AferoDeviceController>(*this, cls));
    }
}

AferoCloudSession::~AferoCloudSession() = default;

device::DeviceVoidResult AferoCloudSession::initialize(
    const Credentials& credentials, std::chrono::milliseconds budget) {
    const auto deadline = Clock::now() + budget;
    credentials_ = credentials;

    return device::tryExecute([&] {
        logger_->info("Authenticating with the platform");
        token_ = token_source_->fetch(credentials_);
        check_deadline(deadline, "Authentication");

        resolve_account(deadline);
        check_deadline(deadline, "Account lookup");

        load_inventory(deadline);
    });
}

DeviceController* AferoCloudSession::controller(DeviceClass cls) {
    auto it = controllers_.find(cls);
    return it == controllers_.end() ? nullptr : it->second.get();
}

std::string AferoCloudSession::accessToken() {
    if (token_.expired()) {
        logger_->debug("Access token missing or near expiry, refreshing");
        token_ = token_source_->fetch(credentials_);
    }
    return token_.value;
}

HttpResponse AferoCloudSession::rawRequest(HttpRequest request) {
    request.headers["Authorization"] = "Bearer " + accessToken();
    if (!request.headers.contains("Accept")) {
        request.headers["Accept"] = "application/json";
    }
    request.timeout = std::min(request.timeout, config_.http_timeout);
    return transport_->send(request);
}

device::DeviceVoidResult AferoCloudSession::close(
    std::chrono::milliseconds budget) {
    logger_->debug("Closing session (budget {}ms)", budget.count());
    for (auto& [cls, controller] : controllers_) {
        controller->clear();
    }
    token_ = AccessToken{};
    account_id_.clear();
    return device::success();
}

void AferoCloudSession::check_deadline(Clock::time_point deadline,
                                       const std::string& stage) const {
    if (Clock::now() >= deadline) {
        throw device::DeviceTimeoutException(stage);
    }
}

std::chrono::milliseconds AferoCloudSession::request_timeout(
    Clock::time_point deadline) const {
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - Clock::now());
    return std::clamp(remaining, std::chrono::milliseconds(1),
                      config_.http_timeout);
}

void AferoCloudSession::resolve_account(Clock::time_point deadline) {
    HttpRequest request;
    request.url = config_.api_host + "/v1/users/me";
    request.timeout = request_timeout(deadline);

    auto response = rawRequest(std::move(request));
    if (response.status == 401 || response.status == 403) {
        throw device::AuthenticationException(
            "Account lookup rejected (HTTP " +
            std::to_string(response.status) + ")");
    }
    if (!response.is_success()) {
        throw BackendException("Account lookup failed", response.status);
    }

    account_id_ = parse_account_id(parse_body(response, "Account response"));
    logger_->info("Authenticated, account {}", account_id_);
}

void AferoCloudSession::load_inventory(Clock::time_point deadline) {
    HttpRequest request;
    request.url = metadevices_url(config_.data_host, account_id_);
    request.query = {{"expansions", "state"}};
    request.timeout = request_timeout(deadline);

    auto response = rawRequest(std::move(request));
    if (!response.is_success()) {
        throw BackendException("Metadevice listing failed", response.status);
    }

    std::map<DeviceClass, std::vector<Metadevice>> by_class;
    for (auto& metadevice :
         parse_metadevices(parse_body(response, "Metadevice listing"))) {
        if (metadevice.type_id != kDeviceTypeId) {
            continue;
        }
        auto cls = device::deviceClassFromString(metadevice.device_class);
        if (!cls) {
            logger_->debug("Skipping {} ({}): unsupported class '{}'",
                           metadevice.friendly_name, metadevice.id,
                           metadevice.device_class);
            continue;
        }
        by_class[*cls].push_back(std::move(metadevice));
    }

    for (auto& [cls, controller] : controllers_) {
        controller->load(by_class[cls]);
        logger_->info("Loaded {} {} device(s)", by_class[cls].size(),
                      device::deviceClassToString(cls));
    }
}

}  // namespace hubbridge::afero
