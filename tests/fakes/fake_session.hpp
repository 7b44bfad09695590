/*
 * fake_session.hpp - Scripted session provider for bridge tests
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef HUBBRIDGE_TESTS_FAKES_FAKE_SESSION_HPP
#define HUBBRIDGE_TESTS_FAKES_FAKE_SESSION_HPP

#include <gmock/gmock.h>

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "client/afero/http_transport.hpp"
#include "client/afero/session.hpp"
#include "device/common/device_result.hpp"
#include "worker/background_worker.hpp"

namespace hubbridge::test {

using json = nlohmann::json;
using afero::DeviceHandle;
using afero::HttpMethod;
using afero::HttpRequest;
using afero::HttpResponse;
using device::DeviceClass;
using device::StatusSnapshot;

class FakeBackend;

/**
 * @brief Class controller whose devices and failures are set by the test
 */
class FakeController : public afero::DeviceController {
public:
    FakeController(DeviceClass cls, FakeBackend& backend)
        : class_(cls), backend_(backend) {}

    DeviceClass deviceClass() const override { return class_; }
    std::vector<DeviceHandle> listDevices() override;
    std::optional<DeviceHandle> getDevice(const std::string& id) override;
    void turnOn(const std::string& id) override { setPower(id, true); }
    void turnOff(const std::string& id) override { setPower(id, false); }
    void applyState(const std::string& id, std::string_view functionClass,
                    const json& value) override;

    std::vector<DeviceHandle> devices;
    bool failPower = false;
    bool failList = false;
    bool failLookup = false;

private:
    void setPower(const std::string& id, bool on);

    DeviceClass class_;
    FakeBackend& backend_;
};

/**
 * @brief Shared state behind FakeSession, kept alive by the test
 *
 * Every controller call and raw request is appended to an event log:
 * `controller:on:<id>`, `controller:off:<id>`,
 * `state:<functionClass>=<value>:<id>` for state writes and
 * `get:<url>` for reads.
 */
class FakeBackend {
public:
    using Handler = std::function<HttpResponse(const HttpRequest&)>;

    FakeBackend() {
        for (auto cls : device::kAllDeviceClasses) {
            controllers_.emplace(cls,
                                 std::make_unique<FakeController>(cls, *this));
        }
    }

    auto controller(DeviceClass cls) -> FakeController& {
        return *controllers_.at(cls);
    }

    void addDevice(DeviceClass cls, const std::string& id,
                   const std::string& name, StatusSnapshot state = {}) {
        controller(cls).devices.push_back(DeviceHandle{id, name, cls, state});
    }

    void record(std::string event) {
        std::lock_guard lock(mutex_);
        events_.push_back(std::move(event));
    }

    [[nodiscard]] auto events() const -> std::vector<std::string> {
        std::lock_guard lock(mutex_);
        return events_;
    }

    void clearEvents() {
        std::lock_guard lock(mutex_);
        events_.clear();
    }

    [[nodiscard]] auto requestCount() const -> size_t {
        std::lock_guard lock(mutex_);
        return requests_.size();
    }

    auto handle(const HttpRequest& request) -> HttpResponse {
        {
            std::lock_guard lock(mutex_);
            requests_.push_back(request);
        }
        if (request.method == HttpMethod::Put) {
            auto body = json::parse(request.body);
            const auto& value = body["values"][0];
            const auto& raw = value["value"];
            record("state:" + value["functionClass"].get<std::string>() + "=" +
                   (raw.is_string() ? raw.get<std::string>() : raw.dump()) +
                   ":" + body["metadeviceId"].get<std::string>());
        } else {
            record("get:" + request.url);
        }

        if (requestDelay.count() > 0) {
            std::this_thread::sleep_for(requestDelay);
        }
        if (handler) {
            return handler(request);
        }
        return HttpResponse{200, "{}", {}};
    }

    // Scripted behaviour
    Handler handler;
    device::DeviceVoidResult initResult = device::success();
    std::chrono::milliseconds initDelay{0};
    std::chrono::milliseconds requestDelay{0};
    bool controllersAvailable = true;
    std::string accountId = "acct-1";
    std::atomic<int> initializeCalls{0};
    std::atomic<int> closeCalls{0};

private:
    mutable std::mutex mutex_;
    std::vector<std::string> events_;
    std::vector<HttpRequest> requests_;
    std::map<DeviceClass, std::unique_ptr<FakeController>> controllers_;
};

inline auto FakeController::listDevices() -> std::vector<DeviceHandle> {
    if (failList) {
        throw device::BackendException("listing unavailable");
    }
    return devices;
}

inline auto FakeController::getDevice(const std::string& id)
    -> std::optional<DeviceHandle> {
    if (failLookup) {
        throw device::BackendException("lookup unavailable");
    }
    for (const auto& handle : devices) {
        if (handle.id == id) {
            return handle;
        }
    }
    return std::nullopt;
}

inline void FakeController::setPower(const std::string& id, bool on) {
    backend_.record(std::string("controller:") + (on ? "on:" : "off:") + id);
    if (failPower) {
        throw device::BackendException("controller rejected power change");
    }
    for (auto& handle : devices) {
        if (handle.id == id) {
            handle.state.on = on;
        }
    }
}

inline void FakeController::applyState(const std::string& id,
                                       std::string_view functionClass,
                                       const json& value) {
    for (auto& handle : devices) {
        if (handle.id == id) {
            afero::apply_state_value(
                handle.state,
                afero::StateValue{std::string(functionClass), std::nullopt,
                                  value});
        }
    }
}

/**
 * @brief SessionProvider forwarding to a FakeBackend
 */
class FakeSession : public afero::SessionProvider {
public:
    explicit FakeSession(std::shared_ptr<FakeBackend> backend)
        : backend_(std::move(backend)) {}

    device::DeviceVoidResult initialize(
        const afero::Credentials& /*credentials*/,
        std::chrono::milliseconds /*budget*/) override {
        ++backend_->initializeCalls;
        if (backend_->initDelay.count() > 0) {
            std::this_thread::sleep_for(backend_->initDelay);
        }
        return backend_->initResult;
    }

    afero::DeviceController* controller(DeviceClass cls) override {
        if (!backend_->controllersAvailable) {
            return nullptr;
        }
        return &backend_->controller(cls);
    }

    std::string accessToken() override { return "token"; }

    std::string accountId() const override { return backend_->accountId; }

    HttpResponse rawRequest(HttpRequest request) override {
        return backend_->handle(request);
    }

    device::DeviceVoidResult close(
        std::chrono::milliseconds /*budget*/) override {
        ++backend_->closeCalls;
        return device::success();
    }

private:
    std::shared_ptr<FakeBackend> backend_;
};

inline auto makeFakeFactory(std::shared_ptr<FakeBackend> backend)
    -> worker::SessionFactory {
    return [backend]() -> std::unique_ptr<afero::SessionProvider> {
        return std::make_unique<FakeSession>(backend);
    };
}

inline auto testCredentials() -> afero::Credentials {
    return afero::Credentials{"user@example.com", "secret", ""};
}

/**
 * @brief Metadevice JSON with a state block, as the data host returns it
 */
inline auto metadeviceJson(const std::string& id, const std::string& name,
                           const std::string& deviceClass,
                           const json& values) -> json {
    return json{{"id", id},
                {"friendlyName", name},
                {"typeId", "metadevice.device"},
                {"description", {{"device", {{"deviceClass", deviceClass}}}}},
                {"state", {{"values", values}}}};
}

class MockHttpTransport : public afero::HttpTransport {
public:
    MOCK_METHOD(afero::HttpResponse, send, (const afero::HttpRequest&),
                (override));
};

}  // namespace hubbridge::test

#endif  // HUBBRIDGE_TESTS_FAKES_FAKE_SESSION_HPP
