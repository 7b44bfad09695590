/*
 * test_background_worker.cpp - Tests for the background worker and the
 * blocking hand-off to it
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>

#include <chrono>
#include <atomic>
#include <future>
#include <memory>
#include <thread>
#include <vector>

#include "fakes/fake_session.hpp"
#include "worker/background_worker.hpp"
#include "worker/ready_signal.hpp"
#include "worker/sync_bridge.hpp"

using namespace hubbridge;
using namespace hubbridge::worker;
using hubbridge::device::DeviceClass;
using hubbridge::device::DeviceErrorCode;
using hubbridge::device::DeviceResult;
using hubbridge::test::FakeBackend;
using json = nlohmann::json;
using namespace std::chrono_literals;

// ==================== ReadySignal Tests ====================

TEST(ReadySignalTest, WaitTimesOutUntilSet) {
    ReadySignal signal;
    EXPECT_FALSE(signal.isSet());
    EXPECT_FALSE(signal.waitFor(10ms));

    signal.set();
    EXPECT_TRUE(signal.isSet());
    EXPECT_TRUE(signal.waitFor(0ms));
}

TEST(ReadySignalTest, SetWakesWaiter) {
    ReadySignal signal;
    auto waiter = std::async(std::launch::async,
                             [&signal] { return signal.waitFor(2000ms); });
    std::this_thread::sleep_for(20ms);
    signal.set();
    EXPECT_TRUE(waiter.get());
}

// ==================== BackgroundWorker Tests ====================

class BackgroundWorkerTest : public ::testing::Test {
protected:
    void SetUp() override {
        backend_ = std::make_shared<FakeBackend>();
        backend_->addDevice(DeviceClass::Light, "abc", "Kitchen Light");
        backend_->addDevice(DeviceClass::Switch, "sw1", "Porch Switch");
    }

    void TearDown() override {
        if (worker_) {
            worker_->stop();
        }
    }

    void makeWorker(afero::Credentials credentials = test::testCredentials()) {
        WorkerConfig config;
        config.credentials = std::move(credentials);
        config.dataHost = "https://data.test";
        worker_ = std::make_unique<BackgroundWorker>(
            config, test::makeFakeFactory(backend_), catalog_);
    }

    std::shared_ptr<FakeBackend> backend_;
    device::DeviceCatalog catalog_;
    std::unique_ptr<BackgroundWorker> worker_;
};

TEST_F(BackgroundWorkerTest, StartupDiscoversControllerDevices) {
    makeWorker();
    worker_->start();

    ASSERT_TRUE(worker_->waitReady(2000ms));
    EXPECT_TRUE(worker_->isRunning());
    EXPECT_TRUE(worker_->hasSession());
    EXPECT_EQ(backend_->initializeCalls.load(), 1);
    EXPECT_EQ(catalog_.size(), 2U);
    EXPECT_EQ(catalog_.resolve("porch switch"), "sw1");
    EXPECT_EQ(catalog_.get("sw1")->deviceClass, DeviceClass::Switch);
}

TEST_F(BackgroundWorkerTest, MissingCredentialsLeavesWorkerDisconnected) {
    makeWorker(afero::Credentials{});
    worker_->start();

    ASSERT_TRUE(worker_->waitReady(2000ms));
    EXPECT_FALSE(worker_->hasSession());
    EXPECT_TRUE(catalog_.empty());
    EXPECT_EQ(backend_->initializeCalls.load(), 0);
}

TEST_F(BackgroundWorkerTest, InitializationFailureIsNotFatal) {
    backend_->initResult = std::unexpected(device::DeviceError(
        DeviceErrorCode::AuthenticationFailed, "bad token"));
    makeWorker();
    worker_->start();

    ASSERT_TRUE(worker_->waitReady(2000ms));
    EXPECT_TRUE(worker_->hasSession());
    EXPECT_EQ(catalog_.size(), 2U);
}

TEST_F(BackgroundWorkerTest, ListingFailureOfOneClassKeepsOthers) {
    backend_->controller(DeviceClass::Light).failList = true;
    makeWorker();
    worker_->start();

    ASSERT_TRUE(worker_->waitReady(2000ms));
    EXPECT_FALSE(catalog_.resolve("abc").has_value());
    EXPECT_TRUE(catalog_.resolve("sw1").has_value());
}

TEST_F(BackgroundWorkerTest, EmptyControllersFallBackToDirectListing) {
    backend_->controllersAvailable = false;
    backend_->handler = [](const afero::HttpRequest&) {
        auto listing = json::array(
            {test::metadeviceJson(
                 "m1", "Desk Lamp", "light",
                 json::array({{{"functionClass", "power"},
                               {"value", "on"}}})),
             test::metadeviceJson("m2", "Thermostat", "thermostat",
                                  json::array())});
        return afero::HttpResponse{200, listing.dump(), {}};
    };
    makeWorker();
    worker_->start();

    ASSERT_TRUE(worker_->waitReady(2000ms));
    ASSERT_EQ(catalog_.size(), 1U);
    EXPECT_EQ(catalog_.resolve("desk lamp"), "m1");
    EXPECT_EQ(backend_->events().front(),
              "get:https://data.test/v1/accounts/acct-1/metadevices");
}

TEST_F(BackgroundWorkerTest, StopClosesSessionOnce) {
    makeWorker();
    worker_->start();
    ASSERT_TRUE(worker_->waitReady(2000ms));

    worker_->stop();
    worker_->stop();

    EXPECT_FALSE(worker_->isRunning());
    EXPECT_FALSE(worker_->hasSession());
    EXPECT_EQ(backend_->closeCalls.load(), 1);
}

TEST_F(BackgroundWorkerTest, StopReleasesStartupWaiters) {
    backend_->initDelay = 300ms;
    makeWorker();
    worker_->start();

    worker_->stop();

    EXPECT_TRUE(worker_->waitReady(0ms));
}

TEST_F(BackgroundWorkerTest, StoppedWorkerDoesNotRestart) {
    makeWorker();
    worker_->start();
    ASSERT_TRUE(worker_->waitReady(2000ms));
    worker_->stop();

    worker_->start();

    EXPECT_FALSE(worker_->isRunning());
    EXPECT_EQ(backend_->initializeCalls.load(), 1);
}

TEST_F(BackgroundWorkerTest, PostedWorkRunsOnWorkerThread) {
    makeWorker();
    worker_->start();
    ASSERT_TRUE(worker_->waitReady(2000ms));

    auto caller = std::this_thread::get_id();
    auto future = worker_->post([](afero::SessionProvider& session) {
        return std::make_pair(std::this_thread::get_id(), session.accountId());
    });
    auto [workerThread, account] = future.get();

    EXPECT_NE(workerThread, caller);
    EXPECT_EQ(account, "acct-1");
}

// ==================== SyncBridge Tests ====================

class SyncBridgeTest : public BackgroundWorkerTest {};

TEST_F(SyncBridgeTest, ReturnsWorkResult) {
    makeWorker();
    worker_->start();
    ASSERT_TRUE(worker_->waitReady(2000ms));
    SyncBridge bridge(*worker_, 1000ms);

    auto result = bridge.runBlocking(
        "account", [](afero::SessionProvider& session) -> DeviceResult<std::string> {
            return session.accountId();
        });

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, "acct-1");
}

TEST_F(SyncBridgeTest, WithoutSessionFailsImmediately) {
    makeWorker(afero::Credentials{});
    worker_->start();
    ASSERT_TRUE(worker_->waitReady(2000ms));
    SyncBridge bridge(*worker_, 5000ms);

    auto started = std::chrono::steady_clock::now();
    auto result = bridge.runBlocking(
        "noop", [](afero::SessionProvider&) -> device::DeviceVoidResult {
            return device::success();
        });

    EXPECT_LT(std::chrono::steady_clock::now() - started, 1000ms);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, DeviceErrorCode::NotConnected);
    EXPECT_FALSE(bridge.connected());
}

TEST_F(SyncBridgeTest, BeforeStartIsNotConnected) {
    makeWorker();
    SyncBridge bridge(*worker_);

    auto result = bridge.runBlocking(
        "noop", [](afero::SessionProvider&) -> device::DeviceVoidResult {
            return device::success();
        });

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().message, "Hubspace not connected");
}

TEST_F(SyncBridgeTest, ExceptionsBecomeErrors) {
    makeWorker();
    worker_->start();
    ASSERT_TRUE(worker_->waitReady(2000ms));
    SyncBridge bridge(*worker_);

    auto result = bridge.runBlocking(
        "explode", [](afero::SessionProvider&) -> device::DeviceVoidResult {
            throw device::ProtocolException("garbled");
        });

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, DeviceErrorCode::ProtocolError);
    EXPECT_EQ(result.error().message, "garbled");
}

TEST_F(SyncBridgeTest, NonStandardThrowBecomesError) {
    makeWorker();
    worker_->start();
    ASSERT_TRUE(worker_->waitReady(2000ms));
    SyncBridge bridge(*worker_);

    auto result = bridge.runBlocking(
        "explode", [](afero::SessionProvider&) -> device::DeviceVoidResult {
            throw 42;
        });

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, DeviceErrorCode::Unknown);
    EXPECT_EQ(result.error().message, "Unknown exception");
}

TEST_F(SyncBridgeTest, SlowWorkTimesOut) {
    makeWorker();
    worker_->start();
    ASSERT_TRUE(worker_->waitReady(2000ms));
    SyncBridge bridge(*worker_);

    auto result = bridge.runBlocking(
        "slow",
        [](afero::SessionProvider&) -> device::DeviceVoidResult {
            std::this_thread::sleep_for(300ms);
            return device::success();
        },
        50ms);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, DeviceErrorCode::Timeout);
    EXPECT_EQ(result.error().operationName, "slow");
}

TEST_F(SyncBridgeTest, ConcurrentCallersAreSerialisedOnWorker) {
    makeWorker();
    worker_->start();
    ASSERT_TRUE(worker_->waitReady(2000ms));
    SyncBridge bridge(*worker_, 2000ms);

    std::atomic<int> active{0};
    std::atomic<int> maxActive{0};
    auto work = [&](afero::SessionProvider&) -> DeviceResult<int> {
        int now = ++active;
        int expected = maxActive.load();
        while (now > expected &&
               !maxActive.compare_exchange_weak(expected, now)) {
        }
        std::this_thread::sleep_for(5ms);
        --active;
        return now;
    };

    std::vector<std::future<bool>> callers;
    for (int i = 0; i < 8; ++i) {
        callers.push_back(std::async(std::launch::async, [&] {
            return bridge.runBlocking("work", work).has_value();
        }));
    }
    for (auto& caller : callers) {
        EXPECT_TRUE(caller.get());
    }
    EXPECT_EQ(maxActive.load(), 1);
}
