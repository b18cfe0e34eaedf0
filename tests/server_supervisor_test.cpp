/**
 * @file server_supervisor_test.cpp
 * @brief Tests for the ServerSupervisor lifecycle state machine
 */

#include <gtest/gtest.h>
#include "transease/ConfigStore.h"
#include "transease/ErrorCodes.h"
#include "transease/Errors.h"
#include "transease/EventBus.h"
#include "transease/ServerSupervisor.h"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace TransEase;

namespace {

//=============================================================================
// Fake engine
//=============================================================================

/// Shared between the test and every engine the factory creates.
struct FakeEngineControl {
    std::mutex m;
    std::condition_variable cv;

    int created = 0;
    int active = 0;
    int maxActive = 0;

    bool failBind = false;
    int listenDelayMs = 0;
    bool hangOnClose = false;
    bool hangReleased = false;
    bool faultRequested = false;
    bool faultOnServe = false;

    std::vector<BindSpec> binds;
    std::vector<HandlerConfig> handlers;
    std::vector<ConnectionCountCallback> callbacks;

    void requestFault() {
        std::lock_guard<std::mutex> lock(m);
        faultRequested = true;
        cv.notify_all();
    }

    void releaseHang() {
        std::lock_guard<std::mutex> lock(m);
        hangReleased = true;
        cv.notify_all();
    }

    bool waitIdle() {
        std::unique_lock<std::mutex> lock(m);
        return cv.wait_for(lock, std::chrono::seconds(5), [this]() { return active == 0; });
    }
};

class FakeEngine : public TransferEngine {
public:
    explicit FakeEngine(std::shared_ptr<FakeEngineControl> control) : m_control(std::move(control)) {}

    void setMaxConnections(size_t) override {}

    void setConnectionCountCallback(ConnectionCountCallback callback) override {
        std::lock_guard<std::mutex> lock(m_control->m);
        m_control->callbacks.push_back(callback);
    }

    void listen(const BindSpec& bind, const HandlerConfig& handler) override {
        if (m_control->listenDelayMs > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(m_control->listenDelayMs));
        }
        std::lock_guard<std::mutex> lock(m_control->m);
        if (m_closed) {
            throw ServerBindError("closed before bind");
        }
        if (m_control->failBind) {
            throw ServerBindError("Address already in use");
        }
        m_control->binds.push_back(bind);
        m_control->handlers.push_back(handler);
    }

    void serveForever() override {
        if (m_control->faultOnServe) {
            throw ServerRuntimeError("listener closed at once");
        }
        std::unique_lock<std::mutex> lock(m_control->m);
        ++m_control->active;
        m_control->maxActive = std::max(m_control->maxActive, m_control->active);

        m_control->cv.wait(lock, [this]() {
            const bool closeHonored = m_closed && (!m_control->hangOnClose || m_control->hangReleased);
            return closeHonored || m_control->faultRequested;
        });

        --m_control->active;
        const bool fault = m_control->faultRequested && !m_closed;
        m_control->faultRequested = false;
        m_control->cv.notify_all();
        if (fault) {
            throw ServerRuntimeError("simulated listener failure");
        }
    }

    void closeAll() override {
        std::lock_guard<std::mutex> lock(m_control->m);
        m_closed = true;
        m_control->cv.notify_all();
    }

    size_t connectionCount() const override { return 0; }

private:
    std::shared_ptr<FakeEngineControl> m_control;
    bool m_closed = false;  // guarded by m_control->m
};

//=============================================================================
// Event recorder
//=============================================================================

class EventLog {
public:
    void add(const Event& e) {
        if (e.type() == EventType::LogLine) {
            return;
        }
        std::lock_guard<std::mutex> lock(m_mutex);
        m_events.push_back(e);
        m_cv.notify_all();
    }

    bool waitFor(const std::function<bool(const std::vector<Event>&)>& pred) {
        std::unique_lock<std::mutex> lock(m_mutex);
        return m_cv.wait_for(lock, std::chrono::seconds(5), [&]() { return pred(m_events); });
    }

    bool waitForCount(EventType type, size_t n) {
        return waitFor([type, n](const std::vector<Event>& events) {
            return static_cast<size_t>(std::count_if(events.begin(), events.end(),
                [type](const Event& e) { return e.type() == type; })) >= n;
        });
    }

    std::vector<Event> events() {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_events;
    }

    size_t countOf(EventType type) {
        std::lock_guard<std::mutex> lock(m_mutex);
        return static_cast<size_t>(std::count_if(m_events.begin(), m_events.end(),
            [type](const Event& e) { return e.type() == type; }));
    }

    void clear() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_events.clear();
    }

private:
    std::mutex m_mutex;
    std::condition_variable m_cv;
    std::vector<Event> m_events;
};

void settle()
{
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
}

//=============================================================================
// Fixture
//=============================================================================

class ServerSupervisorTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        m_dir = std::filesystem::temp_directory_path() / ("transease_supervisor_" + std::to_string(stamp));
        std::filesystem::create_directories(m_dir);

        m_config = std::make_unique<ConfigStore>(m_dir / "config.json");
        m_config->load();

        SettingsUpdate update;
        update["general"]["root_path"] = (m_dir / "share").u8string();
        ASSERT_TRUE(m_config->save(update));

        m_control = std::make_shared<FakeEngineControl>();
        m_bus.subscribe([this](const Event& e) { m_events.add(e); });
    }

    void TearDown() override
    {
        m_config.reset();
        std::error_code ec;
        std::filesystem::remove_all(m_dir, ec);
    }

    TransferEngineFactory factory()
    {
        auto control = m_control;
        return [control]() -> std::unique_ptr<TransferEngine> {
            {
                std::lock_guard<std::mutex> lock(control->m);
                ++control->created;
            }
            return std::make_unique<FakeEngine>(control);
        };
    }

    std::filesystem::path m_dir;
    EventLog m_events;
    EventBus m_bus;
    std::unique_ptr<ConfigStore> m_config;
    std::shared_ptr<FakeEngineControl> m_control;
};

}  // namespace

//=============================================================================
// Start
//=============================================================================

TEST_F(ServerSupervisorTest, StartEmitsStartedStatusAndZeroCount)
{
    ServerSupervisor supervisor(*m_config, m_bus, factory());

    EXPECT_EQ(supervisor.requestStart(), ServerState::Running);
    EXPECT_TRUE(supervisor.isRunning());
    EXPECT_EQ(supervisor.activePort(), 21);

    ASSERT_TRUE(m_events.waitForCount(EventType::ConnectionCount, 1));
    const auto events = m_events.events();
    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(events[0].type(), EventType::Started);
    EXPECT_EQ(events[1].type(), EventType::Status);
    EXPECT_NE(events[1].text().find("21"), std::string::npos);
    EXPECT_EQ(events[2].type(), EventType::ConnectionCount);
    EXPECT_EQ(events[2].count(), 0u);
}

TEST_F(ServerSupervisorTest, HandlerIsBuiltFromSettings)
{
    SettingsUpdate update;
    update["general"]["port"] = 2121;
    update["general"]["encoding"] = "utf-8";
    update["general"]["timeout"] = 45;
    ASSERT_TRUE(m_config->save(update));

    ServerSupervisor supervisor(*m_config, m_bus, factory());
    ASSERT_EQ(supervisor.requestStart(), ServerState::Running);

    std::lock_guard<std::mutex> lock(m_control->m);
    ASSERT_EQ(m_control->binds.size(), 1u);
    EXPECT_EQ(m_control->binds[0].host, "0.0.0.0");
    EXPECT_EQ(m_control->binds[0].port, 2121);

    const HandlerConfig& handler = m_control->handlers[0];
    EXPECT_EQ(handler.authorizer.user, "anonymous");
    EXPECT_EQ(handler.authorizer.permissions, "elradfmwM");
    EXPECT_TRUE(std::filesystem::equivalent(std::filesystem::u8path(handler.authorizer.rootPath), m_dir / "share"));
    EXPECT_EQ(handler.timeoutSeconds, 45);
    EXPECT_TRUE(handler.utf8);
    ASSERT_TRUE(handler.codec);
    EXPECT_EQ(handler.codec->encoding(), "utf-8");
    EXPECT_FALSE(handler.banner.empty());
}

TEST_F(ServerSupervisorTest, DuplicateStartIsNoop)
{
    ServerSupervisor supervisor(*m_config, m_bus, factory());

    ASSERT_EQ(supervisor.requestStart(), ServerState::Running);
    EXPECT_EQ(supervisor.requestStart(), ServerState::Running);

    settle();
    EXPECT_EQ(m_events.countOf(EventType::Started), 1u);
    std::lock_guard<std::mutex> lock(m_control->m);
    EXPECT_EQ(m_control->created, 1);
}

TEST_F(ServerSupervisorTest, BindFailureEmitsErrorAndEndsStopped)
{
    m_control->failBind = true;
    ServerSupervisor supervisor(*m_config, m_bus, factory());

    EXPECT_EQ(supervisor.requestStart(), ServerState::Stopped);
    EXPECT_EQ(supervisor.state(), ServerState::Stopped);
    EXPECT_FALSE(supervisor.isRunning());

    ASSERT_TRUE(m_events.waitForCount(EventType::Error, 1));
    settle();
    const auto events = m_events.events();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_NE(events[0].text().find(ErrorCodes::SERVER_BIND_FAILED), std::string::npos);
    EXPECT_NE(events[0].text().find("Address already in use"), std::string::npos);

    // A later start with a free port works
    m_control->failBind = false;
    EXPECT_EQ(supervisor.requestStart(), ServerState::Running);
}

TEST_F(ServerSupervisorTest, UncreatableRootEmitsError)
{
    // Root was valid when saved; a file now sits where the directory was.
    const auto share = m_dir / "share";
    std::filesystem::remove_all(share);
    std::ofstream(share) << "not a directory";

    ServerSupervisor supervisor(*m_config, m_bus, factory());
    EXPECT_EQ(supervisor.requestStart(), ServerState::Stopped);

    ASSERT_TRUE(m_events.waitForCount(EventType::Error, 1));
    EXPECT_NE(m_events.events()[0].text().find(ErrorCodes::SERVER_ROOT_UNAVAILABLE), std::string::npos);
    EXPECT_EQ(m_events.countOf(EventType::Started), 0u);
    EXPECT_EQ(supervisor.state(), ServerState::Stopped);

    std::lock_guard<std::mutex> lock(m_control->m);
    EXPECT_EQ(m_control->created, 0);
}

TEST_F(ServerSupervisorTest, BindTimeoutEmitsError)
{
    m_control->listenDelayMs = 400;
    ServerSupervisor supervisor(*m_config, m_bus, factory(), 2000, 100);

    EXPECT_EQ(supervisor.requestStart(), ServerState::Stopped);
    ASSERT_TRUE(m_events.waitForCount(EventType::Error, 1));
    EXPECT_NE(m_events.events()[0].text().find(ErrorCodes::SERVER_BIND_TIMEOUT), std::string::npos);
    EXPECT_EQ(m_events.countOf(EventType::Started), 0u);
}

//=============================================================================
// Stop
//=============================================================================

TEST_F(ServerSupervisorTest, StopWhileStoppedIsSilent)
{
    ServerSupervisor supervisor(*m_config, m_bus, factory());

    EXPECT_EQ(supervisor.requestStop(), ServerState::Stopped);
    settle();
    EXPECT_TRUE(m_events.events().empty());
}

TEST_F(ServerSupervisorTest, StopEmitsSingleStoppedEvent)
{
    ServerSupervisor supervisor(*m_config, m_bus, factory());
    ASSERT_EQ(supervisor.requestStart(), ServerState::Running);
    m_events.clear();

    EXPECT_EQ(supervisor.requestStop(), ServerState::Stopped);
    EXPECT_FALSE(supervisor.isRunning());
    EXPECT_EQ(supervisor.activePort(), 0);
    EXPECT_TRUE(m_control->waitIdle());

    ASSERT_TRUE(m_events.waitForCount(EventType::Stopped, 1));
    settle();
    const auto events = m_events.events();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].type(), EventType::Stopped);
}

TEST_F(ServerSupervisorTest, HangingWorkerIsForceReleasedAfterTimeout)
{
    m_control->hangOnClose = true;
    {
        ServerSupervisor supervisor(*m_config, m_bus, factory(), 200);
        ASSERT_EQ(supervisor.requestStart(), ServerState::Running);
        m_events.clear();

        const auto begin = std::chrono::steady_clock::now();
        EXPECT_EQ(supervisor.requestStop(), ServerState::Stopped);
        const auto elapsed = std::chrono::steady_clock::now() - begin;
        EXPECT_LT(elapsed, std::chrono::seconds(2));
        EXPECT_EQ(supervisor.state(), ServerState::Stopped);

        ASSERT_TRUE(m_events.waitForCount(EventType::Stopped, 1));
        const auto events = m_events.events();
        ASSERT_GE(events.size(), 2u);
        EXPECT_EQ(events[0].type(), EventType::Error);
        EXPECT_NE(events[0].text().find(ErrorCodes::SERVER_STOP_TIMEOUT), std::string::npos);
        EXPECT_NE(events[0].text().find("timeout"), std::string::npos);
        EXPECT_EQ(events[1].type(), EventType::Stopped);
    }

    // Let the detached worker finish before the fixture goes away.
    m_control->releaseHang();
    EXPECT_TRUE(m_control->waitIdle());
    settle();
}

//=============================================================================
// Faults and counts
//=============================================================================

TEST_F(ServerSupervisorTest, RuntimeFaultEmitsErrorThenStopped)
{
    ServerSupervisor supervisor(*m_config, m_bus, factory());
    ASSERT_EQ(supervisor.requestStart(), ServerState::Running);
    m_events.clear();

    m_control->requestFault();

    ASSERT_TRUE(m_events.waitForCount(EventType::Stopped, 1));
    const auto events = m_events.events();
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].type(), EventType::Error);
    EXPECT_NE(events[0].text().find(ErrorCodes::SERVER_RUNTIME_FAULT), std::string::npos);
    EXPECT_NE(events[0].text().find("simulated listener failure"), std::string::npos);
    EXPECT_EQ(events[1].type(), EventType::Stopped);
    EXPECT_FALSE(supervisor.isRunning());

    // Recovered: stop is a no-op, start works again
    m_events.clear();
    EXPECT_EQ(supervisor.requestStop(), ServerState::Stopped);
    EXPECT_EQ(supervisor.requestStart(), ServerState::Running);
    ASSERT_TRUE(m_events.waitForCount(EventType::Started, 1));
    EXPECT_EQ(m_events.countOf(EventType::Error), 0u);
}

TEST_F(ServerSupervisorTest, FaultRightAfterBindIsNeverLeftRunning)
{
    m_control->faultOnServe = true;
    ServerSupervisor supervisor(*m_config, m_bus, factory());

    constexpr size_t kAttempts = 300;
    for (size_t i = 0; i < kAttempts; ++i) {
        const ServerState result = supervisor.requestStart();
        ASSERT_TRUE(result == ServerState::Stopped || result == ServerState::Running);

        // A start that won the race must still be torn down by the fault.
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
        while (supervisor.state() != ServerState::Stopped &&
               std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        ASSERT_EQ(supervisor.state(), ServerState::Stopped) << "attempt " << i;
    }

    // Every attempt reported its failure, and every Started was followed by Stopped.
    ASSERT_TRUE(m_events.waitForCount(EventType::Error, kAttempts));
    settle();
    EXPECT_EQ(m_events.countOf(EventType::Error), kAttempts);
    EXPECT_EQ(m_events.countOf(EventType::Started), m_events.countOf(EventType::Stopped));
    for (const Event& e : m_events.events()) {
        if (e.type() == EventType::Error) {
            EXPECT_NE(e.text().find(ErrorCodes::SERVER_RUNTIME_FAULT), std::string::npos);
            EXPECT_NE(e.text().find("listener closed at once"), std::string::npos);
        }
    }
}

TEST_F(ServerSupervisorTest, ConnectionCountChangesAreForwarded)
{
    ServerSupervisor supervisor(*m_config, m_bus, factory());
    ASSERT_EQ(supervisor.requestStart(), ServerState::Running);

    ConnectionCountCallback callback;
    {
        std::lock_guard<std::mutex> lock(m_control->m);
        ASSERT_EQ(m_control->callbacks.size(), 1u);
        callback = m_control->callbacks[0];
    }
    callback(3);

    ASSERT_TRUE(m_events.waitFor([](const std::vector<Event>& events) {
        return std::any_of(events.begin(), events.end(), [](const Event& e) {
            return e.type() == EventType::ConnectionCount && e.count() == 3;
        });
    }));
    EXPECT_EQ(supervisor.connectionCount(), 3u);
}

TEST_F(ServerSupervisorTest, RestartNeverOverlapsAndIgnoresStaleWorker)
{
    ServerSupervisor supervisor(*m_config, m_bus, factory());

    ASSERT_EQ(supervisor.requestStart(), ServerState::Running);
    ConnectionCountCallback staleCallback;
    {
        std::lock_guard<std::mutex> lock(m_control->m);
        staleCallback = m_control->callbacks[0];
    }
    ASSERT_EQ(supervisor.requestStop(), ServerState::Stopped);
    ASSERT_EQ(supervisor.requestStart(), ServerState::Running);

    {
        std::lock_guard<std::mutex> lock(m_control->m);
        EXPECT_EQ(m_control->created, 2);
        EXPECT_EQ(m_control->maxActive, 1);
    }

    // The first instance is gone; its reports must not reach observers.
    m_events.clear();
    staleCallback(7);
    settle();
    EXPECT_EQ(m_events.countOf(EventType::ConnectionCount), 0u);
    EXPECT_EQ(supervisor.connectionCount(), 0u);
}

TEST_F(ServerSupervisorTest, SettingsApplyOnlyAtNextStart)
{
    ServerSupervisor supervisor(*m_config, m_bus, factory());
    ASSERT_EQ(supervisor.requestStart(), ServerState::Running);

    SettingsUpdate update;
    update["general"]["port"] = 2121;
    ASSERT_TRUE(m_config->save(update));
    EXPECT_EQ(supervisor.activePort(), 21);

    supervisor.requestStop();
    ASSERT_EQ(supervisor.requestStart(), ServerState::Running);
    EXPECT_EQ(supervisor.activePort(), 2121);

    std::lock_guard<std::mutex> lock(m_control->m);
    ASSERT_EQ(m_control->binds.size(), 2u);
    EXPECT_EQ(m_control->binds[1].port, 2121);
}

TEST_F(ServerSupervisorTest, DestructorStopsRunningServer)
{
    {
        ServerSupervisor supervisor(*m_config, m_bus, factory());
        ASSERT_EQ(supervisor.requestStart(), ServerState::Running);
    }
    EXPECT_TRUE(m_control->waitIdle());
    ASSERT_TRUE(m_events.waitForCount(EventType::Stopped, 1));
}

TEST(ServerStateTest, Names)
{
    EXPECT_STREQ(serverStateToString(ServerState::Running), "Running");
    EXPECT_STREQ(serverStateToString(ServerState::Failed), "Failed");
}
