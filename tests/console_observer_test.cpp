/**
 * @file console_observer_test.cpp
 * @brief Tests for ConsoleObserver commands, quit confirmation and log view
 */

#include <gtest/gtest.h>
#include <QBuffer>
#include <QCoreApplication>
#include <QElapsedTimer>
#include <QThread>
#include "transease/ControlPlane.h"
#include "transease/QtUi/ConsoleObserver.h"
#include "transease/QtUi/EventBridge.h"

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

using namespace TransEase;

namespace {

class IdleEngine : public TransferEngine {
public:
    void setMaxConnections(size_t) override {}
    void setConnectionCountCallback(ConnectionCountCallback) override {}
    void listen(const BindSpec&, const HandlerConfig&) override {}

    void serveForever() override {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_cv.wait(lock, [this]() { return m_closed; });
    }

    void closeAll() override {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_closed = true;
        m_cv.notify_all();
    }

    size_t connectionCount() const override { return 0; }

private:
    std::mutex m_mutex;
    std::condition_variable m_cv;
    bool m_closed = false;
};

bool waitUntil(const std::function<bool()>& done, int timeoutMs = 5000)
{
    QElapsedTimer timer;
    timer.start();
    while (!done()) {
        if (timer.elapsed() > timeoutMs) {
            return false;
        }
        QCoreApplication::processEvents(QEventLoop::AllEvents, 20);
        QThread::msleep(5);
    }
    return true;
}

class ConsoleObserverTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        m_dir = std::filesystem::temp_directory_path() / ("transease_console_" + std::to_string(stamp));
        std::filesystem::create_directories(m_dir);

        m_plane = std::make_unique<ControlPlane>(m_dir / "config.json", []() -> std::unique_ptr<TransferEngine> {
            return std::make_unique<IdleEngine>();
        });
        SettingsUpdate update;
        update[SECTION_GENERAL][KEY_ROOT_PATH] = (m_dir / "share").u8string();
        ASSERT_TRUE(m_plane->saveSettings(update));

        m_output.open(QIODevice::ReadWrite);
        m_bridge = std::make_unique<EventBridge>(m_plane->bus());
        m_console = std::make_unique<ConsoleObserver>(*m_plane, *m_bridge, &m_output);
        QObject::connect(m_console.get(), &ConsoleObserver::quitRequested, [this]() { ++m_quitRequests; });
    }

    void TearDown() override
    {
        m_console.reset();
        m_bridge.reset();
        m_plane.reset();
        std::error_code ec;
        std::filesystem::remove_all(m_dir, ec);
    }

    QString output() const { return QString::fromUtf8(m_output.data()); }

    bool waitForOutput(const QString& needle)
    {
        return waitUntil([&]() { return output().contains(needle); });
    }

    std::filesystem::path m_dir;
    std::unique_ptr<ControlPlane> m_plane;
    QBuffer m_output;
    std::unique_ptr<EventBridge> m_bridge;
    std::unique_ptr<ConsoleObserver> m_console;
    int m_quitRequests = 0;
};

}  // namespace

TEST_F(ConsoleObserverTest, StartAndStopCommandsDriveServer)
{
    m_console->handleLine(QStringLiteral("start"));
    EXPECT_TRUE(m_plane->isRunning());
    EXPECT_TRUE(waitForOutput(QStringLiteral("[server] running")));
    EXPECT_TRUE(waitForOutput(QStringLiteral("[status] Server started on port 21")));

    m_console->handleLine(QStringLiteral("status"));
    EXPECT_TRUE(output().contains(QStringLiteral("Server running on port 21")));

    m_console->handleLine(QStringLiteral("STOP"));
    EXPECT_FALSE(m_plane->isRunning());
    EXPECT_TRUE(waitForOutput(QStringLiteral("[server] stopped")));
    EXPECT_EQ(m_console->connectionCount(), 0);
}

TEST_F(ConsoleObserverTest, SetCommandSavesSetting)
{
    m_console->handleLine(QStringLiteral("set port 2121"));
    EXPECT_EQ(m_plane->settings().port, 2121);

    m_console->handleLine(QStringLiteral("set port 99999"));
    EXPECT_EQ(m_plane->settings().port, 2121);
    EXPECT_TRUE(output().contains(QStringLiteral("Invalid value for port")));

    m_console->handleLine(QStringLiteral("set port"));
    EXPECT_TRUE(output().contains(QStringLiteral("Usage: set <key> <value>")));
}

TEST_F(ConsoleObserverTest, RootCommandChangesSharedDirectory)
{
    const auto target = m_dir / "other";
    m_console->handleLine(QStringLiteral("root ") + QString::fromStdString(target.u8string()));
    EXPECT_TRUE(std::filesystem::is_directory(target));
    EXPECT_TRUE(std::filesystem::equivalent(std::filesystem::u8path(m_plane->settings().rootPath), target));
}

TEST_F(ConsoleObserverTest, UnknownCommandIsReported)
{
    m_console->handleLine(QStringLiteral("dance"));
    EXPECT_TRUE(output().contains(QStringLiteral("Unknown command 'dance'")));

    m_console->handleLine(QStringLiteral("   "));
    m_console->handleLine(QStringLiteral("help"));
    EXPECT_TRUE(output().contains(QStringLiteral("Commands:")));
}

TEST_F(ConsoleObserverTest, QuitWhileStoppedExitsImmediately)
{
    m_console->handleLine(QStringLiteral("quit"));
    EXPECT_EQ(m_quitRequests, 1);
    EXPECT_FALSE(m_console->isAwaitingQuitConfirmation());
}

TEST_F(ConsoleObserverTest, QuitWhileRunningAsksForConfirmation)
{
    m_console->handleLine(QStringLiteral("start"));
    ASSERT_TRUE(m_plane->isRunning());

    m_console->handleLine(QStringLiteral("quit"));
    EXPECT_TRUE(m_console->isAwaitingQuitConfirmation());
    EXPECT_TRUE(output().contains(QStringLiteral("[y/N]")));
    EXPECT_EQ(m_quitRequests, 0);

    // Anything but yes keeps the server running
    m_console->handleLine(QString());
    EXPECT_FALSE(m_console->isAwaitingQuitConfirmation());
    EXPECT_TRUE(m_plane->isRunning());
    EXPECT_EQ(m_quitRequests, 0);
    EXPECT_TRUE(output().contains(QStringLiteral("Quit cancelled")));

    m_console->handleLine(QStringLiteral("exit"));
    m_console->handleLine(QStringLiteral("n"));
    EXPECT_TRUE(m_plane->isRunning());
    EXPECT_EQ(m_quitRequests, 0);

    m_console->handleLine(QStringLiteral("quit"));
    m_console->handleLine(QStringLiteral("yes"));
    EXPECT_FALSE(m_plane->isRunning());
    EXPECT_EQ(m_quitRequests, 1);
}

TEST_F(ConsoleObserverTest, LogViewIsTrimmedWhenFull)
{
    for (int i = 0; i < LOG_VIEW_MAX_LINES + 1; ++i) {
        m_plane->bus().publish(Event::logLine("line " + std::to_string(i)));
    }
    const QString last = QStringLiteral("line %1").arg(LOG_VIEW_MAX_LINES);
    ASSERT_TRUE(waitUntil([&]() {
        return !m_console->logView().isEmpty() && m_console->logView().last() == last;
    }));

    // Startup log lines may precede ours, so only the bounds are fixed
    const QStringList& view = m_console->logView();
    EXPECT_GE(view.size(), LOG_VIEW_KEEP_LINES);
    EXPECT_LE(view.size(), LOG_VIEW_MAX_LINES);
    EXPECT_FALSE(view.contains(QStringLiteral("line 0")));
}

TEST_F(ConsoleObserverTest, ErrorsAndCountsArePresented)
{
    m_plane->bus().publish(Event::connectionCount(4));
    m_plane->bus().publish(Event::error("TE-SRV-2000 Failed to start server on port 21: in use"));

    ASSERT_TRUE(waitForOutput(QStringLiteral("[error] TE-SRV-2000")));
    EXPECT_EQ(m_console->connectionCount(), 4);
}

int main(int argc, char** argv)
{
    QCoreApplication app(argc, argv);
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
