/**
 * @file ConsoleObserver.cpp
 * @brief Text-console presentation of the control plane
 *
 * (c) 2026 TransEase Project
 * Licensed under MIT License
 */

#include "transease/QtUi/ConsoleObserver.h"
#include "transease/QtUi/EventBridge.h"
#include "transease/ControlPlane.h"
#include "transease/config.h"
#include <QIODevice>
#include <QSocketNotifier>
#include <unistd.h>
#include <optional>

namespace {
    const char* kHelpText =
        "Commands:\n"
        "  start               start the server\n"
        "  stop                stop the server\n"
        "  status              show server state and connections\n"
        "  config              show the current settings\n"
        "  set <key> <value>   change a setting (port, root_path, max_connections,\n"
        "                      timeout, encoding, log_level, save_log)\n"
        "  root <path>         change the shared directory\n"
        "  log                 show recent log lines\n"
        "  quit                exit\n"
        "  help                show this text\n";
} // anonymous namespace

//=============================================================================
// Constructor / Destructor
//=============================================================================

ConsoleObserver::ConsoleObserver(TransEase::ControlPlane& control,
                                 EventBridge& bridge,
                                 QIODevice* output,
                                 QObject* parent)
    : QObject(parent)
    , m_control(control)
    , m_out(output)
    , m_stdinNotifier(nullptr)
    , m_connectionCount(0)
    , m_awaitingQuitConfirmation(false)
{
    connect(&bridge, &EventBridge::logReceived, this, &ConsoleObserver::onLogReceived);
    connect(&bridge, &EventBridge::statusUpdated, this, &ConsoleObserver::onStatusUpdated);
    connect(&bridge, &EventBridge::connectionCountChanged, this, &ConsoleObserver::onConnectionCountChanged);
    connect(&bridge, &EventBridge::serverStarted, this, &ConsoleObserver::onServerStarted);
    connect(&bridge, &EventBridge::serverStopped, this, &ConsoleObserver::onServerStopped);
    connect(&bridge, &EventBridge::errorOccurred, this, &ConsoleObserver::onErrorOccurred);
}

ConsoleObserver::~ConsoleObserver() = default;

void ConsoleObserver::startReadingStdin() {
    if (m_stdinNotifier) {
        return;
    }
    m_stdinNotifier = new QSocketNotifier(STDIN_FILENO, QSocketNotifier::Read, this);
    connect(m_stdinNotifier, &QSocketNotifier::activated, this, &ConsoleObserver::onStdinReady);

    m_out << "TransEase console. Type 'help' for commands.\n";
    m_out.flush();
}

//=============================================================================
// Input
//=============================================================================

void ConsoleObserver::onStdinReady() {
    char buffer[1024];
    const ssize_t n = ::read(STDIN_FILENO, buffer, sizeof(buffer));
    if (n <= 0) {
        // End of input: nobody is left to answer a prompt
        m_stdinNotifier->setEnabled(false);
        if (!m_stdinBuffer.isEmpty()) {
            handleLine(QString::fromUtf8(m_stdinBuffer));
            m_stdinBuffer.clear();
        }
        m_control.shutdown();
        emit quitRequested();
        return;
    }

    m_stdinBuffer.append(buffer, static_cast<int>(n));
    int newline;
    while ((newline = m_stdinBuffer.indexOf('\n')) >= 0) {
        const QByteArray raw = m_stdinBuffer.left(newline);
        m_stdinBuffer.remove(0, newline + 1);
        handleLine(QString::fromUtf8(raw));
    }
}

void ConsoleObserver::handleLine(const QString& line) {
    if (m_awaitingQuitConfirmation) {
        finishQuit(line);
        return;
    }

    const QString trimmed = line.trimmed();
    if (trimmed.isEmpty()) {
        return;
    }

    const int space = trimmed.indexOf(QLatin1Char(' '));
    const QString command = (space < 0 ? trimmed : trimmed.left(space)).toLower();
    const QString rest = space < 0 ? QString() : trimmed.mid(space + 1).trimmed();

    if (command == QLatin1String("start")) {
        m_control.requestStart();
    } else if (command == QLatin1String("stop")) {
        if (!m_control.isRunning()) {
            m_out << "Server is not running\n";
        }
        m_control.requestStop();
    } else if (command == QLatin1String("status")) {
        printStatus();
    } else if (command == QLatin1String("config")) {
        printConfig();
    } else if (command == QLatin1String("set")) {
        const int sep = rest.indexOf(QLatin1Char(' '));
        if (sep < 0) {
            m_out << "Usage: set <key> <value>\n";
        } else {
            const std::string key = rest.left(sep).toStdString();
            const std::string value = rest.mid(sep + 1).trimmed().toStdString();
            TransEase::SettingsUpdate update;
            update[TransEase::SECTION_GENERAL][key] = value;
            if (!m_control.saveSettings(update)) {
                m_out << "Invalid value for " << QString::fromStdString(key) << "; settings unchanged\n";
            }
        }
    } else if (command == QLatin1String("root")) {
        if (rest.isEmpty()) {
            m_out << "Usage: root <path>\n";
        } else {
            m_control.changeRootPath(rest.toStdString());
        }
    } else if (command == QLatin1String("log")) {
        printLogView();
    } else if (command == QLatin1String("quit") || command == QLatin1String("exit")) {
        beginQuit();
    } else if (command == QLatin1String("help")) {
        printHelp();
    } else {
        m_out << "Unknown command '" << command << "'. Type 'help' for commands.\n";
    }
    m_out.flush();
}

//=============================================================================
// Quit
//=============================================================================

void ConsoleObserver::beginQuit() {
    if (!m_control.isRunning()) {
        emit quitRequested();
        return;
    }
    m_awaitingQuitConfirmation = true;
    m_out << "The server is running. Stop it and quit? [y/N] ";
    m_out.flush();
}

void ConsoleObserver::finishQuit(const QString& answer) {
    m_awaitingQuitConfirmation = false;

    const QString normalized = answer.trimmed().toLower();
    std::optional<bool> decision;
    if (normalized == QLatin1String("y") || normalized == QLatin1String("yes")) {
        decision = true;
    } else if (normalized == QLatin1String("n") || normalized == QLatin1String("no")) {
        decision = false;
    }

    if (m_control.requestQuit([decision]() { return decision; })) {
        emit quitRequested();
    } else {
        m_out << "Quit cancelled\n";
        m_out.flush();
    }
}

//=============================================================================
// Event slots
//=============================================================================

void ConsoleObserver::onLogReceived(const QString& line) {
    m_logView.append(line);
    if (m_logView.size() > TransEase::LOG_VIEW_MAX_LINES) {
        m_logView = m_logView.mid(m_logView.size() - TransEase::LOG_VIEW_KEEP_LINES);
    }
    m_out << line << "\n";
    m_out.flush();
}

void ConsoleObserver::onStatusUpdated(const QString& text) {
    m_out << "[status] " << text << "\n";
    m_out.flush();
}

void ConsoleObserver::onConnectionCountChanged(int count) {
    m_connectionCount = count;
}

void ConsoleObserver::onServerStarted() {
    m_out << "[server] running\n";
    m_out.flush();
}

void ConsoleObserver::onServerStopped() {
    m_connectionCount = 0;
    m_out << "[server] stopped\n";
    m_out.flush();
}

void ConsoleObserver::onErrorOccurred(const QString& message) {
    m_out << "[error] " << message << "\n";
    m_out.flush();
}

//=============================================================================
// Output helpers
//=============================================================================

void ConsoleObserver::printHelp() {
    m_out << kHelpText;
}

void ConsoleObserver::printStatus() {
    const TransEase::ServerSettings settings = m_control.settings();
    if (m_control.isRunning()) {
        m_out << "Server running on port " << m_control.supervisor().activePort()
              << ", " << m_control.connectionCount() << " connection(s)\n";
    } else {
        m_out << "Server stopped (configured port " << settings.port << ")\n";
    }
}

void ConsoleObserver::printConfig() {
    const TransEase::ServerSettings s = m_control.settings();
    m_out << "port            " << s.port << "\n"
          << "root_path       " << QString::fromStdString(s.rootPath) << "\n"
          << "max_connections " << s.maxConnections << "\n"
          << "timeout         " << s.timeoutSeconds << "\n"
          << "encoding        " << QString::fromStdString(s.encoding) << "\n"
          << "log_level       " << QString::fromStdString(s.logLevel) << "\n"
          << "save_log        " << (s.saveLog ? "true" : "false") << "\n"
          << "config file     " << QString::fromStdString(m_control.config().path().u8string()) << "\n";
}

void ConsoleObserver::printLogView() {
    for (const QString& line : m_logView) {
        m_out << line << "\n";
    }
}
