/**
 * @file ControlPlane.cpp
 * @brief Application-lifetime owner of settings, events, logging and the server
 *
 * (c) 2026 TransEase Project
 * Licensed under MIT License
 */

#include "transease/ControlPlane.h"
#include "transease/AppPaths.h"
#include "transease/Debug.h"
#include "transease/TcpTransferEngine.h"
#include <filesystem>
#include <system_error>

namespace TransEase {

TransferEngineFactory defaultEngineFactory() {
    return []() -> std::unique_ptr<TransferEngine> {
        return std::make_unique<TcpTransferEngine>();
    };
}

//=============================================================================
// Constructor / Destructor
//=============================================================================

ControlPlane::ControlPlane(const std::filesystem::path& configPath,
                           TransferEngineFactory engineFactory)
    : m_bus()
    , m_logBridge(m_bus)
    , m_config(configPath)
    , m_supervisor(m_config, m_bus, std::move(engineFactory))
{
    const ServerSettings settings = m_config.load();
    applyLogSettings(settings);

    LOG_INFO("Settings loaded from " << m_config.path().u8string());
    LOG_INFO("Root directory: " << settings.rootPath << ", port " << settings.port
             << ", encoding " << settings.encoding);
}

ControlPlane::~ControlPlane() {
    shutdown();
}

//=============================================================================
// Settings
//=============================================================================

bool ControlPlane::saveSettings(const SettingsUpdate& update) {
    if (!m_config.save(update)) {
        m_bus.publish(Event::status("Settings were not saved"));
        return false;
    }

    applyLogSettings(m_config.snapshot());
    LOG_INFO("Settings saved");

    if (m_supervisor.isRunning()) {
        m_bus.publish(Event::status("Settings saved; restart the server for changes to take effect"));
    } else {
        m_bus.publish(Event::status("Settings saved"));
    }
    return true;
}

bool ControlPlane::changeRootPath(const std::string& path) {
    const std::filesystem::path normalized = AppPaths::normalize(std::filesystem::u8path(path));

    std::error_code ec;
    if (!std::filesystem::is_directory(normalized, ec)) {
        std::filesystem::create_directories(normalized, ec);
        if (ec) {
            LOG_ERROR("Cannot create root directory " << normalized.u8string() << ": " << ec.message());
            m_bus.publish(Event::status("Root directory was not changed"));
            return false;
        }
    }

    SettingsUpdate update;
    update[SECTION_GENERAL][KEY_ROOT_PATH] = normalized.u8string();
    if (!saveSettings(update)) {
        return false;
    }
    LOG_INFO("Root directory set to " << normalized.u8string());
    return true;
}

void ControlPlane::applyLogSettings(const ServerSettings& settings) {
    LogLevel level = LogLevel::Info;
    if (!parseLogLevel(settings.logLevel, level)) {
        LOG_WARNING("Unknown log level '" << settings.logLevel << "', using INFO");
    }
    m_logBridge.reconfigure(level, settings.saveLog, AppPaths::logFilePath(m_config.path()));
}

//=============================================================================
// Shutdown
//=============================================================================

bool ControlPlane::requestQuit(const QuitPrompt& prompt) {
    if (!m_supervisor.isRunning()) {
        return true;
    }

    const std::optional<bool> answer = prompt ? prompt() : std::nullopt;
    if (!answer.has_value() || !answer.value()) {
        LOG_INFO("Quit cancelled; server keeps running");
        return false;
    }

    m_supervisor.requestStop();
    return true;
}

void ControlPlane::shutdown() {
    if (m_supervisor.state() != ServerState::Stopped) {
        LOG_INFO("Shutting down: stopping server");
    }
    m_supervisor.requestStop();
}

}  // namespace TransEase
