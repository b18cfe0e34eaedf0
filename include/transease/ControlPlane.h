/**
 * @file ControlPlane.h
 * @brief Application-lifetime owner of settings, events, logging and the server
 *
 * (c) 2026 TransEase Project
 * Licensed under MIT License
 */

#pragma once

#include "ConfigStore.h"
#include "EventBus.h"
#include "LogBridge.h"
#include "ServerSupervisor.h"
#include "TransferEngine.h"
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace TransEase {

/**
 * @brief Asks the observer whether a running server may be stopped for quit
 * @return true to stop and quit, false to keep running, nullopt if there was no answer
 */
using QuitPrompt = std::function<std::optional<bool>()>;

/**
 * @brief Engine factory for the built-in TcpTransferEngine
 */
TransferEngineFactory defaultEngineFactory();

//=============================================================================
// ControlPlane Class
//=============================================================================

/**
 * @class ControlPlane
 * @brief The one object an observer talks to
 *
 * Construction order is EventBus, LogBridge, ConfigStore (loaded and
 * repaired), ServerSupervisor; logging is configured from the loaded
 * settings before anything else is logged. Destruction stops the server
 * synchronously.
 *
 * Thread Safety: all methods may be called from any thread.
 */
class ControlPlane {
public:
    /**
     * @param configPath Settings file (see AppPaths::configJsonPath())
     * @param engineFactory Transfer engine used for every server start
     */
    explicit ControlPlane(const std::filesystem::path& configPath,
                          TransferEngineFactory engineFactory = defaultEngineFactory());

    ~ControlPlane();

    ControlPlane(const ControlPlane&) = delete;
    ControlPlane& operator=(const ControlPlane&) = delete;

    //=========================================================================
    // Server lifecycle
    //=========================================================================

    ServerState requestStart() { return m_supervisor.requestStart(); }
    ServerState requestStop() { return m_supervisor.requestStop(); }
    bool isRunning() const { return m_supervisor.isRunning(); }
    size_t connectionCount() const { return m_supervisor.connectionCount(); }

    //=========================================================================
    // Settings
    //=========================================================================

    /**
     * @brief Validate and persist a settings update
     * @return false if nothing was saved (the reason is logged)
     *
     * Logging settings apply immediately. Server settings apply at the
     * next start; a Status event says so while the server is running.
     */
    bool saveSettings(const SettingsUpdate& update);

    /**
     * @brief Set the shared root directory, creating it if needed
     */
    bool changeRootPath(const std::string& path);

    ServerSettings settings() const { return m_config.snapshot(); }

    //=========================================================================
    // Shutdown
    //=========================================================================

    /**
     * @brief Interactive quit
     * @param prompt Confirmation asked only while the server is running
     * @return true if the application may exit (the server is stopped)
     *
     * Without a "yes" the server keeps running and false is returned.
     */
    bool requestQuit(const QuitPrompt& prompt);

    /**
     * @brief Application teardown or signal: stop synchronously, no prompt
     */
    void shutdown();

    //=========================================================================
    // Accessors
    //=========================================================================

    EventBus& bus() { return m_bus; }
    ConfigStore& config() { return m_config; }
    LogBridge& logBridge() { return m_logBridge; }
    ServerSupervisor& supervisor() { return m_supervisor; }

private:
    void applyLogSettings(const ServerSettings& settings);

    EventBus m_bus;
    LogBridge m_logBridge;
    ConfigStore m_config;
    ServerSupervisor m_supervisor;
};

}  // namespace TransEase
