/**
 * @file ServerSupervisor.h
 * @brief Lifecycle state machine for the transfer-server worker
 */

#pragma once

#include "config.h"
#include "TransferEngine.h"
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace TransEase {

class ConfigStore;
class EventBus;

/**
 * @brief Supervisor states
 *
 * Stopped -> Starting -> Running -> Stopping -> Stopped
 * Starting/Running -> Failed -> Stopped
 */
enum class ServerState : uint8_t {
    Stopped = 0,
    Starting = 1,
    Running = 2,
    Stopping = 3,
    Failed = 4
};

/**
 * @brief Convert server state to display string
 */
const char* serverStateToString(ServerState state);

/**
 * @brief One running worker and the parameters it was started with
 */
struct ServerInstance {
    BindSpec bind;
    size_t maxConnections = 0;
    HandlerConfig handler;
    uint64_t generation = 0;  ///< Increments on every start; never reused
};

struct WorkerContext;

//=============================================================================
// ServerSupervisor Class
//=============================================================================

/**
 * @class ServerSupervisor
 * @brief Starts, stops and watches the transfer-server worker
 *
 * Architecture:
 * - The controller (caller of requestStart/requestStop) owns transitions
 * - One worker thread per ServerInstance; spawned on every start and
 *   joined (or force-released) on every stop, never reused
 * - The worker reports only through the EventBus, via the supervisor
 *
 * Events:
 * - start success: Started, Status("... port N"), ConnectionCount(0)
 * - start failure: Error(message); state returns to Stopped
 * - stop: Stopped, Status; Error first if the worker had to be force-released
 * - fault while running: Error(message), Stopped
 * - every change of the active connection count: ConnectionCount(n)
 *
 * Thread Safety:
 * - requestStart()/requestStop() are serialized by an internal mutex and
 *   may be called from any thread
 * - state(), isRunning(), connectionCount() never block
 *
 * Nothing thrown inside the worker or the engine escapes this class.
 */
class ServerSupervisor {
public:
    /**
     * @param config Source of the settings read at every start
     * @param bus Event channel for all notifications
     * @param engineFactory Creates the transfer engine for each instance
     * @param stopTimeoutMs Bound on waiting for worker termination
     * @param bindTimeoutMs Bound on waiting for the worker to bind
     */
    ServerSupervisor(ConfigStore& config,
                     EventBus& bus,
                     TransferEngineFactory engineFactory,
                     uint32_t stopTimeoutMs = STOP_TIMEOUT_MS,
                     uint32_t bindTimeoutMs = BIND_TIMEOUT_MS);

    /**
     * @brief Stops the server synchronously if running
     */
    ~ServerSupervisor();

    ServerSupervisor(const ServerSupervisor&) = delete;
    ServerSupervisor& operator=(const ServerSupervisor&) = delete;

    /**
     * @brief Start a server instance with the current settings
     * @return Running on success; Stopped if the start failed
     *
     * No-op returning Running if an instance is already active.
     * Blocks until the worker has bound (or failed to).
     */
    ServerState requestStart();

    /**
     * @brief Stop the active instance
     * @return Stopped
     *
     * No-op (no events) when nothing is running. Waits at most the stop
     * timeout for the worker, then force-releases it.
     */
    ServerState requestStop();

    ServerState state() const { return m_state.load(); }

    bool isRunning() const { return m_state.load() == ServerState::Running; }

    size_t connectionCount() const { return m_connectionCount.load(); }

    /// Listening port of the active instance, 0 when stopped.
    uint16_t activePort() const { return m_activePort.load(); }

private:
    friend struct WorkerContext;

    static void workerThreadFunc(std::shared_ptr<WorkerContext> ctx);

    void failStart(const char* code, const std::string& message);
    void releaseWorkerLocked(bool quiet);
    void reapFinishedWorkerLocked();
    void setState(ServerState state);

    // Called by the worker through WorkerContext::report()
    void onConnectionCountChanged(uint64_t generation, size_t count);
    void onWorkerFault(uint64_t generation, const std::string& message);

    ConfigStore& m_config;
    EventBus& m_bus;
    TransferEngineFactory m_engineFactory;
    const uint32_t m_stopTimeoutMs;
    const uint32_t m_bindTimeoutMs;

    std::mutex m_controlMutex;  ///< Serializes lifecycle transitions

    std::atomic<ServerState> m_state;
    std::atomic<size_t> m_connectionCount;
    std::atomic<uint16_t> m_activePort;
    std::atomic<uint64_t> m_activeGeneration;  ///< Generation whose events are accepted

    // Active instance (guarded by m_controlMutex)
    std::shared_ptr<WorkerContext> m_worker;
    std::thread m_workerThread;
    uint64_t m_nextGeneration;
};

}  // namespace TransEase
