/**
 * @file ServerSupervisor.cpp
 * @brief Lifecycle state machine for the transfer-server worker
 */

#include "transease/ServerSupervisor.h"
#include "transease/ConfigStore.h"
#include "transease/EncodingAdapter.h"
#include "transease/Debug.h"
#include "transease/ErrorCodes.h"
#include "transease/Errors.h"
#include "transease/EventBus.h"
#include <chrono>
#include <exception>
#include <filesystem>
#include <future>
#include <iostream>
#include <system_error>

namespace TransEase {

//=============================================================================
// WorkerContext
//=============================================================================

/**
 * @brief State shared between the supervisor and one worker thread
 *
 * The worker holds its own reference, so the context (and the engine)
 * stays valid even if the supervisor force-releases the worker and goes
 * away. After release() the worker can no longer reach the supervisor.
 */
struct WorkerContext {
    ServerInstance instance;
    std::shared_ptr<TransferEngine> engine;

    std::promise<void> bound;
    std::promise<void> finished;
    std::shared_future<void> boundFuture;
    std::shared_future<void> finishedFuture;

    std::atomic<bool> stopRequested{false};

    std::mutex ownerMutex;  ///< Protects owner and fault
    ServerSupervisor* owner = nullptr;
    std::string fault;      ///< Set once serving has failed

    WorkerContext()
        : boundFuture(bound.get_future().share())
        , finishedFuture(finished.get_future().share())
    {
    }

    template <typename Fn>
    void report(Fn&& fn) {
        std::lock_guard<std::mutex> lock(ownerMutex);
        if (owner) {
            fn(*owner);
        }
    }

    /// Record a serving fault, then report it if the owner is still attached.
    template <typename Fn>
    void reportFault(const std::string& message, Fn&& fn) {
        std::lock_guard<std::mutex> lock(ownerMutex);
        fault = message;
        if (owner) {
            fn(*owner);
        }
    }

    void release() {
        std::lock_guard<std::mutex> lock(ownerMutex);
        owner = nullptr;
    }
};

const char* serverStateToString(ServerState state) {
    switch (state) {
        case ServerState::Stopped:  return "Stopped";
        case ServerState::Starting: return "Starting";
        case ServerState::Running:  return "Running";
        case ServerState::Stopping: return "Stopping";
        case ServerState::Failed:   return "Failed";
        default:                    return "Unknown";
    }
}

//=============================================================================
// Constructor / Destructor
//=============================================================================

ServerSupervisor::ServerSupervisor(ConfigStore& config,
                                   EventBus& bus,
                                   TransferEngineFactory engineFactory,
                                   uint32_t stopTimeoutMs,
                                   uint32_t bindTimeoutMs)
    : m_config(config)
    , m_bus(bus)
    , m_engineFactory(std::move(engineFactory))
    , m_stopTimeoutMs(stopTimeoutMs)
    , m_bindTimeoutMs(bindTimeoutMs)
    , m_state(ServerState::Stopped)
    , m_connectionCount(0)
    , m_activePort(0)
    , m_activeGeneration(0)
    , m_nextGeneration(1)
{
}

ServerSupervisor::~ServerSupervisor() {
    try {
        requestStop();
    } catch (const std::exception& e) {
        std::cerr << "[ServerSupervisor] Stop during destruction failed: " << e.what() << "\n";
    }

    std::lock_guard<std::mutex> lock(m_controlMutex);
    reapFinishedWorkerLocked();
}

//=============================================================================
// ServerSupervisor: requestStart()
//=============================================================================

ServerState ServerSupervisor::requestStart() {
    std::lock_guard<std::mutex> lock(m_controlMutex);

    reapFinishedWorkerLocked();

    const ServerState current = m_state.load();
    if (current == ServerState::Starting || current == ServerState::Running) {
        LOG_DEBUG("Start requested while " << serverStateToString(current) << "; ignored");
        return current;
    }

    // One consistent read; a concurrent save() is either fully visible or not at all.
    const ServerSettings settings = m_config.snapshot();
    std::shared_ptr<WorkerContext> ctx;

    setState(ServerState::Starting);
    LOG_INFO("Starting server on " << BIND_HOST << ":" << settings.port
             << " (root " << settings.rootPath << ", encoding " << settings.encoding << ")");

    try {
        const std::filesystem::path root = std::filesystem::u8path(settings.rootPath);
        std::error_code ec;
        if (!std::filesystem::is_directory(root, ec)) {
            std::filesystem::create_directories(root, ec);
            if (ec || !std::filesystem::is_directory(root)) {
                throw ConfigValidationError("root directory '" + settings.rootPath +
                                            "' cannot be created: " +
                                            (ec ? ec.message() : std::string("not a directory")));
            }
        }

        auto codec = std::make_shared<EncodingAdapter>(settings.encoding);
        if (!codec->isPrimaryAvailable()) {
            LOG_WARNING("Encoding " << settings.encoding
                        << " is not available; control text falls back to latin1");
        }

        ctx = std::make_shared<WorkerContext>();
        ctx->owner = this;
        ctx->instance.generation = m_nextGeneration++;
        ctx->instance.bind.host = BIND_HOST;
        ctx->instance.bind.port = static_cast<uint16_t>(settings.port);
        ctx->instance.maxConnections = static_cast<size_t>(settings.maxConnections);
        ctx->instance.handler.codec = codec;
        ctx->instance.handler.timeoutSeconds = settings.timeoutSeconds;
        ctx->instance.handler.authorizer.user = ANONYMOUS_USER;
        ctx->instance.handler.authorizer.rootPath = root.u8string();
        ctx->instance.handler.authorizer.permissions = ANONYMOUS_PERMISSIONS;
        ctx->instance.handler.banner = BANNER;
        ctx->instance.handler.utf8 = codec->advertisesUtf8();

        std::unique_ptr<TransferEngine> engine = m_engineFactory ? m_engineFactory() : nullptr;
        if (!engine) {
            throw ServerRuntimeError("no transfer engine available");
        }
        ctx->engine = std::move(engine);

        const uint64_t generation = ctx->instance.generation;
        WorkerContext* raw = ctx.get();  // ctx owns the engine, so it outlives the callback
        ctx->engine->setMaxConnections(ctx->instance.maxConnections);
        ctx->engine->setConnectionCountCallback([raw, generation](size_t count) {
            raw->report([generation, count](ServerSupervisor& s) {
                s.onConnectionCountChanged(generation, count);
            });
        });

        m_activeGeneration.store(generation);
        m_connectionCount.store(0);
        m_worker = ctx;
        m_workerThread = std::thread(&ServerSupervisor::workerThreadFunc, ctx);

        if (ctx->boundFuture.wait_for(std::chrono::milliseconds(m_bindTimeoutMs)) !=
            std::future_status::ready) {
            failStart(ErrorCodes::SERVER_BIND_TIMEOUT,
                      "Failed to start server: port " + std::to_string(settings.port) +
                      " was not bound within " + std::to_string(m_bindTimeoutMs) + " ms");
            return m_state.load();
        }
        ctx->boundFuture.get();

    } catch (const ServerBindError& e) {
        failStart(ErrorCodes::SERVER_BIND_FAILED,
                  "Failed to start server on port " + std::to_string(settings.port) + ": " + e.what());
        return m_state.load();
    } catch (const ConfigValidationError& e) {
        failStart(ErrorCodes::SERVER_ROOT_UNAVAILABLE,
                  std::string("Failed to start server: ") + e.what());
        return m_state.load();
    } catch (const std::exception& e) {
        failStart(ErrorCodes::SERVER_INTERNAL_ERROR,
                  std::string("Failed to start server: ") + e.what());
        return m_state.load();
    }

    // The worker reports faults under ownerMutex: a fault either lands
    // before this block (start fails) or after Running is published.
    std::string fault;
    {
        std::lock_guard<std::mutex> ownerLock(ctx->ownerMutex);
        fault = ctx->fault;
        if (fault.empty()) {
            m_activePort.store(static_cast<uint16_t>(settings.port));
            setState(ServerState::Running);

            const std::string message = "Server started on port " + std::to_string(settings.port);
            LOG_INFO(message);
            m_bus.publish(Event::started());
            m_bus.publish(Event::status(message));
            m_bus.publish(Event::connectionCount(0));
            return ServerState::Running;
        }
    }

    failStart(ErrorCodes::SERVER_RUNTIME_FAULT,
              "Failed to start server on port " + std::to_string(settings.port) + ": " + fault);
    return m_state.load();
}

//=============================================================================
// ServerSupervisor: requestStop()
//=============================================================================

ServerState ServerSupervisor::requestStop() {
    std::lock_guard<std::mutex> lock(m_controlMutex);

    ServerState expected = ServerState::Running;
    if (!m_state.compare_exchange_strong(expected, ServerState::Stopping)) {
        // Stopped already, or a worker fault got there first.
        reapFinishedWorkerLocked();
        return m_state.load();
    }

    LOG_INFO("Stopping server");
    LOG_DEBUG("Server state: Running -> Stopping");

    releaseWorkerLocked(false);

    setState(ServerState::Stopped);
    LOG_INFO("Server stopped");
    m_bus.publish(Event::stopped());

    return ServerState::Stopped;
}

//=============================================================================
// Internal helpers
//=============================================================================

void ServerSupervisor::failStart(const char* code, const std::string& message) {
    releaseWorkerLocked(true);

    setState(ServerState::Failed);
    LOG_ERROR(code << " " << message);
    m_bus.publish(Event::error(std::string(code) + " " + message));

    // Never left half-running.
    setState(ServerState::Stopped);
}

void ServerSupervisor::releaseWorkerLocked(bool quiet) {
    if (!m_worker) {
        return;
    }

    std::shared_ptr<WorkerContext> ctx = std::move(m_worker);
    m_worker.reset();
    m_activeGeneration.store(0);

    ctx->stopRequested.store(true);
    try {
        ctx->engine->closeAll();
    } catch (const std::exception& e) {
        LOG_WARNING("Error while closing server connections: " << e.what());
    }

    const bool finished =
        ctx->finishedFuture.wait_for(std::chrono::milliseconds(m_stopTimeoutMs)) ==
        std::future_status::ready;

    // From here on the worker cannot call back into this object.
    ctx->release();

    if (finished) {
        if (m_workerThread.joinable()) {
            m_workerThread.join();
        }
    } else {
        if (m_workerThread.joinable()) {
            m_workerThread.detach();
        }
        const std::string message = std::string(ErrorCodes::SERVER_STOP_TIMEOUT) +
            " Server did not stop within the " + std::to_string(m_stopTimeoutMs) +
            " ms timeout; worker resources were force-released";
        LOG_ERROR(message);
        if (!quiet) {
            m_bus.publish(Event::error(message));
        }
    }

    m_connectionCount.store(0);
    m_activePort.store(0);
}

void ServerSupervisor::reapFinishedWorkerLocked() {
    // Left behind by a worker fault: the state is already Stopped.
    if (m_worker && m_state.load() != ServerState::Running) {
        releaseWorkerLocked(true);
    }
}

void ServerSupervisor::setState(ServerState state) {
    const ServerState previous = m_state.exchange(state);
    if (previous != state) {
        LOG_DEBUG("Server state: " << serverStateToString(previous)
                  << " -> " << serverStateToString(state));
    }
}

//=============================================================================
// Worker callbacks
//=============================================================================

void ServerSupervisor::onConnectionCountChanged(uint64_t generation, size_t count) {
    if (generation != m_activeGeneration.load()) {
        return;
    }
    m_connectionCount.store(count);
    m_bus.publish(Event::connectionCount(count));
}

void ServerSupervisor::onWorkerFault(uint64_t generation, const std::string& message) {
    if (generation != m_activeGeneration.load()) {
        return;
    }

    ServerState expected = ServerState::Running;
    if (!m_state.compare_exchange_strong(expected, ServerState::Failed)) {
        if (expected == ServerState::Starting) {
            // requestStart() finds the recorded fault and fails the start.
            LOG_DEBUG("Worker fault before start completed: " << message);
            return;
        }
        // A stop is in progress; it reports on its own.
        LOG_WARNING("Worker fault during " << serverStateToString(expected) << ": " << message);
        return;
    }

    const std::string text = std::string(ErrorCodes::SERVER_RUNTIME_FAULT) + " Server error: " + message;
    LOG_ERROR(text);
    m_bus.publish(Event::error(text));

    m_connectionCount.store(0);
    m_activePort.store(0);
    setState(ServerState::Stopped);
    m_bus.publish(Event::stopped());
}

//=============================================================================
// Worker thread
//=============================================================================

void ServerSupervisor::workerThreadFunc(std::shared_ptr<WorkerContext> ctx) {
    const uint64_t generation = ctx->instance.generation;

    bool bound = false;
    try {
        ctx->engine->listen(ctx->instance.bind, ctx->instance.handler);
        bound = true;
        ctx->bound.set_value();
    } catch (...) {
        // Handed to the controller, which rethrows it in requestStart().
        ctx->bound.set_exception(std::current_exception());
    }

    if (bound) {
        std::string fault;
        try {
            ctx->engine->serveForever();
            if (!ctx->stopRequested.load()) {
                fault = "server stopped serving unexpectedly";
            }
        } catch (const std::exception& e) {
            fault = e.what();
        }

        if (!fault.empty()) {
            if (ctx->stopRequested.load()) {
                LOG_WARNING("Worker ended with an error during stop: " << fault);
            } else {
                ctx->reportFault(fault, [generation, &fault](ServerSupervisor& s) {
                    s.onWorkerFault(generation, fault);
                });
            }
        }

        try {
            ctx->engine->closeAll();
        } catch (const std::exception& e) {
            LOG_WARNING("Error while releasing server socket: " << e.what());
        }
    }

    LOG_DEBUG("Worker " << generation << " finished");
    ctx->finished.set_value();
}

}  // namespace TransEase
