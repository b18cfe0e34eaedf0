/**
 * @file TransferEngine.h
 * @brief Boundary to the file-transfer protocol implementation
 */

#pragma once

#include "EncodingAdapter.h"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace TransEase {

//=============================================================================
// Handler Configuration
//=============================================================================

/**
 * @brief Directory tree exposed to the anonymous principal
 */
struct Authorizer {
    std::string user;         ///< Principal name ("anonymous")
    std::string rootPath;     ///< Absolute, existing directory
    std::string permissions;  ///< Permission letters, see ANONYMOUS_PERMISSIONS
};

/**
 * @brief Per-connection handler settings fixed for one server instance
 */
struct HandlerConfig {
    std::shared_ptr<const TextCodec> codec;  ///< Control-channel text conversion
    int timeoutSeconds = 0;                  ///< Idle timeout per connection
    Authorizer authorizer;
    std::string banner;                      ///< Greeting line (without CRLF)
    bool utf8 = false;                       ///< Advertise UTF-8 filenames
};

/**
 * @brief Address the worker listens on
 */
struct BindSpec {
    std::string host;
    uint16_t port = 0;
};

/**
 * @brief Active connection count changed
 *
 * Called from engine threads.
 */
using ConnectionCountCallback = std::function<void(size_t activeConnections)>;

//=============================================================================
// TransferEngine Interface
//=============================================================================

/**
 * @class TransferEngine
 * @brief Transfer server as seen by the supervisor
 *
 * Lifecycle for one server instance:
 * 1. setMaxConnections() / setConnectionCountCallback()
 * 2. listen()        - binds; throws ServerBindError on failure
 * 3. serveForever()  - blocks on the worker thread until closeAll()
 * 4. closeAll()      - from any thread; closes every connection and unbinds
 *
 * An engine object serves exactly one instance and is not restarted.
 * Per-operation permission checks and per-connection I/O faults are the
 * engine's business; only faults that end serveForever() reach the
 * supervisor.
 */
class TransferEngine {
public:
    virtual ~TransferEngine() = default;

    virtual void setMaxConnections(size_t maxConnections) = 0;

    virtual void setConnectionCountCallback(ConnectionCountCallback callback) = 0;

    /**
     * @brief Bind and start listening
     * @throws ServerBindError if the address cannot be bound
     */
    virtual void listen(const BindSpec& bind, const HandlerConfig& handler) = 0;

    /**
     * @brief Accept and serve connections until closeAll()
     * @throws ServerRuntimeError on a fault that ends serving
     */
    virtual void serveForever() = 0;

    /**
     * @brief Close all connections, unbind and make serveForever() return
     *
     * Thread-safe and idempotent.
     */
    virtual void closeAll() = 0;

    virtual size_t connectionCount() const = 0;
};

/**
 * @brief Creates a fresh engine for every server start
 */
using TransferEngineFactory = std::function<std::unique_ptr<TransferEngine>()>;

}  // namespace TransEase
