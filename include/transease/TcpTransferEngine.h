/**
 * @file TcpTransferEngine.h
 * @brief Built-in POSIX TCP transfer engine
 */

#pragma once

#include "config.h"
#include "TransferEngine.h"
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_set>

namespace TransEase {

//=============================================================================
// TcpTransferEngine Class
//=============================================================================

/**
 * @class TcpTransferEngine
 * @brief Minimal control-channel server behind the TransferEngine boundary
 *
 * Greets every client with the handler banner and answers a small command
 * set (QUIT, NOOP); everything else is refused with 502. It exists so the
 * control plane can be run and tested end to end without an external
 * protocol library.
 *
 * Architecture:
 * - serveForever() runs the accept loop on the caller's (worker) thread,
 *   polling the listening socket and a wake pipe
 * - One detached thread per client, tracked by socket and counted;
 *   serveForever() does not return before every client thread has exited
 * - closeAll() wakes the loop and shuts every client socket down
 *
 * Thread Safety:
 * - closeAll() and connectionCount() may be called from any thread
 * - listen() and serveForever() are called once, from the worker thread
 */
class TcpTransferEngine : public TransferEngine {
public:
    TcpTransferEngine();

    /**
     * @brief Closes the listener and wake pipe if still open
     */
    ~TcpTransferEngine() override;

    // Prevent copying
    TcpTransferEngine(const TcpTransferEngine&) = delete;
    TcpTransferEngine& operator=(const TcpTransferEngine&) = delete;

    // Prevent moving (engine has unique resources)
    TcpTransferEngine(TcpTransferEngine&&) = delete;
    TcpTransferEngine& operator=(TcpTransferEngine&&) = delete;

    void setMaxConnections(size_t maxConnections) override { m_maxConnections.store(maxConnections); }

    void setConnectionCountCallback(ConnectionCountCallback callback) override {
        m_countCallback = std::move(callback);
    }

    void listen(const BindSpec& bind, const HandlerConfig& handler) override;
    void serveForever() override;
    void closeAll() override;

    size_t connectionCount() const override { return m_connectionCount.load(); }

    /// Port actually bound (differs from BindSpec::port when that was 0).
    uint16_t boundPort() const { return m_boundPort.load(); }

    /// poll() timeout for an idle timeout in seconds: -1 when disabled, clamped to INT_MAX.
    static int idleTimeoutMs(int timeoutSeconds);

private:
    void handleClient(int clientSocket, const std::string& clientIp);

    /// Encode through the handler codec and send with CRLF; false if the peer is gone.
    bool sendLine(int clientSocket, const std::string& text) const;

    /// Reply for one decoded command line; empty means no reply.
    std::string replyFor(const std::string& line, bool& closeAfter) const;

    bool registerClient(int clientSocket);
    void unregisterClient(int clientSocket);
    void notifyCount(size_t count);

    void closeListenerLocked();

    // Configuration
    std::atomic<size_t> m_maxConnections;
    ConnectionCountCallback m_countCallback;
    HandlerConfig m_handler;

    // Listener (guarded by m_socketMutex)
    std::mutex m_socketMutex;
    int m_listenSocket;
    int m_wakePipe[2];
    bool m_serving;
    std::atomic<uint16_t> m_boundPort;

    // Control flags
    std::atomic<bool> m_closed;

    // Clients
    std::mutex m_clientsMutex;                  ///< Protects m_clientSockets
    std::unordered_set<int> m_clientSockets;
    std::atomic<size_t> m_connectionCount;
    std::condition_variable m_clientsCv;        ///< Signalled when a client thread exits
};

}  // namespace TransEase
