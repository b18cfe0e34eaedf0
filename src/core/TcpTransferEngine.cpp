/**
 * @file TcpTransferEngine.cpp
 * @brief Built-in POSIX TCP transfer engine
 */

#include "transease/TcpTransferEngine.h"
#include "transease/Debug.h"
#include "transease/Errors.h"
#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <limits>
#include <thread>
#include <vector>

namespace TransEase {

namespace {
    std::string errnoText(int err) {
        return std::string(std::strerror(err)) + " (errno " + std::to_string(err) + ")";
    }

    std::string upperCommand(const std::string& line) {
        const size_t end = line.find(' ');
        std::string verb = line.substr(0, end);
        std::transform(verb.begin(), verb.end(), verb.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return verb;
    }

    void setNonBlocking(int fd) {
        const int flags = fcntl(fd, F_GETFL, 0);
        if (flags >= 0) {
            (void)fcntl(fd, F_SETFL, flags | O_NONBLOCK);
        }
    }
} // anonymous namespace

//=============================================================================
// Constructor / Destructor
//=============================================================================

TcpTransferEngine::TcpTransferEngine()
    : m_maxConnections(0)
    , m_countCallback(nullptr)
    , m_listenSocket(-1)
    , m_wakePipe{-1, -1}
    , m_serving(false)
    , m_boundPort(0)
    , m_closed(false)
    , m_connectionCount(0)
{
}

TcpTransferEngine::~TcpTransferEngine() {
    closeAll();

    std::lock_guard<std::mutex> lock(m_socketMutex);
    closeListenerLocked();
    for (int& fd : m_wakePipe) {
        if (fd >= 0) {
            ::close(fd);
            fd = -1;
        }
    }
}

//=============================================================================
// TcpTransferEngine: listen()
//=============================================================================

void TcpTransferEngine::listen(const BindSpec& bind, const HandlerConfig& handler) {
    std::lock_guard<std::mutex> lock(m_socketMutex);

    if (m_closed.load()) {
        throw ServerBindError("engine was closed before binding");
    }
    if (m_listenSocket >= 0) {
        throw ServerBindError("engine is already listening");
    }

    m_handler = handler;

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(bind.port);
    if (inet_pton(AF_INET, bind.host.c_str(), &addr.sin_addr) != 1) {
        throw ServerBindError("invalid bind address '" + bind.host + "'");
    }

    const int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        throw ServerBindError("socket() failed: " + errnoText(errno));
    }

    const int reuse = 1;
    (void)setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

    if (::bind(fd, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) != 0) {
        const int err = errno;
        ::close(fd);
        throw ServerBindError("cannot bind " + bind.host + ":" + std::to_string(bind.port) +
                              ": " + errnoText(err));
    }

    if (::listen(fd, SOMAXCONN) != 0) {
        const int err = errno;
        ::close(fd);
        throw ServerBindError("listen() failed: " + errnoText(err));
    }

    if (::pipe(m_wakePipe) != 0) {
        const int err = errno;
        ::close(fd);
        m_wakePipe[0] = m_wakePipe[1] = -1;
        throw ServerBindError("cannot create wake pipe: " + errnoText(err));
    }
    setNonBlocking(m_wakePipe[0]);
    setNonBlocking(m_wakePipe[1]);
    setNonBlocking(fd);

    sockaddr_in bound{};
    socklen_t boundLen = sizeof(bound);
    if (getsockname(fd, reinterpret_cast<sockaddr*>(&bound), &boundLen) == 0) {
        m_boundPort.store(ntohs(bound.sin_port));
    } else {
        m_boundPort.store(bind.port);
    }

    m_listenSocket = fd;
    LOG_DEBUG("Listening on " << bind.host << ":" << m_boundPort.load());
}

//=============================================================================
// TcpTransferEngine: serveForever()
//=============================================================================

void TcpTransferEngine::serveForever() {
    int listenSocket = -1;
    int wakeFd = -1;
    {
        std::lock_guard<std::mutex> lock(m_socketMutex);
        if (m_closed.load() || m_listenSocket < 0) {
            return;
        }
        m_serving = true;
        listenSocket = m_listenSocket;
        wakeFd = m_wakePipe[0];
    }

    std::string fault;

    while (!m_closed.load()) {
        pollfd fds[2] = {};
        fds[0].fd = listenSocket;
        fds[0].events = POLLIN;
        fds[1].fd = wakeFd;
        fds[1].events = POLLIN;

        const int rc = ::poll(fds, 2, ACCEPT_POLL_INTERVAL_MS);
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            fault = "poll() failed: " + errnoText(errno);
            break;
        }
        if (m_closed.load() || (fds[1].revents & POLLIN)) {
            break;
        }
        if (rc == 0 || !(fds[0].revents & POLLIN)) {
            continue;
        }

        sockaddr_in clientAddr{};
        socklen_t addrLen = sizeof(clientAddr);
        const int clientSocket = ::accept(listenSocket,
                                          reinterpret_cast<sockaddr*>(&clientAddr),
                                          &addrLen);
        if (clientSocket < 0) {
            const int err = errno;
            if (err == EAGAIN || err == EWOULDBLOCK || err == EINTR || err == ECONNABORTED) {
                continue;
            }
            if (err == EMFILE || err == ENFILE) {
                // Out of descriptors: back off instead of spinning
                LOG_WARNING("accept() failed: " << errnoText(err));
                std::this_thread::sleep_for(std::chrono::milliseconds(ACCEPT_POLL_INTERVAL_MS));
                continue;
            }
            fault = "accept() failed: " + errnoText(err);
            break;
        }

        // accept() inherits O_NONBLOCK on some systems; client I/O is poll-driven anyway
        const int flags = fcntl(clientSocket, F_GETFL, 0);
        if (flags >= 0) {
            (void)fcntl(clientSocket, F_SETFL, flags & ~O_NONBLOCK);
        }

        char ipStr[INET_ADDRSTRLEN] = {};
        inet_ntop(AF_INET, &clientAddr.sin_addr, ipStr, sizeof(ipStr));
        const std::string clientIp(ipStr);

        const size_t limit = m_maxConnections.load();
        if (limit > 0 && m_connectionCount.load() >= limit) {
            LOG_WARNING("Refused connection from " << clientIp << ": limit of "
                        << limit << " connections reached");
            (void)sendLine(clientSocket, "421 Too many connections.");
            ::close(clientSocket);
            continue;
        }

        if (!registerClient(clientSocket)) {
            ::close(clientSocket);
            break;
        }

        std::thread clientThread([this, clientSocket, clientIp]() {
            try {
                this->handleClient(clientSocket, clientIp);
            } catch (const std::exception& e) {
                LOG_ERROR("Connection handler for " << clientIp << " failed: " << e.what());
            }
            this->unregisterClient(clientSocket);
        });
        clientThread.detach();
    }

    {
        std::lock_guard<std::mutex> lock(m_socketMutex);
        closeListenerLocked();
        m_serving = false;
    }

    // Client threads reference this object; wait until they are gone.
    {
        std::vector<int> sockets;
        {
            std::lock_guard<std::mutex> lock(m_clientsMutex);
            sockets.assign(m_clientSockets.begin(), m_clientSockets.end());
        }
        for (int s : sockets) {
            (void)::shutdown(s, SHUT_RDWR);
        }

        std::unique_lock<std::mutex> lock(m_clientsMutex);
        m_clientsCv.wait(lock, [this]() { return m_clientSockets.empty(); });
    }

    if (!fault.empty()) {
        throw ServerRuntimeError(fault);
    }
}

//=============================================================================
// TcpTransferEngine: closeAll()
//=============================================================================

void TcpTransferEngine::closeAll() {
    const bool wasClosed = m_closed.exchange(true);

    {
        std::lock_guard<std::mutex> lock(m_socketMutex);
        if (!wasClosed && m_wakePipe[1] >= 0) {
            const char wake = 1;
            (void)::write(m_wakePipe[1], &wake, 1);
        }
        // A running accept loop closes the listener itself.
        if (!m_serving) {
            closeListenerLocked();
        }
    }

    std::vector<int> sockets;
    {
        std::lock_guard<std::mutex> lock(m_clientsMutex);
        sockets.assign(m_clientSockets.begin(), m_clientSockets.end());
    }
    for (int s : sockets) {
        (void)::shutdown(s, SHUT_RDWR);
    }
}

//=============================================================================
// Client handling
//=============================================================================

int TcpTransferEngine::idleTimeoutMs(int timeoutSeconds) {
    if (timeoutSeconds <= 0) {
        return -1;
    }
    const int64_t ms = static_cast<int64_t>(timeoutSeconds) * 1000;
    return ms > std::numeric_limits<int>::max() ? std::numeric_limits<int>::max()
                                                : static_cast<int>(ms);
}

void TcpTransferEngine::handleClient(int clientSocket, const std::string& clientIp) {
    LOG_INFO("Client connected: " << clientIp);

    if (!sendLine(clientSocket, m_handler.banner)) {
        LOG_INFO("Client disconnected: " << clientIp);
        return;
    }

    const int timeoutMs = idleTimeoutMs(m_handler.timeoutSeconds);
    std::string pending;
    char buffer[1024];
    bool open = true;

    while (open && !m_closed.load()) {
        pollfd pfd{};
        pfd.fd = clientSocket;
        pfd.events = POLLIN;

        const int rc = ::poll(&pfd, 1, timeoutMs);
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }
        if (rc == 0) {
            LOG_INFO("Client " << clientIp << " idle for " << m_handler.timeoutSeconds << " s");
            (void)sendLine(clientSocket, "421 Idle timeout.");
            break;
        }

        const ssize_t received = ::recv(clientSocket, buffer, sizeof(buffer), 0);
        if (received < 0) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }
        if (received == 0) {
            break;
        }
        pending.append(buffer, static_cast<size_t>(received));

        size_t newline;
        while (open && (newline = pending.find('\n')) != std::string::npos) {
            std::string raw = pending.substr(0, newline);
            pending.erase(0, newline + 1);
            if (!raw.empty() && raw.back() == '\r') {
                raw.pop_back();
            }

            const std::string line = m_handler.codec ? m_handler.codec->decode(raw) : raw;
            LOG_DEBUG(clientIp << " -> " << line);

            bool closeAfter = false;
            const std::string reply = replyFor(line, closeAfter);
            if (!reply.empty() && !sendLine(clientSocket, reply)) {
                open = false;
            }
            if (closeAfter) {
                open = false;
            }
        }

        if (open && pending.size() > MAX_CONTROL_LINE) {
            (void)sendLine(clientSocket, "500 Line too long.");
            open = false;
        }
    }

    LOG_INFO("Client disconnected: " << clientIp);
}

std::string TcpTransferEngine::replyFor(const std::string& line, bool& closeAfter) const {
    const std::string verb = upperCommand(line);
    if (verb.empty()) {
        return std::string();
    }
    if (verb == "QUIT") {
        closeAfter = true;
        return "221 Goodbye.";
    }
    if (verb == "NOOP") {
        return "200 OK.";
    }
    return "502 Command not implemented.";
}

bool TcpTransferEngine::sendLine(int clientSocket, const std::string& text) const {
    std::string wire = m_handler.codec ? m_handler.codec->encode(text) : text;
    wire += "\r\n";

    size_t sent = 0;
    while (sent < wire.size()) {
        const ssize_t n = ::send(clientSocket, wire.data() + sent, wire.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        sent += static_cast<size_t>(n);
    }
    return true;
}

//=============================================================================
// Client bookkeeping
//=============================================================================

bool TcpTransferEngine::registerClient(int clientSocket) {
    size_t count = 0;
    {
        std::lock_guard<std::mutex> lock(m_clientsMutex);
        if (m_closed.load()) {
            return false;
        }
        m_clientSockets.insert(clientSocket);
        count = m_connectionCount.fetch_add(1) + 1;
    }
    notifyCount(count);
    return true;
}

void TcpTransferEngine::unregisterClient(int clientSocket) {
    notifyCount(m_connectionCount.fetch_sub(1) - 1);

    // Last touch of this object: serveForever() may return as soon as the set is empty.
    std::lock_guard<std::mutex> lock(m_clientsMutex);
    m_clientSockets.erase(clientSocket);
    // Closed under the lock so closeAll() never shuts down a reused descriptor
    ::close(clientSocket);
    m_clientsCv.notify_all();
}

void TcpTransferEngine::notifyCount(size_t count) {
    if (m_countCallback) {
        m_countCallback(count);
    }
}

void TcpTransferEngine::closeListenerLocked() {
    if (m_listenSocket >= 0) {
        ::close(m_listenSocket);
        m_listenSocket = -1;
    }
}

}  // namespace TransEase
