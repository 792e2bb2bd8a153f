#include "core/health_probe.h"

#include "utils/config.h"

#include <httplib.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cerrno>
#include <cstring>

#ifdef _WIN32
#include <winsock2.h>
#include <ws2tcpip.h>
#else
#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>
#endif

namespace ksboot {

namespace {

#ifdef _WIN32
using socket_t = SOCKET;
constexpr socket_t kInvalidSocket = INVALID_SOCKET;
void closeSocket(socket_t s) { closesocket(s); }
bool setNonBlocking(socket_t s) {
    u_long mode = 1;
    return ioctlsocket(s, FIONBIO, &mode) == 0;
}
bool connectInProgress() { return WSAGetLastError() == WSAEWOULDBLOCK; }
int waitWritable(socket_t s, int timeout_ms) {
    WSAPOLLFD pfd{};
    pfd.fd = s;
    pfd.events = POLLOUT;
    return WSAPoll(&pfd, 1, timeout_ms);
}
#else
using socket_t = int;
constexpr socket_t kInvalidSocket = -1;
void closeSocket(socket_t s) { ::close(s); }
bool setNonBlocking(socket_t s) {
    int flags = ::fcntl(s, F_GETFL, 0);
    return flags >= 0 && ::fcntl(s, F_SETFL, flags | O_NONBLOCK) == 0;
}
bool connectInProgress() { return errno == EINPROGRESS; }
int waitWritable(socket_t s, int timeout_ms) {
    pollfd pfd{};
    pfd.fd = s;
    pfd.events = POLLOUT;
    int r;
    do {
        r = ::poll(&pfd, 1, timeout_ms);
    } while (r == -1 && errno == EINTR);
    return r;
}
#endif

// Closes the socket on every exit path.
class SocketGuard {
public:
    explicit SocketGuard(socket_t s) : s_(s) {}
    ~SocketGuard() {
        if (s_ != kInvalidSocket) closeSocket(s_);
    }
    SocketGuard(const SocketGuard&) = delete;
    SocketGuard& operator=(const SocketGuard&) = delete;
    socket_t get() const { return s_; }

private:
    socket_t s_;
};

bool connectOnce(const addrinfo* ai, int timeout_ms) {
    SocketGuard sock(::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol));
    if (sock.get() == kInvalidSocket) return false;
    if (!setNonBlocking(sock.get())) return false;

    if (::connect(sock.get(), ai->ai_addr, ai->ai_addrlen) == 0) {
        return true;
    }
    if (!connectInProgress()) return false;

    if (waitWritable(sock.get(), timeout_ms) <= 0) return false;

    int so_error = 0;
    socklen_t len = sizeof(so_error);
    if (::getsockopt(sock.get(), SOL_SOCKET, SO_ERROR,
                     reinterpret_cast<char*>(&so_error), &len) != 0) {
        return false;
    }
    return so_error == 0;
}

}  // namespace

int probeTimeoutMillis(std::chrono::milliseconds timeout) {
    return static_cast<int>(std::clamp<long long>(timeout.count(), 1, kMaxProbeTimeoutMs));
}

bool TcpHealthProbe::probe(const std::string& host, uint16_t port,
                           std::chrono::milliseconds timeout) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* results = nullptr;
    const std::string service = std::to_string(port);
    int rc = ::getaddrinfo(host.c_str(), service.c_str(), &hints, &results);
    if (rc != 0 || !results) {
        spdlog::debug("Probe {}:{} cannot resolve host: {}", host, port, gai_strerror(rc));
        return false;
    }

    const int timeout_ms = probeTimeoutMillis(timeout);
    bool connected = false;
    for (const addrinfo* ai = results; ai && !connected; ai = ai->ai_next) {
        connected = connectOnce(ai, timeout_ms);
    }
    ::freeaddrinfo(results);

    spdlog::trace("Probe {}:{} -> {}", host, port, connected ? "listening" : "not listening");
    return connected;
}

HttpHealthProbe::HttpHealthProbe(std::string path) : path_(std::move(path)) {
    if (path_.empty() || path_.front() != '/') {
        path_.insert(path_.begin(), '/');
    }
}

bool HttpHealthProbe::probe(const std::string& host, uint16_t port,
                            std::chrono::milliseconds timeout) {
    try {
        httplib::Client client(host, port);
        const int ms = probeTimeoutMillis(timeout);
        const auto secs = static_cast<time_t>(ms / 1000);
        const auto usecs = static_cast<time_t>((ms % 1000) * 1000);
        client.set_connection_timeout(secs, usecs);
        client.set_read_timeout(secs, usecs);
        client.set_keep_alive(false);

        auto res = client.Get(path_.c_str());
        if (!res) {
            spdlog::trace("Probe http://{}:{}{} failed: {}", host, port, path_,
                          httplib::to_string(res.error()));
            return false;
        }
        return res->status < 500;
    } catch (const std::exception& e) {
        spdlog::debug("Probe http://{}:{}{} raised: {}", host, port, path_, e.what());
        return false;
    }
}

std::unique_ptr<HealthProbe> makeHealthProbe(const BootstrapConfig& config) {
    if (config.health_path.empty()) {
        return std::make_unique<TcpHealthProbe>();
    }
    return std::make_unique<HttpHealthProbe>(config.health_path);
}

}  // namespace ksboot
