#include "ipc/control_plane.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <iomanip>
#include <sstream>
#include <utility>

#ifdef __linux__
#include <poll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>
#endif

namespace framegov::ipc {

namespace {

constexpr int kAcceptPollMs = 100;

std::string firstWord(const std::string& s) {
    const auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) {
        return {};
    }
    const auto e = s.find_first_of(" \t\r\n", b);
    return s.substr(b, e == std::string::npos ? std::string::npos : e - b);
}

}  // namespace

ControlCommand parseControlCommand(const std::string& request) {
    const std::string w = firstWord(request);
    if (w == "status") return ControlCommand::Status;
    if (w == "snapshot") return ControlCommand::Snapshot;
    if (w == "reclaim") return ControlCommand::Reclaim;
    if (w == "background") return ControlCommand::Background;
    if (w == "load") return ControlCommand::Load;
    if (w == "quit") return ControlCommand::Quit;
    return ControlCommand::Unknown;
}

const char* controlCommandName(ControlCommand cmd) {
    switch (cmd) {
        case ControlCommand::Status: return "status";
        case ControlCommand::Snapshot: return "snapshot";
        case ControlCommand::Reclaim: return "reclaim";
        case ControlCommand::Background: return "background";
        case ControlCommand::Load: return "load";
        case ControlCommand::Quit: return "quit";
        case ControlCommand::Unknown: break;
    }
    return "unknown";
}

bool parseCommandArgument(const std::string& request, double& out) {
    std::istringstream iss(request);
    std::string word;
    double value = 0.0;
    if (!(iss >> word >> value)) {
        return false;
    }
    out = value;
    return true;
}

std::string formatStatus(const TelemetrySnapshot& s) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1)
        << "OK status initialized=" << (s.initialized ? 1 : 0)
        << " fps=" << s.fps
        << " health=" << s.health_score
        << " render_mode=" << renderModeName(s.render_mode)
        << " cache_mode=" << cacheModeName(s.cache_mode)
        << " animations=" << s.active_handles
        << " memory_mb=" << bytesToMb(s.memory_usage_bytes)
        << " cache_hit_pct=" << (s.cache_hit_rate * 100.0)
        << " frames=" << s.frames
        << " render_transitions=" << s.render_transitions
        << " cache_transitions=" << s.cache_transitions
        << "\n";
    return oss.str();
}

UnixControlServer::~UnixControlServer() {
    stop();
}

bool UnixControlServer::start(const std::string& socket_path, Handler handler, std::string& error) {
    stop();
#ifdef __linux__
    sockaddr_un addr{};
    if (socket_path.empty() || socket_path.size() >= sizeof(addr.sun_path)) {
        error = "control socket path empty or too long: " + socket_path;
        return false;
    }
    const int fd = socket(AF_UNIX, SOCK_STREAM, 0);
    if (fd < 0) {
        error = std::string("socket failed: ") + std::strerror(errno);
        return false;
    }
    ::unlink(socket_path.c_str());
    addr.sun_family = AF_UNIX;
    std::snprintf(addr.sun_path, sizeof(addr.sun_path), "%s", socket_path.c_str());
    if (bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        error = std::string("bind failed: ") + std::strerror(errno);
        close(fd);
        return false;
    }
    if (listen(fd, 4) < 0) {
        error = std::string("listen failed: ") + std::strerror(errno);
        close(fd);
        ::unlink(socket_path.c_str());
        return false;
    }
    listen_fd_ = fd;
    socket_path_ = socket_path;
    handler_ = std::move(handler);
    running_.store(true);
    thread_ = std::thread(&UnixControlServer::serveLoop, this);
    error.clear();
    return true;
#else
    (void)socket_path;
    (void)handler;
    error = "UnixControlServer requires Linux";
    return false;
#endif
}

void UnixControlServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    if (thread_.joinable()) {
        thread_.join();
    }
#ifdef __linux__
    if (listen_fd_ >= 0) {
        close(listen_fd_);
        listen_fd_ = -1;
    }
    ::unlink(socket_path_.c_str());
#endif
}

void UnixControlServer::serveLoop() {
#ifdef __linux__
    while (running_.load()) {
        // poll so stop() is observed without shutting the socket down under accept
        pollfd pfd{};
        pfd.fd = listen_fd_;
        pfd.events = POLLIN;
        const int rc = poll(&pfd, 1, kAcceptPollMs);
        if (rc <= 0) {
            continue;
        }
        const int client_fd = accept(listen_fd_, nullptr, nullptr);
        if (client_fd < 0) {
            continue;
        }

        char buf[512];
        const ssize_t n = recv(client_fd, buf, sizeof(buf) - 1, 0);
        std::string reply = "ERR empty\n";
        if (n > 0) {
            buf[n] = '\0';
            reply = handler_ ? handler_(std::string(buf)) : "ERR no-handler\n";
        }
        (void)send(client_fd, reply.data(), reply.size(), MSG_NOSIGNAL);
        close(client_fd);
    }
#endif
}

bool unixControlRequest(const std::string& socket_path, const std::string& request, std::string& response, std::string& error) {
#ifdef __linux__
    sockaddr_un addr{};
    if (socket_path.size() >= sizeof(addr.sun_path)) {
        error = "socket path too long";
        return false;
    }
    const int fd = socket(AF_UNIX, SOCK_STREAM, 0);
    if (fd < 0) {
        error = "socket failed";
        return false;
    }
    addr.sun_family = AF_UNIX;
    std::snprintf(addr.sun_path, sizeof(addr.sun_path), "%s", socket_path.c_str());
    if (connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        error = "connect failed: " + socket_path;
        close(fd);
        return false;
    }
    if (send(fd, request.data(), request.size(), MSG_NOSIGNAL) < 0) {
        error = "send failed";
        close(fd);
        return false;
    }
    response.clear();
    char buf[2048];
    while (true) {
        const ssize_t n = recv(fd, buf, sizeof(buf), 0);
        if (n < 0) {
            error = "recv failed";
            close(fd);
            return false;
        }
        if (n == 0) {
            break;
        }
        response.append(buf, static_cast<std::size_t>(n));
    }
    close(fd);
    error.clear();
    return true;
#else
    (void)socket_path;
    (void)request;
    (void)response;
    error = "unixControlRequest requires Linux";
    return false;
#endif
}

}  // namespace framegov::ipc
