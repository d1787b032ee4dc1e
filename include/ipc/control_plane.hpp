#pragma once

#include "core/telemetry.hpp"

#include <atomic>
#include <functional>
#include <string>
#include <thread>

namespace framegov::ipc {

enum class ControlCommand {
    Unknown,
    Status,
    Snapshot,
    Reclaim,
    Background,
    Load,
    Quit,
};

ControlCommand parseControlCommand(const std::string& request);
const char* controlCommandName(ControlCommand cmd);

// Numeric argument following the command word, e.g. "load 40".
bool parseCommandArgument(const std::string& request, double& out);

// One line, "OK status ..." form, key=value pairs.
std::string formatStatus(const TelemetrySnapshot& s);

// Serves one text request per connection on a Unix stream socket. The handler
// runs on the server thread.
class UnixControlServer {
public:
    using Handler = std::function<std::string(const std::string&)>;

    UnixControlServer() = default;
    ~UnixControlServer();

    bool start(const std::string& socket_path, Handler handler, std::string& error);
    void stop();
    bool isRunning() const { return running_.load(); }

private:
    void serveLoop();

    std::atomic<bool> running_{false};
    std::string socket_path_{};
    Handler handler_{};
    std::thread thread_{};
    int listen_fd_{-1};
};

bool unixControlRequest(const std::string& socket_path, const std::string& request, std::string& response, std::string& error);

}  // namespace framegov::ipc
