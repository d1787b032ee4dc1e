#include "core/config.hpp"
#include "ipc/control_plane.hpp"

#include <iostream>
#include <string>

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "usage: framegov_ctl <status|snapshot|reclaim|background|load <frame_ms>|quit> [config_path]\n";
        return 1;
    }

    std::string command = argv[1];
    int config_arg = 2;
    if (framegov::ipc::parseControlCommand(command) == framegov::ipc::ControlCommand::Load && argc > 2) {
        command += " ";
        command += argv[2];
        config_arg = 3;
    }
    if (framegov::ipc::parseControlCommand(command) == framegov::ipc::ControlCommand::Unknown) {
        std::cerr << "unknown command: " << command << "\n";
        return 1;
    }

    framegov::AppConfig cfg;
    std::string err;
    if (argc > config_arg) {
        if (!framegov::loadConfig(argv[config_arg], cfg, err)) {
            std::cerr << "config load failed: " << err << "\n";
            return 1;
        }
    }
    if (!cfg.control.enable) {
        std::cerr << "control socket disabled in config\n";
        return 1;
    }

    std::string response;
    if (!framegov::ipc::unixControlRequest(cfg.control.socket_path, command + "\n", response, err)) {
        std::cerr << "control request failed: " << err << "\n";
        return 1;
    }
    std::cout << response;
    return response.rfind("OK", 0) == 0 ? 0 : 2;
}
