#include "fand/api.hpp"
#include "fand/config.hpp"
#include "fand/daemon.hpp"
#include "fand/logging.hpp"

#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>

namespace {

fand::FanDaemon* g_daemon = nullptr;

void handle_signal(int) {
    if (g_daemon) {
        g_daemon->stop();
    }
}

void print_usage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " [--config <path>] [--monitor <socket>]\n";
}

}  // namespace

int main(int argc, char** argv) {
    std::string config_path;
    std::string monitor_socket;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" || arg == "--monitor") {
            if (i + 1 >= argc) {
                print_usage(argv[0]);
                return 1;
            }
            (arg == "--config" ? config_path : monitor_socket) = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else {
            print_usage(argv[0]);
            return 1;
        }
    }

    try {
        auto settings = config_path.empty() ? fand::FandSettings{} : fand::FandSettings::from_toml(config_path);
        if (!monitor_socket.empty()) {
            settings.monitor.enabled = true;
            settings.monitor.socket_path = monitor_socket;
        }

        fand::FanDaemon daemon(fand::build_runtime(settings));
        g_daemon = &daemon;
        std::signal(SIGINT, handle_signal);
        std::signal(SIGTERM, handle_signal);

        daemon.run();
        g_daemon = nullptr;
    } catch (const std::exception& exc) {
        g_daemon = nullptr;
        std::cerr << "fand error: " << exc.what() << "\n";
        return 1;
    }

    return 0;
}
