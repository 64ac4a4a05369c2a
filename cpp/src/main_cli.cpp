#include "fand/monitor.hpp"
#include "fand/observer.hpp"

#include <iostream>
#include <string>

namespace {

void print_usage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " <socket>\n"
              << "Prints the internal state of a running fand control loop.\n";
}

}  // namespace

int main(int argc, char** argv) {
    if (argc != 2) {
        print_usage(argv[0]);
        return 1;
    }

    try {
        fand::ObserverConnection connection(argv[1]);
        while (auto line = connection.read_line()) {
            std::cout << *line << "\n";
            auto parsed = fand::parse_monitor_line(*line);
            if (!parsed.has_value()) {
                std::cout << "Failed to parse the line\n";
                continue;
            }
            std::cout << "The operation is " << parsed->tag << " at index " << parsed->stage_index << "\n";
            if (parsed->is_output()) {
                continue;
            }
            auto fields = fand::parse_numeric_object(parsed->payload);
            if (!fields.has_value()) {
                std::cout << "Failed to parse the rest\n";
            } else if (parsed->tag == "PID") {
                std::cout << "P: " << (*fields)["P"] << "\tI: " << (*fields)["I"] << "\t D: " << (*fields)["D"]
                          << "\t\n";
            } else {
                std::cout << "\n";
            }
        }
    } catch (const std::exception& exc) {
        std::cerr << "fand-cli error: " << exc.what() << "\n";
        return 1;
    }
    return 0;
}
