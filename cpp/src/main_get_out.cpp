#include "fand/monitor.hpp"
#include "fand/observer.hpp"

#include <cmath>
#include <iostream>
#include <sstream>
#include <string>

namespace {

// Position of the last stage of the built-in chain. Only meaningful when
// the daemon runs the default eight-stage pipeline.
constexpr std::size_t kFinalStageIndex = 7;

void print_usage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " <socket>\n"
              << "Prints the current output of fand. Only works with the default pipeline.\n";
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
            auto parsed = fand::parse_monitor_line(*line);
            if (!parsed.has_value() || parsed->stage_index != kFinalStageIndex || !parsed->is_output()) {
                continue;
            }
            std::istringstream number(parsed->payload);
            double value = 0.0;
            if (!(number >> value)) {
                std::cerr << "fand-get-out error: malformed output value: " << parsed->payload << "\n";
                return 1;
            }
            std::cout << static_cast<long long>(std::llround(value)) << "\n";
            return 0;
        }
    } catch (const std::exception& exc) {
        std::cerr << "fand-get-out error: " << exc.what() << "\n";
        return 1;
    }
    std::cerr << "fand-get-out error: connection closed before an output was seen\n";
    return 1;
}
