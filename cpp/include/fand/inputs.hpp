#ifndef FAND_INPUTS_HPP
#define FAND_INPUTS_HPP

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "fand/config.hpp"
#include "fand/logging.hpp"

namespace fand {

// Anything that yields a scalar per pull. An empty result means the stream
// has ended; callers never pull an ended source again.
class SampleSource {
public:
    virtual ~SampleSource() = default;
    virtual std::optional<double> next_sample() = 0;
};

// Reads one number from a file on every pull, multiplied by `scale`.
// The Raspberry Pi SoC temperature is exposed in millidegrees, hence the
// default scale.
class FileInput : public SampleSource {
public:
    explicit FileInput(std::string path = "/sys/class/thermal/thermal_zone0/temp", double scale = 0.001,
                       Logger logger = get_logger("FileInput"));

    std::optional<double> next_sample() override;

private:
    std::string path_;
    double scale_ = 0.001;
    Logger logger_;
};

// Runs a shell command on every pull and parses the first token of its
// standard output.
class CommandInput : public SampleSource {
public:
    explicit CommandInput(std::string command, double scale = 1.0, Logger logger = get_logger("CommandInput"));

    std::optional<double> next_sample() override;

private:
    std::string command_;
    double scale_ = 1.0;
    Logger logger_;
};

class ReplayInput : public SampleSource {
public:
    explicit ReplayInput(std::vector<double> values);

    std::optional<double> next_sample() override;
    std::size_t remaining() const;

private:
    std::vector<double> values_;
    std::size_t position_ = 0;
};

std::optional<double> parse_sample(const std::string& text, double scale);

std::unique_ptr<SampleSource> make_input(const InputSpec& spec);

}  // namespace fand

#endif  // FAND_INPUTS_HPP
