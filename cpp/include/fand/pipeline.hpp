#ifndef FAND_PIPELINE_HPP
#define FAND_PIPELINE_HPP

#include <cstddef>
#include <memory>
#include <optional>
#include <vector>

#include "fand/inputs.hpp"
#include "fand/logging.hpp"
#include "fand/monitor.hpp"
#include "fand/stage_spec.hpp"
#include "fand/stages.hpp"

namespace fand {

// A linear chain sensor -> stage 0 -> ... -> stage n-1, stored as a flat
// array. Each stage pulls through a fused cursor onto its predecessor, so
// pulling the pipeline drives exactly as much upstream work as the stages
// ask for. The pipeline is itself a SampleSource.
class Pipeline : public SampleSource {
public:
    Pipeline(std::unique_ptr<SampleSource> source, std::vector<std::unique_ptr<Stage>> stages);

    Pipeline(const Pipeline&) = delete;
    Pipeline& operator=(const Pipeline&) = delete;
    Pipeline(Pipeline&&) = delete;
    Pipeline& operator=(Pipeline&&) = delete;

    std::optional<double> next_sample() override;

    std::size_t size() const;
    const Stage& stage(std::size_t index) const;
    bool exhausted() const;

private:
    // Cursor k yields the output of position k-1; cursor 0 is the sensor.
    class Cursor : public SampleSource {
    public:
        Cursor(Pipeline& owner, std::size_t position);

        std::optional<double> next_sample() override;
        bool exhausted() const;

    private:
        Pipeline* owner_;
        std::size_t position_;
        bool exhausted_ = false;
    };

    std::optional<double> pull(std::size_t position);

    std::unique_ptr<SampleSource> source_;
    std::vector<std::unique_ptr<Stage>> stages_;
    std::vector<Cursor> cursors_;
};

std::unique_ptr<Stage> make_stage(const StageSpec& spec, std::optional<MonitorHandle> monitor = std::nullopt);

// Wraps `source` with one stage per spec, in order. A null channel builds an
// unmonitored pipeline; otherwise stage i publishes under index i. Invalid
// specs throw ConfigError before any stage is built.
std::unique_ptr<Pipeline> assemble_pipeline(const std::vector<StageSpec>& specs,
                                            std::unique_ptr<SampleSource> source,
                                            std::shared_ptr<MessageChannel> channel = nullptr,
                                            Logger logger = get_logger("Pipeline"));

}  // namespace fand

#endif  // FAND_PIPELINE_HPP
