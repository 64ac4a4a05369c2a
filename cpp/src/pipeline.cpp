#include "fand/pipeline.hpp"

#include <stdexcept>

namespace fand {

namespace {

struct StageFactory {
    std::optional<MonitorHandle> monitor;

    std::unique_ptr<Stage> operator()(const IdentitySpec&) const {
        return std::make_unique<IdentityStage>(monitor);
    }
    std::unique_ptr<Stage> operator()(const AverageSpec& spec) const {
        return std::make_unique<AverageStage>(spec, monitor);
    }
    std::unique_ptr<Stage> operator()(const PidSpec& spec) const {
        return std::make_unique<PidStage>(spec, monitor);
    }
    std::unique_ptr<Stage> operator()(const DampenedOscillatorSpec& spec) const {
        return std::make_unique<DampenedOscillatorStage>(spec, monitor);
    }
    std::unique_ptr<Stage> operator()(const ClipSpec& spec) const {
        return std::make_unique<ClipStage>(spec, monitor);
    }
    std::unique_ptr<Stage> operator()(const AtLeastSpec& spec) const {
        return std::make_unique<AtLeastStage>(spec, monitor);
    }
    std::unique_ptr<Stage> operator()(const SupersampleSpec& spec) const {
        return std::make_unique<SupersampleStage>(spec, monitor);
    }
    std::unique_ptr<Stage> operator()(const SubsampleSpec& spec) const {
        return std::make_unique<SubsampleStage>(spec, monitor);
    }
};

}  // namespace

Pipeline::Cursor::Cursor(Pipeline& owner, std::size_t position) : owner_(&owner), position_(position) {}

std::optional<double> Pipeline::Cursor::next_sample() {
    if (exhausted_) {
        return std::nullopt;
    }
    auto value = owner_->pull(position_);
    if (!value.has_value()) {
        exhausted_ = true;
    }
    return value;
}

bool Pipeline::Cursor::exhausted() const {
    return exhausted_;
}

Pipeline::Pipeline(std::unique_ptr<SampleSource> source, std::vector<std::unique_ptr<Stage>> stages)
    : source_(std::move(source)), stages_(std::move(stages)) {
    if (!source_) {
        throw std::invalid_argument("pipeline requires a source");
    }
    cursors_.reserve(stages_.size() + 1);
    for (std::size_t position = 0; position <= stages_.size(); ++position) {
        cursors_.emplace_back(*this, position);
    }
}

std::optional<double> Pipeline::pull(std::size_t position) {
    if (position == 0) {
        return source_->next_sample();
    }
    return stages_[position - 1]->next(cursors_[position - 1]);
}

std::optional<double> Pipeline::next_sample() {
    return cursors_.back().next_sample();
}

std::size_t Pipeline::size() const {
    return stages_.size();
}

const Stage& Pipeline::stage(std::size_t index) const {
    return *stages_.at(index);
}

bool Pipeline::exhausted() const {
    return cursors_.back().exhausted();
}

std::unique_ptr<Stage> make_stage(const StageSpec& spec, std::optional<MonitorHandle> monitor) {
    return std::visit(StageFactory{std::move(monitor)}, spec);
}

std::unique_ptr<Pipeline> assemble_pipeline(const std::vector<StageSpec>& specs,
                                            std::unique_ptr<SampleSource> source,
                                            std::shared_ptr<MessageChannel> channel, Logger logger) {
    for (std::size_t index = 0; index < specs.size(); ++index) {
        try {
            validate_stage_spec(specs[index]);
        } catch (const ConfigError& exc) {
            throw ConfigError("stage " + std::to_string(index) + ": " + exc.what());
        }
    }

    std::vector<std::unique_ptr<Stage>> stages;
    stages.reserve(specs.size());
    for (std::size_t index = 0; index < specs.size(); ++index) {
        const auto& spec = specs[index];
        if (const auto* oscillator = std::get_if<DampenedOscillatorSpec>(&spec)) {
            if (oscillator->damping.has_value()) {
                logger.warn("damping_ignored", {{"stage", std::to_string(index)}});
            }
        }
        std::optional<MonitorHandle> monitor;
        if (channel) {
            monitor.emplace(index, channel);
        }
        stages.push_back(make_stage(spec, std::move(monitor)));
        logger.debug("stage_assembled", {{"stage", std::to_string(index)}, {"kind", stage_kind(spec)}});
    }

    logger.info("pipeline_assembled", {{"stages", std::to_string(stages.size())},
                                       {"monitored", channel ? "true" : "false"}});
    return std::make_unique<Pipeline>(std::move(source), std::move(stages));
}

}  // namespace fand
