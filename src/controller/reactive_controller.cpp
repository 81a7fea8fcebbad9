// ==============================================================================
// ReactiveController Implementation
// ==============================================================================

#include "controller/reactive_controller.h"

#include "logging/log.h"

#include <harmonia/dsp/primitives/time_base.h>

#include <sstream>
#include <type_traits>
#include <utility>
#include <variant>

namespace Harmonia {

namespace {

constexpr std::string_view kLogTag = "controller";

DSP::SignalPipeline makePipeline(const AppConfig& config) {
    if (config.seed) {
        return DSP::SignalPipeline(*config.seed, config.edgePolicy);
    }
    DSP::SignalPipeline pipeline;
    pipeline.setEdgePolicy(config.edgePolicy);
    return pipeline;
}

} // anonymous namespace

ReactiveController::ReactiveController(const AppConfig& config, IDisplaySink& display)
    : display_(display)
    , store_(config.rangePolicy)
    , pipeline_(makePipeline(config))
    , timeBase_(DSP::TimeBase::generate(config.timeStart, config.timeStop, config.sampleCount))
{
    std::ostringstream message;
    message << "time base " << config.timeStart << ".." << config.timeStop << " ("
            << timeBase_.size() << " samples), noise seed "
            << pipeline_.noiseSource().seed() << ", policy " << toString(config.rangePolicy)
            << ", edges " << toString(config.edgePolicy);
    Log::debug(kLogTag, message.str());
}

bool ReactiveController::isVisible(Series series) const noexcept {
    return visible_[static_cast<size_t>(series)];
}

// =============================================================================
// Event handlers
// =============================================================================

DSP::Status ReactiveController::start() {
    if (const DSP::Status status = refuseIfBusy("start"); status != DSP::Status::Ok) {
        return status;
    }
    EventScope event(inEvent_);
    return recomputeAndPublish(store_.get(), "startup");
}

DSP::Status ReactiveController::dispatch(const ControllerEvent& event) {
    return std::visit(
        [this](const auto& e) -> DSP::Status {
            using Event = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<Event, ParameterChangeEvent>) {
                return onParameterChange(e.name, e.value);
            } else if constexpr (std::is_same_v<Event, ResetEvent>) {
                return onReset();
            } else {
                return onVisibilityToggle(e.series);
            }
        },
        event);
}

DSP::Status ReactiveController::onParameterChange(std::string_view name, double value) {
    if (const DSP::Status status = refuseIfBusy("parameter-change"); status != DSP::Status::Ok) {
        return status;
    }
    EventScope event(inEvent_);

    const DSP::SignalParameters snapshot = store_.get();
    if (const DSP::Status status = store_.set(name, value); status != DSP::Status::Ok) {
        std::ostringstream message;
        message << "parameter-change " << name << "=" << value << " refused";
        return fail(status, message.str());
    }

    if (store_.get() == snapshot) {
        Log::debug(kLogTag, "parameter-change " + std::string(name) + " left values unchanged");
    }

    return recomputeAndPublish(snapshot, name);
}

DSP::Status ReactiveController::onReset() {
    if (const DSP::Status status = refuseIfBusy("reset"); status != DSP::Status::Ok) {
        return status;
    }
    EventScope event(inEvent_);

    const DSP::SignalParameters snapshot = store_.get();
    store_.reset();
    Log::info(kLogTag, "parameters reset to defaults");
    return recomputeAndPublish(snapshot, "reset");
}

DSP::Status ReactiveController::onVisibilityToggle(std::string_view series) {
    if (const DSP::Status status = refuseIfBusy("visibility-toggle"); status != DSP::Status::Ok) {
        return status;
    }
    EventScope event(inEvent_);

    const auto target = findSeries(series);
    if (!target) {
        return fail(DSP::Status::InvalidParameter,
                    "visibility-toggle: unknown series '" + std::string(series) + "'");
    }

    bool& flag = visible_[static_cast<size_t>(*target)];
    flag = !flag;

    display_.onVisibilityChanged(VisibilityChange{*target, flag});
    Log::debug(kLogTag, std::string(seriesName(*target)) + (flag ? " shown" : " hidden"));
    succeed();
    return DSP::Status::Ok;
}

// =============================================================================
// Internals
// =============================================================================

DSP::Status ReactiveController::recomputeAndPublish(const DSP::SignalParameters& rollback,
                                                    std::string_view cause) {
    RecomputeScope scope(state_);

    if (const DSP::Status status = pipeline_.recompute(store_.get(), timeBase_);
        status != DSP::Status::Ok) {
        store_.restore(rollback);
        return fail(status, "recompute after " + std::string(cause) + " failed");
    }

    const DSP::SignalFrame& published = pipeline_.frame();
    display_.onFramePublished(timeBase_, published);

    std::ostringstream message;
    message << "frame " << published.generation << " published (" << cause
            << "), rms noisy-pure " << DSP::rmsDifference(published.noisy, published.pure)
            << ", filtered-pure " << DSP::rmsDifference(published.filtered, published.pure);
    Log::debug(kLogTag, message.str());

    succeed();
    return DSP::Status::Ok;
}

DSP::Status ReactiveController::refuseIfBusy(std::string_view eventName) {
    if (!inEvent_) {
        return DSP::Status::Ok;
    }
    return fail(DSP::Status::Busy,
                std::string(eventName) + " refused: another event is in progress");
}

DSP::Status ReactiveController::fail(DSP::Status status, std::string message) {
    Log::warn(kLogTag, message + " (" + std::string(DSP::toString(status)) + ")");
    lastError_ = std::move(message);
    return status;
}

} // namespace Harmonia
