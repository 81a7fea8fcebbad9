#pragma once

// ==============================================================================
// ReactiveController - Event-Driven Recompute Loop
// ==============================================================================
// Turns UI events into parameter updates, recomputes and publications.
//
// States:
//   Idle --parameter-change--> Recomputing --> Idle   (set, recompute, publish)
//   Idle --reset-------------> Recomputing --> Idle   (reset, recompute, publish)
//   Idle --visibility-toggle-> Idle                   (forward to display only)
//
// Every event runs to completion before the next one is accepted. An event
// delivered while another is still being handled (a display calling back
// from inside a publication) is refused with Status::Busy.
//
// A failed event leaves the parameters and the published frame exactly as
// they were; the reason is returned as a Status and kept in lastError().
// ==============================================================================

#include "config/app_config.h"
#include "controller/controller_events.h"
#include "controller/display_sink.h"
#include "parameters/parameter_store.h"

#include <harmonia/dsp/core/sample_sequence.h>
#include <harmonia/dsp/core/signal_parameters.h>
#include <harmonia/dsp/core/status.h>
#include <harmonia/dsp/systems/signal_pipeline.h>

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace Harmonia {

enum class ControllerState : uint8_t {
    Idle = 0,
    Recomputing
};

class ReactiveController {
public:
    /// @param config Validated startup configuration
    /// @param display Collaborator that receives publications; must outlive the controller
    ReactiveController(const AppConfig& config, IDisplaySink& display);

    ReactiveController(const ReactiveController&) = delete;
    ReactiveController& operator=(const ReactiveController&) = delete;

    // =========================================================================
    // Events
    // =========================================================================

    /// @brief Startup recompute and first publication.
    [[nodiscard]] DSP::Status start();

    /// @brief Route any event to its handler.
    [[nodiscard]] DSP::Status dispatch(const ControllerEvent& event);

    [[nodiscard]] DSP::Status onParameterChange(std::string_view name, double value);
    [[nodiscard]] DSP::Status onReset();
    [[nodiscard]] DSP::Status onVisibilityToggle(std::string_view series);

    // =========================================================================
    // Queries
    // =========================================================================

    [[nodiscard]] ControllerState state() const noexcept { return state_; }
    [[nodiscard]] const DSP::SignalParameters& parameters() const noexcept { return store_.get(); }
    [[nodiscard]] const ParameterStore& store() const noexcept { return store_; }
    [[nodiscard]] const DSP::SignalFrame& frame() const noexcept { return pipeline_.frame(); }
    [[nodiscard]] std::span<const double> timeBase() const noexcept { return timeBase_; }
    [[nodiscard]] bool isVisible(Series series) const noexcept;

    /// @brief Reason for the most recent failed event; empty after a success.
    [[nodiscard]] const std::string& lastError() const noexcept { return lastError_; }

    /// @brief Generator access for test harnesses that reseed mid-run.
    [[nodiscard]] DSP::NoiseSource& noiseSource() noexcept { return pipeline_.noiseSource(); }

private:
    /// Marks the controller Recomputing for the lifetime of the scope.
    class RecomputeScope {
    public:
        explicit RecomputeScope(ControllerState& state) noexcept : state_(state) {
            state_ = ControllerState::Recomputing;
        }
        ~RecomputeScope() { state_ = ControllerState::Idle; }

        RecomputeScope(const RecomputeScope&) = delete;
        RecomputeScope& operator=(const RecomputeScope&) = delete;

    private:
        ControllerState& state_;
    };

    /// Marks an event as in flight so nested events from display callbacks are refused.
    class EventScope {
    public:
        explicit EventScope(bool& inEvent) noexcept : inEvent_(inEvent) { inEvent_ = true; }
        ~EventScope() { inEvent_ = false; }

        EventScope(const EventScope&) = delete;
        EventScope& operator=(const EventScope&) = delete;

    private:
        bool& inEvent_;
    };

    [[nodiscard]] DSP::Status recomputeAndPublish(const DSP::SignalParameters& rollback,
                                                  std::string_view cause);
    [[nodiscard]] DSP::Status refuseIfBusy(std::string_view eventName);
    DSP::Status fail(DSP::Status status, std::string message);
    void succeed() noexcept { lastError_.clear(); }

    IDisplaySink& display_;
    ParameterStore store_;
    DSP::SignalPipeline pipeline_;
    DSP::SampleSequence timeBase_;
    std::array<bool, kNumSeries> visible_{true, true, true};
    ControllerState state_ = ControllerState::Idle;
    bool inEvent_ = false;
    std::string lastError_;
};

} // namespace Harmonia
