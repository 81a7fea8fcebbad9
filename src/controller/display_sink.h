#pragma once

// ==============================================================================
// IDisplaySink - Interface for the Display Collaborator
// ==============================================================================
// Receives everything ReactiveController publishes. A plotting front end,
// the console driver and the test recorder all implement it.
//
// Calls arrive synchronously from inside event handling. Implementations may
// read the controller but must not send it new events from inside these
// callbacks; such events are refused with Status::Busy.
// ==============================================================================

#include "controller/controller_events.h"

#include <harmonia/dsp/systems/signal_pipeline.h>

#include <span>

namespace Harmonia {

class IDisplaySink {
public:
    virtual ~IDisplaySink() = default;

    /// @brief A recompute finished; show the new series.
    /// @param time Sample instants (same length as every series of `frame`)
    /// @param frame The new frame; valid until the next publication
    virtual void onFramePublished(std::span<const double> time,
                                  const DSP::SignalFrame& frame) = 0;

    /// @brief A series was shown or hidden. Sample data is unchanged.
    virtual void onVisibilityChanged(const VisibilityChange& change) = 0;
};

} // namespace Harmonia
