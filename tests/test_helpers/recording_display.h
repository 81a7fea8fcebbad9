#pragma once

// =============================================================================
// Recording IDisplaySink for Controller Testing
// =============================================================================
// Keeps a copy of every publication and visibility notice, and can run a
// hook from inside a callback to exercise re-entrant events.
// =============================================================================

#include "controller/display_sink.h"

#include <functional>
#include <span>
#include <vector>

namespace Harmonia {
namespace Testing {

class RecordingDisplay final : public IDisplaySink {
public:
    // Recorded publications
    std::vector<DSP::SignalFrame> frames_;
    std::vector<double> lastTime_;
    std::vector<VisibilityChange> visibilityChanges_;

    // Runs inside onFramePublished / onVisibilityChanged when set
    std::function<void()> onPublishHook_;
    std::function<void()> onVisibilityHook_;

    void onFramePublished(std::span<const double> time,
                          const DSP::SignalFrame& frame) override {
        lastTime_.assign(time.begin(), time.end());
        frames_.push_back(frame);
        if (onPublishHook_) onPublishHook_();
    }

    void onVisibilityChanged(const VisibilityChange& change) override {
        visibilityChanges_.push_back(change);
        if (onVisibilityHook_) onVisibilityHook_();
    }

    [[nodiscard]] size_t publishCount() const { return frames_.size(); }
    [[nodiscard]] const DSP::SignalFrame& lastFrame() const { return frames_.back(); }
};

} // namespace Testing
} // namespace Harmonia
