#pragma once

// =============================================================================
// ConsoleDisplay - Text stand-in for the plotting front end
// =============================================================================
// Prints a one-line summary per published frame and keeps the latest frame
// so the console can dump it as CSV.
// =============================================================================

#include "controller/display_sink.h"

#include <harmonia/dsp/core/sample_sequence.h>

#include <array>
#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <span>

namespace Harmonia {
namespace Console {

class ConsoleDisplay final : public IDisplaySink {
public:
    explicit ConsoleDisplay(std::ostream& out) : out_(out) {}

    void onFramePublished(std::span<const double> time,
                          const DSP::SignalFrame& frame) override;
    void onVisibilityChanged(const VisibilityChange& change) override;

    /// @brief Write "t,pure,noisy,filtered" rows for the latest frame.
    /// @return false if nothing was published yet or the file cannot be written
    [[nodiscard]] bool writeCsv(const std::filesystem::path& path) const;

    [[nodiscard]] uint64_t lastGeneration() const noexcept { return frame_.generation; }

private:
    std::ostream& out_;
    DSP::SampleSequence time_;
    DSP::SignalFrame frame_;
    std::array<bool, kNumSeries> visible_{true, true, true};
};

} // namespace Console
} // namespace Harmonia
