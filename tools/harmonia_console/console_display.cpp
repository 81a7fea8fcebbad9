// =============================================================================
// ConsoleDisplay Implementation
// =============================================================================

#include "console_display.h"

#include <algorithm>
#include <fstream>
#include <iomanip>
#include <ostream>

namespace Harmonia {
namespace Console {

void ConsoleDisplay::onFramePublished(std::span<const double> time,
                                      const DSP::SignalFrame& frame) {
    time_.assign(time.begin(), time.end());
    frame_ = frame;

    out_ << "frame #" << frame.generation << ": " << frame.size() << " samples";
    if (!frame.pure.empty()) {
        const auto [lo, hi] = std::minmax_element(frame.noisy.begin(), frame.noisy.end());
        out_ << std::fixed << std::setprecision(4)
             << ", noisy range [" << *lo << ", " << *hi << "]";
    }
    if (visible_[static_cast<size_t>(Series::Noisy)]) {
        out_ << ", rms(noisy-pure)=" << DSP::rmsDifference(frame.noisy, frame.pure);
    }
    if (visible_[static_cast<size_t>(Series::Filtered)]) {
        out_ << ", rms(filtered-pure)=" << DSP::rmsDifference(frame.filtered, frame.pure);
    }
    out_ << std::defaultfloat << '\n';
}

void ConsoleDisplay::onVisibilityChanged(const VisibilityChange& change) {
    visible_[static_cast<size_t>(change.series)] = change.visible;
    out_ << change.seriesName() << (change.visible ? " shown" : " hidden") << '\n';
}

bool ConsoleDisplay::writeCsv(const std::filesystem::path& path) const {
    if (frame_.generation == 0) {
        return false;
    }

    std::ofstream file(path);
    if (!file) {
        return false;
    }

    file << "t,pure,noisy,filtered\n" << std::setprecision(17);
    for (size_t i = 0; i < time_.size() && i < frame_.size(); ++i) {
        file << time_[i] << ',' << frame_.pure[i] << ',' << frame_.noisy[i] << ','
             << frame_.filtered[i] << '\n';
    }
    return static_cast<bool>(file);
}

} // namespace Console
} // namespace Harmonia
