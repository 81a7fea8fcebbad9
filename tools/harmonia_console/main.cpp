// ==============================================================================
// Harmonia Console
// ==============================================================================
// Line-oriented driver for ReactiveController. Each input line becomes one
// controller event; publications are summarised on stdout.
//
// Usage:
//   harmonia_console [--seed N] [--samples N] [--start X] [--stop X]
//                    [--policy reject|clamp] [--edge zero|truncate]
//                    [--log-level debug|info|warn|error|off]
// ==============================================================================

#include "console_display.h"

#include "config/app_config.h"
#include "controller/reactive_controller.h"
#include "logging/log.h"
#include "parameters/parameter_ids.h"
#include "version.h"

#include <charconv>
#include <functional>
#include <iostream>
#include <map>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace {

using Harmonia::DSP::Status;

constexpr std::string_view kLogTag = "console";

using Handler = std::function<void(const std::string& args)>;

void printParameters(const Harmonia::ReactiveController& controller) {
    for (const auto& range : Harmonia::kParamRanges) {
        std::cout << "  " << range.label << " (" << range.name
                  << ") = " << controller.store().value(range.id) << '\n';
    }
    for (size_t i = 0; i < Harmonia::kNumSeries; ++i) {
        const auto series = static_cast<Harmonia::Series>(i);
        std::cout << "  show " << Harmonia::seriesName(series) << " = "
                  << (controller.isVisible(series) ? "on" : "off") << '\n';
    }
}

void report(Status status, const Harmonia::ReactiveController& controller) {
    if (status != Status::Ok) {
        std::cout << "error: " << Harmonia::DSP::toString(status) << ": "
                  << controller.lastError() << '\n';
    }
}

bool parseValue(const std::string& text, double& value) {
    const char* const last = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(text.data(), last, value);
    return ec == std::errc{} && ptr == last;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    std::vector<std::string_view> args(argv + 1, argv + argc);

    Harmonia::AppConfig config;
    std::string error;
    if (Harmonia::parseConfigArgs(args, config, error) != Status::Ok) {
        std::cerr << "harmonia_console: " << error << std::endl;
        return 2;
    }
    Harmonia::Log::setMinLevel(config.logLevel);

    Harmonia::Console::ConsoleDisplay display(std::cout);
    Harmonia::ReactiveController controller(config, display);

    std::cout << HARMONIA_PRODUCT_NAME << " " << HARMONIA_VERSION_STR
              << " - type 'help' for commands" << std::endl;

    if (const Status status = controller.start(); status != Status::Ok) {
        report(status, controller);
        return 1;
    }

    bool running = true;
    std::map<std::string, Handler> handlers;

    handlers["set"] = [&](const std::string& rest) {
        std::istringstream iss(rest);
        std::string name;
        std::string valueText;
        double value = 0.0;
        if (!(iss >> name >> valueText) || !parseValue(valueText, value)) {
            std::cout << "usage: set <name> <value>" << std::endl;
            return;
        }
        report(controller.dispatch(Harmonia::ParameterChangeEvent{name, value}), controller);
    };

    handlers["reset"] = [&](const std::string&) {
        report(controller.dispatch(Harmonia::ResetEvent{}), controller);
    };

    handlers["toggle"] = [&](const std::string& rest) {
        report(controller.dispatch(Harmonia::VisibilityToggleEvent{rest}), controller);
    };

    handlers["show"] = [&](const std::string&) {
        printParameters(controller);
    };

    handlers["dump"] = [&](const std::string& rest) {
        if (rest.empty()) {
            std::cout << "usage: dump <path>" << std::endl;
            return;
        }
        if (!display.writeCsv(rest)) {
            std::cout << "error: could not write " << rest << std::endl;
            Harmonia::Log::warn(kLogTag, "CSV export to " + rest + " failed");
            return;
        }
        std::cout << "wrote frame #" << display.lastGeneration() << " to " << rest << std::endl;
    };

    handlers["quit"] = [&](const std::string&) {
        running = false;
    };

    handlers["help"] = [&](const std::string&) {
        std::cout << "commands:\n"
                  << "  set <name> <value>   amplitude, frequency, phase, noise_mean,\n"
                  << "                       noise_variance, filter_window\n"
                  << "  reset                restore default parameters\n"
                  << "  toggle <series>      pure, noisy or filtered\n"
                  << "  show                 print parameters and visibility\n"
                  << "  dump <path>          write the latest frame as CSV\n"
                  << "  quit" << std::endl;
    };

    std::string line;
    while (running && std::getline(std::cin, line)) {
        if (line.empty()) continue;

        std::istringstream iss(line);
        std::string command;
        std::string rest;
        iss >> command;
        std::getline(iss >> std::ws, rest);

        auto it = handlers.find(command);
        if (it != handlers.end()) {
            it->second(rest);
        } else {
            std::cout << "unknown command: " << command << std::endl;
        }
    }

    return 0;
}
