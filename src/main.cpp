#include <format>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string_view>
#include <vector>

#include "App/Dispatcher.h"
#include "Helper/File.h"
#include "Replay/ActionLog.h"
#include "Replay/Preferences.h"

#include "Core/Log.h"

// Print each event as a JSON line.
struct EventPrinter : EventListener<Event::Any> {
    void OnEvent(const Event::Any &event) override { std::cout << json(event).dump() << '\n'; }
};

static int Usage() {
    std::cerr << "Usage: cadence_replay [--preferences FILE] [--verbose] [--output FILE] ACTIONS_FILE\n";
    return 1;
}

int main(int argc, char **argv) {
    const std::vector<std::string_view> args(argv + 1, argv + argc);

    fs::path preferences_path = Preferences::DefaultPath;
    std::optional<fs::path> actions_path, output_path;
    bool verbose = false;
    for (size_t i = 0; i < args.size(); ++i) {
        const auto arg = args[i];
        if (arg == "--verbose") verbose = true;
        else if (arg == "--preferences" || arg == "--output") {
            if (i + 1 == args.size()) return Usage();
            const auto path = fs::path{args[++i]};
            if (arg == "--preferences") preferences_path = path;
            else output_path = path;
        } else if (arg.starts_with("--") || actions_path) {
            return Usage();
        } else {
            actions_path = fs::path{arg};
        }
    }
    if (!actions_path) return Usage();

    const auto preferences = Preferences::Load(preferences_path);
    Logger.SetLevel(verbose ? LogLevel::Debug : preferences.LogLevel);
    Logger.SetEcho(verbose || preferences.EchoLog);

    Dispatcher dispatcher{preferences.GetDispatcherConfig()};
    EventPrinter printer;
    dispatcher.AddListener(&printer);

    try {
        for (auto &action : ParseActionLog(FileIO::read(*actions_path))) {
            if (!dispatcher.Q(std::move(action))) throw std::runtime_error{"Action queue is full"};
        }
    } catch (const std::runtime_error &e) {
        std::cerr << std::format("{}: {}\n", actions_path->string(), e.what());
        return 1;
    }
    dispatcher.ApplyQueuedActions();

    if (output_path) {
        json history = json::array();
        for (const auto &record : dispatcher.GetHistory()) history.push_back(record);
        const json output{{"History", std::move(history)}, {"Log", Logger.ToJson()}};
        if (!FileIO::write(*output_path, output.dump(2))) {
            std::cerr << std::format("Failed to write {}\n", output_path->string());
            return 1;
        }
    }
    return 0;
}
