#include "ActionLog.h"

#include <format>
#include <stdexcept>

#include "Helper/String.h"

std::vector<Action::Any> ParseActionLog(std::string_view contents) {
    std::vector<Action::Any> actions;
    const auto lines = StringHelper::Split(contents, '\n');
    for (size_t i = 0; i < lines.size(); ++i) {
        auto line = lines[i];
        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
        const auto start = line.find_first_not_of(" \t");
        if (start == string_view::npos || line[start] == '#') continue;

        try {
            actions.emplace_back(json::parse(line).get<Action::Any>());
        } catch (const std::exception &e) {
            throw std::runtime_error{std::format("Line {}: {}", i + 1, e.what())};
        }
    }
    return actions;
}
