#include "SelectionState.h"

#include <algorithm>
#include <utility>

#include <range/v3/range/conversion.hpp>
#include <range/v3/view/transform.hpp>

#include "Helper/Variant.h"

using std::vector;

namespace views = ranges::views;
using ranges::to;

namespace Events = Event::Selection;

vector<SelectionState::EventType> SelectionState::Apply(const ActionType &action) {
    return std::visit(
        Match{
            [this](const Action::Selection::Select &a) -> vector<EventType> {
                if (!IsActive()) return {};

                vector<std::string> added;
                for (const auto &song : a.songs) {
                    if (IsSelected(song.Id)) continue;
                    Songs.push_back(song);
                    added.push_back(song.Id);
                }
                if (added.empty()) return {};
                return {Events::Selected{std::move(added)}};
            },
            [this](const Action::Selection::Deselect &a) -> vector<EventType> {
                vector<std::string> removed;
                std::erase_if(Songs, [&a, &removed](const auto &song) {
                    if (std::ranges::find(a.ids, song.Id) == a.ids.end()) return false;
                    removed.push_back(song.Id);
                    return true;
                });
                if (removed.empty()) return {};
                return {Events::Deselected{std::move(removed)}};
            },
            [this](const Action::Selection::Clear &) -> vector<EventType> {
                if (Songs.empty()) return {};
                auto ids = Songs | views::transform([](const auto &song) { return song.Id; }) | to<vector>();
                Songs.clear();
                return {Events::Deselected{std::move(ids)}};
            },
        },
        action
    );
}

bool SelectionState::IsSelected(const std::string &id) const {
    return std::ranges::find(Songs, id, &SongDescription::Id) != Songs.end();
}

vector<SongDescription> SelectionState::TakeSelection() {
    Context.reset();
    return std::exchange(Songs, {});
}

std::optional<bool> SelectionState::SetMode(std::optional<SelectionContext> context) {
    if (Context == context) return {};
    if (!context) {
        Context.reset();
        Songs.clear();
        return false;
    }
    if (Context) Songs.clear();
    Context = std::move(context);
    return true;
}
