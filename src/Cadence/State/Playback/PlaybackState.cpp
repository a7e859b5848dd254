#include "PlaybackState.h"

#include <algorithm>

#include "Helper/Variant.h"

using std::vector;

namespace Events = Event::Playback;

vector<PlaybackState::EventType> PlaybackState::Apply(const ActionType &action) {
    return std::visit(
        Match{
            [this](const Action::Playback::Play &) -> vector<EventType> {
                if (!Position || Playing) return {};
                Playing = true;
                return {Events::PlaybackResumed{}};
            },
            [this](const Action::Playback::Pause &) -> vector<EventType> {
                if (!Playing) return {};
                Playing = false;
                return {Events::PlaybackPaused{}};
            },
            [this](const Action::Playback::TogglePlay &) {
                return Playing ? Apply(Action::Playback::Pause{}) : Apply(Action::Playback::Play{});
            },
            [this](const Action::Playback::Stop &) -> vector<EventType> {
                if (!Position) return {};
                Position.reset();
                Playing = false;
                SeekPositionMs = 0;
                return {Events::PlaybackStopped{}};
            },
            [this](const Action::Playback::Next &) -> vector<EventType> {
                if (!Position) return {};
                if (Repeat == RepeatMode::Song) return SetPosition(*Position);
                if (*Position + 1 < Songs.size()) return SetPosition(*Position + 1);
                if (Repeat == RepeatMode::Playlist) return SetPosition(0);
                return {};
            },
            [this](const Action::Playback::Previous &) -> vector<EventType> {
                if (!Position) return {};
                if (Repeat == RepeatMode::Song) return SetPosition(*Position);
                if (*Position > 0) return SetPosition(*Position - 1);
                if (Repeat == RepeatMode::Playlist) return SetPosition(Songs.size() - 1);
                return {};
            },
            [this](const Action::Playback::ToggleRepeat &) -> vector<EventType> {
                switch (Repeat) {
                    case RepeatMode::None: Repeat = RepeatMode::Song; break;
                    case RepeatMode::Song: Repeat = RepeatMode::Playlist; break;
                    case RepeatMode::Playlist: Repeat = RepeatMode::None; break;
                }
                return {Events::RepeatModeChanged{Repeat}};
            },
            [this](const Action::Playback::Seek &a) -> vector<EventType> {
                if (!Position) return {};
                SeekPositionMs = a.position_ms;
                return {Events::TrackSeeked{a.position_ms}};
            },
            [this](const Action::Playback::SetVolume &a) -> vector<EventType> {
                Volume = std::clamp(a.value, 0.0, 1.0);
                return {Events::VolumeSet{Volume}};
            },
            [this](const Action::Playback::LoadSongs &a) -> vector<EventType> {
                Songs = a.songs;
                Position.reset();
                Playing = false;
                SeekPositionMs = 0;
                return {Events::PlaylistChanged{}};
            },
            [this](const Action::Playback::PlaySong &a) -> vector<EventType> {
                const auto index = IndexOf(a.id);
                if (!index) return {};

                auto events = SetPosition(*index);
                if (!Playing) {
                    Playing = true;
                    events.emplace_back(Events::PlaybackResumed{});
                }
                return events;
            },
            [this](const Action::Playback::Queue &a) -> vector<EventType> {
                Queue(a.songs);
                return {Events::PlaylistChanged{}};
            },
            [this](const Action::Playback::Dequeue &a) -> vector<EventType> {
                Dequeue(a.ids);
                return {Events::PlaylistChanged{}};
            },
        },
        action
    );
}

std::optional<Count> PlaybackState::IndexOf(const std::string &id) const {
    const auto it = std::ranges::find(Songs, id, &SongDescription::Id);
    if (it == Songs.end()) return {};
    return Count(std::distance(Songs.begin(), it));
}

void PlaybackState::Queue(const vector<SongDescription> &songs) {
    for (const auto &song : songs) {
        if (!IndexOf(song.Id)) Songs.push_back(song);
    }
}

void PlaybackState::Dequeue(const vector<std::string> &ids) {
    const std::optional<std::string> current_id = Position ? std::optional{Songs[*Position].Id} : std::nullopt;
    std::erase_if(Songs, [&ids](const auto &song) { return std::ranges::find(ids, song.Id) != ids.end(); });

    if (!current_id) return;

    Position = IndexOf(*current_id);
    if (!Position) {
        Playing = false;
        SeekPositionMs = 0;
    }
}

std::optional<Count> PlaybackState::MoveUp(const std::string &id) {
    const auto index = IndexOf(id);
    if (!index || *index == 0) return {};
    return Swap(*index, *index - 1);
}

std::optional<Count> PlaybackState::MoveDown(const std::string &id) {
    const auto index = IndexOf(id);
    if (!index || *index + 1 >= Songs.size()) return {};
    return Swap(*index, *index + 1);
}

std::optional<Count> PlaybackState::Swap(Count from, Count to) {
    std::swap(Songs[from], Songs[to]);
    if (Position == from) Position = to;
    else if (Position == to) Position = from;
    return to;
}

vector<PlaybackState::EventType> PlaybackState::SetPosition(Count index) {
    Position = index;
    SeekPositionMs = 0;
    return {Events::TrackChanged{Songs[index].Id}};
}
