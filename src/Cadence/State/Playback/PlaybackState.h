#pragma once

#include <optional>
#include <string>
#include <vector>

#include "Core/Action/Actionable.h"
#include "PlaybackAction.h"
#include "PlaybackEvent.h"

/**
The play queue and transport state.
`Position` always indexes into `Songs` when set, and follows the song it points at as the queue is edited.
*/
struct PlaybackState : Actionable<Action::Playback::Any, Event::Playback::Any> {
    std::vector<EventType> Apply(const ActionType &) override;

    // Append songs that aren't already queued (by id), keeping their relative order.
    void Queue(const std::vector<SongDescription> &);
    // Remove every queued song with one of the given ids.
    void Dequeue(const std::vector<std::string> &ids);
    // Swap the song with its neighbour.
    // Returns the song's new index, or nothing if it isn't queued or is already at the boundary.
    std::optional<Count> MoveUp(const std::string &id);
    std::optional<Count> MoveDown(const std::string &id);

    const std::vector<SongDescription> &GetSongs() const { return Songs; }
    std::optional<Count> GetPosition() const { return Position; }
    const SongDescription *GetCurrentSong() const { return Position ? &Songs[*Position] : nullptr; }
    std::optional<Count> IndexOf(const std::string &id) const;

    bool IsPlaying() const { return Playing; }
    RepeatMode GetRepeatMode() const { return Repeat; }
    double GetVolume() const { return Volume; }
    u32 GetSeekPositionMs() const { return SeekPositionMs; }

private:
    std::vector<EventType> SetPosition(Count);
    std::optional<Count> Swap(Count, Count);

    std::vector<SongDescription> Songs{};
    std::optional<Count> Position{};
    bool Playing{false};
    RepeatMode Repeat{RepeatMode::None};
    double Volume{1.0};
    u32 SeekPositionMs{0};
};
