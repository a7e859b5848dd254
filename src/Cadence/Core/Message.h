#pragma once

#include <concepts>
#include <format>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>

#include "Core/Json.h"
#include "Helper/Path.h"
#include "Helper/Variant.h"

/**
Actions and events are both "messages": plain structs with static `Metadata`, grouped into `MessageVariant`s, which wrap
around `std::variant`.
Groups are in turn held by a `MessageGroup`, so any message is a two-level sum: the outer level says which group
(substate, or cross-cutting concern) it belongs to, and the inner level is the concrete type.
This keeps every `std::visit` over one level bounded to the size of a single group.

Messages serialize as two-element arrays, `[TypePath, Data]`, where `Data` is `null` for messages without fields.
*/
struct Metadata {
    Metadata(std::string_view type_path, std::string_view path_leaf);

    const std::string PathLeaf; // E.g. "TogglePlay"
    const TypePath Path; // E.g. "Playback/TogglePlay"
    const std::string Name; // Human-readable name, derived as `PascalToSentenceCase(PathLeaf)`.
};

template<typename T>
concept IsMessage = requires() {
    { T::_Meta } -> std::same_as<const Metadata &>;
};

template<IsMessage... T> struct MessageVariant : std::variant<T...> {
    using variant_t = std::variant<T...>; // Alias to the base variant type.
    using variant_t::variant; // Inherit the base variant's constructors.

    template<size_t I = 0> static auto CreatePathToIndex() {
        if constexpr (I < std::variant_size_v<variant_t>) {
            using MemberType = std::variant_alternative_t<I, variant_t>;
            auto map = CreatePathToIndex<I + 1>();
            map[MemberType::_Meta.Path] = I;
            return map;
        }
        return std::unordered_map<TypePath, size_t, PathHash>{};
    }

    static const auto &PathToIndex() {
        static const auto path_to_index = CreatePathToIndex();
        return path_to_index;
    }

    static bool Contains(const TypePath &path) { return PathToIndex().contains(path); }

    const TypePath &GetPath() const {
        return Call([](const auto &m) -> const TypePath & { return m._Meta.Path; });
    }
    const std::string &GetName() const {
        return Call([](const auto &m) -> const std::string & { return m._Meta.Name; });
    }

    // Construct a variant from its index and JSON representation.
    // Adapted for JSON from the default-ctor approach here: https://stackoverflow.com/a/60567091/780425
    template<size_t I = 0> static MessageVariant Create(size_t index, const json &j) {
        if constexpr (I >= std::variant_size_v<variant_t>) throw std::runtime_error{std::format("Variant index {} out of bounds", I + index)};
        else return index == 0 ? MessageVariant{j.get<std::variant_alternative_t<I, variant_t>>()} : Create<I + 1>(index - 1, j);
    }

    void to_json(json &j) const {
        Call([&j](const auto &m) { j = {m._Meta.Path, m}; });
    }
    static void from_json(const json &j, MessageVariant &value) {
        const auto path = j.at(0).get<TypePath>();
        const auto &path_to_index = PathToIndex();
        const auto it = path_to_index.find(path);
        if (it == path_to_index.end()) throw std::runtime_error{std::format("Unknown message type: {}", path.string())};
        value = Create(it->second, j.at(1));
    }

private:
    // Call a function on the variant's active member type.
    template<typename Callable> decltype(auto) Call(Callable func) const {
        return std::visit([&func](const auto &m) -> decltype(auto) { return func(m); }, *this);
    }
};

/**
The outer level of a message: one alternative per `MessageVariant` group.
A concrete message converts implicitly to its group, and from there to the `MessageGroup`,
so `Action::Any action = Action::App::Start{};` works as expected.
*/
template<typename... Groups> struct MessageGroup : std::variant<Groups...> {
    using variant_t = std::variant<Groups...>;
    using variant_t::variant;

    static bool Contains(const TypePath &path) { return (Groups::Contains(path) || ...); }

    const TypePath &GetPath() const {
        return std::visit([](const auto &group) -> const TypePath & { return group.GetPath(); }, *this);
    }
    const std::string &GetName() const {
        return std::visit([](const auto &group) -> const std::string & { return group.GetName(); }, *this);
    }

    void to_json(json &j) const {
        std::visit([&j](const auto &group) { group.to_json(j); }, *this);
    }
    static void from_json(const json &j, MessageGroup &value) {
        const auto path = j.at(0).get<TypePath>();
        if (!FromJson<0>(path, j, value)) throw std::runtime_error{std::format("Unknown message type: {}", path.string())};
    }

private:
    template<size_t I> static bool FromJson(const TypePath &path, const json &j, MessageGroup &value) {
        if constexpr (I >= sizeof...(Groups)) return false;
        else {
            using GroupType = std::variant_alternative_t<I, variant_t>;
            if (!GroupType::Contains(path)) return FromJson<I + 1>(path, j, value);

            GroupType group;
            GroupType::from_json(j, group);
            value = std::move(group);
            return true;
        }
    }
};

namespace nlohmann {
template<typename... T> struct adl_serializer<MessageVariant<T...>> {
    static void to_json(json &j, const MessageVariant<T...> &value) { value.to_json(j); }
    static void from_json(const json &j, MessageVariant<T...> &value) { MessageVariant<T...>::from_json(j, value); }
};
template<typename... Groups> struct adl_serializer<MessageGroup<Groups...>> {
    static void to_json(json &j, const MessageGroup<Groups...> &value) { value.to_json(j); }
    static void from_json(const json &j, MessageGroup<Groups...> &value) { MessageGroup<Groups...>::from_json(j, value); }
};
} // namespace nlohmann
