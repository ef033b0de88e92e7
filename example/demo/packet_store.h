// packet_store.h - State, actions and reducer for the lens transform example
//
// The reducer is written entirely with optics lenses and transforms. Every
// action that changes the state first records a Snapshot, so Undo restores
// both the packet and the sample list.

#pragma once

#include <optics/optics.h>

#include <immer/vector.hpp>

#include <cstddef>
#include <cstdint>
#include <iostream>
#include <string>
#include <type_traits>
#include <variant>

namespace packet_store {

// ============================================================
// Application State
// ============================================================

struct Header
{
    uint16_t version;
    uint32_t count;
    bool compressed;
};

struct Packet
{
    Header header;
    std::string payload;
};

/// Everything Undo restores
struct Snapshot
{
    Packet packet;
    immer::vector<uint32_t> samples;
};

struct AppState
{
    Packet packet;
    immer::vector<uint32_t> samples;
    immer::vector<Snapshot> history;
};

struct HeaderLenses
{
    static constexpr auto version    = optics::member_lens<&Header::version>(0);
    static constexpr auto count      = optics::member_lens<&Header::count>(1);
    static constexpr auto compressed = optics::member_lens<&Header::compressed>(2);
};

struct PacketLenses
{
    static constexpr auto header  = optics::member_lens<&Packet::header>(0);
    static constexpr auto payload = optics::member_lens<&Packet::payload>(1);
};

struct AppStateLenses
{
    static constexpr auto packet  = optics::member_lens<&AppState::packet>(0);
    static constexpr auto samples = optics::member_lens<&AppState::samples>(1);
    static constexpr auto history = optics::member_lens<&AppState::history>(2);
};

inline const auto count_lens =
    optics::compose(AppStateLenses::packet, PacketLenses::header, HeaderLenses::count);
inline const auto compressed_lens =
    optics::compose(AppStateLenses::packet, PacketLenses::header, HeaderLenses::compressed);
inline const auto payload_lens = optics::compose(AppStateLenses::packet, PacketLenses::payload);

inline AppState initial_state()
{
    return AppState{
        .packet  = Packet{Header{1, 0, false}, "hello"},
        .samples = immer::vector<uint32_t>{10, 20, 30},
        .history = immer::vector<Snapshot>{}
    };
}

// ============================================================
// Actions
// ============================================================

struct Increment {};
struct Decrement {};
struct ToggleCompression {};
struct Scale { uint32_t factor; };
struct SetPayload { std::string text; };
struct SetSample { std::size_t index; uint32_t value; };
struct Undo {};

using Action = std::variant<Increment, Decrement, ToggleCompression, Scale, SetPayload, SetSample, Undo>;

// ============================================================
// Reducer
// ============================================================

/// Push the undoable part of `state` onto its history
inline AppState record(AppState state)
{
    state.history = state.history.push_back(Snapshot{state.packet, state.samples});
    return state;
}

inline AppState reducer(AppState state, Action action)
{
    return std::visit(
        [&](auto&& act) -> AppState {
            using T = std::decay_t<decltype(act)>;

            if constexpr (std::is_same_v<T, Increment>) {
                return count_lens.increment_tx().apply(record(std::move(state)));

            } else if constexpr (std::is_same_v<T, Decrement>) {
                if (count_lens.get(state) == 0)
                    return state;
                return count_lens.decrement_tx().apply(record(std::move(state)));

            } else if constexpr (std::is_same_v<T, ToggleCompression>) {
                return compressed_lens.not_tx().apply(record(std::move(state)));

            } else if constexpr (std::is_same_v<T, Scale>) {
                auto factor = act.factor;
                return count_lens.mod_tx([factor](uint32_t c) { return c * factor; })
                    .apply(record(std::move(state)));

            } else if constexpr (std::is_same_v<T, SetPayload>) {
                return payload_lens.set(record(std::move(state)), act.text);

            } else if constexpr (std::is_same_v<T, SetSample>) {
                auto lens   = optics::compose(AppStateLenses::samples,
                                              optics::immer_index_lens<uint32_t>(act.index));
                auto result = optics::try_set(lens, record(state), act.value);
                if (!result) {
                    std::cerr << "[Demo] SetSample failed: " << result.error_message << "\n";
                    return state;
                }
                return result.get();

            } else if constexpr (std::is_same_v<T, Undo>) {
                if (state.history.empty())
                    return state;
                const auto& previous = state.history.back();
                auto new_state    = state;
                new_state.packet  = previous.packet;
                new_state.samples = previous.samples;
                new_state.history = state.history.take(state.history.size() - 1);
                return new_state;
            }

            return state;
        },
        action);
}

} // namespace packet_store
