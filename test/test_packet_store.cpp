// test_packet_store.cpp - Tests for the example store reducer
// Actions built from lens transforms, and Undo over packet and samples

#include <catch2/catch_all.hpp>

#include "packet_store.h"

#include <cstdint>
#include <vector>

using namespace packet_store;

namespace {

std::vector<uint32_t> samples_of(const AppState& state)
{
    return {state.samples.begin(), state.samples.end()};
}

} // namespace

TEST_CASE("Packet store counter actions", "[demo][reducer]") {
    auto state = reducer(initial_state(), Increment{});
    state = reducer(state, Scale{5});
    REQUIRE(state.packet.header.count == 5);
    REQUIRE(state.history.size() == 2);

    state = reducer(state, Decrement{});
    REQUIRE(state.packet.header.count == 4);
}

TEST_CASE("Packet store sample edits are undoable", "[demo][undo]") {
    auto state = reducer(initial_state(), SetPayload{"edited"});
    state = reducer(state, SetSample{1, 99});
    REQUIRE(samples_of(state) == std::vector<uint32_t>{10, 99, 30});
    REQUIRE(state.history.size() == 2);

    SECTION("undo reverts the sample, not the earlier packet edit") {
        auto undone = reducer(state, Undo{});
        REQUIRE(samples_of(undone) == std::vector<uint32_t>{10, 20, 30});
        REQUIRE(undone.packet.payload == "edited");

        auto twice = reducer(undone, Undo{});
        REQUIRE(twice.packet.payload == "hello");
        REQUIRE(twice.history.empty());
    }

    SECTION("a failed sample edit records nothing") {
        auto same = reducer(state, SetSample{7, 1});
        REQUIRE(same.history.size() == 2);
        REQUIRE(samples_of(same) == samples_of(state));
    }
}
