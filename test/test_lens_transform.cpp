// test_lens_transform.cpp - Tests for lens-driven transforms
// Module 4: set_tx, mod_tx, increment_tx, decrement_tx, not_tx

#include <catch2/catch_all.hpp>
#include <optics/optics.h>

#include "test_structs.h"

#include <cstdint>
#include <string>
#include <vector>

using namespace optics;

// ============================================================
// Builders
// ============================================================

TEST_CASE("set_tx computes the target from the whole source", "[transform][set]") {
    auto tx = set_tx(Struct1Lenses::int32, [](const Struct1& s) { return s.int16 * 2; });
    STATIC_REQUIRE(Transform<decltype(tx)>);

    Struct1 out = tx.apply(Struct1{0, 21});
    REQUIRE(out.int32 == 42);
    REQUIRE(out.int16 == 21);
}

TEST_CASE("mod_tx computes the target from the current target", "[transform][modify]") {
    auto tx = mod_tx(struct3_inner_int32_lens(), [](int32_t v) { return v * 10; });
    Struct3 out = tx.apply(make_struct3());
    REQUIRE(out.struct2.struct1.int32 == 1320);
    REQUIRE(out.struct2.struct1.int16 == 116);
}

TEST_CASE("increment_tx", "[transform][step]") {
    auto tx = increment_tx(Struct1Lenses::int32);
    REQUIRE(tx.apply(Struct1{42, 0}).int32 == 43);

    SECTION("narrow integer targets") {
        auto narrow = increment_tx(Struct1Lenses::int16);
        Struct1 out = narrow.apply(Struct1{0, 115});
        REQUIRE(out.int16 == 116);
    }

    SECTION("unsigned vector element") {
        auto elem = increment_tx(vec_lens<uint32_t>(0));
        REQUIRE(elem.apply(std::vector<uint32_t>{9, 1}) == std::vector<uint32_t>{10, 1});
    }
}

TEST_CASE("decrement_tx", "[transform][step]") {
    auto tx = decrement_tx(Struct1Lenses::int32);
    REQUIRE(tx.apply(Struct1{42, 0}).int32 == 41);

    SECTION("through a value-only lens") {
        auto elem = decrement_tx(immer_index_lens<int>(1));
        auto out = elem.apply(immer::vector<int>{1, 2, 3});
        REQUIRE(out[1] == 1);
    }
}

TEST_CASE("Step transforms wrap at the integer limits", "[transform][step]") {
    SECTION("int32 maximum increments to minimum") {
        Struct1 out = increment_tx(Struct1Lenses::int32).apply(Struct1{INT32_MAX, 0});
        REQUIRE(out.int32 == INT32_MIN);
    }

    SECTION("int32 minimum decrements to maximum") {
        Struct1 out = decrement_tx(Struct1Lenses::int32).apply(Struct1{INT32_MIN, 0});
        REQUIRE(out.int32 == INT32_MAX);
    }

    SECTION("int16 edges") {
        REQUIRE(increment_tx(Struct1Lenses::int16).apply(Struct1{0, INT16_MAX}).int16 == INT16_MIN);
        REQUIRE(decrement_tx(Struct1Lenses::int16).apply(Struct1{0, INT16_MIN}).int16 == INT16_MAX);
    }

    SECTION("64-bit and unsigned targets") {
        auto wide = increment_tx(vec_lens<int64_t>(0));
        REQUIRE(wide.apply(std::vector<int64_t>{INT64_MAX})[0] == INT64_MIN);

        auto counter = decrement_tx(vec_lens<uint32_t>(0));
        REQUIRE(counter.apply(std::vector<uint32_t>{0})[0] == UINT32_MAX);
    }

    SECTION("values away from the limits step normally") {
        REQUIRE(decrement_tx(Struct1Lenses::int32).apply(Struct1{0, 0}).int32 == -1);
        REQUIRE(increment_tx(Struct1Lenses::int16).apply(Struct1{0, -1}).int16 == 0);
    }
}

TEST_CASE("not_tx", "[transform][not]") {
    auto tx = not_tx(Struct5Lenses::enabled);
    REQUIRE(tx.apply(Struct5{false}).enabled == true);
    REQUIRE(tx.apply(Struct5{true}).enabled == false);
    REQUIRE(tx.apply(tx.apply(Struct5{true})).enabled == true);
}

TEST_CASE("Step and negation builders are constrained", "[transform][concept]") {
    using BoolLens = decltype(Struct5Lenses::enabled);
    STATIC_REQUIRE_FALSE(IntegralTarget<lens_target_t<BoolLens>>);
    STATIC_REQUIRE(Negatable<lens_target_t<BoolLens>>);
    STATIC_REQUIRE(IntegralTarget<int16_t>);
    STATIC_REQUIRE_FALSE(IntegralTarget<std::string>);
}

TEST_CASE("Lens transforms fail like the lens they wrap", "[transform][error]") {
    auto tx = increment_tx(compose(Struct4Lenses::inner_vec, vec_lens<Struct1>(5), Struct1Lenses::int32));
    Struct4 s{{{1, 1}, {2, 2}, {3, 3}}};
    REQUIRE_THROWS_AS(tx.apply(s), IndexOutOfRange);
}

// ============================================================
// Pipelines
// ============================================================

TEST_CASE("Composed lens transforms", "[transform][compose]") {
    const auto lens = struct3_inner_int32_lens();
    const Struct3 zero = lens.set(make_struct3(), 0);

    auto pipeline = compose_tx(increment_tx(lens),
                               mod_tx(lens, [](int32_t v) { return v + 2; }),
                               mod_tx(lens, [](int32_t v) { return v * 2; }));

    Struct3 once = pipeline.apply(zero);
    REQUIRE(lens.get(once) == 6);
    REQUIRE(once.int32 == 332);
    REQUIRE(once.struct2.struct1.int16 == 116);

    REQUIRE(lens.get(pipeline.apply(once)) == 18);
}

TEST_CASE("apply_tx over lens transforms", "[transform][apply]") {
    const Struct1 s0{42, 7};
    Struct1 out = apply_tx(s0,
                           increment_tx(Struct1Lenses::int32),
                           decrement_tx(Struct1Lenses::int16),
                           set_tx(Struct1Lenses::int32, [](const Struct1& s) { return s.int32 + s.int16; }));
    REQUIRE(out.int32 == 49);
    REQUIRE(out.int16 == 6);
}

TEST_CASE("Transforms mixing field and chain lenses", "[transform][compose]") {
    auto tx = compose_tx(mod_tx(Struct3Lenses::int32, [](int32_t v) { return v - 300; }),
                         increment_tx(compose(Struct3Lenses::struct2, Struct2Lenses::int32)));
    Struct3 out = tx.apply(make_struct3());
    REQUIRE(out.int32 == 32);
    REQUIRE(out.struct2.int32 == 233);
    REQUIRE(out.struct2.struct1 == Struct1{132, 116});
}

// ============================================================
// Member syntax
// ============================================================

TEST_CASE("Transform builders as lens members", "[transform][facade]") {
    const auto lens = struct3_inner_int32_lens();
    const Struct3 s0 = make_struct3();

    REQUIRE(lens.get(lens.increment_tx().apply(s0)) == 133);
    REQUIRE(lens.get(lens.decrement_tx().apply(s0)) == 131);
    REQUIRE(lens.get(lens.mod_tx([](int32_t v) { return -v; }).apply(s0)) == -132);
    REQUIRE(lens.get(lens.set_tx([](const Struct3& s) { return s.int32; }).apply(s0)) == 332);
    REQUIRE(Struct5Lenses::enabled.not_tx().apply(Struct5{false}).enabled);
}
