// test_lens_result.cpp - Tests for the non-throwing access layer
// try_get / try_set / try_modify and LensAccessResult

#include <catch2/catch_all.hpp>
#include <optics/optics.h>

#include "test_structs.h"

#include <stdexcept>
#include <vector>

using namespace optics;

TEST_CASE("try_get", "[result][get]") {
    const std::vector<int> values{1, 2, 3};

    SECTION("in range") {
        auto result = try_get(vec_lens<int>(2), values);
        REQUIRE(result);
        REQUIRE(result.success);
        REQUIRE(result.error_code == LensErrorCode::Success);
        REQUIRE(result.get() == 3);
        REQUIRE(result.get_or(-1) == 3);
    }

    SECTION("out of range") {
        auto result = try_get(vec_lens<int>(5), values);
        REQUIRE_FALSE(result);
        REQUIRE_FALSE(result.value.has_value());
        REQUIRE(result.error_code == LensErrorCode::IndexOutOfRange);
        REQUIRE_THAT(result.error_message, Catch::Matchers::ContainsSubstring("size 3"));
        REQUIRE(result.get_or(-1) == -1);
        REQUIRE_THROWS_AS(result.get(), std::runtime_error);
    }

    SECTION("struct targets are copied out") {
        const Struct3 s = make_struct3();
        auto result = try_get(compose(Struct3Lenses::struct2, Struct2Lenses::struct1), s);
        REQUIRE(result.get() == Struct1{132, 116});
    }
}

TEST_CASE("try_set", "[result][set]") {
    const Struct4 s0{{{1, 10}, {2, 20}, {3, 30}}};

    SECTION("in range") {
        auto lens = compose(Struct4Lenses::inner_vec, vec_lens<Struct1>(0), Struct1Lenses::int16);
        auto result = try_set(lens, s0, int16_t{99});
        REQUIRE(result);
        REQUIRE(result.get().inner_vec[0].int16 == 99);
    }

    SECTION("out of range") {
        auto lens = compose(Struct4Lenses::inner_vec, vec_lens<Struct1>(5), Struct1Lenses::int16);
        auto result = try_set(lens, s0, int16_t{99});
        REQUIRE_FALSE(result);
        REQUIRE(result.error_code == LensErrorCode::IndexOutOfRange);
    }
}

TEST_CASE("try_modify", "[result][modify]") {
    const immer::vector<int> v0{4, 5};

    auto ok = try_modify(immer_index_lens<int>(1), v0, [](int v) { return v + 1; });
    REQUIRE(ok);
    REQUIRE(ok.get()[1] == 6);

    auto failed = try_modify(immer_index_lens<int>(2), v0, [](int v) { return v + 1; });
    REQUIRE_FALSE(failed);
    REQUIRE(failed.error_code == LensErrorCode::IndexOutOfRange);
}

TEST_CASE("LensAccessResult factories", "[result]") {
    auto ok = LensAccessResult<int>::ok(5);
    REQUIRE(ok.success);
    REQUIRE(*ok.value == 5);

    auto failed = LensAccessResult<int>::failure(LensErrorCode::IndexOutOfRange, "bad index");
    REQUIRE_FALSE(failed.success);
    REQUIRE(failed.error_message == "bad index");
    REQUIRE_THROWS_WITH(failed.get(), "Lens access failed: bad index");
}
