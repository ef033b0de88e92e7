// test_nested_structs.cpp - End-to-end scenarios over hand-written accessor groups
// Records nesting records, string fields, and transform pipelines

#include <catch2/catch_all.hpp>
#include <optics/optics.h>

#include <cstdint>
#include <string>

using namespace optics;

namespace {

// ============================================================
// Person / Address
// ============================================================

struct Address {
    std::string street;
    std::string city;
    bool operator==(const Address&) const = default;
};

struct Person {
    std::string name;
    Address address;
    bool operator==(const Person&) const = default;
};

struct AddressLenses {
    static constexpr auto street = member_lens<&Address::street>(0);
    static constexpr auto city = member_lens<&Address::city>(1);
};

struct PersonLenses {
    static constexpr auto name = member_lens<&Person::name>(0);
    static constexpr auto address = member_lens<&Person::address>(1);
};

// ============================================================
// Packet / Header
// ============================================================

struct Header {
    uint16_t version;
    uint32_t count;
    bool compressed;
    bool operator==(const Header&) const = default;
};

struct Packet {
    Header header;
    std::string payload;
    bool operator==(const Packet&) const = default;
};

struct HeaderLenses {
    static constexpr auto version = member_lens<&Header::version>(0);
    static constexpr auto count = member_lens<&Header::count>(1);
    static constexpr auto compressed = member_lens<&Header::compressed>(2);
};

struct PacketLenses {
    static constexpr auto header = member_lens<&Packet::header>(0);
    static constexpr auto payload = member_lens<&Packet::payload>(1);
};

} // namespace

TEST_CASE("Person street update", "[nested][person]") {
    const Person pop{"Pop Zeus", {"123 Needmore Rd", "Dayton"}};
    const auto street = compose(PersonLenses::address, AddressLenses::street);

    REQUIRE(street.path() == LensPath::from_pair(1, 0));
    REQUIRE(street.get(pop) == "123 Needmore Rd");

    Person moved = street.set(pop, std::string{"666 Titus Ave"});
    REQUIRE(moved.address.street == "666 Titus Ave");
    REQUIRE(moved.address.city == "Dayton");
    REQUIRE(moved.name == "Pop Zeus");
    REQUIRE(pop.address.street == "123 Needmore Rd");
}

TEST_CASE("Person string transforms", "[nested][person]") {
    const Person pop{"Pop Zeus", {"123 Needmore Rd", "Dayton"}};
    const auto city = compose(PersonLenses::address, AddressLenses::city);

    auto shout = compose_tx(
        mod_tx(PersonLenses::name, [](const std::string& n) { return n + "!"; }),
        set_tx(city, [](const Person& p) { return p.name.substr(0, 3) + "ville"; }));

    Person out = shout.apply(pop);
    REQUIRE(out.name == "Pop Zeus!");
    REQUIRE(out.address.city == "Popville");
    REQUIRE(out.address.street == pop.address.street);
}

TEST_CASE("Packet header counter pipeline", "[nested][packet]") {
    const auto count = compose(PacketLenses::header, HeaderLenses::count);
    const Packet p0{{1, 0, false}, "data"};

    auto pipeline = compose_tx(count.increment_tx(),
                               count.mod_tx([](uint32_t c) { return c + 2; }),
                               count.mod_tx([](uint32_t c) { return c * 2; }));

    Packet p1 = pipeline.apply(p0);
    REQUIRE(count.get(p1) == 6);
    REQUIRE(p1.header.version == 1);
    REQUIRE(p1.payload == "data");

    Packet p2 = pipeline.apply(p1);
    REQUIRE(count.get(p2) == 18);
}

TEST_CASE("Packet header flags and versions", "[nested][packet]") {
    const auto compressed = compose(PacketLenses::header, HeaderLenses::compressed);
    const auto version = compose(PacketLenses::header, HeaderLenses::version);
    const Packet p0{{3, 10, false}, "data"};

    Packet p1 = apply_tx(p0, compressed.not_tx(), version.decrement_tx());
    REQUIRE(p1.header == Header{2, 10, true});

    REQUIRE(compressed.path() == LensPath::from_pair(0, 2));
    REQUIRE(version.path() == LensPath::from_pair(0, 0));
    REQUIRE(PacketLenses::payload.path() == LensPath::single(1));
}
