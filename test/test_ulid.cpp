// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#include <doctest/doctest.h>

#include <idgen/ulid.h>

#include "test_sources.h"

#include <sstream>
#include <vector>
#include <map>
#include <unordered_map>
#include <set>

using namespace idgen;
using namespace std::literals;


TEST_SUITE("ulid") {

static_assert(std::is_trivially_copyable_v<ulid>);
static_assert(std::is_standard_layout_v<ulid>);
static_assert(std::has_unique_object_representations_v<ulid>);
static_assert(std::is_nothrow_default_constructible_v<ulid>);
static_assert(std::regular<ulid>);
static_assert(std::totally_ordered<ulid>);

namespace {
    template<ulid U1> class some_class {};
    [[maybe_unused]] some_class<ulid("01BX5ZZKBKACTAV9WEVGEMMVRY")> some_object;

    [[maybe_unused]] std::map<ulid, std::string> m;
    [[maybe_unused]] std::unordered_map<ulid, std::string> um;
}

TEST_CASE("nil and max") {

    constexpr ulid u;
    CHECK(u.to_string() == "00000000000000000000000000");
    CHECK(u.timestamp() == 0);

    constexpr ulid mx = ulid::max();
    constexpr std::array<uint8_t, 16> max_bytes = {
        0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,
        0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF
    };
    CHECK(mx.bytes == max_bytes);
    CHECK(mx.timestamp() == ulid::max_timestamp);
}

TEST_CASE("components") {
    const std::array<uint8_t, 10> random = {1, 2, 3, 4, 5, 6, 7, 8, 9, 10};
    ulid u(1609459200000, random);

    CHECK(u.timestamp() == 1609459200000);
    CHECK(u.random() == random);

    CHECK(ulid(1609459200000, {}).to_string() == "01ETXKWW000000000000000000");
    CHECK(ulid(1609459200000, {0, 0, 0, 0, 0, 0, 0, 0, 0, 1}).to_string() == "01ETXKWW000000000000000001");
    CHECK(ulid(ulid::max_timestamp, {}).to_string() == "7ZZZZZZZZZ0000000000000000");
}

TEST_CASE("strings") {
    constexpr ulid lit("01ARYZ6S410000000000000000");
    CHECK(lit.timestamp() == 1469918176385);

    auto parsed = ulid::from_chars("01ARYZ6S410000000000000000");
    REQUIRE(parsed);
    CHECK(*parsed == lit);
    CHECK(ulid::from_chars("01aryz6s410000000000000000") == lit);

    CHECK(lit.to_string() == "01ARYZ6S410000000000000000");
    CHECK(lit.to_string(ulid::lowercase) == "01aryz6s410000000000000000");

    auto text = ulid("01BX5ZZKBKACTAV9WEVGEMMVRY").to_string();
    CHECK(text.size() == ulid::char_length);
    CHECK(ulid::parse(text) == ulid("01BX5ZZKBKACTAV9WEVGEMMVRY"));
}

TEST_CASE("alphabet") {
    ulid_generator gen;
    for (int i = 0; i < 100; ++i) {
        auto text = gen.generate().to_string();
        CHECK(text.size() == 26);
        CHECK(text.find_first_not_of("0123456789ABCDEFGHJKMNPQRSTVWXYZ") == std::string::npos);
        CHECK(text[0] <= '7');
    }
}

TEST_CASE("malformed") {
    CHECK(!ulid::from_chars(""));
    CHECK(!ulid::from_chars("01ARYZ6S41000000000000000"));
    CHECK(!ulid::from_chars("01ARYZ6S4100000000000000000"));
    CHECK(!ulid::from_chars("01ARYZ6S41000000000000000I"));
    CHECK(!ulid::from_chars("01ARYZ6S41000000000000000L"));
    CHECK(!ulid::from_chars("01ARYZ6S41000000000000000O"));
    CHECK(!ulid::from_chars("01ARYZ6S41000000000000000U"));
    CHECK(!ulid::from_chars("01ARYZ6S41000000000000000-"));
    CHECK(!ulid::from_chars("80000000000000000000000000"));
    CHECK(ulid::from_chars("7ZZZZZZZZZZZZZZZZZZZZZZZZZ") == ulid::max());

    try {
        ulid::parse("8ZZZZZZZZZZZZZZZZZZZZZZZZZ");
        FAIL("parse should throw");
    } catch (const error & ex) {
        CHECK(ex.code() == errc::malformed_text);
    }
}

TEST_CASE("output") {
    std::ostringstream obuf;

    obuf << ulid("01BX5ZZKBKACTAV9WEVGEMMVRY");
    CHECK(obuf.str() == "01BX5ZZKBKACTAV9WEVGEMMVRY");
}

TEST_CASE("input") {
    std::istringstream ibuf;
    ulid val;

    ibuf.str("01bx5zzkbkactav9wevgemmvry");
    ibuf >> val;
    CHECK(ibuf);
    CHECK(val == ulid("01BX5ZZKBKACTAV9WEVGEMMVRY"));

    ibuf.clear();
    ibuf.str("01BX5ZZKBKACTAV9WEVGEMMVR");
    ibuf >> val;
    CHECK(ibuf.fail());
    CHECK(ibuf.eof());
}

TEST_CASE("hash") {
    constexpr std::hash<ulid> hasher;
    constexpr ulid val("01BX5ZZKBKACTAV9WEVGEMMVRY");
    CHECK(hasher(val) != hasher(ulid()));
    CHECK(hasher(val) == hasher(val));
}

TEST_CASE("generate with timestamp") {
    pattern_random_source random(0x11);
    stepping_clock_source clock;
    ulid_generator gen(random, clock);

    auto u = gen.generate(1609459200000);
    CHECK(u.timestamp() == 1609459200000);
    CHECK(u.to_string().starts_with("01ETXKWW00"));

    CHECK(gen.generate(ulid::max_timestamp).timestamp() == ulid::max_timestamp);
    try {
        gen.generate(ulid::max_timestamp + 1);
        FAIL("generation should throw");
    } catch (const error & ex) {
        CHECK(ex.code() == errc::invalid_timestamp);
    }
}

TEST_CASE("generate from clock") {
    pattern_random_source random;
    stepping_clock_source clock(unix_millis(1609459200000));
    ulid_generator gen(random, clock);

    auto u = gen.generate();
    CHECK(u == ulid("01ETXKWW000000000000000000"));
}

TEST_CASE("batch in one millisecond") {
    pattern_random_source random;
    stepping_clock_source clock(unix_millis(1609459200000));
    ulid_generator gen(random, clock);

    auto batch = gen.generate_batch(3);
    REQUIRE(batch.size() == 3);
    CHECK(batch[0].to_string() == "01ETXKWW000000000000000000");
    CHECK(batch[1].to_string() == "01ETXKWW000000000000000001");
    CHECK(batch[2].to_string() == "01ETXKWW000000000000000002");

    //every call starts a new batch
    auto again = gen.generate_batch(1);
    REQUIRE(again.size() == 1);
    CHECK(again[0] == batch[0]);
    CHECK(gen.generate() == batch[0]);
}

TEST_CASE("batch across milliseconds") {
    pattern_random_source random(0x42);
    stepping_clock_source clock(unix_millis(1609459200000), 1ms);
    ulid_generator gen(random, clock);

    auto batch = gen.generate_batch(3);
    REQUIRE(batch.size() == 3);
    for (size_t i = 0; i < batch.size(); ++i) {
        CHECK(batch[i].timestamp() == 1609459200000 + i);
        CHECK(batch[i].random() == std::array<uint8_t, 10>{0x42, 0x42, 0x42, 0x42, 0x42, 0x42, 0x42, 0x42, 0x42, 0x42});
    }
}

TEST_CASE("batch with clock going back") {
    pattern_random_source random;
    stepping_clock_source clock(unix_millis(1609459200000), -1ms);
    ulid_generator gen(random, clock);

    auto batch = gen.generate_batch(4);
    REQUIRE(batch.size() == 4);
    for (size_t i = 0; i < batch.size(); ++i)
        CHECK(batch[i].timestamp() == 1609459200000);
    CHECK(std::is_sorted(batch.begin(), batch.end()));
    CHECK(std::set<ulid>(batch.begin(), batch.end()).size() == 4);
}

TEST_CASE("batch with fixed timestamp") {
    ulid_generator gen;

    auto batch = gen.generate_batch(1000, 1609459200000);
    REQUIRE(batch.size() == 1000);
    for (size_t i = 1; i < batch.size(); ++i) {
        CHECK(batch[i].timestamp() == 1609459200000);
        CHECK(batch[i - 1] < batch[i]);
    }

    CHECK(gen.generate_batch(0).empty());
}

TEST_CASE("random overflow") {
    pattern_random_source random(0xFF);
    stepping_clock_source clock(unix_millis(1609459200000));
    ulid_generator gen(random, clock);

    auto single = gen.generate_batch(1);
    REQUIRE(single.size() == 1);
    CHECK(single[0].to_string() == "01ETXKWW00ZZZZZZZZZZZZZZZZ");

    try {
        gen.generate_batch(2);
        FAIL("generation should throw");
    } catch (const error & ex) {
        CHECK(ex.code() == errc::random_overflow);
    }
}

}
