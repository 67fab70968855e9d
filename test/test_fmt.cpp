// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#include <doctest/doctest.h>

#include <fmt/format.h>
#include <idgen/uuid.h>
#include <idgen/ulid.h>
#include <idgen/object_id.h>

using namespace idgen;
using namespace std::literals;

static_assert(IDGEN_SUPPORTS_FMT_FORMAT);

TEST_SUITE("fmt") {

TEST_CASE("format uuid") {

    CHECK(fmt::format("{}", uuid()) == "00000000-0000-0000-0000-000000000000");
    CHECK(fmt::format("{}", uuid("7d444840-9dc0-11d1-b245-5ffdce74fad2")) == "7d444840-9dc0-11d1-b245-5ffdce74fad2");
    CHECK(fmt::format("{:l}", uuid("7d444840-9dc0-11d1-b245-5ffdce74fad2")) == "7d444840-9dc0-11d1-b245-5ffdce74fad2");
    CHECK(fmt::format("{:u}", uuid("7d444840-9dc0-11d1-b245-5ffdce74fad2")) == "7D444840-9DC0-11D1-B245-5FFDCE74FAD2");
}

TEST_CASE("format ulid") {

    CHECK(fmt::format("{}", ulid()) == "00000000000000000000000000");
    CHECK(fmt::format("{}", ulid("01BX5ZZKBKACTAV9WEVGEMMVRY")) == "01BX5ZZKBKACTAV9WEVGEMMVRY");
    CHECK(fmt::format("{:l}", ulid("01BX5ZZKBKACTAV9WEVGEMMVRY")) == "01bx5zzkbkactav9wevgemmvry");
    CHECK(fmt::format("{:u}", ulid("01BX5ZZKBKACTAV9WEVGEMMVRY")) == "01BX5ZZKBKACTAV9WEVGEMMVRY");
}

TEST_CASE("format object_id") {

    CHECK(fmt::format("{}", object_id()) == "000000000000000000000000");
    CHECK(fmt::format("{}", object_id("507f1f77bcf86cd799439011")) == "507f1f77bcf86cd799439011");
    CHECK(fmt::format("{:u}", object_id("507f1f77bcf86cd799439011")) == "507F1F77BCF86CD799439011");
}

TEST_CASE("format errors") {

    CHECK_THROWS_AS((void)fmt::format(fmt::runtime("{:x}"), uuid()), fmt::format_error);
}

}
