// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#include <idgen/uuid.h>

#include <openssl/evp.h>

#include <memory>
#include <new>
#include <chrono>

using namespace idgen;
using namespace std::chrono;

using hundred_nanoseconds = duration<int64_t, std::ratio<int64_t(1), int64_t(10'000'000)>>;

//gregorian offset of Unix epoch in 100ns ticks
static constexpr uint64_t g_gregorian_offset = ((uint64_t(0x01B21DD2)) << 32) + 0x13814000;

static constexpr uint64_t g_max_gregorian_ticks = (uint64_t(1) << 60) - 1;
static constexpr uint64_t g_max_unix_millis = (uint64_t(1) << 48) - 1;

namespace {

    struct md_ctx_deleter {
        void operator()(EVP_MD_CTX * ctx) const noexcept {
            EVP_MD_CTX_free(ctx);
        }
    };

    using md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, md_ctx_deleter>;

    uuid hash_name(const EVP_MD * md, uuid ns, std::string_view name, uuid::type version) {

        md_ctx_ptr ctx{EVP_MD_CTX_new()};
        if (!ctx)
            throw std::bad_alloc();

        uint8_t digest[EVP_MAX_MD_SIZE];
        unsigned digest_len = 0;
        if (EVP_DigestInit_ex(ctx.get(), md, nullptr) != 1 ||
            EVP_DigestUpdate(ctx.get(), ns.bytes.data(), ns.bytes.size()) != 1 ||
            EVP_DigestUpdate(ctx.get(), name.data(), name.size()) != 1 ||
            EVP_DigestFinal_ex(ctx.get(), digest, &digest_len) != 1) {
            throw std::runtime_error("idgen: message digest computation failed");
        }
        if (digest_len < sizeof(uuid))
            throw std::runtime_error("idgen: message digest is too short");

        uuid ret(std::span<const uint8_t, 16>(digest, 16));
        ret.stamp(version);
        return ret;
    }

    bool equals_ignore_case(std::string_view lhs, std::string_view rhs) noexcept {
        return std::equal(lhs.begin(), lhs.end(), rhs.begin(), rhs.end(), [](char l, char r) {
            auto lower = [](char c) { return (c >= 'A' && c <= 'Z') ? char(c - 'A' + 'a') : c; };
            return lower(l) == lower(r);
        });
    }
}

auto uuid::generate_md5(uuid ns, std::string_view name) -> uuid {
    return hash_name(EVP_md5(), ns, name, uuid::type::name_based_md5);
}

auto uuid::generate_sha1(uuid ns, std::string_view name) -> uuid {
    return hash_name(EVP_sha1(), ns, name, uuid::type::name_based_sha1);
}

auto uuid::namespaces::find(std::string_view name) noexcept -> std::optional<uuid> {
    if (equals_ignore_case(name, "dns"))
        return namespaces::dns;
    if (equals_ignore_case(name, "url"))
        return namespaces::url;
    if (equals_ignore_case(name, "oid"))
        return namespaces::oid;
    if (equals_ignore_case(name, "x500"))
        return namespaces::x500;
    return std::nullopt;
}

auto idgen::version_of(const uuid_request & request) noexcept -> uuid::type {
    constexpr uuid::type types[] = {
        uuid::type::time_based,
        uuid::type::name_based_md5,
        uuid::type::random,
        uuid::type::name_based_sha1,
        uuid::type::reordered_time_based,
        uuid::type::unix_time_based,
        uuid::type::custom
    };
    static_assert(std::size(types) == std::variant_size_v<uuid_request>);
    return types[request.index()];
}

uuid_generator::uuid_generator(random_source & random, clock_source & clock):
    m_random(random),
    m_clock(clock) {

    m_random.fill(m_node_id);

    // Set multicast bit, to prevent conflicts
    // with IEEE 802 addresses obtained from
    // network cards
    m_node_id[0] |= 0x01;
}

auto uuid_generator::generate(const uuid_request & request) -> uuid {
    return std::visit([this](const auto & req) -> uuid {
        using req_type = std::remove_cvref_t<decltype(req)>;

        if constexpr (std::is_same_v<req_type, time_based_request>)
            return this->generate_time_based(req);
        else if constexpr (std::is_same_v<req_type, md5_request>)
            return uuid::generate_md5(req.ns, req.name);
        else if constexpr (std::is_same_v<req_type, random_request>)
            return this->generate_random();
        else if constexpr (std::is_same_v<req_type, sha1_request>)
            return uuid::generate_sha1(req.ns, req.name);
        else if constexpr (std::is_same_v<req_type, reordered_time_based_request>)
            return this->generate_reordered_time_based(req);
        else if constexpr (std::is_same_v<req_type, unix_time_based_request>)
            return this->generate_unix_time_based(req);
        else
            return uuid_generator::generate_custom(req.data);
    }, request);
}

auto uuid_generator::generate_time_based(const time_based_request & request) -> uuid {
    uint64_t clock = this->gregorian_ticks(request.timestamp);
    const auto & node_id = this->resolve_node_id(request.node_id);

    uint32_t clock_high = uint32_t(clock >> 32);
    uint32_t clock_low = uint32_t(clock);

    uuid_parts parts;
    parts.time_low = clock_low;
    parts.time_mid = uint16_t(clock_high);
    parts.time_hi_and_version = uint16_t(((clock_high >> 16) & 0x0FFF) | 0x1000);
    parts.clock_seq = uint16_t(this->clock_sequence() | 0x8000);
    std::copy(node_id.begin(), node_id.end(), parts.node);

    return uuid(parts);
}

auto uuid_generator::generate_random() -> uuid {
    uuid ret;
    m_random.fill(ret.bytes);
    ret.stamp(uuid::type::random);
    return ret;
}

auto uuid_generator::generate_reordered_time_based(const reordered_time_based_request & request) -> uuid {
    uint64_t clock = this->gregorian_ticks(request.timestamp);
    const auto & node_id = this->resolve_node_id(request.node_id);

    clock <<= 4;
    uint32_t clock_high = uint32_t(clock >> 32);
    uint32_t clock_low = uint32_t(clock);

    uuid_parts parts;
    parts.time_low = clock_high;
    parts.time_mid = uint16_t(clock_low >> 16);
    parts.time_hi_and_version = uint16_t(((clock_low >> 4) & 0x0FFF) | 0x6000);
    parts.clock_seq = uint16_t(this->clock_sequence() | 0x8000);
    std::copy(node_id.begin(), node_id.end(), parts.node);

    return uuid(parts);
}

auto uuid_generator::generate_unix_time_based(const unix_time_based_request & request) -> uuid {
    uint64_t clock;
    if (request.timestamp) {
        clock = *request.timestamp;
    } else {
        auto since_epoch = duration_cast<milliseconds>(m_clock.now().time_since_epoch()).count();
        if (since_epoch < 0)
            throw error(errc::invalid_timestamp, "system clock is before Unix epoch");
        clock = uint64_t(since_epoch);
    }
    if (clock > g_max_unix_millis)
        throw error(errc::invalid_timestamp, std::to_string(clock) + " does not fit in 48 bits");

    uuid ret;
    auto tail = impl::write_bytes<6>(clock, ret.bytes.data());
    m_random.fill(std::span<uint8_t>(tail, ret.bytes.data() + ret.bytes.size()));
    ret.stamp(uuid::type::unix_time_based);
    return ret;
}

auto uuid_generator::generate_custom(std::span<const uint8_t> data) -> uuid {
    uuid ret;
    if (data.size() > ret.bytes.size())
        throw error(errc::invalid_payload_length,
                    "custom data is " + std::to_string(data.size()) + " bytes, at most 16 allowed");
    std::copy(data.begin(), data.end(), ret.bytes.begin());
    ret.stamp(uuid::type::custom);
    return ret;
}

auto uuid_generator::gregorian_ticks(std::optional<uint64_t> timestamp) -> uint64_t {
    uint64_t ret;
    if (timestamp) {
        ret = *timestamp;
    } else {
        auto since_epoch = duration_cast<hundred_nanoseconds>(m_clock.now().time_since_epoch()).count();
        ret = uint64_t(since_epoch) + g_gregorian_offset;
    }
    if (ret > g_max_gregorian_ticks)
        throw error(errc::invalid_timestamp, std::to_string(ret) + " does not fit in 60 bits");
    return ret;
}

auto uuid_generator::clock_sequence() -> uint16_t {
    return impl::random_value<uint16_t>(m_random) & 0x3FFF;
}

auto uuid_generator::resolve_node_id(const std::optional<std::array<uint8_t, 6>> & node_id) const noexcept
    -> const std::array<uint8_t, 6> & {
    return node_id ? *node_id : m_node_id;
}
