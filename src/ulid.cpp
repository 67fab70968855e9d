// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#include <idgen/ulid.h>

#include <chrono>

using namespace idgen;
using namespace std::chrono;

// Adds one to a big-endian number. Returns false on wrap around.
static bool increment(std::array<uint8_t, 10> & val) noexcept {
    for (size_t i = val.size(); i != 0; --i) {
        if (++val[i - 1] != 0)
            return true;
    }
    return false;
}

ulid_generator::ulid_generator(random_source & random, clock_source & clock):
    m_random(random),
    m_clock(clock)
{}

auto ulid_generator::generate(std::optional<uint64_t> timestamp) -> ulid {
    this->reset();
    return this->next(timestamp);
}

auto ulid_generator::generate_batch(size_t count, std::optional<uint64_t> timestamp) -> std::vector<ulid> {
    this->reset();
    std::vector<ulid> ret;
    ret.reserve(count);
    for (size_t i = 0; i < count; ++i)
        ret.push_back(this->next(timestamp));
    return ret;
}

auto ulid_generator::next(std::optional<uint64_t> timestamp) -> ulid {
    uint64_t now;
    if (timestamp) {
        now = *timestamp;
    } else {
        auto since_epoch = duration_cast<milliseconds>(m_clock.now().time_since_epoch()).count();
        if (since_epoch < 0)
            throw error(errc::invalid_timestamp, "system clock is before Unix epoch");
        now = uint64_t(since_epoch);
    }
    if (now > ulid::max_timestamp)
        throw error(errc::invalid_timestamp, std::to_string(now) + " does not fit in 48 bits");

    //a clock that stepped back keeps using the last millisecond so the batch stays sorted
    if (m_last_time && now <= *m_last_time) {
        auto random = m_last_random;
        if (!increment(random))
            throw error(errc::random_overflow,
                        "random component exhausted for millisecond " + std::to_string(*m_last_time));
        m_last_random = random;
    } else {
        m_random.fill(m_last_random);
        m_last_time = now;
    }

    return ulid(*m_last_time, m_last_random);
}

void ulid_generator::reset() noexcept {
    m_last_time.reset();
    m_last_random = {};
}
