// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#include <idgen/object_id.h>

#include <chrono>

using namespace idgen;
using namespace std::chrono;

object_id_generator::object_id_generator(random_source & random, clock_source & clock):
    m_clock(clock) {

    random.fill(m_process_unique);
    m_counter = impl::random_value<uint32_t>(random) % object_id::counter_modulus;
}

auto object_id_generator::generate(std::optional<uint64_t> timestamp) -> object_id {
    uint64_t now;
    if (timestamp) {
        now = *timestamp;
    } else {
        auto since_epoch = duration_cast<seconds>(m_clock.now().time_since_epoch()).count();
        if (since_epoch < 0)
            throw error(errc::invalid_timestamp, "system clock is before Unix epoch");
        now = uint64_t(since_epoch);
    }
    if (now > std::numeric_limits<uint32_t>::max())
        throw error(errc::invalid_timestamp, std::to_string(now) + " does not fit in 32 bits");

    object_id ret(uint32_t(now), m_process_unique, m_counter);
    m_counter = (m_counter + 1) % object_id::counter_modulus;
    return ret;
}
