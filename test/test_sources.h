// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#ifndef HEADER_TEST_SOURCES_H_INCLUDED
#define HEADER_TEST_SOURCES_H_INCLUDED

#include <idgen/entropy.h>

#include <vector>
#include <initializer_list>

// Fills every byte with the same value
class pattern_random_source final : public idgen::random_source {
public:
    explicit pattern_random_source(uint8_t value = 0): m_value(value)
    {}

    void fill(std::span<uint8_t> dest) override {
        std::fill(dest.begin(), dest.end(), m_value);
    }
private:
    uint8_t m_value;
};

// Replays a fixed byte script, cycling when exhausted
class scripted_random_source final : public idgen::random_source {
public:
    scripted_random_source(std::initializer_list<uint8_t> script): m_script(script)
    {}

    void fill(std::span<uint8_t> dest) override {
        for (auto & b: dest) {
            b = m_script[m_pos];
            m_pos = (m_pos + 1) % m_script.size();
        }
    }
private:
    std::vector<uint8_t> m_script;
    size_t m_pos = 0;
};

// Returns a time that moves by `step` after every call
class stepping_clock_source final : public idgen::clock_source {
public:
    explicit stepping_clock_source(time_point start = {}, std::chrono::milliseconds step = {}):
        m_now(start),
        m_step(step)
    {}

    auto now() -> time_point override {
        auto ret = m_now;
        m_now += m_step;
        return ret;
    }

    void set(time_point value) noexcept
        { m_now = value; }
private:
    time_point m_now;
    std::chrono::milliseconds m_step;
};

inline auto unix_millis(int64_t value) -> idgen::clock_source::time_point {
    return idgen::clock_source::time_point(std::chrono::milliseconds(value));
}

#endif
