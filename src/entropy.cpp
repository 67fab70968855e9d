// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#include <idgen/entropy.h>

#include <openssl/rand.h>
#include <openssl/err.h>

#include <string>

using namespace idgen;

namespace {

    class system_random_source final : public random_source {
    public:
        void fill(std::span<uint8_t> dest) override {
            if (dest.empty())
                return;
            if (dest.size() > size_t(std::numeric_limits<int>::max()))
                throw std::length_error("idgen: random request is too large");
            if (RAND_bytes(dest.data(), int(dest.size())) != 1) {
                char buf[256];
                ERR_error_string_n(ERR_get_error(), buf, sizeof(buf));
                throw std::runtime_error(std::string("idgen: system random source failed: ") + buf);
            }
        }
    };

    class system_clock_source final : public clock_source {
    public:
        auto now() -> time_point override {
            return std::chrono::system_clock::now();
        }
    };
}

auto random_source::system() noexcept -> random_source & {
    static system_random_source ret;
    return ret;
}

auto clock_source::system() noexcept -> clock_source & {
    static system_clock_source ret;
    return ret;
}
