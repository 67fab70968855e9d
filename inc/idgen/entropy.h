// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#ifndef HEADER_IDGEN_ENTROPY_H_INCLUDED
#define HEADER_IDGEN_ENTROPY_H_INCLUDED

#include <idgen/common.h>

#include <chrono>

namespace idgen {

    /**
     * Source of random bytes used by all generators.
     *
     * Implementations must be usable from the thread that owns the generator
     * they are passed to. The system implementation is cryptographically strong.
     */
    class random_source {
    public:
        /// Fill dest with random bytes
        virtual void fill(std::span<uint8_t> dest) = 0;

        /// Returns the process-wide cryptographically strong source
        IDGEN_EXPORTED static auto system() noexcept -> random_source &;
    protected:
        random_source() noexcept = default;
        ~random_source() noexcept = default;
        random_source(const random_source &) noexcept = default;
        random_source & operator=(const random_source &) noexcept = default;
    };

    /// Source of wall clock time used by all time based generators
    class clock_source {
    public:
        using time_point = std::chrono::system_clock::time_point;

        /// Returns the current time
        virtual auto now() -> time_point = 0;

        /// Returns the process-wide std::chrono::system_clock based source
        IDGEN_EXPORTED static auto system() noexcept -> clock_source &;
    protected:
        clock_source() noexcept = default;
        ~clock_source() noexcept = default;
        clock_source(const clock_source &) noexcept = default;
        clock_source & operator=(const clock_source &) noexcept = default;
    };

    namespace impl {
        template<class T>
        requires(std::is_unsigned_v<T>)
        T random_value(random_source & source) {
            std::array<uint8_t, sizeof(T)> buf;
            source.fill(buf);
            T ret;
            read_bytes(buf.data(), ret);
            return ret;
        }
    }
}

#endif
