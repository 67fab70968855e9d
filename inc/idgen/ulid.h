// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#ifndef HEADER_IDGEN_ULID_H_INCLUDED
#define HEADER_IDGEN_ULID_H_INCLUDED

#include <idgen/common.h>
#include <idgen/text_codec.h>
#include <idgen/entropy.h>

#include <vector>

namespace idgen {

    class ulid {
    public:
        /// Whether to print ulid in lower or upper case
        enum format {
            lowercase,
            uppercase
        };

        static constexpr format default_format = uppercase;

        /// Number of characters in string representation of ULID
        static constexpr size_t char_length = 26;

        /// Largest timestamp a ULID can hold
        static constexpr uint64_t max_timestamp = (uint64_t(1) << 48) - 1;

        static_assert(impl::base32_length<16> == char_length);

    public:
        std::array<uint8_t, 16> bytes{};

    public:
        ///Constructs a zeroed out ULID
        constexpr ulid() noexcept = default;

        ///Constructs ulid from a string literal
        consteval ulid(const char (&src)[ulid::char_length + 1]) noexcept {
            if (!impl::read_base32<16>(src, this->bytes) || src[ulid::char_length] != 0)
                impl::invalid_constexpr_call("invalid ulid string");
        }

        /// Constructs ulid from an array of 16 bytes
        constexpr ulid(const std::array<uint8_t, 16> & src) noexcept:
            bytes(src)
        {}

        /// Constructs ulid from its millisecond timestamp and 10 bytes of randomness
        constexpr ulid(uint64_t timestamp, const std::array<uint8_t, 10> & random) noexcept {
            auto dest = impl::write_bytes<6>(timestamp, this->bytes.data());
            std::copy(random.begin(), random.end(), dest);
        }

        /// Returns a Max ULID
        static constexpr ulid max() noexcept
            { return ulid("7ZZZZZZZZZZZZZZZZZZZZZZZZZ"); }

        /// Returns the millisecond timestamp
        constexpr auto timestamp() const noexcept -> uint64_t {
            uint64_t ret;
            impl::read_bytes<6>(this->bytes.data(), ret);
            return ret;
        }

        /// Returns the random component
        constexpr auto random() const noexcept -> std::array<uint8_t, 10> {
            std::array<uint8_t, 10> ret;
            std::copy(this->bytes.begin() + 6, this->bytes.end(), ret.begin());
            return ret;
        }

        constexpr friend auto operator==(const ulid & lhs, const ulid & rhs) noexcept -> bool = default;
        constexpr friend auto operator<=>(const ulid & lhs, const ulid & rhs) noexcept -> std::strong_ordering = default;

        /// Parses ulid from a string. Case insensitive, must be exactly 26 characters.
        static constexpr std::optional<ulid> from_chars(std::string_view src) noexcept {
            if (src.size() != ulid::char_length)
                return std::nullopt;
            ulid ret;
            if (!impl::read_base32<16>(src.data(), ret.bytes))
                return std::nullopt;
            return ret;
        }

        /// Parses ulid from a string, throwing error with errc::malformed_text on failure
        static auto parse(std::string_view src) -> ulid {
            if (auto ret = ulid::from_chars(src))
                return *ret;
            throw error(errc::malformed_text, "'" + std::string(src) + "' is not a valid ULID");
        }

        /// Formats ulid into a caller supplied buffer of at least 26 characters
        [[nodiscard]]
        constexpr bool to_chars(std::span<char> dest, format fmt = default_format) const noexcept {
            if (dest.size() < ulid::char_length)
                return false;
            impl::write_base32<16>(this->bytes, dest.data(), fmt == uppercase);
            return true;
        }

        /// Returns a character array with formatted ulid
        constexpr auto to_chars(format fmt = default_format) const noexcept -> std::array<char, ulid::char_length> {
            std::array<char, ulid::char_length> ret{};
            impl::write_base32<16>(this->bytes, ret.data(), fmt == uppercase);
            return ret;
        }

        /// Returns a string with formatted ulid
        auto to_string(format fmt = default_format) const -> std::string {
            auto buf = this->to_chars(fmt);
            return std::string(buf.data(), buf.size());
        }

        /// Prints ulid into an ostream
        friend std::ostream & operator<<(std::ostream & str, const ulid & val)
            { return impl::write_to_stream(str, val); }

        /// Reads ulid from an istream
        friend std::istream & operator>>(std::istream & str, ulid & val)
            { return impl::read_from_stream(str, val); }

        /// Returns hash code for the ulid
        friend constexpr size_t hash_value(const ulid & val) noexcept
            { return impl::hash_bytes(val.bytes); }
    };

    static_assert(sizeof(ulid) == 16);

    /**
     * Generator of ULIDs
     *
     * Within one generate_batch() call identifiers sharing a millisecond get
     * consecutive random components so the batch sorts in generation order.
     * The batch state lives in this object and is reset by every call.
     * Not safe for concurrent use; give each thread its own instance.
     */
    class ulid_generator {
    public:
        IDGEN_EXPORTED explicit ulid_generator(random_source & random = random_source::system(),
                                               clock_source & clock = clock_source::system());

        /// Generates a single ULID with fresh randomness
        IDGEN_EXPORTED auto generate(std::optional<uint64_t> timestamp = std::nullopt) -> ulid;

        /**
         * Generates `count` ULIDs sorted in generation order.
         *
         * Throws error with errc::random_overflow if the random component of
         * one millisecond would wrap. Nothing is returned in that case.
         */
        IDGEN_EXPORTED auto generate_batch(size_t count, std::optional<uint64_t> timestamp = std::nullopt) -> std::vector<ulid>;

    private:
        auto next(std::optional<uint64_t> timestamp) -> ulid;
        void reset() noexcept;

    private:
        random_source & m_random;
        clock_source & m_clock;
        std::optional<uint64_t> m_last_time;
        std::array<uint8_t, 10> m_last_random{};
    };
}

/// std::hash specialization for ulid
template<>
struct std::hash<idgen::ulid> {

    constexpr size_t operator()(const idgen::ulid & val) const noexcept {
        return hash_value(val);
    }
};


#if IDGEN_SUPPORTS_STD_FORMAT

/// ulid formatter for std::format
template<>
struct std::formatter<::idgen::ulid, char> :
    public ::idgen::impl::formatter_base<std::formatter<::idgen::ulid, char>, ::idgen::ulid>
{
    [[noreturn]] void raise_exception(const char * message) {
        throw std::format_error(message);
    }
};

#endif

#if IDGEN_SUPPORTS_FMT_FORMAT

/// ulid formatter for fmt::format
template<>
struct fmt::formatter<::idgen::ulid, char> :
    public ::idgen::impl::formatter_base<fmt::formatter<::idgen::ulid, char>, ::idgen::ulid>
{
    void raise_exception(const char * message) {
        FMT_THROW(fmt::format_error(message));
    }
};

#endif

#endif
