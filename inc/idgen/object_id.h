// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#ifndef HEADER_IDGEN_OBJECT_ID_H_INCLUDED
#define HEADER_IDGEN_OBJECT_ID_H_INCLUDED

#include <idgen/common.h>
#include <idgen/text_codec.h>
#include <idgen/entropy.h>

namespace idgen {

    /// MongoDB/BSON ObjectId
    class object_id {
    public:
        /// Whether to print object_id in lower or upper case
        enum format {
            lowercase,
            uppercase
        };

        static constexpr format default_format = lowercase;

        /// Number of characters in string representation of ObjectId
        static constexpr size_t char_length = 24;

        /// Counter values wrap at this modulus
        static constexpr uint32_t counter_modulus = uint32_t(1) << 24;

    private:
        static constexpr bool read(const char * str, std::array<uint8_t, 12> & dest) noexcept {
            for (size_t i = 0; i < dest.size(); ++i) {
                if (!impl::read_hex(str + 2 * i, dest[i]))
                    return false;
            }
            return true;
        }

        constexpr void write(char * str, format fmt) const noexcept {
            for (size_t i = 0; i < this->bytes.size(); ++i)
                impl::write_hex(this->bytes[i], str + 2 * i, fmt == uppercase);
        }

    public:
        std::array<uint8_t, 12> bytes{};

    public:
        ///Constructs a zeroed out ObjectId
        constexpr object_id() noexcept = default;

        ///Constructs object_id from a string literal
        consteval object_id(const char (&src)[object_id::char_length + 1]) noexcept {
            if (!object_id::read(src, this->bytes) || src[object_id::char_length] != 0)
                impl::invalid_constexpr_call("invalid object id string");
        }

        /// Constructs object_id from an array of 12 bytes
        constexpr object_id(const std::array<uint8_t, 12> & src) noexcept:
            bytes(src)
        {}

        /// Constructs object_id from its parts. Only the low 24 bits of counter are used.
        constexpr object_id(uint32_t timestamp, const std::array<uint8_t, 5> & process_unique, uint32_t counter) noexcept {
            auto dest = impl::write_bytes(timestamp, this->bytes.data());
            dest = std::copy(process_unique.begin(), process_unique.end(), dest);
            impl::write_bytes<3>(counter, dest);
        }

        /// Returns the timestamp in seconds since Unix epoch
        constexpr auto timestamp() const noexcept -> uint32_t {
            uint32_t ret;
            impl::read_bytes(this->bytes.data(), ret);
            return ret;
        }

        /// Returns the per-process random component
        constexpr auto process_unique() const noexcept -> std::array<uint8_t, 5> {
            std::array<uint8_t, 5> ret;
            std::copy(this->bytes.begin() + 4, this->bytes.begin() + 9, ret.begin());
            return ret;
        }

        /// Returns the 24-bit counter
        constexpr auto counter() const noexcept -> uint32_t {
            uint32_t ret;
            impl::read_bytes<3>(this->bytes.data() + 9, ret);
            return ret;
        }

        constexpr friend auto operator==(const object_id & lhs, const object_id & rhs) noexcept -> bool = default;
        constexpr friend auto operator<=>(const object_id & lhs, const object_id & rhs) noexcept -> std::strong_ordering = default;

        /// Parses object_id from a string. Case insensitive, must be exactly 24 characters.
        static constexpr std::optional<object_id> from_chars(std::string_view src) noexcept {
            if (src.size() != object_id::char_length)
                return std::nullopt;
            object_id ret;
            if (!object_id::read(src.data(), ret.bytes))
                return std::nullopt;
            return ret;
        }

        /// Parses object_id from a string, throwing error with errc::malformed_text on failure
        static auto parse(std::string_view src) -> object_id {
            if (auto ret = object_id::from_chars(src))
                return *ret;
            throw error(errc::malformed_text, "'" + std::string(src) + "' is not a valid ObjectId");
        }

        /// Formats object_id into a caller supplied buffer of at least 24 characters
        [[nodiscard]]
        constexpr bool to_chars(std::span<char> dest, format fmt = lowercase) const noexcept {
            if (dest.size() < object_id::char_length)
                return false;
            this->write(dest.data(), fmt);
            return true;
        }

        /// Returns a character array with formatted object_id
        constexpr auto to_chars(format fmt = lowercase) const noexcept -> std::array<char, object_id::char_length> {
            std::array<char, object_id::char_length> ret{};
            this->write(ret.data(), fmt);
            return ret;
        }

        /// Returns a string with formatted object_id
        auto to_string(format fmt = lowercase) const -> std::string {
            auto buf = this->to_chars(fmt);
            return std::string(buf.data(), buf.size());
        }

        /// Prints object_id into an ostream
        friend std::ostream & operator<<(std::ostream & str, const object_id & val)
            { return impl::write_to_stream(str, val); }

        /// Reads object_id from an istream
        friend std::istream & operator>>(std::istream & str, object_id & val)
            { return impl::read_from_stream(str, val); }

        /// Returns hash code for the object_id
        friend constexpr size_t hash_value(const object_id & val) noexcept
            { return impl::hash_bytes(val.bytes); }
    };

    static_assert(sizeof(object_id) == 12);

    /**
     * Generator of ObjectIds
     *
     * The 5 byte random component and the counter start are drawn once at
     * construction. Each generate() call uses the next counter value, wrapping
     * modulo 2^24. Not safe for concurrent use; give each thread its own instance.
     */
    class object_id_generator {
    public:
        IDGEN_EXPORTED explicit object_id_generator(random_source & random = random_source::system(),
                                                    clock_source & clock = clock_source::system());

        /// Generates an ObjectId. timestamp is in seconds since Unix epoch and must fit in 32 bits.
        IDGEN_EXPORTED auto generate(std::optional<uint64_t> timestamp = std::nullopt) -> object_id;

        auto process_unique() const noexcept -> const std::array<uint8_t, 5> &
            { return m_process_unique; }

    private:
        clock_source & m_clock;
        std::array<uint8_t, 5> m_process_unique;
        uint32_t m_counter;
    };
}

/// std::hash specialization for object_id
template<>
struct std::hash<idgen::object_id> {

    constexpr size_t operator()(const idgen::object_id & val) const noexcept {
        return hash_value(val);
    }
};


#if IDGEN_SUPPORTS_STD_FORMAT

/// object_id formatter for std::format
template<>
struct std::formatter<::idgen::object_id, char> :
    public ::idgen::impl::formatter_base<std::formatter<::idgen::object_id, char>, ::idgen::object_id>
{
    [[noreturn]] void raise_exception(const char * message) {
        throw std::format_error(message);
    }
};

#endif

#if IDGEN_SUPPORTS_FMT_FORMAT

/// object_id formatter for fmt::format
template<>
struct fmt::formatter<::idgen::object_id, char> :
    public ::idgen::impl::formatter_base<fmt::formatter<::idgen::object_id, char>, ::idgen::object_id>
{
    void raise_exception(const char * message) {
        FMT_THROW(fmt::format_error(message));
    }
};

#endif

#endif
