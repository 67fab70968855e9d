// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#ifndef HEADER_IDGEN_UUID_H_INCLUDED
#define HEADER_IDGEN_UUID_H_INCLUDED

#include <idgen/common.h>
#include <idgen/text_codec.h>
#include <idgen/entropy.h>

#include <variant>
#include <vector>

namespace idgen {

    struct uuid_parts {
        uint32_t    time_low;
        uint16_t    time_mid;
        uint16_t    time_hi_and_version;
        uint16_t    clock_seq;
        uint8_t     node[6];
    };

    class uuid {
    public:
        /// UUID variant
        /// see https://datatracker.ietf.org/doc/html/rfc4122#section-4.1.1
        /// and https://datatracker.ietf.org/doc/rfc9562/ section 4.1
        enum class variant: uint8_t {
            reserved_ncs        = 0,
            standard            = 1,
            reserved_microsoft  = 2,
            reserved_future     = 3
        };

        /// UUID type
        /// Only valid for variant::standard UUIDs
        /// see https://datatracker.ietf.org/doc/rfc9562/ section 4.2
        enum class type : uint8_t {
            none                    = 0,
            time_based              = 1,
            dce_security            = 2,
            name_based_md5          = 3,
            random                  = 4,
            name_based_sha1         = 5,
            reordered_time_based    = 6,
            unix_time_based         = 7,
            custom                  = 8
        };

        /// Whether to print uuid in lower or upper case
        enum format {
            lowercase,
            uppercase
        };

        static constexpr format default_format = lowercase;

        /// Number of characters in string representation of UUID
        static constexpr size_t char_length = 36;

        struct namespaces;
    private:
        static constexpr bool is_dash_position(size_t idx) noexcept
            { return idx == 8 || idx == 13 || idx == 18 || idx == 23; }

        static constexpr bool read(const char * str, std::array<uint8_t, 16> & dest) noexcept {
            uint8_t * out = dest.data();
            for (size_t i = 0; i < uuid::char_length; ) {
                if (is_dash_position(i)) {
                    if (str[i] != '-')
                        return false;
                    ++i;
                    continue;
                }
                if (!impl::read_hex(str + i, *out++))
                    return false;
                i += 2;
            }
            return true;
        }

        constexpr void write(char * str, format fmt) const noexcept {
            const uint8_t * src = this->bytes.data();
            for (size_t i = 0; i < uuid::char_length; ) {
                if (is_dash_position(i)) {
                    str[i++] = '-';
                    continue;
                }
                impl::write_hex(*src++, str + i, fmt == uppercase);
                i += 2;
            }
        }

    public:
        std::array<uint8_t, 16> bytes{};

    public:
        ///Constructs a Nil UUID
        constexpr uuid() noexcept = default;

        ///Constructs uuid from a string literal
        consteval uuid(const char (&src)[uuid::char_length + 1]) noexcept {
            if (!uuid::read(src, this->bytes) || src[uuid::char_length] != 0)
                impl::invalid_constexpr_call("invalid uuid string");
        }

        /// Constructs uuid from a span of 16 byte-like objects
        template<impl::byte_like Byte>
        constexpr uuid(std::span<Byte, 16> src) noexcept {
            std::transform(src.begin(), src.end(), this->bytes.begin(), [](Byte b) { return uint8_t(b); });
        }

        /// Constructs uuid from an array of 16 bytes
        constexpr uuid(const std::array<uint8_t, 16> & src) noexcept:
            bytes(src)
        {}

        /// Constructs uuid from a uuid_parts struct
        constexpr uuid(const uuid_parts & parts) noexcept {
            auto dest = this->bytes.data();
            dest = impl::write_bytes(parts.time_low, dest);
            dest = impl::write_bytes(parts.time_mid, dest);
            dest = impl::write_bytes(parts.time_hi_and_version, dest);
            dest = impl::write_bytes(parts.clock_seq, dest);
            std::copy(std::begin(parts.node), std::end(parts.node), dest);
        }

        /// Generates a version 3 UUID
        IDGEN_EXPORTED static auto generate_md5(uuid ns, std::string_view name) -> uuid;
        /// Generates a version 5 UUID
        IDGEN_EXPORTED static auto generate_sha1(uuid ns, std::string_view name) -> uuid;

        /// Returns a Max UUID
        static constexpr uuid max() noexcept
            { return uuid("ffffffff-ffff-ffff-ffff-ffffffffffff"); }

        /// Returns the UUID variant
        constexpr auto get_variant() const noexcept -> variant {
            uint8_t val = this->bytes[8];
            if ((val & 0x80) == 0)
                return variant::reserved_ncs;
            if ((val & 0x40) == 0)
                return variant::standard;
            if ((val & 0x20) == 0)
                return variant::reserved_microsoft;
            return variant::reserved_future;
        }

        /// Returns the UUID type
        /// Only meaningful if get_variant() returns variant::standard
        constexpr auto get_type() const noexcept -> type {
            return static_cast<type>(this->bytes[6] >> 4);
        }

        /// Overwrites version and variant bits, leaving all others alone
        constexpr void stamp(type version) noexcept {
            this->bytes[6] = uint8_t((this->bytes[6] & 0x0F) | (uint8_t(version) << 4));
            this->bytes[8] = uint8_t((this->bytes[8] & 0x3F) | 0x80);
        }

        constexpr friend auto operator==(const uuid & lhs, const uuid & rhs) noexcept -> bool = default;
        constexpr friend auto operator<=>(const uuid & lhs, const uuid & rhs) noexcept -> std::strong_ordering = default;

        /// Converts uuid to a uuid_parts struct
        constexpr auto to_parts() const noexcept -> uuid_parts {
            uuid_parts ret;
            auto ptr = this->bytes.data();
            ptr = impl::read_bytes(ptr, ret.time_low);
            ptr = impl::read_bytes(ptr, ret.time_mid);
            ptr = impl::read_bytes(ptr, ret.time_hi_and_version);
            ptr = impl::read_bytes(ptr, ret.clock_seq);
            std::copy(ptr, ptr + 6, ret.node);
            return ret;
        }

        /// Parses uuid from a string. Case insensitive, must be exactly 36 characters.
        static constexpr std::optional<uuid> from_chars(std::string_view src) noexcept {
            if (src.size() != uuid::char_length)
                return std::nullopt;
            uuid ret;
            if (!uuid::read(src.data(), ret.bytes))
                return std::nullopt;
            return ret;
        }

        /// Parses uuid from a string, throwing error with errc::malformed_text on failure
        static auto parse(std::string_view src) -> uuid {
            if (auto ret = uuid::from_chars(src))
                return *ret;
            throw error(errc::malformed_text, "'" + std::string(src) + "' is not a valid UUID");
        }

        /// Formats uuid into a caller supplied buffer of at least 36 characters
        [[nodiscard]]
        constexpr bool to_chars(std::span<char> dest, format fmt = lowercase) const noexcept {
            if (dest.size() < uuid::char_length)
                return false;
            this->write(dest.data(), fmt);
            return true;
        }

        /// Returns a character array with formatted uuid
        constexpr auto to_chars(format fmt = lowercase) const noexcept -> std::array<char, uuid::char_length> {
            std::array<char, uuid::char_length> ret{};
            this->write(ret.data(), fmt);
            return ret;
        }

        /// Returns a string with formatted uuid
        auto to_string(format fmt = lowercase) const -> std::string {
            auto buf = this->to_chars(fmt);
            return std::string(buf.data(), buf.size());
        }

        /// Prints uuid into an ostream
        friend std::ostream & operator<<(std::ostream & str, const uuid & val)
            { return impl::write_to_stream(str, val); }

        /// Reads uuid from an istream
        friend std::istream & operator>>(std::istream & str, uuid & val)
            { return impl::read_from_stream(str, val); }

        /// Returns hash code for the uuid
        friend constexpr size_t hash_value(const uuid & val) noexcept
            { return impl::hash_bytes(val.bytes); }
    };

    static_assert(sizeof(uuid) == 16);

    /// Well-known namespaces for uuid::generate_md5() and uuid::generate_sha1()
    struct uuid::namespaces {
        /// Name string is a fully-qualified domain name
        static constexpr uuid dns{"6ba7b810-9dad-11d1-80b4-00c04fd430c8"};

        /// Name string is a URL
        static constexpr uuid url{"6ba7b811-9dad-11d1-80b4-00c04fd430c8"};

        /// Name string is an ISO OID
        static constexpr uuid oid{"6ba7b812-9dad-11d1-80b4-00c04fd430c8"};

        /// Name string is an X.500 DN (in DER or a text output format)
        static constexpr uuid x500{"6ba7b814-9dad-11d1-80b4-00c04fd430c8"};

        /// Looks up a well-known namespace by its case-insensitive name
        IDGEN_EXPORTED static auto find(std::string_view name) noexcept -> std::optional<uuid>;

        namespaces() = delete;
        ~namespaces() = delete;
        namespaces(const namespaces &) = delete;
        namespaces & operator=(const namespaces &) = delete;
    };

    /// Inputs of a version 1 UUID
    struct time_based_request {
        /// 100ns ticks since 1582-10-15. Must fit in 60 bits.
        std::optional<uint64_t> timestamp;
        std::optional<std::array<uint8_t, 6>> node_id;
    };

    /// Inputs of a version 3 UUID
    struct md5_request {
        uuid ns;
        std::string name;
    };

    /// Inputs of a version 4 UUID
    struct random_request {};

    /// Inputs of a version 5 UUID
    struct sha1_request {
        uuid ns;
        std::string name;
    };

    /// Inputs of a version 6 UUID
    struct reordered_time_based_request {
        /// 100ns ticks since 1582-10-15. Must fit in 60 bits.
        std::optional<uint64_t> timestamp;
        std::optional<std::array<uint8_t, 6>> node_id;
    };

    /// Inputs of a version 7 UUID
    struct unix_time_based_request {
        /// Milliseconds since Unix epoch. Must fit in 48 bits.
        std::optional<uint64_t> timestamp;
    };

    /// Inputs of a version 8 UUID
    struct custom_request {
        /// At most 16 bytes. Shorter payloads are zero padded on the right.
        std::vector<uint8_t> data;
    };

    using uuid_request = std::variant<time_based_request,
                                      md5_request,
                                      random_request,
                                      sha1_request,
                                      reordered_time_based_request,
                                      unix_time_based_request,
                                      custom_request>;

    /// Returns the UUID version produced by a request
    IDGEN_EXPORTED auto version_of(const uuid_request & request) noexcept -> uuid::type;

    /**
     * Generator of all supported UUID versions
     *
     * Owns the random node id used by time based versions when the request
     * does not supply one. Not safe for concurrent use; give each thread its
     * own instance.
     */
    class uuid_generator {
    public:
        IDGEN_EXPORTED explicit uuid_generator(random_source & random = random_source::system(),
                                               clock_source & clock = clock_source::system());

        /// Generates a UUID of the version selected by the request
        IDGEN_EXPORTED auto generate(const uuid_request & request) -> uuid;

        /// Generates a version 1 UUID
        IDGEN_EXPORTED auto generate_time_based(const time_based_request & request = {}) -> uuid;
        /// Generates a version 4 UUID
        IDGEN_EXPORTED auto generate_random() -> uuid;
        /// Generates a version 6 UUID
        IDGEN_EXPORTED auto generate_reordered_time_based(const reordered_time_based_request & request = {}) -> uuid;
        /// Generates a version 7 UUID
        IDGEN_EXPORTED auto generate_unix_time_based(const unix_time_based_request & request = {}) -> uuid;
        /// Generates a version 8 UUID
        IDGEN_EXPORTED static auto generate_custom(std::span<const uint8_t> data) -> uuid;

        /// Returns the node id used when a request does not supply one
        auto node_id() const noexcept -> std::span<const uint8_t, 6>
            { return m_node_id; }

    private:
        auto gregorian_ticks(std::optional<uint64_t> timestamp) -> uint64_t;
        auto clock_sequence() -> uint16_t;
        auto resolve_node_id(const std::optional<std::array<uint8_t, 6>> & node_id) const noexcept
            -> const std::array<uint8_t, 6> &;

    private:
        random_source & m_random;
        clock_source & m_clock;
        std::array<uint8_t, 6> m_node_id;
    };
}

/// std::hash specialization for uuid
template<>
struct std::hash<idgen::uuid> {

    constexpr size_t operator()(const idgen::uuid & val) const noexcept {
        return hash_value(val);
    }
};


#if IDGEN_SUPPORTS_STD_FORMAT

/// uuid formatter for std::format
template<>
struct std::formatter<::idgen::uuid, char> :
    public ::idgen::impl::formatter_base<std::formatter<::idgen::uuid, char>, ::idgen::uuid>
{
    [[noreturn]] void raise_exception(const char * message) {
        throw std::format_error(message);
    }
};

#endif

#if IDGEN_SUPPORTS_FMT_FORMAT

/// uuid formatter for fmt::format
template<>
struct fmt::formatter<::idgen::uuid, char> :
    public ::idgen::impl::formatter_base<fmt::formatter<::idgen::uuid, char>, ::idgen::uuid>
{
    void raise_exception(const char * message) {
        FMT_THROW(fmt::format_error(message));
    }
};

#endif

#endif
