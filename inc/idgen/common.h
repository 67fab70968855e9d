// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#ifndef HEADER_IDGEN_COMMON_H_INCLUDED
#define HEADER_IDGEN_COMMON_H_INCLUDED

// Config macros:
//
// The following macros must be defined identically when using and building this library:
//
// IDGEN_SHARED - set to 1 when using/building a shared library version of the library
//
// The following macro should be set when building the library itself but not when using it:
//
// IDGEN_BUILDING_IDGEN - set 1 if building the library itself.

#include <cstdint>
#include <cstring>

#include <concepts>
#include <compare>
#include <array>
#include <span>
#include <string>
#include <string_view>
#include <optional>
#include <limits>
#include <stdexcept>
#include <istream>
#include <ostream>
#include <iterator>
#include <algorithm>

#if IDGEN_SHARED
    #if defined(_WIN32) || defined(_WIN64)
        #if IDGEN_BUILDING_IDGEN
            #define IDGEN_EXPORTED __declspec(dllexport)
        #else
            #define IDGEN_EXPORTED __declspec(dllimport)
        #endif
    #elif defined(__GNUC__)
        #define IDGEN_EXPORTED [[gnu::visibility("default")]]
    #else
        #define IDGEN_EXPORTED
    #endif
#else
    #define IDGEN_EXPORTED
#endif


//See https://github.com/llvm/llvm-project/issues/77773 for the sad story of how feature test
//macros are useless with libc++
#if (__cpp_lib_format >= 201907L || (defined(_LIBCPP_VERSION) && _LIBCPP_VERSION >= 170000)) && __has_include(<format>)

    #define IDGEN_SUPPORTS_STD_FORMAT 1

#endif

#if defined(FMT_VERSION) && FMT_VERSION >= 60000 && defined(FMT_THROW)

    #define IDGEN_SUPPORTS_FMT_FORMAT 1

#endif

#if IDGEN_SUPPORTS_STD_FORMAT
    #include <format>
#endif

namespace idgen
{
    /// Error conditions reported by identifier generation and parsing
    enum class errc {
        /// Timestamp override does not fit the bit width of the requested format
        invalid_timestamp = 1,
        /// Custom UUID payload is longer than 16 bytes
        invalid_payload_length,
        /// Text is not a valid encoding of the requested identifier
        malformed_text,
        /// ULID random component would wrap within one millisecond
        random_overflow
    };

    /// Returns a stable name for an error code
    constexpr auto to_string_view(errc code) noexcept -> std::string_view {
        switch(code) {
            case errc::invalid_timestamp:       return "invalid timestamp";
            case errc::invalid_payload_length:  return "invalid payload length";
            case errc::malformed_text:          return "malformed text";
            case errc::random_overflow:         return "random overflow";
        }
        return "unknown error";
    }

    /// Exception thrown by generators and throwing parsers
    class error : public std::runtime_error {
    public:
        error(errc code, const std::string & message):
            std::runtime_error(std::string(to_string_view(code)) + ": " + message),
            m_code(code)
        {}

        auto code() const noexcept -> errc
            { return m_code; }
    private:
        errc m_code;
    };

    namespace impl {
        template<class T>
        concept byte_like = std::is_standard_layout_v<T> &&
                            sizeof(T) == sizeof(uint8_t) &&
        requires {
            static_cast<T>(uint8_t{});
            static_cast<uint8_t>(T{});
        };

        static_assert(byte_like<char>);
        static_assert(byte_like<unsigned char>);
        static_assert(byte_like<std::byte>);

        void invalid_constexpr_call(const char *);

        template<std::same_as<size_t> S>
        constexpr size_t hash_combine(S prev, S next) {
            constexpr auto digits = std::numeric_limits<S>::digits;
            static_assert(digits == 64 || digits == 32);

            if constexpr (digits == 64) {
                S x = prev + 0x9e3779b9 + next;
                const S m = 0xe9846af9b1a615d;
                x ^= x >> 32;
                x *= m;
                x ^= x >> 32;
                x *= m;
                x ^= x >> 28;
                return x;
            } else {
                S x = prev + 0x9e3779b9 + next;
                const S m1 = 0x21f0aaad;
                const S m2 = 0x735a2d97;
                x ^= x >> 16;
                x *= m1;
                x ^= x >> 15;
                x *= m2;
                x ^= x >> 15;
                return x;
            }
        }

        /// Hashes a byte array of any size, padding the tail with zeroes
        template<size_t N>
        constexpr size_t hash_bytes(const std::array<uint8_t, N> & bytes) noexcept {
            size_t ret = 0;
            for (size_t i = 0; i < N; i += sizeof(size_t)) {
                size_t chunk = 0;
                for (size_t j = 0; j < sizeof(size_t); ++j) {
                    chunk <<= 8;
                    if (i + j < N)
                        chunk |= bytes[i + j];
                }
                ret = hash_combine(ret, chunk);
            }
            return ret;
        }

        /// Writes the low `Count` bytes of val in big-endian order
        template<size_t Count, class T>
        requires(std::is_unsigned_v<T> && Count <= sizeof(T))
        constexpr uint8_t * write_bytes(T val, uint8_t * bytes) noexcept {
            for (size_t i = Count; i != 0; --i) {
                bytes[i - 1] = uint8_t(val);
                if constexpr (sizeof(T) > 1)
                    val >>= 8;
            }
            return bytes + Count;
        }

        template<class T>
        requires(std::is_unsigned_v<T>)
        constexpr uint8_t * write_bytes(T val, uint8_t * bytes) noexcept {
            return write_bytes<sizeof(T)>(val, bytes);
        }

        /// Reads `Count` big-endian bytes into val
        template<size_t Count, class T>
        requires(std::is_unsigned_v<T> && Count <= sizeof(T))
        constexpr const uint8_t * read_bytes(const uint8_t * bytes, T & val) noexcept {
            T tmp = 0;
            for (size_t i = 0; i < Count; ++i) {
                if constexpr (sizeof(T) > 1)
                    tmp <<= 8;
                tmp |= bytes[i];
            }
            val = tmp;
            return bytes + Count;
        }

        template<class T>
        requires(std::is_unsigned_v<T>)
        constexpr const uint8_t * read_bytes(const uint8_t * bytes, T & val) noexcept {
            return read_bytes<sizeof(T)>(bytes, val);
        }

        /// Common part of fmt and std formatters for identifier types
        template<class Derived, class Id>
        struct formatter_base {
            typename Id::format fmt = Id::default_format;

            template<class ParseContext>
            constexpr auto parse(ParseContext & ctx) -> typename ParseContext::iterator {
                auto it = ctx.begin();
                while(it != ctx.end()) {
                    if (*it == 'l') {
                        this->fmt = Id::lowercase; ++it;
                    } else if (*it == 'u') {
                        this->fmt = Id::uppercase; ++it;
                    } else if (*it == '}') {
                        break;
                    } else {
                        static_cast<Derived *>(this)->raise_exception("Invalid format args");
                    }
                }
                return it;
            }

            template <typename FormatContext>
            auto format(const Id & val, FormatContext & ctx) const -> decltype(ctx.out()) {
                auto buf = val.to_chars(this->fmt);
                return std::copy(buf.begin(), buf.end(), ctx.out());
            }
        };

        /// Common stream insertion for identifier types
        template<class Id>
        std::ostream & write_to_stream(std::ostream & str, const Id & val) {
            const auto flags = str.flags();
            typename Id::format fmt = Id::default_format;
            if (flags & std::ios_base::uppercase)
                fmt = Id::uppercase;
            auto buf = val.to_chars(fmt);
            std::copy(buf.begin(), buf.end(), std::ostreambuf_iterator<char>(str));
            return str;
        }

        /// Common stream extraction for identifier types
        template<class Id>
        std::istream & read_from_stream(std::istream & str, Id & val) {
            std::array<char, Id::char_length> buf;
            auto * strbuf = str.rdbuf();
            for(char & c: buf) {
                auto res = strbuf->sbumpc();
                if (res == std::char_traits<char>::eof()) {
                    str.setstate(std::ios_base::eofbit | std::ios_base::failbit);
                    return str;
                }
                c = char(res);
            }
            if (auto maybe_val = Id::from_chars(std::string_view(buf.data(), buf.size())))
                val = *maybe_val;
            else
                str.setstate(std::ios_base::failbit);
            return str;
        }
    }
}

#endif
