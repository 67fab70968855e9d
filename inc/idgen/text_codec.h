// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#ifndef HEADER_IDGEN_TEXT_CODEC_H_INCLUDED
#define HEADER_IDGEN_TEXT_CODEC_H_INCLUDED

#include <idgen/common.h>

namespace idgen::impl {

    /**
     * A case-insensitive single byte alphabet.
     *
     * `Chars` lists the lower case form of every digit in order. Upper case
     * letters decode to the same value. Anything else decodes to `size`.
     */
    template<size_t N>
    class alphabet {
    public:
        static constexpr size_t size = N - 1;

        consteval alphabet(const char (&chars)[N]) noexcept {
            for (size_t i = 0; i < size; ++i) {
                char c = chars[i];
                m_lower[i] = c;
                m_upper[i] = (c >= 'a' && c <= 'z') ? char(c - 'a' + 'A') : c;
            }
            for (auto & r: m_reverse)
                r = uint8_t(size);
            for (size_t i = 0; i < size; ++i) {
                m_reverse[uint8_t(m_lower[i])] = uint8_t(i);
                m_reverse[uint8_t(m_upper[i])] = uint8_t(i);
            }
        }

        constexpr char encode(bool uppercase, uint8_t idx) const noexcept {
            return uppercase ? m_upper[idx] : m_lower[idx];
        }

        constexpr uint8_t decode(char c) const noexcept {
            auto idx = static_cast<unsigned char>(c);
            if (idx >= m_reverse.size())
                return uint8_t(size);
            return m_reverse[idx];
        }

    private:
        std::array<char, size> m_lower{};
        std::array<char, size> m_upper{};
        std::array<uint8_t, 128> m_reverse{};
    };

    inline constexpr alphabet hex_alphabet{"0123456789abcdef"};

    // Crockford's Base32: no i, l, o or u
    inline constexpr alphabet crockford_alphabet{"0123456789abcdefghjkmnpqrstvwxyz"};

    static_assert(hex_alphabet.size == 16);
    static_assert(crockford_alphabet.size == 32);

    constexpr void write_hex(uint8_t val, char * str, bool uppercase) noexcept {
        str[0] = hex_alphabet.encode(uppercase, uint8_t(val >> 4));
        str[1] = hex_alphabet.encode(uppercase, uint8_t(val & 0x0F));
    }

    constexpr bool read_hex(const char * str, uint8_t & val) noexcept {
        uint8_t high = hex_alphabet.decode(str[0]);
        uint8_t low = hex_alphabet.decode(str[1]);
        if (high >= hex_alphabet.size || low >= hex_alphabet.size)
            return false;
        val = uint8_t((high << 4) | low);
        return true;
    }

    /// Number of Base32 characters needed to hold `Bytes` bytes
    template<size_t Bytes>
    inline constexpr size_t base32_length = (Bytes * 8 + 4) / 5;

    /**
     * Encodes bytes as a big-endian number in fixed width Base32.
     *
     * The leading character carries the leftover high bits so the output always
     * has exactly base32_length<Bytes> characters.
     */
    template<size_t Bytes>
    constexpr void write_base32(std::span<const uint8_t, Bytes> src, char * str, bool uppercase) noexcept {
        uint32_t acc = 0;
        unsigned bits = 0;
        size_t src_idx = Bytes;
        for (size_t i = base32_length<Bytes>; i != 0; --i) {
            if (bits < 5 && src_idx != 0) {
                acc |= uint32_t(src[--src_idx]) << bits;
                bits += 8;
            }
            str[i - 1] = crockford_alphabet.encode(uppercase, uint8_t(acc & 0x1F));
            acc >>= 5;
            bits = (bits >= 5 ? bits - 5 : 0);
        }
    }

    /**
     * Decodes fixed width Base32 produced by write_base32.
     *
     * Fails on characters outside the alphabet and when the leading character
     * carries bits that do not fit in `Bytes` bytes.
     */
    template<size_t Bytes>
    constexpr bool read_base32(const char * str, std::span<uint8_t, Bytes> dest) noexcept {
        uint32_t acc = 0;
        unsigned bits = 0;
        size_t dest_idx = Bytes;
        for (size_t i = base32_length<Bytes>; i != 0; --i) {
            uint8_t val = crockford_alphabet.decode(str[i - 1]);
            if (val >= crockford_alphabet.size)
                return false;
            acc |= uint32_t(val) << bits;
            bits += 5;
            if (bits >= 8 && dest_idx != 0) {
                dest[--dest_idx] = uint8_t(acc);
                acc >>= 8;
                bits -= 8;
            }
        }
        return acc == 0;
    }
}

#endif
