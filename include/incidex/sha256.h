#ifndef INCIDEX_SHA256_H
#define INCIDEX_SHA256_H

#include <algorithm>
#include <array>
#include <cstdint>
#include <cstring>
#include <string>

namespace incidex::crypto {

    /**
     * @brief Streaming SHA-256 (FIPS 180-4).
     */
    class SHA256 {
    public:
        using Digest = std::array<uint8_t, 32>;

        SHA256() { reset(); }

        void reset() {
            m_state = {0x6a09e667, 0xbb67ae85, 0x3c6ef372, 0xa54ff53a,
                       0x510e527f, 0x9b05688c, 0x1f83d9ab, 0x5be0cd19};
            m_buffered = 0;
            m_total_bytes = 0;
        }

        void update(const void* data, size_t len) {
            const auto* bytes = static_cast<const uint8_t*>(data);
            m_total_bytes += len;
            while (len > 0) {
                size_t take = std::min(len, m_block.size() - m_buffered);
                std::memcpy(m_block.data() + m_buffered, bytes, take);
                m_buffered += take;
                bytes += take;
                len -= take;
                if (m_buffered == m_block.size()) {
                    compress(m_block.data());
                    m_buffered = 0;
                }
            }
        }

        void update(const std::string& text) { update(text.data(), text.size()); }

        Digest digest() {
            const uint64_t bit_length = m_total_bytes * 8;
            const uint8_t pad_start = 0x80;
            update(&pad_start, 1);
            const uint8_t zero = 0x00;
            while (m_buffered != 56) update(&zero, 1);

            uint8_t length_be[8];
            for (int i = 0; i < 8; ++i) {
                length_be[i] = static_cast<uint8_t>(bit_length >> (56 - 8 * i));
            }
            update(length_be, 8);

            Digest out{};
            for (size_t i = 0; i < m_state.size(); ++i) {
                out[i * 4] = static_cast<uint8_t>(m_state[i] >> 24);
                out[i * 4 + 1] = static_cast<uint8_t>(m_state[i] >> 16);
                out[i * 4 + 2] = static_cast<uint8_t>(m_state[i] >> 8);
                out[i * 4 + 3] = static_cast<uint8_t>(m_state[i]);
            }
            reset();
            return out;
        }

        static Digest hash(const std::string& text) {
            SHA256 h;
            h.update(text);
            return h.digest();
        }

        static std::string to_hex(const Digest& digest) {
            static const char* hex = "0123456789abcdef";
            std::string out;
            out.reserve(digest.size() * 2);
            for (uint8_t b : digest) {
                out.push_back(hex[b >> 4]);
                out.push_back(hex[b & 0x0f]);
            }
            return out;
        }

        /**
         * @brief Remainder of the digest read as a big-endian unsigned integer.
         */
        static uint32_t mod(const Digest& digest, uint32_t modulus) {
            uint64_t rem = 0;
            for (uint8_t b : digest) {
                rem = ((rem << 8) | b) % modulus;
            }
            return static_cast<uint32_t>(rem);
        }

    private:
        std::array<uint32_t, 8> m_state{};
        std::array<uint8_t, 64> m_block{};
        size_t m_buffered = 0;
        uint64_t m_total_bytes = 0;

        static uint32_t rotr(uint32_t x, int n) { return (x >> n) | (x << (32 - n)); }

        void compress(const uint8_t* block) {
            static const uint32_t k[64] = {
                0x428a2f98, 0x71374491, 0xb5c0fbcf, 0xe9b5dba5, 0x3956c25b, 0x59f111f1, 0x923f82a4, 0xab1c5ed5,
                0xd807aa98, 0x12835b01, 0x243185be, 0x550c7dc3, 0x72be5d74, 0x80deb1fe, 0x9bdc06a7, 0xc19bf174,
                0xe49b69c1, 0xefbe4786, 0x0fc19dc6, 0x240ca1cc, 0x2de92c6f, 0x4a7484aa, 0x5cb0a9dc, 0x76f988da,
                0x983e5152, 0xa831c66d, 0xb00327c8, 0xbf597fc7, 0xc6e00bf3, 0xd5a79147, 0x06ca6351, 0x14292967,
                0x27b70a85, 0x2e1b2138, 0x4d2c6dfc, 0x53380d13, 0x650a7354, 0x766a0abb, 0x81c2c92e, 0x92722c85,
                0xa2bfe8a1, 0xa81a664b, 0xc24b8b70, 0xc76c51a3, 0xd192e819, 0xd6990624, 0xf40e3585, 0x106aa070,
                0x19a4c116, 0x1e376c08, 0x2748774c, 0x34b0bcb5, 0x391c0cb3, 0x4ed8aa4a, 0x5b9cca4f, 0x682e6ff3,
                0x748f82ee, 0x78a5636f, 0x84c87814, 0x8cc70208, 0x90befffa, 0xa4506ceb, 0xbef9a3f7, 0xc67178f2
            };

            uint32_t w[64];
            for (int i = 0; i < 16; ++i) {
                w[i] = (uint32_t(block[i * 4]) << 24) | (uint32_t(block[i * 4 + 1]) << 16) |
                       (uint32_t(block[i * 4 + 2]) << 8) | uint32_t(block[i * 4 + 3]);
            }
            for (int i = 16; i < 64; ++i) {
                uint32_t s0 = rotr(w[i - 15], 7) ^ rotr(w[i - 15], 18) ^ (w[i - 15] >> 3);
                uint32_t s1 = rotr(w[i - 2], 17) ^ rotr(w[i - 2], 19) ^ (w[i - 2] >> 10);
                w[i] = w[i - 16] + s0 + w[i - 7] + s1;
            }

            uint32_t a = m_state[0], b = m_state[1], c = m_state[2], d = m_state[3];
            uint32_t e = m_state[4], f = m_state[5], g = m_state[6], h = m_state[7];

            for (int i = 0; i < 64; ++i) {
                uint32_t s1 = rotr(e, 6) ^ rotr(e, 11) ^ rotr(e, 25);
                uint32_t ch = (e & f) ^ (~e & g);
                uint32_t t1 = h + s1 + ch + k[i] + w[i];
                uint32_t s0 = rotr(a, 2) ^ rotr(a, 13) ^ rotr(a, 22);
                uint32_t maj = (a & b) ^ (a & c) ^ (b & c);
                uint32_t t2 = s0 + maj;
                h = g; g = f; f = e; e = d + t1;
                d = c; c = b; b = a; a = t1 + t2;
            }

            m_state[0] += a; m_state[1] += b; m_state[2] += c; m_state[3] += d;
            m_state[4] += e; m_state[5] += f; m_state[6] += g; m_state[7] += h;
        }
    };

}

#endif
