#include "util/PathHasher.hpp"
#include <cstring>

namespace reprise::util {

// BLAKE2b initialization vector (same words as the SHA-512 IV)
static constexpr uint64_t IV[8] = {
    0x6a09e667f3bcc908ULL, 0xbb67ae8584caa73bULL, 0x3c6ef372fe94f82bULL, 0xa54ff53a5f1d36f1ULL,
    0x510e527fade682d1ULL, 0x9b05688c2b3e6c1fULL, 0x1f83d9abfb41bd6bULL, 0x5be0cd19137e2179ULL
};

// Message word schedule; rounds 10 and 11 reuse rows 0 and 1
static constexpr uint8_t SIGMA[10][16] = {
    { 0,  1,  2,  3,  4,  5,  6,  7,  8,  9, 10, 11, 12, 13, 14, 15},
    {14, 10,  4,  8,  9, 15, 13,  6,  1, 12,  0,  2, 11,  7,  5,  3},
    {11,  8, 12,  0,  5,  2, 15, 13, 10, 14,  3,  6,  7,  1,  9,  4},
    { 7,  9,  3,  1, 13, 12, 11, 14,  2,  6,  5, 10,  4,  0, 15,  8},
    { 9,  0,  5,  7,  2,  4, 10, 15, 14,  1, 11, 12,  6,  8,  3, 13},
    { 2, 12,  6, 10,  0, 11,  8,  3,  4, 13,  7,  5, 15, 14,  1,  9},
    {12,  5,  1, 15, 14, 13,  4, 10,  0,  7,  6,  3,  9,  2,  8, 11},
    {13, 11,  7, 14, 12,  1,  3,  9,  5,  0, 15,  4,  8,  6,  2, 10},
    { 6, 15, 14,  9, 11,  3,  0,  8, 12,  2, 13,  7,  1,  4, 10,  5},
    {10,  2,  8,  4,  7,  6,  1,  5, 15, 11,  9, 14,  3, 12, 13,  0}
};

static constexpr int ROUNDS = 12;

uint64_t PathHasher::rotr(uint64_t x, unsigned n) {
    return (x >> n) | (x << (64 - n));
}

uint64_t PathHasher::load64(const uint8_t* p) {
    uint64_t v = 0;
    for (int i = 7; i >= 0; --i) {
        v = (v << 8) | p[i];
    }
    return v;
}

void PathHasher::compress(uint64_t h[8], const uint8_t* block, uint64_t counter, bool last) {
    uint64_t m[16];
    for (int i = 0; i < 16; ++i) {
        m[i] = load64(block + i * 8);
    }

    uint64_t v[16];
    for (int i = 0; i < 8; ++i) {
        v[i] = h[i];
        v[i + 8] = IV[i];
    }
    // Byte counter is 128 bits; inputs here never exceed the low word
    v[12] ^= counter;
    if (last) v[14] = ~v[14];

    auto g = [&v](int a, int b, int c, int d, uint64_t x, uint64_t y) {
        v[a] = v[a] + v[b] + x;
        v[d] = rotr(v[d] ^ v[a], 32);
        v[c] = v[c] + v[d];
        v[b] = rotr(v[b] ^ v[c], 24);
        v[a] = v[a] + v[b] + y;
        v[d] = rotr(v[d] ^ v[a], 16);
        v[c] = v[c] + v[d];
        v[b] = rotr(v[b] ^ v[c], 63);
    };

    for (int r = 0; r < ROUNDS; ++r) {
        const uint8_t* s = SIGMA[r % 10];
        // Columns
        g(0, 4,  8, 12, m[s[0]],  m[s[1]]);
        g(1, 5,  9, 13, m[s[2]],  m[s[3]]);
        g(2, 6, 10, 14, m[s[4]],  m[s[5]]);
        g(3, 7, 11, 15, m[s[6]],  m[s[7]]);
        // Diagonals
        g(0, 5, 10, 15, m[s[8]],  m[s[9]]);
        g(1, 6, 11, 12, m[s[10]], m[s[11]]);
        g(2, 7,  8, 13, m[s[12]], m[s[13]]);
        g(3, 4,  9, 14, m[s[14]], m[s[15]]);
    }

    for (int i = 0; i < 8; ++i) {
        h[i] ^= v[i] ^ v[i + 8];
    }
}

void PathHasher::blake2b(const uint8_t* data, size_t len, uint8_t* out, size_t out_len) {
    uint64_t h[8];
    std::memcpy(h, IV, sizeof(h));
    // Parameter block: digest length, no key, fanout 1, depth 1
    h[0] ^= 0x01010000ULL ^ static_cast<uint64_t>(out_len);

    // Every block but the last is compressed as it arrives; the last one (possibly empty) is padded
    size_t offset = 0;
    while (len - offset > BLAKE2B_BLOCK_SIZE) {
        compress(h, data + offset, offset + BLAKE2B_BLOCK_SIZE, false);
        offset += BLAKE2B_BLOCK_SIZE;
    }

    uint8_t block[BLAKE2B_BLOCK_SIZE] = {};
    if (len > offset) {
        std::memcpy(block, data + offset, len - offset);
    }
    compress(h, block, len, true);

    // Little-endian output, truncated to the digest length
    for (size_t i = 0; i < out_len; ++i) {
        out[i] = static_cast<uint8_t>(h[i / 8] >> (8 * (i % 8)));
    }
}

std::string PathHasher::to_hex(const uint8_t* bytes, size_t len) {
    static constexpr char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        out += digits[bytes[i] >> 4];
        out += digits[bytes[i] & 0x0F];
    }
    return out;
}

std::string PathHasher::hash_path(std::string_view relative_path) {
    uint8_t digest[DIGEST_SIZE];
    blake2b(reinterpret_cast<const uint8_t*>(relative_path.data()), relative_path.size(),
            digest, DIGEST_SIZE);
    return to_hex(digest, DIGEST_SIZE);
}

bool PathHasher::is_hash_name(std::string_view name) {
    if (name.size() != HEX_LENGTH) return false;
    for (char c : name) {
        bool digit = (c >= '0' && c <= '9');
        bool lower = (c >= 'a' && c <= 'z');
        if (!digit && !lower) return false;
    }
    return true;
}

}  // namespace reprise::util
