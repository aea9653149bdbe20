#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace reprise::util {

class PathHasher {
public:
    static constexpr size_t DIGEST_SIZE = 16;
    static constexpr size_t HEX_LENGTH = DIGEST_SIZE * 2;

    // Unkeyed BLAKE2b with a 16-byte digest (returns 32-char lowercase hex string used as record file name).
    static std::string hash_path(std::string_view relative_path);

    // True for names a record file can have: exactly 32 characters of [0-9a-z].
    static bool is_hash_name(std::string_view name);

private:
    // BLAKE2b internal implementation
    static constexpr size_t BLAKE2B_BLOCK_SIZE = 128;

    static void blake2b(const uint8_t* data, size_t len, uint8_t* out, size_t out_len);
    static void compress(uint64_t h[8], const uint8_t* block, uint64_t counter, bool last);
    static std::string to_hex(const uint8_t* bytes, size_t len);

    static uint64_t rotr(uint64_t x, unsigned n);
    static uint64_t load64(const uint8_t* p);
};

}  // namespace reprise::util
