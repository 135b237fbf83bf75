/**
 * @file blake3_pipeline.hpp
 * @brief BLAKE3 content hashing for URL deduplication keys
 */

#pragma once

#include <vector>
#include <array>
#include <cstdint>
#include <string>
#include <string_view>

extern "C" {
#include <blake3.h>
}

namespace PhishLedger {

/**
 * @brief BLAKE3 hashing truncated to 128 bits
 *
 * SAME URL = SAME HASH. The hex form is what lands in urls.url_hash.
 */
class BLAKE3Pipeline {
public:
    static constexpr size_t HASH_SIZE = 16; // 128 bits
    using Hash = std::array<uint8_t, HASH_SIZE>;

    /**
     * @brief Hash single buffer
     * @param data Input data
     * @param len Length in bytes
     * @return 16-byte BLAKE3 hash
     */
    static Hash hash(const void* data, size_t len);

    /**
     * @brief Hash string
     */
    static Hash hash(std::string_view str) {
        return hash(str.data(), str.size());
    }

    /**
     * @brief Batch hash multiple inputs (parallel for large batches)
     * @return Vector of hashes (same order)
     */
    static std::vector<Hash> hash_batch(const std::vector<std::string>& inputs);

    /**
     * @brief Convert hash to lowercase hex string (32 chars)
     */
    static std::string to_hex(const Hash& hash);

    /**
     * @brief Convert hex string to hash; hyphens are ignored
     * @throws std::invalid_argument on wrong length or non-hex input
     */
    static Hash from_hex(const std::string& hex);
};

} // namespace PhishLedger
