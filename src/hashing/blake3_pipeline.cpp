/**
 * @file blake3_pipeline.cpp
 * @brief BLAKE3 hashing implementation
 */

#include <hashing/blake3_pipeline.hpp>
#include <sstream>
#include <iomanip>
#include <stdexcept>
#include <thread>
#include <algorithm>
#include <cctype>

namespace PhishLedger {

BLAKE3Pipeline::Hash BLAKE3Pipeline::hash(const void* data, size_t len) {
    Hash result;

    blake3_hasher hasher;
    blake3_hasher_init(&hasher);
    blake3_hasher_update(&hasher, data, len);
    blake3_hasher_finalize(&hasher, result.data(), HASH_SIZE);

    return result;
}

std::vector<BLAKE3Pipeline::Hash> BLAKE3Pipeline::hash_batch(const std::vector<std::string>& inputs) {
    std::vector<Hash> results(inputs.size());

    const size_t num_threads = std::min(
        static_cast<size_t>(std::thread::hardware_concurrency()),
        inputs.size()
    );

    if (num_threads <= 1 || inputs.size() < 100) {
        // Serial for small batches
        for (size_t i = 0; i < inputs.size(); ++i) {
            results[i] = hash(inputs[i]);
        }
        return results;
    }

    std::vector<std::thread> threads;
    size_t chunk_size = (inputs.size() + num_threads - 1) / num_threads;

    for (size_t t = 0; t < num_threads; ++t) {
        size_t start = t * chunk_size;
        size_t end = std::min(start + chunk_size, inputs.size());

        if (start >= inputs.size()) break;

        threads.emplace_back([&, start, end]() {
            for (size_t i = start; i < end; ++i) {
                results[i] = hash(inputs[i]);
            }
        });
    }

    for (auto& thread : threads) {
        thread.join();
    }

    return results;
}

std::string BLAKE3Pipeline::to_hex(const Hash& hash) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');

    for (uint8_t byte : hash) {
        oss << std::setw(2) << static_cast<int>(byte);
    }

    return oss.str();
}

BLAKE3Pipeline::Hash BLAKE3Pipeline::from_hex(const std::string& hex) {
    Hash result = {0};
    std::string clean = hex;
    // Remove hyphens if present (UUID format)
    clean.erase(std::remove(clean.begin(), clean.end(), '-'), clean.end());

    if (clean.size() != HASH_SIZE * 2) {
        throw std::invalid_argument("Invalid hex string length: " + std::to_string(clean.size()) + ". Expected 32 (128-bit).");
    }
    if (!std::all_of(clean.begin(), clean.end(), [](unsigned char c) { return std::isxdigit(c) != 0; })) {
        throw std::invalid_argument("Invalid hex string: " + hex);
    }

    for (size_t i = 0; i < HASH_SIZE; ++i) {
        result[i] = static_cast<uint8_t>(std::stoul(clean.substr(i * 2, 2), nullptr, 16));
    }

    return result;
}

} // namespace PhishLedger
