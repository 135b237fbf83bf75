/**
 * @file url.hpp
 * @brief URL normalization used as the registry's deduplication form
 */

#pragma once

#include <string>

namespace PhishLedger {

/**
 * @brief Canonical form of a submitted URL
 *
 * Trims surrounding whitespace, lower-cases the scheme and host (user info,
 * path and query keep their case) and drops any #fragment. Input without a
 * "scheme://" prefix is treated as starting with the host.
 * Returns an empty string for blank input.
 */
std::string normalize_url(const std::string& url);

/**
 * @brief Host part of a URL, lower-cased, without user info or port
 *
 * Returns an empty string when no host can be found.
 */
std::string extract_domain(const std::string& url);

} // namespace PhishLedger
