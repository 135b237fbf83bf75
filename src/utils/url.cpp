/**
 * @file url.cpp
 * @brief URL normalization and domain extraction
 */

#include <utils/url.hpp>
#include <utils/text.hpp>

namespace PhishLedger {

namespace {

struct UrlParts {
    std::string scheme;     // without "://", empty when absent
    std::string authority;  // userinfo@host:port
    std::string rest;       // path, query
};

UrlParts split_url(const std::string& url) {
    UrlParts parts;
    size_t authority_start = 0;

    size_t scheme_end = url.find("://");
    if (scheme_end != std::string::npos && url.find_first_of("/?", 0) > scheme_end) {
        parts.scheme = url.substr(0, scheme_end);
        authority_start = scheme_end + 3;
    }

    size_t authority_end = url.find_first_of("/?", authority_start);
    if (authority_end == std::string::npos) authority_end = url.size();

    parts.authority = url.substr(authority_start, authority_end - authority_start);
    parts.rest = url.substr(authority_end);
    return parts;
}

} // namespace

std::string normalize_url(const std::string& url) {
    std::string trimmed = trim(url);

    size_t fragment = trimmed.find('#');
    if (fragment != std::string::npos) {
        trimmed = trimmed.substr(0, fragment);
    }
    if (trimmed.empty()) return "";

    UrlParts parts = split_url(trimmed);

    // Credentials before '@' are case-sensitive
    size_t at = parts.authority.rfind('@');
    std::string userinfo = (at == std::string::npos) ? "" : parts.authority.substr(0, at + 1);
    std::string hostport = (at == std::string::npos) ? parts.authority : parts.authority.substr(at + 1);

    std::string result;
    if (!parts.scheme.empty()) {
        result = to_lower(parts.scheme) + "://";
    }
    result += userinfo + to_lower(hostport) + parts.rest;
    return result;
}

std::string extract_domain(const std::string& url) {
    std::string normalized = normalize_url(url);
    if (normalized.empty()) return "";

    std::string host = split_url(normalized).authority;

    size_t at = host.rfind('@');
    if (at != std::string::npos) host = host.substr(at + 1);

    if (!host.empty() && host.front() == '[') {
        // IPv6 literal: keep the bracketed address, drop any port
        size_t close = host.find(']');
        return close == std::string::npos ? "" : host.substr(0, close + 1);
    }

    size_t port = host.find(':');
    if (port != std::string::npos) host = host.substr(0, port);

    return host;
}

} // namespace PhishLedger
