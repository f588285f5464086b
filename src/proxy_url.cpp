// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#include "proxy_url.hpp"

#include <algorithm>
#include <cctype>

namespace strix {

namespace {

constexpr std::string_view SCHEME_SEPARATOR = "://";
constexpr int MAX_PORT = 65535;

/**
 * @brief Raw slices of a URL, before any validation of their contents.
 */
struct UrlParts {
    std::string_view scheme;
    std::optional<std::string_view> userinfo;
    std::string_view hostport;
    std::string_view rest; ///< Path, query and fragment
};

bool is_valid_scheme_token(std::string_view scheme) {
    if (scheme.empty() || !std::isalpha(static_cast<unsigned char>(scheme.front()))) {
        return false;
    }
    return std::all_of(scheme.begin(), scheme.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '-' || c == '.';
    });
}

UrlParts split_url(std::string_view text) {
    // Leading C0 controls and spaces are not part of the URL
    while (!text.empty() && static_cast<unsigned char>(text.front()) <= 0x20) {
        text.remove_prefix(1);
    }

    const auto separator = text.find(SCHEME_SEPARATOR);
    if (separator == std::string_view::npos) {
        throw UrlParseError("missing '://' after scheme");
    }

    UrlParts parts;
    parts.scheme = text.substr(0, separator);
    if (!is_valid_scheme_token(parts.scheme)) {
        throw UrlParseError("malformed scheme '" + std::string(parts.scheme) + "'");
    }

    auto remainder = text.substr(separator + SCHEME_SEPARATOR.size());
    const auto authority_end = remainder.find_first_of("/?#");
    auto authority = remainder.substr(0, authority_end);
    if (authority_end != std::string_view::npos) {
        parts.rest = remainder.substr(authority_end);
    }

    // The last '@' separates credentials, which may themselves contain '@'
    if (const auto at = authority.rfind('@'); at != std::string_view::npos) {
        parts.userinfo = authority.substr(0, at);
        authority = authority.substr(at + 1);
    }
    parts.hostport = authority;
    return parts;
}

int hex_value(char c) {
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

// Malformed escapes are kept literally
std::string percent_decode(std::string_view value) {
    std::string result;
    result.reserve(value.size());
    for (std::size_t i = 0; i < value.size(); ++i) {
        if (value[i] == '%' && i + 2 < value.size()) {
            const int hi = hex_value(value[i + 1]);
            const int lo = hex_value(value[i + 2]);
            if (hi >= 0 && lo >= 0) {
                result += static_cast<char>(hi * 16 + lo);
                i += 2;
                continue;
            }
        }
        result += value[i];
    }
    return result;
}

int parse_port(std::string_view port_str) {
    if (port_str.empty()) {
        return 0;
    }
    if (!std::all_of(port_str.begin(), port_str.end(),
                     [](char c) { return std::isdigit(static_cast<unsigned char>(c)); })) {
        throw UrlParseError("port could not be parsed: '" + std::string(port_str) + "'");
    }
    // Leading zeros are legal, so compare digit by digit instead of by length
    int port = 0;
    for (char c : port_str) {
        port = port * 10 + (c - '0');
        if (port > MAX_PORT) {
            throw UrlParseError("port out of range 0-65535: " + std::string(port_str));
        }
    }
    return port;
}

std::optional<ProxyScheme> scheme_from_string(std::string_view name) {
    if (name == "http")
        return ProxyScheme::Http;
    if (name == "https")
        return ProxyScheme::Https;
    if (name == "socks5")
        return ProxyScheme::Socks5;
    if (name == "socks5h")
        return ProxyScheme::Socks5h;
    return std::nullopt;
}

} // namespace

ProxyUrl parse_proxy_url(std::string_view text) {
    const auto parts = split_url(text);

    ProxyUrl result;
    result.url = std::string(text);
    result.scheme_name = std::string(parts.scheme);
    std::transform(result.scheme_name.begin(), result.scheme_name.end(),
                   result.scheme_name.begin(), [](unsigned char c) { return std::tolower(c); });
    result.scheme = scheme_from_string(result.scheme_name);

    if (parts.userinfo) {
        const auto colon = parts.userinfo->find(':');
        result.username = percent_decode(parts.userinfo->substr(0, colon));
        if (colon != std::string_view::npos) {
            result.password = percent_decode(parts.userinfo->substr(colon + 1));
        }
    }

    std::string_view port_str;
    if (!parts.hostport.empty() && parts.hostport.front() == '[') {
        const auto close = parts.hostport.find(']');
        if (close == std::string_view::npos) {
            throw UrlParseError("unterminated IPv6 address literal");
        }
        result.host = std::string(parts.hostport.substr(1, close - 1));
        const auto after = parts.hostport.substr(close + 1);
        if (!after.empty()) {
            if (after.front() != ':') {
                throw UrlParseError("unexpected characters after IPv6 address literal");
            }
            port_str = after.substr(1);
        }
    } else {
        const auto colon = parts.hostport.find(':');
        result.host = std::string(parts.hostport.substr(0, colon));
        if (colon != std::string_view::npos) {
            port_str = parts.hostport.substr(colon + 1);
        }
        if (result.host.find_first_of("[]") != std::string::npos) {
            throw UrlParseError("misplaced bracket in host '" + result.host + "'");
        }
    }
    result.port = parse_port(port_str);

    return result;
}

std::string ProxyUrl::redacted() const {
    if (!password) {
        return url;
    }
    const auto parts = split_url(url);
    const auto colon = parts.userinfo->find(':');
    std::string out(parts.scheme);
    out += SCHEME_SEPARATOR;
    out += parts.userinfo->substr(0, colon);
    out += ":***@";
    out += parts.hostport;
    out += parts.rest;
    return out;
}

std::string_view to_string(ProxyScheme scheme) {
    switch (scheme) {
        case ProxyScheme::Http:
            return "http";
        case ProxyScheme::Https:
            return "https";
        case ProxyScheme::Socks5:
            return "socks5";
        case ProxyScheme::Socks5h:
            return "socks5h";
    }
    return "unknown";
}

} // namespace strix
