#include "routing/url_rebuilder.hpp"
#include "core/utils.hpp"

#include <cctype>

namespace graphroute {

namespace {

// RFC 3986: scheme = ALPHA *( ALPHA / DIGIT / "+" / "-" / "." )
bool is_scheme(std::string_view s) {
    if (s.empty() || !std::isalpha(static_cast<unsigned char>(s.front()))) return false;
    for (const char c : s) {
        const auto uc = static_cast<unsigned char>(c);
        if (!std::isalnum(uc) && c != '+' && c != '-' && c != '.') return false;
    }
    return true;
}

bool parse_port(std::string_view text, UrlComponents& parts) {
    if (text.empty()) return true;  // "host:" carries no port
    const auto port = utils::try_parse_int<uint32_t>(text);
    if (!port || !utils::in_range<0, 65535>(*port)) return false;
    parts.port = static_cast<uint16_t>(*port);
    return true;
}

bool parse_authority(std::string_view authority, UrlComponents& parts) {
    const auto at = authority.rfind('@');
    if (at != std::string_view::npos) {
        const auto userinfo = authority.substr(0, at);
        const auto colon = userinfo.find(':');
        if (colon == std::string_view::npos) {
            parts.user = std::string(userinfo);
        } else {
            parts.user = std::string(userinfo.substr(0, colon));
            parts.pass = std::string(userinfo.substr(colon + 1));
        }
        authority.remove_prefix(at + 1);
    }

    std::string_view host = authority;
    std::string_view port;

    if (authority.starts_with('[')) {
        // IPv6 literal: [::1]:7687
        const auto close = authority.find(']');
        if (close == std::string_view::npos) return false;
        host = authority.substr(0, close + 1);
        const auto rest = authority.substr(close + 1);
        if (!rest.empty()) {
            if (rest.front() != ':') return false;
            port = rest.substr(1);
        }
    } else {
        const auto colon = authority.rfind(':');
        if (colon != std::string_view::npos) {
            host = authority.substr(0, colon);
            port = authority.substr(colon + 1);
        }
    }

    if (!host.empty()) parts.host = std::string(host);
    return parse_port(port, parts);
}

} // anonymous namespace

std::optional<UrlComponents> parse_url(std::string_view url) {
    if (url.empty()) return std::nullopt;

    UrlComponents parts;
    std::string_view rest = url;

    if (const auto hash = rest.find('#'); hash != std::string_view::npos) {
        parts.fragment = std::string(rest.substr(hash + 1));
        rest = rest.substr(0, hash);
    }
    if (const auto question = rest.find('?'); question != std::string_view::npos) {
        parts.query = std::string(rest.substr(question + 1));
        rest = rest.substr(0, question);
    }

    // "scheme://" only; "host:7687" must not be mistaken for a scheme
    if (const auto colon = rest.find(':'); colon != std::string_view::npos
        && is_scheme(rest.substr(0, colon)) && rest.substr(colon + 1).starts_with("//")) {
        parts.scheme = std::string(rest.substr(0, colon));
        rest.remove_prefix(colon + 1);
    }

    bool has_authority = false;
    if (rest.starts_with("//")) {
        rest.remove_prefix(2);
        has_authority = true;
    } else if (!parts.scheme && !rest.empty() && rest.front() != '/') {
        // Bare "host[:port][/path]" as returned by discovery
        has_authority = true;
    }

    if (has_authority) {
        const auto slash = rest.find('/');
        const auto authority = rest.substr(0, slash);
        if (!parse_authority(authority, parts)) return std::nullopt;
        rest = (slash == std::string_view::npos) ? std::string_view{} : rest.substr(slash);
    }

    if (!rest.empty()) parts.path = std::string(rest);

    return parts;
}

UrlComponents UrlComponents::merged_with(const UrlComponents& overlay) const {
    UrlComponents out = *this;
    if (overlay.scheme)   out.scheme = overlay.scheme;
    if (overlay.user)     out.user = overlay.user;
    if (overlay.pass)     out.pass = overlay.pass;
    if (overlay.host)     out.host = overlay.host;
    if (overlay.port)     out.port = overlay.port;
    if (overlay.path)     out.path = overlay.path;
    if (overlay.query)    out.query = overlay.query;
    if (overlay.fragment) out.fragment = overlay.fragment;
    return out;
}

std::string UrlComponents::to_string() const {
    std::string url;

    if (scheme) {
        url += *scheme;
        url += ':';
    }
    if (host || user) {
        url += "//";
    }
    if (user) {
        url += *user;
        if (pass) {
            url += ':';
            url += *pass;
        }
        url += '@';
    }
    if (host) url += *host;
    if (port) {
        url += ':';
        url += std::to_string(*port);
    }
    if (path) url += *path;
    if (query) {
        url += '?';
        url += *query;
    }
    if (fragment) {
        url += '#';
        url += *fragment;
    }
    return url;
}

std::optional<std::string> UrlRebuilder::rebuild(std::string_view address) const {
    const auto parsed = parse_url(address);
    if (!parsed) return std::nullopt;
    return base_.merged_with(*parsed).to_string();
}

} // namespace graphroute
