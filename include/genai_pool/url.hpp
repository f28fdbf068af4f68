#pragma once

#include <string>
#include <string_view>

#include "result.hpp"

namespace genai_pool {

    struct UrlComponents {
        bool https{false};
        std::string host;
        std::string port;
        // For a parsed absolute URL: full target (path + optional query).
        // For a parsed base URL: normalized prefix path ("" or "/proxy").
        std::string target;
    };

    /// @brief Parse an absolute http:// or https:// URL into its components.
    inline Result<UrlComponents> parse_url(std::string_view url) {
        auto make_err = [](std::string msg) {
            return Result<UrlComponents>::err(Error::Code::InvalidUrl,
                                              std::move(msg));
        };

        std::string_view s(url);

        bool https = false;
        if (s.rfind("https://", 0) == 0) {
            https = true;
            s.remove_prefix(std::string_view("https://").size());
        } else if (s.rfind("http://", 0) == 0) {
            s.remove_prefix(std::string_view("http://").size());
        } else {
            return make_err("URL must start with http:// or https://");
        }

        // Split host[:port] from path
        std::string_view hostport = s;
        std::string_view path = "/";
        if (auto slash = s.find('/'); slash != std::string_view::npos) {
            hostport = s.substr(0, slash);
            path = s.substr(slash);
        }

        if (hostport.empty()) {
            return make_err("URL missing host");
        }

        std::string host;
        std::string port;

        if (auto colon = hostport.rfind(':'); colon != std::string_view::npos) {
            host = std::string(hostport.substr(0, colon));
            port = std::string(hostport.substr(colon + 1));
            if (port.empty()) {
                return make_err("URL has empty port");
            }
        } else {
            host = std::string(hostport);
            port = https ? "443" : "80";
        }

        if (host.empty()) {
            return make_err("URL has empty host");
        }

        UrlComponents out;
        out.https = https;
        out.host = std::move(host);
        out.port = std::move(port);
        out.target = path.empty() ? "/" : std::string(path);
        return Result<UrlComponents>::ok(std::move(out));
    }

    namespace url_utils {

        /// @brief Trim trailing slashes from a string.
        inline std::string trim_trailing_slashes(std::string s) {
            while (!s.empty() && s.back() == '/') s.pop_back();
            return s;
        }

        /// @brief Parse a service base URL. The returned target is a
        /// normalized prefix: "/" becomes "", trailing '/' removed, and a
        /// query string is rejected so prefix joining stays trivial.
        inline Result<UrlComponents> parse_base_url(std::string_view base_url) {
            if (base_url.empty()) {
                return Result<UrlComponents>::err(Error::Code::InvalidUrl,
                                                  "base_url is empty");
            }

            auto parsed = parse_url(base_url);
            if (parsed.has_error()) return parsed;

            UrlComponents b = std::move(parsed).value();
            b.target = trim_trailing_slashes(std::move(b.target));

            if (b.target.find('?') != std::string::npos) {
                return Result<UrlComponents>::err(
                    Error::Code::InvalidUrl,
                    "base_url must not include query parameters");
            }

            return Result<UrlComponents>::ok(std::move(b));
        }

        /// @brief Percent-encode everything outside the RFC 3986 unreserved
        /// set.
        inline std::string url_encode(std::string_view s) {
            static constexpr char hex[] = "0123456789ABCDEF";
            std::string out;
            out.reserve(s.size());
            for (unsigned char c : s) {
                const bool unreserved = (c >= 'A' && c <= 'Z') ||
                                        (c >= 'a' && c <= 'z') ||
                                        (c >= '0' && c <= '9') || c == '-' ||
                                        c == '_' || c == '.' || c == '~';
                if (unreserved) {
                    out.push_back(static_cast<char>(c));
                } else {
                    out.push_back('%');
                    out.push_back(hex[c >> 4]);
                    out.push_back(hex[c & 0x0F]);
                }
            }
            return out;
        }

    }  // namespace url_utils

}  // namespace genai_pool
