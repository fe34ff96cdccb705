#ifndef HTTPD_REQUEST_HPP_INCLUDED
#define HTTPD_REQUEST_HPP_INCLUDED
#include <optional>
#include <string>
#include <string_view>
#include <httpd/headers.hpp>
namespace httpd {
    enum class method { options, get, head, post, put, del, trace, connect, patch };

    std::optional<method> parse_method(std::string_view token);
    const char* to_string(method m) noexcept;

    enum class version { http10, http11 };

    std::optional<version> parse_version(std::string_view token);
    const char* to_string(version v) noexcept;

    struct request {
        httpd::method method;
        // Decoded and normalised path, always absolute
        std::string target;
        // Target exactly as received on the request line
        std::string raw_target;
        httpd::version version;
        header_map headers;
        std::string body;

        // Persistence implied by the version and the Connection header
        bool keep_alive() const;
    };

    // Drops query and fragment, percent-decodes and collapses "." and ".." segments so that
    // the result never climbs above "/". Returns std::nullopt on a malformed %-escape.
    std::optional<std::string> normalize_target(std::string_view raw);
}
#endif
