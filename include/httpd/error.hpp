#ifndef HTTPD_ERROR_HPP_INCLUDED
#define HTTPD_ERROR_HPP_INCLUDED
#include <stdexcept>
#include <string>
namespace httpd {
    // Throws std::system_error built from errno when return_val is negative
    void check_error(long return_val);

    // Peer closed the stream in the middle of a request
    struct premature_close : public std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    enum class parse_error_kind {
        malformed_line,
        malformed_header,
        too_large,
        body_too_large,
        bad_content_length,
        unsupported_version,
        unsupported_transfer_encoding
    };

    class parse_error : public std::runtime_error {
        parse_error_kind kind_;

        public:
        parse_error(parse_error_kind kind, const std::string& what);
        parse_error_kind kind() const noexcept { return kind_; }
        int status() const noexcept;
    };

    enum class resolve_error_kind {
        not_found,
        method_not_allowed,
        internal
    };

    class resolve_error : public std::runtime_error {
        resolve_error_kind kind_;

        public:
        resolve_error(resolve_error_kind kind, const std::string& what);
        resolve_error_kind kind() const noexcept { return kind_; }
        int status() const noexcept;
    };

    const char* to_string(parse_error_kind kind) noexcept;
}
#endif
