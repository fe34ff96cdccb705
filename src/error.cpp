#include <httpd/error.hpp>
#include <httpd/status.hpp>
#include <cerrno>
#include <system_error>

void httpd::check_error(long return_val) {
    if(return_val < 0) {
        throw std::system_error(errno, std::generic_category());
    }
}

httpd::parse_error::parse_error(parse_error_kind kind, const std::string& what)
    : std::runtime_error(what), kind_(kind) {
}

int httpd::parse_error::status() const noexcept {
    switch(kind_) {
        case parse_error_kind::too_large:           return httpd::status::header_fields_too_large;
        case parse_error_kind::body_too_large:      return httpd::status::payload_too_large;
        case parse_error_kind::unsupported_version: return httpd::status::version_not_supported;
        case parse_error_kind::unsupported_transfer_encoding: return httpd::status::not_implemented;
        default:                                    return httpd::status::bad_request;
    }
}

httpd::resolve_error::resolve_error(resolve_error_kind kind, const std::string& what)
    : std::runtime_error(what), kind_(kind) {
}

int httpd::resolve_error::status() const noexcept {
    switch(kind_) {
        case resolve_error_kind::not_found:          return httpd::status::not_found;
        case resolve_error_kind::method_not_allowed: return httpd::status::method_not_allowed;
        default:                                     return httpd::status::internal_server_error;
    }
}

const char* httpd::to_string(parse_error_kind kind) noexcept {
    switch(kind) {
        case parse_error_kind::malformed_line:      return "malformed request line";
        case parse_error_kind::malformed_header:    return "malformed header";
        case parse_error_kind::too_large:           return "request head too large";
        case parse_error_kind::body_too_large:      return "request body too large";
        case parse_error_kind::bad_content_length:  return "bad Content-Length";
        case parse_error_kind::unsupported_version: return "unsupported HTTP version";
        case parse_error_kind::unsupported_transfer_encoding: return "unsupported Transfer-Encoding";
    }
    return "unknown parse error";
}
