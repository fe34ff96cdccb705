#include <httpd/status.hpp>

std::string httpd::reason_phrase(int code) {
    switch(code) {
        case status::ok:                      return "OK";
        case status::bad_request:             return "Bad Request";
        case status::not_found:               return "Not Found";
        case status::method_not_allowed:      return "Method Not Allowed";
        case status::payload_too_large:       return "Payload Too Large";
        case status::header_fields_too_large: return "Request Header Fields Too Large";
        case status::internal_server_error:   return "Internal Server Error";
        case status::not_implemented:         return "Not Implemented";
        case status::version_not_supported:   return "HTTP Version Not Supported";
        default:                              return "Unknown";
    }
}
