#ifndef HTTPD_RESPONSE_HPP_INCLUDED
#define HTTPD_RESPONSE_HPP_INCLUDED
#include <string>
#include <string_view>
#include <httpd/headers.hpp>
namespace httpd {
    class socket;

    struct response {
        int code;
        std::string reason;
        header_map headers;
        std::string body;
    };

    response make_response(int code, std::string content_type, std::string body);
    // Small text/html page describing an error status
    response make_error_response(int code, std::string_view detail);

    // Wire form of r. Content-Length is filled in from the body unless already present.
    std::string serialize(const response& r);
    // Sends r, returning the number of bytes written; I/O failures propagate
    std::size_t write_response(socket& sock, const response& r);
    // Parses a complete serialised response; throws parse_error on malformed input. Pass
    // body_expected = false for answers to HEAD, whose Content-Length has no body behind it.
    response parse_response(std::string_view bytes, bool body_expected = true);
}
#endif
