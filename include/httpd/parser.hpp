#ifndef HTTPD_PARSER_HPP_INCLUDED
#define HTTPD_PARSER_HPP_INCLUDED
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <httpd/request.hpp>
namespace httpd {
    struct parser_limits {
        std::size_t max_header_bytes = 8192;
        std::size_t max_body_bytes = 1 << 20;
        duplicate_policy duplicates = duplicate_policy::join;
    };

    // Incremental request parser. Bytes are fed as they arrive; once a request is complete it
    // is handed out by next() and any following bytes stay buffered for the next request.
    class request_parser {
        enum class stage { request_line, headers, body, done };

        parser_limits limits;
        std::string buffer;
        std::size_t consumed = 0;
        std::size_t header_bytes = 0;
        stage current = stage::request_line;
        std::size_t body_length = 0;
        request pending;

        std::optional<std::string_view> take_line();
        void parse_request_line(std::string_view line);
        void parse_header_line(std::string_view line);
        void finish_headers();

        public:
        explicit request_parser(parser_limits limits = {});

        // Appends bytes and advances as far as possible. Throws parse_error.
        void feed(std::string_view bytes);
        // Completed request, if any; resets the parser for the next one
        std::optional<request> next();
        // True if a partial request has been received
        bool mid_request() const;
        void reset();
    };

    // Parses one complete request held in bytes; throws parse_error, including for
    // truncated input.
    request parse_request(std::string_view bytes, parser_limits limits = {});
}
#endif
