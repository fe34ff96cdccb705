#ifndef HTTPD_SESSION_HPP_INCLUDED
#define HTTPD_SESSION_HPP_INCLUDED
#include <array>
#include <optional>
#include <string>
#include <httpd/config.hpp>
#include <httpd/parser.hpp>
#include <httpd/request.hpp>
#include <httpd/response.hpp>
#include <httpd/socket.hpp>
namespace httpd {
    class resolver;

    // Owns one accepted connection for its whole life. Requests are read, answered and
    // written strictly one after another.
    class session {
        static const int buffer_size = 4096;
        using byte_buf = std::array<char, buffer_size>;

        httpd::socket sock;
        const resolver& res;
        const server_config& config;
        request_parser parser;
        byte_buf buffer;
        std::size_t requests_served = 0;

        std::optional<request> recv_request();
        void stamp(response& r, bool keep_alive) const;
        void send_response(response r, bool keep_alive);
        bool handle_request(const request& req);

        public:
        session(httpd::socket sock, const resolver& res, const server_config& config);
        // Runs until the connection closes; never throws
        void operator()();
    };
}
#endif
