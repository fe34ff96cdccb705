#ifndef HTTPD_CONFIG_HPP_INCLUDED
#define HTTPD_CONFIG_HPP_INCLUDED
#include <chrono>
#include <cstddef>
#include <string>
#include <httpd/parser.hpp>
namespace httpd {
    struct server_config {
        std::string host = "0.0.0.0";
        unsigned short port = 8080;
        int backlog = 128;
        std::string root = ".";

        std::chrono::milliseconds read_timeout{5000};
        std::chrono::milliseconds write_timeout{5000};
        parser_limits limits;

        // 0 starts a thread per accepted connection, otherwise connections are queued to a
        // fixed pool of this many threads
        int workers = 0;
        bool gzip = true;
        std::string server_name = "httpd";
    };
}
#endif
