#ifndef HTTPD_SOCKET_HPP_INCLUDED
#define HTTPD_SOCKET_HPP_INCLUDED
#include <chrono>
#include <cstddef>
#include <sys/types.h>
namespace httpd {
    // Owning wrapper around a connected stream socket
    class socket {
        int sockfd;

        public:
        explicit socket(int connected);
        socket(const socket&) = delete;
        socket& operator=(const socket&) = delete;
        socket(socket&& other) noexcept;
        socket& operator=(socket&& other) noexcept;
        ~socket();

        int fd() const { return sockfd; }
        void set_timeouts(std::chrono::milliseconds recv_timeout, std::chrono::milliseconds send_timeout);
        // Reads whatever is available, 0 on orderly shutdown by the peer
        std::size_t recv_some(char* dest, std::size_t capacity);
        void send_all(const char* start, std::size_t size);
        // Sends FIN and discards input until the peer closes or the receive timeout fires, so
        // that unread request bytes do not turn the close into a reset
        void finish_writes() noexcept;
        void shutdown();
    };
}
#endif
