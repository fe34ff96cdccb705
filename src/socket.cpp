#include <httpd/socket.hpp>
#include <httpd/error.hpp>
#include <sys/types.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <utility>

static timeval to_timeval(std::chrono::milliseconds ms) {
    timeval tv;
    tv.tv_sec = static_cast<time_t>(ms.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((ms.count() % 1000) * 1000);
    return tv;
}

httpd::socket::socket(int connected) : sockfd(connected) {
}

httpd::socket::socket(socket&& other) noexcept : sockfd(std::exchange(other.sockfd, -1)) {
}

httpd::socket& httpd::socket::operator=(socket&& other) noexcept {
    if(this != &other) {
        if(sockfd >= 0) ::close(sockfd);
        sockfd = std::exchange(other.sockfd, -1);
    }
    return *this;
}

httpd::socket::~socket() {
    if(sockfd >= 0) ::close(sockfd);
}

void httpd::socket::set_timeouts(std::chrono::milliseconds recv_timeout, std::chrono::milliseconds send_timeout) {
    timeval recv_tv = to_timeval(recv_timeout);
    timeval send_tv = to_timeval(send_timeout);
    httpd::check_error(::setsockopt(sockfd, SOL_SOCKET, SO_RCVTIMEO, &recv_tv, sizeof(recv_tv)));
    httpd::check_error(::setsockopt(sockfd, SOL_SOCKET, SO_SNDTIMEO, &send_tv, sizeof(send_tv)));
}

std::size_t httpd::socket::recv_some(char* dest, std::size_t capacity) {
    while(true) {
        ssize_t n = ::recv(sockfd, dest, capacity, 0);
        if(n < 0 && errno == EINTR) continue;
        httpd::check_error(n);
        return static_cast<std::size_t>(n);
    }
}

void httpd::socket::send_all(const char* start, std::size_t size) {
    while(size > 0) {
        ssize_t sent = ::send(sockfd, start, size, MSG_NOSIGNAL);
        if(sent < 0 && errno == EINTR) continue;
        httpd::check_error(sent);
        start += sent;
        size -= static_cast<std::size_t>(sent);
    }
}

void httpd::socket::finish_writes() noexcept {
    if(sockfd < 0 || ::shutdown(sockfd, SHUT_WR) < 0) return;
    char discard[1024];
    std::size_t budget = 64 * 1024;
    while(budget > 0) {
        ssize_t n = ::recv(sockfd, discard, sizeof(discard), 0);
        if(n < 0 && errno == EINTR) continue;
        if(n <= 0) return;
        budget -= std::min(budget, static_cast<std::size_t>(n));
    }
}

void httpd::socket::shutdown() {
    if(sockfd >= 0) ::shutdown(sockfd, SHUT_RDWR);
}
