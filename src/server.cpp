#include <httpd/server.hpp>
#include <httpd/error.hpp>
#include <httpd/session.hpp>
#include <sys/types.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <cerrno>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <boost/log/trivial.hpp>

static in_addr parse_bind_address(const std::string& host) {
    in_addr addr;
    const std::string& dotted = host == "localhost" ? std::string{"127.0.0.1"} : host;
    if(::inet_pton(AF_INET, dotted.c_str(), &addr) != 1) {
        throw std::invalid_argument("not an IPv4 bind address: " + host);
    }
    return addr;
}

std::chrono::milliseconds httpd::accept_backoff(int error) noexcept {
    switch(error) {
        case EMFILE:
        case ENFILE:
        case ENOBUFS:
        case ENOMEM:
            return std::chrono::milliseconds{100};
        case EINTR:
        case ECONNABORTED:
        case EPROTO:
            return std::chrono::milliseconds{0};
        default:
            return std::chrono::milliseconds{10};
    }
}

httpd::server::server(server_config cfg, const content_source& source)
    : config(std::move(cfg)), res(source, config.gzip), sockfd(::socket(AF_INET, SOCK_STREAM, 0)) {
    httpd::check_error(sockfd);
    try {
        int enable_reuse = 1;
        httpd::check_error(setsockopt(sockfd, SOL_SOCKET, SO_REUSEADDR, &enable_reuse, sizeof(enable_reuse)));
        sockaddr_in listen_address{};
        listen_address.sin_family = AF_INET;
        listen_address.sin_port = htons(config.port);
        listen_address.sin_addr = parse_bind_address(config.host);
        httpd::check_error(::bind(sockfd, reinterpret_cast<const sockaddr*>(&listen_address), sizeof(listen_address)));
        httpd::check_error(::listen(sockfd, config.backlog));
    } catch (...) {
        ::close(sockfd);
        throw;
    }
    if(config.workers > 0) {
        pool = std::make_unique<threadpool>(config.workers);
    }
    BOOST_LOG_TRIVIAL(info) << "Listening on " << config.host << ":" << port()
                            << (pool ? " with " + std::to_string(config.workers) + " workers" : std::string{" with a thread per connection"});
}

httpd::server::~server() {
    stop();
    // Queued connections are dropped (and closed) with the pool; running sessions are joined
    pool.reset();
    std::unique_lock<std::mutex> lock(live_mutex);
    all_closed.wait(lock, [this](){ return live.load() == 0; });
    ::close(sockfd);
}

httpd::server::live_ticket::live_ticket(server* owner) : owner(owner) {
    owner->accepted++;
    owner->live++;
}

httpd::server::live_ticket::~live_ticket() {
    if(!owner) return;
    std::lock_guard<std::mutex> lock(owner->live_mutex);
    owner->live--;
    owner->all_closed.notify_all();
}

unsigned short httpd::server::port() const {
    sockaddr_in bound{};
    socklen_t len = sizeof(bound);
    httpd::check_error(::getsockname(sockfd, reinterpret_cast<sockaddr*>(&bound), &len));
    return ntohs(bound.sin_port);
}

void httpd::server::stop() noexcept {
    if(!stopping.exchange(true)) {
        // Wakes a blocked accept()
        ::shutdown(sockfd, SHUT_RDWR);
    }
}

void httpd::server::run_session(httpd::socket client) {
    try {
        session{std::move(client), res, config}();
    } catch (const std::exception& err) {
        BOOST_LOG_TRIVIAL(error) << "Session failed: " << err.what();
    }
}

void httpd::server::dispatch(httpd::socket client, live_ticket ticket) {
    if(pool) {
        pool->post_task([this, client = std::move(client), ticket = std::move(ticket)]() mutable {
            run_session(std::move(client));
        });
        return;
    }
    // Detached; ~server waits for the tickets instead of joining
    try {
        std::thread([this, client = std::move(client), ticket = std::move(ticket)]() mutable {
            run_session(std::move(client));
        }).detach();
    } catch (const std::system_error& err) {
        BOOST_LOG_TRIVIAL(error) << "Could not start a thread for the connection: " << err.what();
    }
}

void httpd::server::serve_forever() {
    while(!stopping.load()) {
        sockaddr_in client_addr;
        socklen_t addrlen = sizeof(client_addr);
        int clientfd = ::accept(sockfd, reinterpret_cast<sockaddr*>(&client_addr), &addrlen);
        if(clientfd < 0) {
            const int error = errno;
            if(stopping.load()) break;
            if(error == EINTR) continue;
            BOOST_LOG_TRIVIAL(error) << "accept failed: " << std::system_category().message(error);
            auto pause = accept_backoff(error);
            if(pause.count() > 0) std::this_thread::sleep_for(pause);
            continue;
        }
        httpd::socket client{clientfd};
        live_ticket ticket{this};
        char peer[INET_ADDRSTRLEN] = "?";
        ::inet_ntop(AF_INET, &client_addr.sin_addr, peer, sizeof(peer));
        BOOST_LOG_TRIVIAL(debug) << "        accepted fd #" << clientfd << " from " << peer << ":" << ntohs(client_addr.sin_port)
                                 << " (" << live.load() << " live)";
        dispatch(std::move(client), std::move(ticket));
    }
    BOOST_LOG_TRIVIAL(info) << "Stopped accepting after " << accepted.load() << " connection(s)";
}
