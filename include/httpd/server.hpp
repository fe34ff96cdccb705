#ifndef HTTPD_SERVER_HPP_INCLUDED
#define HTTPD_SERVER_HPP_INCLUDED
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <utility>
#include <httpd/config.hpp>
#include <httpd/resolver.hpp>
#include <httpd/socket.hpp>
#include <httpd/threadpool.hpp>
namespace httpd {
    class content_source;

    // Pause before the next accept() after a failure with this errno. Running out of
    // descriptors or memory persists for a while, so retrying at once would only spin.
    std::chrono::milliseconds accept_backoff(int error) noexcept;

    // Listening socket plus the accept loop. Every accepted connection gets its own session,
    // run either on a fresh thread or on the bounded pool.
    class server {
        server_config config;
        resolver res;
        int sockfd;
        std::unique_ptr<threadpool> pool;

        std::atomic<bool> stopping{false};
        // Updated by the accept loop (increment) and by exiting sessions (decrement)
        std::atomic<std::size_t> live{0};
        std::atomic<std::size_t> accepted{0};
        std::mutex live_mutex;
        std::condition_variable all_closed;

        // Counts one connection as live from accept until destroyed, wherever its session runs
        class live_ticket {
            server* owner;

            public:
            explicit live_ticket(server* owner);
            live_ticket(live_ticket&& other) noexcept : owner(std::exchange(other.owner, nullptr)) {}
            live_ticket(const live_ticket&) = delete;
            live_ticket& operator=(const live_ticket&) = delete;
            ~live_ticket();
        };

        void dispatch(httpd::socket client, live_ticket ticket);
        void run_session(httpd::socket client);

        public:
        // Binds and listens; throws std::system_error or std::invalid_argument on failure
        server(server_config config, const content_source& source);
        server(const server&) = delete;
        server& operator=(const server&) = delete;
        // Stops accepting and waits for running sessions to finish
        ~server();

        // Accept loop, returns only after stop()
        void serve_forever();
        // Safe to call from another thread or a signal handler
        void stop() noexcept;

        unsigned short port() const;
        std::size_t live_connections() const { return live.load(); }
        std::size_t total_connections() const { return accepted.load(); }
    };
}
#endif
