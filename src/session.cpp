#include <httpd/session.hpp>
#include <httpd/error.hpp>
#include <httpd/resolver.hpp>
#include <httpd/status.hpp>
#include <cerrno>
#include <ctime>
#include <string>
#include <system_error>
#include <utility>
#include <boost/log/trivial.hpp>
#include <boost/scope_exit.hpp>

// RFC 7231 IMF-fixdate, e.g. "Sun, 06 Nov 1994 08:49:37 GMT"
static std::string http_date() {
    std::time_t now = std::time(nullptr);
    std::tm gmt;
    ::gmtime_r(&now, &gmt);
    char buf[64];
    std::size_t n = std::strftime(buf, sizeof(buf), "%a, %d %b %Y %H:%M:%S GMT", &gmt);
    return std::string(buf, n);
}

httpd::session::session(httpd::socket sock, const resolver& res, const server_config& config)
    : sock(std::move(sock)), res(res), config(config), parser(config.limits) {
}

std::optional<httpd::request> httpd::session::recv_request() {
    // Bytes that arrived behind the previous request are parsed first
    parser.feed({});
    std::optional<request> req = parser.next();
    while(!req) {
        std::size_t n = sock.recv_some(buffer.data(), buffer.size());
        if(n == 0) {
            if(parser.mid_request()) {
                throw httpd::premature_close("Socket closed while receiving request");
            }
            return std::nullopt;
        }
        BOOST_LOG_TRIVIAL(trace) << "        recv'd " << n << " from fd #" << sock.fd();
        parser.feed({buffer.data(), n});
        req = parser.next();
    }
    return req;
}

void httpd::session::stamp(response& r, bool keep_alive) const {
    r.headers.set("Server", config.server_name);
    r.headers.set("Date", http_date());
    if(!r.headers.contains("Content-Length")) {
        r.headers.set("Content-Length", std::to_string(r.body.size()));
    }
    r.headers.set("Connection", keep_alive ? "keep-alive" : "close");
}

void httpd::session::send_response(response r, bool keep_alive) {
    stamp(r, keep_alive);
    std::size_t sent = write_response(sock, r);
    BOOST_LOG_TRIVIAL(debug) << "        fd #" << sock.fd() << " sent " << r.code << " (" << sent << " bytes)";
}

bool httpd::session::handle_request(const request& req) {
    BOOST_LOG_TRIVIAL(info) << to_string(req.method) << " " << req.raw_target << " " << to_string(req.version);
    for(const auto& [name, value] : req.headers) {
        BOOST_LOG_TRIVIAL(trace) << "    " << name << ": " << value;
    }
    bool keep_alive = req.keep_alive();
    send_response(res.resolve(req), keep_alive);
    requests_served++;
    return keep_alive;
}

void httpd::session::operator()() {
    const int fd = sock.fd();
    BOOST_SCOPE_EXIT(fd, this_) {
        this_->sock.shutdown();
        BOOST_LOG_TRIVIAL(debug) << "        closed fd #" << fd << " after " << this_->requests_served << " request(s)";
    } BOOST_SCOPE_EXIT_END
    BOOST_LOG_TRIVIAL(debug) << "Handling new client on fd #" << fd;
    try {
        sock.set_timeouts(config.read_timeout, config.write_timeout);
        bool keep_alive = true;
        while(keep_alive) {
            std::optional<request> req;
            try {
                req = recv_request();
            } catch (const httpd::parse_error& err) {
                BOOST_LOG_TRIVIAL(warning) << "Rejecting request on fd #" << fd << ": " << to_string(err.kind()) << ": " << err.what();
                send_response(make_error_response(err.status(), err.what()), false);
                sock.finish_writes();
                break;
            }
            if(!req) {
                BOOST_LOG_TRIVIAL(debug) << "Client on fd #" << fd << " closed the connection";
                break;
            }
            keep_alive = handle_request(*req);
        }
    } catch (const httpd::premature_close& err) {
        BOOST_LOG_TRIVIAL(warning) << "Client stopped sending prematurely";
    } catch (const std::system_error& err) {
        if(err.code().value() == EAGAIN || err.code().value() == EWOULDBLOCK) {
            BOOST_LOG_TRIVIAL(info) << "Read or write timed out on fd #" << fd;
        } else if(err.code().value() == ECONNRESET || err.code().value() == EPIPE) {
            BOOST_LOG_TRIVIAL(info) << "Peer on fd #" << fd << " went away: " << err.what();
        } else {
            BOOST_LOG_TRIVIAL(error) << "System error " << err.code() << ": " << err.what();
        }
    } catch (const std::exception& err) {
        BOOST_LOG_TRIVIAL(error) << "Something went badly wrong: " << err.what();
    }
}
