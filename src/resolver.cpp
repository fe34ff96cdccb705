#include <httpd/resolver.hpp>
#include <httpd/content_source.hpp>
#include <httpd/encoding.hpp>
#include <httpd/error.hpp>
#include <httpd/status.hpp>
#include <boost/filesystem/path.hpp>
#include <boost/log/trivial.hpp>
#include <fmt/format.h>

namespace fs = boost::filesystem;

static const char* allowed_methods = "GET, HEAD";

std::string httpd::content_type_for(std::string_view path) {
    auto e = fs::path{std::string{path}}.extension();
    if      (e == ".html" || e == ".htm") return "text/html";
    else if (e == ".txt")   return "text/plain";
    else if (e == ".css")   return "text/css";
    else if (e == ".js")    return "text/javascript";
    else if (e == ".json")  return "application/json";
    else if (e == ".jpg" || e == ".jpeg") return "image/jpeg";
    else if (e == ".png")   return "image/png";
    else if (e == ".gif")   return "image/gif";
    else if (e == ".svg")   return "image/svg+xml";
    else if (e == ".swf")   return "application/x-shockwave-flash";
    else if (e == ".eot")   return "application/vnd.ms-fontobject";
    else if (e == ".ttf")   return "font/ttf";
    else if (e == ".woff")  return "font/woff";
    else if (e == ".woff2") return "font/woff2";
    else if (e == ".webm")  return "video/webm";
    else return "application/octet-stream";
}

httpd::resolver::resolver(const content_source& source, bool gzip) : source(source), gzip(gzip) {
}

httpd::response httpd::resolver::serve(const request& req) const {
    if(req.method != method::get && req.method != method::head) {
        throw resolve_error(resolve_error_kind::method_not_allowed,
            fmt::format("{} is not supported on {}", to_string(req.method), req.target));
    }
    try {
        auto found = source.lookup(req.target);
        if(!found) {
            throw resolve_error(resolve_error_kind::not_found,
                fmt::format("Could not find the file specified: {}", req.target));
        }
        BOOST_LOG_TRIVIAL(debug) << "* Mapping request to " << found->resolved_path;
        response r = make_response(status::ok, content_type_for(found->resolved_path), std::move(found->bytes));
        if(gzip && wants_gzip(req, r)) {
            r = encode_gzip(std::move(r));
        }
        return r;
    } catch (const resolve_error&) {
        throw;
    } catch (const std::exception& err) {
        throw resolve_error(resolve_error_kind::internal,
            fmt::format("Failed to resolve {}: {}", req.target, err.what()));
    }
}

httpd::response httpd::resolver::resolve(const request& req) const {
    response r;
    try {
        r = serve(req);
    } catch (const resolve_error& err) {
        if(err.kind() == resolve_error_kind::internal) {
            BOOST_LOG_TRIVIAL(error) << "* " << err.what();
            // The cause stays in the log, not in the page
            r = make_error_response(err.status(), "The server failed to produce this resource.");
        } else {
            BOOST_LOG_TRIVIAL(info) << "* " << err.what() << " (" << err.status() << ")";
            r = make_error_response(err.status(), err.what());
        }
        if(err.kind() == resolve_error_kind::method_not_allowed) {
            r.headers.set("Allow", allowed_methods);
        }
    }
    // Same headers as GET, Content-Length and encoding included, without the body
    if(req.method == method::head) {
        r.body.clear();
    }
    return r;
}
