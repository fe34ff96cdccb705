#include <httpd/response.hpp>
#include <httpd/error.hpp>
#include <httpd/socket.hpp>
#include <httpd/status.hpp>
#include <algorithm>
#include <cctype>
#include <sstream>
#include <fmt/format.h>

static const std::string crlf = "\r\n";

static const std::string error_template = R"EOS(<!DOCTYPE html>
<html>
    <head>
        <title>{0} {1}</title>
        <style>
        html {{ font-family: monospace; sans-serif; }}
        </style>
    </head>
    <body>
        <h1>{0} {1}</h1>
        <p>{2}</p>
    </body>
</html>
)EOS";

static std::string escape_html(std::string_view text) {
    std::string escaped;
    escaped.reserve(text.size());
    for(char c : text) {
        switch(c) {
            case '<': escaped += "&lt;"; break;
            case '>': escaped += "&gt;"; break;
            case '&': escaped += "&amp;"; break;
            case '"': escaped += "&quot;"; break;
            default: escaped += c;
        }
    }
    return escaped;
}

httpd::response httpd::make_response(int code, std::string content_type, std::string body) {
    response r{code, reason_phrase(code), {}, std::move(body)};
    r.headers.set("Content-Type", std::move(content_type));
    r.headers.set("Content-Length", std::to_string(r.body.size()));
    return r;
}

httpd::response httpd::make_error_response(int code, std::string_view detail) {
    auto reason = reason_phrase(code);
    return make_response(code, "text/html; charset=utf-8",
        fmt::format(error_template, code, reason, escape_html(detail)));
}

std::string httpd::serialize(const response& r) {
    std::ostringstream sstr;
    sstr << "HTTP/1.1 " << r.code << " " << (r.reason.empty() ? reason_phrase(r.code) : r.reason) << crlf;
    for(const auto& [header, val] : r.headers) {
        sstr << header << ": " << val << crlf;
    }
    if(!r.headers.contains("Content-Length")) {
        sstr << "Content-Length: " << r.body.size() << crlf;
    }
    sstr << crlf;
    sstr << r.body;
    return sstr.str();
}

std::size_t httpd::write_response(socket& sock, const response& r) {
    std::string bytes = serialize(r);
    sock.send_all(bytes.data(), bytes.size());
    return bytes.size();
}

httpd::response httpd::parse_response(std::string_view bytes, bool body_expected) {
    auto head_end = bytes.find(crlf + crlf);
    if(head_end == std::string_view::npos) {
        throw parse_error(parse_error_kind::malformed_line, "response head is not terminated");
    }
    std::string_view head = bytes.substr(0, head_end);
    std::string_view rest = bytes.substr(head_end + 2 * crlf.size());

    auto line_end = std::min(head.find(crlf), head.size());
    std::string_view status_line = head.substr(0, line_end);
    // "HTTP/1.x" SP 3DIGIT SP reason
    if(status_line.size() < 12 || status_line.substr(0, 7) != "HTTP/1." || status_line[8] != ' '
        || !std::all_of(status_line.begin() + 9, status_line.begin() + 12, [](char c){ return std::isdigit(static_cast<unsigned char>(c)); })
        || (status_line.size() > 12 && status_line[12] != ' ')) {
        throw parse_error(parse_error_kind::malformed_line, fmt::format("bad status line '{}'", status_line));
    }
    response r;
    r.code = std::stoi(std::string{status_line.substr(9, 3)});
    r.reason = std::string{status_line.size() > 13 ? status_line.substr(13) : std::string_view{}};

    head.remove_prefix(std::min(line_end + crlf.size(), head.size()));
    while(!head.empty()) {
        auto next = std::min(head.find(crlf), head.size());
        std::string_view line = head.substr(0, next);
        auto colon = line.find(':');
        if(colon == std::string_view::npos || colon == 0) {
            throw parse_error(parse_error_kind::malformed_header, fmt::format("bad header line '{}'", line));
        }
        auto value = line.substr(colon + 1);
        while(!value.empty() && (value.front() == ' ' || value.front() == '\t')) value.remove_prefix(1);
        r.headers.add(std::string{line.substr(0, colon)}, std::string{value});
        head.remove_prefix(std::min(next + crlf.size(), head.size()));
    }

    auto content_length = r.headers.get("Content-Length");
    if(!content_length) {
        throw parse_error(parse_error_kind::bad_content_length, "response has no Content-Length");
    }
    std::size_t length = 0;
    try {
        length = std::stoul(*content_length);
    } catch(const std::exception&) {
        throw parse_error(parse_error_kind::bad_content_length, fmt::format("bad Content-Length '{}'", *content_length));
    }
    if(body_expected) {
        if(rest.size() < length) {
            throw parse_error(parse_error_kind::bad_content_length, "response body is truncated");
        }
        r.body = std::string{rest.substr(0, length)};
    }
    return r;
}
