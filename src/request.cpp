#include <httpd/request.hpp>
#include <array>
#include <utility>
#include <vector>

namespace {
    const std::array<std::pair<const char*, httpd::method>, 9> method_names = {{
        {"OPTIONS", httpd::method::options},
        {"GET", httpd::method::get},
        {"HEAD", httpd::method::head},
        {"POST", httpd::method::post},
        {"PUT", httpd::method::put},
        {"DELETE", httpd::method::del},
        {"TRACE", httpd::method::trace},
        {"CONNECT", httpd::method::connect},
        {"PATCH", httpd::method::patch}
    }};

    int hex_value(char c) {
        if(c >= '0' && c <= '9') return c - '0';
        if(c >= 'a' && c <= 'f') return c - 'a' + 10;
        if(c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }

    std::optional<std::string> percent_decode(std::string_view s) {
        std::string decoded;
        decoded.reserve(s.size());
        for(std::size_t i = 0; i < s.size(); i++) {
            if(s[i] != '%') {
                decoded.push_back(s[i]);
                continue;
            }
            if(i + 2 >= s.size()) return std::nullopt;
            int hi = hex_value(s[i + 1]);
            int lo = hex_value(s[i + 2]);
            if(hi < 0 || lo < 0) return std::nullopt;
            char c = static_cast<char>(hi * 16 + lo);
            if(c == '\0') return std::nullopt;
            decoded.push_back(c);
            i += 2;
        }
        return decoded;
    }
}

std::optional<httpd::method> httpd::parse_method(std::string_view token) {
    for(const auto& [name, m] : method_names) {
        if(token == name) return m;
    }
    return std::nullopt;
}

const char* httpd::to_string(method m) noexcept {
    for(const auto& [name, value] : method_names) {
        if(value == m) return name;
    }
    return "UNKNOWN";
}

std::optional<httpd::version> httpd::parse_version(std::string_view token) {
    if(token == "HTTP/1.1") return version::http11;
    if(token == "HTTP/1.0") return version::http10;
    return std::nullopt;
}

const char* httpd::to_string(version v) noexcept {
    return v == version::http10 ? "HTTP/1.0" : "HTTP/1.1";
}

bool httpd::request::keep_alive() const {
    if(version == httpd::version::http10) {
        return headers.has_token("Connection", "keep-alive");
    }
    return !headers.has_token("Connection", "close");
}

std::optional<std::string> httpd::normalize_target(std::string_view raw) {
    auto path_end = raw.find_first_of("?#");
    if(path_end != std::string_view::npos) raw = raw.substr(0, path_end);
    auto decoded = percent_decode(raw);
    if(!decoded) return std::nullopt;

    std::vector<std::string_view> segments;
    std::string_view rest = *decoded;
    while(!rest.empty()) {
        auto slash = rest.find('/');
        auto segment = rest.substr(0, slash);
        if(segment == "..") {
            if(!segments.empty()) segments.pop_back();
        } else if(!segment.empty() && segment != ".") {
            segments.push_back(segment);
        }
        if(slash == std::string_view::npos) break;
        rest.remove_prefix(slash + 1);
    }

    std::string normalized;
    for(auto segment : segments) {
        normalized += '/';
        normalized += segment;
    }
    bool trailing_slash = !decoded->empty() && decoded->back() == '/';
    if(normalized.empty() || trailing_slash) normalized += '/';
    return normalized;
}
