#include <httpd/parser.hpp>
#include <httpd/error.hpp>
#include <algorithm>
#include <cctype>
#include <vector>
#include <fmt/format.h>

static const char header_kv_delim = ':';

static std::string_view trim(std::string_view s) {
    auto first = s.find_first_not_of(" \t");
    if(first == std::string_view::npos) return {};
    auto last = s.find_last_not_of(" \t");
    return s.substr(first, last - first + 1);
}

static std::vector<std::string_view> split(std::string_view s, char delim) {
    std::vector<std::string_view> parts;
    while(true) {
        auto delim_pos = s.find(delim);
        parts.push_back(s.substr(0, delim_pos));
        if(delim_pos == std::string_view::npos) break;
        s.remove_prefix(delim_pos + 1);
    }
    return parts;
}

static bool is_token_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || std::string_view{"!#$%&'*+-.^_`|~"}.find(c) != std::string_view::npos;
}

// "HTTP/" followed by a single digit, a dot and a single digit
static bool looks_like_version(std::string_view token) {
    return token.size() == 8 && token.substr(0, 5) == "HTTP/"
        && std::isdigit(static_cast<unsigned char>(token[5]))
        && token[6] == '.'
        && std::isdigit(static_cast<unsigned char>(token[7]));
}

// Reduces absolute-form targets ("http://host/path") to their path
static std::string_view origin_form(std::string_view target) {
    for(std::string_view scheme : {"http://", "https://"}) {
        if(target.size() >= scheme.size() && std::equal(scheme.begin(), scheme.end(), target.begin(), [](char a, char b){
            return a == std::tolower(static_cast<unsigned char>(b));
        })) {
            auto path_start = target.find('/', scheme.size());
            return path_start == std::string_view::npos ? std::string_view{"/"} : target.substr(path_start);
        }
    }
    return target;
}

httpd::request_parser::request_parser(parser_limits limits) : limits(limits) {
}

std::optional<std::string_view> httpd::request_parser::take_line() {
    auto line_end = buffer.find('\n', consumed);
    if(line_end == std::string::npos) {
        if(header_bytes + (buffer.size() - consumed) > limits.max_header_bytes) {
            throw parse_error(parse_error_kind::too_large,
                fmt::format("request head exceeds {} bytes", limits.max_header_bytes));
        }
        return std::nullopt;
    }
    std::string_view line{buffer.data() + consumed, line_end - consumed};
    header_bytes += line_end - consumed + 1;
    consumed = line_end + 1;
    if(header_bytes > limits.max_header_bytes) {
        throw parse_error(parse_error_kind::too_large,
            fmt::format("request head exceeds {} bytes", limits.max_header_bytes));
    }
    if(!line.empty() && line.back() == '\r') line.remove_suffix(1);
    return line;
}

void httpd::request_parser::parse_request_line(std::string_view line) {
    auto tokens = split(line, ' ');
    if(tokens.size() != 3 || std::any_of(tokens.begin(), tokens.end(), [](auto t){ return t.empty(); })) {
        throw parse_error(parse_error_kind::malformed_line,
            fmt::format("expected 3 tokens in request line, got '{}'", line));
    }

    auto m = parse_method(tokens[0]);
    if(!m) {
        throw parse_error(parse_error_kind::malformed_line, fmt::format("unrecognised method '{}'", tokens[0]));
    }

    if(!looks_like_version(tokens[2])) {
        throw parse_error(parse_error_kind::malformed_line, fmt::format("unrecognised version '{}'", tokens[2]));
    }
    auto v = parse_version(tokens[2]);
    if(!v) {
        throw parse_error(parse_error_kind::unsupported_version, fmt::format("unsupported version '{}'", tokens[2]));
    }

    auto path = origin_form(tokens[1]);
    std::optional<std::string> normalized;
    if(!path.empty() && path.front() == '/') normalized = normalize_target(path);
    if(!normalized) {
        throw parse_error(parse_error_kind::malformed_line, fmt::format("bad request target '{}'", tokens[1]));
    }

    pending.method = *m;
    pending.raw_target = std::string{tokens[1]};
    pending.target = std::move(*normalized);
    pending.version = *v;
}

void httpd::request_parser::parse_header_line(std::string_view line) {
    auto key_end = line.find(header_kv_delim);
    if(key_end == std::string_view::npos) {
        throw parse_error(parse_error_kind::malformed_header, fmt::format("no colon in header line '{}'", line));
    }
    auto name = line.substr(0, key_end);
    if(name.empty() || !std::all_of(name.begin(), name.end(), is_token_char)) {
        throw parse_error(parse_error_kind::malformed_header, fmt::format("bad header name '{}'", name));
    }
    auto value = trim(line.substr(key_end + 1));
    // Repeated Content-Length must agree whatever the duplicate policy, or framing is ambiguous
    if(iequals(name, "Content-Length")) {
        if(auto previous = pending.headers.get(name)) {
            for(auto item : split(*previous, ',')) {
                if(trim(item) != value) {
                    throw parse_error(parse_error_kind::bad_content_length,
                        fmt::format("conflicting Content-Length '{}' and '{}'", *previous, value));
                }
            }
        }
    }
    pending.headers.add(std::string{name}, std::string{value}, limits.duplicates);
}

void httpd::request_parser::finish_headers() {
    if(pending.headers.contains("Transfer-Encoding")) {
        throw parse_error(parse_error_kind::unsupported_transfer_encoding, "Transfer-Encoding request bodies are not supported");
    }

    auto content_length = pending.headers.get("Content-Length");
    body_length = 0;
    if(content_length) {
        // Joined duplicates are accepted as long as they agree
        std::optional<std::size_t> length;
        for(auto item : split(*content_length, ',')) {
            item = trim(item);
            if(item.empty() || item.size() > 18 || !std::all_of(item.begin(), item.end(), [](char c){
                return std::isdigit(static_cast<unsigned char>(c));
            })) {
                throw parse_error(parse_error_kind::bad_content_length, fmt::format("bad Content-Length '{}'", *content_length));
            }
            auto n = static_cast<std::size_t>(std::stoull(std::string{item}));
            if(length && *length != n) {
                throw parse_error(parse_error_kind::bad_content_length, fmt::format("conflicting Content-Length '{}'", *content_length));
            }
            length = n;
        }
        body_length = *length;
    }

    if(body_length > limits.max_body_bytes) {
        throw parse_error(parse_error_kind::body_too_large,
            fmt::format("body of {} bytes exceeds {}", body_length, limits.max_body_bytes));
    }
    current = body_length > 0 ? stage::body : stage::done;
}

void httpd::request_parser::feed(std::string_view bytes) {
    if(!bytes.empty()) buffer.append(bytes.data(), bytes.size());
    while(current != stage::done) {
        if(current == stage::body) {
            if(buffer.size() - consumed < body_length) return;
            pending.body.assign(buffer, consumed, body_length);
            consumed += body_length;
            current = stage::done;
            return;
        }

        auto line = take_line();
        if(!line) return;
        if(current == stage::request_line) {
            // Stray blank lines between requests are skipped
            if(line->empty()) continue;
            parse_request_line(*line);
            current = stage::headers;
        } else if(line->empty()) {
            finish_headers();
        } else {
            if(line->front() == ' ' || line->front() == '\t') {
                throw parse_error(parse_error_kind::malformed_header, "obsolete header line folding");
            }
            parse_header_line(*line);
        }
    }
}

std::optional<httpd::request> httpd::request_parser::next() {
    if(current != stage::done) return std::nullopt;
    request completed = std::move(pending);
    pending = request{};
    buffer.erase(0, consumed);
    consumed = 0;
    header_bytes = 0;
    body_length = 0;
    current = stage::request_line;
    return completed;
}

bool httpd::request_parser::mid_request() const {
    if(current == stage::done) return false;
    if(current != stage::request_line) return true;
    // Only blank lines seen so far do not count as a started request
    return std::any_of(buffer.begin() + consumed, buffer.end(), [](char c){ return c != '\r' && c != '\n'; });
}

void httpd::request_parser::reset() {
    buffer.clear();
    consumed = 0;
    header_bytes = 0;
    body_length = 0;
    current = stage::request_line;
    pending = request{};
}

httpd::request httpd::parse_request(std::string_view bytes, parser_limits limits) {
    request_parser parser{limits};
    parser.feed(bytes);
    auto req = parser.next();
    if(!req) {
        throw parse_error(parse_error_kind::malformed_line, "incomplete request");
    }
    return std::move(*req);
}
