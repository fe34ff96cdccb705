#include <httpd/encoding.hpp>
#include <httpd/status.hpp>
#include <cstdlib>
#include <optional>
#include <boost/iostreams/copy.hpp>
#include <boost/iostreams/device/array.hpp>
#include <boost/iostreams/device/back_inserter.hpp>
#include <boost/iostreams/filtering_stream.hpp>
#include <boost/iostreams/filter/gzip.hpp>

namespace io = boost::iostreams;

std::string httpd::gzip_compress(std::string_view data) {
    std::string compressed;
    {
        io::filtering_ostream out;
        out.push(io::gzip_compressor{});
        out.push(io::back_inserter(compressed));
        out.write(data.data(), static_cast<std::streamsize>(data.size()));
    }
    return compressed;
}

std::string httpd::gzip_decompress(std::string_view data) {
    std::string decompressed;
    io::filtering_istream in;
    in.push(io::gzip_decompressor{});
    in.push(io::array_source{data.data(), data.size()});
    io::copy(in, io::back_inserter(decompressed));
    return decompressed;
}

static std::string_view trim(std::string_view s) {
    auto first = s.find_first_not_of(" \t");
    if(first == std::string_view::npos) return {};
    auto last = s.find_last_not_of(" \t");
    return s.substr(first, last - first + 1);
}

// q-value of one Accept-Encoding entry, 1 when absent; malformed values count as 0
static double quality(std::string_view params) {
    while(!params.empty()) {
        auto semi = params.find(';');
        auto param = trim(params.substr(0, semi));
        if(param.size() >= 2 && (param[0] == 'q' || param[0] == 'Q') && param[1] == '=') {
            std::string value{param.substr(2)};
            char* end = nullptr;
            double q = std::strtod(value.c_str(), &end);
            if(value.empty() || *end != '\0') return 0.0;
            return q;
        }
        if(semi == std::string_view::npos) break;
        params.remove_prefix(semi + 1);
    }
    return 1.0;
}

bool httpd::accepts_gzip(const header_map& headers) {
    auto accept = headers.get("Accept-Encoding");
    if(!accept) return false;
    std::optional<double> gzip_q;
    std::optional<double> wildcard_q;
    std::string_view rest = *accept;
    while(!rest.empty()) {
        auto comma = rest.find(',');
        auto item = trim(rest.substr(0, comma));
        auto semi = item.find(';');
        auto coding = trim(item.substr(0, semi));
        double q = semi == std::string_view::npos ? 1.0 : quality(item.substr(semi + 1));
        if(iequals(coding, "gzip") || iequals(coding, "x-gzip")) {
            gzip_q = q;
        } else if(coding == "*") {
            wildcard_q = q;
        }
        if(comma == std::string_view::npos) break;
        rest.remove_prefix(comma + 1);
    }
    if(gzip_q) return *gzip_q > 0.0;
    return wildcard_q && *wildcard_q > 0.0;
}

bool httpd::wants_gzip(const request& req, const response& r) {
    return (req.method == method::get || req.method == method::head)
        && r.code == status::ok
        && !r.body.empty()
        && !r.headers.contains("Content-Encoding")
        && accepts_gzip(req.headers);
}

httpd::response httpd::encode_gzip(response r) {
    r.body = gzip_compress(r.body);
    r.headers.set("Content-Encoding", "gzip");
    r.headers.set("Content-Length", std::to_string(r.body.size()));
    r.headers.set("Vary", "Accept-Encoding");
    return r;
}
