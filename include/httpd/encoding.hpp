#ifndef HTTPD_ENCODING_HPP_INCLUDED
#define HTTPD_ENCODING_HPP_INCLUDED
#include <string>
#include <string_view>
#include <httpd/request.hpp>
#include <httpd/response.hpp>
namespace httpd {
    std::string gzip_compress(std::string_view data);
    std::string gzip_decompress(std::string_view data);

    // Whether Accept-Encoding admits gzip. A zero q-value is a refusal, and an explicit gzip
    // entry takes precedence over "*".
    bool accepts_gzip(const header_map& headers);
    // Whether r should be sent gzip-encoded in answer to req. HEAD qualifies like GET so
    // that both carry the same headers; r must still hold the full body.
    bool wants_gzip(const request& req, const response& r);
    response encode_gzip(response r);
}
#endif
