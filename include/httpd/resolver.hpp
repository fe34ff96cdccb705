#ifndef HTTPD_RESOLVER_HPP_INCLUDED
#define HTTPD_RESOLVER_HPP_INCLUDED
#include <string>
#include <string_view>
#include <httpd/request.hpp>
#include <httpd/response.hpp>
namespace httpd {
    class content_source;

    std::string content_type_for(std::string_view path);

    // Maps requests onto a content source. Holds no mutable state, so one instance is shared
    // by every connection.
    class resolver {
        const content_source& source;
        bool gzip;

        response serve(const request& req) const;

        public:
        // With gzip set, 200 answers to GET and HEAD are gzip-encoded when the client accepts it
        explicit resolver(const content_source& source, bool gzip = false);
        // Faults become 404, 405 or 500 responses
        response resolve(const request& req) const;
    };
}
#endif
