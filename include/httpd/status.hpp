#ifndef HTTPD_STATUS_HPP_INCLUDED
#define HTTPD_STATUS_HPP_INCLUDED
#include <string>
namespace httpd {
    namespace status {
        constexpr int ok = 200;
        constexpr int bad_request = 400;
        constexpr int not_found = 404;
        constexpr int method_not_allowed = 405;
        constexpr int payload_too_large = 413;
        constexpr int header_fields_too_large = 431;
        constexpr int internal_server_error = 500;
        constexpr int not_implemented = 501;
        constexpr int version_not_supported = 505;
    }

    // Reason phrase for a status code; "Unknown" for codes outside the supported set
    std::string reason_phrase(int code);
}
#endif
