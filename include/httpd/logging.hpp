#ifndef HTTPD_LOGGING_HPP_INCLUDED
#define HTTPD_LOGGING_HPP_INCLUDED
#include <boost/log/trivial.hpp>
namespace httpd {
    // Console sink with timestamps, filtered at level
    void init_logging(boost::log::trivial::severity_level level);
}
#endif
