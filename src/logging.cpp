#include <httpd/logging.hpp>
#include <iostream>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/keywords/auto_flush.hpp>
#include <boost/log/keywords/format.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>

namespace logging = boost::log;
namespace expr = boost::log::expressions;

void httpd::init_logging(logging::trivial::severity_level level) {
    logging::add_common_attributes();
    logging::add_console_log(
        std::clog,
        logging::keywords::format = (
            expr::stream
                << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y.%m.%d %H:%M:%S")
                << " " << logging::trivial::severity
                << " " << expr::smessage
        ),
        logging::keywords::auto_flush = true
    );
    logging::core::get()->set_filter(logging::trivial::severity >= level);
}
