#include "core/Logging.hpp"
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <iostream>
#include <mutex>

namespace pem {

namespace logging = boost::log;
namespace expr = boost::log::expressions;
namespace keywords = boost::log::keywords;

void initLogging(bool verbose)
{
    static std::once_flag sinkInstalled;
    std::call_once(sinkInstalled, []() {
        logging::add_console_log(
            std::clog,
            keywords::format = (expr::stream
                                << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%H:%M:%S.%f")
                                << " [" << logging::trivial::severity << "] "
                                << expr::smessage));
        logging::add_common_attributes();
    });

    logging::core::get()->set_filter(
        logging::trivial::severity >= (verbose ? logging::trivial::debug : logging::trivial::info));
}

} // namespace pem
