#include "loopcast/logging.hpp"

#include <boost/date_time/posix_time/posix_time_types.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>

#include <iostream>
#include <stdexcept>
#include <string>

namespace loopcast {

namespace logging = boost::log;
namespace expr = boost::log::expressions;

boost::log::trivial::severity_level parse_severity(std::string_view level) {
    using boost::log::trivial::severity_level;

    if (level == "trace") return severity_level::trace;
    if (level == "debug") return severity_level::debug;
    if (level == "info") return severity_level::info;
    if (level == "warning") return severity_level::warning;
    if (level == "error") return severity_level::error;
    if (level == "fatal") return severity_level::fatal;
    throw std::invalid_argument("Unknown log level: " + std::string(level));
}

void init_logging(const LogConfig& config) {
    const auto threshold = parse_severity(config.level);

    const auto formatter =
        expr::stream << "["
                     << expr::format_date_time<boost::posix_time::ptime>("TimeStamp",
                                                                         "%H:%M:%S.%f")
                     << "] [" << logging::trivial::severity << "] " << expr::smessage;

    logging::core::get()->remove_all_sinks();

    if (config.file.empty()) {
        logging::add_console_log(std::clog, logging::keywords::format = formatter,
                                 logging::keywords::auto_flush = true);
    } else {
        logging::add_file_log(logging::keywords::file_name = config.file,
                              logging::keywords::open_mode = std::ios_base::app,
                              logging::keywords::format = formatter,
                              logging::keywords::auto_flush = true);
    }

    logging::add_common_attributes();
    logging::core::get()->set_filter(logging::trivial::severity >= threshold);
}

}  // namespace loopcast
