#include <usbshare/log.hpp>

#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>

#include <boost/date_time/posix_time/posix_time_types.hpp>

#include <boost/program_options/value_semantic.hpp>

#include <iostream>
#include <string>

namespace usbshare { namespace log {

namespace po = boost::program_options;
namespace expr = boost::log::expressions;
namespace keywords = boost::log::keywords;

po::options_description optionsDescription () {
    po::options_description desc{"Logging options"};
    desc.add_options()
        ("log-level", po::value<severity_level>()->default_value(info),
            "minimum severity to log: trace, debug, info, warning, error or fatal")
        ("log-file", po::value<std::string>(), "also append log records to this file")
        ;
    return desc;
}

void initialize (const po::variables_map& options) {
    boost::log::add_common_attributes();

    auto format = expr::stream
        << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%H:%M:%S.%f")
        << " [" << boost::log::trivial::severity << "] "
        << expr::smessage;

    boost::log::add_console_log(std::clog, keywords::format = format);

    if (options.count("log-file")) {
        boost::log::add_file_log(
            keywords::file_name = options["log-file"].as<std::string>(),
            keywords::open_mode = std::ios_base::app,
            keywords::auto_flush = true,
            keywords::format = format);
    }

    auto level = options.count("log-level")
        ? options["log-level"].as<severity_level>()
        : info;
    boost::log::core::get()->set_filter(boost::log::trivial::severity >= level);
}

}} // usbshare::log
