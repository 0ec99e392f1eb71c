#ifndef USBSHARE_LOG_HPP
#define USBSHARE_LOG_HPP

#include <boost/log/common.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/trivial.hpp>

#include <boost/program_options/options_description.hpp>
#include <boost/program_options/variables_map.hpp>

namespace usbshare { namespace log {

using boost::log::trivial::severity_level;
using boost::log::trivial::trace;
using boost::log::trivial::debug;
using boost::log::trivial::info;
using boost::log::trivial::warning;
using boost::log::trivial::error;
using boost::log::trivial::fatal;

using Logger = boost::log::sources::severity_logger_mt<severity_level>;

boost::program_options::options_description optionsDescription ();
// --log-level and --log-file.

void initialize (const boost::program_options::variables_map& options);
// Install the console sink, and a file sink if --log-file was given. Call once.

}} // usbshare::log

#endif
