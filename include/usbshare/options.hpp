#ifndef USBSHARE_OPTIONS_HPP
#define USBSHARE_OPTIONS_HPP

#include <usbshare/hotplug.hpp>
#include <usbshare/store.hpp>

#include <boost/program_options/options_description.hpp>
#include <boost/program_options/variables_map.hpp>

#include <string>

namespace usbshare {

std::string defaultTool ();
// `usbipd.exe` under WSL, where interop exposes Windows programs only by their full name.

struct Options {
    std::string tool = defaultTool();
    ListFormat format = ListFormat::AUTO;
    unsigned workers = 2;
    bool hotplug = hotplugSeesHost();
};

boost::program_options::options_description optionsDescription ();
// --tool, --format, --workers, --hotplug, --no-hotplug, --config.

void storeConfigFile (boost::program_options::variables_map& vm);
// If --config was given, read that file into `vm`. Values already in `vm` take precedence.

Options fromVariables (const boost::program_options::variables_map& vm);
// Throws boost::program_options::error for invalid values.

} // namespace usbshare

#endif
