#include <usbshare/options.hpp>

#include "platform.hpp"

#include <boost/program_options/errors.hpp>
#include <boost/program_options/parsers.hpp>
#include <boost/program_options/value_semantic.hpp>

#include <fstream>
#include <string>

namespace po = boost::program_options;

namespace usbshare {

std::ostream& operator<< (std::ostream& os, ListFormat f) {
    switch (f) {
        case ListFormat::AUTO: return os << "auto";
        case ListFormat::JSON: return os << "json";
        case ListFormat::TABLE: return os << "table";
    }
    return os;
}

std::istream& operator>> (std::istream& is, ListFormat& f) {
    std::string s;
    is >> s;
    if (s == "auto") { f = ListFormat::AUTO; }
    else if (s == "json") { f = ListFormat::JSON; }
    else if (s == "table") { f = ListFormat::TABLE; }
    else { is.setstate(std::ios_base::failbit); }
    return is;
}

std::string defaultTool () {
    return runningUnderWsl() ? "usbipd.exe" : "usbipd";
}

po::options_description optionsDescription () {
    po::options_description desc{"Device sharing options"};
    desc.add_options()
        ("tool", po::value<std::string>()->default_value(defaultTool()),
            "name or path of the usbipd executable")
        ("format", po::value<ListFormat>()->default_value(ListFormat::AUTO),
            "device list source: json (usbipd state), table (usbipd list), or auto to pick "
            "by tool version")
        ("workers", po::value<unsigned>()->default_value(2),
            "threads running bind, unbind, attach and detach")
        ("hotplug", po::bool_switch(),
            "refresh on USB events even under WSL, where only devices attached to this guest "
            "are seen")
        ("no-hotplug", po::bool_switch(), "do not refresh on USB arrival and removal")
        ("config", po::value<std::string>(), "read further options from this file")
        ;
    return desc;
}

void storeConfigFile (po::variables_map& vm) {
    if (!vm.count("config")) {
        return;
    }
    auto path = vm["config"].as<std::string>();
    std::ifstream file{path};
    if (!file) {
        throw po::reading_file{path.c_str()};
    }
    // Only the keys that make sense in a file; unknown keys are an error.
    auto desc = optionsDescription();
    po::store(po::parse_config_file(file, desc), vm);
}

Options fromVariables (const po::variables_map& vm) {
    auto options = Options{};
    if (vm.count("tool")) {
        options.tool = vm["tool"].as<std::string>();
    }
    if (options.tool.empty()) {
        throw po::invalid_option_value{"--tool must not be empty"};
    }
    if (vm.count("format")) {
        options.format = vm["format"].as<ListFormat>();
    }
    if (vm.count("workers")) {
        options.workers = vm["workers"].as<unsigned>();
    }
    if (!options.workers) {
        throw po::invalid_option_value{"--workers must be at least 1"};
    }
    auto flag = [&vm] (const char* name) {
        return vm.count(name) && vm[name].as<bool>();
    };
    options.hotplug = (hotplugSeesHost() || flag("hotplug")) && !flag("no-hotplug");
    return options;
}

} // namespace usbshare
