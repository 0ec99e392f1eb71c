#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include <usbshare/log.hpp>

#include <boost/program_options/parsers.hpp>
#include <boost/program_options/variables_map.hpp>

int main (int argc, char** argv) {
    // We need a custom main() because we want to make sure we set up logging only once.
    auto desc = usbshare::log::optionsDescription();
    boost::program_options::parsed_options parsed{&desc};
    boost::program_options::variables_map options;
    boost::program_options::store(parsed, options);
    boost::program_options::notify(options);
    usbshare::log::initialize(options);

    doctest::Context context;
    context.applyCommandLine(argc, argv);
    return context.run();
}
