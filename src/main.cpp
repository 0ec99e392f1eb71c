#include <usbshare/error.hpp>
#include <usbshare/log.hpp>
#include <usbshare/manager.hpp>
#include <usbshare/options.hpp>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <boost/program_options/errors.hpp>
#include <boost/program_options/parsers.hpp>
#include <boost/program_options/positional_options.hpp>
#include <boost/program_options/value_semantic.hpp>

#include <csignal>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <string>

namespace po = boost::program_options;

namespace {

const char* kUsage =
    "usbshare - share USB devices with WSL through usbipd\n"
    "\n"
    "USAGE:\n"
    "    usbshare [OPTIONS] <command> [busid|guid]\n"
    "\n"
    "COMMANDS:\n"
    "    list          print the devices usbipd knows about\n"
    "    version       print the usbipd version\n"
    "    bind          share a device (add --force to override other drivers)\n"
    "    unbind        stop sharing a device\n"
    "    unbind-all    stop sharing every device\n"
    "    attach        attach a device to WSL, sharing it first if needed\n"
    "    detach        detach a device from WSL\n"
    "    auto-attach   keep a device attached, re-attaching on reconnect, until interrupted\n"
    "    watch         print the device list whenever a USB device comes or goes\n";

void printDevices (std::ostream& os, const usbshare::DeviceList& devices) {
    os << "Connected:\n" << std::left
       << std::setw(8) << "BUSID" << std::setw(11) << "VID:PID"
       << std::setw(60) << "DEVICE" << "STATE\n";
    for (const auto& d : devices) {
        if (d.connected()) {
            os << std::setw(8) << d.busId() << std::setw(11) << d.hardwareId()
               << std::setw(60) << d.description() << d.state() << '\n';
        }
    }
    os << "\nPersisted:\n" << std::setw(38) << "GUID" << "DEVICE\n";
    for (const auto& d : devices) {
        if (!d.connected() && d.persisted()) {
            os << std::setw(38) << d.persistedGuid() << d.description() << '\n';
        }
    }
    os << std::flush;
}

void waitForSignal () {
    boost::asio::io_context context;
    boost::asio::signal_set signals{context, SIGINT, SIGTERM};
    signals.async_wait([] (const boost::system::error_code&, int) {});
    context.run();
}

int run (usbshare::Manager& manager, const std::string& command, const std::string& device,
        bool force) {
    auto requireDevice = [&] {
        if (device.empty()) {
            throw po::error{"'" + command + "' needs a bus id or GUID"};
        }
    };

    if (command == "version") {
        std::cout << manager.version() << '\n';
        return EXIT_SUCCESS;
    }

    usbshare::log::Logger lg;
    if (manager.version().major < 4) {
        BOOST_LOG_SEV(lg, usbshare::log::warning) << "usbipd " << manager.version()
            << " is older than 4.0.0 and has not been tested";
    }

    if (command == "list") {
        printDevices(std::cout, *manager.refresh().get());
    }
    else if (command == "bind") {
        requireDevice();
        manager.bind(device, force).get();
    }
    else if (command == "unbind") {
        requireDevice();
        manager.unbind(device).get();
    }
    else if (command == "unbind-all") {
        manager.unbindAll().get();
    }
    else if (command == "attach") {
        requireDevice();
        manager.attach(device).get();
    }
    else if (command == "detach") {
        requireDevice();
        manager.detach(device).get();
    }
    else if (command == "auto-attach") {
        requireDevice();
        manager.startAutoAttach(device).get();
        std::cout << "Auto-attaching " << device << ", press Ctrl+C to stop" << std::endl;
        waitForSignal();
        manager.stopAutoAttach(device).get();
    }
    else if (command == "watch") {
        auto connection = manager.connect([] (const usbshare::DeviceListPtr& devices) {
            printDevices(std::cout, *devices);
            std::cout << '\n';
        });
        manager.refresh().get();
        waitForSignal();
        connection.disconnect();
    }
    else {
        throw po::error{"unknown command '" + command + "'"};
    }
    return EXIT_SUCCESS;
}

} // <anonymous>

int main (int argc, char** argv) {
    auto general = po::options_description{"General options"};
    general.add_options()
        ("help,h", "print this help and exit")
        ("version,v", "print the usbshare version and exit")
        ("force", po::bool_switch(), "with bind: share even if another driver claims the device")
        ;
    auto hidden = po::options_description{};
    hidden.add_options()
        ("command", po::value<std::string>())
        ("device", po::value<std::string>())
        ;
    auto visible = po::options_description{};
    visible.add(general).add(usbshare::optionsDescription()).add(usbshare::log::optionsDescription());
    auto all = po::options_description{};
    all.add(visible).add(hidden);

    auto positional = po::positional_options_description{};
    positional.add("command", 1).add("device", 1);

    po::variables_map vm;
    auto options = usbshare::Options{};
    try {
        po::store(po::command_line_parser(argc, argv).options(all).positional(positional).run(), vm);
        usbshare::storeConfigFile(vm);
        po::notify(vm);

        if (vm.count("help")) {
            std::cout << kUsage << '\n' << visible << '\n';
            return EXIT_SUCCESS;
        }
        if (vm.count("version")) {
            std::cout << USBSHARE_VERSION << '\n';
            return EXIT_SUCCESS;
        }
        if (!vm.count("command")) {
            throw po::error{"no command given, see --help"};
        }
        options = usbshare::fromVariables(vm);
    }
    catch (const po::error& e) {
        std::cerr << "Error: " << e.what() << '\n';
        return EXIT_FAILURE;
    }

    usbshare::log::initialize(vm);

    auto command = vm["command"].as<std::string>();
    auto device = vm.count("device") ? vm["device"].as<std::string>() : std::string{};
    options.hotplug = options.hotplug && (command == "watch" || command == "auto-attach");

    try {
        usbshare::Manager manager{options};
        return run(manager, command, device, vm["force"].as<bool>());
    }
    catch (const usbshare::ToolNotFound& e) {
        std::cerr << "Error: " << e.what() << "\nInstall usbipd-win from "
            "https://github.com/dorssel/usbipd-win/releases or point --tool at it.\n";
    }
    catch (const usbshare::ElevationDeclined&) {
        std::cerr << "Cancelled: administrator privileges are needed for this command.\n";
    }
    catch (const usbshare::CommandError& e) {
        std::cerr << "Error: usbipd exited with code " << e.exitCode() << '\n' << e.stderrText();
    }
    catch (const usbshare::Error& e) {
        std::cerr << "Error: " << e.what() << '\n';
    }
    catch (const po::error& e) {
        std::cerr << "Error: " << e.what() << '\n';
    }
    catch (const std::exception& e) {
        std::cerr << "Unexpected error: " << e.what() << '\n';
    }
    return EXIT_FAILURE;
}
