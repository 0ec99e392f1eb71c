#include <usbshare/error.hpp>
#include <usbshare/hotplug.hpp>
#include <usbshare/log.hpp>

#include "platform.hpp"

#include <boost/process.hpp>

#include <boost/asio/buffers_iterator.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/streambuf.hpp>

#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/replace.hpp>
#include <boost/algorithm/string/trim.hpp>

#include <boost/filesystem/fstream.hpp>
#include <boost/filesystem/operations.hpp>

#include <exception>
#include <string>
#include <system_error>
#include <thread>

#include <unistd.h>

namespace bp = boost::process;

namespace usbshare {

namespace {

// pkexec's exit status when the user dismissed the authentication dialog.
const int kPkexecDismissed = 126;

// ERROR_CANCELLED, which uacScript() exits with when the UAC prompt was dismissed.
const int kUacDismissed = 1223;

std::string powershellQuote (const std::string& s) {
    return "'" + boost::algorithm::replace_all_copy(s, "'", "''") + "'";
}

// Linux root means nothing to a Windows program reached through WSL interop; only UAC can
// elevate it.
ProcessResult runElevatedOnWindows (const boost::filesystem::path& exe, const Arguments& args,
        log::Logger& lg) {
    auto wslpath = Arguments{"-w", boost::filesystem::absolute(exe).string()};
    auto converted = capture(findExecutable("wslpath"), wslpath);
    if (converted.exitCode) {
        throw CommandError{"wslpath " + joinArguments(wslpath), converted.exitCode, converted.err};
    }
    auto windowsExe = boost::algorithm::trim_copy(converted.out);

    BOOST_LOG_SEV(lg, log::info) << "Requesting UAC elevation for '" << windowsExe << ' '
        << joinArguments(args) << "'";

    auto result = capture(findExecutable("powershell.exe"),
        {"-NoProfile", "-NonInteractive", "-Command", uacScript(windowsExe, args)});
    if (kUacDismissed == result.exitCode) {
        throw ElevationDeclined{};
    }
    return result;
}

Arguments udevadmMonitorArguments () {
    return {
        // When run in a terminal, `udevadm` has line-buffered output. When run in a pipeline it is
        // block-buffered, so events would arrive in bursts long after they happened. `stdbuf -oL`
        // forces line buffering.
        "-oL",
        findExecutable("udevadm").string(),
        "monitor",
        "--udev",  // Only post-processed udev events
        "--property",  // Dump the properties that identify the device
        "--subsystem-match=usb"
    };
}

} // <anonymous>

std::string uacScript (const std::string& windowsExe, const Arguments& args) {
    auto cancelled = std::to_string(kUacDismissed);
    return "try { $p = Start-Process -FilePath " + powershellQuote(windowsExe)
        + " -ArgumentList " + powershellQuote(joinArguments(args))
        + " -Verb RunAs -WindowStyle Hidden -Wait -PassThru; exit $p.ExitCode }"
        + " catch { $e = $_.Exception; while ($e.InnerException) { $e = $e.InnerException };"
        + " if ($e.NativeErrorCode -eq " + cancelled + ") { exit " + cancelled + " };"
        + " [Console]::Error.WriteLine($_.Exception.Message); exit 1 }";
}

bool runningUnderWsl () {
    // WSL kernels identify themselves as e.g. 5.15.90.1-microsoft-standard-WSL2.
    boost::filesystem::ifstream release{"/proc/sys/kernel/osrelease"};
    std::string line;
    return std::getline(release, line) && boost::algorithm::icontains(line, "microsoft");
}

ProcessResult runElevated (const boost::filesystem::path& exe, const Arguments& args,
        log::Logger& lg) {
    if (runningUnderWsl() && boost::algorithm::iends_with(exe.string(), ".exe")) {
        return runElevatedOnWindows(exe, args, lg);
    }
    if (::geteuid() == 0) {
        return capture(exe, args);
    }

    auto pkexec = findExecutable("pkexec");
    auto full = Arguments{boost::filesystem::absolute(exe).string()};
    full.insert(full.end(), args.begin(), args.end());
    BOOST_LOG_SEV(lg, log::info) << "Requesting elevation for '" << joinArguments(full) << "'";

    auto result = capture(pkexec, full);
    if (kPkexecDismissed == result.exitCode) {
        throw ElevationDeclined{};
    }
    return result;
}

struct HotplugMonitor::Impl {
    explicit Impl (Callback cb);

    void receive ();
    void close ();

    Callback callback;
    boost::asio::io_context context;
    bp::async_pipe pipe;
    bp::child child;
    boost::asio::streambuf buf;
    std::thread thread;
    log::Logger lg;
};

HotplugMonitor::Impl::Impl (Callback cb)
    : callback(std::move(cb))
    , pipe(context)
    , child(findExecutable("stdbuf"), bp::args(udevadmMonitorArguments()),
        bp::std_in < bp::null, bp::std_out > pipe, bp::std_err > bp::null)
{
    receive();
    thread = std::thread{[this] { context.run(); }};
}

void HotplugMonitor::Impl::receive () {
    boost::asio::async_read_until(pipe, buf, "\n\n",
        [this] (const boost::system::error_code& ec, std::size_t n) {
            if (ec) {
                if (ec != boost::asio::error::operation_aborted && ec != boost::asio::error::eof) {
                    BOOST_LOG_SEV(lg, log::warning) << "udevadm monitor stopped: " << ec.message();
                }
                return;
            }

            auto begin = boost::asio::buffers_begin(buf.data());
            auto block = std::string(begin, begin + n);
            buf.consume(n);

            auto event = HotplugEvent{};
            if (parseUdevadm(block, event)) {
                BOOST_LOG_SEV(lg, log::debug) << "Hotplug event: " << event;
                try {
                    callback(event);
                }
                catch (const std::exception& e) {
                    BOOST_LOG_SEV(lg, log::error) << "Hotplug callback threw: " << e.what();
                }
            }
            receive();
        });
}

void HotplugMonitor::Impl::close () {
    std::error_code ec;
    if (child.running(ec)) {
        child.terminate(ec);
    }
    boost::asio::post(context, [this] {
        boost::system::error_code ec;
        pipe.close(ec);
    });
    if (thread.joinable()) {
        thread.join();
    }
}

bool hotplugSeesHost () {
    return !runningUnderWsl();
}

HotplugMonitor::HotplugMonitor (Callback callback)
    : mImpl(std::make_unique<Impl>(std::move(callback)))
{}

HotplugMonitor::~HotplugMonitor () {
    close();
}

void HotplugMonitor::close () {
    if (mImpl) {
        mImpl->close();
        mImpl.reset();
    }
}

} // namespace usbshare
