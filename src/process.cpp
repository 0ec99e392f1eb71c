#include <usbshare/error.hpp>
#include <usbshare/process.hpp>

#include "platform.hpp"

#include <boost/predef.h>
#include <boost/process.hpp>
#if BOOST_OS_WINDOWS
#include <boost/process/windows.hpp>
#endif

#include <boost/algorithm/string/join.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/filesystem/operations.hpp>

#include <future>
#include <system_error>
#include <utility>

namespace bp = boost::process;

namespace usbshare {

namespace {

template <class... Init>
bp::child launch (const boost::filesystem::path& exe, const Arguments& args, Init&&... init) {
    try {
#if BOOST_OS_WINDOWS
        return bp::child(exe, bp::args(args), std::forward<Init>(init)...,
            bp::windows::create_no_window);
#else
        return bp::child(exe, bp::args(args), std::forward<Init>(init)...);
#endif
    }
    catch (const bp::process_error& e) {
        BOOST_LOG_TRIVIAL(error) << "Launching " << exe << " failed: " << e.what();
        throw ToolNotFound{exe.string()};
    }
}

class SystemBackgroundProcess : public BackgroundProcess {
public:
    explicit SystemBackgroundProcess (bp::child child) : mChild(std::move(child)) {}

    ~SystemBackgroundProcess () override {
        terminate();
    }

    bool running () override {
        std::error_code ec;
        return mChild.running(ec);
    }

    void terminate () override {
        // On POSIX this is SIGKILL followed by a wait, so nothing is left behind as a zombie.
        std::error_code ec;
        if (mChild.running(ec)) {
            mChild.terminate(ec);
        }
    }

private:
    bp::child mChild;
};

} // <anonymous>

std::string joinArguments (const Arguments& args) {
    return boost::algorithm::join(args, " ");
}

boost::filesystem::path findExecutable (const std::string& name) {
    auto path = boost::filesystem::path{name};
    if (path.has_parent_path()) {
        boost::system::error_code ec;
        if (boost::filesystem::exists(path, ec)) {
            return path;
        }
        throw ToolNotFound{name};
    }
    auto found = bp::search_path(path);
    if (found.empty()) {
        throw ToolNotFound{name};
    }
    return found;
}

ProcessResult capture (const boost::filesystem::path& exe, const Arguments& args) {
    boost::asio::io_context context;
    std::future<std::string> out;
    std::future<std::string> err;
    auto child = launch(exe, args,
        bp::std_in < bp::null, bp::std_out > out, bp::std_err > err, context);
    context.run();
    child.wait();
    return {child.exit_code(), out.get(), err.get()};
}

SystemProcessInvoker::SystemProcessInvoker (const std::string& tool)
    : mTool(tool)
{}

ProcessResult SystemProcessInvoker::run (const Arguments& args, Elevation elevation) {
    BOOST_LOG_SEV(mLog, log::debug) << "Running '" << mTool << ' ' << joinArguments(args) << "'"
        << (elevation == Elevation::REQUIRED ? " elevated" : "");
    auto exe = findExecutable(mTool);
    auto result = elevation == Elevation::REQUIRED
        ? runElevated(exe, args, mLog)
        : capture(exe, args);
    if (result.exitCode) {
        BOOST_LOG_SEV(mLog, log::debug) << "'" << mTool << ' ' << joinArguments(args)
            << "' exited with " << result.exitCode;
    }
    return result;
}

std::unique_ptr<BackgroundProcess> SystemProcessInvoker::spawn (const Arguments& args) {
    BOOST_LOG_SEV(mLog, log::debug) << "Spawning '" << mTool << ' ' << joinArguments(args) << "'";
    auto exe = findExecutable(mTool);
    return std::make_unique<SystemBackgroundProcess>(
        launch(exe, args, bp::std_in < bp::null, bp::std_out > bp::null, bp::std_err > bp::null));
}

} // namespace usbshare
