#ifndef USBSHARE_PROCESS_HPP
#define USBSHARE_PROCESS_HPP

#include <usbshare/log.hpp>

#include <memory>
#include <string>
#include <vector>

namespace usbshare {

using Arguments = std::vector<std::string>;

enum class Elevation {
    NONE,
    REQUIRED
};

struct ProcessResult {
    int exitCode = 0;
    std::string out;
    std::string err;
};

std::string joinArguments (const Arguments& args);
// Space-joined command line. Arguments are built internally; nothing is quoted or escaped.

// A long-running invocation. Destroying the handle terminates the process.
class BackgroundProcess {
public:
    virtual ~BackgroundProcess () = default;
    virtual bool running () = 0;
    virtual void terminate () = 0;
};

// Runs the external tool. Abstract so tests can substitute canned output.
class ProcessInvoker {
public:
    virtual ~ProcessInvoker () = default;

    virtual ProcessResult run (const Arguments& args, Elevation elevation) = 0;
    // Launch the tool once and block until it exits. Throws ToolNotFound if it cannot be
    // launched, ElevationDeclined if the user dismissed the privilege prompt.

    virtual std::unique_ptr<BackgroundProcess> spawn (const Arguments& args) = 0;
    // Start the tool without waiting for it.
};

class SystemProcessInvoker : public ProcessInvoker {
public:
    explicit SystemProcessInvoker (const std::string& tool);

    ProcessResult run (const Arguments& args, Elevation elevation) override;
    std::unique_ptr<BackgroundProcess> spawn (const Arguments& args) override;

private:
    std::string mTool;
    log::Logger mLog;
};

} // namespace usbshare

#endif
