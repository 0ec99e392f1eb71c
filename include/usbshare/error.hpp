#ifndef USBSHARE_ERROR_HPP
#define USBSHARE_ERROR_HPP

#include <stdexcept>
#include <string>

namespace usbshare {

struct Error : std::runtime_error {
    explicit Error (const std::string& what) : std::runtime_error{what} {}
};

// The external tool (or the helper used to elevate it) could not be launched.
struct ToolNotFound : Error {
    explicit ToolNotFound (const std::string& tool)
        : Error{"'" + tool + "' was not found, is it installed and on the PATH?"}
        , mTool(tool)
    {}
    const std::string& tool () const { return mTool; }
private:
    std::string mTool;
};

// The user dismissed the privilege escalation prompt. Nothing was run.
struct ElevationDeclined : Error {
    ElevationDeclined () : Error{"Elevation was declined"} {}
};

// The tool ran and exited with a nonzero status.
struct CommandError : Error {
    CommandError (const std::string& command, int exitCode, const std::string& stderrText)
        : Error{"'" + command + "' failed with exit code " + std::to_string(exitCode)
            + (stderrText.empty() ? std::string{} : ": " + stderrText)}
        , mExitCode(exitCode)
        , mStderr(stderrText)
    {}
    int exitCode () const { return mExitCode; }
    const std::string& stderrText () const { return mStderr; }
private:
    int mExitCode;
    std::string mStderr;
};

// Tool output did not have the expected shape. `offending()` is the text that failed.
struct ParseError : Error {
    ParseError (const std::string& message, const std::string& offending)
        : Error{message + ": '" + offending + "'"}
        , mOffending(offending)
    {}
    const std::string& offending () const { return mOffending; }
private:
    std::string mOffending;
};

struct DeviceNotBound : Error {
    explicit DeviceNotBound (const std::string& locator)
        : Error{"Device " + locator + " is not shared, bind it first"}
    {}
};

struct DeviceNotFound : Error {
    explicit DeviceNotFound (const std::string& locator)
        : Error{"No device " + locator}
    {}
};

} // namespace usbshare

#endif
