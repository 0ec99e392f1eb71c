#ifndef USBSHARE_PLATFORM_HPP
#define USBSHARE_PLATFORM_HPP

#include <usbshare/log.hpp>
#include <usbshare/process.hpp>

#include <boost/filesystem/path.hpp>
#include <boost/predef.h>

#include <string>

namespace usbshare {

boost::filesystem::path findExecutable (const std::string& name);
// `name` itself if it contains a directory and exists, otherwise the PATH lookup of `name`.
// Throws ToolNotFound.

ProcessResult capture (const boost::filesystem::path& exe, const Arguments& args);
// Run `exe` unelevated and collect its output.

// Implemented per platform in linux.cpp and windows.cpp.

ProcessResult runElevated (const boost::filesystem::path& exe, const Arguments& args,
        log::Logger& lg);

bool runningUnderWsl ();

#if BOOST_OS_LINUX
std::string uacScript (const std::string& windowsExe, const Arguments& args);
// PowerShell that runs `windowsExe` through UAC and exits with its exit code, or with
// ERROR_CANCELLED if the prompt was dismissed.
#endif

} // namespace usbshare

#endif
