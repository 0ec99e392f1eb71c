#ifndef USBSHARE_COMMANDS_HPP
#define USBSHARE_COMMANDS_HPP

#include <usbshare/log.hpp>
#include <usbshare/process.hpp>
#include <usbshare/store.hpp>
#include <usbshare/versioncache.hpp>

#include <string>

namespace usbshare {

// Mutating tool invocations. Each runs synchronously on the calling thread, throws CommandError
// on a nonzero exit, and on success waits for a store refresh so the next snapshot reflects it.
class Commands {
public:
    Commands (ProcessInvoker& invoker, VersionCache& version, DeviceStore& store)
        : mInvoker(invoker), mVersion(version), mStore(store)
    {}

    void bind (const std::string& locator, bool force = false);
    void unbind (const std::string& locator);
    void unbindAll ();
    void attach (const std::string& locator);
    void detach (const std::string& locator);

    Arguments bindArguments (const std::string& locator, bool force) const;
    Arguments unbindArguments (const std::string& locator) const;
    Arguments attachArguments (const std::string& locator);
    Arguments detachArguments (const std::string& locator);
    Arguments autoAttachArguments (const std::string& locator);

private:
    void execute (const Arguments& args, Elevation elevation);
    bool legacySyntax ();
    // Tools before 4.0 put attach and detach under the `wsl` verb.

    ProcessInvoker& mInvoker;
    VersionCache& mVersion;
    DeviceStore& mStore;
    log::Logger mLog;
};

} // namespace usbshare

#endif
