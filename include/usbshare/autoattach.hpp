#ifndef USBSHARE_AUTOATTACH_HPP
#define USBSHARE_AUTOATTACH_HPP

#include <usbshare/commands.hpp>
#include <usbshare/log.hpp>
#include <usbshare/process.hpp>
#include <usbshare/store.hpp>

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace usbshare {

struct AutoAttachSession {
    std::string locator;
    // As passed to start().
    bool active = false;
    std::string description;
    std::string hardwareId;
    std::string busId;
};

// The tool has no durable notion of an auto-attach watch, so sessions live only as long as
// this object. Destroying it terminates every watch process.
class AutoAttachTracker {
public:
    AutoAttachTracker (ProcessInvoker& invoker, Commands& commands, DeviceStore& store)
        : mInvoker(invoker), mCommands(commands), mStore(store)
    {}

    ~AutoAttachTracker ();

    AutoAttachTracker (const AutoAttachTracker&) = delete;
    AutoAttachTracker& operator= (const AutoAttachTracker&) = delete;

    void start (const std::string& locator);
    // Throws DeviceNotFound or DeviceNotBound without creating a session. No-op if a session
    // for the same device is already active, whether it was started by bus id or by GUID.

    void stop (const std::string& locator);

    bool active (const std::string& locator);
    std::vector<AutoAttachSession> sessions ();

private:
    struct Session {
        AutoAttachSession info;
        std::unique_ptr<BackgroundProcess> process;
    };

    std::string sessionKey (const std::string& locator);
    // The device's persisted GUID, or its bus id if it has none. Resolved through the current
    // snapshot, then through existing sessions; `locator` itself if neither knows it.

    std::shared_ptr<std::mutex> keyMutex (const std::string& key);

    bool checkRunning (Session& session);
    // Call with mMutex held.

    ProcessInvoker& mInvoker;
    Commands& mCommands;
    DeviceStore& mStore;

    std::mutex mMutex;
    // Both keyed by sessionKey().
    std::map<std::string, Session> mSessions;
    std::map<std::string, std::shared_ptr<std::mutex>> mKeyMutexes;
    log::Logger mLog;
};

} // namespace usbshare

#endif
