#ifndef USBSHARE_MANAGER_HPP
#define USBSHARE_MANAGER_HPP

#include <usbshare/autoattach.hpp>
#include <usbshare/commands.hpp>
#include <usbshare/hotplug.hpp>
#include <usbshare/log.hpp>
#include <usbshare/options.hpp>
#include <usbshare/process.hpp>
#include <usbshare/store.hpp>
#include <usbshare/versioncache.hpp>

#include <boost/asio/thread_pool.hpp>

#include <functional>
#include <future>
#include <memory>
#include <string>
#include <vector>

namespace usbshare {

// Everything a UI needs: cached version, shared device list, and the mutating operations, run
// on worker threads. Errors arrive as exceptions from the returned futures.
class Manager {
public:
    explicit Manager (const Options& options);
    Manager (const Options& options, std::unique_ptr<ProcessInvoker> invoker);
    ~Manager ();

    Manager (const Manager&) = delete;
    Manager& operator= (const Manager&) = delete;

    const Version& version ();

    std::shared_future<DeviceListPtr> refresh ();
    DeviceListPtr snapshot () const;
    boost::signals2::connection connect (const std::function<DeviceStore::Slot>& slot);

    std::future<void> bind (const std::string& locator, bool force = false);
    std::future<void> unbind (const std::string& locator);
    std::future<void> unbindAll ();
    std::future<void> attach (const std::string& locator);
    std::future<void> detach (const std::string& locator);
    std::future<void> startAutoAttach (const std::string& locator);
    std::future<void> stopAutoAttach (const std::string& locator);

    std::vector<AutoAttachSession> autoAttachSessions ();

    bool enableHotplug ();
    // Refresh on every host USB arrival or removal. Returns false, and logs why, if the host
    // cannot deliver notifications.

private:
    std::future<void> post (std::function<void()> work);

    std::unique_ptr<ProcessInvoker> mInvoker;
    boost::asio::thread_pool mRefreshContext;
    boost::asio::thread_pool mCommandContext;
    VersionCache mVersion;
    DeviceStore mStore;
    Commands mCommands;
    AutoAttachTracker mTracker;
    std::unique_ptr<HotplugMonitor> mHotplug;
    log::Logger mLog;
};

} // namespace usbshare

#endif
