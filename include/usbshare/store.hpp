#ifndef USBSHARE_STORE_HPP
#define USBSHARE_STORE_HPP

#include <usbshare/devices.hpp>
#include <usbshare/log.hpp>
#include <usbshare/parser.hpp>
#include <usbshare/process.hpp>
#include <usbshare/versioncache.hpp>

#include <boost/asio/thread_pool.hpp>
#include <boost/signals2/signal.hpp>

#include <future>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace usbshare {

enum class ListFormat {
    AUTO,   // `state` for tool major version 4 and up, `list` below
    JSON,   // always `usbipd state`
    TABLE   // always `usbipd list`
};

std::ostream& operator<< (std::ostream& os, ListFormat f);
std::istream& operator>> (std::istream& is, ListFormat& f);

// Single source of truth for the device list. Fetches run one at a time on `context`; readers
// take the current list without waiting.
class DeviceStore {
public:
    using Slot = void(const DeviceListPtr&);

    DeviceStore (ProcessInvoker& invoker, VersionCache& version, ListFormat format,
            boost::asio::thread_pool& context);

    DeviceStore (const DeviceStore&) = delete;
    DeviceStore& operator= (const DeviceStore&) = delete;

    std::shared_future<DeviceListPtr> refresh ();
    // Request a fetch. Requests made before a fetch starts share it; a request made while a
    // fetch is running gets the next one. The future throws if the fetch failed, in which case
    // the previous snapshot stays current.

    DeviceListPtr snapshot () const;
    // Never invokes the tool. Null until the first successful refresh.

    std::vector<std::string> warnings () const;
    // Rows dropped by the last successful fetch.

    boost::signals2::connection connect (const std::function<Slot>& slot);
    // `slot` is called with every freshly fetched list, on the fetching thread.

private:
    struct Fetch {
        std::promise<DeviceListPtr> promise;
        std::shared_future<DeviceListPtr> future = promise.get_future().share();
    };

    void launch (std::shared_ptr<Fetch> fetch);
    void run (std::shared_ptr<Fetch> fetch);
    ParseResult fetchDevices ();

    ProcessInvoker& mInvoker;
    VersionCache& mVersion;
    ListFormat mFormat;
    boost::asio::thread_pool& mContext;

    mutable std::mutex mMutex;
    std::shared_ptr<Fetch> mQueued;
    // Requested and not yet started.
    bool mRunning = false;
    std::vector<std::string> mWarnings;

    DeviceListPtr mCurrent;
    // Read and written only through std::atomic_load/atomic_store.

    boost::signals2::signal<Slot> mRefreshed;
    log::Logger mLog;
};

} // namespace usbshare

#endif
