#include <usbshare/error.hpp>
#include <usbshare/store.hpp>

#include <boost/asio/post.hpp>

#include <exception>
#include <utility>

namespace usbshare {

namespace {

// `usbipd state` first appeared alongside the 4.0 command syntax.
const unsigned kStateMinMajor = 4;

} // <anonymous>

DeviceStore::DeviceStore (ProcessInvoker& invoker, VersionCache& version, ListFormat format,
        boost::asio::thread_pool& context)
    : mInvoker(invoker)
    , mVersion(version)
    , mFormat(format)
    , mContext(context)
{}

std::shared_future<DeviceListPtr> DeviceStore::refresh () {
    std::lock_guard<std::mutex> lock{mMutex};
    if (mQueued) {
        BOOST_LOG_SEV(mLog, log::trace) << "Refresh joins the pending fetch";
        return mQueued->future;
    }

    auto fetch = std::make_shared<Fetch>();
    mQueued = fetch;
    if (mRunning) {
        BOOST_LOG_SEV(mLog, log::trace) << "Refresh queued behind the running fetch";
    }
    else {
        launch(fetch);
    }
    return fetch->future;
}

DeviceListPtr DeviceStore::snapshot () const {
    return std::atomic_load(&mCurrent);
}

std::vector<std::string> DeviceStore::warnings () const {
    std::lock_guard<std::mutex> lock{mMutex};
    return mWarnings;
}

boost::signals2::connection DeviceStore::connect (const std::function<Slot>& slot) {
    return mRefreshed.connect(slot);
}

void DeviceStore::launch (std::shared_ptr<Fetch> fetch) {
    boost::asio::post(mContext, [this, fetch] { run(fetch); });
}

void DeviceStore::run (std::shared_ptr<Fetch> fetch) {
    {
        std::lock_guard<std::mutex> lock{mMutex};
        // From here on, new requests must wait for the next fetch.
        mQueued.reset();
        mRunning = true;
    }

    auto list = DeviceListPtr{};
    try {
        auto parsed = fetchDevices();
        for (const auto& w : parsed.warnings) {
            BOOST_LOG_SEV(mLog, log::warning) << "Dropped: " << w;
        }
        list = std::make_shared<const DeviceList>(std::move(parsed.devices));
        std::atomic_store(&mCurrent, list);
        std::lock_guard<std::mutex> lock{mMutex};
        mWarnings = std::move(parsed.warnings);
    }
    catch (const std::exception& e) {
        BOOST_LOG_SEV(mLog, log::error) << "Refresh failed, keeping the last device list: "
            << e.what();
        fetch->promise.set_exception(std::current_exception());
    }
    catch (...) {
        BOOST_LOG_SEV(mLog, log::error) << "Refresh failed with an unknown exception, keeping the "
            "last device list";
        fetch->promise.set_exception(std::current_exception());
    }

    if (list) {
        BOOST_LOG_SEV(mLog, log::debug) << "Refreshed " << list->size() << " devices";
        try {
            mRefreshed(list);
        }
        catch (const std::exception& e) {
            BOOST_LOG_SEV(mLog, log::error) << "Device list consumer threw: " << e.what();
        }
        catch (...) {
            // The fetch succeeded, so the promise is still fulfilled below.
            BOOST_LOG_SEV(mLog, log::error) << "Device list consumer threw an unknown exception";
        }
        fetch->promise.set_value(list);
    }

    std::lock_guard<std::mutex> lock{mMutex};
    mRunning = false;
    if (mQueued) {
        launch(mQueued);
    }
}

ParseResult DeviceStore::fetchDevices () {
    auto json = ListFormat::JSON == mFormat
        || (ListFormat::AUTO == mFormat && mVersion.get().major >= kStateMinMajor);
    auto args = Arguments{json ? "state" : "list"};
    auto result = mInvoker.run(args, Elevation::NONE);
    if (result.exitCode) {
        throw CommandError{joinArguments(args), result.exitCode, result.err};
    }
    return json ? parseState(result.out) : parseList(result.out);
}

} // namespace usbshare
