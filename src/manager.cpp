#include <usbshare/manager.hpp>

#include <boost/asio/post.hpp>

#include <exception>
#include <utility>

namespace usbshare {

Manager::Manager (const Options& options)
    : Manager(options, std::make_unique<SystemProcessInvoker>(options.tool))
{}

Manager::Manager (const Options& options, std::unique_ptr<ProcessInvoker> invoker)
    : mInvoker(std::move(invoker))
    , mRefreshContext(1)
    , mCommandContext(options.workers)
    , mVersion(*mInvoker)
    , mStore(*mInvoker, mVersion, options.format, mRefreshContext)
    , mCommands(*mInvoker, mVersion, mStore)
    , mTracker(*mInvoker, mCommands, mStore)
{
    if (options.hotplug) {
        enableHotplug();
    }
}

Manager::~Manager () {
    mHotplug.reset();
    // Queued commands still run to completion, and may need the refresh context, so join the
    // command pool first.
    mCommandContext.join();
    mRefreshContext.join();
}

const Version& Manager::version () {
    return mVersion.get();
}

std::shared_future<DeviceListPtr> Manager::refresh () {
    return mStore.refresh();
}

DeviceListPtr Manager::snapshot () const {
    return mStore.snapshot();
}

boost::signals2::connection Manager::connect (const std::function<DeviceStore::Slot>& slot) {
    return mStore.connect(slot);
}

std::future<void> Manager::bind (const std::string& locator, bool force) {
    return post([this, locator, force] { mCommands.bind(locator, force); });
}

std::future<void> Manager::unbind (const std::string& locator) {
    return post([this, locator] { mCommands.unbind(locator); });
}

std::future<void> Manager::unbindAll () {
    return post([this] { mCommands.unbindAll(); });
}

std::future<void> Manager::attach (const std::string& locator) {
    return post([this, locator] { mCommands.attach(locator); });
}

std::future<void> Manager::detach (const std::string& locator) {
    return post([this, locator] { mCommands.detach(locator); });
}

std::future<void> Manager::startAutoAttach (const std::string& locator) {
    return post([this, locator] { mTracker.start(locator); });
}

std::future<void> Manager::stopAutoAttach (const std::string& locator) {
    return post([this, locator] { mTracker.stop(locator); });
}

std::vector<AutoAttachSession> Manager::autoAttachSessions () {
    return mTracker.sessions();
}

bool Manager::enableHotplug () {
    if (mHotplug) {
        return true;
    }
    try {
        mHotplug = std::make_unique<HotplugMonitor>([this] (const HotplugEvent& event) {
            BOOST_LOG_SEV(mLog, log::debug) << "Refreshing after " << event;
            mStore.refresh();
        });
    }
    catch (const std::exception& e) {
        BOOST_LOG_SEV(mLog, log::warning) << "Hotplug notifications unavailable: " << e.what();
        return false;
    }
    if (!hotplugSeesHost()) {
        BOOST_LOG_SEV(mLog, log::info) << "Under WSL only devices attached to this guest raise "
            "hotplug events";
    }
    return true;
}

std::future<void> Manager::post (std::function<void()> work) {
    auto task = std::make_shared<std::packaged_task<void()>>(std::move(work));
    auto future = task->get_future();
    boost::asio::post(mCommandContext, [task] { (*task)(); });
    return future;
}

} // namespace usbshare
