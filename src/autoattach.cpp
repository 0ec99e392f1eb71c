#include <usbshare/autoattach.hpp>
#include <usbshare/error.hpp>

namespace usbshare {

namespace {

std::string keyOf (const UsbDevice& device) {
    return device.persistedGuid().empty() ? device.busId() : device.persistedGuid();
}

} // <anonymous>

AutoAttachTracker::~AutoAttachTracker () {
    std::lock_guard<std::mutex> lock{mMutex};
    for (auto& kv : mSessions) {
        if (kv.second.process) {
            BOOST_LOG_SEV(mLog, log::info) << "Stopping auto-attach for " << kv.second.info.locator;
            kv.second.process->terminate();
        }
    }
}

void AutoAttachTracker::start (const std::string& locator) {
    auto devices = mStore.snapshot();
    if (!devices) {
        devices = mStore.refresh().get();
    }
    auto device = findDevice(*devices, locator);
    if (!device) {
        throw DeviceNotFound{locator};
    }

    auto key = keyOf(*device);
    auto serial = keyMutex(key);
    std::lock_guard<std::mutex> serialLock{*serial};

    {
        std::lock_guard<std::mutex> lock{mMutex};
        auto it = mSessions.find(key);
        if (it != mSessions.end() && checkRunning(it->second)) {
            BOOST_LOG_SEV(mLog, log::debug) << "Auto-attach for " << locator << " already active as "
                << it->second.info.locator;
            return;
        }
    }

    if (!device->bound()) {
        throw DeviceNotBound{locator};
    }

    auto info = AutoAttachSession{locator, true, device->description(), device->hardwareId(),
        device->busId()};

    // The watch process fails silently if it cannot attach, so attach once first to surface
    // any error to the caller.
    if (!device->attached()) {
        mCommands.attach(info.busId);
    }

    auto process = mInvoker.spawn(mCommands.autoAttachArguments(info.busId));

    std::lock_guard<std::mutex> lock{mMutex};
    auto& session = mSessions[key];
    session.info = info;
    session.process = std::move(process);
    BOOST_LOG_SEV(mLog, log::info) << "Auto-attaching " << locator << " '" << info.description
        << "'";
}

void AutoAttachTracker::stop (const std::string& locator) {
    auto key = sessionKey(locator);
    auto serial = keyMutex(key);
    std::lock_guard<std::mutex> serialLock{*serial};

    auto process = std::unique_ptr<BackgroundProcess>{};
    {
        std::lock_guard<std::mutex> lock{mMutex};
        auto it = mSessions.find(key);
        if (it == mSessions.end()) {
            return;
        }
        process = std::move(it->second.process);
        it->second.info.active = false;
    }

    if (process) {
        process->terminate();
        BOOST_LOG_SEV(mLog, log::info) << "Stopped auto-attach for " << locator;
    }
}

bool AutoAttachTracker::active (const std::string& locator) {
    auto key = sessionKey(locator);
    std::lock_guard<std::mutex> lock{mMutex};
    auto it = mSessions.find(key);
    return it != mSessions.end() && checkRunning(it->second);
}

std::vector<AutoAttachSession> AutoAttachTracker::sessions () {
    std::lock_guard<std::mutex> lock{mMutex};
    auto result = std::vector<AutoAttachSession>{};
    for (auto& kv : mSessions) {
        checkRunning(kv.second);
        result.push_back(kv.second.info);
    }
    return result;
}

std::string AutoAttachTracker::sessionKey (const std::string& locator) {
    auto devices = mStore.snapshot();
    auto device = devices ? findDevice(*devices, locator) : nullptr;
    if (device) {
        return keyOf(*device);
    }
    // An unplugged device loses its bus id in the snapshot, but its session remembers it.
    std::lock_guard<std::mutex> lock{mMutex};
    for (const auto& kv : mSessions) {
        if (kv.second.info.locator == locator || kv.second.info.busId == locator) {
            return kv.first;
        }
    }
    return locator;
}

std::shared_ptr<std::mutex> AutoAttachTracker::keyMutex (const std::string& key) {
    std::lock_guard<std::mutex> lock{mMutex};
    auto& m = mKeyMutexes[key];
    if (!m) {
        m = std::make_shared<std::mutex>();
    }
    return m;
}

bool AutoAttachTracker::checkRunning (Session& session) {
    if (session.process && !session.process->running()) {
        BOOST_LOG_SEV(mLog, log::warning) << "Auto-attach process for " << session.info.locator
            << " exited on its own";
        session.process.reset();
    }
    session.info.active = bool(session.process);
    return session.info.active;
}

} // namespace usbshare
