#include <usbshare/commands.hpp>
#include <usbshare/error.hpp>

#include <exception>

namespace usbshare {

namespace {

// Major version that moved `wsl attach`/`wsl detach` to `attach --wsl`/`detach`.
const unsigned kModernSyntaxMajor = 4;

// Bind, attach and detach address a connected device by bus id. A GUID locator is resolved
// through the current snapshot.
std::string busIdOf (DeviceStore& store, const std::string& locator) {
    if (!isGuid(locator)) {
        return locator;
    }
    auto devices = store.snapshot();
    auto device = devices ? findDevice(*devices, locator) : nullptr;
    if (!device || !device->connected()) {
        throw DeviceNotFound{locator};
    }
    return device->busId();
}

} // <anonymous>

void Commands::bind (const std::string& locator, bool force) {
    execute(bindArguments(locator, force), Elevation::REQUIRED);
}

void Commands::unbind (const std::string& locator) {
    execute(unbindArguments(locator), Elevation::REQUIRED);
}

void Commands::unbindAll () {
    execute({"unbind", "--all"}, Elevation::REQUIRED);
}

void Commands::attach (const std::string& locator) {
    auto devices = mStore.snapshot();
    auto device = devices ? findDevice(*devices, locator) : nullptr;
    if (device && !device->bound()) {
        BOOST_LOG_SEV(mLog, log::info) << "Sharing " << locator << " before attaching it";
        bind(locator);
    }
    execute(attachArguments(locator), Elevation::NONE);
}

void Commands::detach (const std::string& locator) {
    execute(detachArguments(locator), Elevation::NONE);
}

Arguments Commands::bindArguments (const std::string& locator, bool force) const {
    auto args = Arguments{"bind"};
    if (force) {
        args.push_back("--force");
    }
    args.push_back("--busid");
    args.push_back(busIdOf(mStore, locator));
    return args;
}

Arguments Commands::unbindArguments (const std::string& locator) const {
    if (isGuid(locator)) {
        return {"unbind", "--guid", locator};
    }
    // Prefer the GUID: it still names the device if it was re-plugged into another port.
    auto devices = mStore.snapshot();
    auto device = devices ? findDevice(*devices, locator) : nullptr;
    if (device && device->persistedGuid().size()) {
        return {"unbind", "--guid", device->persistedGuid()};
    }
    return {"unbind", "--busid", locator};
}

Arguments Commands::attachArguments (const std::string& locator) {
    auto busId = busIdOf(mStore, locator);
    if (legacySyntax()) {
        return {"wsl", "attach", "--busid", busId};
    }
    return {"attach", "--wsl", "--busid", busId};
}

Arguments Commands::detachArguments (const std::string& locator) {
    auto busId = busIdOf(mStore, locator);
    if (legacySyntax()) {
        return {"wsl", "detach", "--busid", busId};
    }
    return {"detach", "--busid", busId};
}

Arguments Commands::autoAttachArguments (const std::string& locator) {
    auto args = attachArguments(locator);
    args.push_back("--auto-attach");
    return args;
}

void Commands::execute (const Arguments& args, Elevation elevation) {
    auto command = joinArguments(args);
    auto result = mInvoker.run(args, elevation);
    if (result.exitCode) {
        BOOST_LOG_SEV(mLog, log::warning) << "'" << command << "' failed with exit code "
            << result.exitCode << ": " << result.err;
        throw CommandError{command, result.exitCode, result.err};
    }
    BOOST_LOG_SEV(mLog, log::info) << "'" << command << "' succeeded";

    try {
        mStore.refresh().get();
    }
    catch (const std::exception& e) {
        // The command itself worked; the next refresh will catch up.
        BOOST_LOG_SEV(mLog, log::warning) << "Refresh after '" << command << "' failed: "
            << e.what();
    }
}

bool Commands::legacySyntax () {
    return mVersion.get().major < kModernSyntaxMajor;
}

} // namespace usbshare
