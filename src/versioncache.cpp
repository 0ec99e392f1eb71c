#include <usbshare/error.hpp>
#include <usbshare/parser.hpp>
#include <usbshare/versioncache.hpp>

namespace usbshare {

const Version& VersionCache::get () {
    // Later callers block here until the first computation is done.
    std::lock_guard<std::mutex> lock{mMutex};
    if (!mKnown) {
        auto args = Arguments{"--version"};
        auto result = mInvoker.run(args, Elevation::NONE);
        if (result.exitCode) {
            throw CommandError{joinArguments(args), result.exitCode, result.err};
        }
        mVersion = parseVersion(result.out);
        mKnown = true;
        BOOST_LOG_SEV(mLog, log::info) << "usbipd version " << mVersion;
    }
    return mVersion;
}

} // namespace usbshare
