#include <usbshare/error.hpp>
#include <usbshare/hotplug.hpp>
#include <usbshare/log.hpp>

#include "platform.hpp"
#include "windows_error.hpp"
#include "windows_utf.hpp"

#include <windows.h>
#include <shellapi.h>
#include <cfgmgr32.h>

#include <initguid.h>
#include <usbiodef.h>

#include <exception>
#include <memory>
#include <string>

namespace usbshare {

ProcessResult runElevated (const boost::filesystem::path& exe, const Arguments& args,
        log::Logger& lg) {
    // ShellExecuteEx takes the arguments as one parameter string and cannot redirect the
    // elevated process's output, so only the exit code comes back.
    auto file = exe.wstring();
    auto params = toUtf16(joinArguments(args));

    SHELLEXECUTEINFOW info = {};
    info.cbSize = sizeof(info);
    info.fMask = SEE_MASK_NOCLOSEPROCESS | SEE_MASK_NOASYNC;
    info.lpVerb = L"runas";
    info.lpFile = file.c_str();
    info.lpParameters = params.c_str();
    info.nShow = SW_HIDE;

    BOOST_LOG_SEV(lg, log::info) << "Requesting elevation for '" << exe.string() << ' '
        << joinArguments(args) << "'";

    if (!ShellExecuteExW(&info)) {
        auto err = GetLastError();
        if (ERROR_CANCELLED == err) {
            throw ElevationDeclined{};
        }
        if (ERROR_FILE_NOT_FOUND == err || ERROR_PATH_NOT_FOUND == err) {
            throw ToolNotFound{exe.string()};
        }
        throw WindowsError{"ShellExecuteEx", err};
    }
    if (!info.hProcess) {
        throw Error{"ShellExecuteEx returned no process handle"};
    }

    std::shared_ptr<void> process { info.hProcess, CloseHandle };
    if (WAIT_FAILED == WaitForSingleObject(process.get(), INFINITE)) {
        throw WindowsError{"WaitForSingleObject", GetLastError()};
    }
    DWORD code = 0;
    if (!GetExitCodeProcess(process.get(), &code)) {
        throw WindowsError{"GetExitCodeProcess", GetLastError()};
    }
    return {int(code), {}, {}};
}

bool runningUnderWsl () {
    return false;
}

struct HotplugMonitor::Impl {
    explicit Impl (Callback cb);
    ~Impl () { close(); }

    void close ();

    static DWORD CALLBACK notify (HCMNOTIFICATION, PVOID context, CM_NOTIFY_ACTION action,
            PCM_NOTIFY_EVENT_DATA data, DWORD);

    Callback callback;
    HCMNOTIFICATION handle = nullptr;
    log::Logger lg;
};

HotplugMonitor::Impl::Impl (Callback cb)
    : callback(std::move(cb))
{
    // Every device instance of the USB device interface class
    CM_NOTIFY_FILTER filter = {};
    filter.cbSize = sizeof(filter);
    filter.FilterType = CM_NOTIFY_FILTER_TYPE_DEVICEINTERFACE;
    filter.u.DeviceInterface.ClassGuid = GUID_DEVINTERFACE_USB_DEVICE;

    auto cr = CM_Register_Notification(&filter, this, &Impl::notify, &handle);
    if (CR_SUCCESS != cr) {
        throw WindowsError{"CM_Register_Notification", CM_MapCrToWin32Err(cr, ERROR_GEN_FAILURE)};
    }
}

DWORD CALLBACK HotplugMonitor::Impl::notify (HCMNOTIFICATION, PVOID context,
        CM_NOTIFY_ACTION action, PCM_NOTIFY_EVENT_DATA data, DWORD) {
    auto self = static_cast<Impl*>(context);
    auto event = HotplugEvent{};
    switch (action) {
        case CM_NOTIFY_ACTION_DEVICEINTERFACEARRIVAL:
            event.type = HotplugEvent::ADD;
            break;
        case CM_NOTIFY_ACTION_DEVICEINTERFACEREMOVAL:
            event.type = HotplugEvent::REMOVE;
            break;
        default:
            return ERROR_SUCCESS;
    }
    event.path = toUtf8(data->u.DeviceInterface.SymbolicLink);

    BOOST_LOG_SEV(self->lg, log::debug) << "Hotplug event: " << event;
    try {
        self->callback(event);
    }
    catch (const std::exception& e) {
        BOOST_LOG_SEV(self->lg, log::error) << "Hotplug callback threw: " << e.what();
    }
    return ERROR_SUCCESS;
}

void HotplugMonitor::Impl::close () {
    // Blocks until callbacks in progress have returned.
    if (handle) {
        CM_Unregister_Notification(handle);
        handle = nullptr;
    }
}

bool hotplugSeesHost () {
    return true;
}

HotplugMonitor::HotplugMonitor (Callback callback)
    : mImpl(std::make_unique<Impl>(std::move(callback)))
{}

HotplugMonitor::~HotplugMonitor () {
    close();
}

void HotplugMonitor::close () {
    if (mImpl) {
        mImpl->close();
        mImpl.reset();
    }
}

} // namespace usbshare
