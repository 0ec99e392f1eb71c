#ifndef USBSHARE_WINDOWS_ERROR_HPP
#define USBSHARE_WINDOWS_ERROR_HPP

#ifndef _WIN32
#error windows_error.hpp is a Windows-specific header file.
#endif

#include <usbshare/error.hpp>

#include "windows_utf.hpp"

#include <windows.h>

#include <memory>
#include <string>

namespace usbshare {

static inline std::string windowsErrorString (DWORD code) {
    wchar_t* errorText = nullptr;
    auto nWritten = FormatMessageW(FORMAT_MESSAGE_FROM_SYSTEM
            | FORMAT_MESSAGE_ALLOCATE_BUFFER
            | FORMAT_MESSAGE_IGNORE_INSERTS,
            nullptr, code,
            MAKELANGID(LANG_NEUTRAL, SUBLANG_DEFAULT),
            LPWSTR(&errorText),
            0, nullptr);
    if (errorText && nWritten) {
        std::shared_ptr<void> guard { nullptr, [&] (void*) { LocalFree(errorText); }};
        auto message = toUtf8(std::wstring(errorText, errorText + nWritten));
        message.erase(message.find_last_not_of(" \r\n") + 1);
        return message;
    }
    else {
        return std::string("Windows error ") + std::to_string(GetLastError())
            + " while formatting message for error " + std::to_string(code);
    }
}

struct WindowsError : Error {
    WindowsError (std::string prefix, DWORD code)
        : Error{prefix + ": " + windowsErrorString(code)}
        , mCode(code)
    {}
    DWORD code () const { return mCode; }
private:
    DWORD mCode;
};

} // namespace usbshare

#endif
