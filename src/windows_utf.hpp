#ifndef USBSHARE_WINDOWS_UTF_HPP
#define USBSHARE_WINDOWS_UTF_HPP

#include <stdexcept>
#include <string>
#include <vector>

#include <windows.h>

namespace usbshare {

// UTF16 -> UTF8
static inline std::string toUtf8 (const std::wstring& input) {
    if (input.empty()) {
        return {};
    }
    auto size = WideCharToMultiByte(CP_UTF8, 0,
                                    input.data(), int(input.size()),
                                    nullptr, 0,
                                    nullptr, nullptr);
    if (size <= 0) {
        throw std::runtime_error("toUtf8: conversion failed");
    }
    auto result = std::string(size, '\0');
    WideCharToMultiByte(CP_UTF8, 0,
                        input.data(), int(input.size()),
                        &result[0], size,
                        nullptr, nullptr);
    return result;
}

// UTF8 -> UTF16
static inline std::wstring toUtf16 (const std::string& input) {
    if (input.empty()) {
        return {};
    }
    auto size = MultiByteToWideChar(CP_UTF8, 0,
                                    input.data(), int(input.size()),
                                    nullptr, 0);
    if (size <= 0) {
        throw std::runtime_error("toUtf16: conversion failed");
    }
    auto result = std::wstring(size, L'\0');
    MultiByteToWideChar(CP_UTF8, 0,
                        input.data(), int(input.size()),
                        &result[0], size);
    return result;
}

} // namespace usbshare

#endif
