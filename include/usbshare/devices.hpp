#ifndef USBSHARE_DEVICES_HPP
#define USBSHARE_DEVICES_HPP

#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace usbshare {

class UsbDevice {
public:
    UsbDevice () = default;
    UsbDevice (const std::string& busId, const std::string& hardwareId,
            const std::string& description)
        : mBusId(busId), mHardwareId(hardwareId), mDescription(description)
    {}

    void busId (const std::string& id) { mBusId = id; }
    void persistedGuid (const std::string& guid) { mPersistedGuid = guid; }
    void hardwareId (const std::string& id) { mHardwareId = id; }
    void serial (const std::string& s) { mSerial = s; }
    void description (const std::string& d) { mDescription = d; }
    void clientAddress (const std::string& a) { mClientAddress = a; }
    void bound (bool b) { mBound = b; }
    void attached (bool a) { mAttached = a; }
    void persisted (bool p) { mPersisted = p; }
    void forced (bool f) { mForced = f; }

    const std::string& busId () const { return mBusId; }
    const std::string& persistedGuid () const { return mPersistedGuid; }
    const std::string& hardwareId () const { return mHardwareId; }
    const std::string& serial () const { return mSerial; }
    const std::string& description () const { return mDescription; }
    const std::string& clientAddress () const { return mClientAddress; }
    bool bound () const { return mBound; }
    bool attached () const { return mAttached; }
    bool persisted () const { return mPersisted; }
    bool forced () const { return mForced; }

    bool connected () const { return !mBusId.empty(); }

    // The bus id of a connected device, or the persisted GUID of one that is not plugged in.
    const std::string& locator () const { return connected() ? mBusId : mPersistedGuid; }

    // "Not shared", "Shared", "Attached" or "Persisted", with " (forced)" for forced shares.
    std::string state () const;

private:
    std::string mBusId;
    std::string mPersistedGuid;
    std::string mHardwareId;
    std::string mSerial;
    std::string mDescription;
    std::string mClientAddress;
    bool mBound = false;
    bool mAttached = false;
    bool mPersisted = false;
    bool mForced = false;
};

std::ostream& operator<< (std::ostream& os, const UsbDevice& d);

using DeviceList = std::vector<UsbDevice>;

// Shared, immutable result of one refresh. Null means no refresh has completed yet.
using DeviceListPtr = std::shared_ptr<const DeviceList>;

const UsbDevice* findDevice (const DeviceList& devices, const std::string& locator);
// Returns the device whose locator, bus id or persisted GUID equals `locator`, or nullptr.

bool isGuid (const std::string& s);
// True if `s` has the 8-4-4-4-12 hex digit shape of a GUID.

} // namespace usbshare

#endif
