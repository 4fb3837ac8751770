// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Synaptics Incorporated

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <libusb-1.0/libusb.h>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

// Owns the libusb context and its event thread, and reports devices with a
// given vendor/product id as they enumerate.
class USBTransport {
public:
    USBTransport(bool usbDebug) : m_usbDebug{usbDebug}, m_ctx{nullptr}, m_running{false}
    {}
    virtual ~USBTransport();

    int Init(uint16_t vendorId, uint16_t productId, const std::string &filterPorts = "");
    void Shutdown();

    // Waits for a matching device to show up. The returned device carries a
    // reference which the caller releases with libusb_unref_device().
    libusb_device *WaitForDevice(std::chrono::milliseconds timeout, std::string &usbPath);

    libusb_context *GetContext() const { return m_ctx; }

private:
    bool m_usbDebug;
    libusb_context *m_ctx;
    libusb_hotplug_callback_handle m_callbackHandle = 0;
    bool m_hotplug = false;
    std::thread m_deviceMonitorThread;
    std::atomic<bool> m_running;
    std::mutex m_shutdownMutex;
    uint16_t m_vendorId = 0;
    uint16_t m_productId = 0;
    std::vector<std::string> m_filterPorts;

    std::mutex m_arrivedMutex;
    std::condition_variable m_arrivedCV;
    std::deque<libusb_device *> m_arrivedDevices;

    void DeviceMonitorThread();
    void DeviceArrived(libusb_device *device);
    void ScanDevices();
    bool IsValidPort(const std::string &devicePath) const;

    static std::vector<std::string> ParseFilterPortString(const std::string &filterPorts);
    static std::string ConstructUSBPath(libusb_device *device);
    static int LIBUSB_CALL HotplugEventCallback(libusb_context *ctx, libusb_device *device,
                                                libusb_hotplug_event event, void *user_data);
};
