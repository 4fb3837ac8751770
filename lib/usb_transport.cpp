// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Synaptics Incorporated

#include <algorithm>
#include <iomanip>
#include <libusb-1.0/libusb.h>
#include <sstream>
#include <string>

#include "usb_transport.hpp"
#include "conch_log.hpp"

USBTransport::~USBTransport()
{
    CONCH_LOG;
    Shutdown();

    std::lock_guard<std::mutex> lock(m_arrivedMutex);
    for (libusb_device *device : m_arrivedDevices) {
        libusb_unref_device(device);
    }
    m_arrivedDevices.clear();

    if (m_ctx) {
        libusb_exit(m_ctx);
        m_ctx = nullptr;
    }
}

void USBTransport::DeviceMonitorThread()
{
    CONCH_LOG;

    int ret;

    while (m_running.load()) {
        struct timeval tv = { 0, 250000 };
        ret = libusb_handle_events_timeout_completed(m_ctx, &tv, nullptr);
        if (ret < 0) {
            if (ret == LIBUSB_ERROR_INTERRUPTED) {
                log(CONCH_LOG_LEVEL_DEBUG) << "libusb_handle_events_timeout_completed interrupted" << endLog;
                continue;
            }
            log(CONCH_LOG_LEVEL_ERROR) << "Failed to handle events: " << libusb_error_name(ret) << endLog;
            break;
        }
    }
}

int USBTransport::Init(uint16_t vendorId, uint16_t productId, const std::string &filterPorts)
{
    CONCH_LOG;

    m_vendorId = vendorId;
    m_productId = productId;

    m_filterPorts = ParseFilterPortString(filterPorts);

    int ret = libusb_init(&m_ctx);
    if (ret < 0) {
        log(CONCH_LOG_LEVEL_ERROR) << "Failed to initialize libusb: " << libusb_error_name(ret) << endLog;
        return ret;
    }

    if (m_usbDebug) {
        libusb_set_option(m_ctx, LIBUSB_OPTION_LOG_LEVEL, LIBUSB_LOG_LEVEL_DEBUG);
    }

    m_running.store(true);
    if (libusb_has_capability(LIBUSB_CAP_HAS_HOTPLUG)) {
        log(CONCH_LOG_LEVEL_DEBUG) << "Hotplug is supported" << endLog;

        ret = libusb_hotplug_register_callback(m_ctx,
                                                LIBUSB_HOTPLUG_EVENT_DEVICE_ARRIVED,
                                                LIBUSB_HOTPLUG_ENUMERATE,
                                                vendorId,
                                                productId,
                                                LIBUSB_HOTPLUG_MATCH_ANY,
                                                HotplugEventCallback,
                                                this,
                                                &m_callbackHandle);
        if (ret != LIBUSB_SUCCESS) {
            log(CONCH_LOG_LEVEL_ERROR) << "Failed to register hotplug callback: " << libusb_error_name(ret) << endLog;
            m_running.store(false);
            return ret;
        }
        m_hotplug = true;
    } else {
        log(CONCH_LOG_LEVEL_DEBUG) << "Hotplug is NOT supported, polling the device list" << endLog;
    }

    m_deviceMonitorThread = std::thread(&USBTransport::DeviceMonitorThread, this);

    return 0;
}

void USBTransport::Shutdown()
{
    CONCH_LOG;

    std::lock_guard<std::mutex> lock(m_shutdownMutex);
    if (m_running.exchange(false)) {
        if (m_hotplug) {
            libusb_hotplug_deregister_callback(m_ctx, m_callbackHandle);
            m_callbackHandle = 0;
            m_hotplug = false;
        }

        libusb_interrupt_event_handler(m_ctx);
        if (m_deviceMonitorThread.joinable()) {
            m_deviceMonitorThread.join();
        }
    }
    m_arrivedCV.notify_all();
}

libusb_device *USBTransport::WaitForDevice(std::chrono::milliseconds timeout, std::string &usbPath)
{
    CONCH_LOG;

    const auto deadline = std::chrono::steady_clock::now() + timeout;

    std::unique_lock<std::mutex> lock(m_arrivedMutex);
    while (m_arrivedDevices.empty()) {
        if (!m_running.load() || std::chrono::steady_clock::now() >= deadline) {
            log(CONCH_LOG_LEVEL_ERROR) << "No device " << std::hex << std::setw(4) << std::setfill('0') << m_vendorId
                << ":" << std::setw(4) << m_productId << std::dec << " found" << endLog;
            return nullptr;
        }

        if (!m_hotplug) {
            lock.unlock();
            ScanDevices();
            lock.lock();
            if (!m_arrivedDevices.empty()) {
                break;
            }
        }

        m_arrivedCV.wait_until(lock, std::min(deadline, std::chrono::steady_clock::now() + std::chrono::milliseconds(250)));
    }

    libusb_device *device = m_arrivedDevices.front();
    m_arrivedDevices.pop_front();
    usbPath = ConstructUSBPath(device);

    return device;
}

void USBTransport::ScanDevices()
{
    CONCH_LOG;

    libusb_device **list = nullptr;
    ssize_t count = libusb_get_device_list(m_ctx, &list);
    if (count < 0) {
        log(CONCH_LOG_LEVEL_ERROR) << "Failed to get device list: " << libusb_error_name(static_cast<int>(count)) << endLog;
        return;
    }

    for (ssize_t i = 0; i < count; ++i) {
        libusb_device_descriptor desc;
        if (libusb_get_device_descriptor(list[i], &desc) == 0 &&
            desc.idVendor == m_vendorId && desc.idProduct == m_productId)
        {
            DeviceArrived(list[i]);
        }
    }

    libusb_free_device_list(list, 1);
}

void USBTransport::DeviceArrived(libusb_device *device)
{
    CONCH_LOG;

    std::string usbPath = ConstructUSBPath(device);
    if (!IsValidPort(usbPath)) {
        log(CONCH_LOG_LEVEL_DEBUG) << "Device is not on a port we are monitoring" << endLog;
        return;
    }

    log(CONCH_LOG_LEVEL_INFO) << "Device arrived on " << usbPath << endLog;

    std::lock_guard<std::mutex> lock(m_arrivedMutex);
    m_arrivedDevices.push_back(libusb_ref_device(device));
    m_arrivedCV.notify_all();
}

std::vector<std::string> USBTransport::ParseFilterPortString(const std::string &filterPorts)
{
    CONCH_LOG;

    std::vector<std::string> filterList;

    if (!filterPorts.empty()) {
        size_t start = 0;
        size_t end = 0;
        while ((end = filterPorts.find(',', start)) != std::string::npos) {
            std::string port = filterPorts.substr(start, end - start);
            if (!port.empty()) {
                filterList.push_back(port);
                log(CONCH_LOG_LEVEL_DEBUG) << "Adding filter port: " << port << endLog;
            }
            start = end + 1;
        }
        std::string lastPort = filterPorts.substr(start);
        if (!lastPort.empty()) {
            filterList.push_back(lastPort);
            log(CONCH_LOG_LEVEL_DEBUG) << "Adding filter port: " << lastPort << endLog;
        }
    }

    return filterList;
}

std::string USBTransport::ConstructUSBPath(libusb_device *device)
{
    std::stringstream portStream;
    uint8_t portNumbers[8];
    uint8_t bus = libusb_get_bus_number(device);
    int numElementsInPath = libusb_get_port_numbers(device, portNumbers, 8);
    portStream << static_cast<int>(bus) << "-";
    if (numElementsInPath > 0) {
        portStream << static_cast<int>(portNumbers[0]);
        for (int i = 1; i < numElementsInPath; ++i) {
            portStream << "." << static_cast<int>(portNumbers[i]);
        }
    }

    return portStream.str();
}

bool USBTransport::IsValidPort(const std::string &devicePath) const
{
    if (m_filterPorts.empty()) {
        return true;
    }

    for (const auto& port : m_filterPorts) {
        if (devicePath.rfind(port, 0) == 0) {
            return true;
        }
    }

    return false;
}

int LIBUSB_CALL USBTransport::HotplugEventCallback(libusb_context *ctx, libusb_device *device,
                                                libusb_hotplug_event event, void *user_data)
{
    CONCH_LOG;

    USBTransport *transport = static_cast<USBTransport*>(user_data);

    if (event == LIBUSB_HOTPLUG_EVENT_DEVICE_ARRIVED) {
        libusb_device_descriptor desc;
        int ret = libusb_get_device_descriptor(device, &desc);
        if (ret < 0) {
            log(CONCH_LOG_LEVEL_ERROR) << "Failed to get device descriptor" << endLog;
            return 0;
        }

        log(CONCH_LOG_LEVEL_DEBUG) << "Device arrived: vid: 0x" << std::hex << std::uppercase << desc.idVendor
            << ", pid: 0x" << desc.idProduct << std::dec << endLog;
        transport->DeviceArrived(device);
    }

    return 0;
}
