// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Synaptics Incorporated

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <libusb-1.0/libusb.h>
#include <memory>
#include <mutex>
#include <string>

#include "channel.hpp"
#include "usb_transport.hpp"

// U-Boot console carried over the interrupt endpoints of a USB device. Input
// arrives through a continuously resubmitted interrupt IN transfer; output is
// written synchronously to the interrupt OUT endpoint.
class UsbConsoleChannel : public Channel {
public:
    UsbConsoleChannel(const std::string &name, uint16_t vendorId, uint16_t productId,
        std::chrono::milliseconds enumerateTimeout, const std::string &filterPorts = "", bool usbDebug = false);
    ~UsbConsoleChannel();

    const std::string &GetUSBPath() const { return m_usbPath; }

protected:
    int WriteRaw(const uint8_t *data, size_t size) override;
    ChannelReadStatus ReadRaw(std::string &data, std::chrono::milliseconds timeout) override;
    void CloseTransport() override;
    void WakeUp() override;

private:
    std::unique_ptr<USBTransport> m_transport;
    libusb_device *m_device = nullptr;
    libusb_device_handle *m_handle = nullptr;
    libusb_config_descriptor *m_config = nullptr;
    struct libusb_transfer *m_inputInterruptXfer = nullptr;
    std::string m_usbPath;
    int m_interfaceNumber = 0;
    bool m_interfaceClaimed = false;

    uint8_t m_interruptInEndpoint = 0;
    uint8_t m_interruptOutEndpoint = 0;
    size_t m_interruptInSize = 0;
    size_t m_interruptOutSize = 0;
    uint8_t *m_interruptInBuffer = nullptr;
    unsigned int m_writeTimeout = 1000;

    std::mutex m_rxMutex;
    std::condition_variable m_rxCV;
    std::string m_rxData;
    bool m_inputActive = false;
    bool m_deviceGone = false;
    bool m_closing = false;

    int Open();
    void Release();

    static void LIBUSB_CALL HandleTransfer(struct libusb_transfer *transfer);
};
