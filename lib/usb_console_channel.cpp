// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Synaptics Incorporated

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <stdexcept>

#include "usb_console_channel.hpp"
#include "conch_log.hpp"

UsbConsoleChannel::UsbConsoleChannel(const std::string &name, uint16_t vendorId, uint16_t productId,
    std::chrono::milliseconds enumerateTimeout, const std::string &filterPorts, bool usbDebug)
    : Channel{name}, m_transport{std::make_unique<USBTransport>(usbDebug)}
{
    CONCH_LOG;

    if (m_transport->Init(vendorId, productId, filterPorts) < 0) {
        throw std::runtime_error("Failed to initialize USB transport");
    }

    m_device = m_transport->WaitForDevice(enumerateTimeout, m_usbPath);
    if (!m_device) {
        m_transport->Shutdown();
        std::stringstream ss;
        ss << "USB device " << std::hex << std::setw(4) << std::setfill('0') << vendorId << ":"
            << std::setw(4) << productId << " did not enumerate";
        throw std::runtime_error(ss.str());
    }

    if (Open() < 0) {
        Release();
        throw std::runtime_error("Failed to open USB console on " + m_usbPath);
    }

    log(CONCH_LOG_LEVEL_INFO) << "USB console open on " << m_usbPath << endLog;
}

UsbConsoleChannel::~UsbConsoleChannel()
{
    CONCH_LOG;

    Close();
}

int UsbConsoleChannel::Open()
{
    CONCH_LOG;

    int ret = libusb_open(m_device, &m_handle);
    if (ret < 0) {
        log(CONCH_LOG_LEVEL_ERROR) << "Failed to open USB device: " << libusb_error_name(ret) << endLog;
        return ret;
    }

    ret = libusb_get_config_descriptor(m_device, 0, &m_config);
    if (ret < 0) {
        log(CONCH_LOG_LEVEL_ERROR) << "Failed to get config descriptor: " << libusb_error_name(ret) << endLog;
        return ret;
    }

    ret = libusb_detach_kernel_driver(m_handle, m_interfaceNumber);
    if (ret < 0) {
        if (ret == LIBUSB_ERROR_NOT_FOUND || ret == LIBUSB_ERROR_NOT_SUPPORTED) {
            log(CONCH_LOG_LEVEL_DEBUG) << "No kernel driver detached: " << libusb_error_name(ret) << endLog;
        } else {
            log(CONCH_LOG_LEVEL_ERROR) << "Failed to detach kernel driver: " << libusb_error_name(ret) << endLog;
            return ret;
        }
    }

    ret = libusb_claim_interface(m_handle, m_interfaceNumber);
    if (ret < 0) {
        log(CONCH_LOG_LEVEL_ERROR) << "Failed to claim interface: " << libusb_error_name(ret) << endLog;
        return ret;
    }
    m_interfaceClaimed = true;

    for (int i = 0; i < m_config->bNumInterfaces; ++i) {
        const libusb_interface &interface = m_config->interface[i];
        for (int j = 0; j < interface.num_altsetting; ++j) {
            const libusb_interface_descriptor &altsetting = interface.altsetting[j];
            if (altsetting.bInterfaceNumber != m_interfaceNumber) {
                continue;
            }

            for (int k = 0; k < altsetting.bNumEndpoints; ++k) {
                const libusb_endpoint_descriptor &endpoint = altsetting.endpoint[k];
                log(CONCH_LOG_LEVEL_DEBUG) << "Endpoint 0x" << std::hex << static_cast<int>(endpoint.bEndpointAddress)
                    << " attributes 0x" << static_cast<int>(endpoint.bmAttributes) << std::dec
                    << " max packet " << endpoint.wMaxPacketSize << endLog;

                if ((endpoint.bmAttributes & LIBUSB_TRANSFER_TYPE_MASK) != LIBUSB_TRANSFER_TYPE_INTERRUPT) {
                    continue;
                }

                if (endpoint.bEndpointAddress & LIBUSB_ENDPOINT_IN) {
                    m_interruptInSize = endpoint.wMaxPacketSize;
                    m_interruptInEndpoint = endpoint.bEndpointAddress;
                } else {
                    m_interruptOutSize = endpoint.wMaxPacketSize;
                    m_interruptOutEndpoint = endpoint.bEndpointAddress;
                }
            }
        }
    }

    if (!m_interruptInEndpoint || !m_interruptOutEndpoint || !m_interruptInSize || !m_interruptOutSize) {
        log(CONCH_LOG_LEVEL_ERROR) << "Device has no interrupt console endpoints" << endLog;
        return -1;
    }

    m_inputInterruptXfer = libusb_alloc_transfer(0);
    if (!m_inputInterruptXfer) {
        log(CONCH_LOG_LEVEL_ERROR) << "Failed to allocate input interrupt transfer" << endLog;
        return -1;
    }

    m_interruptInBuffer = new uint8_t[m_interruptInSize];
    libusb_fill_interrupt_transfer(m_inputInterruptXfer, m_handle, m_interruptInEndpoint,
        m_interruptInBuffer, static_cast<int>(m_interruptInSize), HandleTransfer, this, 0);

    {
        std::lock_guard<std::mutex> lock(m_rxMutex);
        m_inputActive = true;
    }
    ret = libusb_submit_transfer(m_inputInterruptXfer);
    if (ret < 0) {
        std::lock_guard<std::mutex> lock(m_rxMutex);
        m_inputActive = false;
        log(CONCH_LOG_LEVEL_ERROR) << "Failed to submit input interrupt transfer: " << libusb_error_name(ret) << endLog;
        return ret;
    }

    return 0;
}

void UsbConsoleChannel::Release()
{
    CONCH_LOG;

    bool bufferInUse = false;
    if (m_inputInterruptXfer) {
        std::unique_lock<std::mutex> lock(m_rxMutex);
        m_closing = true;
        if (m_inputActive) {
            lock.unlock();
            libusb_cancel_transfer(m_inputInterruptXfer);
            lock.lock();
            // The event thread of the transport completes the cancellation.
            m_rxCV.wait_for(lock, std::chrono::seconds(1), [this] { return !m_inputActive; });
        }
        if (m_inputActive) {
            log(CONCH_LOG_LEVEL_WARNING) << "Input transfer did not complete its cancellation" << endLog;
            bufferInUse = true;
        } else {
            libusb_free_transfer(m_inputInterruptXfer);
        }
        m_inputInterruptXfer = nullptr;
    }

    if (m_handle) {
        if (m_interfaceClaimed) {
            libusb_release_interface(m_handle, m_interfaceNumber);
            m_interfaceClaimed = false;
        }
        libusb_close(m_handle);
        m_handle = nullptr;
    }

    if (m_config) {
        libusb_free_config_descriptor(m_config);
        m_config = nullptr;
    }

    if (m_device) {
        libusb_unref_device(m_device);
        m_device = nullptr;
    }

    m_transport->Shutdown();

    if (m_interruptInBuffer && !bufferInUse) {
        delete[] m_interruptInBuffer;
        m_interruptInBuffer = nullptr;
    }
}

int UsbConsoleChannel::WriteRaw(const uint8_t *data, size_t size)
{
    CONCH_LOG;

    if (!m_handle) {
        return -1;
    }

    size_t written = 0;
    while (written < size) {
        int chunk = static_cast<int>(std::min(size - written, m_interruptOutSize));
        int transferred = 0;
        int ret = libusb_interrupt_transfer(m_handle, m_interruptOutEndpoint, const_cast<uint8_t *>(data + written),
            chunk, &transferred, m_writeTimeout);
        if (ret == LIBUSB_ERROR_PIPE) {
            log(CONCH_LOG_LEVEL_WARNING) << "Endpoint stalled, clearing halt" << endLog;
            ret = libusb_clear_halt(m_handle, m_interruptOutEndpoint);
            if (ret < 0) {
                log(CONCH_LOG_LEVEL_ERROR) << "Failed to clear halt on endpoint: " << libusb_error_name(ret) << endLog;
                return -1;
            }
            continue;
        } else if (ret < 0 && ret != LIBUSB_ERROR_TIMEOUT) {
            log(CONCH_LOG_LEVEL_ERROR) << "Failed to write to USB device: " << libusb_error_name(ret) << endLog;
            return -1;
        } else if (ret == LIBUSB_ERROR_TIMEOUT && transferred == 0) {
            log(CONCH_LOG_LEVEL_ERROR) << "Timed out writing to USB device" << endLog;
            return -1;
        }
        written += transferred;
    }

    return static_cast<int>(written);
}

ChannelReadStatus UsbConsoleChannel::ReadRaw(std::string &data, std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(m_rxMutex);
    m_rxCV.wait_for(lock, timeout, [this] { return !m_rxData.empty() || m_deviceGone || m_closing; });

    if (!m_rxData.empty()) {
        data.append(m_rxData);
        m_rxData.clear();
        return CHANNEL_READ_DATA;
    }

    if (m_deviceGone || m_closing) {
        return CHANNEL_READ_CLOSED;
    }

    return CHANNEL_READ_TIMEOUT;
}

void UsbConsoleChannel::CloseTransport()
{
    CONCH_LOG;

    Release();
}

void UsbConsoleChannel::WakeUp()
{
    {
        std::lock_guard<std::mutex> lock(m_rxMutex);
        m_closing = true;
    }
    m_rxCV.notify_all();
}

void UsbConsoleChannel::HandleTransfer(struct libusb_transfer *transfer)
{
    CONCH_LOG;

    UsbConsoleChannel *channel = static_cast<UsbConsoleChannel *>(transfer->user_data);

    bool resubmit = false;
    {
        std::lock_guard<std::mutex> lock(channel->m_rxMutex);

        if (transfer->status == LIBUSB_TRANSFER_COMPLETED) {
            channel->m_rxData.append(reinterpret_cast<const char *>(transfer->buffer), transfer->actual_length);
            resubmit = !channel->m_closing;
        } else if (transfer->status == LIBUSB_TRANSFER_TIMED_OUT) {
            resubmit = !channel->m_closing;
        } else if (transfer->status == LIBUSB_TRANSFER_CANCELLED) {
            log(CONCH_LOG_LEVEL_DEBUG) << "Input transfer cancelled" << endLog;
        } else if (transfer->status == LIBUSB_TRANSFER_NO_DEVICE) {
            log(CONCH_LOG_LEVEL_INFO) << "Device is no longer there during transfer" << endLog;
            channel->m_deviceGone = true;
        } else {
            log(CONCH_LOG_LEVEL_ERROR) << "Input transfer failed with status " << transfer->status << endLog;
            channel->m_deviceGone = true;
        }

        if (resubmit) {
            int ret = libusb_submit_transfer(transfer);
            if (ret < 0) {
                log(CONCH_LOG_LEVEL_ERROR) << "Failed to resubmit input transfer: " << libusb_error_name(ret) << endLog;
                channel->m_deviceGone = true;
                resubmit = false;
            }
        }

        if (!resubmit) {
            channel->m_inputActive = false;
        }
    }
    channel->m_rxCV.notify_all();
}
