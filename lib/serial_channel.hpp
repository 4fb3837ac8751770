// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Synaptics Incorporated

#pragma once

#include <string>

#include "fd_channel.hpp"

// Console on a local tty device, raw 8N1 without flow control.
class SerialChannel : public FdChannel
{
public:
    SerialChannel(const std::string &name, const std::string &device, int baudrate = 115200);
    ~SerialChannel();

    const std::string &GetDevice() const { return m_device; }

private:
    std::string m_device;
    int m_baudrate;

    void Open();
};
