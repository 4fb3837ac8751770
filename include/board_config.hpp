// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Synaptics Incorporated

#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include "board.hpp"
#include "channel.hpp"
#include "uboot_machine.hpp"

enum ConnectionType {
    CONNECTION_TYPE_PROCESS,
    CONNECTION_TYPE_SERIAL,
    CONNECTION_TYPE_USB,
};

struct ConnectionConfig
{
    ConnectionType m_type = CONNECTION_TYPE_PROCESS;

    // process
    std::string m_command;
    std::string m_init;

    // serial
    std::string m_device;
    int m_baudrate = 115200;

    // usb
    uint16_t m_vendorId = 0;
    uint16_t m_productId = 0;
    std::string m_filterPorts;
    std::chrono::milliseconds m_enumerateTimeout{20000};
    bool m_usbDebug = false;
};

// Board description read from a YAML file: how to switch the board, how to
// reach its console and what its U-Boot looks like.
class BoardConfig
{
public:
    // Throws std::runtime_error when the file cannot be read and
    // std::invalid_argument when its content is not a valid description.
    static BoardConfig LoadFile(const std::string &path);
    static BoardConfig Load(const std::string &yaml);

    const std::string &GetName() const { return m_name; }
    const std::string &GetPowerOnCommand() const { return m_powerOn; }
    const std::string &GetPowerOffCommand() const { return m_powerOff; }
    const ConnectionConfig &GetConnection() const { return m_connection; }
    const UBootConfig &GetUBootConfig() const { return m_uboot; }

    void SetUsbDebug(bool usbDebug) { m_connection.m_usbDebug = usbDebug; }

    std::shared_ptr<PowerControl> MakePowerControl() const;
    ChannelFactory MakeChannelFactory() const;
    std::unique_ptr<Board> MakeBoard() const;

    static ConnectionType StringToConnectionType(const std::string &type);
    static const std::string ConnectionTypeToString(ConnectionType type);

private:
    std::string m_name;
    std::string m_powerOn;
    std::string m_powerOff;
    ConnectionConfig m_connection;
    UBootConfig m_uboot;
};
