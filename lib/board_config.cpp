// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Synaptics Incorporated

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

#include "board_config.hpp"
#include "process_channel.hpp"
#include "serial_channel.hpp"
#include "usb_console_channel.hpp"
#include "conch_log.hpp"

namespace {

std::string RequiredString(const YAML::Node &node, const std::string &key, const std::string &section)
{
    if (!node[key] || node[key].IsNull()) {
        throw std::invalid_argument("Missing " + section + "." + key);
    }
    return node[key].as<std::string>();
}

std::string OptionalString(const YAML::Node &node, const std::string &key, const std::string &defaultValue)
{
    if (!node || !node[key] || node[key].IsNull()) {
        return defaultValue;
    }
    return node[key].as<std::string>();
}

std::chrono::milliseconds OptionalSeconds(const YAML::Node &node, const std::string &key,
    std::chrono::milliseconds defaultValue)
{
    if (!node || !node[key] || node[key].IsNull()) {
        return defaultValue;
    }

    double seconds = node[key].as<double>();
    if (seconds <= 0) {
        throw std::invalid_argument(key + " must be positive");
    }
    return std::chrono::milliseconds{static_cast<int64_t>(seconds * 1000)};
}

uint16_t ParseUsbId(const YAML::Node &node, const std::string &key)
{
    std::string value = RequiredString(node, key, "connection");
    unsigned long id = std::stoul(value, nullptr, 16);
    if (id > 0xFFFF) {
        throw std::invalid_argument("connection." + key + " out of range: " + value);
    }
    return static_cast<uint16_t>(id);
}

}

ConnectionType BoardConfig::StringToConnectionType(const std::string &type)
{
    std::string lowerType = type;
    std::transform(lowerType.begin(), lowerType.end(), lowerType.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowerType == "process") {
        return CONNECTION_TYPE_PROCESS;
    } else if (lowerType == "serial") {
        return CONNECTION_TYPE_SERIAL;
    } else if (lowerType == "usb") {
        return CONNECTION_TYPE_USB;
    }

    throw std::invalid_argument("Unknown connection type: " + type);
}

const std::string BoardConfig::ConnectionTypeToString(ConnectionType type)
{
    switch (type) {
        case CONNECTION_TYPE_PROCESS:
            return "process";
        case CONNECTION_TYPE_SERIAL:
            return "serial";
        case CONNECTION_TYPE_USB:
            return "usb";
        default:
            return "unknown";
    }
}

BoardConfig BoardConfig::LoadFile(const std::string &path)
{
    CONCH_LOG;

    std::ifstream file(path);
    if (!file) {
        log(CONCH_LOG_LEVEL_ERROR) << "Unable to open the board file: " << path << endLog;
        throw std::runtime_error("Unable to open board file " + path);
    }

    std::stringstream content;
    content << file.rdbuf();

    return Load(content.str());
}

BoardConfig BoardConfig::Load(const std::string &yaml)
{
    CONCH_LOG;

    BoardConfig config;

    try {
        YAML::Node root = YAML::Load(yaml);
        if (!root.IsMap()) {
            throw std::invalid_argument("Board description is not a map");
        }

        config.m_name = RequiredString(root, "name", "board");

        YAML::Node power = root["power"];
        config.m_powerOn = OptionalString(power, "on", "");
        config.m_powerOff = OptionalString(power, "off", "");

        YAML::Node connection = root["connection"];
        if (!connection || !connection.IsMap()) {
            throw std::invalid_argument("Missing connection section");
        }

        ConnectionConfig &conn = config.m_connection;
        conn.m_type = StringToConnectionType(RequiredString(connection, "type", "connection"));
        switch (conn.m_type) {
            case CONNECTION_TYPE_PROCESS:
                conn.m_command = RequiredString(connection, "command", "connection");
                conn.m_init = OptionalString(connection, "init", "");
                break;
            case CONNECTION_TYPE_SERIAL:
                conn.m_device = RequiredString(connection, "device", "connection");
                if (connection["baudrate"]) {
                    conn.m_baudrate = connection["baudrate"].as<int>();
                }
                break;
            case CONNECTION_TYPE_USB:
                conn.m_vendorId = ParseUsbId(connection, "vendor_id");
                conn.m_productId = ParseUsbId(connection, "product_id");
                conn.m_filterPorts = OptionalString(connection, "filter_ports", "");
                conn.m_enumerateTimeout = OptionalSeconds(connection, "enumerate_timeout", conn.m_enumerateTimeout);
                break;
        }

        YAML::Node uboot = root["uboot"];
        UBootConfig &ubootConfig = config.m_uboot;
        if (uboot) {
            if (!uboot.IsMap()) {
                throw std::invalid_argument("uboot section is not a map");
            }

            ubootConfig.prompt = OptionalString(uboot, "prompt", ubootConfig.prompt);
            if (ubootConfig.prompt.empty()) {
                throw std::invalid_argument("uboot.prompt is empty");
            }

            if (uboot["autoboot_prompt"]) {
                if (uboot["autoboot_prompt"].IsNull()) {
                    ubootConfig.autobootPrompt.reset();
                } else {
                    ubootConfig.autobootPrompt = uboot["autoboot_prompt"].as<std::string>();
                }
            }

            ubootConfig.autobootKeys = OptionalString(uboot, "autoboot_keys", ubootConfig.autobootKeys);
            ubootConfig.bootTimeout = OptionalSeconds(uboot, "boot_timeout", ubootConfig.bootTimeout);
            ubootConfig.commandTimeout = OptionalSeconds(uboot, "command_timeout", ubootConfig.commandTimeout);
            ubootConfig.reacquireTimeout = OptionalSeconds(uboot, "reacquire_timeout", ubootConfig.reacquireTimeout);
            ubootConfig.promptSettleTime = OptionalSeconds(uboot, "prompt_settle_time", ubootConfig.promptSettleTime);
            ubootConfig.statusCommand = OptionalString(uboot, "status_command", ubootConfig.statusCommand);
            ubootConfig.pathRoot = OptionalString(uboot, "path_root", ubootConfig.pathRoot.string());
        }
    } catch (const YAML::Exception &e) {
        log(CONCH_LOG_LEVEL_ERROR) << "Invalid board description: " << e.what() << endLog;
        throw std::invalid_argument(std::string("Invalid board description: ") + e.what());
    } catch (const std::logic_error &e) {
        // std::invalid_argument and std::out_of_range from the conversions above
        log(CONCH_LOG_LEVEL_ERROR) << "Invalid board description: " << e.what() << endLog;
        throw std::invalid_argument(std::string("Invalid board description: ") + e.what());
    }

    log(CONCH_LOG_LEVEL_INFO) << "Board: " << config.m_name << endLog;
    log(CONCH_LOG_LEVEL_INFO) << "Connection: " << ConnectionTypeToString(config.m_connection.m_type) << endLog;
    if (config.m_connection.m_type == CONNECTION_TYPE_USB) {
        log(CONCH_LOG_LEVEL_INFO) << "Vendor ID: 0x" << std::hex << std::uppercase << std::setfill('0') << std::setw(4)
            << config.m_connection.m_vendorId << endLog;
        log(CONCH_LOG_LEVEL_INFO) << "Product ID: 0x" << std::hex << std::uppercase << std::setfill('0') << std::setw(4)
            << config.m_connection.m_productId << endLog;
    }
    log(CONCH_LOG_LEVEL_INFO) << "U-Boot prompt: '" << config.m_uboot.prompt << "'" << endLog;
    log(CONCH_LOG_LEVEL_INFO) << "Autoboot prompt: "
        << (config.m_uboot.autobootPrompt ? "'" + *config.m_uboot.autobootPrompt + "'" : "disabled") << endLog;

    return config;
}

std::shared_ptr<PowerControl> BoardConfig::MakePowerControl() const
{
    return std::make_shared<ShellPowerControl>(m_powerOn, m_powerOff);
}

ChannelFactory BoardConfig::MakeChannelFactory() const
{
    std::string name = m_name;
    ConnectionConfig connection = m_connection;

    switch (connection.m_type) {
        case CONNECTION_TYPE_PROCESS:
            return [name, connection]() -> std::unique_ptr<Channel> {
                return std::make_unique<ProcessChannel>(name, connection.m_command, connection.m_init);
            };
        case CONNECTION_TYPE_SERIAL:
            return [name, connection]() -> std::unique_ptr<Channel> {
                return std::make_unique<SerialChannel>(name, connection.m_device, connection.m_baudrate);
            };
        case CONNECTION_TYPE_USB:
            return [name, connection]() -> std::unique_ptr<Channel> {
                return std::make_unique<UsbConsoleChannel>(name, connection.m_vendorId, connection.m_productId,
                    connection.m_enumerateTimeout, connection.m_filterPorts, connection.m_usbDebug);
            };
    }

    throw std::invalid_argument("Unknown connection type");
}

std::unique_ptr<Board> BoardConfig::MakeBoard() const
{
    return std::make_unique<Board>(m_name, MakePowerControl(), MakeChannelFactory());
}
