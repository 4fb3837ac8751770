// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Synaptics Incorporated

#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <string>
#include <unistd.h>
#include <gtest/gtest.h>

#include "board_config.hpp"

using namespace std::chrono_literals;

TEST(BoardConfigTest, ProcessBoard)
{
    BoardConfig config = BoardConfig::Load(R"(
name: sl1680-evk
power:
  on: relayctl 3 on
  off: relayctl 3 off
connection:
  type: process
  command: picocom -q -b 115200 /dev/ttyUSB0
  init: "\n"
uboot:
  prompt: "=> "
  autoboot_prompt: 'Hit any key to stop autoboot:\s+\d+\s+'
  autoboot_keys: " "
  boot_timeout: 90
  command_timeout: 2.5
  reacquire_timeout: 1
  prompt_settle_time: 0.05
  status_command: echo $?
  path_root: /srv/tftp
)");

    EXPECT_EQ(config.GetName(), "sl1680-evk");
    EXPECT_EQ(config.GetPowerOnCommand(), "relayctl 3 on");
    EXPECT_EQ(config.GetPowerOffCommand(), "relayctl 3 off");

    const ConnectionConfig &connection = config.GetConnection();
    EXPECT_EQ(connection.m_type, CONNECTION_TYPE_PROCESS);
    EXPECT_EQ(connection.m_command, "picocom -q -b 115200 /dev/ttyUSB0");
    EXPECT_EQ(connection.m_init, "\n");

    const UBootConfig &uboot = config.GetUBootConfig();
    EXPECT_EQ(uboot.prompt, "=> ");
    ASSERT_TRUE(uboot.autobootPrompt.has_value());
    EXPECT_EQ(*uboot.autobootPrompt, R"(Hit any key to stop autoboot:\s+\d+\s+)");
    EXPECT_EQ(uboot.autobootKeys, " ");
    EXPECT_EQ(uboot.bootTimeout, 90s);
    EXPECT_EQ(uboot.commandTimeout, 2500ms);
    EXPECT_EQ(uboot.reacquireTimeout, 1s);
    EXPECT_EQ(uboot.promptSettleTime, 50ms);
    EXPECT_EQ(uboot.statusCommand, "echo $?");
    EXPECT_EQ(uboot.pathRoot, std::filesystem::path("/srv/tftp"));
}

TEST(BoardConfigTest, Defaults)
{
    BoardConfig config = BoardConfig::Load(R"(
name: bench
connection:
  type: process
  command: cat
)");

    EXPECT_EQ(config.GetPowerOnCommand(), "");
    EXPECT_EQ(config.GetPowerOffCommand(), "");
    EXPECT_EQ(config.GetConnection().m_init, "");

    const UBootConfig &uboot = config.GetUBootConfig();
    UBootConfig defaults;
    EXPECT_EQ(uboot.prompt, "U-Boot> ");
    EXPECT_EQ(uboot.autobootPrompt, defaults.autobootPrompt);
    EXPECT_EQ(uboot.autobootKeys, "\n");
    EXPECT_EQ(uboot.bootTimeout, 60s);
    EXPECT_EQ(uboot.commandTimeout, 30s);
    EXPECT_EQ(uboot.reacquireTimeout, 500ms);
    EXPECT_EQ(uboot.promptSettleTime, 20ms);
    EXPECT_EQ(uboot.statusCommand, "echo $?");
    EXPECT_EQ(uboot.pathRoot, std::filesystem::path("/tftpboot"));
}

TEST(BoardConfigTest, NullAutobootPromptDisablesInterception)
{
    BoardConfig config = BoardConfig::Load(R"(
name: bench
connection:
  type: process
  command: cat
uboot:
  autoboot_prompt: ~
)");

    EXPECT_FALSE(config.GetUBootConfig().autobootPrompt.has_value());
}

TEST(BoardConfigTest, SerialBoard)
{
    BoardConfig config = BoardConfig::Load(R"(
name: rpi
connection:
  type: Serial
  device: /dev/ttyAMA0
  baudrate: 921600
)");

    EXPECT_EQ(config.GetConnection().m_type, CONNECTION_TYPE_SERIAL);
    EXPECT_EQ(config.GetConnection().m_device, "/dev/ttyAMA0");
    EXPECT_EQ(config.GetConnection().m_baudrate, 921600);
}

TEST(BoardConfigTest, UsbBoard)
{
    BoardConfig config = BoardConfig::Load(R"(
name: astra
connection:
  type: usb
  vendor_id: "06CB"
  product_id: 0x019e
  filter_ports: "1-2"
  enumerate_timeout: 5
)");

    const ConnectionConfig &connection = config.GetConnection();
    EXPECT_EQ(connection.m_type, CONNECTION_TYPE_USB);
    EXPECT_EQ(connection.m_vendorId, 0x06CB);
    EXPECT_EQ(connection.m_productId, 0x019E);
    EXPECT_EQ(connection.m_filterPorts, "1-2");
    EXPECT_EQ(connection.m_enumerateTimeout, 5s);
    EXPECT_FALSE(connection.m_usbDebug);

    config.SetUsbDebug(true);
    EXPECT_TRUE(config.GetConnection().m_usbDebug);
}

TEST(BoardConfigTest, InvalidDescriptions)
{
    // No name
    EXPECT_THROW(BoardConfig::Load("connection: {type: process, command: cat}"), std::invalid_argument);
    // No connection
    EXPECT_THROW(BoardConfig::Load("name: bench"), std::invalid_argument);
    // No connection type
    EXPECT_THROW(BoardConfig::Load("name: bench\nconnection: {command: cat}"), std::invalid_argument);
    // Unknown connection type
    EXPECT_THROW(BoardConfig::Load("name: bench\nconnection: {type: telnet}"), std::invalid_argument);
    // Process without command
    EXPECT_THROW(BoardConfig::Load("name: bench\nconnection: {type: process}"), std::invalid_argument);
    // Serial without device
    EXPECT_THROW(BoardConfig::Load("name: bench\nconnection: {type: serial}"), std::invalid_argument);
    // USB id out of range or not hex
    EXPECT_THROW(BoardConfig::Load("name: b\nconnection: {type: usb, vendor_id: '10000', product_id: '1'}"),
        std::invalid_argument);
    EXPECT_THROW(BoardConfig::Load("name: b\nconnection: {type: usb, vendor_id: xyz, product_id: '1'}"),
        std::invalid_argument);
    // Empty prompt
    EXPECT_THROW(BoardConfig::Load("name: b\nconnection: {type: process, command: cat}\nuboot: {prompt: ''}"),
        std::invalid_argument);
    // Negative timeout
    EXPECT_THROW(BoardConfig::Load("name: b\nconnection: {type: process, command: cat}\nuboot: {boot_timeout: -1}"),
        std::invalid_argument);
    // Not YAML at all
    EXPECT_THROW(BoardConfig::Load("name: [unterminated"), std::invalid_argument);
    EXPECT_THROW(BoardConfig::Load("- just\n- a list\n"), std::invalid_argument);
}

TEST(BoardConfigTest, LoadFile)
{
    std::filesystem::path path = std::filesystem::temp_directory_path()
        / ("conch-board-" + std::to_string(getpid()) + ".yaml");
    {
        std::ofstream file(path);
        file << "name: from-file\nconnection:\n  type: process\n  command: cat\n";
    }

    BoardConfig config = BoardConfig::LoadFile(path.string());
    EXPECT_EQ(config.GetName(), "from-file");

    std::filesystem::remove(path);
    EXPECT_THROW(BoardConfig::LoadFile(path.string()), std::runtime_error);
}

TEST(BoardConfigTest, ConnectionTypeNames)
{
    EXPECT_EQ(BoardConfig::StringToConnectionType("PROCESS"), CONNECTION_TYPE_PROCESS);
    EXPECT_EQ(BoardConfig::StringToConnectionType("serial"), CONNECTION_TYPE_SERIAL);
    EXPECT_EQ(BoardConfig::StringToConnectionType("usb"), CONNECTION_TYPE_USB);
    EXPECT_THROW(BoardConfig::StringToConnectionType("ssh"), std::invalid_argument);
    EXPECT_THROW(BoardConfig::StringToConnectionType("s\xC3\xA9rial"), std::invalid_argument);
    EXPECT_THROW(BoardConfig::StringToConnectionType("\xFF"), std::invalid_argument);
    EXPECT_EQ(BoardConfig::ConnectionTypeToString(CONNECTION_TYPE_USB), "usb");
}

TEST(BoardConfigTest, MakeBoardConnectsProcessConsole)
{
    BoardConfig config = BoardConfig::Load(R"(
name: loopback
power:
  on: "true"
  off: "true"
connection:
  type: process
  command: cat
)");

    std::unique_ptr<Board> board = config.MakeBoard();
    EXPECT_EQ(board->GetName(), "loopback");

    {
        BoardSession session(*board);
        Channel &channel = session.GetChannel();
        EXPECT_TRUE(channel.IsOpen());

        channel.Send("ping\n");
        EXPECT_NO_THROW(channel.ReadUntilPrompt("ping\r\n", 5s));
    }

    EXPECT_EQ(board->GetState(), BOARD_STATE_OFF);
}

TEST(BoardConfigTest, FailingPowerCommandAbortsEntry)
{
    BoardConfig config = BoardConfig::Load(R"(
name: dead
power:
  on: "false"
connection:
  type: process
  command: cat
)");

    std::unique_ptr<Board> board = config.MakeBoard();
    EXPECT_THROW(board->Enter(), std::runtime_error);
    EXPECT_EQ(board->GetState(), BOARD_STATE_OFF);
}
