// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Synaptics Incorporated

#pragma once

#include <functional>
#include <memory>
#include <string>

#include "channel.hpp"

enum BoardState {
    BOARD_STATE_OFF,
    BOARD_STATE_POWERING_ON,
    BOARD_STATE_CONNECTED,
    BOARD_STATE_POWERING_OFF,
};

// Switches the supply of a board. Both calls throw on failure.
class PowerControl
{
public:
    virtual ~PowerControl()
    {}

    virtual void PowerOn() = 0;
    virtual void PowerOff() = 0;
};

// Runs a shell command for each transition. An empty command is a no-op.
class ShellPowerControl : public PowerControl
{
public:
    ShellPowerControl(const std::string &powerOnCommand, const std::string &powerOffCommand)
        : m_powerOnCommand{powerOnCommand}, m_powerOffCommand{powerOffCommand}
    {}

    void PowerOn() override;
    void PowerOff() override;

private:
    std::string m_powerOnCommand;
    std::string m_powerOffCommand;

    void Run(const std::string &command);
};

struct BoardResponse
{
    std::string m_boardName;
    BoardState m_state;
    std::string m_message;
};

class Board
{
public:
    Board(const std::string &name, std::shared_ptr<PowerControl> powerControl, ChannelFactory connect);
    ~Board();

    void SetStatusCallback(std::function<void(BoardResponse)> statusCallback);

    // Powers the board on and connects its console. If connecting fails the
    // board is powered off again before the error propagates.
    void Enter();

    // Closes the console and powers the board off. Both steps run even when
    // the first one fails; the first error is rethrown afterwards.
    void Exit();

    // Only valid while connected.
    Channel &GetChannel();

    BoardState GetState() const;
    const std::string &GetName() const;

    static const std::string BoardStateToString(BoardState state);

private:
    class BoardImpl;
    std::unique_ptr<BoardImpl> pImpl;
};

// Keeps a board connected for the lifetime of the object.
class BoardSession
{
public:
    BoardSession(Board &board);
    ~BoardSession();

    BoardSession(const BoardSession&) = delete;
    BoardSession& operator=(const BoardSession&) = delete;

    // Leaves the board early and reports teardown errors to the caller. The
    // destructor can only log them.
    void Close();

    Board &GetBoard() { return m_board; }
    Channel &GetChannel() { return m_board.GetChannel(); }

private:
    Board &m_board;
    bool m_closed = false;
};
