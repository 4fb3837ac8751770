// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Synaptics Incorporated

#include <exception>
#include <mutex>
#include <stdexcept>

#include "board.hpp"
#include "utils.hpp"
#include "conch_log.hpp"

void ShellPowerControl::Run(const std::string &command)
{
    CONCH_LOG;

    if (command.empty()) {
        return;
    }

    int ret = RunShellCommand(command);
    if (ret != 0) {
        log(CONCH_LOG_LEVEL_ERROR) << "Power command '" << command << "' failed: " << ret << endLog;
        throw std::runtime_error("Power command '" + command + "' failed with status " + std::to_string(ret));
    }
}

void ShellPowerControl::PowerOn()
{
    Run(m_powerOnCommand);
}

void ShellPowerControl::PowerOff()
{
    Run(m_powerOffCommand);
}

class Board::BoardImpl {
public:
    BoardImpl(const std::string &name, std::shared_ptr<PowerControl> powerControl, ChannelFactory connect)
        : m_name{name}, m_powerControl{powerControl}, m_connect{connect}
    {
        CONCH_LOG;

        if (!m_powerControl) {
            throw std::invalid_argument("Board " + name + " has no power control");
        }
        if (!m_connect) {
            throw std::invalid_argument("Board " + name + " has no channel factory");
        }
    }

    ~BoardImpl()
    {
        CONCH_LOG;

        if (m_state != BOARD_STATE_OFF) {
            log(CONCH_LOG_LEVEL_WARNING) << m_name << " destroyed while " << BoardStateToString(m_state) << endLog;
            try {
                Exit();
            } catch (const std::exception &e) {
                log(CONCH_LOG_LEVEL_ERROR) << m_name << ": teardown failed: " << e.what() << endLog;
            }
        }
    }

    void SetStatusCallback(std::function<void(BoardResponse)> statusCallback)
    {
        CONCH_LOG;

        m_statusCallback = statusCallback;
    }

    void Enter()
    {
        CONCH_LOG;
        ConchLogContext logContext(m_name);

        std::lock_guard<std::mutex> lock(m_stateMutex);

        if (m_state != BOARD_STATE_OFF) {
            throw MachineStateException(m_name + ": cannot enter while " + BoardStateToString(m_state));
        }

        SetState(BOARD_STATE_POWERING_ON, "Powering on");
        try {
            m_powerControl->PowerOn();
        } catch (const std::exception &e) {
            log(CONCH_LOG_LEVEL_ERROR) << m_name << ": power on failed: " << e.what() << endLog;
            SetState(BOARD_STATE_OFF, std::string("Power on failed: ") + e.what());
            throw;
        }

        try {
            m_channel = m_connect();
            if (!m_channel) {
                throw std::runtime_error(m_name + ": channel factory returned no channel");
            }
        } catch (const std::exception &e) {
            log(CONCH_LOG_LEVEL_ERROR) << m_name << ": connect failed: " << e.what() << endLog;
            m_channel.reset();
            SetState(BOARD_STATE_POWERING_OFF, std::string("Connect failed: ") + e.what());
            try {
                m_powerControl->PowerOff();
            } catch (const std::exception &powerError) {
                log(CONCH_LOG_LEVEL_ERROR) << m_name << ": power off failed: " << powerError.what() << endLog;
            }
            SetState(BOARD_STATE_OFF, "Powered off");
            throw;
        }

        SetState(BOARD_STATE_CONNECTED, "Connected");
    }

    void Exit()
    {
        CONCH_LOG;
        ConchLogContext logContext(m_name);

        std::lock_guard<std::mutex> lock(m_stateMutex);

        if (m_state != BOARD_STATE_CONNECTED) {
            log(CONCH_LOG_LEVEL_DEBUG) << m_name << ": exit while " << BoardStateToString(m_state) << ", nothing to do" << endLog;
            return;
        }

        SetState(BOARD_STATE_POWERING_OFF, "Powering off");

        std::exception_ptr error;
        try {
            m_channel->Close();
        } catch (const std::exception &e) {
            log(CONCH_LOG_LEVEL_ERROR) << m_name << ": closing the console failed: " << e.what() << endLog;
            error = std::current_exception();
        }
        m_channel.reset();

        try {
            m_powerControl->PowerOff();
        } catch (const std::exception &e) {
            log(CONCH_LOG_LEVEL_ERROR) << m_name << ": power off failed: " << e.what() << endLog;
            if (!error) {
                error = std::current_exception();
            }
        }

        SetState(BOARD_STATE_OFF, "Powered off");

        if (error) {
            std::rethrow_exception(error);
        }
    }

    Channel &GetChannel()
    {
        if (m_state != BOARD_STATE_CONNECTED || !m_channel) {
            throw MachineStateException(m_name + ": no console while " + BoardStateToString(m_state));
        }
        return *m_channel;
    }

    BoardState GetState() const { return m_state; }
    const std::string &GetName() const { return m_name; }

private:
    std::string m_name;
    std::shared_ptr<PowerControl> m_powerControl;
    ChannelFactory m_connect;
    std::unique_ptr<Channel> m_channel;
    BoardState m_state = BOARD_STATE_OFF;
    std::mutex m_stateMutex;
    std::function<void(BoardResponse)> m_statusCallback;

    void SetState(BoardState state, const std::string &message)
    {
        CONCH_LOG;

        m_state = state;
        log(CONCH_LOG_LEVEL_INFO) << m_name << ": " << BoardStateToString(state) << endLog;

        if (m_statusCallback) {
            m_statusCallback({m_name, state, message});
        }
    }
};

Board::Board(const std::string &name, std::shared_ptr<PowerControl> powerControl, ChannelFactory connect)
    : pImpl{std::make_unique<BoardImpl>(name, powerControl, connect)}
{}

Board::~Board()
{}

void Board::SetStatusCallback(std::function<void(BoardResponse)> statusCallback)
{
    pImpl->SetStatusCallback(statusCallback);
}

void Board::Enter()
{
    pImpl->Enter();
}

void Board::Exit()
{
    pImpl->Exit();
}

Channel &Board::GetChannel()
{
    return pImpl->GetChannel();
}

BoardState Board::GetState() const
{
    return pImpl->GetState();
}

const std::string &Board::GetName() const
{
    return pImpl->GetName();
}

const std::string Board::BoardStateToString(BoardState state)
{
    switch (state) {
        case BOARD_STATE_OFF:
            return "OFF";
        case BOARD_STATE_POWERING_ON:
            return "POWERING_ON";
        case BOARD_STATE_CONNECTED:
            return "CONNECTED";
        case BOARD_STATE_POWERING_OFF:
            return "POWERING_OFF";
        default:
            return "UNKNOWN";
    }
}

BoardSession::BoardSession(Board &board) : m_board{board}
{
    CONCH_LOG;

    m_board.Enter();
}

BoardSession::~BoardSession()
{
    CONCH_LOG;

    if (m_closed) {
        return;
    }

    try {
        m_closed = true;
        m_board.Exit();
    } catch (const std::exception &e) {
        log(CONCH_LOG_LEVEL_ERROR) << m_board.GetName() << ": teardown failed: " << e.what() << endLog;
    }
}

void BoardSession::Close()
{
    CONCH_LOG;

    if (m_closed) {
        return;
    }

    m_closed = true;
    m_board.Exit();
}
