// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Synaptics Incorporated

#pragma once

#include <stdexcept>
#include <string>

// The channel was closed locally or by the peer. Fatal to the session.
class ChannelClosedException : public std::runtime_error
{
public:
    ChannelClosedException(const std::string &message = "Channel closed") : std::runtime_error{message}
    {}
};

// A pattern did not show up within the allotted time.
class TimeoutException : public std::runtime_error
{
public:
    TimeoutException(const std::string &message = "Timeout") : std::runtime_error{message}
    {}
};

class CommandFailedException : public std::runtime_error
{
public:
    CommandFailedException(const std::string &machineName, const std::string &command, const std::string &output)
        : std::runtime_error{machineName + ": command failed: \"" + command + "\""},
        m_machineName{machineName}, m_command{command}, m_output{output}
    {}

    const std::string &GetMachineName() const { return m_machineName; }
    const std::string &GetCommand() const { return m_command; }
    const std::string &GetOutput() const { return m_output; }

private:
    std::string m_machineName;
    std::string m_command;
    std::string m_output;
};

// The prompt could not be found again after an interactive session. The
// console state is unknown afterwards.
class InteractiveReacquireException : public std::runtime_error
{
public:
    InteractiveReacquireException(const std::string &message) : std::runtime_error{message}
    {}
};

// A command was issued while the machine is not synchronized with its prompt.
class MachineStateException : public std::runtime_error
{
public:
    MachineStateException(const std::string &message) : std::runtime_error{message}
    {}
};
