// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Synaptics Incorporated

#pragma once

#include <string>
#include <sys/types.h>

#include "fd_channel.hpp"

// Console reached through a local command running on a pseudo terminal, for
// example "picocom -q -b 115200 /dev/ttyUSB0" or "ssh -t lab console board".
class ProcessChannel : public FdChannel
{
public:
    ProcessChannel(const std::string &name, const std::string &command, const std::string &initScript = "");
    ~ProcessChannel();

    pid_t GetPid() const { return m_pid; }

protected:
    void ReleaseTransport() override;

private:
    std::string m_command;
    pid_t m_pid = -1;

    void Spawn();
    void Reap();
};
