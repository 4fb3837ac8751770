// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Synaptics Incorporated

#pragma once

#include <string>

#include "channel.hpp"

// Channel over a non-blocking file descriptor. A self-pipe lets Close() wake up
// a read that is blocked in poll().
class FdChannel : public Channel
{
public:
    FdChannel(const std::string &name);
    ~FdChannel();

protected:
    int m_fd = -1;

    int WriteRaw(const uint8_t *data, size_t size) override;
    ChannelReadStatus ReadRaw(std::string &data, std::chrono::milliseconds timeout) override;
    void CloseTransport() override;
    void WakeUp() override;

    // Derived transports release their own resources here, after m_fd is closed.
    virtual void ReleaseTransport()
    {}

    int SetFd(int fd);

private:
    int m_wakePipe[2] = {-1, -1};
    static constexpr size_t m_readSize = 4096;
};
