// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Synaptics Incorporated

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unistd.h>

#include "pattern.hpp"
#include "console_log.hpp"
#include "conch_errors.hpp"

enum ChannelReadStatus {
    CHANNEL_READ_DATA,
    CHANNEL_READ_TIMEOUT,
    CHANNEL_READ_CLOSED,
};

// Bidirectional byte stream to a device console.
//
// Transports implement WriteRaw(), ReadRaw() and CloseTransport(). The base
// class keeps the bytes that were read from the transport but not consumed
// yet, and the sticky open/closed state. A channel is driven by one thread at
// a time; Close() may additionally be called from any thread to abort a
// pending read.
class Channel
{
public:
    Channel(const std::string &name);
    virtual ~Channel();

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    void Send(const std::string &data);

    // Returns buffered bytes right away, otherwise waits at most timeout for
    // the transport to deliver something.
    std::string Recv(std::chrono::milliseconds timeout);

    // Reads until prompt shows up and returns everything read, the prompt
    // included. Bytes received after the prompt stay buffered. On timeout
    // nothing that was read is lost: it is handed out again by the next read,
    // and is not mirrored to the sink a second time.
    std::string ReadUntilPrompt(const Pattern &prompt, std::chrono::milliseconds timeout,
        ConsoleSink *sink = nullptr);

    // How long the console must stay quiet after a literal prompt before the
    // prompt is taken as such.
    void SetPromptSettleTime(std::chrono::milliseconds settleTime) { m_promptSettleTime = settleTime; }
    std::chrono::milliseconds GetPromptSettleTime() const { return m_promptSettleTime; }

    void Close();
    bool IsOpen() const { return m_open.load(); }

    // Relays inFd to the channel and the channel to outFd until the detach key
    // is typed or inFd reaches end of file. The channel stays open.
    void AttachInteractive(int inFd = STDIN_FILENO, int outFd = STDOUT_FILENO);

    size_t GetPendingSize() const { return m_pending.size(); }
    const std::string &GetName() const { return m_name; }

    static constexpr char m_detachKey = 0x04; // CTRL+D

protected:
    // Returns the number of bytes written or a negative value on failure.
    virtual int WriteRaw(const uint8_t *data, size_t size) = 0;
    virtual ChannelReadStatus ReadRaw(std::string &data, std::chrono::milliseconds timeout) = 0;
    virtual void CloseTransport() = 0;

    // Called by Close() before taking the transport locks so a blocked
    // ReadRaw() returns early.
    virtual void WakeUp()
    {}

private:
    std::string m_name;
    std::string m_pending;
    size_t m_pendingMirrored = 0;
    std::chrono::milliseconds m_promptSettleTime{20};
    std::atomic<bool> m_open{true};
    bool m_transportClosed = false;
    std::mutex m_readMutex;
    std::mutex m_writeMutex;
    std::mutex m_closeMutex;

    ChannelReadStatus ReadSome(std::string &data, std::chrono::milliseconds timeout);
    static size_t LookbackOffset(const std::string &buffer);
};

using ChannelFactory = std::function<std::unique_ptr<Channel>()>;
