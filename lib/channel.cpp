// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Synaptics Incorporated

#include <cerrno>
#include <cstring>
#include <poll.h>
#include <termios.h>
#include <unistd.h>

#include "channel.hpp"
#include "conch_log.hpp"

namespace {

// Puts a terminal into raw mode for the lifetime of the object.
class RawTerminal
{
public:
    RawTerminal(int fd) : m_fd{fd}
    {
        CONCH_LOG;

        if (!isatty(m_fd)) {
            return;
        }

        if (tcgetattr(m_fd, &m_orig) != 0) {
            log(CONCH_LOG_LEVEL_WARNING) << "tcgetattr failed: " << std::strerror(errno) << endLog;
            return;
        }

        termios raw = m_orig;
        cfmakeraw(&raw);
        raw.c_cc[VMIN] = 1;
        raw.c_cc[VTIME] = 0;
        if (tcsetattr(m_fd, TCSANOW, &raw) != 0) {
            log(CONCH_LOG_LEVEL_WARNING) << "tcsetattr failed: " << std::strerror(errno) << endLog;
            return;
        }
        m_restore = true;
    }

    ~RawTerminal()
    {
        if (m_restore) {
            tcsetattr(m_fd, TCSANOW, &m_orig);
        }
    }

private:
    int m_fd;
    termios m_orig{};
    bool m_restore = false;
};

bool WriteAll(int fd, const std::string &data)
{
    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = write(fd, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        written += n;
    }
    return true;
}

}

Channel::Channel(const std::string &name) : m_name{name}
{
    CONCH_LOG;
}

Channel::~Channel()
{
    CONCH_LOG;
}

void Channel::Send(const std::string &data)
{
    CONCH_LOG;

    if (!m_open.load()) {
        throw ChannelClosedException(m_name + ": send on closed channel");
    }

    int ret;
    {
        std::lock_guard<std::mutex> lock(m_writeMutex);
        size_t sent = 0;
        ret = 0;
        while (sent < data.size()) {
            ret = WriteRaw(reinterpret_cast<const uint8_t*>(data.data()) + sent, data.size() - sent);
            if (ret < 0) {
                break;
            }
            sent += ret;
        }
    }

    if (ret < 0) {
        log(CONCH_LOG_LEVEL_ERROR) << m_name << ": failed to write to transport" << endLog;
        Close();
        throw ChannelClosedException(m_name + ": transport write failed");
    }
}

ChannelReadStatus Channel::ReadSome(std::string &data, std::chrono::milliseconds timeout)
{
    if (!m_open.load()) {
        return CHANNEL_READ_CLOSED;
    }

    if (!m_pending.empty()) {
        data.swap(m_pending);
        m_pending.clear();
        m_pendingMirrored = 0;
        return CHANNEL_READ_DATA;
    }

    ChannelReadStatus status;
    {
        std::lock_guard<std::mutex> lock(m_readMutex);
        status = ReadRaw(data, timeout);
    }

    if (status == CHANNEL_READ_CLOSED || !m_open.load()) {
        CONCH_LOG;
        log(CONCH_LOG_LEVEL_DEBUG) << m_name << ": transport closed" << endLog;
        Close();
        return CHANNEL_READ_CLOSED;
    }

    return status;
}

std::string Channel::Recv(std::chrono::milliseconds timeout)
{
    std::string data;

    switch (ReadSome(data, timeout)) {
        case CHANNEL_READ_DATA:
            return data;
        case CHANNEL_READ_TIMEOUT:
            throw TimeoutException(m_name + ": no data within " + std::to_string(timeout.count()) + " ms");
        case CHANNEL_READ_CLOSED:
        default:
            throw ChannelClosedException(m_name + ": channel closed");
    }
}

size_t Channel::LookbackOffset(const std::string &buffer)
{
    // Restart the search at the beginning of the line before the last one so
    // a prompt split over two reads is still seen as a whole.
    size_t lastNewline = buffer.rfind('\n');
    if (lastNewline == std::string::npos || lastNewline == 0) {
        return 0;
    }

    size_t previousNewline = buffer.rfind('\n', lastNewline - 1);
    if (previousNewline == std::string::npos) {
        return 0;
    }

    return previousNewline + 1;
}

std::string Channel::ReadUntilPrompt(const Pattern &prompt, std::chrono::milliseconds timeout, ConsoleSink *sink)
{
    CONCH_LOG;

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    std::string buffer;
    size_t searchFrom = 0;

    // Buffered bytes left by a timed out read were mirrored already
    size_t mirrored = m_pendingMirrored;
    m_pendingMirrored = 0;

    auto mirror = [&](size_t upTo) {
        if (upTo > mirrored) {
            if (sink) {
                sink->Write(buffer.substr(mirrored, upTo - mirrored));
            }
            mirrored = upTo;
        }
    };

    for (;;) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        if (remaining.count() < 0) {
            remaining = std::chrono::milliseconds{0};
        }

        std::string chunk;
        ChannelReadStatus status = ReadSome(chunk, remaining);
        if (status == CHANNEL_READ_CLOSED) {
            throw ChannelClosedException(m_name + ": channel closed while waiting for '" + prompt.GetText() + "'");
        }

        if (status == CHANNEL_READ_TIMEOUT) {
            log(CONCH_LOG_LEVEL_DEBUG) << m_name << ": timeout waiting for '" << prompt.GetText()
                << "', " << buffer.size() << " bytes kept" << endLog;
            m_pending.insert(0, buffer);
            m_pendingMirrored = mirrored;
            throw TimeoutException(m_name + ": timeout waiting for prompt '" + prompt.GetText() + "'");
        }

        buffer += chunk;

        size_t matchEnd = 0;
        bool found = false;
        while (prompt.Find(buffer, searchFrom, matchEnd)) {
            if (prompt.IsRegex() || std::chrono::steady_clock::now() >= deadline) {
                found = true;
                break;
            }

            // A literal prompt at the end of what was read so far may still be
            // part of a longer line. It counts once the console stays quiet.
            std::string more;
            if (ReadSome(more, m_promptSettleTime) != CHANNEL_READ_DATA) {
                found = true;
                break;
            }
            buffer += more;
        }

        if (found) {
            mirror(matchEnd);
            m_pending.insert(0, buffer.substr(matchEnd));
            m_pendingMirrored = mirrored - matchEnd;
            buffer.resize(matchEnd);

            log(CONCH_LOG_LEVEL_DEBUG) << m_name << ": prompt '" << prompt.GetText() << "' found after "
                << buffer.size() << " bytes" << endLog;
            return buffer;
        }

        mirror(buffer.size());
        searchFrom = LookbackOffset(buffer);
    }
}

void Channel::Close()
{
    CONCH_LOG;

    m_open.store(false);
    WakeUp();

    std::lock_guard<std::mutex> closeLock(m_closeMutex);
    if (m_transportClosed) {
        return;
    }

    std::lock_guard<std::mutex> readLock(m_readMutex);
    std::lock_guard<std::mutex> writeLock(m_writeMutex);
    log(CONCH_LOG_LEVEL_DEBUG) << m_name << ": closing transport" << endLog;
    CloseTransport();
    m_transportClosed = true;
}

void Channel::AttachInteractive(int inFd, int outFd)
{
    CONCH_LOG;

    if (!m_open.load()) {
        throw ChannelClosedException(m_name + ": cannot attach to a closed channel");
    }

    log(CONCH_LOG_LEVEL_INFO) << m_name << ": attached interactive session" << endLog;

    RawTerminal terminal(inFd);
    char input[256];
    bool attached = true;

    while (attached) {
        pollfd pfd{inFd, POLLIN, 0};
        int ret = poll(&pfd, 1, 20);
        if (ret < 0 && errno != EINTR) {
            log(CONCH_LOG_LEVEL_ERROR) << "poll failed: " << std::strerror(errno) << endLog;
            break;
        }

        if (ret > 0 && (pfd.revents & (POLLIN | POLLHUP))) {
            ssize_t n = read(inFd, input, sizeof(input));
            if (n <= 0) {
                attached = false;
            } else {
                std::string keys(input, n);
                size_t detach = keys.find(m_detachKey);
                if (detach != std::string::npos) {
                    keys.resize(detach);
                    attached = false;
                }
                if (!keys.empty()) {
                    Send(keys);
                }
            }
        }

        std::string output;
        ChannelReadStatus status = ReadSome(output, std::chrono::milliseconds{attached ? 20 : 0});
        if (status == CHANNEL_READ_CLOSED) {
            throw ChannelClosedException(m_name + ": channel closed during interactive session");
        }
        if (status == CHANNEL_READ_DATA && !WriteAll(outFd, output)) {
            log(CONCH_LOG_LEVEL_WARNING) << "Failed to write console output to terminal" << endLog;
        }
    }

    // Whatever already arrived belongs to the operator, not to the next reader
    for (;;) {
        std::string output;
        ChannelReadStatus status = ReadSome(output, std::chrono::milliseconds{0});
        if (status == CHANNEL_READ_CLOSED) {
            throw ChannelClosedException(m_name + ": channel closed during interactive session");
        }
        if (status != CHANNEL_READ_DATA) {
            break;
        }
        if (!WriteAll(outFd, output)) {
            log(CONCH_LOG_LEVEL_WARNING) << "Failed to write console output to terminal" << endLog;
        }
    }

    log(CONCH_LOG_LEVEL_INFO) << m_name << ": detached interactive session" << endLog;
}
