// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Synaptics Incorporated

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

#include "fd_channel.hpp"
#include "conch_log.hpp"

FdChannel::FdChannel(const std::string &name) : Channel{name}
{
    CONCH_LOG;

    if (pipe(m_wakePipe) < 0) {
        throw std::runtime_error("Failed to create wake pipe: " + std::string(std::strerror(errno)));
    }
    fcntl(m_wakePipe[0], F_SETFL, O_NONBLOCK);
    fcntl(m_wakePipe[1], F_SETFL, O_NONBLOCK);
}

FdChannel::~FdChannel()
{
    CONCH_LOG;

    if (m_fd >= 0) {
        close(m_fd);
        m_fd = -1;
    }

    for (int &fd : m_wakePipe) {
        if (fd >= 0) {
            close(fd);
            fd = -1;
        }
    }
}

int FdChannel::SetFd(int fd)
{
    CONCH_LOG;

    int flags = fcntl(fd, F_GETFL);
    if (flags < 0 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
        log(CONCH_LOG_LEVEL_ERROR) << "Failed to set O_NONBLOCK: " << std::strerror(errno) << endLog;
        return -1;
    }

    m_fd = fd;
    return 0;
}

int FdChannel::WriteRaw(const uint8_t *data, size_t size)
{
    CONCH_LOG;

    for (;;) {
        ssize_t n = write(m_fd, data, size);
        if (n >= 0) {
            return static_cast<int>(n);
        }

        if (errno == EINTR) {
            continue;
        }

        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            pollfd pfd{m_fd, POLLOUT, 0};
            if (poll(&pfd, 1, 1000) <= 0) {
                log(CONCH_LOG_LEVEL_ERROR) << "Transport not writable" << endLog;
                return -1;
            }
            continue;
        }

        log(CONCH_LOG_LEVEL_ERROR) << "write failed: " << std::strerror(errno) << endLog;
        return -1;
    }
}

ChannelReadStatus FdChannel::ReadRaw(std::string &data, std::chrono::milliseconds timeout)
{
    CONCH_LOG;

    const auto deadline = std::chrono::steady_clock::now() + timeout;

    for (;;) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        int timeoutMs = remaining.count() < 0 ? 0 : static_cast<int>(remaining.count());

        pollfd fds[2] = {
            {m_fd, POLLIN, 0},
            {m_wakePipe[0], POLLIN, 0},
        };

        int ret = poll(fds, 2, timeoutMs);
        if (ret < 0) {
            if (errno == EINTR) {
                continue;
            }
            log(CONCH_LOG_LEVEL_ERROR) << "poll failed: " << std::strerror(errno) << endLog;
            return CHANNEL_READ_CLOSED;
        }

        if (ret == 0) {
            return CHANNEL_READ_TIMEOUT;
        }

        if (fds[1].revents & POLLIN) {
            log(CONCH_LOG_LEVEL_DEBUG) << "Woken up by close" << endLog;
            return CHANNEL_READ_CLOSED;
        }

        if (fds[0].revents & (POLLIN | POLLHUP | POLLERR)) {
            char buf[m_readSize];
            ssize_t n = read(m_fd, buf, sizeof(buf));
            if (n > 0) {
                data.assign(buf, n);
                return CHANNEL_READ_DATA;
            }

            if (n < 0 && (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK)) {
                continue;
            }

            // EOF, or EIO on a pty whose other side went away
            log(CONCH_LOG_LEVEL_DEBUG) << "read returned " << static_cast<int>(n)
                << (n < 0 ? std::string(": ") + std::strerror(errno) : std::string()) << endLog;
            return CHANNEL_READ_CLOSED;
        }

        if (fds[0].revents & POLLNVAL) {
            return CHANNEL_READ_CLOSED;
        }
    }
}

void FdChannel::WakeUp()
{
    const char wake = 'w';
    if (write(m_wakePipe[1], &wake, 1) < 0 && errno != EAGAIN) {
        CONCH_LOG;
        log(CONCH_LOG_LEVEL_WARNING) << "Failed to signal wake pipe: " << std::strerror(errno) << endLog;
    }
}

void FdChannel::CloseTransport()
{
    CONCH_LOG;

    if (m_fd >= 0) {
        close(m_fd);
        m_fd = -1;
    }

    ReleaseTransport();
}
