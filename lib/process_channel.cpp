// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Synaptics Incorporated

#include <cerrno>
#include <csignal>
#include <cstring>
#include <chrono>
#include <pty.h>
#include <stdexcept>
#include <sys/wait.h>
#include <termios.h>
#include <thread>
#include <unistd.h>

#include "process_channel.hpp"
#include "conch_log.hpp"

ProcessChannel::ProcessChannel(const std::string &name, const std::string &command, const std::string &initScript)
    : FdChannel{name}, m_command{command}
{
    CONCH_LOG;

    Spawn();

    if (!initScript.empty()) {
        log(CONCH_LOG_LEVEL_DEBUG) << "Sending init script (" << static_cast<int>(initScript.size()) << " bytes)" << endLog;
        try {
            Send(initScript);
        } catch (const std::exception &e) {
            // The destructor does not run for a half constructed channel
            log(CONCH_LOG_LEVEL_ERROR) << "Init script for '" << m_command << "' failed: " << e.what() << endLog;
            Close();
            throw;
        }
    }
}

ProcessChannel::~ProcessChannel()
{
    CONCH_LOG;

    Close();
}

void ProcessChannel::Spawn()
{
    CONCH_LOG;

    struct winsize ws{};
    ws.ws_row = 24;
    ws.ws_col = 200;

    int master = -1;
    pid_t pid = forkpty(&master, nullptr, nullptr, &ws);
    if (pid < 0) {
        log(CONCH_LOG_LEVEL_ERROR) << "forkpty failed: " << std::strerror(errno) << endLog;
        throw std::runtime_error("Failed to spawn '" + m_command + "': " + std::strerror(errno));
    }

    if (pid == 0) {
        setenv("TERM", "dumb", 1);
        execl("/bin/sh", "sh", "-c", m_command.c_str(), static_cast<char *>(nullptr));
        _exit(127);
    }

    m_pid = pid;
    log(CONCH_LOG_LEVEL_INFO) << "Spawned '" << m_command << "' pid: " << static_cast<int>(m_pid) << endLog;

    if (SetFd(master) < 0) {
        close(master);
        Reap();
        throw std::runtime_error("Failed to configure pty for '" + m_command + "'");
    }
}

void ProcessChannel::ReleaseTransport()
{
    CONCH_LOG;

    Reap();
}

void ProcessChannel::Reap()
{
    CONCH_LOG;

    if (m_pid <= 0) {
        return;
    }

    // Closing the master hangs up the child; give it a moment before killing it.
    kill(m_pid, SIGHUP);

    int status = 0;
    for (int i = 0; i < 50; ++i) {
        pid_t ret = waitpid(m_pid, &status, WNOHANG);
        if (ret == m_pid || (ret < 0 && errno == ECHILD)) {
            log(CONCH_LOG_LEVEL_DEBUG) << "Child " << static_cast<int>(m_pid) << " exited" << endLog;
            m_pid = -1;
            return;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    log(CONCH_LOG_LEVEL_WARNING) << "Child " << static_cast<int>(m_pid) << " did not exit, killing it" << endLog;
    kill(m_pid, SIGKILL);
    waitpid(m_pid, &status, 0);
    m_pid = -1;
}
