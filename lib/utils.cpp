// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Synaptics Incorporated

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <string>
#include <sys/wait.h>
#include <unistd.h>

#include "utils.hpp"
#include "conch_log.hpp"

std::string MakeTempDirectory()
{
    char temp[] = "/tmp/conch-XXXXXX";
    if (mkdtemp(temp) == nullptr) {
        return "";
    }

    return std::string(temp);
}

int RunShellCommand(const std::string &command)
{
    CONCH_LOG;

    log(CONCH_LOG_LEVEL_DEBUG) << "Running: " << command << endLog;

    pid_t pid = fork();
    if (pid < 0) {
        log(CONCH_LOG_LEVEL_ERROR) << "fork failed: " << std::strerror(errno) << endLog;
        return -1;
    }

    if (pid == 0) {
        execl("/bin/sh", "sh", "-c", command.c_str(), static_cast<char *>(nullptr));
        _exit(127);
    }

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            log(CONCH_LOG_LEVEL_ERROR) << "waitpid failed: " << std::strerror(errno) << endLog;
            return -1;
        }
    }

    if (WIFEXITED(status)) {
        log(CONCH_LOG_LEVEL_DEBUG) << "'" << command << "' exited with " << WEXITSTATUS(status) << endLog;
        return WEXITSTATUS(status);
    }

    log(CONCH_LOG_LEVEL_ERROR) << "'" << command << "' terminated by signal " << WTERMSIG(status) << endLog;
    return -1;
}

std::string StripCarriageReturns(const std::string &text)
{
    std::string stripped = text;
    stripped.erase(std::remove(stripped.begin(), stripped.end(), '\r'), stripped.end());
    return stripped;
}
