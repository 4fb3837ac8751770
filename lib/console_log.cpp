// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Synaptics Incorporated

#include <algorithm>

#include "console_log.hpp"
#include "conch_log.hpp"

ConsoleLog::ConsoleLog(const std::string &name, const std::string &logPath) : m_name{name}
{
    CONCH_LOG;

    if (!logPath.empty()) {
        std::string logFile = logPath + "/console.log";
        m_consoleLog = std::ofstream(logFile, std::ios::out | std::ios::app);
        if (!m_consoleLog) {
            log(CONCH_LOG_LEVEL_WARNING) << "Failed to open " << logFile << ", console is only logged" << endLog;
        }
    }
}

ConsoleLog::~ConsoleLog()
{
    CONCH_LOG;

    Flush();
}

void ConsoleLog::Write(const std::string &data)
{
    std::lock_guard<std::mutex> lock(m_writeMutex);

    if (m_consoleLog.is_open()) {
        m_consoleLog << data;
        m_consoleLog.flush();
    }

    m_partialLine += data;

    size_t newline;
    while ((newline = m_partialLine.find('\n')) != std::string::npos) {
        EmitLine(m_partialLine.substr(0, newline));
        m_partialLine.erase(0, newline + 1);
    }
}

void ConsoleLog::SetPrefix(const std::string &prefix)
{
    Flush();

    std::lock_guard<std::mutex> lock(m_writeMutex);
    m_prefix = prefix;
}

void ConsoleLog::Flush()
{
    std::lock_guard<std::mutex> lock(m_writeMutex);

    if (!m_partialLine.empty()) {
        EmitLine(m_partialLine);
        m_partialLine.clear();
    }
}

void ConsoleLog::EmitLine(const std::string &line)
{
    std::string cleanLine = line;
    cleanLine.erase(std::remove(cleanLine.begin(), cleanLine.end(), '\r'), cleanLine.end());

    ConchLogStore::getInstance().Log(CONCH_LOG_LEVEL_INFO, m_name, m_prefix + cleanLine);
}
