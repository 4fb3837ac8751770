// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Synaptics Incorporated

#include "conch_log.hpp"
#include <iostream>
#include <mutex>
#include <chrono>
#include <ctime>
#include <stdexcept>

std::unique_ptr<ConchLogStore> ConchLogStore::instance;
std::once_flag ConchLogStore::initInstanceFlag;

namespace {

thread_local std::string logContext;

}

ConchLog::ConchLog(const std::string &funcName) : m_funcName{funcName}, m_logLevel{CONCH_LOG_LEVEL_NONE}
{
    ConchLogStore::getInstance().Log(CONCH_LOG_LEVEL_TRACE, m_funcName, "-> Entering");
}

ConchLog::~ConchLog()
{
    ConchLogStore::getInstance().Log(CONCH_LOG_LEVEL_TRACE, m_funcName, "<- Exiting");
}

ConchLog & ConchLog::operator()(ConchLogLevel level) {
    m_logLevel = level;
    return *this;
}

ConchLog & ConchLog::operator<<(const char *str) {
    m_os << str;
    return *this;
}

ConchLog & ConchLog::operator<<(const std::string &str) {
    m_os << str;
    return *this;
}

ConchLog & ConchLog::operator<<(int val) {
    m_os << val;
    return *this;
}

ConchLog & ConchLog::operator<<(unsigned int val) {
    m_os << val;
    return *this;
}

ConchLog & endLog(ConchLog &log) {
    ConchLogStore::getInstance().Log(log.m_logLevel, log.m_funcName, log.m_os.str());
    log.m_os.str("");
    log.m_os.clear();
    log.m_os.flags(std::ios_base::fmtflags{});
    log.m_os.fill(' ');
    return log;
}

ConchLog & operator<<(ConchLog &log, ConchLog &(*finalizeLog)(ConchLog &)) {
    return finalizeLog(log);
}

ConchLogLevel ConchLog::StringToLevel(const std::string &level) {
    if (level == "NONE") return CONCH_LOG_LEVEL_NONE;
    if (level == "TRACE") return CONCH_LOG_LEVEL_TRACE;
    if (level == "DEBUG") return CONCH_LOG_LEVEL_DEBUG;
    if (level == "INFO") return CONCH_LOG_LEVEL_INFO;
    if (level == "WARNING") return CONCH_LOG_LEVEL_WARNING;
    if (level == "ERROR") return CONCH_LOG_LEVEL_ERROR;
    throw std::invalid_argument("Unknown log level: " + level);
}

std::string ConchLog::LevelToString(ConchLogLevel level) {
    switch (level) {
        case CONCH_LOG_LEVEL_NONE: return "NONE";
        case CONCH_LOG_LEVEL_TRACE: return "TRACE";
        case CONCH_LOG_LEVEL_DEBUG: return "DEBUG";
        case CONCH_LOG_LEVEL_INFO: return "INFO";
        case CONCH_LOG_LEVEL_WARNING: return "WARNING";
        case CONCH_LOG_LEVEL_ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

std::string ConchLog::FormatLog(ConchLogLevel logLevel, const std::string &source, const std::string &message) {
    std::ostringstream os;
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&t, &tm);

    auto us = std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()) % 1000000;

    os << std::put_time(&tm, "[%H:%M:%S");
    os << '.' << std::setw(6) << std::setfill('0') << us.count() << "]";

    std::string levelString = "[" + ConchLog::LevelToString(logLevel) + "]";
    os << std::setfill(' ') << std::setw(10) << std::left << levelString;

    const std::string &context = ConchLogContext::Current();
    if (!context.empty()) {
        os << "[" << context << "] ";
    }

    os << source << ": " << message;
    return os.str();
}

ConchLogContext::ConchLogContext(const std::string &context) : m_previous{logContext}
{
    logContext = context;
}

ConchLogContext::~ConchLogContext()
{
    logContext = m_previous;
}

const std::string &ConchLogContext::Current()
{
    return logContext;
}

ConchLogStore::ConchLogStore() {}

ConchLogStore::~ConchLogStore() {
    Close();
}

ConchLogStore& ConchLogStore::getInstance() {
    std::call_once(initInstanceFlag, []() {
        instance.reset(new ConchLogStore);
    });
    return *instance;
}

void ConchLogStore::Open(const std::string &logPath, ConchLogLevel minLogLevel) {
    std::lock_guard<std::mutex> lock(m_logMutex);

    m_logStream.reset();
    if (m_logFile.is_open()) {
        m_logFile.close();
    }

    if (logPath == "" || logPath == "stdout") {
        m_logStream = std::make_unique<std::ostream>(std::cout.rdbuf());
    } else if (logPath == "stderr") {
        m_logStream = std::make_unique<std::ostream>(std::cerr.rdbuf());
    } else {
        m_logFile.open(logPath, std::ios::out | std::ios::trunc);
        if (!m_logFile.is_open()) {
            throw std::runtime_error("Failed to open log file " + logPath);
        }
        m_logStream = std::make_unique<std::ostream>(m_logFile.rdbuf());
    }

    m_minLogLevel = minLogLevel;
}

void ConchLogStore::Close() {
    std::lock_guard<std::mutex> lock(m_logMutex);

    m_logStream.reset();
    if (m_logFile.is_open()) {
        m_logFile.close();
    }
}

bool ConchLogStore::IsEnabled(ConchLogLevel level) const {
    std::lock_guard<std::mutex> lock(m_logMutex);

    return m_logStream && level != CONCH_LOG_LEVEL_NONE && level >= m_minLogLevel;
}

ConchLogLevel ConchLogStore::GetMinLogLevel() const {
    std::lock_guard<std::mutex> lock(m_logMutex);

    return m_minLogLevel;
}

void ConchLogStore::SetMinLogLevel(ConchLogLevel minLogLevel) {
    std::lock_guard<std::mutex> lock(m_logMutex);

    m_minLogLevel = minLogLevel;
}

void ConchLogStore::Log(ConchLogLevel level, const std::string &source, const std::string &message) {
    // Formatting is the expensive part, skip it for filtered levels
    if (!IsEnabled(level)) {
        return;
    }

    std::string formatted;
    size_t start = 0;
    for (;;) {
        size_t newline = message.find('\n', start);
        std::string line = message.substr(start, newline == std::string::npos ? std::string::npos : newline - start);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        formatted += ConchLog::FormatLog(level, source, line) + "\n";

        if (newline == std::string::npos || newline + 1 == message.size()) {
            break;
        }
        start = newline + 1;
    }

    std::lock_guard<std::mutex> lock(m_logMutex);

    if (m_logStream) {
        *m_logStream << formatted;
        m_logStream->flush();
    }
}
