// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Synaptics Incorporated

#pragma once

#include <sstream>
#include <string>
#include <fstream>
#include <memory>
#include <mutex>
#include <iomanip>

enum ConchLogLevel {
    CONCH_LOG_LEVEL_TRACE,
    CONCH_LOG_LEVEL_DEBUG,
    CONCH_LOG_LEVEL_INFO,
    CONCH_LOG_LEVEL_WARNING,
    CONCH_LOG_LEVEL_ERROR,
    CONCH_LOG_LEVEL_NONE
};

// One function's log statements. Created by CONCH_LOG, which also traces entry
// and exit of the function. A statement is terminated with endLog:
//
//     log(CONCH_LOG_LEVEL_INFO) << "Opened " << device << endLog;
class ConchLog {
public:
    std::ostringstream m_os;
    std::string m_funcName;
    ConchLogLevel m_logLevel;

    ConchLog(const std::string &funcName);
    ~ConchLog();

    ConchLog & operator()(ConchLogLevel level);
    ConchLog & operator<<(const char *str);
    ConchLog & operator<<(const std::string &str);
    ConchLog & operator<<(int val);
    ConchLog & operator<<(unsigned int val);

    template <typename T>
    ConchLog & operator<<(T value) {
        m_os << value;
        return *this;
    }

    static ConchLogLevel StringToLevel(const std::string &level);
    static std::string LevelToString(ConchLogLevel level);

    // "[12:00:00.000000][INFO]   [board] source: message"; the board tag is
    // the calling thread's ConchLogContext and is left out when there is none.
    static std::string FormatLog(ConchLogLevel level, const std::string &source, const std::string &message);
};

ConchLog & endLog(ConchLog &log);
ConchLog & operator<<(ConchLog &log, ConchLog &(*finalizeLog)(ConchLog &));

// Tags every log line of the current thread with a board name while it is in
// scope. Contexts nest; the previous tag is restored on destruction.
class ConchLogContext {
public:
    ConchLogContext(const std::string &context);
    ~ConchLogContext();

    ConchLogContext(const ConchLogContext&) = delete;
    ConchLogContext& operator=(const ConchLogContext&) = delete;

    static const std::string &Current();

private:
    std::string m_previous;
};

class ConchLogStore {
public:
    static ConchLogStore& getInstance();

    // logPath "" or "stdout" logs to stdout, "stderr" to stderr, anything else
    // is truncated and used as the log file.
    void Open(const std::string &logPath, ConchLogLevel minLogLevel);
    void Close();

    bool IsEnabled(ConchLogLevel level) const;
    ConchLogLevel GetMinLogLevel() const;
    void SetMinLogLevel(ConchLogLevel minLogLevel);

    // Formats and writes message. Every line of a multi-line message gets its
    // own header so console output stays greppable.
    void Log(ConchLogLevel level, const std::string &source, const std::string &message);

    ~ConchLogStore();

private:
    ConchLogStore();
    ConchLogStore(const ConchLogStore&) = delete;
    ConchLogStore& operator=(const ConchLogStore&) = delete;

    std::unique_ptr<std::ostream> m_logStream;
    std::ofstream m_logFile;
    ConchLogLevel m_minLogLevel = CONCH_LOG_LEVEL_NONE;
    mutable std::mutex m_logMutex;
    static std::unique_ptr<ConchLogStore> instance;
    static std::once_flag initInstanceFlag;
};

#define CONCH_LOG ConchLog log(__FUNCTION__)
