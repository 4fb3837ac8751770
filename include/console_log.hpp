// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Synaptics Incorporated

#pragma once

#include <string>
#include <fstream>
#include <mutex>

// Receives console bytes as they are read from a channel.
class ConsoleSink
{
public:
    virtual ~ConsoleSink()
    {}

    virtual void Write(const std::string &data) = 0;

    // Annotation for the lines that follow, e.g. "   >> " for command output.
    virtual void SetPrefix(const std::string &prefix)
    {}
};

// Writes the raw console stream to <logPath>/console.log and every complete
// line to the log store, annotated with the current prefix.
class ConsoleLog : public ConsoleSink
{
public:
    ConsoleLog(const std::string &name, const std::string &logPath = "");
    ~ConsoleLog();

    void Write(const std::string &data) override;

    // Emits the pending partial line, then switches to the new prefix.
    void SetPrefix(const std::string &prefix) override;
    void Flush();

    const std::string &GetName() const { return m_name; }

private:
    std::string m_name;
    std::string m_prefix;
    std::string m_partialLine;
    std::ofstream m_consoleLog;
    std::mutex m_writeMutex;

    void EmitLine(const std::string &line);
};
