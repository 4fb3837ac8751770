// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Synaptics Incorporated

#pragma once

#include <algorithm>
#include <cctype>
#include <functional>
#include <map>
#include <string>
#include <vector>

#include "fake_channel.hpp"

// Minimal U-Boot shell on top of a FakeChannel: echoes input lines with CRLF,
// runs a few commands and prints the prompt after each one.
//
// Supported: echo, true, false, ret <n>, setenv, printenv, hang (never
// returns), reset (drops the connection) and empty lines. "$?", "$NAME" and
// "${NAME}" expand outside single quotes.
class UBootEmulator
{
public:
    UBootEmulator(FakeChannel &channel, const std::string &prompt = "=> ") : m_channel{channel}, m_prompt{prompt}
    {
        m_channel.SetResponder([this](const std::string &data) { Receive(data); });
    }

    // Until the shell is started, input is swallowed without any response.
    void Start() { m_running = true; }
    void Stop() { m_running = false; }

    // Answer the first key with a fresh prompt, like an interrupted countdown.
    void InterceptAutoboot() { m_autoboot = true; }

    // Deliver responses in pieces of at most chunkSize bytes.
    void SetChunkSize(size_t chunkSize) { m_chunkSize = chunkSize; }

    void SetEnv(const std::string &name, const std::string &value) { m_env[name] = value; }

    const std::vector<std::string> &GetCommands() const { return m_commands; }

private:
    FakeChannel &m_channel;
    std::string m_prompt;
    bool m_running = false;
    bool m_autoboot = false;
    size_t m_chunkSize = 0;
    std::string m_line;
    int m_status = 0;
    std::map<std::string, std::string> m_env;
    std::vector<std::string> m_commands;

    void Receive(const std::string &data)
    {
        if (m_autoboot) {
            m_autoboot = false;
            m_running = true;
            Respond("\r\n" + m_prompt);
            return;
        }

        if (!m_running) {
            return;
        }

        for (char c : data) {
            if (c != '\n') {
                m_line += c;
                continue;
            }

            std::string line;
            line.swap(m_line);
            Execute(line);
        }
    }

    void Respond(const std::string &text)
    {
        if (m_chunkSize == 0) {
            m_channel.Feed(text);
            return;
        }

        for (size_t i = 0; i < text.size(); i += m_chunkSize) {
            m_channel.Feed(text.substr(i, m_chunkSize));
        }
    }

    void Execute(const std::string &line)
    {
        m_commands.push_back(line);

        std::string response = line + "\r\n";
        std::vector<std::string> args = Split(line);

        if (args.empty()) {
            Respond(response + m_prompt);
            return;
        }

        const std::string &command = args[0];
        int status = 0;
        if (command == "echo") {
            std::string text;
            for (size_t i = 1; i < args.size(); ++i) {
                text += (i > 1 ? " " : "") + args[i];
            }
            response += text + "\r\n";
        } else if (command == "true") {
            status = 0;
        } else if (command == "false") {
            status = 1;
        } else if (command == "ret" && args.size() == 2) {
            status = std::stoi(args[1]);
        } else if (command == "setenv" && args.size() >= 2) {
            std::string value;
            for (size_t i = 2; i < args.size(); ++i) {
                value += (i > 2 ? " " : "") + args[i];
            }
            m_env[args[1]] = value;
        } else if (command == "printenv" && args.size() == 2) {
            auto it = m_env.find(args[1]);
            if (it == m_env.end()) {
                response += "## Error: \"" + args[1] + "\" not defined\r\n";
                status = 1;
            } else {
                response += args[1] + "=" + it->second + "\r\n";
            }
        } else if (command == "hang") {
            m_channel.Feed(response);
            return;
        } else if (command == "reset") {
            m_channel.Feed(response + "resetting ...\r\n");
            m_channel.FeedEof();
            return;
        } else {
            response += "Unknown command '" + command + "' - try 'help'\r\n";
            status = 1;
        }

        m_status = status;
        Respond(response + m_prompt);
    }

    std::string Expand(const std::string &text, size_t &pos)
    {
        // text[pos] is '$'
        if (pos + 1 < text.size() && text[pos + 1] == '?') {
            pos += 2;
            return std::to_string(m_status);
        }

        std::string name;
        if (pos + 1 < text.size() && text[pos + 1] == '{') {
            size_t close = text.find('}', pos + 2);
            if (close == std::string::npos) {
                ++pos;
                return "$";
            }
            name = text.substr(pos + 2, close - pos - 2);
            pos = close + 1;
        } else {
            size_t end = pos + 1;
            while (end < text.size() && (std::isalnum(static_cast<unsigned char>(text[end])) || text[end] == '_')) {
                ++end;
            }
            if (end == pos + 1) {
                ++pos;
                return "$";
            }
            name = text.substr(pos + 1, end - pos - 1);
            pos = end;
        }

        auto it = m_env.find(name);
        return it == m_env.end() ? "" : it->second;
    }

    std::vector<std::string> Split(const std::string &line)
    {
        std::vector<std::string> args;
        std::string current;
        bool inArg = false;
        size_t pos = 0;

        while (pos < line.size()) {
            char c = line[pos];
            if (c == ' ' || c == '\t') {
                if (inArg) {
                    args.push_back(current);
                    current.clear();
                    inArg = false;
                }
                ++pos;
            } else if (c == '\'') {
                size_t close = line.find('\'', pos + 1);
                if (close == std::string::npos) {
                    close = line.size();
                }
                current += line.substr(pos + 1, close - pos - 1);
                inArg = true;
                pos = close + 1;
            } else if (c == '"') {
                ++pos;
                while (pos < line.size() && line[pos] != '"') {
                    if (line[pos] == '$') {
                        current += Expand(line, pos);
                    } else {
                        current += line[pos++];
                    }
                }
                ++pos;
                inArg = true;
            } else if (c == '$') {
                current += Expand(line, pos);
                inArg = true;
            } else {
                current += c;
                inArg = true;
                ++pos;
            }
        }

        if (inArg) {
            args.push_back(current);
        }

        return args;
    }
};
