// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Synaptics Incorporated

#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include "channel.hpp"

// In-memory channel. Every Feed() is delivered as one transport read, Send()
// data is recorded and optionally handed to a responder.
class FakeChannel : public Channel
{
public:
    FakeChannel(const std::string &name = "fake") : Channel{name}
    {}

    ~FakeChannel()
    {
        Close();
    }

    void Feed(const std::string &data)
    {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_chunks.push_back(data);
        }
        m_cv.notify_all();
    }

    // The peer hangs up once the queued chunks are read.
    void FeedEof()
    {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_eof = true;
        }
        m_cv.notify_all();
    }

    std::string TakeSent()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::string sent;
        sent.swap(m_sent);
        return sent;
    }

    int GetCloseCount() const { return m_closeCount; }

    void SetResponder(std::function<void(const std::string &)> responder) { m_responder = responder; }
    void SetOnClose(std::function<void()> onClose) { m_onClose = onClose; }

protected:
    int WriteRaw(const uint8_t *data, size_t size) override
    {
        std::string chunk(reinterpret_cast<const char *>(data), size);
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_sent += chunk;
        }
        if (m_responder) {
            m_responder(chunk);
        }
        return static_cast<int>(size);
    }

    ChannelReadStatus ReadRaw(std::string &data, std::chrono::milliseconds timeout) override
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_cv.wait_for(lock, timeout, [this] { return !m_chunks.empty() || m_eof || m_woken; });

        if (!m_chunks.empty()) {
            data += m_chunks.front();
            m_chunks.pop_front();
            return CHANNEL_READ_DATA;
        }

        if (m_eof || m_woken) {
            return CHANNEL_READ_CLOSED;
        }

        return CHANNEL_READ_TIMEOUT;
    }

    void CloseTransport() override
    {
        ++m_closeCount;
        if (m_onClose) {
            m_onClose();
        }
    }

    void WakeUp() override
    {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_woken = true;
        }
        m_cv.notify_all();
    }

private:
    std::mutex m_mutex;
    std::condition_variable m_cv;
    std::deque<std::string> m_chunks;
    std::string m_sent;
    bool m_eof = false;
    bool m_woken = false;
    int m_closeCount = 0;
    std::function<void(const std::string &)> m_responder;
    std::function<void()> m_onClose;
};

// Records what a channel mirrors to its sink.
class RecordingSink : public ConsoleSink
{
public:
    void Write(const std::string &data) override
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_data += data;
    }

    void SetPrefix(const std::string &prefix) override
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_prefixes.push_back(prefix);
    }

    std::string GetData()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_data;
    }

    std::vector<std::string> GetPrefixes()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_prefixes;
    }

private:
    std::mutex m_mutex;
    std::string m_data;
    std::vector<std::string> m_prefixes;
};
