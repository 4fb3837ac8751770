// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Synaptics Incorporated

#include <chrono>
#include <thread>
#include <unistd.h>
#include <gtest/gtest.h>

#include "fake_channel.hpp"

using namespace std::chrono_literals;

TEST(ChannelTest, RecvReturnsAvailableData)
{
    FakeChannel channel;
    channel.Feed("U-Boot 2020.01\r\n");

    EXPECT_EQ(channel.Recv(100ms), "U-Boot 2020.01\r\n");
}

TEST(ChannelTest, RecvTimesOutWithoutData)
{
    FakeChannel channel;

    auto start = std::chrono::steady_clock::now();
    EXPECT_THROW(channel.Recv(50ms), TimeoutException);
    EXPECT_GE(std::chrono::steady_clock::now() - start, 40ms);
    EXPECT_TRUE(channel.IsOpen());
}

TEST(ChannelTest, SendReachesTransport)
{
    FakeChannel channel;
    channel.Send("version\n");

    EXPECT_EQ(channel.TakeSent(), "version\n");
}

TEST(ChannelTest, PromptSplitAcrossReads)
{
    FakeChannel channel;
    channel.Feed("loading...\nU-Bo");
    channel.Feed("ot");
    channel.Feed("> ");

    EXPECT_EQ(channel.ReadUntilPrompt("U-Boot> ", 1s), "loading...\nU-Boot> ");
    EXPECT_EQ(channel.GetPendingSize(), 0u);
}

TEST(ChannelTest, BytesAfterPromptStayBuffered)
{
    FakeChannel channel;
    channel.Feed("Hit any key to stop autoboot:  3 \n=> ");

    EXPECT_EQ(channel.ReadUntilPrompt(Pattern::Regex(R"(autoboot:\s+\d+\s+)"), 1s),
        "Hit any key to stop autoboot:  3 \n");
    EXPECT_EQ(channel.GetPendingSize(), 3u);
    EXPECT_EQ(channel.Recv(10ms), "=> ");
}

TEST(ChannelTest, PromptFollowedByCompletedLineIsSkipped)
{
    FakeChannel channel;
    channel.Feed("a\n=> \r\nb\n=> ");

    EXPECT_EQ(channel.ReadUntilPrompt("=> ", 1s), "a\n=> \r\nb\n=> ");
    EXPECT_EQ(channel.GetPendingSize(), 0u);
}

TEST(ChannelTest, PromptAtChunkBoundaryWaitsForTheLineToSettle)
{
    FakeChannel channel;
    channel.Feed("abc\r\nresult: x => ");
    channel.Feed("y done\r\n=> ");

    EXPECT_EQ(channel.ReadUntilPrompt("=> ", 1s), "abc\r\nresult: x => y done\r\n=> ");
    EXPECT_EQ(channel.GetPendingSize(), 0u);
}

TEST(ChannelTest, PromptFollowedByTextInTheSameReadIsSkipped)
{
    FakeChannel channel;
    channel.Feed("abc\r\nresult: x => y");
    channel.Feed(" done\r\n=> ");

    EXPECT_EQ(channel.ReadUntilPrompt("=> ", 1s), "abc\r\nresult: x => y done\r\n=> ");
}

TEST(ChannelTest, QuietPromptIsAcceptedAfterSettleTime)
{
    FakeChannel channel;
    channel.SetPromptSettleTime(30ms);
    EXPECT_EQ(channel.GetPromptSettleTime(), 30ms);
    channel.Feed("version\r\n=> ");

    auto start = std::chrono::steady_clock::now();
    EXPECT_EQ(channel.ReadUntilPrompt("=> ", 1s), "version\r\n=> ");
    EXPECT_GE(std::chrono::steady_clock::now() - start, 25ms);
}

TEST(ChannelTest, PromptWithTextAfterItOnTheSameLineIsSkipped)
{
    FakeChannel channel;
    channel.Feed("a\n=> b\n=> ");

    EXPECT_EQ(channel.ReadUntilPrompt("=> ", 1s), "a\n=> b\n=> ");
}

TEST(ChannelTest, NoDataLostOnTimeout)
{
    FakeChannel channel;
    channel.Feed("partial ");
    channel.Feed("output");

    EXPECT_THROW(channel.ReadUntilPrompt("=> ", 50ms), TimeoutException);
    EXPECT_EQ(channel.GetPendingSize(), 14u);

    channel.Feed("\n=> ");
    EXPECT_EQ(channel.ReadUntilPrompt("=> ", 1s), "partial output\n=> ");
}

TEST(ChannelTest, RecvAfterTimeoutReturnsBufferedData)
{
    FakeChannel channel;
    channel.Feed("Hit any key");

    EXPECT_THROW(channel.ReadUntilPrompt("=> ", 20ms), TimeoutException);
    EXPECT_EQ(channel.Recv(10ms), "Hit any key");
}

TEST(ChannelTest, EarlierFalseMatchIsRejected)
{
    FakeChannel channel;
    channel.Feed("echo => not a prompt\nreal output\n=> ");

    EXPECT_EQ(channel.ReadUntilPrompt("=> ", 1s), "echo => not a prompt\nreal output\n=> ");
}

TEST(ChannelTest, RegexFalseMatchIsRejected)
{
    FakeChannel channel;
    channel.Feed("autoboot: 3 seconds remaining\n");
    channel.Feed("Hit any key to stop autoboot:  2 ");

    std::string log = channel.ReadUntilPrompt(Pattern::Regex(R"(autoboot:\s+\d+\s+)"), 1s);
    EXPECT_EQ(log, "autoboot: 3 seconds remaining\nHit any key to stop autoboot:  2 ");
}

TEST(ChannelTest, SinkSeesChunksAsTheyArrive)
{
    FakeChannel channel;
    RecordingSink sink;
    channel.Feed("first line\n");
    channel.Feed("second");

    EXPECT_THROW(channel.ReadUntilPrompt("=> ", 50ms, &sink), TimeoutException);
    EXPECT_EQ(sink.GetData(), "first line\nsecond");
}

TEST(ChannelTest, SinkStopsAtPrompt)
{
    FakeChannel channel;
    RecordingSink sink;
    channel.Feed("autoboot:  1 \nleftover");

    channel.ReadUntilPrompt(Pattern::Regex(R"(autoboot:\s+\d+\s+)"), 1s, &sink);
    EXPECT_EQ(sink.GetData(), "autoboot:  1 \n");

    channel.Feed(" => ");
    channel.ReadUntilPrompt("=> ", 1s, &sink);
    EXPECT_EQ(sink.GetData(), "autoboot:  1 \nleftover => ");
}

TEST(ChannelTest, SinkDoesNotRepeatDataKeptAcrossTimeout)
{
    FakeChannel channel;
    RecordingSink sink;
    channel.Feed("loading kernel\r\n");

    EXPECT_THROW(channel.ReadUntilPrompt("=> ", 50ms, &sink), TimeoutException);
    EXPECT_EQ(sink.GetData(), "loading kernel\r\n");

    channel.Feed("done\r\n=> ");
    EXPECT_EQ(channel.ReadUntilPrompt("=> ", 1s, &sink), "loading kernel\r\ndone\r\n=> ");
    EXPECT_EQ(sink.GetData(), "loading kernel\r\ndone\r\n=> ");
}

TEST(ChannelTest, PeerCloseIsSticky)
{
    FakeChannel channel;
    channel.Feed("bye\n");
    channel.FeedEof();

    EXPECT_EQ(channel.Recv(100ms), "bye\n");
    EXPECT_THROW(channel.Recv(100ms), ChannelClosedException);
    EXPECT_FALSE(channel.IsOpen());
    EXPECT_THROW(channel.Recv(100ms), ChannelClosedException);
    EXPECT_THROW(channel.Send("\n"), ChannelClosedException);
    EXPECT_THROW(channel.ReadUntilPrompt("=> ", 100ms), ChannelClosedException);
}

TEST(ChannelTest, CloseIsIdempotent)
{
    FakeChannel channel;

    channel.Close();
    channel.Close();

    EXPECT_FALSE(channel.IsOpen());
    EXPECT_EQ(channel.GetCloseCount(), 1);
    EXPECT_THROW(channel.Send("\n"), ChannelClosedException);
    EXPECT_THROW(channel.Recv(10ms), ChannelClosedException);
}

TEST(ChannelTest, ClosedChannelDropsBufferedData)
{
    FakeChannel channel;
    channel.Feed("output\nrest");
    EXPECT_THROW(channel.ReadUntilPrompt("=> ", 20ms), TimeoutException);
    ASSERT_GT(channel.GetPendingSize(), 0u);

    channel.Close();
    EXPECT_THROW(channel.Recv(10ms), ChannelClosedException);
}

TEST(ChannelTest, CloseFromAnotherThreadUnblocksRead)
{
    FakeChannel channel;

    std::thread closer([&channel] {
        std::this_thread::sleep_for(50ms);
        channel.Close();
    });

    auto start = std::chrono::steady_clock::now();
    EXPECT_THROW(channel.ReadUntilPrompt("=> ", 10s), ChannelClosedException);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);

    closer.join();
    EXPECT_FALSE(channel.IsOpen());
}

TEST(ChannelTest, AttachInteractiveRelaysUntilDetachKey)
{
    FakeChannel channel;
    channel.Feed("=> ");

    int input[2];
    int output[2];
    ASSERT_EQ(pipe(input), 0);
    ASSERT_EQ(pipe(output), 0);

    std::string keys = "printenv\n";
    keys += Channel::m_detachKey;
    ASSERT_EQ(write(input[1], keys.data(), keys.size()), static_cast<ssize_t>(keys.size()));

    channel.AttachInteractive(input[0], output[1]);

    EXPECT_EQ(channel.TakeSent(), "printenv\n");
    EXPECT_TRUE(channel.IsOpen());

    close(output[1]);
    char buffer[64];
    ssize_t n = read(output[0], buffer, sizeof(buffer));
    ASSERT_GT(n, 0);
    EXPECT_EQ(std::string(buffer, n), "=> ");

    close(input[0]);
    close(input[1]);
    close(output[0]);
}

TEST(ChannelTest, AttachInteractiveEndsOnEof)
{
    FakeChannel channel;

    int input[2];
    int output[2];
    ASSERT_EQ(pipe(input), 0);
    ASSERT_EQ(pipe(output), 0);

    ASSERT_EQ(write(input[1], "reset\n", 6), 6);
    close(input[1]);

    channel.AttachInteractive(input[0], output[1]);

    EXPECT_EQ(channel.TakeSent(), "reset\n");
    EXPECT_TRUE(channel.IsOpen());

    close(input[0]);
    close(output[0]);
    close(output[1]);
}
