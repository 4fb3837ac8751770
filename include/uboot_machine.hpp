// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Synaptics Incorporated

#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "board.hpp"
#include "channel.hpp"
#include "console_log.hpp"
#include "shell_arg.hpp"

enum UBootState {
    UBOOT_STATE_AWAIT_AUTOBOOT,
    UBOOT_STATE_INTERRUPT_SENT,
    UBOOT_STATE_AWAIT_STEADY_PROMPT,
    UBOOT_STATE_READY,
    UBOOT_STATE_INTERACTIVE,
    UBOOT_STATE_DESYNCHRONIZED,
    UBOOT_STATE_CLOSED,
};

struct UBootConfig
{
    // Prompt U-Boot was built with (CONFIG_SYS_PROMPT), matched literally.
    std::string prompt = "U-Boot> ";
    // Regular expression of the autoboot countdown. Unset when the board does
    // not autoboot.
    std::optional<std::string> autobootPrompt = std::string{R"(Hit any key to stop autoboot:\s+\d+\s+)"};
    std::string autobootKeys = "\n";
    std::chrono::milliseconds bootTimeout{60000};
    std::chrono::milliseconds commandTimeout{30000};
    std::chrono::milliseconds reacquireTimeout{500};
    // Quiet time after the prompt before it is trusted, see
    // Channel::SetPromptSettleTime().
    std::chrono::milliseconds promptSettleTime{20};
    std::string statusCommand = "echo $?";
    std::filesystem::path pathRoot = "/tftpboot";
};

struct CommandResult
{
    int m_returnCode;
    std::string m_output;
};

// Drives the U-Boot shell on a board console.
//
// Construction intercepts autoboot and waits for the steady prompt; a machine
// that was constructed is synchronized. Every command is followed by a status
// query (UBootConfig::statusCommand) so the return code belongs to the command
// itself. A timeout or a closed console in the middle of a command leaves the
// machine desynchronized and all further commands fail.
class UBootMachine
{
public:
    UBootMachine(Board &board, const UBootConfig &config = UBootConfig{}, ConsoleSink *sink = nullptr);
    UBootMachine(Channel &channel, const std::string &boardName, const UBootConfig &config = UBootConfig{},
        ConsoleSink *sink = nullptr);
    ~UBootMachine();

    template<typename... Args>
    std::string BuildCommand(Args&&... args) const
    {
        return BuildCommandArgs({ShellArg(std::forward<Args>(args))...});
    }

    template<typename... Args>
    CommandResult Exec(Args&&... args)
    {
        return ExecArgs({ShellArg(std::forward<Args>(args))...});
    }

    // Throws CommandFailedException on a non-zero return code.
    template<typename... Args>
    std::string Exec0(Args&&... args)
    {
        return Exec0Args({ShellArg(std::forward<Args>(args))...});
    }

    template<typename... Args>
    bool Test(Args&&... args)
    {
        return TestArgs({ShellArg(std::forward<Args>(args))...});
    }

    std::string BuildCommandArgs(const std::vector<ShellArg> &args) const;
    CommandResult ExecArgs(const std::vector<ShellArg> &args);
    std::string Exec0Args(const std::vector<ShellArg> &args);
    bool TestArgs(const std::vector<ShellArg> &args);

    // Value of a U-Boot environment variable, without the trailing newline.
    std::string Env(const std::string &name);

    // Hands the console to the terminal until the operator detaches (CTRL+D)
    // and then looks for the prompt again. Throws
    // InteractiveReacquireException if it does not show up within
    // UBootConfig::reacquireTimeout.
    void Interactive(int inFd = STDIN_FILENO, int outFd = STDOUT_FILENO);

    // Console output from the start of the session up to the first steady
    // prompt, without its first line.
    const std::string &GetBootLog() const;
    const std::string &GetName() const;
    UBootState GetState() const;
    const UBootConfig &GetConfig() const;

    // Closes the console. The machine cannot be used afterwards.
    void Destroy();

    static const std::string UBootStateToString(UBootState state);

private:
    class UBootMachineImpl;
    std::unique_ptr<UBootMachineImpl> pImpl;
};
