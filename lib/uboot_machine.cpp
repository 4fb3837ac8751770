// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Synaptics Incorporated

#include <cctype>
#include <stdexcept>

#include "uboot_machine.hpp"
#include "pattern.hpp"
#include "utils.hpp"
#include "conch_log.hpp"

class UBootMachine::UBootMachineImpl {
public:
    UBootMachineImpl(Channel &channel, const std::string &boardName, const UBootConfig &config, ConsoleSink *sink)
        : m_channel{channel}, m_name{boardName + "-uboot"}, m_config{config}, m_sink{sink},
        m_prompt{Pattern::Literal(config.prompt)}
    {
        CONCH_LOG;

        m_channel.SetPromptSettleTime(m_config.promptSettleTime);
        Boot();
    }

    ~UBootMachineImpl()
    {
        CONCH_LOG;
    }

    std::string BuildCommandArgs(const std::vector<ShellArg> &args) const
    {
        return BuildShellCommand(args, m_config.pathRoot);
    }

    CommandResult ExecArgs(const std::vector<ShellArg> &args)
    {
        CONCH_LOG;
        ConchLogContext logContext(m_name);

        std::string command = BuildCommandArgs(args);
        CheckReady(command);

        log(CONCH_LOG_LEVEL_INFO) << m_name << " $ " << command << endLog;
        if (m_sink) {
            m_sink->SetPrefix("   >> ");
        }

        CommandResult result{-1, ""};
        try {
            result.m_output = RunRaw(command);

            std::string status = RunRaw(m_config.statusCommand);
            if (!ParseReturnCode(status, result.m_returnCode)) {
                m_state = UBOOT_STATE_DESYNCHRONIZED;
                log(CONCH_LOG_LEVEL_ERROR) << m_name << ": unexpected status output '" << status << "'" << endLog;
                throw std::runtime_error(m_name + ": could not read the return code of \"" + command + "\"");
            }
        } catch (const TimeoutException &e) {
            m_state = UBOOT_STATE_DESYNCHRONIZED;
            log(CONCH_LOG_LEVEL_ERROR) << m_name << ": \"" << command << "\" timed out: " << e.what() << endLog;
            throw;
        } catch (const ChannelClosedException &e) {
            m_state = UBOOT_STATE_DESYNCHRONIZED;
            log(CONCH_LOG_LEVEL_ERROR) << m_name << ": console closed during \"" << command << "\"" << endLog;
            throw;
        }

        log(CONCH_LOG_LEVEL_DEBUG) << m_name << ": \"" << command << "\" returned " << result.m_returnCode << endLog;

        return result;
    }

    std::string Exec0Args(const std::vector<ShellArg> &args)
    {
        CONCH_LOG;

        CommandResult result = ExecArgs(args);
        if (result.m_returnCode != 0) {
            std::string command = BuildCommandArgs(args);
            log(CONCH_LOG_LEVEL_ERROR) << m_name << ": \"" << command << "\" failed with " << result.m_returnCode << endLog;
            throw CommandFailedException(m_name, command, result.m_output);
        }

        return result.m_output;
    }

    bool TestArgs(const std::vector<ShellArg> &args)
    {
        return ExecArgs(args).m_returnCode == 0;
    }

    std::string Env(const std::string &name)
    {
        CONCH_LOG;

        std::string value = Exec0Args({"echo", ShellArg::Env(name)});
        if (!value.empty() && value.back() == '\n') {
            value.pop_back();
        }

        return value;
    }

    void Interactive(int inFd, int outFd)
    {
        CONCH_LOG;
        ConchLogContext logContext(m_name);

        CheckReady("interactive session");

        log(CONCH_LOG_LEVEL_INFO) << "Entering interactive shell (CTRL+D to exit) ..." << endLog;
        m_state = UBOOT_STATE_INTERACTIVE;

        try {
            m_channel.Send(" \n");
            m_channel.AttachInteractive(inFd, outFd);
            m_channel.Send(" \n");
            m_channel.ReadUntilPrompt(m_prompt, m_config.reacquireTimeout, m_sink);
        } catch (const TimeoutException &e) {
            m_state = UBOOT_STATE_DESYNCHRONIZED;
            log(CONCH_LOG_LEVEL_ERROR) << m_name << ": prompt did not come back: " << e.what() << endLog;
            throw InteractiveReacquireException("Failed to reacquire U-Boot after interactive session on " + m_name);
        } catch (const ChannelClosedException &e) {
            m_state = UBOOT_STATE_DESYNCHRONIZED;
            log(CONCH_LOG_LEVEL_ERROR) << m_name << ": console closed during interactive session" << endLog;
            throw;
        }

        m_state = UBOOT_STATE_READY;
        log(CONCH_LOG_LEVEL_INFO) << "Exiting interactive shell ..." << endLog;
    }

    void Destroy()
    {
        CONCH_LOG;

        m_channel.Close();
        m_state = UBOOT_STATE_CLOSED;
    }

    const std::string &GetBootLog() const { return m_bootLog; }
    const std::string &GetName() const { return m_name; }
    UBootState GetState() const { return m_state; }
    const UBootConfig &GetConfig() const { return m_config; }

private:
    Channel &m_channel;
    std::string m_name;
    UBootConfig m_config;
    ConsoleSink *m_sink;
    Pattern m_prompt;
    UBootState m_state = UBOOT_STATE_AWAIT_STEADY_PROMPT;
    std::string m_bootLog;

    void Boot()
    {
        CONCH_LOG;
        ConchLogContext logContext(m_name);

        if (m_sink) {
            m_sink->SetPrefix("   <> ");
        }

        std::string bootLog;
        try {
            if (m_config.autobootPrompt) {
                m_state = UBOOT_STATE_AWAIT_AUTOBOOT;
                bootLog = m_channel.ReadUntilPrompt(Pattern::Regex(*m_config.autobootPrompt),
                    m_config.bootTimeout, m_sink);
                log(CONCH_LOG_LEVEL_DEBUG) << m_name << ": intercepting autoboot" << endLog;

                m_channel.Send(m_config.autobootKeys);
                m_state = UBOOT_STATE_INTERRUPT_SENT;
            }

            m_state = UBOOT_STATE_AWAIT_STEADY_PROMPT;
            bootLog += m_channel.ReadUntilPrompt(m_prompt, m_config.bootTimeout, m_sink);
        } catch (const std::runtime_error &e) {
            log(CONCH_LOG_LEVEL_ERROR) << m_name << ": failed to reach the U-Boot prompt in state "
                << UBootStateToString(m_state) << ": " << e.what() << endLog;
            m_state = UBOOT_STATE_DESYNCHRONIZED;
            throw;
        }

        bootLog = StripCarriageReturns(bootLog);
        size_t firstNewline = bootLog.find('\n');
        m_bootLog = firstNewline == std::string::npos ? "" : bootLog.substr(firstNewline + 1);

        m_state = UBOOT_STATE_READY;
        log(CONCH_LOG_LEVEL_INFO) << m_name << ": U-Boot is ready" << endLog;
    }

    void CheckReady(const std::string &what) const
    {
        if (m_state != UBOOT_STATE_READY) {
            throw MachineStateException(m_name + ": cannot run " + what + " while "
                + UBootStateToString(m_state));
        }
    }

    // Sends one line and returns what the shell printed in response, without
    // the echo of the line itself and without the prompt.
    std::string RunRaw(const std::string &line)
    {
        CONCH_LOG;

        m_channel.Send(line + "\n");
        std::string output = m_channel.ReadUntilPrompt(m_prompt, m_config.commandTimeout, m_sink);

        output.resize(output.size() - m_config.prompt.size());
        output = StripCarriageReturns(output);

        size_t echoEnd = output.find('\n');
        if (echoEnd == std::string::npos) {
            return "";
        }

        return output.substr(echoEnd + 1);
    }

    static bool ParseReturnCode(const std::string &status, int &returnCode)
    {
        size_t start = 0;
        while (start < status.size() && std::isspace(static_cast<unsigned char>(status[start]))) {
            ++start;
        }
        size_t end = status.size();
        while (end > start && std::isspace(static_cast<unsigned char>(status[end - 1]))) {
            --end;
        }

        if (start == end || end - start > 9) {
            return false;
        }

        for (size_t i = start; i < end; ++i) {
            if (!std::isdigit(static_cast<unsigned char>(status[i]))) {
                return false;
            }
        }

        returnCode = std::stoi(status.substr(start, end - start));
        return true;
    }
};

UBootMachine::UBootMachine(Board &board, const UBootConfig &config, ConsoleSink *sink)
    : pImpl{std::make_unique<UBootMachineImpl>(board.GetChannel(), board.GetName(), config, sink)}
{}

UBootMachine::UBootMachine(Channel &channel, const std::string &boardName, const UBootConfig &config, ConsoleSink *sink)
    : pImpl{std::make_unique<UBootMachineImpl>(channel, boardName, config, sink)}
{}

UBootMachine::~UBootMachine()
{}

std::string UBootMachine::BuildCommandArgs(const std::vector<ShellArg> &args) const
{
    return pImpl->BuildCommandArgs(args);
}

CommandResult UBootMachine::ExecArgs(const std::vector<ShellArg> &args)
{
    return pImpl->ExecArgs(args);
}

std::string UBootMachine::Exec0Args(const std::vector<ShellArg> &args)
{
    return pImpl->Exec0Args(args);
}

bool UBootMachine::TestArgs(const std::vector<ShellArg> &args)
{
    return pImpl->TestArgs(args);
}

std::string UBootMachine::Env(const std::string &name)
{
    return pImpl->Env(name);
}

void UBootMachine::Interactive(int inFd, int outFd)
{
    pImpl->Interactive(inFd, outFd);
}

const std::string &UBootMachine::GetBootLog() const
{
    return pImpl->GetBootLog();
}

const std::string &UBootMachine::GetName() const
{
    return pImpl->GetName();
}

UBootState UBootMachine::GetState() const
{
    return pImpl->GetState();
}

const UBootConfig &UBootMachine::GetConfig() const
{
    return pImpl->GetConfig();
}

void UBootMachine::Destroy()
{
    pImpl->Destroy();
}

const std::string UBootMachine::UBootStateToString(UBootState state)
{
    switch (state) {
        case UBOOT_STATE_AWAIT_AUTOBOOT:
            return "AWAIT_AUTOBOOT";
        case UBOOT_STATE_INTERRUPT_SENT:
            return "INTERRUPT_SENT";
        case UBOOT_STATE_AWAIT_STEADY_PROMPT:
            return "AWAIT_STEADY_PROMPT";
        case UBOOT_STATE_READY:
            return "READY";
        case UBOOT_STATE_INTERACTIVE:
            return "INTERACTIVE";
        case UBOOT_STATE_DESYNCHRONIZED:
            return "DESYNCHRONIZED";
        case UBOOT_STATE_CLOSED:
            return "CLOSED";
        default:
            return "UNKNOWN";
    }
}
