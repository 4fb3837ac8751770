// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Synaptics Incorporated

#include <atomic>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <vector>
#include <cxxopts.hpp>
#include <indicators/cursor_control.hpp>
#include <indicators/progress_bar.hpp>

#include "board.hpp"
#include "board_config.hpp"
#include "console_log.hpp"
#include "uboot_machine.hpp"
#include "conch_log.hpp"
#include "utils.hpp"

const std::string conchVersion = "1.0.0";

std::atomic<bool> running{true};

struct CommandReport {
    std::string m_command;
    int m_returnCode;
    std::string m_output;
};

void BoardStatusCallback(BoardResponse response)
{
    if (response.m_state == BOARD_STATE_POWERING_ON) {
        std::cout << "Powering on " << response.m_boardName << std::endl;
    } else if (response.m_state == BOARD_STATE_CONNECTED) {
        std::cout << "Connected to " << response.m_boardName << std::endl;
    } else if (response.m_state == BOARD_STATE_POWERING_OFF) {
        std::cout << "Powering off " << response.m_boardName << ": " << response.m_message << std::endl;
    } else if (response.m_state == BOARD_STATE_OFF) {
        std::cout << response.m_boardName << ": " << response.m_message << std::endl;
    }
}

void UpdateSimpleProgress(size_t index, size_t total, const std::string &command, int returnCode)
{
    std::cout << "Command " << (index + 1) << "/" << total << ": " << command
        << " returned " << returnCode << std::endl;
}

void SignalHandler(int signal)
{
    if (signal == SIGINT) {
        running.store(false);
    }
}

// Runs the commands on a synchronized U-Boot. Returns the number of failed
// commands.
int RunCommands(UBootMachine &uboot, const std::vector<std::string> &commands, bool keepGoing,
    bool simpleProgress, std::vector<CommandReport> &reports)
{
    int failures = 0;

    std::unique_ptr<indicators::ProgressBar> progressBar;
    if (!simpleProgress && !commands.empty()) {
        progressBar = std::make_unique<indicators::ProgressBar>(
            indicators::option::BarWidth{50},
            indicators::option::Start{"["},
            indicators::option::Fill{"="},
            indicators::option::Lead{">"},
            indicators::option::Remainder{" "},
            indicators::option::End{"]"},
            indicators::option::PrefixText{uboot.GetName() + ": "},
            indicators::option::ForegroundColor{indicators::Color::green},
            indicators::option::ShowElapsedTime{true},
            indicators::option::MaxProgress{commands.size()}
        );
    }

    for (size_t i = 0; i < commands.size() && running.load(); ++i) {
        if (progressBar) {
            progressBar->set_option(indicators::option::PostfixText{commands[i]});
        }

        CommandResult result = uboot.Exec(ShellArg::Raw(commands[i]));
        reports.push_back({commands[i], result.m_returnCode, result.m_output});

        if (progressBar) {
            progressBar->tick();
        } else if (simpleProgress) {
            UpdateSimpleProgress(i, commands.size(), commands[i], result.m_returnCode);
        }

        if (result.m_returnCode != 0) {
            ++failures;
            if (!keepGoing) {
                break;
            }
        }
    }

    if (progressBar && !progressBar->is_completed()) {
        progressBar->mark_as_completed();
    }

    return failures;
}

int main(int argc, char* argv[])
{
    cxxopts::Options options("conch", "U-Boot console automation");

    std::signal(SIGINT, SignalHandler);

    options.add_options()
        ("c,config", "Board description (YAML)", cxxopts::value<std::string>())
        ("l,log", "Log file path", cxxopts::value<std::string>()->default_value(""))
        ("D,debug", "Enable debug logging and libusb debug output", cxxopts::value<bool>()->default_value("false"))
        ("L,log-level", "Log level (TRACE, DEBUG, INFO, WARNING, ERROR, NONE)", cxxopts::value<std::string>()->default_value(""))
        ("T,temp-dir", "Directory for the log and console.log", cxxopts::value<std::string>()->default_value(""))
        ("b,bootlog", "Print the boot log", cxxopts::value<bool>()->default_value("false"))
        ("i,interactive", "Hand the console to the terminal after the commands", cxxopts::value<bool>()->default_value("false"))
        ("k,keep-going", "Keep running commands after one failed", cxxopts::value<bool>()->default_value("false"))
        ("r,retries", "Session attempts after a failed boot", cxxopts::value<int>()->default_value("0"))
        ("S,simple-progress", "Disable progress bars and report progress messages", cxxopts::value<bool>()->default_value("false"))
        ("h,help", "Print usage")
        ("v,version", "Print version")
        ("commands", "U-Boot command lines", cxxopts::value<std::vector<std::string>>());

    options.parse_positional({"commands"});
    options.positional_help("[command ...]");

    cxxopts::ParseResult result;
    try {
        result = options.parse(argc, argv);
    } catch (const cxxopts::OptionException& e) {
        std::cerr << "Error parsing options: " << e.what() << std::endl;
        std::cerr << options.help() << std::endl;
        return -1;
    }

    if (result.count("help")) {
        std::cout << options.help() << std::endl;
        return 0;
    }

    if (result.count("version")) {
        std::cout << "conch: v" << conchVersion << std::endl;
        return 0;
    }

    if (!result.count("config")) {
        std::cerr << "A board description is required (-c)" << std::endl;
        std::cerr << options.help() << std::endl;
        return -1;
    }

    std::string configPath = result["config"].as<std::string>();
    std::string logFilePath = result["log"].as<std::string>();
    std::string tempDir = result["temp-dir"].as<std::string>();
    bool debug = result["debug"].as<bool>();
    bool printBootLog = result["bootlog"].as<bool>();
    bool interactive = result["interactive"].as<bool>();
    bool keepGoing = result["keep-going"].as<bool>();
    int retries = result["retries"].as<int>();
    bool simpleProgress = result["simple-progress"].as<bool>();
    std::string logLevelName = result["log-level"].as<std::string>();
    ConchLogLevel logLevel = debug ? CONCH_LOG_LEVEL_DEBUG : CONCH_LOG_LEVEL_INFO;

    std::vector<std::string> commands;
    if (result.count("commands")) {
        commands = result["commands"].as<std::vector<std::string>>();
    }

    if (!logLevelName.empty()) {
        try {
            logLevel = ConchLog::StringToLevel(logLevelName);
        } catch (const std::invalid_argument& e) {
            std::cerr << e.what() << std::endl;
            return -1;
        }
    }

    if (retries < 0) {
        std::cerr << "Retries must not be negative" << std::endl;
        return -1;
    }

    if (tempDir.empty()) {
        tempDir = MakeTempDirectory();
        if (tempDir.empty()) {
            tempDir = "./";
        }
    } else {
        std::filesystem::create_directories(tempDir);
    }

    if (logFilePath.empty()) {
        logFilePath = tempDir + "/conch.log";
    }

    try {
        ConchLogStore::getInstance().Open(logFilePath, logLevel);
    } catch (const std::exception& e) {
        std::cerr << "Failed to open log file " << logFilePath << ": " << e.what() << std::endl;
        return -1;
    }

    std::unique_ptr<BoardConfig> config;
    try {
        config = std::make_unique<BoardConfig>(BoardConfig::LoadFile(configPath));
    } catch (const std::exception& e) {
        std::cerr << "Failed to load board description: " << e.what() << std::endl;
        return -1;
    }
    config->SetUsbDebug(debug);

    ConchLogContext logContext(config->GetName());

    std::cout << "Board: " << config->GetName() << std::endl;
    std::cout << "    Connection: " << BoardConfig::ConnectionTypeToString(config->GetConnection().m_type) << std::endl;
    std::cout << "    U-Boot prompt: '" << config->GetUBootConfig().prompt << "'\n" << std::endl;

    std::unique_ptr<Board> board;
    try {
        board = config->MakeBoard();
    } catch (const std::exception& e) {
        std::cerr << "Failed to set up board: " << e.what() << std::endl;
        return -1;
    }
    board->SetStatusCallback(BoardStatusCallback);

    ConsoleLog consoleLog(config->GetName(), tempDir);

    bool sessionEstablished = false;
    int failures = 0;
    std::vector<CommandReport> reports;

    for (int attempt = 0; attempt <= retries && !sessionEstablished && running.load(); ++attempt) {
        if (attempt > 0) {
            std::cout << "Retrying session (" << attempt << "/" << retries << ")" << std::endl;
        }

        try {
            BoardSession session(*board);
            UBootMachine uboot(*board, config->GetUBootConfig(), &consoleLog);
            sessionEstablished = true;

            if (printBootLog) {
                std::cout << uboot.GetBootLog() << std::endl;
            }

            indicators::show_console_cursor(false);
            try {
                failures = RunCommands(uboot, commands, keepGoing, simpleProgress, reports);
            } catch (const std::exception&) {
                indicators::show_console_cursor(true);
                throw;
            }
            indicators::show_console_cursor(true);

            if (interactive && running.load()) {
                uboot.Interactive();
            }

            session.Close();
        } catch (const std::exception& e) {
            std::cerr << (sessionEstablished ? "Session failed: " : "Failed to reach U-Boot: ") << e.what() << std::endl;
            if (sessionEstablished) {
                ++failures;
            }
        }
    }

    consoleLog.Flush();

    for (const auto &report : reports) {
        std::cout << config->GetUBootConfig().prompt << report.m_command << "\n" << report.m_output;
        if (report.m_returnCode != 0) {
            std::cout << "(returned " << report.m_returnCode << ")" << std::endl;
        }
    }

    if (!sessionEstablished || failures) {
        std::cerr << "Error reported: please check the log file for more information: " << logFilePath << std::endl;
        return -1;
    }

    return 0;
}
