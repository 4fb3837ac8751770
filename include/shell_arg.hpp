// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Synaptics Incorporated

#pragma once

#include <filesystem>
#include <initializer_list>
#include <string>
#include <vector>

enum ShellArgKind {
    SHELL_ARG_STRING,
    SHELL_ARG_PATH,
    SHELL_ARG_RAW,
    SHELL_ARG_ENV,
    SHELL_ARG_FORMAT,
};

// One argument of a console command line. Plain strings are quoted so the
// shell sees them literally; the other kinds supply their own expansion.
class ShellArg
{
public:
    ShellArg(const std::string &value) : m_kind{SHELL_ARG_STRING}, m_text{value}
    {}
    ShellArg(const char *value) : m_kind{SHELL_ARG_STRING}, m_text{value}
    {}

    // A file below the directory the boot loader loads from (TFTP root).
    static ShellArg Path(const std::filesystem::path &path);

    // Emitted verbatim, no quoting.
    static ShellArg Raw(const std::string &text);

    // Reference to a boot loader environment variable, rendered as ${NAME}.
    static ShellArg Env(const std::string &name);

    // Template whose "{}" placeholders are replaced by the rendered args, in
    // order. Format("0x{}", {"1234"}) renders 0x1234.
    static ShellArg Format(const std::string &format, std::initializer_list<ShellArg> args);
    static ShellArg Format(const std::string &format, const std::vector<ShellArg> &args);

    std::string Render(const std::filesystem::path &pathRoot) const;

    ShellArgKind GetKind() const { return m_kind; }
    const std::string &GetText() const { return m_text; }

    // POSIX shell quoting: safe strings stay as they are, everything else is
    // single quoted.
    static std::string Quote(const std::string &value);

private:
    ShellArg(ShellArgKind kind, const std::string &text) : m_kind{kind}, m_text{text}
    {}

    ShellArgKind m_kind;
    std::string m_text;
    std::vector<ShellArg> m_args;

    static std::string RelativePath(const std::filesystem::path &path, const std::filesystem::path &pathRoot);
};

// Renders every argument and joins them with single spaces.
std::string BuildShellCommand(const std::vector<ShellArg> &args, const std::filesystem::path &pathRoot);
