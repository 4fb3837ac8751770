// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Synaptics Incorporated

#include <stdexcept>

#include "shell_arg.hpp"

ShellArg ShellArg::Path(const std::filesystem::path &path)
{
    return ShellArg{SHELL_ARG_PATH, path.string()};
}

ShellArg ShellArg::Raw(const std::string &text)
{
    return ShellArg{SHELL_ARG_RAW, text};
}

ShellArg ShellArg::Env(const std::string &name)
{
    if (name.empty()) {
        throw std::invalid_argument("Environment variable name is empty");
    }
    return ShellArg{SHELL_ARG_ENV, name};
}

ShellArg ShellArg::Format(const std::string &format, std::initializer_list<ShellArg> args)
{
    return Format(format, std::vector<ShellArg>(args));
}

ShellArg ShellArg::Format(const std::string &format, const std::vector<ShellArg> &args)
{
    ShellArg arg{SHELL_ARG_FORMAT, format};
    arg.m_args = args;
    return arg;
}

std::string ShellArg::Quote(const std::string &value)
{
    if (value.empty()) {
        return "''";
    }

    bool safe = true;
    for (char c : value) {
        if (!((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9')
            || std::string{"@%+=:,./_-"}.find(c) != std::string::npos))
        {
            safe = false;
            break;
        }
    }
    if (safe) {
        return value;
    }

    std::string quoted = "'";
    for (char c : value) {
        if (c == '\'') {
            quoted += "'\"'\"'";
        } else {
            quoted += c;
        }
    }
    quoted += "'";

    return quoted;
}

std::string ShellArg::RelativePath(const std::filesystem::path &path, const std::filesystem::path &pathRoot)
{
    std::filesystem::path relative;
    if (path.is_absolute()) {
        relative = path.lexically_normal().lexically_relative(pathRoot.lexically_normal());
    } else {
        relative = path.lexically_normal();
    }

    if (relative.empty() || relative == "." || *relative.begin() == "..") {
        throw std::invalid_argument("Path " + path.string() + " is not below " + pathRoot.string());
    }

    return relative.string();
}

std::string ShellArg::Render(const std::filesystem::path &pathRoot) const
{
    switch (m_kind) {
        case SHELL_ARG_STRING:
            return Quote(m_text);
        case SHELL_ARG_PATH:
            return Quote(RelativePath(m_text, pathRoot));
        case SHELL_ARG_RAW:
            return m_text;
        case SHELL_ARG_ENV:
            return "${" + m_text + "}";
        case SHELL_ARG_FORMAT:
        {
            std::string rendered;
            size_t argIndex = 0;
            size_t pos = 0;
            size_t placeholder;
            while ((placeholder = m_text.find("{}", pos)) != std::string::npos) {
                if (argIndex >= m_args.size()) {
                    throw std::invalid_argument("Too few arguments for format \"" + m_text + "\"");
                }
                rendered += m_text.substr(pos, placeholder - pos);
                rendered += m_args[argIndex++].Render(pathRoot);
                pos = placeholder + 2;
            }
            rendered += m_text.substr(pos);

            if (argIndex != m_args.size()) {
                throw std::invalid_argument("Too many arguments for format \"" + m_text + "\"");
            }
            return rendered;
        }
    }

    throw std::logic_error("Unknown shell argument kind");
}

std::string BuildShellCommand(const std::vector<ShellArg> &args, const std::filesystem::path &pathRoot)
{
    std::string command;
    for (size_t i = 0; i < args.size(); ++i) {
        if (i > 0) {
            command += " ";
        }
        command += args[i].Render(pathRoot);
    }

    return command;
}
