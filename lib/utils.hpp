// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Synaptics Incorporated

#pragma once

#include <string>

std::string MakeTempDirectory();

// Runs command with /bin/sh -c and waits for it. Returns the exit status, or
// -1 when the shell could not be started or was killed by a signal.
int RunShellCommand(const std::string &command);

std::string StripCarriageReturns(const std::string &text);
