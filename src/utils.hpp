/*
 * Sensors Monitor
 * Copyright (c) 2025 Pavel Petržela
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */

#pragma once

#include <chrono>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>
#include <wx/config.h>
#include <wx/log.h>
#include <wx/string.h>

using Clock = std::chrono::steady_clock;

class wxWindow;

extern bool g_debugLogging;
extern bool g_verboseLogging;

void SenDebugLog(const char *fmt, ...);
void SenTraceLog(const char *fmt, ...);

#define SEN_DEBUG_LOG(...)    \
  do {                        \
    SenDebugLog(__VA_ARGS__); \
  } while (0)

#define SEN_TRACE_LOG(...)    \
  do {                        \
    SenTraceLog(__VA_ARGS__); \
  } while (0)

/**
 * Helper for profiling.
 */
struct ScopeTimer {
  std::string name;
  Clock::time_point start;

  ScopeTimer(const char *fmt, ...) {
    char buf[512];

    va_list ap;
    va_start(ap, fmt);
    vsnprintf(buf, sizeof(buf), fmt, ap);
    va_end(ap);

    name = buf;
    start = Clock::now();
  }

  ~ScopeTimer() {
    auto end = Clock::now();
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(end - start).count();
    SEN_DEBUG_LOG("TIMER [%s]: %lld us", name.c_str(), static_cast<long long>(us));
  }
};

std::string Trim(const std::string &s);

bool LoadWindowSize(const wxString &prefix, wxWindow *win, wxConfigBase *config);

void SaveWindowSize(const wxString &prefix, wxWindow *win, wxConfigBase *config);

bool LoadFileToString(const std::string &path, std::string &out);

void SplitLines(const std::string &content, std::vector<std::string> &out);

bool startsWithCaseInsensitive(const std::string &s, const std::string &prefix);

bool hasSuffix(const std::string &s, const char *suf);

std::string wxToStd(const wxString &str);

// Synchronous execution of a shell command. stdout (and stderr unless
// withStderr is false) goes to output, the exit code is returned (-1 when the
// process could not be started).
int ExecuteCommand(const std::string &cmd, std::string &output, bool withStderr = true);

// Shortens s to at most w characters, marking the cut with an ellipsis.
wxString TruncateLabel(const wxString &s, size_t w);

// "1h02m03s" / "2m05s"
wxString FormatUptime(long long seconds);
