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

#include "utils.hpp"
#include <array>
#include <cctype>
#include <cstring>
#include <fstream>
#include <sstream>
#include <wx/window.h>

#if !defined(_WIN32)
#include <sys/wait.h>
#endif

bool g_debugLogging = false;
bool g_verboseLogging = false;

void SenDebugLog(const char *fmt, ...) {
  if (!g_debugLogging) {
    return;
  }

  char buf[65535];

  va_list args;
  va_start(args, fmt);
#if defined(_MSC_VER)
  vsnprintf_s(buf, sizeof(buf), _TRUNCATE, fmt, args);
#else
  vsnprintf(buf, sizeof(buf), fmt, args);
#endif
  va_end(args);

  buf[sizeof(buf) - 1] = '\0';

#if defined(__WXMSW__)
  wxString msg(buf, wxConvLocal);
#else
  wxString msg = wxString::FromUTF8(buf);
#endif

  wxLogMessage(wxT("[DBG] %s"), msg);
}

void SenTraceLog(const char *fmt, ...) {
  if (!g_verboseLogging) {
    return;
  }

  char buf[65535];

  va_list args;
  va_start(args, fmt);
#if defined(_MSC_VER)
  vsnprintf_s(buf, sizeof(buf), _TRUNCATE, fmt, args);
#else
  vsnprintf(buf, sizeof(buf), fmt, args);
#endif
  va_end(args);

  buf[sizeof(buf) - 1] = '\0';

#if defined(__WXMSW__)
  wxString msg(buf, wxConvLocal);
#else
  wxString msg = wxString::FromUTF8(buf);
#endif

  wxLogMessage(wxT("[TRC] %s"), msg);
}

std::string Trim(const std::string &s) {
  size_t b = s.find_first_not_of(" \t\r\n");
  if (b == std::string::npos)
    return std::string();
  size_t e = s.find_last_not_of(" \t\r\n");
  return s.substr(b, e - b + 1);
}

bool LoadWindowSize(const wxString &prefix, wxWindow *win, wxConfigBase *config) {
  long x, y, w, h;
  if (config->Read(prefix + wxT("/PosX"), &x) &&
      config->Read(prefix + wxT("/PosY"), &y) &&
      config->Read(prefix + wxT("/Width"), &w) &&
      config->Read(prefix + wxT("/Height"), &h)) {
    win->SetSize(x, y, w, h);
    return true;
  }
  return false;
}

void SaveWindowSize(const wxString &prefix, wxWindow *win, wxConfigBase *config) {
  wxPoint pos = win->GetPosition();
  wxSize size = win->GetSize();

  config->Write(prefix + wxT("/PosX"), pos.x);
  config->Write(prefix + wxT("/PosY"), pos.y);
  config->Write(prefix + wxT("/Width"), size.GetWidth());
  config->Write(prefix + wxT("/Height"), size.GetHeight());
  config->Flush();
}

bool LoadFileToString(const std::string &pathUtf8, std::string &out) {
  out.clear();

  std::ifstream ifs(pathUtf8, std::ios::binary);
  if (!ifs.is_open()) {
    return false;
  }

  std::ostringstream oss;
  oss << ifs.rdbuf();
  out = oss.str();
  return true;
}

void SplitLines(const std::string &content, std::vector<std::string> &out) {
  std::istringstream iss(content);
  std::string line;
  while (std::getline(iss, line)) {
    if (!line.empty() && line.back() == '\r')
      line.pop_back();
    out.push_back(line);
  }
}

bool startsWithCaseInsensitive(const std::string &s, const std::string &prefix) {
  if (prefix.size() > s.size())
    return false;
  for (size_t i = 0; i < prefix.size(); ++i) {
    unsigned char c1 = (unsigned char)s[i];
    unsigned char c2 = (unsigned char)prefix[i];
    if (std::tolower(c1) != std::tolower(c2))
      return false;
  }
  return true;
}

bool hasSuffix(const std::string &s, const char *suf) {
  size_t len = std::strlen(suf);
  return s.size() >= len && s.compare(s.size() - len, len, suf) == 0;
}

std::string wxToStd(const wxString &str) {
  wxCharBuffer buf = str.utf8_str();
  return std::string(buf.data(), buf.length());
}

static unsigned int g_execCounter = 1;

/**
 * Synchronous execution of command. Output stored to output parameter and
 * return value of process is returned.
 */
int ExecuteCommand(const std::string &cmd, std::string &output, bool withStderr) {
  unsigned int index = (g_execCounter++);
  ScopeTimer t("%04u ExecuteCommand (%s)", index, cmd.c_str());

  SEN_DEBUG_LOG("EXEC: %04u SYNC: %s", index, cmd.c_str());

  output.clear();

  std::string _cmd = cmd;
#if defined(_WIN32)
  _cmd += withStderr ? " 2>&1" : " 2>NUL";
#else
  _cmd += withStderr ? " 2>&1" : " 2>/dev/null";
#endif

#if defined(_WIN32)
  FILE *pipe = _popen(_cmd.c_str(), "r");
#else
  FILE *pipe = popen(_cmd.c_str(), "r");
#endif
  if (!pipe) {
    wxLogWarning(wxT("EXEC: %04u ERROR %s"), index, wxString::FromUTF8(_cmd));
    return -1;
  }

  std::array<char, 128> buffer{};
  while (fgets(buffer.data(), buffer.size(), pipe) != nullptr) {
    output += buffer.data();
  }

#if defined(_WIN32)
  int rc = _pclose(pipe);
#else
  int status = pclose(pipe);
  int rc = -1;

  if (status >= 0) {
    if (WIFEXITED(status)) {
      rc = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
      rc = -WTERMSIG(status);
    }
  }
#endif

  SEN_DEBUG_LOG("EXEC: %04u EXIT %d: output-size=%d", index, rc, (int)output.length());
  return rc;
}

wxString TruncateLabel(const wxString &s, size_t w) {
  if (s.length() <= w)
    return s;
  if (w <= 3)
    return s.Left(w);
  return s.Left(w - 1) + wxString(wxUniChar(0x2026));
}

wxString FormatUptime(long long seconds) {
  if (seconds < 0)
    seconds = 0;
  long long h = seconds / 3600;
  long long m = (seconds % 3600) / 60;
  long long s = seconds % 60;
  if (h > 0) {
    return wxString::Format(wxT("%lldh%02lldm%02llds"), h, m, s);
  }
  return wxString::Format(wxT("%lldm%02llds"), m, s);
}
