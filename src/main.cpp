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

#include "main.hpp"
#include "sen_histfrm.hpp"
#include "sen_monfrm.hpp"
#include "sen_store.hpp"
#include "utils.hpp"

#include <wx/intl.h>
#include <wx/log.h>

static const wxCmdLineEntryDesc g_cmdLineDesc[] = {
    // --verbose
    {wxCMD_LINE_SWITCH,
     nullptr,
     "verbose",
     "generate verbose log messages",
     wxCMD_LINE_VAL_NONE,
     0},

    // --debug
    {wxCMD_LINE_SWITCH,
     nullptr,
     "debug",
     "enable debug logging",
     wxCMD_LINE_VAL_NONE,
     0},

    // --history
    {wxCMD_LINE_SWITCH,
     nullptr,
     "history",
     "browse recorded days instead of live monitoring",
     wxCMD_LINE_VAL_NONE,
     0},

    // --capacity N
    {wxCMD_LINE_OPTION,
     nullptr,
     "capacity",
     "points kept per sensor",
     wxCMD_LINE_VAL_NUMBER,
     0},

    // --data-dir PATH
    {wxCMD_LINE_OPTION,
     nullptr,
     "data-dir",
     "directory with the daily CSV logs",
     wxCMD_LINE_VAL_STRING,
     0},

    wxCMD_LINE_DESC_END};

bool SensorsApp::OnInit() {
  if (!wxApp::OnInit()) {
    return false;
  }

  SetAppName(wxT("SensorsMonitor"));

  if (g_debugLogging) {
    wxLog::SetActiveTarget(new wxLogStderr());
    wxLog::SetVerbose(true);
    SEN_DEBUG_LOG("Debug mode enabled");
  }

  cfg = wxConfig::Get();
  if (cfg) {
    m_settings.Load(cfg);
    if (!cfg->HasGroup(wxT("Monitor"))) {
      m_settings.Save(cfg);
    }
  }

  // command line wins for this session only, nothing is written back
  if (m_capacity > 0) {
    m_settings.historySize = (int)m_capacity;
  }
  if (!m_dataDir.IsEmpty()) {
    m_settings.dataDir = m_dataDir;
  }
  m_settings.Sanitize();

  SEN_DEBUG_LOG("APP: capacity=%d poll=%dms dataDir=%s", m_settings.historySize, m_settings.pollIntervalMs,
                wxToStd(m_settings.GetDataDir()).c_str());

  return m_historyMode ? StartHistory() : StartMonitor();
}

bool SensorsApp::StartMonitor() {
  auto *frame = new MonitorFrame(cfg, m_settings);
  frame->Show(true);
  return true;
}

bool SensorsApp::StartHistory() {
  wxString dir = m_settings.GetDataDir();

  std::vector<wxString> days;
  wxString error;
  if (!DiskStore::ListDays(dir, days, error)) {
    wxLogError(_("Cannot read history directory %s: %s"), dir, error);
    return false;
  }

  if (days.empty()) {
    wxLogError(_("No history data found in %s"), dir);
    return false;
  }

  SEN_DEBUG_LOG("APP: %d recorded days in %s", (int)days.size(), wxToStd(dir).c_str());

  auto *frame = new HistoryFrame(cfg, m_settings, days);
  frame->Show(true);
  return true;
}

void SensorsApp::OnInitCmdLine(wxCmdLineParser &parser) {
  wxApp::OnInitCmdLine(parser);

  parser.SetDesc(g_cmdLineDesc);
  parser.SetSwitchChars(wxT("-")); // so that both -x and --xxx work
}

bool SensorsApp::OnCmdLineParsed(wxCmdLineParser &parser) {
  bool hasDebug = parser.Found(wxT("debug"));
  bool hasVerbose = parser.Found(wxT("verbose"));

  g_verboseLogging = hasVerbose;
  g_debugLogging = hasDebug || hasVerbose;

  m_historyMode = parser.Found(wxT("history"));

  long capacity = 0;
  if (parser.Found(wxT("capacity"), &capacity)) {
    if (capacity <= 0) {
      wxLogError(_("--capacity must be a positive number"));
      return false;
    }
    m_capacity = capacity;
  }

  wxString dataDir;
  if (parser.Found(wxT("data-dir"), &dataDir)) {
    m_dataDir = dataDir;
  }

  return wxApp::OnCmdLineParsed(parser);
}

wxIMPLEMENT_APP_NO_MAIN(SensorsApp);

int main(int argc, char **argv) {
  return wxEntry(argc, argv);
}
