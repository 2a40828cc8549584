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

#include "sen_settings.hpp"
#include "sen_store.hpp"

#include <algorithm>

static void ConfigReadString(wxConfigBase *cfg, const wxString &key, wxString &value, const wxString &defValue) {
  wxString v;
  if (cfg->Read(key, &v) && !v.IsEmpty()) {
    value = v;
  } else {
    value = defValue;
  }
}

static void ConfigReadInt(wxConfigBase *cfg, const wxString &key, int &value, int defValue) {
  long lw;
  if (cfg->Read(key, &lw)) {
    value = (int)lw;
  } else {
    value = defValue;
  }
}

static void ConfigReadBool(wxConfigBase *cfg, const wxString &key, bool &value, bool defValue) {
  bool b;
  if (cfg->Read(key, &b)) {
    value = b;
  } else {
    value = defValue;
  }
}

void MonitorSettings::Load(wxConfigBase *cfg) {
  ConfigReadInt(cfg, wxT("Monitor/PollIntervalMs"), pollIntervalMs, 1000);
  ConfigReadInt(cfg, wxT("Monitor/HistorySize"), historySize, 600);
  ConfigReadString(cfg, wxT("Monitor/DataDir"), dataDir, wxEmptyString);
  ConfigReadBool(cfg, wxT("Monitor/Record"), record, true);
  ConfigReadInt(cfg, wxT("Monitor/ChartMaxWidth"), chartMaxWidth, 140);
  ConfigReadString(cfg, wxT("Monitor/Font"), fontDesc, wxEmptyString);

  Sanitize();
}

void MonitorSettings::Save(wxConfigBase *cfg) const {
  cfg->Write(wxT("Monitor/PollIntervalMs"), (long)pollIntervalMs);
  cfg->Write(wxT("Monitor/HistorySize"), (long)historySize);
  cfg->Write(wxT("Monitor/DataDir"), dataDir);
  cfg->Write(wxT("Monitor/Record"), record);
  cfg->Write(wxT("Monitor/ChartMaxWidth"), (long)chartMaxWidth);
  cfg->Write(wxT("Monitor/Font"), fontDesc);
  cfg->Flush();
}

void MonitorSettings::Sanitize() {
  pollIntervalMs = std::clamp(pollIntervalMs, 100, 60000);
  historySize = std::max(0, historySize);
  chartMaxWidth = std::clamp(chartMaxWidth, 15, 1000);
}

wxString MonitorSettings::GetDataDir() const {
  if (dataDir.IsEmpty())
    return DiskStore::DefaultDataDir();
  return dataDir;
}
