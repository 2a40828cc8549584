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

#include <wx/config.h>
#include <wx/string.h>

struct MonitorSettings {
  int pollIntervalMs = 1000;
  int historySize = 600; // points kept per sensor, 10 minutes at 1s
  wxString dataDir;      // empty = ~/.sensors-data
  bool record = true;    // append polls to the daily CSV log
  int chartMaxWidth = 140;
  wxString fontDesc;     // e.g. "Monospace 10", empty = system fixed font

  void Load(wxConfigBase *cfg);
  void Save(wxConfigBase *cfg) const;

  // Clamps values read from a hand edited configuration.
  void Sanitize();

  wxString GetDataDir() const;
};
