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

#include "sen_settings.hpp"

#include <wx/app.h>
#include <wx/cmdline.h>
#include <wx/config.h>

class SensorsApp : public wxApp {
private:
  wxConfigBase *cfg = nullptr;
  MonitorSettings m_settings;

  bool m_historyMode = false;
  long m_capacity = 0;    // 0 = from configuration
  wxString m_dataDir;     // empty = from configuration

  bool StartMonitor();
  bool StartHistory();

public:
  virtual void OnInitCmdLine(wxCmdLineParser &parser) override;
  virtual bool OnCmdLineParsed(wxCmdLineParser &parser) override;
  virtual bool OnInit() override;
};

wxDECLARE_APP(SensorsApp);
