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

#include "sen_session.hpp"
#include "sen_settings.hpp"

#include <vector>
#include <wx/config.h>
#include <wx/frame.h>

class SparklineView;

// Browser of the recorded days: one day at a time, with a time cursor.
class HistoryFrame : public wxFrame {
public:
  HistoryFrame(wxConfigBase *config, const MonitorSettings &settings, const std::vector<wxString> &days);

private:
  void CreateControls();

  void Dispatch(const HostEvent &ev);
  void UpdateView();
  void UpdateGridSize();

  void OnCharHook(wxKeyEvent &event);
  void OnMouseWheel(wxMouseEvent &event);
  void OnViewSize(wxSizeEvent &event);
  void OnClose(wxCloseEvent &event);

  wxConfigBase *m_config{nullptr};
  MonitorSettings m_settings;

  HistorySession m_session;
  wxString m_lastDay;

  SparklineView *m_view{nullptr};
};
