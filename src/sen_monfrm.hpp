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

#include "sen_poller.hpp"
#include "sen_session.hpp"
#include "sen_settings.hpp"
#include "sen_store.hpp"

#include <memory>
#include <wx/config.h>
#include <wx/frame.h>
#include <wx/timer.h>

class SparklineView;

// Live monitor: polls the sensors on a timer and shows the sparkline panels.
class MonitorFrame : public wxFrame {
public:
  MonitorFrame(wxConfigBase *config, const MonitorSettings &settings);
  ~MonitorFrame() override;

private:
  void CreateControls();
  void OpenDiskStore();

  // Feeds one event to the session and carries out the resulting command.
  void Dispatch(const HostEvent &ev);
  void Apply(const HostCommand &cmd);
  void UpdateView();
  void UpdateGridSize();

  void OnPollTimer(wxTimerEvent &event);
  void OnReadingsReady(wxThreadEvent &event);
  void OnReadError(wxThreadEvent &event);
  void OnCharHook(wxKeyEvent &event);
  void OnMouseWheel(wxMouseEvent &event);
  void OnViewSize(wxSizeEvent &event);
  void OnClose(wxCloseEvent &event);

  wxConfigBase *m_config{nullptr};
  MonitorSettings m_settings;

  MonitorSession m_session;
  std::unique_ptr<DiskStore> m_store;
  SensorPoller m_poller;

  wxTimer m_pollTimer;
  SparklineView *m_view{nullptr};
};
