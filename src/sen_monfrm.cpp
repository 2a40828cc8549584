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

#include "sen_monfrm.hpp"
#include "sen_ev.hpp"
#include "sen_panels.hpp"
#include "sen_sparkview.hpp"
#include "utils.hpp"

#include <algorithm>
#include <wx/intl.h>
#include <wx/sizer.h>

MonitorFrame::MonitorFrame(wxConfigBase *config, const MonitorSettings &settings)
    : wxFrame(nullptr,
              wxID_ANY,
              _("Sensors Monitor"),
              wxDefaultPosition,
              wxSize(1100, 700),
              wxDEFAULT_FRAME_STYLE),
      m_config(config),
      m_settings(settings),
      m_session((size_t)settings.historySize),
      m_pollTimer(this) {
  CreateControls();

  if (m_config) {
    LoadWindowSize(wxT("MonitorFrame"), this, m_config);
  }

  // ---- Bindings for GUI events ----
  Bind(wxEVT_CLOSE_WINDOW, &MonitorFrame::OnClose, this);
  Bind(wxEVT_CHAR_HOOK, &MonitorFrame::OnCharHook, this);
  Bind(wxEVT_TIMER, &MonitorFrame::OnPollTimer, this);
  m_view->Bind(wxEVT_SIZE, &MonitorFrame::OnViewSize, this);
  m_view->Bind(wxEVT_MOUSEWHEEL, &MonitorFrame::OnMouseWheel, this);

  // ---- Bindings for thread events ----
  Bind(EVT_SENSOR_READINGS_READY, &MonitorFrame::OnReadingsReady, this);
  Bind(EVT_SENSOR_READ_ERROR, &MonitorFrame::OnReadError, this);

  if (m_settings.record) {
    OpenDiskStore();
  }

  UpdateGridSize();

  // first poll right away, then on every timer tick
  Dispatch(TickEvent{wxDateTime::Now()});
  m_pollTimer.Start(m_settings.pollIntervalMs);
}

MonitorFrame::~MonitorFrame() {
  m_pollTimer.Stop();
  m_poller.Cancel();
}

void MonitorFrame::CreateControls() {
  auto *topSizer = new wxBoxSizer(wxVERTICAL);

  m_view = new SparklineView(this);
  m_view->SetChartFont(m_settings.fontDesc);
  topSizer->Add(m_view, 1, wxEXPAND);

  SetSizer(topSizer);

  CreateStatusBar();
  SetStatusText(_("q: quit   j/k: scroll   home: top   p/space: pause"));

  m_view->SetFocus();
}

void MonitorFrame::OpenDiskStore() {
  m_store = std::make_unique<DiskStore>(m_settings.GetDataDir());

  wxString error;
  if (!m_store->Open(error)) {
    m_store.reset();
    Dispatch(ErrorEvent{wxT("disk store: ") + error});
  }
}

void MonitorFrame::Dispatch(const HostEvent &ev) {
  HostCommand cmd = m_session.Handle(ev);
  Apply(cmd);
  UpdateView();
}

void MonitorFrame::Apply(const HostCommand &cmd) {
  if (cmd.fetch) {
    m_poller.ReadAsync(this);
  }

  if (cmd.persist && m_store) {
    wxString error;
    if (!m_store->Write(m_session.GetReadings(), m_session.GetLastPoll(), error)) {
      m_session.Handle(ErrorEvent{wxT("write: ") + error});
    }
  }

  if (cmd.quit) {
    Close();
  }
}

void MonitorFrame::UpdateView() {
  if (!m_view)
    return;

  wxDateTime now = m_session.GetNow().IsValid() ? m_session.GetNow() : wxDateTime::Now();
  wxString recDir = m_store ? m_store->GetDir() : wxString();
  std::vector<StyledLine> lines = BuildLiveDocument(m_session, now, recDir, m_settings.chartMaxWidth);

  int lineCount = (int)lines.size();
  m_view->SetLines(std::move(lines));

  m_session.ClampScroll(lineCount - std::max(5, m_session.GetRows()));
  m_view->SetFirstLine(m_session.GetScroll());
}

void MonitorFrame::UpdateGridSize() {
  int cols = 0, rows = 0;
  m_view->GetGridSize(cols, rows);
  if (cols != m_session.GetCols() || rows != m_session.GetRows()) {
    Dispatch(ResizedEvent{cols, rows});
  }
}

void MonitorFrame::OnPollTimer(wxTimerEvent &WXUNUSED(event)) {
  Dispatch(TickEvent{wxDateTime::Now()});
}

void MonitorFrame::OnReadingsReady(wxThreadEvent &event) {
  DataArrivedEvent data = event.GetPayload<DataArrivedEvent>();
  SEN_DEBUG_LOG("MON: poll finished, %zu readings", data.readings.size());
  Dispatch(data);
}

void MonitorFrame::OnReadError(wxThreadEvent &event) {
  wxString msg = event.GetString();
  SEN_DEBUG_LOG("MON: poll failed: %s", wxToStd(msg).c_str());
  Dispatch(ErrorEvent{msg});
}

void MonitorFrame::OnCharHook(wxKeyEvent &event) {
  HostKey key = MapKey(event.GetKeyCode(), event.ShiftDown());
  if (key == HostKey::None) {
    event.Skip();
    return;
  }
  Dispatch(KeyPressedEvent{key});
}

void MonitorFrame::OnMouseWheel(wxMouseEvent &event) {
  Dispatch(KeyPressedEvent{event.GetWheelRotation() > 0 ? HostKey::Up : HostKey::Down});
}

void MonitorFrame::OnViewSize(wxSizeEvent &event) {
  UpdateGridSize();
  event.Skip();
}

void MonitorFrame::OnClose(wxCloseEvent &WXUNUSED(event)) {
  m_pollTimer.Stop();
  m_poller.Cancel();

  if (m_store) {
    m_store->Close();
  }

  if (m_config) {
    SaveWindowSize(wxT("MonitorFrame"), this, m_config);
  }

  Destroy();
}
