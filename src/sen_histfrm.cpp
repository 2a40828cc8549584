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

#include "sen_histfrm.hpp"
#include "sen_panels.hpp"
#include "sen_sparkview.hpp"
#include "sen_store.hpp"
#include "utils.hpp"

#include <algorithm>
#include <wx/intl.h>
#include <wx/sizer.h>

static DayLoader MakeDayLoader(const wxString &dataDir) {
  return [dataDir](const wxString &day, std::vector<StoredReading> &rows, wxString &error) {
    return DiskStore::LoadDay(dataDir, day, rows, error);
  };
}

HistoryFrame::HistoryFrame(wxConfigBase *config, const MonitorSettings &settings, const std::vector<wxString> &days)
    : wxFrame(nullptr,
              wxID_ANY,
              _("Sensors History"),
              wxDefaultPosition,
              wxSize(1100, 700),
              wxDEFAULT_FRAME_STYLE),
      m_config(config),
      m_settings(settings),
      m_session(days, MakeDayLoader(settings.GetDataDir())) {
  CreateControls();

  if (m_config) {
    LoadWindowSize(wxT("HistoryFrame"), this, m_config);
  }

  Bind(wxEVT_CLOSE_WINDOW, &HistoryFrame::OnClose, this);
  Bind(wxEVT_CHAR_HOOK, &HistoryFrame::OnCharHook, this);
  m_view->Bind(wxEVT_SIZE, &HistoryFrame::OnViewSize, this);
  m_view->Bind(wxEVT_MOUSEWHEEL, &HistoryFrame::OnMouseWheel, this);

  UpdateGridSize();
  UpdateView();
}

void HistoryFrame::CreateControls() {
  auto *topSizer = new wxBoxSizer(wxVERTICAL);

  m_view = new SparklineView(this);
  m_view->SetChartFont(m_settings.fontDesc);
  topSizer->Add(m_view, 1, wxEXPAND);

  SetSizer(topSizer);

  CreateStatusBar();
  SetStatusText(_("q: quit   h/l: step   H/L: minute   home/end   [ ]: day   j/k: scroll"));

  m_view->SetFocus();
}

void HistoryFrame::Dispatch(const HostEvent &ev) {
  HostCommand cmd = m_session.Handle(ev);
  UpdateView();

  if (cmd.quit) {
    Close();
  }
}

void HistoryFrame::UpdateView() {
  if (!m_view)
    return;

  std::vector<StyledLine> lines = BuildHistoryDocument(m_session, m_settings.chartMaxWidth);

  int lineCount = (int)lines.size();
  m_view->SetLines(std::move(lines));

  m_session.ClampScroll(lineCount - std::max(5, m_session.GetRows()));
  m_view->SetFirstLine(m_session.GetScroll());

  wxString day = m_session.GetCurrentDay();
  if (day != m_lastDay) {
    m_lastDay = day;
    SetTitle(day.IsEmpty() ? wxString(_("Sensors History")) : wxString::Format(_("Sensors History - %s"), day));
  }
}

void HistoryFrame::UpdateGridSize() {
  int cols = 0, rows = 0;
  m_view->GetGridSize(cols, rows);
  if (cols != m_session.GetCols() || rows != m_session.GetRows()) {
    Dispatch(ResizedEvent{cols, rows});
  }
}

void HistoryFrame::OnCharHook(wxKeyEvent &event) {
  HostKey key = MapKey(event.GetKeyCode(), event.ShiftDown());
  if (key == HostKey::None || key == HostKey::Pause) {
    event.Skip();
    return;
  }
  Dispatch(KeyPressedEvent{key});
}

void HistoryFrame::OnMouseWheel(wxMouseEvent &event) {
  Dispatch(KeyPressedEvent{event.GetWheelRotation() > 0 ? HostKey::Up : HostKey::Down});
}

void HistoryFrame::OnViewSize(wxSizeEvent &event) {
  UpdateGridSize();
  event.Skip();
}

void HistoryFrame::OnClose(wxCloseEvent &WXUNUSED(event)) {
  if (m_config) {
    SaveWindowSize(wxT("HistoryFrame"), this, m_config);
  }
  Destroy();
}
