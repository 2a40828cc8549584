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

#include "sen_sparkview.hpp"
#include "utils.hpp"

#include <algorithm>
#include <wx/dcbuffer.h>
#include <wx/dcclient.h>
#include <wx/intl.h>

static const wxColour kBackground(18, 18, 18);

SparklineView::SparklineView(wxWindow *parent,
                             wxWindowID id,
                             const wxPoint &pos,
                             const wxSize &size,
                             long style)
    : wxPanel(parent, id, pos, size, style), m_refreshTimer(this) {

  SetBackgroundStyle(wxBG_STYLE_PAINT);
  SetBackgroundColour(kBackground);

  Bind(wxEVT_PAINT, &SparklineView::OnPaint, this);
  Bind(wxEVT_SIZE, &SparklineView::OnSize, this);

  // Dont erase background from Refresh()
  Bind(wxEVT_ERASE_BACKGROUND, [](wxEraseEvent &) { /* no-op */ });

  // delayed refresh
  Bind(wxEVT_TIMER, &SparklineView::OnRefreshTimer, this);

  SetChartFont(wxEmptyString);
}

void SparklineView::SetChartFont(const wxString &fontDesc) {
  wxFont font;
  if (!fontDesc.IsEmpty() && font.SetNativeFontInfoUserDesc(fontDesc) && font.IsOk() && font.IsFixedWidth()) {
    m_font = font;
  } else {
    if (!fontDesc.IsEmpty()) {
      wxLogWarning(_("Font '%s' is not a usable monospace font, using the default one."), fontDesc);
    }
    m_font = wxFont(wxFontInfo(10).Family(wxFONTFAMILY_TELETYPE));
  }

  m_boldFont = m_font.Bold();
  UpdateCellSize();
  RequestRefresh();
}

void SparklineView::UpdateCellSize() {
  wxClientDC dc(this);
  dc.SetFont(m_font);

  wxCoord w = 0, h = 0;
  dc.GetTextExtent(wxT("M"), &w, &h);
  m_cell = wxSize(std::max(1, (int)w), std::max(1, (int)h));

  SEN_TRACE_LOG("VIEW: cell size %dx%d", m_cell.x, m_cell.y);
}

void SparklineView::GetGridSize(int &cols, int &rows) const {
  wxSize sz = GetClientSize();
  cols = std::max(0, sz.x / m_cell.x);
  rows = std::max(0, sz.y / m_cell.y);
}

void SparklineView::SetLines(std::vector<StyledLine> lines) {
  m_lines = std::move(lines);
  RequestRefresh();
}

void SparklineView::SetFirstLine(int line) {
  line = std::max(0, line);
  if (line == m_firstLine)
    return;
  m_firstLine = line;
  RequestRefresh();
}

void SparklineView::RequestRefresh() {
  if (m_refreshScheduled)
    return;
  m_refreshScheduled = true;
  m_refreshTimer.StartOnce(30);
}

void SparklineView::OnRefreshTimer(wxTimerEvent &) {
  m_refreshScheduled = false;
  Refresh(false);
}

void SparklineView::OnSize(wxSizeEvent &evt) {
  RequestRefresh();
  evt.Skip();
}

void SparklineView::OnPaint(wxPaintEvent &WXUNUSED(evt)) {
  wxAutoBufferedPaintDC dc(this);
  dc.SetBackground(wxBrush(kBackground));
  dc.Clear();

  wxGraphicsContext *gc = wxGraphicsContext::Create(dc);
  if (!gc)
    return;

  const wxRect rc = GetClientRect();
  Draw(*gc, rc);

  delete gc;
}

void SparklineView::Draw(wxGraphicsContext &gc, const wxRect &rcClient) {
  const int visibleRows = rcClient.GetHeight() / m_cell.y + 1;
  const int last = std::min((int)m_lines.size(), m_firstLine + visibleRows);

  // cells are drawn one by one: block and box glyphs often come from a
  // fallback font whose advance differs from the cell width
  for (int li = m_firstLine; li < last; li++) {
    const StyledLine &line = m_lines[(size_t)li];
    const double y = (double)((li - m_firstLine) * m_cell.y);

    ColorRole curRole = ColorRole::Label;
    bool curBold = false;
    bool fontSet = false;

    for (size_t ci = 0; ci < line.cells.size(); ci++) {
      const StyledCell &cell = line.cells[ci];
      if (cell.glyph == L' ')
        continue;

      const double x = (double)(ci * (size_t)m_cell.x);
      if (x > rcClient.GetWidth())
        break;

      if (!fontSet || cell.role != curRole || cell.bold != curBold) {
        gc.SetFont(cell.bold ? m_boldFont : m_font, ColorForRole(cell.role));
        curRole = cell.role;
        curBold = cell.bold;
        fontSet = true;
      }

      gc.DrawText(wxString(wxUniChar((wxUint32)cell.glyph)), x, y);
    }
  }
}
