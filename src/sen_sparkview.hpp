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

#include "sen_glyphs.hpp"

#include <vector>
#include <wx/font.h>
#include <wx/graphics.h>
#include <wx/panel.h>
#include <wx/timer.h>

/**
 * Character grid of styled lines, painted like a terminal: fixed cell size,
 * monospace font, dark background. The first visible line is set by the
 * owner.
 */
class SparklineView : public wxPanel {
public:
  explicit SparklineView(wxWindow *parent,
                         wxWindowID id = wxID_ANY,
                         const wxPoint &pos = wxDefaultPosition,
                         const wxSize &size = wxDefaultSize,
                         long style = wxWANTS_CHARS);

  void SetLines(std::vector<StyledLine> lines);

  void SetFirstLine(int line);

  // Font description as accepted by wxFont::SetNativeFontInfoUserDesc,
  // empty selects the default monospace font.
  void SetChartFont(const wxString &fontDesc);

  // Number of whole character cells that fit into the client area.
  void GetGridSize(int &cols, int &rows) const;

private:
  void OnPaint(wxPaintEvent &evt);
  void OnSize(wxSizeEvent &evt);

  // Refresh
  wxTimer m_refreshTimer;
  bool m_refreshScheduled = false;
  void OnRefreshTimer(wxTimerEvent &);
  void RequestRefresh();

  void UpdateCellSize();
  void Draw(wxGraphicsContext &gc, const wxRect &rcClient);

  std::vector<StyledLine> m_lines;
  int m_firstLine = 0;

  wxFont m_font;
  wxFont m_boldFont;
  wxSize m_cell{8, 16};
};
