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

#include <vector>
#include <wx/colour.h>
#include <wx/string.h>

// Palette slots a styled cell can be drawn with. Mapped to real colours by
// ColorForRole().
enum class ColorRole {
  NoData,
  Tick,
  Ok,
  Warn,
  High,
  Critical,
  ScaleBackground,
  MarkerHigh,
  MarkerCritical,
  Label,
  ScrubberLine,
  ScrubberCursor,
  Title,
  ChipName,
  Adapter,
  Dim,
  Value,
  Border,
  Error,
  Paused,
  Recording
};

struct StyledCell {
  wchar_t glyph = L' ';
  ColorRole role = ColorRole::Label;
  bool bold = false;
};

struct StyledLine {
  std::vector<StyledCell> cells;

  size_t Width() const { return cells.size(); }
  bool IsEmpty() const { return cells.empty(); }

  void Append(wchar_t glyph, ColorRole role, bool bold = false) {
    cells.push_back(StyledCell{glyph, role, bold});
  }

  void AppendText(const wxString &text, ColorRole role, bool bold = false) {
    for (wxString::const_iterator it = text.begin(); it != text.end(); ++it) {
      cells.push_back(StyledCell{ToGlyph((*it).GetValue()), role, bold});
    }
  }

  void AppendLine(const StyledLine &other) {
    cells.insert(cells.end(), other.cells.begin(), other.cells.end());
  }

  void AppendSpaces(int n) {
    for (int i = 0; i < n; i++) {
      cells.push_back(StyledCell{L' ', ColorRole::Label, false});
    }
  }

  // Code points that do not fit a 16-bit wchar_t become U+FFFD.
  static wchar_t ToGlyph(wxUint32 cp) {
    if (sizeof(wchar_t) < 4 && cp > 0xFFFF)
      return (wchar_t)0xFFFD;
    return (wchar_t)cp;
  }

  // Plain text of the line, styles dropped.
  wxString Text() const {
    wxString s;
    for (const auto &c : cells) {
      s += wxUniChar((wxUint32)c.glyph);
    }
    return s;
  }
};

namespace SenGlyph {
// ▁▂▃▄▅▆▇█
inline const wchar_t Blocks[8] = {0x2581, 0x2582, 0x2583, 0x2584, 0x2585, 0x2586, 0x2587, 0x2588};
inline const wchar_t NoData = 0x254C;       // ╌
inline const wchar_t Tick = 0x2502;         // │
inline const wchar_t ScaleDot = 0x00B7;     // ·
inline const wchar_t ScaleMarker = 0x25AA;  // ▪
inline const wchar_t Current = 0x25C6;      // ◆
inline const wchar_t ScrubberLine = 0x2500; // ─
inline const wchar_t Degree = 0x00B0;       // °
} // namespace SenGlyph

// xterm-256 palette equivalents used for the terminal-style chart.
wxColour ColorForRole(ColorRole role);
