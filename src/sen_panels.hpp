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

#include "sen_classify.hpp"
#include "sen_glyphs.hpp"
#include "sen_session.hpp"

#include <string>
#include <vector>
#include <wx/string.h>

// Width of the small threshold scale drawn after the stats of a row.
inline const int kScaleWidth = 12;

struct PanelRow {
  std::string key;
  wxString label;

  double value = 0.0;
  Tier tier = Tier::Ok;
  bool emphasized = false;
  wxString valueText;

  StyledLine spark;
  StyledLine scale; // empty when the sensor has no thresholds

  double avg = 0.0;
  double lo = 0.0;
  double peak = 0.0;
  Thresholds thresholds;

  StyledLine timeline; // history rows only
};

// All rows of one chip.
struct SensorPanel {
  std::string chip;
  wxString title; // friendly name
  wxString adapter;
  std::vector<PanelRow> rows;
  StyledLine timeline; // live panels: under the last row
};

struct PanelLayout {
  int labelWidth = 14;
  int valueWidth = 7;
  bool columnHeader = false;
  bool boldLabels = false;
};

PanelLayout LivePanelLayout();
PanelLayout HistoryPanelLayout();

// Sparkline width for a window of cols character columns.
int ChartWidthForColumns(int cols, int maxWidth = 140);

std::vector<SensorPanel> BuildLivePanels(const MonitorSession &session, int chartWidth);
std::vector<SensorPanel> BuildHistoryPanels(const HistorySession &session, int chartWidth);

void LayoutPanels(const std::vector<SensorPanel> &panels,
                  const PanelLayout &layout,
                  int chartWidth,
                  std::vector<StyledLine> &out);

StyledLine BuildLiveHeader(const MonitorSession &session, const wxDateTime &now, const wxString &recordDir);
StyledLine BuildHistoryHeader(const HistorySession &session);
StyledLine BuildCursorLine(const HistorySession &session, int cols);
StyledLine BuildLegend();

/**
 * Complete screen contents of a session: header, error line, panels and
 * legend. recordDir is shown as the recording target, empty when the live
 * monitor does not log to disk.
 */
std::vector<StyledLine> BuildLiveDocument(const MonitorSession &session,
                                          const wxDateTime &now,
                                          const wxString &recordDir,
                                          int maxChartWidth = 140);
std::vector<StyledLine> BuildHistoryDocument(const HistorySession &session, int maxChartWidth = 140);
