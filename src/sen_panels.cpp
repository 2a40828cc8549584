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

#include "sen_panels.hpp"
#include "sen_spark.hpp"
#include "utils.hpp"

#include <algorithm>
#include <limits>
#include <map>

static const wxString kTimeOfDay = wxT("%H:%M:%S");

PanelLayout LivePanelLayout() {
  PanelLayout l;
  l.labelWidth = 14;
  l.valueWidth = 7;
  l.columnHeader = false;
  l.boldLabels = false;
  return l;
}

PanelLayout HistoryPanelLayout() {
  PanelLayout l;
  l.labelWidth = 16;
  l.valueWidth = 8;
  l.columnHeader = true;
  l.boldLabels = true;
  return l;
}

int ChartWidthForColumns(int cols, int maxWidth) {
  // 2 columns of margin, 4 of panel frame, 60 for label, value and stats
  int w = cols - 2 - 4 - 60;
  return std::max(15, std::min(std::max(15, maxWidth), w));
}

static void FillRowValue(PanelRow &row, double value, const Thresholds &th) {
  row.value = value;
  row.thresholds = th;
  row.tier = ValueClassifier::Classify(value, th);
  row.emphasized = ValueClassifier::IsEmphasized(value, th);
  row.valueText = FormatValue(value);
}

std::vector<SensorPanel> BuildLivePanels(const MonitorSession &session, int chartWidth) {
  std::vector<SensorPanel> panels;
  std::map<std::string, size_t> chipIndex;

  std::map<std::string, const SensorReading *> current;
  for (const auto &r : session.GetReadings()) {
    current[r.Key()] = &r;
  }

  for (const auto &key : session.GetOrder()) {
    auto it = current.find(key);
    if (it == current.end())
      continue; // sensor vanished since an earlier poll

    const SensorReading &r = *it->second;
    const RingBuffer *hist = session.GetStore().Get(key);
    if (!hist)
      continue;

    auto ci = chipIndex.find(r.chip);
    if (ci == chipIndex.end()) {
      SensorPanel p;
      p.chip = r.chip;
      p.title = wxString::FromUTF8(FriendlyName(r.chip));
      p.adapter = wxString::FromUTF8(r.adapter);
      panels.push_back(p);
      ci = chipIndex.emplace(r.chip, panels.size() - 1).first;
    }
    SensorPanel &panel = panels[ci->second];

    ChartRange range = ComputeChartRange(hist->LifetimeMin(), hist->LifetimePeak(), r.thresholds);
    std::vector<Point> pts = hist->LastNPoints(chartWidth);

    PanelRow row;
    row.key = key;
    row.label = wxString::FromUTF8(r.label);
    FillRowValue(row, r.value, r.thresholds);
    row.spark = SparklineRenderer::Render(pts, chartWidth, range.min, range.max, r.thresholds);
    if (r.thresholds.high || r.thresholds.critical) {
      row.scale = ThresholdScaleRenderer::Render(r.value, range.min, range.max, r.thresholds, kScaleWidth);
    }
    row.avg = hist->Average();
    row.lo = hist->LifetimeMin();
    row.peak = hist->LifetimePeak();

    panel.rows.push_back(row);
    // the chip timeline follows the points of its last row
    panel.timeline = TimelineRenderer::Render(pts, chartWidth);
  }

  return panels;
}

std::vector<SensorPanel> BuildHistoryPanels(const HistorySession &session, int chartWidth) {
  std::vector<SensorPanel> panels;

  const HistoryView &view = session.GetView();
  int cursor = session.GetCursor();
  if (cursor < 0 || cursor >= (int)view.timeSlots.size())
    return panels;

  const wxDateTime cursorTime = view.timeSlots[(size_t)cursor];
  std::map<std::string, size_t> chipIndex;

  for (const auto &key : view.sensors) {
    const std::vector<Point> *pts = view.Series(key);
    if (!pts)
      continue;

    std::string chip, label;
    SplitSensorKey(key, chip, label);
    if (label.empty())
      label = chip;

    auto ci = chipIndex.find(chip);
    if (ci == chipIndex.end()) {
      SensorPanel p;
      p.chip = chip;
      p.title = wxString::FromUTF8(FriendlyName(chip));
      panels.push_back(p);
      ci = chipIndex.emplace(chip, panels.size() - 1).first;
    }
    SensorPanel &panel = panels[ci->second];

    Thresholds th = view.ThresholdsFor(key);

    double lo = std::numeric_limits<double>::infinity();
    double peak = -std::numeric_limits<double>::infinity();
    double sum = 0.0;
    for (const auto &p : *pts) {
      lo = std::min(lo, p.value);
      peak = std::max(peak, p.value);
      sum += p.value;
    }

    double current = NearestTimeLookup::FindNearest(*pts, cursorTime);
    ChartRange range = ComputeChartRange(lo, peak, th);
    std::vector<Point> window = WindowBuilder::Build(*pts, cursor, chartWidth, view.timeSlots);

    PanelRow row;
    row.key = key;
    row.label = wxString::FromUTF8(label);
    FillRowValue(row, current, th);
    row.spark = SparklineRenderer::Render(window, chartWidth, range.min, range.max, th);
    if (th.high || th.critical) {
      row.scale = ThresholdScaleRenderer::Render(current, range.min, range.max, th, kScaleWidth);
    }
    row.avg = sum / (double)pts->size();
    row.lo = lo;
    row.peak = peak;
    row.timeline = TimelineRenderer::Render(window, chartWidth);

    panel.rows.push_back(row);
  }

  return panels;
}

static wxString PadRight(const wxString &s, int w) {
  wxString out = TruncateLabel(s, (size_t)std::max(0, w));
  if ((int)out.length() < w)
    out.Append(wxT(' '), (size_t)w - out.length());
  return out;
}

static bool HasVisibleText(const StyledLine &line) {
  for (const auto &c : line.cells) {
    if (c.glyph != L' ')
      return true;
  }
  return false;
}

static void AppendTimeline(const StyledLine &timeline, const PanelLayout &layout, std::vector<StyledLine> &out) {
  if (!HasVisibleText(timeline))
    return;

  StyledLine line;
  // label + value + separators, then the frame column
  line.AppendSpaces(layout.labelWidth + layout.valueWidth + 2 + 1);
  line.AppendLine(timeline);
  out.push_back(line);
}

static StyledLine BuildRowLine(const PanelRow &row, const PanelLayout &layout) {
  StyledLine line;

  line.AppendText(PadRight(row.label, layout.labelWidth), ColorRole::Label, layout.boldLabels);
  line.AppendSpaces(1);

  int pad = layout.valueWidth - (int)row.valueText.length();
  line.AppendSpaces(pad);
  line.AppendText(row.valueText, ValueClassifier::RoleFor(row.tier), row.emphasized);
  line.AppendSpaces(1);

  line.Append(0x2595, ColorRole::Border); // ▕
  line.AppendLine(row.spark);
  line.Append(0x258F, ColorRole::Border); // ▏

  line.AppendText(wxT(" avg"), ColorRole::Dim);
  line.AppendText(wxString::Format(wxT("%5.1f"), row.avg), ColorRole::Value);
  line.AppendText(wxT(" lo"), ColorRole::Dim);
  line.AppendText(wxString::Format(wxT("%5.1f"), row.lo), ColorRole::Value);
  line.AppendText(wxT(" pk"), ColorRole::Dim);
  line.AppendText(wxString::Format(wxT("%5.1f"), row.peak), ColorRole::Value);

  if (row.thresholds.high) {
    line.AppendText(wxT(" H"), ColorRole::Dim);
    line.AppendText(wxString::Format(wxT("%.0f"), *row.thresholds.high), ColorRole::Warn);
  }
  if (row.thresholds.critical) {
    line.AppendText(wxT(" C"), ColorRole::Dim);
    line.AppendText(wxString::Format(wxT("%.0f"), *row.thresholds.critical), ColorRole::Critical);
  }

  if (!row.scale.IsEmpty()) {
    line.AppendSpaces(2);
    line.AppendLine(row.scale);
  }

  return line;
}

void LayoutPanels(const std::vector<SensorPanel> &panels,
                  const PanelLayout &layout,
                  int chartWidth,
                  std::vector<StyledLine> &out) {
  for (const auto &panel : panels) {
    StyledLine head;
    head.AppendText(panel.title, ColorRole::ChipName, true);
    head.AppendSpaces(2);
    head.AppendText(wxString::FromUTF8(panel.chip), ColorRole::Dim);
    if (!panel.adapter.empty()) {
      head.AppendSpaces(2);
      head.AppendText(panel.adapter, ColorRole::Adapter);
    }
    out.push_back(head);

    if (layout.columnHeader) {
      StyledLine cols;
      cols.AppendText(PadRight(wxT("sensor"), layout.labelWidth), ColorRole::Adapter);
      cols.AppendSpaces(1);
      cols.AppendSpaces(layout.valueWidth - 5);
      cols.AppendText(wxT("value"), ColorRole::Adapter);
      cols.AppendSpaces(2 + std::max(0, chartWidth / 2 - 3));
      cols.AppendText(wxT("history"), ColorRole::ScrubberLine);
      out.push_back(cols);

      StyledLine sep;
      for (int i = 0; i < layout.labelWidth + layout.valueWidth + chartWidth + 4; i++) {
        sep.Append(SenGlyph::ScrubberLine, ColorRole::ScrubberLine);
      }
      out.push_back(sep);
    }

    for (const auto &row : panel.rows) {
      out.push_back(BuildRowLine(row, layout));
      if (!row.timeline.IsEmpty()) {
        AppendTimeline(row.timeline, layout, out);
      }
    }

    if (!panel.timeline.IsEmpty()) {
      AppendTimeline(panel.timeline, layout, out);
    }

    out.push_back(StyledLine{});
  }
}

static void AppendSeparator(StyledLine &line) {
  line.AppendText(wxT(" "), ColorRole::Dim);
  line.Append(SenGlyph::Tick, ColorRole::Dim);
  line.AppendText(wxT(" "), ColorRole::Dim);
}

StyledLine BuildLiveHeader(const MonitorSession &session, const wxDateTime &now, const wxString &recordDir) {
  StyledLine line;
  line.AppendText(wxT("SENSORS MONITOR"), ColorRole::Title, true);
  line.AppendSpaces(2);

  long long up = 0;
  if (now.IsValid() && session.GetStartTime().IsValid()) {
    up = (now - session.GetStartTime()).GetSeconds().GetValue();
  }
  line.AppendText(wxT("up ") + FormatUptime(up), ColorRole::Dim);

  if (session.GetLastPoll().IsValid()) {
    AppendSeparator(line);
    line.AppendText(session.GetLastPoll().Format(kTimeOfDay), ColorRole::Dim);
  }

  if (session.IsPaused()) {
    AppendSeparator(line);
    line.AppendText(wxT("PAUSED"), ColorRole::Paused, true);
  }

  if (!recordDir.empty()) {
    AppendSeparator(line);
    line.AppendText(wxT("REC"), ColorRole::Recording);
    line.AppendText(wxT(" ") + recordDir, ColorRole::Dim);
  }

  return line;
}

StyledLine BuildHistoryHeader(const HistorySession &session) {
  StyledLine line;
  line.AppendText(wxT("SENSORS HISTORY"), ColorRole::Title, true);
  line.AppendSpaces(2);
  line.AppendText(session.GetCurrentDay(), ColorRole::ScrubberCursor, true);
  line.AppendText(wxString::Format(wxT("  [ %d/%d ]"), session.GetDayIndex() + 1, (int)session.GetDays().size()),
                  ColorRole::Dim);

  const HistoryView &view = session.GetView();
  if (!view.timeSlots.empty()) {
    line.AppendText(wxString::Format(wxT("  %s - %s  (%d readings, %d sensors)"),
                                     view.timeSlots.front().Format(kTimeOfDay),
                                     view.timeSlots.back().Format(kTimeOfDay),
                                     (int)view.rowCount,
                                     (int)view.sensors.size()),
                    ColorRole::Dim);
  }
  return line;
}

StyledLine BuildCursorLine(const HistorySession &session, int cols) {
  StyledLine line;
  const HistoryView &view = session.GetView();
  wxDateTime t = session.GetCursorTime();
  if (!t.IsValid())
    return line;

  line.AppendSpaces(2);
  line.AppendText(t.Format(kTimeOfDay), ColorRole::ScrubberCursor, true);
  line.AppendText(wxString::Format(wxT("  %d/%d"), session.GetCursor() + 1, (int)view.timeSlots.size()), ColorRole::Dim);
  line.AppendSpaces(2);

  int barWidth = std::max(10, cols - 30);
  line.AppendLine(ScrubberRenderer::Render(view.timeSlots, session.GetCursor(), barWidth));
  return line;
}

StyledLine BuildLegend() {
  StyledLine line;
  const struct {
    ColorRole role;
    const wxChar *name;
  } tiers[] = {
      {ColorRole::Ok, wxT(" ok ")},
      {ColorRole::Warn, wxT(" warm ")},
      {ColorRole::High, wxT(" high ")},
      {ColorRole::Critical, wxT(" crit ")},
  };

  for (const auto &t : tiers) {
    line.Append(SenGlyph::Blocks[7], t.role);
    line.Append(SenGlyph::Blocks[7], t.role);
    line.AppendText(t.name, ColorRole::Dim);
  }
  line.Append(SenGlyph::Tick, ColorRole::Tick);
  line.AppendText(wxT(" 1min"), ColorRole::Dim);
  return line;
}

static StyledLine BuildMessageLine(const wxString &text, ColorRole role, bool bold) {
  StyledLine line;
  line.AppendSpaces(1);
  line.AppendText(text, role, bold);
  return line;
}

std::vector<StyledLine> BuildLiveDocument(const MonitorSession &session,
                                          const wxDateTime &now,
                                          const wxString &recordDir,
                                          int maxChartWidth) {
  std::vector<StyledLine> doc;
  doc.push_back(BuildLiveHeader(session, now, recordDir));
  doc.push_back(StyledLine{});

  if (!session.GetLastError().empty()) {
    doc.push_back(BuildMessageLine(wxT("ERROR: ") + session.GetLastError(), ColorRole::Error, true));
    doc.push_back(StyledLine{});
  }

  if (session.GetReadings().empty()) {
    doc.push_back(BuildMessageLine(wxT("Waiting for sensor data..."), ColorRole::Dim, false));
    doc.push_back(StyledLine{});
  } else {
    int chartWidth = ChartWidthForColumns(session.GetCols(), maxChartWidth);
    LayoutPanels(BuildLivePanels(session, chartWidth), LivePanelLayout(), chartWidth, doc);
  }

  doc.push_back(BuildLegend());
  return doc;
}

std::vector<StyledLine> BuildHistoryDocument(const HistorySession &session, int maxChartWidth) {
  std::vector<StyledLine> doc;
  doc.push_back(BuildHistoryHeader(session));
  doc.push_back(StyledLine{});

  if (!session.GetLastError().empty()) {
    doc.push_back(BuildMessageLine(wxT("ERROR: ") + session.GetLastError(), ColorRole::Error, true));
    doc.push_back(StyledLine{});
  }

  if (session.GetView().IsEmpty()) {
    doc.push_back(BuildMessageLine(wxT("No data for this day."), ColorRole::Dim, false));
    return doc;
  }

  doc.push_back(BuildCursorLine(session, session.GetCols()));
  doc.push_back(StyledLine{});

  int chartWidth = ChartWidthForColumns(session.GetCols(), maxChartWidth);
  LayoutPanels(BuildHistoryPanels(session, chartWidth), HistoryPanelLayout(), chartWidth, doc);
  return doc;
}
