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

#include "sen_spark.hpp"

#include <algorithm>
#include <cmath>

bool IsMinuteTick(const std::vector<Point> &pts, size_t i) {
  if (i >= pts.size())
    return false;

  const wxDateTime &t = pts[i].timestamp;
  if (!t.IsValid())
    return false;

  if (t.GetSecond() == 0)
    return true;

  if (i > 0 && pts[i - 1].timestamp.IsValid()) {
    return t.GetMinute() != pts[i - 1].timestamp.GetMinute();
  }
  return false;
}

int SparklineRenderer::BlockIndex(double value, double rangeMin, double rangeMax) {
  double span = rangeMax - rangeMin;
  if (span <= 0)
    span = 1;

  double norm = (value - rangeMin) / span;
  norm = std::max(0.0, std::min(1.0, norm));

  int idx = (int)(norm * 7);
  return std::clamp(idx, 0, 7);
}

StyledLine SparklineRenderer::Render(const std::vector<Point> &points,
                                     int width,
                                     double rangeMin,
                                     double rangeMax,
                                     const Thresholds &thresholds) {
  StyledLine line;
  if (width <= 0)
    return line;

  line.cells.reserve((size_t)width);

  if (points.empty()) {
    for (int i = 0; i < width; i++) {
      line.Append(SenGlyph::NoData, ColorRole::NoData);
    }
    return line;
  }

  // keep the most recent points only
  std::vector<Point> pts;
  if (points.size() > (size_t)width) {
    pts.assign(points.end() - width, points.end());
  } else {
    pts = points;
  }

  int padLen = width - (int)pts.size();
  for (int i = 0; i < padLen; i++) {
    line.Append(SenGlyph::NoData, ColorRole::NoData);
  }

  for (size_t i = 0; i < pts.size(); i++) {
    if (IsMinuteTick(pts, i)) {
      line.Append(SenGlyph::Tick, ColorRole::Tick);
      continue;
    }

    double v = pts[i].value;
    int idx = BlockIndex(v, rangeMin, rangeMax);
    Tier tier = ValueClassifier::Classify(v, thresholds);
    line.Append(SenGlyph::Blocks[idx],
                ValueClassifier::RoleFor(tier),
                ValueClassifier::IsEmphasized(v, thresholds));
  }

  return line;
}

StyledLine TimelineRenderer::Render(const std::vector<Point> &points, int width) {
  StyledLine line;
  if (width <= 0)
    return line;

  line.cells.assign((size_t)width, StyledCell{L' ', ColorRole::Tick, false});
  if (points.empty())
    return line;

  std::vector<Point> pts;
  if (points.size() > (size_t)width) {
    pts.assign(points.end() - width, points.end());
  } else {
    pts = points;
  }

  int padLen = width - (int)pts.size();

  // Candidates come in column order, so placement is earliest-first.
  int lastEnd = -1;
  for (size_t i = 0; i < pts.size(); i++) {
    if (!IsMinuteTick(pts, i))
      continue;

    const wxString label = pts[i].timestamp.Format(wxT("%H:%M"));
    int pos = padLen + (int)i;
    int start = std::max(0, pos - 2);
    int end = start + (int)label.length();

    if (end > width)
      continue;
    if (start <= lastEnd + 1)
      continue;

    for (size_t j = 0; j < label.length(); j++) {
      wxUniChar ch = label[j];
      line.cells[(size_t)start + j].glyph = (wchar_t)ch.GetValue();
    }
    lastEnd = end;
  }

  return line;
}

// Column of value on a scale of width cells; returns false for values that
// cannot be mapped (NaN).
static bool ScaleColumn(double value, double rangeMin, double span, int width, long &col) {
  double pos = (double)(width - 1) * (value - rangeMin) / span;
  if (std::isnan(pos))
    return false;

  pos = std::max(-1.0, std::min((double)width, pos));
  col = std::lround(pos);
  return true;
}

StyledLine ThresholdScaleRenderer::Render(double current,
                                          double rangeMin,
                                          double rangeMax,
                                          const Thresholds &thresholds,
                                          int width) {
  StyledLine line;
  if (width <= 0)
    return line;

  double span = rangeMax - rangeMin;
  if (span <= 0)
    span = 1;

  line.cells.assign((size_t)width, StyledCell{SenGlyph::ScaleDot, ColorRole::ScaleBackground, false});

  long col = 0;
  if (thresholds.high && *thresholds.high > rangeMin &&
      ScaleColumn(*thresholds.high, rangeMin, span, width, col) && col >= 0 && col < width) {
    line.cells[(size_t)col] = StyledCell{SenGlyph::ScaleMarker, ColorRole::MarkerHigh, false};
  }

  // critical wins over high on the same column
  if (thresholds.critical && *thresholds.critical > rangeMin &&
      ScaleColumn(*thresholds.critical, rangeMin, span, width, col) && col >= 0 && col < width) {
    line.cells[(size_t)col] = StyledCell{SenGlyph::ScaleMarker, ColorRole::MarkerCritical, false};
  }

  long cur = 0;
  if (!ScaleColumn(current, rangeMin, span, width, cur)) {
    cur = 0;
  }
  cur = std::max(0L, std::min((long)width - 1, cur));

  Tier tier = ValueClassifier::Classify(current, thresholds);
  line.cells[(size_t)cur] = StyledCell{SenGlyph::Current, ValueClassifier::RoleFor(tier), true};

  return line;
}

StyledLine ScrubberRenderer::Render(const std::vector<wxDateTime> &timeSlots, int cursor, int width) {
  StyledLine line;
  if (timeSlots.empty() || width <= 0)
    return line;

  long long n = (long long)timeSlots.size();
  long long c = std::max(0LL, std::min(n - 1, (long long)cursor));

  long long pos = 0;
  if (n > 1) {
    pos = c * (width - 1) / (n - 1);
  }
  if (pos >= width)
    pos = width - 1;

  line.cells.reserve((size_t)width);
  for (long long i = 0; i < width; i++) {
    if (i == pos) {
      line.Append(SenGlyph::Current, ColorRole::ScrubberCursor, true);
      continue;
    }

    long long slot = 0;
    if (n > 1 && width > 1) {
      slot = i * (n - 1) / (width - 1);
    }
    if (slot > 0 && slot < n && timeSlots[slot].GetHour() != timeSlots[slot - 1].GetHour()) {
      line.Append(SenGlyph::Tick, ColorRole::Tick);
    } else {
      line.Append(SenGlyph::ScrubberLine, ColorRole::ScrubberLine);
    }
  }

  return line;
}
