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
#include "sen_history.hpp"

#include <vector>

// True when pts[i] starts a new minute: it has a timestamp and either sits on
// second 0 or its minute differs from the one of pts[i-1]. Only the directly
// preceding point is compared, so a gap spanning exactly one hour with equal
// minutes produces no tick.
bool IsMinuteTick(const std::vector<Point> &pts, size_t i);

/**
 * One row of block glyphs, right aligned in a fixed number of cells.
 *
 * Missing history on the left is drawn with the dim "no data" glyph, never
 * interpolated. Minute boundaries replace the value glyph with a tick.
 */
class SparklineRenderer {
public:
  static StyledLine Render(const std::vector<Point> &points,
                           int width,
                           double rangeMin,
                           double rangeMax,
                           const Thresholds &thresholds);

  // Glyph index 0..7 of value inside [rangeMin, rangeMax].
  static int BlockIndex(double value, double rangeMin, double rangeMax);
};

// HH:MM labels under the minute ticks of a sparkline of the same width.
class TimelineRenderer {
public:
  static StyledLine Render(const std::vector<Point> &points, int width);
};

// Bar showing the current value against the high/critical thresholds.
class ThresholdScaleRenderer {
public:
  static StyledLine Render(double current,
                           double rangeMin,
                           double rangeMax,
                           const Thresholds &thresholds,
                           int width);
};

// Position of the cursor within a day of time slots, with hour marks.
class ScrubberRenderer {
public:
  static StyledLine Render(const std::vector<wxDateTime> &timeSlots, int cursor, int width);
};
