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
#include "sen_history.hpp"
#include "sen_reading.hpp"

#include <map>
#include <string>
#include <vector>

/**
 * One logged day regrouped for browsing.
 *
 * timeSlots is the sorted union of all row timestamps (one second
 * resolution), each series is sorted by time with at most one point per
 * second; when the log repeats a second the last row wins.
 */
struct HistoryView {
  std::map<std::string, std::vector<Point>> series;
  std::vector<wxDateTime> timeSlots;
  std::map<std::string, Thresholds> thresholds;
  std::vector<std::string> sensors; // sorted keys
  size_t rowCount = 0;

  bool IsEmpty() const { return timeSlots.empty(); }

  // nullptr when key has no points
  const std::vector<Point> *Series(const std::string &key) const;

  // Empty thresholds when none were logged for key.
  Thresholds ThresholdsFor(const std::string &key) const;
};

HistoryView BuildHistoryView(const std::vector<StoredReading> &rows);

/**
 * Builds the points a sparkline shows for one sensor when the history cursor
 * sits at cursorIndex.
 *
 * The global slots cursorIndex-width+1 .. cursorIndex are looked up in the
 * series; slots the sensor has no value for are left out, so the result may
 * be shorter than width and the sparkline shows the gap as missing data.
 */
class WindowBuilder {
public:
  static std::vector<Point> Build(const std::vector<Point> &seriesPoints,
                                  int cursorIndex,
                                  int width,
                                  const std::vector<wxDateTime> &timeSlots);
};

class NearestTimeLookup {
public:
  // Value of the point closest in time to target, earlier point on a tie.
  // sortedPoints must be ordered by time. Returns 0 for an empty series.
  static double FindNearest(const std::vector<Point> &sortedPoints, const wxDateTime &target);
};
