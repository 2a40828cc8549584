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

#include "sen_window.hpp"
#include "utils.hpp"

#include <algorithm>
#include <unordered_map>

const std::vector<Point> *HistoryView::Series(const std::string &key) const {
  auto it = series.find(key);
  if (it == series.end() || it->second.empty())
    return nullptr;
  return &it->second;
}

Thresholds HistoryView::ThresholdsFor(const std::string &key) const {
  auto it = thresholds.find(key);
  if (it == thresholds.end())
    return Thresholds{};
  return it->second;
}

HistoryView BuildHistoryView(const std::vector<StoredReading> &rows) {
  ScopeTimer t("BuildHistoryView (%zu rows)", rows.size());

  HistoryView view;
  view.rowCount = rows.size();

  std::map<time_t, wxDateTime> slots;
  std::map<std::string, std::map<time_t, Point>> perKey;

  for (const auto &r : rows) {
    if (!r.timestamp.IsValid())
      continue;

    std::string key = r.Key();
    time_t sec = r.timestamp.GetTicks();

    slots[sec] = r.timestamp;
    perKey[key][sec] = Point{r.value, r.timestamp};

    if (r.high > 0 || r.crit > 0) {
      Thresholds th;
      if (r.high > 0)
        th.high = r.high;
      if (r.crit > 0)
        th.critical = r.crit;
      view.thresholds[key] = th;
    }
  }

  view.timeSlots.reserve(slots.size());
  for (const auto &s : slots) {
    view.timeSlots.push_back(s.second);
  }

  for (auto &kv : perKey) {
    std::vector<Point> &pts = view.series[kv.first];
    pts.reserve(kv.second.size());
    for (const auto &p : kv.second) {
      pts.push_back(p.second);
    }
    view.sensors.push_back(kv.first);
  }
  // std::map keeps sensors already sorted

  SEN_DEBUG_LOG("HIST: view rebuilt: %zu rows, %zu slots, %zu sensors",
                view.rowCount, view.timeSlots.size(), view.sensors.size());
  return view;
}

std::vector<Point> WindowBuilder::Build(const std::vector<Point> &seriesPoints,
                                        int cursorIndex,
                                        int width,
                                        const std::vector<wxDateTime> &timeSlots) {
  std::vector<Point> result;
  if (seriesPoints.empty() || timeSlots.empty() || width <= 0)
    return result;
  if (cursorIndex < 0 || cursorIndex >= (int)timeSlots.size())
    return result;

  std::unordered_map<time_t, double> byTime;
  byTime.reserve(seriesPoints.size());
  for (const auto &p : seriesPoints) {
    if (p.timestamp.IsValid()) {
      byTime[p.timestamp.GetTicks()] = p.value;
    }
  }

  const int nslots = (int)timeSlots.size();
  for (int i = width - 1; i >= 0; i--) {
    int slot = cursorIndex - i;
    if (slot < 0 || slot >= nslots)
      continue;

    const wxDateTime &t = timeSlots[(size_t)slot];
    auto it = byTime.find(t.GetTicks());
    if (it != byTime.end()) {
      result.push_back(Point{it->second, t});
    }
  }

  const wxDateTime &cursorTime = timeSlots[(size_t)cursorIndex];
  auto cur = byTime.find(cursorTime.GetTicks());
  if (cur != byTime.end()) {
    if (result.empty() || result.back().timestamp.GetTicks() != cursorTime.GetTicks()) {
      result.push_back(Point{cur->second, cursorTime});
    }
  }

  return result;
}

double NearestTimeLookup::FindNearest(const std::vector<Point> &sortedPoints, const wxDateTime &target) {
  if (sortedPoints.empty())
    return 0.0;
  if (!target.IsValid())
    return sortedPoints.front().value;

  bool found = false;
  double best = 0.0;
  wxLongLong bestDiff;

  for (const auto &p : sortedPoints) {
    if (!p.timestamp.IsValid())
      continue;

    wxLongLong diff = (p.timestamp.GetValue() - target.GetValue()).Abs();
    if (!found || diff < bestDiff) {
      found = true;
      best = p.value;
      bestDiff = diff;
    }
    // sorted input: once past the target and moving away, nothing closer follows
    if (p.timestamp.IsLaterThan(target) && diff > bestDiff)
      break;
  }

  return found ? best : sortedPoints.front().value;
}
