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

#include <string>
#include <unordered_map>
#include <vector>
#include <wx/datetime.h>

struct Point {
  double value = 0.0;
  wxDateTime timestamp; // invalid = no time information (never a tick)
};

/**
 * Fixed-capacity window of the most recent readings of one sensor.
 *
 * Lifetime min/peak cover every value ever pushed, including the ones
 * already evicted from the window.
 */
class RingBuffer {
public:
  explicit RingBuffer(size_t capacity);

  void Push(double value, const wxDateTime &timestamp);

  // Most recent min(n, Size()) values/points, oldest first.
  std::vector<double> LastN(int n) const;
  std::vector<Point> LastNPoints(int n) const;

  // Mean of the current window, 0 when empty.
  double Average() const;

  // Most recent value, 0 when empty.
  double Last() const;

  size_t Size() const { return m_size; }
  size_t Capacity() const { return m_capacity; }
  bool IsEmpty() const { return m_size == 0; }

  double LifetimeMin() const { return m_lifetimeMin; }
  double LifetimePeak() const { return m_lifetimePeak; }

private:
  // i-th oldest point of the window
  const Point &At(size_t i) const;

  std::vector<Point> m_slots;
  size_t m_capacity;
  size_t m_head = 0; // index of the oldest point
  size_t m_size = 0;

  double m_lifetimeMin;
  double m_lifetimePeak;
};

/**
 * Per-sensor history buffers, created lazily on the first Record() of a key.
 */
class SeriesStore {
public:
  explicit SeriesStore(size_t capacity);

  void Record(const std::string &key, double value, const wxDateTime &timestamp);

  // nullptr when the key was never recorded
  const RingBuffer *Get(const std::string &key) const;

  // Keys in first-recorded order.
  const std::vector<std::string> &Keys() const { return m_order; }

private:
  size_t m_capacity;
  std::unordered_map<std::string, RingBuffer> m_buffers;
  std::vector<std::string> m_order;
};
