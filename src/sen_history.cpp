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

#include "sen_history.hpp"
#include "utils.hpp"

#include <algorithm>
#include <limits>

RingBuffer::RingBuffer(size_t capacity)
    : m_slots(capacity),
      m_capacity(capacity),
      m_lifetimeMin(std::numeric_limits<double>::infinity()),
      m_lifetimePeak(-std::numeric_limits<double>::infinity()) {
}

const Point &RingBuffer::At(size_t i) const {
  return m_slots[(m_head + i) % m_capacity];
}

void RingBuffer::Push(double value, const wxDateTime &timestamp) {
  if (m_capacity > 0) {
    if (m_size < m_capacity) {
      m_slots[(m_head + m_size) % m_capacity] = Point{value, timestamp};
      m_size++;
    } else {
      // full: overwrite the oldest slot and move the head past it
      m_slots[m_head] = Point{value, timestamp};
      m_head = (m_head + 1) % m_capacity;
    }
  }

  m_lifetimeMin = std::min(m_lifetimeMin, value);
  m_lifetimePeak = std::max(m_lifetimePeak, value);
}

std::vector<double> RingBuffer::LastN(int n) const {
  std::vector<double> vals;
  if (n <= 0 || m_size == 0)
    return vals;

  size_t count = std::min((size_t)n, m_size);
  vals.reserve(count);
  for (size_t i = m_size - count; i < m_size; i++) {
    vals.push_back(At(i).value);
  }
  return vals;
}

std::vector<Point> RingBuffer::LastNPoints(int n) const {
  std::vector<Point> out;
  if (n <= 0 || m_size == 0)
    return out;

  size_t count = std::min((size_t)n, m_size);
  out.reserve(count);
  for (size_t i = m_size - count; i < m_size; i++) {
    out.push_back(At(i));
  }
  return out;
}

double RingBuffer::Average() const {
  if (m_size == 0)
    return 0.0;

  double sum = 0.0;
  for (size_t i = 0; i < m_size; i++) {
    sum += At(i).value;
  }
  return sum / (double)m_size;
}

double RingBuffer::Last() const {
  if (m_size == 0)
    return 0.0;
  return At(m_size - 1).value;
}

SeriesStore::SeriesStore(size_t capacity) : m_capacity(capacity) {
}

void SeriesStore::Record(const std::string &key, double value, const wxDateTime &timestamp) {
  auto it = m_buffers.find(key);
  if (it == m_buffers.end()) {
    SEN_TRACE_LOG("HIST: new series '%s' (capacity=%zu)", key.c_str(), m_capacity);
    it = m_buffers.emplace(key, RingBuffer(m_capacity)).first;
    m_order.push_back(key);
  }
  it->second.Push(value, timestamp);
}

const RingBuffer *SeriesStore::Get(const std::string &key) const {
  auto it = m_buffers.find(key);
  if (it == m_buffers.end())
    return nullptr;
  return &it->second;
}
