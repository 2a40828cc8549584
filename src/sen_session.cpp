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

#include "sen_session.hpp"
#include "utils.hpp"

#include <algorithm>
#include <set>
#include <utility>
#include <wx/defs.h>

HostKey MapKey(int keyCode, bool shift) {
  switch (keyCode) {
    case 'Q':
    case 'q':
    case WXK_ESCAPE:
      return HostKey::Quit;

    case WXK_UP:
    case WXK_NUMPAD_UP:
    case 'K':
    case 'k':
      return HostKey::Up;

    case WXK_DOWN:
    case WXK_NUMPAD_DOWN:
    case 'J':
    case 'j':
      return HostKey::Down;

    case WXK_LEFT:
    case WXK_NUMPAD_LEFT:
    case 'H':
    case 'h':
      return shift ? HostKey::SkipLeft : HostKey::Left;

    case WXK_RIGHT:
    case WXK_NUMPAD_RIGHT:
    case 'L':
    case 'l':
      return shift ? HostKey::SkipRight : HostKey::Right;

    case WXK_HOME:
    case WXK_NUMPAD_HOME:
      return HostKey::Home;

    case WXK_END:
    case WXK_NUMPAD_END:
      return HostKey::End;

    case '[':
      return HostKey::OlderDay;
    case ']':
      return HostKey::NewerDay;

    case WXK_SPACE:
    case 'P':
    case 'p':
      return HostKey::Pause;

    default:
      return HostKey::None;
  }
}

// ---------------------------------------------------------------------------
// MonitorSession
// ---------------------------------------------------------------------------

MonitorSession::MonitorSession(size_t capacity, const wxDateTime &startTime)
    : m_store(capacity), m_startTime(startTime) {
}

HostCommand MonitorSession::Handle(const HostEvent &ev) {
  return std::visit([this](const auto &e) { return On(e); }, ev);
}

HostCommand MonitorSession::On(const TickEvent &ev) {
  m_now = ev.now;

  HostCommand cmd;
  cmd.fetch = !m_paused;
  return cmd;
}

HostCommand MonitorSession::On(const DataArrivedEvent &ev) {
  m_readings = ev.readings;
  m_lastPoll = ev.timestamp;

  for (const auto &r : m_readings) {
    m_store.Record(r.Key(), r.value, ev.timestamp);
  }
  UpdateOrder();

  m_lastError.clear();

  SEN_TRACE_LOG("MON: %zu readings recorded, %zu series", m_readings.size(), m_store.Keys().size());

  HostCommand cmd;
  cmd.persist = !m_readings.empty();
  return cmd;
}

HostCommand MonitorSession::On(const KeyPressedEvent &ev) {
  HostCommand cmd;
  switch (ev.key) {
    case HostKey::Quit:
      cmd.quit = true;
      break;
    case HostKey::Up:
      if (m_scroll > 0)
        m_scroll--;
      break;
    case HostKey::Down:
      m_scroll++;
      break;
    case HostKey::Home:
      m_scroll = 0;
      break;
    case HostKey::Pause:
      m_paused = !m_paused;
      SEN_DEBUG_LOG("MON: %s", m_paused ? "paused" : "resumed");
      break;
    default:
      break;
  }
  return cmd;
}

HostCommand MonitorSession::On(const ResizedEvent &ev) {
  m_cols = std::max(0, ev.cols);
  m_rows = std::max(0, ev.rows);
  return HostCommand{};
}

HostCommand MonitorSession::On(const ErrorEvent &ev) {
  m_lastError = ev.message;
  return HostCommand{};
}

void MonitorSession::UpdateOrder() {
  std::set<std::string> seen(m_order.begin(), m_order.end());
  std::vector<std::string> newKeys;

  for (const auto &r : m_readings) {
    std::string key = r.Key();
    if (seen.insert(key).second) {
      newKeys.push_back(key);
    }
  }

  std::sort(newKeys.begin(), newKeys.end());
  m_order.insert(m_order.end(), newKeys.begin(), newKeys.end());
}

void MonitorSession::ClampScroll(int maxScroll) {
  m_scroll = std::max(0, std::min(m_scroll, std::max(0, maxScroll)));
}

// ---------------------------------------------------------------------------
// HistorySession
// ---------------------------------------------------------------------------

HistorySession::HistorySession(const std::vector<wxString> &days, DayLoader loader)
    : m_days(days), m_loader(std::move(loader)) {
  LoadDay();
}

wxString HistorySession::GetCurrentDay() const {
  if (m_dayIndex < 0 || m_dayIndex >= (int)m_days.size())
    return wxEmptyString;
  return m_days[(size_t)m_dayIndex];
}

wxDateTime HistorySession::GetCursorTime() const {
  if (m_cursor < 0 || m_cursor >= (int)m_view.timeSlots.size())
    return wxDateTime();
  return m_view.timeSlots[(size_t)m_cursor];
}

void HistorySession::LoadDay() {
  m_view = HistoryView();
  m_cursor = 0;
  m_scroll = 0;

  wxString day = GetCurrentDay();
  if (day.empty() || !m_loader)
    return;

  std::vector<StoredReading> rows;
  wxString error;
  if (!m_loader(day, rows, error)) {
    m_lastError = error;
    SEN_DEBUG_LOG("HIST: day %s: %s", wxToStd(day).c_str(), wxToStd(error).c_str());
    return;
  }

  m_lastError.clear();
  m_view = BuildHistoryView(rows);
  if (!m_view.timeSlots.empty()) {
    m_cursor = (int)m_view.timeSlots.size() - 1;
  }

  SEN_DEBUG_LOG("HIST: day %s loaded (%zu rows)", wxToStd(day).c_str(), rows.size());
}

void HistorySession::MoveCursor(int delta) {
  int n = (int)m_view.timeSlots.size();
  if (n == 0)
    return;
  m_cursor = std::max(0, std::min(n - 1, m_cursor + delta));
}

HostCommand HistorySession::Handle(const HostEvent &ev) {
  return std::visit([this](const auto &e) { return On(e); }, ev);
}

HostCommand HistorySession::On(const TickEvent &) {
  return HostCommand{};
}

HostCommand HistorySession::On(const DataArrivedEvent &) {
  // history is read from disk only
  return HostCommand{};
}

HostCommand HistorySession::On(const KeyPressedEvent &ev) {
  HostCommand cmd;
  switch (ev.key) {
    case HostKey::Quit:
      cmd.quit = true;
      break;
    case HostKey::Left:
      MoveCursor(-1);
      break;
    case HostKey::Right:
      MoveCursor(1);
      break;
    case HostKey::SkipLeft:
      MoveCursor(-SkipSlots);
      break;
    case HostKey::SkipRight:
      MoveCursor(SkipSlots);
      break;
    case HostKey::Home:
      m_cursor = 0;
      break;
    case HostKey::End:
      if (!m_view.timeSlots.empty())
        m_cursor = (int)m_view.timeSlots.size() - 1;
      break;
    case HostKey::OlderDay:
      if (m_dayIndex < (int)m_days.size() - 1) {
        m_dayIndex++;
        LoadDay();
      }
      break;
    case HostKey::NewerDay:
      if (m_dayIndex > 0) {
        m_dayIndex--;
        LoadDay();
      }
      break;
    case HostKey::Up:
      if (m_scroll > 0)
        m_scroll--;
      break;
    case HostKey::Down:
      m_scroll++;
      break;
    default:
      break;
  }
  return cmd;
}

HostCommand HistorySession::On(const ResizedEvent &ev) {
  m_cols = std::max(0, ev.cols);
  m_rows = std::max(0, ev.rows);
  return HostCommand{};
}

HostCommand HistorySession::On(const ErrorEvent &ev) {
  m_lastError = ev.message;
  return HostCommand{};
}

void HistorySession::ClampScroll(int maxScroll) {
  m_scroll = std::max(0, std::min(m_scroll, std::max(0, maxScroll)));
}
