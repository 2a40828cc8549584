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

#include "sen_history.hpp"
#include "sen_reading.hpp"
#include "sen_window.hpp"

#include <functional>
#include <string>
#include <variant>
#include <vector>
#include <wx/datetime.h>
#include <wx/string.h>

enum class HostKey {
  None,
  Quit,
  Up,
  Down,
  Left,
  Right,
  SkipLeft,  // one minute back
  SkipRight, // one minute forward
  Home,
  End,
  OlderDay,
  NewerDay,
  Pause
};

// Events the GUI host feeds into a session, one at a time on the GUI thread.
struct TickEvent {
  wxDateTime now;
};

struct DataArrivedEvent {
  std::vector<SensorReading> readings;
  wxDateTime timestamp;
};

struct KeyPressedEvent {
  HostKey key = HostKey::None;
};

struct ResizedEvent {
  int cols = 0;
  int rows = 0;
};

struct ErrorEvent {
  wxString message;
};

using HostEvent = std::variant<TickEvent, DataArrivedEvent, KeyPressedEvent, ResizedEvent, ErrorEvent>;

// What the host has to do after an event was handled.
struct HostCommand {
  bool fetch = false;   // start a sensor poll
  bool persist = false; // append the last readings to the disk log
  bool quit = false;
};

// wx key code (+ shift state) to a session key, HostKey::None when unbound.
HostKey MapKey(int keyCode, bool shift);

/**
 * State of the live monitor.
 *
 * Owns the per-sensor history; every DataArrivedEvent is recorded with the
 * poll timestamp supplied by the host.
 */
class MonitorSession {
public:
  explicit MonitorSession(size_t capacity, const wxDateTime &startTime = wxDateTime::Now());

  HostCommand Handle(const HostEvent &ev);

  const SeriesStore &GetStore() const { return m_store; }
  const std::vector<SensorReading> &GetReadings() const { return m_readings; }

  // Keys in display order: known keys keep their place, new ones are
  // appended sorted.
  const std::vector<std::string> &GetOrder() const { return m_order; }

  const wxDateTime &GetLastPoll() const { return m_lastPoll; }
  // time of the last tick, invalid before the first one
  const wxDateTime &GetNow() const { return m_now; }
  const wxDateTime &GetStartTime() const { return m_startTime; }
  bool IsPaused() const { return m_paused; }

  int GetScroll() const { return m_scroll; }
  void ClampScroll(int maxScroll);

  int GetCols() const { return m_cols; }
  int GetRows() const { return m_rows; }

  const wxString &GetLastError() const { return m_lastError; }
  void SetLastError(const wxString &error) { m_lastError = error; }

private:
  HostCommand On(const TickEvent &ev);
  HostCommand On(const DataArrivedEvent &ev);
  HostCommand On(const KeyPressedEvent &ev);
  HostCommand On(const ResizedEvent &ev);
  HostCommand On(const ErrorEvent &ev);

  void UpdateOrder();

  SeriesStore m_store;
  std::vector<SensorReading> m_readings;
  std::vector<std::string> m_order;

  wxDateTime m_startTime;
  wxDateTime m_lastPoll;
  wxDateTime m_now;
  bool m_paused = false;

  int m_scroll = 0;
  int m_cols = 0;
  int m_rows = 0;

  wxString m_lastError;
};

// Loads the rows of one day; false + error when the day cannot be read.
using DayLoader = std::function<bool(const wxString &day, std::vector<StoredReading> &rows, wxString &error)>;

/**
 * State of the history browser: a list of logged days, the view of the
 * selected day and a cursor over its time slots.
 */
class HistorySession {
public:
  static constexpr int SkipSlots = 60;

  // days newest first; the first day is loaded immediately
  HistorySession(const std::vector<wxString> &days, DayLoader loader);

  HostCommand Handle(const HostEvent &ev);

  const HistoryView &GetView() const { return m_view; }
  const std::vector<wxString> &GetDays() const { return m_days; }
  int GetDayIndex() const { return m_dayIndex; }
  wxString GetCurrentDay() const;

  int GetCursor() const { return m_cursor; }
  // invalid when the day has no data
  wxDateTime GetCursorTime() const;

  int GetScroll() const { return m_scroll; }
  void ClampScroll(int maxScroll);

  int GetCols() const { return m_cols; }
  int GetRows() const { return m_rows; }

  const wxString &GetLastError() const { return m_lastError; }

private:
  HostCommand On(const TickEvent &ev);
  HostCommand On(const DataArrivedEvent &ev);
  HostCommand On(const KeyPressedEvent &ev);
  HostCommand On(const ResizedEvent &ev);
  HostCommand On(const ErrorEvent &ev);

  void LoadDay();
  void MoveCursor(int delta);

  std::vector<wxString> m_days;
  int m_dayIndex = 0;
  DayLoader m_loader;

  HistoryView m_view;
  int m_cursor = 0;

  int m_scroll = 0;
  int m_cols = 0;
  int m_rows = 0;

  wxString m_lastError;
};
