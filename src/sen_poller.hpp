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

#include <atomic>
#include <memory>
#include <wx/event.h>
#include <wx/weakref.h>

/**
 * Runs sensor polls on a detached worker thread and posts the result back to
 * a handler as EVT_SENSOR_READINGS_READY / EVT_SENSOR_READ_ERROR.
 *
 * At most one poll is in flight; the handler is held weakly, so a frame
 * closed during a poll simply never receives the result.
 */
class SensorPoller {
public:
  SensorPoller();
  ~SensorPoller();

  // false when a poll is already running
  bool ReadAsync(wxEvtHandler *handler);

  // Results of running polls are dropped.
  void Cancel();

private:
  struct State {
    std::atomic_bool inFlight{false};
    std::atomic_bool cancel{false};
  };

  static void QueueUiEvent(const std::shared_ptr<State> &state, const wxWeakRef<wxEvtHandler> &weak, wxEvent *event);

  std::shared_ptr<State> m_state;
};
