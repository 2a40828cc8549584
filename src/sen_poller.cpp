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

#include "sen_poller.hpp"
#include "sen_ev.hpp"
#include "sen_session.hpp"
#include "sen_sources.hpp"
#include "utils.hpp"

#include <thread>
#include <wx/app.h>

SensorPoller::SensorPoller() : m_state(std::make_shared<State>()) {
}

SensorPoller::~SensorPoller() {
  Cancel();
}

void SensorPoller::Cancel() {
  m_state->cancel.store(true);
}

bool SensorPoller::ReadAsync(wxEvtHandler *handler) {
  if (!handler)
    return false;

  bool expected = false;
  if (!m_state->inFlight.compare_exchange_strong(expected, true)) {
    SEN_TRACE_LOG("POLL: previous poll still running, skipped");
    return false;
  }

  wxWeakRef<wxEvtHandler> weak(handler);
  std::shared_ptr<State> state = m_state;

  std::thread([state, weak]() {
    std::vector<SensorReading> readings;
    wxString error;

    bool ok = ReadAllSensors(readings, error);

    if (ok) {
      DataArrivedEvent data;
      data.readings = std::move(readings);
      data.timestamp = wxDateTime::Now();

      wxThreadEvent evt(EVT_SENSOR_READINGS_READY);
      evt.SetPayload(data);
      QueueUiEvent(state, weak, evt.Clone());
    } else {
      wxThreadEvent evt(EVT_SENSOR_READ_ERROR);
      evt.SetString(error);
      QueueUiEvent(state, weak, evt.Clone());
    }

    state->inFlight.store(false);
  }).detach();

  return true;
}

void SensorPoller::QueueUiEvent(const std::shared_ptr<State> &state, const wxWeakRef<wxEvtHandler> &weak, wxEvent *event) {
  if (!event)
    return;

  if (state->cancel.load(std::memory_order_relaxed)) {
    delete event;
    return;
  }

  if (!wxTheApp) {
    delete event;
    return;
  }

  wxTheApp->CallAfter([weak, event]() {
    wxEvtHandler *h = weak.get();
    if (!h) {
      delete event;
      return;
    }
    wxQueueEvent(h, event);
  });
}
