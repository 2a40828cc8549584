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

#include <unity.h>
#include <wx/defs.h>
#include <wx/init.h>

#include "sen_session.hpp"

#include <map>

static wxDateTime At(int day, int h, int m, int s) {
  return wxDateTime((wxDateTime::wxDateTime_t)day, wxDateTime::Oct, 2026, (wxDateTime::wxDateTime_t)h,
                    (wxDateTime::wxDateTime_t)m, (wxDateTime::wxDateTime_t)s);
}

static SensorReading Reading(const char *chip, const char *label, double v) {
  SensorReading r;
  r.chip = chip;
  r.label = label;
  r.value = v;
  return r;
}

static StoredReading Row(const wxDateTime &ts, double v) {
  StoredReading r;
  r.timestamp = ts;
  r.chip = "coretemp-isa-0000";
  r.label = "Core 0";
  r.value = v;
  return r;
}

// In-memory replacement for the daily log files.
struct FakeDays {
  std::map<wxString, std::vector<StoredReading>> days;
  std::vector<wxString> loaded;

  DayLoader Loader() {
    return [this](const wxString &day, std::vector<StoredReading> &rows, wxString &error) {
      loaded.push_back(day);
      auto it = days.find(day);
      if (it == days.end()) {
        error = wxT("missing ") + day;
        return false;
      }
      rows = it->second;
      return true;
    };
  }
};

static HostCommand Key(MonitorSession &s, HostKey key) {
  return s.Handle(KeyPressedEvent{key});
}

static HostCommand Key(HistorySession &s, HostKey key) {
  return s.Handle(KeyPressedEvent{key});
}

void setUp(void) {
}

void tearDown(void) {
}

void test_tick_requests_fetch_unless_paused(void) {
  MonitorSession s(10, At(17, 12, 0, 0));
  TEST_ASSERT_FALSE(s.GetNow().IsValid());

  HostCommand cmd = s.Handle(TickEvent{At(17, 12, 0, 1)});
  TEST_ASSERT_TRUE(cmd.fetch);
  TEST_ASSERT_FALSE(cmd.persist);
  TEST_ASSERT_TRUE(s.GetNow() == At(17, 12, 0, 1));

  Key(s, HostKey::Pause);
  TEST_ASSERT_TRUE(s.IsPaused());
  TEST_ASSERT_FALSE(s.Handle(TickEvent{At(17, 12, 0, 2)}).fetch);
  // the clock keeps running while paused
  TEST_ASSERT_TRUE(s.GetNow() == At(17, 12, 0, 2));

  Key(s, HostKey::Pause);
  TEST_ASSERT_TRUE(s.Handle(TickEvent{At(17, 12, 0, 3)}).fetch);
}

void test_data_is_recorded_in_stable_order(void) {
  MonitorSession s(10, At(17, 12, 0, 0));

  DataArrivedEvent first;
  first.timestamp = At(17, 12, 0, 1);
  first.readings.push_back(Reading("nvme-pci-0300", "Composite", 36.9));
  first.readings.push_back(Reading("coretemp-isa-0000", "Core 0", 45.0));

  HostCommand cmd = s.Handle(first);
  TEST_ASSERT_TRUE(cmd.persist);
  TEST_ASSERT_FALSE(cmd.fetch);
  TEST_ASSERT_TRUE(s.GetLastPoll().IsEqualTo(At(17, 12, 0, 1)));

  TEST_ASSERT_EQUAL_UINT(2, s.GetOrder().size());
  TEST_ASSERT_EQUAL_STRING("coretemp-isa-0000/Core 0", s.GetOrder()[0].c_str());
  TEST_ASSERT_EQUAL_STRING("nvme-pci-0300/Composite", s.GetOrder()[1].c_str());

  // a new sensor is appended, known ones keep their place
  DataArrivedEvent second;
  second.timestamp = At(17, 12, 0, 2);
  second.readings.push_back(Reading("acpitz-acpi-0", "temp1", 27.8));
  second.readings.push_back(Reading("coretemp-isa-0000", "Core 0", 47.0));
  s.Handle(second);

  TEST_ASSERT_EQUAL_UINT(3, s.GetOrder().size());
  TEST_ASSERT_EQUAL_STRING("acpitz-acpi-0/temp1", s.GetOrder()[2].c_str());

  const RingBuffer *core = s.GetStore().Get("coretemp-isa-0000/Core 0");
  TEST_ASSERT_NOT_NULL(core);
  TEST_ASSERT_EQUAL_UINT(2, core->Size());
  TEST_ASSERT_FLOAT_WITHIN(0.001f, 47.0, (float)core->Last());
  TEST_ASSERT_TRUE(core->LastNPoints(1)[0].timestamp.IsEqualTo(At(17, 12, 0, 2)));
}

void test_empty_poll_is_not_persisted(void) {
  MonitorSession s(10);
  DataArrivedEvent empty;
  empty.timestamp = At(17, 12, 0, 1);
  TEST_ASSERT_FALSE(s.Handle(empty).persist);
}

void test_error_is_kept_until_next_data(void) {
  MonitorSession s(10);
  s.Handle(ErrorEvent{wxT("sensors: command not found")});
  TEST_ASSERT_TRUE(s.GetLastError() == wxT("sensors: command not found"));

  DataArrivedEvent data;
  data.timestamp = At(17, 12, 0, 1);
  data.readings.push_back(Reading("coretemp-isa-0000", "Core 0", 45.0));
  s.Handle(data);
  TEST_ASSERT_TRUE(s.GetLastError().empty());
}

void test_monitor_keys(void) {
  MonitorSession s(10);

  TEST_ASSERT_TRUE(Key(s, HostKey::Quit).quit);

  Key(s, HostKey::Up);
  TEST_ASSERT_EQUAL_INT(0, s.GetScroll());
  Key(s, HostKey::Down);
  Key(s, HostKey::Down);
  Key(s, HostKey::Down);
  TEST_ASSERT_EQUAL_INT(3, s.GetScroll());
  s.ClampScroll(2);
  TEST_ASSERT_EQUAL_INT(2, s.GetScroll());
  Key(s, HostKey::Home);
  TEST_ASSERT_EQUAL_INT(0, s.GetScroll());

  s.Handle(ResizedEvent{120, 40});
  TEST_ASSERT_EQUAL_INT(120, s.GetCols());
  TEST_ASSERT_EQUAL_INT(40, s.GetRows());
}

void test_key_mapping(void) {
  TEST_ASSERT_TRUE(MapKey('Q', false) == HostKey::Quit);
  TEST_ASSERT_TRUE(MapKey(WXK_ESCAPE, false) == HostKey::Quit);
  TEST_ASSERT_TRUE(MapKey(WXK_LEFT, false) == HostKey::Left);
  TEST_ASSERT_TRUE(MapKey(WXK_LEFT, true) == HostKey::SkipLeft);
  TEST_ASSERT_TRUE(MapKey('L', true) == HostKey::SkipRight);
  TEST_ASSERT_TRUE(MapKey('[', false) == HostKey::OlderDay);
  TEST_ASSERT_TRUE(MapKey(']', false) == HostKey::NewerDay);
  TEST_ASSERT_TRUE(MapKey(WXK_SPACE, false) == HostKey::Pause);
  TEST_ASSERT_TRUE(MapKey('X', false) == HostKey::None);
}

void test_history_cursor_starts_at_end_and_clamps(void) {
  FakeDays fake;
  for (int i = 0; i < 100; i++) {
    fake.days[wxT("2026-10-17")].push_back(Row(At(17, 10, 0, 0) + wxTimeSpan::Seconds(i), 40.0 + i % 5));
  }

  std::vector<wxString> days = {wxT("2026-10-17")};
  HistorySession s(days, fake.Loader());

  TEST_ASSERT_EQUAL_UINT(100, s.GetView().timeSlots.size());
  TEST_ASSERT_EQUAL_INT(99, s.GetCursor());

  Key(s, HostKey::Right);
  TEST_ASSERT_EQUAL_INT(99, s.GetCursor());

  Key(s, HostKey::Left);
  TEST_ASSERT_EQUAL_INT(98, s.GetCursor());

  Key(s, HostKey::SkipLeft);
  TEST_ASSERT_EQUAL_INT(38, s.GetCursor());
  Key(s, HostKey::SkipLeft);
  TEST_ASSERT_EQUAL_INT(0, s.GetCursor());

  Key(s, HostKey::SkipRight);
  TEST_ASSERT_EQUAL_INT(HistorySession::SkipSlots, s.GetCursor());

  Key(s, HostKey::Home);
  TEST_ASSERT_EQUAL_INT(0, s.GetCursor());
  Key(s, HostKey::End);
  TEST_ASSERT_EQUAL_INT(99, s.GetCursor());
  TEST_ASSERT_TRUE(s.GetCursorTime().IsEqualTo(At(17, 10, 1, 39)));
}

void test_history_day_switch_rebuilds_view(void) {
  FakeDays fake;
  fake.days[wxT("2026-10-17")].push_back(Row(At(17, 8, 0, 0), 40.0));
  fake.days[wxT("2026-10-17")].push_back(Row(At(17, 8, 0, 1), 41.0));
  fake.days[wxT("2026-10-16")].push_back(Row(At(16, 9, 0, 0), 50.0));

  std::vector<wxString> days = {wxT("2026-10-17"), wxT("2026-10-16")};
  HistorySession s(days, fake.Loader());
  TEST_ASSERT_TRUE(s.GetCurrentDay() == wxT("2026-10-17"));
  TEST_ASSERT_EQUAL_UINT(2, s.GetView().timeSlots.size());

  // ] at the newest day does nothing
  Key(s, HostKey::NewerDay);
  TEST_ASSERT_EQUAL_INT(0, s.GetDayIndex());
  TEST_ASSERT_EQUAL_UINT(1, fake.loaded.size());

  Key(s, HostKey::OlderDay);
  TEST_ASSERT_EQUAL_INT(1, s.GetDayIndex());
  TEST_ASSERT_TRUE(s.GetCurrentDay() == wxT("2026-10-16"));
  TEST_ASSERT_EQUAL_UINT(1, s.GetView().timeSlots.size());
  TEST_ASSERT_EQUAL_INT(0, s.GetCursor());

  Key(s, HostKey::OlderDay);
  TEST_ASSERT_EQUAL_INT(1, s.GetDayIndex());

  Key(s, HostKey::NewerDay);
  TEST_ASSERT_EQUAL_INT(0, s.GetDayIndex());
  TEST_ASSERT_EQUAL_INT(1, s.GetCursor());
  TEST_ASSERT_EQUAL_UINT(3, fake.loaded.size());
}

void test_history_unreadable_day(void) {
  FakeDays fake;
  fake.days[wxT("2026-10-17")].push_back(Row(At(17, 8, 0, 0), 40.0));

  std::vector<wxString> days = {wxT("2026-10-17"), wxT("2026-10-10")};
  HistorySession s(days, fake.Loader());
  TEST_ASSERT_TRUE(s.GetLastError().empty());

  Key(s, HostKey::OlderDay);
  TEST_ASSERT_TRUE(s.GetView().IsEmpty());
  TEST_ASSERT_FALSE(s.GetLastError().empty());
  TEST_ASSERT_FALSE(s.GetCursorTime().IsValid());

  // cursor keys on an empty view are harmless
  Key(s, HostKey::Left);
  Key(s, HostKey::End);
  TEST_ASSERT_EQUAL_INT(0, s.GetCursor());

  Key(s, HostKey::NewerDay);
  TEST_ASSERT_TRUE(s.GetLastError().empty());
  TEST_ASSERT_FALSE(s.GetView().IsEmpty());
}

void test_history_ignores_live_events(void) {
  FakeDays fake;
  HistorySession s(std::vector<wxString>(), fake.Loader());
  TEST_ASSERT_TRUE(s.GetView().IsEmpty());
  TEST_ASSERT_TRUE(s.GetCurrentDay().empty());

  HostCommand cmd = s.Handle(TickEvent{At(17, 12, 0, 0)});
  TEST_ASSERT_FALSE(cmd.fetch);
  cmd = s.Handle(DataArrivedEvent{});
  TEST_ASSERT_FALSE(cmd.persist);
  TEST_ASSERT_TRUE(Key(s, HostKey::Quit).quit);
}

int main(int argc, char **argv) {
  wxInitializer initializer(argc, argv);
  if (!initializer.IsOk()) {
    return 1;
  }

  UNITY_BEGIN();
  RUN_TEST(test_tick_requests_fetch_unless_paused);
  RUN_TEST(test_data_is_recorded_in_stable_order);
  RUN_TEST(test_empty_poll_is_not_persisted);
  RUN_TEST(test_error_is_kept_until_next_data);
  RUN_TEST(test_monitor_keys);
  RUN_TEST(test_key_mapping);
  RUN_TEST(test_history_cursor_starts_at_end_and_clamps);
  RUN_TEST(test_history_day_switch_rebuilds_view);
  RUN_TEST(test_history_unreadable_day);
  RUN_TEST(test_history_ignores_live_events);
  return UNITY_END();
}
