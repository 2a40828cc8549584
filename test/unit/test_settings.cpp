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
#include <wx/init.h>
#include <wx/memconf.h>

#include "sen_settings.hpp"
#include "sen_store.hpp"

void setUp(void) {
}

void tearDown(void) {
}

void test_defaults_from_empty_config(void) {
  wxMemoryConfig cfg;
  MonitorSettings s;
  s.Load(&cfg);

  TEST_ASSERT_EQUAL_INT(1000, s.pollIntervalMs);
  TEST_ASSERT_EQUAL_INT(600, s.historySize);
  TEST_ASSERT_TRUE(s.record);
  TEST_ASSERT_EQUAL_INT(140, s.chartMaxWidth);
  TEST_ASSERT_TRUE(s.dataDir.empty());
  TEST_ASSERT_TRUE(s.GetDataDir() == DiskStore::DefaultDataDir());
  TEST_ASSERT_TRUE(s.GetDataDir().EndsWith(wxT(".sensors-data")));
}

void test_save_and_load(void) {
  wxMemoryConfig cfg;

  MonitorSettings s;
  s.pollIntervalMs = 2000;
  s.historySize = 1800;
  s.dataDir = wxT("/var/lib/sensors");
  s.record = false;
  s.chartMaxWidth = 90;
  s.fontDesc = wxT("Monospace 12");
  s.Save(&cfg);

  TEST_ASSERT_TRUE(cfg.HasGroup(wxT("Monitor")));

  MonitorSettings loaded;
  loaded.Load(&cfg);
  TEST_ASSERT_EQUAL_INT(2000, loaded.pollIntervalMs);
  TEST_ASSERT_EQUAL_INT(1800, loaded.historySize);
  TEST_ASSERT_TRUE(loaded.dataDir == wxT("/var/lib/sensors"));
  TEST_ASSERT_TRUE(loaded.GetDataDir() == wxT("/var/lib/sensors"));
  TEST_ASSERT_FALSE(loaded.record);
  TEST_ASSERT_EQUAL_INT(90, loaded.chartMaxWidth);
  TEST_ASSERT_TRUE(loaded.fontDesc == wxT("Monospace 12"));
}

void test_hand_edited_values_are_clamped(void) {
  wxMemoryConfig cfg;
  cfg.Write(wxT("Monitor/PollIntervalMs"), 5L);
  cfg.Write(wxT("Monitor/HistorySize"), -3L);
  cfg.Write(wxT("Monitor/ChartMaxWidth"), 3L);

  MonitorSettings s;
  s.Load(&cfg);
  TEST_ASSERT_EQUAL_INT(100, s.pollIntervalMs);
  TEST_ASSERT_EQUAL_INT(0, s.historySize);
  TEST_ASSERT_EQUAL_INT(15, s.chartMaxWidth);
}

int main(int argc, char **argv) {
  wxInitializer initializer(argc, argv);
  if (!initializer.IsOk()) {
    return 1;
  }

  UNITY_BEGIN();
  RUN_TEST(test_defaults_from_empty_config);
  RUN_TEST(test_save_and_load);
  RUN_TEST(test_hand_edited_values_are_clamped);
  return UNITY_END();
}
