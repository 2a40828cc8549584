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

#include "sen_panels.hpp"

static wxDateTime At(int h, int m, int s) {
  return wxDateTime(17, wxDateTime::Oct, 2026, (wxDateTime::wxDateTime_t)h, (wxDateTime::wxDateTime_t)m,
                    (wxDateTime::wxDateTime_t)s);
}

static SensorReading Reading(const char *chip, const char *label, double v, double high = 0.0, double crit = 0.0) {
  SensorReading r;
  r.chip = chip;
  r.adapter = "ISA adapter";
  r.label = label;
  r.value = v;
  if (high > 0)
    r.thresholds.high = high;
  if (crit > 0)
    r.thresholds.critical = crit;
  return r;
}

static DataArrivedEvent Poll(const wxDateTime &ts, std::vector<SensorReading> readings) {
  DataArrivedEvent ev;
  ev.timestamp = ts;
  ev.readings = std::move(readings);
  return ev;
}

// index of the first line containing text, -1 when none does
static int FindLine(const std::vector<StyledLine> &doc, const wxString &text) {
  for (size_t i = 0; i < doc.size(); i++) {
    if (doc[i].Text().Contains(text))
      return (int)i;
  }
  return -1;
}

void setUp(void) {
}

void tearDown(void) {
}

void test_styled_text_keeps_code_points(void) {
  wxString text = wxT("Tctl ");
  text += wxUniChar(0x00B0);
  text += wxUniChar(0x1F525);

  StyledLine line;
  line.AppendText(text, ColorRole::Label);
  TEST_ASSERT_EQUAL_UINT(text.length(), line.Width());
  TEST_ASSERT_TRUE(line.cells[5].glyph == (wchar_t)0x00B0);

  if (sizeof(wchar_t) >= 4) {
    TEST_ASSERT_TRUE(line.Text() == text);
  } else {
    for (const auto &c : line.cells) {
      TEST_ASSERT_TRUE((wxUint32)c.glyph <= 0xFFFF);
    }
  }

  TEST_ASSERT_TRUE(StyledLine::ToGlyph(0x2581) == (wchar_t)0x2581);
  TEST_ASSERT_TRUE(StyledLine::ToGlyph(0x1F525) == (sizeof(wchar_t) < 4 ? (wchar_t)0xFFFD : (wchar_t)0x1F525));
}

void test_chart_width_for_columns(void) {
  TEST_ASSERT_EQUAL_INT(15, ChartWidthForColumns(0));
  TEST_ASSERT_EQUAL_INT(15, ChartWidthForColumns(70));
  TEST_ASSERT_EQUAL_INT(34, ChartWidthForColumns(100));
  TEST_ASSERT_EQUAL_INT(134, ChartWidthForColumns(200));
  TEST_ASSERT_EQUAL_INT(140, ChartWidthForColumns(400));
  TEST_ASSERT_EQUAL_INT(50, ChartWidthForColumns(400, 50));
}

void test_live_document_waiting(void) {
  MonitorSession s(60, At(12, 0, 0));
  std::vector<StyledLine> doc = BuildLiveDocument(s, At(12, 1, 5), wxEmptyString);

  TEST_ASSERT_TRUE(doc.front().Text().StartsWith(wxT("SENSORS MONITOR")));
  TEST_ASSERT_TRUE(doc.front().Text().Contains(wxT("up 1m05s")));
  TEST_ASSERT_FALSE(doc.front().Text().Contains(wxT("REC")));
  TEST_ASSERT_TRUE(FindLine(doc, wxT("Waiting for sensor data...")) > 0);
  TEST_ASSERT_TRUE(doc.back().Text().Contains(wxT("1min")));
}

void test_live_header_states(void) {
  MonitorSession s(60, At(12, 0, 0));
  s.Handle(KeyPressedEvent{HostKey::Pause});
  s.Handle(Poll(At(12, 0, 30), {Reading("coretemp-isa-0000", "Core 0", 45.0)}));

  StyledLine head = BuildLiveHeader(s, At(12, 0, 31), wxT("/tmp/sensors-data"));
  TEST_ASSERT_TRUE(head.Text().Contains(wxT("12:00:30")));
  TEST_ASSERT_TRUE(head.Text().Contains(wxT("PAUSED")));
  TEST_ASSERT_TRUE(head.Text().Contains(wxT("REC /tmp/sensors-data")));

  s.Handle(ErrorEvent{wxT("write: disk full")});
  std::vector<StyledLine> doc = BuildLiveDocument(s, At(12, 0, 31), wxEmptyString);
  int err = FindLine(doc, wxT("ERROR: write: disk full"));
  TEST_ASSERT_TRUE(err > 0);
  TEST_ASSERT_TRUE(doc[(size_t)err].cells[1].role == ColorRole::Error);
}

void test_live_panels_grouped_by_chip(void) {
  MonitorSession s(60, At(12, 0, 0));
  for (int i = 0; i < 5; i++) {
    s.Handle(Poll(At(12, 0, 55 + i),
                  {Reading("coretemp-isa-0000", "Core 0", 40.0 + i, 100.0, 120.0),
                   Reading("coretemp-isa-0000", "Core 1", 41.0),
                   Reading("nvme-pci-0300", "Composite", 36.0)}));
  }

  std::vector<SensorPanel> panels = BuildLivePanels(s, 20);
  TEST_ASSERT_EQUAL_UINT(2, panels.size());
  TEST_ASSERT_TRUE(panels[0].title == wxT("CPU"));
  TEST_ASSERT_TRUE(panels[1].title == wxT("NVMe SSD"));
  TEST_ASSERT_EQUAL_UINT(2, panels[0].rows.size());

  const PanelRow &core0 = panels[0].rows[0];
  TEST_ASSERT_TRUE(core0.label == wxT("Core 0"));
  TEST_ASSERT_TRUE(core0.valueText == wxString::FromUTF8(" 44.0\xC2\xB0" "C"));
  TEST_ASSERT_TRUE(core0.tier == Tier::Ok);
  TEST_ASSERT_EQUAL_UINT(20, core0.spark.Width());
  TEST_ASSERT_EQUAL_UINT((size_t)kScaleWidth, core0.scale.Width());
  TEST_ASSERT_FLOAT_WITHIN(0.001f, 42.0, (float)core0.avg);
  TEST_ASSERT_FLOAT_WITHIN(0.001f, 40.0, (float)core0.lo);
  TEST_ASSERT_FLOAT_WITHIN(0.001f, 44.0, (float)core0.peak);

  // no thresholds, no scale
  TEST_ASSERT_TRUE(panels[0].rows[1].scale.IsEmpty());
  TEST_ASSERT_EQUAL_UINT(20, panels[0].timeline.Width());
}

void test_live_panels_skip_vanished_sensors(void) {
  MonitorSession s(60, At(12, 0, 0));
  s.Handle(Poll(At(12, 0, 1), {Reading("coretemp-isa-0000", "Core 0", 40.0), Reading("acpitz-acpi-0", "temp1", 30.0)}));
  s.Handle(Poll(At(12, 0, 2), {Reading("coretemp-isa-0000", "Core 0", 41.0)}));

  std::vector<SensorPanel> panels = BuildLivePanels(s, 20);
  TEST_ASSERT_EQUAL_UINT(1, panels.size());
  TEST_ASSERT_TRUE(panels[0].chip == "coretemp-isa-0000");
}

void test_live_document_rows(void) {
  MonitorSession s(60, At(12, 0, 0));
  s.Handle(ResizedEvent{100, 40});
  for (int i = 0; i < 7; i++) {
    s.Handle(Poll(At(12, 0, 59) + wxTimeSpan::Seconds(i),
                  {Reading("coretemp-isa-0000", "Core 0", 125.0, 100.0, 120.0)}));
  }

  std::vector<StyledLine> doc = BuildLiveDocument(s, At(12, 1, 6), wxEmptyString);
  TEST_ASSERT_TRUE(FindLine(doc, wxT("CPU  coretemp-isa-0000  ISA adapter")) > 0);

  int row = FindLine(doc, wxT("Core 0"));
  TEST_ASSERT_TRUE(row > 0);
  wxString text = doc[(size_t)row].Text();
  TEST_ASSERT_TRUE(text.Contains(wxT(" avg125.0 lo125.0 pk125.0 H100 C120")));

  // the value of a critical reading is bold and red
  int valueCol = text.Find(wxT("125.0"));
  TEST_ASSERT_TRUE(valueCol > 0);
  TEST_ASSERT_TRUE(doc[(size_t)row].cells[(size_t)valueCol].role == ColorRole::Critical);
  TEST_ASSERT_TRUE(doc[(size_t)row].cells[(size_t)valueCol].bold);

  // the minute tick produced a timeline line under the row
  TEST_ASSERT_TRUE((size_t)row + 1 < doc.size());
  TEST_ASSERT_TRUE(doc[(size_t)row + 1].Text().Contains(wxT("12:01")));
}

void test_history_document(void) {
  std::vector<StoredReading> rows;
  for (int i = 0; i < 90; i++) {
    StoredReading r;
    r.timestamp = At(10, 0, 0) + wxTimeSpan::Seconds(i);
    r.chip = "nvme-pci-0300";
    r.label = "Composite";
    r.value = 36.0 + (i % 3);
    r.high = 81.8;
    r.crit = 84.8;
    rows.push_back(r);
  }

  DayLoader loader = [&rows](const wxString &, std::vector<StoredReading> &out, wxString &) {
    out = rows;
    return true;
  };
  HistorySession s({wxT("2026-10-17")}, loader);
  s.Handle(ResizedEvent{120, 40});

  std::vector<StyledLine> doc = BuildHistoryDocument(s);
  TEST_ASSERT_TRUE(doc.front().Text().StartsWith(wxT("SENSORS HISTORY  2026-10-17  [ 1/1 ]")));
  TEST_ASSERT_TRUE(doc.front().Text().Contains(wxT("10:00:00 - 10:01:29  (90 readings, 1 sensors)")));
  TEST_ASSERT_TRUE(FindLine(doc, wxT("10:01:29  90/90")) > 0);
  TEST_ASSERT_TRUE(FindLine(doc, wxT("sensor    ")) > 0);
  TEST_ASSERT_TRUE(FindLine(doc, wxT("Composite")) > 0);

  std::vector<SensorPanel> panels = BuildHistoryPanels(s, ChartWidthForColumns(120));
  TEST_ASSERT_EQUAL_UINT(1, panels.size());
  TEST_ASSERT_EQUAL_UINT(1, panels[0].rows.size());
  const PanelRow &row = panels[0].rows[0];
  TEST_ASSERT_FLOAT_WITHIN(0.001f, 38.0, (float)row.value); // 89 % 3 == 2
  TEST_ASSERT_FLOAT_WITHIN(0.001f, 36.0, (float)row.lo);
  TEST_ASSERT_FLOAT_WITHIN(0.001f, 38.0, (float)row.peak);
  TEST_ASSERT_TRUE(row.timeline.Text().Contains(wxT("10:01")));
}

void test_history_document_without_data(void) {
  DayLoader loader = [](const wxString &day, std::vector<StoredReading> &, wxString &error) {
    error = wxT("Cannot read log file '") + day + wxT(".csv'.");
    return false;
  };
  HistorySession s({wxT("2026-10-17")}, loader);

  std::vector<StyledLine> doc = BuildHistoryDocument(s);
  TEST_ASSERT_TRUE(FindLine(doc, wxT("ERROR: Cannot read log file")) > 0);
  TEST_ASSERT_TRUE(FindLine(doc, wxT("No data for this day.")) > 0);
  TEST_ASSERT_TRUE(BuildCursorLine(s, 120).IsEmpty());
}

int main(int argc, char **argv) {
  wxInitializer initializer(argc, argv);
  if (!initializer.IsOk()) {
    return 1;
  }

  UNITY_BEGIN();
  RUN_TEST(test_styled_text_keeps_code_points);
  RUN_TEST(test_chart_width_for_columns);
  RUN_TEST(test_live_document_waiting);
  RUN_TEST(test_live_header_states);
  RUN_TEST(test_live_panels_grouped_by_chip);
  RUN_TEST(test_live_panels_skip_vanished_sensors);
  RUN_TEST(test_live_document_rows);
  RUN_TEST(test_history_document);
  RUN_TEST(test_history_document_without_data);
  return UNITY_END();
}
