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

#include "sen_history.hpp"
#include "utils.hpp"

static wxDateTime At(int h, int m, int s) {
  return wxDateTime(17, wxDateTime::Oct, 2026, (wxDateTime::wxDateTime_t)h, (wxDateTime::wxDateTime_t)m,
                    (wxDateTime::wxDateTime_t)s);
}

void setUp(void) {
}

void tearDown(void) {
}

void test_ring_buffer_keeps_last_five(void) {
  RingBuffer buf(5);
  for (int i = 0; i < 7; i++) {
    buf.Push(30.0 + i, At(12, 0, i));
  }

  TEST_ASSERT_EQUAL_UINT(5, buf.Size());

  std::vector<double> last = buf.LastN(10);
  TEST_ASSERT_EQUAL_UINT(5, last.size());
  const double expected[] = {32, 33, 34, 35, 36};
  for (size_t i = 0; i < 5; i++) {
    TEST_ASSERT_FLOAT_WITHIN(0.001f, expected[i], (float)last[i]);
  }

  TEST_ASSERT_FLOAT_WITHIN(0.001f, 30.0, (float)buf.LifetimeMin());
  TEST_ASSERT_FLOAT_WITHIN(0.001f, 36.0, (float)buf.LifetimePeak());
  TEST_ASSERT_FLOAT_WITHIN(0.001f, 34.0, (float)buf.Average());
  TEST_ASSERT_FLOAT_WITHIN(0.001f, 36.0, (float)buf.Last());
}

void test_ring_buffer_last_n_bounds(void) {
  RingBuffer buf(4);
  TEST_ASSERT_TRUE(buf.IsEmpty());
  TEST_ASSERT_EQUAL_UINT(0, buf.LastN(3).size());
  TEST_ASSERT_FLOAT_WITHIN(0.001f, 0.0, (float)buf.Average());
  TEST_ASSERT_FLOAT_WITHIN(0.001f, 0.0, (float)buf.Last());

  buf.Push(1.0, At(8, 0, 0));
  buf.Push(2.0, At(8, 0, 1));
  buf.Push(3.0, At(8, 0, 2));

  TEST_ASSERT_EQUAL_UINT(0, buf.LastN(0).size());
  TEST_ASSERT_EQUAL_UINT(0, buf.LastN(-2).size());

  std::vector<double> two = buf.LastN(2);
  TEST_ASSERT_EQUAL_UINT(2, two.size());
  TEST_ASSERT_FLOAT_WITHIN(0.001f, 2.0, (float)two[0]);
  TEST_ASSERT_FLOAT_WITHIN(0.001f, 3.0, (float)two[1]);

  std::vector<Point> pts = buf.LastNPoints(5);
  TEST_ASSERT_EQUAL_UINT(3, pts.size());
  TEST_ASSERT_TRUE(pts[0].timestamp.IsEqualTo(At(8, 0, 0)));
  TEST_ASSERT_TRUE(pts[2].timestamp.IsEqualTo(At(8, 0, 2)));
}

void test_ring_buffer_wraps_many_times(void) {
  RingBuffer buf(3);
  for (int i = 0; i < 100; i++) {
    buf.Push((double)i, wxDateTime());
    TEST_ASSERT_TRUE(buf.Size() <= buf.Capacity());
  }

  std::vector<double> last = buf.LastN(3);
  TEST_ASSERT_FLOAT_WITHIN(0.001f, 97.0, (float)last[0]);
  TEST_ASSERT_FLOAT_WITHIN(0.001f, 98.0, (float)last[1]);
  TEST_ASSERT_FLOAT_WITHIN(0.001f, 99.0, (float)last[2]);
}

void test_lifetime_extrema_survive_eviction(void) {
  RingBuffer buf(2);
  buf.Push(90.0, At(9, 0, 0));
  buf.Push(10.0, At(9, 0, 1));
  buf.Push(50.0, At(9, 0, 2));
  buf.Push(50.0, At(9, 0, 3));

  // 90 and 10 are gone from the window but not from the extrema
  std::vector<double> last = buf.LastN(2);
  TEST_ASSERT_FLOAT_WITHIN(0.001f, 50.0, (float)last[0]);
  TEST_ASSERT_FLOAT_WITHIN(0.001f, 50.0, (float)last[1]);
  TEST_ASSERT_FLOAT_WITHIN(0.001f, 10.0, (float)buf.LifetimeMin());
  TEST_ASSERT_FLOAT_WITHIN(0.001f, 90.0, (float)buf.LifetimePeak());
}

void test_zero_capacity_tracks_extrema_only(void) {
  RingBuffer buf(0);
  buf.Push(42.0, At(10, 0, 0));
  buf.Push(40.0, At(10, 0, 1));

  TEST_ASSERT_EQUAL_UINT(0, buf.Size());
  TEST_ASSERT_EQUAL_UINT(0, buf.LastN(5).size());
  TEST_ASSERT_FLOAT_WITHIN(0.001f, 40.0, (float)buf.LifetimeMin());
  TEST_ASSERT_FLOAT_WITHIN(0.001f, 42.0, (float)buf.LifetimePeak());
}

void test_series_store_creates_buffers_lazily(void) {
  SeriesStore store(10);
  TEST_ASSERT_NULL(store.Get("coretemp-isa-0000/Core 0"));

  store.Record("coretemp-isa-0000/Core 1", 41.0, At(11, 0, 0));
  store.Record("coretemp-isa-0000/Core 0", 40.0, At(11, 0, 0));
  store.Record("coretemp-isa-0000/Core 1", 43.0, At(11, 0, 1));

  const RingBuffer *core1 = store.Get("coretemp-isa-0000/Core 1");
  TEST_ASSERT_NOT_NULL(core1);
  TEST_ASSERT_EQUAL_UINT(2, core1->Size());
  TEST_ASSERT_EQUAL_UINT(10, core1->Capacity());
  TEST_ASSERT_FLOAT_WITHIN(0.001f, 43.0, (float)core1->Last());

  TEST_ASSERT_EQUAL_UINT(2, store.Keys().size());
  TEST_ASSERT_EQUAL_STRING("coretemp-isa-0000/Core 1", store.Keys()[0].c_str());
  TEST_ASSERT_EQUAL_STRING("coretemp-isa-0000/Core 0", store.Keys()[1].c_str());
}

void test_series_store_with_trace_logging(void) {
  g_verboseLogging = true;
  g_debugLogging = true;

  SeriesStore store(3);
  store.Record("nvme-pci-0100/Composite", 38.9, wxDateTime::Now());
  SEN_DEBUG_LOG("series=%zu", store.Keys().size());

  g_verboseLogging = false;
  g_debugLogging = false;

  TEST_ASSERT_NOT_NULL(store.Get("nvme-pci-0100/Composite"));
  TEST_ASSERT_EQUAL_UINT(1, store.Keys().size());
}

int main(int argc, char **argv) {
  wxInitializer initializer(argc, argv);
  if (!initializer.IsOk()) {
    return 1;
  }

  UNITY_BEGIN();
  RUN_TEST(test_ring_buffer_keeps_last_five);
  RUN_TEST(test_ring_buffer_last_n_bounds);
  RUN_TEST(test_ring_buffer_wraps_many_times);
  RUN_TEST(test_lifetime_extrema_survive_eviction);
  RUN_TEST(test_zero_capacity_tracks_extrema_only);
  RUN_TEST(test_series_store_creates_buffers_lazily);
  RUN_TEST(test_series_store_with_trace_logging);
  return UNITY_END();
}
