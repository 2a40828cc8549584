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

#include "sen_glyphs.hpp"

#include <optional>
#include <wx/string.h>

// Per-reading limits. A missing value disables the corresponding tier.
struct Thresholds {
  std::optional<double> high;
  std::optional<double> critical;
};

enum class Tier { Ok, Warn, High, Critical };

/**
 * Maps a value to its severity tier.
 *
 * Tiers are tested critical, high, warn, ok; the first match wins and a value
 * sitting exactly on a boundary belongs to the higher tier. Warn starts at
 * 85% of the high threshold.
 */
class ValueClassifier {
public:
  static constexpr double WarnRatio = 0.85;

  static Tier Classify(double value, const Thresholds &t);

  // Critical values are drawn bold.
  static bool IsEmphasized(double value, const Thresholds &t);

  static ColorRole RoleFor(Tier tier);
};

// Vertical range used to quantize a series.
struct ChartRange {
  double min = 0.0;
  double max = 1.0;
};

// [max(0, lo-5), peak+5], stretched so that thresholds above the data stay
// visible.
ChartRange ComputeChartRange(double lo, double peak, const Thresholds &t);

// " 45.0°C"
wxString FormatValue(double value);
