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

#include "sen_classify.hpp"

#include <algorithm>

Tier ValueClassifier::Classify(double value, const Thresholds &t) {
  if (t.critical && value >= *t.critical)
    return Tier::Critical;
  if (t.high && value >= *t.high)
    return Tier::High;
  if (t.high && value >= *t.high * WarnRatio)
    return Tier::Warn;
  return Tier::Ok;
}

bool ValueClassifier::IsEmphasized(double value, const Thresholds &t) {
  return t.critical && value >= *t.critical;
}

ColorRole ValueClassifier::RoleFor(Tier tier) {
  switch (tier) {
    case Tier::Critical:
      return ColorRole::Critical;
    case Tier::High:
      return ColorRole::High;
    case Tier::Warn:
      return ColorRole::Warn;
    case Tier::Ok:
    default:
      return ColorRole::Ok;
  }
}

ChartRange ComputeChartRange(double lo, double peak, const Thresholds &t) {
  ChartRange r;
  r.min = std::max(0.0, lo - 5.0);
  r.max = peak + 5.0;

  if (t.critical && *t.critical > r.max) {
    r.max = *t.critical + 5.0;
  }
  if (t.high && *t.high > r.max) {
    r.max = *t.high + 5.0;
  }
  return r;
}

wxString FormatValue(double value) {
  return wxString::Format(wxT("%5.1f"), value) + wxUniChar((wxUint32)SenGlyph::Degree) + wxT("C");
}
