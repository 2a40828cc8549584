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

#include "sen_classify.hpp"

#include <string>
#include <vector>
#include <wx/datetime.h>

// One temperature reading as reported by a sensor source.
struct SensorReading {
  std::string chip;    // e.g. "coretemp-isa-0000"
  std::string adapter; // e.g. "ISA adapter"
  std::string label;   // e.g. "Core 0"
  double value = 0.0;  // degrees Celsius
  Thresholds thresholds;

  // "chip/label", unique per sensor
  std::string Key() const { return chip + "/" + label; }
};

// One row of a daily log file. Thresholds <= 0 mean "not known".
struct StoredReading {
  wxDateTime timestamp;
  std::string chip;
  std::string label;
  double value = 0.0;
  double high = 0.0;
  double crit = 0.0;

  std::string Key() const { return chip + "/" + label; }
};

// Human readable component name for a chip id ("coretemp-isa-0000" -> "CPU").
std::string FriendlyName(const std::string &chip);

// Splits "chip/label" at the first slash; label is empty when there is none.
void SplitSensorKey(const std::string &key, std::string &chip, std::string &label);
