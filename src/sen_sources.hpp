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

#include "sen_reading.hpp"

#include <string>
#include <vector>
#include <wx/string.h>

// Parses "sensors -j" output. Chips and their features come out sorted by
// name; features without a temperature input are ignored. Returns false when
// the document is not valid JSON (out is left empty).
bool ParseSensorsJson(const std::string &text, std::vector<SensorReading> &out);

// Parses the human readable "sensors" output (lm-sensors without -j).
std::vector<SensorReading> ParseSensorsText(const std::string &text);

// Polls lm-sensors once. Blocking, meant for a worker thread.
bool ReadAllSensors(std::vector<SensorReading> &out, wxString &error);
