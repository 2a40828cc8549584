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

#include "sen_sources.hpp"
#include "utils.hpp"

#include <nlohmann/json.hpp>
#include <regex>
#include <wx/intl.h>

using json = nlohmann::json;

// Readings outside of this window are driver placeholders (-273.1, 65261.8...).
static const double kMinValidTemp = -200.0;
static const double kMaxThreshold = 1000.0;

// "°C" in UTF-8
static const std::string kDegC = "\xC2\xB0"
                                 "C";

static bool IsValidThreshold(double v) {
  return v > 0 && v < kMaxThreshold;
}

bool ParseSensorsJson(const std::string &text, std::vector<SensorReading> &out) {
  out.clear();

  json doc;
  try {
    doc = json::parse(text);
  } catch (const std::exception &e) {
    wxLogWarning(wxT("Invalid sensors JSON output: %s"), wxString::FromUTF8(e.what()));
    return false;
  }

  if (!doc.is_object()) {
    wxLogWarning(wxT("Unexpected sensors JSON output (not an object)."));
    return false;
  }

  // json objects iterate in key order, which gives the sorted chip/label order
  for (auto chipIt = doc.begin(); chipIt != doc.end(); ++chipIt) {
    const json &chip = chipIt.value();
    if (!chip.is_object())
      continue;

    std::string adapter;
    if (chip.contains("Adapter") && chip["Adapter"].is_string()) {
      adapter = chip["Adapter"].get<std::string>();
    }

    for (auto featIt = chip.begin(); featIt != chip.end(); ++featIt) {
      if (featIt.key() == "Adapter")
        continue;

      const json &fields = featIt.value();
      if (!fields.is_object())
        continue;

      bool foundTemp = false;
      double temp = 0.0;
      for (auto f = fields.begin(); f != fields.end(); ++f) {
        const std::string &name = f.key();
        if (f.value().is_number() && name.find("temp") != std::string::npos && hasSuffix(name, "_input")) {
          temp = f.value().get<double>();
          foundTemp = true;
          break;
        }
      }
      if (!foundTemp || temp < kMinValidTemp)
        continue;

      SensorReading r;
      r.chip = chipIt.key();
      r.adapter = adapter;
      r.label = featIt.key();
      r.value = temp;

      for (auto f = fields.begin(); f != fields.end(); ++f) {
        if (!f.value().is_number())
          continue;
        double v = f.value().get<double>();
        if (hasSuffix(f.key(), "_max") && IsValidThreshold(v)) {
          r.thresholds.high = v;
        }
        if (hasSuffix(f.key(), "_crit") && IsValidThreshold(v)) {
          r.thresholds.critical = v;
        }
      }

      out.push_back(r);
    }
  }

  SEN_TRACE_LOG("SENS: json: %zu readings", out.size());
  return true;
}

// Value of "name = +NN.N°C" in line, 0 when missing.
static double ExtractNamedValue(const std::string &line, const std::string &name) {
  static const std::regex namedValRe(std::string(R"((\w+)\s*=\s*([+-]?\d+\.?\d*))") + kDegC);

  for (auto it = std::sregex_iterator(line.begin(), line.end(), namedValRe); it != std::sregex_iterator(); ++it) {
    const std::smatch &m = *it;
    if (m[1].str() != name)
      continue;
    try {
      double v = std::stod(m[2].str());
      if (v > kMinValidTemp)
        return v;
    } catch (const std::exception &) {
      // fall through to the next match
    }
  }
  return 0.0;
}

std::vector<SensorReading> ParseSensorsText(const std::string &text) {
  static const std::regex adapterRe(R"(^Adapter:\s+(.+)$)");
  static const std::regex tempValRe(std::string(R"(([+-]?\d+\.?\d*))") + kDegC);

  std::vector<SensorReading> readings;
  std::vector<std::string> lines;
  SplitLines(text, lines);

  std::string currentChip;
  std::string currentAdapter;

  for (size_t i = 0; i < lines.size(); i++) {
    const std::string &line = lines[i];

    if (Trim(line).empty())
      continue;

    std::smatch m;
    if (std::regex_search(line, m, adapterRe)) {
      currentAdapter = m[1].str();
      continue;
    }

    if (line.find(kDegC) != std::string::npos) {
      size_t colon = line.find(':');
      if (colon == std::string::npos)
        continue;

      std::string label = Trim(line.substr(0, colon));
      std::string rest = line.substr(colon + 1);

      std::smatch tm;
      if (!std::regex_search(rest, tm, tempValRe))
        continue;

      double temp = 0.0;
      try {
        temp = std::stod(tm[1].str());
      } catch (const std::exception &) {
        continue;
      }
      if (temp < kMinValidTemp)
        continue;

      SensorReading r;
      r.chip = currentChip;
      r.adapter = currentAdapter;
      r.label = label;
      r.value = temp;

      double high = ExtractNamedValue(line, "high");
      if (IsValidThreshold(high))
        r.thresholds.high = high;

      double crit = ExtractNamedValue(line, "crit");
      if (IsValidThreshold(crit))
        r.thresholds.critical = crit;

      // lm-sensors wraps long limit lists: "(crit = +84.8°C)" on its own line
      if (i + 1 < lines.size()) {
        const std::string &next = lines[i + 1];
        if (next.find("crit") != std::string::npos && next.find(':') == std::string::npos) {
          double c = ExtractNamedValue(next, "crit");
          if (IsValidThreshold(c))
            r.thresholds.critical = c;
        }
      }

      readings.push_back(r);
      continue;
    }

    // chip header: not indented, no temperature
    if (line[0] != ' ' && line[0] != '\t') {
      currentChip = Trim(line);
    }
  }

  return readings;
}

bool ReadAllSensors(std::vector<SensorReading> &out, wxString &error) {
  ScopeTimer t("ReadAllSensors");
  out.clear();
  error.clear();

  std::string output;
  int rc = ExecuteCommand("sensors -j", output, false);
  if (rc == 0 && ParseSensorsJson(output, out)) {
    return true;
  }

  // older lm-sensors without JSON support
  SEN_DEBUG_LOG("SENS: 'sensors -j' failed (rc=%d), falling back to text output", rc);

  rc = ExecuteCommand("sensors", output, false);
  if (rc != 0) {
    error = wxString::Format(_("Cannot read sensors (exit code %d). Is lm-sensors installed?"), rc);
    return false;
  }

  out = ParseSensorsText(output);
  return true;
}
