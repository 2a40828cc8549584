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

#include "sen_reading.hpp"
#include "utils.hpp"

struct ChipIdentity {
  const char *prefix;
  const char *name;
};

// First matching prefix wins, so longer prefixes go before shorter ones.
static const ChipIdentity s_chipIdentities[] = {
    {"coretemp", "CPU"},
    {"k10temp", "CPU"},
    {"zenpower", "CPU"},
    {"amdgpu", "GPU (AMD)"},
    {"radeon", "GPU (AMD)"},
    {"nouveau", "GPU (NVIDIA)"},
    {"nvidia-gpu", "GPU (NVIDIA)"},
    {"nvidia", "GPU (NVIDIA)"},
    {"intel_gpu", "GPU (Intel)"},
    {"i915", "GPU (Intel)"},
    {"nvme", "NVMe SSD"},
    {"drivetemp", "HDD/SSD"},
    {"smart-", "HDD/SSD"},
    {"iwlwifi", "WiFi"},
    {"ath", "WiFi"},
    {"mt7", "WiFi"},
    {"rtw", "WiFi"},
    {"pch", "PCH (Chipset)"},
    {"acpi", "ACPI Thermal"},
    {"it87", "Motherboard"},
    {"nct", "Motherboard"},
    {"w83", "Motherboard"},
    {"f71", "Motherboard"},
    {"asus", "Motherboard"},
    {"thinkpad", "Laptop EC"},
    {"dell", "Laptop EC"},
    {"hp", "Laptop EC"},
    {"bat", "Battery"},
};

std::string FriendlyName(const std::string &chip) {
  for (const auto &id : s_chipIdentities) {
    if (startsWithCaseInsensitive(chip, id.prefix)) {
      return id.name;
    }
  }
  return "Sensor";
}

void SplitSensorKey(const std::string &key, std::string &chip, std::string &label) {
  size_t slash = key.find('/');
  if (slash == std::string::npos) {
    chip = key;
    label.clear();
    return;
  }
  chip = key.substr(0, slash);
  label = key.substr(slash + 1);
}
