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

#include "sen_glyphs.hpp"

wxColour ColorForRole(ColorRole role) {
  switch (role) {
    case ColorRole::NoData:
      return wxColour(48, 48, 48); // 236
    case ColorRole::Tick:
      return wxColour(78, 78, 78); // 239
    case ColorRole::Ok:
      return wxColour(95, 215, 135); // 78
    case ColorRole::Warn:
      return wxColour(255, 215, 0); // 220
    case ColorRole::High:
      return wxColour(255, 135, 0); // 208
    case ColorRole::Critical:
      return wxColour(255, 0, 0); // 196
    case ColorRole::ScaleBackground:
      return wxColour(48, 48, 48);
    case ColorRole::MarkerHigh:
      return wxColour(255, 215, 0);
    case ColorRole::MarkerCritical:
      return wxColour(255, 0, 0);
    case ColorRole::ScrubberLine:
      return wxColour(58, 58, 58); // 237
    case ColorRole::ScrubberCursor:
      return wxColour(255, 175, 0); // 214
    case ColorRole::Title:
      return wxColour(0, 255, 255); // 51
    case ColorRole::ChipName:
      return wxColour(175, 175, 255); // 147
    case ColorRole::Adapter:
      return wxColour(118, 118, 118); // 243
    case ColorRole::Dim:
      return wxColour(88, 88, 88); // 240
    case ColorRole::Value:
      return wxColour(188, 188, 188); // 250
    case ColorRole::Border:
      return wxColour(95, 95, 215); // 62
    case ColorRole::Error:
    case ColorRole::Paused:
    case ColorRole::Recording:
      return wxColour(255, 0, 0);
    case ColorRole::Label:
    default:
      return wxColour(208, 208, 208); // 252
  }
}
