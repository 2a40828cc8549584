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

#include <vector>
#include <wx/datetime.h>
#include <wx/ffile.h>
#include <wx/string.h>

/**
 * Daily CSV log of sensor readings.
 *
 * Files live in the data directory as YYYY-MM-DD.csv with the header
 * "time,chip,label,temp,high,crit". Times are local and have one second
 * resolution, numbers one decimal place; an unknown threshold is written as
 * 0.0.
 */
class DiskStore {
public:
  // Empty dir selects DefaultDataDir().
  explicit DiskStore(const wxString &dir = wxEmptyString);
  ~DiskStore();

  DiskStore(const DiskStore &) = delete;
  DiskStore &operator=(const DiskStore &) = delete;

  // Creates the data directory when missing.
  bool Open(wxString &error);

  // Appends one poll to the file of the day of ts, switching files when the
  // date changes.
  bool Write(const std::vector<SensorReading> &readings, const wxDateTime &ts, wxString &error);

  void Close();

  const wxString &GetDir() const { return m_dir; }

  // ~/.sensors-data
  static wxString DefaultDataDir();

  // Day names ("YYYY-MM-DD") with a log file in dir, newest first.
  static bool ListDays(const wxString &dir, std::vector<wxString> &days, wxString &error);

  static bool LoadDay(const wxString &dir, const wxString &day, std::vector<StoredReading> &rows, wxString &error);

  // Rows of one log file. Header, short rows and rows with an unparsable time
  // or temperature are skipped.
  static bool LoadFile(const wxString &path, std::vector<StoredReading> &rows, wxString &error);

  // Splits CSV text into records of fields. Double-quoted fields may hold
  // commas, doubled quotes and line breaks. Blank lines yield no record.
  static std::vector<std::vector<std::string>> SplitCsvRecords(const std::string &content);

private:
  wxString m_dir;
  wxFFile m_file;
  wxString m_curDate;
};
