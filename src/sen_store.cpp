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

#include "sen_store.hpp"
#include "utils.hpp"

#include <algorithm>
#include <wx/dir.h>
#include <wx/filename.h>
#include <wx/intl.h>
#include <wx/utils.h>

static const wxString kTimeLayout = wxT("%Y-%m-%dT%H:%M:%S");
static const wxString kFileLayout = wxT("%Y-%m-%d");

static std::string CsvField(const std::string &s) {
  if (s.find_first_of(",\"\r\n") == std::string::npos)
    return s;

  std::string out = "\"";
  for (char c : s) {
    if (c == '"')
      out += '"';
    out += c;
  }
  out += '"';
  return out;
}

static std::string FormatNumber(double v) {
  return wxToStd(wxString::FromCDouble(v, 1));
}

DiskStore::DiskStore(const wxString &dir) : m_dir(dir.empty() ? DefaultDataDir() : dir) {
}

DiskStore::~DiskStore() {
  Close();
}

wxString DiskStore::DefaultDataDir() {
  wxFileName fn = wxFileName::DirName(wxGetHomeDir());
  fn.AppendDir(wxT(".sensors-data"));
  return fn.GetPath();
}

bool DiskStore::Open(wxString &error) {
  if (wxFileName::DirExists(m_dir))
    return true;

  if (!wxFileName::Mkdir(m_dir, wxS_DIR_DEFAULT, wxPATH_MKDIR_FULL)) {
    error = wxString::Format(_("Cannot create data directory '%s'."), m_dir);
    return false;
  }
  SEN_DEBUG_LOG("STORE: created data dir %s", wxToStd(m_dir).c_str());
  return true;
}

bool DiskStore::Write(const std::vector<SensorReading> &readings, const wxDateTime &ts, wxString &error) {
  if (!ts.IsValid()) {
    error = _("Cannot log readings without a timestamp.");
    return false;
  }

  wxString date = ts.Format(kFileLayout);

  if (date != m_curDate || !m_file.IsOpened()) {
    Close();

    wxFileName path(m_dir, date + wxT(".csv"));
    if (!m_file.Open(path.GetFullPath(), wxT("ab"))) {
      error = wxString::Format(_("Cannot open log file '%s'."), path.GetFullPath());
      return false;
    }
    m_curDate = date;
    SEN_DEBUG_LOG("STORE: logging to %s", wxToStd(path.GetFullPath()).c_str());

    if (m_file.Length() == 0) {
      m_file.Write(wxT("time,chip,label,temp,high,crit\n"));
    }
  }

  std::string stamp = wxToStd(ts.Format(kTimeLayout));
  std::string batch;
  for (const auto &r : readings) {
    batch += stamp;
    batch += ',';
    batch += CsvField(r.chip);
    batch += ',';
    batch += CsvField(r.label);
    batch += ',';
    batch += FormatNumber(r.value);
    batch += ',';
    batch += FormatNumber(r.thresholds.high.value_or(0.0));
    batch += ',';
    batch += FormatNumber(r.thresholds.critical.value_or(0.0));
    batch += '\n';
  }

  if (!batch.empty() && m_file.Write(batch.data(), batch.size()) != batch.size()) {
    error = wxString::Format(_("Write to log file failed (%s)."), m_curDate);
    return false;
  }
  if (!m_file.Flush()) {
    error = wxString::Format(_("Flush of log file failed (%s)."), m_curDate);
    return false;
  }
  return true;
}

void DiskStore::Close() {
  if (m_file.IsOpened()) {
    m_file.Flush();
    m_file.Close();
  }
  m_curDate.clear();
}

bool DiskStore::ListDays(const wxString &dir, std::vector<wxString> &days, wxString &error) {
  days.clear();

  wxString base = dir.empty() ? DefaultDataDir() : dir;
  if (!wxFileName::DirExists(base)) {
    error = wxString::Format(_("Data directory '%s' does not exist."), base);
    return false;
  }

  wxDir d(base);
  if (!d.IsOpened()) {
    error = wxString::Format(_("Directory '%s' could not be opened."), base);
    return false;
  }

  wxString filename;
  bool cont = d.GetFirst(&filename, wxT("*.csv"), wxDIR_FILES);
  while (cont) {
    wxFileName fn(base, filename);
    days.push_back(fn.GetName());
    cont = d.GetNext(&filename);
  }

  // names are ISO dates, so the string order is the date order
  std::sort(days.begin(), days.end(), [](const wxString &a, const wxString &b) { return a > b; });
  return true;
}

bool DiskStore::LoadDay(const wxString &dir, const wxString &day, std::vector<StoredReading> &rows, wxString &error) {
  wxString base = dir.empty() ? DefaultDataDir() : dir;
  wxFileName fn(base, day + wxT(".csv"));
  return LoadFile(fn.GetFullPath(), rows, error);
}

std::vector<std::vector<std::string>> DiskStore::SplitCsvRecords(const std::string &content) {
  std::vector<std::vector<std::string>> records;
  std::vector<std::string> fields;
  std::string cur;
  bool quoted = false;
  bool pending = false;

  for (size_t i = 0; i < content.size(); i++) {
    char c = content[i];
    if (quoted) {
      if (c == '"') {
        if (i + 1 < content.size() && content[i + 1] == '"') {
          cur += '"';
          i++;
        } else {
          quoted = false;
        }
      } else {
        // line breaks inside quotes belong to the field
        cur += c;
      }
      continue;
    }

    if (c == '"') {
      quoted = true;
      pending = true;
    } else if (c == ',') {
      fields.push_back(cur);
      cur.clear();
      pending = true;
    } else if (c == '\r') {
      // CRLF line ends
    } else if (c == '\n') {
      if (pending) {
        fields.push_back(cur);
        records.push_back(fields);
      }
      fields.clear();
      cur.clear();
      pending = false;
    } else {
      cur += c;
      pending = true;
    }
  }

  // last record without a trailing newline; an unterminated quote keeps
  // whatever was read
  if (pending) {
    fields.push_back(cur);
    records.push_back(fields);
  }
  return records;
}

bool DiskStore::LoadFile(const wxString &path, std::vector<StoredReading> &rows, wxString &error) {
  ScopeTimer t("DiskStore::LoadFile (%s)", wxToStd(path).c_str());
  rows.clear();

  std::string content;
  if (!LoadFileToString(wxToStd(path), content)) {
    error = wxString::Format(_("Cannot read log file '%s'."), path);
    return false;
  }

  std::vector<std::vector<std::string>> records = SplitCsvRecords(content);

  size_t skipped = 0;
  for (size_t i = 0; i < records.size(); i++) {
    const std::vector<std::string> &f = records[i];
    if (i == 0 && !f.empty() && f[0] == "time")
      continue;
    if (f.size() < 6) {
      skipped++;
      continue;
    }

    wxString stamp = wxString::FromUTF8(f[0]);
    wxDateTime ts;
    wxString::const_iterator end;
    if (!ts.ParseFormat(stamp, kTimeLayout, &end) || end != stamp.end()) {
      skipped++;
      continue;
    }

    StoredReading r;
    r.timestamp = ts;
    r.chip = f[1];
    r.label = f[2];
    if (!wxString::FromUTF8(f[3]).ToCDouble(&r.value)) {
      skipped++;
      continue;
    }
    if (!wxString::FromUTF8(f[4]).ToCDouble(&r.high))
      r.high = 0.0;
    if (!wxString::FromUTF8(f[5]).ToCDouble(&r.crit))
      r.crit = 0.0;

    rows.push_back(r);
  }

  if (skipped > 0) {
    SEN_DEBUG_LOG("STORE: %s: %zu malformed rows skipped", wxToStd(path).c_str(), skipped);
  }
  return true;
}
