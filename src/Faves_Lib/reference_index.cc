#include <cctype>
#include <fstream>
#include <iostream>
#include <memory>

#include "absl/strings/match.h"
#include "absl/strings/str_split.h"
#include "google/protobuf/text_format.h"
#include "re2/re2.h"

#include "Foundational/data_source/tfdatarecord.h"
#include "Foundational/iwmisc/iwre2.h"

#include "Faves_Lib/canonical.h"
#include "Faves_Lib/molecule.h"
#include "Faves_Lib/reference_index.h"
#include "Faves_Lib/smiles.h"
#include "Faves_Lib/structure_hash.h"

namespace faves {

using std::cerr;

void
ReferencePartition::reserve(uint32_t n) {
  _entries.reserve(n);
  _next.reserve(n);
  _first.reserve(n);
}

int
ReferencePartition::Add(ReferenceEntry&& entry) {
  const uint32_t ndx = _entries.size();
  const uint64_t content_hash = entry.content_hash;

  _entries.push_back(std::move(entry));

  auto iter = _first.find(content_hash);
  if (iter == _first.end()) {
    _next.push_back(-1);
    _first.emplace(content_hash, ndx);
  } else {
    _next.push_back(iter->second);
    iter->second = ndx;
  }

  return 1;
}

const ReferenceEntry*
ReferencePartition::Find(const std::string& canonical, uint64_t content_hash) const {
  const auto iter = _first.find(content_hash);
  if (iter == _first.end()) {
    return nullptr;
  }

  for (int32_t i = iter->second; i >= 0; i = _next[i]) {
    if (_entries[i].canonical == canonical) {
      return &_entries[i];
    }
  }

  return nullptr;
}

LookupResult
ReferencePartition::Find(const std::string& canonical, uint64_t content_hash,
                         uint64_t secondary_hash) const {
  LookupResult result;

  const auto iter = _first.find(content_hash);
  if (iter == _first.end()) {
    return result;
  }

  for (int32_t i = iter->second; i >= 0; i = _next[i]) {
    const ReferenceEntry& e = _entries[i];
    if (e.canonical != canonical) {
      continue;
    }
    if (! e.has_secondary_hash || e.secondary_hash == secondary_hash) {
      result.entry = &e;
      result.ambiguous = 0;
      return result;
    }
    result.ambiguous = 1;
  }

  return result;
}

std::optional<Schedule>
ParseSchedule(const std::string& s) {
  static const RE2 rx("(?i)(?:c|schedule_?)?(i|ii|iii|iv|v)");

  std::string roman;
  if (! iwre2::RE2FullMatch(s, rx, roman)) {
    return std::nullopt;
  }

  for (char& c : roman) {
    c = toupper(static_cast<unsigned char>(c));
  }

  if ("I" == roman) {
    return SCHEDULE_I;
  }
  if ("II" == roman) {
    return SCHEDULE_II;
  }
  if ("III" == roman) {
    return SCHEDULE_III;
  }
  if ("IV" == roman) {
    return SCHEDULE_IV;
  }

  return SCHEDULE_V;
}

std::string
ScheduleName(Schedule s) {
  switch (s) {
    case SCHEDULE_I:
      return "I";
    case SCHEDULE_II:
      return "II";
    case SCHEDULE_III:
      return "III";
    case SCHEDULE_IV:
      return "IV";
    case SCHEDULE_V:
      return "V";
    default:
      return "";
  }
}

std::optional<ReferenceRecord>
ParseSmilesRecord(const std::string& line) {
  const std::vector<std::string> tokens =
      absl::StrSplit(line, absl::ByAnyChar(" \t"), absl::SkipEmpty());
  if (tokens.empty()) {
    cerr << "ParseSmilesRecord:empty line\n";
    return std::nullopt;
  }

  ReferenceRecord result;
  result.set_smiles(tokens[0]);
  if (tokens.size() > 1) {
    result.set_name(tokens[1]);
  }

  for (uint32_t i = 2; i < tokens.size(); ++i) {
    const std::string& token = tokens[i];
    if ("fda_banned" == token) {
      result.set_is_fda_banned(true);
    } else if ("cwc" == token || "cwc_scheduled" == token) {
      result.set_is_cwc_scheduled(true);
    } else if (std::optional<Schedule> s = ParseSchedule(token); s) {
      result.set_schedule(*s);
    } else {
      cerr << "ParseSmilesRecord:unrecognised attribute '" << token << "'\n";
      return std::nullopt;
    }
  }

  return result;
}

ReferenceIndex::ReferenceIndex() {
  _verbose = 0;
}

ReferencePartition*
ReferenceIndex::_partition(Label label) {
  switch (label) {
    case WHITELISTED:
      return &_whitelist;
    case CONTROLLED:
      return &_controlled;
    default:
      return nullptr;
  }
}

int
ReferenceIndex::Build(const ClassifierConfig& config) {
  for (const std::string& fname : config.whitelist()) {
    if (! ReadFile(fname, WHITELISTED)) {
      cerr << "ReferenceIndex::Build:cannot read whitelist '" << fname << "'\n";
      return 0;
    }
  }

  for (const std::string& fname : config.controlled()) {
    if (! ReadFile(fname, CONTROLLED)) {
      cerr << "ReferenceIndex::Build:cannot read controlled '" << fname << "'\n";
      return 0;
    }
  }

  if (_verbose) {
    cerr << "ReferenceIndex::Build:" << _whitelist.size() << " whitelisted, "
         << _controlled.size() << " controlled\n";
  }

  return 1;
}

int
ReferenceIndex::ReadFile(const std::string& fname, Label label) {
  if (nullptr == _partition(label)) {
    cerr << "ReferenceIndex::ReadFile:invalid label " << label << '\n';
    return 0;
  }

  if (absl::EndsWith(fname, ".tfdata")) {
    return _read_tfdata(fname, label);
  }
  if (absl::EndsWith(fname, ".textproto")) {
    return _read_textproto(fname, label);
  }
  if (absl::EndsWith(fname, ".smi")) {
    return _read_smiles(fname, label);
  }

  cerr << "ReferenceIndex::ReadFile:unrecognised file type '" << fname << "'\n";
  return 0;
}

int
ReferenceIndex::Add(const ReferenceRecord& record, Label label) {
  ReferencePartition* partition = _partition(label);
  if (nullptr == partition) {
    cerr << "ReferenceIndex::Add:invalid label " << label << '\n';
    return 0;
  }

  ReferenceEntry entry;
  if (! record.canonical().empty()) {
    entry.canonical = record.canonical();
    if (record.has_secondary_hash()) {
      entry.secondary_hash = record.secondary_hash();
      entry.has_secondary_hash = 1;
    }
  } else if (record.smiles().empty()) {
    cerr << "ReferenceIndex::Add:no structure in '" << record.ShortDebugString() << "'\n";
    return 0;
  } else {
    Molecule m;
    ParseError error;
    if (! m.build_from_smiles(record.smiles(), error)) {
      cerr << "ReferenceIndex::Add:invalid smiles '" << record.smiles() << "', " << error << '\n';
      return 0;
    }
    const CanonicalForm form = MakeCanonicalForm(m);
    entry.canonical = form.smiles;
    entry.secondary_hash = record.has_secondary_hash() ? record.secondary_hash() : form.secondary_hash;
    entry.has_secondary_hash = 1;
  }

  entry.content_hash = Fnv1a64(entry.canonical);
  entry.label = label;
  entry.schedule = record.schedule();
  entry.name = record.name();
  entry.id = record.id();
  entry.is_fda_banned = record.is_fda_banned();
  entry.is_cwc_scheduled = record.is_cwc_scheduled();

  return partition->Add(std::move(entry));
}

int
ReferenceIndex::_read_tfdata(const std::string& fname, Label label) {
  iw_tf_data_record::TFDataReader reader;
  if (! reader.Open(fname)) {
    cerr << "ReferenceIndex::_read_tfdata:cannot open '" << fname << "'\n";
    return 0;
  }

  while (true) {
    std::optional<ReferenceRecord> record = reader.ReadProto<ReferenceRecord>();
    if (! record) {
      break;
    }
    if (! Add(*record, label)) {
      cerr << "ReferenceIndex::_read_tfdata:invalid record " << reader.items_read() << " in '"
           << fname << "'\n";
      return 0;
    }
  }

  if (! reader.good()) {
    cerr << "ReferenceIndex::_read_tfdata:read error after " << reader.items_read()
         << " records in '" << fname << "'\n";
    return 0;
  }

  if (_verbose) {
    cerr << "Read " << reader.items_read() << " records from '" << fname << "'\n";
  }

  return 1;
}

int
ReferenceIndex::_read_textproto(const std::string& fname, Label label) {
  std::ifstream input(fname);
  if (! input) {
    cerr << "ReferenceIndex::_read_textproto:cannot open '" << fname << "'\n";
    return 0;
  }

  int records_read = 0;
  int line_number = 0;
  std::string line;
  while (std::getline(input, line)) {
    ++line_number;
    if (line.empty() || '#' == line[0]) {
      continue;
    }

    ReferenceRecord record;
    if (! google::protobuf::TextFormat::ParseFromString(line, &record)) {
      cerr << "ReferenceIndex::_read_textproto:invalid proto at line " << line_number << " of '"
           << fname << "'\n";
      return 0;
    }

    if (! Add(record, label)) {
      cerr << "ReferenceIndex::_read_textproto:invalid record at line " << line_number << " of '"
           << fname << "'\n";
      return 0;
    }
    ++records_read;
  }

  if (_verbose) {
    cerr << "Read " << records_read << " records from '" << fname << "'\n";
  }

  return 1;
}

// Smiles files come from external sources, lines that cannot be
// interpreted are reported and skipped.
int
ReferenceIndex::_read_smiles(const std::string& fname, Label label) {
  std::ifstream input(fname);
  if (! input) {
    cerr << "ReferenceIndex::_read_smiles:cannot open '" << fname << "'\n";
    return 0;
  }

  int records_read = 0;
  int records_skipped = 0;
  int line_number = 0;
  std::string line;
  while (std::getline(input, line)) {
    ++line_number;
    if (line.empty() || '#' == line[0]) {
      continue;
    }

    std::optional<ReferenceRecord> record = ParseSmilesRecord(line);
    if (! record || ! Add(*record, label)) {
      cerr << "ReferenceIndex::_read_smiles:skipping line " << line_number << " of '" << fname
           << "'\n";
      ++records_skipped;
      continue;
    }
    ++records_read;
  }

  if (_verbose) {
    cerr << "Read " << records_read << " records from '" << fname << "'";
    if (records_skipped) {
      cerr << ", skipped " << records_skipped;
    }
    cerr << '\n';
  }

  return 1;
}

const ReferenceEntry*
ReferenceIndex::LookupWhitelist(const std::string& canonical) const {
  return _whitelist.Find(canonical, Fnv1a64(canonical));
}

LookupResult
ReferenceIndex::LookupWhitelist(const std::string& canonical, uint64_t secondary_hash) const {
  return _whitelist.Find(canonical, Fnv1a64(canonical), secondary_hash);
}

LookupResult
ReferenceIndex::LookupControlled(const std::string& canonical, uint64_t secondary_hash) const {
  return _controlled.Find(canonical, Fnv1a64(canonical), secondary_hash);
}

}  // namespace faves
