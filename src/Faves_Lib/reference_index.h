#ifndef FAVES_LIB_REFERENCE_INDEX_H_
#define FAVES_LIB_REFERENCE_INDEX_H_

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "absl/container/flat_hash_map.h"

#include "Faves_Lib/classifier.pb.h"
#include "Faves_Lib/reference_data.pb.h"

namespace faves {

// In memory form of a ReferenceRecord.
struct ReferenceEntry {
  std::string canonical;
  uint64_t content_hash = 0;

  // Only meaningful if `has_secondary_hash` is set.
  uint64_t secondary_hash = 0;
  int has_secondary_hash = 0;

  Label label = LABEL_UNSPECIFIED;
  Schedule schedule = SCHEDULE_UNSPECIFIED;

  std::string name;
  std::string id;

  int is_fda_banned = 0;
  int is_cwc_scheduled = 0;
};

struct LookupResult {
  // Null if not found.
  const ReferenceEntry* entry = nullptr;

  // Set when the canonical form was found, but only with a different
  // secondary hash. `entry` is null in that case.
  int ambiguous = 0;
};

/*
  Entries are held in one vector. Entries with the same content hash are
  chained through _next, with _first holding the most recently added
  entry for each hash.
*/

class ReferencePartition {
  private:
    std::vector<ReferenceEntry> _entries;
    std::vector<int32_t> _next;
    absl::flat_hash_map<uint64_t, uint32_t> _first;

  public:
    void reserve(uint32_t n);

    int Add(ReferenceEntry&& entry);

    uint32_t size() const { return _entries.size();}
    bool empty() const { return _entries.empty();}

    // Canonical form only.
    const ReferenceEntry* Find(const std::string& canonical, uint64_t content_hash) const;

    // Canonical form, and then secondary hash for those entries that have one.
    LookupResult Find(const std::string& canonical, uint64_t content_hash,
                      uint64_t secondary_hash) const;
};

/*
  Read only store of reference structures, split into whitelisted and
  controlled partitions. Loaded once, and then shared between threads.

  Files are recognised by suffix
    .tfdata     TFDataRecord of serialized ReferenceRecord
    .textproto  one ReferenceRecord text proto per line
    .smi        smiles name [schedule] [flags]
  Where a record has no canonical form, it is computed from the smiles.
*/

class ReferenceIndex {
  private:
    ReferencePartition _whitelist;
    ReferencePartition _controlled;

    int _verbose;

//  private functions

    ReferencePartition* _partition(Label label);

    int _read_tfdata(const std::string& fname, Label label);
    int _read_textproto(const std::string& fname, Label label);
    int _read_smiles(const std::string& fname, Label label);

  public:
    ReferenceIndex();

    void set_verbose(int s) { _verbose = s;}

    // Loads the whitelist and controlled files named in `config`.
    int Build(const ClassifierConfig& config);

    int ReadFile(const std::string& fname, Label label);

    // `record` is added to the partition given by `label`, the label in the
    // record is ignored.
    int Add(const ReferenceRecord& record, Label label);

    const ReferencePartition& whitelist() const { return _whitelist;}
    const ReferencePartition& controlled() const { return _controlled;}

    // Null if not found.
    const ReferenceEntry* LookupWhitelist(const std::string& canonical) const;

    LookupResult LookupWhitelist(const std::string& canonical, uint64_t secondary_hash) const;

    LookupResult LookupControlled(const std::string& canonical, uint64_t secondary_hash) const;
};

// "II", "CII", "schedule_ii" -> SCHEDULE_II.
std::optional<Schedule> ParseSchedule(const std::string& s);

// "I" ... "V", or an empty string for SCHEDULE_UNSPECIFIED.
std::string ScheduleName(Schedule s);

// Parse one line of a reference .smi file.
std::optional<ReferenceRecord> ParseSmilesRecord(const std::string& line);

}  // namespace faves

#endif  // FAVES_LIB_REFERENCE_INDEX_H_
