#ifndef FAVES_LIB_CLASSIFIER_H_
#define FAVES_LIB_CLASSIFIER_H_

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "Faves_Lib/canonical.h"
#include "Faves_Lib/classifier.pb.h"
#include "Faves_Lib/molecule.h"
#include "Faves_Lib/pattern_library.h"
#include "Faves_Lib/reference_index.h"
#include "Faves_Lib/smiles.h"

namespace faves {

struct ScaffoldMatch {
  std::string pattern_id;
  DrugClass drug_class = DRUG_CLASS_UNSPECIFIED;

  bool operator==(const ScaffoldMatch& rhs) const {
    return pattern_id == rhs.pattern_id && drug_class == rhs.drug_class;
  }
};

// The verdict for one structure.
struct ClassificationResult {
  std::string canonical;

  bool is_whitelisted = false;
  bool is_dea_controlled = false;
  bool is_scaffold_match = false;
  bool is_fda_banned = false;
  bool is_cwc_scheduled = false;

  // In pattern library order.
  std::vector<ScaffoldMatch> scaffold_matches;

  // Number of set flags among is_dea_controlled, is_scaffold_match,
  // is_fda_banned and is_cwc_scheduled.
  int faves_flag_count = 0;

  ComplianceStatus status = STATUS_NONE;

  // From the reference record matched in tier 1 or 2.
  std::string reference_name;
  Schedule schedule = SCHEDULE_UNSPECIFIED;

  // Canonical form found in the index with a different secondary hash.
  bool ambiguous_match = false;
  // At least one pattern search ran out of time.
  bool degraded_confidence = false;
  std::vector<std::string> timed_out_patterns;

  bool operator==(const ClassificationResult& rhs) const;
  bool operator!=(const ClassificationResult& rhs) const { return ! (*this == rhs);}

  // The distinct drug classes matched, in the order first seen.
  std::vector<DrugClass> MatchedClasses() const;

  ComplianceResult ToProto() const;
};

std::string ComplianceStatusName(ComplianceStatus s);

/*
  Three tier classification.
    1. Whole molecule lookup in the whitelist. A hit ends classification.
    2. Lookup in the controlled partition, whole molecule and then each
       fragment.
    3. Every scaffold pattern is searched for, each under its own time
       limit.
  The index and patterns are immutable once built, Classify can be
  called from multiple threads.
*/

class Classifier {
  private:
    std::shared_ptr<const ReferenceIndex> _index;
    std::shared_ptr<const PatternLibrary> _patterns;

    std::chrono::milliseconds _match_timeout;

    int _fragment_lookup;

    int _verbose;

//  private functions

    int _whitelist_tier(const CanonicalForm& form, ClassificationResult& result) const;
    int _direct_match_tier(const CanonicalForm& form, ClassificationResult& result) const;
    int _scaffold_tier(const Molecule& m, ClassificationResult& result) const;

  public:
    Classifier();

    int Build(const ClassifierConfig& config);
    // A text proto ClassifierConfig. Relative file names in the config
    // are interpreted relative to the directory containing `fname`.
    int Build(const std::string& fname);
    int Build(std::shared_ptr<const ReferenceIndex> index,
              std::shared_ptr<const PatternLibrary> patterns);

    void set_match_timeout(std::chrono::milliseconds t) { _match_timeout = t;}
    std::chrono::milliseconds match_timeout() const { return _match_timeout;}

    void set_fragment_lookup(int s) { _fragment_lookup = s;}
    void set_verbose(int s) { _verbose = s;}

    int active() const { return nullptr != _index && nullptr != _patterns;}

    const ReferenceIndex& index() const { return *_index;}
    const PatternLibrary& patterns() const { return *_patterns;}

    // Returns nullopt if `smiles` cannot be parsed.
    std::optional<ClassificationResult> Classify(const std::string& smiles) const;
    std::optional<ClassificationResult> Classify(const std::string& smiles,
                                                 ParseError& error) const;

    ClassificationResult Classify(const Molecule& m) const;
};

}  // namespace faves

#endif  // FAVES_LIB_CLASSIFIER_H_
