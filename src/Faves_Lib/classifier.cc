#include <algorithm>
#include <filesystem>
#include <iostream>

#include "Foundational/iwmisc/proto_support.h"

#include "Faves_Lib/classifier.h"

namespace faves {

using std::cerr;

namespace {

constexpr int kDefaultMatchTimeoutMs = 250;

// `fname` if absolute, otherwise relative to `dir`.
std::string
ResolvePath(const std::filesystem::path& dir, const std::string& fname) {
  const std::filesystem::path p(fname);
  if (p.is_absolute() || dir.empty()) {
    return fname;
  }

  return (dir / p).string();
}

}  // namespace

bool
ClassificationResult::operator==(const ClassificationResult& rhs) const {
  return canonical == rhs.canonical &&
         is_whitelisted == rhs.is_whitelisted &&
         is_dea_controlled == rhs.is_dea_controlled &&
         is_scaffold_match == rhs.is_scaffold_match &&
         is_fda_banned == rhs.is_fda_banned &&
         is_cwc_scheduled == rhs.is_cwc_scheduled &&
         scaffold_matches == rhs.scaffold_matches &&
         faves_flag_count == rhs.faves_flag_count &&
         status == rhs.status &&
         reference_name == rhs.reference_name &&
         schedule == rhs.schedule &&
         ambiguous_match == rhs.ambiguous_match &&
         degraded_confidence == rhs.degraded_confidence &&
         timed_out_patterns == rhs.timed_out_patterns;
}

std::vector<DrugClass>
ClassificationResult::MatchedClasses() const {
  std::vector<DrugClass> result;
  for (const ScaffoldMatch& s : scaffold_matches) {
    if (std::find(result.begin(), result.end(), s.drug_class) == result.end()) {
      result.push_back(s.drug_class);
    }
  }

  return result;
}

ComplianceResult
ClassificationResult::ToProto() const {
  ComplianceResult result;

  result.set_canonical(canonical);
  result.set_is_whitelisted(is_whitelisted);
  result.set_is_dea_controlled(is_dea_controlled);
  result.set_is_scaffold_match(is_scaffold_match);
  result.set_is_fda_banned(is_fda_banned);
  result.set_is_cwc_scheduled(is_cwc_scheduled);
  for (const ScaffoldMatch& s : scaffold_matches) {
    ScaffoldHit* hit = result.add_scaffold_hit();
    hit->set_pattern_id(s.pattern_id);
    hit->set_drug_class(s.drug_class);
  }
  result.set_faves_flag_count(faves_flag_count);
  result.set_status(status);
  if (! reference_name.empty()) {
    result.set_reference_name(reference_name);
  }
  result.set_schedule(schedule);
  result.set_ambiguous_match(ambiguous_match);
  result.set_degraded_confidence(degraded_confidence);
  for (const std::string& id : timed_out_patterns) {
    result.add_timed_out_pattern(id);
  }

  return result;
}

std::string
ComplianceStatusName(ComplianceStatus s) {
  switch (s) {
    case STATUS_CLEARED:
      return "cleared";
    case STATUS_CONTROLLED:
      return "controlled";
    case STATUS_REVIEW:
      return "review";
    default:
      return "none";
  }
}

Classifier::Classifier() : _match_timeout(kDefaultMatchTimeoutMs) {
  _fragment_lookup = 1;
  _verbose = 0;
}

int
Classifier::Build(const std::string& fname) {
  std::optional<ClassifierConfig> config = iwmisc::ReadTextProto<ClassifierConfig>(fname);
  if (! config) {
    cerr << "Classifier::Build:cannot read config '" << fname << "'\n";
    return 0;
  }

  const std::filesystem::path dir = std::filesystem::path(fname).parent_path();
  for (std::string& f : *config->mutable_whitelist()) {
    f = ResolvePath(dir, f);
  }
  for (std::string& f : *config->mutable_controlled()) {
    f = ResolvePath(dir, f);
  }
  if (! config->patterns().empty()) {
    config->set_patterns(ResolvePath(dir, config->patterns()));
  }

  return Build(*config);
}

int
Classifier::Build(const ClassifierConfig& config) {
  _verbose = config.verbose();

  if (config.patterns().empty()) {
    cerr << "Classifier::Build:no pattern library specified\n";
    return 0;
  }

  std::shared_ptr<ReferenceIndex> index = std::make_shared<ReferenceIndex>();
  index->set_verbose(_verbose);
  if (! index->Build(config)) {
    cerr << "Classifier::Build:cannot build reference index\n";
    return 0;
  }

  std::shared_ptr<PatternLibrary> patterns = std::make_shared<PatternLibrary>();
  if (! patterns->Build(config.patterns())) {
    cerr << "Classifier::Build:cannot build pattern library '" << config.patterns() << "'\n";
    return 0;
  }

  if (config.match_timeout_ms() > 0) {
    _match_timeout = std::chrono::milliseconds(config.match_timeout_ms());
  }

  _fragment_lookup = ! config.skip_fragment_lookup();

  if (_verbose) {
    cerr << "Classifier::Build:" << patterns->size() << " patterns, timeout "
         << _match_timeout.count() << " ms\n";
  }

  return Build(std::move(index), std::move(patterns));
}

int
Classifier::Build(std::shared_ptr<const ReferenceIndex> index,
                  std::shared_ptr<const PatternLibrary> patterns) {
  if (nullptr == index || nullptr == patterns) {
    cerr << "Classifier::Build:null index or patterns\n";
    return 0;
  }

  _index = std::move(index);
  _patterns = std::move(patterns);

  return 1;
}

std::optional<ClassificationResult>
Classifier::Classify(const std::string& smiles) const {
  ParseError error;
  std::optional<ClassificationResult> result = Classify(smiles, error);
  if (! result && _verbose) {
    cerr << "Classifier::Classify:invalid smiles '" << smiles << "', " << error << '\n';
  }

  return result;
}

std::optional<ClassificationResult>
Classifier::Classify(const std::string& smiles, ParseError& error) const {
  Molecule m;
  if (! m.build_from_smiles(smiles, error)) {
    return std::nullopt;
  }

  return Classify(m);
}

ClassificationResult
Classifier::Classify(const Molecule& m) const {
  ClassificationResult result;

  const CanonicalForm form = MakeCanonicalForm(m);
  result.canonical = form.smiles;

  if (_whitelist_tier(form, result)) {
    result.status = STATUS_CLEARED;
    return result;
  }

  _direct_match_tier(form, result);
  _scaffold_tier(m, result);

  result.faves_flag_count = result.is_dea_controlled + result.is_scaffold_match +
                            result.is_fda_banned + result.is_cwc_scheduled;

  if (result.is_dea_controlled) {
    result.status = STATUS_CONTROLLED;
  } else if (result.is_scaffold_match) {
    result.status = STATUS_REVIEW;
  } else {
    result.status = STATUS_NONE;
  }

  return result;
}

// Returns 1 if the molecule is whitelisted.
int
Classifier::_whitelist_tier(const CanonicalForm& form, ClassificationResult& result) const {
  const LookupResult found = _index->LookupWhitelist(form.smiles, form.secondary_hash);
  if (found.ambiguous) {
    result.ambiguous_match = true;
    cerr << "Classifier::_whitelist_tier:secondary hash mismatch for '" << form.smiles
         << "', not whitelisted\n";
  }

  if (nullptr == found.entry) {
    return 0;
  }

  result.is_whitelisted = true;
  result.reference_name = found.entry->name;

  return 1;
}

// Returns 1 if a controlled record is found.
int
Classifier::_direct_match_tier(const CanonicalForm& form, ClassificationResult& result) const {
  LookupResult found = _index->LookupControlled(form.smiles, form.secondary_hash);
  if (found.ambiguous) {
    result.ambiguous_match = true;
    cerr << "Classifier::_direct_match_tier:secondary hash mismatch for '" << form.smiles
         << "'\n";
  }

  if (nullptr == found.entry && _fragment_lookup && form.fragments.size() > 1) {
    for (const CanonicalFragment& frag : form.fragments) {
      found = _index->LookupControlled(frag.smiles, frag.secondary_hash);
      if (found.ambiguous) {
        result.ambiguous_match = true;
        cerr << "Classifier::_direct_match_tier:secondary hash mismatch for fragment '"
             << frag.smiles << "'\n";
      }
      if (nullptr != found.entry) {
        break;
      }
    }
  }

  if (nullptr == found.entry) {
    return 0;
  }

  const ReferenceEntry& entry = *found.entry;
  result.is_dea_controlled = true;
  result.is_fda_banned = entry.is_fda_banned;
  result.is_cwc_scheduled = entry.is_cwc_scheduled;
  result.reference_name = entry.name;
  result.schedule = entry.schedule;

  return 1;
}

// Every pattern is tried. Returns the number that matched.
int
Classifier::_scaffold_tier(const Molecule& m, ClassificationResult& result) const {
  int rc = 0;
  for (const CompiledPattern& pattern : _patterns->patterns()) {
    const auto deadline = std::chrono::steady_clock::now() + _match_timeout;
    switch (pattern.matcher.Match(m, deadline)) {
      case MatchStatus::kMatch:
        result.scaffold_matches.push_back(ScaffoldMatch{pattern.id, pattern.drug_class});
        ++rc;
        break;
      case MatchStatus::kTimeout:
        result.degraded_confidence = true;
        result.timed_out_patterns.push_back(pattern.id);
        cerr << "Classifier::_scaffold_tier:pattern '" << pattern.id << "' timed out on '"
             << result.canonical << "'\n";
        break;
      case MatchStatus::kNoMatch:
        break;
    }
  }

  result.is_scaffold_match = rc > 0;

  return rc;
}

}  // namespace faves
