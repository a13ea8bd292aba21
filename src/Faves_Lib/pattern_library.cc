#include <iostream>
#include <unordered_set>

#include "re2/re2.h"

#include "Foundational/iwmisc/iwre2.h"
#include "Foundational/iwmisc/proto_support.h"

#include "Faves_Lib/pattern_library.h"

namespace faves {

using std::cerr;

std::string
DrugClassName(DrugClass c) {
  switch (c) {
    case OPIOID:
      return "opioid";
    case BENZODIAZEPINE:
      return "benzodiazepine";
    case STIMULANT:
      return "stimulant";
    case CANNABINOID:
      return "cannabinoid";
    case HYPNOTIC_SEDATIVE:
      return "hypnotic_sedative";
    case DISSOCIATIVE_HALLUCINOGEN:
      return "dissociative_hallucinogen";
    default:
      return "unspecified";
  }
}

int
PatternLibrary::Build(const std::string& fname) {
  std::optional<PatternLibraryData> proto = iwmisc::ReadTextProto<PatternLibraryData>(fname);
  if (! proto) {
    cerr << "PatternLibrary::Build:cannot read '" << fname << "'\n";
    return 0;
  }

  return Build(*proto);
}

int
PatternLibrary::Build(const PatternLibraryData& proto) {
  static const RE2 valid_id("[a-z0-9_]+");

  _patterns.clear();
  _patterns.reserve(proto.pattern_size());

  std::unordered_set<std::string> seen;
  for (const ScaffoldPattern& pattern : proto.pattern()) {
    if (! iwre2::RE2FullMatch(pattern.id(), valid_id)) {
      cerr << "PatternLibrary::Build:invalid id '" << pattern.id() << "'\n";
      return 0;
    }
    if (! seen.insert(pattern.id()).second) {
      cerr << "PatternLibrary::Build:duplicate id '" << pattern.id() << "'\n";
      return 0;
    }
    if (DRUG_CLASS_UNSPECIFIED == pattern.drug_class() || ! DrugClass_IsValid(pattern.drug_class())) {
      cerr << "PatternLibrary::Build:no drug class for '" << pattern.id() << "'\n";
      return 0;
    }

    CompiledPattern compiled;
    compiled.id = pattern.id();
    compiled.drug_class = pattern.drug_class();
    compiled.description = pattern.description();

    ParseError error;
    if (! compiled.matcher.Build(pattern.smarts(), error)) {
      cerr << "PatternLibrary::Build:cannot compile '" << pattern.id() << "' smarts '"
           << pattern.smarts() << "', ";
      if (! error.empty()) {
        cerr << error;
      }
      cerr << '\n';
      return 0;
    }

    _patterns.push_back(std::move(compiled));
  }

  if (_patterns.empty()) {
    cerr << "PatternLibrary::Build:no patterns\n";
    return 0;
  }

  return 1;
}

const CompiledPattern*
PatternLibrary::Find(const std::string& id) const {
  for (const CompiledPattern& p : _patterns) {
    if (p.id == id) {
      return &p;
    }
  }

  return nullptr;
}

}  // namespace faves
