#ifndef FAVES_LIB_PATTERN_LIBRARY_H_
#define FAVES_LIB_PATTERN_LIBRARY_H_

#include <string>
#include <vector>

#include "Faves_Lib/scaffold_pattern.pb.h"
#include "Faves_Lib/substructure.h"

namespace faves {

struct CompiledPattern {
  std::string id;
  DrugClass drug_class = DRUG_CLASS_UNSPECIFIED;
  std::string description;

  SubstructureMatcher matcher;
};

/*
  The scaffold patterns, compiled once and then shared read only.
  Build fails if any pattern has a missing or duplicate id, no drug
  class, or a smarts that does not compile to a connected query.
*/

class PatternLibrary {
  private:
    std::vector<CompiledPattern> _patterns;

  public:
    int Build(const PatternLibraryData& proto);
    // Text proto PatternLibraryData.
    int Build(const std::string& fname);

    int size() const { return static_cast<int>(_patterns.size());}
    bool empty() const { return _patterns.empty();}

    const std::vector<CompiledPattern>& patterns() const { return _patterns;}

    // Null if `id` is not present.
    const CompiledPattern* Find(const std::string& id) const;
};

// "opioid", "benzodiazepine" ...
std::string DrugClassName(DrugClass c);

}  // namespace faves

#endif  // FAVES_LIB_PATTERN_LIBRARY_H_
