#ifndef FAVES_LIB_SUBSTRUCTURE_H_
#define FAVES_LIB_SUBSTRUCTURE_H_

#include <chrono>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "Faves_Lib/molecule.h"
#include "Faves_Lib/query.h"
#include "Faves_Lib/smiles.h"

namespace faves {

enum class MatchStatus {
  kNoMatch,
  kMatch,
  // The deadline passed before the search finished.
  kTimeout
};

std::ostream& operator<<(std::ostream& os, MatchStatus s);

/*
  Subgraph containment of a SubstructureQuery in a Molecule. The match
  need not be induced: target atoms may have bonds that the query does
  not mention.

  Query atoms are matched in breadth first order from the most selective
  atom, so every atom after the first is a neighbour of an atom already
  matched. The search backtracks over candidates and gives up once the
  deadline is reached.
*/

class SubstructureMatcher {
  private:
    SubstructureQuery _query;

    // Query atoms in the order they are matched.
    std::vector<int> _order;
    // For _order[i], i > 0, the query bond joining it to an earlier atom.
    std::vector<int> _parent_bond;
    // For _order[i], other bonds to atoms earlier in _order.
    std::vector<std::vector<int>> _closure_bonds;

    std::vector<std::pair<atomic_number_t, int>> _required_elements;
    int _required_aromatic_atoms;
    int _required_ring_bonds;

//  private functions

    int _establish_order();
    int _passes_prefilter(const Molecule& m) const;
    int _feasible(const Molecule& m, int depth, atom_number_t t,
                  const std::vector<atom_number_t>& assignment,
                  const std::vector<int>& used) const;

  public:
    SubstructureMatcher();

    int Build(SubstructureQuery&& query);
    int Build(const std::string& smarts, ParseError& error);

    const SubstructureQuery& query() const { return _query;}

    // If a match is found and `embedding` is not null, it is filled with
    // the target atom matched by each query atom.
    MatchStatus Match(const Molecule& m, std::chrono::steady_clock::time_point deadline,
                      std::vector<atom_number_t>* embedding = nullptr) const;

    MatchStatus Match(const Molecule& m, std::chrono::milliseconds budget) const;

    // No time limit.
    int Matches(const Molecule& m) const;
};

}  // namespace faves

#endif  // FAVES_LIB_SUBSTRUCTURE_H_
