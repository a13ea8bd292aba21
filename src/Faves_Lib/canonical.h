#ifndef FAVES_LIB_CANONICAL_H_
#define FAVES_LIB_CANONICAL_H_

#include <cstdint>
#include <random>
#include <string>
#include <vector>

#include "Faves_Lib/molecule.h"

namespace faves {

struct CanonicalFragment {
  std::string smiles;
  uint64_t content_hash = 0;
  uint64_t secondary_hash = 0;
};

// Everything needed to look a molecule up in a reference index.
struct CanonicalForm {
  // Fragment smiles, sorted, joined by '.'.
  std::string smiles;
  // Fnv1a64 of `smiles`.
  uint64_t content_hash = 0;
  uint64_t secondary_hash = 0;

  // In the same order as they appear in `smiles`.
  std::vector<CanonicalFragment> fragments;
};

// Canonical ranks, 0 to atoms.size()-1, for the atoms in `atoms`, which
// must be one or more complete fragments. The returned vector is indexed
// by atom number, atoms not in `atoms` get -1.
std::vector<int> CanonicalRanks(const Molecule& m, const std::vector<atom_number_t>& atoms);

// Depth first smiles for the connected `atoms`, starting with the lowest
// ranked atom and visiting neighbours in order of `rank`.
std::string WriteSmiles(const Molecule& m, const std::vector<atom_number_t>& atoms,
                        const std::vector<int>& rank);

CanonicalForm MakeCanonicalForm(const Molecule& m);

// Just the canonical smiles.
std::string UniqueSmiles(const Molecule& m);

// A valid smiles for `m` with the atoms in random order. Mostly useful
// for testing canonicalisation.
std::string RandomSmiles(const Molecule& m, std::mt19937& rng);

}  // namespace faves

#endif  // FAVES_LIB_CANONICAL_H_
