#ifndef FAVES_LIB_STRUCTURE_HASH_H_
#define FAVES_LIB_STRUCTURE_HASH_H_

// Hash functions that must be stable across runs and platforms, since
// their values are stored in reference snapshots.

#include <cstdint>
#include <string_view>
#include <vector>

#include "Faves_Lib/molecule.h"

namespace faves {

// 64 bit FNV-1a.
uint64_t Fnv1a64(std::string_view s);

// Combine `value` into `seed`.
uint64_t HashCombine(uint64_t seed, uint64_t value);

// Packs (atomic number, charge, connections, hydrogens, isotope,
// aromatic, ring) into one number. Atoms that compare equal here are
// indistinguishable by their local properties.
uint64_t AtomInvariant(const Molecule& m, atom_number_t a);

// 1 single, 2 double, 3 triple, 4 aromatic.
int BondCode(const Bond& b);

// Circular environment hash of radius 2 over `atoms`, combined with the
// number of chiral markers and directional bonds among them. Independent
// of atom order.
uint64_t SecondaryHash(const Molecule& m, const std::vector<atom_number_t>& atoms);

// Over the whole molecule.
uint64_t SecondaryHash(const Molecule& m);

}  // namespace faves

#endif  // FAVES_LIB_STRUCTURE_HASH_H_
