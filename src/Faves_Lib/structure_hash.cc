#include <algorithm>
#include <cstdlib>

#include "Faves_Lib/structure_hash.h"

namespace faves {

namespace {

constexpr int kRadius = 2;

uint64_t
Avalanche(uint64_t x) {
  x ^= x >> 33;
  x *= 0xff51afd7ed558ccdULL;
  x ^= x >> 33;
  x *= 0xc4ceb9fe1a85ec53ULL;
  x ^= x >> 33;
  return x;
}

}  // namespace

uint64_t
Fnv1a64(std::string_view s) {
  uint64_t result = 14695981039346656037ULL;
  for (unsigned char c : s) {
    result ^= c;
    result *= 1099511628211ULL;
  }

  return result;
}

uint64_t
HashCombine(uint64_t seed, uint64_t value) {
  return seed ^ (Avalanche(value) + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2));
}

uint64_t
AtomInvariant(const Molecule& m, atom_number_t a) {
  const Atom& atom = m.atomi(a);

  uint64_t result = static_cast<uint64_t>(atom.atomic_number());
  result = (result << 4) | static_cast<uint64_t>(atom.formal_charge() + 8);
  result = (result << 6) | static_cast<uint64_t>(std::min(m.ncon(a), 63));
  result = (result << 4) | static_cast<uint64_t>(std::min(m.hcount(a), 15));
  result = (result << 10) | static_cast<uint64_t>(atom.isotope());
  result = (result << 1) | static_cast<uint64_t>(atom.is_aromatic() ? 1 : 0);
  result = (result << 1) | static_cast<uint64_t>(m.is_ring_atom(a) ? 1 : 0);

  return result;
}

int
BondCode(const Bond& b) {
  switch (b.btype()) {
    case SINGLE_BOND:
      return 1;
    case DOUBLE_BOND:
      return 2;
    case TRIPLE_BOND:
      return 3;
    case AROMATIC_BOND:
      return 4;
    default:
      return 0;
  }
}

uint64_t
SecondaryHash(const Molecule& m, const std::vector<atom_number_t>& atoms) {
  const int matoms = m.natoms();

  std::vector<uint64_t> current(matoms, 0);
  std::vector<uint64_t> environments;
  environments.reserve(atoms.size() * (kRadius + 1));

  for (atom_number_t a : atoms) {
    current[a] = Avalanche(AtomInvariant(m, a));
    environments.push_back(current[a]);
  }

  std::vector<uint64_t> next(matoms, 0);
  std::vector<uint64_t> neighbours;
  for (int radius = 1; radius <= kRadius; ++radius) {
    for (atom_number_t a : atoms) {
      neighbours.clear();
      for (int b : m.bonds_attached(a)) {
        const Bond& bond = m.bondi(b);
        neighbours.push_back(HashCombine(BondCode(bond), current[bond.other(a)]));
      }
      std::sort(neighbours.begin(), neighbours.end());
      uint64_t h = HashCombine(current[a], radius);
      for (uint64_t n : neighbours) {
        h = HashCombine(h, n);
      }
      next[a] = h;
      environments.push_back(h);
    }
    current.swap(next);
  }

  std::sort(environments.begin(), environments.end());

  uint64_t result = 0;
  for (uint64_t e : environments) {
    result = HashCombine(result, e);
  }

  int chiral = 0;
  int directional = 0;
  for (atom_number_t a : atoms) {
    if (m.atomi(a).chiral()) {
      ++chiral;
    }
    for (int b : m.bonds_attached(a)) {
      // Each bond is seen from both ends.
      if (m.bondi(b).directional() && m.bondi(b).a1() == a) {
        ++directional;
      }
    }
  }

  result = HashCombine(result, chiral);
  result = HashCombine(result, directional);

  return Avalanche(result);
}

uint64_t
SecondaryHash(const Molecule& m) {
  // Same as the fragment hash, so a single fragment record can be
  // found from a fragment of a salt.
  if (1 == m.number_fragments()) {
    return SecondaryHash(m, m.atoms_in_fragment(0));
  }

  std::vector<uint64_t> fragment_hashes;
  for (int f = 0; f < m.number_fragments(); ++f) {
    fragment_hashes.push_back(SecondaryHash(m, m.atoms_in_fragment(f)));
  }

  std::sort(fragment_hashes.begin(), fragment_hashes.end());

  uint64_t result = HashCombine(0, fragment_hashes.size());
  for (uint64_t h : fragment_hashes) {
    result = HashCombine(result, h);
  }

  return result;
}

}  // namespace faves
