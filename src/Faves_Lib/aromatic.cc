// Aromaticity perception over the sssr.
// Each ring is tested by itself. Pairs of fused rings that are not
// aromatic individually are then tested as a single envelope.

#include <algorithm>
#include <vector>

#include "Faves_Lib/molecule.h"

namespace faves {

namespace {

int
HuckelCount(int electrons) {
  return electrons >= 2 && 2 == electrons % 4;
}

}  // namespace

// Number of pi electrons atom `a` donates to a ring, or -1 if the
// atom prevents the ring from being aromatic. `kekule` holds the bond
// types before any aromatic bonds were assigned.
int
Molecule::_pi_electrons(atom_number_t a, const std::vector<bond_type_t>& kekule) const {
  const Atom& atom = _atoms[a];
  if (atom.is_aromatic()) {
    return 1;
  }

  int double_ring_bonds = 0;
  atomic_number_t exocyclic_double = INVALID_ATOMIC_NUMBER;
  for (int b : _bond_list[a]) {
    const bond_type_t bt = kekule[b];
    if (TRIPLE_BOND == bt) {
      return -1;
    }
    if (DOUBLE_BOND != bt) {
      continue;
    }
    if (_ring_bond[b]) {
      double_ring_bonds++;
    } else {
      exocyclic_double = _atoms[_bonds[b].other(a)].atomic_number();
    }
  }

  if (double_ring_bonds > 1) {
    return -1;
  }
  if (1 == double_ring_bonds) {
    return 1;
  }

  if (INVALID_ATOMIC_NUMBER != exocyclic_double) {
    if (8 == exocyclic_double || 7 == exocyclic_double || 16 == exocyclic_double) {
      return 0;
    }
    return -1;
  }

  const formal_charge_t q = atom.formal_charge();
  const int connections = ncon(a) + atom.hcount();

  switch (atom.atomic_number()) {
    case 6:
      if (-1 == q) {
        return 2;
      }
      if (1 == q) {
        return 0;
      }
      return -1;
    case 7:
    case 15:
      if (0 == q && 3 == connections) {
        return 2;
      }
      return -1;
    case 8:
    case 16:
    case 34:
      if (0 == q && 2 == connections) {
        return 2;
      }
      return -1;
    case 5:
      if (0 == q) {
        return 0;
      }
      return -1;
    default:
      return -1;
  }
}

int
Molecule::_perceive_aromaticity() {
  const int nr = nrings();
  if (0 == nr) {
    return 1;
  }

  std::vector<bond_type_t> kekule(nedges());
  for (int b = 0; b < nedges(); ++b) {
    kekule[b] = _bonds[b].btype();
  }

  // Pi electron count for a set of ring atoms, -1 if not possible.
  auto count_electrons = [this, &kekule](const std::vector<atom_number_t>& atoms) -> int {
    int rc = 0;
    for (atom_number_t a : atoms) {
      const int e = _pi_electrons(a, kekule);
      if (e < 0) {
        return -1;
      }
      rc += e;
    }
    return rc;
  };

  // 1 for rings written aromatic, 2 for rings perceived here.
  std::vector<int> aromatic_ring(nr, 0);

  for (int r = 0; r < nr; ++r) {
    const std::vector<atom_number_t>& ring = _sssr[r];
    if (std::all_of(ring.begin(), ring.end(), [this](atom_number_t a) {
          return _atoms[a].is_aromatic();
        })) {
      aromatic_ring[r] = 1;
      continue;
    }
    const int electrons = count_electrons(ring);
    if (HuckelCount(electrons)) {
      aromatic_ring[r] = 2;
    }
  }

  // Fused pairs, rings sharing at least one bond.
  for (int r1 = 0; r1 < nr; ++r1) {
    if (aromatic_ring[r1]) {
      continue;
    }
    for (int r2 = r1 + 1; r2 < nr; ++r2) {
      if (aromatic_ring[r2]) {
        continue;
      }
      std::vector<atom_number_t> envelope = _sssr[r1];
      int shared = 0;
      for (atom_number_t a : _sssr[r2]) {
        if (std::find(envelope.begin(), envelope.end(), a) == envelope.end()) {
          envelope.push_back(a);
        } else {
          ++shared;
        }
      }
      if (shared < 2) {
        continue;
      }
      const int electrons = count_electrons(envelope);
      if (HuckelCount(electrons)) {
        aromatic_ring[r1] = 2;
        aromatic_ring[r2] = 2;
        break;
      }
    }
  }

  for (int r = 0; r < nr; ++r) {
    if (2 != aromatic_ring[r]) {
      continue;
    }
    const std::vector<atom_number_t>& ring = _sssr[r];
    const int ring_size = ring.size();
    for (int i = 0; i < ring_size; ++i) {
      const atom_number_t a1 = ring[i];
      const atom_number_t a2 = ring[(i + 1) % ring_size];
      _atoms[a1].set_aromatic(1);
      const int b = which_bond(a1, a2);
      if (b >= 0) {
        _bonds[b].set_bond_type(AROMATIC_BOND);
      }
    }
  }

  return 1;
}

}  // namespace faves
