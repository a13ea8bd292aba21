#include <algorithm>

#include "Faves_Lib/molecule.h"

namespace faves {

Atom::Atom(const Element* e) : _element(e) {
  _formal_charge = 0;
  _isotope = 0;
  _hcount = 0;
  _hcount_specified = 0;
  _aromatic = 0;
  _chiral = 0;
  _atom_class = 0;
}

Bond::Bond(atom_number_t a1, atom_number_t a2, bond_type_t bt) : _a1(a1), _a2(a2), _btype(bt) {
  _directional = 0;
  _implicit = 0;
}

int
Bond::bond_order() const {
  switch (_btype) {
    case DOUBLE_BOND:
      return 2;
    case TRIPLE_BOND:
      return 3;
    default:
      return 1;
  }
}

Molecule::Molecule() {
  _number_fragments = 0;
}

void
Molecule::_clear() {
  _name.clear();
  _atoms.clear();
  _bonds.clear();
  _bond_list.clear();
  _ring_bond.clear();
  _nrings.clear();
  _sssr.clear();
  _fragment_membership.clear();
  _number_fragments = 0;
}

int
Molecule::_add_atom(const Atom& a) {
  _atoms.push_back(a);
  _bond_list.emplace_back();

  return static_cast<int>(_atoms.size()) - 1;
}

// Returns the index of the new bond, or -1 if the bond would
// make the graph not simple.
int
Molecule::_add_bond(atom_number_t a1, atom_number_t a2, bond_type_t bt) {
  if (a1 == a2) {
    return -1;
  }

  if (are_bonded(a1, a2)) {
    return -1;
  }

  const int b = static_cast<int>(_bonds.size());
  _bonds.emplace_back(a1, a2, bt);
  _bond_list[a1].push_back(b);
  _bond_list[a2].push_back(b);

  return b;
}

int
Molecule::natoms(atomic_number_t z) const {
  return std::count_if(_atoms.begin(), _atoms.end(), [z](const Atom& a) {
    return a.atomic_number() == z;
  });
}

int
Molecule::which_bond(atom_number_t a1, atom_number_t a2) const {
  for (int b : _bond_list[a1]) {
    if (_bonds[b].involves(a2)) {
      return b;
    }
  }

  return -1;
}

int
Molecule::nbonds(atom_number_t a) const {
  int rc = 0;
  for (int b : _bond_list[a]) {
    rc += _bonds[b].bond_order();
  }

  return rc;
}

int
Molecule::hcount(atom_number_t a) const {
  int rc = _atoms[a].hcount();
  for (int b : _bond_list[a]) {
    if (1 == _atoms[_bonds[b].other(a)].atomic_number()) {
      ++rc;
    }
  }

  return rc;
}

int
Molecule::in_ring_of_given_size(atom_number_t a, int ring_size) const {
  if (0 == _nrings[a]) {
    return 0;
  }

  for (const std::vector<atom_number_t>& r : _sssr) {
    if (static_cast<int>(r.size()) != ring_size) {
      continue;
    }
    if (std::find(r.begin(), r.end(), a) != r.end()) {
      return 1;
    }
  }

  return 0;
}

// Breadth first labelling of connected components.
int
Molecule::_compute_fragment_membership() {
  const int matoms = natoms();

  _fragment_membership.assign(matoms, -1);
  _number_fragments = 0;

  std::vector<atom_number_t> stack;
  for (int i = 0; i < matoms; ++i) {
    if (_fragment_membership[i] >= 0) {
      continue;
    }

    _fragment_membership[i] = _number_fragments;
    stack.push_back(i);
    while (! stack.empty()) {
      const atom_number_t j = stack.back();
      stack.pop_back();
      for (int b : _bond_list[j]) {
        const atom_number_t k = _bonds[b].other(j);
        if (_fragment_membership[k] < 0) {
          _fragment_membership[k] = _number_fragments;
          stack.push_back(k);
        }
      }
    }

    ++_number_fragments;
  }

  return _number_fragments;
}

std::vector<atom_number_t>
Molecule::atoms_in_fragment(int f) const {
  std::vector<atom_number_t> result;
  for (int i = 0; i < natoms(); ++i) {
    if (_fragment_membership[i] == f) {
      result.push_back(i);
    }
  }

  return result;
}

int
Molecule::aromatic_atom_count() const {
  return std::count_if(_atoms.begin(), _atoms.end(), [](const Atom& a) {
    return a.is_aromatic();
  });
}

int
Molecule::chiral_centre_count() const {
  return std::count_if(_atoms.begin(), _atoms.end(), [](const Atom& a) {
    return a.chiral();
  });
}

int
Molecule::directional_bond_count() const {
  return std::count_if(_bonds.begin(), _bonds.end(), [](const Bond& b) {
    return b.directional();
  });
}

}  // namespace faves
