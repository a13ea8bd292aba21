#include <cstdlib>
#include <iostream>

#include "Faves_Lib/element.h"

namespace faves {

using std::cerr;

namespace {

// Index is atomic number, zero is the '*' atom.
const char* element_symbols[] = {
  "*",
  "H",  "He", "Li", "Be", "B",  "C",  "N",  "O",  "F",  "Ne",
  "Na", "Mg", "Al", "Si", "P",  "S",  "Cl", "Ar", "K",  "Ca",
  "Sc", "Ti", "V",  "Cr", "Mn", "Fe", "Co", "Ni", "Cu", "Zn",
  "Ga", "Ge", "As", "Se", "Br", "Kr", "Rb", "Sr", "Y",  "Zr",
  "Nb", "Mo", "Tc", "Ru", "Rh", "Pd", "Ag", "Cd", "In", "Sn",
  "Sb", "Te", "I",  "Xe", "Cs", "Ba", "La", "Ce", "Pr", "Nd",
  "Pm", "Sm", "Eu", "Gd", "Tb", "Dy", "Ho", "Er", "Tm", "Yb",
  "Lu", "Hf", "Ta", "W",  "Re", "Os", "Ir", "Pt", "Au", "Hg",
  "Tl", "Pb", "Bi", "Po", "At", "Rn", "Fr", "Ra", "Ac", "Th",
  "Pa", "U",  "Np", "Pu", "Am", "Cm", "Bk", "Cf", "Es", "Fm",
  "Md", "No", "Lr", "Rf", "Db", "Sg", "Bh", "Hs", "Mt", "Ds",
  "Rg", "Cn", "Nh", "Fl", "Mc", "Lv", "Ts", "Og"
};

std::vector<Element>
BuildPeriodicTable() {
  std::vector<Element> result;
  result.reserve(HIGHEST_ATOMIC_NUMBER + 1);
  for (int z = 0; z <= HIGHEST_ATOMIC_NUMBER; ++z) {
    result.emplace_back(z, element_symbols[z]);
  }

  result[0].set_organic(1);

  result[1].set_valences({1});

  result[5].set_valences({3});
  result[5].set_organic(1);
  result[5].set_aromatic_symbol("b");

  result[6].set_valences({4});
  result[6].set_organic(1);
  result[6].set_aromatic_symbol("c");

  result[7].set_valences({3, 5});
  result[7].set_organic(1);
  result[7].set_aromatic_symbol("n");

  result[8].set_valences({2});
  result[8].set_organic(1);
  result[8].set_aromatic_symbol("o");

  result[9].set_valences({1});
  result[9].set_organic(1);

  result[14].set_valences({4});

  result[15].set_valences({3, 5});
  result[15].set_organic(1);
  result[15].set_aromatic_symbol("p");

  result[16].set_valences({2, 4, 6});
  result[16].set_organic(1);
  result[16].set_aromatic_symbol("s");

  result[17].set_valences({1, 3, 5, 7});
  result[17].set_organic(1);

  result[33].set_valences({3, 5});
  result[33].set_aromatic_symbol("as");

  result[34].set_valences({2, 4, 6});
  result[34].set_aromatic_symbol("se");

  result[35].set_valences({1, 3, 5, 7});
  result[35].set_organic(1);

  result[52].set_valences({2, 4, 6});
  result[52].set_aromatic_symbol("te");

  result[53].set_valences({1, 3, 5, 7});
  result[53].set_organic(1);

  return result;
}

const std::vector<Element>&
PeriodicTable() {
  static const std::vector<Element> table = BuildPeriodicTable();
  return table;
}

}  // namespace

Element::Element(atomic_number_t z, const char* symbol) : _atomic_number(z), _symbol(symbol) {
  _organic = 0;
}

int
Element::normal_valence() const {
  if (_valence.empty()) {
    return -1;
  }

  return _valence[0];
}

int
Element::ImplicitHydrogens(int bond_order_sum, int aromatic, int has_double_bond) const {
  if (! _organic) {
    return -1;
  }

  if (_valence.empty()) {
    return 0;
  }

  // Aromatic atoms take one valence unit for the pi system unless they
  // already have an explicit double bond. Lone pair donors get nothing.
  if (aromatic && ! has_double_bond) {
    const int h = _valence[0] - bond_order_sum - 1;
    return h > 0 ? h : 0;
  }

  for (int v : _valence) {
    if (v >= bond_order_sum) {
      return v - bond_order_sum;
    }
  }

  return 0;
}

int
Element::ValenceOk(formal_charge_t formal_charge, int valence) const {
  if (_valence.empty()) {
    return 1;
  }

  int max_valence = _valence.back();

  switch (_atomic_number) {
    case 1:
    case 6:
    case 14:
      max_valence -= std::abs(formal_charge);
      break;
    case 5:
      max_valence -= formal_charge;
      break;
    default:
      max_valence += formal_charge;
  }

  return valence <= max_valence;
}

const Element*
get_element_from_atomic_number(atomic_number_t z) {
  if (! REASONABLE_ATOMIC_NUMBER(z)) {
    cerr << "get_element_from_atomic_number:invalid atomic number " << z << '\n';
    return nullptr;
  }

  return &PeriodicTable()[z];
}

const Element*
get_element_from_symbol(std::string_view s) {
  if (s.empty() || s.size() > 2) {
    return nullptr;
  }

  for (const Element& e : PeriodicTable()) {
    if (e.symbol() == s) {
      return &e;
    }
  }

  return nullptr;
}

const Element*
get_element_from_aromatic_symbol(std::string_view s) {
  if (s.empty() || s.size() > 2) {
    return nullptr;
  }

  for (const Element& e : PeriodicTable()) {
    if (! e.aromatic_symbol().empty() && e.aromatic_symbol() == s) {
      return &e;
    }
  }

  return nullptr;
}

}  // namespace faves
