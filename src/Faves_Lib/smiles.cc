#include <algorithm>
#include <cctype>
#include <iostream>
#include <map>
#include <optional>

#include "Faves_Lib/molecule.h"
#include "Faves_Lib/smiles.h"

namespace faves {

using std::cerr;

int
ParseError::Set(int pos, const std::string& msg) {
  position = pos;
  message = msg;

  return 0;
}

std::ostream&
operator<<(std::ostream& os, const ParseError& error) {
  os << error.message;
  if (error.position >= 0) {
    os << " at position " << error.position;
  }

  return os;
}

int
ParseRingClosure(const std::string& s, int& i) {
  const int n = s.size();
  if (i >= n) {
    return -1;
  }

  if (isdigit(static_cast<unsigned char>(s[i]))) {
    return s[i++] - '0';
  }

  if ('%' != s[i]) {
    return -1;
  }

  if (i + 2 >= n || ! isdigit(static_cast<unsigned char>(s[i + 1])) ||
      ! isdigit(static_cast<unsigned char>(s[i + 2]))) {
    return -1;
  }

  const int rc = (s[i + 1] - '0') * 10 + (s[i + 2] - '0');
  i += 3;

  return rc;
}

int
ParseCharge(const std::string& s, int& i, formal_charge_t& result) {
  const int n = s.size();
  if (i >= n) {
    return 0;
  }

  const char sign = s[i];
  if ('+' != sign && '-' != sign) {
    return 0;
  }

  int j = i + 1;
  int magnitude = 1;
  if (j < n && isdigit(static_cast<unsigned char>(s[j]))) {
    magnitude = 0;
    while (j < n && isdigit(static_cast<unsigned char>(s[j]))) {
      magnitude = magnitude * 10 + (s[j] - '0');
      if (magnitude > 99) {
        return 0;
      }
      ++j;
    }
  } else {
    while (j < n && s[j] == sign) {
      ++magnitude;
      ++j;
    }
  }

  if (! REASONABLE_FORMAL_CHARGE(magnitude)) {
    return 0;
  }

  result = ('+' == sign) ? magnitude : -magnitude;
  i = j;

  return 1;
}

bond_type_t
BondTypeFromSymbol(char c) {
  switch (c) {
    case SINGLE_BOND_SYMBOL:
      return SINGLE_BOND;
    case DOUBLE_BOND_SYMBOL:
      return DOUBLE_BOND;
    case TRIPLE_BOND_SYMBOL:
      return TRIPLE_BOND;
    case AROMATIC_BOND_SYMBOL:
      return AROMATIC_BOND;
    default:
      return UNKNOWN_BOND_TYPE;
  }
}

namespace {

// Ring closures that have been opened but not yet closed.
class Smiles_Ring_Status {
  public:
    struct RingOpening {
      atom_number_t atom;
      bond_type_t btype;
      int directional;
      int position;
    };

  private:
    std::map<int, RingOpening> _open;

  public:
    int is_open(int ring) const { return _open.find(ring) != _open.end();}

    void Open(int ring, atom_number_t a, bond_type_t bt, int directional, int position) {
      _open[ring] = RingOpening{a, bt, directional, position};
    }

    RingOpening Close(int ring) {
      auto iter = _open.find(ring);
      const RingOpening result = iter->second;
      _open.erase(iter);
      return result;
    }

    int empty() const { return _open.empty();}

    // The lowest numbered ring still open.
    std::pair<int, RingOpening> first_open() const { return *_open.begin();}
};

enum class Token {
  kNone,
  kAtom,
  kRingClosure,
  kBond,
  kOpenBranch,
  kCloseBranch,
  kDot
};

int
FollowsAtom(Token t) {
  return Token::kAtom == t || Token::kRingClosure == t || Token::kCloseBranch == t;
}

std::optional<Atom>
ParseOrganicAtom(const std::string& s, int& i) {
  const int n = s.size();
  const char c = s[i];

  if ('*' == c) {
    ++i;
    return Atom(get_element_from_atomic_number(0));
  }

  if (islower(static_cast<unsigned char>(c))) {
    const Element* e = get_element_from_aromatic_symbol(s.substr(i, 1));
    if (nullptr == e || ! e->organic()) {
      return std::nullopt;
    }
    ++i;
    Atom result(e);
    result.set_aromatic(1);
    return result;
  }

  const Element* e = nullptr;
  if (i + 1 < n && (('C' == c && 'l' == s[i + 1]) || ('B' == c && 'r' == s[i + 1]))) {
    e = get_element_from_symbol(s.substr(i, 2));
    i += 2;
  } else {
    e = get_element_from_symbol(s.substr(i, 1));
    if (nullptr == e || ! e->organic() || 0 == e->atomic_number()) {
      return std::nullopt;
    }
    ++i;
  }

  return Atom(e);
}

int
IsChiralityClass(const std::string& s, int j) {
  static const char* classes[] = {"TH", "AL", "SP", "TB", "OH"};
  for (const char* cls : classes) {
    if (0 == s.compare(j, 2, cls)) {
      return 1;
    }
  }

  return 0;
}

// s[i] is '['. On success `i` is left after the closing ']'.
std::optional<Atom>
ParseBracketAtom(const std::string& s, int& i, ParseError& error) {
  const int n = s.size();
  const int open_bracket = i;
  int j = i + 1;

  isotope_t isotope = 0;
  while (j < n && isdigit(static_cast<unsigned char>(s[j]))) {
    isotope = isotope * 10 + (s[j] - '0');
    if (isotope > 999) {
      error.Set(j, "invalid isotope");
      return std::nullopt;
    }
    ++j;
  }

  if (j >= n) {
    error.Set(open_bracket, "unterminated bracket atom");
    return std::nullopt;
  }

  const Element* e = nullptr;
  int aromatic = 0;
  if ('*' == s[j]) {
    e = get_element_from_atomic_number(0);
    ++j;
  } else if (islower(static_cast<unsigned char>(s[j]))) {
    if (j + 1 < n && islower(static_cast<unsigned char>(s[j + 1]))) {
      e = get_element_from_aromatic_symbol(s.substr(j, 2));
      if (nullptr != e) {
        j += 2;
      }
    }
    if (nullptr == e) {
      e = get_element_from_aromatic_symbol(s.substr(j, 1));
      if (nullptr != e) {
        ++j;
      }
    }
    aromatic = 1;
  } else if (isupper(static_cast<unsigned char>(s[j]))) {
    if (j + 1 < n && islower(static_cast<unsigned char>(s[j + 1]))) {
      e = get_element_from_symbol(s.substr(j, 2));
      if (nullptr != e) {
        j += 2;
      }
    }
    if (nullptr == e) {
      e = get_element_from_symbol(s.substr(j, 1));
      if (nullptr != e) {
        ++j;
      }
    }
  }

  if (nullptr == e) {
    error.Set(j, "invalid element specification");
    return std::nullopt;
  }

  int chiral = 0;
  if (j < n && '@' == s[j]) {
    chiral = 1;
    ++j;
    if (j < n && '@' == s[j]) {
      ++j;
    } else if (j + 1 < n && IsChiralityClass(s, j)) {
      j += 2;
      while (j < n && isdigit(static_cast<unsigned char>(s[j]))) {
        ++j;
      }
    }
  }

  int hcount = 0;
  if (j < n && 'H' == s[j]) {
    ++j;
    hcount = 1;
    if (j < n && isdigit(static_cast<unsigned char>(s[j]))) {
      hcount = s[j] - '0';
      ++j;
      if (j < n && isdigit(static_cast<unsigned char>(s[j]))) {
        error.Set(j, "invalid hydrogen count");
        return std::nullopt;
      }
    }
  }

  formal_charge_t formal_charge = 0;
  if (j < n && ('+' == s[j] || '-' == s[j])) {
    if (! ParseCharge(s, j, formal_charge)) {
      error.Set(j, "invalid charge");
      return std::nullopt;
    }
  }

  int atom_class = 0;
  if (j < n && ':' == s[j]) {
    ++j;
    if (j >= n || ! isdigit(static_cast<unsigned char>(s[j]))) {
      error.Set(j, "invalid atom class");
      return std::nullopt;
    }
    while (j < n && isdigit(static_cast<unsigned char>(s[j]))) {
      atom_class = atom_class * 10 + (s[j] - '0');
      ++j;
    }
  }

  if (j >= n || ']' != s[j]) {
    error.Set(j < n ? j : open_bracket, "malformed bracket atom");
    return std::nullopt;
  }

  i = j + 1;

  Atom result(e);
  result.set_isotope(isotope);
  result.set_aromatic(aromatic);
  result.set_chiral(chiral);
  result.set_hcount(hcount);
  result.set_hcount_specified(1);
  result.set_formal_charge(formal_charge);
  result.set_atom_class(atom_class);

  return result;
}

}  // namespace

int
Molecule::build_from_smiles(const std::string& smiles) {
  ParseError error;
  if (! build_from_smiles(smiles, error)) {
    cerr << "Molecule::build_from_smiles:cannot parse '" << smiles << "', " << error << '\n';
    return 0;
  }

  return 1;
}

int
Molecule::build_from_smiles(const std::string& smiles, ParseError& error) {
  _clear();
  error.clear();

  std::vector<int> atom_position;
  if (! _parse_smiles(smiles, atom_position, error) ||
      ! _finish_perception(atom_position, error)) {
    _clear();
    return 0;
  }

  return 1;
}

int
Molecule::_parse_smiles(const std::string& smiles, std::vector<int>& atom_position,
                        ParseError& error) {
  const int n = smiles.size();
  if (0 == n) {
    return error.Set(0, "empty smiles");
  }

  atom_number_t previous_atom = INVALID_ATOM_NUMBER;
  bond_type_t pending_bond = UNKNOWN_BOND_TYPE;
  int pending_directional = 0;
  int pending_bond_position = -1;
  Token last_token = Token::kNone;
  // Token preceding a bond symbol, ring closures may follow "C=".
  Token before_bond = Token::kNone;

  std::vector<atom_number_t> branch_stack;
  std::vector<int> branch_position;
  std::vector<int> atoms_at_branch_start;

  Smiles_Ring_Status ring_status;

  int i = 0;
  while (i < n) {
    const char c = smiles[i];

    if ('(' == c) {
      if (! FollowsAtom(last_token)) {
        return error.Set(i, "branch must follow an atom");
      }
      branch_stack.push_back(previous_atom);
      branch_position.push_back(i);
      atoms_at_branch_start.push_back(natoms());
      last_token = Token::kOpenBranch;
      ++i;
      continue;
    }

    if (')' == c) {
      if (branch_stack.empty()) {
        return error.Set(i, "unbalanced parentheses");
      }
      if (Token::kBond == last_token) {
        return error.Set(pending_bond_position, "bond symbol with no following atom");
      }
      if (natoms() == atoms_at_branch_start.back()) {
        return error.Set(i, "empty branch");
      }
      previous_atom = branch_stack.back();
      branch_stack.pop_back();
      branch_position.pop_back();
      atoms_at_branch_start.pop_back();
      last_token = Token::kCloseBranch;
      ++i;
      continue;
    }

    if ('.' == c) {
      if (! FollowsAtom(last_token)) {
        return error.Set(i, "misplaced fragment separator");
      }
      if (! branch_stack.empty()) {
        return error.Set(i, "fragment separator inside branch");
      }
      previous_atom = INVALID_ATOM_NUMBER;
      last_token = Token::kDot;
      ++i;
      continue;
    }

    if ('/' == c || '\\' == c || UNKNOWN_BOND_TYPE != BondTypeFromSymbol(c)) {
      if (Token::kBond == last_token) {
        return error.Set(i, "consecutive bond symbols");
      }
      if (INVALID_ATOM_NUMBER == previous_atom ||
          (! FollowsAtom(last_token) && Token::kOpenBranch != last_token)) {
        return error.Set(i, "bond symbol with no preceding atom");
      }
      if ('/' == c || '\\' == c) {
        pending_bond = SINGLE_BOND;
        pending_directional = 1;
      } else {
        pending_bond = BondTypeFromSymbol(c);
        pending_directional = 0;
      }
      pending_bond_position = i;
      before_bond = last_token;
      last_token = Token::kBond;
      ++i;
      continue;
    }

    if (isdigit(static_cast<unsigned char>(c)) || '%' == c) {
      const int ring_position = i;
      if (! (Token::kAtom == last_token || Token::kRingClosure == last_token ||
             (Token::kBond == last_token && (Token::kAtom == before_bond ||
                                             Token::kRingClosure == before_bond)))) {
        return error.Set(i, "misplaced ring closure");
      }
      const int ring = ParseRingClosure(smiles, i);
      if (ring < 0) {
        return error.Set(ring_position, "invalid ring closure");
      }

      if (! ring_status.is_open(ring)) {
        ring_status.Open(ring, previous_atom, pending_bond, pending_directional, ring_position);
      } else {
        const Smiles_Ring_Status::RingOpening opening = ring_status.Close(ring);
        if (opening.atom == previous_atom) {
          return error.Set(ring_position, "ring closure to the same atom");
        }

        bond_type_t bt = opening.btype;
        if (UNKNOWN_BOND_TYPE != bt && UNKNOWN_BOND_TYPE != pending_bond && bt != pending_bond) {
          return error.Set(ring_position, "conflicting ring closure bond types");
        }
        if (UNKNOWN_BOND_TYPE == bt) {
          bt = pending_bond;
        }
        int implicit = 0;
        if (UNKNOWN_BOND_TYPE == bt) {
          implicit = 1;
          if (_atoms[opening.atom].is_aromatic() && _atoms[previous_atom].is_aromatic()) {
            bt = AROMATIC_BOND;
          } else {
            bt = SINGLE_BOND;
          }
        }

        const int b = _add_bond(opening.atom, previous_atom, bt);
        if (b < 0) {
          return error.Set(ring_position, "duplicate bond");
        }
        _bonds[b].set_implicit(implicit);
        _bonds[b].set_directional(opening.directional || pending_directional);
      }

      pending_bond = UNKNOWN_BOND_TYPE;
      pending_directional = 0;
      last_token = Token::kRingClosure;
      continue;
    }

    // Must be an atom.
    const int atom_start = i;
    std::optional<Atom> atom;
    if ('[' == c) {
      atom = ParseBracketAtom(smiles, i, error);
      if (! atom) {
        return 0;
      }
    } else {
      atom = ParseOrganicAtom(smiles, i);
      if (! atom) {
        return error.Set(i, "invalid element specification");
      }
    }

    if (natoms() >= kMaxAtoms) {
      return error.Set(atom_start, "too many atoms, limit " + std::to_string(kMaxAtoms));
    }

    const atom_number_t a = _add_atom(*atom);
    atom_position.push_back(atom_start);

    if (INVALID_ATOM_NUMBER != previous_atom) {
      bond_type_t bt = pending_bond;
      int implicit = 0;
      if (UNKNOWN_BOND_TYPE == bt) {
        implicit = 1;
        if (_atoms[previous_atom].is_aromatic() && _atoms[a].is_aromatic()) {
          bt = AROMATIC_BOND;
        } else {
          bt = SINGLE_BOND;
        }
      }
      const int b = _add_bond(previous_atom, a, bt);
      _bonds[b].set_implicit(implicit);
      _bonds[b].set_directional(pending_directional);
    }

    previous_atom = a;
    pending_bond = UNKNOWN_BOND_TYPE;
    pending_directional = 0;
    last_token = Token::kAtom;
  }

  if (Token::kBond == last_token) {
    return error.Set(pending_bond_position, "bond symbol with no following atom");
  }

  if (! branch_stack.empty()) {
    return error.Set(branch_position.back(), "unbalanced parentheses");
  }

  if (! ring_status.empty()) {
    const auto [ring, opening] = ring_status.first_open();
    return error.Set(opening.position, "unclosed ring closure " + std::to_string(ring));
  }

  if (Token::kDot == last_token) {
    return error.Set(n - 1, "misplaced fragment separator");
  }

  if (0 == natoms()) {
    return error.Set(0, "no atoms");
  }

  return 1;
}

int
Molecule::_finish_perception(std::vector<int>& atom_position, ParseError& error) {
  _fold_explicit_hydrogens(atom_position);

  _compute_fragment_membership();

  _find_ring_bonds();
  _find_sssr();

  const int matoms = natoms();
  for (int i = 0; i < matoms; ++i) {
    if (_atoms[i].is_aromatic() && ! is_ring_atom(i)) {
      return error.Set(atom_position[i], "aromatic atom not in ring");
    }
  }

  // Aromatic bonds are only valid between aromatic ring atoms. A biphenyl
  // like c1ccccc1c1ccccc1 has a single bond joining the rings.
  for (int b = 0; b < nedges(); ++b) {
    Bond& bond = _bonds[b];
    if (! bond.is_aromatic()) {
      continue;
    }
    if (! _ring_bond[b] || ! _atoms[bond.a1()].is_aromatic() ||
        ! _atoms[bond.a2()].is_aromatic()) {
      bond.set_bond_type(SINGLE_BOND);
    }
  }

  _assign_implicit_hydrogens();

  if (! _check_valences(atom_position, error)) {
    return 0;
  }

  _perceive_aromaticity();

  return 1;
}

namespace {

// An [H] that can become part of its neighbour's hydrogen count.
int
IsFoldableHydrogen(const Atom& a) {
  return 1 == a.atomic_number() && 0 == a.formal_charge() && 0 == a.isotope() &&
         0 == a.atom_class() && 0 == a.hcount() && ! a.chiral();
}

}  // namespace

// Removes hydrogen atoms that only record a hydrogen on a heavy atom, so
// [H]C and C give the same graph. Returns the number of atoms removed.
int
Molecule::_fold_explicit_hydrogens(std::vector<int>& atom_position) {
  const int matoms = natoms();

  std::vector<int> remove(matoms, 0);
  std::vector<int> extra_hydrogens(matoms, 0);
  int nremove = 0;
  for (int i = 0; i < matoms; ++i) {
    if (1 != ncon(i) || ! IsFoldableHydrogen(_atoms[i])) {
      continue;
    }
    const Bond& b = _bonds[_bond_list[i][0]];
    const atom_number_t j = b.other(i);
    if (! b.is_single_bond() || 1 == _atoms[j].atomic_number()) {
      continue;
    }
    remove[i] = 1;
    extra_hydrogens[j]++;
    ++nremove;
  }

  if (0 == nremove) {
    return 0;
  }

  // Unbracketed atoms get their implicit hydrogens while the folded atoms
  // are still attached, then keep that count.
  for (int i = 0; i < matoms; ++i) {
    if (0 == extra_hydrogens[i]) {
      continue;
    }
    Atom& a = _atoms[i];
    int h = a.hcount();
    if (! a.hcount_specified()) {
      h = std::max(_implicit_hydrogens(i), 0);
    }
    a.set_hcount(h + extra_hydrogens[i]);
    a.set_hcount_specified(1);
  }

  std::vector<atom_number_t> xref(matoms, INVALID_ATOM_NUMBER);
  std::vector<Atom> atoms;
  std::vector<int> position;
  for (int i = 0; i < matoms; ++i) {
    if (remove[i]) {
      continue;
    }
    xref[i] = static_cast<atom_number_t>(atoms.size());
    atoms.push_back(_atoms[i]);
    position.push_back(atom_position[i]);
  }

  std::vector<Bond> bonds;
  bonds.swap(_bonds);

  _atoms.swap(atoms);
  atom_position.swap(position);
  _bond_list.assign(_atoms.size(), std::vector<int>());

  for (const Bond& b : bonds) {
    if (remove[b.a1()] || remove[b.a2()]) {
      continue;
    }
    const int ndx = _add_bond(xref[b.a1()], xref[b.a2()], b.btype());
    _bonds[ndx].set_directional(b.directional());
    _bonds[ndx].set_implicit(b.implicit());
  }

  return nremove;
}

int
Molecule::_implicit_hydrogens(atom_number_t a) const {
  int has_double_bond = 0;
  for (int b : _bond_list[a]) {
    if (_bonds[b].is_double_bond()) {
      has_double_bond = 1;
    }
  }

  const Atom& atom = _atoms[a];
  return atom.element()->ImplicitHydrogens(nbonds(a), atom.is_aromatic(), has_double_bond);
}

int
Molecule::_assign_implicit_hydrogens() {
  const int matoms = natoms();
  for (int i = 0; i < matoms; ++i) {
    Atom& a = _atoms[i];
    if (a.hcount_specified()) {
      continue;
    }

    const int h = _implicit_hydrogens(i);
    a.set_hcount(h > 0 ? h : 0);
  }

  return 1;
}

int
Molecule::_check_valences(const std::vector<int>& atom_position, ParseError& error) const {
  const int matoms = natoms();
  for (int i = 0; i < matoms; ++i) {
    const Atom& a = _atoms[i];
    const int valence = nbonds(i) + a.hcount();
    if (! a.element()->ValenceOk(a.formal_charge(), valence)) {
      return error.Set(atom_position[i], "invalid valence on " + a.element()->symbol() +
                                         ", " + std::to_string(valence));
    }
  }

  return 1;
}

}  // namespace faves
