#include <algorithm>
#include <cctype>
#include <iostream>
#include <map>

#include "Faves_Lib/element.h"
#include "Faves_Lib/query.h"

namespace faves {

using std::cerr;

QueryAtom::QueryAtom() {
  _aromatic = -1;
  _ring = -1;
  _nrings = -1;
  _ring_size = -1;
  _degree = -1;
  _hcount = -1;
  _connectivity = -1;
}

std::optional<atomic_number_t>
QueryAtom::RequiredElement() const {
  if (const ExactElement* e = std::get_if<ExactElement>(&_element)) {
    return e->z;
  }

  return std::nullopt;
}

int
QueryAtom::Selectivity() const {
  int rc = 0;
  if (const ExactElement* e = std::get_if<ExactElement>(&_element)) {
    rc += (6 == e->z) ? 2 : 4;
  } else if (std::holds_alternative<ElementClass>(_element)) {
    rc += 1;
  }

  if (_aromatic >= 0) {
    ++rc;
  }
  if (_ring >= 0) {
    ++rc;
  }
  if (_nrings > 0) {
    ++rc;
  }
  if (_ring_size > 0) {
    ++rc;
  }
  if (_degree >= 0) {
    ++rc;
  }
  if (_hcount >= 0) {
    ++rc;
  }
  if (_connectivity >= 0) {
    ++rc;
  }
  if (_formal_charge) {
    ++rc;
  }

  return rc;
}

namespace {

struct ElementMatcher {
  atomic_number_t z;

  bool operator()(const AnyElement&) const { return true;}
  bool operator()(const ExactElement& e) const { return e.z == z;}
  bool operator()(const ElementClass& e) const {
    return std::find(e.z.begin(), e.z.end(), z) != e.z.end();
  }
};

}  // namespace

int
QueryAtom::Matches(const Molecule& m, atom_number_t a) const {
  if (! std::visit(ElementMatcher{m.atomic_number(a)}, _element)) {
    return 0;
  }

  if (_aromatic >= 0 && (m.is_aromatic(a) ? 1 : 0) != _aromatic) {
    return 0;
  }

  if (_ring >= 0 && (m.is_ring_atom(a) ? 1 : 0) != _ring) {
    return 0;
  }

  if (_nrings > 0 && m.nrings(a) != _nrings) {
    return 0;
  }

  if (_ring_size > 0 && ! m.in_ring_of_given_size(a, _ring_size)) {
    return 0;
  }

  if (_degree >= 0 && m.ncon(a) != _degree) {
    return 0;
  }

  if (_formal_charge && *_formal_charge != m.formal_charge(a)) {
    return 0;
  }

  if (_hcount < 0 && _connectivity < 0) {
    return 1;
  }

  const int h = m.hcount(a);
  if (_hcount >= 0 && h != _hcount) {
    return 0;
  }

  // Explicit hydrogen atoms are already in ncon, only add implicit ones.
  if (_connectivity >= 0 && m.ncon(a) + m.atomi(a).hcount() != _connectivity) {
    return 0;
  }

  return 1;
}

QueryBond::QueryBond(int a1, int a2, bond_type_t bt, int ring) :
    _a1(a1), _a2(a2), _btype(bt), _ring(ring) {
}

int
QueryBond::Matches(const Bond& b, int is_ring_bond) const {
  if (0 == (b.btype() & _btype)) {
    return 0;
  }

  if (_ring >= 0 && (is_ring_bond ? 1 : 0) != _ring) {
    return 0;
  }

  return 1;
}

namespace {

// Number starting at s[j], or `default_value` if there are no digits.
int
ParseCount(const std::string& s, int& j, int end, int default_value) {
  if (j >= end || ! isdigit(static_cast<unsigned char>(s[j]))) {
    return default_value;
  }

  int rc = 0;
  while (j < end && isdigit(static_cast<unsigned char>(s[j]))) {
    rc = rc * 10 + (s[j] - '0');
    if (rc > 999) {
      return -1;
    }
    ++j;
  }

  return rc;
}

// An element primitive starting at s[j]: #n, a symbol, or an aromatic
// symbol. `aromatic` is set to -1 for #n. Returns 0, without changing `j`,
// if s[j] does not start an element.
int
ParseElementPrimitive(const std::string& s, int& j, int end, atomic_number_t& z, int& aromatic) {
  const char c = s[j];

  if ('#' == c) {
    int k = j + 1;
    const int n = ParseCount(s, k, end, -1);
    if (! REASONABLE_ATOMIC_NUMBER(n) || 0 == n) {
      return 0;
    }
    z = n;
    aromatic = -1;
    j = k;
    return 1;
  }

  if (isupper(static_cast<unsigned char>(c))) {
    const Element* e = nullptr;
    if (j + 1 < end && islower(static_cast<unsigned char>(s[j + 1]))) {
      e = get_element_from_symbol(s.substr(j, 2));
      if (nullptr != e) {
        z = e->atomic_number();
        aromatic = 0;
        j += 2;
        return 1;
      }
    }

    // These letters are primitives when they stand alone.
    if ('H' == c || 'D' == c || 'X' == c || 'R' == c) {
      return 0;
    }

    e = get_element_from_symbol(s.substr(j, 1));
    if (nullptr == e || 0 == e->atomic_number()) {
      return 0;
    }
    z = e->atomic_number();
    aromatic = 0;
    ++j;
    return 1;
  }

  if (islower(static_cast<unsigned char>(c))) {
    const Element* e = nullptr;
    if (j + 1 < end && islower(static_cast<unsigned char>(s[j + 1]))) {
      e = get_element_from_aromatic_symbol(s.substr(j, 2));
      if (nullptr != e) {
        z = e->atomic_number();
        aromatic = 1;
        j += 2;
        return 1;
      }
    }
    e = get_element_from_aromatic_symbol(s.substr(j, 1));
    if (nullptr == e) {
      return 0;
    }
    z = e->atomic_number();
    aromatic = 1;
    ++j;
    return 1;
  }

  return 0;
}

int
SetAromatic(QueryAtom& qa, int aromatic, int position, ParseError& error) {
  if (aromatic < 0) {
    return 1;
  }

  if (qa.aromatic() >= 0 && qa.aromatic() != aromatic) {
    return error.Set(position, "conflicting aromaticity");
  }

  qa.set_aromatic(aromatic);

  return 1;
}

// A sequence of primitives, all of which must hold, in s[start, end).
int
ParsePrimitives(const std::string& s, int start, int end, QueryAtom& qa, ParseError& error) {
  int j = start;
  while (j < end) {
    const int position = j;
    const char c = s[j];

    atomic_number_t z;
    int aromatic;
    if (ParseElementPrimitive(s, j, end, z, aromatic)) {
      if (qa.element_specified()) {
        return error.Set(position, "conflicting element specification");
      }
      qa.set_element(ExactElement{z});
      if (! SetAromatic(qa, aromatic, position, error)) {
        return 0;
      }
      continue;
    }

    if ('#' == c) {
      return error.Set(position, "invalid atomic number");
    }

    if ('*' == c) {
      ++j;
      continue;
    }

    if ('a' == c || 'A' == c) {
      if (! SetAromatic(qa, 'a' == c, position, error)) {
        return 0;
      }
      ++j;
      continue;
    }

    if ('!' == c) {
      if (j + 1 < end && 'R' == s[j + 1] &&
          (j + 2 >= end || ! isdigit(static_cast<unsigned char>(s[j + 2])))) {
        qa.set_ring(0);
        j += 2;
        continue;
      }
      return error.Set(position, "unsupported negation");
    }

    if ('+' == c || '-' == c) {
      formal_charge_t q;
      if (! ParseCharge(s, j, q)) {
        return error.Set(position, "invalid charge");
      }
      qa.set_formal_charge(q);
      continue;
    }

    if ('@' == c) {
      ++j;
      if (j < end && '@' == s[j]) {
        ++j;
      }
      continue;
    }

    ++j;
    if ('R' == c) {
      const int nr = ParseCount(s, j, end, -1);
      if (nr < -1 || nr > 99) {
        return error.Set(position, "invalid ring count");
      }
      if (0 == nr) {
        qa.set_ring(0);
      } else {
        qa.set_ring(1);
        qa.set_nrings(nr);
      }
      continue;
    }

    if ('r' == c) {
      const int ring_size = ParseCount(s, j, end, -1);
      if (ring_size < -1 || (ring_size >= 0 && ring_size < 3)) {
        return error.Set(position, "invalid ring size");
      }
      qa.set_ring(1);
      qa.set_ring_size(ring_size);
      continue;
    }

    if ('D' == c || 'H' == c || 'X' == c) {
      const int count = ParseCount(s, j, end, 1);
      if (count < 0) {
        return error.Set(position, "invalid count");
      }
      if ('D' == c) {
        qa.set_degree(count);
      } else if ('H' == c) {
        qa.set_hcount(count);
      } else {
        qa.set_connectivity(count);
      }
      continue;
    }

    return error.Set(position, "unrecognised smarts primitive");
  }

  return 1;
}

// Comma separated element alternatives in s[start, end).
int
ParseElementAlternatives(const std::string& s, int start, int end, QueryAtom& qa,
                         ParseError& error) {
  if (qa.element_specified()) {
    return error.Set(start, "conflicting element specification");
  }

  ElementClass element_class;
  int common_aromatic = -2;
  int j = start;
  while (j < end) {
    const int position = j;
    atomic_number_t z;
    int aromatic;
    if (! ParseElementPrimitive(s, j, end, z, aromatic)) {
      return error.Set(position, "only elements can be combined with ','");
    }
    if (j < end && ',' != s[j]) {
      return error.Set(j, "only elements can be combined with ','");
    }
    if (-2 == common_aromatic) {
      common_aromatic = aromatic;
    } else if (common_aromatic != aromatic) {
      return error.Set(position, "mixed aromaticity in element alternatives");
    }
    if (std::find(element_class.z.begin(), element_class.z.end(), z) == element_class.z.end()) {
      element_class.z.push_back(z);
    }
    if (j < end) {
      ++j;
      if (j == end) {
        return error.Set(j, "empty element alternative");
      }
    }
  }

  if (1 == element_class.z.size()) {
    qa.set_element(ExactElement{element_class.z.front()});
  } else {
    qa.set_element(std::move(element_class));
  }

  return SetAromatic(qa, common_aromatic, start, error);
}

// s[i] is '['. On success `i` is left after the closing ']'.
int
ParseBracketExpression(const std::string& s, int& i, QueryAtom& qa, ParseError& error) {
  const int open_bracket = i;
  const auto close = s.find(']', i + 1);
  if (std::string::npos == close) {
    return error.Set(open_bracket, "unterminated bracket atom");
  }

  const int end = close;
  if (end == i + 1) {
    return error.Set(open_bracket, "empty bracket atom");
  }

  const auto dollar = s.find('$', i + 1);
  if (std::string::npos != dollar && static_cast<int>(dollar) < end) {
    return error.Set(dollar, "recursive smarts not supported");
  }
  const auto inner = s.find('[', i + 1);
  if (std::string::npos != inner && static_cast<int>(inner) < end) {
    return error.Set(inner, "nested bracket");
  }

  int group_start = i + 1;
  while (group_start <= end) {
    int group_end = group_start;
    int has_comma = 0;
    while (group_end < end && ';' != s[group_end] && '&' != s[group_end]) {
      if (',' == s[group_end]) {
        has_comma = 1;
      }
      ++group_end;
    }

    if (group_end == group_start) {
      return error.Set(group_start, "empty smarts primitive");
    }

    const int ok = has_comma ? ParseElementAlternatives(s, group_start, group_end, qa, error)
                             : ParsePrimitives(s, group_start, group_end, qa, error);
    if (! ok) {
      return 0;
    }

    group_start = group_end + 1;
  }

  i = end + 1;

  return 1;
}

// Atom written without brackets.
int
ParseUnbracketedAtom(const std::string& s, int& i, QueryAtom& qa) {
  const int n = s.size();
  const char c = s[i];

  if ('*' == c) {
    ++i;
    return 1;
  }

  if ('a' == c || 'A' == c) {
    qa.set_aromatic('a' == c);
    ++i;
    return 1;
  }

  const Element* e = nullptr;
  if (islower(static_cast<unsigned char>(c))) {
    e = get_element_from_aromatic_symbol(s.substr(i, 1));
    if (nullptr == e || ! e->organic()) {
      return 0;
    }
    qa.set_element(ExactElement{e->atomic_number()});
    qa.set_aromatic(1);
    ++i;
    return 1;
  }

  if (i + 1 < n && (('C' == c && 'l' == s[i + 1]) || ('B' == c && 'r' == s[i + 1]))) {
    e = get_element_from_symbol(s.substr(i, 2));
    i += 2;
  } else {
    e = get_element_from_symbol(s.substr(i, 1));
    if (nullptr == e || ! e->organic() || 0 == e->atomic_number()) {
      return 0;
    }
    ++i;
  }

  qa.set_element(ExactElement{e->atomic_number()});
  qa.set_aromatic(0);

  return 1;
}

int
IsBondCharacter(char c) {
  return UNKNOWN_BOND_TYPE != BondTypeFromSymbol(c) || '~' == c || '@' == c || '!' == c ||
         '/' == c || '\\' == c;
}

// One or more bond characters starting at s[i].
int
ParseBondExpression(const std::string& s, int& i, bond_type_t& bt, int& ring, ParseError& error) {
  const int n = s.size();
  bt = UNKNOWN_BOND_TYPE;
  ring = -1;
  int type_specified = 0;

  while (i < n && IsBondCharacter(s[i])) {
    const char c = s[i];
    if ('!' == c) {
      if (i + 1 < n && '@' == s[i + 1]) {
        ring = 0;
        i += 2;
        continue;
      }
      return error.Set(i, "unsupported bond negation");
    }

    if ('@' == c) {
      ring = 1;
      ++i;
      continue;
    }

    bond_type_t b;
    if ('~' == c) {
      b = ANY_BOND_TYPE;
    } else if ('/' == c || '\\' == c) {
      b = SINGLE_BOND;
    } else {
      b = BondTypeFromSymbol(c);
    }

    bt = type_specified ? (bt & b) : b;
    type_specified = 1;
    if (UNKNOWN_BOND_TYPE == bt) {
      return error.Set(i, "conflicting bond specification");
    }
    ++i;
  }

  if (! type_specified) {
    bt = ANY_BOND_TYPE;
  }

  return 1;
}

struct QueryRingOpening {
  int atom;
  // UNKNOWN_BOND_TYPE if no bond was written.
  bond_type_t btype;
  int ring;
  int position;
};

enum class QueryToken {
  kNone,
  kAtom,
  kRingClosure,
  kBond,
  kOpenBranch,
  kCloseBranch
};

int
FollowsQueryAtom(QueryToken t) {
  return QueryToken::kAtom == t || QueryToken::kRingClosure == t ||
         QueryToken::kCloseBranch == t;
}

}  // namespace

SubstructureQuery::SubstructureQuery() {
}

void
SubstructureQuery::_clear() {
  _smarts.clear();
  _atoms.clear();
  _bonds.clear();
  _bond_list.clear();
}

int
SubstructureQuery::_add_bond(int a1, int a2, bond_type_t bt, int ring) {
  if (a1 == a2) {
    return -1;
  }

  for (int b : _bond_list[a1]) {
    if (_bonds[b].other(a1) == a2) {
      return -1;
    }
  }

  const int rc = _bonds.size();
  _bonds.emplace_back(a1, a2, bt, ring);
  _bond_list[a1].push_back(rc);
  _bond_list[a2].push_back(rc);

  return rc;
}

int
SubstructureQuery::Build(const std::string& smarts) {
  ParseError error;
  if (! Build(smarts, error)) {
    cerr << "SubstructureQuery::Build:cannot parse '" << smarts << "', " << error << '\n';
    return 0;
  }

  return 1;
}

int
SubstructureQuery::Build(const std::string& smarts, ParseError& error) {
  _clear();
  error.clear();

  if (! _parse(smarts, error)) {
    _clear();
    return 0;
  }

  _smarts = smarts;

  return 1;
}

int
SubstructureQuery::_parse(const std::string& smarts, ParseError& error) {
  const int n = smarts.size();
  if (0 == n) {
    return error.Set(0, "empty smarts");
  }

  int previous_atom = -1;
  int bond_pending = 0;
  bond_type_t pending_bond = UNKNOWN_BOND_TYPE;
  int pending_ring = -1;
  int pending_bond_position = -1;
  QueryToken last_token = QueryToken::kNone;
  QueryToken before_bond = QueryToken::kNone;

  std::vector<int> branch_stack;
  std::vector<int> branch_position;
  std::map<int, QueryRingOpening> ring_status;

  int i = 0;
  while (i < n) {
    const char c = smarts[i];

    if ('(' == c) {
      if (! FollowsQueryAtom(last_token)) {
        return error.Set(i, "branch must follow an atom");
      }
      branch_stack.push_back(previous_atom);
      branch_position.push_back(i);
      last_token = QueryToken::kOpenBranch;
      ++i;
      continue;
    }

    if (')' == c) {
      if (branch_stack.empty()) {
        return error.Set(i, "unbalanced parentheses");
      }
      if (QueryToken::kBond == last_token) {
        return error.Set(pending_bond_position, "bond symbol with no following atom");
      }
      if (QueryToken::kOpenBranch == last_token) {
        return error.Set(i, "empty branch");
      }
      previous_atom = branch_stack.back();
      branch_stack.pop_back();
      branch_position.pop_back();
      last_token = QueryToken::kCloseBranch;
      ++i;
      continue;
    }

    if ('.' == c) {
      return error.Set(i, "disconnected query");
    }

    if (IsBondCharacter(c)) {
      if (QueryToken::kBond == last_token) {
        return error.Set(i, "consecutive bond symbols");
      }
      if (previous_atom < 0 ||
          (! FollowsQueryAtom(last_token) && QueryToken::kOpenBranch != last_token)) {
        return error.Set(i, "bond symbol with no preceding atom");
      }
      pending_bond_position = i;
      if (! ParseBondExpression(smarts, i, pending_bond, pending_ring, error)) {
        return 0;
      }
      bond_pending = 1;
      before_bond = last_token;
      last_token = QueryToken::kBond;
      continue;
    }

    if (isdigit(static_cast<unsigned char>(c)) || '%' == c) {
      const int ring_position = i;
      if (! (QueryToken::kAtom == last_token || QueryToken::kRingClosure == last_token ||
             (QueryToken::kBond == last_token && (QueryToken::kAtom == before_bond ||
                                                  QueryToken::kRingClosure == before_bond)))) {
        return error.Set(i, "misplaced ring closure");
      }
      const int ring = ParseRingClosure(smarts, i);
      if (ring < 0) {
        return error.Set(ring_position, "invalid ring closure");
      }

      const bond_type_t bt = bond_pending ? pending_bond : UNKNOWN_BOND_TYPE;
      const int rng = bond_pending ? pending_ring : -1;

      auto iter = ring_status.find(ring);
      if (iter == ring_status.end()) {
        ring_status[ring] = QueryRingOpening{previous_atom, bt, rng, ring_position};
      } else {
        const QueryRingOpening opening = iter->second;
        ring_status.erase(iter);
        if (opening.atom == previous_atom) {
          return error.Set(ring_position, "ring closure to the same atom");
        }

        bond_type_t closure_bt = opening.btype;
        int closure_ring = opening.ring;
        if (UNKNOWN_BOND_TYPE != closure_bt && UNKNOWN_BOND_TYPE != bt &&
            (closure_bt != bt || closure_ring != rng)) {
          return error.Set(ring_position, "conflicting ring closure bond types");
        }
        if (UNKNOWN_BOND_TYPE == closure_bt) {
          closure_bt = bt;
          closure_ring = rng;
        }
        if (UNKNOWN_BOND_TYPE == closure_bt) {
          closure_bt = SINGLE_BOND | AROMATIC_BOND;
        }

        if (_add_bond(opening.atom, previous_atom, closure_bt, closure_ring) < 0) {
          return error.Set(ring_position, "duplicate bond");
        }
      }

      bond_pending = 0;
      last_token = QueryToken::kRingClosure;
      continue;
    }

    const int atom_start = i;
    QueryAtom qa;
    if ('[' == c) {
      if (! ParseBracketExpression(smarts, i, qa, error)) {
        return 0;
      }
    } else if (! ParseUnbracketedAtom(smarts, i, qa)) {
      return error.Set(atom_start, "invalid element specification");
    }

    const int a = _atoms.size();
    _atoms.push_back(qa);
    _bond_list.emplace_back();

    if (previous_atom >= 0) {
      if (bond_pending) {
        _add_bond(previous_atom, a, pending_bond, pending_ring);
      } else {
        _add_bond(previous_atom, a, SINGLE_BOND | AROMATIC_BOND, -1);
      }
    }

    previous_atom = a;
    bond_pending = 0;
    last_token = QueryToken::kAtom;
  }

  if (QueryToken::kBond == last_token) {
    return error.Set(pending_bond_position, "bond symbol with no following atom");
  }

  if (! branch_stack.empty()) {
    return error.Set(branch_position.back(), "unbalanced parentheses");
  }

  if (! ring_status.empty()) {
    const auto& [ring, opening] = *ring_status.begin();
    return error.Set(opening.position, "unclosed ring closure " + std::to_string(ring));
  }

  if (_atoms.empty()) {
    return error.Set(0, "no atoms");
  }

  return 1;
}

std::vector<std::pair<atomic_number_t, int>>
SubstructureQuery::RequiredElementCounts() const {
  std::map<atomic_number_t, int> count;
  for (const QueryAtom& qa : _atoms) {
    if (std::optional<atomic_number_t> z = qa.RequiredElement(); z) {
      count[*z]++;
    }
  }

  return std::vector<std::pair<atomic_number_t, int>>(count.begin(), count.end());
}

int
SubstructureQuery::RequiredAromaticAtoms() const {
  return std::count_if(_atoms.begin(), _atoms.end(), [](const QueryAtom& qa) {
    return 1 == qa.aromatic();
  });
}

int
SubstructureQuery::RequiredRingBonds() const {
  return std::count_if(_bonds.begin(), _bonds.end(), [](const QueryBond& qb) {
    return 1 == qb.ring() || AROMATIC_BOND == qb.btype();
  });
}

}  // namespace faves
