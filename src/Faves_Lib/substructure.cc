#include <iostream>

#include "Faves_Lib/substructure.h"

namespace faves {

using std::cerr;

namespace {

// How often the clock is consulted.
constexpr int kDeadlineCheckInterval = 1024;

}  // namespace

std::ostream&
operator<<(std::ostream& os, MatchStatus s) {
  switch (s) {
    case MatchStatus::kNoMatch:
      return os << "no match";
    case MatchStatus::kMatch:
      return os << "match";
    case MatchStatus::kTimeout:
      return os << "timeout";
  }

  return os;
}

SubstructureMatcher::SubstructureMatcher() {
  _required_aromatic_atoms = 0;
  _required_ring_bonds = 0;
}

int
SubstructureMatcher::Build(const std::string& smarts, ParseError& error) {
  SubstructureQuery query;
  if (! query.Build(smarts, error)) {
    return 0;
  }

  return Build(std::move(query));
}

int
SubstructureMatcher::Build(SubstructureQuery&& query) {
  _query = std::move(query);

  if (0 == _query.natoms()) {
    cerr << "SubstructureMatcher::Build:empty query\n";
    return 0;
  }

  if (! _establish_order()) {
    cerr << "SubstructureMatcher::Build:query '" << _query.smarts() << "' is not connected\n";
    return 0;
  }

  _required_elements = _query.RequiredElementCounts();
  _required_aromatic_atoms = _query.RequiredAromaticAtoms();
  _required_ring_bonds = _query.RequiredRingBonds();

  return 1;
}

// Breadth first from the most selective atom. Fails if some query atoms
// cannot be reached.
int
SubstructureMatcher::_establish_order() {
  const int nq = _query.natoms();

  int root = 0;
  for (int i = 1; i < nq; ++i) {
    const QueryAtom& qi = _query.atomi(i);
    const QueryAtom& qr = _query.atomi(root);
    if (qi.Selectivity() > qr.Selectivity() ||
        (qi.Selectivity() == qr.Selectivity() && _query.ncon(i) > _query.ncon(root))) {
      root = i;
    }
  }

  _order.clear();
  _parent_bond.clear();
  _closure_bonds.clear();

  std::vector<int> position(nq, -1);
  _order.push_back(root);
  _parent_bond.push_back(-1);
  position[root] = 0;

  for (int i = 0; i < static_cast<int>(_order.size()); ++i) {
    const int q = _order[i];
    for (int b : _query.bonds_attached(q)) {
      const int j = _query.bondi(b).other(q);
      if (position[j] >= 0) {
        continue;
      }
      position[j] = _order.size();
      _order.push_back(j);
      _parent_bond.push_back(b);
    }
  }

  if (static_cast<int>(_order.size()) != nq) {
    return 0;
  }

  _closure_bonds.resize(nq);
  for (int i = 1; i < nq; ++i) {
    const int q = _order[i];
    for (int b : _query.bonds_attached(q)) {
      if (b == _parent_bond[i]) {
        continue;
      }
      if (position[_query.bondi(b).other(q)] < i) {
        _closure_bonds[i].push_back(b);
      }
    }
  }

  return 1;
}

int
SubstructureMatcher::_passes_prefilter(const Molecule& m) const {
  if (m.natoms() < _query.natoms() || m.nedges() < _query.nedges()) {
    return 0;
  }

  for (const auto& [z, count] : _required_elements) {
    if (m.natoms(z) < count) {
      return 0;
    }
  }

  if (_required_aromatic_atoms > 0 && m.aromatic_atom_count() < _required_aromatic_atoms) {
    return 0;
  }

  if (_required_ring_bonds > 0) {
    int ring_bonds = 0;
    for (int b = 0; b < m.nedges(); ++b) {
      if (m.is_ring_bond(b)) {
        ++ring_bonds;
      }
    }
    if (ring_bonds < _required_ring_bonds) {
      return 0;
    }
  }

  return 1;
}

// Can target atom `t` be matched to the query atom at `depth`. The parent
// bond has already been checked.
int
SubstructureMatcher::_feasible(const Molecule& m, int depth, atom_number_t t,
                               const std::vector<atom_number_t>& assignment,
                               const std::vector<int>& used) const {
  if (used[t]) {
    return 0;
  }

  const int q = _order[depth];
  if (m.ncon(t) < _query.ncon(q)) {
    return 0;
  }

  if (! _query.atomi(q).Matches(m, t)) {
    return 0;
  }

  for (int qb : _closure_bonds[depth]) {
    const QueryBond& bond = _query.bondi(qb);
    const atom_number_t matched = assignment[bond.other(q)];
    const int b = m.which_bond(t, matched);
    if (b < 0 || ! bond.Matches(m.bondi(b), m.is_ring_bond(b))) {
      return 0;
    }
  }

  return 1;
}

MatchStatus
SubstructureMatcher::Match(const Molecule& m, std::chrono::steady_clock::time_point deadline,
                           std::vector<atom_number_t>* embedding) const {
  const int nq = _query.natoms();
  if (0 == nq || ! _passes_prefilter(m)) {
    return MatchStatus::kNoMatch;
  }

  if (std::chrono::steady_clock::now() >= deadline) {
    return MatchStatus::kTimeout;
  }

  const int matoms = m.natoms();

  // Indexed by query atom.
  std::vector<atom_number_t> assignment(nq, INVALID_ATOM_NUMBER);
  std::vector<int> used(matoms, 0);
  // Next candidate to try at each depth. At depth 0 an atom number,
  // otherwise an index into the bonds of the parent's match.
  std::vector<int> cursor(nq, 0);

  int steps = 0;
  int depth = 0;
  while (true) {
    const int q = _order[depth];

    atom_number_t found = INVALID_ATOM_NUMBER;
    if (0 == depth) {
      while (cursor[0] < matoms) {
        const atom_number_t t = cursor[0]++;
        if (_feasible(m, 0, t, assignment, used)) {
          found = t;
          break;
        }
      }
    } else {
      const QueryBond& parent_bond = _query.bondi(_parent_bond[depth]);
      const atom_number_t anchor = assignment[parent_bond.other(q)];
      const std::vector<int>& bonds = m.bonds_attached(anchor);
      const int nb = bonds.size();
      while (cursor[depth] < nb) {
        const int b = bonds[cursor[depth]++];
        if (! parent_bond.Matches(m.bondi(b), m.is_ring_bond(b))) {
          continue;
        }
        const atom_number_t t = m.bondi(b).other(anchor);
        if (_feasible(m, depth, t, assignment, used)) {
          found = t;
          break;
        }
      }
    }

    if (++steps >= kDeadlineCheckInterval) {
      steps = 0;
      if (std::chrono::steady_clock::now() >= deadline) {
        return MatchStatus::kTimeout;
      }
    }

    if (INVALID_ATOM_NUMBER != found) {
      assignment[q] = found;
      used[found] = 1;
      if (depth + 1 == nq) {
        if (nullptr != embedding) {
          *embedding = assignment;
        }
        return MatchStatus::kMatch;
      }
      ++depth;
      cursor[depth] = 0;
      continue;
    }

    if (0 == depth) {
      return MatchStatus::kNoMatch;
    }

    --depth;
    const int previous = _order[depth];
    used[assignment[previous]] = 0;
    assignment[previous] = INVALID_ATOM_NUMBER;
  }
}

MatchStatus
SubstructureMatcher::Match(const Molecule& m, std::chrono::milliseconds budget) const {
  return Match(m, std::chrono::steady_clock::now() + budget);
}

int
SubstructureMatcher::Matches(const Molecule& m) const {
  return MatchStatus::kMatch == Match(m, std::chrono::steady_clock::time_point::max());
}

}  // namespace faves
