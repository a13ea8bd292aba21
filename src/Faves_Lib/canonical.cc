/*
  Canonical smiles.
  Atoms get initial ranks from their local invariants. Ranks are then
  refined by the ranks of their neighbours until the number of distinct
  ranks stops growing. Remaining ties are resolved by a search: each atom
  of the lowest tied class is promoted in turn and ranks refined again,
  down to a complete ranking. Of all the complete rankings, the one whose
  smiles sorts first is canonical. Rankings that give the same smiles
  define automorphisms, and choices equivalent under a known automorphism
  are not explored.
*/

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <numeric>
#include <string>
#include <utility>
#include <vector>

#include "Faves_Lib/canonical.h"
#include "Faves_Lib/structure_hash.h"

namespace faves {

using std::cerr;

namespace {

// Replace `rank` with dense ranks 0..nclasses-1 based on `key`.
// Returns the number of classes.
template <typename Key>
int
AssignDenseRanks(const std::vector<atom_number_t>& atoms, const std::vector<Key>& key,
                 std::vector<int>& rank) {
  std::vector<atom_number_t> order(atoms);
  std::sort(order.begin(), order.end(), [&key](atom_number_t a1, atom_number_t a2) {
    return key[a1] < key[a2];
  });

  int nclasses = 0;
  for (size_t i = 0; i < order.size(); ++i) {
    if (i > 0 && key[order[i - 1]] < key[order[i]]) {
      ++nclasses;
    }
    rank[order[i]] = nclasses;
  }

  return nclasses + 1;
}

// Iteratively refine `rank` by neighbour ranks. Existing rank order is
// preserved, classes only ever split.
int
Refine(const Molecule& m, const std::vector<atom_number_t>& atoms, std::vector<int>& rank,
       int nclasses) {
  std::vector<std::vector<int>> key(m.natoms());

  const int n = atoms.size();
  while (nclasses < n) {
    for (atom_number_t a : atoms) {
      std::vector<int>& k = key[a];
      k.clear();
      for (int b : m.bonds_attached(a)) {
        const Bond& bond = m.bondi(b);
        k.push_back(rank[bond.other(a)] * 8 + BondCode(bond));
      }
      std::sort(k.begin(), k.end());
      k.insert(k.begin(), rank[a]);
    }

    const int new_nclasses = AssignDenseRanks(atoms, key, rank);
    if (new_nclasses == nclasses) {
      break;
    }
    nclasses = new_nclasses;
  }

  return nclasses;
}

// Give `a` a rank of its own, just ahead of the atoms it was tied with.
int
Individualise(const std::vector<atom_number_t>& atoms, atom_number_t a, std::vector<int>& rank) {
  std::vector<int> key(rank.size(), 0);
  for (atom_number_t j : atoms) {
    key[j] = 2 * rank[j] + 1;
  }
  key[a] = 2 * rank[a];

  return AssignDenseRanks(atoms, key, rank);
}

// Members of the lowest ranked class with more than one member, in atom
// number order. Empty if all ranks are distinct.
std::vector<atom_number_t>
FirstTiedClass(const std::vector<atom_number_t>& atoms, const std::vector<int>& rank) {
  const int n = atoms.size();
  std::vector<int> count(n, 0);
  for (atom_number_t a : atoms) {
    count[rank[a]]++;
  }

  std::vector<atom_number_t> result;
  for (int r = 0; r < n; ++r) {
    if (count[r] < 2) {
      continue;
    }
    for (atom_number_t a : atoms) {
      if (rank[a] == r) {
        result.push_back(a);
      }
    }
    std::sort(result.begin(), result.end());
    break;
  }

  return result;
}

std::string
AtomSmiles(const Molecule& m, atom_number_t a) {
  const Atom& atom = m.atomi(a);
  const Element* e = atom.element();

  const int aromatic = atom.is_aromatic() && ! e->aromatic_symbol().empty();
  const std::string& symbol = aromatic ? e->aromatic_symbol() : e->symbol();

  int need_bracket = ! e->organic() || 0 != atom.formal_charge() || 0 != atom.isotope();
  if (! need_bracket) {
    int has_double_bond = 0;
    for (int b : m.bonds_attached(a)) {
      if (m.bondi(b).is_double_bond()) {
        has_double_bond = 1;
      }
    }
    const int implicit = e->ImplicitHydrogens(m.nbonds(a), aromatic, has_double_bond);
    if (implicit != atom.hcount()) {
      need_bracket = 1;
    }
  }

  if (! need_bracket) {
    return symbol;
  }

  std::string result;
  result += '[';
  if (atom.isotope() > 0) {
    result += std::to_string(atom.isotope());
  }
  result += symbol;
  if (atom.hcount() > 0) {
    result += 'H';
    if (atom.hcount() > 1) {
      result += std::to_string(atom.hcount());
    }
  }
  const formal_charge_t q = atom.formal_charge();
  if (q > 0) {
    result += '+';
  } else if (q < 0) {
    result += '-';
  }
  if (q > 1 || q < -1) {
    result += std::to_string(std::abs(q));
  }
  result += ']';

  return result;
}

std::string
BondSmiles(const Molecule& m, const Bond& b) {
  switch (b.btype()) {
    case DOUBLE_BOND:
      return "=";
    case TRIPLE_BOND:
      return "#";
    case AROMATIC_BOND:
      return "";
    default:
      if (m.is_aromatic(b.a1()) && m.is_aromatic(b.a2())) {
        return "-";
      }
      return "";
  }
}

class SmilesWriter {
  private:
    const Molecule& _m;
    const std::vector<int>& _rank;

    std::vector<int> _visited;
    std::vector<int> _bond_done;
    std::vector<int> _parent_bond;
    std::vector<std::vector<atom_number_t>> _children;
    // Bonds that become ring closures, at both ends.
    std::vector<std::vector<int>> _ring_closures;
    // Ring closure number assigned to each bond when first written.
    std::vector<int> _ring_number;
    std::vector<int> _ring_number_in_use;

    // Atoms in the order written.
    std::vector<atom_number_t> _order;

    // One atom on the depth first stack.
    struct Frame {
      atom_number_t atom;
      // (rank, bond) of the unexplored neighbours, sorted.
      std::vector<std::pair<int, int>> neighbours;
      size_t next;
    };

//  private functions

    void _visit(atom_number_t a, int from_bond, std::vector<Frame>& stack);
    void _build_tree(atom_number_t start);
    void _write_atom(atom_number_t a, std::string& smiles);
    void _write(atom_number_t start, std::string& smiles);
    int _next_ring_number();

  public:
    SmilesWriter(const Molecule& m, const std::vector<int>& rank);

    std::string Write(atom_number_t start);

    const std::vector<atom_number_t>& order() const { return _order;}
};

SmilesWriter::SmilesWriter(const Molecule& m, const std::vector<int>& rank) : _m(m), _rank(rank) {
  const int matoms = m.natoms();
  _visited.assign(matoms, 0);
  _parent_bond.assign(matoms, -1);
  _children.resize(matoms);
  _ring_closures.resize(matoms);
  _bond_done.assign(m.nedges(), 0);
  _ring_number.assign(m.nedges(), -1);
  _ring_number_in_use.assign(100, 0);
}

void
SmilesWriter::_visit(atom_number_t a, int from_bond, std::vector<Frame>& stack) {
  _visited[a] = 1;
  _parent_bond[a] = from_bond;

  Frame f;
  f.atom = a;
  f.next = 0;
  for (int b : _m.bonds_attached(a)) {
    if (b == from_bond) {
      continue;
    }
    f.neighbours.emplace_back(_rank[_m.bondi(b).other(a)], b);
  }
  std::sort(f.neighbours.begin(), f.neighbours.end());

  stack.push_back(std::move(f));
}

// Depth first, neighbours in rank order. Bonds back to an atom already
// visited become ring closures.
void
SmilesWriter::_build_tree(atom_number_t start) {
  std::vector<Frame> stack;
  _visit(start, -1, stack);

  while (! stack.empty()) {
    Frame& f = stack.back();
    if (f.next == f.neighbours.size()) {
      stack.pop_back();
      continue;
    }

    const atom_number_t a = f.atom;
    const int b = f.neighbours[f.next].second;
    f.next++;

    if (_bond_done[b]) {
      continue;
    }
    _bond_done[b] = 1;

    const atom_number_t j = _m.bondi(b).other(a);
    if (_visited[j]) {
      _ring_closures[j].push_back(b);
      _ring_closures[a].push_back(b);
    } else {
      _children[a].push_back(j);
      _visit(j, b, stack);
    }
  }
}

int
SmilesWriter::_next_ring_number() {
  for (int i = 1; i < 100; ++i) {
    if (! _ring_number_in_use[i]) {
      _ring_number_in_use[i] = 1;
      return i;
    }
  }

  cerr << "SmilesWriter::_next_ring_number:too many open rings\n";
  return 99;
}

// The atom and its ring closures.
void
SmilesWriter::_write_atom(atom_number_t a, std::string& smiles) {
  _order.push_back(a);
  smiles += AtomSmiles(_m, a);

  // Closures first, in numeric order, then openings by neighbour rank.
  std::vector<int>& closures = _ring_closures[a];
  std::sort(closures.begin(), closures.end(), [this, a](int b1, int b2) {
    const int n1 = _ring_number[b1];
    const int n2 = _ring_number[b2];
    if (n1 >= 0 && n2 >= 0) {
      return n1 < n2;
    }
    if (n1 >= 0 || n2 >= 0) {
      return n1 >= 0;
    }
    return _rank[_m.bondi(b1).other(a)] < _rank[_m.bondi(b2).other(a)];
  });

  for (int b : closures) {
    int ring_number = _ring_number[b];
    if (ring_number >= 0) {
      _ring_number_in_use[ring_number] = 0;
    } else {
      ring_number = _next_ring_number();
      _ring_number[b] = ring_number;
      smiles += BondSmiles(_m, _m.bondi(b));
    }
    if (ring_number < 10) {
      smiles += static_cast<char>('0' + ring_number);
    } else {
      smiles += '%';
      smiles += std::to_string(ring_number);
    }
  }
}

// Every child but the last is written as a branch.
void
SmilesWriter::_write(atom_number_t start, std::string& smiles) {
  _write_atom(start, smiles);

  // Atom and the index of the next child to write.
  std::vector<std::pair<atom_number_t, int>> stack;
  stack.emplace_back(start, 0);

  while (! stack.empty()) {
    const atom_number_t a = stack.back().first;
    const int i = stack.back().second;
    const std::vector<atom_number_t>& children = _children[a];
    const int nchildren = children.size();

    if (i > 0 && i - 1 < nchildren - 1) {
      smiles += ')';
    }

    if (i == nchildren) {
      stack.pop_back();
      continue;
    }

    stack.back().second = i + 1;

    const atom_number_t j = children[i];
    if (i < nchildren - 1) {
      smiles += '(';
    }
    smiles += BondSmiles(_m, _m.bondi(_parent_bond[j]));
    _write_atom(j, smiles);
    stack.emplace_back(j, 0);
  }
}

std::string
SmilesWriter::Write(atom_number_t start) {
  _build_tree(start);

  std::string result;
  _write(start, result);

  return result;
}

atom_number_t
LowestRanked(const std::vector<atom_number_t>& atoms, const std::vector<int>& rank) {
  return *std::min_element(atoms.begin(), atoms.end(), [&rank](atom_number_t a1, atom_number_t a2) {
    return rank[a1] < rank[a2];
  });
}

// A complete ranking and what it writes.
struct Leaf {
  std::vector<int> rank;
  std::string smiles;
  // Atoms in the order they appear in `smiles`.
  std::vector<atom_number_t> order;
  // Atoms individualised to reach this ranking.
  std::vector<atom_number_t> path;
};

/*
  Search over the ways of breaking ties that survive refinement. The
  leaf whose smiles sorts first is kept.
  Two leaves with the same smiles map atoms onto each other, which is an
  automorphism. At a node, two tied atoms related by an automorphism that
  fixes the atoms already individualised lead to identical subtrees, so
  only one is explored. Meeting the first leaf again means the whole
  subtree back to where the paths diverged has been seen before.
*/
class Canonical_Search {
  private:
    const Molecule& _m;
    const std::vector<atom_number_t>& _atoms;
    const std::vector<uint64_t>& _invariant;

    std::vector<atom_number_t> _path;

    Leaf _first;
    Leaf _best;
    int _leaves_found;

    // Each indexed by atom number.
    std::vector<std::vector<atom_number_t>> _automorphisms;

    // When >= 0, unwind until the node at this depth.
    int _return_to_depth;

//  private functions

    void _search(const std::vector<int>& rank, int nclasses);
    void _leaf(const std::vector<int>& rank);
    int _add_automorphism(const Leaf& leaf, const std::vector<atom_number_t>& order);
    int _equivalent_to_explored(atom_number_t a, const std::vector<atom_number_t>& explored) const;

  public:
    Canonical_Search(const Molecule& m, const std::vector<atom_number_t>& atoms,
                     const std::vector<uint64_t>& invariant);

    // `rank` is refined but not discrete.
    std::vector<int> Run(const std::vector<int>& rank, int nclasses);
};

Canonical_Search::Canonical_Search(const Molecule& m, const std::vector<atom_number_t>& atoms,
                                   const std::vector<uint64_t>& invariant)
    : _m(m), _atoms(atoms), _invariant(invariant) {
  _leaves_found = 0;
  _return_to_depth = -1;
}

std::vector<int>
Canonical_Search::Run(const std::vector<int>& rank, int nclasses) {
  _search(rank, nclasses);

  return _best.rank;
}

void
Canonical_Search::_search(const std::vector<int>& rank, int nclasses) {
  if (nclasses == static_cast<int>(_atoms.size())) {
    _leaf(rank);
    return;
  }

  const int depth = _path.size();
  const std::vector<atom_number_t> tied = FirstTiedClass(_atoms, rank);

  std::vector<atom_number_t> explored;
  for (atom_number_t a : tied) {
    if (_equivalent_to_explored(a, explored)) {
      continue;
    }
    explored.push_back(a);

    std::vector<int> child(rank);
    int c = Individualise(_atoms, a, child);
    c = Refine(_m, _atoms, child, c);

    _path.push_back(a);
    _search(child, c);
    _path.pop_back();

    if (_return_to_depth >= 0) {
      if (_return_to_depth < depth) {
        return;
      }
      _return_to_depth = -1;
    }
  }
}

void
Canonical_Search::_leaf(const std::vector<int>& rank) {
  SmilesWriter writer(_m, rank);
  std::string smiles = writer.Write(LowestRanked(_atoms, rank));

  ++_leaves_found;
  if (1 == _leaves_found) {
    _first.rank = rank;
    _first.smiles = smiles;
    _first.order = writer.order();
    _first.path = _path;
    _best = _first;
    return;
  }

  if (smiles == _first.smiles) {
    if (! _add_automorphism(_first, writer.order())) {
      return;
    }
    int diverge = 0;
    while (diverge < static_cast<int>(_path.size()) &&
           diverge < static_cast<int>(_first.path.size()) &&
           _path[diverge] == _first.path[diverge]) {
      ++diverge;
    }
    // The subtree below the diverging choice is an image of one already
    // searched only if the automorphism maps the first path onto this one.
    const std::vector<atom_number_t>& g = _automorphisms.back();
    if (diverge < static_cast<int>(_path.size()) &&
        diverge < static_cast<int>(_first.path.size()) &&
        g[_first.path[diverge]] == _path[diverge]) {
      _return_to_depth = diverge;
      for (int i = 0; i < diverge; ++i) {
        if (g[_first.path[i]] != _first.path[i]) {
          _return_to_depth = -1;
        }
      }
    }
    return;
  }

  if (smiles == _best.smiles) {
    _add_automorphism(_best, writer.order());
    return;
  }

  if (smiles < _best.smiles) {
    _best.rank = rank;
    _best.smiles = std::move(smiles);
    _best.order = writer.order();
    _best.path = _path;
  }
}

// Atoms written at the same position in two identical smiles correspond.
// The mapping is kept if it preserves atom invariants and bonds.
int
Canonical_Search::_add_automorphism(const Leaf& leaf, const std::vector<atom_number_t>& order) {
  const int n = order.size();
  if (n != static_cast<int>(leaf.order.size())) {
    return 0;
  }

  std::vector<atom_number_t> g(_m.natoms());
  std::iota(g.begin(), g.end(), 0);
  int identity = 1;
  for (int i = 0; i < n; ++i) {
    g[leaf.order[i]] = order[i];
    if (leaf.order[i] != order[i]) {
      identity = 0;
    }
  }

  if (identity) {
    return 0;
  }

  for (atom_number_t a : _atoms) {
    if (_invariant[a] != _invariant[g[a]]) {
      return 0;
    }
    for (int b : _m.bonds_attached(a)) {
      const Bond& bond = _m.bondi(b);
      const int b2 = _m.which_bond(g[a], g[bond.other(a)]);
      if (b2 < 0 || BondCode(bond) != BondCode(_m.bondi(b2))) {
        return 0;
      }
    }
  }

  _automorphisms.push_back(std::move(g));

  return 1;
}

// True if `a` is in the same orbit as an atom in `explored`, under the
// automorphisms that fix every atom on the current path.
int
Canonical_Search::_equivalent_to_explored(atom_number_t a,
                                          const std::vector<atom_number_t>& explored) const {
  if (explored.empty() || _automorphisms.empty()) {
    return 0;
  }

  std::vector<atom_number_t> parent(_m.natoms());
  std::iota(parent.begin(), parent.end(), 0);

  auto root_of = [&parent](atom_number_t x) {
    while (parent[x] != x) {
      parent[x] = parent[parent[x]];
      x = parent[x];
    }
    return x;
  };

  for (const std::vector<atom_number_t>& g : _automorphisms) {
    const bool fixes_path = std::all_of(_path.begin(), _path.end(), [&g](atom_number_t p) {
      return g[p] == p;
    });
    if (! fixes_path) {
      continue;
    }
    for (atom_number_t j : _atoms) {
      const atom_number_t r1 = root_of(j);
      const atom_number_t r2 = root_of(g[j]);
      if (r1 != r2) {
        parent[r1] = r2;
      }
    }
  }

  const atom_number_t root = root_of(a);
  for (atom_number_t e : explored) {
    if (root_of(e) == root) {
      return 1;
    }
  }

  return 0;
}

}  // namespace

std::vector<int>
CanonicalRanks(const Molecule& m, const std::vector<atom_number_t>& atoms) {
  std::vector<int> rank(m.natoms(), -1);
  if (atoms.empty()) {
    return rank;
  }

  std::vector<uint64_t> invariant(m.natoms(), 0);
  for (atom_number_t a : atoms) {
    invariant[a] = AtomInvariant(m, a);
  }

  int nclasses = AssignDenseRanks(atoms, invariant, rank);
  nclasses = Refine(m, atoms, rank, nclasses);

  if (nclasses == static_cast<int>(atoms.size())) {
    return rank;
  }

  Canonical_Search search(m, atoms, invariant);
  return search.Run(rank, nclasses);
}

std::string
WriteSmiles(const Molecule& m, const std::vector<atom_number_t>& atoms,
            const std::vector<int>& rank) {
  if (atoms.empty()) {
    return "";
  }

  SmilesWriter writer(m, rank);
  return writer.Write(LowestRanked(atoms, rank));
}

CanonicalForm
MakeCanonicalForm(const Molecule& m) {
  CanonicalForm result;

  for (int f = 0; f < m.number_fragments(); ++f) {
    const std::vector<atom_number_t> atoms = m.atoms_in_fragment(f);
    const std::vector<int> rank = CanonicalRanks(m, atoms);

    CanonicalFragment fragment;
    fragment.smiles = WriteSmiles(m, atoms, rank);
    fragment.content_hash = Fnv1a64(fragment.smiles);
    fragment.secondary_hash = SecondaryHash(m, atoms);
    result.fragments.push_back(std::move(fragment));
  }

  std::sort(result.fragments.begin(), result.fragments.end(),
            [](const CanonicalFragment& f1, const CanonicalFragment& f2) {
              if (f1.smiles != f2.smiles) {
                return f1.smiles < f2.smiles;
              }
              return f1.secondary_hash < f2.secondary_hash;
            });

  for (const CanonicalFragment& fragment : result.fragments) {
    if (! result.smiles.empty()) {
      result.smiles += '.';
    }
    result.smiles += fragment.smiles;
  }

  result.content_hash = Fnv1a64(result.smiles);
  result.secondary_hash = SecondaryHash(m);

  return result;
}

std::string
UniqueSmiles(const Molecule& m) {
  return MakeCanonicalForm(m).smiles;
}

std::string
RandomSmiles(const Molecule& m, std::mt19937& rng) {
  std::vector<int> rank(m.natoms());
  std::iota(rank.begin(), rank.end(), 0);
  std::shuffle(rank.begin(), rank.end(), rng);

  std::vector<int> fragment_order(m.number_fragments());
  std::iota(fragment_order.begin(), fragment_order.end(), 0);
  std::shuffle(fragment_order.begin(), fragment_order.end(), rng);

  std::string result;
  for (int f : fragment_order) {
    if (! result.empty()) {
      result += '.';
    }
    result += WriteSmiles(m, m.atoms_in_fragment(f), rank);
  }

  return result;
}

}  // namespace faves
