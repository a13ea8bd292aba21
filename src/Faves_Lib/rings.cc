// Ring perception. Ring bonds are the bonds that are not bridges,
// the sssr is chosen from candidate smallest cycles by Gaussian
// elimination over the bond incidence vectors.

#include <algorithm>
#include <cstdint>
#include <iostream>
#include <vector>

#include "Faves_Lib/molecule.h"

namespace faves {

using std::cerr;

namespace {

// A ring in path order together with its bond incidence vector.
struct CandidateRing {
  std::vector<atom_number_t> atoms;
  std::vector<uint64_t> bonds;
};

bool
operator<(const CandidateRing& r1, const CandidateRing& r2) {
  if (r1.atoms.size() != r2.atoms.size()) {
    return r1.atoms.size() < r2.atoms.size();
  }

  return r1.bonds < r2.bonds;
}

class GF2Basis {
  private:
    std::vector<std::vector<uint64_t>> _rows;
    std::vector<int> _pivot;

  public:
    int size() const { return static_cast<int>(_rows.size());}

    // Returns 1 and adds `v` if it is independent of the rows already present.
    int AddIfIndependent(std::vector<uint64_t> v);
};

int
GF2Basis::AddIfIndependent(std::vector<uint64_t> v) {
  for (size_t i = 0; i < _rows.size(); ++i) {
    const int p = _pivot[i];
    if (v[p / 64] & (uint64_t{1} << (p % 64))) {
      for (size_t w = 0; w < v.size(); ++w) {
        v[w] ^= _rows[i][w];
      }
    }
  }

  for (size_t w = 0; w < v.size(); ++w) {
    if (0 == v[w]) {
      continue;
    }
    const int bit = __builtin_ctzll(v[w]);
    _pivot.push_back(static_cast<int>(w) * 64 + bit);
    _rows.push_back(std::move(v));
    return 1;
  }

  return 0;
}

}  // namespace

int
Molecule::_find_ring_bonds() {
  const int matoms = natoms();
  _ring_bond.assign(nedges(), 0);

  std::vector<int> discovered(matoms, -1);
  std::vector<int> low(matoms, 0);

  struct Frame {
    atom_number_t atom;
    int parent_bond;
    int next;
  };

  std::vector<Frame> stack;
  int counter = 0;

  for (int root = 0; root < matoms; ++root) {
    if (discovered[root] >= 0) {
      continue;
    }

    discovered[root] = low[root] = counter++;
    stack.push_back(Frame{root, -1, 0});

    while (! stack.empty()) {
      Frame& f = stack.back();
      if (f.next < ncon(f.atom)) {
        const int b = _bond_list[f.atom][f.next++];
        if (b == f.parent_bond) {
          continue;
        }
        const atom_number_t j = _bonds[b].other(f.atom);
        if (discovered[j] < 0) {
          discovered[j] = low[j] = counter++;
          stack.push_back(Frame{j, b, 0});
        } else {
          low[f.atom] = std::min(low[f.atom], discovered[j]);
          _ring_bond[b] = 1;
        }
        continue;
      }

      const atom_number_t a = f.atom;
      const int parent_bond = f.parent_bond;
      stack.pop_back();
      if (parent_bond < 0) {
        continue;
      }

      const atom_number_t parent = _bonds[parent_bond].other(a);
      low[parent] = std::min(low[parent], low[a]);
      if (low[a] <= discovered[parent]) {
        _ring_bond[parent_bond] = 1;
      }
    }
  }

  return 1;
}

namespace {

// Breadth first search over ring bonds from `from`, never traversing
// `excluded_bond`. Fills `parent_bond` for each atom reached.
void
RingBondBfs(const Molecule& m, const std::vector<int>& ring_bond, atom_number_t from,
            int excluded_bond, std::vector<int>& parent_bond, std::vector<int>& distance) {
  const int matoms = m.natoms();
  parent_bond.assign(matoms, -1);
  distance.assign(matoms, -1);

  std::vector<atom_number_t> queue;
  queue.push_back(from);
  distance[from] = 0;
  for (size_t q = 0; q < queue.size(); ++q) {
    const atom_number_t a = queue[q];
    for (int b : m.bonds_attached(a)) {
      if (b == excluded_bond || ! ring_bond[b]) {
        continue;
      }
      const atom_number_t j = m.bondi(b).other(a);
      if (distance[j] >= 0) {
        continue;
      }
      distance[j] = distance[a] + 1;
      parent_bond[j] = b;
      queue.push_back(j);
    }
  }
}

void
SetBit(std::vector<uint64_t>& v, int b) {
  v[b / 64] |= uint64_t{1} << (b % 64);
}

// Atoms on the path from the bfs root to `a`, root first.
std::vector<atom_number_t>
PathToRoot(const Molecule& m, const std::vector<int>& parent_bond, atom_number_t a,
           std::vector<uint64_t>& bonds) {
  std::vector<atom_number_t> result;
  result.push_back(a);
  while (parent_bond[a] >= 0) {
    SetBit(bonds, parent_bond[a]);
    a = m.bondi(parent_bond[a]).other(a);
    result.push_back(a);
  }
  std::reverse(result.begin(), result.end());

  return result;
}

}  // namespace

int
Molecule::_find_sssr() {
  const int matoms = natoms();
  _sssr.clear();
  _nrings.assign(matoms, 0);

  const int cyclomatic = nedges() - matoms + _number_fragments;
  if (cyclomatic <= 0) {
    return 1;
  }

  const int words = (nedges() + 63) / 64;

  std::vector<CandidateRing> candidates;
  std::vector<int> parent_bond;
  std::vector<int> distance;

  // Smallest cycle through each ring bond.
  for (int b = 0; b < nedges(); ++b) {
    if (! _ring_bond[b]) {
      continue;
    }
    const atom_number_t u = _bonds[b].a1();
    const atom_number_t v = _bonds[b].a2();
    RingBondBfs(*this, _ring_bond, u, b, parent_bond, distance);
    if (distance[v] < 0) {
      continue;
    }
    CandidateRing ring;
    ring.bonds.assign(words, 0);
    SetBit(ring.bonds, b);
    ring.atoms = PathToRoot(*this, parent_bond, v, ring.bonds);
    candidates.push_back(std::move(ring));
  }

  std::sort(candidates.begin(), candidates.end());

  GF2Basis basis;
  for (CandidateRing& ring : candidates) {
    if (basis.size() == cyclomatic) {
      break;
    }
    if (basis.AddIfIndependent(ring.bonds)) {
      _sssr.push_back(std::move(ring.atoms));
    }
  }

  // Rarely, the smallest cycle per bond does not span the cycle space.
  // Add cycles formed by two shortest paths from a common atom.
  if (basis.size() < cyclomatic) {
    std::vector<CandidateRing> more;
    for (int r = 0; r < matoms; ++r) {
      const std::vector<int>& attached = _bond_list[r];
      if (std::none_of(attached.begin(), attached.end(), [this](int b) {
            return _ring_bond[b];
          })) {
        continue;
      }
      RingBondBfs(*this, _ring_bond, r, -1, parent_bond, distance);
      for (int b = 0; b < nedges(); ++b) {
        if (! _ring_bond[b] || parent_bond[_bonds[b].a1()] == b ||
            parent_bond[_bonds[b].a2()] == b) {
          continue;
        }
        const atom_number_t x = _bonds[b].a1();
        const atom_number_t y = _bonds[b].a2();
        if (distance[x] < 0 || distance[y] < 0) {
          continue;
        }
        CandidateRing ring;
        ring.bonds.assign(words, 0);
        SetBit(ring.bonds, b);
        std::vector<atom_number_t> px = PathToRoot(*this, parent_bond, x, ring.bonds);
        std::vector<uint64_t> ybonds(words, 0);
        std::vector<atom_number_t> py = PathToRoot(*this, parent_bond, y, ybonds);
        // The two paths may only share the root.
        int shared = 0;
        for (size_t i = 1; i < py.size(); ++i) {
          if (std::find(px.begin(), px.end(), py[i]) != px.end()) {
            shared = 1;
            break;
          }
        }
        if (shared) {
          continue;
        }
        for (int w = 0; w < words; ++w) {
          ring.bonds[w] |= ybonds[w];
        }
        ring.atoms = std::move(px);
        for (size_t i = py.size() - 1; i >= 1; --i) {
          ring.atoms.push_back(py[i]);
        }
        more.push_back(std::move(ring));
      }
    }
    std::sort(more.begin(), more.end());
    for (CandidateRing& ring : more) {
      if (basis.size() == cyclomatic) {
        break;
      }
      if (basis.AddIfIndependent(ring.bonds)) {
        _sssr.push_back(std::move(ring.atoms));
      }
    }

    if (basis.size() < cyclomatic) {
      cerr << "Molecule::_find_sssr:found " << basis.size() << " rings, expected " <<
              cyclomatic << '\n';
    }
  }

  std::stable_sort(_sssr.begin(), _sssr.end(),
                   [](const std::vector<atom_number_t>& r1, const std::vector<atom_number_t>& r2) {
                     return r1.size() < r2.size();
                   });

  for (const std::vector<atom_number_t>& r : _sssr) {
    for (atom_number_t a : r) {
      _nrings[a]++;
    }
  }

  return 1;
}

}  // namespace faves
