#ifndef FAVES_LIB_QUERY_H_
#define FAVES_LIB_QUERY_H_

#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "Faves_Lib/fvtypes.h"
#include "Faves_Lib/molecule.h"
#include "Faves_Lib/smiles.h"

namespace faves {

// What elements a query atom can match.
struct AnyElement {
};

struct ExactElement {
  atomic_number_t z;
};

// [N,O,S]
struct ElementClass {
  std::vector<atomic_number_t> z;
};

using ElementSpec = std::variant<AnyElement, ExactElement, ElementClass>;

/*
  A query atom is a conjunction of properties. Integer properties use
  -1 for "not specified".
*/

class QueryAtom {
  private:
    ElementSpec _element;

    int _aromatic;
    // 0 must not be in a ring, 1 must be in a ring.
    int _ring;
    // R<n> for n > 0, the number of sssr rings containing the atom.
    int _nrings;
    // r<n>, in an sssr ring of this size.
    int _ring_size;
    // D<n>
    int _degree;
    // H<n>, total hydrogens.
    int _hcount;
    // X<n>, connections plus hydrogens.
    int _connectivity;

    std::optional<formal_charge_t> _formal_charge;

  public:
    QueryAtom();

    const ElementSpec& element() const { return _element;}
    void set_element(ElementSpec e) { _element = std::move(e);}
    // True if something other than AnyElement has been set.
    int element_specified() const { return ! std::holds_alternative<AnyElement>(_element);}

    int aromatic() const { return _aromatic;}
    void set_aromatic(int s) { _aromatic = s;}

    int ring() const { return _ring;}
    void set_ring(int s) { _ring = s;}

    int nrings() const { return _nrings;}
    void set_nrings(int s) { _nrings = s;}

    int ring_size() const { return _ring_size;}
    void set_ring_size(int s) { _ring_size = s;}

    int degree() const { return _degree;}
    void set_degree(int s) { _degree = s;}

    int hcount() const { return _hcount;}
    void set_hcount(int s) { _hcount = s;}

    int connectivity() const { return _connectivity;}
    void set_connectivity(int s) { _connectivity = s;}

    const std::optional<formal_charge_t>& formal_charge() const { return _formal_charge;}
    void set_formal_charge(formal_charge_t q) { _formal_charge = q;}

    // The atomic number if only one element can match.
    std::optional<atomic_number_t> RequiredElement() const;

    // Rough measure of how few target atoms are likely to match. Used to
    // choose where a search starts.
    int Selectivity() const;

    int Matches(const Molecule& m, atom_number_t a) const;
};

class QueryBond {
  private:
    // Indices into the query atoms.
    int _a1;
    int _a2;
    // Bit mask of acceptable bond types.
    bond_type_t _btype;
    // -1 any, 0 must be a chain bond, 1 must be a ring bond.
    int _ring;

  public:
    QueryBond(int a1, int a2, bond_type_t bt, int ring);

    int a1() const { return _a1;}
    int a2() const { return _a2;}
    int other(int a) const { return a == _a1 ? _a2 : _a1;}

    bond_type_t btype() const { return _btype;}
    int ring() const { return _ring;}

    int Matches(const Bond& b, int is_ring_bond) const;
};

/*
  A query graph compiled from a subset of smarts:
    atoms: organic subset, aromatic lowercase, *, a, A, and bracketed
           expressions of #n, symbols, a, A, *, R, Rn, !R, rn, Dn, Hn, Xn
           and charges. Primitives are joined by '&', ';' or just written
           next to each other. ',' separates element alternatives, [N,O].
    bonds: - = # : ~ @ !@ and combinations such as -@. With no bond
           symbol, single or aromatic.
  Disconnected patterns, recursive smarts and chirality are not
  supported.
*/

class SubstructureQuery {
  private:
    std::string _smarts;

    std::vector<QueryAtom> _atoms;
    std::vector<QueryBond> _bonds;
    std::vector<std::vector<int>> _bond_list;

//  private functions

    void _clear();
    int _add_bond(int a1, int a2, bond_type_t bt, int ring);
    int _parse(const std::string& smarts, ParseError& error);

  public:
    SubstructureQuery();

    int Build(const std::string& smarts);
    int Build(const std::string& smarts, ParseError& error);

    const std::string& smarts() const { return _smarts;}

    int natoms() const { return static_cast<int>(_atoms.size());}
    int nedges() const { return static_cast<int>(_bonds.size());}

    const QueryAtom& atomi(int a) const { return _atoms[a];}
    const QueryBond& bondi(int b) const { return _bonds[b];}

    int ncon(int a) const { return static_cast<int>(_bond_list[a].size());}
    const std::vector<int>& bonds_attached(int a) const { return _bond_list[a];}

    // Query atoms that can only match atomic number z, as (z, count) pairs.
    std::vector<std::pair<atomic_number_t, int>> RequiredElementCounts() const;

    // Number of query atoms that must be aromatic.
    int RequiredAromaticAtoms() const;
    // Number of query bonds that must be ring bonds.
    int RequiredRingBonds() const;
};

}  // namespace faves

#endif  // FAVES_LIB_QUERY_H_
