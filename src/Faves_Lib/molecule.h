#ifndef FAVES_LIB_MOLECULE_H_
#define FAVES_LIB_MOLECULE_H_

#include <string>
#include <vector>

#include "Faves_Lib/element.h"
#include "Faves_Lib/fvtypes.h"

namespace faves {

struct ParseError;

class Atom {
  private:
    const Element* _element;
    formal_charge_t _formal_charge;
    // Zero means natural abundance.
    isotope_t _isotope;
    // Hydrogens attached, either implicit or as written in a bracket.
    int _hcount;
    // Set for bracket atoms, the hydrogen count is as written.
    int _hcount_specified;
    int _aromatic;
    // @ or @@ seen on input. Not part of the canonical form.
    int _chiral;
    int _atom_class;

  public:
    explicit Atom(const Element* e);

    const Element* element() const { return _element;}
    atomic_number_t atomic_number() const { return _element->atomic_number();}

    formal_charge_t formal_charge() const { return _formal_charge;}
    void set_formal_charge(formal_charge_t q) { _formal_charge = q;}

    isotope_t isotope() const { return _isotope;}
    void set_isotope(isotope_t iso) { _isotope = iso;}

    int hcount() const { return _hcount;}
    void set_hcount(int h) { _hcount = h;}

    int hcount_specified() const { return _hcount_specified;}
    void set_hcount_specified(int s) { _hcount_specified = s;}

    int is_aromatic() const { return _aromatic;}
    void set_aromatic(int s) { _aromatic = s;}

    int chiral() const { return _chiral;}
    void set_chiral(int s) { _chiral = s;}

    int atom_class() const { return _atom_class;}
    void set_atom_class(int s) { _atom_class = s;}
};

class Bond {
  private:
    atom_number_t _a1;
    atom_number_t _a2;
    bond_type_t _btype;
    // '/' or '\' on input. Not part of the canonical form.
    int _directional;
    // No bond symbol was written between the atoms.
    int _implicit;

  public:
    Bond(atom_number_t a1, atom_number_t a2, bond_type_t bt);

    atom_number_t a1() const { return _a1;}
    atom_number_t a2() const { return _a2;}

    atom_number_t other(atom_number_t a) const { return a == _a1 ? _a2 : _a1;}
    int involves(atom_number_t a) const { return a == _a1 || a == _a2;}

    bond_type_t btype() const { return _btype;}
    void set_bond_type(bond_type_t bt) { _btype = bt;}

    int is_single_bond() const { return SINGLE_BOND == _btype;}
    int is_double_bond() const { return DOUBLE_BOND == _btype;}
    int is_triple_bond() const { return TRIPLE_BOND == _btype;}
    int is_aromatic() const { return AROMATIC_BOND == _btype;}

    // Aromatic bonds count as 1.
    int bond_order() const;

    int directional() const { return _directional;}
    void set_directional(int s) { _directional = s;}

    int implicit() const { return _implicit;}
    void set_implicit(int s) { _implicit = s;}
};

/*
  A molecular graph built from smiles. Once build_from_smiles returns
  successfully, hydrogens, rings, aromaticity and fragments have been
  perceived and the object is not modified further.
  Explicit [H] atoms singly bonded to a heavy atom are folded into that
  atom's hydrogen count. Isotopic, charged or mapped hydrogens, H2 and
  bridging hydrogens stay as atoms.
*/

class Molecule {
  private:
    std::string _name;

    std::vector<Atom> _atoms;
    std::vector<Bond> _bonds;

    // For each atom, the indices into _bonds of the bonds attached.
    std::vector<std::vector<int>> _bond_list;

    // Set by ring perception.
    std::vector<int> _ring_bond;
    // For each atom, the number of sssr rings containing it.
    std::vector<int> _nrings;
    std::vector<std::vector<atom_number_t>> _sssr;

    std::vector<int> _fragment_membership;
    int _number_fragments;

//  private functions

    void _clear();

    int _add_atom(const Atom& a);
    int _add_bond(atom_number_t a1, atom_number_t a2, bond_type_t bt);

    int _parse_smiles(const std::string& smiles, std::vector<int>& atom_position,
                      ParseError& error);
    int _finish_perception(std::vector<int>& atom_position, ParseError& error);
    int _fold_explicit_hydrogens(std::vector<int>& atom_position);
    int _implicit_hydrogens(atom_number_t a) const;
    int _assign_implicit_hydrogens();
    int _check_valences(const std::vector<int>& atom_position, ParseError& error) const;
    int _compute_fragment_membership();

    // rings.cc
    int _find_ring_bonds();
    int _find_sssr();

    // aromatic.cc
    int _perceive_aromaticity();
    int _pi_electrons(atom_number_t a, const std::vector<bond_type_t>& kekule) const;

  public:
    Molecule();

    int build_from_smiles(const std::string& smiles);
    int build_from_smiles(const std::string& smiles, ParseError& error);

    const std::string& name() const { return _name;}
    void set_name(const std::string& s) { _name = s;}

    int natoms() const { return static_cast<int>(_atoms.size());}
    // Number of atoms with atomic number `z`.
    int natoms(atomic_number_t z) const;
    int nedges() const { return static_cast<int>(_bonds.size());}

    const Atom& atomi(atom_number_t a) const { return _atoms[a];}
    const Bond& bondi(int b) const { return _bonds[b];}

    atomic_number_t atomic_number(atom_number_t a) const { return _atoms[a].atomic_number();}
    formal_charge_t formal_charge(atom_number_t a) const { return _atoms[a].formal_charge();}
    int is_aromatic(atom_number_t a) const { return _atoms[a].is_aromatic();}

    int ncon(atom_number_t a) const { return static_cast<int>(_bond_list[a].size());}
    const std::vector<int>& bonds_attached(atom_number_t a) const { return _bond_list[a];}
    atom_number_t other(atom_number_t a, int i) const { return _bonds[_bond_list[a][i]].other(a);}

    // Index into bondi, or -1.
    int which_bond(atom_number_t a1, atom_number_t a2) const;
    int are_bonded(atom_number_t a1, atom_number_t a2) const { return which_bond(a1, a2) >= 0;}

    // Sum of bond orders, aromatic bonds count 1.
    int nbonds(atom_number_t a) const;

    // Implicit hydrogens plus explicit hydrogen atoms attached.
    int hcount(atom_number_t a) const;

    int is_ring_atom(atom_number_t a) const { return _nrings[a] > 0;}
    int is_ring_bond(int b) const { return _ring_bond[b];}
    int nrings(atom_number_t a) const { return _nrings[a];}
    int nrings() const { return static_cast<int>(_sssr.size());}
    const std::vector<std::vector<atom_number_t>>& sssr_rings() const { return _sssr;}
    // True if `a` is in an sssr ring with `ring_size` members.
    int in_ring_of_given_size(atom_number_t a, int ring_size) const;

    int number_fragments() const { return _number_fragments;}
    int fragment_membership(atom_number_t a) const { return _fragment_membership[a];}
    std::vector<atom_number_t> atoms_in_fragment(int f) const;

    int aromatic_atom_count() const;
    int chiral_centre_count() const;
    int directional_bond_count() const;
};

}  // namespace faves

#endif  // FAVES_LIB_MOLECULE_H_
