#ifndef FAVES_LIB_ELEMENT_H_
#define FAVES_LIB_ELEMENT_H_

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "Faves_Lib/fvtypes.h"

namespace faves {

// Per element data needed for hydrogen assignment and valence checking.
// Instances live in a static table and are never copied by clients.
class Element {
  private:
    atomic_number_t _atomic_number;
    std::string _symbol;
    // Empty if the element has no aromatic form in smiles.
    std::string _aromatic_symbol;
    // In the smiles organic subset, can be written without brackets.
    int _organic;
    // Normal valences in increasing order. Empty when not defined, in
    // which case no valence checking is done.
    std::vector<int> _valence;

  public:
    Element(atomic_number_t z, const char* symbol);

    atomic_number_t atomic_number() const { return _atomic_number;}
    const std::string& symbol() const { return _symbol;}
    const std::string& aromatic_symbol() const { return _aromatic_symbol;}
    int organic() const { return _organic;}

    void set_organic(int s) { _organic = s;}
    void set_aromatic_symbol(const char* s) { _aromatic_symbol = s;}
    void set_valences(std::vector<int> v) { _valence = std::move(v);}

    int valence_defined() const { return ! _valence.empty();}
    int normal_valence() const;

    // Implicit hydrogens for an atom written without brackets.
    // `bond_order_sum` counts aromatic bonds as 1. Returns -1 for
    // elements outside the organic subset.
    int ImplicitHydrogens(int bond_order_sum, int aromatic, int has_double_bond) const;

    // True if `valence` (bonds plus hydrogens) does not exceed the largest
    // normal valence of this element, adjusted for `formal_charge`.
    int ValenceOk(formal_charge_t formal_charge, int valence) const;
};

const Element* get_element_from_atomic_number(atomic_number_t z);

// Case sensitive, "Cl" not "CL".
const Element* get_element_from_symbol(std::string_view s);

// "c", "n", "se" ...
const Element* get_element_from_aromatic_symbol(std::string_view s);

}  // namespace faves

#endif  // FAVES_LIB_ELEMENT_H_
