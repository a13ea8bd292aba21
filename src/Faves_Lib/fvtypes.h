#ifndef FAVES_LIB_FVTYPES_H_
#define FAVES_LIB_FVTYPES_H_

/*
  Various typedef's used for molecules and queries.
*/

#include <cstdint>

typedef int formal_charge_t;

typedef int atomic_number_t;     // proton count

typedef int isotope_t;

typedef int atom_number_t;     // number of each atom within a molecule, starts at 0

// Value for atom numbers which are invalid.

#define INVALID_ATOM_NUMBER -1

#define INVALID_ATOMIC_NUMBER -1

#define HIGHEST_ATOMIC_NUMBER 118

#define REASONABLE_ATOMIC_NUMBER(z) ((z) >= 0 && (z) <= HIGHEST_ATOMIC_NUMBER)

#define REASONABLE_FORMAL_CHARGE(q) ( (q) >= -7 && (q) <= 7 )

/*
  Bond types are stored by setting bits in a word. A perceived bond
  has exactly one bit set, a query bond may have several.
*/

typedef unsigned int bond_type_t;

#define UNKNOWN_BOND_TYPE 0
#define SINGLE_BOND 1
#define DOUBLE_BOND 2
#define TRIPLE_BOND 4
#define AROMATIC_BOND 8

#define ANY_BOND_TYPE (SINGLE_BOND | DOUBLE_BOND | TRIPLE_BOND | AROMATIC_BOND)

#define SINGLE_BOND_SYMBOL '-'
#define DOUBLE_BOND_SYMBOL '='
#define TRIPLE_BOND_SYMBOL '#'
#define AROMATIC_BOND_SYMBOL ':'

#endif  // FAVES_LIB_FVTYPES_H_
