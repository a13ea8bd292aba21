#ifndef FAVES_LIB_SMILES_H_
#define FAVES_LIB_SMILES_H_

// Support for reading smiles and the smarts subset used by queries.

#include <iostream>
#include <string>

#include "Faves_Lib/fvtypes.h"

namespace faves {

// Describes why a smiles or smarts could not be interpreted.
struct ParseError {
  // Zero based offset into the input, -1 when not tied to a character.
  int position = -1;
  std::string message;

  // Always returns 0 so callers can `return error.Set(...)`.
  int Set(int pos, const std::string& msg);

  void clear() {
    position = -1;
    message.clear();
  }

  bool empty() const { return message.empty();}
};

std::ostream& operator<<(std::ostream& os, const ParseError& error);

// Smiles with more atoms than this, explicit hydrogens included, are rejected.
inline constexpr int kMaxAtoms = 1000;

// Ring closure digit or %nn starting at s[i]. On success, returns the ring
// number and advances `i` past it. Returns -1 if s[i] is not a ring closure.
int ParseRingClosure(const std::string& s, int& i);

// A charge specification starting at s[i], '+', '--', '+2'.
// Returns 1 and advances `i` if successful.
int ParseCharge(const std::string& s, int& i, formal_charge_t& result);

// Bond symbol to bond type, UNKNOWN_BOND_TYPE if `c` is not one
// of - = # :
bond_type_t BondTypeFromSymbol(char c);

}  // namespace faves

#endif  // FAVES_LIB_SMILES_H_
