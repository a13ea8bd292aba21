// Tests for reading smiles.

#include <string>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include "Faves_Lib/canonical.h"
#include "Faves_Lib/molecule.h"
#include "Faves_Lib/smiles.h"

namespace {

using testing::HasSubstr;

TEST(TestSmiles, SingleAtom) {
  faves::Molecule m;
  ASSERT_TRUE(m.build_from_smiles("C"));
  EXPECT_EQ(m.natoms(), 1);
  EXPECT_EQ(m.nedges(), 0);
  EXPECT_EQ(m.hcount(0), 4);
  EXPECT_EQ(m.number_fragments(), 1);
}

TEST(TestSmiles, Ethanol) {
  faves::Molecule m;
  ASSERT_TRUE(m.build_from_smiles("CCO"));
  EXPECT_EQ(m.natoms(), 3);
  EXPECT_EQ(m.nedges(), 2);
  EXPECT_EQ(m.hcount(0), 3);
  EXPECT_EQ(m.hcount(1), 2);
  EXPECT_EQ(m.hcount(2), 1);
  EXPECT_EQ(m.natoms(8), 1);
  EXPECT_EQ(m.nrings(), 0);
}

TEST(TestSmiles, Ammonium) {
  faves::Molecule m;
  ASSERT_TRUE(m.build_from_smiles("[NH4+]"));
  EXPECT_EQ(m.natoms(), 1);
  EXPECT_EQ(m.formal_charge(0), 1);
  EXPECT_EQ(m.hcount(0), 4);
}

TEST(TestSmiles, Isotope) {
  faves::Molecule m;
  ASSERT_TRUE(m.build_from_smiles("[13CH4]"));
  EXPECT_EQ(m.atomi(0).isotope(), 13);
  EXPECT_EQ(m.hcount(0), 4);
}

TEST(TestSmiles, DoubleAndTriple) {
  faves::Molecule m;
  ASSERT_TRUE(m.build_from_smiles("C=CC#N"));
  EXPECT_TRUE(m.bondi(0).is_double_bond());
  EXPECT_TRUE(m.bondi(2).is_triple_bond());
  EXPECT_EQ(m.hcount(0), 2);
  EXPECT_EQ(m.hcount(3), 0);
}

TEST(TestSmiles, Fragments) {
  faves::Molecule m;
  ASSERT_TRUE(m.build_from_smiles("[Na+].[Cl-]"));
  EXPECT_EQ(m.number_fragments(), 2);
  EXPECT_NE(m.fragment_membership(0), m.fragment_membership(1));
  EXPECT_EQ(m.atoms_in_fragment(0).size(), 1);
}

TEST(TestSmiles, Benzene) {
  faves::Molecule m;
  ASSERT_TRUE(m.build_from_smiles("c1ccccc1"));
  EXPECT_EQ(m.aromatic_atom_count(), 6);
  EXPECT_EQ(m.nrings(), 1);
  for (int i = 0; i < m.natoms(); ++i) {
    EXPECT_EQ(m.hcount(i), 1);
    EXPECT_TRUE(m.in_ring_of_given_size(i, 6));
  }
}

TEST(TestSmiles, KekuleBenzeneIsAromatic) {
  faves::Molecule m;
  ASSERT_TRUE(m.build_from_smiles("C1=CC=CC=C1"));
  EXPECT_EQ(m.aromatic_atom_count(), 6);
  for (int b = 0; b < m.nedges(); ++b) {
    EXPECT_TRUE(m.bondi(b).is_aromatic());
  }
}

TEST(TestSmiles, KekulePyrroleIsAromatic) {
  faves::Molecule m;
  ASSERT_TRUE(m.build_from_smiles("C1=CNC=C1"));
  EXPECT_EQ(m.aromatic_atom_count(), 5);
  EXPECT_EQ(m.hcount(2), 1);
}

TEST(TestSmiles, CyclohexeneNotAromatic) {
  faves::Molecule m;
  ASSERT_TRUE(m.build_from_smiles("C1=CCCCC1"));
  EXPECT_EQ(m.aromatic_atom_count(), 0);
  EXPECT_EQ(m.nrings(), 1);
}

TEST(TestSmiles, Naphthalene) {
  faves::Molecule m;
  ASSERT_TRUE(m.build_from_smiles("c1ccc2ccccc2c1"));
  EXPECT_EQ(m.nrings(), 2);
  EXPECT_EQ(m.aromatic_atom_count(), 10);
  EXPECT_EQ(m.nrings(3), 2);
  EXPECT_EQ(m.nrings(0), 1);
}

TEST(TestSmiles, BiphenylLinkIsSingle) {
  faves::Molecule m;
  ASSERT_TRUE(m.build_from_smiles("c1ccccc1c1ccccc1"));
  const int b = m.which_bond(5, 6);
  ASSERT_GE(b, 0);
  EXPECT_TRUE(m.bondi(b).is_single_bond());
  EXPECT_FALSE(m.is_ring_bond(b));
}

TEST(TestSmiles, Chirality) {
  faves::Molecule m;
  ASSERT_TRUE(m.build_from_smiles("C[C@H](N)O"));
  EXPECT_EQ(m.chiral_centre_count(), 1);
  EXPECT_EQ(m.hcount(1), 1);
}

TEST(TestSmiles, DirectionalBonds) {
  faves::Molecule m;
  ASSERT_TRUE(m.build_from_smiles("F/C=C/F"));
  EXPECT_EQ(m.directional_bond_count(), 2);
}

TEST(TestSmiles, TwoDigitRingClosure) {
  faves::Molecule m;
  ASSERT_TRUE(m.build_from_smiles("C%12CCCCC%12"));
  EXPECT_EQ(m.nrings(), 1);
  EXPECT_EQ(m.nedges(), 6);
}

TEST(TestSmiles, ExplicitHydrogenFolded) {
  faves::Molecule m;
  ASSERT_TRUE(m.build_from_smiles("[H]C"));
  EXPECT_EQ(m.natoms(), 1);
  EXPECT_EQ(m.hcount(0), 4);

  ASSERT_TRUE(m.build_from_smiles("[H][N+]([H])([H])[H]"));
  EXPECT_EQ(m.natoms(), 1);
  EXPECT_EQ(m.formal_charge(0), 1);
  EXPECT_EQ(m.hcount(0), 4);

  ASSERT_TRUE(m.build_from_smiles("[H]OC"));
  EXPECT_EQ(m.natoms(), 2);
  EXPECT_EQ(m.hcount(0), 1);
  EXPECT_EQ(m.hcount(1), 3);
}

TEST(TestSmiles, HydrogenMoleculeKept) {
  faves::Molecule m;
  ASSERT_TRUE(m.build_from_smiles("[H][H]"));
  EXPECT_EQ(m.natoms(), 2);
  EXPECT_EQ(m.nedges(), 1);
}

TEST(TestSmiles, IsotopicHydrogenKept) {
  faves::Molecule m;
  ASSERT_TRUE(m.build_from_smiles("[2H]C"));
  EXPECT_EQ(m.natoms(), 2);
  EXPECT_EQ(m.atomi(0).isotope(), 2);
}

TEST(TestSmiles, ChainAtAtomLimit) {
  const std::string chain(faves::kMaxAtoms, 'C');
  faves::Molecule m;
  ASSERT_TRUE(m.build_from_smiles(chain));
  EXPECT_EQ(m.natoms(), faves::kMaxAtoms);
  EXPECT_EQ(faves::UniqueSmiles(m), chain);
}

struct SmilesAndMessage {
  std::string smiles;
  std::string message;
  int position;
};

class TestInvalidSmiles: public testing::TestWithParam<SmilesAndMessage> {
};

TEST_P(TestInvalidSmiles, Errors) {
  const auto params = GetParam();
  faves::Molecule m;
  faves::ParseError error;
  EXPECT_FALSE(m.build_from_smiles(params.smiles, error));
  EXPECT_THAT(error.message, HasSubstr(params.message));
  if (params.position >= 0) {
    EXPECT_EQ(error.position, params.position);
  }
}

INSTANTIATE_TEST_SUITE_P(TestInvalidSmiles, TestInvalidSmiles, testing::Values(
  SmilesAndMessage{"", "empty smiles", 0},
  SmilesAndMessage{"CC)", "unbalanced parentheses", 2},
  SmilesAndMessage{"C1CC", "unclosed ring closure 1", 1},
  SmilesAndMessage{"cC", "aromatic atom not in ring", -1},
  SmilesAndMessage{"C(C)(C)(C)(C)C", "invalid valence", -1},
  SmilesAndMessage{"C[Xx]", "invalid element", -1},
  SmilesAndMessage{"C[CH4", "malformed bracket atom", 1},
  SmilesAndMessage{"C=", "bond symbol with no following atom", -1},
  SmilesAndMessage{"(C)", "branch must follow an atom", 0},
  SmilesAndMessage{"C\xc3\xa9", "invalid element specification", 1},
  SmilesAndMessage{std::string(faves::kMaxAtoms + 1, 'C'), "too many atoms", faves::kMaxAtoms}
));

TEST(TestParseRingClosure, Digit) {
  int i = 1;
  EXPECT_EQ(faves::ParseRingClosure("C1", i), 1);
  EXPECT_EQ(i, 2);
}

TEST(TestParseRingClosure, Percent) {
  int i = 0;
  EXPECT_EQ(faves::ParseRingClosure("%12C", i), 12);
  EXPECT_EQ(i, 3);
}

TEST(TestParseRingClosure, NotARing) {
  int i = 0;
  EXPECT_EQ(faves::ParseRingClosure("%1", i), -1);
  EXPECT_EQ(i, 0);
  EXPECT_EQ(faves::ParseRingClosure("C", i), -1);
}

TEST(TestParseCharge, Values) {
  formal_charge_t q = 0;
  int i = 0;
  ASSERT_TRUE(faves::ParseCharge("+2", i, q));
  EXPECT_EQ(q, 2);
  EXPECT_EQ(i, 2);

  i = 0;
  ASSERT_TRUE(faves::ParseCharge("--", i, q));
  EXPECT_EQ(q, -2);

  i = 0;
  ASSERT_TRUE(faves::ParseCharge("-]", i, q));
  EXPECT_EQ(q, -1);
  EXPECT_EQ(i, 1);

  i = 0;
  EXPECT_FALSE(faves::ParseCharge("2", i, q));
}

TEST(TestBondTypeFromSymbol, Symbols) {
  EXPECT_EQ(faves::BondTypeFromSymbol('-'), SINGLE_BOND);
  EXPECT_EQ(faves::BondTypeFromSymbol('='), DOUBLE_BOND);
  EXPECT_EQ(faves::BondTypeFromSymbol('#'), TRIPLE_BOND);
  EXPECT_EQ(faves::BondTypeFromSymbol(':'), AROMATIC_BOND);
  EXPECT_EQ(faves::BondTypeFromSymbol('C'), UNKNOWN_BOND_TYPE);
}

}  // namespace
