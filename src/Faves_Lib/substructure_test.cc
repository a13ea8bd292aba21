// Tests for SubstructureMatcher.

#include <chrono>
#include <random>
#include <sstream>
#include <string>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include "Faves_Lib/canonical.h"
#include "Faves_Lib/molecule.h"
#include "Faves_Lib/substructure.h"

namespace {

using testing::ElementsAre;

struct SmartsSmilesMatch {
  std::string smarts;
  std::string smiles;
  int expected;
};

class TestSubstructure : public testing::TestWithParam<SmartsSmilesMatch> {
};

TEST_P(TestSubstructure, Matches) {
  const auto params = GetParam();

  faves::SubstructureMatcher matcher;
  faves::ParseError error;
  ASSERT_TRUE(matcher.Build(params.smarts, error)) << error;

  faves::Molecule m;
  ASSERT_TRUE(m.build_from_smiles(params.smiles));

  EXPECT_EQ(matcher.Matches(m), params.expected) << params.smarts << ' ' << params.smiles;
}

INSTANTIATE_TEST_SUITE_P(TestSubstructure, TestSubstructure, testing::Values(
  SmartsSmilesMatch{"c1ccccc1", "Cc1ccccc1", 1},
  SmartsSmilesMatch{"c1ccccc1", "CC1CCCCC1", 0},
  SmartsSmilesMatch{"c1ccccc1", "C1=CC=CC=C1C", 1},
  SmartsSmilesMatch{"C=O", "CC(C)=O", 1},
  SmartsSmilesMatch{"C=O", "CCO", 0},
  SmartsSmilesMatch{"CCC", "C1CC1", 1},
  SmartsSmilesMatch{"C@C", "C1CC1", 1},
  SmartsSmilesMatch{"C@C", "CCC", 0},
  SmartsSmilesMatch{"C!@C", "CCC", 1},
  SmartsSmilesMatch{"C!@C", "C1CC1", 0},
  SmartsSmilesMatch{"[#6]~[#7]", "C=N", 1},
  SmartsSmilesMatch{"[#6]~[#7]", "c1ccncc1", 1},
  SmartsSmilesMatch{"C[N,O]", "CO", 1},
  SmartsSmilesMatch{"C[N,O]", "CS", 0},
  SmartsSmilesMatch{"[NX3]C=O", "CC(N)=O", 1},
  SmartsSmilesMatch{"[CH3]C", "C", 0},
  SmartsSmilesMatch{"a-a", "c1ccccc1-c1ccccc1", 1},
  SmartsSmilesMatch{"a-a", "c1ccc2ccccc2c1", 0},
  SmartsSmilesMatch{"c1ccc2ccccc2c1", "c1ccc2ccccc2c1", 1},
  SmartsSmilesMatch{"C1CCCCC1", "C1CCCC1", 0},
  SmartsSmilesMatch{"[Cl]", "CCl", 1},
  SmartsSmilesMatch{"[Cl]", "CBr", 0}
));

TEST(TestSubstructureMatcher, Embedding) {
  faves::SubstructureMatcher matcher;
  faves::ParseError error;
  ASSERT_TRUE(matcher.Build("CO", error)) << error;

  faves::Molecule m;
  ASSERT_TRUE(m.build_from_smiles("CCO"));

  std::vector<atom_number_t> embedding;
  EXPECT_EQ(matcher.Match(m, std::chrono::steady_clock::time_point::max(), &embedding),
            faves::MatchStatus::kMatch);
  EXPECT_THAT(embedding, ElementsAre(1, 2));
}

TEST(TestSubstructureMatcher, ZeroBudgetTimesOut) {
  faves::SubstructureMatcher matcher;
  faves::ParseError error;
  ASSERT_TRUE(matcher.Build("c1ccccc1", error)) << error;

  faves::Molecule m;
  ASSERT_TRUE(m.build_from_smiles("Cc1ccccc1"));

  EXPECT_EQ(matcher.Match(m, std::chrono::milliseconds(0)), faves::MatchStatus::kTimeout);
  EXPECT_EQ(matcher.Match(m, std::chrono::milliseconds(1000)), faves::MatchStatus::kMatch);
}

TEST(TestSubstructureMatcher, PrefilterBeforeDeadline) {
  faves::SubstructureMatcher matcher;
  faves::ParseError error;
  ASSERT_TRUE(matcher.Build("[Cl]", error)) << error;

  faves::Molecule m;
  ASSERT_TRUE(m.build_from_smiles("c1ccccc1"));

  EXPECT_EQ(matcher.Match(m, std::chrono::milliseconds(0)), faves::MatchStatus::kNoMatch);
}

TEST(TestSubstructureMatcher, EmptyMatcherNeverMatches) {
  faves::SubstructureMatcher matcher;
  faves::Molecule m;
  ASSERT_TRUE(m.build_from_smiles("C"));
  EXPECT_FALSE(matcher.Matches(m));
}

TEST(TestSubstructureMatcher, InvalidSmarts) {
  faves::SubstructureMatcher matcher;
  faves::ParseError error;
  EXPECT_FALSE(matcher.Build("C(", error));
  EXPECT_FALSE(error.empty());
}

TEST(TestSubstructureMatcher, StatusNames) {
  std::ostringstream os;
  os << faves::MatchStatus::kTimeout;
  EXPECT_FALSE(os.str().empty());
}

// Whether or not a match is found must not depend on the atom order
// of the target.
struct SmartsAndSmiles {
  std::string smarts;
  std::string smiles;
};

class TestSubstructurePermutations : public testing::TestWithParam<SmartsAndSmiles> {
  protected:
    std::mt19937 _rng;

    void SetUp() override;
};

void
TestSubstructurePermutations::SetUp() {
  _rng.seed(8811);
}

TEST_P(TestSubstructurePermutations, Invariant) {
  const auto params = GetParam();

  faves::SubstructureMatcher matcher;
  faves::ParseError error;
  ASSERT_TRUE(matcher.Build(params.smarts, error)) << error;

  faves::Molecule m;
  ASSERT_TRUE(m.build_from_smiles(params.smiles));
  const int expected = matcher.Matches(m);

  for (int i = 0; i < 10; ++i) {
    const std::string rsmi = faves::RandomSmiles(m, _rng);
    faves::Molecule m2;
    ASSERT_TRUE(m2.build_from_smiles(rsmi)) << rsmi;
    EXPECT_EQ(matcher.Matches(m2), expected) << rsmi;
  }
}

INSTANTIATE_TEST_SUITE_P(TestSubstructurePermutations, TestSubstructurePermutations, testing::Values(
  SmartsAndSmiles{"O=C([#6])N(c1ccccc1)C1CCNCC1", "CCC(=O)N(c1ccccc1)C1CCN(CCc2ccccc2)CC1"},
  SmartsAndSmiles{"c1ccc2c(c1)C(a)=NC[#6]~[#7]2", "CN1C(=O)CN=C(c2ccccc2)c2cc(Cl)ccc21"},
  SmartsAndSmiles{"[CH3]Oc1cc(CC[NX3])cc(O[CH3])c1O[CH3]", "COc1cc(CCN)cc(OC)c1OC"},
  SmartsAndSmiles{"c1ccccc1[CH2][CH]([CH3])[NX3]", "CC(=O)Nc1ccc(O)cc1"}
));

}  // namespace
