// Tests for the scaffold pattern library, and the patterns shipped
// in the data directory.

#include <map>
#include <string>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include "google/protobuf/text_format.h"

#include "Faves_Lib/molecule.h"
#include "Faves_Lib/pattern_library.h"

#ifndef FAVES_DATA_DIR
#define FAVES_DATA_DIR "data"
#endif

namespace {

const char* kPatternFile = FAVES_DATA_DIR "/patterns.textproto";

class TestPatternLibrary : public testing::Test {
  protected:
    faves::PatternLibrary _library;

    void SetUp() override;
};

void
TestPatternLibrary::SetUp() {
  ASSERT_TRUE(_library.Build(kPatternFile));
}

TEST_F(TestPatternLibrary, Size) {
  EXPECT_EQ(_library.size(), 37);
}

TEST_F(TestPatternLibrary, ClassCounts) {
  std::map<faves::DrugClass, int> count;
  for (const faves::CompiledPattern& p : _library.patterns()) {
    count[p.drug_class]++;
  }

  EXPECT_EQ(count[faves::OPIOID], 7);
  EXPECT_EQ(count[faves::BENZODIAZEPINE], 5);
  EXPECT_EQ(count[faves::STIMULANT], 7);
  EXPECT_EQ(count[faves::CANNABINOID], 6);
  EXPECT_EQ(count[faves::HYPNOTIC_SEDATIVE], 5);
  EXPECT_EQ(count[faves::DISSOCIATIVE_HALLUCINOGEN], 7);
}

TEST_F(TestPatternLibrary, Find) {
  const faves::CompiledPattern* p = _library.Find("anilidopiperidine");
  ASSERT_NE(p, nullptr);
  EXPECT_EQ(p->drug_class, faves::OPIOID);
  EXPECT_FALSE(p->description.empty());

  EXPECT_EQ(_library.Find("not_a_pattern"), nullptr);
}

struct DrugAndPattern {
  std::string name;
  std::string smiles;
  std::string pattern_id;
};

class TestKnownDrugs : public testing::TestWithParam<DrugAndPattern> {
  protected:
    faves::PatternLibrary _library;

    void SetUp() override;
};

void
TestKnownDrugs::SetUp() {
  ASSERT_TRUE(_library.Build(kPatternFile));
}

TEST_P(TestKnownDrugs, Matches) {
  const auto params = GetParam();

  const faves::CompiledPattern* p = _library.Find(params.pattern_id);
  ASSERT_NE(p, nullptr) << params.pattern_id;

  faves::Molecule m;
  ASSERT_TRUE(m.build_from_smiles(params.smiles)) << params.name;

  EXPECT_TRUE(p->matcher.Matches(m)) << params.name << " " << params.pattern_id;
}

INSTANTIATE_TEST_SUITE_P(Opioids, TestKnownDrugs, testing::Values(
  DrugAndPattern{"fentanyl", "CCC(=O)N(c1ccccc1)C1CCN(CCc2ccccc2)CC1", "anilidopiperidine"},
  DrugAndPattern{"morphine", "CN1CCC23c4c5ccc(O)c4OC2C(O)C=CC3C1C5", "morphinan"},
  DrugAndPattern{"pethidine", "CCOC(=O)C1(CCN(C)CC1)c1ccccc1", "phenylpiperidine_ester"},
  DrugAndPattern{"methadone", "CCC(=O)C(CC(C)N(C)C)(c1ccccc1)c1ccccc1", "diphenylpropylamine"},
  DrugAndPattern{"tramadol", "CN(C)CC1CCCCC1(O)c1cccc(OC)c1", "aryl_cyclohexanol_amine"},
  DrugAndPattern{"isotonitazene", "CCN(CC)CCn1c(Cc2ccc(OC(C)C)cc2)nc2cc([N+](=O)[O-])ccc21", "nitazene"},
  DrugAndPattern{"u47700", "CN(C)C1CCCCC1N(C)C(=O)c1ccc(Cl)c(Cl)c1", "cyclohexyl_benzamide"}
));

INSTANTIATE_TEST_SUITE_P(Benzodiazepines, TestKnownDrugs, testing::Values(
  DrugAndPattern{"diazepam", "CN1C(=O)CN=C(c2ccccc2)c2cc(Cl)ccc21", "benzodiazepine_14"},
  DrugAndPattern{"alprazolam", "Cc1nnc2CN=C(c3ccccc3)c3cc(Cl)ccc3-n12", "triazolobenzodiazepine"},
  DrugAndPattern{"alprazolam", "Cc1nnc2CN=C(c3ccccc3)c3cc(Cl)ccc3-n12", "benzodiazepine_14"},
  DrugAndPattern{"midazolam", "Cc1ncc2CN=C(c3ccccc3F)c3cc(Cl)ccc3-n12", "imidazobenzodiazepine"},
  DrugAndPattern{"etizolam", "CCc1cc2c(s1)-n1c(C)nnc1CN=C2c1ccccc1Cl", "thienodiazepine"},
  DrugAndPattern{"clobazam", "CN1C(=O)CC(=O)N(c2ccccc2)c2cc(Cl)ccc21", "benzodiazepine_15"}
));

INSTANTIATE_TEST_SUITE_P(Stimulants, TestKnownDrugs, testing::Values(
  DrugAndPattern{"amphetamine", "CC(N)Cc1ccccc1", "amphetamine"},
  DrugAndPattern{"mephedrone", "CNC(C)C(=O)c1ccc(C)cc1", "cathinone"},
  DrugAndPattern{"cocaine", "COC(=O)C1C(OC(=O)c2ccccc2)CC2CCC1N2C", "tropane_ester"},
  DrugAndPattern{"phenmetrazine", "CC1NCCOC1c1ccccc1", "phenylmorpholine"},
  DrugAndPattern{"methylphenidate", "COC(=O)C(c1ccccc1)C1CCCCN1", "methylphenidate"},
  DrugAndPattern{"4-methylaminorex", "CC1N=C(N)OC1c1ccccc1", "aminorex"},
  DrugAndPattern{"alpha-pvp", "CCCC(N1CCCC1)C(=O)c1ccccc1", "pyrrolidinophenone"}
));

INSTANTIATE_TEST_SUITE_P(Cannabinoids, TestKnownDrugs, testing::Values(
  DrugAndPattern{"thc", "CCCCCc1cc(O)c2c(c1)OC(C)(C)C1CCC(C)=CC21", "dibenzopyran"},
  DrugAndPattern{"jwh018", "CCCCCn1cc(C(=O)c2cccc3ccccc23)c2ccccc21", "indole_3_carbonyl_aryl"},
  DrugAndPattern{"ab-fubinaca", "CC(C)C(NC(=O)c1nn(Cc2ccc(F)cc2)c2ccccc12)C(N)=O", "indazole_3_carboxamide"},
  DrugAndPattern{"mdmb-chmica", "COC(=O)C(NC(=O)c1cn(CC2CCCCC2)c2ccccc12)C(C)(C)C", "indole_3_carboxamide"},
  DrugAndPattern{"cp47497", "CCCCCCC(C)(C)c1ccc(C2CCCC(O)C2)c(O)c1", "cyclohexylphenol"},
  DrugAndPattern{"jwh030", "CCCCCn1ccc(C(=O)c2cccc3ccccc23)c1", "naphthoylpyrrole"}
));

INSTANTIATE_TEST_SUITE_P(HypnoticSedatives, TestKnownDrugs, testing::Values(
  DrugAndPattern{"phenobarbital", "CCC1(c2ccccc2)C(=O)NC(=O)NC1=O", "barbiturate"},
  DrugAndPattern{"methaqualone", "Cc1ccccc1-n1c(C)nc2ccccc2c1=O", "quinazolinone"},
  DrugAndPattern{"zolpidem", "Cc1ccc(cc1)-c1nc2ccc(C)cn2c1CC(=O)N(C)C", "imidazopyridine"},
  DrugAndPattern{"zaleplon", "CCN(C(C)=O)c1cccc(c1)-c1ccnc2c(C#N)cnn12", "pyrazolopyrimidine"},
  DrugAndPattern{"ghb", "OCCCC(=O)O", "hydroxybutyrate"}
));

INSTANTIATE_TEST_SUITE_P(DissociativeHallucinogens, TestKnownDrugs, testing::Values(
  DrugAndPattern{"ketamine", "CNC1(CCCCC1=O)c1ccccc1Cl", "arylcyclohexylamine"},
  DrugAndPattern{"pcp", "c1ccc(cc1)C1(CCCCC1)N1CCCCC1", "arylcyclohexylamine"},
  DrugAndPattern{"dmt", "CN(C)CCc1c[nH]c2ccccc12", "tryptamine"},
  DrugAndPattern{"lsd", "CCN(CC)C(=O)C1CN(C)C2Cc3c[nH]c4cccc(C2=C1)c34", "ergoline"},
  DrugAndPattern{"2c-b", "COc1cc(CCN)c(OC)cc1Br", "dimethoxyphenethylamine"},
  DrugAndPattern{"mdma", "CNC(C)Cc1ccc2OCOc2c1", "methylenedioxyphenethylamine"},
  DrugAndPattern{"mescaline", "COc1cc(CCN)cc(OC)c1OC", "mescaline"},
  DrugAndPattern{"diphenidine", "C(C(c1ccccc1)N1CCCCC1)c1ccccc1", "diarylethylamine"}
));

class TestNegatives : public testing::TestWithParam<std::string> {
  protected:
    faves::PatternLibrary _library;

    void SetUp() override;
};

void
TestNegatives::SetUp() {
  ASSERT_TRUE(_library.Build(kPatternFile));
}

TEST_P(TestNegatives, NoPatternMatches) {
  faves::Molecule m;
  ASSERT_TRUE(m.build_from_smiles(GetParam()));

  for (const faves::CompiledPattern& p : _library.patterns()) {
    EXPECT_FALSE(p.matcher.Matches(m)) << GetParam() << " matched " << p.id;
  }
}

INSTANTIATE_TEST_SUITE_P(TestNegatives, TestNegatives, testing::Values(
  "CC(=O)Oc1ccccc1C(=O)O",
  "CC(C)Cc1ccc(cc1)C(C)C(=O)O",
  "CC(=O)Nc1ccc(O)cc1",
  "Cn1cnc2c1c(=O)n(C)c(=O)n2C",
  "CCCCCCCCO"
));

TEST(TestPatternLibraryBuild, FromProto) {
  faves::PatternLibraryData proto;
  ASSERT_TRUE(google::protobuf::TextFormat::ParseFromString(R"pb(
pattern { id: "benzene" smarts: "c1ccccc1" drug_class: STIMULANT }
pattern { id: "carbonyl" smarts: "C=O" drug_class: OPIOID }
)pb", &proto));

  faves::PatternLibrary library;
  ASSERT_TRUE(library.Build(proto));
  EXPECT_EQ(library.size(), 2);
  EXPECT_EQ(library.patterns()[0].id, "benzene");
  EXPECT_EQ(library.patterns()[1].drug_class, faves::OPIOID);
}

TEST(TestPatternLibraryBuild, DuplicateId) {
  faves::PatternLibraryData proto;
  ASSERT_TRUE(google::protobuf::TextFormat::ParseFromString(R"pb(
pattern { id: "benzene" smarts: "c1ccccc1" drug_class: STIMULANT }
pattern { id: "benzene" smarts: "C=O" drug_class: OPIOID }
)pb", &proto));

  faves::PatternLibrary library;
  EXPECT_FALSE(library.Build(proto));
}

TEST(TestPatternLibraryBuild, InvalidId) {
  faves::PatternLibraryData proto;
  ASSERT_TRUE(google::protobuf::TextFormat::ParseFromString(R"pb(
pattern { id: "Not Valid" smarts: "c1ccccc1" drug_class: STIMULANT }
)pb", &proto));

  faves::PatternLibrary library;
  EXPECT_FALSE(library.Build(proto));
}

TEST(TestPatternLibraryBuild, NoDrugClass) {
  faves::PatternLibraryData proto;
  ASSERT_TRUE(google::protobuf::TextFormat::ParseFromString(R"pb(
pattern { id: "benzene" smarts: "c1ccccc1" }
)pb", &proto));

  faves::PatternLibrary library;
  EXPECT_FALSE(library.Build(proto));
}

TEST(TestPatternLibraryBuild, InvalidSmarts) {
  faves::PatternLibraryData proto;
  ASSERT_TRUE(google::protobuf::TextFormat::ParseFromString(R"pb(
pattern { id: "broken" smarts: "C.C" drug_class: STIMULANT }
)pb", &proto));

  faves::PatternLibrary library;
  EXPECT_FALSE(library.Build(proto));
}

TEST(TestPatternLibraryBuild, Empty) {
  faves::PatternLibraryData proto;
  faves::PatternLibrary library;
  EXPECT_FALSE(library.Build(proto));
}

TEST(TestDrugClassName, Names) {
  EXPECT_EQ(faves::DrugClassName(faves::OPIOID), "opioid");
  EXPECT_EQ(faves::DrugClassName(faves::DRUG_CLASS_UNSPECIFIED), "unspecified");
}

}  // namespace
