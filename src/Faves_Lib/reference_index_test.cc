// Tests for ReferenceIndex.

#include <unistd.h>

#include <filesystem>
#include <fstream>
#include <optional>
#include <string>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include "google/protobuf/text_format.h"

#include "Foundational/data_source/tfdatarecord.h"

#include "Faves_Lib/canonical.h"
#include "Faves_Lib/molecule.h"
#include "Faves_Lib/reference_index.h"

namespace {

faves::CanonicalForm
FormOf(const std::string& smiles) {
  faves::Molecule m;
  if (! m.build_from_smiles(smiles)) {
    return faves::CanonicalForm();
  }

  return faves::MakeCanonicalForm(m);
}

struct StringAndSchedule {
  std::string s;
  faves::Schedule expected;
};

class TestParseSchedule : public testing::TestWithParam<StringAndSchedule> {
};

TEST_P(TestParseSchedule, Valid) {
  const auto params = GetParam();
  std::optional<faves::Schedule> s = faves::ParseSchedule(params.s);
  ASSERT_TRUE(s) << params.s;
  EXPECT_EQ(*s, params.expected);
}

INSTANTIATE_TEST_SUITE_P(TestParseSchedule, TestParseSchedule, testing::Values(
  StringAndSchedule{"I", faves::SCHEDULE_I},
  StringAndSchedule{"II", faves::SCHEDULE_II},
  StringAndSchedule{"CII", faves::SCHEDULE_II},
  StringAndSchedule{"ciii", faves::SCHEDULE_III},
  StringAndSchedule{"schedule_iv", faves::SCHEDULE_IV},
  StringAndSchedule{"ScheduleV", faves::SCHEDULE_V}
));

TEST(TestParseSchedule, Invalid) {
  EXPECT_FALSE(faves::ParseSchedule(""));
  EXPECT_FALSE(faves::ParseSchedule("VI"));
  EXPECT_FALSE(faves::ParseSchedule("2"));
  EXPECT_FALSE(faves::ParseSchedule("fda_banned"));
}

TEST(TestScheduleName, Names) {
  EXPECT_EQ(faves::ScheduleName(faves::SCHEDULE_III), "III");
  EXPECT_EQ(faves::ScheduleName(faves::SCHEDULE_UNSPECIFIED), "");
}

TEST(TestParseSmilesRecord, NameOnly) {
  std::optional<faves::ReferenceRecord> record = faves::ParseSmilesRecord("CC(=O)Oc1ccccc1C(=O)O aspirin");
  ASSERT_TRUE(record);
  EXPECT_EQ(record->smiles(), "CC(=O)Oc1ccccc1C(=O)O");
  EXPECT_EQ(record->name(), "aspirin");
  EXPECT_EQ(record->schedule(), faves::SCHEDULE_UNSPECIFIED);
  EXPECT_FALSE(record->is_fda_banned());
}

TEST(TestParseSmilesRecord, Attributes) {
  std::optional<faves::ReferenceRecord> record =
      faves::ParseSmilesRecord("CNC(C)Cc1ccc2OCOc2c1\tmdma CI fda_banned");
  ASSERT_TRUE(record);
  EXPECT_EQ(record->name(), "mdma");
  EXPECT_EQ(record->schedule(), faves::SCHEDULE_I);
  EXPECT_TRUE(record->is_fda_banned());
  EXPECT_FALSE(record->is_cwc_scheduled());
}

TEST(TestParseSmilesRecord, Cwc) {
  std::optional<faves::ReferenceRecord> record =
      faves::ParseSmilesRecord("CCOP(C)(=O)SCCN(C(C)C)C(C)C vx cwc");
  ASSERT_TRUE(record);
  EXPECT_TRUE(record->is_cwc_scheduled());
}

TEST(TestParseSmilesRecord, Invalid) {
  EXPECT_FALSE(faves::ParseSmilesRecord(""));
  EXPECT_FALSE(faves::ParseSmilesRecord("C methane unknown_attribute"));
}

class TestReferenceIndex : public testing::Test {
  protected:
    faves::ReferenceIndex _index;

    void SetUp() override;
};

void
TestReferenceIndex::SetUp() {
  faves::ReferenceRecord record;
  record.set_smiles("CC(=O)Oc1ccccc1C(=O)O");
  record.set_name("aspirin");
  ASSERT_TRUE(_index.Add(record, faves::WHITELISTED));

  record.Clear();
  record.set_smiles("CC(N)Cc1ccccc1");
  record.set_name("amphetamine");
  record.set_schedule(faves::SCHEDULE_II);
  ASSERT_TRUE(_index.Add(record, faves::CONTROLLED));
}

TEST_F(TestReferenceIndex, Sizes) {
  EXPECT_EQ(_index.whitelist().size(), 1);
  EXPECT_EQ(_index.controlled().size(), 1);
}

TEST_F(TestReferenceIndex, LookupAnySmiles) {
  const faves::CanonicalForm form = FormOf("OC(=O)c1ccccc1OC(C)=O");
  const faves::LookupResult found = _index.LookupWhitelist(form.smiles, form.secondary_hash);
  ASSERT_NE(found.entry, nullptr);
  EXPECT_EQ(found.entry->name, "aspirin");
  EXPECT_EQ(found.entry->label, faves::WHITELISTED);
  EXPECT_FALSE(found.ambiguous);

  EXPECT_NE(_index.LookupWhitelist(form.smiles), nullptr);
}

TEST_F(TestReferenceIndex, PartitionsAreSeparate) {
  const faves::CanonicalForm form = FormOf("NC(C)Cc1ccccc1");
  EXPECT_EQ(_index.LookupWhitelist(form.smiles, form.secondary_hash).entry, nullptr);

  const faves::LookupResult found = _index.LookupControlled(form.smiles, form.secondary_hash);
  ASSERT_NE(found.entry, nullptr);
  EXPECT_EQ(found.entry->schedule, faves::SCHEDULE_II);
  EXPECT_EQ(found.entry->label, faves::CONTROLLED);
}

TEST_F(TestReferenceIndex, NotFound) {
  const faves::CanonicalForm form = FormOf("CCCCCCCCO");
  const faves::LookupResult found = _index.LookupControlled(form.smiles, form.secondary_hash);
  EXPECT_EQ(found.entry, nullptr);
  EXPECT_FALSE(found.ambiguous);
}

TEST_F(TestReferenceIndex, DifferentSecondaryHashIsAmbiguous) {
  const faves::CanonicalForm form = FormOf("C[C@H](N)Cc1ccccc1");
  const faves::LookupResult found = _index.LookupControlled(form.smiles, form.secondary_hash);
  EXPECT_EQ(found.entry, nullptr);
  EXPECT_TRUE(found.ambiguous);
}

TEST_F(TestReferenceIndex, NoSecondaryHashMatchesCanonicalOnly) {
  const faves::CanonicalForm form = FormOf("CCO");

  faves::ReferenceRecord record;
  record.set_canonical(form.smiles);
  record.set_name("ethanol");
  ASSERT_TRUE(_index.Add(record, faves::CONTROLLED));

  const faves::LookupResult found = _index.LookupControlled(form.smiles, 12345);
  ASSERT_NE(found.entry, nullptr);
  EXPECT_EQ(found.entry->name, "ethanol");
}

TEST_F(TestReferenceIndex, SecondEntrySameStructure) {
  faves::ReferenceRecord record;
  record.set_smiles("C[C@H](N)Cc1ccccc1");
  record.set_name("dextroamphetamine");
  ASSERT_TRUE(_index.Add(record, faves::CONTROLLED));

  const faves::CanonicalForm stereo = FormOf("C[C@@H](N)Cc1ccccc1");
  faves::LookupResult found = _index.LookupControlled(stereo.smiles, stereo.secondary_hash);
  ASSERT_NE(found.entry, nullptr);
  EXPECT_EQ(found.entry->name, "dextroamphetamine");

  const faves::CanonicalForm flat = FormOf("CC(N)Cc1ccccc1");
  found = _index.LookupControlled(flat.smiles, flat.secondary_hash);
  ASSERT_NE(found.entry, nullptr);
  EXPECT_EQ(found.entry->name, "amphetamine");
}

TEST_F(TestReferenceIndex, InvalidRecords) {
  faves::ReferenceRecord record;
  EXPECT_FALSE(_index.Add(record, faves::CONTROLLED));

  record.set_smiles("C1CC");
  EXPECT_FALSE(_index.Add(record, faves::CONTROLLED));

  record.set_smiles("CC");
  EXPECT_FALSE(_index.Add(record, faves::LABEL_UNSPECIFIED));
}

class TestReferenceFiles : public testing::Test {
  protected:
    std::string _stem;
    std::string _fname;

    void SetUp() override;
    void TearDown() override;
};

void
TestReferenceFiles::SetUp() {
  _stem = "/tmp/reference_index_test" + std::to_string(getpid());
}

void
TestReferenceFiles::TearDown() {
  std::error_code ec;
  std::filesystem::remove(_fname, ec);
}

TEST_F(TestReferenceFiles, Smiles) {
  _fname = _stem + ".smi";
  {
    std::ofstream output(_fname);
    output << "# comment\n";
    output << "CCC(=O)N(c1ccccc1)C1CCN(CCc2ccccc2)CC1 fentanyl CII\n";
    output << "C1CC broken\n";
    output << "\n";
    output << "CNC(C)Cc1ccc2OCOc2c1 mdma CI fda_banned\n";
  }

  faves::ReferenceIndex index;
  ASSERT_TRUE(index.ReadFile(_fname, faves::CONTROLLED));
  EXPECT_EQ(index.controlled().size(), 2);

  const faves::CanonicalForm form = FormOf("CNC(C)Cc1ccc2OCOc2c1");
  const faves::LookupResult found = index.LookupControlled(form.smiles, form.secondary_hash);
  ASSERT_NE(found.entry, nullptr);
  EXPECT_TRUE(found.entry->is_fda_banned);
  EXPECT_EQ(found.entry->schedule, faves::SCHEDULE_I);
}

TEST_F(TestReferenceFiles, TextProto) {
  _fname = _stem + ".textproto";
  const faves::CanonicalForm form = FormOf("CN1C(=O)CN=C(c2ccccc2)c2cc(Cl)ccc21");
  {
    std::ofstream output(_fname);
    output << "canonical: \"" << form.smiles << "\" secondary_hash: " << form.secondary_hash
           << " name: \"diazepam\" schedule: SCHEDULE_IV\n";
    output << "smiles: \"CC(=O)Oc1ccccc1C(=O)O\" name: \"aspirin\"\n";
  }

  faves::ReferenceIndex index;
  ASSERT_TRUE(index.ReadFile(_fname, faves::CONTROLLED));
  EXPECT_EQ(index.controlled().size(), 2);

  const faves::LookupResult found = index.LookupControlled(form.smiles, form.secondary_hash);
  ASSERT_NE(found.entry, nullptr);
  EXPECT_EQ(found.entry->name, "diazepam");
  EXPECT_EQ(found.entry->schedule, faves::SCHEDULE_IV);
}

TEST_F(TestReferenceFiles, InvalidTextProto) {
  _fname = _stem + ".textproto";
  {
    std::ofstream output(_fname);
    output << "not_a_field: 1\n";
  }

  faves::ReferenceIndex index;
  EXPECT_FALSE(index.ReadFile(_fname, faves::CONTROLLED));
}

TEST_F(TestReferenceFiles, TFData) {
  _fname = _stem + ".tfdata";
  const faves::CanonicalForm form = FormOf("Cn1cnc2c1c(=O)n(C)c(=O)n2C");
  {
    iw_tf_data_record::TFDataWriter writer;
    ASSERT_TRUE(writer.Open(_fname));
    faves::ReferenceRecord record;
    record.set_canonical(form.smiles);
    record.set_secondary_hash(form.secondary_hash);
    record.set_name("caffeine");
    ASSERT_TRUE(writer.WriteSerializedProto(record));
    ASSERT_TRUE(writer.Close());
  }

  faves::ReferenceIndex index;
  ASSERT_TRUE(index.ReadFile(_fname, faves::WHITELISTED));
  EXPECT_EQ(index.whitelist().size(), 1);

  const faves::LookupResult found = index.LookupWhitelist(form.smiles, form.secondary_hash);
  ASSERT_NE(found.entry, nullptr);
  EXPECT_EQ(found.entry->name, "caffeine");
}

TEST_F(TestReferenceFiles, UnknownSuffix) {
  _fname = _stem + ".csv";
  faves::ReferenceIndex index;
  EXPECT_FALSE(index.ReadFile(_fname, faves::WHITELISTED));
}

TEST_F(TestReferenceFiles, MissingFile) {
  _fname = _stem + "_missing.smi";
  faves::ReferenceIndex index;
  EXPECT_FALSE(index.ReadFile(_fname, faves::WHITELISTED));
}

}  // namespace
