// Tests for TFDataRecord reading and writing.
#include <unistd.h>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <string_view>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include "Foundational/data_source/tfdatarecord.h"

namespace {

using iw_tf_data_record::TFDataReader;
using iw_tf_data_record::TFDataWriter;

class TestTFDataRecord : public ::testing::Test {
  protected:
    std::string _fname;

  void SetUp();
  void TearDown();
};

void
TestTFDataRecord::SetUp() {
  _fname = "/tmp/tfdatarecord_test" + std::to_string(getpid()) + ".dat";
}

void
TestTFDataRecord::TearDown() {
  std::error_code ec;
  std::filesystem::remove(_fname, ec);
}

TEST_F(TestTFDataRecord, RoundTrip) {
  TFDataWriter writer;
  ASSERT_TRUE(writer.Open(_fname));
  ASSERT_TRUE(writer.Write(std::string_view("hello")));
  ASSERT_TRUE(writer.Write(std::string_view("")));
  ASSERT_TRUE(writer.Write(std::string_view("world")));
  ASSERT_TRUE(writer.Close());

  TFDataReader reader;
  ASSERT_TRUE(reader.Open(_fname));

  std::optional<std::string_view> data = reader.Next();
  ASSERT_TRUE(data);
  EXPECT_EQ(*data, "hello");

  data = reader.Next();
  ASSERT_TRUE(data);
  EXPECT_TRUE(data->empty());

  data = reader.Next();
  ASSERT_TRUE(data);
  EXPECT_EQ(*data, "world");

  EXPECT_FALSE(reader.Next());
  EXPECT_TRUE(reader.eof());
  EXPECT_TRUE(reader.good());
  EXPECT_EQ(reader.items_read(), 3);
}

TEST_F(TestTFDataRecord, LargeRecord) {
  const std::string large(100000, 'x');

  TFDataWriter writer;
  ASSERT_TRUE(writer.Open(_fname));
  ASSERT_TRUE(writer.Write(large));
  ASSERT_TRUE(writer.Close());

  TFDataReader reader(_fname);
  ASSERT_TRUE(reader.IsOpen());
  std::optional<std::string_view> data = reader.Next();
  ASSERT_TRUE(data);
  EXPECT_EQ(data->size(), large.size());
  EXPECT_EQ(*data, large);
}

TEST_F(TestTFDataRecord, RecordLongerThanLimit) {
  TFDataWriter writer;
  ASSERT_TRUE(writer.Open(_fname));
  ASSERT_TRUE(writer.Write(std::string(100, 'x')));
  ASSERT_TRUE(writer.Close());

  TFDataReader reader(_fname);
  reader.set_max_record_length(99);
  EXPECT_FALSE(reader.Next());
  EXPECT_FALSE(reader.good());
}

// A header whose length crc is valid but whose length is enormous.
TEST_F(TestTFDataRecord, HugeLengthInHeader) {
  const uint64_t length = uint64_t{1} << 60;
  const uint32_t crc = iw_tf_data_record::MaskedCrc(reinterpret_cast<const char*>(&length), sizeof(length));
  {
    std::ofstream output(_fname, std::ios::binary);
    output.write(reinterpret_cast<const char*>(&length), sizeof(length));
    output.write(reinterpret_cast<const char*>(&crc), sizeof(crc));
    output << "abc";
  }

  TFDataReader reader(_fname);
  ASSERT_TRUE(reader.IsOpen());
  EXPECT_FALSE(reader.Next());
  EXPECT_FALSE(reader.good());
  EXPECT_EQ(reader.items_read(), 0);
}

TEST_F(TestTFDataRecord, CloseWhenNotOpen) {
  TFDataWriter writer;
  EXPECT_FALSE(writer.IsOpen());
  EXPECT_FALSE(writer.Close());
}

TEST_F(TestTFDataRecord, MissingFile) {
  TFDataReader reader;
  EXPECT_FALSE(reader.Open("/this/file/does/not/exist.tfdata"));
}

TEST(TestMaskedCrc, Deterministic) {
  const char* data = "123456789";
  EXPECT_EQ(iw_tf_data_record::MaskedCrc(data, 9), iw_tf_data_record::MaskedCrc(data, 9));
  EXPECT_NE(iw_tf_data_record::MaskedCrc(data, 9), iw_tf_data_record::MaskedCrc(data, 8));
}

}  // namespace
