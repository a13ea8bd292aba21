#ifndef FOUNDATIONAL_DATA_SOURCE_TFDATARECORD_H
#define FOUNDATIONAL_DATA_SOURCE_TFDATARECORD_H
// Read and write TFDataRecord

#include <sys/types.h>

#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace iw_tf_data_record {

// Each record is
//   uint64 length, masked crc32 of the length
//   data, masked crc32 of the data
uint32_t MaskedCrc(const char* data, uint64_t nbytes);

// Records longer than this are treated as a corrupt file.
inline constexpr uint64_t kDefaultMaxRecordLength = 64 * 1024 * 1024;

class TFDataReader {
  private:
    // The file descriptor from which data is retrieved.
    int _fd;
    // Status flags.

    bool _good;
    bool _eof;

    int _items_read;

    // An index into _read_buffer where the next item starts.
    uint64_t _next;

    // Data is read from _fd into _read_buffer. Bytes [0, _bytes_in_buffer)
    // are valid.
    std::vector<char> _read_buffer;
    uint64_t _bytes_in_buffer;

    // A length read from the file above this is not allocated.
    uint64_t _max_record_length;

    // private functions.

    void DefaultValues();

    bool OpenFile(const char * fname);

    std::optional<uint64_t> GetLength();

    bool FillReadBuffer(uint64_t bytes_needed = 8192);

  public:
    TFDataReader();
    TFDataReader(const std::string& fname);
    ~TFDataReader();

    TFDataReader(const TFDataReader&) = delete;
    TFDataReader& operator=(const TFDataReader&) = delete;

    int Open(const std::string& fname);

    bool IsOpen() const { return _fd >= 0;}

    bool good() const { return _good;}
    bool eof() const { return _eof;}

    int Close();

    int items_read() const { return _items_read;}

    void set_max_record_length(uint64_t s) { _max_record_length = s;}

    // The primary method for this class. If possible, return
    // the next item. The view is valid until the next call.
    std::optional<std::string_view> Next();

    // Read serialized proto of type P and return decoded form.
    template <typename P>
    std::optional<P>
    ReadProto();
};

// Writes data files that can subsequently be read by TFDataReader.
class TFDataWriter {
  private:
    int _fd;

    // Output accumulates here and is flushed to _fd when large.
    std::string _buffer;

  // private functions

  int WriteData(const void * data, uint64_t nbytes);
  int WriteLength(const uint64_t nbytes);
  int CommonWrite(const void * data, const uint64_t nbytes);
  int Flush();

  public:
    TFDataWriter();
    ~TFDataWriter();

    TFDataWriter(const TFDataWriter&) = delete;
    TFDataWriter& operator=(const TFDataWriter&) = delete;

    int Open(const std::string& fname);

    bool IsOpen() const { return _fd >= 0;}

    int Close();

    int Write(const void * data, uint64_t nbytes);
    int Write(std::string_view data);

    // Write a serialized proto.
    template <typename P>
    int WriteSerializedProto(const P& proto);
};

template <typename P>
std::optional<P>
TFDataReader::ReadProto() {
  std::optional<std::string_view> data = Next();
  if (! data) {
    return std::nullopt;
  }
  P proto;
  if (! proto.ParseFromArray(data->data(), static_cast<int>(data->size()))) {
    std::cerr << "TFDataReader::ReadProto:cannot parse serialized form\n";
    _good = false;
    return std::nullopt;
  }

  return proto;
}

template <typename P>
int
TFDataWriter::WriteSerializedProto(const P& proto) {
  const std::string as_string = proto.SerializeAsString();
  return Write(as_string.data(), as_string.size());
}

}  // namespace iw_tf_data_record

#endif // FOUNDATIONAL_DATA_SOURCE_TFDATARECORD_H
