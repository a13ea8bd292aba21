#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <cstdint>
#include <cstring>

#include "zlib.h"

#include "Foundational/data_source/tfdatarecord.h"

namespace iw_tf_data_record {

using std::cerr;

unsigned int default_read_buffer_size = 4096;

constexpr uint64_t sizeof_length = sizeof(uint64_t);
constexpr uint64_t sizeof_crc = sizeof(uint32_t);

uint32_t
MaskedCrc(const char* data, uint64_t nbytes) {
  uLong crc = crc32(0L, Z_NULL, 0);
  crc = crc32_z(crc, reinterpret_cast<const Bytef*>(data), static_cast<z_size_t>(nbytes));
  const uint32_t result = static_cast<uint32_t>(crc);
  return ((result >> 15) | (result << 17)) + 0xa282ead8ul;
}

void
TFDataReader::DefaultValues() {
  _fd = -1;
  _good = true;
  _eof = false;
  _next = 0;

  _read_buffer.resize(default_read_buffer_size);
  _bytes_in_buffer = 0;
  _max_record_length = kDefaultMaxRecordLength;

  _items_read = 0;
}

TFDataReader::TFDataReader() {
  DefaultValues();
}

TFDataReader::TFDataReader(const std::string& fname) {
  DefaultValues();
  OpenFile(fname.c_str());
}

TFDataReader::~TFDataReader() {
  Close();
}

int
TFDataReader::Open(const std::string& fname) {
  return OpenFile(fname.c_str());
}

int
TFDataReader::Close() {
  if (_fd < 0) {
    return 1;
  }

  ::close(_fd);
  _fd = -1;
  return 1;
}

bool
TFDataReader::OpenFile(const char * fname) {
  if (_fd >= 0) {
    cerr << "TFDataReader::OpenFile:already open " << _fd << ", no action\n";
    return false;
  }

  _fd = ::open(fname, O_RDONLY);
  if (_fd < 0) {
    _good = false;
    return false;
  }

  _good = true;
  _eof = false;
  _next = 0;
  _bytes_in_buffer = 0;
  return true;
}

// _next is pointing at length data. Retrieve that length.
std::optional<uint64_t>
TFDataReader::GetLength() {
  const char* p = _read_buffer.data() + _next;

  uint64_t length;
  memcpy(&length, p, sizeof_length);
  uint32_t crc;
  memcpy(&crc, p + sizeof_length, sizeof_crc);

  const uint32_t result = MaskedCrc(p, sizeof_length);
  if (result != crc) {
    cerr << "TFDataReader::GetLength:crc fails, length " << length << '\n';
    cerr << result << " vs " << crc << '\n';
    _good = false;
    return std::nullopt;
  }

  _next += sizeof_length + sizeof_crc;
  return length;
}

std::optional<std::string_view>
TFDataReader::Next() {
  if (_eof || ! _good) {
    return std::nullopt;
  }

  // First task is to read the size of the next item.
  // At a minimum, we need 8+4 bytes for size of next and the crc
  if (! FillReadBuffer(sizeof_length + sizeof_crc)) {
    if (_eof && _bytes_in_buffer > _next) {
      cerr << "TFDataReader::Next:truncated length, " << (_bytes_in_buffer - _next) << " bytes\n";
      _good = false;
    }
    return std::nullopt;
  }

  std::optional<uint64_t> length = GetLength();
  if (! length) {
    return std::nullopt;
  }

  if (*length > _max_record_length) {
    cerr << "TFDataReader::Next:record length " << *length << " exceeds limit " << _max_record_length << '\n';
    _good = false;
    return std::nullopt;
  }

  if (! FillReadBuffer(*length + sizeof_crc)) {
    cerr << "TFDataReader::Next:truncated record, expected " << *length << " bytes\n";
    _good = false;
    return std::nullopt;
  }

  const char* data = _read_buffer.data() + _next;

  uint32_t crc;
  memcpy(&crc, data + *length, sizeof_crc);
  if (crc != MaskedCrc(data, *length)) {
    cerr << "TFDataReader::Next:Invalid data crc " << *length << " bytes\n";
    _good = false;
    return std::nullopt;
  }

  _next += *length + sizeof_crc;

  ++_items_read;
  return std::string_view(data, *length);
}

// The class needs to be able to read `bytes_needed` into an item.
// Upon exit, the next bytes_needed of data will be in the buffer.
bool
TFDataReader::FillReadBuffer(uint64_t bytes_needed) {
  // If the next bytes_needed bytes are already in _read_buffer we are done.
  if (_next + bytes_needed <= _bytes_in_buffer) {
    return true;
  }

  // We need to shift the data and maybe resize.
  if (_next > 0) {
    std::copy(_read_buffer.begin() + _next, _read_buffer.begin() + _bytes_in_buffer,
              _read_buffer.begin());
    _bytes_in_buffer -= _next;
    _next = 0;
  }

  // At this stage, the next item will start at zero.

  if (_read_buffer.size() < bytes_needed) {
    _read_buffer.resize(bytes_needed);
  }

  while (_bytes_in_buffer < bytes_needed) {
    const ssize_t bytes_read = ::read(_fd, _read_buffer.data() + _bytes_in_buffer,
                                      _read_buffer.size() - _bytes_in_buffer);
    if (bytes_read < 0) {
      _good = false;
      return false;
    }
    if (bytes_read == 0) {
      _eof = true;
      return false;
    }

    _bytes_in_buffer += bytes_read;
  }

  return true;
}

TFDataWriter::TFDataWriter() : _fd(-1) {
}

TFDataWriter::~TFDataWriter() {
  if (_fd >= 0) {
    Close();
  }
}

int
TFDataWriter::Open(const std::string& fname) {
  if (_fd >= 0) {
    cerr << "TFDataWriter::Open:already open\n";
    return 0;
  }

  _fd = ::open(fname.c_str(), O_WRONLY | O_CREAT | O_TRUNC,
               S_IRUSR | S_IWUSR | S_IRGRP | S_IROTH);
  if (_fd < 0) {
    cerr << "TFDataWriter::Open:cannot open '" << fname << "'\n";
    return 0;
  }

  return 1;
}

int
TFDataWriter::Close() {
  if (_fd < 0) {
    return 0;
  }

  int rc = Flush();
  if (::close(_fd) != 0) {
    rc = 0;
  }
  _fd = -1;

  return rc;
}

int
TFDataWriter::Flush() {
  const char* p = _buffer.data();
  uint64_t remaining = _buffer.size();
  while (remaining > 0) {
    const ssize_t written = ::write(_fd, p, remaining);
    if (written <= 0) {
      cerr << "TFDataWriter::Flush:write failed, " << remaining << " bytes pending\n";
      return 0;
    }
    p += written;
    remaining -= written;
  }

  _buffer.clear();
  return 1;
}

int
TFDataWriter::Write(const void * data, uint64_t nbytes) {
  if (_fd < 0) {
    cerr << "TFDataWriter::Write:not open\n";
    return 0;
  }

  if (! WriteLength(nbytes)) {
    cerr << "TFDataWriter::Write:cannot write " << nbytes << " length\n";
    return 0;
  }
  return WriteData(data, nbytes);
}

int
TFDataWriter::Write(std::string_view data) {
  return Write(data.data(), data.size());
}

// Write `nbytes` from `data` as well as the crc of `data`.
int
TFDataWriter::CommonWrite(const void * data, const uint64_t nbytes) {
  const char * p = reinterpret_cast<const char *>(data);
  _buffer.append(p, nbytes);

  const uint32_t crc = MaskedCrc(p, nbytes);
  _buffer.append(reinterpret_cast<const char *>(&crc), sizeof_crc);

  if (_buffer.size() > 8192) {
    return Flush();
  }

  return 1;
}

int
TFDataWriter::WriteLength(const uint64_t nbytes) {
  return CommonWrite(&nbytes, sizeof_length);
}

// A zero length record still carries the crc of its empty payload.
int
TFDataWriter::WriteData(const void * data, uint64_t nbytes) {
  return CommonWrite(data, nbytes);
}

}  // namespace iw_tf_data_record
