// Convert a smiles reference list to a TFDataRecord file of ReferenceRecord
// protos, with the canonical form and secondary hash precomputed.

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>

#include "google/protobuf/text_format.h"

#include "Foundational/cmdline/cmdline.h"
#include "Foundational/data_source/tfdatarecord.h"
#include "Foundational/iwmisc/report_progress.h"

#include "Faves_Lib/canonical.h"
#include "Faves_Lib/molecule.h"
#include "Faves_Lib/reference_data.pb.h"
#include "Faves_Lib/reference_index.h"
#include "Faves_Lib/smiles.h"

namespace faves_make_index {

using std::cerr;

using iw_tf_data_record::TFDataWriter;

void
Usage(int rc) {
// clang-format off
#if defined(GIT_HASH) && defined(TODAY)
  cerr << __FILE__ << " compiled " << TODAY << " git hash " << GIT_HASH << '\n';
#else
  cerr << __FILE__ << " compiled " << __DATE__ << " " << __TIME__ << '\n';
#endif
// clang-format on
// clang-format off
  const char* msg = R"(Builds a reference snapshot from smiles files.
Input lines are 'smiles name [schedule] [fda_banned] [cwc]'.
 -l <label>        whitelist or controlled, required
 -S <fname>        output file, TFDataRecord serialized ReferenceRecord
 -T <fname>        output file, one ReferenceRecord text proto per line
 -r <n>            report progress every <n> structures
 -v                verbose output
)";
  cerr << msg;
// clang-format on

  ::exit(rc);
}

class Options {
  private:
    int _verbose;

    faves::Label _label;

    TFDataWriter _tfdata_output;
    std::ofstream _text_output;

    Report_Progress _report_progress;

    int _lines_read;
    int _records_written;
    int _lines_skipped;

  public:
    Options();

    int Initialise(const Command_Line& cl);

    // Convert one line of input, returning 0 only for output errors.
    int Process(const std::string& line, int line_number);

    int Close();

    int Report(std::ostream& output) const;
};

Options::Options() {
  _verbose = 0;
  _label = faves::LABEL_UNSPECIFIED;
  _lines_read = 0;
  _records_written = 0;
  _lines_skipped = 0;
}

int
Options::Initialise(const Command_Line& cl) {
  _verbose = cl.option_count('v');

  if (! cl.option_present('l')) {
    cerr << "Options::Initialise:must specify the label via -l\n";
    return 0;
  }

  const std::string label = cl.string_value('l');
  if ("whitelist" == label || "whitelisted" == label) {
    _label = faves::WHITELISTED;
  } else if ("controlled" == label) {
    _label = faves::CONTROLLED;
  } else {
    cerr << "Options::Initialise:unrecognised label '" << label << "'\n";
    return 0;
  }

  if (! cl.option_present('S') && ! cl.option_present('T')) {
    cerr << "Options::Initialise:must specify output via -S or -T\n";
    return 0;
  }

  if (cl.option_present('S')) {
    const std::string fname = cl.string_value('S');
    if (! _tfdata_output.Open(fname)) {
      cerr << "Options::Initialise:cannot open '" << fname << "'\n";
      return 0;
    }
    if (_verbose) {
      cerr << "Serialized records written to '" << fname << "'\n";
    }
  }

  if (cl.option_present('T')) {
    const std::string fname = cl.string_value('T');
    _text_output.open(fname);
    if (! _text_output) {
      cerr << "Options::Initialise:cannot open '" << fname << "'\n";
      return 0;
    }
    if (_verbose) {
      cerr << "Text records written to '" << fname << "'\n";
    }
  }

  if (cl.option_present('r')) {
    if (! _report_progress.initialise(cl, 'r', _verbose)) {
      cerr << "Options::Initialise:cannot initialise progress reporting\n";
      return 0;
    }
  }

  return 1;
}

int
Options::Process(const std::string& line, int line_number) {
  ++_lines_read;
  _report_progress.report("Read ", "\n", cerr);

  std::optional<faves::ReferenceRecord> record = faves::ParseSmilesRecord(line);
  if (! record) {
    cerr << "Options::Process:skipping line " << line_number << '\n';
    ++_lines_skipped;
    return 1;
  }

  faves::Molecule m;
  faves::ParseError error;
  if (! m.build_from_smiles(record->smiles(), error)) {
    cerr << "Options::Process:invalid smiles '" << record->smiles() << "', " << error
         << ", line " << line_number << " skipped\n";
    ++_lines_skipped;
    return 1;
  }

  const faves::CanonicalForm form = faves::MakeCanonicalForm(m);
  record->set_canonical(form.smiles);
  record->set_secondary_hash(form.secondary_hash);
  record->set_label(_label);

  if (_tfdata_output.IsOpen() && ! _tfdata_output.WriteSerializedProto(*record)) {
    cerr << "Options::Process:write failed at line " << line_number << '\n';
    return 0;
  }

  if (_text_output.is_open()) {
    static google::protobuf::TextFormat::Printer printer;
    printer.SetSingleLineMode(true);

    std::string buffer;
    if (! printer.PrintToString(*record, &buffer)) {
      cerr << "Options::Process:cannot format line " << line_number << '\n';
      return 0;
    }
    _text_output << buffer << '\n';
    if (! _text_output.good()) {
      cerr << "Options::Process:write failed at line " << line_number << '\n';
      return 0;
    }
  }

  ++_records_written;

  return 1;
}

int
Options::Close() {
  int rc = 1;
  if (_tfdata_output.IsOpen() && ! _tfdata_output.Close()) {
    cerr << "Options::Close:cannot close serialized output\n";
    rc = 0;
  }

  if (_text_output.is_open()) {
    _text_output.close();
    if (_text_output.fail()) {
      cerr << "Options::Close:cannot close text output\n";
      rc = 0;
    }
  }

  return rc;
}

int
Options::Report(std::ostream& output) const {
  output << "Read " << _lines_read << " lines, wrote " << _records_written << " records";
  if (_lines_skipped) {
    output << ", skipped " << _lines_skipped;
  }
  output << '\n';

  return output.good();
}

int
FavesMakeIndex(Options& options, const char* fname) {
  std::ifstream input(fname);
  if (! input) {
    cerr << "FavesMakeIndex:cannot open '" << fname << "'\n";
    return 0;
  }

  int line_number = 0;
  std::string line;
  while (std::getline(input, line)) {
    ++line_number;
    if (line.empty() || '#' == line[0]) {
      continue;
    }

    if (! options.Process(line, line_number)) {
      cerr << "FavesMakeIndex:error at line " << line_number << " of '" << fname << "'\n";
      return 0;
    }
  }

  return 1;
}

int
Main(int argc, char** argv) {
  Command_Line cl(argc, argv, "vl:S:T:r:");

  if (cl.unrecognised_options_encountered()) {
    cerr << "Unrecognised options encountered\n";
    Usage(1);
  }

  const int verbose = cl.option_count('v');

  Options options;
  if (! options.Initialise(cl)) {
    cerr << "Cannot initialise options\n";
    Usage(1);
  }

  if (cl.empty()) {
    cerr << "Insufficient arguments\n";
    Usage(1);
  }

  for (const char* fname : cl) {
    if (! FavesMakeIndex(options, fname)) {
      cerr << "Fatal error processing '" << fname << "'\n";
      return 1;
    }
  }

  if (! options.Close()) {
    return 1;
  }

  if (verbose) {
    options.Report(cerr);
  }

  return 0;
}

}  // namespace faves_make_index

int
main(int argc, char** argv) {
  int rc = faves_make_index::Main(argc, argv);

  return rc;
}
