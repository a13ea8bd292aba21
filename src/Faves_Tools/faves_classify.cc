// Classify structures against the reference index and scaffold patterns.

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "absl/strings/str_join.h"
#include "absl/strings/str_split.h"
#include "google/protobuf/text_format.h"
#include "tbb/blocked_range.h"
#include "tbb/parallel_for.h"

#include "Foundational/cmdline/cmdline.h"
#include "Foundational/iwmisc/report_progress.h"

#include "Faves_Lib/benchmark_metrics.h"
#include "Faves_Lib/classifier.h"
#include "Faves_Lib/pattern_library.h"
#include "Faves_Lib/reference_index.h"
#include "Faves_Lib/smiles.h"

namespace faves_classify {

using std::cerr;

using faves::BenchmarkMetrics;
using faves::ClassificationResult;
using faves::Classifier;
using faves::ParseError;

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
  const char* msg = R"(Classifies structures as cleared, controlled, review or none.
Input is one structure per line, 'smiles name', or with -b, 'smiles name expected'
where expected is one of controlled, controlled:<schedule>, fda_approved or negative_control.
 -C <fname>        ClassifierConfig text proto, required
 -t <ms>           time limit for each pattern search, overrides the config
 -F                do not look up individual fragments of multi fragment inputs
 -p                classify in parallel
 -y                write ComplianceResult text protos rather than tab separated output
 -b <fname>        benchmark mode, write performance metrics to <fname>
 -c <n>            number of structures held in memory at once (default 10000)
 -r <n>            report progress every <n> structures
 -v                verbose output
)";
  cerr << msg;
// clang-format on

  ::exit(rc);
}

// One line of input.
struct InputRecord {
  std::string smiles;
  std::string name;
  std::string expected;
};

struct Outcome {
  std::optional<ClassificationResult> result;
  ParseError error;
};

// Classifies a range of `_input`, results go to the same index in `_output`.
class ClassifyRange {
  private:
    const Classifier& _classifier;
    const std::vector<InputRecord>& _input;
    std::vector<Outcome>& _output;

  public:
    ClassifyRange(const Classifier& classifier, const std::vector<InputRecord>& input,
                  std::vector<Outcome>& output) :
        _classifier(classifier), _input(input), _output(output) {
    }

    void operator()(const tbb::blocked_range<int>& range) const {
      for (int i = range.begin(); i != range.end(); ++i) {
        Outcome& outcome = _output[i];
        outcome.result = _classifier.Classify(_input[i].smiles, outcome.error);
      }
    }
};

class Options {
  private:
    int _verbose;

    Classifier _classifier;

    int _parallel;

    int _write_proto;

    int _benchmark;
    std::string _benchmark_fname;
    BenchmarkMetrics _metrics;

    int _chunk_size;

    Report_Progress _report_progress;

    int _molecules_read;
    int _parse_errors;
    int _status_count[4];

//  private functions

    int _write_tabular(const InputRecord& input, const Outcome& outcome,
                       std::ostream& output) const;
    int _write_proto_form(const InputRecord& input, const Outcome& outcome,
                          std::ostream& output) const;
    int _accumulate(const InputRecord& input, const Outcome& outcome);

  public:
    Options();

    int Initialise(const Command_Line& cl);

    int chunk_size() const { return _chunk_size;}

    std::optional<InputRecord> Parse(const std::string& line) const;

    int Process(const std::vector<InputRecord>& input, std::ostream& output);

    int Report(std::ostream& output) const;
    int WriteBenchmark() const;
};

Options::Options() {
  _verbose = 0;
  _parallel = 0;
  _write_proto = 0;
  _benchmark = 0;
  _chunk_size = 10000;
  _molecules_read = 0;
  _parse_errors = 0;
  std::fill_n(_status_count, 4, 0);
}

int
Options::Initialise(const Command_Line& cl) {
  _verbose = cl.option_count('v');

  if (! cl.option_present('C')) {
    cerr << "Options::Initialise:must specify classifier config via -C\n";
    return 0;
  }

  const std::string config = cl.string_value('C');
  if (! _classifier.Build(config)) {
    cerr << "Options::Initialise:cannot initialise classifier from '" << config << "'\n";
    return 0;
  }

  if (_verbose) {
    _classifier.set_verbose(_verbose);
    cerr << "Classifier has " << _classifier.patterns().size() << " patterns, "
         << _classifier.index().whitelist().size() << " whitelisted and "
         << _classifier.index().controlled().size() << " controlled structures\n";
  }

  if (cl.option_present('t')) {
    int t;
    if (! cl.value('t', t) || t <= 0) {
      cerr << "Options::Initialise:the time limit (-t) must be a whole +ve number\n";
      return 0;
    }
    _classifier.set_match_timeout(std::chrono::milliseconds(t));
    if (_verbose) {
      cerr << "Pattern searches limited to " << t << " ms\n";
    }
  }

  if (cl.option_present('F')) {
    _classifier.set_fragment_lookup(0);
    if (_verbose) {
      cerr << "Fragments not looked up individually\n";
    }
  }

  if (cl.option_present('p')) {
    _parallel = 1;
  }

  if (cl.option_present('y')) {
    _write_proto = 1;
  }

  if (cl.option_present('b')) {
    _benchmark = 1;
    cl.value('b', _benchmark_fname);
    if (_verbose) {
      cerr << "Benchmark metrics written to '" << _benchmark_fname << "'\n";
    }
  }

  if (cl.option_present('c')) {
    if (! cl.value('c', _chunk_size) || _chunk_size < 1) {
      cerr << "Options::Initialise:the chunk size (-c) must be a whole +ve number\n";
      return 0;
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

std::optional<InputRecord>
Options::Parse(const std::string& line) const {
  const std::vector<std::string> tokens =
      absl::StrSplit(line, absl::ByAnyChar(" \t"), absl::SkipEmpty());
  if (tokens.empty()) {
    return std::nullopt;
  }

  InputRecord result;
  result.smiles = tokens[0];
  if (tokens.size() > 1) {
    result.name = tokens[1];
  }
  if (_benchmark) {
    if (tokens.size() < 3) {
      cerr << "Options::Parse:no expected outcome '" << line << "'\n";
      return std::nullopt;
    }
    result.expected = tokens[2];
  }

  return result;
}

int
Options::Process(const std::vector<InputRecord>& input, std::ostream& output) {
  std::vector<Outcome> outcomes(input.size());

  const int n = input.size();
  ClassifyRange classify(_classifier, input, outcomes);
  if (_parallel) {
    tbb::parallel_for(tbb::blocked_range<int>(0, n), classify);
  } else {
    classify(tbb::blocked_range<int>(0, n));
  }

  for (int i = 0; i < n; ++i) {
    ++_molecules_read;
    _report_progress.report("Classified ", "\n", cerr);

    _accumulate(input[i], outcomes[i]);

    if (_write_proto) {
      _write_proto_form(input[i], outcomes[i], output);
    } else {
      _write_tabular(input[i], outcomes[i], output);
    }
  }

  return output.good();
}

int
Options::_accumulate(const InputRecord& input, const Outcome& outcome) {
  if (! outcome.result) {
    ++_parse_errors;
    if (_benchmark) {
      _metrics.ExtraError(input.name);
    }
    return 1;
  }

  _status_count[outcome.result->status]++;

  if (! _benchmark) {
    return 1;
  }

  std::optional<faves::ExpectedOutcome> expected = faves::ParseExpectedOutcome(input.expected);
  if (! expected) {
    cerr << "Options::_accumulate:invalid expected outcome '" << input.expected << "' for "
         << input.name << '\n';
    _metrics.ExtraError(input.name);
    return 0;
  }

  _metrics.Extra(input.name, *expected, *outcome.result);

  return 1;
}

// smiles name status flag_count dea scaffold fda cwc schedule patterns
int
Options::_write_tabular(const InputRecord& input, const Outcome& outcome,
                        std::ostream& output) const {
  output << input.smiles << '\t' << input.name << '\t';

  if (! outcome.result) {
    output << "PARSE_ERROR\t" << outcome.error << '\n';
    return output.good();
  }

  const ClassificationResult& r = *outcome.result;
  output << faves::ComplianceStatusName(r.status) << '\t' << r.faves_flag_count << '\t'
         << r.is_dea_controlled << '\t' << r.is_scaffold_match << '\t' << r.is_fda_banned
         << '\t' << r.is_cwc_scheduled << '\t';

  const std::string schedule = faves::ScheduleName(r.schedule);
  output << (schedule.empty() ? "." : schedule) << '\t';

  if (r.scaffold_matches.empty()) {
    output << '.';
  } else {
    output << absl::StrJoin(r.scaffold_matches, ",",
                            [](std::string* out, const faves::ScaffoldMatch& s) {
                              out->append(s.pattern_id);
                            });
  }

  if (r.degraded_confidence) {
    output << "\tDEGRADED";
  }
  if (r.ambiguous_match) {
    output << "\tAMBIGUOUS";
  }

  output << '\n';

  return output.good();
}

int
Options::_write_proto_form(const InputRecord& input, const Outcome& outcome,
                           std::ostream& output) const {
  static google::protobuf::TextFormat::Printer printer;
  printer.SetSingleLineMode(true);

  faves::ComplianceResult proto;
  if (outcome.result) {
    proto = outcome.result->ToProto();
  } else {
    std::ostringstream msg;
    msg << outcome.error;
    proto.set_parse_error(msg.str());
  }
  proto.set_smiles(input.smiles);
  proto.set_name(input.name);

  std::string buffer;
  if (! printer.PrintToString(proto, &buffer)) {
    cerr << "Options::_write_proto_form:cannot write " << input.name << '\n';
    return 0;
  }

  output << buffer << '\n';

  return output.good();
}

int
Options::Report(std::ostream& output) const {
  output << "Read " << _molecules_read << " structures";
  if (_parse_errors) {
    output << ", " << _parse_errors << " could not be parsed";
  }
  output << '\n';

  for (faves::ComplianceStatus s : {faves::STATUS_CLEARED, faves::STATUS_CONTROLLED,
                                   faves::STATUS_REVIEW, faves::STATUS_NONE}) {
    output << _status_count[s] << ' ' << faves::ComplianceStatusName(s) << '\n';
  }

  return output.good();
}

int
Options::WriteBenchmark() const {
  if (! _benchmark) {
    return 1;
  }

  if (_benchmark_fname.empty() || "-" == _benchmark_fname) {
    return _metrics.Report(std::cout);
  }

  std::ofstream output(_benchmark_fname);
  if (! output) {
    cerr << "Options::WriteBenchmark:cannot open '" << _benchmark_fname << "'\n";
    return 0;
  }

  return _metrics.Report(output);
}

int
FavesClassify(Options& options, const char* fname, std::ostream& output) {
  std::ifstream input(fname);
  if (! input) {
    cerr << "FavesClassify:cannot open '" << fname << "'\n";
    return 0;
  }

  std::vector<InputRecord> chunk;
  chunk.reserve(options.chunk_size());

  std::string line;
  while (std::getline(input, line)) {
    if (line.empty() || '#' == line[0]) {
      continue;
    }

    std::optional<InputRecord> record = options.Parse(line);
    if (! record) {
      cerr << "FavesClassify:skipping '" << line << "'\n";
      continue;
    }

    chunk.push_back(std::move(*record));
    if (static_cast<int>(chunk.size()) < options.chunk_size()) {
      continue;
    }

    if (! options.Process(chunk, output)) {
      return 0;
    }
    chunk.clear();
  }

  if (! chunk.empty() && ! options.Process(chunk, output)) {
    return 0;
  }

  return 1;
}

int
Main(int argc, char** argv) {
  Command_Line cl(argc, argv, "vC:t:Fpyb:c:r:");

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
    if (! FavesClassify(options, fname, std::cout)) {
      cerr << "Fatal error processing '" << fname << "'\n";
      return 1;
    }
  }

  std::cout.flush();

  if (verbose) {
    options.Report(cerr);
  }

  if (! options.WriteBenchmark()) {
    return 1;
  }

  return 0;
}

}  // namespace faves_classify

int
main(int argc, char** argv) {
  int rc = faves_classify::Main(argc, argv);

  return rc;
}
