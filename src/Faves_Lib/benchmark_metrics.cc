#include <iomanip>

#include "re2/re2.h"

#include "Foundational/iwmisc/iwre2.h"

#include "Faves_Lib/benchmark_metrics.h"

namespace faves {

namespace {

double
Ratio(int numerator, int denominator) {
  if (0 == denominator) {
    return 0.0;
  }

  return static_cast<double>(numerator) / static_cast<double>(denominator);
}

}  // namespace

std::optional<ExpectedOutcome>
ParseExpectedOutcome(const std::string& s) {
  static const RE2 controlled_rx("controlled(?::(\\w+))?");

  ExpectedOutcome result;

  if ("fda_approved" == s) {
    result.fda_approved = true;
    return result;
  }

  if ("negative_control" == s) {
    return result;
  }

  std::string schedule;
  if (! iwre2::RE2FullMatch(s, controlled_rx, schedule)) {
    return std::nullopt;
  }

  result.controlled = true;
  if (schedule.empty()) {
    return result;
  }

  std::optional<Schedule> sched = ParseSchedule(schedule);
  if (! sched) {
    return std::nullopt;
  }
  result.schedule = *sched;

  return result;
}

BenchmarkMetrics::BenchmarkMetrics() {
  _true_positives = 0;
  _false_negatives = 0;
  _true_negatives = 0;
  _false_positives = 0;
  _errors = 0;
  _fda_approved = 0;
  _fda_approved_whitelisted = 0;
  _schedule_correct = 0;
  _schedule_tested.fill(0);
  _schedule_detected.fill(0);
}

void
BenchmarkMetrics::Extra(const std::string& name, const ExpectedOutcome& expected,
                        const ClassificationResult& result) {
  const bool detected = result.is_dea_controlled || result.is_scaffold_match;

  if (expected.controlled) {
    if (detected) {
      ++_true_positives;
      if (SCHEDULE_UNSPECIFIED != expected.schedule && expected.schedule == result.schedule) {
        ++_schedule_correct;
      }
    } else {
      ++_false_negatives;
      _false_negative_names.push_back(name);
    }
    _schedule_tested[expected.schedule]++;
    if (detected) {
      _schedule_detected[expected.schedule]++;
    }
  } else if (detected) {
    ++_false_positives;
    _false_positive_names.push_back(name);
  } else {
    ++_true_negatives;
  }

  if (expected.fda_approved) {
    ++_fda_approved;
    if (result.is_whitelisted) {
      ++_fda_approved_whitelisted;
    }
  }
}

void
BenchmarkMetrics::ExtraError(const std::string& name) {
  ++_errors;
  _error_names.push_back(name);
}

double
BenchmarkMetrics::Sensitivity() const {
  return Ratio(_true_positives, _true_positives + _false_negatives);
}

double
BenchmarkMetrics::Specificity() const {
  return Ratio(_true_negatives, _true_negatives + _false_positives);
}

double
BenchmarkMetrics::Precision() const {
  return Ratio(_true_positives, _true_positives + _false_positives);
}

double
BenchmarkMetrics::F1() const {
  const double precision = Precision();
  const double sensitivity = Sensitivity();
  if (precision + sensitivity <= 0.0) {
    return 0.0;
  }

  return 2.0 * precision * sensitivity / (precision + sensitivity);
}

double
BenchmarkMetrics::Accuracy() const {
  return Ratio(_true_positives + _true_negatives, total_tested());
}

double
BenchmarkMetrics::ScheduleAccuracy() const {
  return Ratio(_schedule_correct, _true_positives);
}

double
BenchmarkMetrics::WhitelistRate() const {
  return Ratio(_fda_approved_whitelisted, _fda_approved);
}

int
BenchmarkMetrics::Report(std::ostream& output) const {
  const std::ios_base::fmtflags flags = output.flags();
  const std::streamsize precision = output.precision();

  output << std::fixed << std::setprecision(3);

  output << "Tested " << total_tested() << " molecules";
  if (_errors) {
    output << ", " << _errors << " could not be classified";
  }
  output << '\n';
  output << "Controlled " << (_true_positives + _false_negatives) << ", not controlled "
         << (_true_negatives + _false_positives) << '\n';

  output << "TP " << _true_positives << " FN " << _false_negatives << " FP "
         << _false_positives << " TN " << _true_negatives << '\n';

  output << "Sensitivity " << Sensitivity() << '\n';
  output << "Specificity " << Specificity() << '\n';
  output << "Precision " << Precision() << '\n';
  output << "F1 " << F1() << '\n';
  output << "Accuracy " << Accuracy() << '\n';
  output << "Schedule accuracy " << ScheduleAccuracy() << '\n';
  output << "Whitelist rate " << WhitelistRate() << '\n';

  for (Schedule s : {SCHEDULE_I, SCHEDULE_II, SCHEDULE_III, SCHEDULE_IV, SCHEDULE_V}) {
    if (0 == _schedule_tested[s]) {
      continue;
    }
    output << "Schedule " << ScheduleName(s) << " tested " << _schedule_tested[s]
           << " detected " << _schedule_detected[s] << ' '
           << Ratio(_schedule_detected[s], _schedule_tested[s]) << '\n';
  }

  for (const std::string& name : _false_positive_names) {
    output << "False positive " << name << '\n';
  }
  for (const std::string& name : _false_negative_names) {
    output << "False negative " << name << '\n';
  }
  for (const std::string& name : _error_names) {
    output << "Error " << name << '\n';
  }

  output.flags(flags);
  output.precision(precision);

  return output.good();
}

}  // namespace faves
