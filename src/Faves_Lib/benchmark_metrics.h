#ifndef FAVES_LIB_BENCHMARK_METRICS_H_
#define FAVES_LIB_BENCHMARK_METRICS_H_

#include <array>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "Faves_Lib/classifier.h"

namespace faves {

// What a benchmark molecule is known to be.
struct ExpectedOutcome {
  // Should be detected as controlled.
  bool controlled = false;
  // Set for "fda_approved", used for whitelist coverage.
  bool fda_approved = false;
  Schedule schedule = SCHEDULE_UNSPECIFIED;
};

// "controlled", "controlled:II", "fda_approved", "negative_control".
std::optional<ExpectedOutcome> ParseExpectedOutcome(const std::string& s);

/*
  Accumulates expected and observed outcomes over a benchmark set.
  A molecule counts as detected if it is either a direct match to a
  controlled record or matches a scaffold.
*/

class BenchmarkMetrics {
  private:
    int _true_positives;
    int _false_negatives;
    int _true_negatives;
    int _false_positives;

    // Molecules that could not be classified.
    int _errors;

    int _fda_approved;
    int _fda_approved_whitelisted;

    // True positives where the schedule of the reference record matched.
    int _schedule_correct;

    // Indexed by Schedule.
    std::array<int, 6> _schedule_tested;
    std::array<int, 6> _schedule_detected;

    std::vector<std::string> _false_positive_names;
    std::vector<std::string> _false_negative_names;
    std::vector<std::string> _error_names;

  public:
    BenchmarkMetrics();

    void Extra(const std::string& name, const ExpectedOutcome& expected,
               const ClassificationResult& result);
    void ExtraError(const std::string& name);

    int true_positives() const { return _true_positives;}
    int false_negatives() const { return _false_negatives;}
    int true_negatives() const { return _true_negatives;}
    int false_positives() const { return _false_positives;}
    int errors() const { return _errors;}

    int total_tested() const {
      return _true_positives + _false_negatives + _true_negatives + _false_positives;
    }

    // Ratios are zero when their denominator is zero.
    double Sensitivity() const;
    double Specificity() const;
    double Precision() const;
    double F1() const;
    double Accuracy() const;
    double ScheduleAccuracy() const;
    double WhitelistRate() const;

    int schedule_tested(Schedule s) const { return _schedule_tested[s];}
    int schedule_detected(Schedule s) const { return _schedule_detected[s];}

    const std::vector<std::string>& false_positive_names() const { return _false_positive_names;}
    const std::vector<std::string>& false_negative_names() const { return _false_negative_names;}
    const std::vector<std::string>& error_names() const { return _error_names;}

    int Report(std::ostream& output) const;
};

}  // namespace faves

#endif  // FAVES_LIB_BENCHMARK_METRICS_H_
