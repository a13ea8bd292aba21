#ifndef FOUNDATIONAL_IWMISC_REPORT_PROGRESS_H_
#define FOUNDATIONAL_IWMISC_REPORT_PROGRESS_H_

#include <ctime>
#include <iostream>

class Command_Line;

/*
  Long running programmes report their progress every so many items.
  Not thread safe, call from the thread that consumes results.
*/

class Report_Progress
{
  private:
    unsigned int _times_called;
    unsigned int _report_every;
    unsigned int _report_next;
    time_t _tzero;
    time_t _tprev;

  public:
    Report_Progress ();

    // Values of `flag` are either a number, or 'time' to also report
    // elapsed time.
    int initialise (const Command_Line & cl, char flag, int verbose);

    // Returns 1 if it is time to report.
    int operator ()();

    unsigned int times_called() const { return _times_called;}

    int active () const { return _report_every > 0;}

    int report (const char * leading, const char * trailing, std::ostream &);
};

#endif  // FOUNDATIONAL_IWMISC_REPORT_PROGRESS_H_
