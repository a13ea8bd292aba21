#include <limits>
#include <string>

#include "Foundational/cmdline/cmdline.h"
#include "Foundational/iwmisc/report_progress.h"

using std::cerr;

Report_Progress::Report_Progress()
{
  _times_called = 0;
  _report_every = 0;
  _report_next = std::numeric_limits<unsigned int>::max();
  _tzero = static_cast<time_t>(0);
  _tprev = static_cast<time_t>(0);

  return;
}

int
Report_Progress::operator ()()
{
  if (0 == _report_every)
    return 0;

  _times_called++;

  if (_times_called < _report_next)
    return 0;

  _report_next += _report_every;

  return 1;
}

int
Report_Progress::report (const char * leading,
                         const char * trailing,
                         std::ostream & output)
{
  if (! operator()())
    return 0;

  if (nullptr != leading)
    output << leading;

  output << _times_called;

  if (0 != _tzero)
  {
    const time_t tnow = time(nullptr);
    output << " t=" << (tnow - _tzero) << " (" << (tnow - _tprev) << ")";
    _tprev = tnow;
  }

  if (nullptr != trailing)
    output << trailing;

  return 1;
}

int
Report_Progress::initialise (const Command_Line & cl, char flag, int verbose)
{
  std::string s;
  for (int i = 0; cl.value(flag, s, i); ++i)
  {
    if ("time" == s)
    {
      _tzero = time(nullptr);
      _tprev = _tzero;
    }
    else if (! cl.value(flag, _report_every, i) || 0 == _report_every)
    {
      cerr << "Report_Progress::initialise:the report every option (-" << flag << ") must be a whole +ve number\n";
      return 0;
    }
  }

  _report_next = _report_every;

  if (verbose)
    cerr << "Will report progress every " << _report_every << " items\n";

  return 1;
}
