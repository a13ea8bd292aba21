#include <unistd.h>

#include <cerrno>
#include <climits>
#include <cstdlib>
#include <iostream>

#include "cmdline.h"

using std::cerr;

Option_and_Value::Option_and_Value (int o, const char * val) : _o(o), _value(val)
{
}

int
Option_and_Value::value (int & result) const
{
  if (nullptr == _value)
    return 0;

  char * endptr = nullptr;
  errno = 0;
  const long tmp = strtol(_value, &endptr, 10);
  if (endptr == _value || '\0' != *endptr || 0 != errno)
    return 0;

  if (tmp < INT_MIN || tmp > INT_MAX)
    return 0;

  result = static_cast<int>(tmp);

  return 1;
}

int
Option_and_Value::value (unsigned int & result) const
{
  int tmp;
  if (! value(tmp) || tmp < 0)
    return 0;

  result = static_cast<unsigned int>(tmp);

  return 1;
}

int
Option_and_Value::value (double & result) const
{
  if (nullptr == _value)
    return 0;

  char * endptr = nullptr;
  errno = 0;
  const double tmp = strtod(_value, &endptr);
  if (endptr == _value || '\0' != *endptr || 0 != errno)
    return 0;

  result = tmp;

  return 1;
}

int
Option_and_Value::value (std::string & result) const
{
  if (nullptr == _value)
    return 0;

  result = _value;

  return 1;
}

std::ostream &
operator << (std::ostream & os, const Option_and_Value & ov)
{
  os << "Option '" << ov.option() << "'";
  if (nullptr != ov.value())
    os << ", value '" << ov.value() << "'";

  return os;
}

Command_Line::Command_Line (int argc, char ** argv, const char * options)
{
  optarg = nullptr;
  optind = 1;   // reinitialise in case of multiple invocations
  opterr = 0;     // suppress error messages

  _some_options_start_with_dash = 0;
  _unrecognised_options_encountered = 0;

  int o;
  while ((o = getopt(argc, argv, options)) != EOF)
  {
    if ('?' == o)
    {
      cerr << "Command_Line: unrecognised option '" << argv[optind - 1] << "'\n";
      _unrecognised_options_encountered++;
    }
    else
      _options.emplace_back(o, optarg);
  }

  _args.reserve(argc - optind);

  for (int i = optind; i < argc; i++)
  {
    if ('-' == *(argv[i]))
      _some_options_start_with_dash++;
    _args.push_back(argv[i]);
  }
}

int
Command_Line::option_present (const char c) const
{
  for (size_t i = 0; i < _options.size(); i++)
  {
    if (c == _options[i].option())
      return i + 1;
  }

  return 0;
}

int
Command_Line::option_count (const char c) const
{
  int rc = 0;

  for (const Option_and_Value & oo : _options)
  {
    if (c == oo.option())
      rc++;
  }

  return rc;
}

const char *
Command_Line::option_value (const char c, int occurrence) const
{
  int nfound = 0;
  for (const Option_and_Value & oo : _options)
  {
    if (c == oo.option() && occurrence == nfound++)
      return oo.value();
  }

  return nullptr;
}

int
Command_Line::value (const char c, int & result, int occurrence) const
{
  int nfound = 0;
  for (const Option_and_Value & oo : _options)
  {
    if (c == oo.option() && occurrence == nfound++)
      return oo.value(result);
  }

  return 0;
}

int
Command_Line::value (const char c, unsigned int & result, int occurrence) const
{
  int nfound = 0;
  for (const Option_and_Value & oo : _options)
  {
    if (c == oo.option() && occurrence == nfound++)
      return oo.value(result);
  }

  return 0;
}

int
Command_Line::value (const char c, double & result, int occurrence) const
{
  int nfound = 0;
  for (const Option_and_Value & oo : _options)
  {
    if (c == oo.option() && occurrence == nfound++)
      return oo.value(result);
  }

  return 0;
}

int
Command_Line::value (const char c, std::string & result, int occurrence) const
{
  int nfound = 0;
  for (const Option_and_Value & oo : _options)
  {
    if (c == oo.option() && occurrence == nfound++)
      return oo.value(result);
  }

  return 0;
}

std::string
Command_Line::string_value (const char c, int occurrence) const
{
  const char * v = option_value(c, occurrence);
  if (nullptr == v)
    return "";

  return v;
}

std::vector<std::string>
Command_Line::all_values (const char c) const
{
  std::vector<std::string> result;

  for (const Option_and_Value & oo : _options)
  {
    if (c == oo.option() && nullptr != oo.value())
      result.emplace_back(oo.value());
  }

  return result;
}

std::ostream &
operator << (std::ostream & os, const Command_Line & cl)
{
  os << "Command line object contains " << cl._options.size() << " options and " <<
        cl._args.size() << " values\n";

  for (const Option_and_Value & oo : cl._options)
    os << oo << '\n';

  for (const char * a : cl._args)
    os << "Value '" << a << "'\n";

  return os;
}
