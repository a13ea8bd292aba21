#ifndef FOUNDATIONAL_CMDLINE_CMDLINE_H_
#define FOUNDATIONAL_CMDLINE_CMDLINE_H_

#include <iostream>
#include <string>
#include <vector>

// A single option encountered on the command line, together with
// its value, if the option takes one.
class Option_and_Value
{
  friend
    std::ostream &
    operator << (std::ostream &, const Option_and_Value &);

  private:
    int _o;
    // Will be null for options that do not take a value.
    const char * _value;

  public:
    Option_and_Value (int, const char * = nullptr);

    char option () const { return _o;}
    const char * value () const { return _value;}

    int value (int &) const;
    int value (unsigned int &) const;
    int value (double &) const;
    int value (std::string &) const;
};

// Wrapper around getopt. Options are parsed on construction, the
// non option arguments are available via operator[] and iteration.
class Command_Line
{
  friend
    std::ostream &
      operator << (std::ostream &, const Command_Line &);

  private:
    std::vector<Option_and_Value> _options;
    std::vector<const char *> _args;
    int _some_options_start_with_dash;    // perhaps indicative of an error
    int _unrecognised_options_encountered;

  public:
    Command_Line (int, char **, const char *);

    int some_options_start_with_dash () const { return _some_options_start_with_dash;}
    int unrecognised_options_encountered () const { return _unrecognised_options_encountered;}

    int option_present (const char) const;
    int option_count (const char) const;

    const char * option_value (const char, int = 0) const;

    int value (const char, int &, int = 0) const;
    int value (const char, unsigned int &, int = 0) const;
    int value (const char, double &, int = 0) const;
    int value (const char, std::string &, int = 0) const;

    std::string string_value (const char, int = 0) const;

    std::vector<std::string> all_values (const char) const;

    int number_elements () const { return static_cast<int>(_args.size());}
    bool empty () const { return _args.empty();}

    const char * operator[] (int i) const { return _args[i];}

    std::vector<const char *>::const_iterator begin () const { return _args.cbegin();}
    std::vector<const char *>::const_iterator end () const { return _args.cend();}
};

#endif  // FOUNDATIONAL_CMDLINE_CMDLINE_H_
