#include <steamloc/acf/acf-tokenizer.hxx>

#include <algorithm>

using namespace std;

namespace steamloc
{
  // Only ASCII whitespace separates fragments. We don't use isspace() since
  // its answer depends on the locale.
  //
  static inline bool
  separator (char c) noexcept
  {
    return c == ' '  || c == '\t' || c == '\n' ||
           c == '\r' || c == '\v' || c == '\f';
  }

  vector<string>
  tokenize (const string& s)
  {
    vector<string> r;

    size_t n (s.size ());
    size_t i (0);

    while (i != n)
    {
      while (i != n && separator (s[i]))
        ++i;

      if (i == n)
        break;

      size_t b (i);
      while (i != n && !separator (s[i]))
        ++i;

      r.emplace_back (s, b, i - b);
    }

    return r;
  }

  size_t
  quote_count (const string& f) noexcept
  {
    return static_cast<size_t> (count (f.begin (), f.end (), '"'));
  }

  bool
  is_quoted (const string& f) noexcept
  {
    return f.size () >= 2 && f.front () == '"' && f.back () == '"';
  }

  bool
  opens_quoted_run (const string& f) noexcept
  {
    return !f.empty () && f.front () == '"' && quote_count (f) == 1;
  }

  string
  strip_leading_quote (const string& f)
  {
    return !f.empty () && f.front () == '"' ? f.substr (1) : f;
  }

  string
  strip_trailing_quote (const string& f)
  {
    return !f.empty () && f.back () == '"' ? f.substr (0, f.size () - 1) : f;
  }

  string
  strip_quotes (const string& f)
  {
    return strip_trailing_quote (strip_leading_quote (f));
  }
}
