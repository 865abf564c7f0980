#include <steamloc/acf/acf-parser.hxx>

#include <steamloc/acf/acf-tokenizer.hxx>

#include <utility>

using namespace std;

namespace steamloc
{
  // Describe what we found at position p for diagnostics.
  //
  static string
  found_at (const vector<string>& f, size_t p)
  {
    if (p >= f.size ())
      return "end of document";

    return '\'' + f[p] + '\'';
  }

  acf_result<acf_node> acf_parser::
  parse (const vector<string>& f)
  {
    acf_block r;

    if (optional<acf_failure> x = parse_range (f, 0, f.size (), 0, r))
      return move (*x);

    return acf_node (move (r));
  }

  acf_result<acf_node> acf_parser::
  parse (const string& text)
  {
    return parse (tokenize (text));
  }

  // Parse a run of key/value pairs.
  //
  // We alternate between expecting a key and expecting a value. A key must
  // be a self-contained quoted fragment. A value is either a quoted string
  // (possibly split over several fragments) or a block, in which case we
  // delimit the block first and then recurse into it.
  //
  optional<acf_failure> acf_parser::
  parse_range (const fragments& f,
               size_t b,
               size_t e,
               size_t depth,
               acf_block& r)
  {
    bool expecting_key (true);
    string key;

    for (size_t p (b); p != e; ++p)
    {
      const string& s (f[p]);

      if (expecting_key)
      {
        if (!is_quoted (s))
          return malformed_document (p, "key", found_at (f, p));

        key = strip_quotes (s);
        expecting_key = false;
        continue;
      }

      if (opens_quoted_run (s))
      {
        string v;
        if (optional<acf_failure> x = parse_quoted_run (f, p, e, v))
          return x;

        r.insert_or_assign (move (key), acf_node (move (v)));
      }
      else if (quote_count (s) >= 2)
      {
        r.insert_or_assign (move (key), acf_node (strip_quotes (s)));
      }
      else if (s == "{")
      {
        size_t c (match_brace (f, p, e));

        if (c == e)
          return malformed_document (
            e,
            "'}' closing block opened at position " + std::to_string (p),
            found_at (f, e));

        if (depth + 1 > max_depth)
          return malformed_document (
            p,
            "nesting depth of at most " + std::to_string (max_depth),
            "deeper block");

        // The sub-range excludes both braces. An empty one is an empty
        // block rather than a leaf.
        //
        acf_block nested;

        if (c - p > 1)
        {
          if (optional<acf_failure> x =
                parse_range (f, p + 1, c, depth + 1, nested))
            return x;
        }

        r.insert_or_assign (move (key), acf_node (move (nested)));
        p = c;
      }
      else
        return malformed_document (p, "value or list", found_at (f, p));

      expecting_key = true;
    }

    // A key without a value is an error, not something to drop quietly.
    //
    if (!expecting_key)
      return malformed_document (e, "value or list", found_at (f, e));

    return nullopt;
  }

  optional<acf_failure> acf_parser::
  parse_quoted_run (const fragments& f, size_t& p, size_t e, string& r)
  {
    string v (strip_leading_quote (f[p]));

    for (size_t i (p + 1); i != e; ++i)
    {
      const string& s (f[i]);

      // Runs of whitespace collapse to a single space.
      //
      v += ' ';

      if (quote_count (s) != 0)
      {
        v += strip_trailing_quote (s);

        r = move (v);
        p = i;
        return nullopt;
      }

      v += s;
    }

    return malformed_document (
      e,
      "closing quote for value opened at position " + std::to_string (p),
      found_at (f, e));
  }

  // Track the brace depth until it drops back to zero.
  //
  // Only stand-alone brace fragments count and only outside of a quoted run,
  // so a value such as "a { b" does not affect the nesting.
  //
  size_t acf_parser::
  match_brace (const fragments& f, size_t p, size_t e)
  {
    size_t depth (1);
    bool quoted (false);

    for (++p; p != e; ++p)
    {
      const string& s (f[p]);

      if (quoted)
      {
        if (quote_count (s) != 0)
          quoted = false;

        continue;
      }

      if (opens_quoted_run (s))
        quoted = true;
      else if (s == "{")
        ++depth;
      else if (s == "}" && --depth == 0)
        return p;
    }

    return e;
  }
}
