#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace steamloc
{
  // Split a document into whitespace-delimited fragments.
  //
  // Leading and trailing whitespace of the whole document is ignored and
  // runs of ASCII whitespace act as a single separator, so an empty or blank
  // document yields no fragments. Quotes are not interpreted here: a quoted
  // value with embedded whitespace comes out as several fragments which the
  // parser reassembles.
  //
  std::vector<std::string>
  tokenize (const std::string& text);

  // Fragment classification helpers.
  //

  // Number of quote characters in the fragment.
  //
  std::size_t
  quote_count (const std::string& fragment) noexcept;

  // True if the fragment starts and ends with a quote (and is at least two
  // characters long).
  //
  bool
  is_quoted (const std::string& fragment) noexcept;

  // True if the fragment starts a quoted run that continues over the
  // following fragments, that is, it opens with the only quote it contains.
  //
  bool
  opens_quoted_run (const std::string& fragment) noexcept;

  // Remove one leading and/or one trailing quote, if present.
  //
  std::string
  strip_leading_quote (const std::string& fragment);

  std::string
  strip_trailing_quote (const std::string& fragment);

  std::string
  strip_quotes (const std::string& fragment);
}
