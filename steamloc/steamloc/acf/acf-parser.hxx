#pragma once

#include <steamloc/acf/acf-node.hxx>
#include <steamloc/acf/acf-types.hxx>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace steamloc
{
  // ACF/VDF parser.
  //
  // The document is a sequence of "key" value pairs where value is either a
  // quoted string or a { ... } block of further pairs. The result is always
  // a block holding the top-level pairs (usually a single root key such as
  // "AppState" or "libraryfolders").
  //
  class acf_parser
  {
  public:
    // Maximum block nesting accepted before the document is rejected.
    //
    static constexpr std::size_t max_depth = 256;

    // Parse a fragment sequence as produced by tokenize().
    //
    static acf_result<acf_node>
    parse (const std::vector<std::string>& fragments);

    // Tokenize and parse a complete document.
    //
    static acf_result<acf_node>
    parse (const std::string& text);

  private:
    using fragments = std::vector<std::string>;

    // Parse the pairs in [b, e) into r. Positions are indices into the
    // complete fragment sequence so that failures point at the right place.
    //
    static std::optional<acf_failure>
    parse_range (const fragments&,
                 std::size_t b,
                 std::size_t e,
                 std::size_t depth,
                 acf_block& r);

    // Reassemble a quoted value that was split on whitespace. On entry p
    // points to the opening fragment; on success it points to the closing
    // one.
    //
    static std::optional<acf_failure>
    parse_quoted_run (const fragments&,
                      std::size_t& p,
                      std::size_t e,
                      std::string& r);

    // Find the brace that closes the block opened at position p. Returns the
    // closing brace position or e if there is none.
    //
    static std::size_t
    match_brace (const fragments&, std::size_t p, std::size_t e);
  };
}
