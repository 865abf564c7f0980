#pragma once

#include <cstddef>
#include <map>
#include <ostream>
#include <string>
#include <utility>
#include <variant>

namespace steamloc
{
  struct acf_node;

  // Nested key-value section. Keys are unique; on a repeated key the last
  // value wins.
  //
  using acf_block = std::map<std::string, acf_node>;

  // Node in the parse tree: either a leaf string or a block.
  //
  struct acf_node
  {
    std::variant<std::string, acf_block> value;

    acf_node (): value (acf_block {}) {}

    explicit acf_node (std::string s): value (std::move (s)) {}

    explicit acf_node (acf_block b): value (std::move (b)) {}

    bool
    is_leaf () const noexcept
    {
      return std::holds_alternative<std::string> (value);
    }

    bool
    is_block () const noexcept
    {
      return std::holds_alternative<acf_block> (value);
    }

    // Throws std::bad_variant_access on kind mismatch.
    //
    const std::string&
    as_leaf () const
    {
      return std::get<std::string> (value);
    }

    const acf_block&
    as_block () const
    {
      return std::get<acf_block> (value);
    }

    // Child by key, or nullptr if this is a leaf or the key is absent.
    //
    const acf_node*
    find (const std::string& key) const;

    // Leaf value of child key, or default if absent or not a leaf.
    //
    std::string
    get_string (const std::string& key,
                const std::string& default_value = "") const;

    // Child block, or nullptr.
    //
    const acf_block*
    get_block (const std::string& key) const;

    // Number of immediate children (0 for a leaf).
    //
    std::size_t
    size () const noexcept;
  };

  bool
  operator== (const acf_node&, const acf_node&);

  inline bool
  operator!= (const acf_node& x, const acf_node& y)
  {
    return !(x == y);
  }

  // Print every leaf of the tree as a "key/path = value" line, in key order.
  // Empty blocks are printed as "key/path = {}" so that they don't vanish
  // from the output.
  //
  void
  dump_paths (std::ostream&, const acf_node&);
}
