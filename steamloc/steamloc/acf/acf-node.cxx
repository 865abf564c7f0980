#include <steamloc/acf/acf-node.hxx>

using namespace std;

namespace steamloc
{
  const acf_node* acf_node::
  find (const string& key) const
  {
    if (!is_block ())
      return nullptr;

    const acf_block& b (as_block ());
    auto i (b.find (key));
    return i != b.end () ? &i->second : nullptr;
  }

  string acf_node::
  get_string (const string& key, const string& default_value) const
  {
    const acf_node* n (find (key));

    if (n != nullptr && n->is_leaf ())
      return n->as_leaf ();

    return default_value;
  }

  const acf_block* acf_node::
  get_block (const string& key) const
  {
    const acf_node* n (find (key));

    if (n != nullptr && n->is_block ())
      return &n->as_block ();

    return nullptr;
  }

  size_t acf_node::
  size () const noexcept
  {
    return is_block () ? get<acf_block> (value).size () : 0;
  }

  // Structural equality. std::map compares its mapped values with ==, which
  // recurses back here.
  //
  bool
  operator== (const acf_node& x, const acf_node& y)
  {
    if (x.is_leaf () != y.is_leaf ())
      return false;

    if (x.is_leaf ())
      return x.as_leaf () == y.as_leaf ();

    return x.as_block () == y.as_block ();
  }

  static void
  dump_paths (ostream& o, const acf_node& n, const string& prefix)
  {
    for (const auto& [k, v]: n.as_block ())
    {
      string p (prefix.empty () ? k : prefix + '/' + k);

      if (v.is_leaf ())
        o << p << " = " << v.as_leaf () << '\n';
      else if (v.size () == 0)
        o << p << " = {}" << '\n';
      else
        dump_paths (o, v, p);
    }
  }

  void
  dump_paths (ostream& o, const acf_node& n)
  {
    if (n.is_leaf ())
      o << n.as_leaf () << '\n';
    else
      dump_paths (o, n, "");
  }
}
