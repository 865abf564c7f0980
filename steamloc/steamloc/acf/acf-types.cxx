#include <steamloc/acf/acf-types.hxx>

#include <sstream>

using namespace std;

namespace steamloc
{
  string
  to_string (acf_error e)
  {
    switch (e)
    {
      case acf_error::malformed_document: return "malformed-document";
      case acf_error::schema_mismatch:    return "schema-mismatch";
      case acf_error::not_found:          return "not-found";
    }

    return "unknown";
  }

  string acf_failure::
  description () const
  {
    ostringstream o;

    switch (kind)
    {
      case acf_error::malformed_document:
      {
        o << "malformed document: expected " << expected
          << " at position " << position << ", got " << found;
        break;
      }
      case acf_error::schema_mismatch:
      {
        o << "schema mismatch: root node '" << expected << "' not found";
        break;
      }
      case acf_error::not_found:
      {
        o << "'" << expected << "' not found";
        break;
      }
    }

    return o.str ();
  }

  acf_failure
  malformed_document (size_t p, string e, string f)
  {
    acf_failure r;
    r.kind = acf_error::malformed_document;
    r.position = p;
    r.expected = move (e);
    r.found = move (f);
    return r;
  }

  acf_failure
  schema_mismatch (string k)
  {
    acf_failure r;
    r.kind = acf_error::schema_mismatch;
    r.expected = move (k);
    return r;
  }

  acf_failure
  not_found (string k)
  {
    acf_failure r;
    r.kind = acf_error::not_found;
    r.expected = move (k);
    return r;
  }
}
