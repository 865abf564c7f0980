#include <steamloc/steam/steam-types.hxx>

using namespace std;

namespace steamloc
{
  string
  to_string (steam_error e)
  {
    switch (e)
    {
      case steam_error::steam_not_found:   return "steam-not-found";
      case steam_error::file_unreadable:   return "file-unreadable";
      case steam_error::document_unusable: return "document-unusable";
      case steam_error::schema_mismatch:   return "schema-mismatch";
      case steam_error::app_not_found:     return "app-not-found";
      case steam_error::appdata_not_found: return "appdata-not-found";
      case steam_error::user_not_found:    return "user-not-found";
    }

    return "unknown";
  }

  // The accessor taxonomy is coarser than ours: not_found means different
  // things depending on what was asked for, so the caller supplies it.
  //
  steam_error
  to_steam_error (acf_error e, steam_error nf)
  {
    switch (e)
    {
      case acf_error::malformed_document: return steam_error::document_unusable;
      case acf_error::schema_mismatch:    return steam_error::schema_mismatch;
      case acf_error::not_found:          return nf;
    }

    return steam_error::document_unusable;
  }
}
