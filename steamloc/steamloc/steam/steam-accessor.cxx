#include <steamloc/steam/steam-accessor.hxx>

#include <charconv>
#include <utility>

using namespace std;

namespace steamloc
{
  // Return the block under the document root key, or nullptr.
  //
  static const acf_block*
  root_block (const acf_node& t, const char* key)
  {
    return t.get_block (key);
  }

  // Convert a decimal leaf. Leave the destination untouched on garbage.
  //
  template <typename T>
  static void
  parse_uint (const string& s, T& r)
  {
    T v (0);
    auto [p, ec] = from_chars (s.data (), s.data () + s.size (), v);

    if (ec == errc () && p == s.data () + s.size ())
      r = v;
  }

  acf_result<map<string, set<string>>>
  installed_app_ids (const acf_node& t)
  {
    const acf_block* lf (root_block (t, steam_root_key::libraryfolders));

    if (lf == nullptr)
      return schema_mismatch (steam_root_key::libraryfolders);

    map<string, set<string>> r;

    for (const auto& [id, entry]: *lf)
    {
      if (!entry.is_block ())
        continue;

      set<string>& ids (r[id]);

      if (const acf_block* apps = entry.get_block ("apps"))
      {
        for (const auto& a: *apps)
          ids.insert (a.first);
      }
    }

    return r;
  }

  acf_result<string>
  game_base_path (const acf_node& t, const string& app_id)
  {
    const acf_block* lf (root_block (t, steam_root_key::libraryfolders));

    if (lf == nullptr)
      return schema_mismatch (steam_root_key::libraryfolders);

    for (const auto& [id, entry]: *lf)
    {
      const acf_block* apps (entry.get_block ("apps"));

      if (apps == nullptr || apps->find (app_id) == apps->end ())
        continue;

      const acf_node* p (entry.find ("path"));

      if (p == nullptr || !p->is_leaf ())
        return schema_mismatch (
          string (steam_root_key::libraryfolders) + '/' + id + "/path");

      return p->as_leaf ();
    }

    return not_found (app_id);
  }

  acf_result<string>
  manifest_field (const acf_node& t, const string& field)
  {
    const acf_block* st (root_block (t, steam_root_key::app_state));

    if (st == nullptr)
      return schema_mismatch (steam_root_key::app_state);

    auto i (st->find (field));

    if (i == st->end ())
      return not_found (field);

    if (!i->second.is_leaf ())
      return schema_mismatch (string (steam_root_key::app_state) + '/' + field);

    return i->second.as_leaf ();
  }

  acf_result<string>
  login_user_field (const acf_node& t, const string& key)
  {
    const acf_block* us (root_block (t, steam_root_key::users));

    if (us == nullptr)
      return schema_mismatch (steam_root_key::users);

    // Pick the user flagged as most recent. Older clients spell the flag in
    // lower case.
    //
    const acf_block::value_type* u (nullptr);

    for (const auto& e: *us)
    {
      if (!e.second.is_block ())
        continue;

      if (u == nullptr)
        u = &e;

      if (e.second.get_string ("MostRecent") == "1" ||
          e.second.get_string ("mostrecent") == "1")
      {
        u = &e;
        break;
      }
    }

    if (u == nullptr)
      return not_found (steam_root_key::users);

    const acf_node* n (u->second.find (key));

    if (n == nullptr)
      return not_found (key);

    if (!n->is_leaf ())
      return schema_mismatch (
        string (steam_root_key::users) + '/' + u->first + '/' + key);

    return n->as_leaf ();
  }

  // Map the generic nodes into steam_library records.
  //
  acf_result<vector<steam_library>>
  library_folders (const acf_node& t)
  {
    const acf_block* lf (root_block (t, steam_root_key::libraryfolders));

    if (lf == nullptr)
      return schema_mismatch (steam_root_key::libraryfolders);

    vector<steam_library> r;

    for (const auto& [id, entry]: *lf)
    {
      if (!entry.is_block ())
        continue;

      steam_library l;
      l.index = id;

      // Steam writes Windows paths with doubled backslashes and sometimes
      // with forward slashes. Normalize so the rest of the code can use
      // path algebra.
      //
      if (const acf_node* n = entry.find ("path"); n && n->is_leaf ())
        l.path = fs::path (n->as_leaf ()).lexically_normal ().make_preferred ();

      l.label = entry.get_string ("label");

      parse_uint (entry.get_string ("contentid"), l.contentid);
      parse_uint (entry.get_string ("totalsize"), l.totalsize);

      if (const acf_block* apps = entry.get_block ("apps"))
      {
        for (const auto& [appid, v]: *apps)
        {
          if (v.is_leaf ())
            l.apps[appid] = v.as_leaf ();
        }
      }

      if (!l.path.empty ())
        r.push_back (move (l));
    }

    return r;
  }

  acf_result<steam_app_manifest>
  app_manifest (const acf_node& t)
  {
    const acf_block* st (root_block (t, steam_root_key::app_state));

    if (st == nullptr)
      return schema_mismatch (steam_root_key::app_state);

    steam_app_manifest m;

    for (const auto& [k, v]: *st)
    {
      if (v.is_leaf ())
        m.metadata[k] = v.as_leaf ();
    }

    const acf_node& s (*t.find (steam_root_key::app_state));

    m.appid = s.get_string ("appid");
    m.name = s.get_string ("name");
    m.installdir = s.get_string ("installdir");
    m.last_updated = s.get_string ("LastUpdated");

    parse_uint (s.get_string ("SizeOnDisk"), m.size_on_disk);
    parse_uint (s.get_string ("buildid"), m.buildid);

    return m;
  }
}
