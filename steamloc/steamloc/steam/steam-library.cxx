#include <steamloc/steam/steam-library.hxx>

#include <steamloc/acf/acf-parser.hxx>
#include <steamloc/steam/steam-accessor.hxx>

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <utility>
#include <vector>

#include <boost/asio/post.hpp>
#include <boost/asio/use_awaitable.hpp>

#ifdef _WIN32
#  include <cstring>
#  include <windows.h>
#endif

using namespace std;

namespace steamloc
{
#ifdef _WIN32
  // Detect if we're running under Wine by checking for wine_get_version in
  // ntdll.dll.
  //
  static bool
  is_wine ()
  {
    static int r (-1); // Cache: -1 = unknown, 0 = no, 1 = yes.

    if (r == -1)
    {
      HMODULE ntdll (GetModuleHandleA ("ntdll.dll"));

      if (ntdll != nullptr)
      {
        auto proc = GetProcAddress (ntdll, "wine_get_version");
        r = (proc != nullptr) ? 1 : 0;
      }
      else
        r = 0;
    }

    return r == 1;
  }

  // Read a REG_SZ value.
  //
  static optional<string>
  registry_string (HKEY root, const char* key, const char* value)
  {
    HKEY k;
    if (RegOpenKeyExA (root, key, 0, KEY_READ, &k) != ERROR_SUCCESS)
      return nullopt;

    char buf[MAX_PATH];
    DWORD size (sizeof (buf));
    DWORD type (0);

    LSTATUS s (RegQueryValueExA (k,
                                 value,
                                 nullptr,
                                 &type,
                                 reinterpret_cast<LPBYTE> (buf),
                                 &size));
    RegCloseKey (k);

    if (s != ERROR_SUCCESS || type != REG_SZ || size == 0)
      return nullopt;

    return string (buf, strnlen (buf, size));
  }
#endif

  static inline optional<fs::path>
  getenv_path (const char* n)
  {
    const char* v (getenv (n));

    if (v == nullptr || *v == '\0')
      return nullopt;

    return fs::path (v);
  }

  steam_library_manager::
  steam_library_manager (asio::io_context& ioc, optional<fs::path> r)
    : ioc_ (ioc),
      steam_root_ (move (r))
  {
  }

  // Detect the main Steam installation path.
  //
  // We delegate this to platform-specific implementations unless the root
  // was given to us explicitly. The result is cached in steam_path_ so we
  // don't have to re-scan the registry or filesystem on subsequent calls.
  //
  asio::awaitable<optional<fs::path>> steam_library_manager::
  detect_steam_path ()
  {
    if (steam_path_)
      co_return steam_path_;

    optional<fs::path> r;

    if (steam_root_)
    {
      if (validate_library_path (*steam_root_))
        r = *steam_root_;
    }
    else
    {
#ifdef _WIN32
      // If we're running under Wine, use Linux detection since Steam is
      // likely installed on the host Linux system.
      //
      r = is_wine () ? detect_steam_path_linux ()
                     : detect_steam_path_windows ();
#elif defined(__APPLE__)
      r = detect_steam_path_macos ();
#else
      r = detect_steam_path_linux ();
#endif
    }

    if (r)
      steam_path_ = *r;

    co_return r;
  }

  // Linux detection logic.
  //
  // On Linux, Steam is typically installed in the user's home directory,
  // either under .steam or .local. However, we also need to check system-wide
  // locations and the Flatpak sandbox.
  //
  optional<fs::path> steam_library_manager::
  detect_steam_path_linux () const
  {
    vector<fs::path> candidates;

    optional<fs::path> h (getenv_path ("HOME"));

#ifdef _WIN32
    // Under Wine HOME is usually not set. Try Z:\home\<user>, preferring USER
    // but falling back to USERNAME.
    //
    if (!h)
    {
      const char* u (getenv ("USER"));
      if (u == nullptr)
        u = getenv ("USERNAME");

      if (u != nullptr)
      {
        fs::path p ("Z:\\home");
        p /= u;

        if (fs::exists (p))
          h = move (p);
      }
    }
#endif

    if (h)
    {
      candidates.push_back (*h / ".steam" / "steam");
      candidates.push_back (*h / ".steam" / "root");
      candidates.push_back (*h / ".local" / "share" / "Steam");

      // Flatpak. Depending on the version the data lives either in data/
      // or in the sandboxed home's .steam.
      //
      fs::path fp (*h / ".var" / "app" / "com.valvesoftware.Steam");
      candidates.push_back (fp / "data" / "Steam");
      candidates.push_back (fp / ".steam" / "steam");
    }

#ifdef _WIN32
    candidates.push_back ("Z:\\usr\\share\\steam");
    candidates.push_back ("Z:\\usr\\local\\share\\steam");
#else
    candidates.push_back ("/usr/share/steam");
    candidates.push_back ("/usr/local/share/steam");
#endif

    if (optional<fs::path> x = getenv_path ("XDG_DATA_HOME"))
      candidates.push_back (*x / "Steam");

    for (const fs::path& p: candidates)
    {
      if (validate_library_path (p))
        return p;
    }

    return nullopt;
  }

  // Windows detection logic.
  //
  // The registry is the most reliable source of truth. The per-user key is
  // written by the client itself while the machine key is written by the
  // installer. If both fail (e.g., portable installations), we fall back to
  // the standard Program Files directories.
  //
  optional<fs::path> steam_library_manager::
  detect_steam_path_windows () const
  {
#ifdef _WIN32
    vector<fs::path> candidates;

    if (auto v = registry_string (HKEY_CURRENT_USER,
                                  "Software\\Valve\\Steam",
                                  "SteamPath"))
      candidates.push_back (*v);

    if (auto v = registry_string (HKEY_LOCAL_MACHINE,
                                  "SOFTWARE\\Wow6432Node\\Valve\\Steam",
                                  "InstallPath"))
      candidates.push_back (*v);

    if (auto v = registry_string (HKEY_LOCAL_MACHINE,
                                  "SOFTWARE\\Valve\\Steam",
                                  "InstallPath"))
      candidates.push_back (*v);

    candidates.push_back ("C:\\Program Files (x86)\\Steam");
    candidates.push_back ("C:\\Program Files\\Steam");

    for (const fs::path& p: candidates)
    {
      fs::path n (p.lexically_normal ().make_preferred ());

      if (validate_library_path (n))
        return n;
    }
#endif

    return nullopt;
  }

  // macOS detection logic.
  //
  // On macOS, Steam usually lives in the user's Library/Application Support.
  //
  optional<fs::path> steam_library_manager::
  detect_steam_path_macos () const
  {
    vector<fs::path> candidates;

    if (optional<fs::path> h = getenv_path ("HOME"))
      candidates.push_back (*h / "Library" / "Application Support" / "Steam");

    for (const fs::path& p: candidates)
    {
      if (validate_library_path (p))
        return p;
    }

    return nullopt;
  }

  asio::awaitable<fs::path> steam_library_manager::
  require_steam_path ()
  {
    optional<fs::path> r (co_await detect_steam_path ());

    if (!r)
    {
      if (steam_root_)
        throw steam_exception (steam_error::steam_not_found,
                               "no Steam installation in " +
                               steam_root_->string ());

      throw steam_exception (steam_error::steam_not_found,
                             "unable to locate Steam installation");
    }

    co_return *r;
  }

  asio::awaitable<steam_config_paths> steam_library_manager::
  get_config_paths ()
  {
    fs::path r (co_await require_steam_path ());

    steam_config_paths paths;
    paths.steam_root = r;
    paths.steamapps = r / "steamapps";
    paths.libraryfolders_vdf = paths.steamapps / "libraryfolders.vdf";
    paths.loginusers_vdf = r / "config" / "loginusers.vdf";

    co_return paths;
  }

  // Load and parse a document.
  //
  // The files are a few kilobytes so we read them in one go. We do yield to
  // the context first since callers tend to load many manifests in a row.
  //
  asio::awaitable<acf_node> steam_library_manager::
  load_document (const fs::path& f)
  {
    co_await asio::post (ioc_, asio::use_awaitable);

    ifstream ifs (f, ios::binary);
    if (!ifs)
      throw steam_exception (steam_error::file_unreadable,
                             "unable to open " + f.string ());

    ostringstream oss;
    oss << ifs.rdbuf ();

    if (ifs.bad ())
      throw steam_exception (steam_error::file_unreadable,
                             "unable to read " + f.string ());

    acf_result<acf_node> r (acf_parser::parse (oss.str ()));

    if (!r)
      throw steam_exception (steam_error::document_unusable,
                             f.string () + ": " + r.failure ().description (),
                             r.failure ());

    co_return move (r).value ();
  }

  asio::awaitable<acf_node> steam_library_manager::
  library_tree ()
  {
    // If we have already parsed the libraries, return the cached tree.
    //
    if (library_tree_)
      co_return *library_tree_;

    steam_config_paths paths (co_await get_config_paths ());

    library_tree_ = co_await load_document (paths.libraryfolders_vdf);
    co_return *library_tree_;
  }

  asio::awaitable<vector<steam_library>> steam_library_manager::
  load_libraries ()
  {
    acf_node t (co_await library_tree ());
    acf_result<vector<steam_library>> r (library_folders (t));

    if (!r)
      throw steam_exception (
        to_steam_error (r.error (), steam_error::document_unusable),
        "libraryfolders.vdf: " + r.failure ().description (),
        r.failure ());

    co_return move (r).value ();
  }

  asio::awaitable<fs::path> steam_library_manager::
  game_base_path (const string& appid)
  {
    acf_node t (co_await library_tree ());
    acf_result<string> r (steamloc::game_base_path (t, appid));

    if (!r)
    {
      if (r.error () == acf_error::not_found)
        throw steam_exception (steam_error::app_not_found,
                               "app " + appid + " is not installed in any "
                               "Steam library",
                               r.failure ());

      throw steam_exception (
        to_steam_error (r.error (), steam_error::app_not_found),
        "libraryfolders.vdf: " + r.failure ().description (),
        r.failure ());
    }

    co_return fs::path (*r).lexically_normal ().make_preferred ();
  }

  asio::awaitable<steam_app_manifest> steam_library_manager::
  load_app_manifest (const string& appid)
  {
    fs::path b (co_await game_base_path (appid));
    fs::path f (b / "steamapps" / ("appmanifest_" + appid + ".acf"));

    acf_node t (co_await load_document (f));
    acf_result<steam_app_manifest> r (app_manifest (t));

    if (!r)
      throw steam_exception (
        to_steam_error (r.error (), steam_error::app_not_found),
        f.string () + ": " + r.failure ().description (),
        r.failure ());

    steam_app_manifest m (move (r).value ());

    // Resolve the full installation path.
    //
    if (!m.installdir.empty ())
      m.fullpath = b / "steamapps" / "common" / m.installdir;

    co_return m;
  }

  asio::awaitable<fs::path> steam_library_manager::
  game_install_path (const string& appid)
  {
    steam_app_manifest m (co_await load_app_manifest (appid));

    if (m.fullpath.empty ())
      throw steam_exception (steam_error::app_not_found,
                             "manifest of app " + appid +
                             " has no installdir");

    co_return m.fullpath;
  }

  asio::awaitable<fs::path> steam_library_manager::
  game_appdata_path (const string& appid, const optional<string>& o)
  {
    fs::path b (co_await game_base_path (appid));

    string d;
    if (o && !o->empty ())
      d = *o;
    else
    {
      steam_app_manifest m (co_await load_app_manifest (appid));
      d = m.installdir;
    }

    if (d.empty ())
      throw steam_exception (steam_error::appdata_not_found,
                             "manifest of app " + appid +
                             " has no installdir");

    vector<fs::path> candidates;

    // Proton prefix. The emulated user is always steamuser.
    //
    fs::path ad (b / "steamapps" / "compatdata" / appid / "pfx" /
                 "drive_c" / "users" / "steamuser" / "AppData");

    candidates.push_back (ad / "Local" / d);
    candidates.push_back (ad / "LocalLow" / d);

    // Native locations. LocalLow has no variable of its own but sits next to
    // Local.
    //
    optional<fs::path> la (getenv_path ("LOCALAPPDATA"));

    if (la)
      candidates.push_back (*la / d);

    if (optional<fs::path> a = getenv_path ("APPDATA"))
      candidates.push_back (*a / d);

    if (la)
      candidates.push_back (la->parent_path () / "LocalLow" / d);

    for (const fs::path& p: candidates)
    {
      error_code ec;
      if (fs::is_directory (p, ec))
        co_return p;
    }

    throw steam_exception (steam_error::appdata_not_found,
                           "save data directory of app " + appid +
                           " (" + d + ") not found");
  }

  // Scan every library for manifest files.
  //
  // We iterate over the directory entries looking for files matching the
  // appmanifest_*.acf pattern. Files are visited in name order so that the
  // result doesn't depend on the directory enumeration order.
  //
  asio::awaitable<map<string, string>> steam_library_manager::
  installed_games ()
  {
    map<string, string> r;
    vector<steam_library> libs (co_await load_libraries ());

    for (const steam_library& lib: libs)
    {
      fs::path apps_dir (lib.path / "steamapps");

      error_code ec;
      if (!fs::is_directory (apps_dir, ec))
        continue;

      vector<fs::path> files;

      for (fs::directory_iterator i (apps_dir, ec), e; i != e; i.increment (ec))
      {
        if (ec)
          break;

        error_code fec;
        if (!i->is_regular_file (fec))
          continue;

        string n (i->path ().filename ().string ());

        if (n.starts_with ("appmanifest_") && n.ends_with (".acf"))
          files.push_back (i->path ());
      }

      if (ec)
        throw steam_exception (steam_error::file_unreadable,
                               "unable to list " + apps_dir.string () +
                               ": " + ec.message ());

      sort (files.begin (), files.end ());

      for (const fs::path& f: files)
      {
        acf_node t (co_await load_document (f));
        acf_result<steam_app_manifest> m (app_manifest (t));

        if (!m)
          throw steam_exception (
            to_steam_error (m.error (), steam_error::app_not_found),
            f.string () + ": " + m.failure ().description (),
            m.failure ());

        // Without a name there is nothing to look the app up by.
        //
        if (m->name.empty () || m->appid.empty ())
          continue;

        r[m->name] = m->appid;
      }
    }

    co_return r;
  }

  asio::awaitable<string> steam_library_manager::
  find_appid_by_name (const string& name)
  {
    map<string, string> games (co_await installed_games ());

    auto i (games.find (name));
    if (i == games.end ())
      throw steam_exception (steam_error::app_not_found,
                             "no game named '" + name +
                             "' in the Steam libraries");

    co_return i->second;
  }

  asio::awaitable<string> steam_library_manager::
  login_user_field (const string& key)
  {
    steam_config_paths paths (co_await get_config_paths ());
    acf_node t (co_await load_document (paths.loginusers_vdf));

    acf_result<string> r (steamloc::login_user_field (t, key));

    if (!r)
      throw steam_exception (
        to_steam_error (r.error (), steam_error::user_not_found),
        "loginusers.vdf: " + r.failure ().description (),
        r.failure ());

    co_return *r;
  }

  asio::awaitable<string> steam_library_manager::
  persona_name ()
  {
    co_return co_await login_user_field ("PersonaName");
  }

  asio::awaitable<string> steam_library_manager::
  account_name ()
  {
    co_return co_await login_user_field ("AccountName");
  }

  bool steam_library_manager::
  validate_library_path (const fs::path& p)
  {
    error_code ec;

    if (!fs::is_directory (p, ec))
      return false;

    // A valid Steam library must contain a 'steamapps' subdirectory.
    //
    return fs::is_directory (p / "steamapps", ec);
  }
}
