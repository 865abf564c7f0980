#include <steamloc/steam/steam-library.hxx>
#include <steamloc/steam/steam-types.hxx>
#include <steamloc/steam/steam.hxx>

#include <cassert>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <fstream>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>

using namespace std;
using namespace steamloc;

namespace fs = std::filesystem;

// Drive the coroutine to completion and hand back its result, rethrowing
// whatever it threw.
//
template <typename T>
static T
run (asio::io_context& ioc, asio::awaitable<T> a)
{
  optional<T> r;
  exception_ptr ep;

  asio::co_spawn (ioc,
                  move (a),
                  [&r, &ep] (exception_ptr e, T v)
                  {
                    if (e)
                      ep = e;
                    else
                      r = move (v);
                  });

  ioc.restart ();
  ioc.run ();

  if (ep)
    rethrow_exception (ep);

  return move (*r);
}

// Run and expect a steam_exception with the specified code.
//
template <typename T>
static void
run_fail (asio::io_context& ioc, asio::awaitable<T> a, steam_error c)
{
  bool thrown (false);

  try
  {
    run (ioc, move (a));
  }
  catch (const steam_exception& e)
  {
    thrown = true;
    assert (e.code () == c);
  }

  assert (thrown);
}

static void
set_env (const char* n, const fs::path& v)
{
#ifdef _WIN32
  _putenv_s (n, v.string ().c_str ());
#else
  setenv (n, v.string ().c_str (), 1);
#endif
}

static void
unset_env (const char* n)
{
#ifdef _WIN32
  _putenv_s (n, "");
#else
  unsetenv (n);
#endif
}

static void
write_file (const fs::path& f, const string& s)
{
  fs::create_directories (f.parent_path ());

  ofstream o (f, ios::binary);
  o << s;
  assert (o);
}

// Scratch Steam installation with two libraries:
//
// <root>                 Noita (881100), SYNTHETIK (528230)
// <root>/Second Library  Dominions 5 (722060)
//
static fs::path root (fs::temp_directory_path () / "steamloc-library-test");
static fs::path second (root / "Second Library");

static string
manifest (const string& id, const string& name, const string& dir)
{
  return "\"AppState\"\n"
         "{\n"
         "\t\"appid\"\t\t\"" + id + "\"\n"
         "\t\"Universe\"\t\t\"1\"\n"
         "\t\"name\"\t\t\"" + name + "\"\n"
         "\t\"StateFlags\"\t\t\"4\"\n"
         "\t\"installdir\"\t\t\"" + dir + "\"\n"
         "\t\"SizeOnDisk\"\t\t\"1024\"\n"
         "\t\"buildid\"\t\t\"42\"\n"
         "}\n";
}

static void
setup ()
{
  fs::remove_all (root);

  write_file (root / "steamapps" / "libraryfolders.vdf",
              "\"libraryfolders\"\n"
              "{\n"
              "\t\"0\"\n"
              "\t{\n"
              "\t\t\"path\"\t\t\"" + root.generic_string () + "\"\n"
              "\t\t\"label\"\t\t\"\"\n"
              "\t\t\"apps\"\n"
              "\t\t{\n"
              "\t\t\t\"881100\"\t\t\"1024\"\n"
              "\t\t\t\"528230\"\t\t\"1024\"\n"
              "\t\t}\n"
              "\t}\n"
              "\t\"1\"\n"
              "\t{\n"
              "\t\t\"path\"\t\t\"" + second.generic_string () + "\"\n"
              "\t\t\"label\"\t\t\"Games Disk\"\n"
              "\t\t\"apps\"\n"
              "\t\t{\n"
              "\t\t\t\"722060\"\t\t\"1024\"\n"
              "\t\t}\n"
              "\t}\n"
              "}\n");

  write_file (root / "steamapps" / "appmanifest_881100.acf",
              manifest ("881100", "Noita", "Noita"));
  write_file (root / "steamapps" / "appmanifest_528230.acf",
              manifest ("528230", "SYNTHETIK", "SYNTHETIK"));
  write_file (second / "steamapps" / "appmanifest_722060.acf",
              manifest ("722060", "Dominions 5", "Dominions5"));

  // Proton prefixes. Noita keeps its saves under a name that differs from
  // its installdir.
  //
  fs::path ad ("pfx/drive_c/users/steamuser/AppData");

  fs::create_directories (
    root / "steamapps" / "compatdata" / "881100" / ad / "LocalLow" /
    "Nolla_Games_Noita");

  fs::create_directories (
    root / "steamapps" / "compatdata" / "528230" / ad / "Local" /
    "SYNTHETIK");

  write_file (root / "config" / "loginusers.vdf",
              "\"users\"\n"
              "{\n"
              "\t\"76561197960265729\"\n"
              "\t{\n"
              "\t\t\"AccountName\"\t\t\"old_account\"\n"
              "\t\t\"PersonaName\"\t\t\"Old\"\n"
              "\t\t\"MostRecent\"\t\t\"0\"\n"
              "\t}\n"
              "\t\"76561197960265730\"\n"
              "\t{\n"
              "\t\t\"AccountName\"\t\t\"gaben\"\n"
              "\t\t\"PersonaName\"\t\t\"Gabe Newell\"\n"
              "\t\t\"MostRecent\"\t\t\"1\"\n"
              "\t}\n"
              "}\n");

  // Keep the host environment out of the appdata lookups.
  //
  unset_env ("LOCALAPPDATA");
  unset_env ("APPDATA");
}

static void
test_validate ()
{
  assert (!steam_library_manager::validate_library_path ("/nonexistent/path"));
  assert (steam_library_manager::validate_library_path (root));
  assert (steam_library_manager::validate_library_path (second));

  // Trailing separators and redundant components.
  //
  assert (steam_library_manager::validate_library_path (root / ""));
  assert (steam_library_manager::validate_library_path (
            root / "steamapps" / ".." / ""));

  // A directory, but not a library.
  //
  assert (!steam_library_manager::validate_library_path (root / "config"));
}

static void
test_detect ()
{
  asio::io_context ioc;

  {
    steam_library_manager m (ioc, root);

    optional<fs::path> p (run (ioc, m.detect_steam_path ()));
    assert (p && *p == root);
    assert (m.cached_steam_path () == p);

    steam_config_paths c (run (ioc, m.get_config_paths ()));
    assert (c.steamapps == root / "steamapps");
    assert (c.libraryfolders_vdf == root / "steamapps" / "libraryfolders.vdf");
    assert (c.loginusers_vdf == root / "config" / "loginusers.vdf");
  }

  // An explicit root that is not a Steam installation is not silently
  // replaced by a detected one.
  //
  {
    steam_library_manager m (ioc, root / "config");

    assert (!run (ioc, m.detect_steam_path ()));
    run_fail (ioc, m.get_config_paths (), steam_error::steam_not_found);
    run_fail (ioc, m.installed_games (), steam_error::steam_not_found);
  }
}

static void
test_libraries ()
{
  asio::io_context ioc;
  steam_library_manager m (ioc, root);

  vector<steam_library> ls (run (ioc, m.load_libraries ()));

  assert (ls.size () == 2);
  assert (ls[0].index == "0");
  assert (ls[0].path == root.lexically_normal ().make_preferred ());
  assert (ls[0].apps.size () == 2);
  assert (ls[1].label == "Games Disk");
  assert (ls[1].path == second.lexically_normal ().make_preferred ());
}

static void
test_paths ()
{
  asio::io_context ioc;
  steam_library_manager m (ioc, root);

  assert (run (ioc, m.game_base_path ("881100")) ==
          root.lexically_normal ().make_preferred ());

  // The library path has a space in it.
  //
  fs::path b (run (ioc, m.game_base_path ("722060")));
  assert (b == second.lexically_normal ().make_preferred ());
  assert (b.filename () == "Second Library");

  fs::path i (run (ioc, m.game_install_path ("722060")));
  assert (i == b / "steamapps" / "common" / "Dominions5");

  steam_app_manifest am (run (ioc, m.load_app_manifest ("881100")));
  assert (am.name == "Noita");
  assert (am.size_on_disk == 1024);
  assert (am.buildid == 42);
  assert (am.fullpath.filename () == "Noita");

  run_fail (ioc, m.game_base_path ("999"), steam_error::app_not_found);
  run_fail (ioc, m.game_install_path ("999"), steam_error::app_not_found);
}

static void
test_appdata ()
{
  asio::io_context ioc;
  steam_library_manager m (ioc, root);

  fs::path ad (root / "steamapps" / "compatdata");

  // Proton Local.
  //
  assert (run (ioc, m.game_appdata_path ("528230")) ==
          ad / "528230" / "pfx" / "drive_c" / "users" / "steamuser" /
          "AppData" / "Local" / "SYNTHETIK");

  // Proton LocalLow, with the directory name overridden.
  //
  assert (run (ioc, m.game_appdata_path ("881100", string ("Nolla_Games_Noita"))) ==
          ad / "881100" / "pfx" / "drive_c" / "users" / "steamuser" /
          "AppData" / "LocalLow" / "Nolla_Games_Noita");

  // With the installdir there is nothing to find.
  //
  run_fail (ioc, m.game_appdata_path ("881100"),
            steam_error::appdata_not_found);

  // Native Windows locations for an app without a prefix.
  //
  fs::path w (root / "win" / "AppData");
  fs::create_directories (w / "Local");
  fs::create_directories (w / "Roaming");

  set_env ("LOCALAPPDATA", w / "Local");
  set_env ("APPDATA", w / "Roaming");

  run_fail (ioc, m.game_appdata_path ("722060"),
            steam_error::appdata_not_found);

  fs::create_directories (w / "LocalLow" / "Dominions5");
  assert (run (ioc, m.game_appdata_path ("722060")) ==
          w / "LocalLow" / "Dominions5");

  fs::create_directories (w / "Roaming" / "Dominions5");
  assert (run (ioc, m.game_appdata_path ("722060")) ==
          w / "Roaming" / "Dominions5");

  fs::create_directories (w / "Local" / "Dominions5");
  assert (run (ioc, m.game_appdata_path ("722060")) ==
          w / "Local" / "Dominions5");

  unset_env ("LOCALAPPDATA");
  unset_env ("APPDATA");

  run_fail (ioc, m.game_appdata_path ("999"), steam_error::app_not_found);
}

static void
test_games ()
{
  asio::io_context ioc;
  steam_library_manager m (ioc, root);

  map<string, string> gs (run (ioc, m.installed_games ()));

  assert (gs.size () == 3);
  assert (gs.at ("Noita") == "881100");
  assert (gs.at ("SYNTHETIK") == "528230");
  assert (gs.at ("Dominions 5") == "722060");

  assert (run (ioc, m.find_appid_by_name ("Dominions 5")) == "722060");
  run_fail (ioc, m.find_appid_by_name ("Half-Life 3"),
            steam_error::app_not_found);

  // Manifests without a name (or App ID) can't be looked up by name and
  // must not clobber each other under an empty key.
  //
  fs::path n1 (second / "steamapps" / "appmanifest_2.acf");
  fs::path n2 (second / "steamapps" / "appmanifest_3.acf");
  write_file (n1, "\"AppState\" { \"appid\" \"2\" }");
  write_file (n2, "\"AppState\" { \"appid\" \"3\" \"installdir\" \"x\" }");

  {
    map<string, string> gs (run (ioc, m.installed_games ()));

    assert (gs.size () == 3);
    assert (gs.find ("") == gs.end ());
  }

  fs::remove (n1);
  fs::remove (n2);

#ifndef _WIN32
  // A steamapps directory we can't list is reported as unreadable rather
  // than escaping as a filesystem error. Root ignores permissions, so only
  // check this if the directory really became unreadable.
  //
  fs::path sa (second / "steamapps");
  fs::permissions (sa, fs::perms::none);

  error_code ec;
  fs::directory_iterator i (sa, ec);

  if (ec)
    run_fail (ioc, m.installed_games (), steam_error::file_unreadable);

  fs::permissions (sa, fs::perms::owner_all);
#endif
}

static void
test_users ()
{
  asio::io_context ioc;
  steam_library_manager m (ioc, root);

  assert (run (ioc, m.persona_name ()) == "Gabe Newell");
  assert (run (ioc, m.account_name ()) == "gaben");
}

static void
test_documents ()
{
  asio::io_context ioc;
  steam_library_manager m (ioc, root);

  run_fail (ioc, m.load_document (root / "missing.vdf"),
            steam_error::file_unreadable);

  // Broken document. The parse failure is kept as the cause.
  //
  fs::path f (root / "broken.vdf");
  write_file (f, "\"key\" \"value\" \"danglingkey\"\n");

  try
  {
    run (ioc, m.load_document (f));
    assert (false);
  }
  catch (const steam_exception& e)
  {
    assert (e.code () == steam_error::document_unusable);
    assert (e.cause ());
    assert (e.cause ()->kind == acf_error::malformed_document);
    assert (e.cause ()->position == 3);
  }

  // A broken manifest in a library is reported, not skipped.
  //
  fs::path bm (second / "steamapps" / "appmanifest_1.acf");
  write_file (bm, "\"AppState\" { \"name\" }");

  run_fail (ioc, m.installed_games (), steam_error::document_unusable);

  fs::remove (bm);

  // Neither is a manifest of the wrong kind.
  //
  write_file (bm, "\"libraryfolders\" { }");
  run_fail (ioc, m.installed_games (), steam_error::schema_mismatch);

  fs::remove (bm);
}

// Free functions that detect Steam themselves. Point HOME at a scratch
// directory so that ~/.steam/steam is the installation they find.
//
static void
test_convenience ()
{
#if !defined(_WIN32) && !defined(__APPLE__)
  fs::path h (root / "home");
  fs::path s (h / ".steam" / "steam");

  write_file (s / "steamapps" / "libraryfolders.vdf",
              "\"libraryfolders\"\n"
              "{\n"
              "\t\"0\"\n"
              "\t{\n"
              "\t\t\"path\"\t\t\"" + s.generic_string () + "\"\n"
              "\t\t\"apps\"\t\t{ \"10\" \"1024\" }\n"
              "\t}\n"
              "}\n");

  write_file (s / "steamapps" / "appmanifest_10.acf",
              manifest ("10", "Counter-Strike", "Half-Life"));

  optional<string> home;
  if (const char* v = getenv ("HOME"))
    home = v;

  set_env ("HOME", h);

  asio::io_context ioc;

  assert (run (ioc, is_steam_installed (ioc)));
  assert (run (ioc, get_steam_path (ioc)) == s);

  // Found.
  //
  optional<fs::path> g (run (ioc, find_steam_game (ioc, "10")));
  assert (g);
  assert (*g == s.lexically_normal ().make_preferred () /
                "steamapps" / "common" / "Half-Life");

  // Not installed is not an error.
  //
  assert (!run (ioc, find_steam_game (ioc, "999")));

  // A broken libraryfolders.vdf is.
  //
  write_file (s / "steamapps" / "libraryfolders.vdf",
              "\"libraryfolders\" { \"0\" {");

  run_fail (ioc, find_steam_game (ioc, "10"), steam_error::document_unusable);

  if (home)
    set_env ("HOME", *home);
  else
    unset_env ("HOME");
#endif
}

int
main ()
{
  setup ();

  test_validate ();
  test_detect ();
  test_libraries ();
  test_paths ();
  test_appdata ();
  test_games ();
  test_users ();
  test_documents ();
  test_convenience ();

  fs::remove_all (root);
}
