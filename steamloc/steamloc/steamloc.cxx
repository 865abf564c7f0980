#include <exception>
#include <filesystem>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>

#include <steamloc/acf/acf.hxx>
#include <steamloc/steam/steam.hxx>

#include <steamloc/steamloc-options.hxx>
#include <steamloc/version.hxx>

using namespace std;
namespace fs = filesystem;
namespace asio = boost::asio;

namespace steamloc
{
  // Count the commands requested on the command line.
  //
  static size_t
  command_count (const options& o)
  {
    return (o.libraries () ? 1 : 0)              +
           (o.list () ? 1 : 0)                   +
           (o.appid_specified () ? 1 : 0)        +
           (o.base_path_specified () ? 1 : 0)    +
           (o.install_path_specified () ? 1 : 0) +
           (o.appdata_path_specified () ? 1 : 0) +
           (o.persona_name () ? 1 : 0)           +
           (o.account_name () ? 1 : 0)           +
           (o.dump_specified () ? 1 : 0);
  }

  static asio::awaitable<int>
  run (asio::io_context& ioc, const options& o)
  {
    optional<fs::path> root;
    if (o.steam_specified ())
      root = fs::path (o.steam ());

    steam_library_manager m (ioc, move (root));
    ostream& out (cout);

    // Dumping a file doesn't need Steam at all.
    //
    if (o.dump_specified ())
    {
      acf_node t (co_await m.load_document (o.dump ()));
      dump_paths (out, t);
      co_return 0;
    }

    if (o.libraries ())
    {
      vector<steam_library> ls (co_await m.load_libraries ());

      for (const steam_library& l: ls)
      {
        out << l.index << '\t' << l.path.string ();

        if (!l.label.empty ())
          out << " (" << l.label << ')';

        out << '\t' << l.apps.size () << " apps" << '\n';
      }

      co_return 0;
    }

    if (o.appid_specified ())
    {
      out << co_await m.find_appid_by_name (o.appid ()) << '\n';
      co_return 0;
    }

    if (o.base_path_specified ())
    {
      out << (co_await m.game_base_path (o.base_path ())).string () << '\n';
      co_return 0;
    }

    if (o.install_path_specified ())
    {
      out << (co_await m.game_install_path (o.install_path ())).string ()
          << '\n';
      co_return 0;
    }

    if (o.appdata_path_specified ())
    {
      optional<string> d;
      if (o.install_dir_specified ())
        d = o.install_dir ();

      out << (co_await m.game_appdata_path (o.appdata_path (), d)).string ()
          << '\n';
      co_return 0;
    }

    if (o.persona_name ())
    {
      out << co_await m.persona_name () << '\n';
      co_return 0;
    }

    if (o.account_name ())
    {
      out << co_await m.account_name () << '\n';
      co_return 0;
    }

    // Default: --list.
    //
    map<string, string> gs (co_await m.installed_games ());

    for (const auto& [name, id]: gs)
      out << id << '\t' << name << '\n';

    co_return 0;
  }
}

int
main (int argc, char* argv[])
{
  using namespace std;
  using namespace steamloc;

  try
  {
    options opt (argc, argv);

    // Handle --version.
    //
    if (opt.version ())
    {
      cout << STEAMLOC_VERSION_STR << "\n";
      return 0;
    }

    // Handle --help.
    //
    if (opt.help ())
    {
      auto& o (cout);

      o << "usage: steamloc [options]" << "\n"
        << "options:"                  << "\n";

      opt.print_usage (o);

      return 0;
    }

    if (command_count (opt) > 1)
    {
      cerr << "error: more than one command specified" << "\n"
           << "  info: run 'steamloc --help' for more information" << endl;
      return 1;
    }

    if (opt.install_dir_specified () && !opt.appdata_path_specified ())
      cerr << "warning: --install-dir is ignored without --appdata-path"
           << endl;

    asio::io_context ioc;
    int exit_code (0);

    asio::co_spawn (
      ioc,
      run (ioc, opt),
      [&exit_code] (exception_ptr ex, int r)
      {
        exit_code = r;
        if (ex)
        {
          try { rethrow_exception (ex); }
          catch (const exception& e)
          {
            cerr << "error: " << e.what () << "\n";
            exit_code = 1;
          }
        }
      });

    ioc.run ();
    return exit_code;
  }
  catch (const cli::exception& ex)
  {
    cerr << "error: " << ex.what () << "\n";
    return 1;
  }
  catch (const exception& ex)
  {
    cerr << "error: " << ex.what () << "\n";
    return 1;
  }
}
