#include <steamloc/steam/steam.hxx>

using namespace std;

namespace steamloc
{
  asio::awaitable<bool>
  is_steam_installed (asio::io_context& ioc)
  {
    steam_library_manager m (ioc);
    co_return (co_await m.detect_steam_path ()).has_value ();
  }

  asio::awaitable<optional<fs::path>>
  get_steam_path (asio::io_context& ioc)
  {
    steam_library_manager m (ioc);
    co_return co_await m.detect_steam_path ();
  }

  // Only "not there" is mapped to nullopt. A broken libraryfolders.vdf or
  // manifest is still reported.
  //
  asio::awaitable<optional<fs::path>>
  find_steam_game (asio::io_context& ioc, string appid)
  {
    steam_library_manager m (ioc);

    if (!(co_await m.detect_steam_path ()))
      co_return nullopt;

    optional<fs::path> r;

    try
    {
      r = co_await m.game_install_path (appid);
    }
    catch (const steam_exception& e)
    {
      if (e.code () != steam_error::app_not_found)
        throw;
    }

    co_return r;
  }
}
