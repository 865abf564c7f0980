#pragma once

#include <steamloc/steam/steam-types.hxx>
#include <steamloc/steam/steam-accessor.hxx>
#include <steamloc/steam/steam-library.hxx>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>

#include <optional>
#include <string>

namespace steamloc
{
  // Convenience functions for common Steam operations.
  //

  // Quick check if Steam is installed on this system.
  //
  asio::awaitable<bool>
  is_steam_installed (asio::io_context& ioc);

  // Get Steam installation path without creating a manager instance.
  //
  asio::awaitable<std::optional<fs::path>>
  get_steam_path (asio::io_context& ioc);

  // Find the installation directory of a game without creating a manager
  // instance. Returns nullopt if Steam or the game is not installed.
  //
  asio::awaitable<std::optional<fs::path>>
  find_steam_game (asio::io_context& ioc, std::string appid);
}
