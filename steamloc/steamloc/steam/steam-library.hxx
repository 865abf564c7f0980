#pragma once

#include <steamloc/acf/acf-node.hxx>

#include <steamloc/steam/steam-types.hxx>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace steamloc
{
  namespace asio = boost::asio;

  class steam_library_manager
  {
  public:
    // Constructor.
    //
    // If steam_root is specified, it is used instead of detecting the
    // installation.
    //
    explicit
    steam_library_manager (asio::io_context& ioc,
                           std::optional<fs::path> steam_root = std::nullopt);

    steam_library_manager (const steam_library_manager&) = delete;
    steam_library_manager& operator= (const steam_library_manager&) = delete;

    // Detect Steam installation path for the current platform.
    //
    // Returns the main Steam installation directory, or std::nullopt if
    // Steam is not installed or cannot be found.
    //
    asio::awaitable<std::optional<fs::path>>
    detect_steam_path ();

    // Get Steam configuration paths.
    //
    // Throws steam_exception (steam_not_found) if there is no Steam
    // installation.
    //
    asio::awaitable<steam_config_paths>
    get_config_paths ();

    // Read and parse an ACF/VDF file.
    //
    // Throws steam_exception with file_unreadable if the file cannot be read
    // and document_unusable if it does not parse.
    //
    asio::awaitable<acf_node>
    load_document (const fs::path& file);

    // Parsed libraryfolders.vdf (cached).
    //
    asio::awaitable<acf_node>
    library_tree ();

    // Load all Steam library folders.
    //
    asio::awaitable<std::vector<steam_library>>
    load_libraries ();

    // Path of the library folder that holds the app.
    //
    asio::awaitable<fs::path>
    game_base_path (const std::string& appid);

    // Load app manifest for a specific App ID, with fullpath resolved.
    //
    asio::awaitable<steam_app_manifest>
    load_app_manifest (const std::string& appid);

    // Installation directory of the app (steamapps/common/<installdir>).
    //
    asio::awaitable<fs::path>
    game_install_path (const std::string& appid);

    // Save-data directory of the app.
    //
    // We first look inside the app's Proton prefix (AppData/Local, then
    // AppData/LocalLow) and then in the native Windows locations given by
    // LOCALAPPDATA and APPDATA. The directory name is the manifest's
    // installdir unless installdir_override is specified, which helps with
    // games whose save directory is named differently.
    //
    // Throws steam_exception (appdata_not_found) if none of them exist.
    //
    asio::awaitable<fs::path>
    game_appdata_path (
      const std::string& appid,
      const std::optional<std::string>& installdir_override = std::nullopt);

    // Get all installed apps across all libraries.
    //
    // Returns a map of app name to App ID built from every
    // appmanifest_*.acf file found. Manifests without a name or App ID are
    // skipped. Throws steam_exception (file_unreadable) if a library's
    // steamapps directory cannot be listed.
    //
    asio::awaitable<std::map<std::string, std::string>>
    installed_games ();

    // Find the App ID of an installed game by its name.
    //
    asio::awaitable<std::string>
    find_appid_by_name (const std::string& name);

    // Display name of the most recently logged in account.
    //
    asio::awaitable<std::string>
    persona_name ();

    // Login name of the most recently logged in account.
    //
    asio::awaitable<std::string>
    account_name ();

    // Validate that a path is a valid Steam library.
    //
    // Checks if the specified path contains the expected Steam library
    // structure (steamapps directory).
    //
    static bool
    validate_library_path (const fs::path& path);

    // Get the cached Steam installation path.
    //
    std::optional<fs::path>
    cached_steam_path () const
    {
      return steam_path_;
    }

  private:
    // Detect Steam path on Linux.
    //
    std::optional<fs::path>
    detect_steam_path_linux () const;

    // Detect Steam path on Windows.
    //
    std::optional<fs::path>
    detect_steam_path_windows () const;

    // Detect Steam path on macOS.
    //
    std::optional<fs::path>
    detect_steam_path_macos () const;

    // Detected path or throw steam_not_found.
    //
    asio::awaitable<fs::path>
    require_steam_path ();

    asio::awaitable<std::string>
    login_user_field (const std::string& key);

    // IO context reference.
    //
    asio::io_context& ioc_;

    // Explicitly specified Steam root.
    //
    std::optional<fs::path> steam_root_;

    // Cached Steam installation path.
    //
    std::optional<fs::path> steam_path_;

    // Cached libraryfolders.vdf tree.
    //
    std::optional<acf_node> library_tree_;
  };
}
