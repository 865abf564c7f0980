#pragma once

#include <steamloc/acf/acf-types.hxx>

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <utility>

namespace steamloc
{
  namespace fs = std::filesystem;

  // Steam library folder (one entry of libraryfolders.vdf).
  //
  struct steam_library
  {
    std::string index;                       // Entry key ("0", "1", ...)
    std::string label;                       // Library label/name
    fs::path path;                           // Absolute path to library folder
    std::uint64_t contentid;                 // Content ID
    std::uint64_t totalsize;                 // Total size in bytes
    std::map<std::string, std::string> apps; // App ID -> size on disk

    steam_library (): contentid (0), totalsize (0) {}

    steam_library (std::string i, fs::path p)
        : index (std::move (i)), path (std::move (p)),
          contentid (0), totalsize (0) {}
  };

  // Steam app manifest (appmanifest_<appid>.acf).
  //
  struct steam_app_manifest
  {
    std::string appid;                           // Application ID
    std::string name;                            // Application name
    std::string installdir;                      // Installation directory name
    fs::path fullpath;                           // Full installation path
    std::uint64_t size_on_disk;                  // Size on disk in bytes
    std::uint32_t buildid;                       // Build ID
    std::string last_updated;                    // Last update timestamp
    std::map<std::string, std::string> metadata; // All leaf fields

    steam_app_manifest (): size_on_disk (0), buildid (0) {}
  };

  // Steam configuration paths.
  //
  struct steam_config_paths
  {
    fs::path steam_root;         // Main Steam installation directory
    fs::path steamapps;          // steamapps directory
    fs::path libraryfolders_vdf; // libraryfolders.vdf location
    fs::path loginusers_vdf;     // loginusers.vdf location
  };

  // Root keys of the documents we know about.
  //
  namespace steam_root_key
  {
    inline constexpr const char libraryfolders[] = "libraryfolders";
    inline constexpr const char app_state[] = "AppState";
    inline constexpr const char users[] = "users";
  }

  // Error codes for Steam operations.
  //
  enum class steam_error
  {
    steam_not_found,
    file_unreadable,
    document_unusable,
    schema_mismatch,
    app_not_found,
    appdata_not_found,
    user_not_found
  };

  std::string
  to_string (steam_error);

  inline std::ostream&
  operator<< (std::ostream& os, steam_error e)
  {
    return os << to_string (e);
  }

  // Exception thrown by the Steam library manager.
  //
  class steam_exception: public std::runtime_error
  {
  public:
    steam_exception (steam_error c, const std::string& what)
      : std::runtime_error (what), code_ (c) {}

    steam_exception (steam_error c,
                     const std::string& what,
                     acf_failure cause)
      : std::runtime_error (what), code_ (c), cause_ (std::move (cause)) {}

    steam_error
    code () const noexcept
    {
      return code_;
    }

    // The underlying parse or lookup failure, if any.
    //
    const std::optional<acf_failure>&
    cause () const noexcept
    {
      return cause_;
    }

  private:
    steam_error code_;
    std::optional<acf_failure> cause_;
  };

  // Map an accessor failure to the Steam error it represents.
  //
  steam_error
  to_steam_error (acf_error, steam_error not_found);
}
