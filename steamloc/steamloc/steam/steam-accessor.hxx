#pragma once

#include <steamloc/acf/acf-node.hxx>
#include <steamloc/acf/acf-types.hxx>

#include <steamloc/steam/steam-types.hxx>

#include <map>
#include <set>
#include <string>
#include <vector>

namespace steamloc
{
  // Typed queries over parsed Steam documents.
  //
  // Each query first checks that the tree has the root key of the document
  // it expects and fails with schema_mismatch otherwise, so asking for
  // library folders on an app manifest is reported rather than answered with
  // an empty result.
  //

  // Library entry key -> app ids installed in it (libraryfolders.vdf).
  //
  // Entries that are not blocks (e.g. "contentstatsid") are skipped and an
  // entry without "apps" maps to an empty set.
  //
  acf_result<std::map<std::string, std::set<std::string>>>
  installed_app_ids (const acf_node& library_tree);

  // Path of the library that contains app_id (libraryfolders.vdf).
  //
  // Entries are searched in key order and the first match wins. Fails with
  // not_found if no library lists the app.
  //
  acf_result<std::string>
  game_base_path (const acf_node& library_tree, const std::string& app_id);

  // AppState[field] of an app manifest.
  //
  acf_result<std::string>
  manifest_field (const acf_node& manifest_tree, const std::string& field);

  // Field of the most recently logged in user (loginusers.vdf). If no user
  // is marked MostRecent, the first one is used.
  //
  acf_result<std::string>
  login_user_field (const acf_node& loginusers_tree, const std::string& key);

  // All library folders with their metadata.
  //
  acf_result<std::vector<steam_library>>
  library_folders (const acf_node& library_tree);

  // App manifest record. The fullpath member is left empty since it depends
  // on the library the manifest was found in.
  //
  acf_result<steam_app_manifest>
  app_manifest (const acf_node& manifest_tree);
}
