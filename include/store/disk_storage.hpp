#pragma once

#include <filesystem>
#include <string>
#include "store/storage.hpp"

namespace dsb {
namespace store {

// Filesystem backend in a content-addressed directory layout:
// {base_path}/{chunks|manifests}/{id[0:2]}/{id[2:4]}/{id[4:6]}/{remaining_id}
// Each key is written to a temporary file and renamed into place, so a key is
// either absent or complete; no global lock is held.
class DiskStorage : public Storage {
public:

  // ---- CONSTRUCTOR ----
  explicit DiskStorage(const std::filesystem::path& base_path);


  // ---- CORE STORAGE OPERATIONS ----
  void store_chunk(const content::Chunk& chunk) override;
  content::Chunk get_chunk(const Cid& id) const override;
  void store_manifest(const content::Manifest& manifest) override;
  content::Manifest get_manifest(const content::ManifestId& id) const override;


  // ---- QUERY OPERATIONS ----
  // Throws Error(IO) when the store cannot be inspected
  bool has_chunk(const Cid& id) const;
  bool has_manifest(const content::ManifestId& id) const;
  const std::filesystem::path& base_path() const { return base_path_; }
  // Removes all stored data and resets the store
  void clear();

private:
  // ---- PARAMETERS ----
  std::filesystem::path base_path_;


  // ---- CAS STORAGE SUPPORT ----
  // Creates a directory structure using parts of the id
  std::filesystem::path get_path_for_id(const std::string& area, const std::string& id) const;
  // Throws Error(INVALID_ARGUMENT) unless id is a 64 character hex digest
  static void validate_id(const std::string& id);


  // ---- FILE OPERATIONS ----
  // Throws Error(IO) when the path cannot be inspected
  bool file_exists(const std::filesystem::path& path, const std::string& key) const;
  // Writes to a temporary sibling then renames into place
  void write_file(const std::filesystem::path& path, const Bytes& data) const;
  // Throws Error(NOT_FOUND) for a missing file, Error(IO) for access failures
  Bytes read_file(const std::filesystem::path& path, const std::string& key) const;
  // Ensures directory exists, create if needed
  void check_directory_exists(const std::filesystem::path& path) const;
};

} // namespace store
} // namespace dsb
