#include "store/disk_storage.hpp"
#include <atomic>
#include <fstream>
#include <system_error>
#include <sstream>
#include <thread>
#include <boost/log/trivial.hpp>
#include "content/manifest.hpp"
#include "crypto/hash.hpp"

namespace dsb {
namespace store {

namespace {

const char* const CHUNK_AREA = "chunks";
const char* const MANIFEST_AREA = "manifests";

// Unique suffix for temporary files written concurrently by this process
std::string temp_suffix() {
  static std::atomic<uint64_t> counter{0};
  std::stringstream ss;
  ss << ".tmp." << std::this_thread::get_id() << "." << counter.fetch_add(1);
  return ss.str();
}

} // namespace

//==============================================
// CONSTRUCTOR
//==============================================

// Initialize store with base directory path and ensure it exists
DiskStorage::DiskStorage(const std::filesystem::path& base_path) : base_path_(base_path) {
  BOOST_LOG_TRIVIAL(info) << "Disk storage: Initializing with base path: " << base_path_.string();
  try {
    check_directory_exists(base_path_ / CHUNK_AREA);
    check_directory_exists(base_path_ / MANIFEST_AREA);
  }
  catch (const std::filesystem::filesystem_error& e) {
    BOOST_LOG_TRIVIAL(error) << "Disk storage: Failed to create store directories: " << e.what();
    throw Error::wrap_current(ErrorKind::IO, "Disk storage: Failed to create store directories",
                              base_path_.string());
  }
  BOOST_LOG_TRIVIAL(debug) << "Disk storage: Store directory created/verified at: " << base_path_.string();
}

//==============================================
// CORE STORAGE OPERATIONS
//==============================================

void DiskStorage::store_chunk(const content::Chunk& chunk) {
  validate_id(chunk.id);
  BOOST_LOG_TRIVIAL(debug) << "Disk storage: Storing chunk " << chunk.id << " (" << chunk.data.size() << " bytes)";
  write_file(get_path_for_id(CHUNK_AREA, chunk.id), chunk.data);
}

content::Chunk DiskStorage::get_chunk(const Cid& id) const {
  validate_id(id);
  BOOST_LOG_TRIVIAL(debug) << "Disk storage: Retrieving chunk " << id;

  content::Chunk chunk;
  chunk.id = id;
  chunk.data = read_file(get_path_for_id(CHUNK_AREA, id), id);
  chunk.size = chunk.data.size();
  return chunk;
}

void DiskStorage::store_manifest(const content::Manifest& manifest) {
  validate_id(manifest.id);
  BOOST_LOG_TRIVIAL(debug) << "Disk storage: Storing manifest " << manifest.id;
  write_file(get_path_for_id(MANIFEST_AREA, manifest.id), content::encode_manifest(manifest));
}

content::Manifest DiskStorage::get_manifest(const content::ManifestId& id) const {
  validate_id(id);
  BOOST_LOG_TRIVIAL(debug) << "Disk storage: Retrieving manifest " << id;

  content::Manifest manifest = content::decode_manifest(read_file(get_path_for_id(MANIFEST_AREA, id), id));
  if (manifest.id != id) {
    BOOST_LOG_TRIVIAL(error) << "Disk storage: Manifest record under " << id << " names " << manifest.id;
    throw Error(ErrorKind::INCONSISTENT_MANIFEST, "Disk storage: Manifest record stored under wrong key", id);
  }
  return manifest;
}

//==============================================
// QUERY OPERATIONS
//==============================================

bool DiskStorage::has_chunk(const Cid& id) const {
  if (!crypto::is_cid(id)) {
    return false;
  }
  return file_exists(get_path_for_id(CHUNK_AREA, id), id);
}

bool DiskStorage::has_manifest(const content::ManifestId& id) const {
  if (!crypto::is_cid(id)) {
    return false;
  }
  return file_exists(get_path_for_id(MANIFEST_AREA, id), id);
}

bool DiskStorage::file_exists(const std::filesystem::path& path, const std::string& key) const {
  std::error_code ec;
  const bool found = std::filesystem::exists(path, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Disk storage: Cannot access " << path.string() << ": " << ec.message();
    throw Error(ErrorKind::IO, "Disk storage: Cannot access " + path.string() + ": " + ec.message(), key);
  }
  return found;
}

void DiskStorage::clear() {
  BOOST_LOG_TRIVIAL(info) << "Disk storage: Clearing entire store at: " << base_path_.string();
  try {
    std::filesystem::remove_all(base_path_);
    check_directory_exists(base_path_ / CHUNK_AREA);
    check_directory_exists(base_path_ / MANIFEST_AREA);
  }
  catch (const std::filesystem::filesystem_error& e) {
    BOOST_LOG_TRIVIAL(error) << "Disk storage: Failed to clear store: " << e.what();
    throw Error::wrap_current(ErrorKind::IO, "Disk storage: Failed to clear store", base_path_.string());
  }
  BOOST_LOG_TRIVIAL(info) << "Disk storage: Store cleared successfully";
}

//==============================================
// CAS STORAGE SUPPORT
//==============================================

std::filesystem::path DiskStorage::get_path_for_id(const std::string& area, const std::string& id) const {
  std::filesystem::path path = base_path_ / area;

  for (size_t i = 0; i < 6; i += 2) {
    path /= id.substr(i, 2);
  }

  path /= id.substr(6);
  return path;
}

void DiskStorage::validate_id(const std::string& id) {
  if (!crypto::is_cid(id)) {
    BOOST_LOG_TRIVIAL(error) << "Disk storage: Rejecting malformed id: '" << id << "'";
    throw Error(ErrorKind::INVALID_ARGUMENT, "Disk storage: Malformed content identifier", id);
  }
}

//==============================================
// FILE OPERATIONS
//==============================================

void DiskStorage::write_file(const std::filesystem::path& path, const Bytes& data) const {
  std::filesystem::path temp_path = path;
  temp_path += temp_suffix();

  try {
    check_directory_exists(path.parent_path());

    // Open output file in binary mode for cross-platform consistency
    {
      std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
      if (!file) {
        throw Error(ErrorKind::IO, "Disk storage: Failed to create file: " + temp_path.string());
      }
      if (!data.empty()) {
        file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
      }
      file.flush();
      if (!file) {
        throw Error(ErrorKind::IO, "Disk storage: Failed to write file: " + temp_path.string());
      }
    }

    // Atomic on POSIX: readers see either the old complete file or the new one
    std::filesystem::rename(temp_path, path);
  }
  catch (const std::filesystem::filesystem_error& e) {
    BOOST_LOG_TRIVIAL(error) << "Disk storage: Filesystem error writing " << path.string() << ": " << e.what();
    std::error_code ignored;
    std::filesystem::remove(temp_path, ignored);
    throw Error::wrap_current(ErrorKind::IO, "Disk storage: Failed to store " + path.filename().string());
  }
  catch (const Error&) {
    std::error_code ignored;
    std::filesystem::remove(temp_path, ignored);
    throw;
  }

  BOOST_LOG_TRIVIAL(trace) << "Disk storage: Wrote " << data.size() << " bytes to " << path.string();
}

Bytes DiskStorage::read_file(const std::filesystem::path& path, const std::string& key) const {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    if (ec) {
      BOOST_LOG_TRIVIAL(error) << "Disk storage: Cannot access " << path.string() << ": " << ec.message();
      throw Error(ErrorKind::IO, "Disk storage: Cannot access " + path.string() + ": " + ec.message(), key);
    }
    BOOST_LOG_TRIVIAL(debug) << "Disk storage: File not found: " << path.string();
    throw Error(ErrorKind::NOT_FOUND, "Disk storage: " + key + " not found", key);
  }

  // Open file in binary mode to handle all file types correctly
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    throw Error(ErrorKind::IO, "Disk storage: Failed to open file: " + path.string(), key);
  }

  Bytes data;
  char buffer[4096];

  // Read file in chunks to handle large files efficiently
  while (file.read(buffer, sizeof(buffer))) {
    data.insert(data.end(), buffer, buffer + file.gcount());
  }

  // Handle final partial chunk if any
  if (file.gcount() > 0) {
    data.insert(data.end(), buffer, buffer + file.gcount());
  }

  if (file.bad()) {
    throw Error(ErrorKind::IO, "Disk storage: Failed to read file: " + path.string(), key);
  }

  BOOST_LOG_TRIVIAL(trace) << "Disk storage: Read " << data.size() << " bytes from " << path.string();
  return data;
}

void DiskStorage::check_directory_exists(const std::filesystem::path& path) const {
  if (!std::filesystem::exists(path)) {
    std::filesystem::create_directories(path);
  }
}

} // namespace store
} // namespace dsb
