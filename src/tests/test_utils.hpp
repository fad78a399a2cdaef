#ifndef DSB_TEST_UTILS_HPP
#define DSB_TEST_UTILS_HPP

#include <chrono>
#include <filesystem>
#include <string>
#include <gmock/gmock.h>
#include "content/retriever.hpp"
#include "logger/logger.hpp"
#include "store/storage.hpp"

// Console logging at warning level keeps test output readable
inline void init_logging() {
  dsb::logging::init_console_logging(dsb::logging::severity_level::warning);
}

// Fresh directory under the system temp dir
inline std::filesystem::path make_temp_dir(const std::string& prefix) {
  auto dir = std::filesystem::temp_directory_path() /
    (prefix + "_" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
  std::filesystem::create_directories(dir);
  return dir;
}

class MockStorage : public dsb::store::Storage {
public:
  MOCK_METHOD(void, store_chunk, (const dsb::content::Chunk& chunk), (override));
  MOCK_METHOD(dsb::content::Chunk, get_chunk, (const dsb::Cid& id), (const, override));
  MOCK_METHOD(void, store_manifest, (const dsb::content::Manifest& manifest), (override));
  MOCK_METHOD(dsb::content::Manifest, get_manifest, (const dsb::content::ManifestId& id), (const, override));
};

class MockRetriever : public dsb::content::Retriever {
public:
  MOCK_METHOD(dsb::content::Manifest, fetch_manifest, (const dsb::content::ManifestId& id), (override));
  MOCK_METHOD(dsb::content::Chunk, fetch_chunk, (const dsb::Cid& id), (override));
};

#endif // DSB_TEST_UTILS_HPP
