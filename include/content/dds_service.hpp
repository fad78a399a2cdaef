#pragma once

#include <chrono>
#include <memory>
#include "content/content_retriever.hpp"
#include "content/publisher.hpp"
#include "store/storage.hpp"

namespace dsb {
namespace content {

// Front door of the data store: publishes into local storage and retrieves
// local-first. When content is missing locally and a remote retriever is set,
// it is fetched remotely, verified, and cached into local storage.
class DdsService {
public:

  // ---- CONSTRUCTOR ----
  DdsService(Chunker chunker, std::shared_ptr<store::Storage> local_storage,
             std::shared_ptr<Retriever> remote = nullptr,
             std::shared_ptr<utils::WorkerPool> pool = nullptr,
             std::chrono::milliseconds fetch_timeout = std::chrono::milliseconds(0));


  // ---- OPERATIONS ----
  ManifestId publish(const Bytes& data);
  // Throws Error(INVALID_ARGUMENT) for an empty id
  Bytes retrieve(const ManifestId& manifest_id);


  // ---- GETTERS ----
  bool has_remote() const { return remote_ != nullptr; }
  const std::shared_ptr<store::Storage>& storage() const { return storage_; }

private:
  // ---- PARAMETERS ----
  std::shared_ptr<store::Storage> storage_;
  Publisher publisher_;
  ContentRetriever local_;
  std::unique_ptr<ContentRetriever> remote_;


  // ---- REMOTE FALLBACK ----
  Bytes retrieve_remote(const ManifestId& manifest_id);
  void cache_locally(const RetrievedContent& content);
};

} // namespace content
} // namespace dsb
