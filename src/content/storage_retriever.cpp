#include "content/retriever.hpp"
#include <stdexcept>
#include <utility>
#include <boost/log/trivial.hpp>

namespace dsb {
namespace content {

StorageRetriever::StorageRetriever(std::shared_ptr<const store::Storage> storage)
  : storage_(std::move(storage)) {
  if (!storage_) {
    throw std::invalid_argument("Storage retriever: Storage must not be null");
  }
}

Manifest StorageRetriever::fetch_manifest(const ManifestId& id) {
  try {
    return storage_->get_manifest(id);
  }
  catch (const Error& e) {
    if (e.kind() != ErrorKind::NOT_FOUND) {
      throw;
    }
    BOOST_LOG_TRIVIAL(debug) << "Storage retriever: Manifest " << id << " not in storage";
    throw Error::wrap_current(ErrorKind::MANIFEST_NOT_FOUND, "Storage retriever: Failed to fetch manifest " + id, id);
  }
}

Chunk StorageRetriever::fetch_chunk(const Cid& id) {
  return storage_->get_chunk(id);
}

} // namespace content
} // namespace dsb
