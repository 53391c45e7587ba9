#include "chunking.hpp"

#include <algorithm>
#include <stdexcept>

namespace twiper::upload {

std::vector<std::shared_ptr<arrow::Buffer>> SplitIntoChunks(const std::shared_ptr<arrow::Buffer>& payload, std::uint64_t chunk_size) {
  if (chunk_size == 0) {
    throw std::invalid_argument("chunk size must be positive");
  }

  std::vector<std::shared_ptr<arrow::Buffer>> chunks;
  if (!payload) {
    return chunks;
  }

  const auto total = static_cast<std::uint64_t>(payload->size());
  chunks.reserve(static_cast<std::size_t>((total + chunk_size - 1) / chunk_size));
  for (std::uint64_t offset = 0; offset < total; offset += chunk_size) {
    const auto length = std::min(chunk_size, total - offset);
    chunks.push_back(arrow::SliceBuffer(payload, static_cast<int64_t>(offset), static_cast<int64_t>(length)));
  }
  return chunks;
}

} // namespace twiper::upload
