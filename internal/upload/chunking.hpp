#pragma once

#include <arrow/buffer.h>

#include <cstdint>
#include <memory>
#include <vector>

namespace twiper::upload {

/*
  Splits a payload into consecutive chunks of at most `chunk_size` bytes.

  Chunks are zero-copy slices that keep `payload` alive. Concatenating them
  in order reproduces the payload; only the last chunk may be short.
  Throws std::invalid_argument when chunk_size is 0.
*/
std::vector<std::shared_ptr<arrow::Buffer>> SplitIntoChunks(const std::shared_ptr<arrow::Buffer>& payload, std::uint64_t chunk_size);

} // namespace twiper::upload
