#include "internal/upload/chunking.hpp"

#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using twiper::upload::SplitIntoChunks;

std::shared_ptr<arrow::Buffer> Payload(std::size_t size) {
  std::string bytes(size, '\0');
  for (std::size_t i = 0; i < size; ++i) bytes[i] = static_cast<char>(i * 31 + 7);
  return arrow::Buffer::FromString(std::move(bytes));
}

void TestChunksReassembleToPayload() {
  auto payload = Payload(10'000);
  auto chunks  = SplitIntoChunks(payload, 4'096);

  assert(chunks.size() == 3);
  assert(chunks[0]->size() == 4'096);
  assert(chunks[1]->size() == 4'096);
  assert(chunks[2]->size() == 10'000 - 2 * 4'096);

  std::string joined;
  for (const auto& chunk : chunks) joined += chunk->ToString();
  assert(joined == payload->ToString());
}

void TestChunksAreZeroCopySlices() {
  auto payload = Payload(100);
  auto chunks  = SplitIntoChunks(payload, 40);
  assert(chunks[1]->data() == payload->data() + 40);
}

void TestExactMultipleHasNoEmptyTail() {
  auto chunks = SplitIntoChunks(Payload(8), 4);
  assert(chunks.size() == 2);
  assert(chunks[1]->size() == 4);
}

void TestSmallPayloadIsSingleChunk() {
  auto chunks = SplitIntoChunks(Payload(3), 1024 * 1024);
  assert(chunks.size() == 1);
  assert(chunks[0]->size() == 3);
}

void TestEmptyPayloadHasNoChunks() {
  assert(SplitIntoChunks(Payload(0), 16).empty());
  assert(SplitIntoChunks(nullptr, 16).empty());
}

void TestZeroChunkSizeIsRejected() {
  bool threw = false;
  try {
    (void)SplitIntoChunks(Payload(4), 0);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestChunksReassembleToPayload();
  TestChunksAreZeroCopySlices();
  TestExactMultipleHasNoEmptyTail();
  TestSmallPayloadIsSingleChunk();
  TestEmptyPayloadHasNoChunks();
  TestZeroChunkSizeIsRejected();

  std::cout << "twiper_unit_chunking: pass\n";
  return 0;
}
