#include "bench_common.hpp"

#include "ragvix/corpus/chunker.hpp"
#include "ragvix/index/vector_index.hpp"

#include <filesystem>
#include <random>
#include <thread>
#include <vector>

namespace {

constexpr std::size_t kDimension = 384;
constexpr std::size_t kChunks = 10000;

std::vector<float> random_vector(std::mt19937 &rng) {
  std::normal_distribution<float> dist(0.0F, 1.0F);
  std::vector<float> vector(kDimension);
  for (auto &value : vector) {
    value = dist(rng);
  }
  return vector;
}

std::vector<ragvix::index::EmbeddedChunk> random_chunks(std::mt19937 &rng, std::size_t count) {
  std::vector<ragvix::index::EmbeddedChunk> chunks;
  chunks.reserve(count);
  for (std::size_t i = 0; i < count; ++i) {
    ragvix::index::EmbeddedChunk entry;
    entry.chunk.document_id = "paper-" + std::to_string(i / 20);
    entry.chunk.sequence_index = i % 20;
    entry.chunk.chunk_id =
        ragvix::corpus::make_chunk_id(entry.chunk.document_id, entry.chunk.sequence_index);
    entry.chunk.text = "bench chunk";
    entry.vector = random_vector(rng);
    entry.model_id = "bench-model";
    chunks.push_back(std::move(entry));
  }
  return chunks;
}

} // namespace

void run_index_benchmarks() {
  std::cout << "\n=== Index Benchmarks ===\n";
  std::mt19937 rng(7);
  auto chunks = random_chunks(rng, kChunks);

  std::unique_ptr<ragvix::index::VectorIndex> index;
  ragvix::bench::run_bench("index_build_10k", 3, [&] {
    auto built = ragvix::index::VectorIndex::build(ragvix::index::IndexOptions{}, chunks);
    if (built.ok()) {
      index = std::move(built.value());
    }
  });
  if (index == nullptr) {
    std::cout << "index build failed\n";
    return;
  }

  const auto query = random_vector(rng);
  ragvix::bench::run_bench("index_search_10k_k10", 200, [&] { (void)index->search(query, 10); });

  ragvix::bench::run_bench("index_search_concurrent_4x50", 5, [&] {
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
      threads.emplace_back([&] {
        for (int i = 0; i < 50; ++i) {
          (void)index->search(query, 10);
        }
      });
    }
    for (auto &thread : threads) {
      thread.join();
    }
  });

  const auto location = std::filesystem::temp_directory_path() / "ragvix-index-bench";
  ragvix::bench::run_bench("index_save_10k", 3, [&] { (void)index->save(location); });
  ragvix::bench::run_bench("index_load_10k", 3,
                           [&] { (void)ragvix::index::VectorIndex::load(location); });
  std::error_code ec;
  std::filesystem::remove_all(location, ec);
}
