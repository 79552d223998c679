#include "bench_common.hpp"

#include "ragvix/corpus/chunker.hpp"
#include "ragvix/embedding/embedder_local.hpp"

#include <string>
#include <vector>

namespace {

std::string synthetic_paper(std::size_t words) {
  static const char *vocabulary[] = {"graph",   "neural", "retrieval", "transformer", "sparse",
                                     "quantum", "lattice", "protein",  "gradient",    "kernel"};
  std::string text;
  for (std::size_t i = 0; i < words; ++i) {
    if (i > 0) {
      text += ' ';
    }
    text += vocabulary[(i * 7 + i / 3) % 10];
  }
  return text;
}

} // namespace

void run_chunking_benchmark() {
  ragvix::corpus::Document doc;
  doc.id = "bench-paper";
  doc.text = synthetic_paper(20000);

  ragvix::bench::run_bench("chunk_chars_1200_120", 50, [&] {
    (void)ragvix::corpus::chunk_document(doc, ragvix::corpus::ChunkingOptions{});
  });
  ragvix::bench::run_bench("chunk_tokens_256_32", 50, [&] {
    (void)ragvix::corpus::chunk_document(
        doc, ragvix::corpus::ChunkingOptions{
                 .window_size = 256, .overlap = 32, .unit = ragvix::corpus::ChunkUnit::Tokens});
  });
}

void run_embedding_benchmark() {
  ragvix::embedding::HashingEmbedder embedder;
  std::vector<std::string> batch(32, synthetic_paper(200));
  ragvix::bench::run_bench("hash_embed_batch_32", 100, [&] { (void)embedder.embed_batch(batch); });
}
