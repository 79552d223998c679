#include "ragvix/retrieval/indexer.hpp"

namespace ragvix::retrieval {

common::Result<std::vector<index::EmbeddedChunk>>
embed_chunks(embedding::Embedder &embedder, const std::vector<corpus::Chunk> &chunks) {
  using R = common::Result<std::vector<index::EmbeddedChunk>>;
  std::vector<std::string> texts;
  texts.reserve(chunks.size());
  for (const auto &chunk : chunks) {
    texts.push_back(chunk.text);
  }

  auto vectors = embedder.embed(texts);
  if (!vectors.ok()) {
    return R::failure(vectors.status());
  }

  std::vector<index::EmbeddedChunk> out;
  out.reserve(chunks.size());
  for (std::size_t i = 0; i < chunks.size(); ++i) {
    out.push_back(index::EmbeddedChunk{.chunk = chunks[i],
                                       .vector = std::move(vectors.value()[i]),
                                       .model_id = embedder.model_id()});
  }
  return R::success(std::move(out));
}

common::Result<std::unique_ptr<index::VectorIndex>>
build_index(embedding::Embedder &embedder, const index::IndexOptions &options,
            const corpus::ChunkCorpus &corpus) {
  auto embedded = embed_chunks(embedder, corpus.chunks);
  if (!embedded.ok()) {
    return common::Result<std::unique_ptr<index::VectorIndex>>::failure(embedded.status());
  }
  return index::VectorIndex::build(options, std::move(embedded.value()), corpus.documents);
}

common::Result<index::MutationSummary> add_to_index(embedding::Embedder &embedder,
                                                    index::VectorIndex &index,
                                                    const corpus::ChunkCorpus &corpus) {
  // Already-indexed ids still reach add() so the duplicate policy decides, but their text
  // is not embedded again.
  std::vector<corpus::Chunk> fresh;
  std::vector<index::EmbeddedChunk> known;
  for (const auto &chunk : corpus.chunks) {
    if (index.contains(chunk.chunk_id)) {
      known.push_back(index::EmbeddedChunk{.chunk = chunk,
                                           .vector = std::vector<float>(index.dimension(), 0.0F),
                                           .model_id = embedder.model_id()});
    } else {
      fresh.push_back(chunk);
    }
  }

  auto embedded = embed_chunks(embedder, fresh);
  if (!embedded.ok()) {
    return common::Result<index::MutationSummary>::failure(embedded.status());
  }
  auto batch = std::move(embedded.value());
  batch.insert(batch.end(), std::make_move_iterator(known.begin()),
               std::make_move_iterator(known.end()));
  return index.add(std::move(batch), corpus.documents);
}

} // namespace ragvix::retrieval
