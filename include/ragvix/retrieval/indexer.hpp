#pragma once

#include "ragvix/common/result.hpp"
#include "ragvix/corpus/chunk_corpus.hpp"
#include "ragvix/embedding/service.hpp"
#include "ragvix/index/vector_index.hpp"

#include <memory>
#include <vector>

namespace ragvix::retrieval {

/// Embeds chunk texts in corpus order and tags each vector with the embedder's model id.
[[nodiscard]] common::Result<std::vector<index::EmbeddedChunk>>
embed_chunks(embedding::Embedder &embedder, const std::vector<corpus::Chunk> &chunks);

[[nodiscard]] common::Result<std::unique_ptr<index::VectorIndex>>
build_index(embedding::Embedder &embedder, const index::IndexOptions &options,
            const corpus::ChunkCorpus &corpus);

/// Embeds only the chunks the index does not hold yet; the rest go through the index's
/// duplicate policy untouched.
[[nodiscard]] common::Result<index::MutationSummary>
add_to_index(embedding::Embedder &embedder, index::VectorIndex &index,
             const corpus::ChunkCorpus &corpus);

} // namespace ragvix::retrieval
