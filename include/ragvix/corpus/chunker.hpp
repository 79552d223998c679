#pragma once

#include "ragvix/common/result.hpp"
#include "ragvix/corpus/document.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace ragvix::corpus {

enum class ChunkUnit {
  Chars,
  Tokens,
};

struct ChunkingOptions {
  std::size_t window_size = 1200;
  std::size_t overlap = 120;
  ChunkUnit unit = ChunkUnit::Chars;
};

[[nodiscard]] common::Result<ChunkUnit> parse_chunk_unit(const std::string &value);
[[nodiscard]] std::string_view chunk_unit_name(ChunkUnit unit);

/// window_size > overlap >= 0 and window_size > 0.
[[nodiscard]] common::Status validate_chunking(const ChunkingOptions &options);

/// "<document_id>#<sequence_index, zero-padded to 5 digits>".
[[nodiscard]] std::string make_chunk_id(const std::string &document_id,
                                        std::size_t sequence_index);

/// Longest prefix of text holding at most max_code_points UTF-8 code points.
[[nodiscard]] std::string truncate_code_points(const std::string &text,
                                               std::size_t max_code_points);

/// Splits a document into overlapping windows advancing by window_size - overlap units.
/// The last window is the first one that reaches the end of the text; an empty document
/// yields no chunks.
[[nodiscard]] common::Result<std::vector<Chunk>> chunk_document(const Document &document,
                                                                const ChunkingOptions &options);

[[nodiscard]] common::Result<std::vector<Chunk>>
chunk_documents(const std::vector<Document> &documents, const ChunkingOptions &options);

} // namespace ragvix::corpus
