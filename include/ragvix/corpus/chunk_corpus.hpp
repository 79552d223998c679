#pragma once

#include "ragvix/common/result.hpp"
#include "ragvix/corpus/document.hpp"

#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace ragvix::corpus {

/// Chunker output as exchanged with the embedding stage: chunk records plus the metadata
/// of every document they came from.
struct ChunkCorpus {
  std::vector<Chunk> chunks;
  std::map<std::string, DocumentInfo> documents;
};

/// One JSON object per line: chunk_id, document_id, sequence_index, start_offset,
/// end_offset, text, and the document's title/authors/category/published when known.
[[nodiscard]] std::string format_chunk_record(const Chunk &chunk, const DocumentInfo *info);
[[nodiscard]] common::Status parse_chunk_record(const std::string &line, Chunk &chunk,
                                                DocumentInfo &info);

[[nodiscard]] common::Status write_chunk_corpus(const std::filesystem::path &path,
                                                const ChunkCorpus &corpus);
[[nodiscard]] common::Result<ChunkCorpus> read_chunk_corpus(const std::filesystem::path &path);

/// Builds the document metadata map for a set of documents.
[[nodiscard]] std::map<std::string, DocumentInfo>
collect_document_info(const std::vector<Document> &documents);

} // namespace ragvix::corpus
