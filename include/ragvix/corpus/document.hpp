#pragma once

#include "ragvix/common/result.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace ragvix::corpus {

/// Source metadata carried from ingestion through to search results.
struct DocumentInfo {
  std::string title;
  std::vector<std::string> authors;
  std::string category;
  /// ISO-8601 date or timestamp; compared lexicographically.
  std::string published;

  [[nodiscard]] bool empty() const {
    return title.empty() && authors.empty() && category.empty() && published.empty();
  }
};

struct Document {
  std::string id;
  std::string text;
  DocumentInfo info;
};

/// A contiguous window of one document's text. Offsets are in chunking units
/// (code points or whitespace tokens), `end_offset` exclusive.
struct Chunk {
  std::string chunk_id;
  std::string document_id;
  std::string text;
  std::uint64_t start_offset = 0;
  std::uint64_t end_offset = 0;
  std::uint64_t sequence_index = 0;
};

/// Parses one upstream document record. Accepts `id` or `arxiv_id`, `text` or `abstract`,
/// and `category` or the first entry of `categories`.
[[nodiscard]] common::Result<Document> parse_document_record(const std::string &line);

/// Reads newline-delimited document records. Records without an id or text are skipped.
[[nodiscard]] common::Result<std::vector<Document>>
read_documents(const std::filesystem::path &path);

} // namespace ragvix::corpus
