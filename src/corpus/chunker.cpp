#include "ragvix/corpus/chunker.hpp"

#include "ragvix/common/fs.hpp"
#include "ragvix/observability/global.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <utility>

namespace ragvix::corpus {

namespace {

using Span = std::pair<std::size_t, std::size_t>; // byte range [first, second)

std::size_t utf8_sequence_length(const unsigned char lead) {
  if (lead < 0x80) {
    return 1;
  }
  if ((lead & 0xE0) == 0xC0) {
    return 2;
  }
  if ((lead & 0xF0) == 0xE0) {
    return 3;
  }
  if ((lead & 0xF8) == 0xF0) {
    return 4;
  }
  // Stray continuation or invalid lead byte counts as one unit.
  return 1;
}

std::vector<Span> code_point_spans(const std::string &text) {
  std::vector<Span> spans;
  spans.reserve(text.size());
  std::size_t pos = 0;
  while (pos < text.size()) {
    const std::size_t length =
        std::min(utf8_sequence_length(static_cast<unsigned char>(text[pos])), text.size() - pos);
    spans.emplace_back(pos, pos + length);
    pos += length;
  }
  return spans;
}

std::vector<Span> token_spans(const std::string &text) {
  std::vector<Span> spans;
  std::size_t pos = 0;
  while (pos < text.size()) {
    while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])) != 0) {
      ++pos;
    }
    if (pos >= text.size()) {
      break;
    }
    const std::size_t start = pos;
    while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])) == 0) {
      ++pos;
    }
    spans.emplace_back(start, pos);
  }
  return spans;
}

} // namespace

common::Result<ChunkUnit> parse_chunk_unit(const std::string &value) {
  const std::string normalized = common::to_lower(common::trim(value));
  if (normalized == "chars" || normalized == "characters") {
    return common::Result<ChunkUnit>::success(ChunkUnit::Chars);
  }
  if (normalized == "tokens") {
    return common::Result<ChunkUnit>::success(ChunkUnit::Tokens);
  }
  return common::Result<ChunkUnit>::failure(common::ErrorCode::InvalidConfiguration,
                                            "unknown chunking unit: " + value);
}

std::string_view chunk_unit_name(const ChunkUnit unit) {
  return unit == ChunkUnit::Tokens ? "tokens" : "chars";
}

std::string truncate_code_points(const std::string &text, const std::size_t max_code_points) {
  std::size_t pos = 0;
  for (std::size_t count = 0; count < max_code_points && pos < text.size(); ++count) {
    pos += std::min(utf8_sequence_length(static_cast<unsigned char>(text[pos])), text.size() - pos);
  }
  return text.substr(0, pos);
}

common::Status validate_chunking(const ChunkingOptions &options) {
  if (options.window_size == 0) {
    return common::Status::error(common::ErrorCode::InvalidConfiguration,
                                 "window_size must be > 0");
  }
  if (options.overlap >= options.window_size) {
    return common::Status::error(common::ErrorCode::InvalidConfiguration,
                                 "overlap (" + std::to_string(options.overlap) +
                                     ") must be smaller than window_size (" +
                                     std::to_string(options.window_size) + ")");
  }
  return common::Status::success();
}

std::string make_chunk_id(const std::string &document_id, const std::size_t sequence_index) {
  std::ostringstream stream;
  stream << document_id << '#' << std::setw(5) << std::setfill('0') << sequence_index;
  return stream.str();
}

common::Result<std::vector<Chunk>> chunk_document(const Document &document,
                                                  const ChunkingOptions &options) {
  if (const auto status = validate_chunking(options); !status.ok()) {
    return common::Result<std::vector<Chunk>>::failure(status);
  }

  const std::vector<Span> units = options.unit == ChunkUnit::Tokens
                                      ? token_spans(document.text)
                                      : code_point_spans(document.text);
  const std::size_t length = units.size();
  const std::size_t step = options.window_size - options.overlap;

  std::vector<Chunk> chunks;
  if (length > 0) {
    chunks.reserve((length + step - 1) / step);
  }

  std::size_t cursor = 0;
  while (cursor < length) {
    const std::size_t end = std::min(cursor + options.window_size, length);
    const std::size_t byte_begin = units[cursor].first;
    const std::size_t byte_end = units[end - 1].second;

    Chunk chunk;
    chunk.sequence_index = chunks.size();
    chunk.chunk_id = make_chunk_id(document.id, chunks.size());
    chunk.document_id = document.id;
    chunk.text = document.text.substr(byte_begin, byte_end - byte_begin);
    chunk.start_offset = cursor;
    chunk.end_offset = end;
    chunks.push_back(std::move(chunk));

    if (end == length) {
      break;
    }
    cursor += step;
  }

  observability::record_chunking(document.id, chunks.size());
  return common::Result<std::vector<Chunk>>::success(std::move(chunks));
}

common::Result<std::vector<Chunk>> chunk_documents(const std::vector<Document> &documents,
                                                   const ChunkingOptions &options) {
  std::vector<Chunk> all;
  for (const auto &document : documents) {
    auto chunks = chunk_document(document, options);
    if (!chunks.ok()) {
      return chunks;
    }
    all.insert(all.end(), std::make_move_iterator(chunks.value().begin()),
               std::make_move_iterator(chunks.value().end()));
  }
  return common::Result<std::vector<Chunk>>::success(std::move(all));
}

} // namespace ragvix::corpus
