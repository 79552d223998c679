#include "ragvix/corpus/chunk_corpus.hpp"

#include "ragvix/common/fs.hpp"
#include "ragvix/common/json_util.hpp"

#include <charconv>
#include <fstream>
#include <sstream>

namespace ragvix::corpus {

namespace {

bool parse_u64_field(const common::JsonFlatMap &fields, const char *key, std::uint64_t &out) {
  const auto it = fields.find(key);
  if (it == fields.end()) {
    return false;
  }
  const std::string &raw = it->second;
  const auto [ptr, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), out);
  return ec == std::errc() && ptr == raw.data() + raw.size() && !raw.empty();
}

common::Status require_string(const common::JsonFlatMap &fields, const char *key,
                              std::string &out) {
  const auto it = fields.find(key);
  if (it == fields.end()) {
    return common::Status::error(common::ErrorCode::InvalidArgument,
                                 std::string("missing field: ") + key);
  }
  out = it->second;
  return common::Status::success();
}

void append_string_array(std::ostringstream &stream, const std::vector<std::string> &values) {
  stream << '[';
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i > 0) {
      stream << ',';
    }
    stream << '"' << common::json_escape(values[i]) << '"';
  }
  stream << ']';
}

} // namespace

std::string format_chunk_record(const Chunk &chunk, const DocumentInfo *info) {
  std::ostringstream stream;
  stream << "{\"chunk_id\":\"" << common::json_escape(chunk.chunk_id) << "\"";
  stream << ",\"document_id\":\"" << common::json_escape(chunk.document_id) << "\"";
  stream << ",\"sequence_index\":" << chunk.sequence_index;
  stream << ",\"start_offset\":" << chunk.start_offset;
  stream << ",\"end_offset\":" << chunk.end_offset;
  stream << ",\"text\":\"" << common::json_escape(chunk.text) << "\"";
  if (info != nullptr && !info->empty()) {
    stream << ",\"title\":\"" << common::json_escape(info->title) << "\"";
    stream << ",\"authors\":";
    append_string_array(stream, info->authors);
    stream << ",\"category\":\"" << common::json_escape(info->category) << "\"";
    stream << ",\"published\":\"" << common::json_escape(info->published) << "\"";
  }
  stream << '}';
  return stream.str();
}

common::Status parse_chunk_record(const std::string &line, Chunk &chunk, DocumentInfo &info) {
  const std::string trimmed = common::trim(line);
  if (trimmed.size() < 2 || trimmed.front() != '{' || trimmed.back() != '}') {
    return common::Status::error(common::ErrorCode::InvalidArgument, "not a JSON object");
  }
  const auto fields = common::json_parse_flat(trimmed);

  if (auto status = require_string(fields, "chunk_id", chunk.chunk_id); !status.ok()) {
    return status;
  }
  if (auto status = require_string(fields, "document_id", chunk.document_id); !status.ok()) {
    return status;
  }
  if (auto status = require_string(fields, "text", chunk.text); !status.ok()) {
    return status;
  }
  if (!parse_u64_field(fields, "sequence_index", chunk.sequence_index) ||
      !parse_u64_field(fields, "start_offset", chunk.start_offset) ||
      !parse_u64_field(fields, "end_offset", chunk.end_offset)) {
    return common::Status::error(common::ErrorCode::InvalidArgument,
                                 "sequence_index, start_offset and end_offset must be "
                                 "non-negative integers");
  }
  if (chunk.end_offset < chunk.start_offset) {
    return common::Status::error(common::ErrorCode::InvalidArgument,
                                 "end_offset precedes start_offset");
  }
  if (chunk.chunk_id.empty() || chunk.document_id.empty()) {
    return common::Status::error(common::ErrorCode::InvalidArgument,
                                 "chunk_id and document_id must not be empty");
  }

  info = DocumentInfo{};
  if (const auto it = fields.find("title"); it != fields.end()) {
    info.title = it->second;
  }
  if (const auto it = fields.find("authors"); it != fields.end()) {
    info.authors = common::json_parse_string_array(it->second);
  }
  if (const auto it = fields.find("category"); it != fields.end()) {
    info.category = it->second;
  }
  if (const auto it = fields.find("published"); it != fields.end()) {
    info.published = it->second;
  }
  return common::Status::success();
}

common::Status write_chunk_corpus(const std::filesystem::path &path, const ChunkCorpus &corpus) {
  if (!path.parent_path().empty()) {
    if (auto dir = common::ensure_dir(path.parent_path()); !dir.ok()) {
      return dir.status();
    }
  }

  std::ofstream file(path, std::ios::trunc);
  if (!file) {
    return common::Status::error(common::ErrorCode::IoError,
                                 "unable to write chunk corpus: " + path.string());
  }
  for (const auto &chunk : corpus.chunks) {
    const auto it = corpus.documents.find(chunk.document_id);
    file << format_chunk_record(chunk, it == corpus.documents.end() ? nullptr : &it->second)
         << '\n';
  }
  file.close();
  if (!file) {
    return common::Status::error(common::ErrorCode::IoError,
                                 "failed writing chunk corpus: " + path.string());
  }
  return common::Status::success();
}

common::Result<ChunkCorpus> read_chunk_corpus(const std::filesystem::path &path) {
  std::ifstream file(path);
  if (!file) {
    return common::Result<ChunkCorpus>::failure(common::ErrorCode::IoError,
                                                "unable to open chunk corpus: " + path.string());
  }

  ChunkCorpus corpus;
  std::string line;
  std::size_t line_number = 0;
  while (std::getline(file, line)) {
    ++line_number;
    if (common::trim(line).empty()) {
      continue;
    }
    Chunk chunk;
    DocumentInfo info;
    if (const auto status = parse_chunk_record(line, chunk, info); !status.ok()) {
      return common::Result<ChunkCorpus>::failure(
          common::ErrorCode::InvalidArgument,
          path.string() + ":" + std::to_string(line_number) + ": " + status.error());
    }
    if (!info.empty()) {
      corpus.documents.emplace(chunk.document_id, std::move(info));
    }
    corpus.chunks.push_back(std::move(chunk));
  }
  return common::Result<ChunkCorpus>::success(std::move(corpus));
}

std::map<std::string, DocumentInfo> collect_document_info(const std::vector<Document> &documents) {
  std::map<std::string, DocumentInfo> out;
  for (const auto &document : documents) {
    out.emplace(document.id, document.info);
  }
  return out;
}

} // namespace ragvix::corpus
