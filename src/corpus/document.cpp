#include "ragvix/corpus/document.hpp"

#include "ragvix/common/fs.hpp"
#include "ragvix/common/json_util.hpp"
#include "ragvix/observability/global.hpp"

#include <fstream>

namespace ragvix::corpus {

namespace {

std::string first_present(const common::JsonFlatMap &fields,
                          std::initializer_list<const char *> keys) {
  for (const char *key : keys) {
    if (const auto it = fields.find(key); it != fields.end() && !it->second.empty() &&
                                          it->second != "null") {
      return it->second;
    }
  }
  return "";
}

} // namespace

common::Result<Document> parse_document_record(const std::string &line) {
  const std::string trimmed = common::trim(line);
  if (trimmed.empty() || trimmed.front() != '{' || trimmed.back() != '}') {
    return common::Result<Document>::failure(common::ErrorCode::InvalidArgument,
                                             "document record is not a JSON object");
  }

  const auto fields = common::json_parse_flat(trimmed);
  Document document;
  document.id = first_present(fields, {"id", "arxiv_id", "document_id"});
  document.text = first_present(fields, {"text", "abstract"});
  document.info.title = first_present(fields, {"title"});
  document.info.published = first_present(fields, {"published"});
  document.info.category = first_present(fields, {"category"});
  if (document.info.category.empty()) {
    if (const auto it = fields.find("categories"); it != fields.end()) {
      const auto categories = common::json_parse_string_array(it->second);
      if (!categories.empty()) {
        document.info.category = categories.front();
      }
    }
  }
  if (const auto it = fields.find("authors"); it != fields.end()) {
    document.info.authors = common::json_parse_string_array(it->second);
  }

  if (document.id.empty()) {
    return common::Result<Document>::failure(common::ErrorCode::InvalidArgument,
                                             "document record has no id");
  }
  return common::Result<Document>::success(std::move(document));
}

common::Result<std::vector<Document>> read_documents(const std::filesystem::path &path) {
  std::ifstream file(path);
  if (!file) {
    return common::Result<std::vector<Document>>::failure(
        common::ErrorCode::IoError, "unable to open documents file: " + path.string());
  }

  std::vector<Document> documents;
  std::string line;
  std::size_t line_number = 0;
  while (std::getline(file, line)) {
    ++line_number;
    if (common::trim(line).empty()) {
      continue;
    }
    auto parsed = parse_document_record(line);
    if (!parsed.ok()) {
      observability::record_error("corpus", path.string() + ":" + std::to_string(line_number) +
                                                ": skipped record: " + parsed.error());
      continue;
    }
    if (common::trim(parsed.value().text).empty()) {
      observability::record_error("corpus", "document " + parsed.value().id +
                                                " has no text; skipped");
      continue;
    }
    documents.push_back(std::move(parsed.value()));
  }
  return common::Result<std::vector<Document>>::success(std::move(documents));
}

} // namespace ragvix::corpus
