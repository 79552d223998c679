#pragma once

#include "ragvix/common/result.hpp"
#include "ragvix/corpus/document.hpp"

#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include <sqlite3.h>

namespace ragvix::index {

/// Everything the index keeps next to its vectors.
struct SidecarContents {
  /// index_info key/value rows (format_version, model_id, dimension, metric, count,
  /// vectors_sha256).
  std::map<std::string, std::string> info;
  /// Chunk metadata in slot order; slot i describes vector i.
  std::vector<corpus::Chunk> chunks;
  std::map<std::string, corpus::DocumentInfo> documents;
};

/// SQLite file holding the chunk_id -> metadata mapping of a persisted index.
class SidecarStore {
  struct PrivateTag {
    explicit PrivateTag() = default;
  };

public:
  /// Takes ownership of db; reachable only through create() and open().
  SidecarStore(PrivateTag, sqlite3 *db) : db_(db) {}

  /// Creates a fresh database at `path`, replacing any existing file.
  [[nodiscard]] static common::Result<std::unique_ptr<SidecarStore>>
  create(const std::filesystem::path &path);
  /// Opens an existing database read-only. Unreadable files are CorruptIndex.
  [[nodiscard]] static common::Result<std::unique_ptr<SidecarStore>>
  open(const std::filesystem::path &path);

  ~SidecarStore();
  SidecarStore(const SidecarStore &) = delete;
  SidecarStore &operator=(const SidecarStore &) = delete;

  [[nodiscard]] common::Status write(const SidecarContents &contents);
  [[nodiscard]] common::Result<SidecarContents> read() const;

private:
  [[nodiscard]] common::Status init_schema();

  sqlite3 *db_ = nullptr;
};

} // namespace ragvix::index
