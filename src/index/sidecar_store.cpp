#include "ragvix/index/sidecar_store.hpp"

#include "ragvix/common/json_util.hpp"

#include <sstream>

namespace ragvix::index {

namespace {

common::Status exec_sql(sqlite3 *db, const std::string &sql) {
  char *err = nullptr;
  const int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    const std::string msg = err == nullptr ? "sqlite error" : err;
    if (err != nullptr) {
      sqlite3_free(err);
    }
    return common::Status::error(common::ErrorCode::IoError, msg);
  }
  return common::Status::success();
}

std::string column_text(sqlite3_stmt *stmt, const int column) {
  const auto *text = sqlite3_column_text(stmt, column);
  return text == nullptr ? std::string() : std::string(reinterpret_cast<const char *>(text));
}

std::string authors_to_json(const std::vector<std::string> &authors) {
  std::ostringstream stream;
  stream << '[';
  for (std::size_t i = 0; i < authors.size(); ++i) {
    if (i > 0) {
      stream << ',';
    }
    stream << '"' << common::json_escape(authors[i]) << '"';
  }
  stream << ']';
  return stream.str();
}

common::Status corrupt(sqlite3 *db, const std::string &what) {
  return common::Status::error(common::ErrorCode::CorruptIndex,
                               "metadata sidecar " + what + ": " + sqlite3_errmsg(db));
}

} // namespace

common::Result<std::unique_ptr<SidecarStore>>
SidecarStore::create(const std::filesystem::path &path) {
  using R = common::Result<std::unique_ptr<SidecarStore>>;
  std::error_code ec;
  std::filesystem::remove(path, ec);

  sqlite3 *db = nullptr;
  if (sqlite3_open(path.string().c_str(), &db) != SQLITE_OK) {
    const std::string message = db == nullptr ? "out of memory" : sqlite3_errmsg(db);
    sqlite3_close(db);
    return R::failure(common::ErrorCode::IoError,
                      "unable to create metadata sidecar " + path.string() + ": " + message);
  }

  auto store = std::make_unique<SidecarStore>(PrivateTag{}, db);
  if (auto status = store->init_schema(); !status.ok()) {
    return R::failure(status);
  }
  return R::success(std::move(store));
}

common::Result<std::unique_ptr<SidecarStore>>
SidecarStore::open(const std::filesystem::path &path) {
  using R = common::Result<std::unique_ptr<SidecarStore>>;
  sqlite3 *db = nullptr;
  if (sqlite3_open_v2(path.string().c_str(), &db, SQLITE_OPEN_READONLY, nullptr) != SQLITE_OK) {
    const std::string message = db == nullptr ? "out of memory" : sqlite3_errmsg(db);
    sqlite3_close(db);
    return R::failure(common::ErrorCode::CorruptIndex,
                      "unable to open metadata sidecar " + path.string() + ": " + message);
  }
  return R::success(std::make_unique<SidecarStore>(PrivateTag{}, db));
}

SidecarStore::~SidecarStore() {
  if (db_ != nullptr) {
    sqlite3_close(db_);
  }
}

common::Status SidecarStore::init_schema() {
  return exec_sql(db_, R"(
CREATE TABLE index_info (
  key TEXT PRIMARY KEY,
  value TEXT NOT NULL
);
CREATE TABLE chunks (
  slot INTEGER PRIMARY KEY,
  chunk_id TEXT NOT NULL UNIQUE,
  document_id TEXT NOT NULL,
  sequence_index INTEGER NOT NULL,
  start_offset INTEGER NOT NULL,
  end_offset INTEGER NOT NULL,
  text TEXT NOT NULL
);
CREATE TABLE documents (
  document_id TEXT PRIMARY KEY,
  title TEXT NOT NULL DEFAULT '',
  authors TEXT NOT NULL DEFAULT '[]',
  category TEXT NOT NULL DEFAULT '',
  published TEXT NOT NULL DEFAULT ''
);
)");
}

common::Status SidecarStore::write(const SidecarContents &contents) {
  auto status = exec_sql(db_, "BEGIN TRANSACTION;");
  if (!status.ok()) {
    return status;
  }

  auto fail = [this](const std::string &message) {
    (void)exec_sql(db_, "ROLLBACK;");
    return common::Status::error(common::ErrorCode::IoError, message);
  };

  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, "INSERT INTO index_info(key, value) VALUES(?1, ?2)", -1, &stmt,
                         nullptr) != SQLITE_OK) {
    return fail(sqlite3_errmsg(db_));
  }
  for (const auto &[key, value] : contents.info) {
    sqlite3_reset(stmt);
    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, value.c_str(), -1, SQLITE_TRANSIENT);
    if (sqlite3_step(stmt) != SQLITE_DONE) {
      sqlite3_finalize(stmt);
      return fail(sqlite3_errmsg(db_));
    }
  }
  sqlite3_finalize(stmt);

  const char *chunk_sql = R"(
INSERT INTO chunks(slot, chunk_id, document_id, sequence_index, start_offset, end_offset, text)
VALUES(?1, ?2, ?3, ?4, ?5, ?6, ?7)
)";
  if (sqlite3_prepare_v2(db_, chunk_sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return fail(sqlite3_errmsg(db_));
  }
  for (std::size_t slot = 0; slot < contents.chunks.size(); ++slot) {
    const auto &chunk = contents.chunks[slot];
    sqlite3_reset(stmt);
    sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(slot));
    sqlite3_bind_text(stmt, 2, chunk.chunk_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, chunk.document_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 4, static_cast<sqlite3_int64>(chunk.sequence_index));
    sqlite3_bind_int64(stmt, 5, static_cast<sqlite3_int64>(chunk.start_offset));
    sqlite3_bind_int64(stmt, 6, static_cast<sqlite3_int64>(chunk.end_offset));
    sqlite3_bind_text(stmt, 7, chunk.text.c_str(), static_cast<int>(chunk.text.size()),
                      SQLITE_TRANSIENT);
    if (sqlite3_step(stmt) != SQLITE_DONE) {
      sqlite3_finalize(stmt);
      return fail(sqlite3_errmsg(db_));
    }
  }
  sqlite3_finalize(stmt);

  const char *document_sql = R"(
INSERT INTO documents(document_id, title, authors, category, published)
VALUES(?1, ?2, ?3, ?4, ?5)
)";
  if (sqlite3_prepare_v2(db_, document_sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return fail(sqlite3_errmsg(db_));
  }
  for (const auto &[document_id, info] : contents.documents) {
    const std::string authors = authors_to_json(info.authors);
    sqlite3_reset(stmt);
    sqlite3_bind_text(stmt, 1, document_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, info.title.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, authors.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 4, info.category.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 5, info.published.c_str(), -1, SQLITE_TRANSIENT);
    if (sqlite3_step(stmt) != SQLITE_DONE) {
      sqlite3_finalize(stmt);
      return fail(sqlite3_errmsg(db_));
    }
  }
  sqlite3_finalize(stmt);

  return exec_sql(db_, "COMMIT;");
}

common::Result<SidecarContents> SidecarStore::read() const {
  using R = common::Result<SidecarContents>;
  SidecarContents contents;

  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, "SELECT key, value FROM index_info", -1, &stmt, nullptr) !=
      SQLITE_OK) {
    return R::failure(corrupt(db_, "has no index_info table"));
  }
  while (sqlite3_step(stmt) == SQLITE_ROW) {
    contents.info[column_text(stmt, 0)] = column_text(stmt, 1);
  }
  sqlite3_finalize(stmt);

  const char *chunk_sql = "SELECT slot, chunk_id, document_id, sequence_index, start_offset, "
                          "end_offset, text FROM chunks ORDER BY slot ASC";
  if (sqlite3_prepare_v2(db_, chunk_sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return R::failure(corrupt(db_, "has no chunks table"));
  }
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
    const auto slot = sqlite3_column_int64(stmt, 0);
    if (slot != static_cast<sqlite3_int64>(contents.chunks.size())) {
      sqlite3_finalize(stmt);
      return R::failure(common::ErrorCode::CorruptIndex,
                        "metadata sidecar has a gap at slot " +
                            std::to_string(contents.chunks.size()));
    }
    corpus::Chunk chunk;
    chunk.chunk_id = column_text(stmt, 1);
    chunk.document_id = column_text(stmt, 2);
    chunk.sequence_index = static_cast<std::uint64_t>(sqlite3_column_int64(stmt, 3));
    chunk.start_offset = static_cast<std::uint64_t>(sqlite3_column_int64(stmt, 4));
    chunk.end_offset = static_cast<std::uint64_t>(sqlite3_column_int64(stmt, 5));
    chunk.text = column_text(stmt, 6);
    contents.chunks.push_back(std::move(chunk));
  }
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return R::failure(corrupt(db_, "chunk rows unreadable"));
  }

  if (sqlite3_prepare_v2(db_,
                         "SELECT document_id, title, authors, category, published FROM documents",
                         -1, &stmt, nullptr) != SQLITE_OK) {
    return R::failure(corrupt(db_, "has no documents table"));
  }
  while (sqlite3_step(stmt) == SQLITE_ROW) {
    corpus::DocumentInfo info;
    info.title = column_text(stmt, 1);
    info.authors = common::json_parse_string_array(column_text(stmt, 2));
    info.category = column_text(stmt, 3);
    info.published = column_text(stmt, 4);
    contents.documents.emplace(column_text(stmt, 0), std::move(info));
  }
  sqlite3_finalize(stmt);

  return R::success(std::move(contents));
}

} // namespace ragvix::index
