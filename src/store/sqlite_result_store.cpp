#include <peek/store/sqlite_result_store.hpp>
#include <peek/core/insights_json.hpp>
#include <sqlite3.h>
#include <chrono>
#include <memory>
#include <stdexcept>

namespace peek::store {

using peek::core::Error;
using peek::core::ErrorCode;
using peek::core::InsightRecord;
using peek::core::JobStatus;

std::int64_t now_ms() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

namespace {

struct StatementFinalizer {
  void operator()(sqlite3_stmt* st) const noexcept { sqlite3_finalize(st); }
};
using Statement = std::unique_ptr<sqlite3_stmt, StatementFinalizer>;

std::expected<Statement, Error> prepare(sqlite3* db, const char* sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
    return std::unexpected(Error{ErrorCode::StoreError, std::string("prepare failed: ") +
                                                            sqlite3_errmsg(db)});
  }
  return Statement(st);
}

void bind_text(sqlite3_stmt* st, int i, std::string_view v) {
  sqlite3_bind_text(st, i, v.data(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
}

template <typename T>
void bind_optional_text(sqlite3_stmt* st, int i, const std::optional<T>& v) {
  if (v) bind_text(st, i, *v);
  else sqlite3_bind_null(st, i);
}

template <typename T>
void bind_optional_int(sqlite3_stmt* st, int i, const std::optional<T>& v) {
  if (v) sqlite3_bind_int64(st, i, static_cast<sqlite3_int64>(*v));
  else sqlite3_bind_null(st, i);
}

std::string column_text(sqlite3_stmt* st, int i) {
  const auto* p = sqlite3_column_text(st, i);
  return p ? std::string(reinterpret_cast<const char*>(p),
                         static_cast<std::size_t>(sqlite3_column_bytes(st, i)))
           : std::string();
}

std::optional<std::string> column_optional_text(sqlite3_stmt* st, int i) {
  if (sqlite3_column_type(st, i) == SQLITE_NULL) return std::nullopt;
  return column_text(st, i);
}

std::optional<std::int64_t> column_optional_int(sqlite3_stmt* st, int i) {
  if (sqlite3_column_type(st, i) == SQLITE_NULL) return std::nullopt;
  return sqlite3_column_int64(st, i);
}

Error step_error(sqlite3* db, std::string_view what) {
  return Error{ErrorCode::StoreError, std::string(what) + ": " + sqlite3_errmsg(db)};
}

constexpr const char* kSchema = R"SQL(
  CREATE TABLE IF NOT EXISTS insight_records (
    id                 TEXT PRIMARY KEY,
    status             TEXT NOT NULL CHECK (status IN ('processing', 'completed', 'failed')),
    reason             TEXT,
    original_key       TEXT NOT NULL,
    annotated_key      TEXT,
    content_type       TEXT NOT NULL,
    size_bytes         INTEGER NOT NULL,
    checksum           TEXT NOT NULL,
    filename           TEXT NOT NULL DEFAULT '',
    width              INTEGER,
    height             INTEGER,
    insights           TEXT,
    failed_analyzers   TEXT,
    processing_time_ms INTEGER,
    created_at         INTEGER NOT NULL,
    updated_at         INTEGER NOT NULL
  );
  CREATE INDEX IF NOT EXISTS idx_insight_records_status
    ON insight_records (status, created_at);
)SQL";

constexpr const char* kSelectColumns =
    "SELECT id, status, reason, original_key, annotated_key, content_type, size_bytes, "
    "checksum, filename, width, height, insights, failed_analyzers, processing_time_ms, "
    "created_at, updated_at FROM insight_records";

}  // namespace

SqliteResultStore::SqliteResultStore(const std::string& db_path) {
  const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
  if (sqlite3_open_v2(db_path.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
    const std::string err = db_ ? sqlite3_errmsg(db_) : "out of memory";
    sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error("failed to open result store " + db_path + ": " + err);
  }
  sqlite3_busy_timeout(db_, 5000);
  init_schema();
}

SqliteResultStore::~SqliteResultStore() {
  if (db_) sqlite3_close(db_);
}

void SqliteResultStore::init_schema() {
  char* err = nullptr;
  // WAL is refused for in-memory databases; that is fine.
  sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
  if (sqlite3_exec(db_, kSchema, nullptr, nullptr, &err) != SQLITE_OK) {
    const std::string msg = err ? err : "unknown error";
    sqlite3_free(err);
    throw std::runtime_error("result store schema init failed: " + msg);
  }
}

std::expected<void, Error> SqliteResultStore::create(const InsightRecord& r) {
  if (r.status != JobStatus::Processing) {
    return std::unexpected(Error{ErrorCode::StoreError, "new records must be processing"});
  }
  std::lock_guard lock(mutex_);
  auto st = prepare(db_, R"SQL(
    INSERT INTO insight_records
      (id, status, original_key, annotated_key, content_type, size_bytes, checksum, filename,
       width, height, created_at, updated_at)
    VALUES (?,?,?,?,?,?,?,?,?,?,?,?)
  )SQL");
  if (!st) return std::unexpected(st.error());

  sqlite3_stmt* s = st->get();
  int i = 1;
  bind_text(s, i++, r.id);
  bind_text(s, i++, peek::core::to_string(r.status));
  bind_text(s, i++, r.asset.original_key);
  bind_optional_text(s, i++, r.asset.annotated_key);
  bind_text(s, i++, r.asset.content_type);
  sqlite3_bind_int64(s, i++, static_cast<sqlite3_int64>(r.asset.size_bytes));
  bind_text(s, i++, r.asset.checksum);
  bind_text(s, i++, r.asset.filename);
  bind_optional_int(s, i++, r.asset.width);
  bind_optional_int(s, i++, r.asset.height);
  sqlite3_bind_int64(s, i++, r.created_at_ms);
  sqlite3_bind_int64(s, i++, r.updated_at_ms);

  if (sqlite3_step(s) != SQLITE_DONE) {
    return std::unexpected(step_error(db_, "insert " + r.id));
  }
  return {};
}

std::expected<InsightRecord, Error> SqliteResultStore::get(const std::string& id) const {
  std::lock_guard lock(mutex_);
  const std::string sql = std::string(kSelectColumns) + " WHERE id = ?";
  auto st = prepare(db_, sql.c_str());
  if (!st) return std::unexpected(st.error());

  sqlite3_stmt* s = st->get();
  bind_text(s, 1, id);
  const int rc = sqlite3_step(s);
  if (rc == SQLITE_DONE) {
    return std::unexpected(Error{ErrorCode::NotFound, "no record with id " + id});
  }
  if (rc != SQLITE_ROW) {
    return std::unexpected(step_error(db_, "select " + id));
  }

  InsightRecord r;
  r.id = column_text(s, 0);
  const auto status = peek::core::parse_job_status(column_text(s, 1));
  if (!status) {
    return std::unexpected(Error{ErrorCode::StoreError, "bad status in row " + id});
  }
  r.status = *status;
  r.reason = column_optional_text(s, 2);
  r.asset.original_key = column_text(s, 3);
  r.asset.annotated_key = column_optional_text(s, 4);
  r.asset.content_type = column_text(s, 5);
  r.asset.size_bytes = static_cast<std::uint64_t>(sqlite3_column_int64(s, 6));
  r.asset.checksum = column_text(s, 7);
  r.asset.filename = column_text(s, 8);
  if (auto w = column_optional_int(s, 9)) r.asset.width = static_cast<std::uint32_t>(*w);
  if (auto h = column_optional_int(s, 10)) r.asset.height = static_cast<std::uint32_t>(*h);

  if (auto text = column_optional_text(s, 11)) {
    auto insights = peek::core::parse_insights(*text);
    if (!insights) return std::unexpected(insights.error());
    r.insights = std::move(*insights);
  }
  if (auto failed = column_optional_text(s, 12)) {
    auto j = peek::core::Json::parse(*failed, nullptr, /*allow_exceptions=*/false);
    if (j.is_array()) {
      for (const auto& name : j) {
        if (name.is_string()) r.failed_analyzers.push_back(name.get<std::string>());
      }
    }
  }
  r.processing_time_ms = column_optional_int(s, 13);
  r.created_at_ms = sqlite3_column_int64(s, 14);
  r.updated_at_ms = sqlite3_column_int64(s, 15);
  return r;
}

Error SqliteResultStore::no_row_error(const std::string& id) const {
  auto st = prepare(db_, "SELECT status FROM insight_records WHERE id = ?");
  if (!st) return st.error();
  bind_text(st->get(), 1, id);
  if (sqlite3_step(st->get()) == SQLITE_ROW) {
    return Error{ErrorCode::AlreadyTerminal,
                 "record " + id + " is already " + column_text(st->get(), 0)};
  }
  return Error{ErrorCode::NotFound, "no record with id " + id};
}

std::expected<void, Error> SqliteResultStore::complete(const std::string& id,
                                                       const Completion& c,
                                                       std::int64_t now) {
  const std::string insights_text = peek::core::serialize_insights(c.insights);
  const std::string failed_text = peek::core::Json(c.failed_analyzers).dump();

  std::lock_guard lock(mutex_);
  auto st = prepare(db_, R"SQL(
    UPDATE insight_records
       SET status = 'completed', insights = ?, failed_analyzers = ?, annotated_key = ?,
           width = ?, height = ?, processing_time_ms = ?, updated_at = ?
     WHERE id = ? AND status = 'processing'
  )SQL");
  if (!st) return std::unexpected(st.error());

  sqlite3_stmt* s = st->get();
  int i = 1;
  bind_text(s, i++, insights_text);
  bind_text(s, i++, failed_text);
  bind_optional_text(s, i++, c.annotated_key);
  bind_optional_int(s, i++, c.width);
  bind_optional_int(s, i++, c.height);
  sqlite3_bind_int64(s, i++, c.processing_time_ms);
  sqlite3_bind_int64(s, i++, now);
  bind_text(s, i++, id);

  if (sqlite3_step(s) != SQLITE_DONE) {
    return std::unexpected(step_error(db_, "complete " + id));
  }
  if (sqlite3_changes(db_) != 1) {
    return std::unexpected(no_row_error(id));
  }
  return {};
}

std::expected<void, Error> SqliteResultStore::fail(const std::string& id,
                                                   std::string_view reason,
                                                   std::int64_t processing_time_ms,
                                                   std::int64_t now) {
  std::lock_guard lock(mutex_);
  auto st = prepare(db_, R"SQL(
    UPDATE insight_records
       SET status = 'failed', reason = ?, insights = NULL, processing_time_ms = ?, updated_at = ?
     WHERE id = ? AND status = 'processing'
  )SQL");
  if (!st) return std::unexpected(st.error());

  sqlite3_stmt* s = st->get();
  bind_text(s, 1, reason);
  sqlite3_bind_int64(s, 2, processing_time_ms);
  sqlite3_bind_int64(s, 3, now);
  bind_text(s, 4, id);

  if (sqlite3_step(s) != SQLITE_DONE) {
    return std::unexpected(step_error(db_, "fail " + id));
  }
  if (sqlite3_changes(db_) != 1) {
    return std::unexpected(no_row_error(id));
  }
  return {};
}

std::expected<std::vector<std::string>, Error> SqliteResultStore::list_ids(JobStatus status) const {
  std::lock_guard lock(mutex_);
  auto st = prepare(db_,
                    "SELECT id FROM insight_records WHERE status = ? ORDER BY created_at, id");
  if (!st) return std::unexpected(st.error());

  bind_text(st->get(), 1, peek::core::to_string(status));
  std::vector<std::string> ids;
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(st->get())) == SQLITE_ROW) {
    ids.push_back(column_text(st->get(), 0));
  }
  if (rc != SQLITE_DONE) {
    return std::unexpected(step_error(db_, "list"));
  }
  return ids;
}

std::expected<std::size_t, Error> SqliteResultStore::count() const {
  std::lock_guard lock(mutex_);
  auto st = prepare(db_, "SELECT COUNT(*) FROM insight_records");
  if (!st) return std::unexpected(st.error());
  if (sqlite3_step(st->get()) != SQLITE_ROW) {
    return std::unexpected(step_error(db_, "count"));
  }
  return static_cast<std::size_t>(sqlite3_column_int64(st->get(), 0));
}

}  // namespace peek::store
