#pragma once

#include <peek/store/result_store.hpp>
#include <mutex>
#include <string>

struct sqlite3;

namespace peek::store {

/// Result store on SQLite: one row per job in `insight_records`, insights as a
/// nullable JSON text column. Pass ":memory:" for a private in-memory database.
/// All access goes through one connection guarded by a mutex.
class SqliteResultStore : public IResultStore {
 public:
  /// Opens (creating if needed) the database and its schema.
  /// Throws std::runtime_error if the database cannot be opened or migrated.
  explicit SqliteResultStore(const std::string& db_path);
  ~SqliteResultStore() override;

  SqliteResultStore(const SqliteResultStore&) = delete;
  SqliteResultStore& operator=(const SqliteResultStore&) = delete;

  [[nodiscard]] std::expected<void, peek::core::Error> create(
      const peek::core::InsightRecord& record) override;

  [[nodiscard]] std::expected<peek::core::InsightRecord, peek::core::Error> get(
      const std::string& id) const override;

  [[nodiscard]] std::expected<void, peek::core::Error> complete(
      const std::string& id, const Completion& completion, std::int64_t now_ms) override;

  [[nodiscard]] std::expected<void, peek::core::Error> fail(
      const std::string& id,
      std::string_view reason,
      std::int64_t processing_time_ms,
      std::int64_t now_ms) override;

  [[nodiscard]] std::expected<std::vector<std::string>, peek::core::Error> list_ids(
      peek::core::JobStatus status) const override;

  [[nodiscard]] std::expected<std::size_t, peek::core::Error> count() const override;

 private:
  void init_schema();
  /// Distinguishes NotFound from AlreadyTerminal after a conditional update hit no row.
  peek::core::Error no_row_error(const std::string& id) const;

  sqlite3* db_{nullptr};
  mutable std::mutex mutex_;
};

}  // namespace peek::store
