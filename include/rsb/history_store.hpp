/**
 * @file history_store.hpp
 * @brief SQLite-backed telemetry history behind a bounded read-only pool.
 *
 * Connections are opened lazily up to `pool_size` and returned to the pool
 * after each query. A query waits for a free connection at most
 * kPoolAcquireTimeoutMs. All user-supplied values are bound as
 * parameters; the SQL text is assembled from fixed fragments only.
 */

#ifndef RSB_HISTORY_STORE_HPP_
#define RSB_HISTORY_STORE_HPP_

#include "rsb/log.hpp"
#include "rsb/telemetry.hpp"
#include "rsb/timestamp.hpp"
#include "rsb/vocabulary.hpp"

#include <sqlite3.h>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace rsb {

static constexpr uint32_t kDefaultPoolSize = 5U;
static constexpr uint32_t kDefaultHistoryLimit = 1000U;
static constexpr uint32_t kMaxHistoryLimit = 10000U;
static constexpr uint32_t kPoolAcquireTimeoutMs = 5000U;

enum class StoreError : uint8_t {
  kOpenFailed = 0,
  kPoolExhausted,
  kPrepareFailed,
  kStepFailed,
  kSchemaFailed,
  kWriteFailed,
};

struct HistoryError {
  StoreError code = StoreError::kStepFailed;
  std::string message;
};

struct HistoryQuery {
  std::string device_uid;
  uint32_t limit = kDefaultHistoryLimit;
  optional<UtcMicros> start;  ///< Inclusive
  optional<UtcMicros> end;    ///< Inclusive
};

/// @brief Clamp a requested row count into [1, kMaxHistoryLimit].
inline uint32_t ClampHistoryLimit(int64_t requested) noexcept {
  if (requested < 1) return 1U;
  if (requested > static_cast<int64_t>(kMaxHistoryLimit)) {
    return kMaxHistoryLimit;
  }
  return static_cast<uint32_t>(requested);
}

static constexpr const char kSchemaSql[] =
    "CREATE TABLE IF NOT EXISTS devices ("
    "  id INTEGER PRIMARY KEY,"
    "  device_uid TEXT UNIQUE NOT NULL,"
    "  name TEXT,"
    "  model TEXT,"
    "  firmware_version TEXT,"
    "  metadata_json TEXT);"
    "CREATE TABLE IF NOT EXISTS telemetry_samples ("
    "  id INTEGER PRIMARY KEY,"
    "  device_id INTEGER NOT NULL REFERENCES devices(id) ON DELETE CASCADE,"
    "  ts TEXT NOT NULL,"
    "  metrics_json TEXT NOT NULL,"
    "  quality_json TEXT,"
    "  crc_ok INTEGER,"
    "  frame_seq INTEGER,"
    "  source TEXT);"
    "CREATE INDEX IF NOT EXISTS ix_telemetry_device_ts"
    "  ON telemetry_samples(device_id, ts);";

namespace detail {

/// Finalizes a prepared statement on scope exit.
class StmtGuard {
 public:
  explicit StmtGuard(sqlite3_stmt* stmt) noexcept : stmt_(stmt) {}
  ~StmtGuard() {
    if (stmt_ != nullptr) sqlite3_finalize(stmt_);
  }
  StmtGuard(const StmtGuard&) = delete;
  StmtGuard& operator=(const StmtGuard&) = delete;

  sqlite3_stmt* get() const noexcept { return stmt_; }

 private:
  sqlite3_stmt* stmt_;
};

inline HistoryError MakeHistoryError(StoreError code, sqlite3* db) {
  HistoryError e;
  e.code = code;
  e.message = (db != nullptr) ? sqlite3_errmsg(db) : "out of memory";
  return e;
}

inline std::string ColumnText(sqlite3_stmt* stmt, int col) {
  const unsigned char* p = sqlite3_column_text(stmt, col);
  if (p == nullptr) return std::string();
  return std::string(reinterpret_cast<const char*>(p),
                     static_cast<size_t>(sqlite3_column_bytes(stmt, col)));
}

inline void BindText(sqlite3_stmt* stmt, int idx, const std::string& s) {
  sqlite3_bind_text(stmt, idx, s.c_str(), static_cast<int>(s.size()),
                    SQLITE_TRANSIENT);
}

}  // namespace detail

// ============================================================================
// HistoryStore
// ============================================================================

class HistoryStore {
 public:
  explicit HistoryStore(std::string path, uint32_t pool_size = kDefaultPoolSize)
      : path_(std::move(path)), pool_size_(pool_size == 0U ? 1U : pool_size) {}

  ~HistoryStore() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (sqlite3* db : idle_) sqlite3_close(db);
    idle_.clear();
  }

  HistoryStore(const HistoryStore&) = delete;
  HistoryStore& operator=(const HistoryStore&) = delete;

  const std::string& Path() const noexcept { return path_; }

  /**
   * @brief Create the database file and tables if missing.
   *
   * Uses a private read-write connection; the pool stays read-only.
   */
  expected<void, HistoryError> EnsureSchema() {
    sqlite3* db = nullptr;
    const int rc = sqlite3_open_v2(path_.c_str(), &db,
                                   SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE,
                                   nullptr);
    if (rc != SQLITE_OK) {
      auto err = detail::MakeHistoryError(StoreError::kOpenFailed, db);
      sqlite3_close(db);
      return expected<void, HistoryError>::error(std::move(err));
    }
    char* errmsg = nullptr;
    if (sqlite3_exec(db, kSchemaSql, nullptr, nullptr, &errmsg) != SQLITE_OK) {
      HistoryError err;
      err.code = StoreError::kSchemaFailed;
      err.message = (errmsg != nullptr) ? errmsg : "schema failed";
      sqlite3_free(errmsg);
      sqlite3_close(db);
      return expected<void, HistoryError>::error(std::move(err));
    }
    sqlite3_close(db);
    return expected<void, HistoryError>::success();
  }

  /**
   * @brief Insert one sample, registering the device on first sight.
   *
   * Producers (and tests) use this; the server itself never writes.
   */
  expected<void, HistoryError> Append(const std::string& device_uid,
                                      UtcMicros ts,
                                      const nlohmann::json& metrics,
                                      const optional<nlohmann::json>& quality,
                                      const char* source = nullptr) {
    sqlite3* db = nullptr;
    if (sqlite3_open_v2(path_.c_str(), &db, SQLITE_OPEN_READWRITE, nullptr) !=
        SQLITE_OK) {
      auto err = detail::MakeHistoryError(StoreError::kOpenFailed, db);
      sqlite3_close(db);
      return expected<void, HistoryError>::error(std::move(err));
    }
    auto r = AppendOn(db, device_uid, ts, metrics, quality, source);
    sqlite3_close(db);
    return r;
  }

  /**
   * @brief Samples of @p q.device_uid in [start, end], ts ascending.
   *
   * start > end is not an error; it simply matches nothing. An unknown
   * device yields an empty result.
   */
  expected<std::vector<HistorySample>, HistoryError> Query(
      const HistoryQuery& q) {
    using Result = expected<std::vector<HistorySample>, HistoryError>;

    auto acquired = Acquire();
    if (!acquired.has_value()) return Result::error(acquired.get_error());
    sqlite3* db = acquired.value();
    auto result = QueryOn(db, q);
    Release(db);
    return result;
  }

  /// @brief Connections currently opened by the pool (idle or in use).
  uint32_t OpenConnections() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return opened_;
  }

  uint32_t PoolSize() const noexcept { return pool_size_; }

 private:
  expected<sqlite3*, HistoryError> Acquire() {
    using Result = expected<sqlite3*, HistoryError>;
    std::unique_lock<std::mutex> lock(mutex_);
    const bool ready = cv_.wait_for(
        lock, std::chrono::milliseconds(kPoolAcquireTimeoutMs),
        [this] { return !idle_.empty() || opened_ < pool_size_; });
    if (!ready) {
      HistoryError err;
      err.code = StoreError::kPoolExhausted;
      err.message = "pool timed out while waiting for an open connection";
      return Result::error(std::move(err));
    }
    if (!idle_.empty()) {
      sqlite3* db = idle_.back();
      idle_.pop_back();
      return Result::success(db);
    }

    ++opened_;
    lock.unlock();
    sqlite3* db = nullptr;
    const int rc = sqlite3_open_v2(path_.c_str(), &db,
                                   SQLITE_OPEN_READONLY | SQLITE_OPEN_NOMUTEX,
                                   nullptr);
    if (rc != SQLITE_OK) {
      auto err = detail::MakeHistoryError(StoreError::kOpenFailed, db);
      sqlite3_close(db);
      lock.lock();
      --opened_;
      lock.unlock();
      cv_.notify_one();
      RSB_LOG_ERROR("History", "open %s failed: %s", path_.c_str(),
                    err.message.c_str());
      return Result::error(std::move(err));
    }
    sqlite3_busy_timeout(db, static_cast<int>(kPoolAcquireTimeoutMs));
    RSB_LOG_DEBUG("History", "pool connection opened (%s)", path_.c_str());
    return Result::success(db);
  }

  void Release(sqlite3* db) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      idle_.push_back(db);
    }
    cv_.notify_one();
  }

  static expected<std::vector<HistorySample>, HistoryError> QueryOn(
      sqlite3* db, const HistoryQuery& q) {
    using Result = expected<std::vector<HistorySample>, HistoryError>;

    std::string sql =
        "SELECT s.ts, s.metrics_json, s.quality_json "
        "FROM telemetry_samples s JOIN devices d ON s.device_id = d.id "
        "WHERE d.device_uid = ?";
    if (q.start.has_value()) sql += " AND s.ts >= ?";
    if (q.end.has_value()) sql += " AND s.ts <= ?";
    sql += " ORDER BY s.ts ASC LIMIT ?";

    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &raw, nullptr) != SQLITE_OK) {
      sqlite3_finalize(raw);
      return Result::error(
          detail::MakeHistoryError(StoreError::kPrepareFailed, db));
    }
    detail::StmtGuard stmt(raw);

    int idx = 1;
    detail::BindText(raw, idx++, q.device_uid);
    if (q.start.has_value()) detail::BindText(raw, idx++, FormatStorage(*q.start));
    if (q.end.has_value()) detail::BindText(raw, idx++, FormatStorage(*q.end));
    sqlite3_bind_int64(raw, idx, static_cast<sqlite3_int64>(
                                     ClampHistoryLimit(q.limit)));

    std::vector<HistorySample> rows;
    for (;;) {
      const int rc = sqlite3_step(raw);
      if (rc == SQLITE_DONE) break;
      if (rc != SQLITE_ROW) {
        return Result::error(
            detail::MakeHistoryError(StoreError::kStepFailed, db));
      }
      const std::string ts_text = detail::ColumnText(raw, 0);
      auto ts = ParseStorage(ts_text);
      if (!ts.has_value()) {
        RSB_LOG_WARN("History", "skipping row with bad ts '%s'",
                     ts_text.c_str());
        continue;
      }
      HistorySample sample;
      sample.ts = *ts;
      // Payloads that are not valid JSON surface as null.
      sample.metrics = nlohmann::json::parse(detail::ColumnText(raw, 1),
                                             nullptr, false);
      if (sample.metrics.is_discarded()) sample.metrics = nullptr;
      if (sqlite3_column_type(raw, 2) != SQLITE_NULL) {
        auto quality = nlohmann::json::parse(detail::ColumnText(raw, 2),
                                             nullptr, false);
        sample.quality =
            quality.is_discarded() ? nlohmann::json(nullptr) : quality;
      }
      rows.push_back(std::move(sample));
    }
    return Result::success(std::move(rows));
  }

  static expected<void, HistoryError> AppendOn(
      sqlite3* db, const std::string& device_uid, UtcMicros ts,
      const nlohmann::json& metrics, const optional<nlohmann::json>& quality,
      const char* source) {
    using Result = expected<void, HistoryError>;

    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db,
                           "INSERT OR IGNORE INTO devices(device_uid) VALUES(?)",
                           -1, &raw, nullptr) != SQLITE_OK) {
      sqlite3_finalize(raw);
      return Result::error(
          detail::MakeHistoryError(StoreError::kPrepareFailed, db));
    }
    {
      detail::StmtGuard stmt(raw);
      detail::BindText(raw, 1, device_uid);
      if (sqlite3_step(raw) != SQLITE_DONE) {
        return Result::error(
            detail::MakeHistoryError(StoreError::kWriteFailed, db));
      }
    }

    raw = nullptr;
    if (sqlite3_prepare_v2(
            db,
            "INSERT INTO telemetry_samples(device_id, ts, metrics_json,"
            " quality_json, crc_ok, frame_seq, source)"
            " SELECT id, ?, ?, ?, ?, ?, ? FROM devices WHERE device_uid = ?",
            -1, &raw, nullptr) != SQLITE_OK) {
      sqlite3_finalize(raw);
      return Result::error(
          detail::MakeHistoryError(StoreError::kPrepareFailed, db));
    }
    detail::StmtGuard stmt(raw);
    detail::BindText(raw, 1, FormatStorage(ts));
    detail::BindText(raw, 2, metrics.dump());
    if (quality.has_value()) {
      detail::BindText(raw, 3, quality->dump());
      auto crc = quality->find("crc_ok");
      if (crc != quality->end() && crc->is_boolean()) {
        sqlite3_bind_int(raw, 4, crc->get<bool>() ? 1 : 0);
      } else {
        sqlite3_bind_null(raw, 4);
      }
      auto seq = quality->find("frame_seq");
      if (seq != quality->end() && seq->is_number_integer()) {
        sqlite3_bind_int64(raw, 5, seq->get<int64_t>());
      } else {
        sqlite3_bind_null(raw, 5);
      }
    } else {
      sqlite3_bind_null(raw, 3);
      sqlite3_bind_null(raw, 4);
      sqlite3_bind_null(raw, 5);
    }
    if (source != nullptr) {
      sqlite3_bind_text(raw, 6, source, -1, SQLITE_TRANSIENT);
    } else {
      sqlite3_bind_null(raw, 6);
    }
    detail::BindText(raw, 7, device_uid);
    if (sqlite3_step(raw) != SQLITE_DONE) {
      return Result::error(
          detail::MakeHistoryError(StoreError::kWriteFailed, db));
    }
    return Result::success();
  }

  std::string path_;
  uint32_t pool_size_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::vector<sqlite3*> idle_;
  uint32_t opened_ = 0U;
};

}  // namespace rsb

#endif  // RSB_HISTORY_STORE_HPP_
