#include "sqlite_archive_store.h"

#include <sqlite3.h>

#include <string>

#include "message_codec.h"

namespace pbr::archive {

namespace {

class Statement {
 public:
  Statement() = default;
  ~Statement() {
    if (stmt_) {
      sqlite3_finalize(stmt_);
    }
  }

  Statement(const Statement&) = delete;
  Statement& operator=(const Statement&) = delete;

  sqlite3_stmt** out() { return &stmt_; }
  sqlite3_stmt* get() const { return stmt_; }

 private:
  sqlite3_stmt* stmt_{nullptr};
};

ByteView ColumnBlob(sqlite3_stmt* stmt, int col) {
  const void* data = sqlite3_column_blob(stmt, col);
  const int size = sqlite3_column_bytes(stmt, col);
  if (!data || size <= 0) {
    return ByteView{};
  }
  return ByteView{static_cast<const std::uint8_t*>(data),
                  static_cast<std::size_t>(size)};
}

class SqliteArchiveStore final : public ArchiveStore {
 public:
  explicit SqliteArchiveStore(sqlite3* db) : db_(db) {}

  ~SqliteArchiveStore() override {
    if (db_) {
      sqlite3_close(db_);
      db_ = nullptr;
    }
  }

  bool ScanMessageKeys(const MessageKeyVisitor& visit,
                       std::string& error) override {
    error.clear();
    Statement stmt;
    const std::string sql = std::string("SELECT key FROM ") + kMessageTable;
    if (!Prepare(sql, stmt, error)) {
      return false;
    }
    return StepRows(stmt, error, [&visit](sqlite3_stmt* row) {
      return visit(ColumnBlob(row, 0));
    });
  }

  bool ScanMessages(std::optional<std::int64_t> peer_id, ScanOrder order,
                    const MessageRowVisitor& visit,
                    std::string& error) override {
    error.clear();
    std::string sql = std::string("SELECT key, value FROM ") + kMessageTable;
    if (peer_id.has_value()) {
      sql += " WHERE substr(key, 1, 8) = ?";
    }
    sql += (order == ScanOrder::kDescending) ? " ORDER BY key DESC"
                                             : " ORDER BY key ASC";
    Statement stmt;
    if (!Prepare(sql, stmt, error)) {
      return false;
    }
    if (peer_id.has_value()) {
      const auto prefix = EncodePeerPrefix(*peer_id);
      if (sqlite3_bind_blob(stmt.get(), 1, prefix.data(),
                            static_cast<int>(prefix.size()),
                            SQLITE_TRANSIENT) != SQLITE_OK) {
        error = Describe("bind peer prefix");
        return false;
      }
    }
    return StepRows(stmt, error, [&visit](sqlite3_stmt* row) {
      return visit(ColumnBlob(row, 0), ColumnBlob(row, 1));
    });
  }

  bool ScanPeers(const PeerRowVisitor& visit, std::string& error) override {
    error.clear();
    Statement stmt;
    const std::string sql =
        std::string("SELECT key, value FROM ") + kPeerTable;
    if (!Prepare(sql, stmt, error)) {
      return false;
    }
    return StepRows(stmt, error, [&visit](sqlite3_stmt* row) {
      return visit(static_cast<std::int64_t>(sqlite3_column_int64(row, 0)),
                   ColumnBlob(row, 1));
    });
  }

  bool LoadPeer(std::int64_t peer_id, BlobLoadResult& out,
                std::string& error) override {
    error.clear();
    out = BlobLoadResult{};
    Statement stmt;
    const std::string sql = std::string("SELECT value FROM ") + kPeerTable +
                            " WHERE key = ? LIMIT 1";
    if (!Prepare(sql, stmt, error)) {
      return false;
    }
    if (sqlite3_bind_int64(stmt.get(), 1,
                           static_cast<sqlite3_int64>(peer_id)) != SQLITE_OK) {
      error = Describe("bind peer id");
      return false;
    }
    return StepRows(stmt, error, [&out](sqlite3_stmt* row) {
      const ByteView blob = ColumnBlob(row, 0);
      out.found = true;
      if (blob.size > 0) {
        out.data.assign(blob.data, blob.data + blob.size);
      }
      return false;
    });
  }

  bool CountMessages(std::uint64_t& out, std::string& error) override {
    return Count(kMessageTable, out, error);
  }

  bool CountPeers(std::uint64_t& out, std::string& error) override {
    return Count(kPeerTable, out, error);
  }

 private:
  template <typename RowFn>
  bool StepRows(Statement& stmt, std::string& error, RowFn&& on_row) {
    while (true) {
      const int rc = sqlite3_step(stmt.get());
      if (rc == SQLITE_DONE) {
        return true;
      }
      if (rc != SQLITE_ROW) {
        error = Describe("step");
        return false;
      }
      if (!on_row(stmt.get())) {
        return true;
      }
    }
  }

  bool Prepare(const std::string& sql, Statement& stmt, std::string& error) {
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, stmt.out(), nullptr) !=
        SQLITE_OK) {
      error = Describe("prepare");
      return false;
    }
    return true;
  }

  bool Count(const char* table, std::uint64_t& out, std::string& error) {
    error.clear();
    out = 0;
    Statement stmt;
    if (!Prepare(std::string("SELECT COUNT(*) FROM ") + table, stmt, error)) {
      return false;
    }
    return StepRows(stmt, error, [&out](sqlite3_stmt* row) {
      out = static_cast<std::uint64_t>(sqlite3_column_int64(row, 0));
      return false;
    });
  }

  std::string Describe(const char* what) const {
    return std::string("sqlite ") + what + " failed: " + sqlite3_errmsg(db_);
  }

  sqlite3* db_{nullptr};
};

bool HasPostboxTables(sqlite3* db, std::string& error) {
  Statement stmt;
  const std::string sql =
      std::string("SELECT COUNT(*) FROM sqlite_master WHERE type = 'table' "
                  "AND name IN ('") +
      kPeerTable + "', '" + kMessageTable + "')";
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, stmt.out(), nullptr) !=
          SQLITE_OK ||
      sqlite3_step(stmt.get()) != SQLITE_ROW) {
    error = std::string("sqlite schema probe failed: ") + sqlite3_errmsg(db);
    return false;
  }
  if (sqlite3_column_int(stmt.get(), 0) != 2) {
    error = "not a postbox database (peer or message table missing)";
    return false;
  }
  return true;
}

}  // namespace

std::unique_ptr<ArchiveStore> OpenSqliteArchiveStore(
    const std::filesystem::path& path, std::string& error) {
  error.clear();
  sqlite3* db = nullptr;
  const int rc = sqlite3_open_v2(path.string().c_str(), &db,
                                 SQLITE_OPEN_READONLY, nullptr);
  if (rc != SQLITE_OK) {
    error = std::string("sqlite open failed: ") +
            (db ? sqlite3_errmsg(db) : sqlite3_errstr(rc));
    if (db) {
      sqlite3_close(db);
    }
    return nullptr;
  }
  if (!HasPostboxTables(db, error)) {
    sqlite3_close(db);
    return nullptr;
  }
  return std::make_unique<SqliteArchiveStore>(db);
}

}  // namespace pbr::archive
