/*
 * database.hpp  Andrew Belles  Nov 8th, 2025
 *
 * RAII wrapper over a sqlite3 connection. Parent of the ContentStore, owns
 * the connection, transactions and statement helpers
 *
 */

#pragma once

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <sqlite3.h>

namespace dat {

/************ Sqlite Deleter ******************************/
/* Simple deleter struct to safely close a unique_ptr to sqlite3*
 */
struct SqliteDeleter {
  void operator()(sqlite3* db) const noexcept
  {
    if ( db ) {
      sqlite3_close(db);
    }
  }
};

/************ Stmt Deleter ********************************/
/* Finalizes a prepared statement owned by a Stmt
 */
struct StmtDeleter {
  void operator()(sqlite3_stmt* stmt) const noexcept
  {
    if ( stmt ) {
      sqlite3_finalize(stmt);
    }
  }
};

using Stmt = std::unique_ptr<sqlite3_stmt, StmtDeleter>;

/************ SqliteDB ************************************/
/* Parent Class for stores backed by a single sqlite connection
 */
class SqliteDB {
public:

  /********** Tx ******************************************/
  /* Transaction class that holds context of a sqlite3 transaction. Rolls
   * back on destruction unless committed. Immediate transactions take the
   * write lock up front so concurrent writers serialize at BEGIN
   */
  class Tx {
  public:
    explicit Tx(SqliteDB& db, bool immediate = false) : db_(&db), active_(false)
    {
      std::string_view sql = immediate ? "BEGIN IMMEDIATE TRANSACTION"
                                       : "BEGIN TRANSACTION";
      db_->exec(sql);
      active_ = true;
    }

    Tx(const Tx&) = delete;
    Tx& operator=(const Tx&) = delete;

    ~Tx()
    {
      if ( active_ ) {
        db_->exec_noexcept_("ROLLBACK");
      }
    }

    void commit() { end_("COMMIT"); }
    void rollback() { end_("ROLLBACK"); }

  private:
    SqliteDB* db_;
    bool active_;

    // no-op once the transaction has ended either way
    void end_(std::string_view sql)
    {
      if ( !active_ ) {
        return;
      }
      if ( db_ == nullptr ) {
        throw std::runtime_error("SqliteDB::Tx: nullptr database handle on " + std::string(sql));
      }
      db_->exec(sql);
      active_ = false;
    }
  };

  /********** SqliteDB Constructor ************************/
  /*
   * Explicit Constructor for Database RAII wrapper over sqlite3 database
   *
   * Throws:
   *   Runtime error for failure to open sqlite connection
   */
  explicit SqliteDB(const std::string& path,
                    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE |
                                SQLITE_OPEN_FULLMUTEX)
  {
    sqlite3* sql_raw = nullptr;

    const int code = sqlite3_open_v2(path.c_str(), &sql_raw, flags, nullptr);
    if ( code != SQLITE_OK ) {
      std::string err = sql_raw? sqlite3_errmsg(sql_raw)
        : ("sqlite open error: " + std::to_string(code));
      if ( sql_raw ) {
        sqlite3_close(sql_raw);
      }
      throw std::runtime_error("SqliteDB construction: " + err);
    }
    db_.reset(sql_raw);
    sqlite3_busy_timeout(db_.get(), 5000);
  }

  virtual ~SqliteDB() = default;

  SqliteDB(SqliteDB&&) noexcept = default;
  SqliteDB& operator=(SqliteDB&&) noexcept = default;

  /********** exec() **************************************/
  /* Executes a single query on the intialized database.
   *
   * Throws:
   *   runtime error for nullptr database uniq ptr
   *   runtime error for failure to execute query on database
   */
  void exec(std::string_view sql)
  {
    if ( !db_ ) {
      throw std::runtime_error("SqliteDB::exec database handle is nullptr");
    }

    const std::string owned(sql);
    char* errmsg = nullptr;
    const int code = sqlite3_exec(db_.get(), owned.c_str(), nullptr, nullptr, &errmsg);
    if ( code != SQLITE_OK ) {
      std::string err = errmsg? std::string(errmsg) : sqlite3_errmsg(db_.get());

      if ( errmsg ) {
        sqlite3_free(errmsg);
      }
      throw std::runtime_error("SqliteDB::exec failed: " + err);
    }
  }

  /********** prepare() ***********************************/
  /* Prepares an sql statement. The returned Stmt finalizes itself.
   *
   * Throws:
   *   runtime error for nullptr database uniq ptr
   *   runtime error for failure to compile the statement
   */
  Stmt prepare(std::string_view sql)
  {
    if ( !db_ ) {
      throw std::runtime_error("SqliteDB::prepare database handle is nullptr");
    }

    sqlite3_stmt* stmt = nullptr;
    const int code = sqlite3_prepare_v2(
      db_.get(), sql.data(), static_cast<int>(sql.size()), &stmt, nullptr
    );

    if ( code != SQLITE_OK ) {
      std::string errmsg{sqlite3_errmsg(db_.get())};
      if ( stmt ) {
        sqlite3_finalize(stmt);
      }
      throw std::runtime_error("SqliteDB::prepare failed: " + errmsg);
    }
    return Stmt(stmt);
  }

protected:
  void bind(sqlite3_stmt* stmt, int idx, std::string_view value)
  {
    check_(stmt, "bind");
    const int code = sqlite3_bind_text(stmt, idx, value.data(),
        static_cast<int>(value.size()), SQLITE_TRANSIENT);
    if ( code != SQLITE_OK ) {
      std::string errmsg{sqlite3_errmsg(db_.get())};
      throw std::runtime_error("SqliteDB::bind failed: " + errmsg);
    }
  }

  void bind_int(sqlite3_stmt* stmt, int idx, int64_t value)
  {
    check_(stmt, "bind_int");
    if ( sqlite3_bind_int64(stmt, idx, value) != SQLITE_OK ) {
      std::string errmsg{sqlite3_errmsg(db_.get())};
      throw std::runtime_error("SqliteDB::bind_int failed: " + errmsg);
    }
  }

  void bind_double(sqlite3_stmt* stmt, int idx, double value)
  {
    check_(stmt, "bind_double");
    if ( sqlite3_bind_double(stmt, idx, value) != SQLITE_OK ) {
      std::string errmsg{sqlite3_errmsg(db_.get())};
      throw std::runtime_error("SqliteDB::bind_double failed: " + errmsg);
    }
  }

  bool step(sqlite3_stmt* stmt)
  {
    check_(stmt, "step");

    const int code = sqlite3_step(stmt);
    if ( code == SQLITE_ROW ) {
      return true;
    }

    if ( code == SQLITE_DONE ) {
      return false;
    }

    std::string errmsg{sqlite3_errmsg(db_.get())};
    throw std::runtime_error("SqliteDB::step failed: " + errmsg);
  }

  static std::string column_text(sqlite3_stmt* stmt, int col)
  {
    const auto* text = sqlite3_column_text(stmt, col);
    if ( !text ) {
      return "";
    }
    return std::string(reinterpret_cast<const char*>(text),
                       static_cast<size_t>(sqlite3_column_bytes(stmt, col)));
  }

  static int64_t column_int(sqlite3_stmt* stmt, int col)
  {
    return sqlite3_column_int64(stmt, col);
  }

  static double column_double(sqlite3_stmt* stmt, int col)
  {
    return sqlite3_column_double(stmt, col);
  }

private:
  std::unique_ptr<sqlite3, SqliteDeleter> db_{nullptr};

  void check_(sqlite3_stmt* stmt, const char* op) const
  {
    if ( !db_ ) {
      throw std::runtime_error(std::string("SqliteDB::") + op + " database handle is nullptr");
    }

    if ( stmt == nullptr ) {
      throw std::runtime_error(std::string("SqliteDB::") + op + " statement is nullptr");
    }
  }

  void exec_noexcept_(const char* sql) noexcept
  {
    if ( db_ ) {
      sqlite3_exec(db_.get(), sql, nullptr, nullptr, nullptr);
    }
  }
};

}
