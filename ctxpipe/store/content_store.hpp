/*
 * content_store.hpp  Andrew Belles  Nov 20th, 2025
 *
 * Append-only, versioned store for Documents and Records. Every logical key
 * (document url, record key) moves through two states per version:
 *
 *   current  --supersede_and_insert-->  superseded
 *
 * and the transition plus the insert of the successor happen in a single
 * immediate transaction, so exactly one current row exists per key at any
 * observation point. A partial unique index on is_latest backs this up in
 * the schema itself.
 *
 */

#ifndef __CTXPIPE_CONTENT_STORE_HPP
#define __CTXPIPE_CONTENT_STORE_HPP

#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "database.hpp"
#include "model.hpp"

namespace dat {

/************ StoreConflict *******************************/
/* A version flip that could not be applied. Fatal for the write involved,
 * always surfaced to the caller
 */
class StoreConflict : public std::runtime_error {
public:
  StoreConflict(std::string key, const std::string& detail)
    : std::runtime_error("store conflict on '" + key + "': " + detail),
      key_(std::move(key)) {}

  const std::string& key() const noexcept { return key_; }

private:
  std::string key_;
};

class ContentStore final : public SqliteDB {
public:
  using Base = SqliteDB;

  /********** ContentStore Constructor ********************/
  /* Opens (or creates) the database at path and applies the schema.
   * ":memory:" gives a private in-memory store
   */
  explicit ContentStore(const std::string& path);

  /********** documents ***********************************/

  // Writes doc as the new current version of doc.url, returns its version.
  // Throws StoreConflict when the flip fails
  int64_t put_document(const Document& doc);

  std::vector<Document> get_latest_documents(const std::optional<std::string>& topic = std::nullopt);
  std::optional<Document> get_latest_document(const std::string& url);
  std::vector<Document> document_history(const std::string& url);

  /********** records *************************************/

  // Writes rec as the new current version of rec.key. When expected_version
  // is set the write only applies if the current version still equals it
  // (0 meaning no version yet), otherwise StoreConflict
  int64_t put_record(const Record& rec,
                     std::optional<int64_t> expected_version = std::nullopt);

  std::optional<Record> get_latest_record(const std::string& key);
  std::vector<Record> get_latest_records(const std::optional<std::string>& topic = std::nullopt,
                                         const std::optional<std::string>& category = std::nullopt);
  std::vector<Record> record_history(const std::string& key);

  // Number of rows flagged current for a key, used to audit the invariant
  size_t current_count(const std::string& key);

  std::vector<std::string> topics();

private:
  std::mutex mu_;

  void apply_schema_();

  int64_t supersede_and_insert_(const char* table, const char* key_column,
                                const std::string& key,
                                std::optional<int64_t> expected_version,
                                const std::function<void(int64_t)>& insert);

  std::optional<int64_t> current_version_(const char* table, const char* key_column,
                                          const std::string& key);

  std::vector<Document> read_documents_(sqlite3_stmt* stmt);
  std::vector<Record> read_records_(sqlite3_stmt* stmt);
};

} // end namespace dat

#endif // !__CTXPIPE_CONTENT_STORE_HPP
