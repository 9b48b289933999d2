/*
 * content_store.cpp  Andrew Belles  Nov 20th, 2025
 *
 * sqlite implementation of the versioned ContentStore
 *
 */

#include "ctxpipe/store/content_store.hpp"

#include "ctxpipe/crawler/json.hpp"
#include "ctxpipe/logging.hpp"

#include <exception>
#include <string_view>

/************ SQL Queries *********************************/
namespace {

const std::string schema_sql =
R"(
CREATE TABLE IF NOT EXISTS documents (
  id            INTEGER PRIMARY KEY AUTOINCREMENT,
  url           TEXT    NOT NULL,
  topic         TEXT    NOT NULL,
  title         TEXT,
  content_text  TEXT,
  content_raw   TEXT,
  links         TEXT,
  depth         INTEGER NOT NULL DEFAULT 0,
  relevance     REAL    NOT NULL DEFAULT 0,
  fetched_at    INTEGER NOT NULL,
  version       INTEGER NOT NULL,
  is_latest     INTEGER NOT NULL DEFAULT 1,
  UNIQUE(url, version)
);
CREATE UNIQUE INDEX IF NOT EXISTS idx_documents_current
  ON documents(url) WHERE is_latest = 1;
CREATE INDEX IF NOT EXISTS idx_documents_topic
  ON documents(topic, is_latest);

CREATE TABLE IF NOT EXISTS records (
  id            INTEGER PRIMARY KEY AUTOINCREMENT,
  record_key    TEXT    NOT NULL,
  kind          TEXT    NOT NULL,
  topic         TEXT    NOT NULL,
  category      TEXT,
  name          TEXT,
  fields        TEXT,
  summary       TEXT,
  key_points    TEXT,
  source_urls   TEXT,
  updated_at    INTEGER NOT NULL,
  version       INTEGER NOT NULL,
  is_latest     INTEGER NOT NULL DEFAULT 1,
  UNIQUE(record_key, version)
);
CREATE UNIQUE INDEX IF NOT EXISTS idx_records_current
  ON records(record_key) WHERE is_latest = 1;
CREATE INDEX IF NOT EXISTS idx_records_topic
  ON records(topic, category, is_latest);
)";

const std::string insert_document_sql =
R"(
INSERT INTO documents (
  url, topic, title, content_text, content_raw, links,
  depth, relevance, fetched_at, version, is_latest
) VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, 1);
)";

const std::string insert_record_sql =
R"(
INSERT INTO records (
  record_key, kind, topic, category, name, fields, summary,
  key_points, source_urls, updated_at, version, is_latest
) VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11, 1);
)";

const std::string document_columns =
  "url, topic, title, content_text, content_raw, links, depth, relevance, "
  "fetched_at, version, is_latest";

const std::string record_columns =
  "record_key, kind, topic, category, name, fields, summary, key_points, "
  "source_urls, updated_at, version, is_latest";

}

namespace dat {

ContentStore::ContentStore(const std::string& path)
  : Base(path)
{
  apply_schema_();
  lgr::get("store")->debug("opened content store at {}", path);
}

void
ContentStore::apply_schema_()
{
  std::lock_guard<std::mutex> lock(mu_);
  exec("PRAGMA foreign_keys = ON;");
  exec(schema_sql);
}

/********** ContentStore::current_version_ ****************/
/* Version of the row currently flagged latest for key, if any. Caller
 * holds mu_
 */
std::optional<int64_t>
ContentStore::current_version_(const char* table, const char* key_column,
                               const std::string& key)
{
  const std::string sql = std::string("SELECT version FROM ") + table +
    " WHERE " + key_column + " = ?1 AND is_latest = 1;";
  auto stmt = prepare(sql);
  bind(stmt.get(), 1, key);
  if ( step(stmt.get()) ) {
    return column_int(stmt.get(), 0);
  }
  return std::nullopt;
}

/********** ContentStore::supersede_and_insert_ ***********/
/* The only state transition of the version machine. Marks the current row
 * of key superseded and inserts its successor inside one immediate
 * transaction. insert receives the version to write.
 *
 * Throws:
 *   StoreConflict on expected_version mismatch or any failure inside the
 *   transaction (rolled back, nothing is half applied)
 */
int64_t
ContentStore::supersede_and_insert_(const char* table, const char* key_column,
                                    const std::string& key,
                                    std::optional<int64_t> expected_version,
                                    const std::function<void(int64_t)>& insert)
{
  std::lock_guard<std::mutex> lock(mu_);
  try {
    Tx tx(*this, true);

    const auto current = current_version_(table, key_column, key);
    if ( expected_version && *expected_version != current.value_or(0) ) {
      throw StoreConflict(key, "expected version " + std::to_string(*expected_version) +
                               ", current is " + std::to_string(current.value_or(0)));
    }

    int64_t next = 1;
    {
      const std::string sql = std::string("SELECT COALESCE(MAX(version), 0) FROM ") +
        table + " WHERE " + key_column + " = ?1;";
      auto stmt = prepare(sql);
      bind(stmt.get(), 1, key);
      if ( step(stmt.get()) ) {
        next = column_int(stmt.get(), 0) + 1;
      }
    }

    if ( current ) {
      const std::string sql = std::string("UPDATE ") + table +
        " SET is_latest = 0 WHERE " + key_column + " = ?1 AND is_latest = 1;";
      auto stmt = prepare(sql);
      bind(stmt.get(), 1, key);
      step(stmt.get());
    }

    insert(next);
    tx.commit();
    return next;
  } catch (const StoreConflict&) {
    throw;
  } catch (const std::exception& e) {
    std::throw_with_nested(StoreConflict(key, std::string("version flip failed: ") + e.what()));
  }
}

/********** documents *************************************/

int64_t
ContentStore::put_document(const Document& doc)
{
  if ( doc.url.empty() ) {
    throw std::invalid_argument("ContentStore::put_document: document url is empty");
  }

  const std::string links = boost::json::serialize(jsc::to_array(doc.links));
  const int64_t fetched_at = doc.fetched_at > 0 ? doc.fetched_at : now_ms();

  const int64_t version = supersede_and_insert_("documents", "url", doc.url, std::nullopt,
    [&](int64_t next) {
      auto stmt = prepare(insert_document_sql);
      bind(stmt.get(), 1, doc.url);
      bind(stmt.get(), 2, doc.topic);
      bind(stmt.get(), 3, doc.title);
      bind(stmt.get(), 4, doc.content_text);
      bind(stmt.get(), 5, doc.content_raw);
      bind(stmt.get(), 6, links);
      bind_int(stmt.get(), 7, static_cast<int64_t>(doc.depth));
      bind_double(stmt.get(), 8, doc.relevance);
      bind_int(stmt.get(), 9, fetched_at);
      bind_int(stmt.get(), 10, next);
      step(stmt.get());
    });

  lgr::get("store")->debug("document {} -> version {}", doc.url, version);
  return version;
}

std::vector<Document>
ContentStore::read_documents_(sqlite3_stmt* stmt)
{
  std::vector<Document> out;
  while ( step(stmt) ) {
    Document doc{};
    doc.url          = column_text(stmt, 0);
    doc.topic        = column_text(stmt, 1);
    doc.title        = column_text(stmt, 2);
    doc.content_text = column_text(stmt, 3);
    doc.content_raw  = column_text(stmt, 4);
    doc.links        = jsc::decode_strings(column_text(stmt, 5));
    doc.depth        = static_cast<size_t>(column_int(stmt, 6));
    doc.relevance    = column_double(stmt, 7);
    doc.fetched_at   = column_int(stmt, 8);
    doc.version      = column_int(stmt, 9);
    doc.is_latest    = column_int(stmt, 10) != 0;
    out.push_back(std::move(doc));
  }
  return out;
}

std::vector<Document>
ContentStore::get_latest_documents(const std::optional<std::string>& topic)
{
  std::lock_guard<std::mutex> lock(mu_);
  std::string sql = "SELECT " + document_columns + " FROM documents WHERE is_latest = 1";
  if ( topic ) {
    sql += " AND topic = ?1";
  }
  sql += " ORDER BY url;";

  auto stmt = prepare(sql);
  if ( topic ) {
    bind(stmt.get(), 1, *topic);
  }
  return read_documents_(stmt.get());
}

std::optional<Document>
ContentStore::get_latest_document(const std::string& url)
{
  std::lock_guard<std::mutex> lock(mu_);
  auto stmt = prepare("SELECT " + document_columns +
                      " FROM documents WHERE url = ?1 AND is_latest = 1;");
  bind(stmt.get(), 1, url);
  auto docs = read_documents_(stmt.get());
  if ( docs.empty() ) {
    return std::nullopt;
  }
  return std::move(docs.front());
}

std::vector<Document>
ContentStore::document_history(const std::string& url)
{
  std::lock_guard<std::mutex> lock(mu_);
  auto stmt = prepare("SELECT " + document_columns +
                      " FROM documents WHERE url = ?1 ORDER BY version DESC;");
  bind(stmt.get(), 1, url);
  return read_documents_(stmt.get());
}

/********** records ***************************************/

int64_t
ContentStore::put_record(const Record& rec, std::optional<int64_t> expected_version)
{
  if ( rec.key.empty() ) {
    throw std::invalid_argument("ContentStore::put_record: record key is empty");
  }

  const std::string fields  = boost::json::serialize(rec.fields);
  const std::string points  = boost::json::serialize(jsc::to_array(rec.key_points));
  const std::string sources = boost::json::serialize(jsc::to_array(rec.source_urls));
  const int64_t updated_at  = now_ms();

  const int64_t version = supersede_and_insert_("records", "record_key", rec.key,
    expected_version,
    [&](int64_t next) {
      auto stmt = prepare(insert_record_sql);
      bind(stmt.get(), 1, rec.key);
      bind(stmt.get(), 2, to_string(rec.kind));
      bind(stmt.get(), 3, rec.topic);
      bind(stmt.get(), 4, rec.category);
      bind(stmt.get(), 5, rec.name);
      bind(stmt.get(), 6, fields);
      bind(stmt.get(), 7, rec.summary);
      bind(stmt.get(), 8, points);
      bind(stmt.get(), 9, sources);
      bind_int(stmt.get(), 10, updated_at);
      bind_int(stmt.get(), 11, next);
      step(stmt.get());
    });

  lgr::get("store")->debug("record {} -> version {}", rec.key, version);
  return version;
}

std::vector<Record>
ContentStore::read_records_(sqlite3_stmt* stmt)
{
  std::vector<Record> out;
  while ( step(stmt) ) {
    Record rec{};
    rec.key        = column_text(stmt, 0);
    rec.kind       = parse_kind(column_text(stmt, 1)).value_or(RecordKind::Entity);
    rec.topic      = column_text(stmt, 2);
    rec.category   = column_text(stmt, 3);
    rec.name       = column_text(stmt, 4);

    const auto fields = column_text(stmt, 5);
    if ( !fields.empty() ) {
      rec.fields = jsc::as_obj(jsc::parse(fields));
    }

    rec.summary     = column_text(stmt, 6);
    rec.key_points  = jsc::decode_strings(column_text(stmt, 7));
    rec.source_urls = jsc::decode_strings(column_text(stmt, 8));
    rec.updated_at  = column_int(stmt, 9);
    rec.version     = column_int(stmt, 10);
    rec.is_latest   = column_int(stmt, 11) != 0;
    out.push_back(std::move(rec));
  }
  return out;
}

std::optional<Record>
ContentStore::get_latest_record(const std::string& key)
{
  std::lock_guard<std::mutex> lock(mu_);
  auto stmt = prepare("SELECT " + record_columns +
                      " FROM records WHERE record_key = ?1 AND is_latest = 1;");
  bind(stmt.get(), 1, key);
  auto recs = read_records_(stmt.get());
  if ( recs.empty() ) {
    return std::nullopt;
  }
  return std::move(recs.front());
}

std::vector<Record>
ContentStore::get_latest_records(const std::optional<std::string>& topic,
                                 const std::optional<std::string>& category)
{
  std::lock_guard<std::mutex> lock(mu_);
  std::string sql = "SELECT " + record_columns + " FROM records WHERE is_latest = 1";
  int idx = 1;
  if ( topic ) {
    sql += " AND topic = ?" + std::to_string(idx++);
  }
  if ( category ) {
    sql += " AND category = ?" + std::to_string(idx++);
  }
  sql += " ORDER BY record_key;";

  auto stmt = prepare(sql);
  idx = 1;
  if ( topic ) {
    bind(stmt.get(), idx++, *topic);
  }
  if ( category ) {
    bind(stmt.get(), idx++, *category);
  }
  return read_records_(stmt.get());
}

std::vector<Record>
ContentStore::record_history(const std::string& key)
{
  std::lock_guard<std::mutex> lock(mu_);
  auto stmt = prepare("SELECT " + record_columns +
                      " FROM records WHERE record_key = ?1 ORDER BY version DESC;");
  bind(stmt.get(), 1, key);
  return read_records_(stmt.get());
}

size_t
ContentStore::current_count(const std::string& key)
{
  std::lock_guard<std::mutex> lock(mu_);
  auto stmt = prepare(
    "SELECT (SELECT COUNT(*) FROM records WHERE record_key = ?1 AND is_latest = 1) + "
    "(SELECT COUNT(*) FROM documents WHERE url = ?1 AND is_latest = 1);");
  bind(stmt.get(), 1, key);
  if ( step(stmt.get()) ) {
    return static_cast<size_t>(column_int(stmt.get(), 0));
  }
  return 0;
}

std::vector<std::string>
ContentStore::topics()
{
  std::lock_guard<std::mutex> lock(mu_);
  auto stmt = prepare(
    "SELECT topic FROM documents WHERE is_latest = 1 "
    "UNION SELECT topic FROM records WHERE is_latest = 1 ORDER BY topic;");
  std::vector<std::string> out;
  while ( step(stmt.get()) ) {
    out.push_back(column_text(stmt.get(), 0));
  }
  return out;
}

}
