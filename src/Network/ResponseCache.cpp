#include "ResponseCache.hpp"

#include <json/json.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <sstream>
#include <stdexcept>

#include "logger.hpp"

namespace zvukdl {

using utils::Error;
using utils::ErrorCode;
using utils::Result;

namespace {

constexpr const char* kSchema =
    "CREATE TABLE IF NOT EXISTS responses ("
    "  key TEXT PRIMARY KEY,"
    "  status INTEGER NOT NULL,"
    "  headers TEXT NOT NULL,"
    "  body BLOB NOT NULL,"
    "  created_at INTEGER NOT NULL)";

// SQLite 语句 RAII 封装
class Statement {
 public:
  Statement(sqlite3* db, const char* sql) {
    if (sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
      throw std::runtime_error(std::string("Failed to prepare statement: ") +
                               sqlite3_errmsg(db));
    }
  }
  ~Statement() {
    if (stmt_) sqlite3_finalize(stmt_);
  }
  Statement(const Statement&) = delete;
  Statement& operator=(const Statement&) = delete;

  sqlite3_stmt* get() const { return stmt_; }

 private:
  sqlite3_stmt* stmt_ = nullptr;
};

std::string headersToJson(const std::map<std::string, std::string>& headers) {
  Json::Value root(Json::objectValue);
  for (const auto& kv : headers) {
    root[kv.first] = kv.second;
  }
  Json::StreamWriterBuilder builder;
  builder["indentation"] = "";
  return Json::writeString(builder, root);
}

std::map<std::string, std::string> headersFromJson(const std::string& text) {
  std::map<std::string, std::string> headers;
  Json::Value root;
  Json::CharReaderBuilder builder;
  std::string errs;
  std::istringstream in(text);
  if (!Json::parseFromStream(builder, in, &root, &errs) || !root.isObject()) {
    return headers;
  }
  for (const auto& name : root.getMemberNames()) {
    headers[name] = root[name].asString();
  }
  return headers;
}

}  // namespace

ResponseCache::ResponseCache(const std::string& path) {
  int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;
  if (sqlite3_open_v2(path.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
    sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error("Failed to open cache '" + path + "': " + msg);
  }
  sqlite3_busy_timeout(db_, 5000);
  try {
    Exec("PRAGMA journal_mode=WAL");
    Exec("PRAGMA synchronous=FULL");
    Exec(kSchema);
  } catch (const std::runtime_error&) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
  LOG(INFO) << "[ResponseCache] opened " << path << " (" << Size()
            << " entries)";
}

ResponseCache::~ResponseCache() {
  if (db_) sqlite3_close(db_);
}

void ResponseCache::Exec(const char* sql) {
  char* err = nullptr;
  if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK) {
    std::string msg = err ? err : "unknown error";
    sqlite3_free(err);
    throw std::runtime_error("Cache statement failed (" + std::string(sql) +
                             "): " + msg);
  }
}

std::optional<HttpResponse> ResponseCache::Get(const std::string& key) {
  std::lock_guard<std::mutex> lock(mutex_);
  try {
    Statement stmt(db_,
                   "SELECT status, headers, body FROM responses WHERE key = ?");
    sqlite3_bind_text(stmt.get(), 1, key.c_str(), -1, SQLITE_TRANSIENT);
    int rc = sqlite3_step(stmt.get());
    if (rc != SQLITE_ROW) {
      if (rc != SQLITE_DONE) {
        LOG(WARN) << "[ResponseCache] lookup failed for " << key << ": "
                  << sqlite3_errmsg(db_);
      }
      return std::nullopt;
    }
    HttpResponse response;
    response.status = static_cast<long>(sqlite3_column_int64(stmt.get(), 0));
    const unsigned char* headers = sqlite3_column_text(stmt.get(), 1);
    if (headers) {
      response.headers =
          headersFromJson(reinterpret_cast<const char*>(headers));
    }
    const void* body = sqlite3_column_blob(stmt.get(), 2);
    int body_size = sqlite3_column_bytes(stmt.get(), 2);
    if (body && body_size > 0) {
      response.body.assign(static_cast<const char*>(body), body_size);
    }
    return response;
  } catch (const std::runtime_error& e) {
    LOG(WARN) << "[ResponseCache] " << e.what();
    return std::nullopt;
  }
}

Result<void> ResponseCache::Put(const std::string& key,
                                const HttpResponse& response) {
  const std::string headers = headersToJson(response.headers);
  const int64_t now = std::chrono::duration_cast<std::chrono::seconds>(
                          std::chrono::system_clock::now().time_since_epoch())
                          .count();
  std::lock_guard<std::mutex> lock(mutex_);
  try {
    Statement stmt(db_,
                   "INSERT OR REPLACE INTO responses "
                   "(key, status, headers, body, created_at) "
                   "VALUES (?, ?, ?, ?, ?)");
    sqlite3_bind_text(stmt.get(), 1, key.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt.get(), 2, response.status);
    sqlite3_bind_text(stmt.get(), 3, headers.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_blob(stmt.get(), 4, response.body.data(),
                      static_cast<int>(response.body.size()), SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt.get(), 5, now);
    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
      return Error(ErrorCode::DatabaseError,
                   "cache write failed for " + key + ": " +
                       sqlite3_errmsg(db_));
    }
  } catch (const std::runtime_error& e) {
    return Error(ErrorCode::DatabaseError, e.what());
  }
  return utils::Ok();
}

size_t ResponseCache::Size() {
  std::lock_guard<std::mutex> lock(mutex_);
  try {
    Statement stmt(db_, "SELECT COUNT(*) FROM responses");
    if (sqlite3_step(stmt.get()) == SQLITE_ROW) {
      return static_cast<size_t>(sqlite3_column_int64(stmt.get(), 0));
    }
  } catch (const std::runtime_error& e) {
    LOG(WARN) << "[ResponseCache] " << e.what();
  }
  return 0;
}

}  // namespace zvukdl
