#include <vellum/metadata/database.h>

#include <spdlog/spdlog.h>
#include <algorithm>
#include <cstring>
#include <thread>

namespace vellum::metadata {

namespace {
constexpr int kMaxLockRetries = 5;
constexpr auto kInitialLockBackoff = std::chrono::milliseconds(10);
constexpr int kBusyTimeoutMs = 5000;
} // namespace

// Statement implementation
Statement::Statement(sqlite3* db, const std::string& sql) {
    const char* tail;
    int rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt_, &tail);
    if (rc != SQLITE_OK) {
        throw std::runtime_error("Failed to prepare statement: " + std::string(sqlite3_errmsg(db)));
    }
}

Statement::~Statement() {
    if (stmt_) {
        sqlite3_finalize(stmt_);
    }
}

Statement::Statement(Statement&& other) noexcept : stmt_(other.stmt_) {
    other.stmt_ = nullptr;
}

Statement& Statement::operator=(Statement&& other) noexcept {
    if (this != &other) {
        if (stmt_) {
            sqlite3_finalize(stmt_);
        }
        stmt_ = other.stmt_;
        other.stmt_ = nullptr;
    }
    return *this;
}

Result<void> Statement::bind(int index, std::nullptr_t) {
    if (sqlite3_bind_null(stmt_, index) != SQLITE_OK) {
        return Error{ErrorCode::DatabaseError, "Failed to bind null"};
    }
    return {};
}

Result<void> Statement::bind(int index, int value) {
    if (sqlite3_bind_int(stmt_, index, value) != SQLITE_OK) {
        return Error{ErrorCode::DatabaseError, "Failed to bind int"};
    }
    return {};
}

Result<void> Statement::bind(int index, int64_t value) {
    if (sqlite3_bind_int64(stmt_, index, value) != SQLITE_OK) {
        return Error{ErrorCode::DatabaseError, "Failed to bind int64"};
    }
    return {};
}

Result<void> Statement::bind(int index, double value) {
    if (sqlite3_bind_double(stmt_, index, value) != SQLITE_OK) {
        return Error{ErrorCode::DatabaseError, "Failed to bind double"};
    }
    return {};
}

Result<void> Statement::bind(int index, const std::string& value) {
    int rc = sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(value.size()),
                               SQLITE_TRANSIENT);
    if (rc != SQLITE_OK) {
        return Error{ErrorCode::DatabaseError, "Failed to bind string"};
    }
    return {};
}

Result<void> Statement::bind(int index, std::string_view value) {
    int rc = sqlite3_bind_text(stmt_, index, value.data(), static_cast<int>(value.size()),
                               SQLITE_TRANSIENT);
    if (rc != SQLITE_OK) {
        return Error{ErrorCode::DatabaseError, "Failed to bind string_view"};
    }
    return {};
}

Result<void> Statement::bind(int index, std::span<const std::byte> blob) {
    int rc = sqlite3_bind_blob(stmt_, index, blob.data(), static_cast<int>(blob.size()),
                               SQLITE_TRANSIENT);
    if (rc != SQLITE_OK) {
        return Error{ErrorCode::DatabaseError, "Failed to bind blob"};
    }
    return {};
}

Result<void> Statement::execute() {
    auto backoff = kInitialLockBackoff;
    for (int attempt = 0; attempt < kMaxLockRetries; ++attempt) {
        int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_DONE) {
            return {};
        }
        if ((rc == SQLITE_BUSY || rc == SQLITE_LOCKED) && attempt + 1 < kMaxLockRetries) {
            sqlite3_reset(stmt_);
            std::this_thread::sleep_for(backoff);
            backoff *= 2;
            continue;
        }
        std::string errMsg = "Failed to execute statement: " + std::string(sqlite3_errstr(rc));
        if (rc == SQLITE_CONSTRAINT) {
            if (const char* sql = sqlite3_sql(stmt_)) {
                std::string sqlSnippet(sql, std::min(strlen(sql), size_t{100}));
                errMsg += " [SQL: " + sqlSnippet + (strlen(sql) > 100 ? "..." : "") + "]";
            }
        }
        return Error{ErrorCode::DatabaseError, errMsg};
    }
    return Error{ErrorCode::DatabaseError, "Failed to execute statement: max retries exceeded"};
}

Result<bool> Statement::step() {
    auto backoff = kInitialLockBackoff;
    for (int attempt = 0; attempt < kMaxLockRetries; ++attempt) {
        int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) {
            return true;
        } else if (rc == SQLITE_DONE) {
            return false;
        }
        if ((rc == SQLITE_BUSY || rc == SQLITE_LOCKED) && attempt + 1 < kMaxLockRetries) {
            sqlite3_reset(stmt_);
            std::this_thread::sleep_for(backoff);
            backoff *= 2;
            continue;
        }
        std::string message = sqlite3_errstr(rc);
        if (sqlite3* db = sqlite3_db_handle(stmt_)) {
            message = sqlite3_errmsg(db);
        }
        return Error{ErrorCode::DatabaseError, "Failed to step statement: " + message};
    }
    return Error{ErrorCode::DatabaseError, "Failed to step statement: max retries exceeded"};
}

int Statement::getInt(int column) const {
    return sqlite3_column_int(stmt_, column);
}

int64_t Statement::getInt64(int column) const {
    return sqlite3_column_int64(stmt_, column);
}

double Statement::getDouble(int column) const {
    return sqlite3_column_double(stmt_, column);
}

std::string Statement::getString(int column) const {
    const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, column));
    if (!text)
        return "";
    return std::string(text, static_cast<std::size_t>(sqlite3_column_bytes(stmt_, column)));
}

std::vector<std::byte> Statement::getBlob(int column) const {
    const void* blob = sqlite3_column_blob(stmt_, column);
    int size = sqlite3_column_bytes(stmt_, column);
    if (!blob || size <= 0)
        return {};

    std::vector<std::byte> result(static_cast<std::size_t>(size));
    std::memcpy(result.data(), blob, static_cast<std::size_t>(size));
    return result;
}

bool Statement::isNull(int column) const {
    return sqlite3_column_type(stmt_, column) == SQLITE_NULL;
}

Result<void> Statement::reset() {
    if (!stmt_) {
        return Error{ErrorCode::DatabaseError, "Statement is null"};
    }
    if (sqlite3_reset(stmt_) != SQLITE_OK) {
        return Error{ErrorCode::DatabaseError, "Failed to reset statement"};
    }
    return {};
}

// Database implementation
Database::~Database() {
    close();
}

Database::Database(Database&& other) noexcept
    : db_(other.db_), path_(std::move(other.path_)), inTransaction_(other.inTransaction_) {
    other.db_ = nullptr;
    other.inTransaction_ = false;
}

Database& Database::operator=(Database&& other) noexcept {
    if (this != &other) {
        close();
        db_ = other.db_;
        path_ = std::move(other.path_);
        inTransaction_ = other.inTransaction_;
        other.db_ = nullptr;
        other.inTransaction_ = false;
    }
    return *this;
}

Result<void> Database::open(const std::string& path, ConnectionMode mode) {
    int flags = SQLITE_OPEN_NOMUTEX;
    switch (mode) {
        case ConnectionMode::ReadOnly:
            flags |= SQLITE_OPEN_READONLY;
            break;
        case ConnectionMode::ReadWrite:
            flags |= SQLITE_OPEN_READWRITE;
            break;
        case ConnectionMode::Create:
            flags |= SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;
            break;
    }

    int rc = sqlite3_open_v2(path.c_str(), &db_, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : "Unknown error";
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        return Error{ErrorCode::DatabaseError, "Failed to open database: " + error};
    }

    sqlite3_busy_timeout(db_, kBusyTimeoutMs);
    path_ = path;
    return {};
}

void Database::close() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
    path_.clear();
    inTransaction_ = false;
}

Result<Statement> Database::prepare(const std::string& sql) {
    if (!db_) {
        return Error{ErrorCode::NotInitialized, "Database not open"};
    }

    try {
        return Statement(db_, sql);
    } catch (const std::exception& e) {
        return Error{ErrorCode::DatabaseError, e.what()};
    }
}

Result<void> Database::execute(const std::string& sql) {
    if (!db_) {
        return Error{ErrorCode::NotInitialized, "Database not open"};
    }

    char* errMsg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        std::string error = errMsg ? errMsg : "Unknown error";
        sqlite3_free(errMsg);
        spdlog::error("SQL exec failed ({}): {}", error, sql);
        return Error{ErrorCode::DatabaseError, "Failed to execute SQL: " + error};
    }
    return {};
}

Result<void> Database::beginTransaction(bool immediate) {
    if (inTransaction_) {
        return Error{ErrorCode::InvalidState, "Already in transaction"};
    }

    auto result = execute(immediate ? "BEGIN IMMEDIATE" : "BEGIN");
    if (result) {
        inTransaction_ = true;
    }
    return result;
}

Result<void> Database::commit() {
    if (!inTransaction_) {
        return Error{ErrorCode::InvalidState, "Not in transaction"};
    }

    auto result = execute("COMMIT");
    if (result) {
        inTransaction_ = false;
    }
    return result;
}

Result<void> Database::rollback() {
    if (!inTransaction_) {
        return Error{ErrorCode::InvalidState, "Not in transaction"};
    }

    auto result = execute("ROLLBACK");
    inTransaction_ = false;
    return result;
}

int64_t Database::lastInsertRowId() const {
    return db_ ? sqlite3_last_insert_rowid(db_) : 0;
}

int Database::changes() const {
    return db_ ? sqlite3_changes(db_) : 0;
}

Result<void> Database::setBusyTimeout(std::chrono::milliseconds timeout) {
    if (!db_) {
        return Error{ErrorCode::NotInitialized, "Database not open"};
    }
    if (sqlite3_busy_timeout(db_, static_cast<int>(timeout.count())) != SQLITE_OK) {
        return Error{ErrorCode::DatabaseError, "Failed to set busy timeout"};
    }
    return {};
}

Result<void> Database::enableWAL() {
    return execute("PRAGMA journal_mode=WAL");
}

Result<void> Database::registerScalarFunction(const std::string& name, int nArgs,
                                              void (*fn)(sqlite3_context*, int, sqlite3_value**)) {
    if (!db_) {
        return Error{ErrorCode::NotInitialized, "Database not open"};
    }
    int rc = sqlite3_create_function_v2(db_, name.c_str(), nArgs,
                                        SQLITE_UTF8 | SQLITE_DETERMINISTIC, nullptr, fn, nullptr,
                                        nullptr, nullptr);
    if (rc != SQLITE_OK) {
        return Error{ErrorCode::DatabaseError,
                     "Failed to register SQL function " + name + ": " + getErrorMessage()};
    }
    return {};
}

std::string Database::version() {
    return sqlite3_libversion();
}

std::string Database::getErrorMessage() const {
    return db_ ? sqlite3_errmsg(db_) : "No database connection";
}

// ConnectionManager implementation
Result<std::shared_ptr<ConnectionManager>>
ConnectionManager::open(const std::string& path, std::vector<ConnectionInitializer> initializers) {
    std::shared_ptr<ConnectionManager> mgr(new ConnectionManager());
    mgr->path_ = path;

    if (auto r = mgr->writer_.open(path, ConnectionMode::Create); !r) {
        return r.error();
    }
    if (auto r = mgr->writer_.enableWAL(); !r) {
        return r.error();
    }
    for (const char* pragma : {"PRAGMA synchronous=NORMAL", "PRAGMA foreign_keys=ON"}) {
        if (auto r = mgr->writer_.execute(pragma); !r) {
            return r.error();
        }
    }
    for (auto& init : initializers) {
        if (auto r = mgr->addInitializer(std::move(init)); !r) {
            return r.error();
        }
    }

    spdlog::debug("[Database] opened {} (sqlite {})", path, Database::version());
    return mgr;
}

Result<void> ConnectionManager::addInitializer(ConnectionInitializer init) {
    {
        std::lock_guard<std::mutex> lock(writerMutex_);
        if (auto r = init(writer_); !r) {
            return r;
        }
    }
    std::lock_guard<std::mutex> lock(initMutex_);
    initializers_.push_back(std::move(init));
    return {};
}

Result<Database> ConnectionManager::openReader() const {
    Database reader;
    if (auto r = reader.open(path_, ConnectionMode::ReadOnly); !r) {
        return r.error();
    }
    std::lock_guard<std::mutex> lock(initMutex_);
    for (const auto& init : initializers_) {
        if (auto r = init(reader); !r) {
            return r.error();
        }
    }
    return reader;
}

} // namespace vellum::metadata
