#pragma once

#include <vellum/core/types.h>

#include <sqlite3.h>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace vellum::metadata {

/**
 * @brief Database connection mode
 */
enum class ConnectionMode {
    ReadWrite, ///< Read-write mode (default)
    ReadOnly,  ///< Read-only mode
    Create     ///< Create if not exists
};

/**
 * @brief SQLite statement wrapper with RAII
 */
class Statement {
public:
    Statement() = default;
    Statement(sqlite3* db, const std::string& sql);
    ~Statement();

    Statement(Statement&& other) noexcept;
    Statement& operator=(Statement&& other) noexcept;
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    Result<void> bind(int index, std::nullptr_t);
    Result<void> bind(int index, int value);
    Result<void> bind(int index, int64_t value);
    Result<void> bind(int index, std::size_t value) {
        return bind(index, static_cast<int64_t>(value));
    }
    Result<void> bind(int index, double value);
    Result<void> bind(int index, const std::string& value);
    Result<void> bind(int index, std::string_view value);
    Result<void> bind(int index, std::span<const std::byte> blob);
    Result<void> bind(int index, const char* value) { return bind(index, std::string_view(value)); }

    template <typename... Args> Result<void> bindAll(Args&&... args) {
        return bindHelper(1, std::forward<Args>(args)...);
    }

    /**
     * @brief Execute statement (for non-SELECT queries). Retries SQLITE_BUSY/LOCKED
     * with exponential backoff.
     */
    Result<void> execute();

    /**
     * @brief Step through results (for SELECT queries)
     * @return true if row available, false if done
     */
    Result<bool> step();

    int getInt(int column) const;
    int64_t getInt64(int column) const;
    double getDouble(int column) const;
    std::string getString(int column) const;
    std::vector<std::byte> getBlob(int column) const;
    bool isNull(int column) const;

    Result<void> reset();

private:
    sqlite3_stmt* stmt_ = nullptr;

    template <typename T, typename... Rest>
    Result<void> bindHelper(int index, T&& value, Rest&&... rest) {
        auto result = bind(index, std::forward<T>(value));
        if (!result)
            return result;
        if constexpr (sizeof...(rest) > 0) {
            return bindHelper(index + 1, std::forward<Rest>(rest)...);
        }
        return {};
    }

    Result<void> bindHelper(int) { return {}; }
};

/**
 * @brief Database connection wrapper
 */
class Database {
public:
    Database() = default;
    ~Database();

    Database(Database&& other) noexcept;
    Database& operator=(Database&& other) noexcept;
    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    Result<void> open(const std::string& path, ConnectionMode mode = ConnectionMode::ReadWrite);
    void close();
    [[nodiscard]] bool isOpen() const { return db_ != nullptr; }

    Result<Statement> prepare(const std::string& sql);
    Result<void> execute(const std::string& sql);

    /**
     * @brief Begin transaction. Writers take the RESERVED lock up front
     * (BEGIN IMMEDIATE) so a transaction never fails half way on lock upgrade.
     */
    Result<void> beginTransaction(bool immediate = false);
    Result<void> commit();
    Result<void> rollback();

    /**
     * @brief Execute within transaction; rolled back when func returns an error.
     */
    template <typename Func> Result<void> transaction(Func&& func, bool immediate = true) {
        auto beginResult = beginTransaction(immediate);
        if (!beginResult)
            return beginResult;

        try {
            Result<void> result = func();
            if (!result) {
                (void)rollback();
                return result;
            }
            return commit();
        } catch (...) {
            (void)rollback();
            throw;
        }
    }

    int64_t lastInsertRowId() const;
    int changes() const;

    Result<void> setBusyTimeout(std::chrono::milliseconds timeout);
    Result<void> enableWAL();

    /// Registers a deterministic scalar SQL function on this connection.
    Result<void> registerScalarFunction(const std::string& name, int nArgs,
                                        void (*fn)(sqlite3_context*, int, sqlite3_value**));

    static std::string version();
    [[nodiscard]] const std::string& path() const { return path_; }

private:
    sqlite3* db_ = nullptr;
    std::string path_;
    bool inTransaction_ = false;

    std::string getErrorMessage() const;
};

/// Hook run on every connection a ConnectionManager opens (functions, pragmas).
using ConnectionInitializer = std::function<Result<void>(Database&)>;

/**
 * @brief One serialized writer connection plus on-demand read-only connections
 * to the same SQLite file (WAL mode).
 */
class ConnectionManager {
public:
    static Result<std::shared_ptr<ConnectionManager>>
    open(const std::string& path, std::vector<ConnectionInitializer> initializers = {});

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    /// Runs `fn` with exclusive use of the writer connection.
    template <typename Fn> auto withWriter(Fn&& fn) -> decltype(fn(std::declval<Database&>())) {
        std::lock_guard<std::mutex> lock(writerMutex_);
        return fn(writer_);
    }

    /// Fresh read-only connection; it sees the last committed state when first read.
    Result<Database> openReader() const;

    /// Installs an initializer on the writer and on every reader opened afterwards.
    Result<void> addInitializer(ConnectionInitializer init);

    [[nodiscard]] const std::string& path() const { return path_; }

private:
    ConnectionManager() = default;

    std::string path_;
    Database writer_;
    std::mutex writerMutex_;
    std::vector<ConnectionInitializer> initializers_;
    mutable std::mutex initMutex_;
};

} // namespace vellum::metadata
