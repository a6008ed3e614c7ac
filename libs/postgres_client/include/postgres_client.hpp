#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <libpq-fe.h>

namespace edgesync {

/// Configuration for the local PostgreSQL job database
struct PostgresConfig {
    std::string host = "localhost";
    int port = 5432;
    std::string database = "edgesync";
    std::string user = "edgesync";
    std::string password = "edgesync_dev";
    int connect_timeout = 10;
};

/// Row from a query result
class PostgresRow {
public:
    PostgresRow(PGresult* result, int row);

    /// Get column value as string (empty string if NULL)
    std::string get_string(int col) const;
    std::string get_string(const std::string& col_name) const;

    /// Get column value as int (0 if NULL)
    int get_int(int col) const;
    int get_int(const std::string& col_name) const;

    /// Get column value as int64 (0 if NULL)
    int64_t get_int64(int col) const;
    int64_t get_int64(const std::string& col_name) const;

    /// Check if column is NULL
    bool is_null(int col) const;
    bool is_null(const std::string& col_name) const;

    int num_columns() const;

private:
    int get_col_index(const std::string& col_name) const;

    PGresult* result_;
    int row_;
};

/// Query result wrapper, owns the PGresult
class PostgresResult {
public:
    explicit PostgresResult(PGresult* result);
    ~PostgresResult();

    PostgresResult(PostgresResult&& other) noexcept;
    PostgresResult& operator=(PostgresResult&& other) noexcept;

    // Non-copyable
    PostgresResult(const PostgresResult&) = delete;
    PostgresResult& operator=(const PostgresResult&) = delete;

    /// Check if query was successful
    bool ok() const;

    /// Get error message (empty if ok)
    std::string error() const;

    int num_rows() const;
    int num_columns() const;

    PostgresRow row(int index) const;

    /// Number of affected rows (for INSERT/UPDATE/DELETE)
    int affected_rows() const;

    class Iterator {
    public:
        Iterator(const PostgresResult* result, int row);
        PostgresRow operator*() const;
        Iterator& operator++();
        bool operator!=(const Iterator& other) const;

    private:
        const PostgresResult* result_;
        int row_;
    };

    Iterator begin() const;
    Iterator end() const;

private:
    PGresult* result_;
};

/// PostgreSQL client wrapper (single connection, not thread-safe)
class PostgresClient {
public:
    explicit PostgresClient(const PostgresConfig& config);
    ~PostgresClient();

    // Non-copyable
    PostgresClient(const PostgresClient&) = delete;
    PostgresClient& operator=(const PostgresClient&) = delete;

    bool is_connected() const;

    /// Reconnect if connection was lost. Refused inside a transaction,
    /// since the server has already rolled the transaction back.
    bool reconnect();

    /// Execute a query with no parameters
    PostgresResult execute(const std::string& query);

    /// Execute a query with parameters (prevents SQL injection)
    PostgresResult execute(const std::string& query,
                          const std::vector<std::string>& params);

    bool begin_transaction();
    bool commit();
    bool rollback();

    std::string last_error() const;

private:
    void connect();

    PostgresConfig config_;
    PGconn* conn_ = nullptr;
    bool in_transaction_ = false;
};

/// Scope guard: BEGIN on construction, ROLLBACK on destruction unless
/// commit() succeeded.
class PostgresTransaction {
public:
    explicit PostgresTransaction(PostgresClient& client);
    ~PostgresTransaction();

    PostgresTransaction(const PostgresTransaction&) = delete;
    PostgresTransaction& operator=(const PostgresTransaction&) = delete;

    /// True if BEGIN succeeded
    bool active() const { return active_; }

    bool commit();

private:
    PostgresClient& client_;
    bool active_ = false;
};

}  // namespace edgesync
