#pragma once
// libpq plumbing: RAII result, bound parameter list, pooled connections and
// a transaction guard. Every failure surfaces as DatabaseError.
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <libpq-fe.h>
#include "../../errors.hpp"

namespace cachex {

class PgResult {
public:
    PgResult() = default;
    explicit PgResult(PGresult* res) : res_(res) {}
    ~PgResult() { if (res_) PQclear(res_); }

    PgResult(PgResult&& o) noexcept : res_(o.res_) { o.res_ = nullptr; }
    PgResult& operator=(PgResult&& o) noexcept {
        if (this != &o) {
            if (res_) PQclear(res_);
            res_ = o.res_;
            o.res_ = nullptr;
        }
        return *this;
    }
    PgResult(const PgResult&) = delete;
    PgResult& operator=(const PgResult&) = delete;

    [[nodiscard]] int rows() const { return res_ ? PQntuples(res_) : 0; }
    [[nodiscard]] bool empty() const { return rows() == 0; }
    [[nodiscard]] bool is_null(int row, int col) const { return PQgetisnull(res_, row, col) != 0; }

    [[nodiscard]] std::string text(int row, int col) const {
        return std::string(PQgetvalue(res_, row, col), PQgetlength(res_, row, col));
    }
    // bytea column in text result format
    [[nodiscard]] std::string bytes(int row, int col) const;
    [[nodiscard]] int64_t int64(int row, int col) const;
    [[nodiscard]] double dbl(int row, int col) const;

    // Rows touched by INSERT/UPDATE/DELETE
    [[nodiscard]] int64_t affected() const;

private:
    PGresult* res_ = nullptr;
};

// Positional parameters for PQexecParams. Text is sent as-is, bytes in
// binary format so payloads never need escaping.
class PgParams {
public:
    PgParams& text(std::string v) { return push(std::move(v), 0, 0); }
    PgParams& bytes(std::string v) { return push(std::move(v), 17 /* bytea */, 1); }
    PgParams& int64(int64_t v) { return push(std::to_string(v), 20 /* int8 */, 0); }
    PgParams& dbl(double v);

    // "$n" for the parameter about to be pushed
    [[nodiscard]] std::string next_placeholder() const { return "$" + std::to_string(values_.size() + 1); }
    [[nodiscard]] int size() const { return static_cast<int>(values_.size()); }

private:
    friend class PgConnection;

    PgParams& push(std::string v, unsigned int oid, int format) {
        values_.push_back(std::move(v));
        is_null_.push_back(false);
        types_.push_back(oid);
        formats_.push_back(format);
        return *this;
    }

    std::vector<std::string> values_;
    std::vector<bool> is_null_;
    std::vector<unsigned int> types_;
    std::vector<int> formats_;
};

class PgConnection {
public:
    explicit PgConnection(const std::string& conninfo);
    ~PgConnection();

    PgConnection(const PgConnection&) = delete;
    PgConnection& operator=(const PgConnection&) = delete;

    PgResult exec(const std::string& sql, const PgParams& params = {});

    [[nodiscard]] bool healthy() const;
    // PQreset reuses the original parameters; true once the link is back
    bool reset();

    [[nodiscard]] const char* server_version() const;

private:
    PGconn* conn_ = nullptr;
};

class PgPool {
public:
    // Returns the connection to the pool when it goes out of scope
    class Lease {
    public:
        Lease(PgPool* pool, std::unique_ptr<PgConnection> conn) : pool_(pool), conn_(std::move(conn)) {}
        ~Lease() { if (conn_) pool_->release(std::move(conn_)); }

        Lease(Lease&&) noexcept = default;
        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;

        PgConnection& operator*() { return *conn_; }
        PgConnection* operator->() { return conn_.get(); }

    private:
        PgPool* pool_;
        std::unique_ptr<PgConnection> conn_;
    };

    // Connections open lazily, up to max_size
    PgPool(std::string conninfo, size_t max_size);

    Lease acquire();

private:
    void release(std::unique_ptr<PgConnection> conn);

    std::string conninfo_;
    size_t max_size_;
    size_t created_ = 0;
    mutable std::mutex mu_;
    std::condition_variable cv_;
    std::vector<std::unique_ptr<PgConnection>> idle_;
};

// BEGIN on construction, ROLLBACK on destruction unless commit() ran
class Transaction {
public:
    explicit Transaction(PgConnection& conn);
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit();

private:
    PgConnection& conn_;
    bool finished_ = false;
};

} // namespace cachex
