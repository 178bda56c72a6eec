#include "pg_connection.hpp"
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include "../../utils/logger.hpp"
#include "../../utils/timer.hpp"

namespace cachex {

// --- PgResult ---------------------------------------------------------------

std::string PgResult::bytes(int row, int col) const {
    size_t len = 0;
    unsigned char* raw = PQunescapeBytea(
        reinterpret_cast<const unsigned char*>(PQgetvalue(res_, row, col)), &len);
    if (!raw) throw DatabaseError("PQunescapeBytea failed (out of memory)");
    std::string out(reinterpret_cast<const char*>(raw), len);
    PQfreemem(raw);
    return out;
}

int64_t PgResult::int64(int row, int col) const {
    return std::strtoll(PQgetvalue(res_, row, col), nullptr, 10);
}

double PgResult::dbl(int row, int col) const {
    // strtod understands "Infinity" and "-Infinity" as printed by float8out
    return std::strtod(PQgetvalue(res_, row, col), nullptr);
}

int64_t PgResult::affected() const {
    const char* n = res_ ? PQcmdTuples(res_) : "";
    return (n && *n) ? std::strtoll(n, nullptr, 10) : 0;
}

// --- PgParams ---------------------------------------------------------------

PgParams& PgParams::dbl(double v) {
    if (std::isinf(v)) return push(v > 0 ? "Infinity" : "-Infinity", 701 /* float8 */, 0);
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.17g", v);
    return push(buf, 701, 0);
}

// --- PgConnection -----------------------------------------------------------

PgConnection::PgConnection(const std::string& conninfo) {
    conn_ = PQconnectdb(conninfo.c_str());
    if (PQstatus(conn_) != CONNECTION_OK) {
        std::string msg = PQerrorMessage(conn_);
        while (!msg.empty() && (msg.back() == '\n' || msg.back() == ' ')) msg.pop_back();
        LOG_ERR("[postgresql] Connection failed: %s", msg.c_str());
        PQfinish(conn_);
        conn_ = nullptr;
        throw DatabaseError("connection failed: " + msg, "08001");
    }
    LOG_DBG("[postgresql] Connected to %s:%s/%s (server %s)",
        PQhost(conn_), PQport(conn_), PQdb(conn_), server_version());
}

PgConnection::~PgConnection() {
    if (conn_) PQfinish(conn_);
}

PgResult PgConnection::exec(const std::string& sql, const PgParams& params) {
    std::vector<const char*> values(params.values_.size());
    std::vector<int> lengths(params.values_.size());
    for (size_t i = 0; i < params.values_.size(); i++) {
        values[i] = params.is_null_[i] ? nullptr : params.values_[i].data();
        lengths[i] = static_cast<int>(params.values_[i].size());
    }

    Timer timer;
    PGresult* raw = PQexecParams(conn_, sql.c_str(), params.size(),
        params.types_.data(), values.data(), lengths.data(), params.formats_.data(), 0);

    ExecStatusType status = raw ? PQresultStatus(raw) : PGRES_FATAL_ERROR;
    if (status != PGRES_COMMAND_OK && status != PGRES_TUPLES_OK) {
        std::string msg = raw ? PQresultErrorMessage(raw) : PQerrorMessage(conn_);
        while (!msg.empty() && (msg.back() == '\n' || msg.back() == ' ')) msg.pop_back();
        const char* state = raw ? PQresultErrorField(raw, PG_DIAG_SQLSTATE) : nullptr;
        std::string sqlstate = state ? state : "";
        if (raw) PQclear(raw);
        LOG_ERR("[postgresql] SQL error: %s\n  SQL: %s", msg.c_str(), sql.c_str());
        throw DatabaseError(msg, sqlstate);
    }

    LOG_DBG("[postgresql] %.3f ms: %s", timer.elapsed_ms(), sql.c_str());
    return PgResult(raw);
}

bool PgConnection::healthy() const {
    return conn_ && PQstatus(conn_) == CONNECTION_OK;
}

bool PgConnection::reset() {
    PQreset(conn_);
    if (PQstatus(conn_) == CONNECTION_OK) {
        LOG_INF("[postgresql] PQreset successful (server %s)", server_version());
        return true;
    }
    LOG_WRN("[postgresql] PQreset failed: %s", PQerrorMessage(conn_));
    return false;
}

const char* PgConnection::server_version() const {
    const char* v = PQparameterStatus(conn_, "server_version");
    return v ? v : "?";
}

// --- PgPool -----------------------------------------------------------------

PgPool::PgPool(std::string conninfo, size_t max_size)
    : conninfo_(std::move(conninfo)), max_size_(max_size) {}

PgPool::Lease PgPool::acquire() {
    std::unique_lock<std::mutex> lock(mu_);
    cv_.wait(lock, [&] { return !idle_.empty() || created_ < max_size_; });

    if (!idle_.empty()) {
        auto conn = std::move(idle_.back());
        idle_.pop_back();
        lock.unlock();

        if (!conn->healthy()) {
            LOG_WRN("[pool] Borrowed a broken connection, resetting");
            if (!conn->reset()) {
                lock.lock();
                created_--;
                lock.unlock();
                cv_.notify_one();
                throw DatabaseError("connection lost and PQreset failed", "08006");
            }
        }
        return Lease(this, std::move(conn));
    }

    size_t slot = ++created_;
    lock.unlock();
    try {
        auto conn = std::make_unique<PgConnection>(conninfo_);
        LOG_DBG("[pool] Opened connection %zu/%zu", slot, max_size_);
        return Lease(this, std::move(conn));
    } catch (const DatabaseError&) {
        lock.lock();
        created_--;
        lock.unlock();
        cv_.notify_one();
        throw;
    }
}

void PgPool::release(std::unique_ptr<PgConnection> conn) {
    {
        std::lock_guard<std::mutex> lock(mu_);
        idle_.push_back(std::move(conn));
    }
    cv_.notify_one();
}

// --- Transaction ------------------------------------------------------------

Transaction::Transaction(PgConnection& conn) : conn_(conn) {
    conn_.exec("BEGIN");
}

Transaction::~Transaction() {
    if (finished_) return;
    try {
        conn_.exec("ROLLBACK");
    } catch (const DatabaseError& e) {
        // Connection is gone; the pool resets it on the next borrow
        LOG_WRN("[postgresql] ROLLBACK failed: %s", e.what());
    }
}

void Transaction::commit() {
    conn_.exec("COMMIT");
    finished_ = true;
}

} // namespace cachex
