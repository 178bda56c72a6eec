#include "cache_backend.hpp"
#include "../utils/logger.hpp"

namespace cachex {

// --- KeyRange ---------------------------------------------------------------

void KeyRange::iterator::fetch(int64_t cursor) {
    // Skip empty pages until a key shows up or the scan wraps to 0
    for (;;) {
        ScanResult res = range_->backend_->scan(cursor, range_->pattern_, range_->itersize_);
        page_ = std::move(res.keys);
        index_ = 0;
        next_cursor_ = res.next_cursor;
        if (!page_.empty()) return;
        if (next_cursor_ == 0) {
            range_ = nullptr;
            return;
        }
        cursor = next_cursor_;
    }
}

KeyRange::iterator& KeyRange::iterator::operator++() {
    if (done()) return *this;
    if (++index_ < page_.size()) return *this;
    if (next_cursor_ == 0) {
        range_ = nullptr;
        page_.clear();
        return *this;
    }
    fetch(next_cursor_);
    return *this;
}

// --- Native-only surface ----------------------------------------------------

void CacheBackend::not_supported(const char* operation) const {
    LOG_DBG("[%s] %s is not available on this backend", backend_name(), operation);
    throw NotSupportedError(operation, backend_name());
}

std::string CacheBackend::xadd(const std::string&, const std::map<std::string, std::string>&,
                               const std::string&) {
    not_supported("xadd");
}

int64_t CacheBackend::xlen(const std::string&) { not_supported("xlen"); }

std::vector<StreamEntry> CacheBackend::xrange(const std::string&, const std::string&,
                                              const std::string&, std::optional<int64_t>) {
    not_supported("xrange");
}

std::vector<StreamEntry> CacheBackend::xrevrange(const std::string&, const std::string&,
                                                 const std::string&, std::optional<int64_t>) {
    not_supported("xrevrange");
}

StreamReadResult CacheBackend::xread(const std::map<std::string, std::string>&,
                                     std::optional<int64_t>, std::optional<int64_t>) {
    not_supported("xread");
}

int64_t CacheBackend::xtrim(const std::string&, int64_t) { not_supported("xtrim"); }

int64_t CacheBackend::xdel(const std::string&, const std::vector<std::string>&) {
    not_supported("xdel");
}

bool CacheBackend::xgroup_create(const std::string&, const std::string&, const std::string&, bool) {
    not_supported("xgroup_create");
}

int64_t CacheBackend::xgroup_destroy(const std::string&, const std::string&) {
    not_supported("xgroup_destroy");
}

StreamReadResult CacheBackend::xreadgroup(const std::string&, const std::string&,
                                          const std::map<std::string, std::string>&,
                                          std::optional<int64_t>) {
    not_supported("xreadgroup");
}

int64_t CacheBackend::xack(const std::string&, const std::string&, const std::vector<std::string>&) {
    not_supported("xack");
}

Value CacheBackend::eval(const std::string&, const std::vector<std::string>&,
                         const std::vector<std::string>&) {
    not_supported("eval");
}

std::optional<std::pair<std::string, Value>> CacheBackend::blpop(const std::vector<std::string>&, double) {
    not_supported("blpop");
}

std::optional<std::pair<std::string, Value>> CacheBackend::brpop(const std::vector<std::string>&, double) {
    not_supported("brpop");
}

std::optional<Value> CacheBackend::blmove(const std::string&, const std::string&,
                                          ListEnd, ListEnd, double) {
    not_supported("blmove");
}

std::pair<int64_t, ValueSet> CacheBackend::sscan(const std::string&, int64_t,
                                                 const std::optional<std::string>&,
                                                 std::optional<int64_t>) {
    not_supported("sscan");
}

std::unique_ptr<CacheLock> CacheBackend::lock(const std::string&, std::optional<double>) {
    not_supported("lock");
}

std::map<std::string, std::string> CacheBackend::info(const std::string&) {
    not_supported("info");
}

std::vector<Value> CacheBackend::slowlog_get(int64_t) { not_supported("slowlog_get"); }

int64_t CacheBackend::slowlog_len() { not_supported("slowlog_len"); }

} // namespace cachex
