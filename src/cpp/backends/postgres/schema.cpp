#include "schema.hpp"
#include <cctype>
#include "../../errors.hpp"

namespace cachex {

namespace {

// Longest auxiliary suffix is "_hashes"/"_zsets_score_idx"; NAMEDATALEN is 64
constexpr size_t kMaxBaseName = 63 - 16;

std::string quote_ident(const std::string& name) { return "\"" + name + "\""; }

} // namespace

bool TableSet::is_identifier(std::string_view name) {
    if (name.empty()) return false;
    if (!(std::isalpha(static_cast<unsigned char>(name[0])) || name[0] == '_')) return false;
    for (char c : name) {
        if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '_')) return false;
    }
    return true;
}

TableSet::TableSet(const std::string& schema, const std::string& table)
    : schema_(schema), table_(table) {
    if (!is_identifier(table) || table.size() > kMaxBaseName) {
        throw ConfigError("invalid table name '" + table + "'");
    }
    if (!schema.empty() && !is_identifier(schema)) {
        throw ConfigError("invalid schema name '" + schema + "'");
    }
    main_ = qualify(table);
    aux_ = {qualify(table + "_hashes"), qualify(table + "_lists"),
            qualify(table + "_sets"), qualify(table + "_zsets")};
}

std::string TableSet::qualify(const std::string& name) const {
    if (schema_.empty()) return quote_ident(name);
    return quote_ident(schema_) + "." + quote_ident(name);
}

std::string TableSet::render(std::string_view tmpl) const {
    std::string out;
    out.reserve(tmpl.size() + 64);
    size_t i = 0;
    while (i < tmpl.size()) {
        if (tmpl[i] == '{') {
            size_t close = tmpl.find('}', i);
            if (close != std::string_view::npos) {
                std::string_view name = tmpl.substr(i + 1, close - i - 1);
                const std::string* rep = nullptr;
                if (name == "main") rep = &main_;
                else if (name == "hashes") rep = &aux_[0];
                else if (name == "lists") rep = &aux_[1];
                else if (name == "sets") rep = &aux_[2];
                else if (name == "zsets") rep = &aux_[3];
                if (rep) {
                    out += *rep;
                    i = close + 1;
                    continue;
                }
            }
        }
        out += tmpl[i++];
    }
    return out;
}

std::vector<std::string> TableSet::create_statements(bool unlogged) const {
    const std::string create = unlogged ? "CREATE UNLOGGED TABLE IF NOT EXISTS " : "CREATE TABLE IF NOT EXISTS ";
    std::vector<std::string> sql;
    if (!schema_.empty()) sql.push_back("CREATE SCHEMA IF NOT EXISTS " + quote_ident(schema_));

    sql.push_back(create + main_ + " ("
        "key TEXT PRIMARY KEY,"
        " type SMALLINT NOT NULL DEFAULT 0,"
        " value BYTEA,"
        " expires_at TIMESTAMPTZ)");
    sql.push_back("CREATE INDEX IF NOT EXISTS " + quote_ident(table_ + "_expires_idx") +
        " ON " + main_ + " (expires_at) WHERE expires_at IS NOT NULL");

    sql.push_back(create + aux_[0] + " ("
        "key TEXT NOT NULL,"
        " field TEXT NOT NULL,"
        " value BYTEA NOT NULL,"
        " PRIMARY KEY (key, field))");
    sql.push_back(create + aux_[1] + " ("
        "key TEXT NOT NULL,"
        " pos BIGINT NOT NULL,"
        " value BYTEA NOT NULL,"
        " PRIMARY KEY (key, pos))");
    sql.push_back(create + aux_[2] + " ("
        "key TEXT NOT NULL,"
        " member BYTEA NOT NULL,"
        " PRIMARY KEY (key, member))");
    sql.push_back(create + aux_[3] + " ("
        "key TEXT NOT NULL,"
        " member BYTEA NOT NULL,"
        " score DOUBLE PRECISION NOT NULL,"
        " PRIMARY KEY (key, member))");
    sql.push_back("CREATE INDEX IF NOT EXISTS " + quote_ident(table_ + "_zsets_score_idx") +
        " ON " + aux_[3] + " (key, score)");
    return sql;
}

std::vector<std::string> TableSet::drop_statements() const {
    std::vector<std::string> sql;
    for (const auto& t : aux_) sql.push_back("DROP TABLE IF EXISTS " + t);
    sql.push_back("DROP TABLE IF EXISTS " + main_);
    return sql;
}

} // namespace cachex
