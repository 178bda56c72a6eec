#pragma once
// Table layout of the relational emulation.
//
//   <t>          key TEXT PK, type SMALLINT, value BYTEA, expires_at TIMESTAMPTZ
//   <t>_hashes   (key, field) PK, value BYTEA
//   <t>_lists    (key, pos) PK, value BYTEA       pos is sparse, ordered
//   <t>_sets     (key, member) PK
//   <t>_zsets    (key, member) PK, score FLOAT8   plus index (key, score)
//
// Only these configured names are ever spliced into SQL text.
#include <array>
#include <string>
#include <string_view>
#include <vector>

namespace cachex {

class TableSet {
public:
    // Throws ConfigError unless both names are plain SQL identifiers
    TableSet(const std::string& schema, const std::string& table);

    // Replaces {main} {hashes} {lists} {sets} {zsets} with quoted names
    [[nodiscard]] std::string render(std::string_view tmpl) const;

    [[nodiscard]] const std::string& main() const { return main_; }
    // hashes, lists, sets, zsets
    [[nodiscard]] const std::array<std::string, 4>& aux() const { return aux_; }

    [[nodiscard]] std::vector<std::string> create_statements(bool unlogged) const;
    [[nodiscard]] std::vector<std::string> drop_statements() const;

    [[nodiscard]] const std::string& base_name() const { return table_; }

    static bool is_identifier(std::string_view name);

private:
    [[nodiscard]] std::string qualify(const std::string& name) const;

    std::string schema_;
    std::string table_;
    std::string main_;
    std::array<std::string, 4> aux_;
};

} // namespace cachex
