#pragma once

#include "duckdb.hpp"
#include "oracle_predicate_compiler.hpp"
#include "oracle_prepared_statement.hpp"
#include <unordered_set>
#include <vector>

namespace oracle_pushdown {

// ───────────────────────────────────────────────────────────────────────────────
// OracleParameterBinder: PendingBindValue を順番に 1, 2, ... の位置へバインドする
// ───────────────────────────────────────────────────────────────────────────────
class OracleParameterBinder {
public:
    static void Bind(PreparedStatement &statement,
                     const std::vector<PendingBindValue> &bind_values,
                     const std::unordered_set<idx_t> &uuid_columns);

    // 1 件分。宣言型の物理表現で振り分ける
    static void BindValue(PreparedStatement &statement, idx_t position,
                          const PendingBindValue &bind_value, bool is_uuid);
};

} // namespace oracle_pushdown
