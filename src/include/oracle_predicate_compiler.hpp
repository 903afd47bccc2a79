#pragma once

#include "duckdb.hpp"
#include "oracle_tuple_domain.hpp"
#include <string>
#include <unordered_set>
#include <vector>

namespace oracle_pushdown {

// ───────────────────────────────────────────────────────────────────────────────
// バインド待ちの値（コンパイル時に作られ、バインド時に 1 度だけ消費される）
// ───────────────────────────────────────────────────────────────────────────────
struct PendingBindValue {
    idx_t       column_index;
    LogicalType type;   // カラムの宣言型
    Value       value;  // UUID カラムは 16 バイトの BLOB に変換済み

    bool IsNull() const { return value.IsNull(); }
};

// ───────────────────────────────────────────────────────────────────────────────
// コンパイル結果
// ───────────────────────────────────────────────────────────────────────────────
struct CompiledPredicate {
    // "WHERE ..." または空文字列
    std::string where_clause;
    // where_clause 中の '?' と同じ順序
    std::vector<PendingBindValue> bind_values;

    bool HasFilters() const { return !where_clause.empty(); }
};

// ───────────────────────────────────────────────────────────────────────────────
// OraclePredicateCompiler: TupleDomain を WHERE 句とバインド値に変換する
// 副作用なし。入力が異なれば並行に呼び出してよい
// ───────────────────────────────────────────────────────────────────────────────
class OraclePredicateCompiler {
public:
    // column_names / column_types はカラムインデックスで引く。
    // uuid_columns に含まれるカラムの値は 16 バイトのバイナリに変換して保持する
    static CompiledPredicate Compile(const TupleDomain &tuple_domain,
                                     const std::vector<std::string> &column_names,
                                     const std::vector<LogicalType> &column_types,
                                     const std::unordered_set<idx_t> &uuid_columns);

private:
    static std::string ColumnToSQL(idx_t column_index,
                                   const std::string &column_name,
                                   const LogicalType &type,
                                   const Domain &domain,
                                   const std::unordered_set<idx_t> &uuid_columns,
                                   std::vector<PendingBindValue> &bind_values);

    static std::string RangeToSQL(idx_t column_index,
                                  const std::string &column_name,
                                  const LogicalType &type,
                                  const Range &range,
                                  const std::unordered_set<idx_t> &uuid_columns,
                                  std::vector<PendingBindValue> &bind_values);

    static Value GetBindValue(idx_t column_index,
                              const std::unordered_set<idx_t> &uuid_columns,
                              const Value &value);

    static std::string ToBindPredicate(const std::string &column_name, const char *op);
};

} // namespace oracle_pushdown
