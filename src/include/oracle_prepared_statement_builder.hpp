#pragma once

#include "duckdb.hpp"
#include "oracle_tuple_domain.hpp"
#include "oracle_prepared_statement.hpp"
#include <memory>
#include <string>
#include <unordered_set>
#include <vector>

namespace oracle_pushdown {

// ───────────────────────────────────────────────────────────────────────────────
// OraclePreparedStatementBuilder
// ベース SQL に TupleDomain から作った WHERE 句を付け、ストリーミング文として
// 準備してすべてのパラメータをバインドした状態で返す
// ───────────────────────────────────────────────────────────────────────────────
class OraclePreparedStatementBuilder {
public:
    // sql は WHERE 句を含まない SELECT 文。空なら InvalidInputException
    static std::unique_ptr<PreparedStatement>
        Create(StatementPreparer &preparer,
               const std::string &sql,
               const std::vector<std::string> &column_names,
               const std::vector<LogicalType> &column_types,
               const std::unordered_set<idx_t> &uuid_columns,
               const TupleDomain &tuple_domain);

    // ベース SQL と WHERE 句を連結する
    static std::string AppendWhereClause(const std::string &sql, const std::string &where_clause);
};

} // namespace oracle_pushdown
