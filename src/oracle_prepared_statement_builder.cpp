#include "oracle_prepared_statement_builder.hpp"
#include "oracle_predicate_compiler.hpp"
#include "oracle_parameter_binder.hpp"
#include "duckdb/common/exception.hpp"
#include <glog/logging.h>
#include <cctype>

namespace oracle_pushdown {

// ─── Create ───────────────────────────────────────────────────────────────────

std::unique_ptr<PreparedStatement>
OraclePreparedStatementBuilder::Create(StatementPreparer &preparer,
                                       const std::string &sql,
                                       const std::vector<std::string> &column_names,
                                       const std::vector<LogicalType> &column_types,
                                       const std::unordered_set<idx_t> &uuid_columns,
                                       const TupleDomain &tuple_domain) {
    if (sql.empty()) {
        throw InvalidInputException("sql is null or empty");
    }

    if (tuple_domain.IsNone()) {
        LOG(WARNING) << "tuple domain is none; running without a pushed down filter: " << sql;
    }

    CompiledPredicate predicate =
        OraclePredicateCompiler::Compile(tuple_domain, column_names, column_types, uuid_columns);
    std::string full_sql = AppendWhereClause(sql, predicate.where_clause);

    auto statement = preparer.PrepareStreaming(full_sql);
    OracleParameterBinder::Bind(*statement, predicate.bind_values, uuid_columns);

    VLOG(1) << "prepared pushdown query with " << predicate.bind_values.size()
            << " bind values: " << full_sql;
    return statement;
}

// ─── AppendWhereClause ────────────────────────────────────────────────────────

std::string OraclePreparedStatementBuilder::AppendWhereClause(const std::string &sql,
                                                              const std::string &where_clause) {
    if (where_clause.empty()) {
        return sql;
    }
    if (sql.empty() || std::isspace((unsigned char)sql.back())) {
        return sql + where_clause;
    }
    return sql + " " + where_clause;
}

} // namespace oracle_pushdown
