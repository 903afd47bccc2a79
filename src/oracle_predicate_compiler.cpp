#include "oracle_predicate_compiler.hpp"
#include "oracle_utils.hpp"
#include "duckdb/common/exception.hpp"

namespace oracle_pushdown {

namespace {

std::string JoinSQL(const std::vector<std::string> &parts, const char *separator) {
    std::string result;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) result += separator;
        result += parts[i];
    }
    return result;
}

} // namespace

// ─── Compile ──────────────────────────────────────────────────────────────────

CompiledPredicate OraclePredicateCompiler::Compile(const TupleDomain &tuple_domain,
                                                   const std::vector<std::string> &column_names,
                                                   const std::vector<LogicalType> &column_types,
                                                   const std::unordered_set<idx_t> &uuid_columns) {
    CompiledPredicate result;

    // None は「0 行」ではなく「フィルタなし」として扱う（呼び出し側は None を渡さない前提）
    if (tuple_domain.IsNone()) {
        return result;
    }

    std::vector<std::string> conjuncts;
    for (const auto &entry : tuple_domain.GetDomains()) {
        idx_t index = entry.first;
        if (index >= column_names.size() || index >= column_types.size()) {
            throw InternalException("Column index %llu is out of range (%llu names, %llu types)",
                                    index, (idx_t)column_names.size(), (idx_t)column_types.size());
        }
        conjuncts.push_back(ColumnToSQL(index, column_names[index], column_types[index],
                                        entry.second, uuid_columns, result.bind_values));
    }

    if (conjuncts.empty()) {
        return result;
    }
    result.where_clause = "WHERE " + JoinSQL(conjuncts, " AND ");
    return result;
}

// ─── ColumnToSQL ──────────────────────────────────────────────────────────────

std::string OraclePredicateCompiler::ColumnToSQL(idx_t column_index,
                                                 const std::string &column_name,
                                                 const LogicalType &type,
                                                 const Domain &domain,
                                                 const std::unordered_set<idx_t> &uuid_columns,
                                                 std::vector<PendingBindValue> &bind_values) {
    const RangeSet &ranges = domain.GetRanges();
    if (ranges.IsNone() && domain.IsNullAllowed()) {
        return column_name + " IS NULL";
    }
    if (ranges.IsAll() && !domain.IsNullAllowed()) {
        return column_name + " IS NOT NULL";
    }

    std::vector<std::string> disjuncts;
    std::vector<Value> single_values;
    for (const auto &range : ranges.GetRanges()) {
        if (range.IsAll()) {
            throw InternalException("Range covering all values for column %s", column_name);
        }
        if (range.IsSingleValue()) {
            single_values.push_back(range.GetSingleValue());
        } else {
            disjuncts.push_back(RangeToSQL(column_index, column_name, type, range,
                                           uuid_columns, bind_values));
        }
    }

    // 単一値は = か IN にまとめる（Range の挿入順のまま）
    if (single_values.size() == 1) {
        disjuncts.push_back(ToBindPredicate(column_name, "="));
        bind_values.push_back({column_index, type,
                               GetBindValue(column_index, uuid_columns, single_values[0])});
    } else if (single_values.size() > 1) {
        std::string in_list;
        for (const auto &value : single_values) {
            in_list += in_list.empty() ? "?" : ",?";
            bind_values.push_back({column_index, type,
                                   GetBindValue(column_index, uuid_columns, value)});
        }
        disjuncts.push_back(column_name + " IN (" + in_list + ")");
    }

    if (disjuncts.empty()) {
        throw InternalException("Domain for column %s has no ranges and does not allow NULL",
                                column_name);
    }
    if (domain.IsNullAllowed()) {
        disjuncts.push_back(column_name + " IS NULL");
    }

    return "(" + JoinSQL(disjuncts, " OR ") + ")";
}

// ─── RangeToSQL ───────────────────────────────────────────────────────────────

std::string OraclePredicateCompiler::RangeToSQL(idx_t column_index,
                                                const std::string &column_name,
                                                const LogicalType &type,
                                                const Range &range,
                                                const std::unordered_set<idx_t> &uuid_columns,
                                                std::vector<PendingBindValue> &bind_values) {
    std::vector<std::string> conjuncts;

    const Marker &low = range.GetLow();
    if (!low.IsLowerUnbounded()) {
        switch (low.GetBound()) {
        case MarkerBound::ABOVE:
            conjuncts.push_back(ToBindPredicate(column_name, ">"));
            break;
        case MarkerBound::EXACTLY:
            conjuncts.push_back(ToBindPredicate(column_name, ">="));
            break;
        case MarkerBound::BELOW:
            throw InternalException("Low Marker should never use BELOW bound: %s", range.ToString());
        }
        bind_values.push_back({column_index, type,
                               GetBindValue(column_index, uuid_columns, low.GetValue())});
    }

    const Marker &high = range.GetHigh();
    if (!high.IsUpperUnbounded()) {
        switch (high.GetBound()) {
        case MarkerBound::ABOVE:
            throw InternalException("High Marker should never use ABOVE bound: %s", range.ToString());
        case MarkerBound::EXACTLY:
            conjuncts.push_back(ToBindPredicate(column_name, "<="));
            break;
        case MarkerBound::BELOW:
            conjuncts.push_back(ToBindPredicate(column_name, "<"));
            break;
        }
        bind_values.push_back({column_index, type,
                               GetBindValue(column_index, uuid_columns, high.GetValue())});
    }

    if (conjuncts.empty()) {
        throw InternalException("Range %s produced no comparisons", range.ToString());
    }
    return "(" + JoinSQL(conjuncts, " AND ") + ")";
}

// ─── GetBindValue ─────────────────────────────────────────────────────────────

Value OraclePredicateCompiler::GetBindValue(idx_t column_index,
                                            const std::unordered_set<idx_t> &uuid_columns,
                                            const Value &value) {
    if (uuid_columns.find(column_index) == uuid_columns.end()) {
        return value;
    }
    if (value.type().id() != LogicalTypeId::VARCHAR) {
        throw InternalException("UUID column %llu expects VARCHAR values, got %s",
                                column_index, value.type().ToString());
    }
    std::string bytes = OracleUtils::UuidToBytes(StringValue::Get(value));
    return Value::BLOB(reinterpret_cast<const_data_ptr_t>(bytes.data()), bytes.size());
}

std::string OraclePredicateCompiler::ToBindPredicate(const std::string &column_name,
                                                     const char *op) {
    return column_name + " " + op + " ?";
}

} // namespace oracle_pushdown
