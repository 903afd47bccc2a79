#pragma once

#include "duckdb.hpp"
#include "duckdb/common/types.hpp"
#include <dpi.h>
#include <cstdint>

namespace oracle_pushdown {

using namespace duckdb;

// ───────────────────────────────────────────────────────────────────────────────
// NULL をバインドするときの SQL 型コード
// ───────────────────────────────────────────────────────────────────────────────
enum class SqlTypeCode : uint8_t {
    BIGINT,
    DOUBLE,
    BOOLEAN,
    VARCHAR,
    VARBINARY
};

// ───────────────────────────────────────────────────────────────────────────────
// 型マッピング（いずれもテーブル引き。型を増やすときは行を足す）
// ───────────────────────────────────────────────────────────────────────────────
class OracleTypeMapping {
public:
    // DuckDB LogicalType → SQL 型コード。未対応の型は InternalException
    static SqlTypeCode ToSqlTypeCode(const LogicalType &type);

    // SQL 型コード → ODPI-C の Oracle 型 / ネイティブ型
    static dpiOracleTypeNum ToOracleTypeNum(SqlTypeCode code);
    static dpiNativeTypeNum ToNativeTypeNum(SqlTypeCode code);

    static const char *ToString(SqlTypeCode code);
};

} // namespace oracle_pushdown
