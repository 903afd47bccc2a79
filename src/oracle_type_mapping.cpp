#include "oracle_type_mapping.hpp"
#include "duckdb/common/exception.hpp"

namespace oracle_pushdown {

namespace {

struct SqlTypeCodeEntry {
    LogicalTypeId type_id;
    SqlTypeCode   code;
};

// BOOLEAN は Oracle 側では NUMBER(1) として扱う
struct OracleBindTypeEntry {
    SqlTypeCode      code;
    dpiOracleTypeNum oracle_type;
    dpiNativeTypeNum native_type;
    const char      *name;
};

const SqlTypeCodeEntry SQL_TYPE_CODES[] = {
    {LogicalTypeId::BIGINT,  SqlTypeCode::BIGINT},
    {LogicalTypeId::DOUBLE,  SqlTypeCode::DOUBLE},
    {LogicalTypeId::BOOLEAN, SqlTypeCode::BOOLEAN},
    {LogicalTypeId::VARCHAR, SqlTypeCode::VARCHAR},
    {LogicalTypeId::BLOB,    SqlTypeCode::VARBINARY},
};

const OracleBindTypeEntry ORACLE_BIND_TYPES[] = {
    {SqlTypeCode::BIGINT,    DPI_ORACLE_TYPE_NUMBER,        DPI_NATIVE_TYPE_INT64,  "BIGINT"},
    {SqlTypeCode::DOUBLE,    DPI_ORACLE_TYPE_NATIVE_DOUBLE, DPI_NATIVE_TYPE_DOUBLE, "DOUBLE"},
    {SqlTypeCode::BOOLEAN,   DPI_ORACLE_TYPE_NUMBER,        DPI_NATIVE_TYPE_INT64,  "BOOLEAN"},
    {SqlTypeCode::VARCHAR,   DPI_ORACLE_TYPE_VARCHAR,       DPI_NATIVE_TYPE_BYTES,  "VARCHAR"},
    {SqlTypeCode::VARBINARY, DPI_ORACLE_TYPE_RAW,           DPI_NATIVE_TYPE_BYTES,  "VARBINARY"},
};

const OracleBindTypeEntry &FindBindType(SqlTypeCode code) {
    for (const auto &entry : ORACLE_BIND_TYPES) {
        if (entry.code == code) {
            return entry;
        }
    }
    throw InternalException("Unknown SQL type code: %d", static_cast<int>(code));
}

} // namespace

// ─── ToSqlTypeCode ────────────────────────────────────────────────────────────

SqlTypeCode OracleTypeMapping::ToSqlTypeCode(const LogicalType &type) {
    for (const auto &entry : SQL_TYPE_CODES) {
        if (entry.type_id == type.id()) {
            return entry.code;
        }
    }
    throw InternalException("Unknown type: %s", type.ToString());
}

// ─── ToOracleTypeNum / ToNativeTypeNum ────────────────────────────────────────

dpiOracleTypeNum OracleTypeMapping::ToOracleTypeNum(SqlTypeCode code) {
    return FindBindType(code).oracle_type;
}

dpiNativeTypeNum OracleTypeMapping::ToNativeTypeNum(SqlTypeCode code) {
    return FindBindType(code).native_type;
}

const char *OracleTypeMapping::ToString(SqlTypeCode code) {
    return FindBindType(code).name;
}

} // namespace oracle_pushdown
