#include <gtest/gtest.h>

#include "oracle_parameter_binder.hpp"
#include "oracle_type_mapping.hpp"
#include "fake_prepared_statement.hpp"
#include "duckdb/common/exception.hpp"

namespace oracle_pushdown {

TEST(ParameterBinder, DispatchesOnDeclaredType) {
    std::vector<PendingBindValue> values = {
        {0, LogicalType::BIGINT, Value::BIGINT(42)},
        {1, LogicalType::DOUBLE, Value::DOUBLE(0.25)},
        {2, LogicalType::BOOLEAN, Value::BOOLEAN(true)},
        {3, LogicalType::VARCHAR, Value("shard")},
    };
    FakePreparedStatement statement("SELECT", values.size());
    OracleParameterBinder::Bind(statement, values, {});

    ASSERT_EQ(statement.calls.size(), 4u);
    EXPECT_EQ(statement.calls[0].method, "SetLong");
    EXPECT_EQ(statement.calls[0].position, 1u);
    EXPECT_EQ(statement.calls[0].value, "42");
    EXPECT_EQ(statement.calls[1].method, "SetDouble");
    EXPECT_EQ(statement.calls[1].position, 2u);
    EXPECT_EQ(statement.calls[1].value, std::to_string(0.25));
    EXPECT_EQ(statement.calls[2].method, "SetBoolean");
    EXPECT_EQ(statement.calls[2].value, "true");
    EXPECT_EQ(statement.calls[3].method, "SetString");
    EXPECT_EQ(statement.calls[3].position, 4u);
    EXPECT_EQ(statement.calls[3].value, "shard");
}

TEST(ParameterBinder, UuidColumnBindsRawBytes) {
    std::string bytes("\x3f\xa8\x5f\x64\x57\x17\x45\x62\xb3\xfc\x2c\x96\x3f\x66\xaf\xa6", 16);
    Value blob = Value::BLOB(reinterpret_cast<const_data_ptr_t>(bytes.data()), bytes.size());
    std::vector<PendingBindValue> values = {{7, LogicalType::VARCHAR, blob}};

    FakePreparedStatement statement("SELECT", 1);
    OracleParameterBinder::Bind(statement, values, {7});

    ASSERT_EQ(statement.calls.size(), 1u);
    EXPECT_EQ(statement.calls[0].method, "SetBytes");
    EXPECT_EQ(statement.calls[0].value, bytes);
}

TEST(ParameterBinder, BlobColumnWithoutUuidBindsAsString) {
    std::string bytes = "raw";
    Value blob = Value::BLOB(reinterpret_cast<const_data_ptr_t>(bytes.data()), bytes.size());
    std::vector<PendingBindValue> values = {{1, LogicalType::BLOB, blob}};

    FakePreparedStatement statement("SELECT", 1);
    OracleParameterBinder::Bind(statement, values, {});

    ASSERT_EQ(statement.calls.size(), 1u);
    EXPECT_EQ(statement.calls[0].method, "SetString");
    EXPECT_EQ(statement.calls[0].value, "raw");
}

TEST(ParameterBinder, NullsUseTypeCode) {
    std::vector<PendingBindValue> values = {
        {0, LogicalType::BIGINT, Value(LogicalType::BIGINT)},
        {1, LogicalType::DOUBLE, Value(LogicalType::DOUBLE)},
        {2, LogicalType::BOOLEAN, Value(LogicalType::BOOLEAN)},
        {3, LogicalType::VARCHAR, Value(LogicalType::VARCHAR)},
        {4, LogicalType::BLOB, Value(LogicalType::BLOB)},
    };
    FakePreparedStatement statement("SELECT", values.size());
    OracleParameterBinder::Bind(statement, values, {});

    const char *expected[] = {"BIGINT", "DOUBLE", "BOOLEAN", "VARCHAR", "VARBINARY"};
    ASSERT_EQ(statement.calls.size(), 5u);
    for (idx_t i = 0; i < 5; ++i) {
        EXPECT_EQ(statement.calls[i].method, "SetNull");
        EXPECT_EQ(statement.calls[i].position, i + 1);
        EXPECT_EQ(statement.calls[i].value, expected[i]);
    }
}

TEST(ParameterBinder, UnknownTypeForNull) {
    std::vector<PendingBindValue> values = {{0, LogicalType::DATE, Value(LogicalType::DATE)}};
    FakePreparedStatement statement("SELECT", 1);
    EXPECT_THROW(OracleParameterBinder::Bind(statement, values, {}), InternalException);
}

TEST(ParameterBinder, UnknownPhysicalType) {
    std::vector<PendingBindValue> values = {{0, LogicalType::INTEGER, Value::INTEGER(1)}};
    FakePreparedStatement statement("SELECT", 1);
    EXPECT_THROW(OracleParameterBinder::Bind(statement, values, {}), InternalException);
}

TEST(ParameterBinder, UnsupportedDeclaredTypeWithSupportedPhysicalType) {
    // DECIMAL(18,2) も TIMESTAMP も INT64 で保持されるが、宣言型としては対応外
    std::vector<PendingBindValue> decimal = {
        {0, LogicalType::DECIMAL(18, 2), Value::DECIMAL(int64_t(375), 18, 2)}};
    FakePreparedStatement decimal_statement("SELECT", 1);
    EXPECT_THROW(OracleParameterBinder::Bind(decimal_statement, decimal, {}), InternalException);
    EXPECT_TRUE(decimal_statement.calls.empty());

    std::vector<PendingBindValue> timestamp = {
        {0, LogicalType::TIMESTAMP, Value::TIMESTAMP(timestamp_t(1700000000000000LL))}};
    FakePreparedStatement timestamp_statement("SELECT", 1);
    EXPECT_THROW(OracleParameterBinder::Bind(timestamp_statement, timestamp, {}), InternalException);
    EXPECT_TRUE(timestamp_statement.calls.empty());

    std::vector<PendingBindValue> decimal_null = {
        {0, LogicalType::DECIMAL(18, 2), Value(LogicalType::DECIMAL(18, 2))}};
    FakePreparedStatement null_statement("SELECT", 1);
    EXPECT_THROW(OracleParameterBinder::Bind(null_statement, decimal_null, {}), InternalException);
}

TEST(ParameterBinder, ParameterCountMismatch) {
    std::vector<PendingBindValue> values = {{0, LogicalType::BIGINT, Value::BIGINT(1)}};
    FakePreparedStatement statement("SELECT", 2);
    EXPECT_THROW(OracleParameterBinder::Bind(statement, values, {}), InternalException);
    EXPECT_TRUE(statement.calls.empty());
}

TEST(ParameterBinder, EmptyListBindsNothing) {
    FakePreparedStatement statement("SELECT", 0);
    OracleParameterBinder::Bind(statement, {}, {});
    EXPECT_TRUE(statement.calls.empty());
}

TEST(TypeMapping, SqlTypeCodes) {
    EXPECT_EQ(OracleTypeMapping::ToSqlTypeCode(LogicalType::BIGINT), SqlTypeCode::BIGINT);
    EXPECT_EQ(OracleTypeMapping::ToSqlTypeCode(LogicalType::DOUBLE), SqlTypeCode::DOUBLE);
    EXPECT_EQ(OracleTypeMapping::ToSqlTypeCode(LogicalType::BOOLEAN), SqlTypeCode::BOOLEAN);
    EXPECT_EQ(OracleTypeMapping::ToSqlTypeCode(LogicalType::VARCHAR), SqlTypeCode::VARCHAR);
    EXPECT_EQ(OracleTypeMapping::ToSqlTypeCode(LogicalType::BLOB), SqlTypeCode::VARBINARY);
    EXPECT_THROW(OracleTypeMapping::ToSqlTypeCode(LogicalType::TIMESTAMP), InternalException);
}

TEST(TypeMapping, OracleBindTypes) {
    EXPECT_EQ(OracleTypeMapping::ToOracleTypeNum(SqlTypeCode::VARBINARY), DPI_ORACLE_TYPE_RAW);
    EXPECT_EQ(OracleTypeMapping::ToNativeTypeNum(SqlTypeCode::BIGINT), DPI_NATIVE_TYPE_INT64);
    EXPECT_EQ(OracleTypeMapping::ToNativeTypeNum(SqlTypeCode::BOOLEAN), DPI_NATIVE_TYPE_INT64);
    EXPECT_EQ(OracleTypeMapping::ToNativeTypeNum(SqlTypeCode::VARCHAR), DPI_NATIVE_TYPE_BYTES);
}

} // namespace oracle_pushdown
