#include "oracle_parameter_binder.hpp"
#include "oracle_type_mapping.hpp"
#include "duckdb/common/exception.hpp"

namespace oracle_pushdown {

namespace {

// VARCHAR / BLOB 値の中身をそのまま取り出す
std::string GetRawBytes(const Value &value) {
    if (value.type().InternalType() == PhysicalType::VARCHAR) {
        return StringValue::Get(value);
    }
    return value.ToString();
}

} // namespace

// ─── Bind ─────────────────────────────────────────────────────────────────────

void OracleParameterBinder::Bind(PreparedStatement &statement,
                                 const std::vector<PendingBindValue> &bind_values,
                                 const std::unordered_set<idx_t> &uuid_columns) {
    idx_t parameter_count = statement.ParameterCount();
    if (parameter_count != bind_values.size()) {
        throw InternalException("Statement has %llu parameters but %llu bind values were compiled",
                                parameter_count, (idx_t)bind_values.size());
    }

    idx_t position = 1;
    for (const auto &bind_value : bind_values) {
        bool is_uuid = uuid_columns.find(bind_value.column_index) != uuid_columns.end();
        BindValue(statement, position, bind_value, is_uuid);
        ++position;
    }
}

// ─── BindValue ────────────────────────────────────────────────────────────────

void OracleParameterBinder::BindValue(PreparedStatement &statement, idx_t position,
                                      const PendingBindValue &bind_value, bool is_uuid) {
    const LogicalType &type = bind_value.type;
    const Value &value = bind_value.value;

    // 値が NULL でなくても、対応表にない宣言型はここで InternalException
    SqlTypeCode code = OracleTypeMapping::ToSqlTypeCode(type);
    if (bind_value.IsNull()) {
        statement.SetNull(position, code);
        return;
    }

    switch (type.InternalType()) {
    case PhysicalType::INT64:
        statement.SetLong(position, value.GetValue<int64_t>());
        break;
    case PhysicalType::DOUBLE:
        statement.SetDouble(position, value.GetValue<double>());
        break;
    case PhysicalType::BOOL:
        statement.SetBoolean(position, value.GetValue<bool>());
        break;
    case PhysicalType::VARCHAR:
        if (is_uuid) {
            // コンパイル時にバイナリ化済み
            statement.SetBytes(position, GetRawBytes(value));
        } else {
            statement.SetString(position, GetRawBytes(value));
        }
        break;
    default:
        throw InternalException("Unknown physical type %s for column %llu",
                                TypeIdToString(type.InternalType()), bind_value.column_index);
    }
}

} // namespace oracle_pushdown
