#include "oracle_connection.hpp"
#include "duckdb/common/exception.hpp"
#include <glog/logging.h>
#include <stdexcept>

namespace oracle_pushdown {

// ─── グローバルコンテキスト ────────────────────────────────────────────────────
dpiContext *OracleConnection::global_ctx_ = nullptr;
std::mutex  OracleConnection::ctx_mutex_;

dpiContext *OracleConnection::GetOrCreateContext() {
    std::lock_guard<std::mutex> lk(ctx_mutex_);
    if (global_ctx_ != nullptr) {
        return global_ctx_;
    }
    dpiErrorInfo err;
    int rc = dpiContext_createWithParams(DPI_MAJOR_VERSION, DPI_MINOR_VERSION, nullptr,
                                         &global_ctx_, &err);
    if (rc != DPI_SUCCESS) {
        global_ctx_ = nullptr;
        throw std::runtime_error(
            OracleUtils::FormatOracleError("ODPI-C context creation", err.message));
    }
    VLOG(1) << "ODPI-C context created (client API " << DPI_MAJOR_VERSION << "."
            << DPI_MINOR_VERSION << ")";
    return global_ctx_;
}

// ─── Open ─────────────────────────────────────────────────────────────────────

std::shared_ptr<OracleConnection>
OracleConnection::Open(const OracleConnectionParameters &params) {
    // fetch_size / prefetch_rows はここで確定し、以後の PrepareStreaming で使い回す
    params.Validate();

    std::shared_ptr<OracleConnection> conn(new OracleConnection());
    conn->params_ = params;
    conn->ctx_ = GetOrCreateContext();

    const std::string target = params.BuildConnectString();
    int rc = dpiConn_create(conn->ctx_,
                            params.user.data(), (uint32_t)params.user.size(),
                            params.password.data(), (uint32_t)params.password.size(),
                            target.data(), (uint32_t)target.size(),
                            nullptr, nullptr, &conn->conn_);
    if (rc != DPI_SUCCESS) {
        conn->conn_ = nullptr;
        conn->ThrowIfError(rc, "connect to " + target + " as '" + params.user + "'");
    }

    VLOG(1) << "opened streaming connection to " << target << " as " << params.user
            << " (fetch_size=" << params.fetch_size
            << ", prefetch_rows=" << params.prefetch_rows << ")";
    return conn;
}

// ─── Destructor ───────────────────────────────────────────────────────────────

OracleConnection::~OracleConnection() {
    if (conn_ != nullptr) {
        dpiConn_release(conn_);
    }
}

// ─── ThrowIfError ─────────────────────────────────────────────────────────────

void OracleConnection::ThrowIfError(int rc, const std::string &context) {
    if (rc == DPI_SUCCESS) {
        return;
    }
    dpiErrorInfo err;
    dpiContext_getError(ctx_, &err);
    LOG(WARNING) << "ODPI-C call failed (" << context << "): ORA-" << err.code;
    throw std::runtime_error(OracleUtils::FormatOracleError(context, err.message));
}

// ─── PrepareStreaming ─────────────────────────────────────────────────────────

std::unique_ptr<PreparedStatement>
OracleConnection::PrepareStreaming(const std::string &sql) {
    std::string oracle_sql = OracleUtils::ToNumberedBinds(sql);
    std::lock_guard<std::mutex> lk(mutex_);

    // scrollable = 0 で前方向のみのカーソル
    dpiStmt *stmt = nullptr;
    ThrowIfError(dpiConn_prepareStmt(conn_, 0, oracle_sql.c_str(), (uint32_t)oracle_sql.size(),
                                     nullptr, 0, &stmt),
                 "PrepareStreaming::prepareStmt");

    // 所有権は OracleStatement に移る（失敗時もデストラクタで解放される）
    std::unique_ptr<OracleStatement> statement(new OracleStatement(ctx_, conn_, stmt));
    ThrowIfError(dpiStmt_setFetchArraySize(stmt, params_.fetch_size),
                 "PrepareStreaming::setFetchArraySize");
    ThrowIfError(dpiStmt_setPrefetchRows(stmt, params_.prefetch_rows),
                 "PrepareStreaming::setPrefetchRows");

    VLOG(2) << "prepared statement (fetch_size=" << params_.fetch_size
            << ", prefetch_rows=" << params_.prefetch_rows << "): " << oracle_sql;
    return std::move(statement);
}

// ─── OracleStatement ──────────────────────────────────────────────────────────

OracleStatement::OracleStatement(dpiContext *ctx, dpiConn *conn, dpiStmt *stmt)
    : ctx_(ctx), conn_(conn), stmt_(stmt) {
    // 文が生きている間は接続を解放させない
    dpiConn_addRef(conn_);
}

OracleStatement::~OracleStatement() {
    if (stmt_) {
        dpiStmt_release(stmt_);
        stmt_ = nullptr;
    }
    if (conn_) {
        dpiConn_release(conn_);
        conn_ = nullptr;
    }
}

void OracleStatement::ThrowIfError(int rc, const std::string &context) const {
    if (rc == DPI_SUCCESS) return;
    dpiErrorInfo err;
    dpiContext_getError(ctx_, &err);
    throw std::runtime_error(OracleUtils::FormatOracleError(context, err.message));
}

idx_t OracleStatement::ParameterCount() const {
    uint32_t count = 0;
    ThrowIfError(dpiStmt_getBindCount(stmt_, &count), "OracleStatement::getBindCount");
    return count;
}

void OracleStatement::SetNull(idx_t position, SqlTypeCode type) {
    if (OracleTypeMapping::ToOracleTypeNum(type) == DPI_ORACLE_TYPE_RAW) {
        BindRaw(position, nullptr, 0, true);
        return;
    }
    dpiData data;
    data.isNull = 1;
    ThrowIfError(dpiStmt_bindValueByPos(stmt_, (uint32_t)position,
                                        OracleTypeMapping::ToNativeTypeNum(type), &data),
                 "OracleStatement::SetNull");
}

void OracleStatement::SetLong(idx_t position, int64_t value) {
    dpiData data;
    data.isNull = 0;
    data.value.asInt64 = value;
    ThrowIfError(dpiStmt_bindValueByPos(stmt_, (uint32_t)position, DPI_NATIVE_TYPE_INT64, &data),
                 "OracleStatement::SetLong");
}

void OracleStatement::SetDouble(idx_t position, double value) {
    dpiData data;
    data.isNull = 0;
    data.value.asDouble = value;
    ThrowIfError(dpiStmt_bindValueByPos(stmt_, (uint32_t)position, DPI_NATIVE_TYPE_DOUBLE, &data),
                 "OracleStatement::SetDouble");
}

void OracleStatement::SetBoolean(idx_t position, bool value) {
    // Oracle 側は NUMBER(1)
    SetLong(position, value ? 1 : 0);
}

void OracleStatement::SetBytes(idx_t position, const std::string &bytes) {
    BindRaw(position, bytes.data(), (uint32_t)bytes.size(), false);
}

void OracleStatement::SetString(idx_t position, const std::string &value) {
    dpiData data;
    data.isNull = 0;
    data.value.asBytes.ptr = const_cast<char *>(value.data());
    data.value.asBytes.length = (uint32_t)value.size();
    data.value.asBytes.encoding = nullptr;
    // bindValueByPos は値を内部の変数にコピーする
    ThrowIfError(dpiStmt_bindValueByPos(stmt_, (uint32_t)position, DPI_NATIVE_TYPE_BYTES, &data),
                 "OracleStatement::SetString");
}

void OracleStatement::BindRaw(idx_t position, const char *ptr, uint32_t length, bool is_null) {
    dpiVar *var = nullptr;
    dpiData *data = nullptr;
    ThrowIfError(dpiConn_newVar(conn_, DPI_ORACLE_TYPE_RAW, DPI_NATIVE_TYPE_BYTES, 1,
                                length > 0 ? length : 1, 1, 0, nullptr, &var, &data),
                 "OracleStatement::newVar");

    int rc = DPI_SUCCESS;
    if (is_null) {
        data->isNull = 1;
    } else {
        rc = dpiVar_setFromBytes(var, 0, ptr, length);
    }
    if (rc == DPI_SUCCESS) {
        rc = dpiStmt_bindByPos(stmt_, (uint32_t)position, var);
    }
    if (rc != DPI_SUCCESS) {
        // release の前にエラー情報を取り出しておく
        dpiErrorInfo err;
        dpiContext_getError(ctx_, &err);
        std::string message(err.message, err.messageLength);
        dpiVar_release(var);
        throw std::runtime_error(OracleUtils::FormatOracleError("OracleStatement::BindRaw", message));
    }
    // bindByPos が参照を追加しているので、こちらの参照は手放してよい
    dpiVar_release(var);
}

idx_t OracleStatement::Execute() {
    uint32_t num_cols = 0;
    ThrowIfError(dpiStmt_execute(stmt_, DPI_MODE_EXEC_DEFAULT, &num_cols),
                 "OracleStatement::execute");
    return num_cols;
}

bool OracleStatement::Fetch() {
    int found = 0;
    uint32_t buffer_row_index = 0;
    ThrowIfError(dpiStmt_fetch(stmt_, &found, &buffer_row_index), "OracleStatement::fetch");
    return found != 0;
}

} // namespace oracle_pushdown
