#pragma once

#include "duckdb.hpp"
#include "oracle_utils.hpp"
#include "oracle_prepared_statement.hpp"
#include <dpi.h>
#include <memory>
#include <mutex>
#include <string>

namespace oracle_pushdown {

// ───────────────────────────────────────────────────────────────────────────────
// OracleStatement: dpiStmt のラッパー。所有スレッド以外から触らないこと
// ───────────────────────────────────────────────────────────────────────────────
class OracleStatement : public PreparedStatement {
public:
    ~OracleStatement() override;

    OracleStatement(const OracleStatement &) = delete;
    OracleStatement &operator=(const OracleStatement &) = delete;

    idx_t ParameterCount() const override;

    void SetNull(idx_t position, SqlTypeCode type) override;
    void SetLong(idx_t position, int64_t value) override;
    void SetDouble(idx_t position, double value) override;
    void SetBoolean(idx_t position, bool value) override;
    void SetBytes(idx_t position, const std::string &bytes) override;
    void SetString(idx_t position, const std::string &value) override;

    idx_t Execute() override;
    bool Fetch() override;

private:
    friend class OracleConnection;
    OracleStatement(dpiContext *ctx, dpiConn *conn, dpiStmt *stmt);

    void ThrowIfError(int rc, const std::string &context) const;
    void BindRaw(idx_t position, const char *ptr, uint32_t length, bool is_null);

    dpiContext *ctx_;
    dpiConn    *conn_;
    dpiStmt    *stmt_;
};

// ───────────────────────────────────────────────────────────────────────────────
// OracleConnection: ODPI-C 接続ラッパー（スレッドセーフ）
// ───────────────────────────────────────────────────────────────────────────────
class OracleConnection : public StatementPreparer {
public:
    ~OracleConnection() override;

    // パラメータを検証してから接続を開く。失敗時は例外をスロー
    static std::shared_ptr<OracleConnection>
        Open(const OracleConnectionParameters &params);

    // '?' を :n に書き換えて準備し、fetch_size / prefetch_rows を設定する
    std::unique_ptr<PreparedStatement> PrepareStreaming(const std::string &sql) override;

private:
    OracleConnection() = default;

    void ThrowIfError(int rc, const std::string &context);

    OracleConnectionParameters params_;
    dpiContext *ctx_  = nullptr;
    dpiConn    *conn_ = nullptr;
    std::mutex  mutex_;

    // ODPI-C のグローバルコンテキストはプロセスで一つ
    static dpiContext *global_ctx_;
    static std::mutex  ctx_mutex_;
    static dpiContext *GetOrCreateContext();
};

} // namespace oracle_pushdown
