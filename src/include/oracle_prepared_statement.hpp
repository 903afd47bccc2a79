#pragma once

#include "duckdb.hpp"
#include "oracle_type_mapping.hpp"
#include <cstdint>
#include <memory>
#include <string>

namespace oracle_pushdown {

using namespace duckdb;

// ───────────────────────────────────────────────────────────────────────────────
// PreparedStatement: 位置指定（1 始まり）でパラメータをバインドできる文
// ───────────────────────────────────────────────────────────────────────────────
class PreparedStatement {
public:
    virtual ~PreparedStatement() = default;

    // 文中のプレースホルダ数
    virtual idx_t ParameterCount() const = 0;

    virtual void SetNull(idx_t position, SqlTypeCode type) = 0;
    virtual void SetLong(idx_t position, int64_t value) = 0;
    virtual void SetDouble(idx_t position, double value) = 0;
    virtual void SetBoolean(idx_t position, bool value) = 0;
    virtual void SetBytes(idx_t position, const std::string &bytes) = 0;
    virtual void SetString(idx_t position, const std::string &value) = 0;

    // 実行してクエリのカラム数を返す
    virtual idx_t Execute() = 0;
    // 次の行へ進む。行がなければ false
    virtual bool Fetch() = 0;
};

// ───────────────────────────────────────────────────────────────────────────────
// StatementPreparer: 前方向のみ・読み取り専用のストリーミング文を作る
// ───────────────────────────────────────────────────────────────────────────────
class StatementPreparer {
public:
    virtual ~StatementPreparer() = default;

    virtual std::unique_ptr<PreparedStatement> PrepareStreaming(const std::string &sql) = 0;
};

} // namespace oracle_pushdown
