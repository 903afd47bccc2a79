#pragma once

#include "duckdb.hpp"
#include "duckdb/common/exception.hpp"
#include <string>
#include <unordered_map>

namespace oracle_pushdown {

using namespace duckdb;

// ───────────────────────────────────────────────────────────────────────────────
// 接続パラメータ
// ───────────────────────────────────────────────────────────────────────────────
struct OracleConnectionParameters {
    std::string host = "localhost";
    int         port = 1521;
    std::string service_name;       // SERVICE_NAME (推奨)
    std::string sid;                // SID (旧来方式)
    std::string tns_name;           // TNS エイリアス
    std::string user;
    std::string password;

    // ストリーミング取得の設定
    uint32_t fetch_size    = 10000; // 1 回のラウンドトリップで取得する行数
    uint32_t prefetch_rows = 10000; // execute 時にプリフェッチする行数

    // "host=... port=... service=... user=... password=..." 形式、
    // または "//host:port/service user=..." 形式をパース
    static OracleConnectionParameters ParseConnectionString(const std::string &conn_str);

    // 接続先とストリーミング設定の整合性を確認。不正なら InvalidInputException
    void Validate() const;

    // ODPI-C 向け接続文字列を組み立てる
    std::string BuildConnectString() const;
};

// ───────────────────────────────────────────────────────────────────────────────
// 雑多なユーティリティ
// ───────────────────────────────────────────────────────────────────────────────
class OracleUtils {
public:
    static std::string FormatOracleError(const std::string &context,
                                         const std::string &oracle_msg);

    // キーバリュー文字列をパース ("key=val key2='val 2'")
    static std::unordered_map<std::string, std::string>
        ParseKeyValueString(const std::string &s);

    // '?' プレースホルダを Oracle の番号付きバインド (:1, :2, ...) に置換する。
    // クォートされたリテラル・識別子と、-- / /* */ コメントの中はそのまま
    static std::string ToNumberedBinds(const std::string &sql);

    // UUID 文字列 → 16 バイトのビッグエンディアン表現。不正な文字列は InvalidInputException
    static std::string UuidToBytes(const std::string &uuid);
};

} // namespace oracle_pushdown
