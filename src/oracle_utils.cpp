#include "oracle_utils.hpp"
#include "duckdb/common/types/uuid.hpp"
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace oracle_pushdown {

namespace {

uint32_t ParsePositive(const std::string &key, const std::string &value) {
    long long parsed = 0;
    try {
        size_t used = 0;
        parsed = std::stoll(value, &used);
        if (used != value.size()) {
            throw std::invalid_argument(value);
        }
    } catch (const std::logic_error &) {
        throw InvalidInputException("Invalid value for %s: '%s'", key, value);
    }
    if (parsed <= 0 || parsed > 0xFFFFFFFFLL) {
        throw InvalidInputException("%s must be a positive integer: '%s'", key, value);
    }
    return static_cast<uint32_t>(parsed);
}

} // namespace

// ─── OracleUtils ──────────────────────────────────────────────────────────────

std::string OracleUtils::FormatOracleError(const std::string &context,
                                           const std::string &oracle_msg) {
    return "Oracle error in " + context + ": " + oracle_msg;
}

std::unordered_map<std::string, std::string>
OracleUtils::ParseKeyValueString(const std::string &s) {
    std::unordered_map<std::string, std::string> result;
    size_t pos = 0;
    const size_t len = s.size();

    while (pos < len) {
        while (pos < len && std::isspace((unsigned char)s[pos])) ++pos;
        if (pos >= len) break;

        size_t key_start = pos;
        while (pos < len && s[pos] != '=' && !std::isspace((unsigned char)s[pos])) ++pos;
        std::string key = s.substr(key_start, pos - key_start);
        if (key.empty()) {
            throw InvalidInputException("Missing key before '=' in connection string");
        }

        while (pos < len && std::isspace((unsigned char)s[pos])) ++pos;
        if (pos >= len || s[pos] != '=') {
            throw InvalidInputException("Expected '=' after key '%s' in connection string", key);
        }
        ++pos;
        while (pos < len && std::isspace((unsigned char)s[pos])) ++pos;

        std::string value;
        if (pos < len && s[pos] == '\'') {
            ++pos;
            size_t val_start = pos;
            while (pos < len && s[pos] != '\'') ++pos;
            if (pos >= len) {
                throw InvalidInputException("Unterminated quoted value for key '%s'", key);
            }
            value = s.substr(val_start, pos - val_start);
            ++pos; // 閉じクォート
        } else {
            size_t val_start = pos;
            while (pos < len && !std::isspace((unsigned char)s[pos])) ++pos;
            value = s.substr(val_start, pos - val_start);
        }

        result[key] = value;
    }
    return result;
}

std::string OracleUtils::ToNumberedBinds(const std::string &sql) {
    enum class Lexeme { CODE, QUOTED, LINE_COMMENT, BLOCK_COMMENT };

    std::string result;
    result.reserve(sql.size() + 16);
    Lexeme state = Lexeme::CODE;
    char quote = '\0';
    int bind_number = 0;
    const size_t len = sql.size();

    for (size_t i = 0; i < len; ++i) {
        char c = sql[i];
        char next = i + 1 < len ? sql[i + 1] : '\0';
        switch (state) {
        case Lexeme::QUOTED:
            // '' や "" のエスケープは閉じ→開きの連続として扱えば十分
            if (c == quote) state = Lexeme::CODE;
            result += c;
            break;
        case Lexeme::LINE_COMMENT:
            if (c == '\n') state = Lexeme::CODE;
            result += c;
            break;
        case Lexeme::BLOCK_COMMENT:
            if (c == '*' && next == '/') {
                result += "*/";
                ++i;
                state = Lexeme::CODE;
            } else {
                result += c;
            }
            break;
        case Lexeme::CODE:
            if (c == '\'' || c == '"') {
                quote = c;
                state = Lexeme::QUOTED;
                result += c;
            } else if (c == '-' && next == '-') {
                result += "--";
                ++i;
                state = Lexeme::LINE_COMMENT;
            } else if (c == '/' && next == '*') {
                result += "/*";
                ++i;
                state = Lexeme::BLOCK_COMMENT;
            } else if (c == '?') {
                result += ":" + std::to_string(++bind_number);
            } else {
                result += c;
            }
            break;
        }
    }
    return result;
}

std::string OracleUtils::UuidToBytes(const std::string &uuid) {
    hugeint_t value;
    if (!UUID::FromString(uuid, value)) {
        throw InvalidInputException("Invalid UUID string: '%s'", uuid);
    }
    // DuckDB は順序比較のため先頭ビットを反転して保持している
    uint64_t upper = static_cast<uint64_t>(value.upper) ^ (uint64_t(1) << 63);
    uint64_t lower = value.lower;

    std::string bytes(16, '\0');
    for (int i = 0; i < 8; ++i) {
        bytes[i]     = static_cast<char>((upper >> (56 - 8 * i)) & 0xFF);
        bytes[8 + i] = static_cast<char>((lower >> (56 - 8 * i)) & 0xFF);
    }
    return bytes;
}

// ─── OracleConnectionParameters ───────────────────────────────────────────────

OracleConnectionParameters
OracleConnectionParameters::ParseConnectionString(const std::string &conn_str) {
    OracleConnectionParameters params;
    std::string kv_part = conn_str;

    // EasyConnect 形式: "//host[:port][/service] key=val ..."
    if (conn_str.compare(0, 2, "//") == 0) {
        size_t space_pos = conn_str.find(' ');
        std::string ec = conn_str.substr(2, space_pos == std::string::npos
                                                ? std::string::npos
                                                : space_pos - 2);
        kv_part = space_pos == std::string::npos ? "" : conn_str.substr(space_pos + 1);

        size_t slash = ec.find('/');
        std::string host_port = ec.substr(0, slash);
        if (slash != std::string::npos) {
            params.service_name = ec.substr(slash + 1);
        }
        size_t colon = host_port.find(':');
        if (colon != std::string::npos) {
            params.port = (int)ParsePositive("port", host_port.substr(colon + 1));
            host_port = host_port.substr(0, colon);
        }
        if (host_port.empty()) {
            throw InvalidInputException("Missing host in EasyConnect string '%s'", conn_str);
        }
        params.host = host_port;
    }

    auto kv = OracleUtils::ParseKeyValueString(kv_part);
    auto get = [&](const std::string &key, const std::string &default_val) {
        auto it = kv.find(key);
        return it != kv.end() ? it->second : default_val;
    };

    params.host         = get("host", params.host);
    params.port         = (int)ParsePositive("port", get("port", std::to_string(params.port)));
    params.service_name = get("service", get("service_name", params.service_name));
    params.sid          = get("sid", "");
    params.tns_name     = get("tns", "");
    params.user         = get("user", get("username", ""));
    params.password     = get("password", "");
    params.fetch_size   = ParsePositive("fetch_size",
                                        get("fetch_size", std::to_string(params.fetch_size)));
    params.prefetch_rows = ParsePositive("prefetch_rows",
                                         get("prefetch_rows", std::to_string(params.prefetch_rows)));
    params.Validate();
    return params;
}

void OracleConnectionParameters::Validate() const {
    if (tns_name.empty()) {
        if (host.empty()) {
            throw InvalidInputException("Oracle host must be set when no TNS alias is given");
        }
        if (port <= 0 || port > 65535) {
            throw InvalidInputException("Oracle port out of range: %d", port);
        }
    }
    if (fetch_size == 0) {
        throw InvalidInputException("fetch_size must be a positive integer");
    }
    if (prefetch_rows == 0) {
        throw InvalidInputException("prefetch_rows must be a positive integer");
    }
}

std::string OracleConnectionParameters::BuildConnectString() const {
    if (!tns_name.empty()) {
        return tns_name;
    }
    std::ostringstream oss;
    if (service_name.empty() && !sid.empty()) {
        // SID は EasyConnect で表せないので記述子で渡す
        oss << "(DESCRIPTION=(ADDRESS=(PROTOCOL=TCP)(HOST=" << host
            << ")(PORT=" << port << "))"
            << "(CONNECT_DATA=(SID=" << sid << ")))";
        return oss.str();
    }
    oss << "//" << host << ":" << port << "/" << service_name;
    return oss.str();
}

} // namespace oracle_pushdown
