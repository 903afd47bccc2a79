#pragma once

#include "duckdb.hpp"
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace oracle_pushdown {

using namespace duckdb;

// ───────────────────────────────────────────────────────────────────────────────
// Marker: Range の片端。値なしは unbounded
// ───────────────────────────────────────────────────────────────────────────────
enum class MarkerBound : uint8_t {
    ABOVE,    // 値より大きい（low 側のみ）
    EXACTLY,  // 値と等しい
    BELOW     // 値より小さい（high 側のみ）
};

class Marker {
public:
    static Marker LowerUnbounded();
    static Marker UpperUnbounded();
    static Marker Above(const Value &value);
    static Marker Exactly(const Value &value);
    static Marker Below(const Value &value);

    bool IsLowerUnbounded() const { return !has_value_ && bound_ == MarkerBound::ABOVE; }
    bool IsUpperUnbounded() const { return !has_value_ && bound_ == MarkerBound::BELOW; }
    bool HasValue() const { return has_value_; }

    // HasValue() が false の場合は InternalException
    const Value &GetValue() const;
    MarkerBound GetBound() const { return bound_; }

    std::string ToString() const;

private:
    Marker(bool has_value, Value value, MarkerBound bound);

    bool        has_value_;
    Value       value_;
    MarkerBound bound_;
};

// ───────────────────────────────────────────────────────────────────────────────
// Range: low / high の Marker で表す区間
// ───────────────────────────────────────────────────────────────────────────────
class Range {
public:
    // low = BELOW / high = ABOVE などの不正な組み合わせは InternalException
    Range(Marker low, Marker high);

    static Range All();
    static Range Equal(const Value &value);
    static Range GreaterThan(const Value &low);
    static Range GreaterThanOrEqual(const Value &low);
    static Range LessThan(const Value &high);
    static Range LessThanOrEqual(const Value &high);

    const Marker &GetLow() const  { return low_; }
    const Marker &GetHigh() const { return high_; }

    bool IsAll() const;
    bool IsSingleValue() const;

    // IsSingleValue() の場合のみ
    const Value &GetSingleValue() const;

    std::string ToString() const;

private:
    Marker low_;
    Marker high_;
};

// ───────────────────────────────────────────────────────────────────────────────
// RangeSet: Range の集合。None（空）と All を明示的に持つ
// 挿入順を保持し、ソートやマージは行わない
// ───────────────────────────────────────────────────────────────────────────────
class RangeSet {
public:
    static RangeSet None();
    static RangeSet All();
    // 両端 unbounded の Range を含めば All、空なら None
    static RangeSet Of(std::vector<Range> ranges);

    bool IsNone() const { return !is_all_ && ranges_.empty(); }
    bool IsAll() const  { return is_all_; }

    const std::vector<Range> &GetRanges() const { return ranges_; }

private:
    RangeSet(bool is_all, std::vector<Range> ranges);

    bool               is_all_;
    std::vector<Range> ranges_;
};

// ───────────────────────────────────────────────────────────────────────────────
// Domain: 1 カラム分の制約 = 許可される値の範囲 + NULL 許可
// ───────────────────────────────────────────────────────────────────────────────
class Domain {
public:
    Domain(RangeSet ranges, bool null_allowed);

    static Domain Create(RangeSet ranges, bool null_allowed);
    static Domain All();
    static Domain None();
    static Domain OnlyNull();
    static Domain NotNull();
    static Domain SingleValue(const Value &value);
    static Domain MultipleValues(const std::vector<Value> &values);

    const RangeSet &GetRanges() const { return ranges_; }
    bool IsNullAllowed() const { return null_allowed_; }

    bool IsAll() const  { return ranges_.IsAll() && null_allowed_; }
    bool IsNone() const { return ranges_.IsNone() && !null_allowed_; }

private:
    RangeSet ranges_;
    bool     null_allowed_;
};

// ───────────────────────────────────────────────────────────────────────────────
// TupleDomain: カラムインデックス → Domain
// None = どの行も満たさない、空のマップ = 全カラム無制約
// ───────────────────────────────────────────────────────────────────────────────
class TupleDomain {
public:
    static TupleDomain None();
    static TupleDomain All();

    // All の Domain は除外し、None の Domain があれば全体を None にする
    static TupleDomain WithColumnDomains(const std::map<idx_t, Domain> &domains);

    bool IsNone() const { return is_none_; }
    bool IsAll() const  { return !is_none_ && domains_.empty(); }

    // IsNone() の場合は空
    const std::map<idx_t, Domain> &GetDomains() const { return domains_; }

private:
    TupleDomain(bool is_none, std::map<idx_t, Domain> domains);

    bool                    is_none_;
    std::map<idx_t, Domain> domains_;
};

} // namespace oracle_pushdown
