#include "oracle_tuple_domain.hpp"
#include "duckdb/common/exception.hpp"
#include <utility>

namespace oracle_pushdown {

// ─── Marker ───────────────────────────────────────────────────────────────────

Marker::Marker(bool has_value, Value value, MarkerBound bound)
    : has_value_(has_value), value_(std::move(value)), bound_(bound) {
    if (has_value_ && value_.IsNull()) {
        throw InternalException("Marker value must not be NULL");
    }
}

Marker Marker::LowerUnbounded() {
    return Marker(false, Value(), MarkerBound::ABOVE);
}

Marker Marker::UpperUnbounded() {
    return Marker(false, Value(), MarkerBound::BELOW);
}

Marker Marker::Above(const Value &value) {
    return Marker(true, value, MarkerBound::ABOVE);
}

Marker Marker::Exactly(const Value &value) {
    return Marker(true, value, MarkerBound::EXACTLY);
}

Marker Marker::Below(const Value &value) {
    return Marker(true, value, MarkerBound::BELOW);
}

const Value &Marker::GetValue() const {
    if (!has_value_) {
        throw InternalException("No value to get from an unbounded marker");
    }
    return value_;
}

std::string Marker::ToString() const {
    if (IsLowerUnbounded()) return "<min>";
    if (IsUpperUnbounded()) return "<max>";
    switch (bound_) {
    case MarkerBound::ABOVE:   return value_.ToString() + "+";
    case MarkerBound::EXACTLY: return value_.ToString();
    case MarkerBound::BELOW:   return value_.ToString() + "-";
    }
    return value_.ToString();
}

// ─── Range ────────────────────────────────────────────────────────────────────

Range::Range(Marker low, Marker high) : low_(std::move(low)), high_(std::move(high)) {
    // upper unbounded は BELOW、lower unbounded は ABOVE なのでここで弾ける
    if (low_.GetBound() == MarkerBound::BELOW) {
        throw InternalException("Low Marker should never use BELOW bound: %s", ToString());
    }
    if (high_.GetBound() == MarkerBound::ABOVE) {
        throw InternalException("High Marker should never use ABOVE bound: %s", ToString());
    }
    if (low_.HasValue() && high_.HasValue()) {
        const Value &lo = low_.GetValue();
        const Value &hi = high_.GetValue();
        if (lo > hi) {
            throw InternalException("Low must be less than or equal to high: %s", ToString());
        }
        if (lo == hi && (low_.GetBound() != MarkerBound::EXACTLY ||
                         high_.GetBound() != MarkerBound::EXACTLY)) {
            throw InternalException("Range is empty: %s", ToString());
        }
    }
}

Range Range::All() {
    return Range(Marker::LowerUnbounded(), Marker::UpperUnbounded());
}

Range Range::Equal(const Value &value) {
    return Range(Marker::Exactly(value), Marker::Exactly(value));
}

Range Range::GreaterThan(const Value &low) {
    return Range(Marker::Above(low), Marker::UpperUnbounded());
}

Range Range::GreaterThanOrEqual(const Value &low) {
    return Range(Marker::Exactly(low), Marker::UpperUnbounded());
}

Range Range::LessThan(const Value &high) {
    return Range(Marker::LowerUnbounded(), Marker::Below(high));
}

Range Range::LessThanOrEqual(const Value &high) {
    return Range(Marker::LowerUnbounded(), Marker::Exactly(high));
}

bool Range::IsAll() const {
    return low_.IsLowerUnbounded() && high_.IsUpperUnbounded();
}

bool Range::IsSingleValue() const {
    return low_.HasValue() && high_.HasValue() &&
           low_.GetBound() == MarkerBound::EXACTLY &&
           high_.GetBound() == MarkerBound::EXACTLY &&
           low_.GetValue() == high_.GetValue();
}

const Value &Range::GetSingleValue() const {
    if (!IsSingleValue()) {
        throw InternalException("Range does not have just a single value: %s", ToString());
    }
    return low_.GetValue();
}

std::string Range::ToString() const {
    std::string result = low_.GetBound() == MarkerBound::EXACTLY ? "[" : "(";
    result += low_.ToString() + ", " + high_.ToString();
    result += high_.GetBound() == MarkerBound::EXACTLY ? "]" : ")";
    return result;
}

// ─── RangeSet ─────────────────────────────────────────────────────────────────

RangeSet::RangeSet(bool is_all, std::vector<Range> ranges)
    : is_all_(is_all), ranges_(std::move(ranges)) {}

RangeSet RangeSet::None() {
    return RangeSet(false, {});
}

RangeSet RangeSet::All() {
    return RangeSet(true, {});
}

RangeSet RangeSet::Of(std::vector<Range> ranges) {
    for (const auto &range : ranges) {
        if (range.IsAll()) {
            return All();
        }
    }
    return RangeSet(false, std::move(ranges));
}

// ─── Domain ───────────────────────────────────────────────────────────────────

Domain::Domain(RangeSet ranges, bool null_allowed)
    : ranges_(std::move(ranges)), null_allowed_(null_allowed) {}

Domain Domain::Create(RangeSet ranges, bool null_allowed) {
    return Domain(std::move(ranges), null_allowed);
}

Domain Domain::All() {
    return Domain(RangeSet::All(), true);
}

Domain Domain::None() {
    return Domain(RangeSet::None(), false);
}

Domain Domain::OnlyNull() {
    return Domain(RangeSet::None(), true);
}

Domain Domain::NotNull() {
    return Domain(RangeSet::All(), false);
}

Domain Domain::SingleValue(const Value &value) {
    return Domain(RangeSet::Of({Range::Equal(value)}), false);
}

Domain Domain::MultipleValues(const std::vector<Value> &values) {
    if (values.empty()) {
        throw InternalException("Domain::MultipleValues requires at least one value");
    }
    std::vector<Range> ranges;
    ranges.reserve(values.size());
    for (const auto &value : values) {
        ranges.push_back(Range::Equal(value));
    }
    return Domain(RangeSet::Of(std::move(ranges)), false);
}

// ─── TupleDomain ──────────────────────────────────────────────────────────────

TupleDomain::TupleDomain(bool is_none, std::map<idx_t, Domain> domains)
    : is_none_(is_none), domains_(std::move(domains)) {}

TupleDomain TupleDomain::None() {
    return TupleDomain(true, {});
}

TupleDomain TupleDomain::All() {
    return TupleDomain(false, {});
}

TupleDomain TupleDomain::WithColumnDomains(const std::map<idx_t, Domain> &domains) {
    std::map<idx_t, Domain> normalized;
    for (const auto &entry : domains) {
        if (entry.second.IsNone()) {
            return None();
        }
        if (entry.second.IsAll()) {
            continue;
        }
        normalized.emplace(entry.first, entry.second);
    }
    return TupleDomain(false, std::move(normalized));
}

} // namespace oracle_pushdown
