#include <gtest/gtest.h>

#include "oracle_tuple_domain.hpp"
#include "duckdb/common/exception.hpp"

namespace oracle_pushdown {

TEST(Marker, Unbounded) {
    EXPECT_TRUE(Marker::LowerUnbounded().IsLowerUnbounded());
    EXPECT_FALSE(Marker::LowerUnbounded().HasValue());
    EXPECT_TRUE(Marker::UpperUnbounded().IsUpperUnbounded());
    EXPECT_THROW(Marker::UpperUnbounded().GetValue(), InternalException);
}

TEST(Marker, RejectsNullValue) {
    EXPECT_THROW(Marker::Exactly(Value(LogicalType::BIGINT)), InternalException);
}

TEST(Range, SingleValue) {
    Range range = Range::Equal(Value::BIGINT(5));
    EXPECT_TRUE(range.IsSingleValue());
    EXPECT_FALSE(range.IsAll());
    EXPECT_EQ(range.GetSingleValue(), Value::BIGINT(5));

    Range closed(Marker::Exactly(Value::BIGINT(3)), Marker::Exactly(Value::BIGINT(10)));
    EXPECT_FALSE(closed.IsSingleValue());
    EXPECT_THROW(closed.GetSingleValue(), InternalException);
}

TEST(Range, All) {
    EXPECT_TRUE(Range::All().IsAll());
    EXPECT_FALSE(Range::GreaterThan(Value::BIGINT(1)).IsAll());
}

TEST(Range, RejectsMisplacedBounds) {
    EXPECT_THROW(Range(Marker::Below(Value::BIGINT(1)), Marker::UpperUnbounded()),
                 InternalException);
    EXPECT_THROW(Range(Marker::LowerUnbounded(), Marker::Above(Value::BIGINT(1))),
                 InternalException);
    // 端の取り違え
    EXPECT_THROW(Range(Marker::UpperUnbounded(), Marker::UpperUnbounded()), InternalException);
    EXPECT_THROW(Range(Marker::LowerUnbounded(), Marker::LowerUnbounded()), InternalException);
}

TEST(Range, RejectsEmptyIntervals) {
    EXPECT_THROW(Range(Marker::Exactly(Value::BIGINT(10)), Marker::Exactly(Value::BIGINT(3))),
                 InternalException);
    EXPECT_THROW(Range(Marker::Above(Value::BIGINT(3)), Marker::Exactly(Value::BIGINT(3))),
                 InternalException);
}

TEST(RangeSet, States) {
    EXPECT_TRUE(RangeSet::None().IsNone());
    EXPECT_FALSE(RangeSet::None().IsAll());
    EXPECT_TRUE(RangeSet::All().IsAll());
    EXPECT_TRUE(RangeSet::Of({}).IsNone());

    auto with_all = RangeSet::Of({Range::Equal(Value::BIGINT(1)), Range::All()});
    EXPECT_TRUE(with_all.IsAll());
    EXPECT_TRUE(with_all.GetRanges().empty());
}

TEST(RangeSet, KeepsInsertionOrder) {
    auto ranges = RangeSet::Of({Range::Equal(Value::BIGINT(9)),
                                Range::Equal(Value::BIGINT(5)),
                                Range::Equal(Value::BIGINT(7))});
    ASSERT_EQ(ranges.GetRanges().size(), 3u);
    EXPECT_EQ(ranges.GetRanges()[0].GetSingleValue(), Value::BIGINT(9));
    EXPECT_EQ(ranges.GetRanges()[1].GetSingleValue(), Value::BIGINT(5));
    EXPECT_EQ(ranges.GetRanges()[2].GetSingleValue(), Value::BIGINT(7));
}

TEST(Domain, Factories) {
    EXPECT_TRUE(Domain::OnlyNull().GetRanges().IsNone());
    EXPECT_TRUE(Domain::OnlyNull().IsNullAllowed());
    EXPECT_TRUE(Domain::NotNull().GetRanges().IsAll());
    EXPECT_FALSE(Domain::NotNull().IsNullAllowed());
    EXPECT_TRUE(Domain::All().IsAll());
    EXPECT_TRUE(Domain::None().IsNone());
    EXPECT_FALSE(Domain::SingleValue(Value::BIGINT(1)).IsNullAllowed());
    EXPECT_EQ(Domain::MultipleValues({Value::BIGINT(1), Value::BIGINT(2)}).GetRanges().GetRanges().size(),
              2u);
    EXPECT_THROW(Domain::MultipleValues({}), InternalException);
}

TEST(TupleDomain, NoneAndAll) {
    EXPECT_TRUE(TupleDomain::None().IsNone());
    EXPECT_FALSE(TupleDomain::None().IsAll());
    EXPECT_TRUE(TupleDomain::All().IsAll());
    EXPECT_TRUE(TupleDomain::All().GetDomains().empty());
}

TEST(TupleDomain, WithColumnDomainsDropsAllDomains) {
    std::map<idx_t, Domain> domains;
    domains.emplace(0, Domain::All());
    domains.emplace(1, Domain::NotNull());
    auto tuple_domain = TupleDomain::WithColumnDomains(domains);

    EXPECT_FALSE(tuple_domain.IsNone());
    ASSERT_EQ(tuple_domain.GetDomains().size(), 1u);
    EXPECT_EQ(tuple_domain.GetDomains().begin()->first, 1u);
}

TEST(TupleDomain, WithColumnDomainsCollapsesToNone) {
    std::map<idx_t, Domain> domains;
    domains.emplace(0, Domain::SingleValue(Value::BIGINT(1)));
    domains.emplace(3, Domain::None());
    auto tuple_domain = TupleDomain::WithColumnDomains(domains);

    EXPECT_TRUE(tuple_domain.IsNone());
    EXPECT_TRUE(tuple_domain.GetDomains().empty());
}

} // namespace oracle_pushdown
