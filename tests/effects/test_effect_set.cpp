/**
 * @file test_effect_set.cpp
 * @brief Effect codes, lattice laws and subtyping
 */

#include "ecv/effects.hpp"

#include <string>
#include <vector>

#include <gtest/gtest.h>

namespace ecv::effects::test {

namespace {

std::vector<EffectSet> sample_sets()
{
    return {
        EffectSet{},
        EffectSet{Effect::kConsoleWrite},
        EffectSet{Effect::kFsRead, Effect::kNetWrite},
        EffectSet{Effect::kFsReadWrite, Effect::kThrow, Effect::kTime},
        EffectSet::top(),
    };
}

}  // namespace

TEST(EffectCodeTest, SurfaceCodesParseToThemselves)
{
    for (const Effect effect : all_effects()) {
        auto parsed = parse_effect_code(effect_code(effect));
        ASSERT_TRUE(parsed.has_value()) << effect_code(effect);
        EXPECT_EQ(*parsed, effect);
    }
    EXPECT_EQ(all_effects().size(), kEffectCount);
}

TEST(EffectCodeTest, LegacyAliasesAndCase)
{
    EXPECT_EQ(parse_effect_code("fr"), Effect::kFsRead);
    EXPECT_EQ(parse_effect_code("fw"), Effect::kFsWrite);
    EXPECT_EQ(parse_effect_code("http"), Effect::kNetReadWrite);
    EXPECT_EQ(parse_effect_code("net"), Effect::kNetReadWrite);
    EXPECT_EQ(parse_effect_code("db"), Effect::kDbReadWrite);
    EXPECT_EQ(parse_effect_code("rng"), Effect::kRandom);
    EXPECT_EQ(parse_effect_code("CW"), Effect::kConsoleWrite);
    EXPECT_EQ(parse_effect_code("Fs:R"), Effect::kFsRead);
    EXPECT_FALSE(parse_effect_code("teleport").has_value());
    EXPECT_FALSE(parse_effect_code("").has_value());
}

TEST(EffectSetTest, FromCodes)
{
    auto set = EffectSet::from_codes({"cw", "fr", "cw"});
    ASSERT_TRUE(set);
    EXPECT_EQ(set->codes(), (std::vector<std::string>{"cw", "fs:r"}));

    auto top = EffectSet::from_codes({"cw", "*"});
    ASSERT_TRUE(top);
    EXPECT_TRUE(top->is_top());

    auto bad = EffectSet::from_codes({"cw", "warp"});
    ASSERT_FALSE(bad);
    EXPECT_EQ(bad.error().code, "UnknownEffectCode");
    EXPECT_NE(bad.error().message.find("warp"), std::string::npos);
}

TEST(EffectSetTest, JoinIsSemilattice)
{
    const auto sets = sample_sets();
    for (const auto& a : sets) {
        EXPECT_EQ(a.join(a), a);
        EXPECT_EQ(a.join(EffectSet{}), a);
        EXPECT_TRUE(a.join(EffectSet::top()).is_top());
        for (const auto& b : sets) {
            EXPECT_EQ(a.join(b), b.join(a));
            for (const auto& c : sets) {
                EXPECT_EQ(a.join(b).join(c), a.join(b.join(c)));
            }
        }
    }
}

TEST(EffectSetTest, JoinInReportsGrowth)
{
    EffectSet set{Effect::kConsoleWrite};
    EXPECT_FALSE(set.join_in(EffectSet{Effect::kConsoleWrite}));
    EXPECT_TRUE(set.join_in(EffectSet{Effect::kTime}));
    EXPECT_TRUE(set.join_in(EffectSet::top()));
    EXPECT_TRUE(set.is_top());
    EXPECT_FALSE(set.join_in(EffectSet{Effect::kAlloc}));
    EXPECT_TRUE(set.members().empty());
}

TEST(EffectSetTest, ReadWriteSubtyping)
{
    const EffectSet rw{Effect::kFsReadWrite};
    EXPECT_TRUE(rw.covers(Effect::kFsRead));
    EXPECT_TRUE(rw.covers(Effect::kFsWrite));
    EXPECT_FALSE(rw.covers(Effect::kNetRead));

    const EffectSet both{Effect::kNetRead, Effect::kNetWrite};
    EXPECT_TRUE(both.covers(Effect::kNetReadWrite));

    const EffectSet read_only{Effect::kDbRead};
    EXPECT_FALSE(read_only.covers(Effect::kDbWrite));
    EXPECT_FALSE(read_only.covers(Effect::kDbReadWrite));

    EXPECT_TRUE(EffectSet::top().covers(EffectSet::top()));
    EXPECT_FALSE(rw.covers(EffectSet::top()));
    EXPECT_TRUE(rw.covers(EffectSet{Effect::kFsRead, Effect::kFsWrite}));
}

TEST(EffectSetTest, UncoveredBy)
{
    const EffectSet used{Effect::kConsoleWrite, Effect::kFsRead, Effect::kNetWrite};
    const EffectSet declared{Effect::kFsReadWrite, Effect::kConsoleWrite};
    EXPECT_EQ(used.uncovered_by(declared), EffectSet{Effect::kNetWrite});
    EXPECT_TRUE(used.uncovered_by(EffectSet::top()).is_empty());
    EXPECT_TRUE(EffectSet::top().uncovered_by(declared).is_top());
    EXPECT_TRUE(EffectSet{}.uncovered_by(EffectSet{}).is_empty());
}

TEST(EffectSetTest, Display)
{
    EXPECT_EQ(EffectSet{}.to_display_string(), "[pure]");
    EXPECT_EQ(EffectSet::top().to_display_string(), "[unknown]");
    EXPECT_EQ((EffectSet{Effect::kDbRead, Effect::kConsoleWrite}).to_display_string(), "cw, db:r");
    EXPECT_EQ(EffectSet::top().codes(), std::vector<std::string>{"*"});
}

TEST(PrimitiveCatalogTest, KnownAndUnknownOperations)
{
    auto print = primitive_effects("print");
    ASSERT_TRUE(print.has_value());
    EXPECT_EQ(*print, EffectSet{Effect::kConsoleWrite});

    auto abs = primitive_effects("abs");
    ASSERT_TRUE(abs.has_value());
    EXPECT_TRUE(abs->is_empty());

    EXPECT_EQ(primitive_effects("throw"), EffectSet{Effect::kThrow});
    EXPECT_FALSE(primitive_effects("format_disk").has_value());
}

}  // namespace ecv::effects::test
