// axostim headers
#include "core/ProtocolError.hpp"
#include "protocols/AlternationResolver.hpp"
#include "protocols/AlternationStrategy.hpp"
#include "protocols/ProtocolDescriptor.hpp"

// axostim fakes
#include "AnnotationBuilder.hpp"
#include "MockAlternationStrategy.hpp"

// GTest headers
#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace axostim::test {

  using core::OutOfRangeSweep;
  using namespace axostim::protocols;
  using ::testing::Return;

  class AlternationResolverTest : public ::testing::Test {
  protected:
    void SetUp() override {
      // epoch 0: line 0 on primary sweeps, lines 5+6 (registry #7-4) on alternate sweeps
      json d0 = digitalRecord(0, 1, 0, 6, 0);
      d0["nAlternateDigitalRegistry"] = 1;
      builder.flag("lRunsPerTrial", 2)
          .flag("lEpisodesPerRun", 3)
          .flag("nAlternateDigitalOutputState", 1)
          .flag("fDACHoldingLevel", json::array({ -60.0, 5.0 }))
          .digital(d0)
          .digital(digitalRecord(1, 0, 2, 0, 0))
          .epoch(0, epochRecord(0, 1, 10.0, 100))
          .epoch(0, epochRecord(1, 2, 20.0, 50))
          .epoch(1, epochRecord(0, 1, 1.0, 80));
    }

    AnnotationBuilder builder;
  };

  TEST_F(AlternationResolverTest, everyIndexBelowSweepCount_Resolves) {
    const ProtocolDescriptor desc = builder.build();
    ASSERT_EQ(desc.sweepCount(), 6u);
    for (std::uint32_t s = 0; s < desc.sweepCount(); ++s) {
      const ResolvedSweep r = resolve(desc, s);
      EXPECT_EQ(r.sweepIndex, s);
      EXPECT_EQ(r.channels.size(), 2u);
      EXPECT_EQ(r.digital.size(), 2u);
    }
  }

  TEST_F(AlternationResolverTest, indexAtSweepCount_IsOutOfRange) {
    const ProtocolDescriptor desc = builder.build();
    EXPECT_THROW(resolve(desc, 6), OutOfRangeSweep);
    EXPECT_THROW(resolve(desc, 1000), OutOfRangeSweep);
  }

  TEST_F(AlternationResolverTest, digitalAlternation_FollowsSweepParity) {
    const ProtocolDescriptor desc = builder.build();

    const ResolvedSweep s0 = resolve(desc, 0);
    EXPECT_EQ(s0.digitalParity, Parity::Primary);
    EXPECT_EQ(s0.digital[0].value, 1);
    EXPECT_EQ(s0.digital[0].registry, Registry::Low);
    EXPECT_EQ(s0.digital[1].trainValue, 2);

    const ResolvedSweep s1 = resolve(desc, 1);
    EXPECT_EQ(s1.digitalParity, Parity::Alternate);
    EXPECT_EQ(s1.digital[0].value, 6);
    EXPECT_EQ(s1.digital[0].registry, Registry::High);
    EXPECT_EQ(s1.digital[1].trainValue, 0);

    const ResolvedSweep s2 = resolve(desc, 2);
    EXPECT_EQ(s2.digitalParity, Parity::Primary);
    EXPECT_EQ(s2.digital[0].value, 1);
  }

  TEST_F(AlternationResolverTest, alternationOff_AlwaysPrimary) {
    builder.flag("nAlternateDigitalOutputState", 0);
    const ProtocolDescriptor desc = builder.build();
    for (std::uint32_t s = 0; s < desc.sweepCount(); ++s) {
      const ResolvedSweep r = resolve(desc, s);
      EXPECT_EQ(r.digitalParity, Parity::Primary);
      EXPECT_EQ(r.analogParity, Parity::Primary);
      EXPECT_EQ(r.digital[0].value, 1);
    }
  }

  TEST_F(AlternationResolverTest, resolvedValues_CopyDescriptorExactly) {
    const ProtocolDescriptor desc = builder.build();
    const ResolvedSweep r = resolve(desc, 4);

    EXPECT_EQ(r.settings.runsPerTrial, 2u);
    EXPECT_EQ(r.settings.episodesPerRun, 3u);
    const ResolvedChannel* ch0 = r.findChannel(0);
    ASSERT_NE(ch0, nullptr);
    EXPECT_DOUBLE_EQ(ch0->holdingLevel, -60.0);
    ASSERT_EQ(ch0->epochs.size(), 2u);
    EXPECT_EQ(ch0->epochs[0].epochNumber, 0);
    EXPECT_EQ(ch0->epochs[1].type, EpochType::Ramp);
    EXPECT_DOUBLE_EQ(ch0->epochs[1].levelInit, 20.0);

    const ResolvedChannel* ch1 = r.findChannel(1);
    ASSERT_NE(ch1, nullptr);
    EXPECT_DOUBLE_EQ(ch1->holdingLevel, 5.0);
    EXPECT_EQ(r.findChannel(2), nullptr);
  }

  TEST_F(AlternationResolverTest, alternateWaveformSet_PlaysOnOddSweeps) {
    // digital timing comes from DAC 0, so its alternate set covers both epochs
    builder.flag("nAlternateDACOutputState", 1)
        .alternateEpoch(0, epochRecord(0, 1, -10.0, 100))
        .alternateEpoch(0, epochRecord(1, 1, -5.0, 40));
    const ProtocolDescriptor desc = builder.build();

    const ResolvedSweep even = resolve(desc, 0);
    EXPECT_EQ(even.analogParity, Parity::Primary);
    EXPECT_EQ(even.findChannel(0)->waveformSet, Parity::Primary);
    EXPECT_EQ(even.findChannel(0)->epochs.size(), 2u);

    const ResolvedSweep odd = resolve(desc, 1);
    EXPECT_EQ(odd.analogParity, Parity::Alternate);
    const ResolvedChannel* ch0 = odd.findChannel(0);
    ASSERT_NE(ch0, nullptr);
    EXPECT_EQ(ch0->waveformSet, Parity::Alternate);
    ASSERT_EQ(ch0->epochs.size(), 2u);
    EXPECT_DOUBLE_EQ(ch0->epochs[0].levelInit, -10.0);
    EXPECT_EQ(ch0->epochs[1].type, EpochType::Step);

    // DAC 1 has no alternate set and keeps its primary epochs
    const ResolvedChannel* ch1 = odd.findChannel(1);
    ASSERT_NE(ch1, nullptr);
    EXPECT_EQ(ch1->waveformSet, Parity::Primary);
    EXPECT_DOUBLE_EQ(ch1->epochs[0].levelInit, 1.0);
  }

  TEST_F(AlternationResolverTest, digitalTiming_AlternatesOnlyWithDigitalAlternation) {
    builder.flag("nAlternateDACOutputState", 1)
        .alternateEpoch(0, epochRecord(0, 1, -10.0, 100))
        .alternateEpoch(0, epochRecord(1, 1, -5.0, 40));

    const ResolvedSweep both = resolve(builder.build(), 1);
    ASSERT_TRUE(both.digitalTiming.has_value());
    EXPECT_EQ(both.digitalTiming->channelNumber, 0);
    EXPECT_EQ(both.digitalTiming->waveformSet, Parity::Alternate);
    EXPECT_EQ(both.digitalTiming->epochs[1].durationInit, 40u);

    builder.flag("nAlternateDigitalOutputState", 0);
    const ResolvedSweep analogOnly = resolve(builder.build(), 1);
    EXPECT_EQ(analogOnly.findChannel(0)->waveformSet, Parity::Alternate);
    ASSERT_TRUE(analogOnly.digitalTiming.has_value());
    EXPECT_EQ(analogOnly.digitalTiming->waveformSet, Parity::Primary);
    EXPECT_EQ(analogOnly.digitalTiming->epochs[1].durationInit, 50u);
  }

  TEST_F(AlternationResolverTest, injectedStrategy_DecidesParity) {
    builder.flag("nAlternateDACOutputState", 1)
        .alternateEpoch(0, epochRecord(0, 1, -10.0, 100))
        .alternateEpoch(0, epochRecord(1, 1, -5.0, 40));
    const ProtocolDescriptor desc = builder.build();

    MockAlternationStrategy strategy;
    EXPECT_CALL(strategy, selectVariant(2u)).WillOnce(Return(Parity::Alternate));

    const ResolvedSweep r = resolve(desc, 2, strategy);
    EXPECT_EQ(r.analogParity, Parity::Alternate);
    EXPECT_EQ(r.digitalParity, Parity::Alternate);
    EXPECT_EQ(r.findChannel(0)->waveformSet, Parity::Alternate);
  }

  TEST_F(AlternationResolverTest, outOfRange_NeverConsultsStrategy) {
    const ProtocolDescriptor desc = builder.build();
    MockAlternationStrategy strategy;
    EXPECT_CALL(strategy, selectVariant(::testing::_)).Times(0);
    EXPECT_THROW(resolve(desc, 6, strategy), OutOfRangeSweep);
  }

  TEST(ParityAlternation, evenPrimaryOddAlternate) {
    const ParityAlternation parity;
    EXPECT_EQ(parity.selectVariant(0), Parity::Primary);
    EXPECT_EQ(parity.selectVariant(1), Parity::Alternate);
    EXPECT_EQ(parity.selectVariant(2), Parity::Primary);
    EXPECT_STREQ(toString(Parity::Alternate), "alternate");
  }

} // namespace axostim::test
