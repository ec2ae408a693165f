// STL headers
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>

// axostim headers
#include "core/AlternationFactory.hpp"
#include "core/ConfigLoader.hpp"
#include "core/DecoderConfig.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/Logger.hpp"
#include "core/ProtocolDecoder.hpp"
#include "core/ProtocolError.hpp"
#include "protocols/AlternationStrategy.hpp"

// axostim fakes
#include "AnnotationBuilder.hpp"

// GTest headers
#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace axostim::test {

  using core::AlternationFactory;
  using core::ConfigLoader;
  using core::DecoderConfig;
  using core::ErrorMonitor;
  using core::Logger;
  using core::ProtocolDecoder;
  using namespace axostim::protocols;
  using ::testing::HasSubstr;

  class MockErrorMonitor : public ErrorMonitor {
  public:
    MOCK_METHOD(void, notifyFailure, (const std::string&), (override));
  };

  class AlwaysAlternate : public AlternationStrategy {
  public:
    Parity selectVariant(std::uint32_t) const override { return Parity::Alternate; }
  };

  namespace {

    std::filesystem::path scratchFile(const std::string& name) {
      return std::filesystem::temp_directory_path() / ("axostim_" + name);
    }

    std::string slurp(const std::filesystem::path& p) {
      std::ifstream in(p);
      std::stringstream ss;
      ss << in.rdbuf();
      return ss.str();
    }

  } // namespace

  //---ErrorMonitor--------------------------------------------------------------

  TEST(ErrorMonitor, escalatesEachUniqueFailureOnce) {
    ErrorMonitor monitor;
    int calls = 0;
    std::string last;
    monitor.registerEscalation([&](const std::string& msg) {
      ++calls;
      last = msg;
    });

    monitor.notifyFailure("[Resolver] sweep 9 out of range");
    monitor.notifyFailure("[Resolver] sweep 9 out of range");
    monitor.notifyFailure("[Ingest] bad epoch");

    EXPECT_EQ(calls, 2);
    EXPECT_EQ(last, "[Ingest] bad epoch");
    EXPECT_EQ(monitor.failureCount(), 2u);
    EXPECT_EQ(monitor.failures().front(), "[Resolver] sweep 9 out of range");
  }

  TEST(ErrorMonitor, worksWithoutEscalation) {
    ErrorMonitor monitor;
    monitor.notifyFailure("x");
    EXPECT_EQ(monitor.failureCount(), 1u);
  }

  //---AlternationFactory--------------------------------------------------------

  TEST(AlternationFactory, parityIsPreRegistered) {
    const AlternationFactory factory;
    auto strategy = factory.create("parity");
    ASSERT_NE(strategy, nullptr);
    EXPECT_EQ(strategy->selectVariant(3), Parity::Alternate);
    EXPECT_EQ(factory.names(), std::vector<std::string>{ "parity" });
  }

  TEST(AlternationFactory, registerAndCreate) {
    AlternationFactory factory;
    EXPECT_TRUE(factory.registerStrategy("always", [] { return std::make_unique<AlwaysAlternate>(); }));
    EXPECT_FALSE(factory.registerStrategy("always", [] { return std::make_unique<AlwaysAlternate>(); }));
    EXPECT_EQ(factory.create("always")->selectVariant(0), Parity::Alternate);
    EXPECT_THROW(factory.create("n-way"), std::out_of_range);
    EXPECT_THROW(factory.registerStrategy("empty", nullptr), std::invalid_argument);
    EXPECT_EQ(factory.names(), (std::vector<std::string>{ "always", "parity" }));
  }

  //---DecoderConfig / ConfigLoader----------------------------------------------

  TEST(DecoderConfig, defaultsFromEmptyObject) {
    const DecoderConfig cfg = DecoderConfig::fromJson(json::object());
    EXPECT_EQ(cfg.alternation, "parity");
    EXPECT_FALSE(cfg.strictEpochCoverage);
    EXPECT_DOUBLE_EQ(cfg.samplingRateHz, 10000.0);
    EXPECT_TRUE(cfg.logPath.empty());
    EXPECT_TRUE(cfg.triggerLines.empty());
  }

  TEST(DecoderConfig, parsesEveryField) {
    const json j = { { "alternation", "parity" },
                     { "strictEpochCoverage", true },
                     { "samplingRateHz", 20000 },
                     { "logPath", "decode.csv" },
                     { "triggerLines", { { "0", "presynaptic" }, { "5", "imaging_frame" } } } };
    const DecoderConfig cfg = DecoderConfig::fromJson(j);
    EXPECT_TRUE(cfg.strictEpochCoverage);
    EXPECT_DOUBLE_EQ(cfg.samplingRateHz, 20000.0);
    EXPECT_EQ(cfg.logPath, "decode.csv");
    ASSERT_EQ(cfg.triggerLines.size(), 2u);
    EXPECT_EQ(cfg.triggerLines.at(0), TriggerEventType::Presynaptic);
    EXPECT_EQ(cfg.triggerLines.at(5), TriggerEventType::ImagingFrame);
  }

  TEST(DecoderConfig, rejectsBadValues) {
    EXPECT_THROW(DecoderConfig::fromJson(json::array()), std::invalid_argument);
    EXPECT_THROW(DecoderConfig::fromJson({ { "samplingRateHz", 0 } }), std::invalid_argument);
    EXPECT_THROW(DecoderConfig::fromJson({ { "strictEpochCoverage", "yes" } }),
                 std::invalid_argument);
    EXPECT_THROW(DecoderConfig::fromJson({ { "triggerLines", { { "8", "user" } } } }),
                 std::invalid_argument);
    EXPECT_THROW(DecoderConfig::fromJson({ { "triggerLines", { { "one", "user" } } } }),
                 std::invalid_argument);
    EXPECT_THROW(DecoderConfig::fromJson({ { "triggerLines", { { "1", "laser" } } } }),
                 std::invalid_argument);
  }

  TEST(ConfigLoader, readsJsonFile) {
    const auto path = scratchFile("config_ok.json");
    {
      std::ofstream out(path);
      out << R"({ "strictEpochCoverage": true, "triggerLines": { "2": "sweep" } })";
    }
    const ConfigLoader loader(path.string());
    const DecoderConfig cfg = DecoderConfig::fromJson(loader.load());
    EXPECT_TRUE(cfg.strictEpochCoverage);
    EXPECT_EQ(cfg.triggerLines.at(2), TriggerEventType::Sweep);
    std::filesystem::remove(path);
  }

  TEST(ConfigLoader, missingOrBrokenFile_Throws) {
    EXPECT_THROW(ConfigLoader(scratchFile("does_not_exist.json").string()).load(),
                 std::runtime_error);

    const auto path = scratchFile("config_broken.json");
    {
      std::ofstream out(path);
      out << "{ \"alternation\": ";
    }
    EXPECT_THROW(ConfigLoader(path.string()).load(), std::runtime_error);
    std::filesystem::remove(path);
  }

  //---ProtocolDecoder-----------------------------------------------------------

  class ProtocolDecoderTest : public ::testing::Test {
  protected:
    void SetUp() override {
      errorMonitor = std::make_shared<testing::NiceMock<MockErrorMonitor>>();

      builder.flag("lEpisodesPerRun", 2)
          .flag("lRunsPerTrial", 2)
          .flag("nAlternateDACOutputState", 1)
          .flag("nDigitalTrainActiveLogic", 1)
          .flag("fADCSequenceInterval", 100.0)
          .digital(digitalRecord(0, 0, 1))
          .epoch(0, epochRecord(0, 3, 5.0, 200, 50, 10, 0.0, 100))
          .alternateEpoch(0, epochRecord(0, 1, -5.0, 200));
    }

    std::unique_ptr<ProtocolDecoder> makeDecoder(DecoderConfig cfg = {},
                                                 std::shared_ptr<Logger> logger = nullptr,
                                                 const AlternationFactory& factory = {}) {
      return std::make_unique<ProtocolDecoder>(std::move(cfg),
                                               std::static_pointer_cast<ErrorMonitor>(errorMonitor),
                                               std::move(logger), factory);
    }

    std::shared_ptr<testing::NiceMock<MockErrorMonitor>> errorMonitor;
    AnnotationBuilder builder;
  };

  TEST_F(ProtocolDecoderTest, nullMonitor_Throws) {
    EXPECT_THROW(ProtocolDecoder(DecoderConfig{}, nullptr), std::invalid_argument);
  }

  TEST_F(ProtocolDecoderTest, unknownAlternation_Throws) {
    DecoderConfig cfg;
    cfg.alternation = "n-way";
    EXPECT_THROW(makeDecoder(cfg), std::out_of_range);
  }

  TEST_F(ProtocolDecoderTest, useBeforeLoad_IsLogicError) {
    auto decoder = makeDecoder();
    EXPECT_FALSE(decoder->loaded());
    EXPECT_THROW(decoder->decodeSweep(0), std::logic_error);
    EXPECT_THROW(decoder->sweepCount(), std::logic_error);
    EXPECT_THROW(decoder->descriptor(), std::logic_error);
  }

  TEST_F(ProtocolDecoderTest, decodesEverySweep) {
    auto decoder = makeDecoder();
    decoder->load(builder.bundle());
    ASSERT_TRUE(decoder->loaded());
    ASSERT_EQ(decoder->sweepCount(), 4u);

    // sweep 0: episode 0, primary train of 200 samples
    const SweepWaveform s0 = decoder->decodeSweep(0);
    EXPECT_EQ(s0.episode, 0u);
    EXPECT_EQ(s0.sampleCount, 200u);
    EXPECT_FALSE(s0.digital[0].alwaysLow());

    // sweep 1: episode 1, alternate step (train duration grew to 300)
    const SweepWaveform s1 = decoder->decodeSweep(1);
    EXPECT_EQ(s1.episode, 1u);
    const auto segs = s1.analog[0].collect();
    ASSERT_FALSE(segs.empty());
    EXPECT_DOUBLE_EQ(segs[0].level, -5.0);

    // sweep 2 starts run 2 at episode 0
    EXPECT_EQ(decoder->decodeSweep(2).episode, 0u);
  }

  TEST_F(ProtocolDecoderTest, outOfRangeSweep_ReportedAndRethrown) {
    EXPECT_CALL(*errorMonitor, notifyFailure(HasSubstr("out of range"))).Times(1);
    auto decoder = makeDecoder();
    decoder->load(builder.bundle());
    EXPECT_THROW(decoder->decodeSweep(4), core::OutOfRangeSweep);
  }

  TEST_F(ProtocolDecoderTest, nonAxonRecording_IsMalformed) {
    EXPECT_CALL(*errorMonitor, notifyFailure(HasSubstr("Axon"))).Times(1);
    json bundle = builder.bundle();
    bundle["software"] = "CED";
    auto decoder = makeDecoder();
    EXPECT_THROW(decoder->load(bundle), core::MalformedProtocol);
    EXPECT_FALSE(decoder->loaded());
  }

  TEST_F(ProtocolDecoderTest, missingAnnotation_IsMalformed) {
    EXPECT_CALL(*errorMonitor, notifyFailure(HasSubstr("EpochInfo"))).Times(1);
    json bundle = builder.bundle();
    bundle.erase("EpochInfo");
    auto decoder = makeDecoder();
    EXPECT_THROW(decoder->load(bundle), core::MalformedProtocol);
  }

  TEST_F(ProtocolDecoderTest, strictCoverage_FromConfig) {
    builder.epoch(0, epochRecord(2, 1, 1.0, 10)).alternateEpoch(0, epochRecord(2, 1, 1.0, 10));
    DecoderConfig cfg;
    cfg.strictEpochCoverage = true;
    EXPECT_CALL(*errorMonitor, notifyFailure(HasSubstr("missing epoch"))).Times(1);

    auto decoder = makeDecoder(cfg);
    decoder->load(builder.bundle());
    EXPECT_THROW(decoder->decodeSweep(0), core::EpochOrderingGap);
  }

  TEST_F(ProtocolDecoderTest, injectedStrategy_PicksAlternateSet) {
    AlternationFactory factory;
    factory.registerStrategy("always", [] { return std::make_unique<AlwaysAlternate>(); });
    DecoderConfig cfg;
    cfg.alternation = "always";

    auto decoder = makeDecoder(cfg, nullptr, factory);
    decoder->load(builder.bundle());
    const auto segs = decoder->decodeSweep(0).analog[0].collect();
    ASSERT_EQ(segs.size(), 1u);
    EXPECT_DOUBLE_EQ(segs[0].level, -5.0);
  }

  TEST_F(ProtocolDecoderTest, triggers_UseConfiguredLinesAndRecordedInterval) {
    DecoderConfig cfg;
    cfg.triggerLines = { { 0, TriggerEventType::Presynaptic } };
    auto decoder = makeDecoder(cfg);
    decoder->load(builder.bundle());

    EXPECT_DOUBLE_EQ(decoder->sampleIntervalSeconds(), 1e-4);
    const TriggerProtocol p = decoder->triggers(0);
    EXPECT_EQ(p.name, "sweep_0");
    ASSERT_TRUE(p.presynaptic.has_value());
    ASSERT_EQ(p.presynaptic->times.size(), 4u);
    EXPECT_DOUBLE_EQ(p.presynaptic->times[1], 0.005);
  }

  TEST_F(ProtocolDecoderTest, sampleInterval_FallsBackToConfiguredRate) {
    builder.protocol.erase("fADCSequenceInterval");
    DecoderConfig cfg;
    cfg.samplingRateHz = 20000.0;
    auto decoder = makeDecoder(cfg);
    decoder->load(builder.bundle());
    EXPECT_DOUBLE_EQ(decoder->sampleIntervalSeconds(), 5e-5);
  }

  TEST_F(ProtocolDecoderTest, decodeSteps_AreLogged) {
    const auto path = scratchFile("decode_log.csv");
    auto logger = std::make_shared<Logger>();
    logger->startNewRun(path.string());

    {
      auto decoder = makeDecoder({}, logger);
      decoder->load(builder.bundle());
      decoder->decodeSweep(1);
      EXPECT_THROW(decoder->decodeSweep(9), core::OutOfRangeSweep);
    }
    logger->finishRun();

    const std::string csv = slurp(path);
    EXPECT_THAT(csv, HasSubstr("timestamp_ms,stage,sweep,episode,message"));
    EXPECT_THAT(csv, HasSubstr(",ingest,-1,-1,"));
    EXPECT_THAT(csv, HasSubstr(",synthesize,1,1,"));
    EXPECT_THAT(csv, HasSubstr("FAILED"));
    EXPECT_EQ(logger->dropped(), 0u);
    std::filesystem::remove(path);
  }

} // namespace axostim::test
