#pragma once
/** @file  SweepWaveform.hpp
 *  @brief Lazy, restartable analog segment and digital transition sequences of one sweep.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <array>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <vector>

// axostim headers
#include "protocols/DigitalRegistry.hpp"
#include "protocols/ProtocolDescriptor.hpp"

namespace axostim {
  namespace protocols {

    /**
 * @class LazySequence
 * @brief Input-iterator view over a Source that generates items on demand.
 *
 *  Source provides `bool advance(Cursor&, Item&) const`. Every begin() starts
 *  a fresh cursor, so iterating twice yields the same items.
 */
    template <typename Source, typename Item, typename Cursor> class LazySequence {
    public:
      using value_type = Item;

      class iterator {
      public:
        using iterator_category = std::input_iterator_tag;
        using value_type = Item;
        using difference_type = std::ptrdiff_t;
        using pointer = const Item*;
        using reference = const Item&;

        iterator() = default;
        explicit iterator(const Source* src) : src_(src) { step(); }

        reference operator*() const { return current_; }
        pointer operator->() const { return &current_; }
        iterator& operator++() {
          step();
          return *this;
        }
        iterator operator++(int) {
          iterator tmp = *this;
          step();
          return tmp;
        }
        bool operator==(const iterator& o) const { return src_ == o.src_ && count_ == o.count_; }
        bool operator!=(const iterator& o) const { return !(*this == o); }

      private:
        void step() {
          if (src_ && src_->advance(cursor_, current_)) {
            ++count_;
            return;
          }
          src_ = nullptr;
          count_ = 0;
        }

        const Source* src_{ nullptr };
        Cursor cursor_{};
        Item current_{};
        std::size_t count_{ 0 };
      };

      iterator begin() const { return iterator(static_cast<const Source*>(this)); }
      iterator end() const { return iterator(); }

      /// Materialize the whole sequence.
      std::vector<Item> collect() const { return std::vector<Item>(begin(), end()); }
    };

    //---analog----------------------------------------------------------------

    enum class SegmentShape : std::uint8_t { Flat, Linear, Cosine };

    /**
 * @struct AnalogSegment
 * @brief A run of samples [sampleOffset, sampleOffset + sampleCount).
 *
 *  * Flat:   every sample at `level`.
 *  * Linear: `level` at the first sample, heading to `endLevel` at the sample after the run.
 *  * Cosine: `level + amplitude * cos(2*pi*i / period)` for the i-th sample of the run.
 */
    struct AnalogSegment {
      std::uint64_t sampleOffset{ 0 };
      std::uint64_t sampleCount{ 0 };
      SegmentShape shape{ SegmentShape::Flat };
      double level{ 0.0 };
      double endLevel{ 0.0 };
      double amplitude{ 0.0 };
      std::uint32_t period{ 0 };

      /// Value of the i-th sample of this segment (0 <= i < sampleCount).
      double valueAt(std::uint64_t i) const;
    };

    /// One epoch after per-episode scaling, placed on the sweep's time axis.
    struct AnalogEpochPlan {
      int epochNumber{ 0 };
      EpochType type{ EpochType::Step };
      std::uint64_t start{ 0 };
      std::uint64_t duration{ 0 };
      double baseline{ 0.0 }; ///< level entering the epoch
      double level{ 0.0 };    ///< effective level for this episode
      std::uint32_t period{ 0 };
      std::uint32_t width{ 0 };
    };

    struct AnalogCursor {
      std::size_t plan{ 0 };
      std::uint64_t cycle{ 0 };
      int phase{ 0 };
      bool tailDone{ false };
    };

    /**
 * @class AnalogTrace
 * @brief Ordered analog segments of one DAC channel covering the whole sweep.
 */
    class AnalogTrace : public LazySequence<AnalogTrace, AnalogSegment, AnalogCursor> {
    public:
      AnalogTrace() = default;
      AnalogTrace(int channelNumber, double holdingLevel, std::vector<AnalogEpochPlan> plans,
                  std::uint64_t sweepSamples);

      int channelNumber() const { return channel_; }
      double holdingLevel() const { return holding_; }
      std::uint64_t sampleCount() const { return span_; }
      const std::vector<AnalogEpochPlan>& epochs() const { return plans_; }

      /// Dense per-sample rendering, sampleCount() values.
      std::vector<double> render() const;

      bool advance(AnalogCursor& c, AnalogSegment& out) const;

    private:
      int channel_{ 0 };
      double holding_{ 0.0 };
      std::vector<AnalogEpochPlan> plans_;
      std::uint64_t span_{ 0 };
    };

    //---digital---------------------------------------------------------------

    struct DigitalTransition {
      std::uint64_t sampleOffset{ 0 };
      bool state{ false };

      bool operator==(const DigitalTransition& o) const {
        return sampleOffset == o.sampleOffset && state == o.state;
      }
    };

    enum class LineMode : std::uint8_t { Low, High, Train };

    /// What one digital line does during one epoch.
    struct LineEpochPlan {
      int epochNumber{ 0 };
      std::uint64_t start{ 0 };
      std::uint64_t duration{ 0 };
      LineMode mode{ LineMode::Low };
      std::uint32_t period{ 0 };
      std::uint32_t width{ 0 };
    };

    struct DigitalCursor {
      std::size_t plan{ 0 };
      std::uint64_t cycle{ 0 };
      int phase{ 0 };
      bool tailDone{ false };
      bool emitted{ false };
      bool lastState{ false };
    };

    /**
 * @class DigitalTrace
 * @brief State of one digital line: its level at sample 0, then each change.
 */
    class DigitalTrace : public LazySequence<DigitalTrace, DigitalTransition, DigitalCursor> {
    public:
      DigitalTrace() = default;
      DigitalTrace(int line, std::vector<LineEpochPlan> plans, std::uint64_t sweepSamples);

      int line() const { return line_; }
      std::uint64_t sampleCount() const { return span_; }

      /// True when the line never goes high during the sweep.
      bool alwaysLow() const;

      /// Dense per-sample rendering (0/1), sampleCount() values.
      std::vector<std::uint8_t> render() const;

      bool advance(DigitalCursor& c, DigitalTransition& out) const;

    private:
      bool rawNext(DigitalCursor& c, DigitalTransition& out) const;

      int line_{ 0 };
      std::vector<LineEpochPlan> plans_;
      std::uint64_t span_{ 0 };
    };

    /**
 * @struct SweepWaveform
 * @brief Synthesizer output for one sweep/episode.
 */
    struct SweepWaveform {
      std::uint32_t sweepIndex{ 0 };
      std::uint32_t episode{ 0 };
      std::uint64_t sampleCount{ 0 };
      std::vector<AnalogTrace> analog; ///< ascending channel number
      std::array<DigitalTrace, kDigitalLineCount> digital{};

      /// nullptr when the channel has no waveform.
      const AnalogTrace* findChannel(int channelNumber) const;
    };

  } // namespace protocols
} // namespace axostim
