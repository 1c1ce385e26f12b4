#pragma once
/**
 * @file Collector.h
 * @brief Interfaces and implementations for collecting sweep results.
 */
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <tuple>
#include <vector>

#include "CompiledExpression.h"
#include "Sampler.h"
#include "TrialResult.h"

namespace vialsim {
    /**
     * @brief Base interface for streaming & final data collection.
     */
    class DataCollector {
    public:
        virtual ~DataCollector() = default;

        /** @brief reset the per‑trial temporary state */
        virtual void reset() = 0;

        /**
         * @brief record the draw about to be simulated
         * @param draw   the combination generating this trial
         */
        virtual void recordDraw(const Draw& draw) = 0;

        /**
         * @brief commit a completed, accepted trial into long‑term storage
         * @param outcome  the trial's result
         */
        virtual void save(const TrialOutcome& outcome) = 0;

        /**
         * @brief merge another collector’s results into this one
         * @param other  same type collector to absorb
         */
        virtual void merge(const DataCollector& other) = 0;

        /** @brief clone a fresh, empty instance of this collector type */
        virtual std::unique_ptr<DataCollector> clone() const = 0;
    };

    /**
     * @brief A saved outcome together with the ordinal of the draw that produced it.
     */
    struct RankedOutcome {
        uint64_t ordinal;
        TrialOutcome outcome;
    };

    /**
     * @brief Unique outcomes ranked by waste, ascending.
     *
     * Two outcomes are the same when waste (to 1e-6 mL), day and the roster (names, dosages and
     * frequencies in roster order) match; the lowest ordinal is kept. Equal waste ranks by ordinal,
     * which makes the ranking independent of how the sweep was split across workers.
     */
    class RankingCollector final : public DataCollector {
    public:
        /**
         * @param topK  keep only the best topK outcomes (0 = keep all)
         */
        explicit RankingCollector(size_t topK = 0);
        RankingCollector(const RankingCollector& other) = default;

        std::unique_ptr<DataCollector> clone() const override { return std::make_unique<RankingCollector>(topK_); }

        void reset() override { currentOrdinal_ = 0; }
        void recordDraw(const Draw& draw) override { currentOrdinal_ = draw.ordinal; }
        void save(const TrialOutcome& outcome) override;
        void merge(const DataCollector& other) override;

        /**
         * @brief Outcomes sorted by (waste, ordinal), at most topK of them.
         */
        std::vector<RankedOutcome> ranked() const;

        /** @brief Number of distinct outcomes currently held (before the topK cut). */
        size_t size() const noexcept { return entries_.size(); }

        size_t topK() const noexcept { return topK_; }

    private:
        using RosterKey = std::vector<std::tuple<std::string, long long, int>>;
        using Key = std::tuple<long long, int, RosterKey>;

        size_t topK_;
        std::map<Key, RankedOutcome> entries_;
        uint64_t currentOrdinal_ = 0;

        static Key keyOf(const TrialOutcome& outcome);
        void insert(RankedOutcome entry);
        void trim();
    };


    /**
     * @brief One‐dimensional histogram of a compiled expression over completed trials.
     */
    class Hist1D final : public DataCollector {
    public:
        /**
         * @brief Construct a 1D histogram collector.
         * @param expression  compiled expression mapping (Draw, outcome)→value
         * @param bins  number of bins (> 0)
         * @param lo    lower bound
         * @param hi    upper bound (> lo)
         */
        explicit Hist1D(const CompiledExpression& expression, int bins, double lo, double hi);

        std::unique_ptr<DataCollector> clone() const override {
            return std::make_unique<Hist1D>(expression_, bins_, lo_, hi_);
        }

        void reset() override {}
        void recordDraw(const Draw& draw) override { draw_ = draw; }
        void merge(const DataCollector& other) override;
        void save(const TrialOutcome& outcome) override;

        /**
         * @brief Retrieve the accumulated histogram counts.
         * @return vector of length `bins`
         */
        std::vector<long> histogram() const noexcept { return hist_; }

        /** @brief Values that fell outside [lo, hi]. */
        long outOfRange() const noexcept { return outOfRange_; }

    private:
        CompiledExpression expression_;
        int bins_;
        double lo_, hi_;
        std::vector<long> hist_;
        long outOfRange_ = 0;
        Draw draw_; // per trial
    };


    /**
     * @brief Thread‑local grouping of multiple DataCollector instances.
     *
     * Internally owns unique_ptr<DataCollector> clones.
     */
    class DataCollectorGroup final : public DataCollector {
    public:
        DataCollectorGroup() = default;

        /**
         * @brief Construct by cloning each supplied DataCollector.
         * @param collectors  original collectors to clone
         */
        explicit DataCollectorGroup(const std::vector<std::unique_ptr<DataCollector>>& collectors);

        /**
         * @brief Construct by cloning from shared_ptr collectors.
         * @param collectors  original collectors to clone
         */
        explicit DataCollectorGroup(const std::vector<std::shared_ptr<DataCollector>>& collectors);


        /**
         * @brief Copy constructor; the copy holds fresh, empty clones.
         * @param other the other DataCollectorGroup to copy
         */
        DataCollectorGroup(const DataCollectorGroup& other);

        std::unique_ptr<DataCollector> clone() const override { return std::make_unique<DataCollectorGroup>(*this); }

        void reset() override {
            for (const auto& c : collectors_) c->reset();
        }

        void recordDraw(const Draw& draw) override {
            for (const auto& c : collectors_) c->recordDraw(draw);
        }

        void merge(const DataCollector& other) override;

        void save(const TrialOutcome& outcome) override {
            for (const auto& c : collectors_) c->save(outcome);
        }

        /** @brief Number of collectors in this group. */
        size_t size() const { return collectors_.size(); }

        /**
         * @brief Access a specific collector.
         * @param i  index [0...size())
         */
        const std::unique_ptr<DataCollector>& at(const size_t i) const { return collectors_.at(i); }

    private:
        std::vector<std::unique_ptr<DataCollector>> collectors_;
    };
}
