#pragma once
/**
 * @file Sweep.h
 * @brief Parallel sweep over dosage combinations.
 */
#include "Sampler.h"
#include "Criterion.h"
#include "Collector.h"
#include "CompiledExpression.h"
#include "TrialResult.h"
#include "VialState.h"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace vialsim {
    /**
     * @brief Thrown when a sweep produced no usable trial at all.
     */
    class NoUsableScheduleError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    /**
     * @brief How the draws of a sweep were resolved.
     */
    struct SweepSummary {
        uint64_t total = 0; /**< draws processed */
        uint64_t completed = 0; /**< trials saved to the collectors */
        uint64_t aborted = 0; /**< rosters that failed the dosage gate */
        uint64_t filtered = 0; /**< draws skipped by the validator expression */
        uint64_t rejected = 0; /**< completed trials that failed the criteria */

        void merge(const SweepSummary& other) noexcept {
            total += other.total;
            completed += other.completed;
            aborted += other.aborted;
            filtered += other.filtered;
            rejected += other.rejected;
        }
    };

    /**
     * @brief Orchestrates combination sampling, parallel trials, criteria, and data collection.
     */
    class Sweep {
    public:
        /**
         * @param samplerProto  Prototype sampler to split into threads.
         * @param people        People in draw order; names must be unique.
         * @param numVials      Vials to retire per trial.
         * @param vialVolume    mL per vial.
         * @param criteria      Group of acceptance criteria on completed trials.
         * @param collectors    Group of data collectors.
         * @param chunkSize     How many draws per batch.
         * @param maxWorkers    Number of threads.
         * @param validator     Expression to filter draws before simulating them.
         * @param policy        Leftover retention policy for every trial.
         * @throws std::invalid_argument on bad sizes or a validator compiled for other names
         */
        Sweep(const Sampler& samplerProto,
              const std::vector<Person>& people,
              int numVials,
              double vialVolume,
              const CriterionGroup& criteria,
              const DataCollectorGroup& collectors,
              int chunkSize,
              int maxWorkers,
              const CompiledExpression& validator,
              LeftoverPolicy policy = LeftoverPolicy::SINGLE_SLOT);

        /**
         * @brief Run every draw, merging results into `collectors()` and `summary()`.
         * @throws NoUsableScheduleError if no trial completed
         * @throws std::logic_error if called twice
         */
        void run();

        /** @brief Access the merged collectors after `run()`. */
        const DataCollectorGroup& collectors() const { return collectors_; }

        const SweepSummary& summary() const noexcept { return summary_; }

        const std::vector<std::string>& names() const noexcept { return names_; }

    private:
        // Configuration
        const Sampler& samplerProto_;
        const std::vector<std::string> names_;
        const int numVials_;
        const double vialVolume_;
        const CriterionGroup criteria_;
        DataCollectorGroup collectors_;
        const int chunkSize_, maxWorkers_;
        const CompiledExpression validator_;
        const LeftoverPolicy policy_;

        SweepSummary summary_;
        bool hasRun_ = false;

        TrialResult processDraw(const Draw& draw, const CompiledExpression& validator,
                                const CriterionGroup& criterionGroup, DataCollectorGroup& collectorGroup) const;

        void processBlock(const std::vector<Draw>& block, const CompiledExpression& validator,
                          const CriterionGroup& criterionGroup, DataCollectorGroup& collectorGroup,
                          SweepSummary& summary) const;
    };
}
