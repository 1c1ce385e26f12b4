#pragma once
/**
 * @file InjectionTrial.h
 * @brief Day-by-day vial depletion for one fixed dosage schedule.
 */
#include <optional>
#include <string>
#include <vector>

#include "Dosage.h"
#include "TrialResult.h"
#include "VialState.h"

namespace vialsim {
    /**
     * @brief Simulates shared use of multi-dose vials until a number of vials has been retired.
     *
     * Every day, each person whose interval divides the day index injects once, in roster order
     * (largest dose first). Leftover fragments are tried before the primary vial. After each pass
     * over the due people the replacement policy runs: a primary vial that cannot serve the largest
     * dose is retired, either as waste (nobody fits) or as a leftover (only smaller doses fit).
     */
    class InjectionTrial {
    public:
        /**
         * @param roster      schedule per person; re-sorted descending by dosage
         * @param numVials    stop once this many vials have been retired (>= 1)
         * @param vialVolume  mL per vial (> 0)
         * @param policy      leftover retention policy
         * @throws std::invalid_argument on an empty roster, a frequency < 1 or bad vial parameters
         */
        InjectionTrial(Roster roster, int numVials, double vialVolume,
                       LeftoverPolicy policy = LeftoverPolicy::SINGLE_SLOT);

        /** @brief True if the roster failed the dosage gate; no simulation will run. */
        bool earlyTermination() const noexcept { return earlyTermination_; }

        /**
         * @brief Try to inject one dose, from a leftover fragment if one covers it, else from the primary vial.
         *
         * A fragment left smaller than the smallest roster dose is discarded as waste.
         *
         * @return false if neither a fragment nor the primary vial can cover the dose
         */
        bool doInjection(double dose);

        /**
         * @brief Retire the primary vial if it can no longer serve the largest dose.
         *
         * Below the smallest dose the remainder is wasted; otherwise it becomes a leftover fragment.
         * In both cases vialsUsed grows by one and a full vial is opened. No-op when the largest dose fits.
         */
        void updateVialsUsed();

        /**
         * @brief Process every due injection of the current day, then advance the day unless finished.
         * @throws std::logic_error if the trial is early-terminated or already finished
         */
        void stepDay();

        /** @brief True once vialsUsed has reached the target. */
        bool finished() const noexcept { return state_.vialsUsed >= numVials_; }

        /**
         * @brief Run to completion.
         * @return the outcome, or nullopt if the roster failed the dosage gate
         */
        std::optional<TrialOutcome> run();

        const VialState& state() const noexcept { return state_; }
        const Roster& roster() const noexcept { return roster_; }
        double vialVolume() const noexcept { return vialVolume_; }

    private:
        Roster roster_;
        const int numVials_;
        const double vialVolume_;
        const LeftoverPolicy policy_;
        bool earlyTermination_;
        VialState state_;

        double minDosage() const { return roster_.back().dosage; }
        double maxDosage() const { return roster_.front().dosage; }

        /** Smallest fragment that still covers `dose`, or leftovers.end(). */
        std::vector<LeftoverFragment>::iterator findLeftover(double dose);

        void retainLeftover(double amount);
    };

    /**
     * @brief One person's raw schedule: per-day rate and interval.
     */
    struct ScheduleEntry {
        std::string name;
        double doseRate; /**< mL per day */
        int interval; /**< days between injections */
    };

    /**
     * @brief Normalize a roster and run one trial.
     * @return nullopt for an invalid dosage roster (largest dose > vial volume, or smallest <= 0)
     * @throws std::invalid_argument on duplicate names or bad trial parameters
     */
    std::optional<TrialOutcome> simulate(const std::vector<ScheduleEntry>& people, int numVials,
                                         double vialVolume, LeftoverPolicy policy = LeftoverPolicy::SINGLE_SLOT);
}
