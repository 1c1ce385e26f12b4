#pragma once
/**
 * @file VialState.h
 * @brief Mutable vial bookkeeping owned by one trial.
 */
#include <vector>

namespace vialsim {
    /**
     * @brief How partially used vials are retained.
     *
     * SINGLE_SLOT keeps at most one leftover and a new one replaces it (reference behaviour).
     * POOLED keeps every leftover and serves a dose from the smallest fragment that covers it.
     */
    enum class LeftoverPolicy : int { SINGLE_SLOT, POOLED };

    /** @brief Retained remainder of a retired vial. */
    struct LeftoverFragment {
        double amount; /**< mL */
    };

    /**
     * @brief Volumes and counters for one trial. Created fresh per trial, never shared.
     *
     * Conservation: waste + consumed + activeRemaining + leftoverTotal() + overwritten
     *               == vialsOpened() * vialVolume
     */
    struct VialState {
        double activeRemaining = 0.0; /**< mL in the open primary vial */
        std::vector<LeftoverFragment> leftovers; /**< active fragments only */
        int vialsUsed = 0; /**< retired vials; the open one is not counted */
        double waste = 0.0; /**< cumulative discarded mL, non-decreasing */
        double consumed = 0.0; /**< cumulative injected mL */
        double overwritten = 0.0; /**< mL dropped when a single-slot leftover was replaced */
        int day = 1;

        int vialsOpened() const noexcept { return vialsUsed + 1; }

        bool hasLeftover() const noexcept { return !leftovers.empty(); }

        double leftoverTotal() const noexcept {
            double sum = 0.0;
            for (const auto& f : leftovers) sum += f.amount;
            return sum;
        }
    };
}
