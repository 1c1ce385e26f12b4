#pragma once
/**
 * @file TrialResult.h
 * @brief Possible outcomes of a simulated trial.
 */
#include "Dosage.h"

namespace vialsim {
    /**
     * @brief Codes assigned to every draw processed by Sweep.
     */
    enum class TrialResult : int { COMPLETED, INVALID_DOSAGE, REJECTED_BY_VALIDATOR, REJECTED_BY_CRITERIA };

    /**
     * @brief What a completed trial reports.
     */
    struct TrialOutcome {
        double waste; /**< mL discarded */
        int day; /**< day on which the vial target was reached */
        int vialsUsed; /**< retired vials, >= target */
        double overwritten; /**< mL dropped by single-slot leftover replacement, not counted as waste */
        Roster roster; /**< sorted descending by dosage */
    };
}
