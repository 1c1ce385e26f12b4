#pragma once
/**
 * @file Dosage.h
 * @brief Per-injection dosages derived from a draw, and the dosage validity gate.
 */
#include <string>
#include <vector>

#include "Sampler.h"

namespace vialsim {
    /**
     * @brief One person's concrete schedule within a trial.
     */
    struct PersonDosage {
        std::string name;
        double dosage;  /**< mL per injection, rounded to 2 decimals */
        int frequency;  /**< days between injections */

        bool operator==(const PersonDosage& o) const {
            return name == o.name && dosage == o.dosage && frequency == o.frequency;
        }
    };

    /** Sorted descending by dosage: front() is the largest dose, back() the smallest. */
    using Roster = std::vector<PersonDosage>;

    /**
     * @brief Round the exact binary value of `value` to `places` decimals.
     *
     * A product such as 0.061 * 5 is stored just below 0.305 and rounds down. Exact binary ties
     * round to even.
     * @throws std::invalid_argument unless 0 <= places <= 15
     */
    double roundTo(double value, int places);

    /**
     * @brief Compute each person's dosage (rate * frequency, 2 decimals) and sort descending.
     *
     * The sort is stable, so equal dosages keep input order.
     *
     * @param names  person names in input order
     * @param draw   one rate and one frequency per name
     * @throws std::invalid_argument if sizes differ, the draw is empty or a frequency is < 1
     */
    Roster normalizeRoster(const std::vector<std::string>& names, const Draw& draw);

    /**
     * @brief Validity gate: the largest dose fits in a vial and the smallest is positive.
     * @return false if the trial must be early-terminated
     */
    bool checkLegalDosages(const Roster& roster, double vialVolume) noexcept;
}
