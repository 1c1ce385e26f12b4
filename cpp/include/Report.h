#pragma once
/**
 * @file Report.h
 * @brief Console rendering of a finished sweep.
 */
#include <ostream>
#include <string>
#include <vector>

#include "Collector.h"
#include "Sweep.h"

namespace vialsim {
    /**
     * @brief Print the aborted-trial notice and the best outcomes.
     *
     * People are listed in input order, not roster order. At most numOutcomes outcomes are printed.
     *
     * @param os           destination stream
     * @param summary      counts from Sweep::summary()
     * @param ranking      merged ranking collector
     * @param names        person names in input order
     * @param numVials     vials retired per trial
     * @param numOutcomes  how many outcomes to print
     */
    void printReport(std::ostream& os, const SweepSummary& summary, const RankingCollector& ranking,
                     const std::vector<std::string>& names, int numVials, size_t numOutcomes);

    /** @brief printReport into a string. */
    std::string formatReport(const SweepSummary& summary, const RankingCollector& ranking,
                             const std::vector<std::string>& names, int numVials, size_t numOutcomes);
}
