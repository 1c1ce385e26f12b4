#include "Dosage.h"

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <stdexcept>

using namespace vialsim;

double vialsim::roundTo(const double value, const int places) {
    if (places < 0 || places > 15)
        throw std::invalid_argument("roundTo: places must be in [0, 15]");
    // printf rounds the exact binary value, so 0.061 * 5 (0.30499...) becomes 0.30, not 0.31.
    char buf[400];
    std::snprintf(buf, sizeof(buf), "%.*f", places, value);
    return std::strtod(buf, nullptr);
}

Roster vialsim::normalizeRoster(const std::vector<std::string>& names, const Draw& draw) {
    if (names.empty())
        throw std::invalid_argument("normalizeRoster: empty roster");
    if (draw.doseRates.size() != names.size() || draw.frequencies.size() != names.size())
        throw std::invalid_argument("normalizeRoster: draw width does not match number of people");

    Roster roster;
    roster.reserve(names.size());
    for (size_t i = 0; i < names.size(); ++i) {
        const int frequency = draw.frequencies[i];
        if (frequency < 1)
            throw std::invalid_argument("normalizeRoster: frequency must be >= 1 for " + names[i]);
        roster.push_back(PersonDosage{names[i], roundTo(draw.doseRates[i] * frequency, 2), frequency});
    }

    std::stable_sort(roster.begin(), roster.end(),
                     [](const PersonDosage& a, const PersonDosage& b) { return a.dosage > b.dosage; });
    return roster;
}

bool vialsim::checkLegalDosages(const Roster& roster, const double vialVolume) noexcept {
    if (roster.empty()) return false;
    if (roster.front().dosage > vialVolume) return false;
    if (roster.back().dosage <= 0.0) return false;
    return true;
}
