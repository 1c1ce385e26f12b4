#include "Report.h"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <stdexcept>

using namespace vialsim;

namespace {
    const PersonDosage& findByName(const Roster& roster, const std::string& name) {
        const auto it = std::find_if(roster.begin(), roster.end(),
                                     [&name](const PersonDosage& p) { return p.name == name; });
        if (it == roster.end()) throw std::invalid_argument("printReport: '" + name + "' is not in the roster");
        return *it;
    }
}

void vialsim::printReport(std::ostream& os, const SweepSummary& summary, const RankingCollector& ranking,
                          const std::vector<std::string>& names, const int numVials, const size_t numOutcomes) {
    if (summary.aborted > 0) {
        os << summary.aborted << " trials were aborted.\n";
        os << "This is likely a result of having a dose larger than the vial volume or a negative dose. \n\n";
    }

    const auto ranked = ranking.ranked();
    const size_t count = std::min(numOutcomes, ranked.size());

    const auto flags = os.flags();
    const auto precision = os.precision();
    os << std::fixed << std::setprecision(2);

    os << "The least wasteful dosage schedules are:\n";
    for (size_t i = 0; i < count; ++i) {
        const auto& outcome = ranked[i].outcome;
        os << "Optimal outcome: " << i + 1 << "\n";
        os << "Total wasted medicine:  " << outcome.waste << "  mL\n";
        os << "In " << outcome.day << " days, you will have used " << numVials << " vials\n";
        for (const auto& name : names) {
            const auto& p = findByName(outcome.roster, name);
            os << p.name << "'s dosage: " << p.dosage << " mL every " << p.frequency << " days\n";
        }
        os << "\n";
    }

    os.flags(flags);
    os.precision(precision);
}

std::string vialsim::formatReport(const SweepSummary& summary, const RankingCollector& ranking,
                                  const std::vector<std::string>& names, const int numVials,
                                  const size_t numOutcomes) {
    std::ostringstream os;
    printReport(os, summary, ranking, names, numVials, numOutcomes);
    return os.str();
}
