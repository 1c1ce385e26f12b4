#include "InjectionTrial.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <unordered_set>

using namespace vialsim;

InjectionTrial::InjectionTrial(Roster roster, const int numVials, const double vialVolume,
                               const LeftoverPolicy policy)
    : roster_(std::move(roster)),
      numVials_(numVials),
      vialVolume_(vialVolume),
      policy_(policy),
      earlyTermination_(false) {
    if (roster_.empty()) throw std::invalid_argument("InjectionTrial: empty roster");
    if (numVials_ < 1) throw std::invalid_argument("InjectionTrial: numVials must be >= 1");
    if (!std::isfinite(vialVolume_) || vialVolume_ <= 0.0)
        throw std::invalid_argument("InjectionTrial: vialVolume must be a positive volume");
    for (const auto& p : roster_)
        if (p.frequency < 1)
            throw std::invalid_argument("InjectionTrial: frequency must be >= 1 for " + p.name);

    std::stable_sort(roster_.begin(), roster_.end(),
                     [](const PersonDosage& a, const PersonDosage& b) { return a.dosage > b.dosage; });

    earlyTermination_ = !checkLegalDosages(roster_, vialVolume_);
    state_.activeRemaining = vialVolume_;
}

std::vector<LeftoverFragment>::iterator InjectionTrial::findLeftover(const double dose) {
    auto& leftovers = state_.leftovers;
    auto best = leftovers.end();
    for (auto it = leftovers.begin(); it != leftovers.end(); ++it) {
        if (it->amount - dose < 0) continue;
        if (best == leftovers.end() || it->amount < best->amount) best = it;
    }
    return best;
}

void InjectionTrial::retainLeftover(const double amount) {
    auto& leftovers = state_.leftovers;
    if (policy_ == LeftoverPolicy::SINGLE_SLOT && !leftovers.empty()) {
        state_.overwritten += leftovers.front().amount;
        leftovers.clear();
    }
    leftovers.push_back(LeftoverFragment{amount});
}

bool InjectionTrial::doInjection(const double dose) {
    const auto fragment = findLeftover(dose);
    if (fragment != state_.leftovers.end()) {
        fragment->amount = fragment->amount - dose;
        state_.consumed += dose;
        // too small for anyone now
        if (fragment->amount - minDosage() < 0) {
            state_.waste += fragment->amount;
            state_.leftovers.erase(fragment);
        }
        return true;
    }

    if (state_.activeRemaining - dose >= 0) {
        state_.activeRemaining = state_.activeRemaining - dose;
        state_.consumed += dose;
        return true;
    }
    return false;
}

void InjectionTrial::updateVialsUsed() {
    if (state_.activeRemaining < minDosage()) {
        state_.waste += state_.activeRemaining;
    } else if (state_.activeRemaining < maxDosage()) {
        retainLeftover(state_.activeRemaining);
    } else {
        return;
    }
    state_.vialsUsed++;
    state_.activeRemaining = vialVolume_;
}

void InjectionTrial::stepDay() {
    if (earlyTermination_) throw std::logic_error("InjectionTrial::stepDay: roster failed the dosage gate");
    if (finished()) throw std::logic_error("InjectionTrial::stepDay: vial target already reached");

    const size_t n = roster_.size();
    std::vector<bool> handled(n);
    size_t due = 0;
    for (size_t i = 0; i < n; ++i) {
        handled[i] = state_.day % roster_[i].frequency != 0;
        if (!handled[i]) due++;
    }

    // A failed pass always retires the primary vial, and the fresh vial serves at least the first
    // outstanding person, so every pass after the first makes progress.
    const size_t maxPasses = due + 1;
    size_t passes = 0;
    do {
        if (passes++ == maxPasses)
            throw std::logic_error("InjectionTrial::stepDay: day " + std::to_string(state_.day) +
                                   " did not converge");

        for (size_t i = 0; i < n; ++i)
            if (!handled[i]) handled[i] = doInjection(roster_[i].dosage);
        updateVialsUsed();
    } while (std::find(handled.begin(), handled.end(), false) != handled.end());

    if (!finished()) state_.day++;
}

std::optional<TrialOutcome> InjectionTrial::run() {
    if (earlyTermination_) return std::nullopt;

    while (!finished()) stepDay();

    return TrialOutcome{state_.waste, state_.day, state_.vialsUsed, state_.overwritten, roster_};
}

std::optional<TrialOutcome> vialsim::simulate(const std::vector<ScheduleEntry>& people, const int numVials,
                                              const double vialVolume, const LeftoverPolicy policy) {
    std::vector<std::string> names;
    std::unordered_set<std::string> seen;
    Draw draw{0, {}, {}};
    for (const auto& p : people) {
        if (!seen.insert(p.name).second)
            throw std::invalid_argument("simulate: duplicate person '" + p.name + "'");
        names.push_back(p.name);
        draw.doseRates.push_back(p.doseRate);
        draw.frequencies.push_back(p.interval);
    }

    InjectionTrial trial(normalizeRoster(names, draw), numVials, vialVolume, policy);
    return trial.run();
}
