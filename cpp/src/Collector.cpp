#include "Collector.h"
#include <algorithm>
#include <cmath>
#include <stdexcept>

using namespace vialsim;

namespace {
    bool rankedBefore(const RankedOutcome& a, const RankedOutcome& b) {
        if (a.outcome.waste != b.outcome.waste) return a.outcome.waste < b.outcome.waste;
        return a.ordinal < b.ordinal;
    }
}

// RankingCollector
RankingCollector::RankingCollector(const size_t topK): topK_(topK) {}

RankingCollector::Key RankingCollector::keyOf(const TrialOutcome& outcome) {
    RosterKey roster;
    roster.reserve(outcome.roster.size());
    for (const auto& p : outcome.roster)
        roster.emplace_back(p.name, std::llround(p.dosage * 100.0), p.frequency);
    return Key{std::llround(outcome.waste * 1e6), outcome.day, std::move(roster)};
}

void RankingCollector::insert(RankedOutcome entry) {
    auto key = keyOf(entry.outcome);
    const auto it = entries_.find(key);
    if (it == entries_.end()) {
        entries_.emplace(std::move(key), std::move(entry));
    } else if (entry.ordinal < it->second.ordinal) {
        it->second = std::move(entry);
    }
}

void RankingCollector::trim() {
    if (topK_ == 0 || entries_.size() <= 2 * topK_) return;

    std::vector<const RankedOutcome*> order;
    order.reserve(entries_.size());
    for (const auto& kv : entries_) order.push_back(&kv.second);
    std::nth_element(order.begin(), order.begin() + static_cast<long>(topK_) - 1, order.end(),
                     [](const RankedOutcome* a, const RankedOutcome* b) { return rankedBefore(*a, *b); });
    const RankedOutcome cutoff = *order[topK_ - 1];

    for (auto it = entries_.begin(); it != entries_.end();) {
        if (rankedBefore(cutoff, it->second)) it = entries_.erase(it);
        else ++it;
    }
}

void RankingCollector::save(const TrialOutcome& outcome) {
    insert(RankedOutcome{currentOrdinal_, outcome});
    trim();
}

void RankingCollector::merge(const DataCollector& other) {
    const auto& o = dynamic_cast<const RankingCollector&>(other);
    for (const auto& kv : o.entries_)
        insert(kv.second);
    trim();
}

std::vector<RankedOutcome> RankingCollector::ranked() const {
    std::vector<RankedOutcome> out;
    out.reserve(entries_.size());
    for (const auto& kv : entries_) out.push_back(kv.second);
    std::sort(out.begin(), out.end(), rankedBefore);
    if (topK_ != 0 && out.size() > topK_) out.resize(topK_);
    return out;
}

//Hist1D
Hist1D::Hist1D(const CompiledExpression& expression, const int bins, const double lo, const double hi):
    expression_(expression), bins_(bins), lo_(lo), hi_(hi), draw_{0, {}, {}} {
    if (bins <= 0) throw std::invalid_argument("Hist1D: bins must be > 0");
    if (!(lo < hi)) throw std::invalid_argument("Hist1D: need lo < hi");
    hist_.assign(bins, 0);
}

void Hist1D::save(const TrialOutcome& outcome) {
    const double val = expression_.eval(draw_, outcome);
    if (!(val >= lo_ && val <= hi_)) {
        outOfRange_++;
        return;
    }
    const int bin = std::min(static_cast<int>((val - lo_) / (hi_ - lo_) * bins_), bins_ - 1);
    hist_[bin] += 1;
}

void Hist1D::merge(const DataCollector& other) {
    const auto& o = dynamic_cast<const Hist1D&>(other);
    if (o.hist_.size() != hist_.size())
        throw std::invalid_argument("Hist1D::merge: bin counts differ");
    for (size_t i = 0; i < hist_.size(); ++i)
        hist_[i] += o.hist_[i];
    outOfRange_ += o.outOfRange_;
}


//DataCollectorGroup
DataCollectorGroup::DataCollectorGroup(const std::vector<std::unique_ptr<DataCollector>>& collectors) {
    collectors_.reserve(collectors.size());
    for (const auto& collector : collectors)
        collectors_.emplace_back(collector->clone());
}

DataCollectorGroup::DataCollectorGroup(const std::vector<std::shared_ptr<DataCollector>>& collectors) {
    collectors_.reserve(collectors.size());
    for (const auto& collector : collectors)
        collectors_.emplace_back(collector->clone());
}

DataCollectorGroup::DataCollectorGroup(const DataCollectorGroup& other) {
    collectors_.reserve(other.collectors_.size());
    for (const auto& collector : other.collectors_)
        collectors_.emplace_back(collector->clone());
}

void DataCollectorGroup::merge(const DataCollector& other) {
    const auto& o = dynamic_cast<const DataCollectorGroup&>(other);
    if (o.collectors_.size() != collectors_.size())
        throw std::invalid_argument("DataCollectorGroup::merge: groups differ in size");
    for (size_t i = 0; i < collectors_.size(); ++i)
        collectors_[i]->merge(*o.collectors_[i]);
}
