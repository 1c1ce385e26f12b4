#include "Criterion.h"
#include <cmath>
#include <stdexcept>

using namespace vialsim;

// WasteCriterion
WasteCriterion::WasteCriterion(const double maxWaste): maxWaste_(maxWaste) {
    if (std::isnan(maxWaste) || maxWaste < 0.0)
        throw std::invalid_argument("WasteCriterion: maxWaste must be >= 0");
}

bool WasteCriterion::passed(const Draw&, const TrialOutcome& outcome) const noexcept {
    return outcome.waste <= maxWaste_;
}

std::unique_ptr<Criterion> WasteCriterion::clone() const {
    return std::make_unique<WasteCriterion>(*this);
}

// DurationCriterion
DurationCriterion::DurationCriterion(const int minDays, const int maxDays): minDays_(minDays), maxDays_(maxDays) {
    if (minDays < 1 || maxDays < minDays)
        throw std::invalid_argument("DurationCriterion: need 1 <= minDays <= maxDays");
}

bool DurationCriterion::passed(const Draw&, const TrialOutcome& outcome) const noexcept {
    return outcome.day >= minDays_ && outcome.day <= maxDays_;
}

std::unique_ptr<Criterion> DurationCriterion::clone() const {
    return std::make_unique<DurationCriterion>(*this);
}

// ExpressionCriterion
ExpressionCriterion::ExpressionCriterion(const CompiledExpression& expression): expression_(expression) {}

bool ExpressionCriterion::passed(const Draw& draw, const TrialOutcome& outcome) const {
    return expression_.eval(draw, outcome) != 0.0;
}

std::unique_ptr<Criterion> ExpressionCriterion::clone() const {
    return std::make_unique<ExpressionCriterion>(*this);
}

// CriterionGroup
CriterionGroup::CriterionGroup(const std::vector<std::unique_ptr<Criterion>>& criteria) {
    criteria_.reserve(criteria.size());
    for (auto& c : criteria)
        criteria_.push_back(c->clone());
}

CriterionGroup::CriterionGroup(const std::vector<std::shared_ptr<Criterion>>& criteria) {
    criteria_.reserve(criteria.size());
    for (auto& c : criteria)
        criteria_.push_back(c->clone());
}

CriterionGroup::CriterionGroup(const CriterionGroup& other) {
    criteria_.reserve(other.criteria_.size());
    for (auto& c : other.criteria_)
        criteria_.push_back(c->clone());
}

bool CriterionGroup::passed(const Draw& draw, const TrialOutcome& outcome) const {
    for (const auto& c : criteria_)
        if (!c->passed(draw, outcome))
            return false;
    return true;
}

std::unique_ptr<Criterion> CriterionGroup::clone() const {
    return std::make_unique<CriterionGroup>(*this);
}
