#pragma once
/**
 * @file Criterion.h
 * @brief Acceptance/rejection criteria on completed trials, and their composite.
 */
#include <memory>
#include <vector>

#include "CompiledExpression.h"
#include "TrialResult.h"

namespace vialsim {
    /**
     * @brief Base interface for acceptance criteria.
     */
    class Criterion {
    public:
        virtual ~Criterion() = default;

        /** @brief final acceptance check on a completed trial */
        virtual bool passed(const Draw& draw, const TrialOutcome& outcome) const = 0;

        /** @brief clone for per‑worker context isolation */
        virtual std::unique_ptr<Criterion> clone() const = 0;
    };

    /**
     * @brief Accept trials that waste at most maxWaste mL.
     */
    class WasteCriterion final : public Criterion {
    public:
        explicit WasteCriterion(double maxWaste);

        bool passed(const Draw&, const TrialOutcome& outcome) const noexcept override;
        std::unique_ptr<Criterion> clone() const override;

    private:
        double maxWaste_;
    };

    /**
     * @brief Require the vial target to be reached on a day in [minDays, maxDays].
     */
    class DurationCriterion final : public Criterion {
    public:
        DurationCriterion(int minDays, int maxDays);

        bool passed(const Draw&, const TrialOutcome& outcome) const noexcept override;
        std::unique_ptr<Criterion> clone() const override;

    private:
        int minDays_, maxDays_;
    };

    /**
     * @brief Accept when a compiled expression over the draw and outcome is nonzero.
     */
    class ExpressionCriterion final : public Criterion {
    public:
        explicit ExpressionCriterion(const CompiledExpression& expression);

        bool passed(const Draw& draw, const TrialOutcome& outcome) const override;
        std::unique_ptr<Criterion> clone() const override;

    private:
        CompiledExpression expression_;
    };

    /**
     * @brief Composite of multiple Criterion; passes only if every member passes.
     */
    class CriterionGroup final : public Criterion {
    public:
        CriterionGroup() = default;
        explicit CriterionGroup(const std::vector<std::unique_ptr<Criterion>>& criteria);
        explicit CriterionGroup(const std::vector<std::shared_ptr<Criterion>>& criteria);
        CriterionGroup(const CriterionGroup& other);

        bool passed(const Draw& draw, const TrialOutcome& outcome) const override;

        std::unique_ptr<Criterion> clone() const override;

        size_t size() const noexcept { return criteria_.size(); }

    private:
        std::vector<std::unique_ptr<Criterion>> criteria_;
    };
}
