#pragma once
/**
 * @file CompiledExpression.h
 * @brief An arithmetic expression evaluator over a draw and its trial outcome.
 */
#include <memory>
#include <string>
#include <vector>

#include "Sampler.h"   // for vialsim::Draw
#include "TrialResult.h"

namespace vialsim {
    /**
     * @brief Holds a compiled expression for fast repeated evaluation.
     *
     * Variables, for every person name N: N_rate, N_freq, N_dose (rounded mL per injection).
     * Outcome variables: waste, days, vials (NaN when evaluated on a draw alone).
     * Copies recompile, so each worker thread can own an independent instance.
     */
    class CompiledExpression {
    public:
        /**
         * @brief Compile a new expression from source.
         * @param expr   arithmetic (and/or boolean) expression
         * @param names  person names in draw order
         * @throws std::invalid_argument if a name cannot be registered as a variable
         * @throws std::runtime_error on a compile error
         */
        CompiledExpression(const std::string& expr, const std::vector<std::string>& names);

        CompiledExpression(const CompiledExpression& other);
        CompiledExpression& operator=(const CompiledExpression&) = delete;
        ~CompiledExpression();

        /**
         * @brief Evaluate on one draw; outcome variables are NaN.
         * @return   the result as double (0=false, nonzero=true)
         * @throws std::invalid_argument if the draw width does not match the names
         */
        double eval(const Draw& d) const;

        /** @brief Evaluate on one draw and the outcome of its trial. */
        double eval(const Draw& d, const TrialOutcome& outcome) const;

        /** @brief Get the original source string. */
        std::string expr() const { return expr_; }

        const std::vector<std::string>& names() const noexcept { return names_; }

    private:
        const std::string expr_;
        const std::vector<std::string> names_;
        struct Impl;
        std::unique_ptr<Impl> impl_;

        void bindDraw(const Draw& d) const;
    };
}
