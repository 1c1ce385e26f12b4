#include "CompiledExpression.h"
#include <exprtk.hpp>
#include <limits>
#include <stdexcept>

using namespace vialsim;

namespace {
    constexpr double NaN = std::numeric_limits<double>::quiet_NaN();
}

struct CompiledExpression::Impl {
    exprtk::symbol_table<double> symbols;
    exprtk::expression<double> expression;
    exprtk::parser<double> parser;

    // Three slots per person (rate, freq, dose), then waste, days, vials. Sized once, so the
    // references held by the symbol table stay valid.
    std::vector<double> values;

    Impl(const std::string& expr, const std::vector<std::string>& names) : values(3 * names.size() + 3, NaN) {
        for (size_t i = 0; i < names.size(); ++i) {
            addVariable(names[i] + "_rate", values[3 * i]);
            addVariable(names[i] + "_freq", values[3 * i + 1]);
            addVariable(names[i] + "_dose", values[3 * i + 2]);
        }
        const size_t base = 3 * names.size();
        addVariable("waste", values[base]);
        addVariable("days", values[base + 1]);
        addVariable("vials", values[base + 2]);
        symbols.add_constants(); // math constants (pi, e, etc.)
        expression.register_symbol_table(symbols);


        if (!parser.compile(expr, expression))
            throw std::runtime_error("ExprTk compile error: " + parser.error());
    }

    void addVariable(const std::string& name, double& slot) {
        if (!symbols.add_variable(name, slot))
            throw std::invalid_argument("CompiledExpression: cannot register variable '" + name + "'");
    }

    void setOutcome(const double waste, const double days, const double vials) {
        const size_t base = values.size() - 3;
        values[base] = waste;
        values[base + 1] = days;
        values[base + 2] = vials;
    }
};

CompiledExpression::CompiledExpression(const std::string& expr, const std::vector<std::string>& names):
    expr_(expr), names_(names), impl_(std::make_unique<Impl>(expr_, names_)) {}

CompiledExpression::CompiledExpression(const CompiledExpression& other):
    CompiledExpression(other.expr_, other.names_) {}

CompiledExpression::~CompiledExpression() = default;

void CompiledExpression::bindDraw(const Draw& d) const {
    if (d.doseRates.size() != names_.size() || d.frequencies.size() != names_.size())
        throw std::invalid_argument("CompiledExpression: draw width does not match '" + expr_ + "'");

    auto& values = impl_->values;
    for (size_t i = 0; i < names_.size(); ++i) {
        values[3 * i] = d.doseRates[i];
        values[3 * i + 1] = d.frequencies[i];
        values[3 * i + 2] = roundTo(d.doseRates[i] * d.frequencies[i], 2);
    }
}

double CompiledExpression::eval(const Draw& d) const {
    bindDraw(d);
    impl_->setOutcome(NaN, NaN, NaN);
    return impl_->expression.value();
}

double CompiledExpression::eval(const Draw& d, const TrialOutcome& outcome) const {
    bindDraw(d);
    impl_->setOutcome(outcome.waste, outcome.day, outcome.vialsUsed);
    return impl_->expression.value();
}
