#include "Person.h"

#include <cctype>
#include <cmath>
#include <unordered_set>

using namespace vialsim;

std::vector<double> vialsim::doseRange(const double start, const double stop, const double step) {
    if (!std::isfinite(start) || !std::isfinite(stop) || !std::isfinite(step))
        throw std::invalid_argument("doseRange: bounds and step must be finite");
    if (step <= 0.0)
        throw std::invalid_argument("doseRange: step must be > 0");

    const double span = std::ceil((stop - start) / step);
    const auto n = span > 0.0 ? static_cast<size_t>(span) : 0;

    std::vector<double> out;
    out.reserve(n);
    for (size_t i = 0; i < n; ++i)
        out.push_back(start + static_cast<double>(i) * step);
    return out;
}

bool vialsim::isIdentifier(const std::string& name) noexcept {
    if (name.empty() || !std::isalpha(static_cast<unsigned char>(name.front()))) return false;
    for (const unsigned char c : name)
        if (!std::isalnum(c) && c != '_') return false;
    return true;
}

Person::Person(const std::string& name_, const std::vector<double>& doseRates_, const std::vector<int>& frequencies_)
    : name(name_), doseRates(doseRates_), frequencies(frequencies_) {
    if (!isIdentifier(name))
        throw std::invalid_argument("Person: name '" + name + "' must match [A-Za-z][A-Za-z0-9_]*");
    if (doseRates.empty())
        throw std::invalid_argument("Person: no dose rates for " + name);
    if (frequencies.empty())
        throw std::invalid_argument("Person: no frequencies for " + name);

    for (const double rate : doseRates)
        if (!std::isfinite(rate)) throw std::invalid_argument("Person: non-finite dose rate for " + name);
    for (const int f : frequencies)
        if (f < 1) throw std::invalid_argument("Person: frequency must be >= 1 for " + name);
}

std::vector<std::string> vialsim::uniqueNames(const std::vector<Person>& people) {
    if (people.empty()) throw std::invalid_argument("uniqueNames: no people");

    std::vector<std::string> names;
    std::unordered_set<std::string> seen;
    names.reserve(people.size());
    for (const auto& p : people) {
        if (!seen.insert(p.name).second)
            throw std::invalid_argument("uniqueNames: duplicate person '" + p.name + "'");
        names.push_back(p.name);
    }
    return names;
}
