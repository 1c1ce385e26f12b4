#include "Sampler.h"

#include <algorithm>
#include <limits>
#include <stdexcept>
#include <string>

using namespace vialsim;

namespace {
    // Start of segment i when [begin, end) is cut into n nearly equal contiguous parts.
    uint64_t segmentStart(const uint64_t begin, const uint64_t end, const uint64_t n, const uint64_t i) {
        const uint64_t len = end - begin;
        return begin + i * (len / n) + std::min(i, len % n);
    }

    uint64_t productSize(const std::vector<Person>& people) {
        if (people.empty()) throw std::invalid_argument("CartesianSampler: no people to enumerate");

        uint64_t total = 1;
        for (const auto& p : people) {
            for (const uint64_t dim : {static_cast<uint64_t>(p.doseRates.size()),
                                       static_cast<uint64_t>(p.frequencies.size())}) {
                if (total > std::numeric_limits<uint64_t>::max() / dim)
                    throw std::overflow_error("CartesianSampler: combination count overflows 64 bits");
                total *= dim;
            }
        }
        return total;
    }
}

CartesianSampler::CartesianSampler(const std::vector<Person>& people)
    : people_(std::make_shared<const std::vector<Person>>(people)),
      total_(productSize(*people_)),
      segBegin_(0),
      segEnd_(total_),
      current_(0) {}

CartesianSampler::CartesianSampler(const CartesianSampler& other, const uint64_t segBegin, const uint64_t segEnd)
    : people_(other.people_),
      total_(other.total_),
      segBegin_(segBegin),
      segEnd_(segEnd),
      current_(segBegin) {
    if (segBegin_ > segEnd_ || segEnd_ > total_)
        throw std::out_of_range("CartesianSampler: invalid segment bounds");
}

std::vector<std::unique_ptr<Sampler>> CartesianSampler::split(const int numThreads) const {
    if (numThreads < 1) throw std::invalid_argument("CartesianSampler: numThreads must be >= 1");

    std::vector<std::unique_ptr<Sampler>> threads;
    threads.reserve(numThreads);
    const auto n = static_cast<uint64_t>(numThreads);
    for (uint64_t i = 0; i < n; i++) {
        const uint64_t begin = segmentStart(current_, segEnd_, n, i);
        const uint64_t end = segmentStart(current_, segEnd_, n, i + 1);
        threads.push_back(std::make_unique<CartesianSampler>(*this, begin, end));
    }
    return threads;
}

Draw CartesianSampler::at(const uint64_t ordinal) const {
    if (ordinal >= total_) throw std::out_of_range("CartesianSampler: ordinal " + std::to_string(ordinal));

    const auto& people = *people_;
    Draw draw{ordinal, std::vector<double>(people.size()), std::vector<int>(people.size())};

    // Peel mixed-radix digits off the fastest (last) dimension first.
    uint64_t rest = ordinal;
    for (size_t i = people.size(); i-- > 0;) {
        const auto& p = people[i];
        const uint64_t nf = p.frequencies.size();
        draw.frequencies[i] = p.frequencies[rest % nf];
        rest /= nf;

        const uint64_t nr = p.doseRates.size();
        draw.doseRates[i] = p.doseRates[rest % nr];
        rest /= nr;
    }
    return draw;
}

std::vector<Draw> CartesianSampler::sampleBlock(const int n) {
    std::vector<Draw> out;
    if (n <= 0) return out;

    const uint64_t count = std::min<uint64_t>(static_cast<uint64_t>(n), segEnd_ - current_);
    out.reserve(count);
    for (uint64_t i = 0; i < count; ++i)
        out.push_back(at(current_++));
    return out;
}


PreselectedSampler::PreselectedSampler(const std::vector<Draw>& draws)
    : draws_([&draws] {
          auto copy = std::make_shared<std::vector<Draw>>(draws);
          for (size_t i = 0; i < copy->size(); ++i) {
              auto& d = (*copy)[i];
              if (d.doseRates.size() != d.frequencies.size() || d.doseRates.empty())
                  throw std::invalid_argument("PreselectedSampler: draw " + std::to_string(i) +
                                              " needs one rate and one frequency per person");
              if (d.doseRates.size() != copy->front().doseRates.size())
                  throw std::invalid_argument("PreselectedSampler: draws differ in width");
              d.ordinal = i;
          }
          return std::shared_ptr<const std::vector<Draw>>(std::move(copy));
      }()),
      segBegin_(0),
      segEnd_(draws_->size()),
      currentIdx_(0) {}


PreselectedSampler::PreselectedSampler(std::shared_ptr<const std::vector<Draw>> sharedDraws,
                                       const size_t segBegin, const size_t segEnd)
    : draws_(std::move(sharedDraws)),
      segBegin_(segBegin),
      segEnd_(segEnd),
      currentIdx_(segBegin_) {
    if (segBegin_ > segEnd_ || segEnd_ > draws_->size())
        throw std::out_of_range("PreselectedSampler: invalid segment bounds");
}

std::vector<std::unique_ptr<Sampler>> PreselectedSampler::split(const int numThreads) const {
    if (numThreads < 1) throw std::invalid_argument("PreselectedSampler: numThreads must be >= 1");

    std::vector<std::unique_ptr<Sampler>> threads;
    threads.reserve(numThreads);
    const auto n = static_cast<uint64_t>(numThreads);
    for (uint64_t i = 0; i < n; i++) {
        const auto begin = static_cast<size_t>(segmentStart(currentIdx_, segEnd_, n, i));
        const auto end = static_cast<size_t>(segmentStart(currentIdx_, segEnd_, n, i + 1));
        threads.push_back(std::make_unique<PreselectedSampler>(draws_, begin, end));
    }
    return threads;
}

std::vector<Draw> PreselectedSampler::sampleBlock(const int n) {
    std::vector<Draw> out;
    if (n <= 0) return out;

    const size_t end = std::min(segEnd_, currentIdx_ + static_cast<size_t>(n));
    out.reserve(end - currentIdx_);
    for (; currentIdx_ < end; ++currentIdx_)
        out.push_back((*draws_)[currentIdx_]);
    return out;
}

bool PreselectedSampler::hasFinished() const {
    return currentIdx_ >= segEnd_;
}
