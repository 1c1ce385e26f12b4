#include "Sweep.h"
#include "InjectionTrial.h"

#include <exception>
#include <memory>
#include <string>
#include <thread>
#include <utility>

using namespace vialsim;

Sweep::Sweep(const Sampler& samplerProto,
             const std::vector<Person>& people,
             const int numVials,
             const double vialVolume,
             const CriterionGroup& criteria,
             const DataCollectorGroup& collectors,
             const int chunkSize,
             const int maxWorkers,
             const CompiledExpression& validator,
             const LeftoverPolicy policy)
    : samplerProto_(samplerProto),
      names_(uniqueNames(people)),
      numVials_(numVials),
      vialVolume_(vialVolume),
      criteria_(criteria),
      collectors_(collectors),
      chunkSize_(chunkSize),
      maxWorkers_(maxWorkers),
      validator_(validator),
      policy_(policy) {
    if (numVials_ < 1) throw std::invalid_argument("Sweep: numVials must be >= 1");
    if (!(vialVolume_ > 0.0)) throw std::invalid_argument("Sweep: vialVolume must be > 0");
    if (chunkSize_ < 1 || maxWorkers_ < 1) throw std::invalid_argument("Sweep: chunkSize and maxWorkers must be >= 1");
    if (validator_.names() != names_)
        throw std::invalid_argument("Sweep: validator '" + validator_.expr() + "' was compiled for other people");
}


void Sweep::run() {
    if (hasRun_) throw std::logic_error("Sweep::run: already run");
    hasRun_ = true;

    auto samplers = samplerProto_.split(maxWorkers_);

    struct WorkerCtx {
        std::unique_ptr<Sampler> sampler;
        CompiledExpression validator;
        CriterionGroup criteria;
        DataCollectorGroup collectors;
        SweepSummary summary;
        std::exception_ptr error;
        std::thread thread;

        WorkerCtx(std::unique_ptr<Sampler> segment, const CompiledExpression& validatorProto,
                  const CriterionGroup& criteriaProto, const DataCollectorGroup& collectorsProto)
            : sampler(std::move(segment)), validator(validatorProto), criteria(criteriaProto),
              collectors(collectorsProto) {}
    };
    std::vector<std::unique_ptr<WorkerCtx>> workers;
    workers.reserve(maxWorkers_);

    for (int i = 0; i < maxWorkers_; ++i) {
        workers.push_back(std::make_unique<WorkerCtx>(std::move(samplers[i]), validator_, criteria_, collectors_));
        auto& wk = *workers.back();
        wk.thread = std::thread([&wk, this] {
            try {
                while (!wk.sampler->hasFinished()) {
                    const auto block = wk.sampler->sampleBlock(chunkSize_);
                    processBlock(block, wk.validator, wk.criteria, wk.collectors, wk.summary);
                }
            } catch (...) {
                wk.error = std::current_exception();
            }
        });
    }

    for (auto& wk : workers) wk->thread.join();
    for (auto& wk : workers)
        if (wk->error) std::rethrow_exception(wk->error);

    for (auto& wk : workers) {
        collectors_.merge(wk->collectors);
        summary_.merge(wk->summary);
    }

    if (summary_.completed == 0)
        throw NoUsableScheduleError(
            "There is no trial data due to early terminations (" + std::to_string(summary_.aborted) + " aborted, " +
            std::to_string(summary_.filtered) + " filtered, " + std::to_string(summary_.rejected) + " rejected of " +
            std::to_string(summary_.total) + " trials).");
}

void Sweep::processBlock(const std::vector<Draw>& block, const CompiledExpression& validator,
                         const CriterionGroup& criterionGroup, DataCollectorGroup& collectorGroup,
                         SweepSummary& summary) const {
    for (const auto& draw : block) {
        summary.total++;
        switch (processDraw(draw, validator, criterionGroup, collectorGroup)) {
        case TrialResult::COMPLETED:
            summary.completed++;
            break;
        case TrialResult::INVALID_DOSAGE:
            summary.aborted++;
            break;
        case TrialResult::REJECTED_BY_VALIDATOR:
            summary.filtered++;
            break;
        case TrialResult::REJECTED_BY_CRITERIA:
            summary.rejected++;
            break;
        }
    }
}


TrialResult Sweep::processDraw(const Draw& draw, const CompiledExpression& validator,
                               const CriterionGroup& criterionGroup, DataCollectorGroup& collectorGroup) const {
    if (validator.eval(draw) == 0.0) return TrialResult::REJECTED_BY_VALIDATOR;

    collectorGroup.reset();
    collectorGroup.recordDraw(draw);

    InjectionTrial trial(normalizeRoster(names_, draw), numVials_, vialVolume_, policy_);
    const auto outcome = trial.run();
    if (!outcome) return TrialResult::INVALID_DOSAGE;
    if (!criterionGroup.passed(draw, *outcome)) return TrialResult::REJECTED_BY_CRITERIA;

    collectorGroup.save(*outcome);
    return TrialResult::COMPLETED;
}
