#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <algorithm>
#include <memory>

#include "Person.h"
#include "Sampler.h"
#include "InjectionTrial.h"
#include "Criterion.h"
#include "Collector.h"
#include "Report.h"
#include "Sweep.h"


namespace py = pybind11;
using namespace vialsim;


static std::vector<std::string> names_of(const std::vector<Person>& people) {
     return uniqueNames(people);
}

static py::dict outcome_to_dict(const TrialOutcome& outcome) {
     py::list roster;
     for (const auto& p : outcome.roster) {
          py::dict entry;
          entry["name"] = p.name;
          entry["dosage"] = p.dosage;
          entry["frequency"] = p.frequency;
          roster.append(entry);
     }
     py::dict d;
     d["waste"] = outcome.waste;
     d["day"] = outcome.day;
     d["vials_used"] = outcome.vialsUsed;
     d["overwritten"] = outcome.overwritten;
     d["roster"] = roster;
     return d;
}


namespace vialsim {
     struct PySweep {
          std::unique_ptr<Sweep> core;
          std::vector<std::shared_ptr<DataCollector>> originals; // borrowed, Python-side
          std::vector<std::string> names;

          PySweep(const std::shared_ptr<Sampler>& sampler,
                  const std::vector<Person>& people,
                  const std::vector<std::shared_ptr<Criterion>>& criteria,
                  const std::vector<std::shared_ptr<DataCollector>>& collectors,
                  const std::string& validator,
                  int numVials,
                  double vialVolume,
                  int chunk,
                  int workers,
                  LeftoverPolicy policy)
               : originals(collectors), names(names_of(people)) {
               CriterionGroup critGroup(criteria);
               DataCollectorGroup collGroup(originals);

               core = std::make_unique<Sweep>(
                    *sampler, people,
                    numVials, vialVolume,
                    critGroup, collGroup,
                    chunk, workers,
                    CompiledExpression(validator, names),
                    policy
               );
          }

          void run() const {
               {
                    py::gil_scoped_release release;
                    core->run();
               }
               auto& collectors = core->collectors(); // DataCollectorGroup
               const size_t n = std::min(collectors.size(), originals.size());
               for (size_t i = 0; i < n; ++i)
                    originals[i]->merge(*collectors.at(i));
          }

          py::dict summary() const {
               const auto& s = core->summary();
               py::dict d;
               d["total"] = s.total;
               d["completed"] = s.completed;
               d["aborted"] = s.aborted;
               d["filtered"] = s.filtered;
               d["rejected"] = s.rejected;
               return d;
          }
     };
}


PYBIND11_MODULE(_vialsim, m) {
     m.doc() = "Multi-dose vial sharing simulator";

     py::enum_<LeftoverPolicy>(m, "LeftoverPolicy")
          .value("SINGLE_SLOT", LeftoverPolicy::SINGLE_SLOT)
          .value("POOLED", LeftoverPolicy::POOLED);

     py::register_exception<NoUsableScheduleError>(m, "NoUsableScheduleError", PyExc_RuntimeError);

     m.def("dose_range", &doseRange,
           py::arg("start"),
           py::arg("stop"),
           py::arg("step"),
           "numpy.arange-compatible list of dose rates.");

     // Person
     py::class_<Person>(m, "Person")
          .def(py::init<std::string, std::vector<double>, std::vector<int>>(),
               py::arg("name"),
               py::arg("dose_rates"),
               py::arg("frequencies")
          )
          .def_readonly("name", &Person::name)
          .def_readonly("dose_rates", &Person::doseRates)
          .def_readonly("frequencies", &Person::frequencies);

     m.def("simulate",
           [](const std::vector<std::tuple<std::string, double, int>>& people, const int numVials,
              const double vialVolume, const LeftoverPolicy policy) -> py::object {
                std::vector<ScheduleEntry> entries;
                entries.reserve(people.size());
                for (const auto& p : people)
                     entries.push_back(ScheduleEntry{std::get<0>(p), std::get<1>(p), std::get<2>(p)});
                const auto outcome = simulate(entries, numVials, vialVolume, policy);
                if (!outcome) return py::none();
                return outcome_to_dict(*outcome);
           },
           py::arg("people"),
           py::arg("num_vials") = 20,
           py::arg("vial_volume") = 5.0,
           py::arg("policy") = LeftoverPolicy::SINGLE_SLOT,
           "Run one trial for (name, dose_rate, interval) tuples; None if the dosages are invalid.");

     py::class_<CompiledExpression>(m, "CompiledExpression")
          .def(py::init([](const std::string& expr, const std::vector<Person>& people) {
                    return CompiledExpression(expr, names_of(people));
               }),
               py::arg("expr"),
               py::arg("people"));


     py::class_<Sampler, std::shared_ptr<Sampler>>(m, "Sampler")
          .def("size", &Sampler::size);

     py::class_<CartesianSampler, Sampler, std::shared_ptr<CartesianSampler>>(m, "CartesianSampler")
          .def(py::init<std::vector<Person>>(), py::arg("people"))
          .def("total", &CartesianSampler::total);


     py::class_<PreselectedSampler, Sampler, std::shared_ptr<PreselectedSampler>>(m, "PreselectedSampler")
          .def(py::init([](const std::vector<std::pair<std::vector<double>, std::vector<int>>>& rawDraws) {
               std::vector<Draw> draws;
               draws.reserve(rawDraws.size());
               for (const auto& raw : rawDraws)
                    draws.emplace_back(Draw{0, raw.first, raw.second});
               return std::make_shared<PreselectedSampler>(draws);
          }), py::arg("draws"), "Each draw is (dose_rates, frequencies) in people order.");

     // Criterion base + subclasses
     py::class_<Criterion, std::shared_ptr<Criterion>>(m, "Criterion");

     py::class_<WasteCriterion, Criterion, std::shared_ptr<WasteCriterion>>(m, "WasteCriterion")
          .def(py::init<double>(), py::arg("max_waste"));

     py::class_<DurationCriterion, Criterion, std::shared_ptr<DurationCriterion>>(m, "DurationCriterion")
          .def(py::init<int, int>(),
               py::arg("min_days"),
               py::arg("max_days")
          );

     py::class_<ExpressionCriterion, Criterion, std::shared_ptr<ExpressionCriterion>>(m, "ExpressionCriterion")
          .def(py::init<CompiledExpression>(), py::arg("expr"));

     // DataCollector base + subclasses
     py::class_<DataCollector, std::shared_ptr<DataCollector>>(m, "DataCollector");

     py::class_<RankingCollector, DataCollector, std::shared_ptr<RankingCollector>>(m, "RankingCollector")
          .def(py::init<size_t>(), py::arg("top_k") = 0)
          .def("ranked", [](const RankingCollector& self) {
               py::list out;
               for (const auto& r : self.ranked()) {
                    auto d = outcome_to_dict(r.outcome);
                    d["ordinal"] = r.ordinal;
                    out.append(d);
               }
               return out;
          })
          .def("__len__", &RankingCollector::size);

     py::class_<Hist1D, DataCollector, std::shared_ptr<Hist1D>>(m, "Hist1D")
          .def(py::init<CompiledExpression, int, double, double>(),
               py::arg("expr"),
               py::arg("bins"),
               py::arg("lo"),
               py::arg("hi")
          )
          .def("histogram", &Hist1D::histogram)
          .def("out_of_range", &Hist1D::outOfRange);

     // Sweep
     py::class_<PySweep, std::shared_ptr<PySweep>>(m, "Sweep")
          .def(py::init<
                    std::shared_ptr<Sampler>,
                    std::vector<Person>,
                    std::vector<std::shared_ptr<Criterion>>,
                    std::vector<std::shared_ptr<DataCollector>>,
                    std::string,
                    int, double, int, int, // numVials, vialVolume, chunk, workers
                    LeftoverPolicy
               >(),
               py::arg("sampler"),
               py::arg("people"),
               py::arg("criteria") = std::vector<std::shared_ptr<Criterion>>{},
               py::arg("collectors") = std::vector<std::shared_ptr<DataCollector>>{},
               py::arg("validator") = "1",
               py::arg("num_vials") = 20,
               py::arg("vial_volume") = 5.0,
               py::arg("chunk_size") = 64,
               py::arg("max_workers") = 1,
               py::arg("policy") = LeftoverPolicy::SINGLE_SLOT,

               // keep the Python‐side objects alive as long as this Sweep lives:
               py::keep_alive<1, 2>(), // sampler
               py::keep_alive<1, 5>() //  collectors' list
          )
          .def("run", &PySweep::run)
          .def("summary", &PySweep::summary)
          .def("names", [](const PySweep& self) { return self.names; });

     m.def("format_report",
           [](const PySweep& sweep, const RankingCollector& ranking, const int numVials, const size_t numOutcomes) {
                return formatReport(sweep.core->summary(), ranking, sweep.names, numVials, numOutcomes);
           },
           py::arg("sweep"),
           py::arg("ranking"),
           py::arg("num_vials") = 20,
           py::arg("num_outcomes") = 5);
}
