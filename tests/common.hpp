#ifndef EVO_TESTS_COMMON_H
#define EVO_TESTS_COMMON_H

#include <catch2/catch.hpp>
#include "evo.hpp"

using Vec = std::vector<double>;
using Bits = std::vector<int>;

/* Everything an operator needs to be called outside of a run. The engine is
 * idle: empty population, no bounds, zero counters. */
template<class Candidate, class Fitness = double>
struct Fixture {
  evo::Random rng{42};
  evo::EvolutionaryComputation<Candidate, Fitness> ec{rng};
  evo::Config config{};
  evo::RunContext context{};
  evo::Population<Candidate, Fitness> archive{};
  evo::Args<Candidate, Fitness> args{config, context, ec, archive, nullptr};
};

/* A scalar individual whose candidate is its own fitness. */
inline evo::Individual<Vec, double> scalar(double f, bool maximize = true) {
  return evo::Individual<Vec, double>{Vec{f}, f, maximize};
}

inline evo::Population<Vec, double> scalars(std::initializer_list<double> fs,
    bool maximize = true) {
  evo::Population<Vec, double> ret{};
  for(auto f : fs)
    ret.add(scalar(f, maximize));
  return ret;
}

/* A two-objective individual whose candidate is its own fitness. */
inline evo::Individual<Vec, evo::Pareto> point(double a, double b,
    bool maximize = true) {
  return evo::Individual<Vec, evo::Pareto>{Vec{a, b}, evo::Pareto({a, b}), maximize};
}

inline std::vector<double> fitnesses(const evo::Population<Vec, double>& pop) {
  std::vector<double> ret{};
  for(auto& ind : pop)
    ret.push_back(ind.fitness());
  return ret;
}

#endif
