#include <iostream>
#include <iomanip>
#include <random>
#include <cmath>

#include "evo.hpp"

namespace Config {
  const size_t popSize = 20;
  const size_t maxEvaluations = 2000;
  const size_t numElites = 1;
  const double mutationRate = 0.5;
  const double bound = 5.12;
  const size_t dimension = 1;
}

typedef std::vector<double> Vec;
typedef evo::Args<Vec, double> Args;

const double pi = std::acos(-1.0);

double rastrigin(const Vec& x) {
  double sum = 10 * x.size();
  for(auto xi : x)
    sum += xi*xi - 10*std::cos(2*pi*xi);
  return sum;
}

int main(int argc, char* argv[]) {
  evo::Random rng(argc > 1 ? std::stoul(argv[1]) : std::random_device{}());
  spdlog::set_level(spdlog::level::info);

  evo::EvolutionaryComputation<Vec, double> ec{rng};
  ec.setSelector(std::make_shared<evo::RankSelection<Vec, double>>());
  ec.setVariators({std::make_shared<evo::GaussianMutation<Vec, double>>()});
  ec.setReplacer(std::make_shared<evo::GenerationalReplacement<Vec, double>>());
  ec.setTerminator(std::make_shared<evo::EvaluationTermination<Vec, double>>());
  ec.addObserver(std::make_shared<evo::StatsObserver<Vec, double>>());

  evo::Config config{};
  config.numSelected = Config::popSize;
  config.numElites = Config::numElites;
  config.mutationRate = Config::mutationRate;
  config.maxEvaluations = Config::maxEvaluations;

  auto generator = [](evo::Random& rng, Args&) -> Vec {
    std::uniform_real_distribution<double> dist{-Config::bound, Config::bound};
    Vec x(Config::dimension);
    for(auto& xi : x)
      xi = dist(rng);
    return x;
  };

  auto evaluator = evo::evaluator<Vec, double>(
      [](const Vec& x, Args&) { return rastrigin(x); });

  auto result = ec.evolve(generator, evaluator, Config::popSize, {}, false,
      evo::Bounder{-Config::bound, Config::bound}, config);

  auto& best = result.best();
  std::cout << "Terminated by " << ec.terminationCause() << " after "
    << ec.numGenerations() << " generations and "
    << ec.numEvaluations() << " evaluations.\n";
  std::cout << "Best: x =";
  for(auto xi : best.candidate())
    std::cout << ' ' << std::setprecision(6) << xi;
  std::cout << ", f = " << best.fitness() << '\n';
}
