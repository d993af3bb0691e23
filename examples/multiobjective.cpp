#include <iostream>
#include <random>

#include "evo.hpp"

/* Schaffer's problem: minimize x^2 and (x-2)^2. The Pareto set is 0 <= x <= 2. */

namespace Config {
  const size_t popSize = 50;
  const size_t nGen = 100;
  const size_t archiveSize = 30;
  const size_t gridDivisions = 3;
  const double bound = 10;
}

typedef std::vector<double> Vec;
typedef evo::Args<Vec, evo::Pareto> Args;

evo::Pareto schaffer(const Vec& x) {
  return evo::Pareto({x[0] * x[0], (x[0] - 2) * (x[0] - 2)});
}

void report(const char* title, const evo::Population<Vec, evo::Pareto>& archive) {
  std::cout << title << ": " << archive.size() << " nondominated solutions\n";
  for(auto& ind : archive)
    std::cout << "  x = " << ind.candidate()[0] << "  f = " << ind.fitness() << '\n';
}

int main(int argc, char* argv[]) {
  evo::Random rng(argc > 1 ? std::stoul(argv[1]) : std::random_device{}());

  auto generator = [](evo::Random& rng, Args&) -> Vec {
    return Vec{std::uniform_real_distribution<double>{-Config::bound, Config::bound}(rng)};
  };
  auto evaluator = evo::evaluator<Vec, evo::Pareto>(
      [](const Vec& x, Args&) { return schaffer(x); });
  evo::Bounder bounder{-Config::bound, Config::bound};

  evo::Config config{};
  config.maxGenerations = Config::nGen;
  config.maxArchiveSize = Config::archiveSize;
  config.numGridDivisions = Config::gridDivisions;

  evo::NSGA2<Vec> nsga{rng};
  nsga.setVariators({
      std::make_shared<evo::BlendCrossover<Vec, evo::Pareto>>(),
      std::make_shared<evo::GaussianMutation<Vec, evo::Pareto>>()});
  nsga.setTerminator(std::make_shared<evo::GenerationTermination<Vec, evo::Pareto>>());
  nsga.evolve(generator, evaluator, Config::popSize, {}, false, bounder, config);
  report("NSGA-II", nsga.archive());

  evo::PAES<Vec> paes{rng};
  paes.setTerminator(std::make_shared<evo::GenerationTermination<Vec, evo::Pareto>>());
  paes.evolve(generator, evaluator, 1, {}, false, bounder, config);
  report("PAES", paes.archive());
}
