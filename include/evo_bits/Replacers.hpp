namespace evo {

/** \brief Keeps the current population, discarding the offspring. */
template<class Candidate, class Fitness = double>
class DefaultReplacement: public Replacer<Candidate, Fitness> {
public:
  std::string name() const override {
    return "default_replacement";
  }

  Population<Candidate, Fitness> replace(Random&,
      Population<Candidate, Fitness> population,
      const Population<Candidate, Fitness>&,
      Population<Candidate, Fitness>,
      Args<Candidate, Fitness>&) override {
    return population;
  }
}; // class DefaultReplacement<Candidate, Fitness>


/** \brief Keeps the best individuals of the population and the offspring
 * together, preserving the population size. */
template<class Candidate, class Fitness = double>
class TruncationReplacement: public Replacer<Candidate, Fitness> {
public:
  std::string name() const override {
    return "truncation_replacement";
  }

  Population<Candidate, Fitness> replace(Random&,
      Population<Candidate, Fitness> population,
      const Population<Candidate, Fitness>&,
      Population<Candidate, Fitness> offspring,
      Args<Candidate, Fitness>&) override {
    size_t sz = population.size();
    population.add(std::move(offspring));
    population.rankTrim(sz);
    return population;
  }
}; // class TruncationReplacement<Candidate, Fitness>


/** \brief The offspring replace the worst members of the population. */
template<class Candidate, class Fitness = double>
class SteadyStateReplacement: public Replacer<Candidate, Fitness> {
public:
  std::string name() const override {
    return "steady_state_replacement";
  }

  Population<Candidate, Fitness> replace(Random&,
      Population<Candidate, Fitness> population,
      const Population<Candidate, Fitness>&,
      Population<Candidate, Fitness> offspring,
      Args<Candidate, Fitness>&) override {
    population.sort(false);
    size_t count = std::min(offspring.size(), population.size());
    for(size_t i = 0; i < count; i++)
      population.replace(i, offspring[i]);
    return population;
  }
}; // class SteadyStateReplacement<Candidate, Fitness>


/** \brief The offspring replace the population, except for the \b numElites
 * best members which compete with them for survival. The population size is
 * not exceeded. */
template<class Candidate, class Fitness = double>
class GenerationalReplacement: public Replacer<Candidate, Fitness> {
public:
  std::string name() const override {
    return "generational_replacement";
  }

  Population<Candidate, Fitness> replace(Random&,
      Population<Candidate, Fitness> population,
      const Population<Candidate, Fitness>&,
      Population<Candidate, Fitness> offspring,
      Args<Candidate, Fitness>& args) override {
    size_t sz = population.size();
    population.rankTrim(args.config.numElites);
    offspring.add(std::move(population));
    offspring.rankTrim(sz);
    return offspring;
  }
}; // class GenerationalReplacement<Candidate, Fitness>


/** \brief The offspring replace randomly chosen members of the population,
 * sparing the \b numElites best ones. */
template<class Candidate, class Fitness = double>
class RandomReplacement: public Replacer<Candidate, Fitness> {
public:
  std::string name() const override {
    return "random_replacement";
  }

  Population<Candidate, Fitness> replace(Random& rng,
      Population<Candidate, Fitness> population,
      const Population<Candidate, Fitness>&,
      Population<Candidate, Fitness> offspring,
      Args<Candidate, Fitness>& args) override {
    size_t elites = args.config.numElites;
    if(elites >= population.size())
      return population;
    population.sort();
    size_t count = std::min(offspring.size(), population.size() - elites);
    auto idx = internal::sample(population.size() - elites, count, rng);
    for(size_t i = 0; i < count; i++)
      population.replace(elites + idx[i], offspring[i]);
    return population;
  }
}; // class RandomReplacement<Candidate, Fitness>


/** \brief (mu + lambda) replacement: the best of the population and the
 * offspring together survive. The offspring take precedence among equals. */
template<class Candidate, class Fitness = double>
class PlusReplacement: public Replacer<Candidate, Fitness> {
public:
  std::string name() const override {
    return "plus_replacement";
  }

  Population<Candidate, Fitness> replace(Random&,
      Population<Candidate, Fitness> population,
      const Population<Candidate, Fitness>&,
      Population<Candidate, Fitness> offspring,
      Args<Candidate, Fitness>&) override {
    size_t sz = population.size();
    offspring.add(std::move(population));
    offspring.rankTrim(sz);
    return offspring;
  }
}; // class PlusReplacement<Candidate, Fitness>


/** \brief (mu, lambda) replacement: the best of the offspring survive. If
 * there are fewer offspring than the population size, the population
 * shrinks. */
template<class Candidate, class Fitness = double>
class CommaReplacement: public Replacer<Candidate, Fitness> {
public:
  std::string name() const override {
    return "comma_replacement";
  }

  Population<Candidate, Fitness> replace(Random&,
      Population<Candidate, Fitness> population,
      const Population<Candidate, Fitness>&,
      Population<Candidate, Fitness> offspring,
      Args<Candidate, Fitness>&) override {
    offspring.rankTrim(population.size());
    return offspring;
  }
}; // class CommaReplacement<Candidate, Fitness>


/** \brief Deterministic crowding: each offspring is compared with the
 * closest of \b crowdingDistance random survivors and replaces it if better.
 *
 * The distance function defaults to the Euclidean distance of numeric
 * sequences. */
template<class Candidate, class Fitness = double>
class CrowdingReplacement: public Replacer<Candidate, Fitness> {
public:
  using Distance = std::function<double(const Candidate&, const Candidate&)>;

private:
  Distance dist;

public:
  explicit CrowdingReplacement(Distance distance = internal::distance<Candidate>):
    dist(std::move(distance)) { }

  std::string name() const override {
    return "crowding_replacement";
  }

  NOINLINE Population<Candidate, Fitness> replace(Random& rng,
      Population<Candidate, Fitness> population,
      const Population<Candidate, Fitness>&,
      Population<Candidate, Fitness> offspring,
      Args<Candidate, Fitness>& args) override {
    for(auto& o : offspring) {
      if(population.empty())
        break;
      auto pool = internal::sample(population.size(), args.config.crowdingDistance, rng);
      if(pool.empty())
        continue;
      size_t closest = pool[0];
      double best = dist(o.candidate(), population[closest].candidate());
      for(size_t k = 1; k < pool.size(); k++) {
        double d = dist(o.candidate(), population[pool[k]].candidate());
        if(d < best) {
          best = d;
          closest = pool[k];
        }
      }
      if(o > population[closest]) {
        population.remove(closest);
        population.add(o);
      }
    }
    return population;
  }
}; // class CrowdingReplacement<Candidate, Fitness>


/** \brief Simulated annealing acceptance: each offspring replaces its
 * parent (the population member at the same position) if it is not worse,
 * or else with probability <b>exp(-|Δf|/T)</b>.
 *
 * The temperature \b T is taken, in order of preference, from \b temperature
 * multiplied by \b coolingRate once per call (the current value is kept in
 * the run context under "temperature"), from the fraction of
 * \b maxEvaluations remaining, or from the fraction of \b maxGenerations
 * remaining. Population members without a matching offspring are kept. */
template<class Candidate, class Fitness = double>
class SimulatedAnnealingReplacement: public Replacer<Candidate, Fitness> {
  static_assert(Individual<Candidate, Fitness>::Traits::is_float,
      "SimulatedAnnealingReplacement needs a fitness type convertible to double!");

public:
  std::string name() const override {
    return "simulated_annealing_replacement";
  }

  /** \throws std::invalid_argument if none of the temperature sources is
   * configured. */
  NOINLINE Population<Candidate, Fitness> replace(Random& rng,
      Population<Candidate, Fitness> population,
      const Population<Candidate, Fitness>&,
      Population<Candidate, Fitness> offspring,
      Args<Candidate, Fitness>& args) override {
    double temp = temperature(args);
    size_t count = std::min(population.size(), offspring.size());
    for(size_t i = 0; i < count; i++) {
      const auto& p = population[i];
      const auto& o = offspring[i];
      double delta = std::abs(static_cast<double>(p.fitness())
          - static_cast<double>(o.fitness()));
      if(o >= p || (temp > 0 && internal::uniform(rng) < std::exp(-delta / temp)))
        population.replace(i, o);
    }
    return population;
  }

private:
  static double temperature(Args<Candidate, Fitness>& args) {
    const Config& config = args.config;
    if(config.temperature && config.coolingRate) {
      double temp = args.context.get("temperature", config.temperature.value())
        * config.coolingRate.value();
      args.context.set("temperature", temp);
      return temp;
    }
    if(config.maxEvaluations) {
      double max = config.maxEvaluations.value();
      return (max - args.ec.numEvaluations()) / max;
    }
    if(config.maxGenerations) {
      double max = config.maxGenerations.value();
      return (max - args.ec.numGenerations()) / max;
    }
    throw std::invalid_argument("replace(): No temperature schedule configured.");
  }
}; // class SimulatedAnnealingReplacement<Candidate, Fitness>

} // namespace evo
