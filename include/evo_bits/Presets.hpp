namespace evo {

/** \brief A canonical genetic algorithm.
 *
 * Rank selection of \b numSelected parents (default: the population size),
 * n-point crossover and bit-flip mutation, generational replacement. Set
 * \b numElites to keep the best individuals. */
template<class Candidate, class Fitness = double>
class GA: public EvolutionaryComputation<Candidate, Fitness> {
  using Base = EvolutionaryComputation<Candidate, Fitness>;

public:
  using Pop = Population<Candidate, Fitness>;

  explicit GA(Random& rng = evo::rng): Base(rng) {
    this->setSelector(std::make_shared<RankSelection<Candidate, Fitness>>());
    this->setVariators({
        std::make_shared<NPointCrossover<Candidate, Fitness>>(),
        std::make_shared<BitFlipMutation<Candidate, Fitness>>()});
    this->setReplacer(std::make_shared<GenerationalReplacement<Candidate, Fitness>>());
  }

  Pop evolve(Generator<Candidate, Fitness> generator,
      Evaluator<Candidate, Fitness> evaluator, size_t popSize = 100,
      std::vector<Candidate> seeds = {}, bool maximize = true,
      BoundFn<Candidate> bounder = nullptr, Config config = Config{}) override {
    if(!config.numSelected)
      config.numSelected = popSize;
    return Base::evolve(std::move(generator), std::move(evaluator), popSize,
        std::move(seeds), maximize, std::move(bounder), std::move(config));
  }
}; // class GA<Candidate, Fitness>


/** \brief A candidate of an evolution strategy: the solution together with
 * one mutation step size per allele. */
template<class Payload>
struct Strategized {
  Payload candidate;
  std::vector<double> strategy;
}; // struct Strategized<Payload>

template<class Payload>
bool operator== (const Strategized<Payload>& a, const Strategized<Payload>& b) {
  return a.candidate == b.candidate && a.strategy == b.strategy;
}

template<class Payload>
bool operator!= (const Strategized<Payload>& a, const Strategized<Payload>& b) {
  return !(a == b);
}

template<class Payload>
bool operator< (const Strategized<Payload>& a, const Strategized<Payload>& b) {
  return a.candidate < b.candidate
    || (!(b.candidate < a.candidate) && a.strategy < b.strategy);
}


/** \brief The self-adaptive mutation of ES.
 *
 * Each step size is multiplied by <b>exp(tau'·N(0,1) + tau·N(0,1))</b> and
 * kept at least \b epsilon, then each allele is perturbed by a normal
 * deviate with that step size. The result is bounded. */
template<class Payload, class Fitness = double>
class ESMutation: public Mutator<Strategized<Payload>, Fitness> {
public:
  std::string name() const override {
    return "es_mutation";
  }

protected:
  void mutate(Random& rng, Strategized<Payload>& c,
      Args<Strategized<Payload>, Fitness>& args) override {
    size_t n = c.candidate.size();
    if(n == 0)
      return;
    double tau = args.config.tau.valueOr(1 / std::sqrt(2 * std::sqrt(static_cast<double>(n))));
    double tauPrime = args.config.tauPrime.valueOr(1 / std::sqrt(2.0 * n));
    std::normal_distribution<double> gauss{0, 1};
    c.strategy.resize(n, 1.0);
    for(auto& s : c.strategy)
      s = std::max(s * std::exp(tauPrime * gauss(rng) + tau * gauss(rng)),
          args.config.epsilon);
    for(size_t i = 0; i < n; i++)
      c.candidate[i] += c.strategy[i] * gauss(rng);
    args.ec.bounder()(c);
  }
}; // class ESMutation<Payload, Fitness>


/** \brief A (mu + lambda) evolution strategy with self-adaptive step sizes.
 *
 * The problem is stated in terms of the payload: the generator, evaluator,
 * seeds and bounder all work with \b Payload, a sequence of numbers. The
 * engine itself evolves Strategized<Payload>: step sizes start uniform in
 * [0, 1) and are mutated along with the payload by ESMutation. Selection
 * takes the whole population, replacement is PlusReplacement. */
template<class Payload, class Fitness = double>
class ES: public EvolutionaryComputation<Strategized<Payload>, Fitness> {
  using Base = EvolutionaryComputation<Strategized<Payload>, Fitness>;

public:
  using Candidate = Strategized<Payload>;
  using Pop = Population<Candidate, Fitness>;
  using PayloadGenerator = std::function<Payload(Random&, Args<Candidate, Fitness>&)>;
  using PayloadEvaluator = std::function<std::vector<Maybe<Fitness>>(
      const std::vector<Payload>&, Args<Candidate, Fitness>&)>;

private:
  Random& _rng;

public:
  explicit ES(Random& rng = evo::rng): Base(rng), _rng(rng) {
    this->setSelector(std::make_shared<DefaultSelection<Candidate, Fitness>>());
    this->setVariators({std::make_shared<ESMutation<Payload, Fitness>>()});
    this->setReplacer(std::make_shared<PlusReplacement<Candidate, Fitness>>());
  }

  /** \brief Pairs a payload with random initial step sizes. */
  static Candidate strategize(Random& rng, Payload payload) {
    Candidate c{std::move(payload), std::vector<double>{}};
    c.strategy.reserve(c.candidate.size());
    for(size_t i = 0; i < c.candidate.size(); i++)
      c.strategy.push_back(internal::uniform(rng));
    return c;
  }

  /** \copydoc EvolutionaryComputation::evolve() */
  Pop evolve(PayloadGenerator generator, PayloadEvaluator evaluator,
      size_t popSize = 100, std::vector<Payload> seeds = {},
      bool maximize = true, BoundFn<Payload> bounder = nullptr,
      Config config = Config{}) {
    Generator<Candidate, Fitness> gen =
      [generator](Random& rng, Args<Candidate, Fitness>& args) -> Candidate {
        return strategize(rng, generator(rng, args));
      };
    Evaluator<Candidate, Fitness> eval =
      [evaluator](const std::vector<Candidate>& candidates,
          Args<Candidate, Fitness>& args) -> std::vector<Maybe<Fitness>> {
        std::vector<Payload> payloads{};
        payloads.reserve(candidates.size());
        for(auto& c : candidates)
          payloads.push_back(c.candidate);
        return evaluator(payloads, args);
      };
    BoundFn<Candidate> bound = nullptr;
    if(bounder)
      bound = [bounder](Candidate& c) { bounder(c.candidate); };
    std::vector<Candidate> strategized{};
    for(auto& s : seeds)
      strategized.push_back(strategize(_rng, s));
    return Base::evolve(gen, eval, popSize, std::move(strategized), maximize,
        bound, std::move(config));
  }
}; // class ES<Payload, Fitness>


/** \brief The variation of EDA: samples \b numOffspring new candidates
 * (default: the population size) from independent normal distributions
 * fitted to each allele of the given candidates. The results are bounded. */
template<class Candidate, class Fitness = double>
class EDAVariation: public Variator<Candidate, Fitness> {
public:
  std::string name() const override {
    return "eda_variation";
  }

  NOINLINE std::vector<Candidate> vary(Random& rng,
      std::vector<Candidate> candidates,
      Args<Candidate, Fitness>& args) override {
    if(candidates.empty())
      return candidates;
    size_t count = args.config.numOffspring.valueOr(args.ec.popSize());
    size_t sz = candidates.size(), n = candidates[0].size();
    std::vector<double> mean(n, 0), stdev(n, 0);
    for(auto& c : candidates)
      for(size_t i = 0; i < n; i++)
        mean[i] += static_cast<double>(c[i]) / sz;
    if(sz > 1) {
      for(auto& c : candidates)
        for(size_t i = 0; i < n; i++) {
          double d = c[i] - mean[i];
          stdev[i] += d*d / (sz - 1);
        }
      for(auto& s : stdev)
        s = std::sqrt(s);
    }
    std::vector<Candidate> ret{};
    ret.reserve(count);
    for(size_t k = 0; k < count; k++) {
      Candidate c(candidates[0]);
      for(size_t i = 0; i < n; i++)
        c[i] = stdev[i] > 0
          ? std::normal_distribution<double>{mean[i], stdev[i]}(rng)
          : mean[i];
      args.ec.bounder()(c);
      ret.push_back(std::move(c));
    }
    return ret;
  }
}; // class EDAVariation<Candidate, Fitness>


/** \brief An estimation of distribution algorithm.
 *
 * Truncation selection of \b numSelected parents (default: half the
 * population), EDAVariation, truncation replacement. */
template<class Candidate, class Fitness = double>
class EDA: public EvolutionaryComputation<Candidate, Fitness> {
  using Base = EvolutionaryComputation<Candidate, Fitness>;

public:
  using Pop = Population<Candidate, Fitness>;

  explicit EDA(Random& rng = evo::rng): Base(rng) {
    this->setSelector(std::make_shared<TruncationSelection<Candidate, Fitness>>());
    this->setVariators({std::make_shared<EDAVariation<Candidate, Fitness>>()});
    this->setReplacer(std::make_shared<TruncationReplacement<Candidate, Fitness>>());
  }

  Pop evolve(Generator<Candidate, Fitness> generator,
      Evaluator<Candidate, Fitness> evaluator, size_t popSize = 100,
      std::vector<Candidate> seeds = {}, bool maximize = true,
      BoundFn<Candidate> bounder = nullptr, Config config = Config{}) override {
    if(!config.numSelected)
      config.numSelected = popSize / 2;
    if(!config.numOffspring)
      config.numOffspring = popSize;
    return Base::evolve(std::move(generator), std::move(evaluator), popSize,
        std::move(seeds), maximize, std::move(bounder), std::move(config));
  }
}; // class EDA<Candidate, Fitness>


/** \brief A steady-state evolutionary algorithm for real-valued problems.
 *
 * Tournament selection of \b numSelected parents (default 2), heuristic
 * crossover and Gaussian mutation, steady-state replacement. */
template<class Candidate, class Fitness = double>
class DEA: public EvolutionaryComputation<Candidate, Fitness> {
  using Base = EvolutionaryComputation<Candidate, Fitness>;

public:
  using Pop = Population<Candidate, Fitness>;

  explicit DEA(Random& rng = evo::rng): Base(rng) {
    this->setSelector(std::make_shared<TournamentSelection<Candidate, Fitness>>());
    this->setVariators({
        std::make_shared<HeuristicCrossover<Candidate, Fitness>>(),
        std::make_shared<GaussianMutation<Candidate, Fitness>>()});
    this->setReplacer(std::make_shared<SteadyStateReplacement<Candidate, Fitness>>());
  }

  Pop evolve(Generator<Candidate, Fitness> generator,
      Evaluator<Candidate, Fitness> evaluator, size_t popSize = 100,
      std::vector<Candidate> seeds = {}, bool maximize = true,
      BoundFn<Candidate> bounder = nullptr, Config config = Config{}) override {
    if(!config.numSelected)
      config.numSelected = 2;
    return Base::evolve(std::move(generator), std::move(evaluator), popSize,
        std::move(seeds), maximize, std::move(bounder), std::move(config));
  }
}; // class DEA<Candidate, Fitness>


/** \brief Simulated annealing.
 *
 * A population of one, Gaussian mutation, and
 * SimulatedAnnealingReplacement; \b popSize is ignored. One of the
 * temperature schedules of SimulatedAnnealingReplacement must be
 * configured. */
template<class Candidate, class Fitness = double>
class SA: public EvolutionaryComputation<Candidate, Fitness> {
  using Base = EvolutionaryComputation<Candidate, Fitness>;

public:
  using Pop = Population<Candidate, Fitness>;

  explicit SA(Random& rng = evo::rng): Base(rng) {
    this->setSelector(std::make_shared<DefaultSelection<Candidate, Fitness>>());
    this->setVariators({std::make_shared<GaussianMutation<Candidate, Fitness>>()});
    this->setReplacer(std::make_shared<SimulatedAnnealingReplacement<Candidate, Fitness>>());
  }

  Pop evolve(Generator<Candidate, Fitness> generator,
      Evaluator<Candidate, Fitness> evaluator, size_t = 1,
      std::vector<Candidate> seeds = {}, bool maximize = true,
      BoundFn<Candidate> bounder = nullptr, Config config = Config{}) override {
    return Base::evolve(std::move(generator), std::move(evaluator), 1,
        std::move(seeds), maximize, std::move(bounder), std::move(config));
  }
}; // class SA<Candidate, Fitness>


/** \brief NSGA-II.
 *
 * Tournament selection of \b numSelected parents (default: the population
 * size), NSGAReplacement, BestArchiver. No variators are preset. */
template<class Candidate, class Fitness = Pareto>
class NSGA2: public EvolutionaryComputation<Candidate, Fitness> {
  using Base = EvolutionaryComputation<Candidate, Fitness>;

public:
  using Pop = Population<Candidate, Fitness>;

  explicit NSGA2(Random& rng = evo::rng): Base(rng) {
    this->setSelector(std::make_shared<TournamentSelection<Candidate, Fitness>>());
    this->setReplacer(std::make_shared<NSGAReplacement<Candidate, Fitness>>());
    this->setArchiver(std::make_shared<BestArchiver<Candidate, Fitness>>());
  }

  Pop evolve(Generator<Candidate, Fitness> generator,
      Evaluator<Candidate, Fitness> evaluator, size_t popSize = 100,
      std::vector<Candidate> seeds = {}, bool maximize = true,
      BoundFn<Candidate> bounder = nullptr, Config config = Config{}) override {
    if(!config.numSelected)
      config.numSelected = popSize;
    return Base::evolve(std::move(generator), std::move(evaluator), popSize,
        std::move(seeds), maximize, std::move(bounder), std::move(config));
  }
}; // class NSGA2<Candidate, Fitness>


/** \brief The Pareto Archived Evolution Strategy, (1+1) variant.
 *
 * Each member is mutated by Gaussian mutation and competes with its
 * offspring by PAESReplacement, which shares the AdaptiveGridArchiver of the
 * engine. The grid is reset when the run finishes; the archive holds the
 * result. */
template<class Candidate, class Fitness = Pareto>
class PAES: public EvolutionaryComputation<Candidate, Fitness> {
  using Base = EvolutionaryComputation<Candidate, Fitness>;

  std::shared_ptr<AdaptiveGridArchiver<Candidate, Fitness>> grid =
    std::make_shared<AdaptiveGridArchiver<Candidate, Fitness>>();

public:
  using Pop = Population<Candidate, Fitness>;

  explicit PAES(Random& rng = evo::rng): Base(rng) {
    this->setSelector(std::make_shared<DefaultSelection<Candidate, Fitness>>());
    this->setVariators({std::make_shared<GaussianMutation<Candidate, Fitness>>()});
    this->setReplacer(std::make_shared<PAESReplacement<Candidate, Fitness>>(grid));
    this->setArchiver(grid);
  }

  Pop evolve(Generator<Candidate, Fitness> generator,
      Evaluator<Candidate, Fitness> evaluator, size_t popSize = 100,
      std::vector<Candidate> seeds = {}, bool maximize = true,
      BoundFn<Candidate> bounder = nullptr, Config config = Config{}) override {
    Pop ret = Base::evolve(std::move(generator), std::move(evaluator), popSize,
        std::move(seeds), maximize, std::move(bounder), std::move(config));
    grid->reset();
    return ret;
  }
}; // class PAES<Candidate, Fitness>

} // namespace evo
