namespace evo {

template<class Candidate, class Fitness>
class EvolutionaryComputation;

/** \brief The fixed parameters of a run.
 *
 * Every parameter has a default; the operators reading each one are listed
 * with it. Parameters of type Maybe default to a value derived from the run
 * (usually the population size) when left unset. The presets fill in some of
 * the unset ones before the run starts.
 *
 * The configuration is not modified by the engine or by the operators. Values
 * which change during a run live in a RunContext. */
struct Config {
  /** \brief Selectors: number of parents. Default: the whole population for
   * DefaultSelection and TruncationSelection, 1 for the rest. */
  Maybe<size_t> numSelected{};
  /** \brief TournamentSelection: tournament size, capped at the population
   * size. */
  size_t tournamentSize = 2;

  /** \brief Crossovers: probability that a pair of parents is recombined. */
  double crossoverRate = 1.0;
  /** \brief NPointCrossover: number of cut points. */
  size_t numCrossoverPoints = 1;
  /** \brief UniformCrossover: probability of swapping each allele. */
  double uxBias = 0.5;
  /** \brief BlendCrossover: extension of the parents' interval. */
  double blxAlpha = 0.1;
  /** \brief ArithmeticCrossover: weight of the first parent. */
  double axAlpha = 0.5;

  /** \brief Mutators: probability of mutating each allele (or each candidate
   * for permutation mutators). */
  double mutationRate = 0.1;
  double gaussianMean = 0.0;
  double gaussianStdev = 1.0;

  /** \brief Generational and random replacement: number of best individuals
   * that survive regardless of offspring. */
  size_t numElites = 0;
  /** \brief CrowdingReplacement: size of the pool the closest individual is
   * sought in. */
  size_t crowdingDistance = 2;
  /** \brief SimulatedAnnealingReplacement: initial temperature, used together
   * with coolingRate. */
  Maybe<double> temperature{};
  Maybe<double> coolingRate{};

  /** \brief EvaluationTermination, SimulatedAnnealingReplacement. Default:
   * the population size. */
  Maybe<size_t> maxEvaluations{};
  /** \brief GenerationTermination (default 1), NoImprovementTermination
   * (default 10), SimulatedAnnealingReplacement. */
  Maybe<size_t> maxGenerations{};
  /** \brief DiversityTermination: threshold on the largest distance. */
  double minDiversity = 0.001;
  /** \brief AverageFitnessTermination: threshold on best - mean. */
  double tolerance = 0.001;
  /** \brief TimeTermination: time limit in seconds. If unset, terminates
   * immediately. */
  Maybe<double> maxTime{};

  /** \brief AdaptiveGridArchiver: archive capacity. Default: the initial
   * population size. */
  Maybe<size_t> maxArchiveSize{};
  /** \brief AdaptiveGridArchiver: number of bisections of each objective. */
  size_t numGridDivisions = 1;

  /** \brief ES: learning rates of the strategy parameters. Default:
   * <b>1/sqrt(2 sqrt(n))</b> and <b>1/sqrt(2n)</b> for \b n alleles. */
  Maybe<double> tau{};
  Maybe<double> tauPrime{};
  /** \brief ES: lower bound of the strategy parameters. */
  double epsilon = 0.00001;

  /** \brief EDA: number of candidates sampled per generation. Default: the
   * population size. */
  Maybe<size_t> numOffspring{};

  /** \brief ChannelMigrator: re-evaluate immigrants. */
  bool evaluateMigrant = false;
}; // struct Config


/** \brief Mutable scratch values of one run.
 *
 * Operators which need to carry a value from one generation to the next
 * (e.g., the annealing temperature or the start time of a time limit) keep
 * it here under a name of their choice. The engine clears the context at the
 * start of each run. */
class RunContext {
  std::map<std::string, double> values{};

public:
  bool has(const std::string& key) const {
    return values.count(key) > 0;
  }

  /** \brief Returns the value stored under \b key, or \b def. */
  double get(const std::string& key, double def) const {
    auto it = values.find(key);
    return it != values.end() ? it->second : def;
  }

  /** \brief Returns the value stored under \b key.
   *
   * \throws std::out_of_range if there is none. */
  double at(const std::string& key) const {
    auto it = values.find(key);
    if(it == values.end())
      throw std::out_of_range("at(): No value stored under '" + key + "'.");
    return it->second;
  }

  void set(const std::string& key, double value) {
    values[key] = value;
  }

  void clear() {
    values.clear();
  }
}; // class RunContext


/** \brief Everything an operator may consult besides its direct inputs.
 *
 * Created by the engine at the start of each run and passed to every
 * generator, evaluator and operator call. */
template<class Candidate, class Fitness>
struct Args {
  /** \brief The fixed parameters of this run. */
  const Config& config;
  /** \brief Scratch values operators may update. */
  RunContext& context;
  /** \brief Read-only access to the engine: population size, bounder,
   * counters, current population. */
  const EvolutionaryComputation<Candidate, Fitness>& ec;
  /** \brief The archive of the engine. Only replacers maintaining it jointly
   * with an archiver (PAESReplacement) modify it. */
  Population<Candidate, Fitness>& archive;
  /** \brief Evaluates candidates outside the regular evaluation stage. The
   * evaluations are added to the engine's count. */
  std::function<std::vector<Maybe<Fitness>>(const std::vector<Candidate>&)> evaluate;
}; // struct Args<Candidate, Fitness>


/** \brief Produces a new random candidate. */
template<class Candidate, class Fitness>
using Generator = std::function<Candidate(Random&, Args<Candidate, Fitness>&)>;

/** \brief Scores a batch of candidates.
 *
 * Must return one entry for each candidate in the same order. An absent
 * entry excludes the corresponding candidate from the run. */
template<class Candidate, class Fitness>
using Evaluator = std::function<std::vector<Maybe<Fitness>>(
    const std::vector<Candidate>&, Args<Candidate, Fitness>&)>;

/** \brief Repairs a candidate in place to satisfy the problem's bounds. */
template<class Candidate>
using BoundFn = std::function<void(Candidate&)>;

} // namespace evo
