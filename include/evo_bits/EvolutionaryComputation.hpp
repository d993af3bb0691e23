namespace evo {

/** \brief The evolution engine.
 *
 * Holds one operator of each role (selector, replacer, migrator, archiver)
 * and ordered lists of variators, terminators and observers, and runs them
 * in a fixed order in evolve(). Each operator can be replaced through its
 * setter; the defaults leave the population unchanged and terminate at
 * once, so that a usable algorithm needs at least a variator, a replacer
 * and a terminator. See the presets (GA, ES, EDA, DEA, SA, NSGA2, PAES) for
 * common combinations.
 *
 * The engine owns the population, the archive and the run counters. After
 * evolve() returns they remain available through the accessors until the
 * next run.
 *
 * \tparam Candidate the candidate type, opaque to the engine.
 * \tparam Fitness the fitness type: an arithmetic type or evo::Pareto. */
template<class Candidate, class Fitness = double>
class EvolutionaryComputation {
public:
  using Pop = Population<Candidate, Fitness>;
  using Ind = Individual<Candidate, Fitness>;
  using ArgsType = Args<Candidate, Fitness>;

  using SelectorPtr = std::shared_ptr<Selector<Candidate, Fitness>>;
  using VariatorPtr = std::shared_ptr<Variator<Candidate, Fitness>>;
  using ReplacerPtr = std::shared_ptr<Replacer<Candidate, Fitness>>;
  using MigratorPtr = std::shared_ptr<Migrator<Candidate, Fitness>>;
  using ArchiverPtr = std::shared_ptr<Archiver<Candidate, Fitness>>;
  using TerminatorPtr = std::shared_ptr<Terminator<Candidate, Fitness>>;
  using ObserverPtr = std::shared_ptr<Observer<Candidate, Fitness>>;

private:
  Random& _rng;

  SelectorPtr _selector = std::make_shared<DefaultSelection<Candidate, Fitness>>();
  std::vector<VariatorPtr> _variators{
    std::make_shared<DefaultVariation<Candidate, Fitness>>()};
  ReplacerPtr _replacer = std::make_shared<DefaultReplacement<Candidate, Fitness>>();
  MigratorPtr _migrator = std::make_shared<DefaultMigration<Candidate, Fitness>>();
  ArchiverPtr _archiver = std::make_shared<DefaultArchiver<Candidate, Fitness>>();
  std::vector<TerminatorPtr> _terminators{
    std::make_shared<DefaultTermination<Candidate, Fitness>>()};
  std::vector<ObserverPtr> _observers{};

  Pop _population{};
  Pop _archive{};
  size_t _numEvaluations = 0;
  size_t _numGenerations = 0;
  std::string _terminationCause{};

  size_t _popSize = 0;
  bool _maximize = true;
  BoundFn<Candidate> _bounder = noBounds;
  Evaluator<Candidate, Fitness> _evaluator{};
  Config _config{};
  RunContext _context{};

  static void noBounds(Candidate&) { }

  template<class T>
  static std::shared_ptr<T> checked(std::shared_ptr<T> ptr, const char* fn) {
    if(!ptr)
      throw std::invalid_argument(std::string(fn) + "(): Operator is null.");
    return ptr;
  }

public:
  /** \brief Creates an engine drawing random numbers from \b rng.
   *
   * The generator is held by reference and must outlive the engine. */
  explicit EvolutionaryComputation(Random& rng = evo::rng): _rng(rng) { }

  virtual ~EvolutionaryComputation() { }

  EvolutionaryComputation(const EvolutionaryComputation&) = delete;
  EvolutionaryComputation& operator=(const EvolutionaryComputation&) = delete;

  void setSelector(SelectorPtr selector) {
    _selector = checked(std::move(selector), "setSelector");
  }

  /** \brief Sets the variators, applied in the given order. */
  void setVariators(std::vector<VariatorPtr> variators) {
    for(auto& v : variators)
      checked(v, "setVariators");
    _variators = std::move(variators);
  }

  void setReplacer(ReplacerPtr replacer) {
    _replacer = checked(std::move(replacer), "setReplacer");
  }

  void setMigrator(MigratorPtr migrator) {
    _migrator = checked(std::move(migrator), "setMigrator");
  }

  void setArchiver(ArchiverPtr archiver) {
    _archiver = checked(std::move(archiver), "setArchiver");
  }

  /** \brief Sets the terminators. The run stops as soon as any of them
   * returns \b true; the first one to do so is recorded as the termination
   * cause. */
  void setTerminators(std::vector<TerminatorPtr> terminators) {
    for(auto& t : terminators)
      checked(t, "setTerminators");
    _terminators = std::move(terminators);
  }

  void setTerminator(TerminatorPtr terminator) {
    setTerminators({std::move(terminator)});
  }

  /** \brief Sets the observers, called in the given order. */
  void setObservers(std::vector<ObserverPtr> observers) {
    for(auto& o : observers)
      checked(o, "setObservers");
    _observers = std::move(observers);
  }

  void addObserver(ObserverPtr observer) {
    _observers.push_back(checked(std::move(observer), "addObserver"));
  }

  const SelectorPtr& selector() const { return _selector; }
  const std::vector<VariatorPtr>& variators() const { return _variators; }
  const ReplacerPtr& replacer() const { return _replacer; }
  const MigratorPtr& migrator() const { return _migrator; }
  const ArchiverPtr& archiver() const { return _archiver; }
  const std::vector<TerminatorPtr>& terminators() const { return _terminators; }
  const std::vector<ObserverPtr>& observers() const { return _observers; }

  /** \brief The current population. */
  const Pop& population() const {
    return _population;
  }

  /** \brief The current archive. */
  const Pop& archive() const {
    return _archive;
  }

  size_t numEvaluations() const {
    return _numEvaluations;
  }

  size_t numGenerations() const {
    return _numGenerations;
  }

  /** \brief The name of the terminator which ended the last run, or an empty
   * string if no run has terminated. */
  const std::string& terminationCause() const {
    return _terminationCause;
  }

  /** \brief The population size requested for the current run. */
  size_t popSize() const {
    return _popSize;
  }

  bool maximize() const {
    return _maximize;
  }

  /** \brief The bounding function of the current run. Never empty. */
  const BoundFn<Candidate>& bounder() const {
    return _bounder;
  }

  const Config& config() const {
    return _config;
  }

  const RunContext& context() const {
    return _context;
  }

  /** \brief Runs the evolution.
   *
   * The initial population consists of the \b seeds followed by as many
   * generated candidates as needed to reach \b popSize. If there are more
   * seeds than that, all of them are kept. The initial population is
   * evaluated as one batch and archived, and the observers are called for
   * generation 0. Then, until a terminator fires, each generation selects
   * parents, passes their candidates through the variators, evaluates the
   * result as one batch, and updates the population by the replacer and the
   * migrator and the archive by the archiver. The observers are called after
   * each generation.
   *
   * Candidates whose fitness is returned absent are excluded with a
   * warning. Exceptions thrown by any operator propagate to the caller.
   *
   * \param generator produces the initial candidates.
   * \param evaluator scores batches of candidates.
   * \param popSize the size of the initial population.
   * \param seeds candidates to include in the initial population.
   * \param maximize \b false if smaller fitness is better.
   * \param bounder repairs candidates produced by the variators; optional.
   * \param config the parameters of the operators.
   * \returns the final population.
   *
   * \throws std::invalid_argument if no terminator is set.
   * \throws std::length_error if the evaluator returns a wrong number of
   * results. */
  virtual Pop evolve(Generator<Candidate, Fitness> generator,
      Evaluator<Candidate, Fitness> evaluator, size_t popSize = 100,
      std::vector<Candidate> seeds = {}, bool maximize = true,
      BoundFn<Candidate> bounder = nullptr, Config config = Config{}) {
    if(_terminators.empty())
      throw std::invalid_argument("evolve(): No terminator set.");
    _popSize = popSize;
    _maximize = maximize;
    _bounder = bounder ? std::move(bounder) : BoundFn<Candidate>{noBounds};
    _evaluator = std::move(evaluator);
    _config = std::move(config);
    _context.clear();
    _population.clear();
    _archive.clear();
    _numEvaluations = 0;
    _numGenerations = 0;
    _terminationCause.clear();
    resetOperators();

    ArgsType args{_config, _context, *this, _archive, nullptr};
    args.evaluate = [this, &args](const std::vector<Candidate>& candidates) {
      return evaluateCounted(candidates, args);
    };

    std::vector<Candidate> initial(std::move(seeds));
    size_t count = popSize > initial.size() ? popSize - initial.size() : 0;
    spdlog::debug("generating initial population");
    for(size_t i = 0; i < count; i++)
      initial.push_back(generator(_rng, args));
    spdlog::debug("evaluating initial population");
    _population = evaluate(initial, args);
    spdlog::debug("population size is now {}", _population.size());
    spdlog::debug("archiving initial population");
    _archive = _archiver->archive(_rng, _population, _archive, args);
    spdlog::debug("archive size is now {}", _archive.size());
    observe(args);

    while(!shouldTerminate(args)) {
      spdlog::debug("selection using {} at generation {} and evaluation {}",
          _selector->name(), _numGenerations, _numEvaluations);
      Pop parents = _selector->select(_rng, _population, args);
      spdlog::debug("selected {} candidates", parents.size());
      std::vector<Candidate> offspring = parents.candidates();
      for(auto& v : _variators) {
        spdlog::debug("variation using {} at generation {} and evaluation {}",
            v->name(), _numGenerations, _numEvaluations);
        offspring = v->vary(_rng, std::move(offspring), args);
        spdlog::debug("created {} offspring", offspring.size());
      }
      spdlog::debug("evaluation using {} candidates at generation {} and evaluation {}",
          offspring.size(), _numGenerations, _numEvaluations);
      Pop evaluated = evaluate(offspring, args);
      spdlog::debug("replacement using {} at generation {} and evaluation {}",
          _replacer->name(), _numGenerations, _numEvaluations);
      _population = _replacer->replace(_rng, _population, parents,
          std::move(evaluated), args);
      spdlog::debug("population size is now {}", _population.size());
      spdlog::debug("migration using {} at generation {} and evaluation {}",
          _migrator->name(), _numGenerations, _numEvaluations);
      _population = _migrator->migrate(_rng, _population, args);
      spdlog::debug("archival using {} at generation {} and evaluation {}",
          _archiver->name(), _numGenerations, _numEvaluations);
      _archive = _archiver->archive(_rng, _population, _archive, args);
      spdlog::debug("archive size is now {}", _archive.size());
      _numGenerations++;
      observe(args);
    }
    return _population;
  }

private:
  void resetOperators() {
    _selector->reset();
    for(auto& v : _variators)
      v->reset();
    _replacer->reset();
    _migrator->reset();
    _archiver->reset();
    for(auto& t : _terminators)
      t->reset();
    for(auto& o : _observers)
      o->reset();
  }

  std::vector<Maybe<Fitness>> evaluateCounted(
      const std::vector<Candidate>& candidates, ArgsType& args) {
    auto fit = _evaluator(candidates, args);
    if(fit.size() != candidates.size())
      throw std::length_error("evolve(): Evaluator returned "
          + std::to_string(fit.size()) + " results for "
          + std::to_string(candidates.size()) + " candidates.");
    _numEvaluations += fit.size();
    return fit;
  }

  NOINLINE Pop evaluate(const std::vector<Candidate>& candidates,
      ArgsType& args) {
    auto fit = evaluateCounted(candidates, args);
    Pop ret(candidates.size());
    for(size_t i = 0; i < candidates.size(); i++) {
      if(fit[i])
        ret.add(Ind{candidates[i], fit[i].value(), _maximize});
      else
        spdlog::warn("excluding candidate {} because fitness received as none", i);
    }
    return ret;
  }

  bool shouldTerminate(ArgsType& args) {
    for(auto& t : _terminators)
      if(t->terminate(_population, _numGenerations, _numEvaluations, args)) {
        _terminationCause = t->name();
        spdlog::debug("termination using {} at generation {} and evaluation {}",
            _terminationCause, _numGenerations, _numEvaluations);
        return true;
      }
    return false;
  }

  void observe(ArgsType& args) {
    for(auto& o : _observers) {
      spdlog::debug("observation using {} at generation {} and evaluation {}",
          o->name(), _numGenerations, _numEvaluations);
      o->observe(_population, _numGenerations, _numEvaluations, args);
    }
  }
}; // class EvolutionaryComputation<Candidate, Fitness>

} // namespace evo
