namespace evo {

/** \brief Does nothing. */
template<class Candidate, class Fitness = double>
class DefaultObserver: public Observer<Candidate, Fitness> {
public:
  std::string name() const override {
    return "default_observer";
  }

  void observe(const Population<Candidate, Fitness>&, size_t, size_t,
      Args<Candidate, Fitness>&) override { }
}; // class DefaultObserver<Candidate, Fitness>


/** \brief Logs the fitness statistics of the population at info level. */
template<class Candidate, class Fitness = double>
class StatsObserver: public Observer<Candidate, Fitness> {
public:
  std::string name() const override {
    return "stats_observer";
  }

  void observe(const Population<Candidate, Fitness>& population,
      size_t numGenerations, size_t numEvaluations,
      Args<Candidate, Fitness>&) override {
    if(population.empty()) {
      spdlog::info("generation {:>6} evaluations {:>8}: population is empty",
          numGenerations, numEvaluations);
      return;
    }
    auto stat = population.stat();
    spdlog::info("generation {:>6} evaluations {:>8} worst {:>10.5g} best {:>10.5g} "
        "median {:>10.5g} mean {:>10.5g} stdev {:>10.5g}",
        numGenerations, numEvaluations, stat.worst, stat.best,
        stat.median, stat.mean, stat.stdev);
  }
}; // class StatsObserver<Candidate, Fitness>


/** \brief An observer given by a function with the signature of
 * Observer::observe(). */
template<class Candidate, class Fitness = double>
class FunctionObserver: public Observer<Candidate, Fitness> {
public:
  using Function = std::function<void(const Population<Candidate, Fitness>&,
      size_t, size_t, Args<Candidate, Fitness>&)>;

private:
  Function fn;

public:
  explicit FunctionObserver(Function fn): fn(std::move(fn)) { }

  std::string name() const override {
    return "function_observer";
  }

  void observe(const Population<Candidate, Fitness>& population,
      size_t numGenerations, size_t numEvaluations,
      Args<Candidate, Fitness>& args) override {
    fn(population, numGenerations, numEvaluations, args);
  }
}; // class FunctionObserver<Candidate, Fitness>

} // namespace evo
