namespace evo {

/** \brief Terminates immediately: the run consists of the initial
 * population only. */
template<class Candidate, class Fitness = double>
class DefaultTermination: public Terminator<Candidate, Fitness> {
public:
  std::string name() const override {
    return "default_termination";
  }

  bool terminate(const Population<Candidate, Fitness>&, size_t, size_t,
      Args<Candidate, Fitness>&) override {
    return true;
  }
}; // class DefaultTermination<Candidate, Fitness>


/** \brief Terminates when the largest Euclidean distance between two
 * candidates of the population drops below \b minDiversity. */
template<class Candidate, class Fitness = double>
class DiversityTermination: public Terminator<Candidate, Fitness> {
public:
  std::string name() const override {
    return "diversity_termination";
  }

  NOINLINE bool terminate(const Population<Candidate, Fitness>& population,
      size_t, size_t, Args<Candidate, Fitness>& args) override {
    double max = 0;
    for(size_t i = 0; i < population.size(); i++)
      for(size_t j = i + 1; j < population.size(); j++)
        max = std::max(max, internal::distance(population[i].candidate(),
              population[j].candidate()));
    return max < args.config.minDiversity;
  }
}; // class DiversityTermination<Candidate, Fitness>


/** \brief Terminates when the best fitness and the mean fitness differ by
 * less than \b tolerance. */
template<class Candidate, class Fitness = double>
class AverageFitnessTermination: public Terminator<Candidate, Fitness> {
public:
  std::string name() const override {
    return "average_fitness_termination";
  }

  bool terminate(const Population<Candidate, Fitness>& population,
      size_t, size_t, Args<Candidate, Fitness>& args) override {
    if(population.empty())
      return true;
    auto stat = population.stat();
    return std::abs(stat.best - stat.mean) < args.config.tolerance;
  }
}; // class AverageFitnessTermination<Candidate, Fitness>


/** \brief Terminates after \b maxEvaluations evaluations (default: the
 * population size, i.e., after the initial population). */
template<class Candidate, class Fitness = double>
class EvaluationTermination: public Terminator<Candidate, Fitness> {
public:
  std::string name() const override {
    return "evaluation_termination";
  }

  bool terminate(const Population<Candidate, Fitness>& population,
      size_t, size_t numEvaluations, Args<Candidate, Fitness>& args) override {
    return numEvaluations >= args.config.maxEvaluations.valueOr(population.size());
  }
}; // class EvaluationTermination<Candidate, Fitness>


/** \brief Terminates after \b maxGenerations generations (default 1). */
template<class Candidate, class Fitness = double>
class GenerationTermination: public Terminator<Candidate, Fitness> {
public:
  std::string name() const override {
    return "generation_termination";
  }

  bool terminate(const Population<Candidate, Fitness>&,
      size_t numGenerations, size_t, Args<Candidate, Fitness>& args) override {
    return numGenerations >= args.config.maxGenerations.valueOr(1);
  }
}; // class GenerationTermination<Candidate, Fitness>


/** \brief Terminates when \b maxTime seconds have elapsed since the first
 * check, or at once if \b maxTime is unset.
 *
 * The start time is kept in the run context under "start_time" and can be
 * set there in advance. */
template<class Candidate, class Fitness = double>
class TimeTermination: public Terminator<Candidate, Fitness> {
public:
  std::string name() const override {
    return "time_termination";
  }

  bool terminate(const Population<Candidate, Fitness>&, size_t, size_t,
      Args<Candidate, Fitness>& args) override {
    double now = std::chrono::duration<double>(
        std::chrono::steady_clock::now().time_since_epoch()).count();
    if(!args.context.has("start_time")) {
      spdlog::debug("time_termination: start time not set, using the current time");
      args.context.set("start_time", now);
    }
    if(!args.config.maxTime) {
      spdlog::debug("time_termination: maxTime not set, terminating immediately");
      return true;
    }
    return now - args.context.at("start_time") >= args.config.maxTime.value();
  }
}; // class TimeTermination<Candidate, Fitness>


/** \brief Terminates when the fitness of the best individual has not changed
 * for \b maxGenerations consecutive checks (default 10). */
template<class Candidate, class Fitness = double>
class NoImprovementTermination: public Terminator<Candidate, Fitness> {
  Maybe<Fitness> previousBest{};
  size_t count = 0;

public:
  std::string name() const override {
    return "no_improvement_termination";
  }

  void reset() override {
    previousBest.reset();
    count = 0;
  }

  bool terminate(const Population<Candidate, Fitness>& population,
      size_t, size_t, Args<Candidate, Fitness>& args) override {
    if(population.empty())
      return false;
    const Fitness& best = population.best().fitness();
    if(!previousBest || previousBest.value() != best) {
      previousBest = best;
      count = 0;
      return false;
    }
    if(count >= args.config.maxGenerations.valueOr(10))
      return true;
    count++;
    return false;
  }
}; // class NoImprovementTermination<Candidate, Fitness>


/** \brief A terminator given by a function with the signature of
 * Terminator::terminate(). */
template<class Candidate, class Fitness = double>
class FunctionTerminator: public Terminator<Candidate, Fitness> {
public:
  using Function = std::function<bool(const Population<Candidate, Fitness>&,
      size_t, size_t, Args<Candidate, Fitness>&)>;

private:
  std::string _name;
  Function fn;

public:
  FunctionTerminator(std::string name, Function fn):
    _name(std::move(name)), fn(std::move(fn)) { }

  std::string name() const override {
    return _name;
  }

  bool terminate(const Population<Candidate, Fitness>& population,
      size_t numGenerations, size_t numEvaluations,
      Args<Candidate, Fitness>& args) override {
    return fn(population, numGenerations, numEvaluations, args);
  }
}; // class FunctionTerminator<Candidate, Fitness>

} // namespace evo
