namespace evo {

/** \brief Selects the whole population. */
template<class Candidate, class Fitness = double>
class DefaultSelection: public Selector<Candidate, Fitness> {
public:
  std::string name() const override {
    return "default_selection";
  }

  Population<Candidate, Fitness> select(Random&,
      const Population<Candidate, Fitness>& population,
      Args<Candidate, Fitness>&) override {
    return population;
  }
}; // class DefaultSelection<Candidate, Fitness>


/** \brief Selects the \b numSelected best individuals (default: all of them,
 * best first). */
template<class Candidate, class Fitness = double>
class TruncationSelection: public Selector<Candidate, Fitness> {
public:
  std::string name() const override {
    return "truncation_selection";
  }

  Population<Candidate, Fitness> select(Random&,
      const Population<Candidate, Fitness>& population,
      Args<Candidate, Fitness>& args) override {
    Population<Candidate, Fitness> ret(population);
    ret.rankTrim(args.config.numSelected.valueOr(population.size()));
    return ret;
  }
}; // class TruncationSelection<Candidate, Fitness>


/** \brief Selects \b numSelected individuals (default 1) uniformly at random,
 * with replacement. */
template<class Candidate, class Fitness = double>
class UniformSelection: public Selector<Candidate, Fitness> {
public:
  std::string name() const override {
    return "uniform_selection";
  }

  Population<Candidate, Fitness> select(Random& rng,
      const Population<Candidate, Fitness>& population,
      Args<Candidate, Fitness>& args) override {
    size_t count = args.config.numSelected.valueOr(1);
    Population<Candidate, Fitness> ret(count);
    if(population.empty())
      return ret;
    for(size_t i = 0; i < count; i++)
      ret.add(population.randomSelect(rng));
    return ret;
  }
}; // class UniformSelection<Candidate, Fitness>


/** \brief Roulette-wheel selection of \b numSelected individuals (default 1)
 * with probabilities proportional to fitness.
 *
 * Only applicable to maximization of a scalar fitness whose values in the
 * population are all of the same sign. If all are equal the selection is
 * uniform. */
template<class Candidate, class Fitness = double>
class FitnessProportionateSelection: public Selector<Candidate, Fitness> {
  static_assert(Individual<Candidate, Fitness>::Traits::is_float,
      "FitnessProportionateSelection needs a fitness type convertible to double!");

public:
  std::string name() const override {
    return "fitness_proportionate_selection";
  }

  /** \throws std::invalid_argument for a minimization problem or fitness
   * values of mixed signs. */
  NOINLINE Population<Candidate, Fitness> select(Random& rng,
      const Population<Candidate, Fitness>& population,
      Args<Candidate, Fitness>& args) override {
    size_t count = args.config.numSelected.valueOr(1);
    Population<Candidate, Fitness> ret(count);
    size_t sz = population.size();
    if(sz == 0)
      return ret;
    if(!population[0].maximize())
      throw std::invalid_argument("select(): Fitness proportionate selection is not valid for minimization.");
    Population<Candidate, Fitness> sorted(population);
    sorted.sort();
    double maxFit = sorted[0].fitness(), minFit = sorted[sz - 1].fitness();
    std::vector<double> psum(sz);
    if(maxFit == minFit) {
      for(size_t i = 0; i < sz; i++)
        psum[i] = (i + 1) / static_cast<double>(sz);
    } else if((maxFit > 0 && minFit >= 0) || (maxFit <= 0 && minFit < 0)) {
      psum[0] = sorted[0].fitness();
      for(size_t i = 1; i < sz; i++)
        psum[i] = psum[i-1] + static_cast<double>(sorted[i].fitness());
      for(size_t i = 0; i < sz; i++)
        psum[i] /= psum[sz - 1];
    } else
      throw std::invalid_argument("select(): Fitness proportionate selection needs fitness values of one sign.");
    for(size_t i = 0; i < count; i++) {
      size_t pos = std::upper_bound(psum.begin(), psum.end(),
          internal::uniform(rng)) - psum.begin();
      ret.add(sorted[std::min(pos, sz - 1)]);
    }
    return ret;
  }
}; // class FitnessProportionateSelection<Candidate, Fitness>


/** \brief Selects \b numSelected individuals (default 1) with probabilities
 * proportional to their rank: the worst individual has rank 1, the best rank
 * \b n. */
template<class Candidate, class Fitness = double>
class RankSelection: public Selector<Candidate, Fitness> {
public:
  std::string name() const override {
    return "rank_selection";
  }

  NOINLINE Population<Candidate, Fitness> select(Random& rng,
      const Population<Candidate, Fitness>& population,
      Args<Candidate, Fitness>& args) override {
    size_t count = args.config.numSelected.valueOr(1);
    Population<Candidate, Fitness> ret(count);
    size_t sz = population.size();
    if(sz == 0)
      return ret;
    Population<Candidate, Fitness> sorted(population);
    sorted.sort(false);
    double den = sz * (sz + 1) / 2.0;
    std::vector<double> psum(sz);
    for(size_t i = 0; i < sz; i++)
      psum[i] = (i + 1) / den + (i ? psum[i-1] : 0);
    for(size_t i = 0; i < count; i++) {
      size_t pos = std::upper_bound(psum.begin(), psum.end(),
          internal::uniform(rng)) - psum.begin();
      ret.add(sorted[std::min(pos, sz - 1)]);
    }
    return ret;
  }
}; // class RankSelection<Candidate, Fitness>


/** \brief Runs \b numSelected tournaments (default 1), each among
 * \b tournamentSize distinct random individuals, and selects the winners. */
template<class Candidate, class Fitness = double>
class TournamentSelection: public Selector<Candidate, Fitness> {
public:
  std::string name() const override {
    return "tournament_selection";
  }

  Population<Candidate, Fitness> select(Random& rng,
      const Population<Candidate, Fitness>& population,
      Args<Candidate, Fitness>& args) override {
    size_t count = args.config.numSelected.valueOr(1);
    size_t size = std::max<size_t>(args.config.tournamentSize, 1);
    Population<Candidate, Fitness> ret(count);
    if(population.empty())
      return ret;
    for(size_t i = 0; i < count; i++)
      ret.add(population.randomSelect(size, rng).best());
    return ret;
  }
}; // class TournamentSelection<Candidate, Fitness>

} // namespace evo
