namespace evo {

/** \brief Passes the candidates through unchanged. */
template<class Candidate, class Fitness = double>
class DefaultVariation: public Variator<Candidate, Fitness> {
public:
  std::string name() const override {
    return "default_variation";
  }

  std::vector<Candidate> vary(Random&, std::vector<Candidate> candidates,
      Args<Candidate, Fitness>&) override {
    return candidates;
  }
}; // class DefaultVariation<Candidate, Fitness>


/** \brief The base of recombination operators.
 *
 * Pairs the candidates in order (1st with 2nd, 3rd with 4th, ...), dropping
 * the last one if their number is odd. Each pair is recombined with
 * probability \b crossoverRate, producing two children; otherwise the pair
 * is copied through. Derived classes implement cross(). */
template<class Candidate, class Fitness = double>
class Crossover: public Variator<Candidate, Fitness> {
public:
  NOINLINE std::vector<Candidate> vary(Random& rng,
      std::vector<Candidate> candidates,
      Args<Candidate, Fitness>& args) override {
    if(candidates.size() % 2 == 1)
      candidates.pop_back();
    std::vector<Candidate> ret{};
    ret.reserve(candidates.size());
    for(size_t i = 0; i < candidates.size(); i += 2) {
      const Candidate& mom = candidates[i];
      const Candidate& dad = candidates[i+1];
      if(internal::uniform(rng) < args.config.crossoverRate) {
        std::pair<Candidate, Candidate> children = cross(rng, mom, dad, args);
        ret.push_back(std::move(children.first));
        ret.push_back(std::move(children.second));
      } else {
        ret.push_back(mom);
        ret.push_back(dad);
      }
    }
    return ret;
  }

protected:
  /** \brief Recombines two parents into two children. */
  virtual std::pair<Candidate, Candidate> cross(Random& rng,
      const Candidate& mom, const Candidate& dad,
      Args<Candidate, Fitness>& args) = 0;
}; // class Crossover<Candidate, Fitness>


/** \brief The base of mutation operators: mutate() is applied to each
 * candidate separately. */
template<class Candidate, class Fitness = double>
class Mutator: public Variator<Candidate, Fitness> {
public:
  std::vector<Candidate> vary(Random& rng, std::vector<Candidate> candidates,
      Args<Candidate, Fitness>& args) override {
    for(auto& c : candidates)
      mutate(rng, c, args);
    return candidates;
  }

protected:
  /** \brief Modifies one candidate in place. */
  virtual void mutate(Random& rng, Candidate& candidate,
      Args<Candidate, Fitness>& args) = 0;
}; // class Mutator<Candidate, Fitness>


/** \brief Cuts both parents at \b numCrossoverPoints random positions and
 * exchanges every other segment. Requires sequences of equal length. */
template<class Candidate, class Fitness = double>
class NPointCrossover: public Crossover<Candidate, Fitness> {
public:
  std::string name() const override {
    return "n_point_crossover";
  }

protected:
  std::pair<Candidate, Candidate> cross(Random& rng, const Candidate& mom,
      const Candidate& dad, Args<Candidate, Fitness>& args) override {
    size_t len = std::min(mom.size(), dad.size());
    std::vector<char> cut(len, 0);
    if(len > 1)
      for(auto i : internal::sample(len - 1, args.config.numCrossoverPoints, rng))
        cut[i + 1] = 1;
    Candidate bro(dad), sis(mom);
    bool normal = true;
    for(size_t i = 0; i < len; i++) {
      if(cut[i])
        normal = !normal;
      if(!normal) {
        bro[i] = mom[i];
        sis[i] = dad[i];
      }
    }
    return {bro, sis};
  }
}; // class NPointCrossover<Candidate, Fitness>


/** \brief Exchanges each allele of the parents with probability \b uxBias. */
template<class Candidate, class Fitness = double>
class UniformCrossover: public Crossover<Candidate, Fitness> {
public:
  std::string name() const override {
    return "uniform_crossover";
  }

protected:
  std::pair<Candidate, Candidate> cross(Random& rng, const Candidate& mom,
      const Candidate& dad, Args<Candidate, Fitness>& args) override {
    Candidate bro(dad), sis(mom);
    size_t len = std::min(mom.size(), dad.size());
    for(size_t i = 0; i < len; i++)
      if(internal::uniform(rng) < args.config.uxBias) {
        bro[i] = mom[i];
        sis[i] = dad[i];
      }
    return {bro, sis};
  }
}; // class UniformCrossover<Candidate, Fitness>


/** \brief Blend crossover (BLX-alpha) of real-valued candidates: each child
 * allele is drawn uniformly from the parents' interval extended by
 * \b blxAlpha times its width on both sides. The children are bounded. */
template<class Candidate, class Fitness = double>
class BlendCrossover: public Crossover<Candidate, Fitness> {
public:
  std::string name() const override {
    return "blend_crossover";
  }

protected:
  std::pair<Candidate, Candidate> cross(Random& rng, const Candidate& mom,
      const Candidate& dad, Args<Candidate, Fitness>& args) override {
    Candidate bro(dad), sis(mom);
    size_t len = std::min(mom.size(), dad.size());
    for(size_t i = 0; i < len; i++) {
      double lo = std::min(mom[i], dad[i]), hi = std::max(mom[i], dad[i]);
      double delta = args.config.blxAlpha * (hi - lo);
      bro[i] = lo - delta + internal::uniform(rng) * (hi - lo + 2*delta);
      sis[i] = lo - delta + internal::uniform(rng) * (hi - lo + 2*delta);
    }
    args.ec.bounder()(bro);
    args.ec.bounder()(sis);
    return {bro, sis};
  }
}; // class BlendCrossover<Candidate, Fitness>


/** \brief Arithmetic crossover: the children are the weighted averages
 * <b>a·mom + (1-a)·dad</b> and <b>a·dad + (1-a)·mom</b>, \b a being
 * \b axAlpha. The children are bounded. */
template<class Candidate, class Fitness = double>
class ArithmeticCrossover: public Crossover<Candidate, Fitness> {
public:
  std::string name() const override {
    return "arithmetic_crossover";
  }

protected:
  std::pair<Candidate, Candidate> cross(Random&, const Candidate& mom,
      const Candidate& dad, Args<Candidate, Fitness>& args) override {
    double a = args.config.axAlpha;
    Candidate bro(dad), sis(mom);
    size_t len = std::min(mom.size(), dad.size());
    for(size_t i = 0; i < len; i++) {
      bro[i] = a * mom[i] + (1 - a) * dad[i];
      sis[i] = a * dad[i] + (1 - a) * mom[i];
    }
    args.ec.bounder()(bro);
    args.ec.bounder()(sis);
    return {bro, sis};
  }
}; // class ArithmeticCrossover<Candidate, Fitness>


/** \brief Heuristic crossover: the children are placed on the line through
 * the parents, randomly beyond the better parent in the direction away from
 * the worse one.
 *
 * The fitness of the parents is looked up in the current population of the
 * engine, so this must be the first variator of the pipeline. The children
 * are bounded.
 *
 * \throws std::invalid_argument if a parent is not in the population. */
template<class Candidate, class Fitness = double>
class HeuristicCrossover: public Crossover<Candidate, Fitness> {
public:
  std::string name() const override {
    return "heuristic_crossover";
  }

protected:
  std::pair<Candidate, Candidate> cross(Random& rng, const Candidate& mom,
      const Candidate& dad, Args<Candidate, Fitness>& args) override {
    bool momIsBetter = lookup(mom, args) > lookup(dad, args);
    Candidate bro(dad), sis(mom);
    size_t len = std::min(mom.size(), dad.size());
    for(size_t i = 0; i < len; i++) {
      double negpos = momIsBetter ? 1 : -1;
      double val = momIsBetter ? dad[i] : mom[i];
      bro[i] = val + internal::uniform(rng) * negpos * (mom[i] - dad[i]);
      sis[i] = val + internal::uniform(rng) * negpos * (mom[i] - dad[i]);
    }
    args.ec.bounder()(bro);
    args.ec.bounder()(sis);
    return {bro, sis};
  }

private:
  static const Individual<Candidate, Fitness>& lookup(const Candidate& c,
      const Args<Candidate, Fitness>& args) {
    for(auto& ind : args.ec.population())
      if(ind.candidate() == c)
        return ind;
    throw std::invalid_argument("cross(): Parent not found in the population.");
  }
}; // class HeuristicCrossover<Candidate, Fitness>


/** \brief Flips each bit of a binary candidate with probability
 * \b mutationRate. Candidates containing values other than 0 and 1 are left
 * unchanged. */
template<class Candidate, class Fitness = double>
class BitFlipMutation: public Mutator<Candidate, Fitness> {
public:
  std::string name() const override {
    return "bit_flip_mutation";
  }

protected:
  void mutate(Random& rng, Candidate& candidate,
      Args<Candidate, Fitness>& args) override {
    for(size_t i = 0; i < candidate.size(); i++)
      if(candidate[i] != 0 && candidate[i] != 1)
        return;
    for(size_t i = 0; i < candidate.size(); i++)
      if(internal::uniform(rng) < args.config.mutationRate)
        candidate[i] = candidate[i] == 0 ? 1 : 0;
  }
}; // class BitFlipMutation<Candidate, Fitness>


/** \brief Adds a normal deviate N(\b gaussianMean, \b gaussianStdev) to each
 * allele with probability \b mutationRate. The result is bounded. */
template<class Candidate, class Fitness = double>
class GaussianMutation: public Mutator<Candidate, Fitness> {
public:
  std::string name() const override {
    return "gaussian_mutation";
  }

protected:
  void mutate(Random& rng, Candidate& candidate,
      Args<Candidate, Fitness>& args) override {
    std::normal_distribution<double> gauss{args.config.gaussianMean,
      args.config.gaussianStdev};
    for(size_t i = 0; i < candidate.size(); i++)
      if(internal::uniform(rng) < args.config.mutationRate)
        candidate[i] += gauss(rng);
    args.ec.bounder()(candidate);
  }
}; // class GaussianMutation<Candidate, Fitness>


/** \brief With probability \b mutationRate, reverses a random segment of the
 * candidate. Suitable for permutations. */
template<class Candidate, class Fitness = double>
class InversionMutation: public Mutator<Candidate, Fitness> {
public:
  std::string name() const override {
    return "inversion_mutation";
  }

protected:
  void mutate(Random& rng, Candidate& candidate,
      Args<Candidate, Fitness>& args) override {
    size_t sz = candidate.size();
    if(sz == 0 || internal::uniform(rng) >= args.config.mutationRate)
      return;
    size_t p = internal::index(sz, rng), q = internal::index(sz, rng);
    if(p > q)
      std::swap(p, q);
    std::reverse(candidate.begin() + p, candidate.begin() + q + 1);
  }
}; // class InversionMutation<Candidate, Fitness>


/** \brief With probability \b mutationRate, shuffles a random segment of the
 * candidate. Suitable for permutations. */
template<class Candidate, class Fitness = double>
class ScrambleMutation: public Mutator<Candidate, Fitness> {
public:
  std::string name() const override {
    return "scramble_mutation";
  }

protected:
  void mutate(Random& rng, Candidate& candidate,
      Args<Candidate, Fitness>& args) override {
    size_t sz = candidate.size();
    if(sz == 0 || internal::uniform(rng) >= args.config.mutationRate)
      return;
    size_t p = internal::index(sz, rng), q = internal::index(sz, rng);
    if(p > q)
      std::swap(p, q);
    std::shuffle(candidate.begin() + p, candidate.begin() + q + 1, rng);
  }
}; // class ScrambleMutation<Candidate, Fitness>

} // namespace evo
