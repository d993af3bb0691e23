namespace evo {

/** \brief Clamps numeric sequences to given bounds.
 *
 * The bounds are either scalars applying to every allele or sequences giving
 * bounds allele by allele. In the latter case alleles beyond the length of
 * the bounds are left as they are. A default-constructed Bounder does nothing.
 *
 * Can be passed as the bounder of any engine whose candidates are sequences
 * of numbers. */
class Bounder {
  std::vector<double> lower{};
  std::vector<double> upper{};

public:
  Bounder() = default;

  Bounder(double lower, double upper):
    Bounder(std::vector<double>{lower}, std::vector<double>{upper}) { }

  /** \throws std::invalid_argument if the lengths differ. */
  Bounder(std::vector<double> lower, std::vector<double> upper):
      lower(std::move(lower)), upper(std::move(upper)) {
    if(this->lower.size() != this->upper.size())
      throw std::invalid_argument("Bounder(): Lower and upper bounds differ in length.");
  }

  template<class Sequence>
  void operator()(Sequence& candidate) const {
    if(lower.empty())
      return;
    bool scalar = lower.size() == 1;
    size_t sz = scalar ? candidate.size() : std::min(candidate.size(), lower.size());
    for(size_t i = 0; i < sz; i++) {
      double lo = scalar ? lower[0] : lower[i];
      double hi = scalar ? upper[0] : upper[i];
      double x = candidate[i];
      candidate[i] = std::max(lo, std::min(hi, x));
    }
  }
}; // class Bounder


/** \brief Lifts a function scoring a single candidate into an Evaluator.
 *
 * \param fn any callable object taking a <b>const Candidate&</b> and an
 * <b>Args<Candidate, Fitness>&</b> and returning either \b Fitness or
 * <b>Maybe<Fitness></b>.
 * \param parallel controls parallelization using OpenMP (on by default). If
 * enabled, \b fn must be safe to call concurrently. The results are returned
 * in the order of the candidates in any case. */
template<class Candidate, class Fitness, class Fn>
Evaluator<Candidate, Fitness> evaluator(Fn fn, bool parallel = true) {
  return [fn, parallel](const std::vector<Candidate>& candidates,
      Args<Candidate, Fitness>& args) -> std::vector<Maybe<Fitness>> {
    size_t sz = candidates.size();
    std::vector<Maybe<Fitness>> ret(sz);
    internal::exception_trap trap{};
    #pragma omp parallel for if(parallel) schedule(dynamic)
    for(size_t i = 0; i < sz; i++)
      trap.run([&, i]() { ret[i] = fn(candidates[i], args); });
    trap.rethrow();
    return ret;
  };
}


/** \brief Caches the results of an Evaluator.
 *
 * Candidates seen before are answered from the cache, the rest are passed to
 * the wrapped evaluator in a single batch. At most \b maxSize results are
 * kept; the oldest are forgotten first. Copies of a Memoize share one cache.
 *
 * Requires `operator<` on \b Candidate. */
template<class Candidate, class Fitness>
class Memoize {
  struct Cache {
    std::map<Candidate, Maybe<Fitness>> values{};
    std::deque<Candidate> order{};
  };

  Evaluator<Candidate, Fitness> inner;
  size_t maxSize;
  std::shared_ptr<Cache> cache;

public:
  explicit Memoize(Evaluator<Candidate, Fitness> evaluator,
      size_t maxSize = std::numeric_limits<size_t>::max()):
    inner(std::move(evaluator)), maxSize(maxSize),
    cache(std::make_shared<Cache>()) { }

  NOINLINE std::vector<Maybe<Fitness>> operator()(
      const std::vector<Candidate>& candidates,
      Args<Candidate, Fitness>& args) {
    std::map<Candidate, Maybe<Fitness>> batch{};
    std::vector<Candidate> missing{};
    for(auto& c : candidates) {
      auto it = cache->values.find(c);
      if(it != cache->values.end())
        batch[c] = it->second;
      else if(batch.insert({c, Maybe<Fitness>{}}).second)
        missing.push_back(c);
    }
    if(!missing.empty()) {
      auto fit = inner(missing, args);
      if(fit.size() != missing.size())
        throw std::length_error("Memoize: Evaluator returned a batch of wrong size.");
      for(size_t i = 0; i < missing.size(); i++) {
        batch[missing[i]] = fit[i];
        store(missing[i], fit[i]);
      }
    }
    std::vector<Maybe<Fitness>> ret{};
    ret.reserve(candidates.size());
    for(auto& c : candidates)
      ret.push_back(batch[c]);
    return ret;
  }

  /** \brief The number of cached results. */
  size_t size() const {
    return cache->values.size();
  }

  void clear() {
    cache->values.clear();
    cache->order.clear();
  }

private:
  void store(const Candidate& c, const Maybe<Fitness>& f) {
    if(maxSize == 0)
      return;
    if(cache->values.insert({c, f}).second)
      cache->order.push_back(c);
    while(cache->values.size() > maxSize) {
      cache->values.erase(cache->order.front());
      cache->order.pop_front();
    }
  }
}; // class Memoize<Candidate, Fitness>


/** \brief A Generator which never yields the same candidate twice.
 *
 * Draws from the wrapped generator until an unseen candidate comes up.
 * Copies of a Diversify share the record of seen candidates; reset() clears
 * it.
 *
 * Requires `operator<` on \b Candidate. */
template<class Candidate, class Fitness>
class Diversify {
  Generator<Candidate, Fitness> inner;
  size_t maxAttempts;
  std::shared_ptr<std::set<Candidate>> seen;

public:
  /** \param generator the generator to draw from.
   * \param maxAttempts the number of draws after which operator()() gives
   * up. */
  explicit Diversify(Generator<Candidate, Fitness> generator,
      size_t maxAttempts = 1000):
    inner(std::move(generator)), maxAttempts(maxAttempts),
    seen(std::make_shared<std::set<Candidate>>()) { }

  /** \throws std::runtime_error if no unseen candidate was produced in
   * \b maxAttempts draws. */
  Candidate operator()(Random& rng, Args<Candidate, Fitness>& args) {
    for(size_t i = 0; i < maxAttempts; i++) {
      Candidate c = inner(rng, args);
      if(seen->insert(c).second)
        return c;
    }
    throw std::runtime_error("operator()(): No new candidate found.");
  }

  /** \brief Registers candidates (e.g. seeds) as seen. */
  void add(const std::vector<Candidate>& candidates) {
    seen->insert(candidates.begin(), candidates.end());
  }

  void reset() {
    seen->clear();
  }
}; // class Diversify<Candidate, Fitness>

} // namespace evo
