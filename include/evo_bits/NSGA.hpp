namespace evo {

/** \brief Computes the crowding distance of the members of a front.
 *
 * For each objective the front is ordered by that objective; the two
 * extreme members get an infinite distance and each interior member
 * accumulates the gap between its two neighbours, normalized by the range of
 * the objective over the front. An objective on which all members agree
 * contributes nothing to the interior members.
 *
 * \param pool the population the front is taken from.
 * \param front indices of the members of the front in \b pool.
 * \returns the distances, in the order of \b front. */
template<class Candidate, class Fitness>
NOINLINE std::vector<double> crowdingDistance(
    const Population<Candidate, Fitness>& pool,
    const std::vector<size_t>& front) {
  static_assert(Individual<Candidate, Fitness>::Traits::is_multi,
      "crowdingDistance() needs a multi-objective fitness type!");
  size_t sz = front.size();
  std::vector<double> dist(sz, 0);
  if(sz == 0)
    return dist;
  const double inf = std::numeric_limits<double>::infinity();
  size_t numObj = pool[front[0]].fitness().size();
  std::vector<size_t> order(sz);
  for(size_t m = 0; m < numObj; m++) {
    auto obj = [&](size_t k) -> double { return pool[front[k]].fitness()[m]; };
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(),
        [&](size_t a, size_t b) { return obj(a) < obj(b); });
    dist[order.front()] = inf;
    dist[order.back()] = inf;
    double range = obj(order.back()) - obj(order.front());
    if(range <= 0)
      continue;
    for(size_t k = 1; k + 1 < sz; k++)
      dist[order[k]] += (obj(order[k+1]) - obj(order[k-1])) / range;
  }
  return dist;
}


/** \brief NSGA-II replacement: nondominated sorting of the population and
 * the offspring together, with crowding distance deciding on the last front
 * that fits only partially.
 *
 * Whole fronts are admitted in order of rank while they fit. Of the front
 * that does not fit, the most isolated members (largest crowding distance)
 * are admitted first; members equal to an already admitted individual come
 * last. Ties keep the pool order (population before offspring). The result
 * has the size of the population if the pool is large enough. */
template<class Candidate, class Fitness = Pareto>
class NSGAReplacement: public Replacer<Candidate, Fitness> {
  bool parallel;

public:
  /** \param parallel controls parallelization of the sorting using OpenMP
   * (on by default) */
  explicit NSGAReplacement(bool parallel = true): parallel(parallel) { }

  std::string name() const override {
    return "nsga_replacement";
  }

  NOINLINE Population<Candidate, Fitness> replace(Random&,
      Population<Candidate, Fitness> population,
      const Population<Candidate, Fitness>&,
      Population<Candidate, Fitness> offspring,
      Args<Candidate, Fitness>&) override {
    size_t target = population.size();
    Population<Candidate, Fitness> pool(std::move(population));
    pool.add(std::move(offspring));
    Population<Candidate, Fitness> survivors(target);
    for(auto& front : pool.fronts(parallel)) {
      if(survivors.size() == target)
        break;
      if(survivors.size() + front.size() <= target) {
        for(auto i : front)
          survivors.add(pool[i]);
        continue;
      }
      auto dist = crowdingDistance(pool, front);
      std::vector<size_t> order(front.size());
      std::iota(order.begin(), order.end(), 0);
      std::stable_sort(order.begin(), order.end(),
          [&](size_t a, size_t b) { return dist[a] > dist[b]; });
      std::vector<size_t> deferred{};
      for(auto k : order) {
        if(survivors.size() == target)
          break;
        const auto& ind = pool[front[k]];
        if(survivors.contains(ind))
          deferred.push_back(k);
        else
          survivors.add(ind);
      }
      for(auto k : deferred) {
        if(survivors.size() == target)
          break;
        survivors.add(pool[front[k]]);
      }
    }
    return survivors;
  }
}; // class NSGAReplacement<Candidate, Fitness>

} // namespace evo
