namespace evo {

/** \brief The grid location of a point outside the current grid bounds.
 *
 * Such a point belongs to no cell; its occupancy is reported as zero. */
constexpr long gridOutOfRange = -1;

/** \brief The Pareto archiver of PAES: a bounded archive of nondominated
 * individuals kept diverse by an adaptive grid over the objective space.
 *
 * Each time an individual is considered, the bounds of the grid are set to
 * the per-objective extremes of the archive and the individual, widened by
 * 20% of their magnitude, and every archive member and the individual are
 * counted in the cells of the grid. The grid bisects every objective
 * \b numGridDivisions times, so it has <b>2^(M·numGridDivisions)</b> cells
 * for \b M objectives. Then:
 * - an individual dominated by or equal to a member is rejected,
 * - an individual dominating some members replaces all of them,
 * - otherwise it is added if the archive has room (\b maxArchiveSize,
 *   default: the size of the first nonempty population archived),
 * - or else it replaces the member in the most crowded cell if that cell is
 *   more crowded than the individual's own, and is rejected if not.
 *
 * The grid and the capacity are state of this object: reset() clears them
 * and the engine calls it at the start of every run. */
template<class Candidate, class Fitness = Pareto>
class AdaptiveGridArchiver: public Archiver<Candidate, Fitness> {
  static_assert(Individual<Candidate, Fitness>::Traits::is_multi,
      "AdaptiveGridArchiver needs a multi-objective fitness type!");

  std::map<long, size_t> gridPopulation{};
  std::vector<double> globalSmallest{};
  std::vector<double> globalLargest{};
  size_t divisions = 1;
  Maybe<size_t> maxSize{};

public:
  std::string name() const override {
    return "adaptive_grid_archiver";
  }

  void reset() override {
    gridPopulation.clear();
    globalSmallest.clear();
    globalLargest.clear();
    divisions = 1;
    maxSize.reset();
  }

  Population<Candidate, Fitness> archive(Random&,
      const Population<Candidate, Fitness>& population,
      Population<Candidate, Fitness> archive,
      Args<Candidate, Fitness>& args) override {
    if(!maxSize && (args.config.maxArchiveSize || !population.empty()))
      maxSize = args.config.maxArchiveSize.valueOr(population.size());
    divisions = args.config.numGridDivisions;
    for(auto& ind : population)
      insert(ind, archive);
    return archive;
  }

  /** \brief Considers one individual for the archive. Returns \b true if it
   * was admitted. */
  NOINLINE bool insert(const Individual<Candidate, Fitness>& ind,
      Population<Candidate, Fitness>& archive) {
    updateGrid(ind, archive);
    for(auto& a : archive)
      if(a == ind || ind < a)
        return false;
    bool dominates = false;
    for(size_t i = archive.size(); i-- > 0; )
      if(archive[i] < ind) {
        archive.remove(i);
        dominates = true;
      }
    if(dominates || archive.empty() || archive.size() < maxSize.valueOr(std::numeric_limits<size_t>::max())) {
      archive.add(ind);
      return true;
    }
    size_t most = occupancy(gridLocation(ind.fitness()));
    bool found = false;
    size_t evict = 0;
    for(size_t i = 0; i < archive.size(); i++) {
      size_t count = occupancy(gridLocation(archive[i].fitness()));
      if(count > most) {
        most = count;
        evict = i;
        found = true;
      }
    }
    if(!found)
      return false;
    archive.remove(evict);
    archive.add(ind);
    return true;
  }

  /** \brief Recomputes the grid bounds from \b archive and \b ind and
   * recounts the cell occupancy.
   *
   * \throws std::invalid_argument if the number of cells is not
   * addressable. */
  NOINLINE void updateGrid(const Individual<Candidate, Fitness>& ind,
      const Population<Candidate, Fitness>& archive) {
    const Fitness& f = ind.fitness();
    size_t numObj = f.size();
    if(numObj * divisions >= 8 * sizeof(long) - 1)
      throw std::invalid_argument("updateGrid(): Too many grid cells.");
    globalSmallest.assign(numObj, 0);
    globalLargest.assign(numObj, 0);
    for(size_t i = 0; i < numObj; i++)
      globalSmallest[i] = globalLargest[i] = f[i];
    for(auto& a : archive)
      for(size_t i = 0; i < numObj; i++) {
        globalSmallest[i] = std::min(globalSmallest[i], static_cast<double>(a.fitness()[i]));
        globalLargest[i] = std::max(globalLargest[i], static_cast<double>(a.fitness()[i]));
      }
    for(size_t i = 0; i < numObj; i++) {
      globalSmallest[i] -= std::abs(0.2 * globalSmallest[i]);
      globalLargest[i] += std::abs(0.2 * globalLargest[i]);
    }
    gridPopulation.clear();
    for(auto& a : archive)
      count(gridLocation(a.fitness()));
    count(gridLocation(f));
  }

  /** \brief Returns the index of the cell containing \b fitness within the
   * current bounds, or #gridOutOfRange.
   *
   * In each round of bisection, every objective contributes one bit: set if
   * the value lies in the lower half of the remaining interval.
   *
   * \throws std::invalid_argument if the number of objectives does not match
   * the grid. */
  long gridLocation(const Fitness& fitness) const {
    size_t numObj = fitness.size();
    if(numObj != globalSmallest.size())
      throw std::invalid_argument("gridLocation(): Number of objectives does not match the grid.");
    std::vector<double> width(numObj), local(numObj);
    std::vector<long> inc(numObj);
    for(size_t i = 0; i < numObj; i++) {
      inc[i] = 1L << i;
      width[i] = globalLargest[i] - globalSmallest[i];
      local[i] = globalSmallest[i];
      if(fitness[i] < globalSmallest[i] || fitness[i] > globalLargest[i])
        return gridOutOfRange;
    }
    long loc = 0;
    for(size_t d = 0; d < divisions; d++) {
      for(size_t i = 0; i < numObj; i++) {
        if(fitness[i] < local[i] + width[i] / 2)
          loc += inc[i];
        else
          local[i] += width[i] / 2;
      }
      for(size_t i = 0; i < numObj; i++) {
        inc[i] <<= numObj;
        width[i] /= 2;
      }
    }
    return loc;
  }

  /** \brief The number of individuals counted in cell \b location at the
   * last update. Zero for #gridOutOfRange. */
  size_t occupancy(long location) const {
    auto it = gridPopulation.find(location);
    return it != gridPopulation.end() ? it->second : 0;
  }

private:
  void count(long location) {
    if(location != gridOutOfRange)
      gridPopulation[location]++;
  }
}; // class AdaptiveGridArchiver<Candidate, Fitness>


/** \brief The (1+1) replacement of PAES, maintaining the archive together
 * with an AdaptiveGridArchiver.
 *
 * Each offspring is compared with the population member at the same
 * position (its parent):
 * - an offspring equal to its parent leaves the parent in place,
 * - an offspring equal to an archive member replaces the parent,
 * - an offspring dominating its parent is archived and replaces the parent,
 * - an offspring dominated by its parent is discarded,
 * - otherwise it is discarded if an archive member dominates it; if not, it
 *   is offered to the archive and replaces the parent if it dominates an
 *   archive member, if the parent lies outside the grid, or if its grid cell
 *   is no more crowded than the parent's.
 *
 * Population members without a matching offspring are kept. */
template<class Candidate, class Fitness = Pareto>
class PAESReplacement: public Replacer<Candidate, Fitness> {
  std::shared_ptr<AdaptiveGridArchiver<Candidate, Fitness>> grid;

public:
  /** \param archiver the archiver the engine uses. */
  explicit PAESReplacement(
      std::shared_ptr<AdaptiveGridArchiver<Candidate, Fitness>> archiver):
      grid(std::move(archiver)) {
    if(!grid)
      throw std::invalid_argument("PAESReplacement(): Archiver is null.");
  }

  std::string name() const override {
    return "paes_replacement";
  }

  NOINLINE Population<Candidate, Fitness> replace(Random&,
      Population<Candidate, Fitness> population,
      const Population<Candidate, Fitness>&,
      Population<Candidate, Fitness> offspring,
      Args<Candidate, Fitness>& args) override {
    Population<Candidate, Fitness>& archive = args.archive;
    size_t count = std::min(population.size(), offspring.size());
    for(size_t k = 0; k < count; k++) {
      const auto& p = population[k];
      const auto& o = offspring[k];
      if(o == p)
        continue;
      if(archive.contains(o))
        population.replace(k, o);
      else if(o > p) {
        grid->insert(o, archive);
        population.replace(k, o);
      } else if(o < p)
        continue;
      else if(accept(o, p, archive))
        population.replace(k, o);
    }
    return population;
  }

private:
  bool accept(const Individual<Candidate, Fitness>& o,
      const Individual<Candidate, Fitness>& p,
      Population<Candidate, Fitness>& archive) {
    bool dominates = false;
    for(auto& a : archive) {
      if(o < a)
        return false;
      if(o > a)
        dominates = true;
    }
    grid->insert(o, archive);
    if(dominates)
      return true;
    // a parent outside the grid has no cell to compare with
    long parentLoc = grid->gridLocation(p.fitness());
    if(parentLoc == gridOutOfRange)
      return true;
    return grid->occupancy(grid->gridLocation(o.fitness()))
      <= grid->occupancy(parentLoc);
  }
}; // class PAESReplacement<Candidate, Fitness>

} // namespace evo
