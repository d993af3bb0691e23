namespace evo {

/** \brief Leaves the archive unchanged. */
template<class Candidate, class Fitness = double>
class DefaultArchiver: public Archiver<Candidate, Fitness> {
public:
  std::string name() const override {
    return "default_archiver";
  }

  Population<Candidate, Fitness> archive(Random&,
      const Population<Candidate, Fitness>&,
      Population<Candidate, Fitness> archive,
      Args<Candidate, Fitness>&) override {
    return archive;
  }
}; // class DefaultArchiver<Candidate, Fitness>


/** \brief Replaces the archive by a copy of the current population. */
template<class Candidate, class Fitness = double>
class PopulationArchiver: public Archiver<Candidate, Fitness> {
public:
  std::string name() const override {
    return "population_archiver";
  }

  Population<Candidate, Fitness> archive(Random&,
      const Population<Candidate, Fitness>& population,
      Population<Candidate, Fitness>,
      Args<Candidate, Fitness>&) override {
    return population;
  }
}; // class PopulationArchiver<Candidate, Fitness>


/** \brief Keeps every individual not dominated by any other seen so far.
 *
 * An individual enters the archive unless it is dominated by a member or a
 * member has the same candidate; members it dominates are removed. The size
 * of the archive is unbounded. */
template<class Candidate, class Fitness = double>
class BestArchiver: public Archiver<Candidate, Fitness> {
public:
  std::string name() const override {
    return "best_archiver";
  }

  NOINLINE Population<Candidate, Fitness> archive(Random&,
      const Population<Candidate, Fitness>& population,
      Population<Candidate, Fitness> archive,
      Args<Candidate, Fitness>&) override {
    for(auto& ind : population) {
      bool admit = true;
      std::vector<size_t> dominated{};
      for(size_t i = 0; i < archive.size(); i++) {
        const auto& a = archive[i];
        if(ind.candidate() == a.candidate()) {
          admit = false;
          break;
        } else if(ind < a)
          admit = false;
        else if(ind > a)
          dominated.push_back(i);
      }
      if(!admit)
        continue;
      for(auto it = dominated.rbegin(); it != dominated.rend(); ++it)
        archive.remove(*it);
      archive.add(ind);
    }
    return archive;
  }
}; // class BestArchiver<Candidate, Fitness>

} // namespace evo
