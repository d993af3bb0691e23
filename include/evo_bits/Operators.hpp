namespace evo {

/** \brief The common base of all operators.
 *
 * An operator may keep state between calls within a run. The engine calls
 * reset() on every operator it holds at the start of each run. */
template<class Candidate, class Fitness>
class Operator {
public:
  virtual ~Operator() { }

  /** \brief A short identifier used in logs and as the termination cause. */
  virtual std::string name() const = 0;

  /** \brief Forgets any state carried over from a previous run. */
  virtual void reset() { }
}; // class Operator<Candidate, Fitness>

/** \brief Chooses the parents of a generation. */
template<class Candidate, class Fitness>
class Selector: public Operator<Candidate, Fitness> {
public:
  virtual Population<Candidate, Fitness> select(Random& rng,
      const Population<Candidate, Fitness>& population,
      Args<Candidate, Fitness>& args) = 0;
}; // class Selector<Candidate, Fitness>

/** \brief Turns a list of candidates into another list of candidates.
 *
 * The engine chains variators: the output of each one is the input of the
 * next. The length of the list may change. */
template<class Candidate, class Fitness>
class Variator: public Operator<Candidate, Fitness> {
public:
  virtual std::vector<Candidate> vary(Random& rng,
      std::vector<Candidate> candidates,
      Args<Candidate, Fitness>& args) = 0;
}; // class Variator<Candidate, Fitness>

/** \brief Decides which individuals form the next population. */
template<class Candidate, class Fitness>
class Replacer: public Operator<Candidate, Fitness> {
public:
  virtual Population<Candidate, Fitness> replace(Random& rng,
      Population<Candidate, Fitness> population,
      const Population<Candidate, Fitness>& parents,
      Population<Candidate, Fitness> offspring,
      Args<Candidate, Fitness>& args) = 0;
}; // class Replacer<Candidate, Fitness>

/** \brief Exchanges individuals with other runs. */
template<class Candidate, class Fitness>
class Migrator: public Operator<Candidate, Fitness> {
public:
  virtual Population<Candidate, Fitness> migrate(Random& rng,
      Population<Candidate, Fitness> population,
      Args<Candidate, Fitness>& args) = 0;
}; // class Migrator<Candidate, Fitness>

/** \brief Maintains the archive from the current population. */
template<class Candidate, class Fitness>
class Archiver: public Operator<Candidate, Fitness> {
public:
  virtual Population<Candidate, Fitness> archive(Random& rng,
      const Population<Candidate, Fitness>& population,
      Population<Candidate, Fitness> archive,
      Args<Candidate, Fitness>& args) = 0;
}; // class Archiver<Candidate, Fitness>

/** \brief Decides whether the run should stop. */
template<class Candidate, class Fitness>
class Terminator: public Operator<Candidate, Fitness> {
public:
  virtual bool terminate(const Population<Candidate, Fitness>& population,
      size_t numGenerations, size_t numEvaluations,
      Args<Candidate, Fitness>& args) = 0;
}; // class Terminator<Candidate, Fitness>

/** \brief Reports on the progress of a run. */
template<class Candidate, class Fitness>
class Observer: public Operator<Candidate, Fitness> {
public:
  virtual void observe(const Population<Candidate, Fitness>& population,
      size_t numGenerations, size_t numEvaluations,
      Args<Candidate, Fitness>& args) = 0;
}; // class Observer<Candidate, Fitness>

} // namespace evo
