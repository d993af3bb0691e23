namespace evo {

/** \brief A candidate solution together with its fitness.
 *
 * Takes a \b Candidate type, which is opaque to the engine, and a \b Fitness
 * type which can be a simple arithmetic type or evo::Pareto (any class with a
 * strict weak or partial ordering given by `operator<` will do).
 *
 * The fitness is unset at construction unless given explicitly and it can
 * only be set, never computed here: the evaluator of the engine takes care of
 * that for a whole batch of candidates at once.
 *
 * The comparison operators are oriented so that "greater" always means
 * "more desirable": if \b maximize is \b false, the order of the fitness type
 * is inverted. Comparing an individual whose fitness has not been set throws.
 * Equality compares the candidate, the fitness and the polarity. */
template<class Candidate, class Fitness = double>
class Individual {
  Candidate _candidate{};
  Fitness _fitness{};
  bool fitnessValid = false;
  bool _maximize = true;
  double _birthdate = now();

  static double now() {
    return std::chrono::duration<double>(
        std::chrono::system_clock::now().time_since_epoch()).count();
  }

  static void check(const Individual& a, const Individual& b, const char* fn) {
    if(!a.fitnessValid || !b.fitnessValid)
      throw std::logic_error(std::string(fn) + "(): Individual fitness is not set.");
  }

public:
  /** \brief The `Candidate` type provided for this template specialization. */
  typedef Candidate _CandidateType;
  /** \brief The `Fitness` type provided for this template specialization. */
  typedef Fitness _FitnessType;

  /** \brief Compile-time facts about the `Fitness` type. */
  struct Traits {
    /** \brief Whether fitness is convertible to \b double. */
    static constexpr bool is_float = std::is_convertible<Fitness, double>::value;
    /** \brief Whether fitness is a sequence of objectives, like evo::Pareto. */
    static constexpr bool is_multi = internal::indexable<Fitness>(0);
  };

  /** \brief Creates an individual with an unset fitness. */
  explicit Individual(Candidate candidate = Candidate{}, bool maximize = true):
    _candidate(std::move(candidate)), _maximize(maximize) { }

  /** \brief Creates an individual with a known fitness. */
  Individual(Candidate candidate, Fitness fitness, bool maximize = true):
    _candidate(std::move(candidate)), _fitness(std::move(fitness)),
    fitnessValid(true), _maximize(maximize) { }

  const Candidate& candidate() const {
    return _candidate;
  }

  /** \brief Replaces the candidate. The fitness becomes unset. */
  void setCandidate(Candidate candidate) {
    _candidate = std::move(candidate);
    clearFitness();
  }

  bool hasFitness() const {
    return fitnessValid;
  }

  /** \brief Returns the fitness.
   *
   * \throws std::logic_error if it has not been set. */
  const Fitness& fitness() const {
    if(!fitnessValid)
      throw std::logic_error("fitness(): Individual fitness is not set.");
    return _fitness;
  }

  void setFitness(Fitness fitness) {
    _fitness = std::move(fitness);
    fitnessValid = true;
  }

  void clearFitness() {
    _fitness = Fitness{};
    fitnessValid = false;
  }

  bool maximize() const {
    return _maximize;
  }

  /** \brief Time of creation in seconds since the epoch. */
  double birthdate() const {
    return _birthdate;
  }

  /** \brief Returns \b true if \b a is less desirable than \b b.
   *
   * \throws std::logic_error if either fitness is unset. */
  friend bool operator< (const Individual& a, const Individual& b) {
    check(a, b, "operator<");
    return a._maximize ? a._fitness < b._fitness : b._fitness < a._fitness;
  }

  friend bool operator> (const Individual& a, const Individual& b) {
    return b < a;
  }

  friend bool operator<= (const Individual& a, const Individual& b) {
    return a < b || !(b < a);
  }

  friend bool operator>= (const Individual& a, const Individual& b) {
    return b < a || !(a < b);
  }

  friend bool operator== (const Individual& a, const Individual& b) {
    return a._candidate == b._candidate
      && a.fitnessValid == b.fitnessValid
      && (!a.fitnessValid || a._fitness == b._fitness)
      && a._maximize == b._maximize;
  }

  friend bool operator!= (const Individual& a, const Individual& b) {
    return !(a == b);
  }
}; // class Individual<Candidate, Fitness>

} // namespace evo
