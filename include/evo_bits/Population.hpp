namespace evo {

/** \brief An ordered collection of Individual objects.
 *
 * A thin layer over \b std::vector providing the selection, ordering and
 * dominance primitives the operators are built from. Elements can only be
 * accessed read-only; modifications go through add(), replace() and
 * remove(), or through whole-population operations like sort() and
 * rankTrim().
 *
 * Functions relying on the ordering of individuals throw if any fitness in
 * the population is unset. The engine never puts such individuals in a
 * population.
 *
 * \tparam Candidate the candidate type, see Individual.
 * \tparam Fitness the fitness type, see Individual. */
template<class Candidate, class Fitness = double>
#ifndef DOXYGEN
class Population: protected std::vector<Individual<Candidate, Fitness>> {
#else
class Population {
#endif

  using Base = std::vector<Individual<Candidate, Fitness>>;

public:

  /** \brief The type of the members of this population. */
  using value_type = Individual<Candidate, Fitness>;
  using const_iterator = typename Base::const_iterator;

  /** \brief Creates an empty population. */
  Population() = default;

  /** \brief Creates an empty population but preallocates space for \b count
   * individuals. */
  explicit Population(size_t count) {
    Base::reserve(count);
  }

  /** \brief Initializes this population from an iterator range. */
  template<class InputIt>
  Population(InputIt first, InputIt last): Base(first, last) { }

  Population(std::initializer_list<value_type> list): Base(list) { }

#ifdef DOXYGEN
  /** \brief Returns the current count of individuals. */
  size_t size() const;
  /** \brief Returns \b true if the population has no members. */
  bool empty() const;
  /** \brief Empties the population. */
  void clear();
  /** \brief Reserves space for \b count individuals. */
  void reserve(size_t count);
#else
  using Base::size;
  using Base::empty;
  using Base::clear;
  using Base::reserve;
#endif

  const_iterator begin() const {
    return Base::begin();
  }

  const_iterator end() const {
    return Base::end();
  }

  /** \brief Read-only access to a specified element by reference
   * (no bounds checking). */
  const value_type& operator[](size_t pos) const {
    return Base::operator[](pos);
  }

  /** \brief Read-only access to a specified element by reference
   * (with bounds checking). */
  const value_type& at(size_t pos) const {
    return Base::at(pos);
  }

  /** \brief Adds a new individual. */
  void add(const value_type& ind) {
    Base::push_back(ind);
  }

  /** \brief Pushes back a new individual using the move semantics. */
  void add(value_type&& ind) {
    Base::push_back(std::move(ind));
  }

  /** \brief Copies an iterator range of individuals. */
  template<class InputIt>
  void add(InputIt first, InputIt last) {
    Base::insert(Base::end(), first, last);
  }

  /** \brief Copies all individuals from a container (e.g., a
   * \b std::vector or another Population). */
  template<class Container>
#ifdef DOXYGEN
  void
#else
  typename std::enable_if<internal::is_container<Container>(0), void>::type
#endif
  add(const Container& vec) {
    add(vec.begin(), vec.end());
  }

  /** \brief Moves all individuals from another population, leaving it
   * empty. */
  void add(Population&& pop) {
    Base::insert(Base::end(),
        std::make_move_iterator(pop.Base::begin()),
        std::make_move_iterator(pop.Base::end()));
    pop.clear();
  }

  /** \brief Overwrites the individual at position \b pos.
   *
   * \throws std::out_of_range if \b pos is not a valid position. */
  void replace(size_t pos, value_type ind) {
    Base::at(pos) = std::move(ind);
  }

  /** \brief Removes the individual at position \b pos, keeping the order of
   * the rest.
   *
   * \throws std::out_of_range if \b pos is not a valid position. */
  void remove(size_t pos) {
    if(pos >= size())
      throw std::out_of_range("remove(): Position out of range.");
    Base::erase(Base::begin() + pos);
  }

  /** \brief Returns \b true if an individual equal to \b ind is a member. */
  bool contains(const value_type& ind) const {
    return std::find(begin(), end(), ind) != end();
  }

  /** \brief Returns the candidates of all members, in order. */
  std::vector<Candidate> candidates() const {
    std::vector<Candidate> ret{};
    ret.reserve(size());
    for(auto& ind : *this)
      ret.push_back(ind.candidate());
    return ret;
  }

  /** \brief Returns the most desirable individual. Of several equally good
   * ones the first is returned.
   *
   * \throws std::out_of_range if called on an empty population. */
  const value_type& best() const {
    if(empty())
      throw std::out_of_range("best(): Population is empty.");
    return *std::max_element(begin(), end());
  }

  /** \brief Returns the least desirable individual.
   *
   * \throws std::out_of_range if called on an empty population. */
  const value_type& worst() const {
    if(empty())
      throw std::out_of_range("worst(): Population is empty.");
    return *std::min_element(begin(), end());
  }

  /** \brief Sorts the population, by default from the best to the worst.
   *
   * The sort is stable: individuals which compare neither greater nor
   * smaller keep their relative order. */
  void sort(bool descending = true) {
    if(descending)
      std::stable_sort(Base::begin(), Base::end(),
          [](const value_type& a, const value_type& b) { return b < a; });
    else
      std::stable_sort(Base::begin(), Base::end());
  }

  /** \brief Reduces the population to a maximum size given by the argument,
   * dropping the least desirable individuals. The population is left sorted
   * from the best to the worst. */
  NOINLINE void rankTrim(size_t newSize) {
    sort();
    if(size() > newSize)
      Base::erase(Base::begin() + newSize, Base::end());
  }

  /** \brief Returns a reference to a randomly chosen individual.
   *
   * \throws std::out_of_range if called on an empty population. */
  template<class Rng = Random>
  const value_type& randomSelect(Rng& rng = evo::rng) const {
    if(empty())
      throw std::out_of_range("randomSelect(): Population is empty.");
    return operator[](internal::index(size(), rng));
  }

  /** \brief Randomly selects \b k different members. If <b>k >= size()</b>,
   * returns a copy of the whole population. */
  template<class Rng = Random>
  NOINLINE Population randomSelect(size_t k, Rng& rng = evo::rng) const {
    if(k >= size())
      return *this;
    Population ret(k);
    for(auto i : internal::sample(size(), k, rng))
      ret.add(operator[](i));
    return ret;
  }

  /** \brief Returns the nondominated subset of this population.
   *
   * Returns a new population containing all the individuals which are not
   * dominated by any other member, in their original order.
   *
   * \param parallel controls parallelization using OpenMP (on by default) */
  NOINLINE Population front(bool parallel = true) const {
    size_t sz = size();
    // flag whether [i] has been found to be dominated by something
    std::vector<char> dom(sz, 0);
    internal::exception_trap trap{};
    #pragma omp parallel for if(parallel) schedule(dynamic)
    for(size_t i = 0; i < sz; i++)
      trap.run([&, i]() {
        for(size_t j = 0; j < sz; j++)
          if(operator[](i) < operator[](j)) {
            dom[i] = 1;
            break;
          }
      });
    trap.rethrow();
    Population ret{};
    for(size_t i = 0; i < sz; i++)
      if(!dom[i])
        ret.add(operator[](i));
    return ret;
  }

  /** \brief Partitions the population into nondominated fronts.
   *
   * The first front consists of the members not dominated by any other
   * member, the second of those dominated only by members of the first front,
   * etc. Each front is a list of indices into this population in increasing
   * order.
   *
   * \param parallel controls parallelization using OpenMP (on by default) */
  NOINLINE std::vector<std::vector<size_t>> fronts(bool parallel = true) const {
    size_t sz = size();
    std::vector<size_t> domCnt(sz, 0);         // number of members dominating [i]
    std::vector<std::vector<size_t>> dom(sz);  // members dominated by [i]
    internal::exception_trap trap{};
    #pragma omp parallel for if(parallel) schedule(dynamic)
    for(size_t i = 0; i < sz; i++)
      trap.run([&, i]() {
        for(size_t j = 0; j < sz; j++)
          if(operator[](j) < operator[](i)) {
            dom[i].push_back(j);
            #pragma omp atomic
            domCnt[j]++;
          }
      });
    trap.rethrow();
    std::vector<std::vector<size_t>> ret{};
    std::vector<size_t> cur{};
    for(size_t i = 0; i < sz; i++)
      if(domCnt[i] == 0)
        cur.push_back(i);
    while(!cur.empty()) {
      std::vector<size_t> next{};
      for(auto i : cur)
        for(auto j : dom[i])
          if(--domCnt[j] == 0)
            next.push_back(j);
      std::sort(next.begin(), next.end());
      ret.push_back(std::move(cur));
      cur = std::move(next);
    }
    return ret;
  }

  /** \brief The return type of Population::stat(). */
  struct Stat {
    double best;    ///< The fitness of the most desirable member.
    double worst;   ///< The fitness of the least desirable member.
    double median;  ///< The fitness in the middle of the ranking.
    double mean;    ///< The mean fitness of the population.
    double stdev;   ///< The standard deviation of fitness in the population.
  }; // struct Population<>::Stat

  /** \brief Returns summary statistics of the fitness of the population.
   *
   * Only available for fitness types convertible to \b double.
   *
   * \throws std::out_of_range if called on an empty population. */
  NOINLINE Stat stat() const {
    static_assert(value_type::Traits::is_float,
        "stat() needs a fitness type convertible to double!");
    if(empty())
      throw std::out_of_range("stat(): Population is empty.");
    Population sorted(*this);
    sorted.sort();
    double f, sf = 0, sf2 = 0;
    for(auto& ind : sorted) {
      f = ind.fitness();
      sf += f;
      sf2 += f*f;
    }
    size_t sz = size();
    double dev2 = sf2/sz - sf/sz*sf/sz;
    return {static_cast<double>(sorted[0].fitness()),
            static_cast<double>(sorted[sz - 1].fitness()),
            static_cast<double>(sorted[sz / 2].fitness()),
            sf/sz,
            dev2 >= 0 ? std::sqrt(dev2) : 0};
  }

}; // class Population<Candidate, Fitness>

} // namespace evo
