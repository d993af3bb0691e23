namespace evo {

/** \brief A multi-objective fitness value.
 *
 * Holds a sequence of objective values and a maximize flag for each of them.
 * The comparison operators implement Pareto dominance:
 * <b>a < b</b> means that \b a is dominated by \b b, i.e., \b b is not worse
 * than \b a in any objective and strictly better in at least one. The
 * per-objective polarity of the left-hand operand is used. Equality compares
 * the values only.
 *
 * This is a strict partial order: two different values may be neither
 * smaller nor greater than each other. */
class Pareto {
  std::vector<double> _values{};
  std::vector<bool> _maximize{};

public:
  /** \brief Creates an empty value with no objectives. */
  Pareto() = default;

  /** \brief Creates a value with one polarity shared by all objectives. */
  explicit Pareto(std::vector<double> values, bool maximize = true):
    _values(std::move(values)), _maximize(_values.size(), maximize) { }

  /** \brief Creates a value with a polarity for each objective.
   *
   * \throws std::invalid_argument if the lengths differ. */
  Pareto(std::vector<double> values, std::vector<bool> maximize):
      _values(std::move(values)), _maximize(std::move(maximize)) {
    if(_values.size() != _maximize.size())
      throw std::invalid_argument("Pareto(): Values and maximize flags differ in length.");
  }

  /** \brief The number of objectives. */
  size_t size() const {
    return _values.size();
  }

  /** \brief The value of objective \b i (no bounds checking). */
  double operator[](size_t i) const {
    return _values[i];
  }

  const std::vector<double>& values() const {
    return _values;
  }

  /** \brief Whether objective \b i is to be maximized. */
  bool maximize(size_t i) const {
    return _maximize[i];
  }

  /** \brief Returns \b true if this value dominates \b other. */
  bool dominates(const Pareto& other) const {
    return other < *this;
  }

  /** \brief Returns \b true if \b a is dominated by \b b.
   *
   * \throws std::invalid_argument if the numbers of objectives differ. */
  friend bool operator< (const Pareto& a, const Pareto& b) {
    if(a.size() != b.size())
      throw std::invalid_argument("operator<(): Pareto values differ in number of objectives.");
    bool notWorse = true, strictlyBetter = false;
    for(size_t i = 0; i < a.size(); i++) {
      double x = a._values[i], y = b._values[i];
      if(!a._maximize[i])
        std::swap(x, y);
      if(x > y)
        notWorse = false;
      else if(y > x)
        strictlyBetter = true;
    }
    return notWorse && strictlyBetter;
  }

  friend bool operator> (const Pareto& a, const Pareto& b) {
    return b < a;
  }

  /** \brief Returns \b true unless \b a dominates \b b. Mutually
   * nondominated values compare as both <= and >=. */
  friend bool operator<= (const Pareto& a, const Pareto& b) {
    return !(b < a);
  }

  friend bool operator>= (const Pareto& a, const Pareto& b) {
    return !(a < b);
  }

  friend bool operator== (const Pareto& a, const Pareto& b) {
    return a._values == b._values;
  }

  friend bool operator!= (const Pareto& a, const Pareto& b) {
    return !(a == b);
  }

  friend std::ostream& operator<< (std::ostream& os, const Pareto& p) {
    os << '(';
    for(size_t i = 0; i < p.size(); i++)
      os << (i ? ", " : "") << p[i];
    return os << ')';
  }
}; // class Pareto

} // namespace evo
