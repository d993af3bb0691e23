namespace evo {

/** \brief A value that may be absent.
 *
 * Used for evaluator results (an absent fitness excludes the candidate from
 * the run) and for Config parameters whose default is only known at run
 * time. */
template<typename T>
class Maybe {
  T _value{};
  bool valid = false;

public:
  /** \brief Creates an absent value. */
  Maybe() = default;

  /** \brief Creates a present value. */
  Maybe(T value): _value(std::move(value)), valid(true) { }

  /** \brief Returns \b true if a value is present. */
  bool isSet() const {
    return valid;
  }

  explicit operator bool() const {
    return valid;
  }

  /** \brief Returns the value.
   *
   * \throws std::logic_error if the value is absent. */
  const T& value() const {
    if(!valid)
      throw std::logic_error("value(): Value is not set.");
    return _value;
  }

  /** \brief Returns the value if present, \b def otherwise. */
  T valueOr(const T& def) const {
    return valid ? _value : def;
  }

  /** \brief Makes the value absent. */
  void reset() {
    _value = T{};
    valid = false;
  }

  friend bool operator== (const Maybe& a, const Maybe& b) {
    return a.valid == b.valid && (!a.valid || a._value == b._value);
  }

  friend bool operator!= (const Maybe& a, const Maybe& b) {
    return !(a == b);
  }
}; // class Maybe<T>

} // namespace evo
