namespace evo {

/* Internal functions only to be used from other sources in this directory. */
namespace internal {

  /* Helper for enabling functions dependent on multi-objective fitness */

  template<typename F>
  constexpr auto indexable(int) ->
    typename std::enable_if<
      std::is_convertible<
        decltype(std::declval<const F&>()[0]), double
      >::value &&
      std::is_integral<
        decltype(std::declval<const F&>().size())
      >::value, bool
    >::type { return true; }

  template<typename>
  constexpr bool indexable(...) { return false; }


  /* Helper for Population::add(const Container&) */

  template<class C>
  constexpr auto is_container(int) ->
    typename std::enable_if<
      std::is_same<
        decltype(std::declval<C>().begin()),
        decltype(std::declval<C>().end())
      >::value, bool
    >::type { return true; }

  template<class>
  constexpr bool is_container(...) { return false; }


  /* A uniform deviate from [0, 1). */

  template<class Rng>
  double uniform(Rng& rng) {
    return std::uniform_real_distribution<double>{0, 1}(rng);
  }

  /* A uniform index from [0, sz). sz must be positive. */

  template<class Rng>
  size_t index(size_t sz, Rng& rng) {
    return std::uniform_int_distribution<size_t>{0, sz - 1}(rng);
  }

  /* k distinct indices from [0, sz), in random order. If k >= sz, all of
   * them. */

  template<class Rng>
  std::vector<size_t> sample(size_t sz, size_t k, Rng& rng) {
    if(k > sz)
      k = sz;
    std::vector<size_t> idx(sz);
    /* Fisher-Yates intentionally without initialization! */
    for(size_t i = 0; i < k; i++) {
      size_t d = index(sz - i, rng), j = i+d;
      std::swap(idx[i], idx[j]);
      idx[j] -= d;
      idx[i] += i + d;
    }
    idx.resize(k);
    return idx;
  }

  /* Euclidean distance between two numeric sequences of the same length. */

  template<class Sequence>
  double distance(const Sequence& a, const Sequence& b) {
    double sum = 0;
    size_t sz = std::min(a.size(), b.size());
    for(size_t i = 0; i < sz; i++) {
      double d = static_cast<double>(a[i]) - static_cast<double>(b[i]);
      sum += d*d;
    }
    return std::sqrt(sum);
  }

  /* Collects the first exception thrown in an OpenMP region so it can be
   * rethrown on the calling thread after the region ends. */

  class exception_trap {
    std::exception_ptr ptr{};
    std::mutex mtx{};

  public:
    template<class Fn>
    void run(Fn fn) {
      try {
        fn();
      } catch(...) {
        std::lock_guard<std::mutex> lock{mtx};
        if(!ptr)
          ptr = std::current_exception();
      }
    }

    void rethrow() {
      if(ptr)
        std::rethrow_exception(ptr);
    }
  }; // class exception_trap

} // namespace internal

} // namespace evo
