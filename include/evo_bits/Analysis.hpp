namespace evo {

namespace internal {

using HvPoint = std::vector<double>;
using HvFront = std::vector<HvPoint>;

/* p is not worse than q in objectives k and above (all maximized) */
inline bool hvCovers(const HvPoint& p, const HvPoint& q, size_t k) {
  for(; k < p.size(); k++)
    if(q[k] > p[k])
      return false;
  return true;
}

/* Inserts p into pl, which is sorted by objective k in descending order,
 * dropping the members p covers. */
inline HvFront hvInsert(const HvPoint& p, size_t k, const HvFront& pl) {
  HvFront ql{};
  size_t i = 0;
  while(i < pl.size() && pl[i][k] > p[k])
    ql.push_back(pl[i++]);
  ql.push_back(p);
  for(; i < pl.size(); i++)
    if(!hvCovers(p, pl[i], k))
      ql.push_back(pl[i]);
  return ql;
}

/* Cuts pl (sorted by objective k, descending) into slabs perpendicular to
 * objective k. Each slab is its depth and the points spanning it, sorted by
 * objective k+1. */
inline std::vector<std::pair<double, HvFront>> hvSlice(const HvFront& pl,
    size_t k, const HvPoint& ref) {
  std::vector<std::pair<double, HvFront>> ret{};
  HvFront ql{};
  HvPoint p = pl[0];
  for(size_t i = 1; i < pl.size(); i++) {
    ql = hvInsert(p, k + 1, ql);
    ret.emplace_back(std::abs(p[k] - pl[i][k]), ql);
    p = pl[i];
  }
  ql = hvInsert(p, k + 1, ql);
  ret.emplace_back(std::abs(p[k] - ref[k]), ql);
  return ret;
}

} // namespace internal


/** \brief Computes the hypervolume (S-metric) of a set of objective vectors.
 *
 * Uses the Hypervolume by Slicing Objectives algorithm (While et al., IEEE
 * CEC 2005). All objectives are taken as maximized and \b ref should be
 * dominated by every point. Dominated points in \b points do not change the
 * result.
 *
 * \throws std::invalid_argument if a point or \b ref has a different number
 * of objectives than the first point. */
inline double hypervolume(std::vector<std::vector<double>> points,
    const std::vector<double>& ref) {
  if(points.empty())
    return 0;
  size_t n = points[0].size();
  if(ref.size() != n)
    throw std::invalid_argument("hypervolume(): Reference point has a wrong number of objectives.");
  for(auto& p : points)
    if(p.size() != n)
      throw std::invalid_argument("hypervolume(): Points differ in number of objectives.");
  if(n == 0)
    return 0;
  std::stable_sort(points.begin(), points.end(),
      [](const std::vector<double>& a, const std::vector<double>& b) { return a[0] > b[0]; });
  std::vector<std::pair<double, internal::HvFront>> slabs{};
  slabs.emplace_back(1.0, std::move(points));
  for(size_t k = 0; k + 1 < n; k++) {
    std::vector<std::pair<double, internal::HvFront>> next{};
    for(auto& s : slabs)
      for(auto& t : internal::hvSlice(s.second, k, ref))
        next.emplace_back(s.first * t.first, std::move(t.second));
    slabs = std::move(next);
  }
  double vol = 0;
  for(auto& s : slabs)
    vol += s.first * std::abs(s.second[0][n - 1] - ref[n - 1]);
  return vol;
}

/** \brief Computes the hypervolume of the fitness values of a population,
 * e.g., the archive of a multi-objective run, relative to \b ref.
 *
 * The polarity of each objective is taken from the first member (its Pareto
 * flags combined with its \b maximize flag); minimized objectives are
 * negated together with \b ref, so \b ref has to be worse than every member
 * in every objective. Members with an unset fitness are skipped.
 *
 * \throws std::invalid_argument if the numbers of objectives differ. */
template<class Candidate>
NOINLINE double hypervolume(const Population<Candidate, Pareto>& population,
    const std::vector<double>& ref) {
  std::vector<std::vector<double>> points{};
  std::vector<char> maximized{};
  for(auto& ind : population) {
    if(!ind.hasFitness())
      continue;
    const Pareto& f = ind.fitness();
    if(f.size() != ref.size())
      throw std::invalid_argument("hypervolume(): Reference point has a wrong number of objectives.");
    if(maximized.empty())
      for(size_t i = 0; i < f.size(); i++)
        maximized.push_back(f.maximize(i) == ind.maximize());
    std::vector<double> p(f.values());
    for(size_t i = 0; i < p.size(); i++)
      if(!maximized[i])
        p[i] = -p[i];
    points.push_back(std::move(p));
  }
  std::vector<double> r(ref);
  for(size_t i = 0; i < maximized.size(); i++)
    if(!maximized[i])
      r[i] = -r[i];
  return hypervolume(std::move(points), r);
}

} // namespace evo
