#include "common.hpp"

#include <set>

TEST_CASE("Population basics", "[population]") {
  auto pop = scalars({3, 1, 2});

  SECTION("add, replace and remove keep the order") {
    pop.add(scalar(5));
    REQUIRE(fitnesses(pop) == (std::vector<double>{3, 1, 2, 5}));
    pop.replace(1, scalar(4));
    REQUIRE(fitnesses(pop) == (std::vector<double>{3, 4, 2, 5}));
    pop.remove(0);
    REQUIRE(fitnesses(pop) == (std::vector<double>{4, 2, 5}));
    REQUIRE_THROWS_AS(pop.remove(3), std::out_of_range);
    REQUIRE_THROWS_AS(pop.replace(3, scalar(0)), std::out_of_range);
  }

  SECTION("moving a population in empties the source") {
    auto other = scalars({7, 8});
    pop.add(std::move(other));
    REQUIRE(pop.size() == 5);
    REQUIRE(other.empty());
  }

  SECTION("copying a population in leaves the source") {
    auto other = scalars({7, 8});
    pop.add(other);
    REQUIRE(pop.size() == 5);
    REQUIRE(other.size() == 2);
  }

  SECTION("membership and candidates") {
    REQUIRE(pop.contains(scalar(1)));
    REQUIRE_FALSE(pop.contains(scalar(1, false)));
    REQUIRE(pop.candidates() == (std::vector<Vec>{Vec{3}, Vec{1}, Vec{2}}));
  }

  SECTION("best and worst") {
    REQUIRE(pop.best().fitness() == 3);
    REQUIRE(pop.worst().fitness() == 1);
    auto minimized = scalars({3, 1, 2}, false);
    REQUIRE(minimized.best().fitness() == 1);
    REQUIRE(minimized.worst().fitness() == 3);
  }

  SECTION("empty population has no best or worst") {
    evo::Population<Vec, double> empty{};
    REQUIRE_THROWS_AS(empty.best(), std::out_of_range);
    REQUIRE_THROWS_AS(empty.worst(), std::out_of_range);
    REQUIRE_THROWS_AS(empty.stat(), std::out_of_range);
    evo::Random rng{1};
    REQUIRE_THROWS_AS(empty.randomSelect(rng), std::out_of_range);
  }
}

TEST_CASE("Population ordering", "[population]") {
  auto pop = scalars({3, 1, 4, 2});

  SECTION("sort is descending by default") {
    pop.sort();
    REQUIRE(fitnesses(pop) == (std::vector<double>{4, 3, 2, 1}));
    pop.sort(false);
    REQUIRE(fitnesses(pop) == (std::vector<double>{1, 2, 3, 4}));
  }

  SECTION("sort is stable") {
    evo::Population<Vec, double> ties{};
    for(int i = 0; i < 5; i++)
      ties.add(evo::Individual<Vec, double>{Vec{static_cast<double>(i)}, 1.0});
    ties.sort();
    for(int i = 0; i < 5; i++)
      REQUIRE(ties[i].candidate()[0] == i);
  }

  SECTION("rankTrim keeps the best") {
    pop.rankTrim(2);
    REQUIRE(fitnesses(pop) == (std::vector<double>{4, 3}));
    pop.rankTrim(5);
    REQUIRE(pop.size() == 2);
  }

  SECTION("stat") {
    auto stat = pop.stat();
    REQUIRE(stat.best == 4);
    REQUIRE(stat.worst == 1);
    REQUIRE(stat.median == 2);
    REQUIRE(stat.mean == Approx(2.5));
    REQUIRE(stat.stdev == Approx(std::sqrt(1.25)));
  }

  SECTION("stat of a minimization problem") {
    auto stat = scalars({3, 1, 2}, false).stat();
    REQUIRE(stat.best == 1);
    REQUIRE(stat.worst == 3);
  }
}

TEST_CASE("Population random selection", "[population]") {
  evo::Random rng{7};
  auto pop = scalars({0, 1, 2, 3, 4, 5, 6, 7, 8, 9});

  SECTION("k distinct members") {
    for(int rep = 0; rep < 20; rep++) {
      auto sel = pop.randomSelect(4, rng);
      REQUIRE(sel.size() == 4);
      std::set<double> seen{};
      for(auto& ind : sel) {
        REQUIRE(pop.contains(ind));
        seen.insert(ind.fitness());
      }
      REQUIRE(seen.size() == 4);
    }
  }

  SECTION("asking for too many returns everybody") {
    REQUIRE(pop.randomSelect(20, rng).size() == 10);
  }

  SECTION("single member") {
    for(int rep = 0; rep < 20; rep++)
      REQUIRE(pop.contains(pop.randomSelect(rng)));
  }
}

TEST_CASE("Population fronts", "[population][pareto]") {
  evo::Population<Vec, evo::Pareto> pop{
    point(3, 3), point(1, 1), point(2, 2), point(0, 4), point(4, 0)};

  SECTION("nondominated front") {
    for(bool parallel : {false, true}) {
      auto front = pop.front(parallel);
      REQUIRE(front.size() == 3);
      REQUIRE(front[0] == point(3, 3));
      REQUIRE(front[1] == point(0, 4));
      REQUIRE(front[2] == point(4, 0));
    }
  }

  SECTION("successive fronts") {
    for(bool parallel : {false, true}) {
      auto fronts = pop.fronts(parallel);
      REQUIRE(fronts.size() == 3);
      REQUIRE(fronts[0] == (std::vector<size_t>{0, 3, 4}));
      REQUIRE(fronts[1] == (std::vector<size_t>{2}));
      REQUIRE(fronts[2] == (std::vector<size_t>{1}));
    }
  }

  SECTION("a dominance chain has one member per front") {
    evo::Population<Vec, evo::Pareto> chain{};
    for(int i = 5; i >= 0; i--)
      chain.add(point(i, i));
    auto fronts = chain.fronts();
    REQUIRE(fronts.size() == 6);
    for(size_t k = 0; k < fronts.size(); k++)
      REQUIRE(fronts[k] == (std::vector<size_t>{k}));
  }

  SECTION("minimization reverses the fronts") {
    evo::Population<Vec, evo::Pareto> minimized{point(1, 1, false), point(2, 2, false)};
    auto fronts = minimized.fronts();
    REQUIRE(fronts.size() == 2);
    REQUIRE(fronts[0] == (std::vector<size_t>{0}));
  }
}
