#include "common.hpp"

using evo::Pareto;

TEST_CASE("Pareto dominance", "[pareto]") {
  Pareto a({1, 2}), b({2, 3}), c({1, 3}), d({2, 2});

  SECTION("a value is dominated by one better in every objective") {
    REQUIRE(a < b);
    REQUIRE(b > a);
    REQUIRE(b.dominates(a));
    REQUIRE_FALSE(b < a);
  }

  SECTION("one better objective suffices if the others are not worse") {
    REQUIRE(a < c);
    REQUIRE(c < b);
  }

  SECTION("mutually nondominated values are unordered") {
    REQUIRE_FALSE(c < d);
    REQUIRE_FALSE(d < c);
    REQUIRE_FALSE(c == d);
    REQUIRE(c <= d);
    REQUIRE(c >= d);
  }

  SECTION("a dominated value is not greater or equal") {
    REQUIRE(a <= b);
    REQUIRE_FALSE(a >= b);
    REQUIRE_FALSE(b <= a);
  }

  SECTION("dominance is irreflexive") {
    REQUIRE_FALSE(a < a);
    REQUIRE(a <= a);
    REQUIRE(a >= a);
  }

  SECTION("minimized objectives reverse the comparison") {
    Pareto x({1, 2}, false), y({2, 3}, false);
    REQUIRE(y < x);
    REQUIRE(x.dominates(y));
  }

  SECTION("polarity can differ by objective") {
    Pareto x({1, 1}, {true, false}), y({2, 0}, {true, false});
    REQUIRE(x < y);
    REQUIRE_FALSE(y < x);
  }

  SECTION("equality ignores polarity") {
    REQUIRE(Pareto({1, 2}, true) == Pareto({1, 2}, false));
  }

  SECTION("values of different dimension cannot be compared") {
    REQUIRE_THROWS_AS(a < Pareto({1, 2, 3}), std::invalid_argument);
  }

  SECTION("polarity must be given for every objective") {
    REQUIRE_THROWS_AS(Pareto({1, 2}, std::vector<bool>{true}), std::invalid_argument);
  }
}

TEST_CASE("Individual ordering", "[individual]") {
  SECTION("greater means better when maximizing") {
    auto a = scalar(1), b = scalar(2);
    REQUIRE(a < b);
    REQUIRE(b > a);
    REQUIRE(a <= b);
    REQUIRE(b >= a);
    REQUIRE_FALSE(b < a);
  }

  SECTION("minimization inverts every comparison") {
    auto a = scalar(1, false), b = scalar(2, false);
    REQUIRE(b < a);
    REQUIRE(a > b);
    REQUIRE_FALSE(a < b);
  }

  SECTION("equal fitness compares as neither smaller nor greater") {
    evo::Individual<Vec, double> a{Vec{1}, 5.0}, b{Vec{2}, 5.0};
    REQUIRE_FALSE(a < b);
    REQUIRE_FALSE(b < a);
    REQUIRE(a <= b);
    REQUIRE(a >= b);
    REQUIRE(a != b);
  }

  SECTION("Pareto fitness orders by dominance") {
    auto a = point(1, 1), b = point(2, 2), c = point(0, 3);
    REQUIRE(a < b);
    REQUIRE_FALSE(a < c);
    REQUIRE_FALSE(c < a);
    auto x = point(1, 1, false), y = point(2, 2, false);
    REQUIRE(y < x);
  }
}

TEST_CASE("Individual fitness state", "[individual]") {
  evo::Individual<Vec, double> unset{Vec{1}}, set = scalar(1);

  SECTION("fitness is unset at construction") {
    REQUIRE_FALSE(unset.hasFitness());
    REQUIRE_THROWS_AS(unset.fitness(), std::logic_error);
  }

  SECTION("comparison with an unset fitness throws") {
    REQUIRE_THROWS_AS(unset < set, std::logic_error);
    REQUIRE_THROWS_AS(set < unset, std::logic_error);
    REQUIRE_THROWS_AS(set > unset, std::logic_error);
  }

  SECTION("setting the candidate clears the fitness") {
    set.setCandidate(Vec{2});
    REQUIRE_FALSE(set.hasFitness());
    set.setFitness(3);
    REQUIRE(set.hasFitness());
    REQUIRE(set.fitness() == 3);
  }

  SECTION("equality compares candidate, fitness and polarity") {
    REQUIRE(scalar(1) == scalar(1));
    REQUIRE(scalar(1) != scalar(1, false));
    REQUIRE(scalar(1) != evo::Individual<Vec, double>(Vec{1}, 2.0));
    REQUIRE(unset != set);
  }

  SECTION("birthdate is recorded") {
    REQUIRE(set.birthdate() > 0);
  }
}

TEST_CASE("Fitness traits", "[individual]") {
  using Scalar = evo::Individual<Vec, double>::Traits;
  using Multi = evo::Individual<Vec, Pareto>::Traits;
  bool scalarFloat = Scalar::is_float, scalarMulti = Scalar::is_multi;
  bool multiFloat = Multi::is_float, multiMulti = Multi::is_multi;
  REQUIRE(scalarFloat);
  REQUIRE_FALSE(scalarMulti);
  REQUIRE(multiMulti);
  REQUIRE_FALSE(multiFloat);
}

TEST_CASE("Maybe", "[maybe]") {
  evo::Maybe<size_t> none{}, some{3};
  REQUIRE_FALSE(none);
  REQUIRE(some);
  REQUIRE(none.valueOr(7) == 7);
  REQUIRE(some.valueOr(7) == 3);
  REQUIRE(some.value() == 3);
  REQUIRE_THROWS_AS(none.value(), std::logic_error);
  some.reset();
  REQUIRE(some == none);
}
