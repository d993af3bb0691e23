#include "common.hpp"

#include <set>

TEST_CASE("Bounder", "[utilities]") {
  SECTION("scalar bounds apply to every allele") {
    evo::Bounder b{-1, 1};
    Vec v{-5, 0.5, 5};
    b(v);
    REQUIRE(v == (Vec{-1, 0.5, 1}));
  }

  SECTION("sequence bounds apply allele by allele") {
    evo::Bounder b{Vec{0, 10}, Vec{1, 20}};
    Vec v{5, 5, 5};
    b(v);
    REQUIRE(v == (Vec{1, 10, 5}));
  }

  SECTION("default bounder does nothing") {
    evo::Bounder b{};
    Vec v{-100, 100};
    b(v);
    REQUIRE(v == (Vec{-100, 100}));
  }

  SECTION("integer sequences") {
    evo::Bounder b{0, 1};
    Bits v{-3, 0, 7};
    b(v);
    REQUIRE(v == (Bits{0, 0, 1}));
  }

  SECTION("lengths must agree") {
    REQUIRE_THROWS_AS(evo::Bounder(Vec{0, 1}, Vec{1}), std::invalid_argument);
  }
}

TEST_CASE("Evaluator lifting", "[utilities]") {
  Fixture<Vec> f{};
  std::vector<Vec> cands{};
  for(int i = 0; i < 100; i++)
    cands.push_back(Vec{static_cast<double>(i)});

  SECTION("results keep the order of the candidates") {
    for(bool parallel : {false, true}) {
      auto eval = evo::evaluator<Vec, double>(
          [](const Vec& v, evo::Args<Vec, double>&) { return 2 * v[0]; }, parallel);
      auto fit = eval(cands, f.args);
      REQUIRE(fit.size() == 100);
      for(int i = 0; i < 100; i++)
        REQUIRE(fit[i].value() == 2 * i);
    }
  }

  SECTION("absent results pass through") {
    auto eval = evo::evaluator<Vec, double>(
        [](const Vec& v, evo::Args<Vec, double>&) -> evo::Maybe<double> {
          if(v[0] < 50)
            return {};
          return v[0];
        });
    auto fit = eval(cands, f.args);
    REQUIRE_FALSE(fit[0]);
    REQUIRE(fit[50]);
  }

  SECTION("exceptions reach the caller") {
    auto eval = evo::evaluator<Vec, double>(
        [](const Vec& v, evo::Args<Vec, double>&) -> double {
          if(v[0] == 42)
            throw std::domain_error("bad candidate");
          return v[0];
        });
    REQUIRE_THROWS_AS(eval(cands, f.args), std::domain_error);
  }
}

TEST_CASE("Memoize", "[utilities]") {
  Fixture<Vec> f{};
  std::shared_ptr<size_t> calls = std::make_shared<size_t>(0);
  evo::Evaluator<Vec, double> counting =
    [calls](const std::vector<Vec>& cands, evo::Args<Vec, double>&) {
      *calls += cands.size();
      std::vector<evo::Maybe<double>> ret{};
      for(auto& c : cands)
        ret.push_back(c[0] * 10);
      return ret;
    };

  SECTION("each candidate is evaluated once") {
    evo::Memoize<Vec, double> memo{counting};
    auto fit = memo({Vec{1}, Vec{2}, Vec{1}}, f.args);
    REQUIRE(*calls == 2);
    REQUIRE(fit[0].value() == 10);
    REQUIRE(fit[1].value() == 20);
    REQUIRE(fit[2].value() == 10);
    fit = memo({Vec{2}, Vec{3}}, f.args);
    REQUIRE(*calls == 3);
    REQUIRE(fit[1].value() == 30);
    REQUIRE(memo.size() == 3);
  }

  SECTION("copies share the cache") {
    evo::Memoize<Vec, double> memo{counting};
    evo::Evaluator<Vec, double> wrapped = memo;
    (void)wrapped({Vec{1}}, f.args);
    (void)memo({Vec{1}}, f.args);
    REQUIRE(*calls == 1);
    memo.clear();
    (void)wrapped({Vec{1}}, f.args);
    REQUIRE(*calls == 2);
  }

  SECTION("the oldest results are forgotten first") {
    evo::Memoize<Vec, double> memo{counting, 2};
    (void)memo({Vec{1}, Vec{2}, Vec{3}}, f.args);
    REQUIRE(memo.size() == 2);
    (void)memo({Vec{3}}, f.args);
    REQUIRE(*calls == 3);
    (void)memo({Vec{1}}, f.args);
    REQUIRE(*calls == 4);
  }

  SECTION("a batch of the wrong size is an error") {
    evo::Memoize<Vec, double> memo{
      [](const std::vector<Vec>&, evo::Args<Vec, double>&) {
        return std::vector<evo::Maybe<double>>{};
      }};
    REQUIRE_THROWS_AS(memo({Vec{1}}, f.args), std::length_error);
  }
}

TEST_CASE("Diversify", "[utilities]") {
  Fixture<Vec> f{};
  std::shared_ptr<int> next = std::make_shared<int>(0);
  /* Yields 0, 0, 1, 1, 2, 2, ... */
  evo::Generator<Vec, double> repeating =
    [next](evo::Random&, evo::Args<Vec, double>&) {
      return Vec{static_cast<double>((*next)++ / 2)};
    };

  SECTION("duplicates are skipped") {
    evo::Diversify<Vec, double> gen{repeating};
    std::set<Vec> seen{};
    for(int i = 0; i < 5; i++)
      seen.insert(gen(f.rng, f.args));
    REQUIRE(seen.size() == 5);
  }

  SECTION("registered candidates are skipped") {
    evo::Diversify<Vec, double> gen{repeating};
    gen.add({Vec{0}, Vec{1}});
    REQUIRE(gen(f.rng, f.args) == Vec{2});
  }

  SECTION("giving up") {
    evo::Diversify<Vec, double> gen{
      [](evo::Random&, evo::Args<Vec, double>&) { return Vec{1}; }, 5};
    REQUIRE(gen(f.rng, f.args) == Vec{1});
    REQUIRE_THROWS_AS(gen(f.rng, f.args), std::runtime_error);
    gen.reset();
    REQUIRE(gen(f.rng, f.args) == Vec{1});
  }
}

TEST_CASE("Random sampling", "[utilities]") {
  evo::Random rng{3};
  for(size_t k = 0; k <= 12; k++) {
    auto idx = evo::internal::sample(10, k, rng);
    REQUIRE(idx.size() == std::min<size_t>(k, 10));
    std::set<size_t> distinct(idx.begin(), idx.end());
    REQUIRE(distinct.size() == idx.size());
    for(auto i : idx)
      REQUIRE(i < 10);
  }
}
