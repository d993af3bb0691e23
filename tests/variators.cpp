#include "common.hpp"

#include <algorithm>

TEST_CASE("Crossover pairing", "[variators]") {
  Fixture<Vec> f{};
  evo::ArithmeticCrossover<Vec> cx{};

  SECTION("an odd candidate is dropped") {
    auto ret = cx.vary(f.rng, {Vec{0}, Vec{2}, Vec{4}}, f.args);
    REQUIRE(ret.size() == 2);
    REQUIRE(ret[0] == Vec{1});
    REQUIRE(ret[1] == Vec{1});
  }

  SECTION("zero crossover rate copies the parents") {
    f.config.crossoverRate = 0;
    auto ret = cx.vary(f.rng, {Vec{0}, Vec{2}}, f.args);
    REQUIRE(ret == (std::vector<Vec>{Vec{0}, Vec{2}}));
  }

  SECTION("arithmetic weights") {
    f.config.axAlpha = 0.25;
    auto ret = cx.vary(f.rng, {Vec{0}, Vec{4}}, f.args);
    REQUIRE(ret[0][0] == Approx(3));
    REQUIRE(ret[1][0] == Approx(1));
  }
}

TEST_CASE("N-point crossover", "[variators]") {
  Fixture<Bits> f{};
  evo::NPointCrossover<Bits> cx{};
  Bits zeros(10, 0), ones(10, 1);

  for(int rep = 0; rep < 20; rep++) {
    auto ret = cx.vary(f.rng, {zeros, ones}, f.args);
    REQUIRE(ret.size() == 2);
    int switches = 0;
    for(size_t i = 0; i < 10; i++) {
      REQUIRE(ret[0][i] + ret[1][i] == 1);
      if(i > 0 && ret[0][i] != ret[0][i-1])
        switches++;
    }
    REQUIRE(switches == 1);
  }

  SECTION("more cut points") {
    f.config.numCrossoverPoints = 3;
    auto ret = cx.vary(f.rng, {zeros, ones}, f.args);
    int switches = 0;
    for(size_t i = 1; i < 10; i++)
      if(ret[0][i] != ret[0][i-1])
        switches++;
    REQUIRE(switches == 3);
  }
}

TEST_CASE("Uniform crossover", "[variators]") {
  Fixture<Bits> f{};
  evo::UniformCrossover<Bits> cx{};
  Bits zeros(10, 0), ones(10, 1);

  f.config.uxBias = 0;
  auto ret = cx.vary(f.rng, {zeros, ones}, f.args);
  REQUIRE(ret[0] == ones);
  REQUIRE(ret[1] == zeros);

  f.config.uxBias = 1;
  ret = cx.vary(f.rng, {zeros, ones}, f.args);
  REQUIRE(ret[0] == zeros);
  REQUIRE(ret[1] == ones);
}

TEST_CASE("Blend crossover", "[variators]") {
  Fixture<Vec> f{};
  evo::BlendCrossover<Vec> cx{};
  f.config.blxAlpha = 0.5;
  for(int rep = 0; rep < 50; rep++)
    for(auto& c : cx.vary(f.rng, {Vec{1, -1}, Vec{3, -3}}, f.args)) {
      REQUIRE(c[0] >= 0);
      REQUIRE(c[0] <= 4);
      REQUIRE(c[1] >= -4);
      REQUIRE(c[1] <= 0);
    }
}

TEST_CASE("Heuristic crossover", "[variators]") {
  Fixture<Vec> f{};
  evo::HeuristicCrossover<Vec> cx{};

  SECTION("parents must be members of the population") {
    REQUIRE_THROWS_AS(cx.vary(f.rng, {Vec{0, 0}, Vec{1, 1}}, f.args), std::invalid_argument);
  }

  SECTION("children lie between the parents") {
    auto sum = [](const Vec& v, evo::Args<Vec, double>&) { return v[0] + v[1]; };
    f.ec.evolve([](evo::Random&, evo::Args<Vec, double>&) { return Vec{}; },
        evo::evaluator<Vec, double>(sum), 2, {Vec{0, 0}, Vec{1, 1}});
    REQUIRE(f.ec.population().size() == 2);
    for(int rep = 0; rep < 20; rep++)
      for(auto& c : cx.vary(f.rng, {Vec{0, 0}, Vec{1, 1}}, f.args))
        for(auto x : c) {
          REQUIRE(x >= 0);
          REQUIRE(x <= 1);
        }
  }
}

TEST_CASE("Bit flip mutation", "[variators]") {
  Fixture<Bits> f{};
  evo::BitFlipMutation<Bits> mut{};

  SECTION("rate one flips every bit") {
    f.config.mutationRate = 1;
    auto ret = mut.vary(f.rng, {Bits{0, 1, 1, 0}}, f.args);
    REQUIRE(ret[0] == (Bits{1, 0, 0, 1}));
  }

  SECTION("rate zero flips nothing") {
    f.config.mutationRate = 0;
    auto ret = mut.vary(f.rng, {Bits{0, 1, 1, 0}}, f.args);
    REQUIRE(ret[0] == (Bits{0, 1, 1, 0}));
  }

  SECTION("non-binary candidates are left alone") {
    f.config.mutationRate = 1;
    auto ret = mut.vary(f.rng, {Bits{0, 2, 1}}, f.args);
    REQUIRE(ret[0] == (Bits{0, 2, 1}));
  }
}

TEST_CASE("Gaussian mutation", "[variators]") {
  Fixture<Vec> f{};
  evo::GaussianMutation<Vec> mut{};

  f.config.mutationRate = 0;
  REQUIRE(mut.vary(f.rng, {Vec{1, 2}}, f.args)[0] == (Vec{1, 2}));

  f.config.mutationRate = 1;
  f.config.gaussianMean = 100;
  auto ret = mut.vary(f.rng, {Vec{1, 2}}, f.args);
  REQUIRE(ret[0][0] > 50);
  REQUIRE(ret[0][1] > 50);
}

TEST_CASE("Permutation mutations", "[variators]") {
  Fixture<Bits> f{};
  f.config.mutationRate = 1;
  Bits perm{0, 1, 2, 3, 4, 5, 6, 7};
  evo::InversionMutation<Bits> inv{};
  evo::ScrambleMutation<Bits> scr{};

  for(int rep = 0; rep < 20; rep++) {
    auto a = inv.vary(f.rng, {perm}, f.args)[0];
    REQUIRE(std::is_permutation(a.begin(), a.end(), perm.begin()));
    auto b = scr.vary(f.rng, {perm}, f.args)[0];
    REQUIRE(std::is_permutation(b.begin(), b.end(), perm.begin()));
  }

  SECTION("inversion reverses one segment") {
    auto a = inv.vary(f.rng, {perm}, f.args)[0];
    size_t p = 0;
    while(p < a.size() && a[p] == perm[p])
      p++;
    size_t q = a.size();
    while(q > p && a[q-1] == perm[q-1])
      q--;
    REQUIRE(std::equal(a.begin() + p, a.begin() + q, perm.rbegin() + (perm.size() - q)));
  }
}

TEST_CASE("Default variation", "[variators]") {
  Fixture<Vec> f{};
  evo::DefaultVariation<Vec> var{};
  std::vector<Vec> cands{Vec{1}, Vec{2}, Vec{3}};
  REQUIRE(var.vary(f.rng, cands, f.args) == cands);
}
