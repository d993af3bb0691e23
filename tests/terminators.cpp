#include "common.hpp"

#include <chrono>

TEST_CASE("Counting terminators", "[terminators]") {
  Fixture<Vec> f{};
  auto pop = scalars({1, 2, 3});

  SECTION("default terminates at once") {
    REQUIRE(evo::DefaultTermination<Vec>{}.terminate(pop, 0, 0, f.args));
  }

  SECTION("generation limit") {
    evo::GenerationTermination<Vec> term{};
    REQUIRE_FALSE(term.terminate(pop, 0, 0, f.args));
    REQUIRE(term.terminate(pop, 1, 0, f.args));
    f.config.maxGenerations = 3;
    REQUIRE_FALSE(term.terminate(pop, 2, 0, f.args));
    REQUIRE(term.terminate(pop, 3, 0, f.args));
  }

  SECTION("evaluation limit defaults to the population size") {
    evo::EvaluationTermination<Vec> term{};
    REQUIRE_FALSE(term.terminate(pop, 0, 2, f.args));
    REQUIRE(term.terminate(pop, 0, 3, f.args));
    f.config.maxEvaluations = 100;
    REQUIRE_FALSE(term.terminate(pop, 0, 99, f.args));
    REQUIRE(term.terminate(pop, 0, 100, f.args));
  }
}

TEST_CASE("Population terminators", "[terminators]") {
  Fixture<Vec> f{};

  SECTION("diversity") {
    evo::DiversityTermination<Vec> term{};
    REQUIRE(term.terminate(scalars({1, 1, 1}), 0, 0, f.args));
    REQUIRE_FALSE(term.terminate(scalars({1, 1, 2}), 0, 0, f.args));
    f.config.minDiversity = 5;
    REQUIRE(term.terminate(scalars({1, 1, 2}), 0, 0, f.args));
  }

  SECTION("average fitness") {
    evo::AverageFitnessTermination<Vec> term{};
    REQUIRE(term.terminate(scalars({2, 2, 2}), 0, 0, f.args));
    REQUIRE_FALSE(term.terminate(scalars({1, 2, 3}), 0, 0, f.args));
    f.config.tolerance = 2;
    REQUIRE(term.terminate(scalars({1, 2, 3}), 0, 0, f.args));
    f.config.tolerance = 0.001;
    REQUIRE_FALSE(term.terminate(scalars({1, 2, 3}, false), 0, 0, f.args));
  }

  SECTION("no improvement") {
    evo::NoImprovementTermination<Vec> term{};
    f.config.maxGenerations = 2;
    auto pop = scalars({1, 2});
    REQUIRE_FALSE(term.terminate(pop, 0, 0, f.args));
    REQUIRE_FALSE(term.terminate(pop, 1, 0, f.args));
    REQUIRE_FALSE(term.terminate(pop, 2, 0, f.args));
    REQUIRE(term.terminate(pop, 3, 0, f.args));

    /* An improvement restarts the count. */
    REQUIRE_FALSE(term.terminate(scalars({1, 5}), 4, 0, f.args));
    REQUIRE_FALSE(term.terminate(scalars({1, 5}), 5, 0, f.args));

    term.reset();
    REQUIRE_FALSE(term.terminate(pop, 0, 0, f.args));
  }
}

TEST_CASE("Time termination", "[terminators]") {
  Fixture<Vec> f{};
  evo::TimeTermination<Vec> term{};
  auto pop = scalars({1});

  SECTION("no limit terminates at once") {
    REQUIRE(term.terminate(pop, 0, 0, f.args));
  }

  SECTION("the clock starts at the first check") {
    f.config.maxTime = 1000.0;
    REQUIRE_FALSE(term.terminate(pop, 0, 0, f.args));
    REQUIRE(f.context.has("start_time"));
  }

  SECTION("an expired limit terminates") {
    f.config.maxTime = 10.0;
    double now = std::chrono::duration<double>(
        std::chrono::steady_clock::now().time_since_epoch()).count();
    f.context.set("start_time", now - 20);
    REQUIRE(term.terminate(pop, 0, 0, f.args));
  }
}

TEST_CASE("Function terminator", "[terminators]") {
  Fixture<Vec> f{};
  evo::FunctionTerminator<Vec> term{"best_above_two",
    [](const evo::Population<Vec>& pop, size_t, size_t, evo::Args<Vec, double>&) {
      return pop.best().fitness() > 2;
    }};
  REQUIRE(term.name() == "best_above_two");
  REQUIRE_FALSE(term.terminate(scalars({1, 2}), 0, 0, f.args));
  REQUIRE(term.terminate(scalars({1, 3}), 0, 0, f.args));
}
