#include <iostream>
#include <random>
#include <thread>
#include <mutex>

#include "evo.hpp"

/* Two islands maximizing the number of ones in a bit string, exchanging
 * individuals through a shared migration channel. */

namespace Config {
  const size_t popSize = 30;
  const size_t length = 64;
  const size_t nGen = 200;
  const size_t channelCapacity = 2;
  const int nIslands = 2;
}

typedef std::vector<int> Bits;
typedef evo::Args<Bits, double> Args;
typedef evo::MigrationChannel<evo::Individual<Bits, double>> Channel;

std::mutex coutMutex;

void island(int id, std::shared_ptr<Channel> channel) {
  evo::Random rng{static_cast<evo::Random::result_type>(id + 1)};
  evo::GA<Bits> ga{rng};
  ga.setMigrator(std::make_shared<evo::ChannelMigrator<Bits, double>>(channel));
  ga.setTerminator(std::make_shared<evo::GenerationTermination<Bits, double>>());

  evo::Config config{};
  config.maxGenerations = Config::nGen;
  config.numElites = 1;
  config.mutationRate = 1.0 / Config::length;

  auto generator = [](evo::Random& rng, Args&) -> Bits {
    Bits b(Config::length);
    for(auto& x : b)
      x = std::uniform_int_distribution<int>{0, 1}(rng);
    return b;
  };
  auto evaluator = evo::evaluator<Bits, double>(
      [](const Bits& b, Args&) { return static_cast<double>(std::count(b.begin(), b.end(), 1)); },
      false);

  auto result = ga.evolve(generator, evaluator, Config::popSize, {}, true, nullptr, config);
  std::lock_guard<std::mutex> lock{coutMutex};
  std::cout << "Island " << id << ": best " << result.best().fitness()
    << " of " << Config::length << " after " << ga.numEvaluations()
    << " evaluations\n";
}

int main() {
  auto channel = std::make_shared<Channel>(Config::channelCapacity);
  std::vector<std::thread> threads{};
  for(int i = 0; i < Config::nIslands; i++)
    threads.emplace_back(island, i, channel);
  for(auto& t : threads)
    t.join();
}
