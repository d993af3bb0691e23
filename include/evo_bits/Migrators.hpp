namespace evo {

/** \brief Does not migrate: returns the population unchanged. */
template<class Candidate, class Fitness = double>
class DefaultMigration: public Migrator<Candidate, Fitness> {
public:
  std::string name() const override {
    return "default_migration";
  }

  Population<Candidate, Fitness> migrate(Random&,
      Population<Candidate, Fitness> population,
      Args<Candidate, Fitness>&) override {
    return population;
  }
}; // class DefaultMigration<Candidate, Fitness>


/** \brief Exchanges individuals with concurrent runs through a shared
 * MigrationChannel.
 *
 * In each call, a random member of the population is offered to the channel
 * and, if the channel holds an immigrant, replaced by it. Both happen while
 * holding the channel's lock. If \b evaluateMigrant is set, the immigrant is
 * re-evaluated first (counting one evaluation); an immigrant whose fitness
 * comes back absent is dropped. The capacity of the channel bounds the
 * number of individuals in transit. */
template<class Candidate, class Fitness = double>
class ChannelMigrator: public Migrator<Candidate, Fitness> {
public:
  using Channel = MigrationChannel<Individual<Candidate, Fitness>>;

private:
  std::shared_ptr<Channel> channel;

public:
  explicit ChannelMigrator(std::shared_ptr<Channel> channel):
      channel(std::move(channel)) {
    if(!this->channel)
      throw std::invalid_argument("ChannelMigrator(): Channel is null.");
  }

  std::string name() const override {
    return "channel_migrator";
  }

  NOINLINE Population<Candidate, Fitness> migrate(Random& rng,
      Population<Candidate, Fitness> population,
      Args<Candidate, Fitness>& args) override {
    if(population.empty())
      return population;
    typename Channel::Lock lock = channel->lock();
    size_t pos = internal::index(population.size(), rng);
    Individual<Candidate, Fitness> old = population[pos];
    Individual<Candidate, Fitness> migrant{};
    if(channel->tryReceive(migrant, lock) && admit(migrant, args))
      population.replace(pos, std::move(migrant));
    if(!channel->trySend(old, lock))
      spdlog::debug("migration channel full, emigrant dropped");
    return population;
  }

private:
  static bool admit(Individual<Candidate, Fitness>& migrant,
      Args<Candidate, Fitness>& args) {
    if(!args.config.evaluateMigrant)
      return true;
    auto fit = args.evaluate({migrant.candidate()});
    if(fit.size() != 1 || !fit[0]) {
      spdlog::warn("excluding migrant because fitness received as none");
      return false;
    }
    migrant.setFitness(fit[0].value());
    return true;
  }
}; // class ChannelMigrator<Candidate, Fitness>

} // namespace evo
