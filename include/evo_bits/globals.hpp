/** \brief The main namespace of the framework.
 *
 * The entry point of most applications is evo::EvolutionaryComputation or
 * one of its presets (evo::GA, evo::ES, evo::EDA, evo::DEA, evo::SA,
 * evo::NSGA2, evo::PAES). The operator classes can be combined freely on
 * any of them. */
namespace evo {

/** \brief The random number generator type used by all operators. */
using Random = std::minstd_rand;

/** \brief The default random number generator for this framework.
 *
 * A strong RNG is not a necessity for evolutionary applications, so speed
 * was main preference in choosing \b std::minstd_rand. Can be accessed
 * freely by applications of the framework. For reproducible runs construct
 * an evo::Random with a fixed seed and pass it to the engine instead. */
static thread_local Random rng{std::random_device{}()};

/** \brief An exception a user callback (generator, evaluator, observer, or
 * any custom operator) may throw to abandon a run.
 *
 * The engine does not catch it, so it reaches the caller of
 * EvolutionaryComputation::evolve() like any other exception. The state of
 * the engine (population, archive, counters) reflects the last completed
 * stage. */
class EvolutionExit: public std::runtime_error {
public:
  explicit EvolutionExit(const std::string& what = "evolution exit"):
    std::runtime_error(what) { }
}; // class EvolutionExit

} // namespace evo
