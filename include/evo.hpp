#ifndef EVO_H
#define EVO_H

#include <vector>
#include <deque>
#include <map>
#include <set>
#include <string>
#include <memory>
#include <functional>
#include <random>
#include <algorithm>
#include <numeric>
#include <limits>
#include <cmath>
#include <chrono>
#include <ostream>
#include <stdexcept>
#include <exception>
#include <type_traits>
#include <mutex>
#include <omp.h>
#include <spdlog/spdlog.h>

#ifndef NOINLINE
#define NOINLINE
#endif

#include "evo_bits/internal.hpp"
#include "evo_bits/globals.hpp"
#include "evo_bits/Maybe.hpp"
#include "evo_bits/Pareto.hpp"
#include "evo_bits/Individual.hpp"
#include "evo_bits/Population.hpp"
#include "evo_bits/Config.hpp"
#include "evo_bits/Operators.hpp"
#include "evo_bits/MigrationChannel.hpp"

#include "evo_bits/Utilities.hpp"
#include "evo_bits/Selectors.hpp"
#include "evo_bits/Variators.hpp"
#include "evo_bits/Replacers.hpp"
#include "evo_bits/NSGA.hpp"
#include "evo_bits/Analysis.hpp"
#include "evo_bits/Archivers.hpp"
#include "evo_bits/AdaptiveGrid.hpp"
#include "evo_bits/Migrators.hpp"
#include "evo_bits/Terminators.hpp"
#include "evo_bits/Observers.hpp"
#include "evo_bits/EvolutionaryComputation.hpp"
#include "evo_bits/Presets.hpp"

#endif
