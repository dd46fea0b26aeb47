#pragma once

#include "random_streams.hpp"

// Bernoulli trial deciding whether a risk materialises in one trial.
// Probabilities 0 and 1 are decided without consuming a draw.
[[nodiscard]] bool occurs(double probability, Rng& rng);
