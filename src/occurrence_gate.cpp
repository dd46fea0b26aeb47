#include "occurrence_gate.hpp"

bool occurs(double probability, Rng& rng) {
    if (probability <= 0.0) {
        return false;
    }
    if (probability >= 1.0) {
        return true;
    }
    std::uniform_real_distribution<double> dist(0.0, 1.0);
    return dist(rng) < probability;
}
