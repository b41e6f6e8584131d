#include "whoopie/Random.hh"

namespace Whoopie {

Rng& getRng()
{
    static Rng randomEngine {std::random_device()()};
    return randomEngine;
}

Rng makeRng(const std::optional<Rng::result_type> seed)
{
    if (seed) {
        return Rng {*seed};
    }
    return Rng {std::random_device()()};
}

}
