#include "trio/Random.hh"

namespace Trio {

Rng& getRng()
{
    static Rng engine {std::random_device {}()};
    return engine;
}

}
