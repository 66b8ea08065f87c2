#include "Shuffler.hpp"

namespace tressette::core
{
    Mt19937Source::Mt19937Source(uint64_t const seed):
        rng_(seed) {}

    auto Mt19937Source::NextIndex(size_t const bound) -> error::GameResult<size_t>
    {
        if (bound == 0)
            return std::unexpected(error::Err(error::GameErrorCode::RandomSourceFailed));
        return std::uniform_int_distribution<size_t>{0, bound - 1}(rng_);
    }
}
