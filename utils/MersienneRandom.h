#pragma once

#include <cstdint>
#include <limits>
#include <random>

namespace utils
{

template <typename IntType>
class MersienneRandom
{
public:
    MersienneRandom()
        : _generator((uint64_t(std::random_device{}()) << 32) + std::random_device{}()),
          _distribution(0, std::numeric_limits<IntType>::max())
    {
    }

    // reproducible sequence
    explicit MersienneRandom(uint64_t seed) : _generator(seed), _distribution(0, std::numeric_limits<IntType>::max())
    {
    }

    IntType next() { return _distribution(_generator); }

    // uniform in [0, upperBound)
    IntType next(IntType upperBound)
    {
        if (upperBound == 0)
        {
            return 0;
        }
        return std::uniform_int_distribution<IntType>(0, upperBound - 1)(_generator);
    }

    // true with probability 1/n
    bool oneIn(IntType n) { return n != 0 && next(n) == 0; }

private:
    std::mt19937_64 _generator;
    std::uniform_int_distribution<IntType> _distribution;
};

} // namespace utils
