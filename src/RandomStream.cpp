#include "RandomStream.h"

#include <cmath>
#include <numeric>
#include <utility>

void RandomStream::reseed(uint32_t seed) {
    engine_.seed(seed);
    hasSpare_ = false;
    spare_ = 0.0;
}

double RandomStream::nextDouble() {
    const uint32_t a = nextUInt32() >> 5;
    const uint32_t b = nextUInt32() >> 6;
    return (static_cast<double>(a) * 67108864.0 + static_cast<double>(b)) / 9007199254740992.0;
}

double RandomStream::gauss() {
    if (hasSpare_) {
        hasSpare_ = false;
        return spare_;
    }

    double x1 = 0.0;
    double x2 = 0.0;
    double r2 = 0.0;
    do {
        x1 = 2.0 * nextDouble() - 1.0;
        x2 = 2.0 * nextDouble() - 1.0;
        r2 = x1 * x1 + x2 * x2;
    } while (r2 >= 1.0 || r2 == 0.0);

    const double f = std::sqrt(-2.0 * std::log(r2) / r2);
    spare_ = f * x1;
    hasSpare_ = true;
    return f * x2;
}

uint64_t RandomStream::interval(uint64_t maxInclusive) {
    if (maxInclusive == 0) return 0;

    uint64_t mask = maxInclusive;
    mask |= mask >> 1;
    mask |= mask >> 2;
    mask |= mask >> 4;
    mask |= mask >> 8;
    mask |= mask >> 16;
    mask |= mask >> 32;

    uint64_t value = 0;
    if (maxInclusive <= 0xffffffffULL) {
        while ((value = (static_cast<uint64_t>(nextUInt32()) & mask)) > maxInclusive) {}
    } else {
        do {
            const uint64_t hi = nextUInt32();
            const uint64_t lo = nextUInt32();
            value = ((hi << 32) | lo) & mask;
        } while (value > maxInclusive);
    }
    return value;
}

std::vector<size_t> RandomStream::permutation(size_t n) {
    std::vector<size_t> order(n);
    std::iota(order.begin(), order.end(), size_t{0});
    for (size_t i = n; i-- > 1;) {
        const size_t j = static_cast<size_t>(interval(i));
        std::swap(order[i], order[j]);
    }
    return order;
}
