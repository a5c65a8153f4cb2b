/*
 * prime.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-12

Description: Prime helpers used to size hash bucket tables

**************************************************/

#include "prime.hpp"

#include <array>
#include <limits>

#include "enumkit/error/exception.hpp"

namespace enumkit::algorithm {

namespace {
constexpr std::size_t MIN_BUCKET_PRIME = 3;

// Sieve for the small sizes that cover nearly every enum domain.
constexpr std::size_t PRIME_CACHE_SIZE = 1024;

constexpr auto buildSieve() {
    std::array<bool, PRIME_CACHE_SIZE> sieve{};
    for (std::size_t i = 2; i < PRIME_CACHE_SIZE; ++i) {
        sieve[i] = true;
    }
    for (std::size_t i = 2; i * i < PRIME_CACHE_SIZE; ++i) {
        if (sieve[i]) {
            for (std::size_t j = i * i; j < PRIME_CACHE_SIZE; j += i) {
                sieve[j] = false;
            }
        }
    }
    return sieve;
}

constexpr auto SMALL_PRIMES = buildSieve();
}  // namespace

auto isPrime(std::uint64_t n) noexcept -> bool {
    if (n < PRIME_CACHE_SIZE) {
        return SMALL_PRIMES[static_cast<std::size_t>(n)];
    }
    if (n % 2 == 0 || n % 3 == 0) {
        return false;
    }
    for (std::uint64_t i = 5; i <= n / i; i += 6) {
        if (n % i == 0 || n % (i + 2) == 0) {
            return false;
        }
    }
    return true;
}

auto nextPrime(std::size_t n) -> std::size_t {
    if (n <= MIN_BUCKET_PRIME) {
        return MIN_BUCKET_PRIME;
    }
    for (std::size_t candidate = n | 1;
         candidate >= n && candidate < std::numeric_limits<std::size_t>::max();
         candidate += 2) {
        if (isPrime(candidate)) {
            return candidate;
        }
    }
    THROW_OUT_OF_RANGE("No prime capacity available at or above {}", n);
}

}  // namespace enumkit::algorithm
