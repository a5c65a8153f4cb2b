/*
 * prime.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-12

Description: Prime helpers used to size hash bucket tables

**************************************************/

#ifndef ENUMKIT_ALGORITHM_PRIME_HPP
#define ENUMKIT_ALGORITHM_PRIME_HPP

#include <cstddef>
#include <cstdint>

namespace enumkit::algorithm {

/**
 * @brief Prime number checker using trial division over 6k +/- 1
 *
 * @param n Number to check
 * @return true If n is prime
 * @return false If n is not prime
 */
[[nodiscard]] auto isPrime(std::uint64_t n) noexcept -> bool;

/**
 * @brief Smallest prime greater than or equal to @p n
 *
 * Bucket tables never go below 3 slots, so any request under 3 yields 3.
 *
 * @throws enumkit::error::OutOfRange if no such prime fits in std::size_t
 */
[[nodiscard]] auto nextPrime(std::size_t n) -> std::size_t;

}  // namespace enumkit::algorithm

#endif  // ENUMKIT_ALGORITHM_PRIME_HPP
