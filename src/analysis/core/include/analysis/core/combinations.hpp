#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace sensamap::analysis::core {

//! True if size-k subsets of n items can be enumerated (1 <= k <= n).
bool isValidCombinationSize(std::size_t n, std::size_t k);

//! Binomial coefficient C(n, k). Saturates at UINT64_MAX. 0 for k > n.
std::uint64_t combinationCount(std::size_t n, std::size_t k);

/*! Enumerates every size-k subset of the indices 0..n-1 exactly once, in lexicographic order.
 *  The first subset is {0, 1, ..., k-1}, the last is {n-k, ..., n-1}. Indices within a subset are increasing.
 *  An enumerator constructed with an invalid k (see isValidCombinationSize) is invalid and yields nothing.
 *
 *  Usage:
 *    for (CombinationEnumerator it{n, k}; it.valid(); it.advance()) { use(it.current()); }
 */
class CombinationEnumerator {
public:
	CombinationEnumerator(std::size_t n, std::size_t k);

	bool valid() const { return m_valid; }                                //!< Current subset is available.
	const std::vector<std::size_t>& current() const { return m_indices; } //!< Indices of the current subset.

	//! Step to the next subset. Returns false (and becomes invalid) after the last one.
	bool advance();

private:
	std::size_t m_n;
	bool m_valid;
	std::vector<std::size_t> m_indices{};
};

//! All size-k subsets of 0..n-1 in enumeration order. Empty if k is invalid.
std::vector<std::vector<std::size_t>> allCombinations(std::size_t n, std::size_t k);

} // namespace sensamap::analysis::core
