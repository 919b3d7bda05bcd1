#include "analysis/core/combinations.hpp"

#include <algorithm>
#include <limits>
#include <numeric>

namespace sensamap::analysis::core {

bool isValidCombinationSize(const std::size_t n, const std::size_t k) {
	return k >= 1u && k <= n;
}

std::uint64_t combinationCount(const std::size_t n, std::size_t k) {
	if (k > n) {
		return 0u;
	}
	k = std::min(k, n - k);

	// C(n, i) = C(n, i-1) * (n-k+i) / i. Reduce by the gcd first so the intermediate product stays small.
	constexpr std::uint64_t MAX = std::numeric_limits<std::uint64_t>::max();
	std::uint64_t count         = 1u;
	for (std::uint64_t i = 1u; i <= k; ++i) {
		std::uint64_t factor  = static_cast<std::uint64_t>(n - k) + i;
		std::uint64_t divisor = i;

		const std::uint64_t g1 = std::gcd(count, divisor);
		count /= g1;
		divisor /= g1;
		const std::uint64_t g2 = std::gcd(factor, divisor);
		factor /= g2;
		divisor /= g2;

		if (count > MAX / factor) {
			return MAX;
		}
		count = count * factor / divisor;
	}
	return count;
}

CombinationEnumerator::CombinationEnumerator(const std::size_t n, const std::size_t k) : m_n{n}, m_valid{isValidCombinationSize(n, k)} {
	if (m_valid) {
		m_indices.resize(k);
		std::iota(m_indices.begin(), m_indices.end(), std::size_t{0});
	}
}

bool CombinationEnumerator::advance() {
	if (!m_valid) {
		return false;
	}

	// Find the rightmost index that can still move right, bump it and reset everything after it.
	const std::size_t k = m_indices.size();
	for (std::size_t pos = k; pos-- > 0;) {
		if (m_indices[pos] < m_n - k + pos) {
			++m_indices[pos];
			for (std::size_t j = pos + 1; j < k; ++j) {
				m_indices[j] = m_indices[j - 1] + 1;
			}
			return true;
		}
	}

	m_valid = false;
	return false;
}

std::vector<std::vector<std::size_t>> allCombinations(const std::size_t n, const std::size_t k) {
	std::vector<std::vector<std::size_t>> result;
	for (CombinationEnumerator it{n, k}; it.valid(); it.advance()) {
		result.push_back(it.current());
	}
	return result;
}

} // namespace sensamap::analysis::core
