#include "analysis/core/stability.hpp"

#include "analysis/core/cellSetExtractor.hpp"
#include "analysis/core/combinations.hpp"
#include "analysis/core/overlap.hpp"

#include <cmath>
#include <format>

namespace sensamap::analysis::core {

static StabilityResult fail(const AnalysisError error, std::string reason) {
	StabilityResult result{};
	result.error  = error;
	result.reason = std::move(reason);
	return result;
}

StabilityResult computeStability(const std::vector<LogRecord>& records, const std::size_t k, const StabilityConfig& config) {
	const std::size_t n = records.size();
	if (n == 0u) {
		return fail(AnalysisError::EmptyBatch, "Select at least one log.");
	}
	if (!isValidCombinationSize(n, k)) {
		return fail(AnalysisError::InvalidCombinationSize, std::format("Combination size k={} must be between 1 and {}.", k, n));
	}
	if (!(config.cellArea > 0.0) || !std::isfinite(config.cellArea)) {
		return fail(AnalysisError::InvalidCellArea, std::format("Cell area {} must be a positive finite number.", config.cellArea));
	}
	const std::uint64_t combinations = combinationCount(n, k);
	if (combinations > config.maxCombinations) {
		return fail(AnalysisError::CombinationLimitExceeded,
		            std::format("C({}, {}) = {} combinations exceeds the limit of {}.", n, k, combinations, config.maxCombinations));
	}

	StabilityResult result{};
	result.k = k;

	// 1) Best day: largest single log, first one wins ties.
	std::size_t maxAreaIndex = 0u;
	for (std::size_t i = 0; i < n; ++i) {
		const double area = areaOf(records[i], config.cellArea);
		if (i == 0u || area > result.bestDayArea) {
			result.bestDayArea = area;
			maxAreaIndex       = i;
		}
	}
	result.maxAreaFile = records[maxAreaIndex].filename;

	// 2) Most stable subset: only replace on strict improvement so the first subset in enumeration order wins ties.
	bool haveBest = false;
	for (CombinationEnumerator it{n, k}; it.valid(); it.advance()) {
		const double area = overlapArea(records, it.current(), config.cellArea);
		++result.combinationsEvaluated;

		if (!haveBest || area > result.stableOverlapArea) {
			result.stableOverlapArea = area;
			result.bestIndices       = it.current();
			haveBest                 = true;
		}
	}

	// 3) Score. Undefined without a reference area -> 0 and no combination.
	if (result.bestDayArea > 0.0) {
		result.stabilityScore = result.stableOverlapArea / result.bestDayArea;
		result.bestCombination.reserve(result.bestIndices.size());
		for (const std::size_t index: result.bestIndices) {
			result.bestCombination.push_back(records[index].filename);
		}
	} else {
		result.stabilityScore = 0.0;
		result.bestIndices.clear();
	}

	return result;
}

StabilityResult analyseBatch(const std::vector<RawLog>& batch, const std::size_t k, const StabilityConfig& config) {
	ExtractionResult extracted = extractBatch(batch);
	if (!extracted.success()) {
		return fail(extracted.error, std::move(extracted.reason));
	}
	return computeStability(extracted.records, k, config);
}

} // namespace sensamap::analysis::core
