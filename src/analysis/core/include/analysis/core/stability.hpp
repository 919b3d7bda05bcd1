#pragma once

#include "analysis/core/analysisError.hpp"
#include "analysis/core/logRecord.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// Stability of a marked region across repeated trials.
// Given n trials of the same image and grid and a combination size k, every size-k subset of trials is scored by the area
// its members have in common. The best subset is compared against the largest single trial ("best day"):
//   stability = max over subsets |intersection| / max over trials |cells|
// Ties are broken by input order everywhere so that the result is reproducible.
namespace sensamap::analysis::core {

//! Parameters of the stability computation.
struct StabilityConfig {
	double cellArea{1.0};                    //!< Area of one grid cell. 1 -> areas are cell counts.
	std::uint64_t maxCombinations{1000000u}; //!< Reject requests with more C(n, k) subsets than this.
};

//! Result of the stability computation.
struct StabilityResult {
	AnalysisError error{AnalysisError::None}; //!< None on success. All fields below are only meaningful on success.
	std::string reason{};                     //!< Why the request was rejected.

	double stabilityScore{0.0};    //!< stableOverlapArea / bestDayArea in [0, 1]. 0 if no log marked anything.
	double stableOverlapArea{0.0}; //!< Largest overlap area of any size-k subset.
	double bestDayArea{0.0};       //!< Largest area of a single log.
	std::string maxAreaFile{};     //!< Filename of the first log with bestDayArea.

	std::vector<std::string> bestCombination{}; //!< Filenames of the winning subset in input order. Empty if bestDayArea is 0.
	std::vector<std::size_t> bestIndices{};     //!< Input indices of the winning subset (aligned to bestCombination).

	std::size_t k{0u};                       //!< Combination size used.
	std::uint64_t combinationsEvaluated{0u}; //!< Number of subsets scored.

	bool success() const { return error == AnalysisError::None; }
};

/*! Find the size-k subset of trials with the largest common area and relate it to the largest single trial.
 * \param [in] records Validated records of one batch (see extractBatch). Not modified.
 * \param [in] k       Combination size, 1 <= k <= records.size().
 * \param [in] config  Area unit and combination ceiling.
 * \return     StabilityResult. On failure only error and reason are set.
 */
StabilityResult computeStability(const std::vector<LogRecord>& records, std::size_t k, const StabilityConfig& config = StabilityConfig{});

//! Validate and canonicalise raw logs (extractBatch) and run computeStability on them.
StabilityResult analyseBatch(const std::vector<RawLog>& batch, std::size_t k, const StabilityConfig& config = StabilityConfig{});

} // namespace sensamap::analysis::core
