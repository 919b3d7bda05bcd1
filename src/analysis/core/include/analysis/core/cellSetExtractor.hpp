#pragma once

#include "analysis/core/analysisError.hpp"
#include "analysis/core/logRecord.hpp"

#include <string>
#include <vector>

namespace sensamap::analysis::core {

//! Result of the extraction stage.
struct ExtractionResult {
	AnalysisError error{AnalysisError::None}; //!< None on success.
	std::string reason{};                     //!< Human readable description of the failure.
	std::vector<LogRecord> records{};         //!< Canonical records in input order. Empty on failure.

	bool success() const { return error == AnalysisError::None; }
};

//! True if both edges are positive and finite.
bool isValidSegmentSize(const SegmentSize& size);

//! Canonicalise the marked cells of a single log (sort, remove duplicates).
//! \note Does not check the batch level invariants. Coordinates are validated against the log's own coarseness.
ExtractionResult extractLog(const RawLog& log);

/*! Validate a batch of raw logs and turn them into canonical records.
 *  The batch is rejected as a whole if it is empty, if any log is malformed or contains a cell outside the grid,
 *  or if the logs disagree on image, coarseness or (where given) physical cell size.
 *
 * \param [in] batch Raw logs in the order the user selected them. The order is kept.
 * \return     ExtractionResult holding one record per input log, or the first error found.
 */
ExtractionResult extractBatch(const std::vector<RawLog>& batch);

//! Pixel area of one cell (w * h) from the first record carrying a segment size. 1.0 if none does.
double cellAreaFromSegmentSize(const std::vector<LogRecord>& records);

} // namespace sensamap::analysis::core
