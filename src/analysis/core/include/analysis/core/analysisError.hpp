#pragma once

#include <string_view>

namespace sensamap::analysis::core {

//! Reason an analysis request was rejected. Every value except None rejects the whole batch.
enum class AnalysisError {
	None,                     //!< Request accepted.
	EmptyBatch,               //!< No logs selected.
	InvalidCombinationSize,   //!< k outside [1, n].
	ImageMismatch,            //!< Logs were marked on different images.
	CoarsenessMismatch,       //!< Logs were marked on different grid resolutions.
	CellSizeMismatch,         //!< Logs carry different physical cell sizes.
	MalformedLog,             //!< Log content could not be interpreted.
	CellOutOfRange,           //!< Marked cell outside the grid.
	CombinationLimitExceeded, //!< Too many combinations to evaluate exhaustively.
	InvalidCellArea,          //!< Area of one cell is not a positive finite number.
	LogUnavailable,           //!< Referenced log could not be read.
};

//! Stable snake_case name of the error (used in responses).
std::string_view toString(AnalysisError error);

} // namespace sensamap::analysis::core
