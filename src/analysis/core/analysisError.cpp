#include "analysis/core/analysisError.hpp"

namespace sensamap::analysis::core {

std::string_view toString(const AnalysisError error) {
	switch (error) {
	case AnalysisError::None:
		return "none";
	case AnalysisError::EmptyBatch:
		return "empty_batch";
	case AnalysisError::InvalidCombinationSize:
		return "invalid_combination_size";
	case AnalysisError::ImageMismatch:
		return "image_mismatch";
	case AnalysisError::CoarsenessMismatch:
		return "coarseness_mismatch";
	case AnalysisError::CellSizeMismatch:
		return "cell_size_mismatch";
	case AnalysisError::MalformedLog:
		return "malformed_log";
	case AnalysisError::CellOutOfRange:
		return "cell_out_of_range";
	case AnalysisError::CombinationLimitExceeded:
		return "combination_limit_exceeded";
	case AnalysisError::InvalidCellArea:
		return "invalid_cell_area";
	case AnalysisError::LogUnavailable:
		return "log_unavailable";
	}
	return "unknown";
}

} // namespace sensamap::analysis::core
