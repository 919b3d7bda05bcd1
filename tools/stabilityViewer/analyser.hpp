#pragma once

#include "analysis/core/analysisError.hpp"
#include "analysis/core/logRecord.hpp"

#include <opencv2/core/mat.hpp>

#include <string>
#include <vector>

namespace sensamap::viewer {

//! Loads a log directory once and renders the stability report for any combination size.
class Analyser {
public:
	explicit Analyser(const std::string& logDir);

	std::size_t logCount() const { return m_records.size(); }
	bool ready() const { return m_error == analysis::core::AnalysisError::None; }

	//! Report mosaic for combination size k, or an info tile explaining why there is none.
	cv::Mat analyse(std::size_t k) const;

private:
	std::vector<analysis::core::LogRecord> m_records{};
	analysis::core::AnalysisError m_error{analysis::core::AnalysisError::None};
	std::string m_reason{};
};

} // namespace sensamap::viewer
