#include "analyser.hpp"

#include "analysis/core/cellSetExtractor.hpp"
#include "analysis/core/stability.hpp"
#include "analysis/core/visualization.hpp"
#include "storage/logStore.hpp"

#include <opencv2/imgproc.hpp>

#include <iostream>

namespace sensamap::viewer {

static cv::Mat buildInfoTile(const std::string& title, const std::string& message) {
	cv::Mat tile(540, 960, CV_8UC3, cv::Scalar(20, 20, 20));
	cv::putText(tile, title, cv::Point(40, 120), cv::FONT_HERSHEY_SIMPLEX, 1.1, cv::Scalar(250, 250, 250), 2, cv::LINE_AA);
	cv::putText(tile, message, cv::Point(40, 200), cv::FONT_HERSHEY_SIMPLEX, 0.6, cv::Scalar(200, 200, 200), 1, cv::LINE_AA);
	return tile;
}

Analyser::Analyser(const std::string& logDir) {
	const storage::LogStore store{logDir};

	std::vector<std::string> filenames;
	for (const storage::LogEntry& entry: store.list()) {
		filenames.push_back(entry.filename);
	}

	const storage::LoadResult loaded = store.loadBatch(filenames);
	if (!loaded.success()) {
		m_error  = loaded.error;
		m_reason = loaded.reason;
		std::cerr << "[Error] " << m_reason << '\n';
		return;
	}

	analysis::core::ExtractionResult extracted = analysis::core::extractBatch(loaded.logs);
	if (!extracted.success()) {
		m_error  = extracted.error;
		m_reason = extracted.reason;
		std::cerr << "[Error] " << m_reason << '\n';
		return;
	}
	m_records = std::move(extracted.records);
}

cv::Mat Analyser::analyse(const std::size_t k) const {
	if (!ready()) {
		return buildInfoTile("Input Error", m_reason);
	}

	const analysis::core::StabilityResult result = analysis::core::computeStability(m_records, k);
	if (!result.success()) {
		return buildInfoTile("Stability", result.reason);
	}
	return analysis::core::buildReport(m_records, result);
}

} // namespace sensamap::viewer
