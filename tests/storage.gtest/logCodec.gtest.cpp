#include "storage/logCodec.hpp"

#include <gtest/gtest.h>

#include <string>

namespace sensamap::storage {
namespace gtest {

using analysis::core::AnalysisError;
using analysis::core::RawLog;
using analysis::core::StabilityResult;

static const std::string VALID_LOG = R"({
  "log_id": "p07",
  "filename": "forearm.svg",
  "feedbackLocation": {
    "image_path": "forearm.svg",
    "exported_at": "20250301_101500",
    "coarseness": 80,
    "chosenPoints": { "row": [10, 11, 10], "col": [4, 4, 4] },
    "segment_size_px": { "w": 6.5, "h": 4 }
  }
})";

TEST(LogCodec, Parse_ValidLog) {
	const ParseResult r = parseLog(VALID_LOG, "p07_forearm_svg_20250301_101500.json");
	ASSERT_TRUE(r.success()) << r.reason;

	EXPECT_EQ(r.log.logId, "p07");
	EXPECT_EQ(r.log.filename, "p07_forearm_svg_20250301_101500.json");
	EXPECT_EQ(r.log.imageFilename, "forearm.svg");
	EXPECT_EQ(r.log.imagePath, "forearm.svg");
	EXPECT_EQ(r.log.exportedAt, "20250301_101500");
	EXPECT_EQ(r.log.coarseness, 80);
	EXPECT_EQ(r.log.rows, (std::vector<int>{10, 11, 10}));
	EXPECT_EQ(r.log.cols, (std::vector<int>{4, 4, 4}));
	ASSERT_TRUE(r.log.segmentSize.has_value());
	EXPECT_DOUBLE_EQ(r.log.segmentSize->w, 6.5);
	EXPECT_DOUBLE_EQ(r.log.segmentSize->h, 4.0);
}

TEST(LogCodec, Parse_WithoutStorageName_UsesFilenameField) {
	const ParseResult r = parseLog(VALID_LOG);
	ASSERT_TRUE(r.success());
	EXPECT_EQ(r.log.filename, "forearm.svg");
}

TEST(LogCodec, Parse_OptionalFieldsMissing) {
	const ParseResult r = parseLog(R"({"log_id": "x", "feedbackLocation": {"image_path": "a.svg", "coarseness": 4,
	                                   "chosenPoints": {"row": [], "col": []}}})");
	ASSERT_TRUE(r.success()) << r.reason;
	EXPECT_TRUE(r.log.exportedAt.empty());
	EXPECT_TRUE(r.log.rows.empty());
	EXPECT_FALSE(r.log.segmentSize.has_value());
}

TEST(LogCodec, Parse_MissingFilenameField_UsesStorageName) {
	const ParseResult r = parseLog(R"({"log_id": "x", "feedbackLocation": {"image_path": "a.svg", "coarseness": 4,
	                                   "chosenPoints": {"row": [0], "col": [1]}}})",
	                               "x_a_svg_20250301_101500.json");
	ASSERT_TRUE(r.success()) << r.reason;
	EXPECT_EQ(r.log.imageFilename, "x_a_svg_20250301_101500.json");
	EXPECT_EQ(r.log.filename, "x_a_svg_20250301_101500.json");
}

TEST(LogCodec, Parse_Malformed) {
	static const std::string CASES[] = {
	        "",
	        "{ not json",
	        "[1, 2, 3]",
	        R"({"feedbackLocation": {"image_path": "a.svg", "coarseness": 4, "chosenPoints": {"row": [], "col": []}}})",
	        R"({"log_id": "x"})",
	        R"({"log_id": "x", "feedbackLocation": {"coarseness": 4, "chosenPoints": {"row": [], "col": []}}})",
	        R"({"log_id": "x", "feedbackLocation": {"image_path": "a.svg", "chosenPoints": {"row": [], "col": []}}})",
	        R"({"log_id": "x", "feedbackLocation": {"image_path": "a.svg", "coarseness": "4", "chosenPoints": {"row": [], "col": []}}})",
	        R"({"log_id": "x", "feedbackLocation": {"image_path": "a.svg", "coarseness": 4}})",
	        R"({"log_id": "x", "feedbackLocation": {"image_path": "a.svg", "coarseness": 4, "chosenPoints": {"row": [1]}}})",
	        R"({"log_id": "x", "feedbackLocation": {"image_path": "a.svg", "coarseness": 4, "chosenPoints": {"row": [1.5], "col": [1]}}})",
	        R"({"log_id": "x", "feedbackLocation": {"image_path": "a.svg", "coarseness": 4, "chosenPoints": {"row": ["1"], "col": [1]}}})",
	        R"({"log_id": "x", "feedbackLocation": {"image_path": "a.svg", "coarseness": 4, "chosenPoints": {"row": [], "col": []},
	            "segment_size_px": {"w": "wide"}}})",
	        R"({"log_id": "x", "feedbackLocation": {"image_path": "a.svg", "coarseness": 4, "chosenPoints": {"row": [], "col": []},
	            "segment_size_px": {"w": -6.5, "h": 4}}})",
	        R"({"log_id": "x", "feedbackLocation": {"image_path": "a.svg", "coarseness": 4, "chosenPoints": {"row": [], "col": []},
	            "segment_size_px": {"w": 6.5, "h": 0}}})",
	        R"({"log_id": "x", "filename": 3, "feedbackLocation": {"image_path": "a.svg", "coarseness": 4, "chosenPoints": {"row": [], "col": []}}})",
	};

	for (const std::string& text: CASES) {
		const ParseResult r = parseLog(text, "broken.json");
		EXPECT_EQ(r.error, AnalysisError::MalformedLog) << text;
		EXPECT_FALSE(r.reason.empty());
	}
}

TEST(LogCodec, Serialize_ReadsBack) {
	RawLog log{};
	log.logId         = "p07";
	log.imageFilename = "forearm.svg";
	log.imagePath     = "forearm.svg";
	log.exportedAt    = "20250301_101500";
	log.coarseness    = 80;
	log.rows          = {1, 2};
	log.cols          = {3, 4};

	const std::string text = serializeLog(log);
	EXPECT_NE(text.find("\n  \"feedbackLocation\""), std::string::npos); // Two space indentation.
	EXPECT_EQ(text.find("segment_size_px"), std::string::npos);

	const ParseResult r = parseLog(text, "stored.json");
	ASSERT_TRUE(r.success()) << r.reason;
	EXPECT_EQ(r.log.logId, log.logId);
	EXPECT_EQ(r.log.imageFilename, log.imageFilename);
	EXPECT_EQ(r.log.coarseness, log.coarseness);
	EXPECT_EQ(r.log.rows, log.rows);
	EXPECT_EQ(r.log.cols, log.cols);
}

TEST(LogCodec, Response_Success) {
	StabilityResult result{};
	result.stabilityScore    = 0.5;
	result.stableOverlapArea = 2.0;
	result.bestDayArea       = 4.0;
	result.maxAreaFile       = "b.json";
	result.bestCombination   = {"a.json", "b.json"};

	const Json::Value response = toResponseJson(result);
	EXPECT_EQ(response["status"].asString(), "ok");
	EXPECT_DOUBLE_EQ(response["stability_score"].asDouble(), 0.5);
	EXPECT_DOUBLE_EQ(response["stable_overlap_area"].asDouble(), 2.0);
	EXPECT_DOUBLE_EQ(response["best_day_area"].asDouble(), 4.0);
	EXPECT_EQ(response["max_area_file"].asString(), "b.json");
	ASSERT_TRUE(response["best_combination"].isArray());
	ASSERT_EQ(response["best_combination"].size(), 2u);
	EXPECT_EQ(response["best_combination"][0].asString(), "a.json");
	EXPECT_EQ(response["best_combination"][1].asString(), "b.json");
}

TEST(LogCodec, Response_EmptyCombinationIsEmptyArray) {
	const Json::Value response = toResponseJson(StabilityResult{});
	ASSERT_TRUE(response["best_combination"].isArray());
	EXPECT_EQ(response["best_combination"].size(), 0u);
}

TEST(LogCodec, Response_Error) {
	StabilityResult result{};
	result.error  = AnalysisError::CoarsenessMismatch;
	result.reason = "different grids";

	const Json::Value response = toResponseJson(result);
	EXPECT_EQ(response["status"].asString(), "error");
	EXPECT_EQ(response["error"].asString(), "coarseness_mismatch");
	EXPECT_EQ(response["detail"].asString(), "different grids");
	EXPECT_FALSE(response.isMember("stability_score"));
}

} // namespace gtest
} // namespace sensamap::storage
