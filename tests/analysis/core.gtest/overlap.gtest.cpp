#include "analysis/core/overlap.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace sensamap::analysis::core {
namespace gtest {

//! Canonical record (cells must already be sorted and unique).
static LogRecord makeRecord(std::string filename, CellSet cells) {
	LogRecord record{};
	record.filename   = std::move(filename);
	record.imagePath  = "hand.svg";
	record.coarseness = 4;
	record.cells      = std::move(cells);
	return record;
}

TEST(Overlap, AreaOf_CountsCells) {
	const LogRecord log = makeRecord("a.json", {{0, 0}, {0, 1}});
	EXPECT_DOUBLE_EQ(areaOf(log), 2.0);
	EXPECT_DOUBLE_EQ(areaOf(log, 20.0), 40.0);
	EXPECT_DOUBLE_EQ(areaOf(makeRecord("b.json", {})), 0.0);
}

TEST(Overlap, Singleton_EqualsOwnArea) {
	const std::vector<LogRecord> records{makeRecord("a.json", {{0, 0}, {0, 1}, {1, 1}}), makeRecord("b.json", {{2, 2}})};
	EXPECT_DOUBLE_EQ(overlapArea(records, {0}), areaOf(records[0]));
	EXPECT_DOUBLE_EQ(overlapArea(records, {1}, 3.0), areaOf(records[1], 3.0));
}

TEST(Overlap, Intersection_AcrossAllMembers) {
	const std::vector<LogRecord> records{
	        makeRecord("a.json", {{0, 0}, {0, 1}, {1, 1}}),
	        makeRecord("b.json", {{0, 0}, {1, 1}}),
	        makeRecord("c.json", {{0, 0}, {0, 1}}),
	};

	EXPECT_EQ(intersectCells(records, {0, 1}), (CellSet{{0, 0}, {1, 1}}));
	EXPECT_EQ(intersectCells(records, {0, 2}), (CellSet{{0, 0}, {0, 1}}));
	EXPECT_EQ(intersectCells(records, {1, 2}), (CellSet{{0, 0}}));
	EXPECT_EQ(intersectCells(records, {0, 1, 2}), (CellSet{{0, 0}}));

	EXPECT_DOUBLE_EQ(overlapArea(records, {0, 1}), 2.0);
	EXPECT_DOUBLE_EQ(overlapArea(records, {1, 2}), 1.0);
	EXPECT_DOUBLE_EQ(overlapArea(records, {0, 1, 2}, 0.5), 0.5);
}

TEST(Overlap, Disjoint_IsZero) {
	const std::vector<LogRecord> records{makeRecord("a.json", {{0, 0}}), makeRecord("b.json", {{3, 3}}), makeRecord("c.json", {{0, 0}, {3, 3}})};
	EXPECT_TRUE(intersectCells(records, {0, 1}).empty());
	EXPECT_DOUBLE_EQ(overlapArea(records, {0, 1, 2}), 0.0);
}

TEST(Overlap, DoesNotModifyInput) {
	const std::vector<LogRecord> records{makeRecord("a.json", {{0, 0}, {0, 1}}), makeRecord("b.json", {{0, 1}})};
	const std::vector<LogRecord> copy = records;

	(void)overlapArea(records, {0, 1});
	ASSERT_EQ(records.size(), copy.size());
	for (std::size_t i = 0; i < records.size(); ++i) {
		EXPECT_EQ(records[i].cells, copy[i].cells);
	}
}

} // namespace gtest
} // namespace sensamap::analysis::core
