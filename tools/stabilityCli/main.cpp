#include "analysis/core/cellSetExtractor.hpp"
#include "analysis/core/stability.hpp"
#include "analysis/core/visualization.hpp"
#include "storage/logCodec.hpp"
#include "storage/logStore.hpp"

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>

#include <charconv>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace sensamap {

//! Command line options of the stability tool.
struct Options {
	std::filesystem::path logDir{"logs"};
	std::string command{};
	std::vector<std::string> arguments{};

	std::size_t k{2u};
	std::optional<double> cellArea{};
	bool pixelArea{false};
	std::uint64_t maxCombinations{analysis::core::StabilityConfig{}.maxCombinations};

	std::filesystem::path heatmapPath{};
	std::filesystem::path intersectionPath{};
	std::filesystem::path reportPath{};

	bool help{false};
};

static void printUsage(std::ostream& out) {
	out << "Usage:\n"
	       "  sensamap_stability [--log-dir DIR] list\n"
	       "  sensamap_stability [--log-dir DIR] import FILE...\n"
	       "  sensamap_stability [--log-dir DIR] analyse [--k K] [--cell-area A | --pixel-area] [--max-combinations N]\n"
	       "                     [--heatmap OUT.png] [--intersection OUT.png] [--report OUT.png] FILENAME...\n";
}

template <typename T>
static bool parseNumber(std::string_view text, T& out) {
	const auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
	return ec == std::errc{} && end == text.data() + text.size();
}

static bool parseDouble(const std::string& text, double& out) {
	try {
		std::size_t used = 0;
		out              = std::stod(text, &used);
		return used == text.size();
	} catch (const std::exception&) {
		return false;
	}
}

static std::optional<Options> parseOptions(int argc, char** argv) {
	Options options;
	for (int i = 1; i < argc; ++i) {
		const std::string_view arg = argv[i];
		const auto value           = [&]() -> std::optional<std::string> {
			if (i + 1 >= argc) {
				std::cerr << "[Error] Missing value for " << arg << ".\n";
				return std::nullopt;
			}
			return std::string(argv[++i]);
		};

		if (arg == "--log-dir") {
			const auto v = value();
			if (!v) {
				return std::nullopt;
			}
			options.logDir = *v;
		} else if (arg == "--k") {
			const auto v = value();
			if (!v || !parseNumber(*v, options.k)) {
				std::cerr << "[Error] --k expects a non-negative integer.\n";
				return std::nullopt;
			}
		} else if (arg == "--cell-area") {
			double area  = 0.0;
			const auto v = value();
			if (!v || !parseDouble(*v, area) || !(area > 0.0) || !std::isfinite(area)) {
				std::cerr << "[Error] --cell-area expects a positive number.\n";
				return std::nullopt;
			}
			options.cellArea = area;
		} else if (arg == "--pixel-area") {
			options.pixelArea = true;
		} else if (arg == "--max-combinations") {
			const auto v = value();
			if (!v || !parseNumber(*v, options.maxCombinations)) {
				std::cerr << "[Error] --max-combinations expects a non-negative integer.\n";
				return std::nullopt;
			}
		} else if (arg == "--heatmap" || arg == "--intersection" || arg == "--report") {
			const auto v = value();
			if (!v) {
				return std::nullopt;
			}
			auto& target = (arg == "--heatmap") ? options.heatmapPath : (arg == "--intersection") ? options.intersectionPath : options.reportPath;
			target       = *v;
		} else if (arg == "--help" || arg == "-h") {
			options.help = true;
			return options;
		} else if (arg.starts_with("--")) {
			std::cerr << "[Error] Unknown option " << arg << ".\n";
			return std::nullopt;
		} else if (options.command.empty()) {
			options.command = arg;
		} else {
			options.arguments.emplace_back(arg);
		}
	}

	if (options.cellArea && options.pixelArea) {
		std::cerr << "[Error] --cell-area and --pixel-area are mutually exclusive.\n";
		return std::nullopt;
	}
	if (options.command.empty()) {
		std::cerr << "[Error] No command given.\n";
		return std::nullopt;
	}
	return options;
}

static int runList(const storage::LogStore& store) {
	Json::Value logs(Json::arrayValue);
	for (const storage::LogEntry& entry: store.list()) {
		Json::Value item(Json::objectValue);
		item["path"]     = entry.path.string();
		item["filename"] = entry.filename;
		item["log_id"]   = entry.logId;
		logs.append(std::move(item));
	}

	Json::Value response(Json::objectValue);
	response["logs"] = std::move(logs);
	std::cout << storage::writeJson(response) << '\n';
	return 0;
}

static int runImport(const storage::LogStore& store, const std::vector<std::string>& files) {
	if (files.empty()) {
		std::cerr << "[Error] import expects at least one file.\n";
		return 2;
	}

	int status = 0;
	Json::Value uploaded(Json::arrayValue);
	for (const std::string& file: files) {
		const storage::SaveResult saved = store.importFile(file);
		if (!saved.success) {
			std::cerr << "[Error] " << saved.reason << '\n';
			status = 1;
			continue;
		}

		Json::Value item(Json::objectValue);
		item["path"]     = (store.directory() / saved.filename).string();
		item["filename"] = saved.filename;
		uploaded.append(std::move(item));
	}

	Json::Value response(Json::objectValue);
	response["uploaded"] = std::move(uploaded);
	std::cout << storage::writeJson(response) << '\n';
	return status;
}

//! Render and write an image if a path was requested.
template <typename Render>
static bool writeImage(const std::filesystem::path& path, Render render) {
	if (path.empty()) {
		return true;
	}
	try {
		if (!cv::imwrite(path.string(), render())) {
			std::cerr << "[Error] Could not write image " << path << ".\n";
			return false;
		}
	} catch (const cv::Exception& e) {
		std::cerr << "[Error] Could not write image " << path << ": " << e.what() << '\n';
		return false;
	}
	return true;
}

static int reportFailure(const analysis::core::StabilityResult& result) {
	std::cerr << "[Error] " << result.reason << '\n';
	std::cout << storage::writeJson(storage::toResponseJson(result)) << '\n';
	return 1;
}

static int runAnalyse(const storage::LogStore& store, const Options& options) {
	using namespace analysis::core;

	const storage::LoadResult loaded = store.loadBatch(options.arguments);
	if (!loaded.success()) {
		StabilityResult failed{};
		failed.error  = loaded.error;
		failed.reason = loaded.reason;
		return reportFailure(failed);
	}

	ExtractionResult extracted = extractBatch(loaded.logs);
	if (!extracted.success()) {
		StabilityResult failed{};
		failed.error  = extracted.error;
		failed.reason = extracted.reason;
		return reportFailure(failed);
	}

	StabilityConfig config{};
	config.maxCombinations = options.maxCombinations;
	if (options.cellArea) {
		config.cellArea = *options.cellArea;
	} else if (options.pixelArea) {
		config.cellArea = cellAreaFromSegmentSize(extracted.records);
	}

	const StabilityResult result = computeStability(extracted.records, options.k, config);
	if (!result.success()) {
		return reportFailure(result);
	}

	std::cout << storage::writeJson(storage::toResponseJson(result)) << '\n';

	const RenderConfig render{};
	const auto& records = extracted.records;
	bool imagesOk       = writeImage(options.heatmapPath, [&] { return renderHeatmap(records, render); });
	imagesOk            = writeImage(options.intersectionPath, [&] { return renderIntersection(records, result.bestIndices, render); }) && imagesOk;
	imagesOk            = writeImage(options.reportPath, [&] { return buildReport(records, result, render); }) && imagesOk;
	return imagesOk ? 0 : 1;
}

} // namespace sensamap

int main(int argc, char** argv) {
	const auto options = sensamap::parseOptions(argc, argv);
	if (!options) {
		sensamap::printUsage(std::cerr);
		return 2;
	}
	if (options->help) {
		sensamap::printUsage(std::cout);
		return 0;
	}

	const sensamap::storage::LogStore store{options->logDir};

	if (options->command == "list") {
		return sensamap::runList(store);
	}
	if (options->command == "import") {
		return sensamap::runImport(store, options->arguments);
	}
	if (options->command == "analyse" || options->command == "analyze") {
		return sensamap::runAnalyse(store, *options);
	}

	std::cerr << "[Error] Unknown command '" << options->command << "'.\n";
	sensamap::printUsage(std::cerr);
	return 2;
}
