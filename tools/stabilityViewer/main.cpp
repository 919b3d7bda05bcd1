#include <string>

#include <QApplication>

#include "analyser.hpp"
#include "mainWindow.hpp"

// Interactive view of the stability analysis of one log directory.
// All logs in the directory form the batch. Changing k recomputes and redraws the report.
int main(int argc, char** argv) {
	QApplication application(argc, argv);

	const std::string logDir = (argc > 1) ? argv[1] : "logs";
	const sensamap::viewer::Analyser analyser{logDir};

	sensamap::viewer::MainWindow window{analyser.logCount()};
	window.resize(1400, 900);
	window.setCombinationSizeChangedCallback([&](std::size_t k) { window.setImage(analyser.analyse(k)); });
	window.setImage(analyser.analyse(window.selectedCombinationSize()));
	window.show();

	return application.exec();
}
