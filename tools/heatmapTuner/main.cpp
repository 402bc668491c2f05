#include <chrono>
#include <filesystem>
#include <iostream>
#include <utility>

#include <QApplication>

#include "analyser.hpp"
#include "mainWindow.hpp"
#include "sessionLoader.hpp"

// Manual tuning of the heatmap pipeline.
// Usage: bullpen_heatmap_tuner [pitches.csv]
// Without a file a synthetic bullpen session is shown.
int main(int argc, char** argv) {
	QApplication application(argc, argv);

	const bullpen::Date today = std::chrono::floor<std::chrono::days>(std::chrono::system_clock::now());

	bullpen::Session session = bullpen::syntheticSession(today);
	if (argc > 1) {
		const std::filesystem::path inputPath = argv[1]; // Path from command line.
		const auto loaded                     = bullpen::loadSessionCsv(inputPath, today);
		if (!loaded) {
			std::cerr << "[Error] Could not load " << inputPath << ", showing the synthetic session.\n";
		} else {
			session = *loaded;
		}
	}

	bullpen::Analyser analyser(std::move(session), today);

	const bullpen::TunerSettings initial{analyser.densityConfig().influenceRadius, analyser.densityConfig().blurPasses, analyser.heatmapConfig().gamma};
	bullpen::MainWindow window(initial);
	window.resize(1400, 900);

	window.setViewChangedCallback([&window, &analyser](bullpen::ViewStep step) { window.setImage(analyser.analyse(step)); });
	window.setSettingsChangedCallback([&window, &analyser](const bullpen::TunerSettings& settings) {
		analyser.densityConfig().influenceRadius = settings.influenceRadius;
		analyser.densityConfig().blurPasses      = settings.blurPasses;
		analyser.heatmapConfig().gamma           = settings.gamma;
		window.setImage(analyser.analyse(window.selectedView()));
	});

	window.setImage(analyser.analyse(window.selectedView()));
	window.show();

	return application.exec();
}
