#pragma once

#include "viewStep.hpp"

#include <QImage>
#include <QMainWindow>
#include <QWidget>

#include <opencv2/core/mat.hpp>

#include <functional>

class QComboBox;
class QDoubleSpinBox;
class QSpinBox;

namespace bullpen {

class CvMatrixView : public QWidget {
public:
	explicit CvMatrixView(QWidget* parent = nullptr);
	void setMat(const cv::Mat& mat);

protected:
	void paintEvent(QPaintEvent* event) override;

private:
	static QImage matToQImage(const cv::Mat& mat);

	QImage m_image{};
};

//! Tunable values exposed in the window.
struct TunerSettings {
	int influenceRadius;
	int blurPasses;
	double gamma;
};

class MainWindow : public QMainWindow {
public:
	explicit MainWindow(const TunerSettings& initial, QWidget* parent = nullptr);
	~MainWindow() override;

	void setImage(const cv::Mat& image);
	void setViewChangedCallback(std::function<void(ViewStep)> callback);
	void setSettingsChangedCallback(std::function<void(const TunerSettings&)> callback);
	ViewStep selectedView() const;
	TunerSettings settings() const;

private:
	void buildLayout(const TunerSettings& initial);

private:
	CvMatrixView* m_matrixView{nullptr};
	QComboBox* m_viewCombo{nullptr};
	QSpinBox* m_radiusSpin{nullptr};
	QSpinBox* m_passesSpin{nullptr};
	QDoubleSpinBox* m_gammaSpin{nullptr};
	std::function<void(ViewStep)> m_viewChangedCallback{};
	std::function<void(const TunerSettings&)> m_settingsChangedCallback{};
};

} // namespace bullpen
