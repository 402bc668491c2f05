#include "mainWindow.hpp"

#include <QComboBox>
#include <QDoubleSpinBox>
#include <QHBoxLayout>
#include <QLabel>
#include <QPainter>
#include <QSpinBox>
#include <QVBoxLayout>

#include <opencv2/imgproc.hpp>

#include <utility>

namespace bullpen {

CvMatrixView::CvMatrixView(QWidget* parent) : QWidget(parent) {
}

void CvMatrixView::setMat(const cv::Mat& mat) {
	m_image = matToQImage(mat);
	update();
}

void CvMatrixView::paintEvent(QPaintEvent* event) {
	QWidget::paintEvent(event);

	QPainter painter(this);
	painter.fillRect(rect(), Qt::black);

	if (m_image.isNull()) {
		return;
	}

	const QImage scaled = m_image.scaled(size(), Qt::KeepAspectRatio, Qt::FastTransformation);
	const QPoint topLeft((width() - scaled.width()) / 2, (height() - scaled.height()) / 2);
	painter.drawImage(topLeft, scaled);
}

QImage CvMatrixView::matToQImage(const cv::Mat& mat) {
	if (mat.empty()) {
		return {};
	}

	switch (mat.type()) {
	case CV_8UC1: {
		const QImage image(mat.data, mat.cols, mat.rows, static_cast<int>(mat.step), QImage::Format_Grayscale8);
		return image.copy();
	}
	case CV_8UC3: {
		cv::Mat rgb;
		cv::cvtColor(mat, rgb, cv::COLOR_BGR2RGB);
		const QImage image(rgb.data, rgb.cols, rgb.rows, static_cast<int>(rgb.step), QImage::Format_RGB888);
		return image.copy();
	}
	case CV_64FC1: {
		// Raw density grid.
		cv::Mat gray;
		cv::normalize(mat, gray, 0.0, 255.0, cv::NORM_MINMAX, CV_8U);
		const QImage image(gray.data, gray.cols, gray.rows, static_cast<int>(gray.step), QImage::Format_Grayscale8);
		return image.copy();
	}
	default:
		return {};
	}
}

MainWindow::MainWindow(const TunerSettings& initial, QWidget* parent) : QMainWindow(parent) {
	setWindowTitle("Heatmap Tuner");
	buildLayout(initial);
}

MainWindow::~MainWindow() = default;

void MainWindow::setImage(const cv::Mat& image) {
	if (m_matrixView != nullptr) {
		m_matrixView->setMat(image);
	}
}

void MainWindow::setViewChangedCallback(std::function<void(ViewStep)> callback) {
	m_viewChangedCallback = std::move(callback);
}

void MainWindow::setSettingsChangedCallback(std::function<void(const TunerSettings&)> callback) {
	m_settingsChangedCallback = std::move(callback);
}

ViewStep MainWindow::selectedView() const {
	return static_cast<ViewStep>(m_viewCombo->currentData().toInt());
}

TunerSettings MainWindow::settings() const {
	return {m_radiusSpin->value(), m_passesSpin->value(), m_gammaSpin->value()};
}

void MainWindow::buildLayout(const TunerSettings& initial) {
	auto* rootWidget = new QWidget(this);
	auto* rootLayout = new QVBoxLayout(rootWidget);
	auto* controls   = new QHBoxLayout();

	m_viewCombo = new QComboBox(rootWidget);
	m_viewCombo->addItem("Heatmap", static_cast<int>(ViewStep::Heatmap));
	m_viewCombo->addItem("Density stages", static_cast<int>(ViewStep::DensityStages));
	m_viewCombo->addItem("Badges", static_cast<int>(ViewStep::Badges));
	m_viewCombo->setCurrentIndex(0);

	m_radiusSpin = new QSpinBox(rootWidget);
	m_radiusSpin->setRange(0, 30);
	m_radiusSpin->setValue(initial.influenceRadius);

	m_passesSpin = new QSpinBox(rootWidget);
	m_passesSpin->setRange(0, 10);
	m_passesSpin->setValue(initial.blurPasses);

	m_gammaSpin = new QDoubleSpinBox(rootWidget);
	m_gammaSpin->setRange(0.1, 3.0);
	m_gammaSpin->setSingleStep(0.05);
	m_gammaSpin->setValue(initial.gamma);

	controls->addWidget(new QLabel("View:", rootWidget));
	controls->addWidget(m_viewCombo);
	controls->addSpacing(24);
	controls->addWidget(new QLabel("Radius:", rootWidget));
	controls->addWidget(m_radiusSpin);
	controls->addWidget(new QLabel("Blur passes:", rootWidget));
	controls->addWidget(m_passesSpin);
	controls->addWidget(new QLabel("Gamma:", rootWidget));
	controls->addWidget(m_gammaSpin);
	controls->addStretch(1);

	m_matrixView = new CvMatrixView(rootWidget);

	rootLayout->addLayout(controls);
	rootLayout->addWidget(m_matrixView, 1);
	setCentralWidget(rootWidget);

	connect(m_viewCombo, QOverload<int>::of(&QComboBox::currentIndexChanged), this, [this](int) {
		if (m_viewChangedCallback) {
			m_viewChangedCallback(selectedView());
		}
	});

	const auto notifySettings = [this]() {
		if (m_settingsChangedCallback) {
			m_settingsChangedCallback(settings());
		}
	};
	connect(m_radiusSpin, QOverload<int>::of(&QSpinBox::valueChanged), this, notifySettings);
	connect(m_passesSpin, QOverload<int>::of(&QSpinBox::valueChanged), this, notifySettings);
	connect(m_gammaSpin, QOverload<double>::of(&QDoubleSpinBox::valueChanged), this, notifySettings);
}

} // namespace bullpen
