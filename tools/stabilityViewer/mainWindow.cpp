#include "mainWindow.hpp"

#include <QComboBox>
#include <QHBoxLayout>
#include <QLabel>
#include <QPainter>
#include <QVBoxLayout>

#include <opencv2/imgproc.hpp>

#include <algorithm>

namespace sensamap::viewer {

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

	// Cells are hard edged, no smoothing.
	const QImage scaled = m_image.scaled(size(), Qt::KeepAspectRatio, Qt::FastTransformation);
	const QPoint topLeft((width() - scaled.width()) / 2, (height() - scaled.height()) / 2);
	painter.drawImage(topLeft, scaled);
}

QImage CvMatrixView::matToQImage(const cv::Mat& mat) {
	if (mat.empty() || mat.type() != CV_8UC3) {
		return {};
	}

	cv::Mat rgb;
	cv::cvtColor(mat, rgb, cv::COLOR_BGR2RGB);
	const QImage image(rgb.data, rgb.cols, rgb.rows, static_cast<int>(rgb.step), QImage::Format_RGB888);
	return image.copy();
}

MainWindow::MainWindow(const std::size_t logCount, QWidget* parent) : QMainWindow(parent) {
	setWindowTitle("Trial Stability");
	buildLayout(logCount);
}

MainWindow::~MainWindow() = default;

void MainWindow::setImage(const cv::Mat& image) {
	if (m_matrixView != nullptr) {
		m_matrixView->setMat(image);
	}
}

void MainWindow::setCombinationSizeChangedCallback(std::function<void(std::size_t)> callback) {
	m_kChangedCallback = std::move(callback);
}

std::size_t MainWindow::selectedCombinationSize() const {
	if (m_kCombo == nullptr || m_kCombo->currentIndex() < 0) {
		return 0u;
	}
	return static_cast<std::size_t>(m_kCombo->currentIndex()) + 1u;
}

void MainWindow::buildLayout(const std::size_t logCount) {
	auto* rootWidget = new QWidget(this);
	auto* rootLayout = new QVBoxLayout(rootWidget);
	auto* kRow       = new QHBoxLayout();
	auto* kLabel     = new QLabel("Combination size k:", rootWidget);
	auto* countLabel = new QLabel(QString("of %1 logs").arg(static_cast<qulonglong>(logCount)), rootWidget);

	m_kCombo = new QComboBox(rootWidget);
	for (std::size_t k = 1; k <= logCount; ++k) {
		m_kCombo->addItem(QString::number(static_cast<qulonglong>(k)));
	}
	if (logCount > 0u) {
		m_kCombo->setCurrentIndex(static_cast<int>(std::min<std::size_t>(2u, logCount)) - 1);
	}
	QObject::connect(m_kCombo, &QComboBox::currentIndexChanged, [this](int) {
		if (m_kChangedCallback) {
			m_kChangedCallback(selectedCombinationSize());
		}
	});

	kRow->addWidget(kLabel);
	kRow->addWidget(m_kCombo);
	kRow->addWidget(countLabel);
	kRow->addStretch(1);

	m_matrixView = new CvMatrixView(rootWidget);

	rootLayout->addLayout(kRow);
	rootLayout->addWidget(m_matrixView, 1);

	setCentralWidget(rootWidget);
}

} // namespace sensamap::viewer
