#pragma once

#include <QImage>
#include <QMainWindow>
#include <QWidget>

#include <opencv2/core/mat.hpp>

#include <cstddef>
#include <functional>

class QComboBox;

namespace sensamap::viewer {

//! Shows a BGR image scaled to the widget, keeping the aspect ratio.
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


class MainWindow : public QMainWindow {
public:
	explicit MainWindow(std::size_t logCount, QWidget* parent = nullptr);
	~MainWindow() override;

	void setImage(const cv::Mat& image);
	void setCombinationSizeChangedCallback(std::function<void(std::size_t)> callback);
	std::size_t selectedCombinationSize() const; //!< 0 if there are no logs.

private:
	void buildLayout(std::size_t logCount);

private:
	CvMatrixView* m_matrixView{nullptr};
	QComboBox* m_kCombo{nullptr};
	std::function<void(std::size_t)> m_kChangedCallback{};
};

} // namespace sensamap::viewer
