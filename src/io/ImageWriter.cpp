#include "ImageWriter.h"
#include "../core/ErrorHandling.h"
#include "../core/Logger.h"
#include <QObject>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>

bool ImageWriter::savePng(const GrayscaleImage& image, const QString& filePath, QString* errorMsg) {
    if (!image.isValid()) {
        if (errorMsg) *errorMsg = QObject::tr("Nothing to export.");
        return false;
    }

    const cv::Mat mat(image.rows, image.cols, CV_8UC1, const_cast<uint8_t*>(image.pixels.data()));
    bool ok = false;
    try {
        ok = cv::imwrite(filePath.toStdString(), mat, {cv::IMWRITE_PNG_COMPRESSION, 6});
    } catch (const cv::Exception& e) {
        if (errorMsg) *errorMsg = formatError("Failed to write PNG", filePath, QString::fromStdString(e.what()));
        Logger::error(formatError("Failed to write PNG", filePath, QString::fromStdString(e.what())), "Loader");
        return false;
    }

    if (!ok) {
        if (errorMsg) *errorMsg = formatError("Failed to write PNG", filePath, "encoder refused the file");
        return false;
    }

    Logger::info(QString("Exported %1x%2 PNG to %3").arg(image.cols).arg(image.rows).arg(filePath), "Loader");
    return true;
}
