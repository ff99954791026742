#include "ImageLoader.h"
#include "../core/Logger.h"
#include <QFile>
#include <QFileInfo>
#include <QObject>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>

QSize ImageLoader::fittedSize(int width, int height, int maxDim) {
    const int longest = std::max(width, height);
    if (longest <= maxDim) return QSize(width, height);

    const double scale = static_cast<double>(maxDim) / longest;
    if (width >= height) {
        return QSize(maxDim, std::max(1, static_cast<int>(std::lround(height * scale))));
    }
    return QSize(std::max(1, static_cast<int>(std::lround(width * scale))), maxDim);
}

QStringList ImageLoader::supportedSuffixes() {
    return {"png", "jpg", "jpeg", "bmp", "tif", "tiff", "webp"};
}

bool ImageLoader::isSupportedImage(const QString& path) {
    return supportedSuffixes().contains(QFileInfo(path).suffix().toLower());
}

QString ImageLoader::fileDialogFilter() {
    QStringList patterns;
    for (const QString& s : supportedSuffixes()) patterns << "*." + s;
    return QObject::tr("Images (%1);;All Files (*)").arg(patterns.join(' '));
}

Result<SampleGrid> ImageLoader::loadFile(const QString& path, int maxDim) {
    QString err;
    if (!validateFileExists(path, &err)) {
        return Result<SampleGrid>(KSpaceError::DecodeFailure, err);
    }

    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return Result<SampleGrid>(KSpaceError::DecodeFailure,
                                  formatError("Cannot open image", path, file.errorString()));
    }
    const QByteArray bytes = file.readAll();
    file.close();

    Result<SampleGrid> grid = loadBytes(bytes, maxDim);
    if (grid) {
        Logger::info(QString("Loaded %1 as %2x%3 grid")
                         .arg(QFileInfo(path).fileName())
                         .arg(grid.value().cols).arg(grid.value().rows), "Loader");
    } else {
        Logger::warning(formatError("Failed to load image", path, grid.error()), "Loader");
    }
    return grid;
}

Result<SampleGrid> ImageLoader::loadBytes(const QByteArray& bytes, int maxDim) {
    if (bytes.isEmpty()) {
        return Result<SampleGrid>(KSpaceError::DecodeFailure, QObject::tr("Empty image data"));
    }

    cv::Mat img;
    try {
        const cv::Mat raw(1, static_cast<int>(bytes.size()), CV_8U, const_cast<char*>(bytes.constData()));
        img = cv::imdecode(raw, cv::IMREAD_UNCHANGED);
    } catch (const cv::Exception& e) {
        return Result<SampleGrid>(KSpaceError::DecodeFailure, QString::fromStdString(e.what()));
    }

    if (img.empty()) {
        return Result<SampleGrid>(KSpaceError::DecodeFailure, QObject::tr("Unrecognized image format"));
    }
    return fromMat(img, maxDim);
}

Result<SampleGrid> ImageLoader::fromQImage(const QImage& image, int maxDim) {
    if (image.isNull()) {
        return Result<SampleGrid>(KSpaceError::DecodeFailure, QObject::tr("Null image"));
    }

    const QImage rgba = image.convertToFormat(QImage::Format_RGBA8888);
    const cv::Mat view(rgba.height(), rgba.width(), CV_8UC4,
                       const_cast<uchar*>(rgba.constBits()), static_cast<size_t>(rgba.bytesPerLine()));
    cv::Mat bgra;
    cv::cvtColor(view, bgra, cv::COLOR_RGBA2BGRA);
    return fromMat(bgra, maxDim);
}

Result<SampleGrid> ImageLoader::fromMat(const cv::Mat& image, int maxDim) {
    if (maxDim <= 0) {
        return Result<SampleGrid>(KSpaceError::InvalidDimensions,
                                  QString("Invalid maximum dimension: %1").arg(maxDim));
    }
    if (image.empty()) {
        return Result<SampleGrid>(KSpaceError::DecodeFailure, QObject::tr("Empty image"));
    }

    const int ch = image.channels();
    if (ch != 1 && ch != 3 && ch != 4) {
        return Result<SampleGrid>(KSpaceError::DecodeFailure,
                                  QString("Unsupported channel count: %1").arg(ch));
    }

    // Bring every depth onto the 0..255 intensity scale.
    double scale = 1.0;
    switch (image.depth()) {
        case CV_8U:  scale = 1.0; break;
        case CV_16U: scale = 255.0 / 65535.0; break;
        case CV_32F:
        case CV_64F: scale = 255.0; break;
        default:
            return Result<SampleGrid>(KSpaceError::DecodeFailure, QObject::tr("Unsupported image bit depth"));
    }

    cv::Mat floatMat;
    image.convertTo(floatMat, CV_32FC(ch), scale);

    const QSize target = fittedSize(floatMat.cols, floatMat.rows, maxDim);
    if (target.width() != floatMat.cols || target.height() != floatMat.rows) {
        cv::Mat resized;
        cv::resize(floatMat, resized, cv::Size(target.width(), target.height()), 0, 0, cv::INTER_AREA);
        floatMat = resized;
    }

    cv::Mat gray;
    if (ch == 4) {
        cv::cvtColor(floatMat, gray, cv::COLOR_BGRA2GRAY);
    } else if (ch == 3) {
        cv::cvtColor(floatMat, gray, cv::COLOR_BGR2GRAY);
    } else {
        gray = floatMat;
    }

    SampleGrid grid(gray.rows, gray.cols);
    for (int y = 0; y < gray.rows; ++y) {
        const float* row = gray.ptr<float>(y);
        std::copy(row, row + gray.cols, grid.samples.begin() + static_cast<size_t>(y) * gray.cols);
    }
    return Result<SampleGrid>(std::move(grid));
}
