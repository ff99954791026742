#ifndef IMAGE_LOADER_H
#define IMAGE_LOADER_H

#include "../kspace/KSpaceTypes.h"
#include "../core/ErrorHandling.h"
#include <QByteArray>
#include <QImage>
#include <QString>
#include <QStringList>

namespace cv { class Mat; }

/**
 * @brief Decodes bitmaps into the grayscale grid the transform works on.
 *
 * The longer side is reduced to @p maxDim (aspect kept, other side rounded);
 * smaller images are never enlarged. Color is reduced with
 * 0.299 R + 0.587 G + 0.114 B and alpha is ignored.
 */
class ImageLoader {
public:
    static constexpr int kDefaultMaxDimension = 256;

    static Result<SampleGrid> loadFile(const QString& path, int maxDim = kDefaultMaxDimension);
    static Result<SampleGrid> loadBytes(const QByteArray& bytes, int maxDim = kDefaultMaxDimension);
    static Result<SampleGrid> fromQImage(const QImage& image, int maxDim = kDefaultMaxDimension);
    static Result<SampleGrid> fromMat(const cv::Mat& image, int maxDim = kDefaultMaxDimension);

    /** Target size after the max-dimension rule. */
    static QSize fittedSize(int width, int height, int maxDim);

    static bool isSupportedImage(const QString& path);
    static QStringList supportedSuffixes();

    /** Filter string for QFileDialog. */
    static QString fileDialogFilter();
};

#endif // IMAGE_LOADER_H
