#ifndef IMAGE_WRITER_H
#define IMAGE_WRITER_H

#include "../kspace/KSpaceTypes.h"
#include <QString>

class ImageWriter {
public:
    /** Writes an 8-bit single channel PNG. */
    static bool savePng(const GrayscaleImage& image, const QString& filePath, QString* errorMsg = nullptr);
};

#endif // IMAGE_WRITER_H
