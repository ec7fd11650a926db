#ifndef IMAGESAVEUTILS_H
#define IMAGESAVEUTILS_H

#include <QByteArray>
#include <QImage>
#include <QString>

/**
 * @brief Writes screenshots to disk through QSaveFile.
 *
 * The target file is only replaced once the encoder has finished, so a
 * failed save never leaves a truncated screenshot behind.
 */
class ImageSaveUtils
{
public:
    struct Error {
        QString message;
        QString stage; // format / open / write / commit
    };

    /**
     * @brief Encode an image and commit it to filePath
     * @param format Writer format ("png", ".JPG", ...); empty uses the file
     *        suffix, then png
     * @param quality 1-100 for lossy formats, -1 for the writer default
     */
    static bool saveImageAtomically(const QImage& image,
                                    const QString& filePath,
                                    const QByteArray& format = QByteArray(),
                                    int quality = -1,
                                    Error* error = nullptr);

    // Opaque copy composited over white, same size and DPR
    static QImage flattenOntoWhite(const QImage& image);

private:
    static QByteArray writerFormat(const QString& filePath, const QByteArray& requested);
};

#endif // IMAGESAVEUTILS_H
