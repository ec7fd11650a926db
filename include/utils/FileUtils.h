#ifndef FILEUTILS_H
#define FILEUTILS_H

#include <QChar>
#include <QString>
#include <optional>

struct FileMetadata
{
    qint64 fileSize = 0;
    QString fileType;           // IMAGEN, VIDEO, PDF, WORD, EXCEL, TEXT or OTROS
    QString fileExtension;      // With leading dot, as on disk
    QString originalFilename;
    QString fileHash;           // SHA-256, lowercase hex
    QString mimeType;
};

class FileUtils
{
public:
    // Replaces characters no common filesystem accepts. Empty input becomes
    // "unnamed"; reserved device names (CON, LPT1...) get a "file_" prefix.
    static QString sanitizeFilename(const QString& filename, QChar replacement = QLatin1Char('_'));
    static bool isValidFilename(const QString& filename);

    // dir/filename if free, otherwise dir/name_1.ext, dir/name_2.ext, ...
    // Returns an empty string and sets error once maxAttempts is exhausted.
    static QString uniqueFilePath(const QString& directory,
                                  const QString& filename,
                                  int maxAttempts = 9999,
                                  QString* error = nullptr);

    static bool ensureDirectoryExists(const QString& path, QString* error = nullptr);

    static QString formatFileSize(qint64 bytes);

    // extension with leading dot, case-insensitive
    static QString classifyFileType(const QString& extension, const QString& mimeType = QString());

    static QString calculateSha256(const QString& filePath, QString* error = nullptr);

    static std::optional<FileMetadata> extractFileMetadata(const QString& filePath,
                                                           QString* error = nullptr);

    // "shot.tar.gz" -> {"shot.tar", ".gz"}; leading dots are not separators
    static void splitExtension(const QString& filename, QString* base, QString* extension);

private:
    static bool isReservedName(const QString& filename);
};

#endif // FILEUTILS_H
