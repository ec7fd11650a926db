#include "utils/FileUtils.h"

#include <QCryptographicHash>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QHash>
#include <QMimeDatabase>
#include <QStringList>

namespace {

constexpr const char* kInvalidFilenameChars = "<>:\"|?*\\/";

QString reservedBaseName(const QString& filename)
{
    QString base;
    FileUtils::splitExtension(filename, &base, nullptr);
    return base.toUpper();
}

const QHash<QString, QString>& extensionCategories()
{
    static const QHash<QString, QString> categories = {
        // Images
        {".jpg", "IMAGEN"}, {".jpeg", "IMAGEN"}, {".png", "IMAGEN"}, {".gif", "IMAGEN"},
        {".bmp", "IMAGEN"}, {".svg", "IMAGEN"}, {".webp", "IMAGEN"}, {".ico", "IMAGEN"},
        {".tiff", "IMAGEN"}, {".tif", "IMAGEN"},
        // Video
        {".mp4", "VIDEO"}, {".avi", "VIDEO"}, {".mkv", "VIDEO"}, {".mov", "VIDEO"},
        {".wmv", "VIDEO"}, {".flv", "VIDEO"}, {".webm", "VIDEO"}, {".m4v", "VIDEO"},
        {".pdf", "PDF"},
        {".doc", "WORD"}, {".docx", "WORD"}, {".odt", "WORD"},
        {".xls", "EXCEL"}, {".xlsx", "EXCEL"}, {".csv", "EXCEL"}, {".ods", "EXCEL"},
        // Text
        {".txt", "TEXT"}, {".md", "TEXT"}, {".log", "TEXT"}, {".json", "TEXT"},
        {".xml", "TEXT"}, {".yaml", "TEXT"}, {".yml", "TEXT"}, {".ini", "TEXT"},
        {".cfg", "TEXT"}, {".conf", "TEXT"},
    };
    return categories;
}

} // namespace

void FileUtils::splitExtension(const QString& filename, QString* base, QString* extension)
{
    int firstNonDot = 0;
    while (firstNonDot < filename.size() && filename.at(firstNonDot) == QLatin1Char('.')) {
        ++firstNonDot;
    }

    const int dot = filename.lastIndexOf(QLatin1Char('.'));
    const bool hasExtension = dot > firstNonDot;

    if (base) {
        *base = hasExtension ? filename.left(dot) : filename;
    }
    if (extension) {
        *extension = hasExtension ? filename.mid(dot) : QString();
    }
}

bool FileUtils::isReservedName(const QString& filename)
{
    static const QStringList reserved = {
        "CON", "PRN", "AUX", "NUL",
        "COM1", "COM2", "COM3", "COM4", "COM5", "COM6", "COM7", "COM8", "COM9",
        "LPT1", "LPT2", "LPT3", "LPT4", "LPT5", "LPT6", "LPT7", "LPT8", "LPT9"
    };
    return reserved.contains(reservedBaseName(filename));
}

QString FileUtils::sanitizeFilename(const QString& filename, QChar replacement)
{
    if (filename.isEmpty()) {
        return QStringLiteral("unnamed");
    }

    const QString invalid = QString::fromLatin1(kInvalidFilenameChars);
    QString sanitized = filename;
    for (QChar& ch : sanitized) {
        if (ch.isNull() || invalid.contains(ch)) {
            ch = replacement;
        }
    }

    if (isReservedName(sanitized)) {
        sanitized.prepend(QStringLiteral("file_"));
    }
    return sanitized;
}

bool FileUtils::isValidFilename(const QString& filename)
{
    if (filename.isEmpty()) {
        return false;
    }

    const QString invalid = QString::fromLatin1(kInvalidFilenameChars);
    for (const QChar ch : filename) {
        if (ch.isNull() || invalid.contains(ch)) {
            return false;
        }
    }

    return !isReservedName(filename);
}

QString FileUtils::uniqueFilePath(const QString& directory,
                                  const QString& filename,
                                  int maxAttempts,
                                  QString* error)
{
    const QDir dir(directory);
    const QString initialPath = dir.filePath(filename);
    if (!QFileInfo::exists(initialPath)) {
        return initialPath;
    }

    QString base;
    QString extension;
    splitExtension(filename, &base, &extension);

    for (int counter = 1; counter <= maxAttempts; ++counter) {
        const QString candidate = dir.filePath(QStringLiteral("%1_%2%3").arg(base, QString::number(counter), extension));
        if (!QFileInfo::exists(candidate)) {
            return candidate;
        }
    }

    const QString message = QStringLiteral("No unique filename for %1 after %2 attempts")
                                .arg(filename, QString::number(maxAttempts));
    qWarning() << "FileUtils:" << message;
    if (error) {
        *error = message;
    }
    return QString();
}

bool FileUtils::ensureDirectoryExists(const QString& path, QString* error)
{
    if (path.isEmpty()) {
        if (error) {
            *error = QStringLiteral("Empty directory path");
        }
        return false;
    }

    QFileInfo info(path);
    if (info.exists() && !info.isDir()) {
        if (error) {
            *error = QStringLiteral("Path exists and is not a directory: %1").arg(path);
        }
        return false;
    }

    if (!QDir().mkpath(path)) {
        if (error) {
            *error = QStringLiteral("Could not create directory: %1").arg(path);
        }
        qWarning() << "FileUtils: Failed to create directory" << path;
        return false;
    }
    return true;
}

QString FileUtils::formatFileSize(qint64 bytes)
{
    if (bytes < 0) {
        return QStringLiteral("0 B");
    }

    static const char* const units[] = { "B", "KB", "MB", "GB", "TB" };
    constexpr int unitCount = sizeof(units) / sizeof(units[0]);

    double size = static_cast<double>(bytes);
    int unit = 0;
    while (size >= 1024.0 && unit < unitCount - 1) {
        size /= 1024.0;
        ++unit;
    }

    if (unit == 0) {
        return QStringLiteral("%1 B").arg(bytes);
    }
    return QStringLiteral("%1 %2").arg(size, 0, 'f', 2).arg(QLatin1String(units[unit]));
}

QString FileUtils::classifyFileType(const QString& extension, const QString& mimeType)
{
    const auto& categories = extensionCategories();
    const auto it = categories.constFind(extension.toLower());
    if (it != categories.constEnd()) {
        return it.value();
    }

    if (!mimeType.isEmpty()) {
        if (mimeType.startsWith(QLatin1String("image/"))) return QStringLiteral("IMAGEN");
        if (mimeType.startsWith(QLatin1String("video/"))) return QStringLiteral("VIDEO");
        if (mimeType == QLatin1String("application/pdf")) return QStringLiteral("PDF");
        if (mimeType.contains(QLatin1String("word")) || mimeType.contains(QLatin1String("document"))) {
            return QStringLiteral("WORD");
        }
        if (mimeType.contains(QLatin1String("excel")) || mimeType.contains(QLatin1String("spreadsheet"))) {
            return QStringLiteral("EXCEL");
        }
        if (mimeType.startsWith(QLatin1String("text/"))) return QStringLiteral("TEXT");
    }

    return QStringLiteral("OTROS");
}

QString FileUtils::calculateSha256(const QString& filePath, QString* error)
{
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        if (error) {
            *error = QStringLiteral("Cannot open %1: %2").arg(filePath, file.errorString());
        }
        return QString();
    }

    QCryptographicHash hash(QCryptographicHash::Sha256);
    if (!hash.addData(&file)) {
        if (error) {
            *error = QStringLiteral("Cannot read %1: %2").arg(filePath, file.errorString());
        }
        return QString();
    }
    return QString::fromLatin1(hash.result().toHex());
}

std::optional<FileMetadata> FileUtils::extractFileMetadata(const QString& filePath, QString* error)
{
    const QFileInfo info(filePath);
    if (!info.exists()) {
        if (error) {
            *error = QStringLiteral("File not found: %1").arg(filePath);
        }
        return std::nullopt;
    }
    if (!info.isFile()) {
        if (error) {
            *error = QStringLiteral("Not a file: %1").arg(filePath);
        }
        return std::nullopt;
    }

    QString hashError;
    const QString hash = calculateSha256(filePath, &hashError);
    if (hash.isEmpty()) {
        if (error) {
            *error = hashError;
        }
        return std::nullopt;
    }

    FileMetadata metadata;
    metadata.fileSize = info.size();
    metadata.originalFilename = info.fileName();
    splitExtension(info.fileName(), nullptr, &metadata.fileExtension);
    metadata.mimeType = QMimeDatabase().mimeTypeForFile(info, QMimeDatabase::MatchExtension).name();
    metadata.fileType = classifyFileType(metadata.fileExtension, metadata.mimeType);
    metadata.fileHash = hash;
    return metadata;
}
