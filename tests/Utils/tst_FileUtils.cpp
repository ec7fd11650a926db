#include <QtTest>

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QImage>
#include <QRegularExpression>
#include <QTemporaryDir>

#include "utils/FileUtils.h"

class tst_FileUtils : public QObject
{
    Q_OBJECT

private slots:
    // Sanitizing
    void testSanitizeFilename_data();
    void testSanitizeFilename();
    void testSanitizeFilename_CustomReplacement();
    void testIsValidFilename();

    // Extension splitting
    void testSplitExtension_data();
    void testSplitExtension();

    // Unique paths
    void testUniqueFilePath_FreeNameUnchanged();
    void testUniqueFilePath_AppendsCounter();
    void testUniqueFilePath_NoExtension();
    void testUniqueFilePath_ExhaustedReportsError();

    // Directories
    void testEnsureDirectoryExists_CreatesNested();
    void testEnsureDirectoryExists_FileInTheWay();

    // Size formatting
    void testFormatFileSize_data();
    void testFormatFileSize();

    // Classification
    void testClassifyFileType_data();
    void testClassifyFileType();

    // Hashing and metadata
    void testCalculateSha256_KnownContent();
    void testCalculateSha256_MissingFile();
    void testExtractFileMetadata_Png();
    void testExtractFileMetadata_MissingFile();

private:
    static void writeFile(const QString& path, const QByteArray& content);
};

void tst_FileUtils::writeFile(const QString& path, const QByteArray& content)
{
    QFile file(path);
    QVERIFY(file.open(QIODevice::WriteOnly));
    QCOMPARE(file.write(content), qint64(content.size()));
    file.close();
}

// ============================================================================
// Sanitizing
// ============================================================================

void tst_FileUtils::testSanitizeFilename_data()
{
    QTest::addColumn<QString>("input");
    QTest::addColumn<QString>("expected");

    QTest::newRow("plain") << "screenshot_20240101_120000.png" << "screenshot_20240101_120000.png";
    QTest::newRow("empty") << "" << "unnamed";
    QTest::newRow("slashes") << "a/b\\c.png" << "a_b_c.png";
    QTest::newRow("windows-invalid") << "what?<is>:\"this\"|*.png" << "what__is___this___.png";
    QTest::newRow("reserved") << "CON" << "file_CON";
    QTest::newRow("reserved-with-ext") << "lpt1.txt" << "file_lpt1.txt";
    QTest::newRow("reserved-prefix-only") << "CONSOLE.txt" << "CONSOLE.txt";
    QTest::newRow("unicode") << QString::fromUtf8("captura_ñ.png") << QString::fromUtf8("captura_ñ.png");
}

void tst_FileUtils::testSanitizeFilename()
{
    QFETCH(QString, input);
    QFETCH(QString, expected);

    const QString result = FileUtils::sanitizeFilename(input);
    QCOMPARE(result, expected);
    QVERIFY(FileUtils::isValidFilename(result));
}

void tst_FileUtils::testSanitizeFilename_CustomReplacement()
{
    QCOMPARE(FileUtils::sanitizeFilename(QStringLiteral("a:b"), QLatin1Char('-')), QStringLiteral("a-b"));
}

void tst_FileUtils::testIsValidFilename()
{
    QVERIFY(FileUtils::isValidFilename(QStringLiteral("shot.png")));
    QVERIFY(!FileUtils::isValidFilename(QString()));
    QVERIFY(!FileUtils::isValidFilename(QStringLiteral("a/b.png")));
    QVERIFY(!FileUtils::isValidFilename(QStringLiteral("aux.png")));
}

// ============================================================================
// Extension splitting
// ============================================================================

void tst_FileUtils::testSplitExtension_data()
{
    QTest::addColumn<QString>("filename");
    QTest::addColumn<QString>("base");
    QTest::addColumn<QString>("extension");

    QTest::newRow("simple") << "shot.png" << "shot" << ".png";
    QTest::newRow("double") << "shot.tar.gz" << "shot.tar" << ".gz";
    QTest::newRow("none") << "README" << "README" << "";
    QTest::newRow("dotfile") << ".hidden" << ".hidden" << "";
    QTest::newRow("dotfile-ext") << ".hidden.png" << ".hidden" << ".png";
}

void tst_FileUtils::testSplitExtension()
{
    QFETCH(QString, filename);
    QFETCH(QString, base);
    QFETCH(QString, extension);

    QString actualBase;
    QString actualExtension;
    FileUtils::splitExtension(filename, &actualBase, &actualExtension);
    QCOMPARE(actualBase, base);
    QCOMPARE(actualExtension, extension);
}

// ============================================================================
// Unique paths
// ============================================================================

void tst_FileUtils::testUniqueFilePath_FreeNameUnchanged()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());

    QCOMPARE(FileUtils::uniqueFilePath(tempDir.path(), QStringLiteral("shot.png")),
             QDir(tempDir.path()).filePath(QStringLiteral("shot.png")));
}

void tst_FileUtils::testUniqueFilePath_AppendsCounter()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());
    const QDir dir(tempDir.path());

    writeFile(dir.filePath("shot.png"), "x");
    QCOMPARE(FileUtils::uniqueFilePath(dir.path(), QStringLiteral("shot.png")),
             dir.filePath("shot_1.png"));

    writeFile(dir.filePath("shot_1.png"), "x");
    QCOMPARE(FileUtils::uniqueFilePath(dir.path(), QStringLiteral("shot.png")),
             dir.filePath("shot_2.png"));
}

void tst_FileUtils::testUniqueFilePath_NoExtension()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());
    const QDir dir(tempDir.path());

    writeFile(dir.filePath("notes"), "x");
    QCOMPARE(FileUtils::uniqueFilePath(dir.path(), QStringLiteral("notes")),
             dir.filePath("notes_1"));
}

void tst_FileUtils::testUniqueFilePath_ExhaustedReportsError()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());
    const QDir dir(tempDir.path());

    writeFile(dir.filePath("shot.png"), "x");
    writeFile(dir.filePath("shot_1.png"), "x");
    writeFile(dir.filePath("shot_2.png"), "x");

    QString error;
    QTest::ignoreMessage(QtWarningMsg, QRegularExpression("No unique filename"));
    const QString path = FileUtils::uniqueFilePath(dir.path(), QStringLiteral("shot.png"), 2, &error);

    QVERIFY(path.isEmpty());
    QVERIFY(error.contains(QStringLiteral("shot.png")));
}

// ============================================================================
// Directories
// ============================================================================

void tst_FileUtils::testEnsureDirectoryExists_CreatesNested()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());

    const QString nested = QDir(tempDir.path()).filePath("a/b/Screenshots");
    QString error;
    QVERIFY(FileUtils::ensureDirectoryExists(nested, &error));
    QVERIFY(QDir(nested).exists());

    // Existing directory is fine
    QVERIFY(FileUtils::ensureDirectoryExists(nested, &error));
}

void tst_FileUtils::testEnsureDirectoryExists_FileInTheWay()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());

    const QString filePath = QDir(tempDir.path()).filePath("occupied");
    writeFile(filePath, "x");

    QString error;
    QVERIFY(!FileUtils::ensureDirectoryExists(filePath, &error));
    QVERIFY(!error.isEmpty());

    QVERIFY(!FileUtils::ensureDirectoryExists(QString(), &error));
}

// ============================================================================
// Size formatting
// ============================================================================

void tst_FileUtils::testFormatFileSize_data()
{
    QTest::addColumn<qint64>("bytes");
    QTest::addColumn<QString>("expected");

    QTest::newRow("zero") << qint64(0) << "0 B";
    QTest::newRow("bytes") << qint64(512) << "512 B";
    QTest::newRow("just-below-kb") << qint64(1023) << "1023 B";
    QTest::newRow("kb") << qint64(1024) << "1.00 KB";
    QTest::newRow("kb-fraction") << qint64(1536) << "1.50 KB";
    QTest::newRow("mb") << qint64(5 * 1024 * 1024) << "5.00 MB";
    QTest::newRow("gb") << qint64(1024) * 1024 * 1024 * 3 / 2 << "1.50 GB";
    QTest::newRow("negative") << qint64(-10) << "0 B";
}

void tst_FileUtils::testFormatFileSize()
{
    QFETCH(qint64, bytes);
    QFETCH(QString, expected);

    QCOMPARE(FileUtils::formatFileSize(bytes), expected);
}

// ============================================================================
// Classification
// ============================================================================

void tst_FileUtils::testClassifyFileType_data()
{
    QTest::addColumn<QString>("extension");
    QTest::addColumn<QString>("mimeType");
    QTest::addColumn<QString>("expected");

    QTest::newRow("png") << ".png" << "" << "IMAGEN";
    QTest::newRow("upper-jpg") << ".JPG" << "" << "IMAGEN";
    QTest::newRow("mp4") << ".mp4" << "" << "VIDEO";
    QTest::newRow("pdf") << ".pdf" << "" << "PDF";
    QTest::newRow("docx") << ".docx" << "" << "WORD";
    QTest::newRow("csv") << ".csv" << "" << "EXCEL";
    QTest::newRow("md") << ".md" << "" << "TEXT";
    QTest::newRow("mime-image") << ".heic" << "image/heic" << "IMAGEN";
    QTest::newRow("mime-text") << ".rst" << "text/x-rst" << "TEXT";
    QTest::newRow("unknown") << ".bin" << "application/octet-stream" << "OTROS";
    QTest::newRow("nothing") << "" << "" << "OTROS";
}

void tst_FileUtils::testClassifyFileType()
{
    QFETCH(QString, extension);
    QFETCH(QString, mimeType);
    QFETCH(QString, expected);

    QCOMPARE(FileUtils::classifyFileType(extension, mimeType), expected);
}

// ============================================================================
// Hashing and metadata
// ============================================================================

void tst_FileUtils::testCalculateSha256_KnownContent()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());

    const QString path = QDir(tempDir.path()).filePath("abc.txt");
    writeFile(path, "abc");

    QCOMPARE(FileUtils::calculateSha256(path),
             QStringLiteral("ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad"));
}

void tst_FileUtils::testCalculateSha256_MissingFile()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());

    QString error;
    const QString hash = FileUtils::calculateSha256(QDir(tempDir.path()).filePath("missing"), &error);
    QVERIFY(hash.isEmpty());
    QVERIFY(!error.isEmpty());
}

void tst_FileUtils::testExtractFileMetadata_Png()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());

    const QString path = QDir(tempDir.path()).filePath("capture.png");
    QImage image(10, 10, QImage::Format_RGB32);
    image.fill(Qt::red);
    QVERIFY(image.save(path, "PNG"));

    QString error;
    const std::optional<FileMetadata> metadata = FileUtils::extractFileMetadata(path, &error);
    QVERIFY2(metadata.has_value(), qPrintable(error));

    QCOMPARE(metadata->fileSize, QFileInfo(path).size());
    QCOMPARE(metadata->originalFilename, QStringLiteral("capture.png"));
    QCOMPARE(metadata->fileExtension, QStringLiteral(".png"));
    QCOMPARE(metadata->mimeType, QStringLiteral("image/png"));
    QCOMPARE(metadata->fileType, QStringLiteral("IMAGEN"));
    QCOMPARE(metadata->fileHash.size(), 64);
    QCOMPARE(metadata->fileHash, FileUtils::calculateSha256(path));
}

void tst_FileUtils::testExtractFileMetadata_MissingFile()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());

    QString error;
    const auto metadata = FileUtils::extractFileMetadata(QDir(tempDir.path()).filePath("gone.png"), &error);
    QVERIFY(!metadata.has_value());
    QVERIFY(error.contains(QStringLiteral("gone.png")));

    // Directories are not files
    QVERIFY(!FileUtils::extractFileMetadata(tempDir.path(), &error).has_value());
}

QTEST_MAIN(tst_FileUtils)
#include "tst_FileUtils.moc"
