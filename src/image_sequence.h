#pragma once
#include <QImage>
#include <QString>
#include <QStringList>

#include <memory>

/**
 * Random-access source of frames.
 *
 * Indices are 0-based. frameAt() may return a null QImage if a frame
 * cannot be decoded; callers substitute a placeholder in that case.
 */
class ImageSequence {
public:
    virtual ~ImageSequence() = default;

    virtual int length() const = 0;
    virtual QImage frameAt(int index) const = 0;

    // Human readable label for logs and window titles
    virtual QString displayName() const { return QString(); }
};

/**
 * All supported images of one folder, in natural order ("2.png" before
 * "10.png", case-insensitive). Sub-folders are not scanned.
 */
class ImageFolder : public ImageSequence {
public:
    // Returns nullptr and fills errorMessage if the folder does not exist,
    // is not a directory, or contains no supported images.
    static std::unique_ptr<ImageFolder> open(const QString& folderPath, QString* errorMessage = nullptr);

    int length() const override { return m_files.size(); }
    QImage frameAt(int index) const override;
    QString displayName() const override;

    QString folderPath() const { return m_folder; }
    const QStringList& filePaths() const { return m_files; }

    // 0-based index of the given file, or -1
    int indexOf(const QString& filePath) const;

    static QStringList listImages(const QString& folderPath);

private:
    ImageFolder(const QString& folderPath, const QStringList& files);

    QString m_folder;
    QStringList m_files;
};
