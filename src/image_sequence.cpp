#include "image_sequence.h"
#include "image_formats.h"
#include "image_loader.h"

#include <QCollator>
#include <QDebug>
#include <QDir>
#include <QFileInfo>

#include <algorithm>

ImageFolder::ImageFolder(const QString& folderPath, const QStringList& files)
    : m_folder(folderPath)
    , m_files(files)
{
}

std::unique_ptr<ImageFolder> ImageFolder::open(const QString& folderPath, QString* errorMessage)
{
    auto fail = [errorMessage](const QString& message) -> std::unique_ptr<ImageFolder> {
        qWarning() << "[ImageFolder]" << message;
        if (errorMessage) *errorMessage = message;
        return nullptr;
    };

    const QFileInfo info(folderPath);
    if (!info.exists()) {
        return fail(QString("Folder does not exist: %1").arg(folderPath));
    }
    if (!info.isDir()) {
        return fail(QString("Not a folder: %1").arg(folderPath));
    }

    const QString absolute = info.absoluteFilePath();
    const QStringList files = listImages(absolute);
    if (files.isEmpty()) {
        return fail(QString("No supported images found in %1").arg(absolute));
    }

    qDebug() << "[ImageFolder] Opened" << absolute << "with" << files.size() << "images";
    return std::unique_ptr<ImageFolder>(new ImageFolder(absolute, files));
}

QStringList ImageFolder::listImages(const QString& folderPath)
{
    QDir dir(folderPath);
    const QFileInfoList entries = dir.entryInfoList(QDir::Files | QDir::Readable | QDir::NoDotAndDotDot);

    QStringList names;
    for (const QFileInfo& fi : entries) {
        if (isSupportedImageFile(fi.suffix())) {
            names << fi.fileName();
        }
    }

    QCollator collator;
    collator.setNumericMode(true);
    collator.setCaseSensitivity(Qt::CaseInsensitive);
    std::sort(names.begin(), names.end(), [&collator](const QString& a, const QString& b) {
        return collator.compare(a, b) < 0;
    });

    QStringList files;
    files.reserve(names.size());
    for (const QString& name : names) {
        files << dir.absoluteFilePath(name);
    }
    return files;
}

QImage ImageFolder::frameAt(int index) const
{
    if (index < 0 || index >= m_files.size()) {
        qWarning() << "[ImageFolder] Frame index out of range:" << index << "of" << m_files.size();
        return QImage();
    }
    return ImageLoader::load(m_files.at(index));
}

QString ImageFolder::displayName() const
{
    return QDir(m_folder).dirName();
}

int ImageFolder::indexOf(const QString& filePath) const
{
    return m_files.indexOf(QFileInfo(filePath).absoluteFilePath());
}
