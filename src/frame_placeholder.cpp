#include "frame_placeholder.h"

#include <QFont>
#include <QPainter>
#include <QPen>

QSize FramePlaceholder::placeholderSize(const QSize& sourceSize)
{
    if (!sourceSize.isValid() || sourceSize.isEmpty()) {
        return QSize(kMinWidth, kMinHeight);
    }
    return QSize(qBound(kMinWidth, sourceSize.width(), kMaxSide),
                 qBound(kMinHeight, sourceSize.height(), kMaxSide));
}

QImage FramePlaceholder::create(const QString& message, const QSize& sourceSize)
{
    QImage image(placeholderSize(sourceSize), QImage::Format_RGB888);
    image.fill(Qt::white);

    QPainter painter(&image);
    painter.setRenderHint(QPainter::Antialiasing);
    painter.setRenderHint(QPainter::TextAntialiasing);
    painter.setPen(QPen(QColor(200, 0, 0)));
    QFont font;
    font.setPointSize(20);
    font.setBold(true);
    painter.setFont(font);
    painter.drawText(image.rect(), Qt::AlignCenter | Qt::TextWordWrap, message);
    painter.end();

    return image;
}
