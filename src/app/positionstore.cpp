/*
 * positionstore.cpp — Last reading position per book
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "positionstore.h"

#include <QCryptographicHash>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QJsonDocument>
#include <QSaveFile>
#include <QStandardPaths>

PositionStore::PositionStore(QObject *parent)
    : QObject(parent)
{
}

PositionStore::PositionStore(const QString &directory, QObject *parent)
    : QObject(parent)
    , m_directory(directory)
{
}

QString PositionStore::storageDir() const
{
    QString dir = m_directory;
    if (dir.isEmpty())
        dir = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation)
              + QStringLiteral("/positions");
    QDir().mkpath(dir);
    return dir;
}

QString PositionStore::hashKey(const QString &bookKey)
{
    QByteArray hash = QCryptographicHash::hash(
        bookKey.toUtf8(), QCryptographicHash::Sha256);
    return QString::fromLatin1(hash.toHex().left(16));
}

QString PositionStore::filePath(const QString &bookKey) const
{
    return storageDir() + QLatin1Char('/') + hashKey(bookKey)
           + QStringLiteral(".json");
}

std::optional<Pagination::ReadingPosition> PositionStore::load(const QString &bookKey) const
{
    QFile file(filePath(bookKey));
    if (!file.open(QIODevice::ReadOnly))
        return std::nullopt;

    QJsonParseError error;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &error);
    if (error.error != QJsonParseError::NoError || !doc.isObject()) {
        qWarning() << "PositionStore: ignoring unreadable" << file.fileName()
                   << error.errorString();
        return std::nullopt;
    }

    const QJsonObject obj = doc.object();
    Pagination::ReadingPosition position;
    position.chapterId = obj.value(QLatin1String("chapterId")).toString();
    position.pageIndex = obj.value(QLatin1String("pageIndex")).toInt();
    if (!position.isValid())
        return std::nullopt;
    return position;
}

bool PositionStore::save(const QString &bookKey, const Pagination::ReadingPosition &position)
{
    QSaveFile file(filePath(bookKey));
    if (!file.open(QIODevice::WriteOnly)) {
        qWarning() << "PositionStore: cannot write" << file.fileName();
        return false;
    }

    // The book key is kept for identification
    QJsonObject obj;
    obj[QStringLiteral("_bookKey")] = bookKey;
    obj[QStringLiteral("chapterId")] = position.chapterId;
    obj[QStringLiteral("pageIndex")] = position.pageIndex;

    file.write(QJsonDocument(obj).toJson(QJsonDocument::Indented));
    return file.commit();
}

void PositionStore::remove(const QString &bookKey)
{
    QFile::remove(filePath(bookKey));
}
