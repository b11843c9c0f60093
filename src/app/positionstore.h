/*
 * positionstore.h — Last reading position per book
 *
 * One small JSON file per book under the application data directory,
 * named after a hash of the book key.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef PAGEWRIGHT_POSITIONSTORE_H
#define PAGEWRIGHT_POSITIONSTORE_H

#include <QJsonObject>
#include <QObject>
#include <QString>

#include <optional>

#include "page.h"

class PositionStore : public QObject
{
    Q_OBJECT

public:
    explicit PositionStore(QObject *parent = nullptr);
    // Stores files in `directory` instead of the application data location
    explicit PositionStore(const QString &directory, QObject *parent = nullptr);

    std::optional<Pagination::ReadingPosition> load(const QString &bookKey) const;
    bool save(const QString &bookKey, const Pagination::ReadingPosition &position);
    void remove(const QString &bookKey);

    QString filePath(const QString &bookKey) const;

private:
    QString storageDir() const;
    static QString hashKey(const QString &bookKey);

    QString m_directory;
};

#endif // PAGEWRIGHT_POSITIONSTORE_H
