/*
 * pagewriter.h — JSON form of pagination results
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef PAGEWRIGHT_PAGEWRITER_H
#define PAGEWRIGHT_PAGEWRITER_H

#include <QJsonArray>
#include <QJsonObject>

#include <optional>

#include "page.h"

namespace Pagination {

namespace PageWriter {

QJsonObject footnoteToJson(const Content::Footnote &footnote);
QJsonObject pageToJson(const Page &page);
QJsonArray pagesToJson(const QList<Page> &pages);

// {pages, karaokeSources, footnotes, startPage}
QJsonObject resultToJson(const PaginationResult &result, std::optional<int> startPage);

} // namespace PageWriter

} // namespace Pagination

#endif // PAGEWRIGHT_PAGEWRITER_H
