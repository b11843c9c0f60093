/*
 * main.cpp — pagewright command-line entry point
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <QEventLoop>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QRegularExpression>
#include <QSaveFile>
#include <QSizeF>

#include <KAboutData>
#include <KLocalizedString>

#include <cstdio>
#include <memory>

#include "chapterstore.h"
#include "fixedtextmetrics.h"
#include "fontmanager.h"
#include "hyphenationpass.h"
#include "hyphenator.h"
#include "imagesizecache.h"
#include "pagemetrics.h"
#include "pagewriter.h"
#include "paginationdriver.h"
#include "paginationsettings.h"
#include "positionstore.h"
#include "layoutoracle.h"
#include "shapedtextmetrics.h"
#include "timingimport.h"

namespace {

void printError(const QString &message)
{
    std::fprintf(stderr, "pagewright: %s\n", qPrintable(message));
}

bool writeOutput(const QString &path, const QByteArray &data)
{
    if (path.isEmpty() || path == QLatin1String("-")) {
        QFile out;
        if (!out.open(stdout, QIODevice::WriteOnly))
            return false;
        return out.write(data) == data.size();
    }
    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        printError(i18n("cannot write %1: %2", path, file.errorString()));
        return false;
    }
    file.write(data);
    return file.commit();
}

std::optional<QByteArray> readInput(const QString &path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        printError(i18n("cannot read %1: %2", path, file.errorString()));
        return std::nullopt;
    }
    return file.readAll();
}

std::optional<QSizeF> parseDeviceSize(const QString &value)
{
    static const QRegularExpression rx(QStringLiteral("^(\\d+)[xX](\\d+)$"));
    const QRegularExpressionMatch match = rx.match(value.trimmed());
    if (!match.hasMatch())
        return std::nullopt;
    const qreal width = match.captured(1).toDouble();
    const qreal height = match.captured(2).toDouble();
    if (width <= 0 || height <= 0)
        return std::nullopt;
    return QSizeF(width, height);
}

int runTimingImport(const QString &timingPath, const QString &textPath, const QString &output)
{
    const std::optional<QByteArray> bytes = readInput(timingPath);
    if (!bytes)
        return 1;

    Karaoke::TimingImportError error = Karaoke::TimingImportError::None;
    std::optional<QList<Karaoke::WordTiming>> timings = Karaoke::importTimings(*bytes, &error);
    if (!timings) {
        printError(i18n("%1: %2", timingPath, Karaoke::timingImportErrorString(error)));
        return 1;
    }

    if (!textPath.isEmpty()) {
        const std::optional<QByteArray> text = readInput(textPath);
        if (!text)
            return 1;
        timings = Karaoke::alignTimingsToText(*timings, QString::fromUtf8(*text));
    }

    QJsonArray array;
    for (const Karaoke::WordTiming &timing : std::as_const(*timings))
        array.append(Karaoke::wordTimingToJson(timing));
    return writeOutput(output, QJsonDocument(array).toJson(QJsonDocument::Indented)) ? 0 : 1;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    KLocalizedString::setApplicationDomain("pagewright");

    KAboutData aboutData(
        QStringLiteral("pagewright"),
        i18n("Pagewright"),
        QStringLiteral("0.1.0"),
        i18n("Paginates illustrated books into screen-sized pages"),
        KAboutLicense::GPL_V2,
        i18n("(c) 2025-2026"));
    aboutData.setOrganizationDomain("pagewright.org");
    KAboutData::setApplicationData(aboutData);

    QCommandLineParser parser;
    aboutData.setupCommandLine(&parser);

    const QCommandLineOption deviceOption(
        QStringLiteral("device"), i18n("Paginate for a device viewport of WxH pixels."),
        QStringLiteral("WxH"));
    const QCommandLineOption fixedMetricsOption(
        QStringLiteral("fixed-metrics"),
        i18n("Measure text with fixed advances instead of installed fonts."));
    const QCommandLineOption fontOption(
        QStringLiteral("font"), i18n("Base font family."), QStringLiteral("family"));
    const QCommandLineOption hyphenateOption(
        QStringLiteral("hyphenate"), i18n("Insert soft hyphens using the dictionary for LANG."),
        QStringLiteral("lang"));
    const QCommandLineOption positionKeyOption(
        QStringLiteral("position-key"),
        i18n("Restore and store the reading position under KEY."), QStringLiteral("key"));
    const QCommandLineOption outputOption(
        {QStringLiteral("o"), QStringLiteral("output")},
        i18n("Write the result to FILE instead of standard output."), QStringLiteral("file"));
    const QCommandLineOption importTimingsOption(
        QStringLiteral("import-timings"), i18n("Read a word timing file and print its timings."),
        QStringLiteral("file"));
    const QCommandLineOption alignTextOption(
        QStringLiteral("align-text"),
        i18n("Align imported timings to the words of this text file."), QStringLiteral("file"));

    parser.addOptions({deviceOption, fixedMetricsOption, fontOption, hyphenateOption,
                       positionKeyOption, outputOption, importTimingsOption, alignTextOption});
    parser.addPositionalArgument(QStringLiteral("chapters"),
                                 i18n("Chapters JSON file to paginate"),
                                 QStringLiteral("[chapters.json]"));
    parser.process(app);
    aboutData.processCommandLine(&parser);

    const QString output = parser.value(outputOption);

    if (parser.isSet(importTimingsOption))
        return runTimingImport(parser.value(importTimingsOption), parser.value(alignTextOption),
                               output);

    const QStringList args = parser.positionalArguments();
    if (args.size() != 1) {
        printError(i18n("expected exactly one chapters file"));
        parser.showHelp(1);
    }

    const std::optional<QList<Content::ChapterRecord>> chapters =
        Content::ChapterStore::loadFile(args.first());
    if (!chapters) {
        printError(i18n("cannot load chapters from %1", args.first()));
        return 1;
    }

    Layout::PageMetrics metrics = Layout::PageMetrics::document();
    if (parser.isSet(deviceOption)) {
        const std::optional<QSizeF> viewport = parseDeviceSize(parser.value(deviceOption));
        if (!viewport) {
            printError(i18n("invalid device size '%1', expected WxH",
                            parser.value(deviceOption)));
            return 1;
        }
        metrics = Layout::PageMetrics::device(*viewport);
    }

    std::unique_ptr<FontManager> fontManager;
    std::unique_ptr<Layout::TextMetrics> textMetrics;
    if (parser.isSet(fixedMetricsOption)) {
        textMetrics = std::make_unique<Layout::FixedTextMetrics>();
    } else {
        fontManager = std::make_unique<FontManager>();
        textMetrics = std::make_unique<Layout::ShapedTextMetrics>(fontManager.get());
    }

    Layout::ImageSizeCache images;
    Layout::LayoutOracle oracle(textMetrics.get(), &images);
    if (parser.isSet(fontOption))
        oracle.setFontFamily(parser.value(fontOption));

    const Pagination::PaginationSettings settings = Pagination::PaginationSettings::load();
    Pagination::PaginationDriver driver(&oracle, &images, metrics, settings);

    std::optional<Pagination::PaginationResult> result = driver.paginate(*chapters);
    if (!result) {
        printError(i18n("pagination did not complete"));
        return 1;
    }

    if (parser.isSet(hyphenateOption)) {
        Hyphenator hyphenator;
        const QString language = parser.value(hyphenateOption);
        if (!hyphenator.loadDictionary(language)) {
            printError(i18n("no hyphenation dictionary for %1 (available: %2)", language,
                            Hyphenator::availableLanguages().join(QLatin1String(", "))));
            return 1;
        }

        HyphenationPass pass(&hyphenator);
        QEventLoop loop;
        QObject::connect(&pass, &HyphenationPass::pagesHyphenated, &loop,
                         [&result, &loop](const QList<Pagination::Page> &pages) {
                             result->pages = pages;
                             loop.quit();
                         });
        QObject::connect(&pass, &HyphenationPass::passAborted, &loop, &QEventLoop::quit);
        pass.schedule(result->pages, settings.hyphenationDelayMs);
        loop.exec();
    }

    std::optional<int> startPage = Pagination::PaginationDriver::restorePosition(result->pages, {});
    if (parser.isSet(positionKeyOption)) {
        PositionStore store;
        const QString key = parser.value(positionKeyOption);
        startPage = Pagination::PaginationDriver::restorePosition(result->pages, store.load(key));
        if (startPage
            && !store.save(key, Pagination::PaginationDriver::positionOf(
                                    result->pages.at(*startPage))))
            qWarning() << "pagewright: reading position not stored";
    }

    const QJsonObject json = Pagination::PageWriter::resultToJson(*result, startPage);
    return writeOutput(output, QJsonDocument(json).toJson(QJsonDocument::Indented)) ? 0 : 1;
}
