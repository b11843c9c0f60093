/*
 * app_test.cpp — Reading positions and the idle hyphenation pass
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include <gtest/gtest.h>

#include <QEventLoop>
#include <QFile>
#include <QFileInfo>
#include <QTemporaryDir>
#include <QTimer>

#include "htmlfragment.h"
#include "hyphenationpass.h"
#include "hyphenator.h"
#include "page.h"
#include "positionstore.h"

using Pagination::Page;
using Pagination::ReadingPosition;

namespace {

constexpr QChar kSoftHyphen(0x00AD);

Page textPage(int chapterIndex, int pageIndex, const QString &content)
{
    Page page;
    page.chapterIndex = chapterIndex;
    page.pageIndex = pageIndex;
    page.content = content;
    return page;
}

QString withoutSoftHyphens(QString text)
{
    return text.remove(kSoftHyphen);
}

// Loads en_US when installed, else whatever the system offers
bool loadAnyDictionary(Hyphenator &hyphenator)
{
    const QStringList languages = Hyphenator::availableLanguages();
    if (languages.contains(QStringLiteral("en_US")))
        return hyphenator.loadDictionary(QStringLiteral("en_US"));
    for (const QString &language : languages) {
        if (hyphenator.loadDictionary(language))
            return true;
    }
    return false;
}

} // namespace

// ============================================================================
// Position store
// ============================================================================

class PositionStoreTest : public ::testing::Test {
protected:
    QTemporaryDir dir;
};

TEST_F(PositionStoreTest, SavesAndLoadsPerBook) {
    ASSERT_TRUE(dir.isValid());
    PositionStore store(dir.path());

    EXPECT_FALSE(store.load(QStringLiteral("book-a")).has_value());

    ASSERT_TRUE(store.save(QStringLiteral("book-a"), ReadingPosition{QStringLiteral("ch3"), 4}));
    ASSERT_TRUE(store.save(QStringLiteral("book-b"), ReadingPosition{QStringLiteral("intro"), 0}));

    const auto a = store.load(QStringLiteral("book-a"));
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(a->chapterId, QStringLiteral("ch3"));
    EXPECT_EQ(a->pageIndex, 4);

    const auto b = store.load(QStringLiteral("book-b"));
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(b->chapterId, QStringLiteral("intro"));
}

TEST_F(PositionStoreTest, FileNameIsAHashOfTheKey) {
    PositionStore store(dir.path());
    const QFileInfo info(store.filePath(QStringLiteral("some/book key")));
    EXPECT_EQ(info.absolutePath(), QFileInfo(dir.path()).absoluteFilePath());
    EXPECT_EQ(info.fileName().size(), 16 + 5);
    EXPECT_TRUE(info.fileName().endsWith(QStringLiteral(".json")));
    EXPECT_NE(store.filePath(QStringLiteral("a")), store.filePath(QStringLiteral("b")));
}

TEST_F(PositionStoreTest, RemoveForgetsThePosition) {
    PositionStore store(dir.path());
    ASSERT_TRUE(store.save(QStringLiteral("book"), ReadingPosition{QStringLiteral("c"), 1}));
    store.remove(QStringLiteral("book"));
    EXPECT_FALSE(store.load(QStringLiteral("book")).has_value());
}

TEST_F(PositionStoreTest, UnreadableFilesAreIgnored) {
    PositionStore store(dir.path());
    QFile file(store.filePath(QStringLiteral("broken")));
    ASSERT_TRUE(file.open(QIODevice::WriteOnly));
    file.write("{ not json");
    file.close();
    EXPECT_FALSE(store.load(QStringLiteral("broken")).has_value());

    QFile empty(store.filePath(QStringLiteral("nochapter")));
    ASSERT_TRUE(empty.open(QIODevice::WriteOnly));
    empty.write(R"({"pageIndex": 3})");
    empty.close();
    EXPECT_FALSE(store.load(QStringLiteral("nochapter")).has_value());
}

// ============================================================================
// Hyphenator
// ============================================================================

TEST(HyphenatorTest, ProtectsCodeAndKaraokeMarkup) {
    const auto code = Html::parseElement(QStringLiteral("<code>x</code>"));
    const auto karaoke = Html::parseElement(
        QStringLiteral("<div class=\"karaoke-object\" data-karaoke=\"{}\">x</div>"));
    const auto slice = Html::parseElement(QStringLiteral("<span data-karaoke-id=\"k\">x</span>"));
    const auto paragraph = Html::parseElement(QStringLiteral("<p class=\"body\">x</p>"));
    ASSERT_TRUE(code && karaoke && slice && paragraph);

    EXPECT_TRUE(Hyphenator::isProtected(*code));
    EXPECT_TRUE(Hyphenator::isProtected(*karaoke));
    EXPECT_TRUE(Hyphenator::isProtected(*slice));
    EXPECT_FALSE(Hyphenator::isProtected(*paragraph));
}

TEST(HyphenatorTest, UnloadedHyphenatorLeavesTextAlone) {
    Hyphenator hyphenator;
    EXPECT_FALSE(hyphenator.isLoaded());
    EXPECT_FALSE(hyphenator.loadDictionary(QStringLiteral("xx_NOPE")));
    const QString html = QStringLiteral("<p>extraordinarily</p>");
    EXPECT_EQ(hyphenator.hyphenateHtml(html), html);
}

TEST(HyphenatorTest, HyphenatesTextButNotCode) {
    Hyphenator hyphenator;
    if (!loadAnyDictionary(hyphenator))
        GTEST_SKIP() << "no hyphenation dictionary installed";

    const QString html = hyphenator.hyphenateHtml(
        QStringLiteral("<p>internationalization</p><code>internationalization</code>"));
    const auto nodes = Html::parseFragment(html);
    ASSERT_EQ(nodes.size(), 2u);
    EXPECT_TRUE(nodes[0].textContent().contains(kSoftHyphen));
    EXPECT_EQ(withoutSoftHyphens(nodes[0].textContent()), QStringLiteral("internationalization"));
    EXPECT_EQ(nodes[1].textContent(), QStringLiteral("internationalization"));
}

// ============================================================================
// Hyphenation pass
// ============================================================================

TEST(HyphenationPassTest, SkipsSpecialAndAlreadyHyphenatedPages) {
    Page cover = textPage(-1, 0, QStringLiteral("<img src=\"c.jpg\">"));
    cover.isCover = true;
    Page epigraph = textPage(0, 0, QStringLiteral("<p>words</p>"));
    epigraph.isEpigraph = true;
    Page video = textPage(0, 1, QStringLiteral("<video></video>"));
    video.isVideo = true;
    const Page done = textPage(0, 2, QStringLiteral("<p>hy") + kSoftHyphen + QStringLiteral("phen</p>"));
    const Page plain = textPage(0, 3, QStringLiteral("<p>plain</p>"));

    EXPECT_TRUE(HyphenationPass::shouldSkip(cover));
    EXPECT_TRUE(HyphenationPass::shouldSkip(epigraph));
    EXPECT_TRUE(HyphenationPass::shouldSkip(video));
    EXPECT_TRUE(HyphenationPass::shouldSkip(done));
    EXPECT_FALSE(HyphenationPass::shouldSkip(plain));
}

TEST(HyphenationPassTest, DoesNothingWithoutADictionary) {
    HyphenationPass pass(nullptr);
    QList<Page> pages{textPage(0, 0, QStringLiteral("<p>extraordinarily</p>"))};
    pass.schedule(pages, 0);
    EXPECT_TRUE(pass.isPending());
    EXPECT_FALSE(pass.apply(pages));

    Hyphenator unloaded;
    HyphenationPass unloadedPass(&unloaded);
    unloadedPass.schedule(pages, 0);
    EXPECT_FALSE(unloadedPass.apply(pages));
    unloadedPass.cancel();
    EXPECT_FALSE(unloadedPass.isPending());
}

TEST(HyphenationPassTest, AbortsWhenThePagesWereReplaced) {
    Hyphenator hyphenator;
    if (!loadAnyDictionary(hyphenator))
        GTEST_SKIP() << "no hyphenation dictionary installed";

    HyphenationPass pass(&hyphenator);
    const QList<Page> scheduled{textPage(0, 0, QStringLiteral("<p>internationalization</p>")),
                                textPage(0, 1, QStringLiteral("<p>internationalization</p>"))};
    pass.schedule(scheduled, 0);

    QList<Page> fewer{scheduled.first()};
    EXPECT_FALSE(pass.apply(fewer));

    QList<Page> reordered{scheduled[1], scheduled[0]};
    EXPECT_FALSE(pass.apply(reordered));
    EXPECT_EQ(reordered[0].content, scheduled[1].content);

    int aborted = 0;
    pass.setCurrentPages(fewer);
    QEventLoop loop;
    QObject::connect(&pass, &HyphenationPass::passAborted, &loop, [&]() {
        ++aborted;
        loop.quit();
    });
    QTimer::singleShot(2000, &loop, &QEventLoop::quit);
    loop.exec();
    EXPECT_EQ(aborted, 1);
}

TEST(HyphenationPassTest, HyphenatesScheduledPagesOnTimeout) {
    Hyphenator hyphenator;
    if (!loadAnyDictionary(hyphenator))
        GTEST_SKIP() << "no hyphenation dictionary installed";

    HyphenationPass pass(&hyphenator);
    Page cover = textPage(-1, 0, QStringLiteral("<p>internationalization</p>"));
    cover.isCover = true;
    const QList<Page> pages{cover, textPage(0, 0, QStringLiteral("<p>internationalization</p>"))};

    QList<Page> result;
    QEventLoop loop;
    QObject::connect(&pass, &HyphenationPass::pagesHyphenated, &loop,
                     [&](const QList<Page> &hyphenated) {
                         result = hyphenated;
                         loop.quit();
                     });
    QTimer::singleShot(2000, &loop, &QEventLoop::quit);
    pass.schedule(pages, 1);
    loop.exec();

    ASSERT_EQ(result.size(), 2);
    EXPECT_EQ(result[0].content, pages[0].content);
    EXPECT_TRUE(result[1].content.contains(kSoftHyphen));
    EXPECT_EQ(withoutSoftHyphens(result[1].content), pages[1].content);
}
