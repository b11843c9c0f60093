/*
 * karaoke_test.cpp — Karaoke sources, slice views, playback and timing import
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include <gtest/gtest.h>

#include <QEventLoop>
#include <QTimer>
#include <QUrl>

#include "audiohandle.h"
#include "htmlfragment.h"
#include "karaokeregistry.h"
#include "karaokesource.h"
#include "playbackcontroller.h"
#include "sliceview.h"
#include "timingimport.h"

#include "testsupport.h"

using namespace Karaoke;
using TestSupport::FakeAudioHandle;

namespace {

const QString kSongId = QStringLiteral("song");

KaraokeSource numberedSource(const QString &id = kSongId)
{
    KaraokePayload payload;
    payload.text = TestSupport::numberedWords(50);
    payload.audioUrl = QStringLiteral("song.mp3");
    payload.wordTimings = TestSupport::numberedTimings(50);
    return buildSource(id, payload);
}

// Runs the event loop until the signal fires or the timeout passes
template<typename Sender, typename Signal>
bool waitFor(Sender *sender, Signal signal, int timeoutMs = 2000)
{
    QEventLoop loop;
    bool fired = false;
    QObject::connect(sender, signal, &loop, [&]() {
        fired = true;
        loop.quit();
    });
    QTimer::singleShot(timeoutMs, &loop, &QEventLoop::quit);
    loop.exec();
    return fired;
}

void spin(int ms)
{
    QEventLoop loop;
    QTimer::singleShot(ms, &loop, &QEventLoop::quit);
    loop.exec();
}

} // namespace

// ============================================================================
// Sources
// ============================================================================

TEST(KaraokeSourceTest, NormalizesWords) {
    EXPECT_EQ(normalizeWord(QStringLiteral("Café’s!")), QStringLiteral("cafe's"));
    EXPECT_EQ(normalizeWord(QStringLiteral("...")), QString());
    const QString softHyphenated = QStringLiteral("ex") + QChar(0x00AD) + QStringLiteral("ample it")
        + QChar(0x2019) + QStringLiteral("s");
    EXPECT_EQ(normalizeText(softHyphenated), QStringLiteral("example it's"));
}

TEST(KaraokeSourceTest, MapsTimingsOntoCharacters) {
    KaraokePayload payload;
    payload.text = QStringLiteral("Hello, world! It’s fine.");
    payload.wordTimings = {{QStringLiteral("hello"), 0.0, 1.0, std::nullopt},
                           {QStringLiteral("world"), 1.0, 2.0, std::nullopt},
                           {QStringLiteral("it's"), 2.0, 2.4, std::nullopt},
                           {QStringLiteral("fine"), 2.4, 3.0, 0.9}};
    const KaraokeSource source = buildSource(QStringLiteral("k"), payload);

    EXPECT_EQ(source.text, QStringLiteral("Hello, world! It's fine."));
    ASSERT_EQ(source.letterTimings.size(), source.text.size());
    ASSERT_EQ(source.wordCharRanges.size(), 4);

    ASSERT_TRUE(source.wordCharRanges[1].has_value());
    EXPECT_EQ(source.wordCharRanges[1]->charStart, 7);
    EXPECT_EQ(source.wordCharRanges[1]->charEnd, 12);
    EXPECT_EQ(source.wordCharRanges[2]->charStart, 14);
    EXPECT_EQ(source.wordCharRanges[2]->charEnd, 18);

    // Duration spread evenly over the letters of a word
    ASSERT_TRUE(source.letterTimings[0].has_value());
    EXPECT_DOUBLE_EQ(source.letterTimings[0]->start, 0.0);
    EXPECT_DOUBLE_EQ(source.letterTimings[0]->end, 0.2);
    EXPECT_DOUBLE_EQ(source.letterTimings[4]->end, 1.0);
    EXPECT_FALSE(source.letterTimings[5].has_value());
}

TEST(KaraokeSourceTest, UnmatchedWordDoesNotConsumeText) {
    KaraokePayload payload;
    payload.text = QStringLiteral("one two three");
    payload.wordTimings = {{QStringLiteral("one"), 0, 1, std::nullopt},
                           {QStringLiteral("zebra"), 1, 2, std::nullopt},
                           {QStringLiteral("two"), 2, 3, std::nullopt},
                           {QStringLiteral("!"), 3, 3.5, std::nullopt},
                           {QStringLiteral("three"), 3.5, 4, std::nullopt}};
    const KaraokeSource source = buildSource(QStringLiteral("k"), payload);
    ASSERT_EQ(source.wordCharRanges.size(), 5);
    EXPECT_FALSE(source.wordCharRanges[1].has_value());
    EXPECT_FALSE(source.wordCharRanges[3].has_value());
    ASSERT_TRUE(source.wordCharRanges[2].has_value());
    EXPECT_EQ(source.wordCharRanges[2]->charStart, 4);
    EXPECT_EQ(source.wordCharRanges[2]->wordIndex, 2);
    ASSERT_TRUE(source.wordCharRanges[4].has_value());
    EXPECT_EQ(source.wordCharRanges[4]->charStart, 8);
}

TEST(KaraokeSourceTest, ParsesLegacyTimingAttributes) {
    const QByteArray timings = QUrl::toPercentEncoding(
        QStringLiteral("[{\"word\":\"Sing\",\"start\":0.5,\"end\":0.9}]"));
    const auto node = Html::parseElement(
        QStringLiteral("<p data-audio-url=\"a.mp3\" data-timings=\"%1\">Sing</p>")
            .arg(QString::fromLatin1(timings)));
    ASSERT_TRUE(node.has_value());

    const auto payload = parsePayload(*node);
    ASSERT_TRUE(payload.has_value());
    EXPECT_EQ(payload->text, QStringLiteral("Sing"));
    EXPECT_EQ(payload->audioUrl, QStringLiteral("a.mp3"));
    ASSERT_EQ(payload->wordTimings.size(), 1);
    EXPECT_DOUBLE_EQ(payload->wordTimings.first().start, 0.5);
}

TEST(KaraokeSourceTest, RejectsUnparsablePayload) {
    const auto node = Html::parseElement(QStringLiteral("<div data-karaoke=\"{broken\"></div>"));
    ASSERT_TRUE(node.has_value());
    EXPECT_FALSE(parsePayload(*node).has_value());

    const auto plain = Html::parseElement(QStringLiteral("<div>nothing</div>"));
    ASSERT_TRUE(plain.has_value());
    EXPECT_FALSE(parsePayload(*plain).has_value());
}

// ============================================================================
// Slice views
// ============================================================================

TEST(SliceViewTest, BuildsEntriesForOverlappingWords) {
    const KaraokeSource source = numberedSource();
    SliceView view(KaraokeSlice{kSongId, 180, 360});
    ASSERT_TRUE(view.ensureInitialized(&source));
    EXPECT_TRUE(view.ensureInitialized(&source));

    ASSERT_EQ(view.words().size(), 18);
    EXPECT_EQ(view.words().first().wordIndex, 18);
    EXPECT_EQ(view.words().first().localStart, 1);
    EXPECT_EQ(view.words().first().localEnd, 10);
    EXPECT_EQ(view.words().last().wordIndex, 35);
    EXPECT_EQ(view.text().size(), 180);
}

TEST(SliceViewTest, AttachesTrailingPunctuation) {
    KaraokePayload payload;
    payload.text = QStringLiteral("Hi there, friend.");
    payload.wordTimings = {{QStringLiteral("hi"), 0, 0.5, std::nullopt},
                           {QStringLiteral("there"), 0.5, 1, std::nullopt},
                           {QStringLiteral("friend"), 1, 1.5, std::nullopt}};
    const KaraokeSource source = buildSource(QStringLiteral("k"), payload);
    SliceView view(KaraokeSlice{QStringLiteral("k"), 0, int(source.text.size())});
    ASSERT_TRUE(view.ensureInitialized(&source));
    ASSERT_EQ(view.words().size(), 3);
    EXPECT_EQ(view.words()[0].punctuationLength, 0);
    EXPECT_EQ(view.words()[1].punctuationLength, 1);
    EXPECT_EQ(view.words()[1].localEnd, 9);

    view.setWordProgress(0, 1.5);
    view.setWordProgress(1, 0.25);
    const QString html = view.renderHtml();
    EXPECT_TRUE(html.contains(QStringLiteral("<span class=\"karaoke-punctuation\">,</span>")));
    EXPECT_TRUE(html.contains(QStringLiteral("karaoke-word karaoke-word-complete")));
    EXPECT_TRUE(html.contains(QStringLiteral("karaoke-word karaoke-word-active")));
    EXPECT_TRUE(html.contains(QStringLiteral("--karaoke-fill: 0.250")));
    EXPECT_EQ(Html::stripTags(html), source.text);
}

TEST(SliceViewTest, ProgressClampsAndSetsState) {
    const KaraokeSource source = numberedSource();
    SliceView view(KaraokeSlice{kSongId, 0, 180});
    ASSERT_TRUE(view.ensureInitialized(&source));

    view.setWordProgress(0, -1);
    EXPECT_EQ(view.words()[0].state, WordEntry::Pending);
    EXPECT_DOUBLE_EQ(view.words()[0].fill, 0.0);
    view.setWordProgress(0, 0.4);
    EXPECT_EQ(view.words()[0].state, WordEntry::Active);
    view.setWordProgress(0, 7);
    EXPECT_EQ(view.words()[0].state, WordEntry::Complete);
    EXPECT_DOUBLE_EQ(view.words()[0].fill, 1.0);

    view.resetHighlight();
    EXPECT_EQ(view.words()[0].state, WordEntry::Pending);
}

TEST(SliceViewTest, InitializationPreconditions) {
    const KaraokeSource source = numberedSource();

    SliceView disconnected(KaraokeSlice{kSongId, 0, 180});
    disconnected.setConnected(false);
    EXPECT_FALSE(disconnected.ensureInitialized(&source));

    SliceView blank(KaraokeSlice{kSongId, 0, 1});
    EXPECT_FALSE(blank.ensureInitialized(&source));

    SliceView orphan(KaraokeSlice{kSongId, 0, 180});
    EXPECT_FALSE(orphan.ensureInitialized(nullptr));
    EXPECT_FALSE(orphan.isInitialized());
}

// ============================================================================
// Playback controller
// ============================================================================

class PlaybackControllerTest : public ::testing::Test {
protected:
    KaraokeSource source = numberedSource();
    FakeAudioHandle *audio = nullptr;
    std::unique_ptr<PlaybackController> controller;
    SliceView first{KaraokeSlice{kSongId, 0, 180}};
    SliceView second{KaraokeSlice{kSongId, 180, 360}};
    SliceView third{KaraokeSlice{kSongId, 360, 500}};

    QList<int> waitingWords;
    QList<double> waitingTimes;
    int endedCount = 0;

    void SetUp() override
    {
        auto handle = std::make_unique<FakeAudioHandle>(50.0);
        audio = handle.get();
        controller = std::make_unique<PlaybackController>(source, std::move(handle));
        QObject::connect(controller.get(), &PlaybackController::waitingForNextPage,
                         [this](const QString &, int word, double time) {
                             waitingWords.append(word);
                             waitingTimes.append(time);
                         });
        QObject::connect(controller.get(), &PlaybackController::playbackEnded,
                         [this](const QString &) { ++endedCount; });
    }

    void frameAt(double t)
    {
        audio->time = t;
        controller->advanceFrame();
    }
};

TEST_F(PlaybackControllerTest, HighlightsFollowTheClock) {
    ASSERT_TRUE(controller->playSlice(&first));
    EXPECT_TRUE(audio->playing);
    EXPECT_DOUBLE_EQ(audio->time, 0.0);
    EXPECT_TRUE(controller->isLoopActive());
    EXPECT_EQ(controller->activeView(), &first);

    frameAt(5.4);
    EXPECT_EQ(first.words()[4].state, WordEntry::Complete);
    EXPECT_EQ(first.words()[5].state, WordEntry::Active);
    EXPECT_NEAR(first.words()[5].fill, 0.5, 1e-9);
    EXPECT_EQ(first.words()[6].state, WordEntry::Pending);
    EXPECT_TRUE(waitingWords.isEmpty());
}

TEST_F(PlaybackControllerTest, PausesAtSliceEndAndResumesOnNextPage) {
    ASSERT_TRUE(controller->playSlice(&first));
    frameAt(17.5);
    EXPECT_TRUE(waitingWords.isEmpty());

    frameAt(17.8);
    ASSERT_EQ(waitingWords.size(), 1);
    EXPECT_EQ(waitingWords.first(), 18);
    EXPECT_DOUBLE_EQ(waitingTimes.first(), 18.0);
    EXPECT_TRUE(controller->state().waitingForNextPage);
    EXPECT_FALSE(audio->playing);
    EXPECT_FALSE(controller->isLoopActive());
    EXPECT_EQ(controller->resumeCharStart().value_or(-1), 181);

    const PlayOptions options = controller->resumeOptions();
    ASSERT_TRUE(options.isResuming());
    EXPECT_EQ(options.resumeWordIndex, 18);

    ASSERT_TRUE(controller->playSlice(&second, options));
    EXPECT_DOUBLE_EQ(audio->time, 18.0);
    EXPECT_TRUE(audio->playing);
    EXPECT_TRUE(controller->state().waitingForNextPage);

    frameAt(18.0);
    EXPECT_FALSE(controller->state().waitingForNextPage);
    EXPECT_FALSE(controller->resumeOptions().isResuming());
    EXPECT_EQ(waitingWords.size(), 1);
}

TEST_F(PlaybackControllerTest, LastSliceNeverWaits) {
    ASSERT_TRUE(controller->playSlice(&third, PlayOptions{36, 36.0}));
    frameAt(49.9);
    EXPECT_TRUE(waitingWords.isEmpty());
    EXPECT_TRUE(controller->isLoopActive());
}

TEST_F(PlaybackControllerTest, EndOfAudioResetsEverything) {
    ASSERT_TRUE(controller->playSlice(&third, PlayOptions{36, 36.0}));
    frameAt(40.0);
    EXPECT_EQ(third.words()[0].state, WordEntry::Complete);

    frameAt(50.0);
    EXPECT_EQ(endedCount, 1);
    EXPECT_EQ(controller->activeView(), nullptr);
    EXPECT_FALSE(controller->isLoopActive());
    EXPECT_EQ(third.words()[0].state, WordEntry::Pending);
}

TEST_F(PlaybackControllerTest, FreshPlayClearsPendingResume) {
    ASSERT_TRUE(controller->playSlice(&first));
    frameAt(17.8);
    ASSERT_TRUE(controller->state().waitingForNextPage);

    ASSERT_TRUE(controller->playSlice(&first));
    EXPECT_FALSE(controller->state().waitingForNextPage);
    EXPECT_FALSE(controller->state().resumeWordIndex.has_value());
    EXPECT_DOUBLE_EQ(audio->time, 0.0);
}

TEST_F(PlaybackControllerTest, ResumedSliceKeepsEarlierWordsComplete) {
    // A page that starts mid-slice: words before the resume word stay lit
    ASSERT_TRUE(controller->playSlice(&first, PlayOptions{10, 10.0}));
    EXPECT_EQ(first.words()[9].state, WordEntry::Complete);
    EXPECT_EQ(first.words()[10].state, WordEntry::Pending);
}

TEST_F(PlaybackControllerTest, DisconnectedViewStopsTheLoop) {
    ASSERT_TRUE(controller->playSlice(&first));
    first.setConnected(false);
    frameAt(1.0);
    EXPECT_FALSE(controller->isLoopActive());
}

TEST_F(PlaybackControllerTest, UnregisteringActiveViewCancelsLoop) {
    ASSERT_TRUE(controller->playSlice(&first));
    controller->unregisterView(&first);
    EXPECT_EQ(controller->activeView(), nullptr);
    EXPECT_FALSE(controller->isLoopActive());
}

TEST_F(PlaybackControllerTest, StopRewindsAndDisposeRefusesPlayback) {
    ASSERT_TRUE(controller->playSlice(&first));
    frameAt(3.0);
    controller->stop();
    EXPECT_DOUBLE_EQ(audio->time, 0.0);
    EXPECT_FALSE(audio->playing);

    controller->dispose();
    EXPECT_TRUE(controller->isDisposed());
    EXPECT_FALSE(controller->playSlice(&first));
}

TEST_F(PlaybackControllerTest, UninitialisableSliceDoesNotPlay) {
    SliceView blank(KaraokeSlice{kSongId, 0, 1});
    EXPECT_FALSE(controller->playSlice(&blank));
    EXPECT_FALSE(audio->playing);
}

// ============================================================================
// Registry
// ============================================================================

class KaraokeRegistryTest : public ::testing::Test {
protected:
    QMap<QString, FakeAudioHandle *> audio;
    std::unique_ptr<KaraokeRegistry> registry;
    QList<QPair<QString, int>> started;
    QStringList failed;

    void SetUp() override
    {
        KaraokeSettings settings;
        settings.initRetryLimit = 3;
        settings.initRetryIntervalMs = 5;
        registry = std::make_unique<KaraokeRegistry>(settings, [this](const KaraokeSource &source) {
            auto handle = std::make_unique<FakeAudioHandle>(50.0);
            audio.insert(source.id, handle.get());
            return std::unique_ptr<AudioHandle>(std::move(handle));
        });

        QMap<QString, KaraokeSource> sources;
        sources.insert(kSongId, numberedSource());
        sources.insert(QStringLiteral("other"), numberedSource(QStringLiteral("other")));
        registry->setSources(sources);

        QObject::connect(registry.get(), &KaraokeRegistry::playbackStarted,
                         [this](const QString &id, int startChar) { started.append({id, startChar}); });
        QObject::connect(registry.get(), &KaraokeRegistry::initializationFailed,
                         [this](const QString &id) { failed.append(id); });
    }
};

TEST_F(KaraokeRegistryTest, ControllersAreCreatedOnDemand) {
    EXPECT_FALSE(registry->hasController(kSongId));
    PlaybackController *ctrl = registry->controller(kSongId);
    ASSERT_NE(ctrl, nullptr);
    EXPECT_TRUE(registry->hasController(kSongId));
    EXPECT_EQ(registry->controller(kSongId), ctrl);
    EXPECT_EQ(registry->controller(QStringLiteral("unknown")), nullptr);
}

TEST_F(KaraokeRegistryTest, PageEnterContinuesOnTheSliceHoldingTheResumeWord) {
    SliceView *page1 = registry->mountSlice(1, KaraokeSlice{kSongId, 0, 180});
    registry->mountSlice(2, KaraokeSlice{kSongId, 0, 180});
    SliceView *page2 = registry->mountSlice(2, KaraokeSlice{kSongId, 180, 360});

    registry->onPageEnter(1);
    ASSERT_EQ(started.size(), 1);
    EXPECT_EQ(started.first(), qMakePair(kSongId, 0));
    PlaybackController *ctrl = registry->controller(kSongId);
    EXPECT_EQ(ctrl->activeView(), page1);

    audio.value(kSongId)->time = 17.8;
    ctrl->advanceFrame();
    ASSERT_TRUE(ctrl->state().waitingForNextPage);

    registry->unmountPage(1);
    registry->onPageEnter(2);
    ASSERT_EQ(started.size(), 2);
    EXPECT_EQ(started.last(), qMakePair(kSongId, 180));
    EXPECT_EQ(ctrl->activeView(), page2);
    EXPECT_DOUBLE_EQ(audio.value(kSongId)->time, 18.0);
}

TEST_F(KaraokeRegistryTest, EnteringAPagePausesOtherSources) {
    registry->mountSlice(1, KaraokeSlice{kSongId, 0, 180});
    registry->mountSlice(2, KaraokeSlice{QStringLiteral("other"), 0, 180});

    registry->onPageEnter(1);
    ASSERT_TRUE(audio.value(kSongId)->playing);
    registry->onPageEnter(2);
    EXPECT_FALSE(audio.value(kSongId)->playing);
    EXPECT_TRUE(audio.value(QStringLiteral("other"))->playing);
}

TEST_F(KaraokeRegistryTest, RetriesUntilTheSliceCanInitialise) {
    SliceView *view = registry->mountSlice(1, KaraokeSlice{kSongId, 0, 180});
    view->setConnected(false);
    registry->onPageEnter(1);
    EXPECT_TRUE(started.isEmpty());

    QTimer::singleShot(0, registry.get(), [view]() { view->setConnected(true); });
    EXPECT_TRUE(waitFor(registry.get(), &KaraokeRegistry::playbackStarted));
    EXPECT_EQ(started.size(), 1);
    EXPECT_TRUE(failed.isEmpty());
}

TEST_F(KaraokeRegistryTest, GivesUpAfterTheRetryLimit) {
    SliceView *view = registry->mountSlice(1, KaraokeSlice{kSongId, 0, 180});
    view->setConnected(false);
    registry->onPageEnter(1);
    EXPECT_TRUE(waitFor(registry.get(), &KaraokeRegistry::initializationFailed));
    EXPECT_EQ(failed, QStringList{kSongId});
    EXPECT_TRUE(started.isEmpty());
}

TEST_F(KaraokeRegistryTest, DisposeAllAbandonsPendingRetries) {
    SliceView *view = registry->mountSlice(1, KaraokeSlice{kSongId, 0, 180});
    view->setConnected(false);
    registry->onPageEnter(1);
    registry->disposeAll();
    spin(60);
    EXPECT_TRUE(failed.isEmpty());
    EXPECT_FALSE(registry->hasController(kSongId));
}

TEST_F(KaraokeRegistryTest, UnmountingThePlayingPageStopsTheLoop) {
    registry->mountSlice(1, KaraokeSlice{kSongId, 0, 180});
    registry->onPageEnter(1);
    PlaybackController *ctrl = registry->controller(kSongId);
    ASSERT_TRUE(ctrl->isLoopActive());

    registry->unmountPage(1);
    EXPECT_TRUE(registry->views(1).isEmpty());
    EXPECT_EQ(ctrl->activeView(), nullptr);
    EXPECT_FALSE(ctrl->isLoopActive());
    EXPECT_FALSE(audio.value(kSongId)->playing);
}

TEST_F(KaraokeRegistryTest, EnteringAPageWithoutSlicesPausesPlayback) {
    registry->mountSlice(1, KaraokeSlice{kSongId, 0, 180});
    registry->onPageEnter(1);
    ASSERT_TRUE(audio.value(kSongId)->playing);

    registry->onPageEnter(99);
    EXPECT_FALSE(audio.value(kSongId)->playing);
    EXPECT_FALSE(registry->controller(kSongId)->isLoopActive());
    EXPECT_EQ(started.size(), 1);
}

TEST_F(KaraokeRegistryTest, DroppedSourcesLoseTheirControllers) {
    registry->controller(kSongId);
    registry->controller(QStringLiteral("other"));

    QMap<QString, KaraokeSource> remaining;
    remaining.insert(QStringLiteral("other"), registry->sources().value(QStringLiteral("other")));
    registry->setSources(remaining);
    EXPECT_FALSE(registry->hasController(kSongId));
    EXPECT_TRUE(registry->hasController(QStringLiteral("other")));
}

TEST(KaraokeRegistryAudioTest, ClockAudioLastsUntilTheLastWord) {
    const std::unique_ptr<AudioHandle> audio = KaraokeRegistry::clockAudio(numberedSource());
    EXPECT_DOUBLE_EQ(audio->duration(), 49.8);
    EXPECT_EQ(audio->source(), QStringLiteral("song.mp3"));
}

// ============================================================================
// Clock audio
// ============================================================================

TEST(ClockAudioHandleTest, SeekingClampsToDuration) {
    ClockAudioHandle audio(QStringLiteral("a.mp3"), 2.0);
    EXPECT_FALSE(audio.isPlaying());
    audio.setCurrentTime(1.5);
    EXPECT_DOUBLE_EQ(audio.currentTime(), 1.5);
    audio.setCurrentTime(9);
    EXPECT_DOUBLE_EQ(audio.currentTime(), 2.0);
    EXPECT_TRUE(audio.hasEnded());
    audio.setCurrentTime(-3);
    EXPECT_DOUBLE_EQ(audio.currentTime(), 0.0);
}

TEST(ClockAudioHandleTest, PlayingFromTheEndRestarts) {
    ClockAudioHandle audio(QStringLiteral("a.mp3"), 2.0);
    audio.setCurrentTime(2.0);
    audio.play();
    EXPECT_TRUE(audio.isPlaying());
    EXPECT_LT(audio.currentTime(), 1.0);
    audio.pause();
    EXPECT_FALSE(audio.isPlaying());
}

TEST(ClockAudioHandleTest, UnknownDurationNeverEnds) {
    ClockAudioHandle audio(QStringLiteral("a.mp3"));
    audio.setCurrentTime(1000);
    EXPECT_FALSE(audio.hasEnded());
}

// ============================================================================
// Timing import
// ============================================================================

TEST(TimingImportTest, AcceptsPlainArray) {
    TimingImportError error = TimingImportError::Empty;
    const auto timings = importTimings(R"([{"word": "a", "start": 1, "end": 0.5}, {"word": "b", "start": 2, "end": 3}])", &error);
    ASSERT_TRUE(timings.has_value());
    EXPECT_EQ(error, TimingImportError::None);
    ASSERT_EQ(timings->size(), 2);
    // end before start is clamped
    EXPECT_DOUBLE_EQ(timings->at(0).end, 1.0);
}

TEST(TimingImportTest, AcceptsWordTimingsObject) {
    const auto timings = importTimings(R"({"wordTimings": [{"word": "x", "start": 0, "end": 1}]})");
    ASSERT_TRUE(timings.has_value());
    EXPECT_EQ(timings->first().word, QStringLiteral("x"));
}

TEST(TimingImportTest, AcceptsRecognitionResponse) {
    const auto timings = importTimings(R"({"results": {"channels": [{"alternatives": [{"words": [
        {"word": "hello", "punctuated_word": "Hello,", "start": 0.1, "end": 0.4, "confidence": 0.98},
        {"word": "there", "start": 0.5, "end": 0.9}
    ]}]}]}})");
    ASSERT_TRUE(timings.has_value());
    ASSERT_EQ(timings->size(), 2);
    EXPECT_EQ(timings->first().word, QStringLiteral("hello"));
    ASSERT_TRUE(timings->first().confidence.has_value());
    EXPECT_DOUBLE_EQ(*timings->first().confidence, 0.98);
}

TEST(TimingImportTest, ReportsUnsupportedAndEmptyInput) {
    TimingImportError error = TimingImportError::None;
    EXPECT_FALSE(importTimings("not json", &error).has_value());
    EXPECT_EQ(error, TimingImportError::UnsupportedFormat);

    EXPECT_FALSE(importTimings(R"([{"word": "no start"}])", &error).has_value());
    EXPECT_EQ(error, TimingImportError::UnsupportedFormat);

    EXPECT_FALSE(importTimings(R"({"pages": []})", &error).has_value());
    EXPECT_EQ(error, TimingImportError::UnsupportedFormat);

    EXPECT_FALSE(importTimings("[]", &error).has_value());
    EXPECT_EQ(error, TimingImportError::Empty);
    EXPECT_FALSE(timingImportErrorString(error).isEmpty());
}

TEST(TimingAlignmentTest, MatchesWordsIgnoringPunctuation) {
    const QList<WordTiming> recognized{{QStringLiteral("the"), 0.0, 0.3, std::nullopt},
                                       {QStringLiteral("quick"), 0.3, 0.6, std::nullopt},
                                       {QStringLiteral("brown"), 0.6, 0.9, std::nullopt},
                                       {QStringLiteral("fox"), 0.9, 1.2, std::nullopt}};
    const QList<WordTiming> aligned = alignTimingsToText(recognized, QStringLiteral("The quick,  brown fox!"));
    ASSERT_EQ(aligned.size(), 4);
    EXPECT_EQ(aligned[1].word, QStringLiteral("quick,"));
    EXPECT_DOUBLE_EQ(aligned[1].start, 0.3);
    EXPECT_DOUBLE_EQ(aligned[3].end, 1.2);
}

TEST(TimingAlignmentTest, InterpolatesMissingWords) {
    const QList<WordTiming> recognized{{QStringLiteral("the"), 0.0, 0.4, std::nullopt},
                                       {QStringLiteral("fox"), 1.0, 1.4, std::nullopt}};
    const QList<WordTiming> aligned = alignTimingsToText(recognized, QStringLiteral("The quick fox"));
    ASSERT_EQ(aligned.size(), 3);
    EXPECT_DOUBLE_EQ(aligned[1].start, 0.4);
    EXPECT_NEAR(aligned[1].end, 0.8, 1e-9);
    EXPECT_DOUBLE_EQ(aligned[2].start, 1.0);
}

TEST(TimingAlignmentTest, UnmatchedFirstWordStartsWithTheRecording) {
    const QList<WordTiming> recognized{{QStringLiteral("fox"), 2.0, 2.5, std::nullopt}};
    const QList<WordTiming> aligned = alignTimingsToText(recognized, QStringLiteral("Zebra fox"));
    ASSERT_EQ(aligned.size(), 2);
    EXPECT_DOUBLE_EQ(aligned[0].start, 2.0);
    EXPECT_DOUBLE_EQ(aligned[0].end, 2.5);
    EXPECT_DOUBLE_EQ(aligned[1].start, 2.0);
}

TEST(TimingAlignmentTest, LookAheadIsLimitedToThreeWords) {
    const QList<WordTiming> recognized{{QStringLiteral("x"), 0, 1, std::nullopt},
                                       {QStringLiteral("y"), 1, 2, std::nullopt},
                                       {QStringLiteral("z"), 2, 3, std::nullopt},
                                       {QStringLiteral("target"), 3, 4, std::nullopt}};
    const QList<WordTiming> aligned = alignTimingsToText(recognized, QStringLiteral("target"));
    ASSERT_EQ(aligned.size(), 1);
    EXPECT_DOUBLE_EQ(aligned[0].start, 0.0);
    EXPECT_DOUBLE_EQ(aligned[0].end, 0.5);
}

TEST(TimingAlignmentTest, WithoutRecognitionWordsAreSequential) {
    const QList<WordTiming> aligned = alignTimingsToText({}, QStringLiteral("a b c"));
    ASSERT_EQ(aligned.size(), 3);
    EXPECT_DOUBLE_EQ(aligned[0].start, 0.0);
    EXPECT_DOUBLE_EQ(aligned[1].start, 0.5);
    EXPECT_DOUBLE_EQ(aligned[2].end, 1.5);
}

TEST(TimingAlignmentTest, PunctuationOnlyWordsAreInterpolated) {
    const QList<WordTiming> recognized{{QStringLiteral("yes"), 0.0, 0.5, std::nullopt},
                                       {QStringLiteral("no"), 1.0, 1.5, std::nullopt}};
    const QList<WordTiming> aligned = alignTimingsToText(recognized, QStringLiteral("yes - no"));
    ASSERT_EQ(aligned.size(), 3);
    EXPECT_DOUBLE_EQ(aligned[1].start, 0.5);
    EXPECT_DOUBLE_EQ(aligned[2].start, 1.0);
}
