//! # Listener Tests
//!
//! File action reporting and filter timing, driven by notifications.

#include "listeners/file_action_logger.hpp"
#include "listeners/filter_timing.hpp"
#include "test_filters.hpp"

#include <chrono>
#include <future>
#include <gtest/gtest.h>
#include <sstream>
#include <thread>

using namespace strata;
using namespace strata::listeners;
namespace fs = std::filesystem;
using strata::test::CompileTest;

class ListenersTest : public CompileTest {
protected:
    event::Notification written(const rep::ItemRep& rep, const fs::path& path, bool is_created,
                                bool is_modified) {
        event::Notification n{event::Event::RepWritten};
        n.rep = &rep;
        n.path = path;
        n.is_created = is_created;
        n.is_modified = is_modified;
        return n;
    }
};

// ============================================================================
// FileActionLogger
// ============================================================================

TEST_F(ListenersTest, FileActionsFromWriteNotifications) {
    auto item = item::Item::textual("/", "x");
    rep::ItemRep rep(item, "default", context());
    std::ostringstream out;
    FileActionLogger logger(out);
    logger.start(notifications_);

    notifications_.post(event::Event::CompilationStarted, rep);
    notifications_.notify(written(rep, "output/index.html", true, true));
    notifications_.notify(written(rep, "output/about.html", false, true));
    notifications_.notify(written(rep, "output/style.css", false, false));

    auto entries = logger.entries();
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[0].action, rep::WriteAction::Created);
    EXPECT_EQ(entries[1].action, rep::WriteAction::Updated);
    EXPECT_EQ(entries[2].action, rep::WriteAction::Identical);

    std::istringstream lines(out.str());
    std::string line;
    std::getline(lines, line);
    EXPECT_EQ(line.substr(0, 15), "      create  [");
    EXPECT_TRUE(line.ends_with("s]  output/index.html"));
    std::getline(lines, line);
    EXPECT_EQ(line.substr(0, 12), "      update");
    std::getline(lines, line);
    EXPECT_EQ(line.substr(0, 12), "   identical");
}

TEST_F(ListenersTest, FileActionLoggerIgnoresOtherEvents) {
    auto item = item::Item::textual("/", "x");
    rep::ItemRep rep(item, "default", context());
    std::ostringstream out;
    FileActionLogger logger(out);
    logger.start(notifications_);

    notifications_.post_filtering(event::Event::FilteringStarted, rep, "upcase");
    notifications_.post_visit(item.reference());

    EXPECT_TRUE(logger.entries().empty());
    EXPECT_TRUE(out.str().empty());
}

TEST_F(ListenersTest, FinishReportsSkippedPaths) {
    auto item = item::Item::textual("/", "x");
    rep::ItemRep compiled(item, "default", context());
    rep::ItemRep pending(item, "print", context());
    compiled.set_raw_path("last", "output/index.html");
    compiled.set_compiled(true);
    pending.set_raw_path("last", "output/print.html");
    std::ostringstream out;
    FileActionLogger logger(out);

    logger.finish({&compiled, &pending});

    auto entries = logger.entries();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].action, rep::WriteAction::Skipped);
    EXPECT_EQ(out.str(), "        skip  output/print.html\n");
}

TEST_F(ListenersTest, RealWriteIsLogged) {
    auto item = item::Item::textual("/", "x");
    rep::ItemRep rep(item, "default", context());
    rep.set_raw_path("last", dir_ / "index.html");
    std::ostringstream out;
    FileActionLogger logger(out);
    logger.start(notifications_);

    ASSERT_TRUE(is_ok(rep.write()));
    ASSERT_TRUE(is_ok(rep.write()));

    auto entries = logger.entries();
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].action, rep::WriteAction::Created);
    EXPECT_EQ(entries[1].action, rep::WriteAction::Identical);
    EXPECT_EQ(entries[0].path, dir_ / "index.html");
}

TEST_F(ListenersTest, StoppedListenerIsDetached) {
    FileActionLogger logger;
    logger.start(notifications_);
    EXPECT_TRUE(logger.is_started());
    EXPECT_EQ(notifications_.sink_count(), 2u);

    logger.stop();
    EXPECT_FALSE(logger.is_started());
    EXPECT_EQ(notifications_.sink_count(), 1u);
}

// ============================================================================
// FilterTimingRecorder
// ============================================================================

TEST(FilterTimingTest, SummaryOfRecordedTimes) {
    FilterTimingRecorder recorder;
    recorder.record("erb", 0.01);
    recorder.record("erb", 0.03);
    recorder.record("erb", 0.02);

    auto s = recorder.summary("erb");
    EXPECT_EQ(s.count, 3u);
    EXPECT_DOUBLE_EQ(s.min, 0.01);
    EXPECT_DOUBLE_EQ(s.max, 0.03);
    EXPECT_NEAR(s.total, 0.06, 1e-12);
    EXPECT_NEAR(s.avg, 0.02, 1e-12);

    EXPECT_EQ(recorder.summary("markdown").count, 0u);
}

TEST(FilterTimingTest, ReportListsFiltersSorted) {
    FilterTimingRecorder recorder;
    recorder.record("markdown", 0.10);
    recorder.record("erb", 0.02);

    std::ostringstream out;
    recorder.report(out);

    auto text = out.str();
    EXPECT_NE(text.find("filter   |  count    min    avg    max     tot"), std::string::npos);
    auto erb = text.find("erb      |      1  0.02s  0.02s  0.02s   0.02s");
    auto markdown = text.find("markdown |      1  0.10s  0.10s  0.10s   0.10s");
    ASSERT_NE(erb, std::string::npos);
    ASSERT_NE(markdown, std::string::npos);
    EXPECT_LT(erb, markdown);
}

TEST(FilterTimingTest, EmptyReportPrintsNothing) {
    FilterTimingRecorder recorder;
    std::ostringstream out;
    recorder.report(out);
    EXPECT_TRUE(out.str().empty());
}

TEST_F(ListenersTest, TimesFiltersFromNotifications) {
    auto item = item::Item::textual("/", "x");
    rep::ItemRep rep(item, "default", context());
    FilterTimingRecorder recorder;
    recorder.start(notifications_);

    ASSERT_TRUE(is_ok(rep.filter("upcase")));
    ASSERT_TRUE(is_ok(rep.filter("upcase")));
    ASSERT_TRUE(is_ok(rep.filter("unwrap")));

    EXPECT_EQ(recorder.summary("upcase").count, 2u);
    EXPECT_EQ(recorder.summary("unwrap").count, 1u);
    EXPECT_EQ(recorder.filter_names(), (std::vector<std::string>{"unwrap", "upcase"}));
}

TEST_F(ListenersTest, NestedRunsOfSameFilterAreTimedSeparately) {
    auto item = item::Item::textual("/", "x");
    rep::ItemRep rep(item, "default", context());
    FilterTimingRecorder recorder;
    recorder.start(notifications_);

    notifications_.post_filtering(event::Event::FilteringStarted, rep, "erb");
    notifications_.post_filtering(event::Event::FilteringStarted, rep, "erb");
    notifications_.post_filtering(event::Event::FilteringEnded, rep, "erb");
    notifications_.post_filtering(event::Event::FilteringEnded, rep, "erb");
    notifications_.post_filtering(event::Event::FilteringEnded, rep, "erb");

    EXPECT_EQ(recorder.summary("erb").count, 2u);
}

TEST_F(ListenersTest, RunsOnDifferentThreadsAreTimedSeparately) {
    auto item = item::Item::textual("/", "x");
    rep::ItemRep rep(item, "default", context());
    FilterTimingRecorder recorder;
    recorder.start(notifications_);
    std::promise<void> worker_started;
    std::promise<void> main_started;

    std::thread worker([&] {
        notifications_.post_filtering(event::Event::FilteringStarted, rep, "erb");
        worker_started.set_value();
        main_started.get_future().wait();
        notifications_.post_filtering(event::Event::FilteringEnded, rep, "erb");
    });

    worker_started.get_future().wait();
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    notifications_.post_filtering(event::Event::FilteringStarted, rep, "erb");
    main_started.set_value();
    worker.join();
    notifications_.post_filtering(event::Event::FilteringEnded, rep, "erb");

    auto s = recorder.summary("erb");
    EXPECT_EQ(s.count, 2u);
    EXPECT_GE(s.max, 0.03);
    EXPECT_LT(s.min, 0.03);
}
