//! # Item Representation Tests
//!
//! Compiled content lookup, snapshot sealing and writing, paths, progress
//! reset and identity.

#include "rep/item_rep.hpp"
#include "test_filters.hpp"

#include <gtest/gtest.h>

using namespace strata;
namespace fs = std::filesystem;
using namespace strata::rep;
using strata::test::CompileTest;
using strata::test::read_file;

class ItemRepTest : public CompileTest {
protected:
    /// Replaces the textual content of `rep` with the given snapshots.
    static void set_content(ItemRep& rep, const std::map<std::string, std::string>& content) {
        auto* text = rep.store().text();
        ASSERT_NE(text, nullptr);
        text->content.clear();
        for (const auto& [name, value] : content) {
            text->content[name] = make_content(value);
        }
    }
};

// ============================================================================
// Construction
// ============================================================================

TEST_F(ItemRepTest, StartsUncompiledWithItemContent) {
    auto item = item::Item::textual("/", "raw content");
    ItemRep rep(item, "default", context());

    EXPECT_FALSE(rep.compiled());
    EXPECT_FALSE(rep.binary());
    EXPECT_EQ(rep.name(), "default");
    EXPECT_EQ(rep.store().text()->last(), "raw content");
    EXPECT_TRUE(rep.snapshots().empty());
    EXPECT_TRUE(rep.raw_paths().empty());
}

TEST_F(ItemRepTest, BinaryItemGivesBinaryRep) {
    auto item = item::Item::binary("/logo/", dir_ / "logo.png");
    ItemRep rep(item, "default", context());

    EXPECT_TRUE(rep.binary());
    EXPECT_EQ(rep.store().binary()->last(), dir_ / "logo.png");
}

// ============================================================================
// Compiled Content
// ============================================================================

TEST_F(ItemRepTest, CompiledContentWithOnlyLastAvailable) {
    auto item = item::Item::textual("/", "blah");
    ItemRep rep(item, "default", context());
    set_content(rep, {{"last", "last content"}});
    rep.set_compiled(true);

    auto content = rep.compiled_content();
    ASSERT_TRUE(is_ok(content));
    EXPECT_EQ(unwrap(content), "last content");
}

TEST_F(ItemRepTest, CompiledContentPrefersPre) {
    auto item = item::Item::textual("/", "blah");
    ItemRep rep(item, "default", context());
    set_content(rep, {{"pre", "pre content"}, {"last", "last content"}});
    rep.set_compiled(true);

    auto content = rep.compiled_content();
    ASSERT_TRUE(is_ok(content));
    EXPECT_EQ(unwrap(content), "pre content");
}

TEST_F(ItemRepTest, CompiledContentWithCustomSnapshot) {
    auto item = item::Item::textual("/", "blah");
    ItemRep rep(item, "default", context());
    set_content(rep, {{"pre", "pre content"}, {"last", "last content"}});
    rep.set_compiled(true);

    auto content = rep.compiled_content(std::string("last"));
    ASSERT_TRUE(is_ok(content));
    EXPECT_EQ(unwrap(content), "last content");
}

TEST_F(ItemRepTest, CompiledContentWithInvalidSnapshot) {
    auto item = item::Item::textual("/", "blah");
    ItemRep rep(item, "default", context());
    set_content(rep, {{"pre", "pre content"}, {"last", "last content"}});

    for (bool compiled : {false, true}) {
        rep.set_compiled(compiled);
        auto content = rep.compiled_content(std::string("bogus"));
        ASSERT_TRUE(is_err(content));
        EXPECT_EQ(unwrap_err(content).code, CompileErrorCode::NoSuchSnapshot);
        EXPECT_EQ(unwrap_err(content).snapshot, "bogus");
    }
}

TEST_F(ItemRepTest, CompiledContentOfNonFinalFixedSnapshotIsMissing) {
    auto item = item::Item::textual("/", "blah");
    ItemRep rep(item, "default", context());
    rep.declare_snapshot("draft", false);
    set_content(rep, {{"draft", "draft content"}, {"last", "last"}});
    rep.set_compiled(true);

    auto content = rep.compiled_content(std::string("draft"));
    ASSERT_TRUE(is_err(content));
    EXPECT_EQ(unwrap_err(content).code, CompileErrorCode::NoSuchSnapshot);
}

TEST_F(ItemRepTest, CompiledContentOfSealedFixedSnapshot) {
    auto item = item::Item::textual("/", "blah");
    ItemRep rep(item, "default", context());
    rep.declare_snapshot("raw");
    set_content(rep, {{"raw", "raw content"}, {"last", "last"}});

    auto content = rep.compiled_content(std::string("raw"));
    ASSERT_TRUE(is_ok(content));
    EXPECT_EQ(unwrap(content), "raw content");
}

TEST_F(ItemRepTest, CompiledContentWithUncompiledContent) {
    auto item = item::Item::textual("/", "blah");
    ItemRep rep(item, "default", context());

    auto content = rep.compiled_content();
    ASSERT_TRUE(is_err(content));
    EXPECT_TRUE(unwrap_err(content).is_unmet_dependency());
}

TEST_F(ItemRepTest, CompiledContentWithMovingPreSnapshot) {
    auto item = item::Item::textual("/", "blah");
    ItemRep rep(item, "default", context());
    set_content(rep, {{"pre", "pre!"}, {"last", "last!"}});

    auto content = rep.compiled_content(std::string("pre"));
    ASSERT_TRUE(is_err(content));
    EXPECT_EQ(unwrap_err(content).code, CompileErrorCode::UnmetDependency);
    EXPECT_EQ(unwrap_err(content).snapshot, "pre");
}

TEST_F(ItemRepTest, CompiledContentWithNonMovingPreSnapshot) {
    auto item = item::Item::textual("/", "blah");
    ItemRep rep(item, "default", context());
    rep.declare_snapshot("pre", true);
    set_content(rep, {{"pre", "pre!"}, {"post", "post!"}, {"last", "last!"}});

    auto content = rep.compiled_content(std::string("pre"));
    ASSERT_TRUE(is_ok(content));
    EXPECT_EQ(unwrap(content), "pre!");
}

TEST_F(ItemRepTest, CompiledContentOfPostIsUnavailableUntilCompiled) {
    auto item = item::Item::textual("/", "blah");
    ItemRep rep(item, "default", context());
    set_content(rep, {{"post", "post!"}, {"last", "last!"}});

    EXPECT_TRUE(is_err(rep.compiled_content(std::string("post"))));
    rep.set_compiled(true);
    auto content = rep.compiled_content(std::string("post"));
    ASSERT_TRUE(is_ok(content));
    EXPECT_EQ(unwrap(content), "post!");
}

TEST_F(ItemRepTest, CompiledContentOfMissingMovingSnapshotIsUnmet) {
    auto item = item::Item::textual("/", "blah");
    ItemRep rep(item, "default", context());
    rep.set_compiled(true);

    auto content = rep.compiled_content(std::string("post"));
    ASSERT_TRUE(is_err(content));
    EXPECT_TRUE(unwrap_err(content).is_unmet_dependency());
}

TEST_F(ItemRepTest, CompiledContentOfBinaryItemFails) {
    auto item = item::Item::binary("/", dir_ / "in.dat");
    ItemRep rep(item, "default", context());

    auto content = rep.compiled_content();
    ASSERT_TRUE(is_err(content));
    EXPECT_EQ(unwrap_err(content).code, CompileErrorCode::CannotGetCompiledContentOfBinaryItem);
    EXPECT_EQ(recorder_.count(event::Event::VisitStarted), 0u);
}

TEST_F(ItemRepTest, CompiledContentRecordsVisit) {
    auto item = item::Item::textual("/blog/", "blah");
    ItemRep rep(item, "default", context());
    rep.set_compiled(true);

    ASSERT_TRUE(is_ok(rep.compiled_content()));

    ASSERT_EQ(recorder_.received.size(), 2u);
    EXPECT_EQ(recorder_.received[0].event, event::Event::VisitStarted);
    EXPECT_EQ(recorder_.received[1].event, event::Event::VisitEnded);
    EXPECT_EQ(recorder_.received[0].object, item.reference());
}

// ============================================================================
// Snapshots
// ============================================================================

TEST_F(ItemRepTest, SnapshotsHoldContentAtTimeOfSealing) {
    auto item = item::Item::textual("/foobar/", "<% '<x>' %>");
    ItemRep rep(item, "foo", context());

    ASSERT_TRUE(is_ok(rep.snapshot("foo")));
    ASSERT_TRUE(is_ok(rep.filter("unwrap")));
    ASSERT_TRUE(is_ok(rep.snapshot("bar")));
    ASSERT_TRUE(is_ok(rep.filter("unwrap")));
    ASSERT_TRUE(is_ok(rep.snapshot("qux")));

    const auto* text = rep.store().text();
    EXPECT_EQ(*text->at("foo"), "<% '<x>' %>");
    EXPECT_EQ(*text->at("bar"), "<x>");
    EXPECT_EQ(*text->at("qux"), "x");
}

TEST_F(ItemRepTest, FinalSnapshotIsWritten) {
    auto item = item::Item::textual("/", "Lorem ipsum, etc.");
    ItemRep rep(item, "foo", context());
    auto out = dir_ / "foo-moo.txt";
    rep.set_raw_path("moo", out);

    ASSERT_TRUE(is_ok(rep.snapshot("moo", false)));
    EXPECT_FALSE(fs::exists(out));

    ASSERT_TRUE(is_ok(rep.snapshot("moo", true)));
    ASSERT_TRUE(fs::is_regular_file(out));
    EXPECT_EQ(read_file(out), "Lorem ipsum, etc.");
    fs::remove(out);

    ASSERT_TRUE(is_ok(rep.snapshot("moo")));
    ASSERT_TRUE(fs::is_regular_file(out));
    EXPECT_EQ(read_file(out), "Lorem ipsum, etc.");
}

TEST_F(ItemRepTest, FinalPreSnapshotIsSealed) {
    auto item = item::Item::textual("/", "x");
    ItemRep rep(item, "default", context());

    ASSERT_TRUE(is_ok(rep.snapshot("pre", false)));
    EXPECT_TRUE(rep.snapshots().empty());

    ASSERT_TRUE(is_ok(rep.snapshot("pre", true)));
    ASSERT_EQ(rep.snapshots().size(), 1u);
    EXPECT_EQ(rep.snapshots()[0], (SnapshotEntry{"pre", true}));
}

TEST_F(ItemRepTest, FixedSnapshotIsNotAddedToSealedSequence) {
    auto item = item::Item::textual("/", "x");
    ItemRep rep(item, "default", context());

    ASSERT_TRUE(is_ok(rep.snapshot("raw")));
    EXPECT_TRUE(rep.snapshots().empty());
    EXPECT_TRUE(rep.has_snapshot("raw"));
}

TEST_F(ItemRepTest, HasSnapshotReflectsContent) {
    auto item = item::Item::textual("/", "x");
    ItemRep rep(item, "default", context());

    EXPECT_TRUE(rep.has_snapshot("last"));
    EXPECT_FALSE(rep.has_snapshot("pre"));
    ASSERT_TRUE(is_ok(rep.filter("upcase")));
    EXPECT_TRUE(rep.has_snapshot("pre"));
}

TEST_F(ItemRepTest, BinarySnapshotRecordsCurrentFile) {
    auto input = dir_ / "in.dat";
    test::write_file(input, "abc");
    auto item = item::Item::binary("/", input);
    ItemRep rep(item, "default", context());

    ASSERT_TRUE(is_ok(rep.snapshot("raw", false)));
    ASSERT_TRUE(is_ok(rep.filter("reverse_binary")));

    const auto* binary = rep.store().binary();
    ASSERT_NE(binary, nullptr);
    EXPECT_EQ(*binary->at("raw"), input);
    EXPECT_EQ(read_file(binary->last()), "cba");
    EXPECT_FALSE(rep.has_snapshot("raw"));
}

// ============================================================================
// Paths
// ============================================================================

TEST_F(ItemRepTest, RawPathRecordsVisitEvenWhenUnset) {
    auto item = item::Item::textual("/about/", "x");
    ItemRep rep(item, "default", context());

    EXPECT_FALSE(rep.raw_path().has_value());
    EXPECT_EQ(recorder_.count(event::Event::VisitStarted), 1u);
    EXPECT_EQ(recorder_.count(event::Event::VisitEnded), 1u);

    rep.set_raw_path("last", "output/about/index.html");
    auto raw = rep.raw_path();
    ASSERT_TRUE(raw.has_value());
    EXPECT_EQ(*raw, fs::path("output/about/index.html"));
    EXPECT_EQ(recorder_.count(event::Event::VisitStarted), 2u);
}

TEST_F(ItemRepTest, PathRecordsVisit) {
    auto item = item::Item::textual("/about/", "x");
    ItemRep rep(item, "default", context());
    rep.set_path("last", "/about/");

    auto path = rep.path();
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(*path, "/about/");
    EXPECT_FALSE(rep.path("pre").has_value());

    ASSERT_EQ(recorder_.count(event::Event::VisitStarted), 2u);
    EXPECT_EQ(recorder_.received[0].object, item.reference());
}

// ============================================================================
// Forget Progress
// ============================================================================

TEST_F(ItemRepTest, ForgetProgressResetsContentOnly) {
    auto item = item::Item::textual("/", "original");
    ItemRep rep(item, "default", context());
    rep.set_raw_path("last", dir_ / "out.html");
    rep.set_path("last", "/out.html");

    ASSERT_TRUE(is_ok(rep.filter("upcase")));
    ASSERT_TRUE(is_ok(rep.snapshot("pre", true)));
    ASSERT_TRUE(rep.has_snapshot("pre"));

    rep.forget_progress();

    EXPECT_EQ(rep.store().text()->last(), "original");
    EXPECT_FALSE(rep.has_snapshot("pre"));
    EXPECT_EQ(rep.snapshots().size(), 1u);
    EXPECT_EQ(rep.raw_paths().size(), 1u);
    EXPECT_EQ(rep.paths().size(), 1u);
}

TEST_F(ItemRepTest, ForgetProgressRestoresBinaryMode) {
    auto input = dir_ / "in.dat";
    test::write_file(input, "data");
    auto item = item::Item::binary("/", input);
    ItemRep rep(item, "default", context());

    ASSERT_TRUE(is_ok(rep.filter("to_text")));
    ASSERT_FALSE(rep.binary());

    rep.forget_progress();

    EXPECT_TRUE(rep.binary());
    EXPECT_EQ(rep.store().binary()->last(), input);
}

TEST_F(ItemRepTest, SealedPreSurvivesForgetProgress) {
    auto item = item::Item::textual("/", "x");
    ItemRep rep(item, "default", context());
    ASSERT_TRUE(is_ok(rep.snapshot("pre", true)));

    rep.forget_progress();

    // The sealed entry remains but its content is gone
    auto content = rep.compiled_content(std::string("pre"));
    ASSERT_TRUE(is_err(content));
    EXPECT_TRUE(unwrap_err(content).is_unmet_dependency());
}

// ============================================================================
// Identity
// ============================================================================

TEST_F(ItemRepTest, Reference) {
    auto item = item::Item::textual("/about/", "x");
    ItemRep rep(item, "print", context());

    auto ref = rep.reference();
    EXPECT_EQ(ref.kind, item::ObjectKind::ItemRep);
    EXPECT_EQ(ref.identifier, "/about/");
    EXPECT_EQ(ref.rep_name, "print");
    EXPECT_EQ(ref.to_string(), "item_rep /about/ (print)");
}

TEST_F(ItemRepTest, Describe) {
    auto item = item::Item::textual("/about/", "x");
    ItemRep rep(item, "default", context());
    EXPECT_EQ(rep.describe(), "item rep \"default\" of /about/ (text)");

    rep.set_raw_path("last", "output/about/index.html");
    EXPECT_EQ(rep.describe(),
              "item rep \"default\" of /about/ (text, raw_path=output/about/index.html)");
}
