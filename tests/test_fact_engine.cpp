// =============================================================================
// End-to-end: trees -> snapshots -> changeset -> documents
// =============================================================================

#include <gtest/gtest.h>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "fact_engine.hpp"
#include "snapshot_serializer.hpp"
#include "test_support.hpp"
#include "tools/AtomicJournal.hpp"

using namespace code_facts;
using code_facts::testing_support::read_file;
using code_facts::testing_support::TempDir;
using code_facts::testing_support::write_file;

class FactEngineTest : public ::testing::Test {
protected:
    TempDir dir;
    FactEngine engine{2};

    EngineConfig config() const {
        EngineConfig cfg;
        cfg.current_root = dir / "current";
        cfg.current_revision = "head";
        cfg.baseline_root = dir / "baseline";
        cfg.baseline_revision = "base";
        cfg.out_full = dir / "out/code_facts_full.json";
        cfg.out_delta = dir / "out/code_facts_delta.json";
        cfg.workers = 2;
        cfg.generated_at = "2024-01-01T00:00:00Z";
        return cfg;
    }

    static std::vector<std::string> names(const nlohmann::json& facts) {
        std::vector<std::string> out;
        for (const auto& f : facts) out.push_back(f["qualified_name"].get<std::string>());
        return out;
    }
};

TEST_F(FactEngineTest, ProcessFileOutcomes) {
    MemoryTree tree;
    tree.add("a.py", "def foo():\n    pass\n");
    tree.add("notes.txt", "not code\n");
    tree.add("broken.py", "def broken(:\n");
    tree.add("bin/tool", "#!/usr/bin/env python3\ndef main():\n    pass\n");
    tree.add_unreadable("gone.py");

    FileFacts ok = engine.process_file(tree, "a.py");
    EXPECT_EQ(ok.status, FileStatus::Parsed);
    EXPECT_EQ(ok.language, "python");
    ASSERT_EQ(ok.facts.size(), 1u);
    EXPECT_FALSE(ok.facts[0].identity.empty());

    EXPECT_EQ(engine.process_file(tree, "notes.txt").status, FileStatus::Skipped);

    FileFacts broken = engine.process_file(tree, "broken.py");
    EXPECT_EQ(broken.status, FileStatus::Failed);
    EXPECT_TRUE(broken.facts.empty());
    EXPECT_FALSE(broken.failure.empty());

    FileFacts tool = engine.process_file(tree, "bin/tool");
    EXPECT_EQ(tool.status, FileStatus::Parsed);
    EXPECT_EQ(tool.language, "python");
    EXPECT_EQ(tool.facts.size(), 1u);

    EXPECT_EQ(engine.process_file(tree, "gone.py").status, FileStatus::Failed);
}

TEST_F(FactEngineTest, BuildSnapshotFromMemory) {
    MemoryTree tree;
    tree.add("a.py", "def foo():\n    pass\n");
    tree.add("b.go", "package b\n\nfunc Bar() {}\n");
    tree.add("c.py", "def (\n");
    tree.add("d.md", "# doc\n");

    Snapshot snap = engine.build_snapshot(tree, "rev", "t");
    EXPECT_EQ(snap.revision, "rev");
    EXPECT_EQ(snap.files_scanned, (std::set<std::string>{"a.py", "b.go", "c.py"}));
    EXPECT_EQ(snap.files_failed, (std::set<std::string>{"c.py"}));
    EXPECT_EQ(snap.files_skipped, (std::set<std::string>{"d.md"}));
    EXPECT_EQ(snap.facts.size(), 2u);
}

TEST_F(FactEngineTest, RunWritesBothDocuments) {
    write_file(dir / "baseline/widget.py", "class Widget:\n    def render(self):\n        return 1\n");
    write_file(dir / "current/widget.py", "class Widget:\n    def draw(self):\n        return 1\n");
    write_file(dir / "current/util.py", "def helper():\n    pass\n");

    RunSummary summary = engine.run(config());
    EXPECT_EQ(summary.added, 2u);
    EXPECT_EQ(summary.removed, 1u);
    EXPECT_EQ(summary.modified, 0u);
    EXPECT_EQ(summary.degraded_files, 0u);

    auto full = nlohmann::json::parse(read_file(dir / "out/code_facts_full.json"));
    EXPECT_EQ(full["revision"], "head");
    EXPECT_EQ(full["generated_at"], "2024-01-01T00:00:00Z");
    EXPECT_EQ(full["facts"].size(), summary.current_facts);

    auto delta = nlohmann::json::parse(read_file(dir / "out/code_facts_delta.json"));
    EXPECT_EQ(delta["baseline_revision"], "base");
    EXPECT_EQ(delta["current_revision"], "head");
    EXPECT_EQ(names(delta["added"]), (std::vector<std::string>{"util.helper", "widget.Widget.draw"}));
    EXPECT_EQ(names(delta["removed"]), (std::vector<std::string>{"widget.Widget.render"}));
    EXPECT_TRUE(delta["modified"].empty());
}

TEST_F(FactEngineTest, BodyEditIsExactlyOneModification) {
    write_file(dir / "baseline/a.py", "def foo():\n    return bar(1)\n");
    write_file(dir / "current/a.py", "def foo():\n    return bar(2)\n");

    RunSummary summary = engine.run(config());
    EXPECT_EQ(summary.added, 0u);
    EXPECT_EQ(summary.removed, 0u);
    EXPECT_EQ(summary.modified, 1u);

    auto delta = nlohmann::json::parse(read_file(dir / "out/code_facts_delta.json"));
    ASSERT_EQ(delta["modified"].size(), 1u);
    EXPECT_EQ(delta["modified"][0]["after"]["qualified_name"], "a.foo");
    EXPECT_NE(delta["modified"][0]["before"]["signature_hash"], delta["modified"][0]["after"]["signature_hash"]);
}

TEST_F(FactEngineTest, ParseFailureInCurrentIsDegraded) {
    write_file(dir / "baseline/a.py", "def foo():\n    pass\n");
    write_file(dir / "current/a.py", "def foo(:\n    pass\n");

    RunSummary summary = engine.run(config());
    EXPECT_EQ(summary.degraded_files, 1u);

    auto delta = nlohmann::json::parse(read_file(dir / "out/code_facts_delta.json"));
    EXPECT_EQ(names(delta["removed"]), (std::vector<std::string>{"a.foo"}));
    EXPECT_EQ(delta["degraded_files"], nlohmann::json::array({"a.py"}));

    auto full = nlohmann::json::parse(read_file(dir / "out/code_facts_full.json"));
    EXPECT_EQ(full["files_failed"], nlohmann::json::array({"a.py"}));
}

TEST_F(FactEngineTest, RepeatedRunsAreByteIdentical) {
    write_file(dir / "baseline/a.py", "def foo():\n    return 1\n");
    write_file(dir / "current/a.py", "def foo():\n    return 2\n");
    write_file(dir / "current/pkg/b.py", "import os\n\ndef bar(x):\n    if x:\n        return os.sep\n");
    write_file(dir / "current/web/app.js", "export const run = () => fetch('/x');\n");

    engine.run(config());
    std::string full_first = read_file(dir / "out/code_facts_full.json");
    std::string delta_first = read_file(dir / "out/code_facts_delta.json");

    FactEngine other{4};
    other.run(config());
    EXPECT_EQ(read_file(dir / "out/code_facts_full.json"), full_first);
    EXPECT_EQ(read_file(dir / "out/code_facts_delta.json"), delta_first);
}

TEST_F(FactEngineTest, BaselineSnapshotRoundTripGivesEmptyDelta) {
    write_file(dir / "current/a.py", "class A:\n    def f(self):\n        return g()\n");
    EngineConfig first = config();
    first.baseline_root.reset();
    engine.run(first);

    fs::copy_file(dir / "out/code_facts_full.json", dir / "previous.json");
    EngineConfig second = config();
    second.baseline_root.reset();
    second.baseline_snapshot = dir / "previous.json";

    RunSummary summary = engine.run(second);
    EXPECT_EQ(summary.added, 0u);
    EXPECT_EQ(summary.removed, 0u);
    EXPECT_EQ(summary.modified, 0u);

    auto delta = nlohmann::json::parse(read_file(dir / "out/code_facts_delta.json"));
    // The snapshot keeps the revision it was captured at
    EXPECT_EQ(delta["baseline_revision"], "head");
}

TEST_F(FactEngineTest, BaselineManifestLimitsFiles) {
    write_file(dir / "baseline/a.py", "def foo():\n    pass\n");
    write_file(dir / "baseline/stale.py", "def stale():\n    pass\n");
    write_file(dir / "current/a.py", "def foo():\n    pass\n");
    write_file(dir / "manifest.txt", "a.py\n");

    EngineConfig cfg = config();
    cfg.baseline_manifest = dir / "manifest.txt";
    RunSummary summary = engine.run(cfg);
    EXPECT_EQ(summary.added + summary.removed + summary.modified, 0u);
}

TEST_F(FactEngineTest, MissingBaselineReportsEverythingAdded) {
    write_file(dir / "current/a.py", "def foo():\n    pass\n");
    EngineConfig cfg = config();
    cfg.baseline_root.reset();

    RunSummary summary = engine.run(cfg);
    EXPECT_EQ(summary.added, summary.current_facts);
    EXPECT_EQ(summary.removed, 0u);
}

TEST_F(FactEngineTest, WriteFailureLeavesNoPartialDocuments) {
    write_file(dir / "current/a.py", "def foo():\n    pass\n");
    write_file(dir / "blocker", "not a directory");

    EngineConfig cfg = config();
    cfg.out_delta = dir / "blocker/code_facts_delta.json";
    EXPECT_THROW(engine.run(cfg), OutputWriteError);
    EXPECT_FALSE(fs::exists(cfg.out_full));
    EXPECT_FALSE(fs::exists(fs::path(cfg.out_full.string() + ".tmp")));
}

TEST_F(FactEngineTest, InvalidConfigIsRejectedBeforeWork) {
    EngineConfig cfg = config();
    cfg.out_delta = cfg.out_full;
    EXPECT_THROW(engine.run(cfg), ConfigError);
}

TEST_F(FactEngineTest, CorruptBaselineSnapshotIsFatal) {
    write_file(dir / "current/a.py", "def foo():\n    pass\n");
    write_file(dir / "previous.json", "{\"facts\": 3}");
    EngineConfig cfg = config();
    cfg.baseline_root.reset();
    cfg.baseline_snapshot = dir / "previous.json";
    EXPECT_THROW(engine.run(cfg), SnapshotFormatError);
    EXPECT_FALSE(fs::exists(cfg.out_full));
}
