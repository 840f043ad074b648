#include <gtest/gtest.h>
#include <managers/template_registry.hpp>
#include <core/constants.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <map>
#include <unistd.h>

namespace fs = std::filesystem;

class TemplateRegistryTest : public ::testing::Test {
protected:
    fs::path test_dir;
    fs::path root;
    fs::path src;

    void SetUp() override {
        auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        test_dir = fs::temp_directory_path() /
                   ("stencil_registry_test_" + std::to_string(getpid()) + "_" + info->name());
        fs::remove_all(test_dir);
        root = test_dir / "home";
        src = test_dir / "project";
        fs::create_directories(src);
    }

    void TearDown() override {
        std::error_code ec;
        remove_tree(test_dir, ec);
    }

    void write_file(const fs::path& base, const std::string& rel_path,
                    const std::string& content = "") {
        auto full = base / rel_path;
        fs::create_directories(full.parent_path());
        std::ofstream(full) << content;
    }

    static std::string read_file(const fs::path& path) {
        std::ifstream in(path);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    // Relative path -> content ("/" for directories)
    static std::map<std::string, std::string> snapshot(const fs::path& dir) {
        std::map<std::string, std::string> out;
        for (const auto& e : fs::recursive_directory_iterator(dir)) {
            std::string rel = e.path().lexically_relative(dir).generic_string();
            out[rel] = e.is_directory() ? "/" : read_file(e.path());
        }
        return out;
    }

    TemplateRegistry make_registry() {
        RegistryConfig rc;
        rc.root = root;
        TemplateRegistry reg(rc);
        auto loaded = reg.load();
        EXPECT_TRUE(loaded.is_ok()) << loaded.error;
        return reg;
    }

    void write_registry(const std::string& yaml) {
        fs::create_directories(root / TEMPLATES_DIR);
        std::ofstream(root / REGISTRY_FILE) << yaml;
    }
};

TEST_F(TemplateRegistryTest, MissingRegistryIsEmpty) {
    auto reg = make_registry();
    EXPECT_TRUE(reg.list().empty());
    EXPECT_FALSE(fs::exists(root / REGISTRY_FILE));
}

TEST_F(TemplateRegistryTest, CaptureAndInstantiateRoundTrip) {
    write_file(src, "README.md", "# hello\n");
    write_file(src, "src/main.cpp", "int main() {}\n");
    fs::create_directories(src / "data");

    auto reg = make_registry();
    auto added = reg.add("app", src, {}, "starter app");
    ASSERT_TRUE(added.is_ok()) << added.error;
    EXPECT_EQ(added.value.tmpl.name, "app");
    EXPECT_EQ(added.value.tmpl.description, "starter app");
    EXPECT_EQ(added.value.stats.files_copied, 2);
    EXPECT_FALSE(added.value.tmpl.created_at.empty());

    fs::path out = test_dir / "out";
    auto made = reg.instantiate("app", out);
    ASSERT_TRUE(made.is_ok()) << made.error;
    EXPECT_EQ(snapshot(out), snapshot(src));
}

TEST_F(TemplateRegistryTest, CaptureAppliesPatterns) {
    write_file(src, "a.txt", "a");
    write_file(src, "b.log", "b");
    write_file(src, "sub/c.log", "c");

    auto reg = make_registry();
    auto added = reg.add("logs", src, {"*.log"});
    ASSERT_TRUE(added.is_ok()) << added.error;
    EXPECT_EQ(added.value.tmpl.ignore, std::vector<std::string>{"*.log"});

    fs::path out = test_dir / "out";
    ASSERT_TRUE(reg.instantiate("logs", out).is_ok());
    EXPECT_EQ(snapshot(out), (std::map<std::string, std::string>{{"a.txt", "a"}}));
}

TEST_F(TemplateRegistryTest, DuplicateNameRejected) {
    write_file(src, "v.txt", "first");
    auto reg = make_registry();
    ASSERT_TRUE(reg.add("foo", src, {}).is_ok());

    write_file(src, "v.txt", "second");
    auto again = reg.add("foo", src, {});
    ASSERT_TRUE(again.is_err());
    EXPECT_EQ(again.kind, ErrorKind::ALREADY_EXISTS);

    auto all = reg.list();
    ASSERT_EQ(all.size(), 1u);
    EXPECT_EQ(all[0].name, "foo");
    EXPECT_EQ(read_file(fs::path(all[0].storage_path) / "v.txt"), "first");
}

TEST_F(TemplateRegistryTest, ReplaceSwapsContent) {
    write_file(src, "v.txt", "first");
    auto reg = make_registry();
    ASSERT_TRUE(reg.add("foo", src, {}).is_ok());

    write_file(src, "v.txt", "second");
    auto replaced = reg.add("foo", src, {}, "", true);
    ASSERT_TRUE(replaced.is_ok()) << replaced.error;

    EXPECT_EQ(reg.list().size(), 1u);
    EXPECT_EQ(read_file(reg.storage_path("foo") / "v.txt"), "second");
    EXPECT_FALSE(fs::exists(root / TEMPLATES_DIR / (std::string(RETIRED_PREFIX) + "foo")));
}

TEST_F(TemplateRegistryTest, FailedReplaceKeepsPreviousCapture) {
    write_file(src, "f.txt", "old");
    auto reg = make_registry();
    ASSERT_TRUE(reg.add("t", src, {}, "first").is_ok());
    std::string created = reg.get("t").value.created_at;

    // A directory in the way of registry.tmp makes the save fail
    write_file(src, "f.txt", "new");
    fs::create_directories(root / REGISTRY_TMP_FILE);
    auto replaced = reg.add("t", src, {}, "second", true);
    ASSERT_TRUE(replaced.is_err());
    EXPECT_EQ(replaced.kind, ErrorKind::IO_FAILURE);

    EXPECT_EQ(read_file(reg.storage_path("t") / "f.txt"), "old");
    EXPECT_TRUE(reg.check().healthy());
    EXPECT_EQ(reg.get("t").value.description, "first");

    fs::remove(root / REGISTRY_TMP_FILE);
    auto fresh = make_registry();
    EXPECT_EQ(fresh.get("t").value.created_at, created);
    EXPECT_TRUE(fresh.check().healthy());
}

TEST_F(TemplateRegistryTest, FailedSaveLeavesNoStorage) {
    write_file(src, "f.txt", "x");
    auto reg = make_registry();
    fs::create_directories(root / REGISTRY_TMP_FILE);

    auto added = reg.add("t", src, {});
    ASSERT_TRUE(added.is_err());
    EXPECT_FALSE(fs::exists(reg.storage_path("t")));
    EXPECT_TRUE(reg.check().healthy());
}

TEST_F(TemplateRegistryTest, ReadOnlyDirectoriesCanBeRemoved) {
    write_file(src, "ro/f.txt", "x");
    const auto read_only = fs::perms::owner_read | fs::perms::owner_exec;
    fs::permissions(src / "ro", read_only);

    auto reg = make_registry();
    ASSERT_TRUE(reg.add("t", src, {}).is_ok());
    fs::path stored = reg.storage_path("t") / "ro";
    EXPECT_EQ(fs::status(stored).permissions() & fs::perms::owner_all, read_only);

    auto removed = reg.remove("t");
    ASSERT_TRUE(removed.is_ok()) << removed.error;
    EXPECT_FALSE(fs::exists(reg.storage_path("t")));
    EXPECT_TRUE(reg.check().healthy());
}

TEST_F(TemplateRegistryTest, ReadOnlyOrphanCanBePruned) {
    fs::path orphan = root / TEMPLATES_DIR / "left" / "ro";
    write_file(orphan, "f.txt", "x");
    fs::permissions(orphan, fs::perms::owner_read | fs::perms::owner_exec);

    auto reg = make_registry();
    auto pruned = reg.prune();
    ASSERT_TRUE(pruned.is_ok()) << pruned.error;
    EXPECT_EQ(pruned.value, 1);
    EXPECT_FALSE(fs::exists(root / TEMPLATES_DIR / "left"));
}

TEST_F(TemplateRegistryTest, UnreadableFileAbortsCapture) {
    if (geteuid() == 0) GTEST_SKIP() << "root reads any file";

    write_file(src, "a.txt", "a");
    write_file(src, "ro/f.txt", "secret");
    fs::permissions(src / "ro" / "f.txt", fs::perms::none);

    auto reg = make_registry();
    auto added = reg.add("t", src, {});
    ASSERT_TRUE(added.is_err());
    EXPECT_EQ(added.kind, ErrorKind::IO_FAILURE);
    EXPECT_EQ(added.path, (fs::canonical(src) / "ro" / "f.txt").string());

    EXPECT_TRUE(reg.list().empty());
    EXPECT_FALSE(fs::exists(reg.storage_path("t")));
    EXPECT_FALSE(fs::exists(root / TEMPLATES_DIR / (std::string(STAGING_PREFIX) + "t")));
    EXPECT_TRUE(reg.check().healthy());
}

TEST_F(TemplateRegistryTest, RemoveMissingLeavesStateUnchanged) {
    write_file(src, "a.txt");
    auto reg = make_registry();
    ASSERT_TRUE(reg.add("keep", src, {}).is_ok());
    std::string before = read_file(root / REGISTRY_FILE);

    auto removed = reg.remove("missing");
    ASSERT_TRUE(removed.is_err());
    EXPECT_EQ(removed.kind, ErrorKind::NOT_FOUND);
    EXPECT_EQ(read_file(root / REGISTRY_FILE), before);
    EXPECT_EQ(reg.list().size(), 1u);
}

TEST_F(TemplateRegistryTest, RemoveDeletesEntryAndStorage) {
    write_file(src, "a.txt");
    auto reg = make_registry();
    ASSERT_TRUE(reg.add("gone", src, {}).is_ok());
    fs::path storage = reg.storage_path("gone");
    ASSERT_TRUE(fs::is_directory(storage));

    auto removed = reg.remove("gone");
    ASSERT_TRUE(removed.is_ok()) << removed.error;
    EXPECT_FALSE(fs::exists(storage));
    EXPECT_TRUE(reg.list().empty());
    EXPECT_EQ(reg.get("gone").kind, ErrorKind::NOT_FOUND);

    auto fresh = make_registry();
    EXPECT_FALSE(fresh.contains("gone"));
}

TEST_F(TemplateRegistryTest, PersistsAcrossInstances) {
    write_file(src, "a.txt");
    {
        auto reg = make_registry();
        ASSERT_TRUE(reg.add("one", src, {"*.tmp"}, "first one").is_ok());
    }

    auto reg = make_registry();
    auto got = reg.get("one");
    ASSERT_TRUE(got.is_ok()) << got.error;
    EXPECT_EQ(got.value.description, "first one");
    EXPECT_EQ(got.value.ignore, std::vector<std::string>{"*.tmp"});
    EXPECT_EQ(fs::path(got.value.storage_path), root / TEMPLATES_DIR / "one");
    EXPECT_EQ(fs::path(got.value.source_path), fs::canonical(src));
}

TEST_F(TemplateRegistryTest, ConcurrentInstancesDoNotLoseEntries) {
    write_file(src, "a.txt");
    auto first = make_registry();
    auto second = make_registry();

    ASSERT_TRUE(first.add("alpha", src, {}).is_ok());
    // second still holds the state from before alpha; it re-reads under the lock
    ASSERT_TRUE(second.add("beta", src, {}).is_ok());
    EXPECT_TRUE(second.contains("alpha"));

    auto fresh = make_registry();
    EXPECT_TRUE(fresh.contains("alpha"));
    EXPECT_TRUE(fresh.contains("beta"));

    // And a duplicate from the stale instance is still caught
    auto dup = first.add("beta", src, {});
    EXPECT_EQ(dup.kind, ErrorKind::ALREADY_EXISTS);
}

TEST_F(TemplateRegistryTest, CorruptRegistryReported) {
    const std::vector<std::string> bad = {
        "templates: [",
        "- just\n- a list\n",
        "version: 99\ntemplates: []\n",
        "version: 1\ntemplates: oops\n",
        "version: 1\ntemplates:\n  - name: a\n    storage: templates/a\n"
        "  - name: a\n    storage: templates/a\n",
        "version: 1\ntemplates:\n  - name: ''\n    storage: templates/x\n",
        "version: 1\ntemplates:\n  - name: a\n    storage: ../../etc\n",
        "version: 1\ntemplates:\n  - not-a-map\n",
    };
    for (const auto& yaml : bad) {
        write_registry(yaml);
        RegistryConfig rc;
        rc.root = root;
        TemplateRegistry reg(rc);
        auto loaded = reg.load();
        EXPECT_TRUE(loaded.is_err()) << yaml;
        EXPECT_EQ(loaded.kind, ErrorKind::REGISTRY_CORRUPT) << yaml;
    }
}

TEST_F(TemplateRegistryTest, CorruptRegistryBlocksMutations) {
    write_file(src, "a.txt");
    write_registry("templates: [");
    RegistryConfig rc;
    rc.root = root;
    TemplateRegistry reg(rc);

    auto added = reg.add("x", src, {});
    ASSERT_TRUE(added.is_err());
    EXPECT_EQ(added.kind, ErrorKind::REGISTRY_CORRUPT);
    // Nothing was silently discarded
    EXPECT_EQ(read_file(root / REGISTRY_FILE), "templates: [");
    EXPECT_FALSE(fs::exists(root / TEMPLATES_DIR / "x"));
}

TEST_F(TemplateRegistryTest, InvalidNamesRejected) {
    write_file(src, "a.txt");
    auto reg = make_registry();
    for (const std::string name : {"", ".", "..", ".hidden", "a/b", "a\\b", "tab\tname"}) {
        auto r = reg.add(name, src, {});
        EXPECT_TRUE(r.is_err()) << name;
        EXPECT_EQ(r.kind, ErrorKind::INVALID_NAME) << name;
    }
    EXPECT_TRUE(reg.list().empty());
}

TEST_F(TemplateRegistryTest, MissingSourceIsNotFound) {
    auto reg = make_registry();
    auto r = reg.add("x", test_dir / "does-not-exist", {});
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::NOT_FOUND);
    EXPECT_FALSE(reg.contains("x"));
}

TEST_F(TemplateRegistryTest, BadPatternLeavesNoTrace) {
    write_file(src, "a.txt");
    auto reg = make_registry();
    auto r = reg.add("x", src, {"[broken"});
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::PATTERN_SYNTAX);
    EXPECT_FALSE(reg.contains("x"));
    EXPECT_FALSE(fs::exists(root / TEMPLATES_DIR / "x"));
}

TEST_F(TemplateRegistryTest, CancelledCaptureLeavesNoEntry) {
    for (int i = 0; i < 5; i++) write_file(src, "f" + std::to_string(i));

    RegistryConfig rc;
    rc.root = root;
    int calls = 0;
    rc.capture.cancel = [&calls]() { return ++calls > 2; };
    TemplateRegistry reg(rc);
    ASSERT_TRUE(reg.load().is_ok());

    auto r = reg.add("partial", src, {});
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::CANCELLED);
    EXPECT_FALSE(reg.contains("partial"));
    EXPECT_TRUE(fs::is_empty(root / TEMPLATES_DIR));
    EXPECT_TRUE(reg.check().healthy());
}

TEST_F(TemplateRegistryTest, LeftoverStorageReportedAndPruned) {
    write_file(src, "a.txt");
    write_file(root / TEMPLATES_DIR, "foo/stale.txt", "old");

    auto reg = make_registry();
    auto blocked = reg.add("foo", src, {});
    ASSERT_TRUE(blocked.is_err());
    EXPECT_EQ(blocked.kind, ErrorKind::DESTINATION_NOT_EMPTY);

    auto health = reg.check();
    EXPECT_TRUE(health.dangling_entries.empty());
    EXPECT_EQ(health.orphan_storage, std::vector<std::string>{"foo"});

    auto pruned = reg.prune();
    ASSERT_TRUE(pruned.is_ok()) << pruned.error;
    EXPECT_EQ(pruned.value, 1);
    EXPECT_TRUE(reg.check().healthy());

    ASSERT_TRUE(reg.add("foo", src, {}).is_ok());
    EXPECT_FALSE(fs::exists(reg.storage_path("foo") / "stale.txt"));
}

TEST_F(TemplateRegistryTest, MissingStorageHiddenFromListButReported) {
    write_file(src, "a.txt");
    auto reg = make_registry();
    ASSERT_TRUE(reg.add("ok", src, {}).is_ok());
    ASSERT_TRUE(reg.add("lost", src, {}).is_ok());
    fs::remove_all(reg.storage_path("lost"));

    auto all = reg.list();
    ASSERT_EQ(all.size(), 1u);
    EXPECT_EQ(all[0].name, "ok");

    auto health = reg.check();
    EXPECT_EQ(health.dangling_entries, std::vector<std::string>{"lost"});

    auto made = reg.instantiate("lost", test_dir / "out");
    EXPECT_EQ(made.kind, ErrorKind::NOT_FOUND);

    // A dangling entry can still be removed
    EXPECT_TRUE(reg.remove("lost").is_ok());
    EXPECT_TRUE(reg.check().healthy());
}

TEST_F(TemplateRegistryTest, ListSortedByName) {
    write_file(src, "a.txt");
    auto reg = make_registry();
    for (const std::string name : {"zeta", "alpha", "mid"}) {
        ASSERT_TRUE(reg.add(name, src, {}).is_ok());
    }
    auto all = reg.list();
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0].name, "alpha");
    EXPECT_EQ(all[1].name, "mid");
    EXPECT_EQ(all[2].name, "zeta");
}

TEST_F(TemplateRegistryTest, InstantiateUnknownIsNotFound) {
    auto reg = make_registry();
    auto r = reg.instantiate("nope", test_dir / "out");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::NOT_FOUND);
    EXPECT_FALSE(fs::exists(test_dir / "out"));
}

TEST_F(TemplateRegistryTest, InstantiateIntoNonEmptyDestination) {
    write_file(src, "a.txt", "template");
    auto reg = make_registry();
    ASSERT_TRUE(reg.add("t", src, {}).is_ok());

    fs::path out = test_dir / "out";
    write_file(out, "a.txt", "mine");

    auto refused = reg.instantiate("t", out);
    ASSERT_TRUE(refused.is_err());
    EXPECT_EQ(refused.kind, ErrorKind::DESTINATION_NOT_EMPTY);
    EXPECT_EQ(read_file(out / "a.txt"), "mine");

    auto forced = reg.instantiate("t", out, true);
    ASSERT_TRUE(forced.is_ok()) << forced.error;
    EXPECT_EQ(read_file(out / "a.txt"), "template");
}

TEST_F(TemplateRegistryTest, InstantiateIsRepeatable) {
    write_file(src, "a.txt", "1");
    write_file(src, "deep/b.txt", "2");
    auto reg = make_registry();
    ASSERT_TRUE(reg.add("t", src, {}).is_ok());

    ASSERT_TRUE(reg.instantiate("t", test_dir / "one").is_ok());
    ASSERT_TRUE(reg.instantiate("t", test_dir / "two").is_ok());
    EXPECT_EQ(snapshot(test_dir / "one"), snapshot(test_dir / "two"));
}

TEST_F(TemplateRegistryTest, CaptureNeverIncludesTheStore) {
    // The store lives inside the directory being captured
    root = src / ".stencil";
    write_file(src, "a.txt");

    auto reg = make_registry();
    auto added = reg.add("self", src, {});
    ASSERT_TRUE(added.is_ok()) << added.error;

    EXPECT_TRUE(fs::exists(reg.storage_path("self") / "a.txt"));
    EXPECT_FALSE(fs::exists(reg.storage_path("self") / ".stencil"));
}

TEST_F(TemplateRegistryTest, RenameMovesStorage) {
    write_file(src, "a.txt", "x");
    auto reg = make_registry();
    ASSERT_TRUE(reg.add("old", src, {}, "desc").is_ok());
    ASSERT_TRUE(reg.add("other", src, {}).is_ok());

    auto renamed = reg.rename("old", "new");
    ASSERT_TRUE(renamed.is_ok()) << renamed.error;
    EXPECT_EQ(renamed.value.name, "new");
    EXPECT_EQ(renamed.value.description, "desc");
    EXPECT_FALSE(fs::exists(root / TEMPLATES_DIR / "old"));
    EXPECT_EQ(read_file(reg.storage_path("new") / "a.txt"), "x");

    auto fresh = make_registry();
    EXPECT_FALSE(fresh.contains("old"));
    EXPECT_TRUE(fresh.contains("new"));
    EXPECT_TRUE(fresh.check().healthy());

    EXPECT_EQ(reg.rename("new", "other").kind, ErrorKind::ALREADY_EXISTS);
    EXPECT_EQ(reg.rename("missing", "x").kind, ErrorKind::NOT_FOUND);
    EXPECT_EQ(reg.rename("new", "bad/name").kind, ErrorKind::INVALID_NAME);
}

TEST_F(TemplateRegistryTest, DescribePersists) {
    write_file(src, "a.txt");
    auto reg = make_registry();
    ASSERT_TRUE(reg.add("t", src, {}).is_ok());

    auto described = reg.describe("t", "A small starter");
    ASSERT_TRUE(described.is_ok()) << described.error;
    EXPECT_EQ(make_registry().get("t").value.description, "A small starter");

    ASSERT_TRUE(reg.describe("t", "").is_ok());
    EXPECT_EQ(make_registry().get("t").value.description, "");

    EXPECT_EQ(reg.describe("missing", "x").kind, ErrorKind::NOT_FOUND);
}

TEST_F(TemplateRegistryTest, TreeListsStoredEntries) {
    write_file(src, "b.txt", "12345");
    write_file(src, "a/inner.txt", "x");
    fs::create_symlink("b.txt", src / "c-link");

    auto reg = make_registry();
    ASSERT_TRUE(reg.add("t", src, {}).is_ok());

    auto tree = reg.tree("t");
    ASSERT_TRUE(tree.is_ok()) << tree.error;
    ASSERT_EQ(tree.value.size(), 4u);

    EXPECT_EQ(tree.value[0].path, "a");
    EXPECT_EQ(tree.value[0].kind, TreeEntry::DIRECTORY);
    EXPECT_EQ(tree.value[1].path, "a/inner.txt");
    EXPECT_EQ(tree.value[1].depth, 1);
    EXPECT_EQ(tree.value[2].path, "b.txt");
    EXPECT_EQ(tree.value[2].size, 5);
    EXPECT_EQ(tree.value[3].path, "c-link");
    EXPECT_EQ(tree.value[3].kind, TreeEntry::SYMLINK);

    EXPECT_EQ(reg.tree("missing").kind, ErrorKind::NOT_FOUND);
}

TEST(TemplateName, Validation) {
    EXPECT_TRUE(validate_template_name("my-template_1.0").is_ok());
    EXPECT_TRUE(validate_template_name("with space").is_ok());
    EXPECT_EQ(validate_template_name("").kind, ErrorKind::INVALID_NAME);
    EXPECT_EQ(validate_template_name("..").kind, ErrorKind::INVALID_NAME);
    EXPECT_EQ(validate_template_name("a/b").kind, ErrorKind::INVALID_NAME);
    EXPECT_EQ(validate_template_name(std::string(300, 'a')).kind, ErrorKind::INVALID_NAME);
}
