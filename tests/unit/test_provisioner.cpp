/**
 * @file test_provisioner.cpp
 * @brief Unit tests for the filesystem sandbox provisioner.
 * @author Dimitris Kafetzis
 */

#include "sandbox/provisioner.hpp"
#include "storage/memory_storage.hpp"
#include "telemetry/json_sink.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>
#include <algorithm>
#include <fstream>
#include <sstream>

#include <csignal>
#include <sys/wait.h>
#include <unistd.h>

using namespace exec_engine;
using namespace exec_engine::test;

namespace {

std::string read_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::ostringstream oss;
    oss << in.rdbuf();
    return oss.str();
}

}  // anonymous namespace

class ProvisionerTest : public ::testing::Test {
protected:
    TempDir dir_{"provisioner"};
    MemoryStorage storage_;
    Logger logger_{std::make_unique<NullSink>()};
    Config config_ = default_config();

    void SetUp() override {
        config_.sandbox.root_dir = dir_.path() / "sandboxes";
        config_.languages[Language::Python] = LanguageRuntimeConfig{
            .interpreter = "/bin/sh", .args = {}, .entry_file = "main.py", .env = {"EXTRA=1"}};
    }

    std::unique_ptr<SandboxProvisioner> make_provisioner() {
        return std::make_unique<SandboxProvisioner>(config_, storage_, logger_);
    }
};

// ─── Path helpers ───────────────────────────

TEST(SandboxPathTest, SafeRelativePaths) {
    EXPECT_TRUE(is_safe_relative_path("main.py"));
    EXPECT_TRUE(is_safe_relative_path("pkg/module/util.py"));
    EXPECT_TRUE(is_safe_relative_path(".hidden"));

    EXPECT_FALSE(is_safe_relative_path(""));
    EXPECT_FALSE(is_safe_relative_path("/etc/passwd"));
    EXPECT_FALSE(is_safe_relative_path("../escape.py"));
    EXPECT_FALSE(is_safe_relative_path("a/../../b"));
    EXPECT_FALSE(is_safe_relative_path("a//b"));
    EXPECT_FALSE(is_safe_relative_path("./main.py"));
    EXPECT_FALSE(is_safe_relative_path("dir/"));
    EXPECT_FALSE(is_safe_relative_path(std::string_view{"a\0b", 3}));
}

TEST(SandboxPathTest, ResolveExecutable) {
    EXPECT_EQ(resolve_executable("/bin/sh"), std::filesystem::path{"/bin/sh"});
    auto sh = resolve_executable("sh");
    ASSERT_TRUE(sh.has_value());
    EXPECT_EQ(sh->filename(), "sh");
    EXPECT_FALSE(resolve_executable("definitely-not-an-interpreter-x9").has_value());
    EXPECT_FALSE(resolve_executable("/nonexistent/bin/python").has_value());
    EXPECT_FALSE(resolve_executable("").has_value());
}

// ─── Provisioning ───────────────────────────

TEST_F(ProvisionerTest, ProvisionsSnapshotOfProjectFiles) {
    auto project = make_project(storage_, "alpha");
    add_file(storage_, project.id, "main.py", "print('hi')\n");
    add_file(storage_, project.id, "lib/util.py", "X = 1\n");
    auto provisioner = make_provisioner();

    auto sandbox = provisioner->provision(project.id, Language::Python);
    ASSERT_TRUE(sandbox.has_value()) << sandbox.error().message;

    const auto& sb = **sandbox;
    EXPECT_EQ(sb.project_id, project.id);
    EXPECT_EQ(sb.root.parent_path(), config_.sandbox.root_dir);
    EXPECT_EQ(sb.interpreter, std::filesystem::path{"/bin/sh"});
    EXPECT_EQ(sb.files, (std::vector<std::string>{"lib/util.py", "main.py"}));
    EXPECT_EQ(sb.snapshot_bytes, 18u);
    EXPECT_TRUE(sb.contains("main.py"));
    EXPECT_FALSE(sb.contains("other.py"));
    EXPECT_EQ(read_file(sb.root / "main.py"), "print('hi')\n");
    EXPECT_EQ(read_file(sb.root / "lib" / "util.py"), "X = 1\n");

    EXPECT_NE(std::find(sb.env.begin(), sb.env.end(), "HOME=" + sb.root.string()), sb.env.end());
    EXPECT_NE(std::find(sb.env.begin(), sb.env.end(), "EXTRA=1"), sb.env.end());
    EXPECT_EQ(sb.limits.file_size_bytes, config_.sandbox.disk_quota_mb * 1024 * 1024);

    EXPECT_EQ(provisioner->live_count(), 1u);
    auto environments = storage_.list_environments(project.id);
    ASSERT_EQ(environments->size(), 1u);
    EXPECT_EQ((*environments)[0].id, sb.id);
}

TEST_F(ProvisionerTest, LaterEditsDoNotReachSandbox) {
    auto project = make_project(storage_, "alpha");
    add_file(storage_, project.id, "main.py", "v1");
    auto provisioner = make_provisioner();

    auto sandbox = provisioner->provision(project.id, Language::Python);
    ASSERT_TRUE(sandbox.has_value());
    add_file(storage_, project.id, "main.py", "v2");
    add_file(storage_, project.id, "new.py", "added");

    EXPECT_EQ(read_file((*sandbox)->root / "main.py"), "v1");
    EXPECT_FALSE(std::filesystem::exists((*sandbox)->root / "new.py"));
}

TEST_F(ProvisionerTest, OneLiveSandboxPerProject) {
    auto project = make_project(storage_, "alpha");
    auto provisioner = make_provisioner();

    auto first = provisioner->provision(project.id, Language::Python);
    ASSERT_TRUE(first.has_value());

    auto second = provisioner->provision(project.id, Language::Python);
    ASSERT_FALSE(second.has_value());
    EXPECT_EQ(second.error().kind, ErrorKind::Provision);

    ASSERT_TRUE(provisioner->teardown(*first).has_value());
    auto third = provisioner->provision(project.id, Language::Python);
    ASSERT_TRUE(third.has_value());
    EXPECT_NE((*third)->id, (*first)->id);
}

TEST_F(ProvisionerTest, SandboxCapEnforced) {
    config_.sandbox.max_sandboxes = 1;
    auto a = make_project(storage_, "a");
    auto b = make_project(storage_, "b");
    auto provisioner = make_provisioner();

    ASSERT_TRUE(provisioner->provision(a.id, Language::Python).has_value());
    auto blocked = provisioner->provision(b.id, Language::Python);
    ASSERT_FALSE(blocked.has_value());
    EXPECT_EQ(blocked.error().kind, ErrorKind::Provision);
    EXPECT_EQ(provisioner->live_count(), 1u);
}

TEST_F(ProvisionerTest, MissingInterpreter) {
    config_.languages[Language::Python].interpreter = "definitely-not-an-interpreter-x9";
    auto project = make_project(storage_, "alpha");
    auto provisioner = make_provisioner();

    auto sandbox = provisioner->provision(project.id, Language::Python);
    ASSERT_FALSE(sandbox.has_value());
    EXPECT_EQ(sandbox.error().kind, ErrorKind::Provision);
    EXPECT_EQ(provisioner->live_count(), 0u);
    EXPECT_EQ(storage_.environment_count(), 0u);
}

TEST_F(ProvisionerTest, UnconfiguredLanguage) {
    config_.languages.erase(Language::Ruby);
    auto project = make_project(storage_, "alpha", Language::Ruby);
    auto provisioner = make_provisioner();

    auto sandbox = provisioner->provision(project.id, Language::Ruby);
    ASSERT_FALSE(sandbox.has_value());
    EXPECT_EQ(sandbox.error().kind, ErrorKind::Provision);
}

TEST_F(ProvisionerTest, InstallerResolvedOnlyWhenManifestPresent) {
    auto& python = config_.languages[Language::Python];
    python.manifest = "requirements.txt";
    python.install = {"sh", "-c", "true"};
    auto with_manifest = make_project(storage_, "alpha");
    add_file(storage_, with_manifest.id, "main.py", "true\n");
    add_file(storage_, with_manifest.id, "requirements.txt", "requests\n");
    auto without_manifest = make_project(storage_, "beta");
    add_file(storage_, without_manifest.id, "main.py", "true\n");
    auto provisioner = make_provisioner();

    auto installing = provisioner->provision(with_manifest.id, Language::Python);
    ASSERT_TRUE(installing.has_value()) << installing.error().message;
    ASSERT_TRUE((*installing)->needs_install());
    EXPECT_TRUE(std::filesystem::path((*installing)->install_command.front()).is_absolute());
    EXPECT_EQ((*installing)->install_command.size(), 3u);

    auto plain = provisioner->provision(without_manifest.id, Language::Python);
    ASSERT_TRUE(plain.has_value()) << plain.error().message;
    EXPECT_FALSE((*plain)->needs_install());
}

TEST_F(ProvisionerTest, MissingInstallerIsProvisionError) {
    auto& python = config_.languages[Language::Python];
    python.manifest = "requirements.txt";
    python.install = {"definitely-not-pip-x9", "install"};
    auto project = make_project(storage_, "alpha");
    add_file(storage_, project.id, "requirements.txt", "requests\n");
    auto provisioner = make_provisioner();

    auto sandbox = provisioner->provision(project.id, Language::Python);
    ASSERT_FALSE(sandbox.has_value());
    EXPECT_EQ(sandbox.error().kind, ErrorKind::Provision);
    EXPECT_NE(sandbox.error().message.find("definitely-not-pip-x9"), std::string::npos);
    EXPECT_EQ(provisioner->live_count(), 0u);
    EXPECT_EQ(storage_.environment_count(), 0u);
}

TEST_F(ProvisionerTest, LanguageMemoryLimitOverridesSandboxDefault) {
    config_.sandbox.memory_limit_mb = 512;
    auto python_project = make_project(storage_, "alpha");
    auto ruby_project = make_project(storage_, "beta", Language::Ruby);
    config_.languages[Language::Ruby] = LanguageRuntimeConfig{
        .interpreter = "/bin/sh", .args = {}, .entry_file = "main.rb", .env = {},
        .install = {}, .manifest = "", .memory_limit_mb = 0};
    auto provisioner = make_provisioner();

    auto python = provisioner->provision(python_project.id, Language::Python);
    ASSERT_TRUE(python.has_value()) << python.error().message;
    EXPECT_EQ((*python)->limits.address_space_bytes, 512ull * 1024 * 1024);

    auto ruby = provisioner->provision(ruby_project.id, Language::Ruby);
    ASSERT_TRUE(ruby.has_value()) << ruby.error().message;
    EXPECT_EQ((*ruby)->limits.address_space_bytes, 0u);
}

TEST_F(ProvisionerTest, DiskQuotaExceeded) {
    config_.sandbox.disk_quota_mb = 1;
    auto project = make_project(storage_, "alpha");
    add_file(storage_, project.id, "data.bin", std::string(2 * 1024 * 1024, 'x'));
    auto provisioner = make_provisioner();

    auto sandbox = provisioner->provision(project.id, Language::Python);
    ASSERT_FALSE(sandbox.has_value());
    EXPECT_EQ(sandbox.error().kind, ErrorKind::Provision);
    EXPECT_EQ(provisioner->live_count(), 0u);
    EXPECT_EQ(storage_.environment_count(), 0u);
}

TEST_F(ProvisionerTest, InodeQuotaExceeded) {
    config_.sandbox.inode_quota = 3;
    auto project = make_project(storage_, "alpha");
    add_file(storage_, project.id, "a/b/c.py", "");   // root + a + a/b + c.py
    auto provisioner = make_provisioner();

    auto sandbox = provisioner->provision(project.id, Language::Python);
    ASSERT_FALSE(sandbox.has_value());
    EXPECT_EQ(sandbox.error().kind, ErrorKind::Provision);
}

TEST_F(ProvisionerTest, UnsafeStoredPathRejected) {
    auto project = make_project(storage_, "alpha");
    add_file(storage_, project.id, "../escape.py", "");
    auto provisioner = make_provisioner();

    auto sandbox = provisioner->provision(project.id, Language::Python);
    ASSERT_FALSE(sandbox.has_value());
    EXPECT_EQ(sandbox.error().kind, ErrorKind::Provision);
    EXPECT_FALSE(std::filesystem::exists(dir_.path() / "escape.py"));
    EXPECT_EQ(provisioner->live_count(), 0u);
}

TEST_F(ProvisionerTest, UnknownProject) {
    auto provisioner = make_provisioner();
    auto sandbox = provisioner->provision("missing", Language::Python);
    ASSERT_FALSE(sandbox.has_value());
    EXPECT_EQ(sandbox.error().kind, ErrorKind::Provision);
    EXPECT_EQ(provisioner->live_count(), 0u);
}

// ─── Teardown ───────────────────────────────

TEST_F(ProvisionerTest, TeardownRemovesFilesystemAndIsIdempotent) {
    auto project = make_project(storage_, "alpha");
    add_file(storage_, project.id, "main.py", "x");
    auto provisioner = make_provisioner();

    auto sandbox = *provisioner->provision(project.id, Language::Python);
    std::filesystem::create_directories(sandbox->root / "out" / "deep");
    std::ofstream(sandbox->root / "out" / "deep" / "result.txt") << "written by the run";

    ASSERT_TRUE(provisioner->teardown(sandbox).has_value());
    EXPECT_FALSE(std::filesystem::exists(sandbox->root));
    EXPECT_TRUE(sandbox->torn_down.load());
    EXPECT_EQ(provisioner->live_count(), 0u);

    EXPECT_TRUE(provisioner->teardown(sandbox).has_value());
    EXPECT_FALSE(provisioner->teardown(nullptr).has_value());
}

TEST_F(ProvisionerTest, TeardownKillsLeftoverProcessGroup) {
    auto project = make_project(storage_, "alpha");
    auto provisioner = make_provisioner();
    auto sandbox = *provisioner->provision(project.id, Language::Python);

    pid_t pid = ::fork();
    ASSERT_GE(pid, 0);
    if (pid == 0) {
        ::setpgid(0, 0);
        ::execl("/bin/sh", "sh", "-c", "sleep 30", static_cast<char*>(nullptr));
        ::_exit(127);
    }
    ::setpgid(pid, pid);
    sandbox->process_group.store(pid);

    ASSERT_TRUE(provisioner->teardown(sandbox).has_value());

    int status = 0;
    ASSERT_EQ(::waitpid(pid, &status, 0), pid);
    EXPECT_TRUE(WIFSIGNALED(status));
    EXPECT_EQ(WTERMSIG(status), SIGKILL);
    EXPECT_EQ(sandbox->process_group.load(), 0);
}

TEST_F(ProvisionerTest, DestructorReclaimsLiveSandboxes) {
    auto project = make_project(storage_, "alpha");
    std::filesystem::path root;
    {
        auto provisioner = make_provisioner();
        auto sandbox = provisioner->provision(project.id, Language::Python);
        ASSERT_TRUE(sandbox.has_value());
        root = (*sandbox)->root;
        EXPECT_TRUE(std::filesystem::exists(root));
    }
    EXPECT_FALSE(std::filesystem::exists(root));
}
