#include "minitest.hpp"
#include "scan/PathGuard.hpp"
#include <string>
#include <vector>

using vigil::scan::PathGuard;
using vigil::model::Finding;
using vigil::model::Severity;

static std::size_t count(const std::vector<Finding>& fs, const std::string& category, Severity sev) {
  std::size_t n = 0;
  for (const auto& f : fs)
    if (f.category == category && f.severity == sev) ++n;
  return n;
}

static bool has_category(const std::vector<Finding>& fs, const std::string& category) {
  for (const auto& f : fs)
    if (f.category == category) return true;
  return false;
}

static const std::vector<std::string> kDocExts = {".md", ".txt", ".json", ".pseudo", ".feature", ".yaml", ".yml"};

TEST(path_root_is_normalized) {
  ASSERT_EQ(PathGuard("/workspace/").workspace_root(), "/workspace");
  ASSERT_EQ(PathGuard("/workspace/./a/..").workspace_root(), "/workspace");
  ASSERT_EQ(PathGuard("/").workspace_root(), "/");
}

TEST(path_escape_to_etc) {
  PathGuard g("/workspace");
  auto v = g.validate("../../../etc/passwd");
  ASSERT_TRUE(!v.safe);
  ASSERT_EQ(count(v.findings, "path_traversal", Severity::High), 1u);
  ASSERT_EQ(count(v.findings, "path_traversal", Severity::Critical), 1u);
  ASSERT_EQ(count(v.findings, "system_access", Severity::Critical), 1u);
  ASSERT_EQ(v.resolved, "/etc/passwd");
  for (const auto& f : v.findings) ASSERT_EQ(f.file_path, "../../../etc/passwd");
}

TEST(path_inside_workspace_is_safe) {
  PathGuard g("/workspace");
  auto v = g.validate("docs/prd");
  ASSERT_TRUE(v.safe);
  ASSERT_TRUE(v.findings.empty());
  ASSERT_EQ(v.resolved, "/workspace/docs/prd");

  ASSERT_TRUE(g.validate("/workspace").safe);
  ASSERT_TRUE(g.validate("/workspace/out/").safe);
  ASSERT_TRUE(g.validate("./out").safe);
}

TEST(path_sibling_prefix_is_outside) {
  PathGuard g("/workspace");
  auto v = g.validate("/workspace-evil/out");
  ASSERT_TRUE(!v.safe);
  ASSERT_EQ(count(v.findings, "path_traversal", Severity::Critical), 1u);
  ASSERT_TRUE(!has_category(v.findings, "system_access"));
}

TEST(path_dotdot_inside_workspace_still_flagged) {
  PathGuard g("/workspace");
  auto v = g.validate("docs/../docs/prd.md");
  ASSERT_TRUE(!v.safe);
  ASSERT_EQ(v.findings.size(), 1u);
  ASSERT_EQ(v.findings[0].severity, Severity::High);
  ASSERT_EQ(*v.findings[0].evidence, "..");
  ASSERT_EQ(v.resolved, "/workspace/docs/prd.md");
}

TEST(path_encoded_and_backslash_traversal) {
  PathGuard g("/workspace");
  auto enc = g.validate("%2e%2e%2f%2e%2e%2fetc");
  ASSERT_TRUE(!enc.safe);
  ASSERT_EQ(count(enc.findings, "path_traversal", Severity::High), 1u);
  ASSERT_EQ(count(enc.findings, "system_access", Severity::Critical), 1u);

  auto dbl = g.validate("%252e%252e%252fsecret");
  ASSERT_TRUE(!dbl.safe);
  ASSERT_EQ(dbl.resolved, "/secret");

  auto bs = g.validate("..\\..\\etc\\shadow");
  ASSERT_TRUE(!bs.safe);
  ASSERT_EQ(bs.resolved, "/etc/shadow");
}

TEST(path_absolute_system_dirs) {
  PathGuard g("/");
  auto etc = g.validate("/etc");
  ASSERT_TRUE(!etc.safe);
  ASSERT_EQ(count(etc.findings, "system_access", Severity::Critical), 1u);
  ASSERT_TRUE(!has_category(etc.findings, "path_traversal"));

  auto home = g.validate("/HOME/user/notes");
  ASSERT_TRUE(!home.safe);
  ASSERT_EQ(*home.findings[0].evidence, "/home/");

  ASSERT_TRUE(g.validate("/srv/out").safe);
  ASSERT_TRUE(g.validate("/etcetera/out").safe);
}

TEST(path_windows_drive_paths) {
  PathGuard g("/workspace");
  auto v = g.validate("C:\\Windows\\System32");
  ASSERT_TRUE(!v.safe);
  ASSERT_EQ(count(v.findings, "path_traversal", Severity::Critical), 1u);
  ASSERT_EQ(count(v.findings, "system_access", Severity::Critical), 1u);
}

TEST(path_nul_is_stripped) {
  PathGuard g("/workspace");
  auto v = g.validate(std::string("out\0/prd.md", 11));
  ASSERT_TRUE(v.safe);
  ASSERT_EQ(v.resolved, "/workspace/out/prd.md");
}

TEST(path_sanitize_filename) {
  ASSERT_EQ(PathGuard::sanitize_filename(""), "unnamed_file");
  ASSERT_EQ(PathGuard::sanitize_filename("prd.md"), "prd.md");
  ASSERT_EQ(PathGuard::sanitize_filename("a/b:c?.md"), "a_b_c_.md");
  ASSERT_EQ(PathGuard::sanitize_filename("x<y>|\"*\\z"), "x_y_____z");
  ASSERT_EQ(PathGuard::sanitize_filename("...hidden"), "hidden");
  ASSERT_EQ(PathGuard::sanitize_filename("..."), "safe_filename");
  ASSERT_EQ(PathGuard::sanitize_filename("   "), "safe_filename");
  ASSERT_EQ(PathGuard::sanitize_filename(std::string("a\0b", 3)), "a_b");
}

TEST(path_sanitize_filename_caps_length) {
  auto out = PathGuard::sanitize_filename(std::string(300, 'a') + ".md");
  ASSERT_EQ(out.size(), PathGuard::kMaxNameLength);
  ASSERT_EQ(out.substr(out.size() - 3), ".md");
  auto plain = PathGuard::sanitize_filename(std::string(300, 'b'));
  ASSERT_EQ(plain.size(), PathGuard::kMaxNameLength);
}

TEST(path_artifact_names) {
  PathGuard g("/workspace");
  ASSERT_TRUE(g.check_artifact_name("out/prd.md", kDocExts).empty());
  ASSERT_TRUE(g.check_artifact_name("out/PRD.MD", kDocExts).empty());
  ASSERT_TRUE(g.check_artifact_name("out/README", kDocExts).empty());

  auto exe = g.check_artifact_name("out/run.exe", kDocExts);
  ASSERT_EQ(count(exe, "invalid_extension", Severity::Medium), 1u);

  auto con = g.check_artifact_name("out/con.md", kDocExts);
  ASSERT_EQ(count(con, "reserved_filename", Severity::Medium), 1u);
  ASSERT_EQ(*con[0].evidence, "CON");

  auto bad = g.check_artifact_name("out/what?.md", kDocExts);
  ASSERT_EQ(count(bad, "invalid_filename", Severity::Medium), 1u);

  auto longp = g.check_artifact_name("out/" + std::string(260, 'a') + ".md", kDocExts);
  ASSERT_EQ(count(longp, "path_length_limit", Severity::Low), 1u);
}
