#include "minitest.hpp"
#include "scratch_dir.hpp"
#include "scan/ContentScanner.hpp"
#include <string>
#include <vector>

using vigil::scan::ContentScanner;
using vigil::scan::ScanOptions;
using vigil::model::Finding;
using vigil::model::Severity;


static std::size_t count(const std::vector<Finding>& fs, const std::string& category) {
  std::size_t n = 0;
  for (const auto& f : fs)
    if (f.category == category) ++n;
  return n;
}

static const Finding* first(const std::vector<Finding>& fs, const std::string& category) {
  for (const auto& f : fs)
    if (f.category == category) return &f;
  return nullptr;
}

TEST(content_credential_is_high) {
  ContentScanner sc;
  auto fs = sc.scan_content("password=supersecretvalue123", "prd.md");
  ASSERT_EQ(fs.size(), 1u);
  ASSERT_EQ(fs[0].category, "credentials");
  ASSERT_EQ(fs[0].severity, Severity::High);
  ASSERT_EQ(fs[0].file_path, "prd.md");
  ASSERT_EQ(*fs[0].line_number, 1);
  ASSERT_EQ(*fs[0].evidence, "password=supersecretvalue123");
  ASSERT_EQ(fs[0].description, "Potential credentials detected");
  ASSERT_EQ(*fs[0].recommendation, "Remove or obfuscate credentials from source code");
}

TEST(content_placeholder_is_low) {
  ContentScanner sc;
  auto fs = sc.scan_content("password=example12345678", "prd.md");
  ASSERT_EQ(fs.size(), 1u);
  ASSERT_EQ(fs[0].severity, Severity::Low);
  // Only the line carrying the placeholder word is downgraded.
  auto two = sc.scan_content("# Test data\npassword=supersecretvalue123", "prd.md");
  ASSERT_EQ(two.size(), 1u);
  ASSERT_EQ(two[0].severity, Severity::High);
  ASSERT_EQ(*two[0].line_number, 2);
}

TEST(content_line_numbers_follow_all_terminators) {
  ContentScanner sc;
  auto fs = sc.scan_content("intro\r\ncontact jane@corp.io\rrun eval(x)\n", "notes.txt");
  const Finding* mail = first(fs, "private_info");
  const Finding* code = first(fs, "malicious_code");
  ASSERT_TRUE(mail != nullptr);
  ASSERT_TRUE(code != nullptr);
  ASSERT_EQ(*mail->line_number, 2);
  ASSERT_EQ(mail->severity, Severity::Medium);
  ASSERT_EQ(*code->line_number, 3);
}

TEST(content_line_numbers_follow_form_feed_and_unicode_separators) {
  ContentScanner sc;
  auto fs = sc.scan_content("intro\fcontact jane@corp.io\xE2\x80\xA8run eval(x)\x0Btail", "notes.txt");
  const Finding* mail = first(fs, "private_info");
  const Finding* code = first(fs, "malicious_code");
  ASSERT_TRUE(mail != nullptr);
  ASSERT_TRUE(code != nullptr);
  ASSERT_EQ(*mail->line_number, 2);
  ASSERT_EQ(*code->line_number, 3);

  // A placeholder word after a vertical tab belongs to the next line.
  auto cred = sc.scan_content("password=supersecretvalue123\x0B" "example", "prd.md");
  ASSERT_EQ(cred.size(), 1u);
  ASSERT_EQ(cred[0].severity, Severity::High);
}

TEST(content_long_line) {
  ContentScanner sc;
  auto fs = sc.scan_content("password=" + std::string(100000, 'a'), "x.md");
  ASSERT_EQ(fs.size(), 1u);
  ASSERT_EQ(fs[0].category, "credentials");
  ASSERT_EQ(fs[0].evidence->size(), vigil::model::kEvidenceCap);

  auto tail = sc.scan_content(std::string(100000, 'a') + " eval(x)", "x.md");
  ASSERT_EQ(tail.size(), 1u);
  ASSERT_EQ(tail[0].category, "malicious_code");
  ASSERT_EQ(*tail[0].evidence, "eval(");
}

TEST(content_evidence_is_capped) {
  ContentScanner sc;
  auto fs = sc.scan_content("api_key=" + std::string(80, 'Z'), "cfg.json");
  ASSERT_EQ(fs.size(), 1u);
  ASSERT_EQ(fs[0].evidence->size(), vigil::model::kEvidenceCap);
}

TEST(content_invalid_utf8_yields_nothing) {
  ContentScanner sc;
  ASSERT_TRUE(sc.scan_content("password=supersecretvalue123\xFF", "x.md").empty());
  ASSERT_TRUE(sc.scan_content("", "x.md").empty());
}

TEST(file_binary_is_medium) {
  ScratchDir d("binary");
  auto p = d.write("logo.md", std::string("\x89PNG\r\n\x1A\n\xFF\xFE", 10));
  ContentScanner sc;
  auto fs = sc.scan_file(p);
  ASSERT_EQ(fs.size(), 1u);
  ASSERT_EQ(fs[0].category, "binary_file");
  ASSERT_EQ(fs[0].severity, Severity::Medium);
  ASSERT_EQ(fs[0].description, "Binary file detected in documentation");
}

TEST(file_missing_is_scan_error) {
  ContentScanner sc;
  auto fs = sc.scan_file("/tmp/vigil_test_no_such_dir/missing.md");
  ASSERT_EQ(fs.size(), 1u);
  ASSERT_EQ(fs[0].category, "scan_error");
  ASSERT_EQ(fs[0].severity, Severity::Low);
  ASSERT_EQ(fs[0].description.rfind("Error scanning file: ", 0), 0u);
}

TEST(file_markup_pass_by_extension) {
  ScratchDir d("markup");
  const std::string body = "Intro\n<iframe src=\"https://evil.invalid\"></iframe>\n";
  auto md = d.write("prd.md", body);
  auto txt = d.write("prd.txt", body);

  ContentScanner sc;
  auto md_findings = sc.scan_file(md);
  ASSERT_EQ(count(md_findings, "dangerous_markup"), 1u);
  ASSERT_EQ(first(md_findings, "dangerous_markup")->severity, Severity::Medium);
  ASSERT_EQ(*first(md_findings, "dangerous_markup")->line_number, 2);
  ASSERT_EQ(count(sc.scan_file(txt), "dangerous_markup"), 0u);

  ScanOptions off;
  off.markup = false;
  ASSERT_EQ(count(ContentScanner(off).scan_file(md), "dangerous_markup"), 0u);
}

TEST(file_size_limit) {
  ScratchDir d("size");
  auto p = d.write("big.md", "password=supersecretvalue123\n");
  ScanOptions small;
  small.max_file_bytes = 10;
  auto fs = ContentScanner(small).scan_file(p);
  ASSERT_EQ(fs.size(), 1u);
  ASSERT_EQ(fs[0].category, "file_size_limit");
  ASSERT_EQ(fs[0].severity, Severity::Low);
}

TEST(tree_scans_nested_files) {
  ScratchDir d("tree");
  d.write("prd.md", "# Product\nA task manager for remote teams.\n");
  d.write("sub/config.yaml", "token: abcdefghijklmnopqrstuvwxyz1234\n");
  d.write("sub/readme.txt", "nothing to see\n");
  ContentScanner sc;
  auto fs = sc.scan_tree(d.path);
  ASSERT_EQ(fs.size(), 1u);
  ASSERT_EQ(fs[0].category, "credentials");
  ASSERT_EQ(fs[0].file_path, (d.path / "sub" / "config.yaml").string());
}

TEST(tree_empty_directory) {
  ScratchDir d("tree_empty");
  ContentScanner sc;
  ASSERT_TRUE(sc.scan_tree(d.path).empty());
  ASSERT_TRUE(sc.check_permissions(d.path).empty());
}

TEST(tree_file_budget) {
  ScratchDir d("budget");
  d.write("a.md", "clean\n");
  d.write("b.md", "clean\n");
  d.write("c.md", "clean\n");
  ScanOptions opts;
  opts.max_files = 2;
  auto fs = ContentScanner(opts).scan_tree(d.path);
  ASSERT_EQ(fs.size(), 1u);
  ASSERT_EQ(fs[0].category, "scan_budget");
  ASSERT_EQ(fs[0].severity, Severity::Low);

  opts.max_files = 3;
  ASSERT_TRUE(ContentScanner(opts).scan_tree(d.path).empty());
}

TEST(permissions_world_writable_and_executable_docs) {
  ScratchDir d("perms");
  d.write("open.yaml", "a: b\n", std::filesystem::perms(0666));
  d.write("run.md", "# doc\n", std::filesystem::perms(0755));
  d.write("tool.sh", "#!/bin/sh\n", std::filesystem::perms(0755));
  d.write("fine.md", "# doc\n", std::filesystem::perms(0644));
  ContentScanner sc;
  auto fs = sc.check_permissions(d.path);
  ASSERT_EQ(fs.size(), 2u);
  for (const auto& f : fs) {
    ASSERT_EQ(f.category, "file_permissions");
    if (f.description == "World-writable file") {
      ASSERT_EQ(f.severity, Severity::Medium);
      ASSERT_EQ(f.file_path, (d.path / "open.yaml").string());
    } else {
      ASSERT_EQ(f.description, "Executable documentation file");
      ASSERT_EQ(f.severity, Severity::Low);
      ASSERT_EQ(f.file_path, (d.path / "run.md").string());
    }
  }
}

TEST(permissions_world_writable_subdirectory) {
  ScratchDir d("dirperms");
  d.mkdir("shared", std::filesystem::perms(0777));
  d.mkdir("private", std::filesystem::perms(0700));
  ContentScanner sc;
  auto fs = sc.check_permissions(d.path);
  ASSERT_EQ(fs.size(), 1u);
  ASSERT_EQ(fs[0].category, "directory_permissions");
  ASSERT_EQ(fs[0].severity, Severity::Medium);
  ASSERT_EQ(fs[0].file_path, (d.path / "shared").string());
}
