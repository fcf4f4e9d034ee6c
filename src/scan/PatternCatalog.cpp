#include "scan/PatternCatalog.hpp"

#include <initializer_list>
#include <utility>

namespace vigil::scan {

using model::Severity;

static PatternSet make_set(const char* category, std::initializer_list<const char*> patterns) {
  PatternSet set;
  set.category = category;
  set.sources.reserve(patterns.size());
  set.regexes.reserve(patterns.size());
  for (const char* p : patterns) {
    set.sources.emplace_back(p);
    set.regexes.emplace_back(p, std::regex::ECMAScript | std::regex::icase);
  }
  return set;
}

const Catalog& threat_catalog() {
  static const Catalog catalog = []{
    Catalog c;
    c.push_back(make_set("sql_injection", {
      R"(';.*drop\s+table)",
      R"(';.*delete\s+from)",
      R"(';.*update\s+.*set)",
      R"(union\s+select)",
      R"(or\s+1\s*=\s*1)",
      R"(and\s+1\s*=\s*1)",
    }));
    c.push_back(make_set("command_injection", {
      R"(;\s*(rm|del|format|shutdown))",
      R"(\|\s*(rm|del|format))",
      R"(&&\s*(rm|del|format))",
      R"(`.*`)",
      R"(\$\(.*\))",
    }));
    c.push_back(make_set("template_injection", {
      R"(\{\{.*?\}\})",
      R"(\$\{.*?\})",
      R"(<%.*?%>)",
      R"(\[\[.*?\]\])",
    }));
    c.push_back(make_set("xss", {
      R"(<script[^>]*>)",
      R"(javascript:)",
      R"(on\w+\s*=)",
      R"(<iframe[^>]*>)",
      R"(<object[^>]*>)",
      R"(<embed[^>]*>)",
    }));
    c.push_back(make_set("path_traversal", {
      R"(\.\./)",
      R"(\.\.\\)",
      R"(%2e%2e%2f)",
      R"(%2e%2e%5c)",
      R"(..%2f)",
      R"(..%5c)",
    }));
    return c;
  }();
  return catalog;
}

const Catalog& sensitive_catalog() {
  static const Catalog catalog = []{
    Catalog c;
    c.push_back(make_set("credentials", {
      R"(password\s*[=:]\s*["']?[^\s"']{8,})",
      R"(api[_-]?key\s*[=:]\s*["']?[a-zA-Z0-9]{20,})",
      R"(secret\s*[=:]\s*["']?[a-zA-Z0-9]{16,})",
      R"(token\s*[=:]\s*["']?[a-zA-Z0-9]{20,})",
      R"(access[_-]?key\s*[=:]\s*["']?[a-zA-Z0-9]{16,})",
    }));
    c.push_back(make_set("private_info", {
      R"(\b\d{3}-\d{2}-\d{4}\b)",                                // SSN
      R"(\b\d{4}[-\s]?\d{4}[-\s]?\d{4}[-\s]?\d{4}\b)",           // card number
      R"(\b[A-Za-z0-9._%+-]+@[A-Za-z0-9.-]+\.[A-Z|a-z]{2,}\b)",  // e-mail
    }));
    c.push_back(make_set("malicious_code", {
      R"(eval\s*\()",
      R"(exec\s*\()",
      R"(system\s*\()",
      R"(shell_exec\s*\()",
      R"(passthru\s*\()",
      R"(base64_decode\s*\()",
    }));
    return c;
  }();
  return catalog;
}

const Catalog& markup_catalog() {
  static const Catalog catalog = []{
    Catalog c;
    c.push_back(make_set("dangerous_markup", {
      R"(<script[^>]*>)",
      R"(<iframe[^>]*>)",
      R"(<object[^>]*>)",
      R"(<embed[^>]*>)",
      R"(<form[^>]*>)",
      R"(<input[^>]*>)",
      R"(javascript:)",
      R"(vbscript:)",
      R"(\bdata:\s*text/html)",
      R"(<[^>]*\son\w+\s*=)",   // event handler attribute
    }));
    return c;
  }();
  return catalog;
}

struct CategoryInfo { const char* category; Severity severity; const char* remediation; };

static constexpr CategoryInfo kCategoryTable[] = {
  {"sql_injection",       Severity::Critical, "Use parameterized queries and input validation"},
  {"command_injection",   Severity::Critical, "Validate and sanitize all user inputs, avoid system calls"},
  {"template_injection",  Severity::High,     "Use safe templating with auto-escaping enabled"},
  {"xss",                 Severity::High,     "Encode output and validate input, use Content Security Policy"},
  {"path_traversal",      Severity::High,     "Validate and canonicalize file paths, use whitelist approach"},
  {"credentials",         Severity::High,     "Remove credentials from generated content and rotate any exposed secret"},
  {"private_info",        Severity::Medium,   "Remove or mask personal data in generated content"},
  {"malicious_code",      Severity::Medium,   "Remove executable code constructs from generated documents"},
  {"dangerous_markup",    Severity::Medium,   "Strip active HTML and script URLs from generated markup"},
  {"prompt_injection",    Severity::Medium,   "Reject instructions that try to override the generator's prompt"},
  {"file_upload",         Severity::Medium,   "Validate file types, scan for malware, limit file sizes"},
  {"resource_exhaustion", Severity::Medium,   "Implement rate limiting and resource quotas"},
};

static const CategoryInfo* find_category(std::string_view category) {
  for (const auto& info : kCategoryTable)
    if (category == info.category) return &info;
  return nullptr;
}

std::string replace_matches(std::string_view text, const std::regex& re, std::string_view replacement) {
  std::string out;
  out.reserve(text.size());
  std::size_t copied = 0;
  for_each_match(text, re, [&](std::size_t b, std::size_t e){
    out.append(text.substr(copied, b - copied));
    out.append(replacement);
    copied = e;
  });
  out.append(text.substr(copied));
  return out;
}

Severity severity_for(std::string_view category) {
  const auto* info = find_category(category);
  return info ? info->severity : Severity::Low;
}

std::string remediation_for(std::string_view category) {
  const auto* info = find_category(category);
  return info ? info->remediation : "Review and validate input handling";
}

} // namespace vigil::scan
