#pragma once

#include <set>
#include <string>
#include <vector>

namespace treetags {

class FieldSelection {
public:
  FieldSelection();

  static FieldSelection Parse(const std::string &spec,
                              std::vector<std::string> *warnings = nullptr);

  bool IsEnabled(const std::string &field) const;
  void Enable(const std::string &field);
  void Disable(const std::string &field);
  const std::set<std::string> &Enabled() const { return enabled_; }

private:
  std::set<std::string> enabled_;
};

struct ExtrasSelection {
  bool qualified = false;
  bool file_scope = true;

  static ExtrasSelection Parse(const std::string &spec,
                               std::vector<std::string> *warnings = nullptr);
};

struct KindAlias {
  std::vector<std::string> aliases;
  char code = '\0';
};

// Kind specs come in two modes. Without any +/- the listed kinds are the
// only ones enabled; with +/- the defaults are modified.
class KindFilter {
public:
  KindFilter() = default;

  static KindFilter Parse(const std::string &spec,
                          const std::vector<KindAlias> &defaults,
                          const std::vector<KindAlias> &optionals,
                          std::vector<std::string> *warnings = nullptr);

  bool IsEnabled(char code) const;
  bool AllowsAll() const { return allow_all_; }

private:
  bool allow_all_ = true;
  std::set<char> enabled_;
};

std::string CanonicalFieldName(const std::string &name);

} // namespace treetags
