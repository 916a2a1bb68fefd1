#include <treetags/tree_sitter_engine.h>

#include <treetags/errors.h>
#include <treetags/grammar_loader.h>
#include <treetags/source_text.h>

#include <algorithm>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

namespace treetags {
namespace {

constexpr int kMaxSiblingDepth = 4;

using TreePointer = std::unique_ptr<TSTree, decltype(&ts_tree_delete)>;

bool IsTagCapture(const std::string &name) {
  return name.rfind("definition.", 0) == 0 || name.rfind("reference.", 0) == 0;
}

SourcePoint ToPoint(TSPoint point) { return SourcePoint{point.row, point.column}; }

std::string NodeText(TSNode node, std::string_view source) {
  const auto start =
      std::min<std::size_t>(ts_node_start_byte(node), source.size());
  const auto end = std::min<std::size_t>(ts_node_end_byte(node), source.size());
  return std::string(source.substr(start, end - start));
}

void AppendNamedChildren(TSNode parent, std::string_view source,
                         std::vector<SiblingNode> &siblings) {
  const auto count = ts_node_child_count(parent);
  for (std::uint32_t i = 0; i < count; ++i) {
    const auto child = ts_node_child(parent, i);
    if (!ts_node_is_named(child)) {
      continue;
    }
    SiblingNode sibling;
    if (const char *field = ts_node_field_name_for_child(parent, i);
        field != nullptr) {
      sibling.field_name = field;
    }
    sibling.node_type = ts_node_type(child);
    const auto length = ts_node_end_byte(child) - ts_node_start_byte(child);
    if (length > kMaxSiblingText) {
      sibling.truncated = true;
    } else {
      sibling.text = NodeText(child, source);
    }
    siblings.push_back(std::move(sibling));
  }
}

// Named children of every node from the identifier's parent up to the
// definition node, nearest first.
std::vector<SiblingNode> SnapshotSiblings(TSNode name_node, TSNode definition,
                                          std::string_view source) {
  std::vector<SiblingNode> siblings;
  if (ts_node_eq(name_node, definition)) {
    AppendNamedChildren(definition, source, siblings);
    return siblings;
  }
  auto current = ts_node_parent(name_node);
  for (int depth = 0; depth < kMaxSiblingDepth && !ts_node_is_null(current);
       ++depth) {
    AppendNamedChildren(current, source, siblings);
    if (ts_node_eq(current, definition)) {
      break;
    }
    current = ts_node_parent(current);
  }
  return siblings;
}

} // namespace

TreeSitterEngine::TreeSitterEngine()
    : parser_(ts_parser_new()), cursor_(ts_query_cursor_new()) {
  if (parser_ == nullptr || cursor_ == nullptr) {
    if (parser_ != nullptr) {
      ts_parser_delete(parser_);
    }
    if (cursor_ != nullptr) {
      ts_query_cursor_delete(cursor_);
    }
    throw std::runtime_error("Failed to create tree-sitter parser");
  }
}

TreeSitterEngine::~TreeSitterEngine() {
  ts_query_cursor_delete(cursor_);
  ts_parser_delete(parser_);
}

std::vector<CaptureMatch>
TreeSitterEngine::ParseAndQuery(std::string_view source,
                                const LanguageProfile &profile) {
  if (!IsValidUtf8(source)) {
    throw EngineError(EngineError::Kind::kDecode,
                      "Source is not valid UTF-8");
  }
  const auto &grammar = profile.grammar;
  if (!grammar || grammar->language == nullptr || grammar->query == nullptr) {
    throw EngineError(EngineError::Kind::kParse,
                      "No grammar loaded for " + profile.name);
  }
  if (!ts_parser_set_language(parser_, grammar->language)) {
    throw EngineError(EngineError::Kind::kParse,
                      "Grammar version of " + profile.name +
                          " is not supported by the parser");
  }

  TreePointer tree(ts_parser_parse_string(parser_, nullptr, source.data(),
                                          static_cast<std::uint32_t>(
                                              source.size())),
                   &ts_tree_delete);
  if (!tree) {
    throw EngineError(EngineError::Kind::kParse,
                      "Parser produced no syntax tree");
  }

  std::vector<CaptureMatch> captures;
  ts_query_cursor_exec(cursor_, grammar->query, ts_tree_root_node(tree.get()));
  TSQueryMatch match;
  while (ts_query_cursor_next_match(cursor_, &match)) {
    if (!grammar->SatisfiesPredicates(match, source)) {
      continue;
    }

    std::optional<TSNode> name_node;
    for (std::uint16_t i = 0; i < match.capture_count; ++i) {
      if (grammar->capture_names[match.captures[i].index] == "name") {
        name_node = match.captures[i].node;
        break;
      }
    }

    for (std::uint16_t i = 0; i < match.capture_count; ++i) {
      const auto &capture_name =
          grammar->capture_names[match.captures[i].index];
      if (!IsTagCapture(capture_name)) {
        continue;
      }
      const auto node = match.captures[i].node;
      const auto identifier = name_node.value_or(node);

      CaptureMatch capture;
      capture.capture_name = capture_name;
      capture.pattern_index = match.pattern_index;
      capture.start_byte = ts_node_start_byte(node);
      capture.end_byte = ts_node_end_byte(node);
      capture.start = ToPoint(ts_node_start_point(node));
      capture.end = ToPoint(ts_node_end_point(node));
      capture.name = NodeText(identifier, source);
      capture.name_start = ToPoint(ts_node_start_point(identifier));
      capture.line_text =
          LineTextAt(source, ts_node_start_byte(identifier));
      capture.siblings = SnapshotSiblings(identifier, node, source);
      captures.push_back(std::move(capture));
    }
  }

  std::stable_sort(captures.begin(), captures.end(),
                   [](const CaptureMatch &left, const CaptureMatch &right) {
                     if (left.start_byte != right.start_byte) {
                       return left.start_byte < right.start_byte;
                     }
                     if (left.end_byte != right.end_byte) {
                       return left.end_byte > right.end_byte;
                     }
                     return left.pattern_index < right.pattern_index;
                   });
  return captures;
}

EngineFactory MakeTreeSitterEngineFactory() {
  return [] { return std::make_unique<TreeSitterEngine>(); };
}

} // namespace treetags
