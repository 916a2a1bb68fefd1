#include <treetags/builtin_languages.h>

#include <algorithm>
#include <utility>

namespace treetags {
namespace {

using Kinds = std::map<std::string, KindSpec>;

KindSpec Kind(char code, std::string name, bool enabled_by_default = true) {
  return KindSpec{code, std::move(name), enabled_by_default};
}

FieldRule Rule(FieldRuleVariant rule, std::vector<std::string> applies_to = {}) {
  return FieldRule{std::move(rule), std::move(applies_to)};
}

BuiltinLanguage MakeLanguage(std::string name,
                             std::vector<std::string> extensions,
                             std::string grammar, std::string query,
                             Kinds kinds, std::vector<FieldRule> field_rules,
                             std::string scope_separator = ".") {
  BuiltinLanguage language;
  language.profile.name = std::move(name);
  language.profile.extensions = std::move(extensions);
  language.profile.kinds = std::move(kinds);
  language.profile.field_rules = std::move(field_rules);
  language.profile.scope_separator = std::move(scope_separator);
  language.library_name = "libtree-sitter-" + grammar + ".so";
  language.symbol = "tree_sitter_" + grammar;
  std::replace(language.symbol.begin(), language.symbol.end(), '-', '_');
  language.query = std::move(query);
  return language;
}

constexpr const char *kCQuery = R"query(
(preproc_def name: (identifier) @name) @definition.macro
(preproc_function_def name: (identifier) @name) @definition.macro

(struct_specifier name: (type_identifier) @name body: (field_declaration_list)) @definition.struct
(union_specifier name: (type_identifier) @name body: (field_declaration_list)) @definition.union
(enum_specifier name: (type_identifier) @name body: (enumerator_list)) @definition.enum
(enumerator name: (identifier) @name) @definition.enumerator
(field_declaration declarator: (field_identifier) @name) @definition.member
(type_definition declarator: (type_identifier) @name) @definition.typedef

(function_definition declarator: (function_declarator declarator: (identifier) @name)) @definition.function
(function_definition declarator: (pointer_declarator declarator: (function_declarator declarator: (identifier) @name))) @definition.function
(declaration declarator: (function_declarator declarator: (identifier) @name)) @definition.prototype

(translation_unit (declaration declarator: (init_declarator declarator: (identifier) @name)) @definition.variable)
(translation_unit (declaration declarator: (identifier) @name) @definition.variable)
)query";

constexpr const char *kCppQuery = R"query(
(preproc_def name: (identifier) @name) @definition.macro
(preproc_function_def name: (identifier) @name) @definition.macro

(namespace_definition name: (namespace_identifier) @name) @definition.namespace
(class_specifier name: (type_identifier) @name body: (field_declaration_list)) @definition.class
(struct_specifier name: (type_identifier) @name body: (field_declaration_list)) @definition.struct
(union_specifier name: (type_identifier) @name body: (field_declaration_list)) @definition.union
(enum_specifier name: (type_identifier) @name body: (enumerator_list)) @definition.enum
(enumerator name: (identifier) @name) @definition.enumerator
(type_definition declarator: (type_identifier) @name) @definition.typedef
(alias_declaration name: (type_identifier) @name) @definition.typedef

(field_declaration declarator: (function_declarator declarator: (field_identifier) @name)) @definition.prototype
(field_declaration declarator: (field_identifier) @name) @definition.member

(function_definition declarator: (function_declarator declarator: (identifier) @name)) @definition.function
(function_definition declarator: (function_declarator declarator: (field_identifier) @name)) @definition.function
(function_definition declarator: (function_declarator declarator: (qualified_identifier name: (identifier) @name))) @definition.function
(function_definition declarator: (pointer_declarator declarator: (function_declarator declarator: (identifier) @name))) @definition.function
(function_definition declarator: (reference_declarator (function_declarator declarator: (identifier) @name))) @definition.function
(declaration declarator: (function_declarator declarator: (identifier) @name)) @definition.prototype

(translation_unit (declaration declarator: (init_declarator declarator: (identifier) @name)) @definition.variable)
(translation_unit (declaration declarator: (identifier) @name) @definition.variable)
(namespace_definition body: (declaration_list (declaration declarator: (init_declarator declarator: (identifier) @name)) @definition.variable))
)query";

constexpr const char *kGoQuery = R"query(
(package_clause (package_identifier) @name) @definition.package
(function_declaration name: (identifier) @name) @definition.function
(method_declaration name: (field_identifier) @name) @definition.method

(type_declaration (type_spec name: (type_identifier) @name type: (struct_type)) @definition.struct)
(type_declaration (type_spec name: (type_identifier) @name type: (interface_type)) @definition.interface)
(type_declaration (type_spec name: (type_identifier) @name type: [(type_identifier) (qualified_type) (pointer_type) (slice_type) (map_type) (array_type) (function_type) (channel_type)]) @definition.type)
(field_declaration name: (field_identifier) @name) @definition.member

(const_spec name: (identifier) @name) @definition.constant
(source_file (var_declaration (var_spec name: (identifier) @name) @definition.variable))

(call_expression function: (identifier) @name) @reference.call
)query";

constexpr const char *kPythonQuery = R"query(
(class_definition body: (block (function_definition name: (identifier) @name) @definition.method))
(class_definition body: (block (decorated_definition definition: (function_definition name: (identifier) @name) @definition.method)))
(class_definition name: (identifier) @name) @definition.class
(function_definition name: (identifier) @name) @definition.function

(module (expression_statement (assignment left: (identifier) @name)) @definition.variable)
(class_definition body: (block (expression_statement (assignment left: (identifier) @name)) @definition.variable))

(call function: (identifier) @name) @reference.call
)query";

constexpr const char *kRustQuery = R"query(
(mod_item name: (identifier) @name) @definition.module
(struct_item name: (type_identifier) @name) @definition.struct
(union_item name: (type_identifier) @name) @definition.union
(enum_item name: (type_identifier) @name) @definition.enum
(enum_variant name: (identifier) @name) @definition.enumerator
(field_declaration name: (field_identifier) @name) @definition.field
(trait_item name: (type_identifier) @name) @definition.interface
(impl_item type: (type_identifier) @name) @definition.implementation
(impl_item type: (generic_type type: (type_identifier) @name)) @definition.implementation

(impl_item body: (declaration_list (function_item name: (identifier) @name) @definition.method))
(trait_item body: (declaration_list (function_item name: (identifier) @name) @definition.method))
(trait_item body: (declaration_list (function_signature_item name: (identifier) @name) @definition.method))
(function_item name: (identifier) @name) @definition.function

(type_item name: (type_identifier) @name) @definition.typedef
(const_item name: (identifier) @name) @definition.constant
(static_item name: (identifier) @name) @definition.variable
(macro_definition name: (identifier) @name) @definition.macro
)query";

constexpr const char *kJavaScriptQuery = R"query(
(class_declaration name: (identifier) @name) @definition.class
(method_definition name: (property_identifier) @name) @definition.method
(function_declaration name: (identifier) @name) @definition.function
(generator_function_declaration name: (identifier) @name) @definition.generator

(program (lexical_declaration (variable_declarator name: (identifier) @name value: (arrow_function)) @definition.function))
(program (lexical_declaration (variable_declarator name: (identifier) @name) @definition.variable))
(program (variable_declaration (variable_declarator name: (identifier) @name) @definition.variable))

(call_expression function: (identifier) @name) @reference.call
)query";

constexpr const char *kJavaQuery = R"query(
(package_declaration [(scoped_identifier) (identifier)] @name) @definition.package
(class_declaration name: (identifier) @name) @definition.class
(interface_declaration name: (identifier) @name) @definition.interface
(enum_declaration name: (identifier) @name) @definition.enum
(enum_constant name: (identifier) @name) @definition.enumConstant
(annotation_type_declaration name: (identifier) @name) @definition.annotation
(method_declaration name: (identifier) @name) @definition.method
(constructor_declaration name: (identifier) @name) @definition.method
(field_declaration declarator: (variable_declarator name: (identifier) @name)) @definition.field

(method_invocation name: (identifier) @name) @reference.call
)query";

constexpr const char *kRubyQuery = R"query(
(class name: [(constant) @name (scope_resolution name: (_) @name)]) @definition.class
(module name: [(constant) @name (scope_resolution name: (_) @name)]) @definition.module
(method name: (_) @name) @definition.method
(singleton_method name: (_) @name) @definition.singletonMethod
(assignment left: (constant) @name) @definition.constant

(call method: (identifier) @name) @reference.call
)query";

constexpr const char *kOcamlQuery = R"query(
(module_definition (module_binding (module_name) @name) @definition.module)
(module_type_definition (module_type_name) @name) @definition.interface
(class_definition (class_binding (class_name) @name) @definition.class)
(method_definition (method_name) @name) @definition.method
(type_definition (type_binding name: (type_constructor) @name) @definition.type)
(exception_definition (constructor_declaration (constructor_name) @name)) @definition.exception
(external (value_name) @name) @definition.function

(value_definition (let_binding pattern: (value_name) @name (parameter)) @definition.function)
(value_definition (let_binding pattern: (value_name) @name body: [(fun_expression) (function_expression)]) @definition.function)
(value_definition (let_binding pattern: (value_name) @name) @definition.variable)
)query";

constexpr const char *kPhpQuery = R"query(
(namespace_definition name: (namespace_name) @name) @definition.namespace
(interface_declaration name: (name) @name) @definition.interface
(trait_declaration name: (name) @name) @definition.trait
(class_declaration name: (name) @name) @definition.class
(function_definition name: (name) @name) @definition.function
(method_declaration name: (name) @name) @definition.method
(property_declaration (property_element (variable_name (name) @name))) @definition.variable

(function_call_expression function: (name) @name) @reference.call
)query";

constexpr const char *kTypeScriptQuery = R"query(
(class_declaration name: (type_identifier) @name) @definition.class
(abstract_class_declaration name: (type_identifier) @name) @definition.class
(interface_declaration name: (type_identifier) @name) @definition.interface
(enum_declaration name: (identifier) @name) @definition.enum
(type_alias_declaration name: (type_identifier) @name) @definition.alias
(internal_module name: (identifier) @name) @definition.namespace
(module name: (identifier) @name) @definition.namespace

(method_definition name: (property_identifier) @name) @definition.method
(method_signature name: (property_identifier) @name) @definition.method
(abstract_method_signature name: (property_identifier) @name) @definition.method
(public_field_definition name: (property_identifier) @name) @definition.property
(property_signature name: (property_identifier) @name) @definition.property

(function_declaration name: (identifier) @name) @definition.function
(function_signature name: (identifier) @name) @definition.function
(generator_function_declaration name: (identifier) @name) @definition.generator

(program (lexical_declaration (variable_declarator name: (identifier) @name value: (arrow_function)) @definition.function))
(program (lexical_declaration (variable_declarator name: (identifier) @name) @definition.variable))
(program (export_statement (lexical_declaration (variable_declarator name: (identifier) @name) @definition.variable)))

(call_expression function: (identifier) @name) @reference.call
)query";

constexpr const char *kElixirQuery = R"query(
(call
  target: (identifier) @keyword
  (arguments (alias) @name)
  (#eq? @keyword "defmodule")) @definition.module

(call
  target: (identifier) @keyword
  (arguments (alias) @name)
  (#eq? @keyword "defprotocol")) @definition.protocol

(call
  target: (identifier) @keyword
  (arguments
    [(identifier) @name
     (call target: (identifier) @name)
     (binary_operator left: (call target: (identifier) @name) operator: "when")])
  (#any-of? @keyword "def" "defp" "defdelegate")) @definition.function

(call
  target: (identifier) @keyword
  (arguments
    [(identifier) @name
     (call target: (identifier) @name)
     (binary_operator left: (call target: (identifier) @name) operator: "when")])
  (#any-of? @keyword "defmacro" "defmacrop")) @definition.macro

(call
  target: (identifier) @keyword
  (arguments
    [(identifier) @name
     (call target: (identifier) @name)
     (binary_operator left: (call target: (identifier) @name) operator: "when")])
  (#any-of? @keyword "defguard" "defguardp")) @definition.guard
)query";

constexpr const char *kLuaQuery = R"query(
(function_declaration
  name: [(identifier) @name
         (dot_index_expression field: (identifier) @name)]) @definition.function
(function_declaration
  name: (method_index_expression method: (identifier) @name)) @definition.method
(field
  name: (identifier) @name
  value: (function_definition)) @definition.function

(function_call name: (identifier) @name) @reference.call
)query";

constexpr const char *kCSharpQuery = R"query(
(namespace_declaration name: [(identifier) (qualified_name)] @name) @definition.namespace
(class_declaration name: (identifier) @name) @definition.class
(struct_declaration name: (identifier) @name) @definition.struct
(interface_declaration name: (identifier) @name) @definition.interface
(enum_declaration name: (identifier) @name) @definition.enum
(enum_member_declaration name: (identifier) @name) @definition.enumerator
(method_declaration name: (identifier) @name) @definition.method
(constructor_declaration name: (identifier) @name) @definition.method
(property_declaration name: (identifier) @name) @definition.property
(field_declaration (variable_declaration (variable_declarator . (identifier) @name))) @definition.field

(object_creation_expression type: (identifier) @name) @reference.class
)query";

constexpr const char *kBashQuery = R"query(
(function_definition name: (word) @name) @definition.function
(heredoc_redirect (heredoc_start) @name) @definition.heredoc

(command name: (command_name (word) @name)) @reference.call
)query";

constexpr const char *kScalaQuery = R"query(
(package_clause name: (package_identifier) @name) @definition.package
(class_definition name: (identifier) @name) @definition.class
(object_definition name: (identifier) @name) @definition.object
(trait_definition name: (identifier) @name) @definition.trait
(enum_definition name: (identifier) @name) @definition.enum
(type_definition name: (type_identifier) @name) @definition.type

(function_definition name: (identifier) @name) @definition.method
(function_declaration name: (identifier) @name) @definition.method
(val_definition pattern: (identifier) @name) @definition.constant
(var_definition pattern: (identifier) @name) @definition.variable

(call_expression function: (identifier) @name) @reference.call
)query";

std::vector<FieldRule> CFamilyRules() {
  return {
      Rule(LineRule{}),
      Rule(EndLineRule{}),
      Rule(SignatureRule{"parameters"},
           {"definition.function", "definition.prototype"}),
      Rule(TypeRefRule{"type"},
           {"definition.function", "definition.prototype", "definition.member",
            "definition.variable", "definition.typedef"}),
  };
}

BuiltinLanguage MakeC() {
  Kinds kinds = {
      {"definition.macro", Kind('d', "macro")},
      {"definition.enumerator", Kind('e', "enumerator")},
      {"definition.function", Kind('f', "function")},
      {"definition.enum", Kind('g', "enum")},
      {"definition.member", Kind('m', "member")},
      {"definition.prototype", Kind('p', "prototype", false)},
      {"definition.struct", Kind('s', "struct")},
      {"definition.typedef", Kind('t', "typedef")},
      {"definition.union", Kind('u', "union")},
      {"definition.variable", Kind('v', "variable")},
  };
  return MakeLanguage("c", {"c", "h"}, "c", kCQuery, std::move(kinds),
                      CFamilyRules(), "::");
}

BuiltinLanguage MakeCpp() {
  Kinds kinds = {
      {"definition.class", Kind('c', "class")},
      {"definition.macro", Kind('d', "macro")},
      {"definition.enumerator", Kind('e', "enumerator")},
      {"definition.function", Kind('f', "function")},
      {"definition.enum", Kind('g', "enum")},
      {"definition.member", Kind('m', "member")},
      {"definition.namespace", Kind('n', "namespace")},
      {"definition.prototype", Kind('p', "prototype", false)},
      {"definition.struct", Kind('s', "struct")},
      {"definition.typedef", Kind('t', "typedef")},
      {"definition.union", Kind('u', "union")},
      {"definition.variable", Kind('v', "variable")},
  };
  return MakeLanguage("c++", {"cc", "cpp", "cxx", "c++", "hh", "hpp", "hxx", "h++"},
                      "cpp", kCppQuery, std::move(kinds), CFamilyRules(), "::");
}

BuiltinLanguage MakeGo() {
  Kinds kinds = {
      {"definition.constant", Kind('c', "constant")},
      {"definition.function", Kind('f', "func")},
      {"definition.method", Kind('f', "func")},
      {"definition.interface", Kind('i', "interface")},
      {"definition.member", Kind('m', "member")},
      {"definition.package", Kind('p', "package")},
      {"definition.struct", Kind('s', "struct")},
      {"definition.type", Kind('t', "type")},
      {"definition.variable", Kind('v', "var")},
  };
  std::vector<FieldRule> rules = {
      Rule(LineRule{}),
      Rule(EndLineRule{}),
      Rule(SignatureRule{"parameters"},
           {"definition.function", "definition.method"}),
      Rule(TypeRefRule{"result"}, {"definition.function", "definition.method"}),
      Rule(TypeRefRule{"type"},
           {"definition.member", "definition.constant", "definition.variable"}),
      Rule(ExportedNameAccessRule{},
           {"definition.function", "definition.method", "definition.member",
            "definition.constant", "definition.variable", "definition.type",
            "definition.struct", "definition.interface"}),
  };
  return MakeLanguage("go", {"go"}, "go", kGoQuery, std::move(kinds),
                      std::move(rules));
}

BuiltinLanguage MakePython() {
  Kinds kinds = {
      {"definition.class", Kind('c', "class")},
      {"definition.function", Kind('f', "function")},
      {"definition.method", Kind('m', "member")},
      {"definition.variable", Kind('v', "variable")},
  };
  std::vector<FieldRule> rules = {
      Rule(LineRule{}),
      Rule(EndLineRule{}),
      Rule(SignatureRule{"parameters"},
           {"definition.function", "definition.method"}),
      Rule(TypeRefRule{"return_type"},
           {"definition.function", "definition.method"}),
  };
  return MakeLanguage("python", {"py", "pyi", "pyw"}, "python", kPythonQuery,
                      std::move(kinds), std::move(rules));
}

BuiltinLanguage MakeRust() {
  Kinds kinds = {
      {"definition.module", Kind('n', "module")},
      {"definition.struct", Kind('s', "struct")},
      {"definition.enum", Kind('g', "enum")},
      {"definition.union", Kind('u', "union")},
      {"definition.interface", Kind('i', "interface")},
      {"definition.implementation", Kind('c', "implementation")},
      {"definition.function", Kind('f', "function")},
      {"definition.method", Kind('P', "method")},
      {"definition.enumerator", Kind('e', "enumerator")},
      {"definition.field", Kind('m', "field")},
      {"definition.typedef", Kind('t', "typedef")},
      {"definition.constant", Kind('C', "constant")},
      {"definition.variable", Kind('v', "variable")},
      {"definition.macro", Kind('M', "macro")},
  };
  AccessModifierRule visibility;
  visibility.node_type = "visibility_modifier";
  visibility.keywords = {{"pub", "public"}};
  visibility.fallback = "private";
  std::vector<FieldRule> rules = {
      Rule(LineRule{}),
      Rule(EndLineRule{}),
      Rule(SignatureRule{"parameters"},
           {"definition.function", "definition.method"}),
      Rule(TypeRefRule{"return_type"},
           {"definition.function", "definition.method"}),
      Rule(TypeRefRule{"type"},
           {"definition.field", "definition.constant", "definition.variable",
            "definition.typedef"}),
      Rule(std::move(visibility),
           {"definition.function", "definition.method", "definition.struct",
            "definition.enum", "definition.union", "definition.interface",
            "definition.field", "definition.module", "definition.typedef",
            "definition.constant", "definition.variable"}),
  };
  return MakeLanguage("rust", {"rs"}, "rust", kRustQuery, std::move(kinds),
                      std::move(rules));
}

BuiltinLanguage MakeJavaScript() {
  Kinds kinds = {
      {"definition.class", Kind('c', "class")},
      {"definition.function", Kind('f', "function")},
      {"definition.generator", Kind('g', "generator")},
      {"definition.method", Kind('m', "method")},
      {"definition.variable", Kind('v', "variable")},
  };
  std::vector<FieldRule> rules = {
      Rule(LineRule{}),
      Rule(EndLineRule{}),
      Rule(SignatureRule{"parameters"},
           {"definition.function", "definition.generator",
            "definition.method"}),
  };
  return MakeLanguage("javascript", {"js", "jsx", "mjs", "cjs"}, "javascript",
                      kJavaScriptQuery, std::move(kinds), std::move(rules));
}

BuiltinLanguage MakeJava() {
  Kinds kinds = {
      {"definition.annotation", Kind('a', "annotation")},
      {"definition.class", Kind('c', "class")},
      {"definition.enumConstant", Kind('e', "enumConstant")},
      {"definition.field", Kind('f', "field")},
      {"definition.enum", Kind('g', "enum")},
      {"definition.interface", Kind('i', "interface")},
      {"definition.method", Kind('m', "method")},
      {"definition.package", Kind('p', "package")},
  };
  AccessModifierRule modifiers;
  modifiers.node_type = "modifiers";
  modifiers.keywords = {{"public", "public"},
                        {"protected", "protected"},
                        {"private", "private"}};
  std::vector<FieldRule> rules = {
      Rule(LineRule{}),
      Rule(EndLineRule{}),
      Rule(SignatureRule{"parameters"}, {"definition.method"}),
      Rule(TypeRefRule{"type"}, {"definition.method", "definition.field"}),
      Rule(std::move(modifiers),
           {"definition.class", "definition.interface", "definition.enum",
            "definition.annotation", "definition.method", "definition.field"}),
  };
  return MakeLanguage("java", {"java"}, "java", kJavaQuery, std::move(kinds),
                      std::move(rules));
}

BuiltinLanguage MakeRuby() {
  Kinds kinds = {
      {"definition.class", Kind('c', "class")},
      {"definition.constant", Kind('C', "constant")},
      {"definition.method", Kind('f', "method")},
      {"definition.module", Kind('m', "module")},
      {"definition.singletonMethod", Kind('S', "singletonMethod")},
  };
  std::vector<FieldRule> rules = {
      Rule(LineRule{}),
      Rule(EndLineRule{}),
      Rule(SignatureRule{"parameters"},
           {"definition.method", "definition.singletonMethod"}),
  };
  return MakeLanguage("ruby", {"rb", "rake", "gemspec"}, "ruby", kRubyQuery,
                      std::move(kinds), std::move(rules));
}

BuiltinLanguage MakeOcaml() {
  Kinds kinds = {
      {"definition.class", Kind('c', "class")},
      {"definition.exception", Kind('e', "exception")},
      {"definition.function", Kind('f', "function")},
      {"definition.interface", Kind('i', "moduleType")},
      {"definition.method", Kind('m', "method")},
      {"definition.module", Kind('M', "module")},
      {"definition.type", Kind('t', "type")},
      {"definition.variable", Kind('v', "value")},
  };
  return MakeLanguage("ocaml", {"ml"}, "ocaml", kOcamlQuery, std::move(kinds),
                      {Rule(LineRule{}), Rule(EndLineRule{})});
}

BuiltinLanguage MakePhp() {
  Kinds kinds = {
      {"definition.class", Kind('c', "class")},
      {"definition.function", Kind('f', "function")},
      {"definition.interface", Kind('i', "interface")},
      {"definition.method", Kind('f', "function")},
      {"definition.namespace", Kind('n', "namespace")},
      {"definition.trait", Kind('t', "trait")},
      {"definition.variable", Kind('v', "variable")},
  };
  AccessModifierRule visibility;
  visibility.node_type = "visibility_modifier";
  visibility.keywords = {{"public", "public"},
                         {"protected", "protected"},
                         {"private", "private"}};
  visibility.fallback = "public";
  std::vector<FieldRule> rules = {
      Rule(LineRule{}),
      Rule(EndLineRule{}),
      Rule(SignatureRule{"parameters"},
           {"definition.function", "definition.method"}),
      Rule(std::move(visibility), {"definition.method"}),
  };
  return MakeLanguage("php", {"php", "php5", "phtml"}, "php", kPhpQuery,
                      std::move(kinds), std::move(rules), "::");
}

BuiltinLanguage MakeTypeScript() {
  Kinds kinds = {
      {"definition.alias", Kind('a', "alias")},
      {"definition.class", Kind('c', "class")},
      {"definition.enum", Kind('g', "enum")},
      {"definition.function", Kind('f', "function")},
      {"definition.generator", Kind('G', "generator")},
      {"definition.interface", Kind('i', "interface")},
      {"definition.method", Kind('m', "method")},
      {"definition.namespace", Kind('n', "namespace")},
      {"definition.property", Kind('p', "property")},
      {"definition.variable", Kind('v', "variable")},
  };
  AccessModifierRule accessibility;
  accessibility.node_type = "accessibility_modifier";
  accessibility.keywords = {{"public", "public"},
                            {"protected", "protected"},
                            {"private", "private"}};
  accessibility.fallback = "public";
  std::vector<FieldRule> rules = {
      Rule(LineRule{}),
      Rule(EndLineRule{}),
      Rule(SignatureRule{"parameters"},
           {"definition.function", "definition.generator",
            "definition.method"}),
      Rule(std::move(accessibility),
           {"definition.method", "definition.property"}),
  };
  return MakeLanguage("typescript", {"ts", "tsx", "mts", "cts"}, "typescript",
                      kTypeScriptQuery, std::move(kinds), std::move(rules));
}

BuiltinLanguage MakeElixir() {
  Kinds kinds = {
      {"definition.function", Kind('f', "function")},
      {"definition.guard", Kind('g', "guard")},
      {"definition.macro", Kind('a', "macro")},
      {"definition.module", Kind('m', "module")},
      {"definition.protocol", Kind('p', "protocol")},
  };
  return MakeLanguage("elixir", {"ex", "exs"}, "elixir", kElixirQuery,
                      std::move(kinds), {Rule(LineRule{}), Rule(EndLineRule{})});
}

BuiltinLanguage MakeLua() {
  Kinds kinds = {
      {"definition.function", Kind('f', "function")},
      {"definition.method", Kind('f', "function")},
  };
  std::vector<FieldRule> rules = {
      Rule(LineRule{}),
      Rule(EndLineRule{}),
      Rule(SignatureRule{"parameters"},
           {"definition.function", "definition.method"}),
  };
  return MakeLanguage("lua", {"lua"}, "lua", kLuaQuery, std::move(kinds),
                      std::move(rules));
}

BuiltinLanguage MakeCSharp() {
  Kinds kinds = {
      {"definition.class", Kind('c', "class")},
      {"definition.enumerator", Kind('e', "enumerator")},
      {"definition.field", Kind('f', "field")},
      {"definition.enum", Kind('g', "enum")},
      {"definition.interface", Kind('i', "interface")},
      {"definition.method", Kind('m', "method")},
      {"definition.namespace", Kind('n', "namespace")},
      {"definition.property", Kind('p', "property")},
      {"definition.struct", Kind('s', "struct")},
  };
  AccessModifierRule modifier;
  modifier.node_type = "modifier";
  modifier.keywords = {{"public", "public"},
                       {"protected", "protected"},
                       {"internal", "internal"},
                       {"private", "private"}};
  modifier.fallback = "private";
  std::vector<FieldRule> rules = {
      Rule(LineRule{}),
      Rule(EndLineRule{}),
      Rule(SignatureRule{"parameters"}, {"definition.method"}),
      Rule(std::move(modifier),
           {"definition.method", "definition.property", "definition.field"}),
  };
  return MakeLanguage("c#", {"cs"}, "c-sharp", kCSharpQuery, std::move(kinds),
                      std::move(rules));
}

BuiltinLanguage MakeBash() {
  Kinds kinds = {
      {"definition.function", Kind('f', "function")},
      {"definition.heredoc", Kind('h', "heredoc")},
  };
  return MakeLanguage("bash", {"sh", "bash"}, "bash", kBashQuery,
                      std::move(kinds), {Rule(LineRule{}), Rule(EndLineRule{})});
}

BuiltinLanguage MakeScala() {
  Kinds kinds = {
      {"definition.class", Kind('c', "class")},
      {"definition.constant", Kind('l', "constant")},
      {"definition.enum", Kind('g', "enum")},
      {"definition.method", Kind('m', "method")},
      {"definition.object", Kind('o', "object")},
      {"definition.package", Kind('p', "package")},
      {"definition.trait", Kind('t', "trait")},
      {"definition.type", Kind('T', "type")},
      {"definition.variable", Kind('v', "variable")},
  };
  std::vector<FieldRule> rules = {
      Rule(LineRule{}),
      Rule(EndLineRule{}),
      Rule(SignatureRule{"parameters"}, {"definition.method"}),
      Rule(TypeRefRule{"return_type"}, {"definition.method"}),
  };
  return MakeLanguage("scala", {"scala", "sc"}, "scala", kScalaQuery,
                      std::move(kinds), std::move(rules));
}

} // namespace

const std::vector<BuiltinLanguage> &BuiltinLanguages() {
  static const std::vector<BuiltinLanguage> languages = {
      MakeC(),      MakeCpp(),        MakeGo(),    MakePython(),
      MakeRust(),   MakeJavaScript(), MakeJava(),  MakeRuby(),
      MakeOcaml(),  MakePhp(),        MakeTypeScript(), MakeElixir(),
      MakeLua(),    MakeCSharp(),     MakeBash(),  MakeScala()};
  return languages;
}

const BuiltinLanguage *FindBuiltinLanguage(const std::string &name) {
  for (const auto &language : BuiltinLanguages()) {
    if (language.profile.name == name) {
      return &language;
    }
  }
  return nullptr;
}

} // namespace treetags
