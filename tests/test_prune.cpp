#include "prune.hpp"

#include <gtest/gtest.h>

typedef std::set<std::string> names;

TEST(CssPruneTest, EmptyUnusedSetIsNoOp) {
  std::string css = ".a {\n  color: red;\n}\n.b { }\n";
  EXPECT_EQ(remove_unused_css_rules(css, names()), css);
  EXPECT_EQ(remove_unused_css_rules(css, selector_set()), css);
}

TEST(CssPruneTest, CleanSelector) {
  EXPECT_EQ(clean_selector("  .btn:hover "), ".btn");
  EXPECT_EQ(clean_selector("a::before"), "a");
  EXPECT_EQ(clean_selector(".x > .y"), ".x > .y");
}

TEST(CssPruneTest, MultiLineRuleRemovedEntirely) {
  std::string css = ".a {\n  color: red;\n}\n.b {\n  color: blue;\n}";
  EXPECT_EQ(remove_unused_css_rules(css, names({".a"})), ".b {\n  color: blue;\n}");
}

TEST(CssPruneTest, MixedRuleWithUsedSelectorKept) {
  std::string css = ".a, .b { color: red; }";
  EXPECT_EQ(remove_unused_css_rules(css, names({".a"})), css);
  std::string multi = ".a,.b {\n  color: red;\n}";
  EXPECT_EQ(remove_unused_css_rules(multi, names({".a"})), multi);
}

TEST(CssPruneTest, SingleLineRules) {
  std::string css = ".x { margin: 0; }\n.y { margin: 1px; }";
  EXPECT_EQ(remove_unused_css_rules(css, names({".x"})), ".y { margin: 1px; }");
}

TEST(CssPruneTest, CompoundSelectorContainingUnusedName) {
  std::string css = ".card { color: red; }\n.card.active { color: blue; }";
  EXPECT_EQ(remove_unused_css_rules(css, names({".active"})), ".card { color: red; }");
}

TEST(CssPruneTest, SubstringContainmentOverDeletes) {
  // .foo unused takes .foobar with it
  std::string css = ".foo { a: 1; }\n.foobar { b: 2; }\n.other { c: 3; }";
  EXPECT_EQ(remove_unused_css_rules(css, names({".foo"})), ".other { c: 3; }");
}

TEST(CssPruneTest, HexColorTakenForIdLosesItsLine) {
  // "#fff" is an id candidate nothing references
  std::string css = ".a {\n  color: #fff;\n}\n";
  selector_set unused = { selector(selector::css_id, "fff") };
  EXPECT_EQ(remove_unused_css_rules(css, unused), ".a {\n}\n");
}

TEST(CssPruneTest, PseudoClassesIgnored) {
  std::string css = ".btn:hover { color: red; }";
  EXPECT_EQ(remove_unused_css_rules(css, names({".hover"})), css);
  EXPECT_EQ(remove_unused_css_rules(css, names({".btn"})), "");
}

TEST(CssPruneTest, NestedRuleInsideUsedBlock) {
  std::string css =
    "@media (max-width: 600px) {\n"
    "  .gone { display: none; }\n"
    "  .kept { display: block; }\n"
    "}";
  EXPECT_EQ(remove_unused_css_rules(css, names({".gone"})),
    "@media (max-width: 600px) {\n"
    "  .kept { display: block; }\n"
    "}");
}

TEST(CssPruneTest, LinesOutsideRulesKept) {
  std::string css = "@import url(\"base.css\");\n/* header */\n.a { }";
  EXPECT_EQ(remove_unused_css_rules(css, names({".a"})), "@import url(\"base.css\");\n/* header */");
}

TEST(CssPruneTest, TrailingNewlinePreserved) {
  EXPECT_EQ(remove_unused_css_rules(".a { }\n.b { }\n", names({".a"})), ".b { }\n");
}

TEST(CssPruneTest, IdRule) {
  std::string css = "#main {\n  width: 100%;\n}\n#side {\n  width: 20%;\n}\n";
  selector_set unused = { selector(selector::css_id, "main") };
  EXPECT_EQ(remove_unused_css_rules(css, unused), "#side {\n  width: 20%;\n}\n");
}

TEST(JsPruneTest, EmptyUnusedSetIsNoOp) {
  std::string js = "function a() {}\nvar b = 1;\n";
  EXPECT_EQ(remove_unused_js_code(js, names()), js);
  EXPECT_EQ(remove_unused_js_code(js, identifier_set()), js);
}

TEST(JsPruneTest, DeclarationLine) {
  EXPECT_TRUE(is_js_declaration_line("function foo() {", "foo"));
  EXPECT_TRUE(is_js_declaration_line("  function foo (a, b) {", "foo"));
  EXPECT_TRUE(is_js_declaration_line("\tconst foo=1;", "foo"));
  EXPECT_TRUE(is_js_declaration_line("let foo;", "foo"));
  EXPECT_FALSE(is_js_declaration_line("var foo, bar;", "foo"));
  EXPECT_FALSE(is_js_declaration_line("foo();", "foo"));
  EXPECT_FALSE(is_js_declaration_line("var foobar = 2;", "foo"));
  EXPECT_FALSE(is_js_declaration_line("x = function foo() {}", "foo"));
}

TEST(JsPruneTest, RemovesUnusedFunctionLine) {
  std::string js = "function used(){}\nfunction unused(){}\nused();";
  identifier_set unused = { identifier("unused") };
  EXPECT_EQ(remove_unused_js_code(js, unused), "function used(){}\nused();");
}

TEST(JsPruneTest, RemovesVariableDeclarations) {
  std::string js = "var a = 1;\n  let b;\nconst c = 3;\nconsole.log(c);";
  EXPECT_EQ(remove_unused_js_code(js, names({"a", "b"})), "const c = 3;\nconsole.log(c);");
}

TEST(JsPruneTest, MultiLineFunctionKeepsBody) {
  std::string js = "function old() {\n  return 1;\n}\nrun();";
  EXPECT_EQ(remove_unused_js_code(js, names({"old"})), "  return 1;\n}\nrun();");
}

TEST(JsPruneTest, SpecialCharactersInName) {
  std::string js = "var $el = 1;\nvar el = 2;";
  EXPECT_EQ(remove_unused_js_code(js, names({"$el"})), "var el = 2;");
}
