#include <catch2/catch_test_macros.hpp>

#include <algorithm>

#include "policy/global_policy.h"

using namespace widget_script;

namespace {

bool HasRef(const std::vector<IdentifierRef>& refs, const std::string& name) {
  return std::any_of(refs.begin(), refs.end(),
                     [&](const IdentifierRef& r) { return r.name == name; });
}

}  // namespace

TEST_CASE("ScanIdentifierRefs", "[policy][scan]") {
  SECTION("plain references with positions") {
    auto refs = ScanIdentifierRefs("const x = 1;\n  return fetch(x);");
    REQUIRE(HasRef(refs, "fetch"));
    auto it = std::find_if(refs.begin(), refs.end(),
                           [](const IdentifierRef& r) { return r.name == "fetch"; });
    REQUIRE(it->line == 2);
    REQUIRE(it->column == 10);
  }

  SECTION("property names are not references") {
    auto refs = ScanIdentifierRefs("return context.fetch + a?.eval;");
    REQUIRE(HasRef(refs, "context"));
    REQUIRE(HasRef(refs, "a"));
    REQUIRE_FALSE(HasRef(refs, "fetch"));
    REQUIRE_FALSE(HasRef(refs, "eval"));
  }

  SECTION("object keys are not references") {
    auto refs = ScanIdentifierRefs("return { window: 1, document : 2 };");
    REQUIRE_FALSE(HasRef(refs, "window"));
    REQUIRE_FALSE(HasRef(refs, "document"));
  }

  SECTION("shorthand properties are references") {
    auto refs = ScanIdentifierRefs("return { type, fetch };");
    REQUIRE(HasRef(refs, "fetch"));
  }

  SECTION("strings and comments are skipped") {
    auto refs = ScanIdentifierRefs(
        "// fetch\n/* eval */\nreturn 'window' + \"document\" + `Function`;");
    REQUIRE_FALSE(HasRef(refs, "fetch"));
    REQUIRE_FALSE(HasRef(refs, "eval"));
    REQUIRE_FALSE(HasRef(refs, "window"));
    REQUIRE_FALSE(HasRef(refs, "document"));
    REQUIRE_FALSE(HasRef(refs, "Function"));
  }

  SECTION("template substitutions are scanned") {
    auto refs = ScanIdentifierRefs("return `a ${ {k: 1}.k } b ${fetch('x')} c`;");
    REQUIRE(HasRef(refs, "fetch"));
    REQUIRE_FALSE(HasRef(refs, "k"));
  }

  SECTION("regex literals are skipped") {
    auto refs = ScanIdentifierRefs("return /fetch|eval/.test(s);");
    REQUIRE_FALSE(HasRef(refs, "fetch"));
    REQUIRE(HasRef(refs, "s"));
  }

  SECTION("division is not a regex") {
    auto refs = ScanIdentifierRefs("const r = a / b / fetch;");
    REQUIRE(HasRef(refs, "fetch"));
  }

  SECTION("unicode escapes in identifiers") {
    auto refs = ScanIdentifierRefs("return \\u0066etch('x');");
    REQUIRE(HasRef(refs, "fetch"));
  }
}

TEST_CASE("GlobalSurfacePolicy reachability", "[policy]") {
  GlobalSurfacePolicy policy(DefaultRuntimeOptions());

  SECTION("allowed globals") {
    REQUIRE(policy.IsReachable("Math"));
    REQUIRE(policy.IsReachable("JSON"));
  }

  SECTION("baseline intrinsics") {
    REQUIRE(policy.IsReachable("Error"));
    REQUIRE(policy.IsReachable("parseInt"));
    REQUIRE(policy.IsReachable("undefined"));
  }

  SECTION("forbidden and unlisted names") {
    REQUIRE(policy.IsForbidden("eval"));
    REQUIRE_FALSE(policy.IsReachable("eval"));
    REQUIRE_FALSE(policy.IsReachable("Function"));
    REQUIRE_FALSE(policy.IsReachable("Promise"));
    REQUIRE_FALSE(policy.IsReachable("globalThis"));
  }

  SECTION("forbidden wins over allowed") {
    RuntimeOptions options = DefaultRuntimeOptions();
    options.allowed_globals.insert("eval");
    options.forbidden_globals.insert("Error");
    GlobalSurfacePolicy strict(options);
    REQUIRE_FALSE(strict.IsReachable("eval"));
    REQUIRE_FALSE(strict.IsReachable("Error"));
  }
}

TEST_CASE("GlobalSurfacePolicy Scan", "[policy][scan]") {
  GlobalSurfacePolicy policy(DefaultRuntimeOptions());

  SECTION("first forbidden reference") {
    auto v = policy.Scan("const a = 1;\nreturn fetch('http://x');");
    REQUIRE(v.has_value());
    REQUIRE(v->identifier == "fetch");
    REQUIRE(v->line == 2);
    REQUIRE(v->column == 8);
  }

  SECTION("each forbidden name") {
    for (const char* src : {"return window;", "return document.title;", "eval('1')",
                            "new XMLHttpRequest()", "Function('return 1')()"}) {
      REQUIRE(policy.Scan(src).has_value());
    }
  }

  SECTION("clean script") {
    REQUIRE_FALSE(policy.Scan("return { type: 'text', value: Math.max(1, 2) + '' };")
                      .has_value());
  }

  SECTION("unlisted names are rejected even under typeof") {
    auto v = policy.Scan("const ok = typeof Math;\nreturn typeof Symbol;");
    REQUIRE(v.has_value());
    REQUIRE(v->identifier == "Symbol");
    REQUIRE(v->line == 2);
  }

  SECTION("allowed once listed and no longer forbidden") {
    RuntimeOptions options = DefaultRuntimeOptions();
    options.forbidden_globals.clear();
    GlobalSurfacePolicy open(options);
    REQUIRE(open.Scan("return fetch('x');").has_value());

    options.allowed_globals.insert("fetch");
    GlobalSurfacePolicy listed(options);
    REQUIRE_FALSE(listed.Scan("return fetch('x');").has_value());
  }

  SECTION("declared names, keywords and the context parameter") {
    for (const char* src : {
             "const a = 1, b = a;\nreturn b;",
             "let x;\nvar y = x;",
             "function f(p, q) { return p + q; }\nreturn f(1, 2);",
             "const g = (m, n) => m * n;\nconst h = k => k;",
             "const { temp, unit = 'C' } = obj0();\nfunction obj0() { return {}; }",
             "const [head, ...tail] = [1, 2];",
             "try { null.x; } catch (err) { err; }",
             "loop: for (const i of [1]) { break loop; }",
             "class Box { constructor(v) { this.v = v; } get size() { return 1; } }",
             "const o = { area(w, h2) { return w * h2; } };",
             "function* gen(seed) { yield seed; }",
             "return typeof undefined === 'undefined' && this === undefined;",
             "return context.get('weather.temp');",
         }) {
      INFO(src);
      REQUIRE_FALSE(policy.Scan(src).has_value());
    }
  }

  SECTION("forbidden wins over a local declaration") {
    REQUIRE(policy.Scan("const fetch = 1;").has_value());
  }
}

TEST_CASE("ScanSource declarations and nesting", "[policy][scan]") {
  SECTION("declared names") {
    auto scan = ScanSource(
        "const { a, b: c } = x;\nlet d = 1, e;\nfunction f(g) { return g; }\n"
        "const h = (i) => i;\nlabel: for (;;) { break label; }");
    for (const char* name : {"a", "c", "d", "e", "f", "g", "h", "i", "label"}) {
      INFO(name);
      REQUIRE(scan.declared.count(name) == 1);
    }
    REQUIRE(scan.declared.count("x") == 0);
    REQUIRE_FALSE(scan.unmatched.has_value());
  }

  SECTION("initializers are not declarations") {
    auto scan = ScanSource("const total = Symbol;\nlet n = Promise, m = 2;");
    REQUIRE(scan.declared.count("Symbol") == 0);
    REQUIRE(scan.declared.count("Promise") == 0);
    REQUIRE(scan.declared.count("m") == 1);
  }

  SECTION("balanced source") {
    REQUIRE_FALSE(ScanSource("if (a) { b[`${ {c: [1]}.c }`]; }").unmatched.has_value());
    REQUIRE_FALSE(ScanSource("const s = '})';\n// })\nconst r = /[}]/;").unmatched.has_value());
  }

  SECTION("closer with no opener") {
    auto scan = ScanSource("return 1;\n}), (function () {");
    REQUIRE(scan.unmatched.has_value());
    REQUIRE(scan.unmatched->token == '}');
    REQUIRE(scan.unmatched->line == 2);
    REQUIRE(scan.unmatched->column == 1);
  }

  SECTION("mismatched closer") {
    auto scan = ScanSource("const a = (1 + ];");
    REQUIRE(scan.unmatched.has_value());
    REQUIRE(scan.unmatched->token == ']');
  }
}
