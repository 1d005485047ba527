#include "policy/global_policy.h"

#include <cctype>
#include <cstdint>
#include <limits>
#include <unordered_set>

namespace widget_script {

namespace {

// Keywords after which a '/' starts a regular expression literal
const std::unordered_set<std::string_view> kRegexPrefixKeywords = {
    "return", "typeof", "case", "do", "else", "in", "instanceof",
    "new", "delete", "void", "throw", "yield", "await", "of"};

// Words that look like identifiers but never name a global binding
const std::unordered_set<std::string_view> kReservedWords = {
    "break", "case", "catch", "class", "const", "continue", "debugger", "default",
    "delete", "do", "else", "export", "extends", "finally", "for", "function", "if",
    "import", "in", "instanceof", "new", "return", "super", "switch", "this", "throw",
    "try", "typeof", "var", "void", "while", "with", "yield", "let", "static", "await",
    "async", "of", "get", "set", "true", "false", "null", "arguments", "enum",
    "implements", "interface", "package", "private", "protected", "public"};

constexpr size_t kNoRef = std::numeric_limits<size_t>::max();

bool IsIdentStart(unsigned char c) {
  return std::isalpha(c) || c == '_' || c == '$' || c == '\\' || c >= 0x80;
}

bool IsIdentPart(unsigned char c) {
  return std::isalnum(c) || c == '_' || c == '$' || c == '\\' || c >= 0x80;
}

int HexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

/**
 * Minimal JavaScript tokenizer that only tracks what is needed to find
 * binding references and the names the source declares: the previous
 * significant token, bracket nesting and declaration lists.
 *
 * Declarations are collected without regard to scope, and generously:
 * every identifier inside a destructuring pattern or a parameter list
 * counts as declared.
 */
class RefScanner {
 public:
  explicit RefScanner(std::string_view src) : src_(src) {}

  SourceScan Run() {
    while (pos_ < src_.size()) {
      char c = src_[pos_];

      if (c == '\n' || c == ' ' || c == '\t' || c == '\r' || c == '\f' || c == '\v') {
        Advance();
        continue;
      }
      if (c == '/' && Peek(1) == '/') {
        SkipLineComment();
        continue;
      }
      if (c == '/' && Peek(1) == '*') {
        SkipBlockComment();
        continue;
      }
      if (c == '\'' || c == '"') {
        SkipString(c);
        SetPrev(Prev::kValue);
        continue;
      }
      if (c == '`') {
        Advance();
        ScanTemplateText();
        continue;
      }
      if (std::isdigit(static_cast<unsigned char>(c)) ||
          (c == '.' && std::isdigit(static_cast<unsigned char>(Peek(1))))) {
        SkipNumber();
        SetPrev(Prev::kValue);
        continue;
      }
      if (c == '#') {
        // Private name: #field
        Advance();
        ReadIdentifier();
        SetPrev(Prev::kValue);
        continue;
      }
      if (IsIdentStart(static_cast<unsigned char>(c))) {
        HandleIdentifier();
        continue;
      }
      if (c == '/') {
        if (RegexAllowed()) {
          SkipRegex();
          SetPrev(Prev::kValue);
        } else {
          Advance();
          SetPunct("/");
        }
        continue;
      }
      HandlePunctuator();
    }

    SourceScan scan;
    scan.refs = std::move(refs_);
    scan.declared = std::move(declared_);
    scan.unmatched = unmatched_;
    return scan;
  }

 private:
  enum class Prev { kNone, kValue, kIdent, kKeywordRegex, kPunct };

  // An open '(', '[', '{' or a template substitution ('`')
  struct Frame {
    char open = 0;
    size_t first_ref = 0;        // refs_ size when the frame opened
    size_t callee_ref = kNoRef;  // identifier right before '('
    bool binding_list = false;   // '(' that may hold parameters
    bool class_body = false;
  };

  std::string_view src_;
  size_t pos_ = 0;
  int line_ = 1;
  int column_ = 1;

  Prev prev_ = Prev::kNone;
  std::string prev_punct_;
  std::string prev_ident_;
  size_t last_ident_ref_ = kNoRef;  // refs_ index of the previous token
  bool paren_closed_ = false;       // previous token closed a '('
  size_t paren_first_ = 0;
  size_t paren_end_ = 0;

  std::vector<Frame> nest_;
  int decl_level_ = -1;     // nesting level of the open var/let/const list
  int pattern_level_ = -1;  // nesting level a destructuring pattern opened at
  int class_level_ = -1;    // nesting level of a class heading awaiting its body
  bool expect_binding_ = false;

  std::vector<IdentifierRef> refs_;
  std::set<std::string, std::less<>> declared_;
  std::optional<UnmatchedCloser> unmatched_;

  char Peek(size_t offset) const {
    return pos_ + offset < src_.size() ? src_[pos_ + offset] : '\0';
  }

  void Advance() {
    if (src_[pos_] == '\n') {
      ++line_;
      column_ = 1;
    } else {
      ++column_;
    }
    ++pos_;
  }

  int Level() const { return static_cast<int>(nest_.size()); }

  void SetPrev(Prev p) {
    prev_ = p;
    prev_punct_.clear();
    last_ident_ref_ = kNoRef;
    paren_closed_ = false;
  }

  void SetPunct(std::string punct) {
    prev_ = Prev::kPunct;
    prev_punct_ = std::move(punct);
    last_ident_ref_ = kNoRef;
    paren_closed_ = false;
  }

  void DeclareRange(size_t first, size_t end) {
    for (size_t i = first; i < end && i < refs_.size(); ++i) {
      declared_.insert(refs_[i].name);
    }
  }

  bool RegexAllowed() const {
    switch (prev_) {
      case Prev::kNone:
      case Prev::kKeywordRegex:
        return true;
      case Prev::kValue:
      case Prev::kIdent:
        return false;
      case Prev::kPunct:
        return prev_punct_ != ")" && prev_punct_ != "]" && prev_punct_ != "}";
    }
    return true;
  }

  void SkipLineComment() {
    while (pos_ < src_.size() && src_[pos_] != '\n') Advance();
  }

  void SkipBlockComment() {
    Advance();
    Advance();
    while (pos_ < src_.size()) {
      if (src_[pos_] == '*' && Peek(1) == '/') {
        Advance();
        Advance();
        return;
      }
      Advance();
    }
  }

  void SkipString(char quote) {
    Advance();
    while (pos_ < src_.size()) {
      char c = src_[pos_];
      if (c == '\\') {
        Advance();
        if (pos_ < src_.size()) Advance();
        continue;
      }
      if (c == quote || c == '\n') {
        Advance();
        return;
      }
      Advance();
    }
  }

  // Scan template text up to the closing backtick or the next ${
  void ScanTemplateText() {
    while (pos_ < src_.size()) {
      char c = src_[pos_];
      if (c == '\\') {
        Advance();
        if (pos_ < src_.size()) Advance();
        continue;
      }
      if (c == '`') {
        Advance();
        SetPrev(Prev::kValue);
        return;
      }
      if (c == '$' && Peek(1) == '{') {
        Advance();
        Advance();
        Frame frame;
        frame.open = '`';
        frame.first_ref = refs_.size();
        nest_.push_back(frame);
        SetPunct("${");
        return;
      }
      Advance();
    }
  }

  void SkipNumber() {
    while (pos_ < src_.size()) {
      unsigned char c = static_cast<unsigned char>(src_[pos_]);
      if (std::isalnum(c) || c == '.' || c == '_') {
        Advance();
      } else {
        break;
      }
    }
  }

  void SkipRegex() {
    Advance();
    bool in_class = false;
    while (pos_ < src_.size()) {
      char c = src_[pos_];
      if (c == '\n') break;
      if (c == '\\') {
        Advance();
        if (pos_ < src_.size()) Advance();
        continue;
      }
      if (c == '[') in_class = true;
      else if (c == ']') in_class = false;
      else if (c == '/' && !in_class) {
        Advance();
        break;
      }
      Advance();
    }
    // flags
    while (pos_ < src_.size() && std::isalpha(static_cast<unsigned char>(src_[pos_]))) {
      Advance();
    }
  }

  // Decode one \uXXXX or \u{X..} escape; appends the ASCII char or a marker
  void ReadUnicodeEscape(std::string* out) {
    Advance();  // backslash
    if (Peek(0) != 'u') {
      out->push_back('\x01');
      return;
    }
    Advance();
    uint32_t cp = 0;
    if (Peek(0) == '{') {
      Advance();
      while (pos_ < src_.size() && src_[pos_] != '}') {
        int h = HexValue(src_[pos_]);
        if (h < 0) break;
        cp = cp * 16 + static_cast<uint32_t>(h);
        Advance();
      }
      if (Peek(0) == '}') Advance();
    } else {
      for (int i = 0; i < 4 && pos_ < src_.size(); ++i) {
        int h = HexValue(src_[pos_]);
        if (h < 0) break;
        cp = cp * 16 + static_cast<uint32_t>(h);
        Advance();
      }
    }
    out->push_back(cp < 0x80 ? static_cast<char>(cp) : '\x01');
  }

  std::string ReadIdentifier() {
    std::string name;
    while (pos_ < src_.size() && IsIdentPart(static_cast<unsigned char>(src_[pos_]))) {
      if (src_[pos_] == '\\') {
        ReadUnicodeEscape(&name);
      } else {
        name.push_back(src_[pos_]);
        Advance();
      }
    }
    return name;
  }

  // Next non-space, non-comment character without consuming anything
  char PeekSignificant() const {
    size_t p = pos_;
    while (p < src_.size()) {
      char c = src_[p];
      if (std::isspace(static_cast<unsigned char>(c))) {
        ++p;
      } else if (c == '/' && p + 1 < src_.size() && src_[p + 1] == '/') {
        while (p < src_.size() && src_[p] != '\n') ++p;
      } else if (c == '/' && p + 1 < src_.size() && src_[p + 1] == '*') {
        size_t end = src_.find("*/", p + 2);
        p = end == std::string_view::npos ? src_.size() : end + 2;
      } else {
        return c;
      }
    }
    return '\0';
  }

  void HandleIdentifier() {
    int line = line_;
    int column = column_;
    bool after_dot = prev_ == Prev::kPunct && (prev_punct_ == "." || prev_punct_ == "?.");
    bool after_key_start = prev_ == Prev::kPunct && (prev_punct_ == "{" || prev_punct_ == ",");
    bool statement_start = prev_ == Prev::kNone ||
                           (prev_ == Prev::kPunct && (prev_punct_ == ";" || prev_punct_ == "}"));
    bool in_class_body = !nest_.empty() && nest_.back().class_body;
    std::string name = ReadIdentifier();

    bool before_colon = PeekSignificant() == ':';
    bool object_key = after_key_start && before_colon;
    bool label = statement_start && before_colon;

    size_t ref_index = kNoRef;
    if (!after_dot && !object_key && !label && !in_class_body && !name.empty()) {
      ref_index = refs_.size();
      refs_.push_back({name, line, column});
    }

    if (!after_dot && !name.empty()) {
      bool reserved = IsReservedWord(name);
      if (label) {
        declared_.insert(name);
      }
      if (expect_binding_ && !reserved) {
        declared_.insert(name);
        expect_binding_ = false;
      } else if (pattern_level_ >= 0 && Level() > pattern_level_) {
        declared_.insert(name);
      }

      if (name == "var" || name == "let" || name == "const") {
        decl_level_ = Level();
        expect_binding_ = true;
      } else if (name == "function") {
        expect_binding_ = true;
      } else if (name == "class") {
        expect_binding_ = true;
        class_level_ = Level();
      }
    }

    if (!after_dot && kRegexPrefixKeywords.count(name)) {
      SetPrev(Prev::kKeywordRegex);
    } else {
      SetPrev(Prev::kIdent);
      if (!IsReservedWord(name)) {
        last_ident_ref_ = ref_index;
      }
    }
    prev_ident_ = std::move(name);
  }

  void OpenFrame(char open) {
    Frame frame;
    frame.open = open;
    frame.first_ref = refs_.size();

    if (open == '(') {
      bool named = prev_ == Prev::kIdent &&
                   (prev_ident_ == "function" || prev_ident_ == "catch" ||
                    !IsReservedWord(prev_ident_));
      frame.binding_list = named || expect_binding_;
      frame.callee_ref = last_ident_ref_;
      expect_binding_ = false;
    } else if (open == '{' && class_level_ == Level()) {
      frame.class_body = true;
      class_level_ = -1;
      expect_binding_ = false;
    } else if (expect_binding_) {
      // const { a, b: [c] } = ...
      pattern_level_ = Level();
      expect_binding_ = false;
    }

    nest_.push_back(frame);
    Advance();
    SetPunct(std::string(1, open));
  }

  void CloseFrame(char close) {
    char want = close == ')' ? '(' : (close == ']' ? '[' : '{');
    bool template_end = close == '}' && !nest_.empty() && nest_.back().open == '`';
    if (nest_.empty() || (nest_.back().open != want && !template_end)) {
      if (!unmatched_) {
        unmatched_ = UnmatchedCloser{close, line_, column_};
      }
      Advance();
      SetPunct(std::string(1, close));
      return;
    }

    Frame frame = nest_.back();
    nest_.pop_back();
    Advance();
    if (pattern_level_ == Level()) pattern_level_ = -1;
    if (decl_level_ > Level()) decl_level_ = -1;
    if (class_level_ > Level()) class_level_ = -1;

    if (template_end) {
      ScanTemplateText();
      return;
    }

    SetPunct(std::string(1, close));
    if (close == ')') {
      // name(a, b) { ... }: a method, function or catch parameter list
      if (frame.binding_list && PeekSignificant() == '{') {
        DeclareRange(frame.first_ref, refs_.size());
        if (frame.callee_ref != kNoRef) {
          declared_.insert(refs_[frame.callee_ref].name);
        }
      }
      paren_closed_ = true;
      paren_first_ = frame.first_ref;
      paren_end_ = refs_.size();
    }
  }

  void HandlePunctuator() {
    char c = src_[pos_];
    if (c == '.') {
      if (Peek(1) == '.' && Peek(2) == '.') {
        Advance();
        Advance();
        Advance();
        SetPunct("...");
      } else {
        Advance();
        SetPunct(".");
      }
      expect_binding_ = false;
      return;
    }
    if (c == '?' && Peek(1) == '.' && !std::isdigit(static_cast<unsigned char>(Peek(2)))) {
      Advance();
      Advance();
      SetPunct("?.");
      expect_binding_ = false;
      return;
    }
    if (c == '=' && Peek(1) == '>') {
      // Arrow parameters: x => ... or (a, b) => ...
      if (paren_closed_) {
        DeclareRange(paren_first_, paren_end_);
      } else if (last_ident_ref_ != kNoRef) {
        declared_.insert(refs_[last_ident_ref_].name);
      }
      Advance();
      Advance();
      SetPunct("=>");
      expect_binding_ = false;
      return;
    }
    if (c == '(' || c == '[' || c == '{') {
      OpenFrame(c);
      return;
    }
    if (c == ')' || c == ']' || c == '}') {
      CloseFrame(c);
      return;
    }

    Advance();
    SetPunct(std::string(1, c));
    if (c == ';') {
      if (decl_level_ >= Level()) decl_level_ = -1;
      expect_binding_ = false;
    } else if (c == ',') {
      if (decl_level_ == Level()) expect_binding_ = true;
    } else if (c != '*') {
      // '*' keeps a pending function name: function* gen()
      expect_binding_ = false;
    }
  }
};

}  // namespace

bool IsReservedWord(std::string_view name) {
  return kReservedWords.count(name) > 0;
}

SourceScan ScanSource(std::string_view source) {
  return RefScanner(source).Run();
}

std::vector<IdentifierRef> ScanIdentifierRefs(std::string_view source) {
  return ScanSource(source).refs;
}

const std::set<std::string, std::less<>>& GlobalSurfacePolicy::BaselineIntrinsics() {
  static const std::set<std::string, std::less<>> kBaseline = {
      "undefined", "NaN", "Infinity", "Boolean",
      "Error", "TypeError", "RangeError", "ReferenceError", "SyntaxError", "URIError",
      "parseInt", "parseFloat", "isNaN", "isFinite"};
  return kBaseline;
}

GlobalSurfacePolicy::GlobalSurfacePolicy(const RuntimeOptions& options)
    : allowed_(options.allowed_globals.begin(), options.allowed_globals.end()),
      forbidden_(options.forbidden_globals.begin(), options.forbidden_globals.end()) {}

bool GlobalSurfacePolicy::IsForbidden(std::string_view name) const {
  return forbidden_.find(name) != forbidden_.end();
}

bool GlobalSurfacePolicy::IsReachable(std::string_view name) const {
  if (IsForbidden(name)) {
    return false;
  }
  const auto& baseline = BaselineIntrinsics();
  return allowed_.find(name) != allowed_.end() || baseline.find(name) != baseline.end();
}

std::optional<PolicyViolation> GlobalSurfacePolicy::Check(const SourceScan& scan) const {
  for (const auto& ref : scan.refs) {
    if (IsForbidden(ref.name)) {
      return PolicyViolation{ref.name, ref.line, ref.column};
    }
    if (IsReservedWord(ref.name) || ref.name == kContextParamName ||
        scan.declared.count(ref.name) > 0 || IsReachable(ref.name)) {
      continue;
    }
    return PolicyViolation{ref.name, ref.line, ref.column};
  }
  return std::nullopt;
}

std::optional<PolicyViolation> GlobalSurfacePolicy::Scan(std::string_view source) const {
  return Check(ScanSource(source));
}

}  // namespace widget_script
