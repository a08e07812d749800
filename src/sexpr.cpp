#include "sexpr.h"
#include "errors.h"
#include "utils.h"

#include <cctype>
#include <cmath>
#include <cstdlib>

namespace kicadfile {

static bool is_ws(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

static bool looks_numeric(const std::string& s) {
    size_t i = 0, n = s.size();
    if (i < n && (s[i] == '+' || s[i] == '-')) i++;
    size_t digits = 0;
    while (i < n && std::isdigit((unsigned char)s[i])) { i++; digits++; }
    if (i < n && s[i] == '.') {
        i++;
        while (i < n && std::isdigit((unsigned char)s[i])) { i++; digits++; }
    }
    if (digits == 0) return false;
    if (i < n && (s[i] == 'e' || s[i] == 'E')) {
        i++;
        if (i < n && (s[i] == '+' || s[i] == '-')) i++;
        size_t exp_digits = 0;
        while (i < n && std::isdigit((unsigned char)s[i])) { i++; exp_digits++; }
        if (exp_digits == 0) return false;
    }
    return i == n;
}

static std::string unescape(const std::string& raw) {
    // raw includes the surrounding quotes
    std::string out;
    if (raw.size() < 2) return out;
    out.reserve(raw.size() - 2);
    for (size_t i = 1; i + 1 < raw.size(); i++) {
        char c = raw[i];
        if (c == '\\' && i + 2 < raw.size()) {
            char e = raw[++i];
            switch (e) {
                case 'n': out += '\n'; break;
                case 't': out += '\t'; break;
                case 'r': out += '\r'; break;
                default:  out += e; break;
            }
        } else {
            out += c;
        }
    }
    return out;
}

// Re-home the indentation that follows each newline in a whitespace run
static std::string shift_ws(const std::string& ws, const std::string& from,
                            const std::string& to) {
    if (ws.find('\n') == std::string::npos) return ws;
    std::string out;
    size_t i = 0;
    while (i < ws.size()) {
        char c = ws[i++];
        out += c;
        if (c == '\n') {
            if (ws.compare(i, from.size(), from) == 0) i += from.size();
            out += to;
        }
    }
    return out;
}

std::string number_text(double v) {
    return fmt(v);
}

// ── Construction ────────────────────────────────────────────────────

SExpr SExpr::symbol(const std::string& name) {
    SExpr e;
    e.kind_ = Kind::Symbol;
    e.text_ = name;
    return e;
}

SExpr SExpr::string(const std::string& value) {
    SExpr e;
    e.kind_ = Kind::String;
    e.text_ = sq(value);
    return e;
}

SExpr SExpr::number(double value) {
    SExpr e;
    e.kind_ = Kind::Number;
    e.text_ = number_text(value);
    return e;
}

SExpr SExpr::list(const std::vector<SExpr>& items) {
    SExpr e;
    e.kind_ = Kind::List;
    e.children_ = items;
    for (size_t i = 0; i < e.children_.size(); i++)
        e.children_[i].lead_ = i == 0 ? "" : " ";
    return e;
}

// ── Access ──────────────────────────────────────────────────────────

std::string SExpr::value() const {
    if (kind_ == Kind::String) return unescape(text_);
    if (kind_ == Kind::List) return "";
    return text_;
}

double SExpr::num(double default_val) const {
    if (kind_ == Kind::List) return default_val;
    return parse_double(value(), default_val);
}

std::string SExpr::tag() const {
    if (kind_ != Kind::List || children_.empty()) return "";
    if (children_[0].kind_ != Kind::Symbol) return "";
    return children_[0].text_;
}

const SExpr* SExpr::find(const std::string& t) const {
    for (auto& c : children_)
        if (c.is(t)) return &c;
    return nullptr;
}

SExpr* SExpr::find(const std::string& t) {
    for (auto& c : children_)
        if (c.is(t)) return &c;
    return nullptr;
}

std::vector<const SExpr*> SExpr::find_all(const std::string& t) const {
    std::vector<const SExpr*> out;
    for (auto& c : children_)
        if (c.is(t)) out.push_back(&c);
    return out;
}

std::vector<SExpr*> SExpr::find_all(const std::string& t) {
    std::vector<SExpr*> out;
    for (auto& c : children_)
        if (c.is(t)) out.push_back(&c);
    return out;
}

int SExpr::index_of(const std::string& t) const {
    for (size_t i = 0; i < children_.size(); i++)
        if (children_[i].is(t)) return static_cast<int>(i);
    return -1;
}

std::string SExpr::str_at(size_t i, const std::string& default_val) const {
    if (i >= children_.size() || children_[i].is_list()) return default_val;
    return children_[i].value();
}

double SExpr::num_at(size_t i, double default_val) const {
    if (i >= children_.size()) return default_val;
    return children_[i].num(default_val);
}

std::string SExpr::child_str(const std::string& t, const std::string& default_val) const {
    const SExpr* c = find(t);
    return c ? c->str_at(1, default_val) : default_val;
}

double SExpr::child_num(const std::string& t, double default_val) const {
    const SExpr* c = find(t);
    return c ? c->num_at(1, default_val) : default_val;
}

bool SExpr::child_flag(const std::string& t, bool default_val) const {
    const SExpr* c = find(t);
    if (!c) return default_val;
    if (c->size() < 2) return true;
    return parse_bool(c->str_at(1), default_val);
}

// ── Editing ─────────────────────────────────────────────────────────

void SExpr::set_atom(size_t i, const SExpr& atom) {
    SExpr& slot = children_.at(i);
    std::string lead = slot.lead_;
    slot = atom;
    slot.lead_ = lead;
}

SExpr& SExpr::insert(size_t index, SExpr child) {
    if (index > children_.size()) index = children_.size();

    if (child.is_atom()) {
        child.lead_ = index == 0 ? "" : " ";
        children_.insert(children_.begin() + index, std::move(child));
        return children_[index];
    }

    // Indent like the nearest sibling list that starts on its own line
    const SExpr* ref = nullptr;
    for (size_t i = index; i-- > 0;) {
        if (children_[i].is_list() && children_[i].lead_.find('\n') != std::string::npos) {
            ref = &children_[i];
            break;
        }
    }
    if (!ref) {
        for (size_t i = index; i < children_.size(); i++) {
            if (children_[i].is_list() && children_[i].lead_.find('\n') != std::string::npos) {
                ref = &children_[i];
                break;
            }
        }
    }

    if (ref) {
        child.reindent(ref->indent());
    } else {
        bool has_list_child = false;
        for (auto& c : children_)
            if (c.is_list()) has_list_child = true;
        if (has_list_child) {
            // Single-line list: stay on one line
            child.lead_ = " ";
        } else {
            std::string own = indent();
            child.reindent(own + "\t");
            if (tail_.find('\n') == std::string::npos) tail_ = "\n" + own;
        }
    }

    children_.insert(children_.begin() + index, std::move(child));
    return children_[index];
}

void SExpr::remove(size_t index) {
    if (index < children_.size()) children_.erase(children_.begin() + index);
}

void SExpr::set_child_atom(const std::string& t, const SExpr& value) {
    SExpr* c = find(t);
    if (c) {
        if (c->size() >= 2) c->set_atom(1, value);
        else c->append(value);
        return;
    }
    append(SExpr::list({SExpr::symbol(t), value}));
}

std::string SExpr::indent() const {
    auto nl = lead_.rfind('\n');
    if (nl == std::string::npos) return "";
    return lead_.substr(nl + 1);
}

void SExpr::shift_indent(const std::string& from, const std::string& to) {
    for (auto& c : children_) {
        c.lead_ = shift_ws(c.lead_, from, to);
        c.shift_indent(from, to);
    }
    tail_ = shift_ws(tail_, from, to);
}

void SExpr::reindent(const std::string& new_indent) {
    shift_indent(indent(), new_indent);
    lead_ = "\n" + new_indent;
}

bool SExpr::operator==(const SExpr& o) const {
    if (is_list() != o.is_list()) return false;
    if (is_list()) {
        if (children_.size() != o.children_.size()) return false;
        for (size_t i = 0; i < children_.size(); i++)
            if (children_[i] != o.children_[i]) return false;
        return true;
    }
    if (kind_ == Kind::Number && o.kind_ == Kind::Number)
        return std::fabs(num() - o.num()) < 1e-9;
    if ((kind_ == Kind::Number) != (o.kind_ == Kind::Number)) return false;
    return value() == o.value();
}

// ── Parser ──────────────────────────────────────────────────────────

class SExprParser {
public:
    explicit SExprParser(const std::string& text) : text_(text) {}

    static void strip(SExpr& node) {
        node.lead_.clear();
        node.trail_.clear();
    }

    SExpr parse() {
        std::vector<SExpr> stack;
        std::string ws;
        bool have_root = false;
        SExpr root;

        size_t i = 0, n = text_.size();
        while (i < n) {
            char c = text_[i];
            if (is_ws(c)) {
                ws += c;
                i++;
                continue;
            }
            if (have_root)
                fail("unexpected content after the root expression", i);

            if (c == '(') {
                SExpr node;
                node.kind_ = SExpr::Kind::List;
                node.lead_ = std::move(ws);
                node.offset_ = i;
                ws.clear();
                stack.push_back(std::move(node));
                i++;
            } else if (c == ')') {
                if (stack.empty()) fail("unexpected ')'", i);
                SExpr node = std::move(stack.back());
                stack.pop_back();
                node.tail_ = std::move(ws);
                ws.clear();
                i++;
                if (stack.empty()) {
                    root = std::move(node);
                    have_root = true;
                } else {
                    stack.back().children_.push_back(std::move(node));
                }
            } else {
                if (stack.empty()) fail("expected '('", i);
                SExpr atom;
                atom.offset_ = i;
                atom.lead_ = std::move(ws);
                ws.clear();
                if (c == '"') {
                    size_t start = i++;
                    bool closed = false;
                    while (i < n) {
                        if (text_[i] == '\\' && i + 1 < n) { i += 2; continue; }
                        if (text_[i] == '"') { closed = true; i++; break; }
                        i++;
                    }
                    if (!closed) fail("unterminated string", start);
                    atom.kind_ = SExpr::Kind::String;
                    atom.text_ = text_.substr(start, i - start);
                } else {
                    size_t start = i;
                    while (i < n && !is_ws(text_[i]) && text_[i] != '(' &&
                           text_[i] != ')' && text_[i] != '"')
                        i++;
                    atom.text_ = text_.substr(start, i - start);
                    atom.kind_ = looks_numeric(atom.text_) ? SExpr::Kind::Number
                                                           : SExpr::Kind::Symbol;
                }
                stack.back().children_.push_back(std::move(atom));
            }
        }

        if (!stack.empty()) fail("unmatched '('", stack.back().offset_);
        if (!have_root) fail("empty document", n);
        root.trail_ = std::move(ws);
        return root;
    }

private:
    const std::string& text_;

    [[noreturn]] void fail(const std::string& msg, size_t offset) const {
        int line = 1, col = 1;
        for (size_t k = 0; k < offset && k < text_.size(); k++) {
            if (text_[k] == '\n') { line++; col = 1; }
            else col++;
        }
        throw ParseError(msg, offset, line, col);
    }
};

SExpr parse_sexpr(const std::string& text) {
    return SExprParser(text).parse();
}

SExpr parse_snippet(const std::string& text) {
    SExpr node = SExprParser(text).parse();
    SExprParser::strip(node);
    return node;
}

// ── Serializer ──────────────────────────────────────────────────────

void write_node(std::string& out, const SExpr& node, bool with_lead) {
    if (with_lead) out += node.lead_;
    if (node.is_atom()) {
        out += node.text_;
        return;
    }
    out += '(';
    for (auto& c : node.children_) write_node(out, c, true);
    out += node.tail_;
    out += ')';
}

std::string serialize(const SExpr& root) {
    std::string out;
    write_node(out, root, true);
    out += root.trail_;
    return out;
}

std::string to_text(const SExpr& node) {
    std::string out;
    write_node(out, node, false);
    return out;
}

} // namespace kicadfile
