#pragma once

#include <string>
#include <vector>

namespace kicadfile {

// A node of a KiCad s-expression document.
//
// Atoms keep their raw token text and lists keep the whitespace found
// before each child and before the closing paren, so serializing an
// unmodified tree reproduces the input byte for byte. Edits only
// reformat the nodes they touch.
class SExpr {
public:
    enum class Kind { Symbol, String, Number, List };

    SExpr() : kind_(Kind::List) {}

    static SExpr symbol(const std::string& name);
    static SExpr string(const std::string& value);
    static SExpr number(double value);
    static SExpr list(const std::vector<SExpr>& items = {});

    Kind kind() const { return kind_; }
    bool is_list() const { return kind_ == Kind::List; }
    bool is_atom() const { return kind_ != Kind::List; }
    bool is_number() const { return kind_ == Kind::Number; }

    // Raw token text (strings keep their quotes and escapes)
    const std::string& raw() const { return text_; }
    // Decoded value: unescaped for strings, raw otherwise; empty for lists
    std::string value() const;
    double num(double default_val = 0.0) const;

    // ── List access ──

    const std::vector<SExpr>& children() const { return children_; }
    size_t size() const { return children_.size(); }
    const SExpr& operator[](size_t i) const { return children_[i]; }
    SExpr& operator[](size_t i) { return children_[i]; }

    // Leading symbol of a list, e.g. "symbol" for (symbol ...)
    std::string tag() const;
    bool is(const std::string& t) const { return is_list() && tag() == t; }

    // First direct child list with the given tag, or nullptr
    const SExpr* find(const std::string& t) const;
    SExpr* find(const std::string& t);
    std::vector<const SExpr*> find_all(const std::string& t) const;
    std::vector<SExpr*> find_all(const std::string& t);
    int index_of(const std::string& t) const;

    // Atom at position i decoded as string/number, default when absent
    std::string str_at(size_t i, const std::string& default_val = "") const;
    double num_at(size_t i, double default_val = 0.0) const;

    // Convenience for (tag value): the value of child list `t`
    std::string child_str(const std::string& t, const std::string& default_val = "") const;
    double child_num(const std::string& t, double default_val = 0.0) const;
    // True for (t) or (t yes); false for (t no) or absent
    bool child_flag(const std::string& t, bool default_val = false) const;

    // ── Editing ──

    // Replace an atom in place, keeping its leading whitespace
    void set_atom(size_t i, const SExpr& atom);
    // Insert a child, indenting it like its siblings
    SExpr& insert(size_t index, SExpr child);
    SExpr& append(SExpr child) { return insert(children_.size(), std::move(child)); }
    void remove(size_t index);
    // Set or add (t value) as a direct child
    void set_child_atom(const std::string& t, const SExpr& value);

    // Whitespace before this node
    const std::string& lead() const { return lead_; }
    void set_lead(const std::string& lead) { lead_ = lead; }
    // Indentation of this node (text after the last newline in lead)
    std::string indent() const;
    // Move this subtree to a new indentation level
    void reindent(const std::string& new_indent);

    size_t offset() const { return offset_; }

    // Formatting-insensitive structural equality. Numbers compare by
    // value, quoted and bare atoms by decoded text.
    bool operator==(const SExpr& o) const;
    bool operator!=(const SExpr& o) const { return !(*this == o); }

private:
    friend class SExprParser;
    friend void write_node(std::string& out, const SExpr& node, bool with_lead);
    friend std::string serialize(const SExpr& root);

    Kind kind_;
    std::string text_;
    std::vector<SExpr> children_;
    std::string lead_;
    std::string tail_;   // before ')' of a list
    std::string trail_;  // after the root list (document only)
    size_t offset_ = 0;

    void shift_indent(const std::string& from, const std::string& to);
};

// Parse a complete document: exactly one root list. Throws ParseError
// with line and column for unbalanced parens, unterminated strings or
// stray content.
SExpr parse_sexpr(const std::string& text);

// Parse a fragment built by code; leading/trailing whitespace dropped
SExpr parse_snippet(const std::string& text);

// Serialize a whole document (root lead, body, trailer)
std::string serialize(const SExpr& root);
// Serialize one subtree without its leading whitespace
std::string to_text(const SExpr& node);

// Encode a number the way KiCad writes coordinates
std::string number_text(double v);

} // namespace kicadfile
