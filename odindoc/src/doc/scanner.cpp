//! # Declaration Scanner Implementation

#include "doc/scanner.hpp"

#include "log/log.hpp"

#include <algorithm>
#include <array>
#include <fstream>
#include <sstream>
#include <utility>

namespace odindoc::doc {

namespace {

constexpr std::string_view BINDING_OPERATOR = "::";

/// Leading tokens that select a declaration kind, tried in order.
constexpr std::array<std::pair<std::string_view, DeclKind>, 5> KIND_TABLE = {{
    {"proc", DeclKind::Procedure},
    {"struct", DeclKind::Struct},
    {"enum", DeclKind::Enum},
    {"union", DeclKind::Union},
    {"bit_set", DeclKind::BitSet},
}};

/// Procedure-only directives that may precede `proc`.
constexpr std::array<std::string_view, 2> PROC_DIRECTIVES = {"#force_inline", "#force_no_inline"};

/// Trims spaces and tabs from both ends.
auto trim(std::string_view s) -> std::string_view {
    auto start = s.find_first_not_of(" \t\r\n\f\v");
    if (start == std::string_view::npos) {
        return {};
    }
    auto end = s.find_last_not_of(" \t\r\n\f\v");
    return s.substr(start, end - start + 1);
}

auto is_ident_char(char c) -> bool {
    auto u = static_cast<unsigned char>(c);
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
           c == '_' || u >= 0x80;
}

/// Identifier check; non-ASCII bytes are accepted as letters.
auto is_identifier(std::string_view s) -> bool {
    if (s.empty() || (s.front() >= '0' && s.front() <= '9')) {
        return false;
    }
    for (char c : s) {
        if (!is_ident_char(c)) {
            return false;
        }
    }
    return true;
}

/// Position of the first `c` outside string and rune literals.
auto find_unquoted(std::string_view s, char c) -> size_t {
    char quote = 0;
    for (size_t i = 0; i < s.size(); ++i) {
        char ch = s[i];
        if (quote != 0) {
            if (ch == '\\' && quote != '`') {
                ++i;
            } else if (ch == quote) {
                quote = 0;
            }
            continue;
        }
        if (ch == '"' || ch == '\'' || ch == '`') {
            quote = ch;
        } else if (ch == c) {
            return i;
        }
    }
    return std::string_view::npos;
}

auto is_file_private_tag(std::string_view trimmed) -> bool {
    return trimmed.starts_with("#+private") || trimmed.starts_with("//+private");
}

/// True if one element of an attribute list (`init, private="file"`) is
/// `private`, with or without a value.
auto attribute_list_is_private(std::string_view list) -> bool {
    while (!list.empty()) {
        auto comma = find_unquoted(list, ',');
        auto element = trim(list.substr(0, comma));
        if (trim(element.substr(0, element.find('='))) == "private") {
            return true;
        }
        list = comma == std::string_view::npos ? std::string_view() : list.substr(comma + 1);
    }
    return false;
}

/// Attributes at the start of a line and the code that follows them.
struct Attributes {
    bool present = false;
    bool is_private = false;
    std::string_view rest; ///< Trimmed code after the last attribute.
};

/// Reads leading `@(...)` and `@name` attributes; several may share a line.
auto read_attributes(std::string_view code) -> Attributes {
    Attributes attrs;
    auto s = trim(code);
    while (s.starts_with('@')) {
        attrs.present = true;
        s.remove_prefix(1);
        if (s.starts_with('(')) {
            auto close = find_unquoted(s, ')');
            if (attribute_list_is_private(s.substr(1, close == std::string_view::npos
                                                          ? std::string_view::npos
                                                          : close - 1))) {
                attrs.is_private = true;
            }
            s = close == std::string_view::npos ? std::string_view() : s.substr(close + 1);
        } else {
            size_t len = 0;
            while (len < s.size() && is_ident_char(s[len])) {
                ++len;
            }
            if (s.substr(0, len) == "private") {
                attrs.is_private = true;
            }
            s.remove_prefix(len);
        }
        s = trim(s);
    }
    attrs.rest = s;
    return attrs;
}

/// `Name` or `A, B`: comma-separated identifiers.
auto is_name_list(std::string_view names) -> bool {
    while (true) {
        auto comma = names.find(',');
        if (!is_identifier(trim(names.substr(0, comma)))) {
            return false;
        }
        if (comma == std::string_view::npos) {
            return true;
        }
        names.remove_prefix(comma + 1);
    }
}

/// "A ,B" -> "A, B".
auto normalize_names(std::string_view names) -> std::string {
    std::string result;
    while (true) {
        auto comma = names.find(',');
        result += trim(names.substr(0, comma));
        if (comma == std::string_view::npos) {
            return result;
        }
        result += ", ";
        names.remove_prefix(comma + 1);
    }
}

/// Splits a declaration into trimmed name and signature.
/// The name ends at the first `::`; later occurrences stay in the signature.
auto split_binding(std::string_view code) -> std::pair<std::string_view, std::string_view> {
    auto pos = code.find(BINDING_OPERATOR);
    if (pos == std::string_view::npos) {
        return {{}, {}};
    }
    auto name = trim(code.substr(0, pos));
    auto rest = trim(code.substr(pos + BINDING_OPERATOR.size()));

    // Keep only the signature: drop the body starting at the first brace.
    auto brace = find_unquoted(rest, '{');
    if (brace != std::string_view::npos) {
        rest = trim(rest.substr(0, brace));
    }
    return {name, rest};
}

auto is_binding(std::string_view code) -> bool {
    auto pos = code.find(BINDING_OPERATOR);
    return pos != std::string_view::npos && is_name_list(trim(code.substr(0, pos)));
}

/// Opening minus closing braces outside string and rune literals.
auto brace_balance(std::string_view code) -> int {
    int balance = 0;
    while (true) {
        auto pos = std::min(find_unquoted(code, '{'), find_unquoted(code, '}'));
        if (pos == std::string_view::npos) {
            return balance;
        }
        balance += code[pos] == '{' ? 1 : -1;
        code.remove_prefix(pos + 1);
    }
}

/// State carried from one line to the next while scanning a single file.
struct ScanContext {
    std::vector<std::string> pending_comment;
    bool pending_private = false;
    bool last_was_code = false;
    bool file_private = false;
    int body_depth = 0;
    uint32_t line_number = 0;

    /// Joins the pending block, dropping trailing blank segments.
    auto take_comment() -> std::string {
        while (!pending_comment.empty() && pending_comment.back().empty()) {
            pending_comment.pop_back();
        }
        std::string doc;
        for (size_t i = 0; i < pending_comment.size(); ++i) {
            if (i > 0) {
                doc += '\n';
            }
            doc += pending_comment[i];
        }
        pending_comment.clear();
        return doc;
    }
};

/// Text of a comment line without the `//` marker and one following space.
auto comment_text(std::string_view trimmed) -> std::string {
    auto text = trimmed.substr(2);
    if (!text.empty() && text.front() == ' ') {
        text.remove_prefix(1);
    }
    auto end = text.find_last_not_of(" \t\r");
    return end == std::string_view::npos ? std::string() : std::string(text.substr(0, end + 1));
}

auto make_entry(ScanContext& ctx, std::string_view code, const std::string& source_file)
    -> DocEntry {
    auto attrs = read_attributes(code);
    auto [name, signature] = split_binding(attrs.rest);

    DocEntry entry;
    entry.name = normalize_names(name);
    entry.signature = std::string(signature);
    entry.kind = classify_kind(signature);
    entry.doc = ctx.take_comment();
    entry.source_file = source_file;
    entry.source_line = ctx.line_number;
    entry.is_private = ctx.pending_private || attrs.is_private || ctx.file_private ||
                       is_private_name(entry.name);
    return entry;
}

/// A line inside a declaration body: counts braces and acts like code.
void consume_body_line(ScanContext& ctx, std::string_view line) {
    ctx.body_depth = std::max(0, ctx.body_depth + brace_balance(strip_line_comment(line)));
    ctx.pending_comment.clear();
    ctx.pending_private = false;
    ctx.last_was_code = true;
}

} // namespace

auto strip_line_comment(std::string_view line) -> std::string_view {
    size_t from = 0;
    while (from < line.size()) {
        auto slash = find_unquoted(line.substr(from), '/');
        if (slash == std::string_view::npos) {
            break;
        }
        slash += from;
        if (slash + 1 < line.size() && line[slash + 1] == '/') {
            return line.substr(0, slash);
        }
        // A lone '/' cannot open a literal, so resuming after it is safe.
        from = slash + 1;
    }
    return line;
}

auto classify_line(std::string_view line) -> LineCategory {
    auto trimmed = trim(line);

    if (is_file_private_tag(trimmed)) {
        return LineCategory::FilePrivate;
    }
    if (trimmed.starts_with("//")) {
        return LineCategory::Comment;
    }
    if (trimmed.empty()) {
        return LineCategory::Blank;
    }

    auto attrs = read_attributes(strip_line_comment(line));
    if (attrs.present && attrs.rest.empty()) {
        return attrs.is_private ? LineCategory::PrivateAttribute : LineCategory::Attribute;
    }
    if (is_binding(attrs.rest)) {
        return LineCategory::Declaration;
    }
    return LineCategory::Code;
}

auto classify_kind(std::string_view signature) -> DeclKind {
    auto sig = trim(signature);
    for (auto directive : PROC_DIRECTIVES) {
        if (sig.starts_with(directive) &&
            (sig.size() == directive.size() || !is_ident_char(sig[directive.size()]))) {
            sig = trim(sig.substr(directive.size()));
            break;
        }
    }

    for (const auto& [token, kind] : KIND_TABLE) {
        if (sig.starts_with(token) &&
            (sig.size() == token.size() || !is_ident_char(sig[token.size()]))) {
            return kind;
        }
    }
    return DeclKind::Constant;
}

auto scan_source(std::string_view text, const std::string& source_file)
    -> std::vector<DocEntry> {
    std::vector<DocEntry> entries;
    ScanContext ctx;

    size_t pos = 0;
    while (pos <= text.size()) {
        auto newline = text.find('\n', pos);
        if (newline == std::string_view::npos) {
            if (pos == text.size()) {
                break;
            }
            newline = text.size();
        }
        auto line = text.substr(pos, newline - pos);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        pos = newline + 1;
        ++ctx.line_number;

        if (ctx.body_depth > 0) {
            consume_body_line(ctx, line);
            continue;
        }

        auto category = classify_line(line);
        switch (category) {
        case LineCategory::PrivateAttribute:
            ctx.pending_private = true;
            ctx.last_was_code = false;
            break;

        case LineCategory::Attribute:
            ctx.last_was_code = false;
            break;

        case LineCategory::FilePrivate:
            ctx.file_private = true;
            ctx.pending_comment.clear();
            ctx.pending_private = false;
            ctx.last_was_code = false;
            break;

        case LineCategory::Comment:
            if (ctx.last_was_code) {
                // Trailing comment of the statement above.
                ctx.last_was_code = false;
                break;
            }
            ctx.pending_comment.push_back(comment_text(trim(line)));
            break;

        case LineCategory::Blank:
            if (!ctx.pending_comment.empty()) {
                ctx.pending_comment.emplace_back();
            }
            ctx.last_was_code = false;
            break;

        case LineCategory::Declaration: {
            auto code = strip_line_comment(line);
            auto entry = make_entry(ctx, code, source_file);
            ODINDOC_LOG_TRACE("scan", source_file << ":" << entry.source_line << ": "
                                                  << decl_kind_to_string(entry.kind) << " "
                                                  << entry.name);
            entries.push_back(std::move(entry));
            ctx.pending_private = false;
            ctx.last_was_code = false;
            ctx.body_depth = std::max(0, brace_balance(code));
            break;
        }

        case LineCategory::Code:
            if (!ctx.pending_comment.empty()) {
                ODINDOC_LOG_TRACE("scan", source_file << ":" << ctx.line_number
                                                      << ": dropping orphaned comment block");
            }
            ctx.pending_comment.clear();
            ctx.pending_private = false;
            ctx.last_was_code = true;
            break;
        }
    }

    ODINDOC_LOG_DEBUG("scan", "Scanned " << source_file << ": " << ctx.line_number << " lines, "
                                         << entries.size() << " declarations");
    return entries;
}

auto scan_file(const std::string& path) -> Result<std::vector<DocEntry>, std::string> {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return "Cannot open file: " + path;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        return "Cannot read file: " + path;
    }
    return scan_source(buffer.str(), path);
}

} // namespace odindoc::doc
