#include <strata/extraction/extraction_util.h>
#include <strata/extraction/tree_sitter_support.h>

#include <algorithm>
#include <cctype>
#include <cstring>

namespace strata::extraction::ts {

std::string SyntaxIssue::message() const {
    return std::string(missing ? "Syntax error: missing " : "Syntax error: unexpected ") +
           (missing ? nodeType : "input") + " at line " + std::to_string(line) + ", column " +
           std::to_string(column);
}

Result<SyntaxTree> SyntaxTree::parse(const TSLanguage* language, std::string_view source) {
    if (!language) {
        return Error{ErrorCode::NotSupported, "No tree-sitter language available"};
    }

    std::unique_ptr<TSParser, decltype(&ts_parser_delete)> parser(ts_parser_new(),
                                                                  ts_parser_delete);
    if (!parser) {
        return Error{ErrorCode::InternalError, "Failed to create tree-sitter parser"};
    }
    if (!ts_parser_set_language(parser.get(), language)) {
        return Error{ErrorCode::NotSupported, "Grammar ABI version is incompatible with runtime"};
    }

    TSTree* tree = ts_parser_parse_string(parser.get(), nullptr, source.data(),
                                          static_cast<uint32_t>(source.length()));
    if (!tree) {
        return Error{ErrorCode::ParseError, "Failed to parse content"};
    }
    return SyntaxTree(tree, source);
}

std::string SyntaxTree::text(TSNode node) const {
    if (ts_node_is_null(node))
        return "";

    uint32_t start_byte = ts_node_start_byte(node);
    uint32_t end_byte = ts_node_end_byte(node);

    if (start_byte >= end_byte || end_byte > source_.length())
        return "";

    return std::string(source_.substr(start_byte, end_byte - start_byte));
}

std::optional<SyntaxIssue> SyntaxTree::firstIssue() const {
    TSNode rootNode = root();
    if (!ts_node_has_error(rootNode)) {
        return std::nullopt;
    }

    TSNode bad{};
    walk(rootNode, [&](TSNode node, uint32_t) {
        if (!ts_node_is_null(bad))
            return false;
        if (ts_node_is_missing(node) || std::strcmp(ts_node_type(node), "ERROR") == 0) {
            bad = node;
            return false;
        }
        return ts_node_has_error(node);
    });
    if (ts_node_is_null(bad)) {
        bad = rootNode;
    }

    SyntaxIssue issue;
    TSPoint start = ts_node_start_point(bad);
    issue.byte = ts_node_start_byte(bad);
    issue.line = start.row + 1;
    issue.column = start.column + 1;
    issue.missing = ts_node_is_missing(bad);
    issue.nodeType = ts_node_type(bad);
    return issue;
}

std::string SyntaxTree::leadingComments(TSNode node) const {
    std::vector<std::string> comments;
    uint32_t expectedRow = ts_node_start_point(node).row;

    for (TSNode prev = ts_node_prev_named_sibling(node); !ts_node_is_null(prev);
         prev = ts_node_prev_named_sibling(prev)) {
        if (!is(prev, "comment"))
            break;
        TSPoint end = ts_node_end_point(prev);
        if (end.row + 1 != expectedRow)
            break;

        // A comment trailing code on the same line belongs to that code
        uint32_t startByte = ts_node_start_byte(prev);
        size_t lineStart = source_.rfind('\n', startByte == 0 ? 0 : startByte - 1);
        lineStart = lineStart == std::string_view::npos ? 0 : lineStart + 1;
        if (startByte > 0 && !util::trim(source_.substr(lineStart, startByte - lineStart)).empty())
            break;

        comments.push_back(text(prev));
        expectedRow = ts_node_start_point(prev).row;
    }

    std::string joined;
    for (auto it = comments.rbegin(); it != comments.rend(); ++it) {
        if (!joined.empty())
            joined += '\n';
        joined += *it;
    }
    return joined;
}

std::vector<std::string> SyntaxTree::urls(TSNode node) const {
    std::vector<std::string> out;
    walk(node, [&](TSNode n, uint32_t) {
        auto t = type(n);
        if (t == "string" || t == "template_string") {
            for (auto& url : util::findUrls(text(n))) {
                if (std::find(out.begin(), out.end(), url) == out.end())
                    out.push_back(std::move(url));
            }
            return false;
        }
        return true;
    });
    return out;
}

namespace {

class Cursor {
public:
    explicit Cursor(TSNode node) : cursor_(ts_tree_cursor_new(node)) {}
    ~Cursor() { ts_tree_cursor_delete(&cursor_); }

    Cursor(const Cursor&) = delete;
    Cursor& operator=(const Cursor&) = delete;

    TSTreeCursor* get() { return &cursor_; }

private:
    TSTreeCursor cursor_;
};

} // namespace

void walk(TSNode node, const std::function<bool(TSNode, uint32_t)>& visit) {
    if (ts_node_is_null(node))
        return;

    Cursor cursor(node);
    uint32_t depth = 0;
    bool descend = visit(node, depth);
    while (true) {
        if (descend && ts_tree_cursor_goto_first_child(cursor.get())) {
            ++depth;
        } else {
            // Next sibling, climbing until one exists; the cursor never leaves node
            while (depth == 0 || !ts_tree_cursor_goto_next_sibling(cursor.get())) {
                if (depth == 0 || !ts_tree_cursor_goto_parent(cursor.get()))
                    return;
                --depth;
            }
        }
        descend = visit(ts_tree_cursor_current_node(cursor.get()), depth);
    }
}

bool deeperThan(TSNode node, uint32_t maxDepth) {
    bool exceeded = false;
    walk(node, [&](TSNode, uint32_t depth) {
        if (depth > maxDepth)
            exceeded = true;
        return !exceeded;
    });
    return exceeded;
}

std::optional<ParsedSource> parseSource(const TSLanguage* language, std::string_view source,
                                        TraversalContext& ctx, std::string_view label) {
    auto prefixed = [&](const std::string& message) {
        return label.empty() ? message : std::string(label) + ": " + message;
    };

    auto parsed = SyntaxTree::parse(language, source);
    if (!parsed) {
        if (label.empty()) {
            ctx.parseFailure(parsed.error().message);
        } else {
            ctx.addError(prefixed(parsed.error().message));
        }
        return std::nullopt;
    }

    if (deeperThan(parsed.value().root(), kMaxTreeDepth)) {
        std::string message =
            "Syntax tree nesting exceeds " + std::to_string(kMaxTreeDepth) + " levels";
        if (label.empty()) {
            ctx.parseFailure(message);
        } else {
            ctx.addError(prefixed(message));
        }
        return std::nullopt;
    }

    ParsedSource out{std::move(parsed).value(), UINT32_MAX};
    if (auto issue = out.tree.firstIssue()) {
        ctx.addError(prefixed(issue->message()));
        out.limit = issue->byte;
    }
    return std::optional<ParsedSource>(std::move(out));
}

std::string_view type(TSNode node) {
    if (ts_node_is_null(node))
        return {};
    return ts_node_type(node);
}

bool is(TSNode node, std::string_view nodeType) {
    return !ts_node_is_null(node) && type(node) == nodeType;
}

TSNode field(TSNode node, std::string_view name) {
    if (ts_node_is_null(node))
        return TSNode{};
    return ts_node_child_by_field_name(node, name.data(), static_cast<uint32_t>(name.size()));
}

std::size_t line(TSNode node) {
    return static_cast<std::size_t>(ts_node_start_point(node).row) + 1;
}

std::vector<TSNode> namedChildren(TSNode node) {
    std::vector<TSNode> out;
    if (ts_node_is_null(node))
        return out;
    uint32_t child_count = ts_node_named_child_count(node);
    out.reserve(child_count);
    for (uint32_t i = 0; i < child_count; ++i) {
        out.push_back(ts_node_named_child(node, i));
    }
    return out;
}

bool hasToken(TSNode node, std::string_view token) {
    uint32_t child_count = ts_node_child_count(node);
    for (uint32_t i = 0; i < child_count; ++i) {
        TSNode child = ts_node_child(node, i);
        if (!ts_node_is_named(child) && type(child) == token)
            return true;
    }
    return false;
}

std::string unquote(std::string_view literal) {
    size_t prefix = 0;
    while (prefix < literal.size() && std::isalpha(static_cast<unsigned char>(literal[prefix])))
        ++prefix;
    literal.remove_prefix(prefix);

    for (std::string_view q : {"\"\"\"", "'''", "\"", "'", "`"}) {
        if (literal.size() >= 2 * q.size() && literal.substr(0, q.size()) == q &&
            literal.substr(literal.size() - q.size()) == q) {
            return std::string(literal.substr(q.size(), literal.size() - 2 * q.size()));
        }
    }
    return std::string(literal);
}

} // namespace strata::extraction::ts
