#pragma once

extern "C" {
#include <tree_sitter/api.h>
}

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <strata/core/types.h>
#include <strata/extraction/traversal_context.h>

extern "C" {
const TSLanguage* tree_sitter_python(void);
const TSLanguage* tree_sitter_javascript(void);
const TSLanguage* tree_sitter_bash(void);
const TSLanguage* tree_sitter_markdown(void);
const TSLanguage* tree_sitter_markdown_inline(void);
}

namespace strata::extraction::ts {

/// Trees nested deeper than this are rejected before any recursive visitor runs
constexpr uint32_t kMaxTreeDepth = 1024;

/**
 * @brief Location of the first ERROR or MISSING node in a tree
 */
struct SyntaxIssue {
    uint32_t byte = 0;
    uint32_t line = 0;   // 1-based
    uint32_t column = 0; // 1-based
    bool missing = false;
    std::string nodeType;

    [[nodiscard]] std::string message() const;
};

/**
 * @brief Owns a parsed tree together with a view of the text it was parsed from
 *
 * The source text must outlive the tree.
 */
class SyntaxTree {
public:
    static Result<SyntaxTree> parse(const TSLanguage* language, std::string_view source);

    [[nodiscard]] TSNode root() const { return ts_tree_root_node(tree_.get()); }
    [[nodiscard]] std::string_view source() const { return source_; }

    /**
     * @brief Exact source span of a node
     */
    [[nodiscard]] std::string text(TSNode node) const;

    /**
     * @brief First syntax error in document order, if the tree has any
     */
    [[nodiscard]] std::optional<SyntaxIssue> firstIssue() const;

    /**
     * @brief Contiguous comment siblings immediately preceding a node, joined by newlines
     */
    [[nodiscard]] std::string leadingComments(TSNode node) const;

    /**
     * @brief Collect string-literal URLs (http/https) anywhere under a node
     */
    [[nodiscard]] std::vector<std::string> urls(TSNode node) const;

private:
    SyntaxTree(TSTree* tree, std::string_view source)
        : tree_(tree, ts_tree_delete), source_(source) {}

    std::unique_ptr<TSTree, decltype(&ts_tree_delete)> tree_;
    std::string_view source_;
};

/**
 * @brief Pre-order walk over every node under (and including) node, without recursion
 *
 * The callback receives each node and its depth relative to node, and returns whether to
 * descend into that node's children.
 */
void walk(TSNode node, const std::function<bool(TSNode, uint32_t)>& visit);

/**
 * @brief True when the subtree under node is more than maxDepth levels deep
 */
[[nodiscard]] bool deeperThan(TSNode node, uint32_t maxDepth);

/**
 * @brief A parsed tree plus the byte offset past which nothing may be emitted
 */
struct ParsedSource {
    SyntaxTree tree;
    uint32_t limit = UINT32_MAX; // Start of the first syntax error, or no limit
};

/**
 * @brief Parse source for traversal and report problems into the context
 *
 * A parser failure, or a tree nested deeper than kMaxTreeDepth, is a parse failure of the
 * whole file when label is empty, and a plain error otherwise. A syntax error is reported
 * once, with line and column, and bounds the well-formed prefix through ParsedSource::limit.
 *
 * @param label Prefix for error messages (e.g. a notebook cell name), empty for whole files
 */
std::optional<ParsedSource> parseSource(const TSLanguage* language, std::string_view source,
                                        TraversalContext& ctx, std::string_view label = {});

// Node helpers
[[nodiscard]] std::string_view type(TSNode node);
[[nodiscard]] bool is(TSNode node, std::string_view nodeType);
[[nodiscard]] TSNode field(TSNode node, std::string_view name);
[[nodiscard]] std::size_t line(TSNode node);
[[nodiscard]] std::vector<TSNode> namedChildren(TSNode node);

/**
 * @brief True when an anonymous child token with the given text exists (e.g. "async")
 */
[[nodiscard]] bool hasToken(TSNode node, std::string_view token);

/**
 * @brief Remove quotes and string prefixes from a string literal
 */
[[nodiscard]] std::string unquote(std::string_view literal);

} // namespace strata::extraction::ts
