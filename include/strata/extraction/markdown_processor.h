#pragma once

#include <strata/extraction/language_processor.h>

namespace strata::extraction {

/**
 * @brief Structural extractor for Markdown and MDX
 *
 * Block structure comes from tree-sitter-markdown; the text of each inline node is parsed
 * again with the markdown_inline grammar, so code spans and HTML blocks never yield links or
 * headers. Recognizes YAML frontmatter, ATX and setext headers, code blocks, list items,
 * blockquotes, pipe tables and links. MDX files (.mdx) additionally yield import/export
 * statements (parsed with tree-sitter-javascript) and capitalized JSX components.
 *
 * A header closes every open header of the same or a deeper level and opens a
 * `Header:<text>` scope. An unclosed code fence is reported as an error; everything before
 * it is kept.
 */
class MarkdownProcessor : public LanguageProcessor {
public:
    using LanguageProcessor::LanguageProcessor;

    std::vector<std::string> supportedTypes() const override {
        return {"text/markdown", "text/mdx"};
    }
    ProcessorKind kind() const override { return ProcessorKind::Markdown; }
    std::string name() const override { return "MarkdownProcessor"; }

protected:
    void extract(const SourceFile& file, TraversalContext& ctx, nlohmann::json& metadata) override;
};

} // namespace strata::extraction
