#include <strata/extraction/extraction_util.h>
#include <strata/extraction/markdown_processor.h>
#include <strata/extraction/tree_sitter_support.h>
#include <strata/extraction/yaml_processor.h>

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>

namespace strata::extraction {

namespace {

using util::trim;

bool startsWith(std::string_view s, std::string_view prefix) {
    return s.substr(0, prefix.size()) == prefix;
}

std::string_view trimNewlines(std::string_view s) {
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r'))
        s.remove_suffix(1);
    return s;
}

TSNode childOfType(TSNode node, std::string_view nodeType) {
    for (TSNode child : ts::namedChildren(node)) {
        if (ts::is(child, nodeType))
            return child;
    }
    return TSNode{};
}

// "Title ##" -> "Title"; a closing sequence must follow a space or stand alone
std::string headingText(std::string_view raw) {
    std::string_view text = trim(raw);
    size_t end = text.size();
    while (end > 0 && text[end - 1] == '#')
        --end;
    if (end < text.size() && (end == 0 || text[end - 1] == ' '))
        text = trim(text.substr(0, end));
    return std::string(text);
}

class MarkdownVisitor {
public:
    MarkdownVisitor(const ts::SyntaxTree& tree, TraversalContext& ctx, uint32_t limit, bool mdx,
                    nlohmann::json& metadata)
        : tree_(tree), ctx_(ctx), limit_(limit), mdx_(mdx), metadata_(metadata) {}

    void run() {
        ts::walk(tree_.root(), [this](TSNode node, uint32_t) { return visit(node); });
        while (!headerLevels_.empty()) {
            ctx_.pop();
            headerLevels_.pop_back();
        }
    }

private:
    // Returns whether the walk should descend into node
    bool visit(TSNode node) {
        if (stopped_ || ts_node_start_byte(node) >= limit_)
            return false;

        auto t = ts::type(node);
        if (t == "minus_metadata") {
            emitFrontmatter(node);
            return false;
        }
        if (t == "atx_heading" || t == "setext_heading") {
            emitHeader(node);
            return false;
        }
        if (t == "fenced_code_block" || t == "indented_code_block") {
            emitCodeBlock(node);
            return false;
        }
        if (t == "list_item") {
            emitListItem(node);
            return true;
        }
        if (t == "block_quote") {
            emitBlockquote(node);
            return true;
        }
        if (t == "pipe_table") {
            emitTable(node);
            return true;
        }
        if (t == "link_reference_definition") {
            emitReferenceDefinition(node);
            return false;
        }
        if (t == "html_block") {
            if (mdx_)
                scanJsx(tree_.text(node), ts::line(node));
            return false;
        }
        if (t == "paragraph" && mdx_ && isModuleBlock(node)) {
            emitModuleStatements(node);
            return false;
        }
        if (t == "inline" || t == "pipe_table_cell") {
            visitInline(node);
            return false;
        }
        return true;
    }

    void emitFrontmatter(TSNode node) {
        std::string raw = tree_.text(node);
        std::string_view text = trimNewlines(raw);
        size_t open = text.find('\n');
        size_t close = text.rfind('\n');
        std::string body;
        if (open != std::string_view::npos && close > open)
            body = std::string(text.substr(open + 1, close - open - 1));

        Element el;
        el.type = ElementType::Frontmatter;
        el.name = "frontmatter";
        el.content = body;
        el.line = ts::line(node);

        try {
            YAML::Node data = YAML::Load(body);
            if (data.IsMap()) {
                auto json = yamlToJson(data);
                std::vector<std::string> keys;
                for (auto it = json.begin(); it != json.end(); ++it) {
                    keys.push_back(it.key());
                }
                el.props["keys"] = keys;
                el.props["data"] = json;
                metadata_["frontmatter"] = json;
            }
        } catch (const YAML::Exception& e) {
            ctx_.addError("Invalid frontmatter at line " + std::to_string(e.mark.line + 2) +
                          ": " + e.msg);
        }

        ctx_.emit(std::move(el));
    }

    void emitHeader(TSNode node) {
        int level = 0;
        for (TSNode child : ts::namedChildren(node)) {
            auto t = ts::type(child);
            if (startsWith(t, "atx_h") && t.size() > 5) {
                level = t[5] - '0';
            } else if (t == "setext_h1_underline") {
                level = 1;
            } else if (t == "setext_h2_underline") {
                level = 2;
            }
        }
        if (level < 1 || level > 6)
            return;

        TSNode content = ts::field(node, "heading_content");
        std::string text = headingText(tree_.text(content));

        while (!headerLevels_.empty() && headerLevels_.back() >= level) {
            ctx_.pop();
            headerLevels_.pop_back();
        }

        Element el;
        el.type = ElementType::Header;
        el.name = "h" + std::to_string(level);
        el.content = std::string(trimNewlines(tree_.text(node)));
        el.line = ts::line(node);
        el.props["level"] = level;
        el.props["text"] = text;
        ctx_.emit(std::move(el));

        ctx_.push(ElementType::Header, text);
        headerLevels_.push_back(level);

        // Setext content is a paragraph wrapping the inline node
        TSNode inlineNode = ts::is(content, "inline") ? content : childOfType(content, "inline");
        if (!ts_node_is_null(inlineNode))
            visitInline(inlineNode);
    }

    void emitCodeBlock(TSNode node) {
        bool fenced = ts::is(node, "fenced_code_block");
        std::string language;
        if (fenced) {
            std::size_t delimiters = 0;
            for (TSNode child : ts::namedChildren(node)) {
                if (ts::is(child, "fenced_code_block_delimiter"))
                    ++delimiters;
            }
            // The grammar runs an unclosed fence to the end of its container
            if (delimiters < 2) {
                ctx_.addError("Unclosed code fence opened at line " +
                              std::to_string(ts::line(node)));
                stopped_ = true;
                return;
            }

            TSNode info = childOfType(node, "info_string");
            TSNode lang = childOfType(info, "language");
            std::string infoText = tree_.text(ts_node_is_null(lang) ? info : lang);
            std::string_view word = trim(infoText);
            language = std::string(word.substr(0, word.find_first_of(" \t{")));
        }

        Element el;
        el.type = ElementType::CodeBlock;
        el.name = "code";
        std::string body = tree_.text(fenced ? childOfType(node, "code_fence_content") : node);
        el.content = std::string(trimNewlines(body));
        el.line = ts::line(node);
        el.props["language"] = language;
        el.props["fenced"] = fenced;
        ctx_.emit(std::move(el));
    }

    void emitListItem(TSNode node) {
        bool ordered = false;
        bool task = false;
        bool checked = false;
        TSNode paragraph{};
        for (TSNode child : ts::namedChildren(node)) {
            auto t = ts::type(child);
            if (t == "list_marker_dot" || t == "list_marker_parenthesis") {
                ordered = true;
            } else if (t == "task_list_marker_checked" || t == "task_list_marker_unchecked") {
                task = true;
                checked = t == "task_list_marker_checked";
            } else if (t == "paragraph" && ts_node_is_null(paragraph)) {
                paragraph = child;
            }
        }

        Element el;
        el.type = ElementType::ListItem;
        el.name = "list_item";
        el.content = std::string(trim(tree_.text(paragraph)));
        el.line = ts::line(node);
        el.props["ordered"] = ordered;
        el.props["indent"] = ts_node_start_point(node).column;
        if (task) {
            el.props["task"] = true;
            el.props["checked"] = checked;
        }
        ctx_.emit(std::move(el));
    }

    void emitBlockquote(TSNode node) {
        std::string body;
        std::size_t lines = 0;
        std::string text = tree_.text(node);
        for (std::string_view line : util::splitLines(trimNewlines(text))) {
            std::string_view t = trim(line);
            while (!t.empty() && t.front() == '>')
                t = trim(t.substr(1));
            if (!body.empty())
                body += '\n';
            body += t;
            ++lines;
        }

        Element el;
        el.type = ElementType::Blockquote;
        el.name = "quote_" + std::to_string(ctx_.nextSynthetic("quote"));
        el.content = body;
        el.line = ts::line(node);
        el.props["lines"] = lines;
        ctx_.emit(std::move(el));
    }

    void emitTable(TSNode node) {
        std::vector<std::string> columns;
        std::size_t rows = 0;
        for (TSNode child : ts::namedChildren(node)) {
            if (ts::is(child, "pipe_table_header")) {
                for (TSNode cell : ts::namedChildren(child)) {
                    if (ts::is(cell, "pipe_table_cell"))
                        columns.emplace_back(trim(tree_.text(cell)));
                }
            } else if (ts::is(child, "pipe_table_row")) {
                ++rows;
            }
        }

        Element el;
        el.type = ElementType::Table;
        el.name = "table_" + std::to_string(ctx_.nextSynthetic("table"));
        el.content = std::string(trimNewlines(tree_.text(node)));
        el.line = ts::line(node);
        el.props["columns"] = columns;
        el.props["rows"] = rows;
        ctx_.emit(std::move(el));
    }

    void emitReferenceDefinition(TSNode node) {
        std::string label = tree_.text(childOfType(node, "link_label"));
        if (label.size() >= 2 && label.front() == '[' && label.back() == ']')
            label = label.substr(1, label.size() - 2);
        emitLink(label, tree_.text(childOfType(node, "link_destination")),
                 std::string(trimNewlines(tree_.text(node))), ts::line(node), false, true);
    }

    void visitInline(TSNode node) {
        uint32_t start = ts_node_start_byte(node);
        uint32_t end = std::min(ts_node_end_byte(node), limit_);
        if (end <= start)
            return;

        auto parsed = ts::SyntaxTree::parse(tree_sitter_markdown_inline(),
                                            tree_.source().substr(start, end - start));
        if (!parsed) {
            spdlog::debug("Inline parse failed at line {}: {}", ts::line(node),
                          parsed.error().message);
            return;
        }
        const ts::SyntaxTree& inlineTree = parsed.value();
        std::size_t baseRow = ts_node_start_point(node).row;

        ts::walk(inlineTree.root(), [&](TSNode n, uint32_t) {
            auto t = ts::type(n);
            std::size_t line = baseRow + ts::line(n);
            if (t == "inline_link" || t == "image") {
                bool image = t == "image";
                TSNode label = childOfType(n, image ? "image_description" : "link_text");
                TSNode destination = childOfType(n, "link_destination");
                emitLink(inlineTree.text(label), inlineTree.text(destination), inlineTree.text(n),
                         line, image, false);
                return false;
            }
            if (t == "uri_autolink") {
                std::string url = inlineTree.text(n);
                if (url.size() >= 2 && url.front() == '<' && url.back() == '>')
                    url = url.substr(1, url.size() - 2);
                emitLink(url, url, inlineTree.text(n), line, false, false);
                return false;
            }
            if (t == "html_tag") {
                if (mdx_)
                    scanJsx(inlineTree.text(n), line);
                return false;
            }
            return t != "code_span";
        });
    }

    void emitLink(const std::string& label, std::string url, std::string content,
                  std::size_t line, bool image, bool reference) {
        if (url.size() >= 2 && url.front() == '<' && url.back() == '>')
            url = url.substr(1, url.size() - 2);

        Element el;
        el.type = ElementType::Link;
        el.name = label.empty() ? url : label;
        el.content = std::move(content);
        el.line = line;
        el.props["url"] = url;
        el.props["image"] = image;
        el.props["external"] = startsWith(url, "http://") || startsWith(url, "https://");
        if (reference)
            el.props["reference"] = true;
        ctx_.emit(std::move(el));
    }

    // MDX import/export statements are top-level paragraphs opening with the keyword
    bool isModuleBlock(TSNode paragraph) const {
        TSNode parent = ts_node_parent(paragraph);
        if (!ts::is(parent, "document") && !ts::is(parent, "section"))
            return false;
        std::string_view text = tree_.source().substr(ts_node_start_byte(paragraph));
        return startsWith(text, "import ") || startsWith(text, "export ");
    }

    void emitModuleStatements(TSNode paragraph) {
        uint32_t start = ts_node_start_byte(paragraph);
        uint32_t end = std::min(ts_node_end_byte(paragraph), limit_);
        std::size_t baseRow = ts_node_start_point(paragraph).row;

        auto parsed = ts::SyntaxTree::parse(tree_sitter_javascript(),
                                            tree_.source().substr(start, end - start));
        if (!parsed || parsed.value().firstIssue()) {
            ctx_.addError("Invalid MDX module statement at line " +
                          std::to_string(ts::line(paragraph)));
            return;
        }
        const ts::SyntaxTree& js = parsed.value();

        for (TSNode stmt : ts::namedChildren(js.root())) {
            bool isImport = ts::is(stmt, "import_statement");
            if (!isImport && !ts::is(stmt, "export_statement"))
                continue;

            Element el;
            el.type = isImport ? ElementType::Import : ElementType::Export;
            el.content = js.text(stmt);
            el.line = baseRow + ts::line(stmt);

            if (isImport) {
                std::string source = ts::unquote(js.text(ts::field(stmt, "source")));
                el.name = source.empty() ? "import" : source;
                el.props["source"] = source;
            } else {
                bool isDefault = ts::hasToken(stmt, "default");
                TSNode declaration = ts::field(stmt, "declaration");
                std::string name = js.text(ts::field(declaration, "name"));
                for (TSNode child : ts::namedChildren(declaration)) {
                    if (name.empty() && ts::is(child, "variable_declarator"))
                        name = js.text(ts::field(child, "name"));
                }
                if (name.empty())
                    name = isDefault ? "default" : "export";
                el.name = name;
                el.props["default"] = isDefault;
            }
            ctx_.emit(std::move(el));
        }
    }

    // Capitalized tags are JSX components; lowercase ones are plain HTML
    void scanJsx(std::string_view text, std::size_t line) {
        size_t pos = 0;
        while ((pos = text.find('<', pos)) != std::string_view::npos) {
            if (pos + 1 >= text.size() ||
                !std::isupper(static_cast<unsigned char>(text[pos + 1]))) {
                ++pos;
                continue;
            }
            size_t nameEnd = pos + 1;
            while (nameEnd < text.size() &&
                   (std::isalnum(static_cast<unsigned char>(text[nameEnd])) ||
                    text[nameEnd] == '.' || text[nameEnd] == '_'))
                ++nameEnd;
            size_t tagEnd = text.find('>', nameEnd);
            std::string_view tag =
                text.substr(pos, tagEnd == std::string_view::npos ? std::string_view::npos
                                                                  : tagEnd + 1 - pos);

            std::vector<std::string> attributes;
            std::string_view attrs = tag.substr(nameEnd - pos);
            size_t eq = 0;
            while ((eq = attrs.find('=', eq)) != std::string_view::npos) {
                size_t s = eq;
                while (s > 0 && (std::isalnum(static_cast<unsigned char>(attrs[s - 1])) ||
                                 attrs[s - 1] == '_' || attrs[s - 1] == '-'))
                    --s;
                if (s < eq)
                    attributes.emplace_back(attrs.substr(s, eq - s));
                ++eq;
            }

            Element el;
            el.type = ElementType::JsxComponent;
            el.name = std::string(text.substr(pos + 1, nameEnd - pos - 1));
            el.content = std::string(tag);
            el.line = line + static_cast<std::size_t>(
                                 std::count(text.begin(), text.begin() + pos, '\n'));
            el.props["attributes"] = attributes;
            el.props["self_closing"] = tag.size() >= 2 && tag.substr(tag.size() - 2) == "/>";
            ctx_.emit(std::move(el));

            pos = tagEnd == std::string_view::npos ? text.size() : tagEnd + 1;
        }
    }

    const ts::SyntaxTree& tree_;
    TraversalContext& ctx_;
    uint32_t limit_;
    bool mdx_;
    nlohmann::json& metadata_;
    std::vector<int> headerLevels_;
    bool stopped_ = false;
};

} // namespace

void MarkdownProcessor::extract(const SourceFile& file, TraversalContext& ctx,
                                nlohmann::json& metadata) {
    std::string ext = file.path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), ::tolower);
    bool mdx = ext == ".mdx";

    spdlog::debug("MarkdownProcessor: parsing {} ({})", file.path.string(),
                  mdx ? "mdx" : "markdown");
    metadata["dialect"] = mdx ? "mdx" : "markdown";

    auto parsed = ts::parseSource(tree_sitter_markdown(), file.text, ctx);
    if (!parsed)
        return;

    MarkdownVisitor visitor(parsed->tree, ctx, parsed->limit, mdx, metadata);
    visitor.run();
}

} // namespace strata::extraction
