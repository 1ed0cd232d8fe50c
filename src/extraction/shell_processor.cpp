#include <strata/extraction/extraction_util.h>
#include <strata/extraction/shell_processor.h>
#include <strata/extraction/tree_sitter_support.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

namespace strata::extraction {

namespace {

// 'value' and "value" lose their quotes; anything else is kept as written
std::string shellUnquote(std::string_view word) {
    if (word.size() >= 2 && (word.front() == '\'' || word.front() == '"') &&
        word.back() == word.front())
        return std::string(word.substr(1, word.size() - 2));
    return std::string(word);
}

bool isPositional(std::string_view ref) {
    if (ref.size() < 2 || ref.front() != '$')
        return false;
    ref.remove_prefix(1);
    if (ref.size() >= 2 && ref.front() == '{' && ref.back() == '}')
        ref = ref.substr(1, ref.size() - 2);
    if (ref == "@" || ref == "*" || ref == "#")
        return true;
    return !ref.empty() &&
           std::all_of(ref.begin(), ref.end(),
                       [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; });
}

class ShellVisitor {
public:
    ShellVisitor(const ts::SyntaxTree& tree, TraversalContext& ctx, uint32_t limit)
        : tree_(tree), ctx_(ctx), limit_(limit) {}

    void visit(TSNode node) {
        if (ts_node_is_null(node) || ts_node_start_byte(node) >= limit_)
            return;

        auto t = ts::type(node);
        bool whole = ts_node_end_byte(node) <= limit_;

        if (t == "function_definition") {
            TSNode body = ts::field(node, "body");
            if (whole || (!ts_node_is_null(body) && ts_node_start_byte(body) < limit_))
                visitFunction(node);
            return;
        }
        if (t == "variable_assignment") {
            if (whole)
                emitVariable(node, node, "");
            return;
        }
        if (t == "declaration_command") {
            if (whole)
                visitDeclaration(node);
            return;
        }
        if (t == "command") {
            if (whole)
                visitCommand(node);
            return;
        }
        if (t == "comment")
            return;
        visitChildren(node);
    }

    void visitChildren(TSNode node) {
        for (TSNode child : ts::namedChildren(node)) {
            visit(child);
        }
    }

private:
    void visitFunction(TSNode node) {
        Element el;
        el.type = ElementType::Function;
        el.name = tree_.text(ts::field(node, "name"));
        el.content = tree_.text(node);
        el.line = ts::line(node);
        el.comments = tree_.leadingComments(node);
        el.props["keyword"] = ts::hasToken(node, "function");

        TSNode body = ts::field(node, "body");
        std::vector<std::string> positional;
        ts::walk(body, [&](TSNode n, uint32_t) {
            auto t = ts::type(n);
            if (t == "simple_expansion" || t == "expansion") {
                std::string ref = tree_.text(n);
                if (isPositional(ref) &&
                    std::find(positional.begin(), positional.end(), ref) == positional.end())
                    positional.push_back(std::move(ref));
                return false;
            }
            return true;
        });
        if (!positional.empty())
            el.props["positional_args"] = positional;
        if (ts_node_end_byte(node) > limit_)
            el.props["incomplete"] = true;

        std::string name = el.name;
        ctx_.emit(std::move(el));
        auto scope = ctx_.enter(ElementType::Function, name);
        visit(body);
    }

    // export/local/readonly/declare followed by assignments or bare names
    void visitDeclaration(TSNode decl) {
        std::string keyword;
        uint32_t child_count = ts_node_child_count(decl);
        for (uint32_t i = 0; i < child_count && keyword.empty(); ++i) {
            TSNode child = ts_node_child(decl, i);
            if (!ts_node_is_named(child))
                keyword = std::string(ts::type(child));
        }

        std::vector<TSNode> targets;
        for (TSNode child : ts::namedChildren(decl)) {
            if (ts::is(child, "variable_assignment") || ts::is(child, "variable_name"))
                targets.push_back(child);
        }
        for (TSNode target : targets) {
            emitVariable(target, targets.size() == 1 ? decl : target, keyword);
        }
    }

    void emitVariable(TSNode node, TSNode outer, const std::string& keyword) {
        bool assignment = ts::is(node, "variable_assignment");

        Element el;
        el.type = ElementType::Variable;
        el.name = tree_.text(assignment ? ts::field(node, "name") : node);
        el.content = tree_.text(outer);
        el.line = ts::line(outer);
        el.comments = tree_.leadingComments(outer);
        if (!keyword.empty())
            el.props["scope"] = keyword;
        el.props["exported"] = keyword == "export";

        TSNode value = assignment ? ts::field(node, "value") : TSNode{};
        if (!ts_node_is_null(value)) {
            std::string text = tree_.text(value);
            el.props["value"] = shellUnquote(text);
            el.props["value_type"] = std::string(ts::type(value));
            auto refs = util::findEnvVars(text);
            if (!refs.empty())
                el.props["env_vars"] = refs;
            auto urls = util::findUrls(text);
            if (!urls.empty())
                el.props["urls"] = urls;
        }
        ctx_.emit(std::move(el));
    }

    void visitCommand(TSNode command) {
        TSNode nameNode = ts::field(command, "name");
        std::string name = tree_.text(nameNode);
        if (name != "alias" && name != "source" && name != ".")
            return;

        std::vector<TSNode> arguments;
        for (TSNode child : ts::namedChildren(command)) {
            if (ts_node_eq(child, nameNode))
                continue;
            auto t = ts::type(child);
            if (t == "variable_assignment" || t == "comment" ||
                t.find("redirect") != std::string_view::npos)
                continue;
            arguments.push_back(child);
        }

        if (name == "alias") {
            for (TSNode arg : arguments) {
                emitAlias(command, arg, arguments.size() == 1);
            }
            return;
        }
        if (arguments.empty())
            return;

        Element el;
        el.type = ElementType::Import;
        el.name = shellUnquote(tree_.text(arguments.front()));
        el.content = tree_.text(command);
        el.line = ts::line(command);
        el.comments = tree_.leadingComments(command);
        el.props["source"] = el.name;
        el.props["command"] = name;
        el.props["dynamic"] = el.name.find('$') != std::string::npos;
        ctx_.emit(std::move(el));
    }

    void emitAlias(TSNode command, TSNode arg, bool only) {
        std::string text = tree_.text(arg);
        size_t eq = text.find('=');
        // `alias name` only prints an alias
        if (eq == std::string::npos || eq == 0)
            return;

        Element el;
        el.type = ElementType::Alias;
        el.name = text.substr(0, eq);
        el.content = only ? tree_.text(command) : "alias " + text;
        el.line = ts::line(command);
        el.comments = tree_.leadingComments(command);
        el.props["value"] = shellUnquote(std::string_view(text).substr(eq + 1));
        ctx_.emit(std::move(el));
    }

    const ts::SyntaxTree& tree_;
    TraversalContext& ctx_;
    uint32_t limit_;
};

} // namespace

void ShellProcessor::extract(const SourceFile& file, TraversalContext& ctx,
                             nlohmann::json& metadata) {
    spdlog::debug("ShellProcessor: traversing {}", file.path.string());
    auto parsed = ts::parseSource(tree_sitter_bash(), file.text, ctx);
    if (!parsed)
        return;

    ShellVisitor visitor(parsed->tree, ctx, parsed->limit);
    visitor.visitChildren(parsed->tree.root());

    metadata["language"] = "shell";
    if (file.text.rfind("#!", 0) == 0) {
        auto lines = util::splitLines(file.text);
        metadata["interpreter"] = std::string(util::trim(lines.front().substr(2)));
    }
}

} // namespace strata::extraction
