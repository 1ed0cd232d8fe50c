#include <strata/extraction/extraction_util.h>
#include <strata/extraction/python_processor.h>
#include <strata/extraction/tree_sitter_support.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

namespace strata::extraction {

namespace {

class PythonVisitor {
public:
    PythonVisitor(const ts::SyntaxTree& tree, TraversalContext& ctx, uint32_t limit)
        : tree_(tree), ctx_(ctx), limit_(limit) {}

    void visit(TSNode node) {
        if (ts_node_start_byte(node) >= limit_)
            return;

        auto t = ts::type(node);
        bool whole = ts_node_end_byte(node) <= limit_;

        if (t == "class_definition") {
            if (whole || bodyOpensBeforeLimit(node))
                visitClass(node, node);
            return;
        }
        if (t == "function_definition") {
            if (whole || bodyOpensBeforeLimit(node))
                visitFunction(node, node);
            return;
        }
        if (t == "decorated_definition") {
            if (whole || bodyOpensBeforeLimit(ts::field(node, "definition")))
                visitDecorated(node);
            return;
        }
        if (t == "import_statement" || t == "import_from_statement" ||
            t == "future_import_statement") {
            if (whole)
                emitImport(node);
            return;
        }
        if (t == "if_statement" && isMainGuard(node)) {
            if (whole || opensBeforeLimit(ts::field(node, "consequence")))
                visitMainGuard(node);
            return;
        }
        if (t == "expression_statement" && whole && visitAssignment(node)) {
            return;
        }
        if (t == "lambda") {
            if (whole)
                visitLambda(node, "", node);
            return;
        }
        visitChildren(node);
    }

    void visitChildren(TSNode node) {
        for (TSNode child : ts::namedChildren(node)) {
            visit(child);
        }
    }

private:
    // A container whose header is intact keeps the children that precede a syntax error
    bool opensBeforeLimit(TSNode body) const {
        return !ts_node_is_null(body) && ts_node_start_byte(body) < limit_;
    }

    bool bodyOpensBeforeLimit(TSNode def) const {
        return opensBeforeLimit(ts::field(def, "body"));
    }

    void markIncomplete(TSNode outer, Element& el) const {
        if (ts_node_end_byte(outer) > limit_)
            el.props["incomplete"] = true;
    }

    void visitClass(TSNode def, TSNode outer) {
        Element el;
        el.type = ElementType::Class;
        el.name = tree_.text(ts::field(def, "name"));
        el.content = tree_.text(outer);
        el.line = ts::line(outer);
        el.comments = tree_.leadingComments(outer);

        TSNode bases = ts::field(def, "superclasses");
        if (!ts_node_is_null(bases)) {
            std::vector<std::string> names;
            for (TSNode base : ts::namedChildren(bases)) {
                names.push_back(tree_.text(base));
            }
            el.props["bases"] = names;
        }
        addDecorators(outer, el);
        addDocstring(ts::field(def, "body"), el);
        markIncomplete(outer, el);

        std::string name = el.name;
        ctx_.emit(std::move(el));
        auto scope = ctx_.enter(ElementType::Class, name);
        visitChildren(ts::field(def, "body"));
    }

    void visitFunction(TSNode def, TSNode outer) {
        const ScopeFrame* frame = ctx_.innermost();
        ElementType type = frame && frame->type == ElementType::Class ? ElementType::Method
                                                                      : ElementType::Function;
        Element el;
        el.type = type;
        el.name = tree_.text(ts::field(def, "name"));
        el.parameters = parameters(ts::field(def, "parameters"));
        el.content = tree_.text(outer);
        el.line = ts::line(outer);
        el.comments = tree_.leadingComments(outer);
        el.props["async"] = ts::hasToken(def, "async");

        TSNode returns = ts::field(def, "return_type");
        if (!ts_node_is_null(returns)) {
            el.props["returns"] = tree_.text(returns);
        }
        addDecorators(outer, el);
        addDocstring(ts::field(def, "body"), el);
        markIncomplete(outer, el);

        std::string name = el.name;
        ctx_.emit(std::move(el));
        auto scope = ctx_.enter(type, name);
        visitChildren(ts::field(def, "body"));
    }

    void visitDecorated(TSNode outer) {
        TSNode def = ts::field(outer, "definition");
        if (ts::is(def, "class_definition")) {
            visitClass(def, outer);
        } else if (ts::is(def, "function_definition")) {
            visitFunction(def, outer);
        } else {
            visitChildren(outer);
        }
    }

    void visitLambda(TSNode node, const std::string& binding, TSNode outer) {
        std::string name = binding;
        if (name.empty()) {
            name = "lambda_" + std::to_string(ctx_.nextSynthetic("lambda"));
            if (const ScopeFrame* frame = ctx_.innermost()) {
                name = frame->name + "." + name;
            }
        }

        Element el;
        el.type = ElementType::Lambda;
        el.name = name;
        el.parameters = parameters(ts::field(node, "parameters"));
        el.content = tree_.text(outer);
        el.line = ts::line(outer);
        if (!binding.empty()) {
            el.comments = tree_.leadingComments(outer);
        }

        ctx_.emit(std::move(el));
        auto scope = ctx_.enter(ElementType::Lambda, name);
        visit(ts::field(node, "body"));
    }

    // Handles `NAME = ...` statements; returns false when the statement is not an assignment
    bool visitAssignment(TSNode stmt) {
        auto children = ts::namedChildren(stmt);
        if (children.size() != 1 || !ts::is(children.front(), "assignment"))
            return false;

        TSNode assign = children.front();
        TSNode left = ts::field(assign, "left");
        TSNode right = ts::field(assign, "right");

        if (ts::is(right, "lambda") &&
            (ts::is(left, "identifier") || ts::is(left, "attribute"))) {
            visitLambda(right, tree_.text(left), stmt);
            return true;
        }

        const ScopeFrame* frame = ctx_.innermost();
        // Notebook cells are module level
        bool constantScope = !frame || frame->type == ElementType::Class ||
                             frame->type == ElementType::Conditional ||
                             frame->type == ElementType::Cell;
        std::string target = tree_.text(left);
        if (!constantScope || !ts::is(left, "identifier") || !util::isUpperSnakeCase(target))
            return false;

        Element el;
        el.type = ElementType::Constant;
        el.name = target;
        el.content = tree_.text(stmt);
        el.line = ts::line(stmt);
        el.comments = tree_.leadingComments(stmt);
        if (!ts_node_is_null(right)) {
            el.props["value"] = tree_.text(right);
        }
        TSNode annotation = ts::field(assign, "type");
        if (!ts_node_is_null(annotation)) {
            el.props["annotation"] = tree_.text(annotation);
        }
        ctx_.emit(std::move(el));

        if (!ts_node_is_null(right)) {
            visit(right);
        }
        return true;
    }

    void emitImport(TSNode node) {
        Element el;
        el.type = ElementType::Import;
        el.content = tree_.text(node);
        el.line = ts::line(node);
        el.comments = tree_.leadingComments(node);

        std::vector<std::string> names;
        TSNode module = ts::field(node, "module_name");
        for (TSNode child : ts::namedChildren(node)) {
            if (ts::is(child, "comment"))
                continue;
            if (!ts_node_is_null(module) && ts_node_eq(child, module))
                continue;
            names.push_back(tree_.text(child));
        }

        if (ts::is(node, "import_statement")) {
            std::string joined;
            for (const auto& n : names) {
                joined += (joined.empty() ? "" : ", ") + n;
            }
            el.name = joined;
        } else if (ts::is(node, "future_import_statement")) {
            el.name = "__future__";
            el.props["module"] = "__future__";
        } else {
            el.name = tree_.text(module);
            el.props["module"] = el.name;
        }
        el.props["names"] = names;
        ctx_.emit(std::move(el));
    }

    bool isMainGuard(TSNode node) const {
        std::string cond = tree_.text(ts::field(node, "condition"));
        cond.erase(std::remove_if(cond.begin(), cond.end(),
                                  [](unsigned char c) { return std::isspace(c); }),
                   cond.end());
        std::replace(cond.begin(), cond.end(), '\'', '"');
        return cond == "__name__==\"__main__\"" || cond == "\"__main__\"==__name__";
    }

    void visitMainGuard(TSNode node) {
        Element el;
        el.type = ElementType::Conditional;
        el.name = "__main__";
        el.content = tree_.text(node);
        el.line = ts::line(node);
        el.comments = tree_.leadingComments(node);
        markIncomplete(node, el);
        ctx_.emit(std::move(el));

        TSNode consequence = ts::field(node, "consequence");
        {
            auto scope = ctx_.enter(ElementType::Conditional, "__main__");
            visitChildren(consequence);
        }
        for (TSNode child : ts::namedChildren(node)) {
            if (ts::is(child, "elif_clause") || ts::is(child, "else_clause")) {
                visitChildren(child);
            }
        }
    }

    std::vector<std::string> parameters(TSNode params) const {
        std::vector<std::string> out;
        for (TSNode p : ts::namedChildren(params)) {
            auto t = ts::type(p);
            if (t == "identifier" || t == "list_splat_pattern" ||
                t == "dictionary_splat_pattern") {
                out.push_back(tree_.text(p));
            } else if (t == "default_parameter" || t == "typed_default_parameter") {
                out.push_back(tree_.text(ts::field(p, "name")));
            } else if (t == "typed_parameter") {
                auto inner = ts::namedChildren(p);
                if (!inner.empty())
                    out.push_back(tree_.text(inner.front()));
            }
        }
        return out;
    }

    void addDecorators(TSNode outer, Element& el) const {
        if (!ts::is(outer, "decorated_definition"))
            return;
        std::vector<std::string> decorators;
        for (TSNode child : ts::namedChildren(outer)) {
            if (ts::is(child, "decorator")) {
                std::string text = tree_.text(child);
                std::string_view body(text);
                if (!body.empty() && body.front() == '@')
                    body.remove_prefix(1);
                decorators.emplace_back(util::trim(body));
            }
        }
        el.props["decorators"] = decorators;
    }

    void addDocstring(TSNode body, Element& el) const {
        auto statements = ts::namedChildren(body);
        auto first = std::find_if(statements.begin(), statements.end(),
                                  [](TSNode n) { return !ts::is(n, "comment"); });
        if (first == statements.end() || !ts::is(*first, "expression_statement"))
            return;
        auto inner = ts::namedChildren(*first);
        if (inner.size() != 1 || !ts::is(inner.front(), "string"))
            return;
        std::string doc = ts::unquote(tree_.text(inner.front()));
        el.props["docstring"] = std::string(util::trim(doc));
    }

    const ts::SyntaxTree& tree_;
    TraversalContext& ctx_;
    uint32_t limit_;
};

} // namespace

void PythonProcessor::traverse(std::string_view source, TraversalContext& ctx,
                               std::string_view label) {
    auto parsed = ts::parseSource(tree_sitter_python(), source, ctx, label);
    if (!parsed)
        return;

    PythonVisitor visitor(parsed->tree, ctx, parsed->limit);
    visitor.visitChildren(parsed->tree.root());
}

void PythonProcessor::extract(const SourceFile& file, TraversalContext& ctx,
                              nlohmann::json& metadata) {
    spdlog::debug("PythonProcessor: traversing {}", file.path.string());
    traverse(file.text, ctx);
    metadata["language"] = "python";
}

} // namespace strata::extraction
