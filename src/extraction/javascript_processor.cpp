#include <strata/extraction/javascript_processor.h>
#include <strata/extraction/tree_sitter_support.h>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace strata::extraction {

namespace {

bool isFunctionLike(TSNode node) {
    auto t = ts::type(node);
    return t == "arrow_function" || t == "function_expression" || t == "function" ||
           t == "generator_function";
}

bool isClassExpression(TSNode node) {
    return ts::is(node, "class");
}

class JavaScriptVisitor {
public:
    JavaScriptVisitor(const ts::SyntaxTree& tree, TraversalContext& ctx, uint32_t limit)
        : tree_(tree), ctx_(ctx), limit_(limit) {}

    void visit(TSNode node) {
        if (ts_node_is_null(node) || ts_node_start_byte(node) >= limit_)
            return;

        auto t = ts::type(node);
        bool whole = ts_node_end_byte(node) <= limit_;

        if (t == "import_statement") {
            if (whole)
                emitImport(node);
            return;
        }
        if (t == "export_statement") {
            if (whole)
                visitExport(node);
            return;
        }
        if (t == "class_declaration" || t == "class") {
            if (whole || (t == "class_declaration" && bodyOpensBeforeLimit(node)))
                visitClass(node, tree_.text(ts::field(node, "name")), node);
            return;
        }
        if (t == "function_declaration" || t == "generator_function_declaration") {
            if (whole || bodyOpensBeforeLimit(node))
                visitFunction(node, tree_.text(ts::field(node, "name")), node,
                              ElementType::Function);
            return;
        }
        if (isFunctionLike(node)) {
            if (whole)
                visitFunction(node, tree_.text(ts::field(node, "name")), node,
                              ElementType::Function);
            return;
        }
        if (t == "method_definition") {
            if (whole || bodyOpensBeforeLimit(node))
                visitMethod(node);
            return;
        }
        if (t == "lexical_declaration" || t == "variable_declaration") {
            if (whole) {
                visitDeclaration(node);
            } else {
                visitChildren(node);
            }
            return;
        }
        if (whole && t == "assignment_expression") {
            TSNode right = ts::field(node, "right");
            if (bindValue(right, tree_.text(ts::field(node, "left")), outerStatement(node),
                          ElementType::Function))
                return;
        }
        if (whole && t == "pair") {
            TSNode key = ts::field(node, "key");
            std::string keyName = ts::is(key, "string") ? ts::unquote(tree_.text(key))
                                                        : tree_.text(key);
            if (bindValue(ts::field(node, "value"), keyName, node, ElementType::Function))
                return;
        }
        if (whole && t == "field_definition") {
            if (bindValue(ts::field(node, "value"), tree_.text(ts::field(node, "property")),
                          node, ElementType::Method))
                return;
        }
        if (t == "call_expression" && ts::is(ts::field(node, "function"), "import")) {
            if (whole)
                emitDynamicImport(node);
            return;
        }
        if (t == "meta_property" ||
            (t == "member_expression" && ts::is(ts::field(node, "object"), "import"))) {
            if (whole && tree_.text(node).rfind("import", 0) == 0)
                emitImportMeta(node);
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
    // A declaration whose header is intact keeps the members that precede a syntax error
    bool bodyOpensBeforeLimit(TSNode node) const {
        TSNode body = ts::field(node, "body");
        return !ts_node_is_null(body) && ts_node_start_byte(body) < limit_;
    }

    void markIncomplete(TSNode outer, Element& el) const {
        if (ts_node_end_byte(outer) > limit_)
            el.props["incomplete"] = true;
    }

    // Names a function or class expression after the binding it is assigned to
    bool bindValue(TSNode value, const std::string& binding, TSNode outer, ElementType type) {
        if (isFunctionLike(value)) {
            visitFunction(value, binding, outer, type);
            return true;
        }
        if (isClassExpression(value)) {
            visitClass(value, binding, outer);
            return true;
        }
        return false;
    }

    // Expression statements own their comments and give the complete source span
    TSNode outerStatement(TSNode node) const {
        TSNode parent = ts_node_parent(node);
        return ts::is(parent, "expression_statement") ? parent : node;
    }

    std::string anonymousName() const {
        const ScopeFrame* frame = ctx_.innermost();
        return frame ? frame->name + ".anonymous" : std::string("anonymous");
    }

    void visitFunction(TSNode node, const std::string& binding, TSNode outer, ElementType type) {
        bool named = !binding.empty();
        Element el;
        el.type = type;
        el.name = named ? binding : anonymousName();
        el.content = tree_.text(outer);
        el.line = ts::line(outer);
        el.comments = tree_.leadingComments(outer);

        TSNode params = ts::field(node, "parameters");
        if (ts_node_is_null(params)) {
            params = ts::field(node, "parameter");
            if (!ts_node_is_null(params))
                el.parameters.push_back(tree_.text(params));
        } else {
            el.parameters = parameters(params);
        }

        el.props["async"] = ts::hasToken(node, "async");
        if (ts::is(node, "arrow_function"))
            el.props["arrow"] = true;
        if (ts::type(node).find("generator") != std::string_view::npos)
            el.props["generator"] = true;
        addUsage(node, el);
        markIncomplete(outer, el);

        std::string name = el.name;
        ctx_.emit(std::move(el));
        if (named) {
            auto scope = ctx_.enter(type, name);
            visit(ts::field(node, "body"));
        } else {
            visit(ts::field(node, "body"));
        }
    }

    void visitClass(TSNode node, const std::string& binding, TSNode outer) {
        bool named = !binding.empty();
        Element el;
        el.type = ElementType::Class;
        el.name = named ? binding : anonymousName();
        el.content = tree_.text(outer);
        el.line = ts::line(outer);
        el.comments = tree_.leadingComments(outer);

        for (TSNode child : ts::namedChildren(node)) {
            if (ts::is(child, "class_heritage")) {
                auto parents = ts::namedChildren(child);
                el.props["extends"] = parents.empty() ? tree_.text(child)
                                                      : tree_.text(parents.front());
            }
        }
        addUsage(node, el);
        markIncomplete(outer, el);

        std::string name = el.name;
        ctx_.emit(std::move(el));
        if (named) {
            auto scope = ctx_.enter(ElementType::Class, name);
            visitChildren(ts::field(node, "body"));
        } else {
            visitChildren(ts::field(node, "body"));
        }
    }

    void visitMethod(TSNode node) {
        Element el;
        el.type = ElementType::Method;
        el.name = tree_.text(ts::field(node, "name"));
        el.parameters = parameters(ts::field(node, "parameters"));
        el.content = tree_.text(node);
        el.line = ts::line(node);
        el.comments = tree_.leadingComments(node);
        el.props["async"] = ts::hasToken(node, "async");
        el.props["static"] = ts::hasToken(node, "static");
        if (ts::hasToken(node, "get")) {
            el.props["kind"] = "get";
        } else if (ts::hasToken(node, "set")) {
            el.props["kind"] = "set";
        }
        addUsage(node, el);
        markIncomplete(node, el);

        std::string name = el.name;
        ctx_.emit(std::move(el));
        auto scope = ctx_.enter(ElementType::Method, name);
        visit(ts::field(node, "body"));
    }

    void visitDeclaration(TSNode decl) {
        bool isConst = tree_.text(decl).rfind("const", 0) == 0;
        std::vector<TSNode> declarators;
        for (TSNode child : ts::namedChildren(decl)) {
            if (ts::is(child, "variable_declarator"))
                declarators.push_back(child);
        }

        for (TSNode declarator : declarators) {
            TSNode outer = declarators.size() == 1 ? decl : declarator;
            TSNode nameNode = ts::field(declarator, "name");
            TSNode value = ts::field(declarator, "value");
            std::string name = tree_.text(nameNode);

            if (ts::is(nameNode, "identifier") &&
                bindValue(value, name, outer, ElementType::Function))
                continue;

            if (isConst && ts::is(nameNode, "identifier") && !ts_node_is_null(value)) {
                Element el;
                el.type = ElementType::Constant;
                el.name = name;
                el.content = tree_.text(outer);
                el.line = ts::line(outer);
                el.comments = tree_.leadingComments(outer);
                el.props["value_type"] = std::string(ts::type(value));
                addUsage(value, el);
                ctx_.emit(std::move(el));
            }
            visit(value);
        }
    }

    void emitImport(TSNode node) {
        Element el;
        el.type = ElementType::Import;
        el.content = tree_.text(node);
        el.line = ts::line(node);
        el.comments = tree_.leadingComments(node);

        std::string source = ts::unquote(tree_.text(ts::field(node, "source")));
        std::vector<std::string> specifiers;
        for (TSNode child : ts::namedChildren(node)) {
            if (ts::is(child, "import_clause")) {
                for (TSNode part : ts::namedChildren(child)) {
                    if (ts::is(part, "named_imports")) {
                        for (TSNode spec : ts::namedChildren(part)) {
                            if (ts::is(spec, "import_specifier"))
                                specifiers.push_back(tree_.text(spec));
                        }
                    } else {
                        specifiers.push_back(tree_.text(part));
                    }
                }
            } else if (ts::is(child, "import_attribute")) {
                el.props["attributes"] = tree_.text(child);
            }
        }

        el.name = source;
        el.props["source"] = source;
        el.props["specifiers"] = specifiers;
        ctx_.emit(std::move(el));
    }

    void emitDynamicImport(TSNode call) {
        Element el;
        el.type = ElementType::Import;
        el.content = tree_.text(call);
        el.line = ts::line(call);

        auto args = ts::namedChildren(ts::field(call, "arguments"));
        std::string source;
        if (!args.empty()) {
            source = ts::is(args.front(), "string") ? ts::unquote(tree_.text(args.front()))
                                                    : tree_.text(args.front());
        }
        el.name = source.empty() ? "import()" : source;
        el.props["source"] = source;
        el.props["dynamic"] = true;
        ctx_.emit(std::move(el));

        for (TSNode arg : args) {
            visit(arg);
        }
    }

    void emitImportMeta(TSNode node) {
        TSNode usage = node;
        TSNode parent = ts_node_parent(node);
        if (ts::is(parent, "member_expression") && ts_node_eq(ts::field(parent, "object"), node))
            usage = parent;

        Element el;
        el.type = ElementType::Import;
        el.name = "import.meta";
        el.content = tree_.text(usage);
        el.line = ts::line(usage);
        el.props["meta_usage"] = true;
        if (!ts_node_eq(usage, node)) {
            el.props["property"] = tree_.text(ts::field(usage, "property"));
        }
        ctx_.emit(std::move(el));
    }

    void visitExport(TSNode node) {
        Element el;
        el.type = ElementType::Export;
        el.content = tree_.text(node);
        el.line = ts::line(node);
        el.comments = tree_.leadingComments(node);

        bool isDefault = ts::hasToken(node, "default");
        TSNode declaration = ts::field(node, "declaration");
        TSNode value = ts::field(node, "value");
        TSNode sourceNode = ts::field(node, "source");
        std::string source = ts::unquote(tree_.text(sourceNode));

        std::vector<std::string> specifiers;
        for (TSNode child : ts::namedChildren(node)) {
            if (ts::is(child, "export_clause")) {
                for (TSNode spec : ts::namedChildren(child)) {
                    if (ts::is(spec, "export_specifier"))
                        specifiers.push_back(tree_.text(spec));
                }
            } else if (ts::is(child, "namespace_export")) {
                specifiers.push_back(tree_.text(child));
            }
        }

        std::string name = declaredNames(declaration);
        if (name.empty())
            name = tree_.text(ts::field(value, "name"));
        if (name.empty() && isDefault)
            name = "default";
        if (name.empty())
            name = join(specifiers);
        if (name.empty())
            name = source.empty() ? "*" : source;

        el.name = name;
        el.props["default"] = isDefault;
        el.props["specifiers"] = specifiers;
        if (!ts_node_is_null(sourceNode))
            el.props["source"] = source;
        ctx_.emit(std::move(el));

        if (!ts_node_is_null(declaration)) {
            visit(declaration);
        } else if (!ts_node_is_null(value)) {
            std::string own = tree_.text(ts::field(value, "name"));
            if (!bindValue(value, own.empty() ? "default" : own, value, ElementType::Function))
                visit(value);
        }
    }

    std::string declaredNames(TSNode declaration) const {
        if (ts_node_is_null(declaration))
            return "";
        TSNode name = ts::field(declaration, "name");
        if (!ts_node_is_null(name))
            return tree_.text(name);

        std::vector<std::string> names;
        for (TSNode child : ts::namedChildren(declaration)) {
            if (ts::is(child, "variable_declarator"))
                names.push_back(tree_.text(ts::field(child, "name")));
        }
        return join(names);
    }

    static std::string join(const std::vector<std::string>& parts) {
        std::string out;
        for (const auto& p : parts) {
            if (!out.empty())
                out += ", ";
            out += p;
        }
        return out;
    }

    std::vector<std::string> parameters(TSNode params) const {
        std::vector<std::string> out;
        for (TSNode p : ts::namedChildren(params)) {
            if (ts::is(p, "comment"))
                continue;
            if (ts::is(p, "assignment_pattern")) {
                out.push_back(tree_.text(ts::field(p, "left")));
            } else {
                out.push_back(tree_.text(p));
            }
        }
        return out;
    }

    // process.env references and URLs used inside a construct
    void addUsage(TSNode node, Element& el) const {
        std::vector<std::string> envVars;
        ts::walk(node, [&](TSNode n, uint32_t) {
            auto t = ts::type(n);
            if (t == "member_expression" || t == "subscript_expression") {
                TSNode object = ts::field(n, "object");
                if (tree_.text(object) == "process.env") {
                    std::string var;
                    if (t == "member_expression") {
                        var = tree_.text(ts::field(n, "property"));
                    } else {
                        TSNode index = ts::field(n, "index");
                        if (ts::is(index, "string"))
                            var = ts::unquote(tree_.text(index));
                    }
                    if (!var.empty() &&
                        std::find(envVars.begin(), envVars.end(), var) == envVars.end())
                        envVars.push_back(std::move(var));
                }
            }
            return true;
        });

        if (!envVars.empty())
            el.props["env_vars"] = envVars;
        auto urls = tree_.urls(node);
        if (!urls.empty())
            el.props["urls"] = urls;
    }

    const ts::SyntaxTree& tree_;
    TraversalContext& ctx_;
    uint32_t limit_;
};

} // namespace

void JavaScriptProcessor::extract(const SourceFile& file, TraversalContext& ctx,
                                  nlohmann::json& metadata) {
    spdlog::debug("JavaScriptProcessor: traversing {}", file.path.string());
    auto parsed = ts::parseSource(tree_sitter_javascript(), file.text, ctx);
    if (!parsed)
        return;

    JavaScriptVisitor visitor(parsed->tree, ctx, parsed->limit);
    visitor.visitChildren(parsed->tree.root());

    auto ext = file.path.extension().string();
    metadata["language"] = "javascript";
    metadata["module_type"] = ext == ".mjs" ? "esm" : ext == ".cjs" ? "commonjs" : "auto";
}

} // namespace strata::extraction
