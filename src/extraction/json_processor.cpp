#include <strata/extraction/extraction_util.h>
#include <strata/extraction/json_processor.h>

#include <spdlog/spdlog.h>

namespace strata::extraction {

namespace {

using ordered_json = nlohmann::ordered_json;

constexpr std::size_t kMaxDepth = 256;

std::string jsonType(const ordered_json& value) {
    switch (value.type()) {
        case ordered_json::value_t::object: return "object";
        case ordered_json::value_t::array: return "array";
        case ordered_json::value_t::string: return "string";
        case ordered_json::value_t::boolean: return "boolean";
        case ordered_json::value_t::number_integer:
        case ordered_json::value_t::number_unsigned: return "integer";
        case ordered_json::value_t::number_float: return "float";
        case ordered_json::value_t::null: return "null";
        default: return "unknown";
    }
}

class JsonVisitor {
public:
    explicit JsonVisitor(TraversalContext& ctx) : ctx_(ctx) {}

    void visit(const std::string& name, const ordered_json& value) {
        Element el;
        el.name = name;
        el.content = value.is_string() ? value.get<std::string>() : value.dump();
        el.props["json_type"] = jsonType(value);

        if (value.is_object()) {
            el.type = ElementType::Object;
            el.props["size"] = value.size();
            ctx_.emit(std::move(el));
            auto scope = ctx_.enter(ElementType::Object, name);
            visitMembers(value);
        } else if (value.is_array()) {
            el.type = ElementType::Array;
            el.props["size"] = value.size();
            ctx_.emit(std::move(el));
            auto scope = ctx_.enter(ElementType::Array, name);
            visitItems(name, value);
        } else {
            el.type = ElementType::Value;
            ctx_.emit(std::move(el));
        }
    }

    void visitMembers(const ordered_json& object) {
        for (auto it = object.begin(); it != object.end(); ++it) {
            visit(it.key(), it.value());
        }
    }

    void visitItems(const std::string& key, const ordered_json& array) {
        for (std::size_t i = 0; i < array.size(); ++i) {
            visit(key + "[" + std::to_string(i) + "]", array[i]);
        }
    }

private:
    TraversalContext& ctx_;
};

} // namespace

void JsonProcessor::extract(const SourceFile& file, TraversalContext& ctx,
                            nlohmann::json& metadata) {
    ordered_json root;
    try {
        root = ordered_json::parse(file.text);
    } catch (const nlohmann::json::parse_error& e) {
        ctx.parseFailure(std::string("Invalid JSON: ") + e.what());
        return;
    }
    // dump() and the visitor recurse once per level
    if (util::nestingExceeds(root, kMaxDepth)) {
        ctx.parseFailure("JSON nesting exceeds " + std::to_string(kMaxDepth) + " levels");
        return;
    }

    spdlog::debug("JsonProcessor: parsed {} ({})", file.path.string(), jsonType(root));
    metadata["root_type"] = jsonType(root);

    Element doc;
    doc.type = ElementType::Document;
    doc.name = "document_0";
    doc.content = root.dump();
    doc.props["json_type"] = jsonType(root);
    ctx.emit(std::move(doc));

    auto scope = ctx.enter(ElementType::Document, "document_0");
    JsonVisitor visitor(ctx);
    if (root.is_object()) {
        visitor.visitMembers(root);
    } else if (root.is_array()) {
        visitor.visitItems("item", root);
    } else {
        visitor.visit("value", root);
    }
}

} // namespace strata::extraction
