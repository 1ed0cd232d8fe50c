#include <strata/extraction/extraction_util.h>
#include <strata/extraction/yaml_processor.h>

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <array>
#include <charconv>
#include <stdexcept>

namespace strata::extraction {

namespace {

constexpr std::size_t kMaxDepth = 256;

bool parseInteger(const std::string& s, long long& out) {
    std::string_view v(s);
    bool negative = false;
    if (!v.empty() && (v.front() == '-' || v.front() == '+')) {
        negative = v.front() == '-';
        v.remove_prefix(1);
    }
    int base = 10;
    if (v.size() > 2 && v[0] == '0' && (v[1] == 'x' || v[1] == 'o')) {
        base = v[1] == 'x' ? 16 : 8;
        v.remove_prefix(2);
    }
    if (v.empty())
        return false;
    auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), out, base);
    if (ec != std::errc() || ptr != v.data() + v.size())
        return false;
    if (negative)
        out = -out;
    return true;
}

bool isYamlBool(const std::string& s) {
    static const std::array<const char*, 18> kWords = {
        "true", "True", "TRUE", "false", "False", "FALSE", "yes", "Yes", "YES",
        "no",   "No",   "NO",   "on",    "On",    "ON",    "off", "Off", "OFF"};
    for (const char* w : kWords) {
        if (s == w)
            return true;
    }
    return false;
}

bool isYamlTrue(const std::string& s) {
    return s == "true" || s == "True" || s == "TRUE" || s == "yes" || s == "Yes" ||
           s == "YES" || s == "on" || s == "On" || s == "ON";
}

bool isYamlNull(const std::string& s) {
    return s.empty() || s == "~" || s == "null" || s == "Null" || s == "NULL";
}

bool isQuotedOrString(const YAML::Node& node) {
    const std::string& tag = node.Tag();
    return tag == "!" || (tag.size() >= 4 && tag.compare(tag.size() - 4, 4, ":str") == 0);
}

std::string keyText(const YAML::Node& key) {
    if (key.IsScalar())
        return key.Scalar();
    return YAML::Dump(key);
}

std::size_t lineOf(const YAML::Node& node) {
    auto mark = node.Mark();
    return mark.line >= 0 ? static_cast<std::size_t>(mark.line) + 1 : 0;
}

class YamlVisitor {
public:
    explicit YamlVisitor(TraversalContext& ctx) : ctx_(ctx) {}

    void visitDocument(const YAML::Node& doc, std::size_t index) {
        std::string name = "document_" + std::to_string(index);

        Element el;
        el.type = ElementType::Document;
        el.name = name;
        el.content = doc.IsNull() ? "" : YAML::Dump(doc);
        el.line = lineOf(doc);
        el.props["yaml_type"] = inferYamlType(doc);
        ctx_.emit(std::move(el));

        auto scope = ctx_.enter(ElementType::Document, name);
        if (doc.IsMap()) {
            visitMapEntries(doc, 1);
        } else if (doc.IsSequence()) {
            visitSequenceItems(doc, "item", 1);
        } else if (doc.IsScalar()) {
            emitScalar("value", doc, lineOf(doc));
        }
    }

private:
    void visitMapEntries(const YAML::Node& map, std::size_t depth) {
        for (auto it = map.begin(); it != map.end(); ++it) {
            visitValue(keyText(it->first), it->second, lineOf(it->first), depth);
        }
    }

    void visitSequenceItems(const YAML::Node& seq, const std::string& key, std::size_t depth) {
        std::size_t i = 0;
        for (auto it = seq.begin(); it != seq.end(); ++it, ++i) {
            const YAML::Node& item = *it;
            visitValue(key + "[" + std::to_string(i) + "]", item, lineOf(item), depth);
        }
    }

    void visitValue(const std::string& name, const YAML::Node& value, std::size_t line,
                    std::size_t depth) {
        if (depth > kMaxDepth) {
            throw std::runtime_error("YAML nesting exceeds " + std::to_string(kMaxDepth) +
                                     " levels at " + name);
        }

        if (value.IsMap()) {
            emitContainer(ElementType::Mapping, name, value, line);
            auto scope = ctx_.enter(ElementType::Mapping, name);
            visitMapEntries(value, depth + 1);
        } else if (value.IsSequence()) {
            emitContainer(ElementType::Sequence, name, value, line);
            auto scope = ctx_.enter(ElementType::Sequence, name);
            visitSequenceItems(value, name, depth + 1);
        } else {
            emitScalar(name, value, line);
        }
    }

    void emitContainer(ElementType type, const std::string& name, const YAML::Node& value,
                       std::size_t line) {
        Element el;
        el.type = type;
        el.name = name;
        el.content = YAML::Dump(value);
        el.line = line;
        el.props["yaml_type"] = inferYamlType(value);
        el.props["size"] = value.size();
        ctx_.emit(std::move(el));
    }

    void emitScalar(const std::string& name, const YAML::Node& value, std::size_t line) {
        Element el;
        el.type = ElementType::Scalar;
        el.name = name;
        el.content = value.IsScalar() ? value.Scalar() : "";
        el.line = line;
        el.props["yaml_type"] = inferYamlType(value);

        if (value.IsScalar()) {
            auto envVars = util::findEnvVars(value.Scalar());
            if (!envVars.empty())
                el.props["env_vars"] = envVars;
            auto urls = util::findUrls(value.Scalar());
            if (!urls.empty())
                el.props["urls"] = urls;
        }
        ctx_.emit(std::move(el));
    }

    TraversalContext& ctx_;
};

} // namespace

std::string inferYamlType(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Map: return "mapping";
        case YAML::NodeType::Sequence: return "sequence";
        case YAML::NodeType::Null:
        case YAML::NodeType::Undefined: return "null";
        case YAML::NodeType::Scalar: break;
    }

    if (isQuotedOrString(node))
        return "str";

    const std::string& s = node.Scalar();
    if (isYamlNull(s))
        return "null";
    if (isYamlBool(s))
        return "bool";
    long long i = 0;
    if (parseInteger(s, i))
        return "int";
    double d = 0.0;
    if (YAML::convert<double>::decode(node, d))
        return "float";
    return "str";
}

nlohmann::json yamlToJson(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Map: {
            nlohmann::json obj = nlohmann::json::object();
            for (auto it = node.begin(); it != node.end(); ++it) {
                obj[keyText(it->first)] = yamlToJson(it->second);
            }
            return obj;
        }
        case YAML::NodeType::Sequence: {
            nlohmann::json arr = nlohmann::json::array();
            for (auto it = node.begin(); it != node.end(); ++it) {
                arr.push_back(yamlToJson(*it));
            }
            return arr;
        }
        case YAML::NodeType::Null:
        case YAML::NodeType::Undefined: return nullptr;
        case YAML::NodeType::Scalar: break;
    }

    auto type = inferYamlType(node);
    const std::string& s = node.Scalar();
    if (type == "null")
        return nullptr;
    if (type == "bool")
        return isYamlTrue(s);
    if (type == "int") {
        long long i = 0;
        parseInteger(s, i);
        return i;
    }
    if (type == "float") {
        double d = 0.0;
        YAML::convert<double>::decode(node, d);
        return d;
    }
    return s;
}

void YamlProcessor::extract(const SourceFile& file, TraversalContext& ctx,
                            nlohmann::json& metadata) {
    std::vector<YAML::Node> documents;
    try {
        documents = YAML::LoadAll(file.text);
    } catch (const YAML::ParserException& e) {
        ctx.parseFailure("YAML parse error at line " + std::to_string(e.mark.line + 1) +
                         ", column " + std::to_string(e.mark.column + 1) + ": " + e.msg);
        return;
    }

    spdlog::debug("YamlProcessor: {} document(s) in {}", documents.size(), file.path.string());
    metadata["documents"] = documents.size();

    YamlVisitor visitor(ctx);
    for (std::size_t i = 0; i < documents.size(); ++i) {
        visitor.visitDocument(documents[i], i);
    }
}

} // namespace strata::extraction
