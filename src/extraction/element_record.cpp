#include <strata/extraction/element_record.h>

namespace strata::extraction {

const char* toString(ElementType type) {
    switch (type) {
        case ElementType::Class: return "Class";
        case ElementType::Function: return "Function";
        case ElementType::Method: return "Method";
        case ElementType::Lambda: return "Lambda";
        case ElementType::Import: return "Import";
        case ElementType::Export: return "Export";
        case ElementType::Constant: return "Constant";
        case ElementType::Conditional: return "Conditional";
        case ElementType::Variable: return "Variable";
        case ElementType::Alias: return "Alias";
        case ElementType::Document: return "Document";
        case ElementType::Mapping: return "Mapping";
        case ElementType::Sequence: return "Sequence";
        case ElementType::Scalar: return "Scalar";
        case ElementType::Object: return "Object";
        case ElementType::Array: return "Array";
        case ElementType::Value: return "Value";
        case ElementType::Header: return "Header";
        case ElementType::CodeBlock: return "CodeBlock";
        case ElementType::ListItem: return "ListItem";
        case ElementType::Blockquote: return "Blockquote";
        case ElementType::Table: return "Table";
        case ElementType::Link: return "Link";
        case ElementType::Frontmatter: return "Frontmatter";
        case ElementType::JsxComponent: return "JsxComponent";
        case ElementType::Cell: return "Cell";
        case ElementType::Output: return "Output";
    }
    return "Unknown";
}

std::vector<std::string> ElementRecord::values() const {
    return {filepath, parentPath, std::to_string(order), name, content, props,
            toString(elementType)};
}

const std::vector<std::string>& ElementTable::columns() {
    static const std::vector<std::string> kColumns = {
        "filepath", "parent_path", "order", "name", "content", "props", "element_type"};
    return kColumns;
}

void ElementTable::append(const std::vector<ElementRecord>& records) {
    rows_.insert(rows_.end(), records.begin(), records.end());
}

std::vector<ElementRecord> ElementTable::rowsFor(const std::string& filepath) const {
    std::vector<ElementRecord> out;
    for (const auto& row : rows_) {
        if (row.filepath == filepath) {
            out.push_back(row);
        }
    }
    return out;
}

nlohmann::json ElementTable::toJson() const {
    nlohmann::json out = nlohmann::json::array();
    const auto& cols = columns();
    for (const auto& row : rows_) {
        auto vals = row.values();
        nlohmann::json obj = nlohmann::json::object();
        for (size_t i = 0; i < cols.size(); ++i) {
            obj[cols[i]] = vals[i];
        }
        obj["order"] = row.order;
        obj["nesting_level"] = row.nestingLevel;
        out.push_back(std::move(obj));
    }
    return out;
}

} // namespace strata::extraction
