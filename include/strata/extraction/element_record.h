#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include <strata/core/types.h>

namespace strata::extraction {

/**
 * @brief Kind of structural construct an element describes
 */
enum class ElementType {
    // Code
    Class,
    Function,
    Method,
    Lambda,
    Import,
    Export,
    Constant,
    Conditional,
    Variable,
    Alias,
    // Data documents
    Document,
    Mapping,
    Sequence,
    Scalar,
    Object,
    Array,
    Value,
    // Markdown
    Header,
    CodeBlock,
    ListItem,
    Blockquote,
    Table,
    Link,
    Frontmatter,
    JsxComponent,
    // Notebooks
    Cell,
    Output
};

/**
 * @brief Name used in the element_type column and in parent path labels
 */
const char* toString(ElementType type);

/**
 * @brief A construct discovered during traversal, before it is placed in scope
 */
struct Element {
    ElementType type = ElementType::Function;
    std::string name;
    std::vector<std::string> parameters;
    std::string comments; // Contiguous comments immediately preceding the construct
    std::string content;  // Exact source span
    std::size_t line = 0; // 1-based, 0 when the format has no line information
    nlohmann::json props = nlohmann::json::object();
};

/**
 * @brief One flattened row of the element table
 */
struct ElementRecord {
    std::string filepath;
    std::string parentPath;
    std::size_t order = 0;
    std::string name;
    std::string content;
    std::string props; // Serialized JSON object
    ElementType elementType = ElementType::Function;
    std::size_t nestingLevel = 0;

    bool operator==(const ElementRecord&) const = default;

    [[nodiscard]] std::vector<std::string> values() const;
};

/**
 * @brief Append-only, order-preserving table of element records
 *
 * A processor keeps one table for its whole lifetime; rows are never altered once appended.
 */
class ElementTable {
public:
    /**
     * @brief Fixed column order: filepath, parent_path, order, name, content, props, element_type
     */
    static const std::vector<std::string>& columns();

    void append(const std::vector<ElementRecord>& records);

    [[nodiscard]] std::size_t size() const { return rows_.size(); }
    [[nodiscard]] bool empty() const { return rows_.empty(); }
    [[nodiscard]] const std::vector<ElementRecord>& rows() const { return rows_; }
    [[nodiscard]] const ElementRecord& operator[](std::size_t i) const { return rows_[i]; }

    /**
     * @brief Rows belonging to one file, in table order
     */
    [[nodiscard]] std::vector<ElementRecord> rowsFor(const std::string& filepath) const;

    /**
     * @brief Table as a JSON array of objects keyed by column name
     */
    [[nodiscard]] nlohmann::json toJson() const;

private:
    std::vector<ElementRecord> rows_;
};

/**
 * @brief File attributes reported alongside every processing result
 */
struct FileInfo {
    std::string name;
    std::string path;
    std::uintmax_t size = 0;
    TimePoint lastModified{};
};

/**
 * @brief Decoded file text; immutable once read
 */
struct SourceFile {
    std::filesystem::path path;
    std::string text;
    FileInfo info;
};

/**
 * @brief Outcome of one processFile call
 */
struct ProcessingResult {
    std::vector<std::string> errors;
    FileInfo fileInfo;
    std::string mimeType;
    std::size_t newRecords = 0;
    nlohmann::json metadata = nlohmann::json::object(); // Format-level data, e.g. notebook metadata
    const ElementTable* table = nullptr;                // The processor's running table

    [[nodiscard]] bool isSuccess() const { return errors.empty(); }
};

} // namespace strata::extraction
