#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include <strata/core/types.h>
#include <strata/extraction/element_record.h>
#include <strata/extraction/traversal_context.h>

namespace strata::extraction {

/**
 * @brief Tag identifying each built-in processor variant
 */
enum class ProcessorKind { Python, JavaScript, Shell, Yaml, Markdown, Jupyter, Json };

const char* toString(ProcessorKind kind);

/**
 * @brief Settings shared by every processor
 */
struct ProcessorOptions {
    std::size_t maxFileSize = 100 * 1024 * 1024; // Larger files are rejected with an error
    bool traverseNotebookCode = true;            // Walk Python code cells in notebooks
};

/**
 * @brief Base class for per-format structural extractors
 *
 * processFile() reads the file, runs the format-specific extract() against a fresh
 * TraversalContext and appends the resulting records to the processor's table. It never
 * throws; every failure ends up in ProcessingResult::errors.
 *
 * An instance is stateful through its table only and must not be shared between threads.
 */
class LanguageProcessor {
public:
    explicit LanguageProcessor(ProcessorOptions options = {});
    virtual ~LanguageProcessor() = default;

    LanguageProcessor(const LanguageProcessor&) = delete;
    LanguageProcessor& operator=(const LanguageProcessor&) = delete;

    /**
     * @brief Canonical MIME types this processor answers to
     */
    virtual std::vector<std::string> supportedTypes() const = 0;

    virtual ProcessorKind kind() const = 0;

    /**
     * @brief Human-readable processor name
     */
    virtual std::string name() const = 0;

    bool supports(const std::string& mimeType) const;

    /**
     * @brief Extract the structure of one file and append it to the table
     * @param path File to process
     * @return Result holding file info, errors and the number of rows appended
     */
    ProcessingResult processFile(const std::filesystem::path& path);

    /**
     * @brief The running table, grown by every processFile call
     */
    const ElementTable& table() const { return table_; }

    const ProcessorOptions& options() const { return options_; }

protected:
    /**
     * @brief Parse the file and drive the traversal context
     *
     * Implementations report parse failures through ctx.parseFailure() and malformed regions
     * through ctx.addError(). Exceptions are caught by processFile().
     */
    virtual void extract(const SourceFile& file, TraversalContext& ctx,
                         nlohmann::json& metadata) = 0;

private:
    ProcessorOptions options_;
    ElementTable table_;
};

/**
 * @brief Read a file into a SourceFile, enforcing a size limit
 */
Result<SourceFile> readSourceFile(const std::filesystem::path& path, std::size_t maxFileSize);

} // namespace strata::extraction
