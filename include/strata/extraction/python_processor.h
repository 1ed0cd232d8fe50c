#pragma once

#include <string_view>

#include <strata/extraction/language_processor.h>

namespace strata::extraction {

/**
 * @brief Structural extractor for Python sources (tree-sitter-python)
 *
 * Single pass in source order. Emits classes, functions (methods inside a class frame),
 * lambdas, imports, UPPER_CASE constants at module or class level and the
 * `if __name__ == "__main__":` guard. Classes, functions, lambdas and the guard open scopes.
 */
class PythonProcessor : public LanguageProcessor {
public:
    using LanguageProcessor::LanguageProcessor;

    std::vector<std::string> supportedTypes() const override { return {"text/x-python"}; }
    ProcessorKind kind() const override { return ProcessorKind::Python; }
    std::string name() const override { return "PythonProcessor"; }

    /**
     * @brief Traverse Python source into ctx beneath its current scope stack
     *
     * Shared with the notebook processor, which walks code cells inside a cell frame.
     * @param label Prefix for error messages; empty when the source is a whole file
     */
    static void traverse(std::string_view source, TraversalContext& ctx,
                         std::string_view label = {});

protected:
    void extract(const SourceFile& file, TraversalContext& ctx, nlohmann::json& metadata) override;
};

} // namespace strata::extraction
