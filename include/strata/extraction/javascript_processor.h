#pragma once

#include <strata/extraction/language_processor.h>

namespace strata::extraction {

/**
 * @brief Structural extractor for JavaScript and JSX sources (tree-sitter-javascript)
 *
 * Single pass in source order; imports and exports are recorded where they appear.
 * Covers static imports, dynamic import() calls, import.meta usage, exports (followed by
 * their declaration), classes, methods, functions and top-level const bindings.
 * Function and arrow expressions take the name of the binding they are assigned to; unbound
 * ones are recorded as "anonymous" and do not open a scope.
 */
class JavaScriptProcessor : public LanguageProcessor {
public:
    using LanguageProcessor::LanguageProcessor;

    std::vector<std::string> supportedTypes() const override { return {"application/javascript"}; }
    ProcessorKind kind() const override { return ProcessorKind::JavaScript; }
    std::string name() const override { return "JavaScriptProcessor"; }

protected:
    void extract(const SourceFile& file, TraversalContext& ctx, nlohmann::json& metadata) override;
};

} // namespace strata::extraction
