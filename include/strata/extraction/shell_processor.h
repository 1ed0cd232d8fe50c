#pragma once

#include <strata/extraction/language_processor.h>

namespace strata::extraction {

/**
 * @brief Structural extractor for shell scripts (tree-sitter-bash)
 *
 * Single pass in source order. Emits function definitions (which open a scope), variable
 * assignments including `export`/`local`/`readonly`/`declare` forms, aliases, and
 * `source`/`.` statements as imports.
 */
class ShellProcessor : public LanguageProcessor {
public:
    using LanguageProcessor::LanguageProcessor;

    std::vector<std::string> supportedTypes() const override { return {"application/x-sh"}; }
    ProcessorKind kind() const override { return ProcessorKind::Shell; }
    std::string name() const override { return "ShellProcessor"; }

protected:
    void extract(const SourceFile& file, TraversalContext& ctx, nlohmann::json& metadata) override;
};

} // namespace strata::extraction
