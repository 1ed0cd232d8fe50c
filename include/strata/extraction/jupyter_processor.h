#pragma once

#include <strata/extraction/language_processor.h>

namespace strata::extraction {

/**
 * @brief Structural extractor for Jupyter notebooks (nlohmann/json)
 *
 * Each cell becomes `cell_<idx>_<type>`, suffixed `_[<n>]` once executed. Code cells open a
 * scope holding their Python structure (when the kernel language is Python and
 * ProcessorOptions::traverseNotebookCode is set) followed by one element per output.
 * Notebook metadata is returned in ProcessingResult::metadata.
 */
class JupyterProcessor : public LanguageProcessor {
public:
    using LanguageProcessor::LanguageProcessor;

    std::vector<std::string> supportedTypes() const override {
        return {"application/x-ipynb+json"};
    }
    ProcessorKind kind() const override { return ProcessorKind::Jupyter; }
    std::string name() const override { return "JupyterProcessor"; }

protected:
    void extract(const SourceFile& file, TraversalContext& ctx, nlohmann::json& metadata) override;
};

} // namespace strata::extraction
