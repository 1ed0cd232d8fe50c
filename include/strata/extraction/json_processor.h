#pragma once

#include <strata/extraction/language_processor.h>

namespace strata::extraction {

/**
 * @brief Structural extractor for JSON documents (nlohmann/json)
 *
 * The root becomes `document_0`. Objects and arrays open scopes named after their key;
 * array items are named `<key>[<i>]`. Member order follows the source.
 */
class JsonProcessor : public LanguageProcessor {
public:
    using LanguageProcessor::LanguageProcessor;

    std::vector<std::string> supportedTypes() const override { return {"application/json"}; }
    ProcessorKind kind() const override { return ProcessorKind::Json; }
    std::string name() const override { return "JsonProcessor"; }

protected:
    void extract(const SourceFile& file, TraversalContext& ctx, nlohmann::json& metadata) override;
};

} // namespace strata::extraction
