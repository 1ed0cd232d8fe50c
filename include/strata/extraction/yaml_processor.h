#pragma once

#include <string>

#include <strata/extraction/language_processor.h>

namespace YAML {
class Node;
}

namespace strata::extraction {

/**
 * @brief Structural extractor for YAML documents (yaml-cpp)
 *
 * Every document becomes `document_<i>`; mappings and sequences open scopes named after
 * their key, scalars are leaves. Sequence items are named `<key>[<i>]`.
 */
class YamlProcessor : public LanguageProcessor {
public:
    using LanguageProcessor::LanguageProcessor;

    std::vector<std::string> supportedTypes() const override { return {"application/x-yaml"}; }
    ProcessorKind kind() const override { return ProcessorKind::Yaml; }
    std::string name() const override { return "YamlProcessor"; }

protected:
    void extract(const SourceFile& file, TraversalContext& ctx, nlohmann::json& metadata) override;
};

/**
 * @brief Inferred YAML type: mapping, sequence, str, int, float, bool or null
 */
std::string inferYamlType(const YAML::Node& node);

/**
 * @brief Convert a YAML tree to JSON using the inferred scalar types
 */
nlohmann::json yamlToJson(const YAML::Node& node);

} // namespace strata::extraction
