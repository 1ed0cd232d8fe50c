#include <strata/extraction/extraction_util.h>
#include <strata/extraction/jupyter_processor.h>
#include <strata/extraction/python_processor.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

namespace strata::extraction {

namespace {

constexpr std::size_t kMaxDepth = 256;

// nbformat stores multi-line text either as one string or as a list of lines
std::string joinText(const nlohmann::json& value) {
    if (value.is_string())
        return value.get<std::string>();
    std::string out;
    if (value.is_array()) {
        for (const auto& part : value) {
            if (part.is_string())
                out += part.get<std::string>();
        }
    }
    return out;
}

std::string notebookLanguage(const nlohmann::json& metadata) {
    if (!metadata.is_object())
        return "python";
    auto info = metadata.find("language_info");
    if (info != metadata.end() && info->is_object() && info->contains("name") &&
        (*info)["name"].is_string())
        return (*info)["name"].get<std::string>();
    auto kernel = metadata.find("kernelspec");
    if (kernel != metadata.end() && kernel->is_object() && kernel->contains("language") &&
        (*kernel)["language"].is_string())
        return (*kernel)["language"].get<std::string>();
    return "python";
}

// IPython magics and shell escapes are not Python; blank them so line numbers still match
std::string stripMagics(const std::string& source) {
    std::string out;
    size_t start = 0;
    while (start <= source.size()) {
        size_t nl = source.find('\n', start);
        std::string_view line(source.data() + start,
                              (nl == std::string::npos ? source.size() : nl) - start);
        size_t first = line.find_first_not_of(" \t");
        bool magic = first != std::string_view::npos && (line[first] == '%' || line[first] == '!');
        if (!magic)
            out += line;
        if (nl == std::string::npos)
            break;
        out += '\n';
        start = nl + 1;
    }
    return out;
}

std::string outputContent(const nlohmann::json& output, const std::string& type) {
    if (type == "stream")
        return joinText(output.value("text", nlohmann::json()));
    if (type == "error") {
        std::string out = output.value("ename", std::string()) + ": " +
                          output.value("evalue", std::string());
        auto traceback = output.value("traceback", nlohmann::json::array());
        for (const auto& line : traceback) {
            if (line.is_string())
                out += "\n" + line.get<std::string>();
        }
        return out;
    }
    auto data = output.value("data", nlohmann::json::object());
    if (data.contains("text/plain"))
        return joinText(data["text/plain"]);
    return data.dump();
}

} // namespace

void JupyterProcessor::extract(const SourceFile& file, TraversalContext& ctx,
                               nlohmann::json& metadata) {
    nlohmann::json notebook;
    try {
        notebook = nlohmann::json::parse(file.text);
    } catch (const nlohmann::json::parse_error& e) {
        ctx.parseFailure(std::string("Invalid JSON in notebook: ") + e.what());
        return;
    }
    if (util::nestingExceeds(notebook, kMaxDepth)) {
        ctx.parseFailure("Invalid notebook: nesting exceeds " + std::to_string(kMaxDepth) +
                         " levels");
        return;
    }

    if (!notebook.is_object() || !notebook.contains("cells") || !notebook["cells"].is_array()) {
        ctx.parseFailure("Invalid notebook: missing cells array");
        return;
    }

    metadata = notebook.value("metadata", nlohmann::json::object());
    if (notebook.contains("nbformat"))
        metadata["nbformat"] = notebook["nbformat"];

    std::string language = notebookLanguage(metadata);
    bool traverseCode = options().traverseNotebookCode && language == "python";

    const auto& cells = notebook["cells"];
    spdlog::debug("JupyterProcessor: {} cells in {} (language {})", cells.size(),
                  file.path.string(), language);

    for (size_t idx = 0; idx < cells.size(); ++idx) {
        const auto& cell = cells[idx];
        if (!cell.is_object()) {
            ctx.addError("Cell " + std::to_string(idx) + " is not an object");
            continue;
        }

        std::string cellType = cell.value("cell_type", std::string("unknown"));
        std::string source = joinText(cell.value("source", nlohmann::json()));
        auto executionCount = cell.value("execution_count", nlohmann::json());
        auto outputs = cell.value("outputs", nlohmann::json::array());
        if (!outputs.is_array())
            outputs = nlohmann::json::array();

        std::string cellName = "cell_" + std::to_string(idx) + "_" + cellType;
        if (executionCount.is_number_integer())
            cellName += "_[" + std::to_string(executionCount.get<long long>()) + "]";

        std::vector<std::string> outputTypes;
        for (const auto& out : outputs) {
            outputTypes.push_back(out.is_object() ? out.value("output_type", std::string("unknown"))
                                                  : std::string("unknown"));
        }

        Element el;
        el.type = ElementType::Cell;
        el.name = cellName;
        el.content = source;
        el.props["cell_type"] = cellType;
        el.props["execution_count"] = executionCount;
        el.props["output_types"] = outputTypes;
        el.props["has_outputs"] = !outputs.empty();
        auto cellMetadata = cell.value("metadata", nlohmann::json::object());
        if (cellMetadata.is_object() && cellMetadata.contains("tags"))
            el.props["tags"] = cellMetadata["tags"];
        ctx.emit(std::move(el));

        if (cellType != "code")
            continue;

        auto scope = ctx.enter(ElementType::Cell, cellName);
        if (traverseCode && !source.empty())
            PythonProcessor::traverse(stripMagics(source), ctx, cellName);

        for (size_t i = 0; i < outputs.size(); ++i) {
            const std::string& outputType = outputTypes[i];
            Element out;
            out.type = ElementType::Output;
            out.name = cellName + "_output_" + std::to_string(i) + "_" + outputType;
            out.props["output_type"] = outputType;
            if (outputs[i].is_object()) {
                out.content = outputContent(outputs[i], outputType);
                out.props["execution_count"] =
                    outputs[i].value("execution_count", nlohmann::json());
                auto data = outputs[i].value("data", nlohmann::json::object());
                if (data.is_object() && !data.empty()) {
                    std::vector<std::string> mimeTypes;
                    for (auto it = data.begin(); it != data.end(); ++it)
                        mimeTypes.push_back(it.key());
                    out.props["mime_types"] = mimeTypes;
                }
            }
            ctx.emit(std::move(out));
        }
    }
}

} // namespace strata::extraction
