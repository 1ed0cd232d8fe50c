#include <strata/detection/file_type_detector.h>
#include <strata/extraction/language_processor.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

namespace strata::extraction {

const char* toString(ProcessorKind kind) {
    switch (kind) {
        case ProcessorKind::Python: return "python";
        case ProcessorKind::JavaScript: return "javascript";
        case ProcessorKind::Shell: return "shell";
        case ProcessorKind::Yaml: return "yaml";
        case ProcessorKind::Markdown: return "markdown";
        case ProcessorKind::Jupyter: return "jupyter";
        case ProcessorKind::Json: return "json";
    }
    return "unknown";
}

Result<SourceFile> readSourceFile(const std::filesystem::path& path, std::size_t maxFileSize) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return Error{ErrorCode::FileNotFound, "File not found: " + path.string()};
    }
    if (!std::filesystem::is_regular_file(path, ec)) {
        return Error{ErrorCode::InvalidArgument, "Not a regular file: " + path.string()};
    }

    SourceFile source;
    source.path = path;
    source.info.name = path.filename().string();
    source.info.path = std::filesystem::absolute(path, ec).string();
    if (ec) {
        source.info.path = path.string();
    }

    source.info.size = std::filesystem::file_size(path, ec);
    if (ec) {
        return Error{ErrorCode::PermissionDenied,
                     "Cannot stat file: " + path.string() + ": " + ec.message()};
    }
    if (source.info.size > maxFileSize) {
        return Error{ErrorCode::ResourceExhausted,
                     "File too large: " + std::to_string(source.info.size) + " bytes (limit " +
                         std::to_string(maxFileSize) + ")"};
    }

    auto ft = std::filesystem::last_write_time(path, ec);
    if (!ec) {
        using std::chrono::system_clock;
        source.info.lastModified = std::chrono::time_point_cast<system_clock::duration>(
            ft - decltype(ft)::clock::now() + system_clock::now());
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return Error{ErrorCode::PermissionDenied, "Cannot open file: " + path.string()};
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    source.text = buffer.str();

    // Drop a UTF-8 byte order mark so parser offsets line up with the text
    if (source.text.size() >= 3 && source.text.compare(0, 3, "\xEF\xBB\xBF") == 0) {
        source.text.erase(0, 3);
    }
    return source;
}

LanguageProcessor::LanguageProcessor(ProcessorOptions options) : options_(options) {}

bool LanguageProcessor::supports(const std::string& mimeType) const {
    auto types = supportedTypes();
    return std::find(types.begin(), types.end(), mimeType) != types.end();
}

ProcessingResult LanguageProcessor::processFile(const std::filesystem::path& path) {
    ProcessingResult result;
    result.table = &table_;
    result.fileInfo.name = path.filename().string();
    result.fileInfo.path = path.string();

    auto mime = detection::FileTypeDetector::getMimeTypeFromExtension(path.extension().string());
    result.mimeType = supports(mime) ? mime : supportedTypes().front();

    auto source = readSourceFile(path, options_.maxFileSize);
    if (!source) {
        spdlog::warn("{}: {}", name(), source.error().message);
        result.errors.push_back(source.error().message);
        return result;
    }
    const SourceFile& file = source.value();
    result.fileInfo = file.info;

    bool blank = std::all_of(file.text.begin(), file.text.end(),
                             [](unsigned char c) { return std::isspace(c); });
    if (blank) {
        spdlog::debug("{}: {} is empty", name(), path.string());
        return result;
    }

    TraversalContext ctx(path.string());
    try {
        extract(file, ctx, result.metadata);
    } catch (const std::exception& e) {
        spdlog::error("{}: error processing {}: {}", name(), path.string(), e.what());
        ctx.parseFailure(std::string("Error processing file: ") + e.what());
    }

    result.errors = ctx.errors();
    result.newRecords = ctx.records().size();
    table_.append(ctx.records());

    if (!result.errors.empty()) {
        spdlog::warn("{}: {} finished with {} error(s), first: {}", name(), path.string(),
                     result.errors.size(), result.errors.front());
    } else {
        spdlog::debug("{}: extracted {} elements from {}", name(), result.newRecords,
                      path.string());
    }
    return result;
}

} // namespace strata::extraction
