#include <strata/detection/file_type_detector.h>
#include <strata/extraction/javascript_processor.h>
#include <strata/extraction/json_processor.h>
#include <strata/extraction/jupyter_processor.h>
#include <strata/extraction/markdown_processor.h>
#include <strata/extraction/processor_registry.h>
#include <strata/extraction/python_processor.h>
#include <strata/extraction/shell_processor.h>
#include <strata/extraction/yaml_processor.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <set>

namespace strata::extraction {

const char* toString(FileStatus status) {
    switch (status) {
        case FileStatus::Processed: return "processed";
        case FileStatus::Unsupported: return "unsupported";
        case FileStatus::DetectionFailed: return "detection_failed";
        case FileStatus::Failed: return "failed";
    }
    return "unknown";
}

std::size_t DirectoryReport::fileCount() const {
    std::size_t n = 0;
    for (const auto& [folder, reports] : folders) {
        n += reports.size();
    }
    return n;
}

std::size_t DirectoryReport::count(FileStatus status) const {
    std::size_t n = 0;
    for (const auto& [folder, reports] : folders) {
        n += static_cast<std::size_t>(
            std::count_if(reports.begin(), reports.end(),
                          [status](const FileReport& r) { return r.status == status; }));
    }
    return n;
}

const FileReport* DirectoryReport::find(const std::filesystem::path& path) const {
    for (const auto& [folder, reports] : folders) {
        for (const auto& report : reports) {
            // A bare file name matches in any folder
            if (report.path == path ||
                (!path.has_parent_path() && report.path.filename() == path)) {
                return &report;
            }
        }
    }
    return nullptr;
}

ProcessorRegistry::ProcessorRegistry()
    : ProcessorRegistry(detection::FileTypeDetector::instance()) {}

ProcessorRegistry::ProcessorRegistry(const detection::FileTypeDetector& detector)
    : detector_(&detector) {}

ProcessorRegistry ProcessorRegistry::createDefault(const config::ExtractionConfig& config) {
    if (auto applied = config::applyLogLevel(config.logLevel); !applied) {
        spdlog::warn("{}, keeping the current log level", applied.error().message);
    }

    ProcessorOptions options;
    options.maxFileSize = config.maxFileSize;
    options.traverseNotebookCode = config.traverseNotebookCode;

    ProcessorRegistry registry;
    registry.configIgnores_ = config.extraIgnoreDirs;
    registry.registerProcessor(std::make_unique<PythonProcessor>(options));
    registry.registerProcessor(std::make_unique<JavaScriptProcessor>(options));
    registry.registerProcessor(std::make_unique<ShellProcessor>(options));
    registry.registerProcessor(std::make_unique<YamlProcessor>(options));
    registry.registerProcessor(std::make_unique<MarkdownProcessor>(options));
    registry.registerProcessor(std::make_unique<JupyterProcessor>(options));
    registry.registerProcessor(std::make_unique<JsonProcessor>(options));
    return registry;
}

bool ProcessorRegistry::registerProcessor(std::unique_ptr<LanguageProcessor> processor) {
    if (!processor) {
        return false;
    }

    bool claimed = false;
    for (const auto& mime : processor->supportedTypes()) {
        auto it = dispatch_.find(mime);
        if (it != dispatch_.end()) {
            spdlog::debug("MIME type {} already claimed by {}, ignoring {}", mime,
                          it->second->name(), processor->name());
            continue;
        }
        dispatch_[mime] = processor.get();
        claimed = true;
        spdlog::debug("Registered {} for {}", processor->name(), mime);
    }

    if (claimed) {
        processors_.push_back(std::move(processor));
    }
    return claimed;
}

LanguageProcessor* ProcessorRegistry::processorFor(const std::string& mimeType) const {
    auto it = dispatch_.find(mimeType);
    return it != dispatch_.end() ? it->second : nullptr;
}

Result<void>
ProcessorRegistry::validateCoverage(const detection::FileTypeDetector& detector) const {
    std::vector<std::string> problems;

    for (const auto& mime : detector.extractableMimeTypes()) {
        if (!processorFor(mime)) {
            problems.push_back("no processor for " + mime);
        }
    }

    std::set<std::string> producible;
    for (const auto& [ext, mime] : detector.extensionTable()) {
        producible.insert(mime);
    }
    std::set<ProcessorKind> kinds;
    for (const auto& processor : processors_) {
        for (const auto& mime : processor->supportedTypes()) {
            if (!producible.count(mime)) {
                problems.push_back(processor->name() + " declares " + mime +
                                   ", which no extension maps to");
            }
        }
        if (!kinds.insert(processor->kind()).second) {
            problems.push_back(std::string("duplicate processor kind ") +
                               toString(processor->kind()));
        }
    }

    if (!problems.empty()) {
        std::string message = "Processor coverage check failed: ";
        for (size_t i = 0; i < problems.size(); ++i) {
            message += (i ? "; " : "") + problems[i];
        }
        spdlog::error("{}", message);
        return Error{ErrorCode::InvalidState, message};
    }
    return {};
}

Result<FileReport> ProcessorRegistry::processFile(const std::filesystem::path& path) {
    auto signature = detector_->detectFromFile(path);
    if (!signature) {
        spdlog::warn("Could not detect type of {}: {}", path.string(),
                     signature.error().message);
        return signature.error();
    }

    const std::string& mime = signature.value().mimeType;
    LanguageProcessor* processor = processorFor(mime);
    if (!processor) {
        spdlog::debug("No processor for {} ({})", path.string(), mime);
        return Error{ErrorCode::NotSupported, "No processor registered for " + mime};
    }

    FileReport report;
    report.path = path;
    report.mimeType = mime;
    report.processor = processor->kind();

    try {
        report.result = processor->processFile(path);
        report.result.mimeType = mime;
        report.errors = report.result.errors;
        report.status = FileStatus::Processed;
    } catch (const std::exception& e) {
        spdlog::error("{} failed on {}: {}", processor->name(), path.string(), e.what());
        report.status = FileStatus::Failed;
        report.errors.push_back(std::string("Processor error: ") + e.what());
    }
    return report;
}

DirectoryReport ProcessorRegistry::processDirectory(const std::filesystem::path& root,
                                                    const std::vector<std::string>& extraIgnores) {
    DirectoryReport report;

    std::error_code ec;
    if (!std::filesystem::is_directory(root, ec)) {
        report.errors.push_back("Not a directory: " + root.string());
        return report;
    }

    std::vector<std::string> extra = configIgnores_;
    extra.insert(extra.end(), extraIgnores.begin(), extraIgnores.end());
    const auto ignored = detection::FileTypeDetector::ignoreSet(extra);

    namespace fs = std::filesystem;
    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        report.errors.push_back("Cannot open directory " + root.string() + ": " + ec.message());
        return report;
    }

    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            report.errors.push_back("Directory walk stopped: " + ec.message());
            break;
        }

        const auto& entry = *it;
        std::error_code typeEc;
        if (entry.is_directory(typeEc)) {
            if (ignored.count(entry.path().filename().string())) {
                spdlog::debug("Skipping ignored directory {}", entry.path().string());
                it.disable_recursion_pending();
            }
            continue;
        }
        if (!entry.is_regular_file(typeEc)) {
            continue;
        }

        std::string folder = entry.path().parent_path().lexically_relative(root).generic_string();
        if (folder.empty() || folder == ".") {
            folder = ".";
        }

        auto result = processFile(entry.path());
        if (result) {
            report.folders[folder].push_back(std::move(result).value());
            continue;
        }

        FileReport failed;
        failed.path = entry.path();
        failed.errors.push_back(result.error().message);
        if (result.error().code == ErrorCode::NotSupported) {
            failed.status = FileStatus::Unsupported;
            failed.mimeType = detector_->detect(entry.path());
        } else {
            failed.status = FileStatus::DetectionFailed;
        }
        report.folders[folder].push_back(std::move(failed));
    }

    spdlog::info("Walked {}: {} files, {} processed, {} unsupported, {} failed", root.string(),
                 report.fileCount(), report.count(FileStatus::Processed),
                 report.count(FileStatus::Unsupported),
                 report.count(FileStatus::Failed) + report.count(FileStatus::DetectionFailed));
    return report;
}

std::vector<std::pair<ProcessorKind, const ElementTable*>> ProcessorRegistry::tables() const {
    std::vector<std::pair<ProcessorKind, const ElementTable*>> out;
    out.reserve(processors_.size());
    for (const auto& processor : processors_) {
        out.emplace_back(processor->kind(), &processor->table());
    }
    return out;
}

const ElementTable* ProcessorRegistry::tableFor(ProcessorKind kind) const {
    for (const auto& processor : processors_) {
        if (processor->kind() == kind) {
            return &processor->table();
        }
    }
    return nullptr;
}

std::vector<std::string> ProcessorRegistry::supportedTypes() const {
    std::vector<std::string> out;
    out.reserve(dispatch_.size());
    for (const auto& [mime, processor] : dispatch_) {
        out.push_back(mime);
    }
    std::sort(out.begin(), out.end());
    return out;
}

} // namespace strata::extraction
