#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <strata/config/config_helpers.h>
#include <strata/core/types.h>
#include <strata/extraction/language_processor.h>

namespace strata::detection {
class FileTypeDetector;
}

namespace strata::extraction {

/**
 * @brief What happened to one file during dispatch
 */
enum class FileStatus {
    Processed,       ///< A processor ran; the result may still carry parse/validation errors
    Unsupported,     ///< No processor claims the detected MIME type
    DetectionFailed, ///< The file type could not be determined
    Failed           ///< The processor raised; caught at the registry boundary
};

const char* toString(FileStatus status);

/**
 * @brief Per-file outcome reported by the registry
 */
struct FileReport {
    std::filesystem::path path;
    std::string mimeType;
    FileStatus status = FileStatus::Processed;
    std::optional<ProcessorKind> processor;
    ProcessingResult result;
    std::vector<std::string> errors; // Result errors, or the dispatch/detection failure

    [[nodiscard]] bool hasErrors() const { return !errors.empty(); }
};

/**
 * @brief Outcome of a directory walk, grouped by folder relative to the root ("." for the root)
 */
struct DirectoryReport {
    std::map<std::string, std::vector<FileReport>> folders;
    std::vector<std::string> errors; // Walk-level problems (unreadable directories)

    [[nodiscard]] std::size_t fileCount() const;
    [[nodiscard]] std::size_t count(FileStatus status) const;
    [[nodiscard]] const FileReport* find(const std::filesystem::path& path) const;
};

/**
 * @brief Maps MIME types to processors and dispatches files and directory trees
 *
 * Each MIME type is claimed by the first registered processor that declares it. Per-file
 * failures never escape: they are recorded in the file's report and the walk continues.
 */
class ProcessorRegistry {
public:
    ProcessorRegistry();
    explicit ProcessorRegistry(const detection::FileTypeDetector& detector);

    ProcessorRegistry(ProcessorRegistry&&) noexcept = default;
    ProcessorRegistry& operator=(ProcessorRegistry&&) noexcept = default;
    ProcessorRegistry(const ProcessorRegistry&) = delete;
    ProcessorRegistry& operator=(const ProcessorRegistry&) = delete;

    /**
     * @brief Registry with every built-in processor, configured from config
     */
    static ProcessorRegistry createDefault(const config::ExtractionConfig& config = {});

    /**
     * @brief Register a processor for the MIME types it declares
     * @return True if at least one type was newly claimed; a processor claiming nothing is dropped
     */
    bool registerProcessor(std::unique_ptr<LanguageProcessor> processor);

    /**
     * @brief Processor claiming a MIME type, or nullptr
     */
    LanguageProcessor* processorFor(const std::string& mimeType) const;

    /**
     * @brief Startup consistency check
     *
     * Every extractable MIME type of the detector must be claimed, every declared type must be
     * one the detector can produce, and no two processors may share a ProcessorKind.
     * @return InvalidState describing every defect found
     */
    Result<void> validateCoverage(const detection::FileTypeDetector& detector) const;

    /**
     * @brief Detect and dispatch one file
     * @return Report, or the detection error (FileNotFound/PermissionDenied) or NotSupported
     */
    Result<FileReport> processFile(const std::filesystem::path& path);

    /**
     * @brief Depth-first walk dispatching every regular file
     * @param extraIgnores Directory names skipped in addition to the default ignore set
     */
    DirectoryReport processDirectory(const std::filesystem::path& root,
                                     const std::vector<std::string>& extraIgnores = {});

    /**
     * @brief Each processor's live table, in registration order
     */
    std::vector<std::pair<ProcessorKind, const ElementTable*>> tables() const;

    const ElementTable* tableFor(ProcessorKind kind) const;

    std::vector<std::string> supportedTypes() const;

    std::size_t size() const { return processors_.size(); }

private:
    const detection::FileTypeDetector* detector_;
    std::vector<std::unique_ptr<LanguageProcessor>> processors_;
    std::unordered_map<std::string, LanguageProcessor*> dispatch_;
    std::vector<std::string> configIgnores_;
};

} // namespace strata::extraction
