#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <set>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

#include <strata/core/types.h>

namespace strata::detection {

inline constexpr const char* kUnknownMimeType = "application/octet-stream";

/**
 * @brief File signature information
 */
struct FileSignature {
    std::string mimeType;    ///< MIME type (e.g., "text/x-python")
    std::string fileType;    ///< File type category (e.g., "code", "text", "binary")
    std::string method;      ///< How the type was decided: extension, content, libmagic, fallback
    bool isBinary = false;   ///< Whether file is binary or text
    float confidence = 1.0f; ///< Confidence level of detection
};

/**
 * @brief Configuration for FileTypeDetector
 */
struct FileTypeDetectorConfig {
    bool useLibMagic = true;     ///< Try to use libmagic if available
    bool sniffContent = true;    ///< Inspect leading bytes when the extension is unknown
    size_t maxBytesToRead = 512; ///< Maximum bytes to read for detection
};

/**
 * @brief File type detection for the extraction pipeline
 *
 * Detection order:
 * 1. Extension table (deterministic, includes aliases such as .yml/.yaml)
 * 2. Content sniffing of the first bytes (shebang, JSON/notebook, YAML, Markdown)
 * 3. libmagic (if available at compile time)
 * 4. "application/octet-stream"
 */
class FileTypeDetector {
public:
    /**
     * @brief Get singleton instance
     */
    static FileTypeDetector& instance();

    /**
     * @brief Initialize detector with configuration
     */
    Result<void> initialize(const FileTypeDetectorConfig& config = {});

    /**
     * @brief Detect file type from file path
     * @return Signature, or FileNotFound/PermissionDenied when the file cannot be read
     */
    Result<FileSignature> detectFromFile(const std::filesystem::path& path) const;

    /**
     * @brief Detect file type from the leading bytes of a file
     * @return Signature or NotFound when no heuristic matched
     */
    Result<FileSignature> detectFromBuffer(std::span<const std::byte> data) const;

    /**
     * @brief Convenience wrapper that never fails
     * @return Detected MIME type, or kUnknownMimeType
     */
    MimeType detect(const std::filesystem::path& path) const;

    /**
     * @brief Get MIME type from file extension
     * @param extension File extension (with or without dot)
     * @return MIME type or "application/octet-stream"
     */
    static std::string getMimeTypeFromExtension(const std::string& extension);

    /**
     * @brief The extension → MIME table consulted first during detection
     */
    static const std::unordered_map<std::string, std::string>& extensionTable();

    /**
     * @brief Canonical MIME types of the formats with a structural processor
     */
    static std::vector<std::string> extractableMimeTypes();

    /**
     * @brief Directory names never descended into during a walk
     */
    static const std::set<std::string>& defaultIgnoreDirs();

    /**
     * @brief Default ignore set extended with caller-supplied names
     */
    static std::set<std::string> ignoreSet(const std::vector<std::string>& extra = {});

    bool isTextMimeType(const std::string& mimeType) const;

    std::string getFileTypeCategory(const std::string& mimeType) const;

    bool hasLibMagic() const;

    ~FileTypeDetector();

    FileTypeDetector(const FileTypeDetector&) = delete;
    FileTypeDetector& operator=(const FileTypeDetector&) = delete;
    FileTypeDetector(FileTypeDetector&&) = delete;
    FileTypeDetector& operator=(FileTypeDetector&&) = delete;

private:
    FileTypeDetector();

    class Impl;
    std::unique_ptr<Impl> pImpl;
};

/**
 * @brief Detect if buffer contains binary data
 * @param data Buffer to check
 * @return True if binary, false if likely text
 */
bool isBinaryData(std::span<const std::byte> data);

} // namespace strata::detection
