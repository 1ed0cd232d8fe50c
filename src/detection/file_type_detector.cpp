#include <strata/detection/file_type_detector.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <mutex>
#include <optional>
#include <string_view>

#ifdef STRATA_HAS_LIBMAGIC
#include <magic.h>
#endif

namespace strata::detection {

namespace {
// Extension to MIME type mapping
const std::unordered_map<std::string, std::string> EXTENSION_MIME_MAP = {
    // Structured formats with a processor
    {".py", "text/x-python"},
    {".pyw", "text/x-python"},
    {".pyi", "text/x-python"},
    {".js", "application/javascript"},
    {".mjs", "application/javascript"},
    {".cjs", "application/javascript"},
    {".jsx", "application/javascript"},
    {".yaml", "application/x-yaml"},
    {".yml", "application/x-yaml"},
    {".md", "text/markdown"},
    {".markdown", "text/markdown"},
    {".mdx", "text/mdx"},
    {".ipynb", "application/x-ipynb+json"},
    {".json", "application/json"},
    {".sh", "application/x-sh"},
    {".bash", "application/x-sh"},

    // Text formats without a processor
    {".txt", "text/plain"},
    {".rst", "text/x-rst"},
    {".html", "text/html"},
    {".htm", "text/html"},
    {".css", "text/css"},
    {".xml", "application/xml"},
    {".csv", "text/csv"},
    {".toml", "text/x-toml"},
    {".ini", "text/x-ini"},
    {".ts", "application/typescript"},
    {".cpp", "text/x-c++"},
    {".hpp", "text/x-c++"},
    {".c", "text/x-c"},
    {".h", "text/x-c"},

    // Binary formats commonly found in repositories
    {".png", "image/png"},
    {".jpg", "image/jpeg"},
    {".jpeg", "image/jpeg"},
    {".gif", "image/gif"},
    {".pdf", "application/pdf"},
    {".zip", "application/zip"},
    {".gz", "application/gzip"},
    {".so", "application/x-sharedlib"},
    {".pyc", "application/x-python-code"}};

const std::vector<std::string> EXTRACTABLE_MIME_TYPES = {
    "text/x-python", "application/javascript",   "application/x-sh",  "application/x-yaml",
    "text/markdown", "text/mdx",                 "application/x-ipynb+json", "application/json"};

const std::set<std::string> DEFAULT_IGNORE_DIRS = {
    ".git",        ".hg",           ".svn", "__pycache__", "node_modules",
    "venv",        ".venv",         "ds_venv", "dw_env",   ".mypy_cache",
    ".pytest_cache", ".tox",        "build", "dist"};

// libmagic reports some script types under names the extension table does not use
const std::unordered_map<std::string, std::string> LIBMAGIC_ALIASES = {
    {"text/x-script.python", "text/x-python"},
    {"text/x-python3", "text/x-python"},
    {"application/x-python", "text/x-python"},
    {"text/javascript", "application/javascript"},
    {"application/x-javascript", "application/javascript"},
    {"text/x-shellscript", "application/x-sh"},
    {"text/yaml", "application/x-yaml"},
    {"text/x-yaml", "application/x-yaml"}};

std::string_view skipWhitespace(std::string_view text) {
    size_t i = 0;
    // UTF-8 BOM
    if (text.size() >= 3 && static_cast<unsigned char>(text[0]) == 0xEF &&
        static_cast<unsigned char>(text[1]) == 0xBB &&
        static_cast<unsigned char>(text[2]) == 0xBF) {
        i = 3;
    }
    while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i]))) {
        ++i;
    }
    return text.substr(i);
}

std::string_view firstLine(std::string_view text) {
    auto nl = text.find('\n');
    return nl == std::string_view::npos ? text : text.substr(0, nl);
}

} // namespace

class FileTypeDetector::Impl {
public:
    FileTypeDetectorConfig config;
    mutable std::mutex configMutex;

#ifdef STRATA_HAS_LIBMAGIC
    magic_t magicCookie = nullptr;
    mutable std::mutex magicMutex; // libmagic handles are not thread-safe
#endif

    Impl() = default;

    ~Impl() {
#ifdef STRATA_HAS_LIBMAGIC
        if (magicCookie) {
            std::lock_guard<std::mutex> lock(magicMutex);
            magic_close(magicCookie);
        }
#endif
    }

    Result<void> initializeLibMagic() {
#ifdef STRATA_HAS_LIBMAGIC
        std::lock_guard<std::mutex> lock(magicMutex);
        if (magicCookie) {
            return {};
        }

        magicCookie = magic_open(MAGIC_MIME_TYPE | MAGIC_ERROR);
        if (!magicCookie) {
            return Error{ErrorCode::InternalError, "Failed to initialize libmagic"};
        }

        if (magic_load(magicCookie, nullptr) != 0) {
            std::string error = magic_error(magicCookie);
            magic_close(magicCookie);
            magicCookie = nullptr;
            return Error{ErrorCode::InternalError, "Failed to load magic database: " + error};
        }
        return {};
#else
        return Error{ErrorCode::NotSupported, "libmagic not available"};
#endif
    }

    Result<std::string> detectWithLibMagic(std::span<const std::byte> data [[maybe_unused]]) const {
#ifdef STRATA_HAS_LIBMAGIC
        std::lock_guard<std::mutex> lock(magicMutex);
        if (!magicCookie) {
            return Error{ErrorCode::InvalidState, "libmagic not initialized"};
        }

        const char* mimeType = magic_buffer(magicCookie, data.data(), data.size());
        if (!mimeType) {
            return Error{ErrorCode::InternalError,
                         "libmagic detection failed: " + std::string(magic_error(magicCookie))};
        }

        std::string mime = mimeType;
        if (auto it = LIBMAGIC_ALIASES.find(mime); it != LIBMAGIC_ALIASES.end()) {
            mime = it->second;
        }
        return mime;
#else
        return Error{ErrorCode::NotSupported, "libmagic not available"};
#endif
    }

    static bool startsJsonToken(char c) {
        return c == '"' || c == '{' || c == '[' || c == '}' || c == ']' || c == '-' ||
               c == 't' || c == 'f' || c == 'n' || std::isdigit(static_cast<unsigned char>(c));
    }

    std::optional<std::string> sniff(std::string_view text) const {
        auto body = skipWhitespace(text);
        if (body.empty()) {
            return std::nullopt;
        }

        // Shebang
        if (body.rfind("#!", 0) == 0) {
            auto line = firstLine(body);
            if (line.find("python") != std::string_view::npos) {
                return std::string("text/x-python");
            }
            if (line.find("node") != std::string_view::npos) {
                return std::string("application/javascript");
            }
            if (line.find("sh") != std::string_view::npos) {
                return std::string("application/x-sh");
            }
            return std::nullopt;
        }

        // Brace structure: notebooks first, then generic JSON
        if (body.front() == '{' || body.front() == '[') {
            if (body.front() == '{' && body.find("\"cells\"") != std::string_view::npos) {
                return std::string("application/x-ipynb+json");
            }
            auto afterBrace = skipWhitespace(body.substr(1));
            if (afterBrace.empty() || startsJsonToken(afterBrace.front())) {
                return std::string("application/json");
            }
        }

        auto line = firstLine(body);
        if (line.rfind("---", 0) == 0 || line.rfind("%YAML", 0) == 0) {
            return std::string("application/x-yaml");
        }

        if (line.rfind("#", 0) == 0) {
            size_t hashes = 0;
            while (hashes < line.size() && line[hashes] == '#') {
                ++hashes;
            }
            if (hashes <= 6 && hashes < line.size() && line[hashes] == ' ') {
                return std::string("text/markdown");
            }
        }

        return std::nullopt;
    }
};

FileTypeDetector::FileTypeDetector() : pImpl(std::make_unique<Impl>()) {
    if (pImpl->config.useLibMagic) {
        auto result = pImpl->initializeLibMagic();
        if (!result && result.error().code != ErrorCode::NotSupported) {
            spdlog::warn("FileTypeDetector: {}", result.error().message);
        }
    }
}

FileTypeDetector::~FileTypeDetector() = default;

FileTypeDetector& FileTypeDetector::instance() {
    static FileTypeDetector instance;
    return instance;
}

Result<void> FileTypeDetector::initialize(const FileTypeDetectorConfig& config) {
    {
        std::lock_guard<std::mutex> lock(pImpl->configMutex);
        pImpl->config = config;
    }

    if (config.useLibMagic) {
        auto result = pImpl->initializeLibMagic();
        if (!result && result.error().code != ErrorCode::NotSupported) {
            return result;
        }
    }
    return {};
}

Result<FileSignature> FileTypeDetector::detectFromBuffer(std::span<const std::byte> data) const {
    if (data.empty()) {
        return Error{ErrorCode::NotFound, "Empty buffer"};
    }

    FileTypeDetectorConfig config;
    {
        std::lock_guard<std::mutex> lock(pImpl->configMutex);
        config = pImpl->config;
    }

    if (isBinaryData(data)) {
        FileSignature sig;
        sig.mimeType = kUnknownMimeType;
        sig.fileType = "binary";
        sig.method = "content";
        sig.isBinary = true;
        sig.confidence = 0.5f;
        return sig;
    }

    if (config.sniffContent) {
        std::string_view text(reinterpret_cast<const char*>(data.data()), data.size());
        if (auto mime = pImpl->sniff(text)) {
            FileSignature sig;
            sig.mimeType = *mime;
            sig.fileType = getFileTypeCategory(*mime);
            sig.method = "content";
            sig.isBinary = false;
            sig.confidence = 0.7f;
            return sig;
        }
    }

    if (config.useLibMagic) {
        if (auto mime = pImpl->detectWithLibMagic(data)) {
            FileSignature sig;
            sig.mimeType = mime.value();
            sig.fileType = getFileTypeCategory(sig.mimeType);
            sig.method = "libmagic";
            sig.isBinary = !isTextMimeType(sig.mimeType);
            sig.confidence = 0.6f;
            return sig;
        }
    }

    return Error{ErrorCode::NotFound, "No content heuristic matched"};
}

Result<FileSignature> FileTypeDetector::detectFromFile(const std::filesystem::path& path) const {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return Error{ErrorCode::FileNotFound, "File not found: " + path.string()};
    }

    std::string mimeType = getMimeTypeFromExtension(path.extension().string());
    if (mimeType != kUnknownMimeType) {
        FileSignature sig;
        sig.mimeType = mimeType;
        sig.fileType = getFileTypeCategory(mimeType);
        sig.method = "extension";
        sig.isBinary = !isTextMimeType(mimeType);
        sig.confidence = 0.9f;
        return sig;
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return Error{ErrorCode::PermissionDenied, "Cannot open file: " + path.string()};
    }

    size_t maxBytes = 0;
    {
        std::lock_guard<std::mutex> lock(pImpl->configMutex);
        maxBytes = pImpl->config.maxBytesToRead;
    }
    std::vector<std::byte> buffer(maxBytes);
    file.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
    buffer.resize(static_cast<size_t>(file.gcount()));

    if (auto sniffed = detectFromBuffer(buffer)) {
        spdlog::debug("Content-based MIME type for {}: {}", path.string(),
                      sniffed.value().mimeType);
        return sniffed;
    }

    FileSignature sig;
    sig.mimeType = kUnknownMimeType;
    sig.fileType = "unknown";
    sig.method = "fallback";
    sig.isBinary = true;
    sig.confidence = 0.0f;
    return sig;
}

MimeType FileTypeDetector::detect(const std::filesystem::path& path) const {
    auto result = detectFromFile(path);
    if (!result) {
        spdlog::debug("Detection failed for {}: {}", path.string(), result.error().message);
        return kUnknownMimeType;
    }
    return result.value().mimeType;
}

std::string FileTypeDetector::getMimeTypeFromExtension(const std::string& extension) {
    if (extension.empty()) {
        return kUnknownMimeType;
    }

    std::string ext = extension;
    if (ext[0] != '.') {
        ext = "." + ext;
    }
    std::transform(ext.begin(), ext.end(), ext.begin(), ::tolower);

    auto it = EXTENSION_MIME_MAP.find(ext);
    if (it != EXTENSION_MIME_MAP.end()) {
        return it->second;
    }
    return kUnknownMimeType;
}

const std::unordered_map<std::string, std::string>& FileTypeDetector::extensionTable() {
    return EXTENSION_MIME_MAP;
}

std::vector<std::string> FileTypeDetector::extractableMimeTypes() {
    return EXTRACTABLE_MIME_TYPES;
}

const std::set<std::string>& FileTypeDetector::defaultIgnoreDirs() {
    return DEFAULT_IGNORE_DIRS;
}

std::set<std::string> FileTypeDetector::ignoreSet(const std::vector<std::string>& extra) {
    std::set<std::string> combined = DEFAULT_IGNORE_DIRS;
    combined.insert(extra.begin(), extra.end());
    return combined;
}

bool FileTypeDetector::isTextMimeType(const std::string& mimeType) const {
    if (mimeType.rfind("text/", 0) == 0) {
        return true;
    }
    return mimeType == "application/json" || mimeType == "application/xml" ||
           mimeType == "application/javascript" || mimeType == "application/typescript" ||
           mimeType == "application/x-yaml" || mimeType == "application/x-sh" ||
           mimeType == "application/x-ipynb+json";
}

std::string FileTypeDetector::getFileTypeCategory(const std::string& mimeType) const {
    if (mimeType == "text/x-python" || mimeType == "application/javascript" ||
        mimeType == "application/typescript" || mimeType == "application/x-sh" ||
        mimeType.rfind("text/x-c", 0) == 0) {
        return "code";
    }
    if (mimeType == "application/x-ipynb+json") {
        return "notebook";
    }
    if (mimeType.rfind("image/", 0) == 0) {
        return "image";
    }
    if (isTextMimeType(mimeType)) {
        return "text";
    }
    if (mimeType == "application/zip" || mimeType == "application/gzip") {
        return "archive";
    }
    return "binary";
}

bool FileTypeDetector::hasLibMagic() const {
#ifdef STRATA_HAS_LIBMAGIC
    std::lock_guard<std::mutex> lock(pImpl->magicMutex);
    return pImpl->magicCookie != nullptr;
#else
    return false;
#endif
}

bool isBinaryData(std::span<const std::byte> data) {
    if (data.empty())
        return false;

    size_t checkLength = std::min(data.size(), size_t(512));
    size_t nullBytes = 0;
    size_t controlChars = 0;

    for (size_t i = 0; i < checkLength; ++i) {
        unsigned char c = static_cast<unsigned char>(data[i]);

        if (c == 0) {
            nullBytes++;
        } else if (c < 32 && c != '\t' && c != '\n' && c != '\r' && c != '\f') {
            controlChars++;
        }
    }

    // If we have null bytes, it's likely binary
    if (nullBytes > 0)
        return true;

    // If control characters exceed 10% of checked bytes, likely binary
    return controlChars > checkLength / 10;
}

} // namespace strata::detection
