#include <strata/extraction/extraction_util.h>

#include <algorithm>
#include <cctype>

namespace strata::extraction::util {

namespace {

bool isUrlTerminator(char c) {
    return std::isspace(static_cast<unsigned char>(c)) || c == '"' || c == '\'' || c == '`' ||
           c == '<' || c == '>' || c == ')' || c == ']' || c == '}';
}

bool isEnvChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

void addUnique(std::vector<std::string>& out, std::string value) {
    if (!value.empty() && std::find(out.begin(), out.end(), value) == out.end()) {
        out.push_back(std::move(value));
    }
}

} // namespace

std::vector<std::string> findUrls(std::string_view text) {
    std::vector<std::string> out;
    size_t pos = 0;
    while (pos < text.size()) {
        size_t http = text.find("http", pos);
        if (http == std::string_view::npos) {
            break;
        }
        auto rest = text.substr(http);
        size_t schemeLen = 0;
        if (rest.rfind("https://", 0) == 0) {
            schemeLen = 8;
        } else if (rest.rfind("http://", 0) == 0) {
            schemeLen = 7;
        }
        if (schemeLen == 0) {
            pos = http + 4;
            continue;
        }

        size_t end = http + schemeLen;
        while (end < text.size() && !isUrlTerminator(text[end])) {
            ++end;
        }
        // Trailing punctuation belongs to the surrounding sentence
        while (end > http + schemeLen && (text[end - 1] == '.' || text[end - 1] == ',' ||
                                          text[end - 1] == ';' || text[end - 1] == ':')) {
            --end;
        }
        if (end > http + schemeLen) {
            addUnique(out, std::string(text.substr(http, end - http)));
        }
        pos = end;
    }
    return out;
}

std::vector<std::string> findEnvVars(std::string_view text) {
    std::vector<std::string> out;
    for (size_t i = 0; i + 1 < text.size(); ++i) {
        if (text[i] != '$') {
            continue;
        }
        if (text[i + 1] == '{') {
            size_t start = i + 2;
            size_t end = start;
            while (end < text.size() && isEnvChar(text[end])) {
                ++end;
            }
            if (end > start && end < text.size() && (text[end] == '}' || text[end] == ':')) {
                addUnique(out, std::string(text.substr(start, end - start)));
            }
            i = end;
        } else if (std::isalpha(static_cast<unsigned char>(text[i + 1])) || text[i + 1] == '_') {
            size_t start = i + 1;
            size_t end = start;
            while (end < text.size() && isEnvChar(text[end])) {
                ++end;
            }
            addUnique(out, std::string(text.substr(start, end - start)));
            i = end - 1;
        }
    }
    return out;
}

std::vector<std::string_view> splitLines(std::string_view text) {
    std::vector<std::string_view> lines;
    size_t start = 0;
    while (start < text.size()) {
        size_t nl = text.find('\n', start);
        size_t end = nl == std::string_view::npos ? text.size() : nl;
        auto line = text.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        lines.push_back(line);
        if (nl == std::string_view::npos) {
            break;
        }
        start = nl + 1;
    }
    return lines;
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.remove_prefix(1);
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.remove_suffix(1);
    }
    return s;
}

bool isUpperSnakeCase(std::string_view s) {
    bool hasLetter = false;
    for (char c : s) {
        if (std::isupper(static_cast<unsigned char>(c))) {
            hasLetter = true;
        } else if (!std::isdigit(static_cast<unsigned char>(c)) && c != '_') {
            return false;
        }
    }
    return hasLetter && !std::isdigit(static_cast<unsigned char>(s.front()));
}

} // namespace strata::extraction::util
