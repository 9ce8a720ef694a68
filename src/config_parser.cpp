#include "sbeir/config_parser.hpp"

#include <cctype>
#include <charconv>
#include <fstream>
#include <iostream>
#include <sstream>

namespace sbeir {

namespace {

std::string_view trim(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

}  // namespace

// ============================================================================
// ConfigValue
// ============================================================================

bool ConfigValue::asBool(bool defaultVal) const {
    if (text_.empty()) return defaultVal;

    if (text_ == "true" || text_ == "yes" || text_ == "1" || text_ == "on") {
        return true;
    }
    if (text_ == "false" || text_ == "no" || text_ == "0" || text_ == "off") {
        return false;
    }
    return defaultVal;
}

int64_t ConfigValue::asInt(int64_t defaultVal) const {
    if (text_.empty()) return defaultVal;

    int64_t val = 0;
    auto [ptr, ec] = std::from_chars(text_.data(), text_.data() + text_.size(), val);
    if (ec != std::errc() || ptr != text_.data() + text_.size()) return defaultVal;
    return val;
}

// ============================================================================
// ConfigDocument
// ============================================================================

void ConfigDocument::addEntry(ConfigEntry entry) {
    entries_.push_back(std::move(entry));
}

const ConfigEntry* ConfigDocument::get(std::string_view key) const {
    // Later entries override earlier ones
    for (auto it = entries_.rbegin(); it != entries_.rend(); ++it) {
        if (it->key == key) {
            return &(*it);
        }
    }
    return nullptr;
}

std::string_view ConfigDocument::getString(std::string_view key, std::string_view defaultVal) const {
    if (auto* entry = get(key)) {
        auto sv = entry->value.asString();
        if (!sv.empty()) return sv;
    }
    return defaultVal;
}

int64_t ConfigDocument::getInt(std::string_view key, int64_t defaultVal) const {
    if (auto* entry = get(key)) {
        return entry->value.asInt(defaultVal);
    }
    return defaultVal;
}

bool ConfigDocument::getBool(std::string_view key, bool defaultVal) const {
    if (auto* entry = get(key)) {
        return entry->value.asBool(defaultVal);
    }
    return defaultVal;
}

std::vector<const ConfigEntry*> ConfigDocument::getAll(std::string_view key) const {
    std::vector<const ConfigEntry*> result;
    for (const auto& entry : entries_) {
        if (entry.key == key) {
            result.push_back(&entry);
        }
    }
    return result;
}

// ============================================================================
// ConfigParser
// ============================================================================

std::optional<ConfigDocument> ConfigParser::parseFile(const std::string& path) const {
    return parseFileAt(path, 0);
}

ConfigDocument ConfigParser::parseString(std::string_view content, const std::string& basePath) const {
    ConfigDocument doc;
    parseInto(content, "", basePath, doc, 0);
    return doc;
}

std::optional<ConfigDocument> ConfigParser::parseFileAt(const std::string& path, int depth) const {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    // Relative includes resolve against the including file's directory
    std::string basePath;
    auto lastSlash = path.find_last_of("/\\");
    if (lastSlash != std::string::npos) {
        basePath = path.substr(0, lastSlash + 1);
    }

    ConfigDocument doc;
    parseInto(buffer.str(), path, basePath, doc, depth);
    return doc;
}

void ConfigParser::parseInto(std::string_view content, const std::string& source,
                             const std::string& basePath, ConfigDocument& doc, int depth) const {
    std::string_view remaining = content;
    size_t lineNumber = 0;

    while (!remaining.empty()) {
        auto lineEnd = remaining.find('\n');
        std::string_view line;
        if (lineEnd == std::string_view::npos) {
            line = remaining;
            remaining = {};
        } else {
            line = remaining.substr(0, lineEnd);
            remaining = remaining.substr(lineEnd + 1);
        }
        ++lineNumber;

        // Windows line endings
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }

        parseLine(line, lineNumber, source, basePath, doc, depth);
    }
}

void ConfigParser::parseLine(std::string_view line, size_t lineNumber, const std::string& source,
                             const std::string& basePath, ConfigDocument& doc, int depth) const {
    line = trim(line);
    if (line.empty() || line.front() == '#') {
        return;
    }

    auto colonPos = line.find(':');
    if (colonPos == std::string_view::npos) {
        if (!quiet_) {
            std::cerr << "[ConfigParser] " << (source.empty() ? "<string>" : source)
                      << ":" << lineNumber << ": expected 'key: value', got '" << line << "'\n";
        }
        return;
    }

    ConfigEntry entry;
    entry.key = std::string(trim(line.substr(0, colonPos)));
    entry.value = ConfigValue(trim(line.substr(colonPos + 1)));
    entry.source = source;
    entry.line = lineNumber;

    if (entry.key != "include") {
        doc.addEntry(std::move(entry));
        return;
    }

    if (depth >= MAX_INCLUDE_DEPTH) {
        if (!quiet_) {
            std::cerr << "[ConfigParser] Include depth exceeded at "
                      << (source.empty() ? "<string>" : source) << ":" << lineNumber << "\n";
        }
        return;
    }

    std::string includePath = entry.value.asStringOwned();
    std::string resolvedPath = includeResolver_ ? includeResolver_(includePath) : basePath + includePath;

    auto included = parseFileAt(resolvedPath, depth + 1);
    if (!included) {
        if (!quiet_) {
            std::cerr << "[ConfigParser] Cannot open include file: " << resolvedPath << "\n";
        }
        return;
    }
    for (const auto& includedEntry : *included) {
        doc.addEntry(includedEntry);
    }
}

}  // namespace sbeir
