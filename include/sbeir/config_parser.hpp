#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sbeir {

// ============================================================================
// ConfigValue - A parsed configuration value
// ============================================================================

/**
 * @brief Text of a configuration value with typed conversions
 *
 * Conversions return the supplied default when the text is empty or does
 * not parse.
 */
class ConfigValue {
public:
    ConfigValue() = default;
    explicit ConfigValue(std::string_view text) : text_(text) {}

    [[nodiscard]] std::string_view asString() const { return text_; }
    [[nodiscard]] std::string asStringOwned() const { return text_; }

    [[nodiscard]] bool asBool(bool defaultVal = false) const;
    [[nodiscard]] int64_t asInt(int64_t defaultVal = 0) const;

    [[nodiscard]] bool empty() const { return text_.empty(); }

private:
    std::string text_;
};

// ============================================================================
// ConfigEntry - A key-value pair and where it came from
// ============================================================================

struct ConfigEntry {
    std::string key;
    ConfigValue value;
    std::string source;  ///< File the entry was read from (empty for strings)
    size_t line = 0;     ///< 1-based line number within source
};

// ============================================================================
// ConfigDocument - A parsed configuration file
// ============================================================================

/**
 * @brief Entries of a configuration file, in order
 *
 * Multiple entries may share a key; simple lookups return the last one.
 */
class ConfigDocument {
public:
    ConfigDocument() = default;

    void addEntry(ConfigEntry entry);

    // Lookup by key (returns last entry with this key, or nullptr)
    [[nodiscard]] const ConfigEntry* get(std::string_view key) const;

    [[nodiscard]] std::string_view getString(std::string_view key, std::string_view defaultVal = "") const;
    [[nodiscard]] int64_t getInt(std::string_view key, int64_t defaultVal = 0) const;
    [[nodiscard]] bool getBool(std::string_view key, bool defaultVal = false) const;

    [[nodiscard]] std::vector<const ConfigEntry*> getAll(std::string_view key) const;

    [[nodiscard]] const std::vector<ConfigEntry>& entries() const { return entries_; }
    [[nodiscard]] auto begin() const { return entries_.begin(); }
    [[nodiscard]] auto end() const { return entries_.end(); }
    [[nodiscard]] bool empty() const { return entries_.empty(); }
    [[nodiscard]] size_t size() const { return entries_.size(); }

private:
    std::vector<ConfigEntry> entries_;
};

// ============================================================================
// ConfigParser - Parses configuration files
// ============================================================================

/**
 * @brief Parser for line-oriented configuration files
 *
 * Format:
 * ```
 * # Comments start with #
 * validation.warnings_fatal: true
 * encoding.default: US-ASCII
 * include: site.conf
 * ```
 *
 * An `include:` line splices the entries of another file at that point, so
 * later lines still override it. Include paths are resolved relative to the
 * including file unless an IncludeResolver is set. Includes nest at most
 * MAX_INCLUDE_DEPTH levels.
 */
class ConfigParser {
public:
    using IncludeResolver = std::function<std::string(const std::string&)>;

    static constexpr int MAX_INCLUDE_DEPTH = 8;

    ConfigParser() = default;

    void setIncludeResolver(IncludeResolver resolver) { includeResolver_ = std::move(resolver); }

    /// Suppress the diagnostics written to std::cerr
    void setQuiet(bool quiet) { quiet_ = quiet; }

    /**
     * @brief Parse a configuration file
     * @return Parsed document, or nullopt if the file cannot be read
     */
    [[nodiscard]] std::optional<ConfigDocument> parseFile(const std::string& path) const;

    /**
     * @brief Parse configuration from a string
     * @param basePath Directory prefix for relative includes (may be empty)
     */
    [[nodiscard]] ConfigDocument parseString(std::string_view content,
                                             const std::string& basePath = "") const;

private:
    std::optional<ConfigDocument> parseFileAt(const std::string& path, int depth) const;
    void parseInto(std::string_view content, const std::string& source,
                   const std::string& basePath, ConfigDocument& doc, int depth) const;
    void parseLine(std::string_view line, size_t lineNumber, const std::string& source,
                   const std::string& basePath, ConfigDocument& doc, int depth) const;

    IncludeResolver includeResolver_;
    bool quiet_ = false;
};

}  // namespace sbeir
