#include "sbeir/parser_options.hpp"

#include <array>
#include <iostream>
#include <string_view>

namespace sbeir {

namespace {

constexpr std::array<std::string_view, 6> KNOWN_KEYS = {
    "validation.enabled",
    "validation.warnings_fatal",
    "output.suppress",
    "xml.xinclude",
    "encoding.default",
    "schema.header_type",
};

bool isKnownKey(std::string_view key) {
    for (auto known : KNOWN_KEYS) {
        if (known == key) return true;
    }
    return false;
}

}  // namespace

ParserOptions ParserOptions::fromConfig(const ConfigDocument& doc) {
    ParserOptions options;

    options.validate = doc.getBool("validation.enabled", options.validate);
    options.warningsFatal = doc.getBool("validation.warnings_fatal", options.warningsFatal);
    options.suppressOutput = doc.getBool("output.suppress", options.suppressOutput);
    options.xincludeAware = doc.getBool("xml.xinclude", options.xincludeAware);
    options.defaultCharacterEncoding =
        std::string(doc.getString("encoding.default", options.defaultCharacterEncoding));

    if (auto* entry = doc.get("schema.header_type")) {
        if (!entry->value.empty()) {
            options.headerType = entry->value.asStringOwned();
        }
    }

    if (!options.suppressOutput) {
        for (const auto& entry : doc) {
            if (!isKnownKey(entry.key)) {
                std::cerr << "[ParserOptions] Ignoring unknown option '" << entry.key << "'";
                if (!entry.source.empty()) {
                    std::cerr << " at " << entry.source << ":" << entry.line;
                }
                std::cerr << "\n";
            }
        }
    }

    return options;
}

std::optional<ParserOptions> ParserOptions::loadFile(const std::string& path) {
    ConfigParser parser;
    auto doc = parser.parseFile(path);
    if (!doc) {
        return std::nullopt;
    }
    return fromConfig(*doc);
}

}  // namespace sbeir
