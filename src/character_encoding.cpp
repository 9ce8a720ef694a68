#include "sbeir/character_encoding.hpp"
#include "sbeir/errors.hpp"

#include <iconv.h>

#include <cerrno>

namespace sbeir {

namespace {

const iconv_t INVALID_ICONV = reinterpret_cast<iconv_t>(-1);

// Owns an iconv conversion descriptor
class Converter {
public:
    Converter(std::string_view to, std::string_view from)
        : cd_(iconv_open(std::string(to).c_str(), std::string(from).c_str())) {
        if (cd_ == INVALID_ICONV) {
            throw FormatError("Unsupported character encoding conversion: " +
                              std::string(from) + " -> " + std::string(to));
        }
    }
    ~Converter() { iconv_close(cd_); }

    Converter(const Converter&) = delete;
    Converter& operator=(const Converter&) = delete;

    [[nodiscard]] iconv_t get() const { return cd_; }

private:
    iconv_t cd_;
};

bool isUtf8(std::string_view encoding) {
    return encoding == "UTF-8" || encoding == "utf-8" || encoding == "UTF8" || encoding == "utf8";
}

std::vector<uint8_t> convert(const char* input, size_t length,
                             std::string_view to, std::string_view from) {
    Converter converter(to, from);

    std::vector<uint8_t> out;
    if (length == 0) {
        return out;
    }

    // Worst case for the encodings in use is 4 output bytes per input byte,
    // plus room for a byte order mark.
    out.resize(length * 4 + 4);

    char* in = const_cast<char*>(input);
    size_t inLeft = length;
    char* outPtr = reinterpret_cast<char*>(out.data());
    size_t outLeft = out.size();

    while (inLeft > 0) {
        size_t rc = iconv(converter.get(), &in, &inLeft, &outPtr, &outLeft);
        if (rc != static_cast<size_t>(-1)) {
            continue;
        }
        if (errno == E2BIG) {
            size_t used = out.size() - outLeft;
            out.resize(out.size() * 2);
            outPtr = reinterpret_cast<char*>(out.data()) + used;
            outLeft = out.size() - used;
            continue;
        }
        throw FormatError("Cannot convert text from " + std::string(from) +
                          " to " + std::string(to) + " at byte " +
                          std::to_string(length - inLeft));
    }

    out.resize(out.size() - outLeft);
    return out;
}

}  // namespace

bool isSupportedEncoding(std::string_view encoding) {
    if (encoding.empty()) return false;
    if (isUtf8(encoding)) return true;

    iconv_t cd = iconv_open(std::string(encoding).c_str(), "UTF-8");
    if (cd == INVALID_ICONV) {
        return false;
    }
    iconv_close(cd);
    return true;
}

std::vector<uint8_t> encodeText(std::string_view utf8, std::string_view encoding) {
    if (isUtf8(encoding)) {
        // Still run through iconv to reject malformed UTF-8
        return convert(utf8.data(), utf8.size(), DEFAULT_CHARACTER_ENCODING, DEFAULT_CHARACTER_ENCODING);
    }
    return convert(utf8.data(), utf8.size(), encoding, DEFAULT_CHARACTER_ENCODING);
}

std::string decodeText(std::span<const uint8_t> bytes, std::string_view encoding) {
    if (isUtf8(encoding)) {
        return std::string(bytes.begin(), bytes.end());
    }
    auto utf8 = convert(reinterpret_cast<const char*>(bytes.data()), bytes.size(),
                        DEFAULT_CHARACTER_ENCODING, encoding);
    return std::string(utf8.begin(), utf8.end());
}

}  // namespace sbeir
