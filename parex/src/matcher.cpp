#include <parex/matcher.hpp>
#include <parex/error.hpp>

#include <unicode/locid.h>
#include <unicode/unistr.h>

namespace parex {

namespace {

bool is_ascii(const std::string& text) {
    for (unsigned char c : text) {
        if (c >= 0x80) return false;
    }
    return true;
}

} // namespace

std::string unicode_lowercase(const std::string& text) {
    // Most names are plain ASCII; skip the UTF-16 round trip for them
    if (is_ascii(text)) {
        std::string lowered = text;
        for (char& c : lowered) {
            if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
        }
        return lowered;
    }

    icu::UnicodeString unicode = icu::UnicodeString::fromUTF8(text);
    unicode.toLower(icu::Locale::getRoot());

    std::string lowered;
    unicode.toUTF8String(lowered);
    return lowered;
}

SubstringMatcher::SubstringMatcher(const std::string& pattern)
    : pattern_(unicode_lowercase(pattern)) {}

bool SubstringMatcher::is_match(const Entry& entry) const {
    if (pattern_.empty()) return true;
    return unicode_lowercase(entry.name()).find(pattern_) != std::string::npos;
}

ExtensionMatcher::ExtensionMatcher(const std::string& extension) {
    std::string ext = extension;
    if (!ext.empty() && ext.front() == '.') {
        ext.erase(0, 1);
    }

    if (ext.empty()) {
        throw ParexError::invalid_pattern("empty extension");
    }
    if (ext.find('/') != std::string::npos || ext.find('\\') != std::string::npos) {
        throw ParexError::invalid_pattern("extension contains a path separator: " + extension);
    }

    extension_ = "." + unicode_lowercase(ext);
}

bool ExtensionMatcher::is_match(const Entry& entry) const {
    return unicode_lowercase(entry.path().extension().string()) == extension_;
}

} // namespace parex
