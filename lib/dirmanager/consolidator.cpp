#include "consolidator.hpp"

#include <unordered_set>
#include <utility>

#include "nameindex.hpp"

Consolidator::Result Consolidator::collect(const TreeWalker& walker,
                                           const std::filesystem::path& root,
                                           const std::string& extension) const {
    Result result;
    std::unordered_set<std::string> seen;

    IndexFilter filter;
    filter.kind = Entry::Kind::File;
    filter.extension = IndexFilter::normalizeExtension(extension);

    walker.walk(root, [&](const Entry& entry) {
        if (!filter.matches(entry)) {
            return;
        }

        std::string raw;
        if (auto ec = m_fs.readText(entry.getPath(), raw)) {
            result.failures.push_back(ReadFailure{entry.getPath(), ec.message()});
            return;
        }
        if (!isValidUtf8(raw)) {
            result.failures.push_back(ReadFailure{entry.getPath(), "not valid UTF-8 text"});
            return;
        }
        ++result.filesRead;

        std::string content = strip(normalizeNewlines(raw));
        if (content.empty()) {
            return;
        }

        if (seen.insert(content).second) {
            result.contents.push_back(std::move(content));
        }
    });

    return result;
}

std::string Consolidator::render(const std::vector<std::string>& contents) {
    std::string out;
    for (std::size_t i = 0; i < contents.size(); ++i) {
        if (i > 0) {
            out += "\n\n";
        }
        out += contents[i];
    }
    return out;
}

std::string Consolidator::strip(const std::string& text) {
    static const char* const whitespace = " \t\n\r\f\v";

    const auto first = text.find_first_not_of(whitespace);
    if (first == std::string::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(whitespace);
    return text.substr(first, last - first + 1);
}

std::string Consolidator::normalizeNewlines(const std::string& text) {
    std::string out;
    out.reserve(text.size());

    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '\r') {
            out.push_back('\n');
            if (i + 1 < text.size() && text[i + 1] == '\n') {
                ++i;
            }
            continue;
        }
        out.push_back(text[i]);
    }
    return out;
}

/**
 * @brief Checks that text is well-formed UTF-8
 *
 * Rejects truncated sequences, overlong encodings, UTF-16 surrogates and
 * code points above U+10FFFF.
 */
bool Consolidator::isValidUtf8(const std::string& text) {
    const auto* bytes = reinterpret_cast<const unsigned char*>(text.data());
    const std::size_t size = text.size();

    std::size_t i = 0;
    while (i < size) {
        const unsigned char lead = bytes[i];
        if (lead < 0x80) {
            ++i;
            continue;
        }

        std::size_t length = 0;
        unsigned int codePoint = 0;
        if (lead >= 0xC2 && lead <= 0xDF) {
            length = 2;
            codePoint = lead & 0x1F;
        } else if (lead >= 0xE0 && lead <= 0xEF) {
            length = 3;
            codePoint = lead & 0x0F;
        } else if (lead >= 0xF0 && lead <= 0xF4) {
            length = 4;
            codePoint = lead & 0x07;
        } else {
            return false;
        }

        if (i + length > size) {
            return false;
        }
        for (std::size_t k = 1; k < length; ++k) {
            const unsigned char next = bytes[i + k];
            if ((next & 0xC0) != 0x80) {
                return false;
            }
            codePoint = (codePoint << 6) | (next & 0x3F);
        }

        if ((length == 3 && codePoint < 0x800) ||
            (length == 4 && (codePoint < 0x10000 || codePoint > 0x10FFFF)) ||
            (codePoint >= 0xD800 && codePoint <= 0xDFFF)) {
            return false;
        }
        i += length;
    }
    return true;
}
