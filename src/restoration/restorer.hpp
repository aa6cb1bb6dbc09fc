#ifndef PIIRELAY_RESTORATION_RESTORER_HPP
#define PIIRELAY_RESTORATION_RESTORER_HPP

#include <string>
#include <vector>
#include "../redaction/placeholder_grammar.hpp"
#include "../redaction/placeholder_map.hpp"

namespace piirelay {
namespace restoration {

/**
 * @brief Append text[from, to) to out with every token span replaced by its
 *        mapped original. Unknown tokens are copied as they are.
 * @param spans Token spans inside [from, to), in order.
 */
inline void appendRestored(std::string &out,
                           const std::string &text,
                           size_t from,
                           size_t to,
                           const std::vector<redaction::TokenSpan> &spans,
                           const redaction::PlaceholderMap &mapping)
{
    size_t pos = from;
    for (const auto &span : spans) {
        out.append(text, pos, span.offset - pos);
        const std::string token = text.substr(span.offset, span.length);
        const std::string *original = mapping.findOriginal(token);
        out += original != nullptr ? *original : token;
        pos = span.end();
    }
    out.append(text, pos, to - pos);
}

/**
 * @brief One-shot restoration: replace every placeholder token in text with
 *        its original value.
 *
 * Single pass. Substituted values are never scanned again, even if one happens
 * to look like a token. Text without tokens comes back unchanged.
 */
inline std::string restoreAll(const std::string &text,
                              const redaction::PlaceholderMap &mapping,
                              const redaction::PlaceholderGrammar &grammar)
{
    const auto spans = grammar.scan(text);
    if (spans.empty()) {
        return text;
    }
    std::string out;
    out.reserve(text.size());
    appendRestored(out, text, 0, text.size(), spans, mapping);
    return out;
}

} // namespace restoration
} // namespace piirelay

#endif // PIIRELAY_RESTORATION_RESTORER_HPP
