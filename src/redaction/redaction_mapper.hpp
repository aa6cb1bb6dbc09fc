#ifndef PIIRELAY_REDACTION_REDACTION_MAPPER_HPP
#define PIIRELAY_REDACTION_REDACTION_MAPPER_HPP

#include <string>
#include <cstdint>
#include <stdexcept>
#include <unordered_map>
#include "pattern_catalog.hpp"
#include "placeholder_map.hpp"
#include "../util/logger.hpp"

/**
 * @file redaction_mapper.hpp
 * @brief Replaces sensitive substrings with typed placeholder tokens and
 *        returns the token -> original mapping needed to reverse it.
 *
 * DESIGN GOALS:
 *   - Reversible: unlike a "[REDACTED]" stripper, every value gets a stable
 *     token (SSN_0001, EMAIL_0001, ...) and the mapping is returned.
 *   - One token per distinct value: repeated occurrences collapse onto it.
 *   - No shared counters. All per-pass state lives in a RedactionState local to
 *     redact(), so one mapper can serve concurrent requests.
 *
 * USAGE EXAMPLE:
 *   @code
 *   using namespace piirelay::redaction;
 *
 *   RedactionMapper mapper(PatternCatalog::standard());
 *   RedactionResult r = mapper.redact("a@b.com called a@b.com");
 *   // r.redactedText == "EMAIL_0001 called EMAIL_0001"
 *   // r.mapping has one entry: EMAIL_0001 -> a@b.com
 *   @endcode
 */

namespace piirelay {
namespace redaction {

/**
 * @struct RedactionResult
 * @brief Output of one redaction pass.
 */
struct RedactionResult
{
    std::string redactedText;
    PlaceholderMap mapping;
};

/**
 * @struct RedactionState
 * @brief Mapping plus per-label counters for a single pass.
 */
struct RedactionState
{
    PlaceholderMap mapping;
    std::unordered_map<std::string, uint32_t> counters;

    /**
     * @brief Next sequence number for label, starting at 1.
     * @throw std::overflow_error once the grammar's digit width is exhausted.
     */
    inline uint32_t nextSequence(const std::string &label, uint32_t maxSequence)
    {
        uint32_t &counter = counters[label];
        if (counter >= maxSequence) {
            throw std::overflow_error("RedactionMapper: placeholder space exhausted for " + label);
        }
        return ++counter;
    }
};

/**
 * @brief Replace every occurrence of needle in haystack in one left-to-right pass.
 */
inline std::string replaceAllLiteral(const std::string &haystack,
                                     const std::string &needle,
                                     const std::string &replacement)
{
    if (needle.empty()) {
        return haystack;
    }
    std::string out;
    out.reserve(haystack.size());
    size_t pos = 0;
    for (size_t hit = haystack.find(needle); hit != std::string::npos; hit = haystack.find(needle, pos)) {
        out.append(haystack, pos, hit - pos);
        out += replacement;
        pos = hit + needle.size();
    }
    out.append(haystack, pos, std::string::npos);
    return out;
}

/**
 * @class RedactionMapper
 * @brief Forward transform: text -> (text with placeholders, mapping).
 */
class RedactionMapper
{
public:
    explicit RedactionMapper(const PatternCatalog &catalog)
        : catalog_(catalog)
    {
    }

    /**
     * @brief Redact text against the catalog.
     *
     * Each category scans the current buffer, not the original input, so a span
     * already replaced by an earlier category cannot be matched again.
     *
     * @throw std::overflow_error if a label needs more tokens than the digit width allows.
     */
    inline RedactionResult redact(const std::string &text) const
    {
        RedactionState state;
        std::string buffer = text;
        const PlaceholderGrammar &grammar = catalog_.grammar();

        for (const auto &category : catalog_.categories()) {
            const auto matches = catalog_.findAll(category, buffer);
            for (const auto &match : matches) {
                if (state.mapping.findToken(match.text) != nullptr) {
                    continue;
                }
                const std::string token = grammar.makeToken(
                    category.label, state.nextSequence(category.label, grammar.maxSequence()));
                state.mapping.insert(token, match.text);
                buffer = replaceAllLiteral(buffer, match.text, token);
            }
        }

        if (!state.mapping.empty()) {
            piirelay::util::logger::debug("RedactionMapper: replaced "
                + std::to_string(state.mapping.size()) + " distinct value(s)");
        }
        return RedactionResult{std::move(buffer), std::move(state.mapping)};
    }

    const PatternCatalog &catalog() const { return catalog_; }

private:
    const PatternCatalog &catalog_;
};

} // namespace redaction
} // namespace piirelay

#endif // PIIRELAY_REDACTION_REDACTION_MAPPER_HPP
