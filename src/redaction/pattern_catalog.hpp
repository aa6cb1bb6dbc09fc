#ifndef PIIRELAY_REDACTION_PATTERN_CATALOG_HPP
#define PIIRELAY_REDACTION_PATTERN_CATALOG_HPP

#include <algorithm>
#include <string>
#include <vector>
#include <regex>
#include <stdexcept>
#include <cstddef>
#include "placeholder_grammar.hpp"

/**
 * @file pattern_catalog.hpp
 * @brief Ordered set of named detection rules (label -> matcher).
 *
 * DESIGN GOALS:
 *   - Few false positives rather than exhaustive detection.
 *   - Categories are evaluated in declared order. An earlier category claims a
 *     span because later categories scan text it has already redacted.
 *   - Matching is stateless: findAll() returns every non-overlapping match of
 *     one category, left to right, and keeps no cursor between calls.
 *   - Input length is unbounded but match length is not. The regex only ever
 *     runs over windows of twice a category's maxLength, and only around the
 *     category's anchor characters. libstdc++ std::regex recurses once per
 *     character of a repeated class, so an unbounded run would exhaust the stack.
 *   - The catalog is immutable after construction and safe to share between
 *     threads (std::regex is only used through const member functions).
 *
 * USAGE EXAMPLE:
 *   @code
 *   using namespace piirelay::redaction;
 *
 *   const PatternCatalog &catalog = PatternCatalog::standard();
 *   for (const auto &m : catalog.findAll(catalog.find("EMAIL"), "mail a@b.com")) {
 *       // m.offset == 5, m.text == "a@b.com"
 *   }
 *   @endcode
 */

namespace piirelay {
namespace redaction {

/**
 * @struct CategoryDefinition
 * @brief Source form of a category.
 *
 * rejectWordCharBefore emulates a negative look-behind on \w, which ECMAScript
 * std::regex lacks. maxLength is the longest text a match may span; longer
 * candidates are not reported. anchorChars, when set, lists characters of which
 * every match contains at least one; text without them is never handed to the regex.
 */
struct CategoryDefinition
{
    std::string label;
    std::string pattern;
    bool rejectWordCharBefore;
    size_t maxLength = 256;
    std::string anchorChars;
};

/**
 * @struct Category
 * @brief Compiled (label, matcher) pair.
 */
struct Category
{
    std::string label;
    std::string pattern;
    std::regex matcher;
    bool rejectWordCharBefore;
    size_t maxLength;
    std::string anchorChars;
};

/**
 * @struct PatternMatch
 * @brief One matched substring and its byte offset in the scanned text.
 */
struct PatternMatch
{
    size_t offset;
    std::string text;
};

class PatternCatalog
{
public:
    /**
     * @brief Compile a catalog from definitions, keeping their order.
     * @throw std::invalid_argument on an empty list, a malformed or duplicate
     *        label, a zero maxLength, or a pattern std::regex rejects.
     */
    explicit PatternCatalog(const std::vector<CategoryDefinition> &definitions)
        : grammar_(collectLabels(definitions))
    {
        categories_.reserve(definitions.size());
        for (const auto &def : definitions) {
            if (def.maxLength == 0) {
                throw std::invalid_argument("PatternCatalog: zero maxLength for " + def.label);
            }
            try {
                categories_.push_back(Category{def.label, def.pattern,
                    std::regex(def.pattern, std::regex::ECMAScript | std::regex::optimize),
                    def.rejectWordCharBefore, def.maxLength, def.anchorChars});
            }
            catch (const std::regex_error &ex) {
                throw std::invalid_argument("PatternCatalog: bad pattern for " + def.label
                                            + ": " + ex.what());
            }
        }
    }

    /**
     * @brief The built-in SSN / EMAIL / PHONE_NUMBER catalog, in that order.
     */
    static const std::vector<CategoryDefinition> &standardDefinitions()
    {
        static const std::vector<CategoryDefinition> definitions = {
            {"SSN", R"(\b\d{3}-\d{2}-\d{4}\b)", false, 11, "-"},
            // 254 is the longest address SMTP accepts.
            {"EMAIL", R"(\b[A-Za-z0-9._%+-]+@[A-Za-z0-9.-]+\.[A-Za-z]{2,}\b)", false, 254, "@"},
            // Optional +CC, optional (area), separators . - or space.
            // Longest form: "+123 (555) 123 4567".
            {"PHONE_NUMBER", R"((?:\+\d{1,3}[ .-]?)?(?:\(\d{3}\)|\d{3})[ .-]?\d{3}[ .-]?\d{4}(?!\w))", true,
             19, "0123456789"},
        };
        return definitions;
    }

    /**
     * @brief Process-wide standard catalog, built once on first use.
     */
    static const PatternCatalog &standard()
    {
        static const PatternCatalog catalog(standardDefinitions());
        return catalog;
    }

    const std::vector<Category> &categories() const { return categories_; }
    const std::vector<std::string> &labels() const { return grammar_.labels(); }
    const PlaceholderGrammar &grammar() const { return grammar_; }

    /**
     * @brief Look up a category by label.
     * @throw std::out_of_range if the label is not in the catalog.
     */
    inline const Category &find(const std::string &label) const
    {
        for (const auto &c : categories_) {
            if (c.label == label) {
                return c;
            }
        }
        throw std::out_of_range("PatternCatalog: unknown label " + label);
    }

    /**
     * @brief All non-overlapping matches of one category in text, in order of offset.
     *
     * The text is searched in windows [start, start + 2 * maxLength). Only a
     * match that starts at least maxLength before the window end is taken as
     * is: it cannot have been cut short by the window. A match closer to the
     * end is searched again from its own start. A window without any match
     * lets the search skip to maxLength before its end.
     */
    inline std::vector<PatternMatch> findAll(const Category &category, const std::string &text) const
    {
        std::vector<PatternMatch> matches;
        const size_t size = text.size();
        const size_t bound = category.maxLength;
        size_t pos = 0;
        std::smatch m;

        while (pos < size) {
            size_t start = pos;
            if (!category.anchorChars.empty()) {
                const size_t anchor = text.find_first_of(category.anchorChars, pos);
                if (anchor == std::string::npos) {
                    break;
                }
                // Earliest start of a match that can reach the anchor.
                if (anchor - pos >= bound) {
                    start = anchor - (bound - 1);
                }
            }
            const size_t limit = std::min(size, start + 2 * bound);
            const bool windowed = limit < size;

            auto flags = std::regex_constants::match_default;
            if (start > 0) {
                flags |= std::regex_constants::match_prev_avail;
            }
            if (windowed) {
                // \b must not see the window end as the end of a word.
                flags |= std::regex_constants::match_not_eow;
            }

            const auto first = text.cbegin() + static_cast<std::ptrdiff_t>(start);
            const auto last = text.cbegin() + static_cast<std::ptrdiff_t>(limit);
            if (!std::regex_search(first, last, m, category.matcher, flags)) {
                pos = windowed ? limit - bound : size;
                continue;
            }

            const size_t offset = static_cast<size_t>(m[0].first - text.cbegin());
            const size_t length = static_cast<size_t>(m.length(0));

            if (windowed && offset + bound >= limit) {
                pos = offset;
                continue;
            }
            if (length == 0 || length > bound
                || (category.rejectWordCharBefore && offset > 0 && isWordChar(text[offset - 1]))) {
                // Retry one character further on, like a failed look-behind would.
                pos = offset + 1;
                continue;
            }

            matches.push_back(PatternMatch{offset, m.str(0)});
            pos = offset + length;
        }
        return matches;
    }

    inline std::vector<PatternMatch> findAll(const std::string &label, const std::string &text) const
    {
        return findAll(find(label), text);
    }

private:
    static bool isWordChar(char c)
    {
        return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_';
    }

    static bool isValidLabel(const std::string &label)
    {
        if (label.empty() || label[0] < 'A' || label[0] > 'Z') {
            return false;
        }
        for (char c : label) {
            if (!((c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_')) {
                return false;
            }
        }
        return true;
    }

    static std::vector<std::string> collectLabels(const std::vector<CategoryDefinition> &definitions)
    {
        if (definitions.empty()) {
            throw std::invalid_argument("PatternCatalog: no categories given");
        }
        std::vector<std::string> labels;
        for (const auto &def : definitions) {
            if (!isValidLabel(def.label)) {
                throw std::invalid_argument("PatternCatalog: invalid label '" + def.label + "'");
            }
            for (const auto &seen : labels) {
                if (seen == def.label) {
                    throw std::invalid_argument("PatternCatalog: duplicate label " + def.label);
                }
            }
            labels.push_back(def.label);
        }
        return labels;
    }

    PlaceholderGrammar grammar_;
    std::vector<Category> categories_;
};

} // namespace redaction
} // namespace piirelay

#endif // PIIRELAY_REDACTION_PATTERN_CATALOG_HPP
