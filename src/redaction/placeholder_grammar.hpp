#ifndef PIIRELAY_REDACTION_PLACEHOLDER_GRAMMAR_HPP
#define PIIRELAY_REDACTION_PLACEHOLDER_GRAMMAR_HPP

#include <string>
#include <vector>
#include <regex>
#include <algorithm>
#include <stdexcept>
#include <cstdint>
#include <cstddef>

/**
 * @file placeholder_grammar.hpp
 * @brief The token syntax shared by redaction and both restoration modes.
 *
 * A placeholder token is "<LABEL>_<seq>": LABEL from a closed label set, seq a
 * zero-padded decimal counter of fixed width (4 by default). Tokens are only
 * recognised on word boundaries, so "xEMAIL_0001" or "EMAIL_00012" are plain
 * text.
 *
 * USAGE EXAMPLE:
 *   @code
 *   PlaceholderGrammar grammar({"SSN", "EMAIL", "PHONE_NUMBER"});
 *   grammar.makeToken("EMAIL", 1);      // "EMAIL_0001"
 *   grammar.maxTokenLength();           // 17 ("PHONE_NUMBER_0000")
 *   auto spans = grammar.scan("mail EMAIL_0001 now");
 *   @endcode
 */

namespace piirelay {
namespace redaction {

/**
 * @struct TokenSpan
 * @brief Byte range of one placeholder token inside a scanned string.
 */
struct TokenSpan
{
    size_t offset;
    size_t length;

    size_t end() const { return offset + length; }
};

class PlaceholderGrammar
{
public:
    static constexpr size_t kDefaultDigitWidth = 4;

    /**
     * @brief Build the grammar for a label set.
     * @throw std::invalid_argument if labels is empty or digitWidth is out of [1, 9].
     */
    explicit PlaceholderGrammar(const std::vector<std::string> &labels,
                                size_t digitWidth = kDefaultDigitWidth)
        : labels_(labels)
        , digitWidth_(digitWidth)
        , maxTokenLength_(0)
        , maxSequence_(0)
    {
        if (labels_.empty()) {
            throw std::invalid_argument("PlaceholderGrammar: label set is empty");
        }
        if (digitWidth_ == 0 || digitWidth_ > 9) {
            throw std::invalid_argument("PlaceholderGrammar: digit width must be in [1, 9]");
        }

        size_t longestLabel = 0;
        std::string alternatives;
        for (const auto &label : labels_) {
            longestLabel = std::max(longestLabel, label.size());
            if (!alternatives.empty()) {
                alternatives += "|";
            }
            alternatives += label;
        }
        maxTokenLength_ = longestLabel + 1 + digitWidth_;

        maxSequence_ = 1;
        for (size_t i = 0; i < digitWidth_; ++i) {
            maxSequence_ *= 10;
        }
        maxSequence_ -= 1;

        // Labels are validated by the catalog to [A-Z][A-Z0-9_]*, no escaping needed.
        pattern_ = std::regex("\\b(?:" + alternatives + ")_\\d{" + std::to_string(digitWidth_) + "}\\b",
                              std::regex::ECMAScript | std::regex::optimize);
    }

    /**
     * @brief Format a token, e.g. ("EMAIL", 7) -> "EMAIL_0007".
     * @throw std::out_of_range if sequence does not fit the digit width.
     */
    inline std::string makeToken(const std::string &label, uint32_t sequence) const
    {
        if (sequence == 0 || sequence > maxSequence_) {
            throw std::out_of_range("PlaceholderGrammar: sequence " + std::to_string(sequence)
                                    + " does not fit " + std::to_string(digitWidth_) + " digits");
        }
        std::string digits = std::to_string(sequence);
        return label + "_" + std::string(digitWidth_ - digits.size(), '0') + digits;
    }

    /**
     * @brief Find all tokens in text[from, end), left to right, non-overlapping.
     *
     * When from > 0 the character text[from - 1] is used as context for the
     * leading word boundary but is never part of a result.
     */
    inline std::vector<TokenSpan> scan(const std::string &text, size_t from = 0) const
    {
        std::vector<TokenSpan> spans;
        if (from >= text.size()) {
            return spans;
        }

        auto it = text.cbegin() + static_cast<std::ptrdiff_t>(from);
        auto flags = from > 0 ? std::regex_constants::match_prev_avail
                              : std::regex_constants::match_default;
        std::smatch m;
        while (it != text.cend() && std::regex_search(it, text.cend(), m, pattern_, flags)) {
            TokenSpan span{static_cast<size_t>(m[0].first - text.cbegin()),
                           static_cast<size_t>(m.length(0))};
            spans.push_back(span);
            it = text.cbegin() + static_cast<std::ptrdiff_t>(span.end());
            flags = std::regex_constants::match_prev_avail;
        }
        return spans;
    }

    const std::vector<std::string> &labels() const { return labels_; }
    size_t digitWidth() const { return digitWidth_; }

    /// Length of the longest possible token (K). Streaming withholds K - 1 characters.
    size_t maxTokenLength() const { return maxTokenLength_; }

    /// Largest sequence number a token can carry (9999 for width 4).
    uint32_t maxSequence() const { return maxSequence_; }

private:
    std::vector<std::string> labels_;
    size_t digitWidth_;
    size_t maxTokenLength_;
    uint32_t maxSequence_;
    std::regex pattern_;
};

} // namespace redaction
} // namespace piirelay

#endif // PIIRELAY_REDACTION_PLACEHOLDER_GRAMMAR_HPP
