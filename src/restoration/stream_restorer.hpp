#ifndef PIIRELAY_RESTORATION_STREAM_RESTORER_HPP
#define PIIRELAY_RESTORATION_STREAM_RESTORER_HPP

#include <string>
#include <vector>
#include <algorithm>
#include <stdexcept>
#include "restorer.hpp"
#include "../redaction/placeholder_grammar.hpp"
#include "../redaction/placeholder_map.hpp"

/**
 * @file stream_restorer.hpp
 * @brief Incremental restoration of generated text for live display.
 *
 * A generation stream may cut a placeholder anywhere ("...EMAIL_00" then
 * "01 ..."). The session buffers raw fragments and only releases text that can
 * no longer be part of an incomplete token:
 *
 *   - K is the longest possible token (grammar().maxTokenLength()).
 *   - The last K - 1 pending characters are always withheld.
 *   - A complete token ending exactly at the end of the buffer is withheld as
 *     well until the next character arrives, because the character after it
 *     decides whether it is a token at all ("EMAIL_0001" vs "EMAIL_00012").
 *   - The buffer keeps raw generated text only. Restored values are never
 *     rescanned, so concatenating every emission equals restoreAll() over the
 *     concatenated fragments.
 *   - Emission boundaries are moved back so they never split a UTF-8 sequence.
 *
 * consume("") or flush() ends the stream: everything left is restored and
 * emitted and the session becomes terminal. Any further call throws
 * std::logic_error.
 *
 * Not thread-safe: one writer per session.
 *
 * USAGE EXAMPLE:
 *   @code
 *   StreamRestorer live(result.mapping, catalog.grammar());
 *   std::cout << live.consume("Write to EMAIL_00");
 *   std::cout << live.consume("01 soon.");
 *   std::cout << live.flush();       // or live.consume("")
 *   @endcode
 */

namespace piirelay {
namespace restoration {

class StreamRestorer
{
public:
    enum class State {
        Empty,        ///< nothing consumed yet
        Accumulating, ///< last call emitted nothing
        Emitting,     ///< last call emitted text
        Flushed       ///< terminal
    };

    /**
     * @param mapping Must outlive the session.
     * @param grammar Must outlive the session.
     */
    StreamRestorer(const redaction::PlaceholderMap &mapping,
                   const redaction::PlaceholderGrammar &grammar)
        : mapping_(mapping)
        , grammar_(grammar)
        , margin_(grammar.maxTokenLength() - 1)
        , contextLength_(0)
        , state_(State::Empty)
    {
    }

    /**
     * @brief Feed one fragment and return the text that is now safe to display.
     *        An empty fragment is the end-of-stream signal (same as flush()).
     * @throw std::logic_error if the session was already flushed.
     */
    inline std::string consume(const std::string &fragment)
    {
        requireOpen("consume");
        if (fragment.empty()) {
            return drain(true);
        }
        buffer_ += fragment;
        if (pendingSize() <= margin_) {
            state_ = State::Accumulating;
            return std::string();
        }
        return drain(false);
    }

    /**
     * @brief End the stream and return everything still withheld, restored.
     * @throw std::logic_error if the session was already flushed.
     */
    inline std::string flush()
    {
        requireOpen("flush");
        return drain(true);
    }

    State state() const { return state_; }
    bool isFlushed() const { return state_ == State::Flushed; }

    /// Raw characters received but not yet emitted.
    size_t pendingSize() const { return buffer_.size() - contextLength_; }

    /// K - 1.
    size_t safetyMargin() const { return margin_; }

private:
    inline void requireOpen(const char *operation) const
    {
        if (state_ == State::Flushed) {
            throw std::logic_error(std::string("StreamRestorer: ") + operation
                                   + " called after the stream was flushed");
        }
    }

    static bool isContinuationByte(char c)
    {
        return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
    }

    inline std::string drain(bool final)
    {
        const size_t begin = contextLength_;
        const size_t end = buffer_.size();
        size_t cut = final ? end : end - margin_;

        std::vector<redaction::TokenSpan> settled;
        for (const auto &span : grammar_.scan(buffer_, begin)) {
            if (span.offset >= cut) {
                break;
            }
            if (!final && span.end() == end) {
                cut = span.offset;
                break;
            }
            settled.push_back(span);
            cut = std::max(cut, span.end());
        }

        if (!final) {
            const size_t floor = settled.empty() ? begin : settled.back().end();
            while (cut > floor && isContinuationByte(buffer_[cut])) {
                --cut;
            }
        }

        std::string out;
        appendRestored(out, buffer_, begin, cut, settled, mapping_);

        if (final) {
            buffer_.clear();
            contextLength_ = 0;
            state_ = State::Flushed;
        }
        else if (cut > begin) {
            // Keep the last emitted character as word-boundary context.
            buffer_.erase(0, cut - 1);
            contextLength_ = 1;
            state_ = State::Emitting;
        }
        else {
            state_ = State::Accumulating;
        }
        return out;
    }

    const redaction::PlaceholderMap &mapping_;
    const redaction::PlaceholderGrammar &grammar_;
    const size_t margin_;
    std::string buffer_;
    size_t contextLength_;
    State state_;
};

} // namespace restoration
} // namespace piirelay

#endif // PIIRELAY_RESTORATION_STREAM_RESTORER_HPP
