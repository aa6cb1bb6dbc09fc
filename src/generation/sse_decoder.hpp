#ifndef PIIRELAY_GENERATION_SSE_DECODER_HPP
#define PIIRELAY_GENERATION_SSE_DECODER_HPP

#include <string>
#include <functional>
#include <utility>
#include "../util/json_text.hpp"

/**
 * @file sse_decoder.hpp
 * @brief Incremental decoder for a chat-completions server-sent event stream.
 *
 * Bytes arrive in arbitrary pieces from the HTTP layer. Complete lines are
 * handled as they appear:
 *   data: {"choices":[{"delta":{"content":"Hel"}}]}   -> onContent("Hel")
 *   data: [DONE]                                       -> done() == true
 *   data: {"error":{"message":"..."}}                  -> errorMessage()
 *   : keep-alive comment / event: / id:                -> ignored
 * Any other non-empty line (a plain JSON error body, typically) is collected in
 * unparsed() so the caller can report it.
 */

namespace piirelay {
namespace generation {

class SseDecoder
{
public:
    using ContentCallback = std::function<void(const std::string &)>;

    explicit SseDecoder(ContentCallback onContent)
        : onContent_(std::move(onContent))
        , done_(false)
    {
    }

    /**
     * @brief Feed raw bytes. Calls onContent for each non-empty delta.
     * @throw std::runtime_error on a malformed JSON string in a data line.
     */
    inline void feed(const char *data, size_t size)
    {
        pending_.append(data, size);
        size_t start = 0;
        for (size_t nl = pending_.find('\n'); nl != std::string::npos; nl = pending_.find('\n', start)) {
            std::string line = pending_.substr(start, nl - start);
            start = nl + 1;
            handleLine(line);
        }
        pending_.erase(0, start);
    }

    inline void feed(const std::string &data)
    {
        feed(data.data(), data.size());
    }

    /**
     * @brief Handle a last line that arrived without a trailing newline.
     */
    inline void finish()
    {
        if (!pending_.empty()) {
            std::string line;
            line.swap(pending_);
            handleLine(line);
        }
    }

    bool done() const { return done_; }
    const std::string &errorMessage() const { return errorMessage_; }
    const std::string &unparsed() const { return unparsed_; }

private:
    inline void handleLine(std::string line)
    {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty() || line[0] == ':') {
            return;
        }
        if (line.compare(0, 5, "data:") != 0) {
            if (line.compare(0, 6, "event:") != 0 && line.compare(0, 3, "id:") != 0
                && line.compare(0, 6, "retry:") != 0) {
                unparsed_ += line;
                unparsed_ += '\n';
            }
            return;
        }

        std::string payload = line.substr(5);
        if (!payload.empty() && payload[0] == ' ') {
            payload.erase(0, 1);
        }
        if (payload == "[DONE]") {
            done_ = true;
            return;
        }

        const size_t errorPos = piirelay::util::json::findKey(payload, "error");
        if (errorPos != std::string::npos && payload.compare(errorPos, 4, "null") != 0) {
            std::string message;
            if (!piirelay::util::json::findStringField(payload, "message", message, errorPos)) {
                message = "unknown streaming error";
            }
            errorMessage_ = message;
            return;
        }

        const size_t deltaPos = piirelay::util::json::findKey(payload, "delta");
        if (deltaPos == std::string::npos) {
            return;
        }
        std::string content;
        if (piirelay::util::json::findStringField(payload, "content", content, deltaPos) && !content.empty()) {
            onContent_(content);
        }
    }

    ContentCallback onContent_;
    std::string pending_;
    std::string unparsed_;
    std::string errorMessage_;
    bool done_;
};

} // namespace generation
} // namespace piirelay

#endif // PIIRELAY_GENERATION_SSE_DECODER_HPP
