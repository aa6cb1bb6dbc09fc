#ifndef PIIRELAY_GENERATION_GENERATION_SERVICE_HPP
#define PIIRELAY_GENERATION_GENERATION_SERVICE_HPP

#include <string>
#include <stdexcept>
#include <utility>

/**
 * @file generation_service.hpp
 * @brief Interface to a remote (or substitute) text-generation service.
 *
 * The service only ever receives redacted text. Implementations:
 *   - OpenAiGenerationService: chat completions over HTTP (libcurl).
 *   - OfflineGenerationService: deterministic local fragments, used when no
 *     credentials are configured.
 */

namespace piirelay {
namespace generation {

/**
 * @class GenerationError
 * @brief A generation call failed (transport, HTTP status, API error body).
 *        Carries whatever output arrived before the failure.
 */
class GenerationError : public std::runtime_error
{
public:
    explicit GenerationError(const std::string &what, std::string partialOutput = std::string())
        : std::runtime_error(what)
        , partialOutput_(std::move(partialOutput))
    {
    }

    const std::string &partialOutput() const { return partialOutput_; }

private:
    std::string partialOutput_;
};

/**
 * @class FragmentSink
 * @brief Receives a streamed response: onFragment() per non-empty fragment,
 *        then onEndOfStream() exactly once if the stream completed.
 */
class FragmentSink
{
public:
    virtual ~FragmentSink() = default;

    virtual void onFragment(const std::string &fragment) = 0;
    virtual void onEndOfStream() = 0;
};

class GenerationService
{
public:
    virtual ~GenerationService() = default;

    /**
     * @brief Request one complete response.
     * @throw GenerationError on failure.
     */
    virtual std::string complete(const std::string &prompt) = 0;

    /**
     * @brief Stream a response into sink and return the concatenated raw text.
     * @throw GenerationError on failure; onEndOfStream() is not called then.
     */
    virtual std::string stream(const std::string &prompt, FragmentSink &sink) = 0;

    /// Short name for logs, e.g. "openai:gpt-4o-mini" or "offline".
    virtual std::string name() const = 0;
};

} // namespace generation
} // namespace piirelay

#endif // PIIRELAY_GENERATION_GENERATION_SERVICE_HPP
