#ifndef PIIRELAY_GENERATION_OPENAI_GENERATION_SERVICE_HPP
#define PIIRELAY_GENERATION_OPENAI_GENERATION_SERVICE_HPP

#include <curl/curl.h>
#include <string>
#include "generation_service.hpp"

namespace piirelay {
namespace generation {

/**
 * @brief Chat-completions client for OpenAI-compatible endpoints.
 *
 * Sends one user message (the redacted prompt) to <baseUrl>/chat/completions.
 * stream() asks for server-sent events and forwards every content delta to the
 * sink as it arrives; complete() asks for a single JSON response.
 *
 * Every failure (transport error, HTTP status >= 400, an error object in the
 * body or in the event stream) surfaces as GenerationError.
 */
class OpenAiGenerationService : public GenerationService {
  public:
    struct Options {
        std::string apiKey;
        std::string model = "gpt-4o-mini";
        std::string baseUrl = "https://api.openai.com/v1";
        double temperature = 0.2;
        long timeoutSeconds = 120;
    };

    explicit OpenAiGenerationService(Options options);

    std::string complete(const std::string& prompt) override;
    std::string stream(const std::string& prompt, FragmentSink& sink) override;
    std::string name() const override { return "openai:" + m_options.model; }

    /// JSON body for one chat-completions call.
    static std::string BuildRequestBody(const std::string& model, const std::string& prompt,
                                        double temperature, bool stream);

    /// choices[0].message.content of a non-streaming response.
    /// @throw GenerationError if the body carries an error or no content.
    static std::string ExtractMessageContent(const std::string& responseBody);

    /// error.message of an API error body, or an empty string.
    static std::string ExtractErrorMessage(const std::string& responseBody);

  private:
    struct HttpResult {
        CURLcode code = CURLE_OK;
        long status = 0;
        std::string transportError;
    };

    using WriteFn = size_t (*)(char*, size_t, size_t, void*);

    HttpResult post(const std::string& body, bool streaming, WriteFn writer, void* userdata);
    std::string endpoint() const;

    static void initCurl();
    static size_t collectCallback(char* ptr, size_t size, size_t nmemb, void* userdata);
    static size_t streamCallback(char* ptr, size_t size, size_t nmemb, void* userdata);

    Options m_options;
};

} // namespace generation
} // namespace piirelay

#endif // PIIRELAY_GENERATION_OPENAI_GENERATION_SERVICE_HPP
