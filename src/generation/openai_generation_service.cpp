#include "generation/openai_generation_service.hpp"
#include "generation/sse_decoder.hpp"
#include "util/json_text.hpp"
#include "util/logger.hpp"

#include <exception>
#include <stdexcept>
#include <utility>
#include <mutex>
#include <sstream>

namespace piirelay {
namespace generation {

namespace {

// State shared with streamCallback for one streamed call.
struct StreamContext {
    SseDecoder* decoder = nullptr;
    std::exception_ptr failure;
};

} // namespace

OpenAiGenerationService::OpenAiGenerationService(Options options) : m_options(std::move(options)) {
    if (m_options.apiKey.empty()) {
        throw std::invalid_argument("OpenAiGenerationService: API key is empty");
    }
    initCurl();
}

std::string OpenAiGenerationService::complete(const std::string& prompt) {
    std::string response;
    const std::string body = BuildRequestBody(m_options.model, prompt, m_options.temperature, false);
    HttpResult result = post(body, false, &OpenAiGenerationService::collectCallback, &response);

    if (result.code != CURLE_OK) {
        throw GenerationError("transport error: " + result.transportError);
    }
    if (result.status >= 400) {
        std::string message = ExtractErrorMessage(response);
        throw GenerationError("HTTP " + std::to_string(result.status) +
                              (message.empty() ? std::string() : ": " + message));
    }
    return ExtractMessageContent(response);
}

std::string OpenAiGenerationService::stream(const std::string& prompt, FragmentSink& sink) {
    std::string raw;
    SseDecoder decoder([&raw, &sink](const std::string& piece) {
        raw += piece;
        sink.onFragment(piece);
    });
    StreamContext ctx;
    ctx.decoder = &decoder;

    const std::string body = BuildRequestBody(m_options.model, prompt, m_options.temperature, true);
    HttpResult result = post(body, true, &OpenAiGenerationService::streamCallback, &ctx);

    if (ctx.failure) {
        // Raised inside the libcurl callback. Malformed payloads become a
        // GenerationError; anything else (sink contract violations) propagates.
        try {
            std::rethrow_exception(ctx.failure);
        } catch (const std::runtime_error& ex) {
            throw GenerationError(std::string("malformed event stream: ") + ex.what(), raw);
        }
    }
    if (result.code != CURLE_OK) {
        throw GenerationError("transport error: " + result.transportError, raw);
    }

    try {
        decoder.finish();
    } catch (const std::runtime_error& ex) {
        throw GenerationError(std::string("malformed event stream: ") + ex.what(), raw);
    }

    if (result.status >= 400) {
        std::string message = ExtractErrorMessage(decoder.unparsed());
        throw GenerationError("HTTP " + std::to_string(result.status) +
                                  (message.empty() ? std::string() : ": " + message),
                              raw);
    }
    if (!decoder.errorMessage().empty()) {
        throw GenerationError("stream error: " + decoder.errorMessage(), raw);
    }
    if (!decoder.done()) {
        util::logger::warn("OpenAiGenerationService: stream ended without [DONE]");
    }

    sink.onEndOfStream();
    return raw;
}

std::string OpenAiGenerationService::BuildRequestBody(const std::string& model,
                                                      const std::string& prompt, double temperature,
                                                      bool stream) {
    std::ostringstream oss;
    oss << R"({"model":")" << util::json::escapeString(model) << "\",";
    oss << R"("messages":[{"role":"user","content":")" << util::json::escapeString(prompt)
        << "\"}],";
    oss << R"("temperature":)" << temperature << ",";
    oss << R"("stream":)" << (stream ? "true" : "false");
    oss << "}";
    return oss.str();
}

std::string OpenAiGenerationService::ExtractMessageContent(const std::string& responseBody) {
    std::string error = ExtractErrorMessage(responseBody);
    if (!error.empty()) {
        throw GenerationError("API error: " + error);
    }
    const size_t messagePos = util::json::findKey(responseBody, "message");
    std::string content;
    try {
        if (messagePos != std::string::npos &&
            util::json::findStringField(responseBody, "content", content, messagePos)) {
            return content;
        }
    } catch (const std::runtime_error& ex) {
        throw GenerationError(std::string("malformed response: ") + ex.what());
    }
    throw GenerationError("response has no message content");
}

std::string OpenAiGenerationService::ExtractErrorMessage(const std::string& responseBody) {
    const size_t errorPos = util::json::findKey(responseBody, "error");
    if (errorPos == std::string::npos || responseBody.compare(errorPos, 4, "null") == 0) {
        return std::string();
    }
    std::string message;
    try {
        if (util::json::findStringField(responseBody, "message", message, errorPos)) {
            return message;
        }
    } catch (const std::runtime_error&) {
        // Fall through to the generic text below; the body is already an error.
    }
    return "unknown API error";
}

std::string OpenAiGenerationService::endpoint() const {
    std::string base = m_options.baseUrl;
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    return base + "/chat/completions";
}

OpenAiGenerationService::HttpResult OpenAiGenerationService::post(const std::string& body,
                                                                  bool streaming, WriteFn writer,
                                                                  void* userdata) {
    HttpResult result;
    CURL* curl = curl_easy_init();
    if (!curl) {
        result.code = CURLE_FAILED_INIT;
        result.transportError = "curl_easy_init failed";
        return result;
    }

    const std::string url = endpoint();
    const std::string auth = "Authorization: Bearer " + m_options.apiKey;
    char errorBuffer[CURL_ERROR_SIZE] = {0};

    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");
    headers = curl_slist_append(headers, auth.c_str());
    if (streaming) {
        headers = curl_slist_append(headers, "Accept: text/event-stream");
    }

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, m_options.timeoutSeconds);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errorBuffer);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writer);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, userdata);

    util::logger::debug("OpenAiGenerationService: POST " + url + " (" + std::to_string(body.size()) +
                        " bytes, stream=" + (streaming ? "true" : "false") + ")");

    result.code = curl_easy_perform(curl);
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &result.status);
    if (result.code != CURLE_OK) {
        result.transportError = errorBuffer[0] != '\0' ? std::string(errorBuffer)
                                                       : std::string(curl_easy_strerror(result.code));
    }

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);
    return result;
}

void OpenAiGenerationService::initCurl() {
    static std::once_flag flag;
    std::call_once(flag, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

size_t OpenAiGenerationService::collectCallback(char* ptr, size_t size, size_t nmemb,
                                                void* userdata) {
    if (!userdata)
        return 0;
    std::string* resp = reinterpret_cast<std::string*>(userdata);
    size_t total = size * nmemb;
    resp->append(ptr, total);
    return total;
}

size_t OpenAiGenerationService::streamCallback(char* ptr, size_t size, size_t nmemb,
                                               void* userdata) {
    if (!userdata)
        return 0;
    StreamContext* ctx = reinterpret_cast<StreamContext*>(userdata);
    size_t total = size * nmemb;
    // Exceptions must not unwind through libcurl: park them and abort the transfer.
    try {
        ctx->decoder->feed(ptr, total);
    } catch (...) {
        ctx->failure = std::current_exception();
        return 0;
    }
    return total;
}

} // namespace generation
} // namespace piirelay
