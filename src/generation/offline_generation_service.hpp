#ifndef PIIRELAY_GENERATION_OFFLINE_GENERATION_SERVICE_HPP
#define PIIRELAY_GENERATION_OFFLINE_GENERATION_SERVICE_HPP

#include <string>
#include <chrono>
#include <thread>
#include <algorithm>
#include <stdexcept>
#include "generation_service.hpp"
#include "../util/logger.hpp"

namespace piirelay {
namespace generation {

/**
 * @class OfflineGenerationService
 * @brief Deterministic substitute used when no API key is configured.
 *
 * The response is a fixed notice followed by the prompt it was given. The
 * prompt is already redacted, so the echo carries placeholder tokens and the
 * whole restoration path (live and final) runs without network access. The
 * response is delivered in fixed-size fragments, which splits some tokens
 * across fragment boundaries.
 */
class OfflineGenerationService : public GenerationService
{
public:
    static constexpr const char *kNotice =
        "[offline] No API key configured; this response is generated locally. "
        "Echoing the prompt as the model received it: ";

    explicit OfflineGenerationService(size_t chunkSize = 12,
                                      std::chrono::milliseconds fragmentDelay = std::chrono::milliseconds(8))
        : chunkSize_(chunkSize)
        , fragmentDelay_(fragmentDelay)
    {
        if (chunkSize_ == 0) {
            throw std::invalid_argument("OfflineGenerationService: chunk size must be positive");
        }
    }

    std::string complete(const std::string &prompt) override
    {
        return responseFor(prompt);
    }

    std::string stream(const std::string &prompt, FragmentSink &sink) override
    {
        const std::string response = responseFor(prompt);
        size_t fragments = 0;
        for (size_t i = 0; i < response.size(); i += chunkSize_) {
            sink.onFragment(response.substr(i, chunkSize_));
            ++fragments;
            if (fragmentDelay_.count() > 0) {
                std::this_thread::sleep_for(fragmentDelay_);
            }
        }
        sink.onEndOfStream();
        piirelay::util::logger::debug("OfflineGenerationService: streamed " + std::to_string(fragments)
                                      + " fragment(s)");
        return response;
    }

    std::string name() const override { return "offline"; }

    static std::string responseFor(const std::string &prompt)
    {
        return std::string(kNotice) + prompt;
    }

private:
    size_t chunkSize_;
    std::chrono::milliseconds fragmentDelay_;
};

} // namespace generation
} // namespace piirelay

#endif // PIIRELAY_GENERATION_OFFLINE_GENERATION_SERVICE_HPP
