#ifndef PIIRELAY_PIPELINE_REQUEST_PROCESSOR_HPP
#define PIIRELAY_PIPELINE_REQUEST_PROCESSOR_HPP

#include <string>
#include <ostream>
#include <stdexcept>
#include "../io/request_loader.hpp"
#include "../generation/generation_service.hpp"
#include "../redaction/pattern_catalog.hpp"
#include "../redaction/redaction_mapper.hpp"
#include "../restoration/restorer.hpp"
#include "../restoration/stream_restorer.hpp"
#include "../util/logger.hpp"

/**
 * @file request_processor.hpp
 * @brief Runs one request end to end: redact, generate, restore.
 *
 * DESIGN GOALS:
 *   - Only redacted text leaves the process; the mapping stays in this call.
 *   - Generated fragments are restored live through a StreamRestorer and
 *     written to the live output as soon as they are safe to show.
 *   - Once generation completes, restoreAll() over the whole raw output gives
 *     the authoritative final text.
 *   - A GenerationError fails this request only. Mapping and session are
 *     locals, so nothing carries over to the next request.
 *
 * USAGE EXAMPLE:
 *   @code
 *   OfflineGenerationService service;
 *   RequestProcessor processor(PatternCatalog::standard(), service, std::cout, true);
 *   RequestOutcome outcome = processor.process({"You are helpful.", "Mail a@b.com"});
 *   @endcode
 */

namespace piirelay {
namespace pipeline {

/**
 * @struct RequestOutcome
 * @brief The three observable strings of one request, plus its status.
 */
struct RequestOutcome
{
    std::string redactedPrompt; ///< what the service received
    std::string rawOutput;      ///< what the service produced, placeholders included
    std::string finalOutput;    ///< rawOutput with originals restored (empty on failure)
    size_t placeholderCount = 0;
    bool succeeded = false;
    std::string error;
};

/**
 * @class LiveRestoreSink
 * @brief FragmentSink that restores fragments and writes them to a stream.
 */
class LiveRestoreSink : public generation::FragmentSink
{
public:
    LiveRestoreSink(restoration::StreamRestorer &restorer, std::ostream &out)
        : restorer_(restorer)
        , out_(out)
    {
    }

    void onFragment(const std::string &fragment) override
    {
        // An empty fragment would end the session early.
        if (fragment.empty()) {
            return;
        }
        write(restorer_.consume(fragment));
    }

    void onEndOfStream() override
    {
        write(restorer_.flush());
    }

private:
    void write(const std::string &text)
    {
        if (!text.empty()) {
            out_ << text;
            out_.flush();
        }
    }

    restoration::StreamRestorer &restorer_;
    std::ostream &out_;
};

class RequestProcessor
{
public:
    /**
     * @param catalog Shared, read-only.
     * @param service Generation backend; called once per request.
     * @param liveOut Destination of the live restored stream.
     * @param streaming Stream fragments, or request one complete response.
     */
    RequestProcessor(const redaction::PatternCatalog &catalog,
                     generation::GenerationService &service,
                     std::ostream &liveOut,
                     bool streaming = true)
        : catalog_(catalog)
        , mapper_(catalog)
        , service_(service)
        , liveOut_(liveOut)
        , streaming_(streaming)
    {
    }

    /**
     * @brief Process one (instruction, request) pair.
     * @return The outcome; succeeded == false if redaction or generation failed.
     *         A request that cannot be redacted is never sent.
     */
    inline RequestOutcome process(const io::PromptRequest &request)
    {
        RequestOutcome outcome;

        const std::string combined = request.instruction + " " + request.request;
        redaction::RedactionResult redaction;
        try {
            redaction = mapper_.redact(combined);
        }
        catch (const std::overflow_error &ex) {
            outcome.error = ex.what();
            piirelay::util::logger::error("RequestProcessor: redaction failed: " + outcome.error);
            return outcome;
        }
        outcome.redactedPrompt = redaction.redactedText;
        outcome.placeholderCount = redaction.mapping.size();

        piirelay::util::logger::info("RequestProcessor: " + std::to_string(outcome.placeholderCount)
                                     + " placeholder(s) minted, sending "
                                     + std::to_string(outcome.redactedPrompt.size())
                                     + " bytes to " + service_.name());

        restoration::StreamRestorer live(redaction.mapping, catalog_.grammar());
        LiveRestoreSink sink(live, liveOut_);

        try {
            if (streaming_) {
                outcome.rawOutput = service_.stream(outcome.redactedPrompt, sink);
            }
            else {
                outcome.rawOutput = service_.complete(outcome.redactedPrompt);
                sink.onFragment(outcome.rawOutput);
                sink.onEndOfStream();
            }
        }
        catch (const generation::GenerationError &ex) {
            outcome.rawOutput = ex.partialOutput();
            outcome.error = ex.what();
            // Release whatever the viewer has not seen yet; no final text is produced.
            if (!live.isFlushed()) {
                sink.onEndOfStream();
            }
            piirelay::util::logger::error("RequestProcessor: generation failed: " + outcome.error);
            return outcome;
        }

        outcome.finalOutput = restoration::restoreAll(outcome.rawOutput, redaction.mapping, catalog_.grammar());
        outcome.succeeded = true;
        return outcome;
    }

private:
    const redaction::PatternCatalog &catalog_;
    redaction::RedactionMapper mapper_;
    generation::GenerationService &service_;
    std::ostream &liveOut_;
    bool streaming_;
};

} // namespace pipeline
} // namespace piirelay

#endif // PIIRELAY_PIPELINE_REQUEST_PROCESSOR_HPP
