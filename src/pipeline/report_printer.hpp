#ifndef PIIRELAY_PIPELINE_REPORT_PRINTER_HPP
#define PIIRELAY_PIPELINE_REPORT_PRINTER_HPP

#include <string>
#include <ostream>
#include "request_processor.hpp"

namespace piirelay {
namespace pipeline {

/*
  ReportPrinter
  --------------------------------
  Console layout of a run:

    === Request #1 ===
    --- User-visible stream (live) ---
    <restored text as it streams>
    Redacted Prompt:
    LLM Output:
    Final Output:
*/
class ReportPrinter
{
public:
    explicit ReportPrinter(std::ostream &out)
        : out_(out)
    {
    }

    void printRequestHeader(size_t number)
    {
        out_ << "\n\n=== Request #" << number << " ===\n";
        out_ << "\n--- User-visible stream (live) ---\n\n";
        out_.flush();
    }

    void printOutcome(const RequestOutcome &outcome)
    {
        out_ << "\n\nRedacted Prompt:\n" << outcome.redactedPrompt << "\n";
        out_ << "\nLLM Output:\n" << outcome.rawOutput << "\n";
        if (outcome.succeeded) {
            out_ << "\nFinal Output:\n" << outcome.finalOutput << "\n";
        }
        else {
            out_ << "\nFinal Output:\n(request failed: " << outcome.error << ")\n";
        }
        out_.flush();
    }

    void printSummary(size_t total, size_t failed)
    {
        out_ << "\n" << total - failed << " of " << total << " request(s) completed";
        if (failed > 0) {
            out_ << ", " << failed << " failed";
        }
        out_ << ".\n";
        out_.flush();
    }

private:
    std::ostream &out_;
};

} // namespace pipeline
} // namespace piirelay

#endif // PIIRELAY_PIPELINE_REPORT_PRINTER_HPP
