#ifndef PIIRELAY_IO_REQUEST_LOADER_HPP
#define PIIRELAY_IO_REQUEST_LOADER_HPP

#include <string>
#include <vector>
#include <fstream>
#include <sstream>
#include <istream>
#include <iterator>
#include <stdexcept>
#include "../util/logger.hpp"

/**
 * @file request_loader.hpp
 * @brief Loads (instruction, request) pairs from a CSV file.
 *
 * DESIGN GOALS:
 *   - Header row required; columns "system_prompt" and "prompt" must be present,
 *     in any order. Other columns are ignored.
 *   - RFC 4180 quoting: quoted fields may hold commas, newlines and "" escapes.
 *   - CRLF or LF line ends, an optional UTF-8 BOM, blank lines skipped.
 *     Whitespace around a field is trimmed; text inside quotes is kept as is.
 *   - Any failure is fatal for the run: std::runtime_error, thrown before a
 *     single request is processed.
 *
 * USAGE EXAMPLE:
 *   @code
 *   using namespace piirelay::io;
 *
 *   std::vector<PromptRequest> requests = RequestLoader::loadFromFile("requests.csv");
 *   for (const auto &r : requests) {
 *       // r.instruction, r.request
 *   }
 *   @endcode
 */

namespace piirelay {
namespace io {

/**
 * @struct PromptRequest
 * @brief One row of input: the system instruction and the user request.
 */
struct PromptRequest
{
    std::string instruction; ///< "system_prompt" column
    std::string request;     ///< "prompt" column
};

class RequestLoader
{
public:
    static constexpr const char *kInstructionColumn = "system_prompt";
    static constexpr const char *kRequestColumn = "prompt";

    /**
     * @brief Read and parse a CSV file.
     * @throw std::runtime_error if the file cannot be read or is malformed.
     */
    static std::vector<PromptRequest> loadFromFile(const std::string &path)
    {
        std::ifstream in(path, std::ios::in | std::ios::binary);
        if (!in.is_open()) {
            throw std::runtime_error("RequestLoader: cannot open " + path);
        }
        piirelay::util::logger::info("RequestLoader: reading " + path);
        auto requests = parse(in);
        piirelay::util::logger::info("RequestLoader: loaded " + std::to_string(requests.size())
                                     + " request(s) from " + path);
        return requests;
    }

    /**
     * @brief Parse CSV content from a stream.
     * @throw std::runtime_error on a missing header, missing columns or an unterminated quote.
     */
    static std::vector<PromptRequest> parse(std::istream &in)
    {
        std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        if (content.compare(0, 3, "\xEF\xBB\xBF") == 0) {
            content.erase(0, 3);
        }

        const auto rows = splitRows(content);
        if (rows.empty()) {
            throw std::runtime_error("RequestLoader: input has no header row");
        }

        const auto &header = rows.front();
        const size_t instructionIdx = columnIndex(header, kInstructionColumn);
        const size_t requestIdx = columnIndex(header, kRequestColumn);

        std::vector<PromptRequest> requests;
        requests.reserve(rows.size() - 1);
        for (size_t r = 1; r < rows.size(); ++r) {
            const auto &row = rows[r];
            PromptRequest req;
            req.instruction = instructionIdx < row.size() ? row[instructionIdx] : std::string();
            req.request = requestIdx < row.size() ? row[requestIdx] : std::string();
            requests.push_back(std::move(req));
        }
        return requests;
    }

private:
    using Row = std::vector<std::string>;

    static size_t columnIndex(const Row &header, const std::string &name)
    {
        for (size_t i = 0; i < header.size(); ++i) {
            if (header[i] == name) {
                return i;
            }
        }
        throw std::runtime_error("RequestLoader: missing required column '" + name + "'");
    }

    static void trim(std::string &s)
    {
        static const std::string whitespace = " \t\r\n";
        const auto first = s.find_first_not_of(whitespace);
        if (first == std::string::npos) {
            s.clear();
            return;
        }
        s.erase(s.find_last_not_of(whitespace) + 1);
        s.erase(0, first);
    }

    static bool isBlank(const Row &row)
    {
        return row.size() == 1 && row[0].empty();
    }

    /**
     * @brief Split CSV text into rows of trimmed fields, skipping blank lines.
     */
    static std::vector<Row> splitRows(const std::string &content)
    {
        std::vector<Row> rows;
        Row row;
        std::string field;
        bool inQuotes = false;
        bool quotedField = false;

        auto endField = [&]() {
            if (!quotedField) {
                trim(field);
            }
            row.push_back(field);
            field.clear();
            quotedField = false;
        };
        auto endRow = [&]() {
            endField();
            if (!isBlank(row)) {
                rows.push_back(row);
            }
            row.clear();
        };

        for (size_t i = 0; i < content.size(); ++i) {
            const char c = content[i];
            if (inQuotes) {
                if (c == '"') {
                    if (i + 1 < content.size() && content[i + 1] == '"') {
                        field.push_back('"');
                        ++i;
                    } else {
                        inQuotes = false;
                    }
                } else {
                    field.push_back(c);
                }
                continue;
            }

            if (c == '"') {
                trim(field);
                if (!field.empty()) {
                    throw std::runtime_error("RequestLoader: unexpected quote inside unquoted field near row "
                                             + std::to_string(rows.size() + 1));
                }
                inQuotes = true;
                quotedField = true;
            } else if (c == ',') {
                endField();
            } else if (c == '\n') {
                endRow();
            } else if (c == '\r') {
                if (i + 1 < content.size() && content[i + 1] == '\n') {
                    ++i;
                }
                endRow();
            } else if (quotedField) {
                // Only whitespace may follow a closing quote.
                if (c != ' ' && c != '\t') {
                    throw std::runtime_error("RequestLoader: text after closing quote near row "
                                             + std::to_string(rows.size() + 1));
                }
            } else {
                field.push_back(c);
            }
        }

        if (inQuotes) {
            throw std::runtime_error("RequestLoader: unterminated quoted field");
        }
        if (!field.empty() || !row.empty() || quotedField) {
            endRow();
        }
        return rows;
    }
};

} // namespace io
} // namespace piirelay

#endif // PIIRELAY_IO_REQUEST_LOADER_HPP
