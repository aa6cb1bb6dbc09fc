#ifndef PIIRELAY_REDACTION_PLACEHOLDER_MAP_HPP
#define PIIRELAY_REDACTION_PLACEHOLDER_MAP_HPP

#include <string>
#include <vector>
#include <utility>
#include <unordered_map>
#include <stdexcept>
#include <initializer_list>

namespace piirelay {
namespace redaction {

/**
 * @class PlaceholderMap
 * @brief Per-request table of placeholder token -> original value.
 *
 * Tokens are unique keys and values are unique too (one token per distinct
 * value). Entries keep insertion order so reports list them as minted.
 */
class PlaceholderMap
{
public:
    using Entry = std::pair<std::string, std::string>; ///< (token, original)

    PlaceholderMap() = default;

    PlaceholderMap(std::initializer_list<Entry> entries)
    {
        for (const auto &e : entries) {
            insert(e.first, e.second);
        }
    }

    /**
     * @brief Record token -> original.
     * @throw std::invalid_argument if the token or the value is already mapped.
     */
    inline void insert(const std::string &token, const std::string &original)
    {
        if (indexByToken_.count(token) != 0) {
            throw std::invalid_argument("PlaceholderMap: duplicate token " + token);
        }
        if (indexByValue_.count(original) != 0) {
            throw std::invalid_argument("PlaceholderMap: value already mapped to "
                                        + entries_[indexByValue_.at(original)].first);
        }
        indexByToken_[token] = entries_.size();
        indexByValue_[original] = entries_.size();
        entries_.emplace_back(token, original);
    }

    /// Original value for a token, or nullptr if the token is unknown.
    inline const std::string *findOriginal(const std::string &token) const
    {
        auto it = indexByToken_.find(token);
        return it == indexByToken_.end() ? nullptr : &entries_[it->second].second;
    }

    /// Token already minted for a value, or nullptr.
    inline const std::string *findToken(const std::string &original) const
    {
        auto it = indexByValue_.find(original);
        return it == indexByValue_.end() ? nullptr : &entries_[it->second].first;
    }

    const std::vector<Entry> &entries() const { return entries_; }
    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

private:
    std::vector<Entry> entries_;
    std::unordered_map<std::string, size_t> indexByToken_;
    std::unordered_map<std::string, size_t> indexByValue_;
};

} // namespace redaction
} // namespace piirelay

#endif // PIIRELAY_REDACTION_PLACEHOLDER_MAP_HPP
