#pragma once
/**
 * @file word_list.hpp
 * @brief Vocabulary word list parsing
 *
 * One entry per line: "english,chinese" or "english,phonetic,chinese".
 * Whitespace around fields is trimmed, blank lines are skipped and other
 * malformed lines are skipped with a warning.
 */

#include "core/result.hpp"

#include <cstddef>
#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace WordCard {

/// One vocabulary pair
struct WordEntry {
  std::string english;
  std::string chinese;
};

/// A parsed line: the pair plus the optional phonetic transcription
struct WordRecord {
  WordEntry entry;
  std::optional<std::string> phonetic;
};

/// Result of parsing a word list
struct WordList {
  std::vector<WordRecord> records;
  size_t skipped_lines = 0;

  [[nodiscard]] bool empty() const noexcept { return records.empty(); }
  [[nodiscard]] size_t size() const noexcept { return records.size(); }
};

/// Parse one line; nullopt for blank or malformed lines
[[nodiscard]] std::optional<WordRecord> parse_word_line(const std::string &line);

/// Parse a whole stream
[[nodiscard]] WordList parse_word_list(std::istream &in);

/// Read and parse a UTF-8 file; IoFailure if it cannot be opened
[[nodiscard]] CardResult<WordList> load_word_list(const std::string &path);

} // namespace WordCard
