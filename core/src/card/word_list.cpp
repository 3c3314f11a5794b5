/**
 * @file word_list.cpp
 * @brief Word list file parsing
 */

#include "card/word_list.hpp"
#include "text/utf8.hpp"

#include <fstream>
#include <iostream>
#include <string_view>

namespace WordCard {

namespace {

constexpr std::string_view kUtf8Bom = "\xEF\xBB\xBF";

std::vector<std::string> split_fields(std::string_view line) {
  std::vector<std::string> fields;
  size_t start = 0;
  while (true) {
    size_t comma = line.find(',', start);
    std::string_view field = line.substr(
        start, comma == std::string_view::npos ? std::string_view::npos
                                               : comma - start);
    fields.emplace_back(Text::trim(field));
    if (comma == std::string_view::npos) {
      break;
    }
    start = comma + 1;
  }
  return fields;
}

} // anonymous namespace

std::optional<WordRecord> parse_word_line(const std::string &line) {
  std::string_view view = Text::trim(line);
  if (view.empty()) {
    return std::nullopt;
  }

  std::vector<std::string> fields = split_fields(view);

  WordRecord record;
  if (fields.size() == 2) {
    record.entry = {fields[0], fields[1]};
  } else if (fields.size() == 3) {
    record.entry = {fields[0], fields[2]};
    if (!fields[1].empty()) {
      record.phonetic = fields[1];
    }
  } else {
    return std::nullopt;
  }

  if (record.entry.english.empty() || record.entry.chinese.empty()) {
    return std::nullopt;
  }
  return record;
}

WordList parse_word_list(std::istream &in) {
  WordList list;
  std::string line;
  size_t line_num = 0;

  while (std::getline(in, line)) {
    ++line_num;
    if (line_num == 1 && line.compare(0, kUtf8Bom.size(), kUtf8Bom) == 0) {
      line.erase(0, kUtf8Bom.size());
    }
    if (Text::trim(line).empty()) {
      continue;
    }

    auto record = parse_word_line(line);
    if (!record) {
      std::cerr << "⚠️ Line " << line_num
                << " is not 'english,chinese' or 'english,phonetic,chinese', "
                   "skipped: '"
                << line << "'" << std::endl;
      ++list.skipped_lines;
      continue;
    }
    list.records.push_back(std::move(*record));
  }
  return list;
}

CardResult<WordList> load_word_list(const std::string &path) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    return make_error(CardErrorCode::IoFailure,
                      "Cannot open word list: " + path);
  }

  WordList list = parse_word_list(file);
  std::cout << "📝 Read " << list.size() << " word pairs from " << path;
  if (list.skipped_lines > 0) {
    std::cout << " (" << list.skipped_lines << " malformed lines skipped)";
  }
  std::cout << std::endl;
  return list;
}

} // namespace WordCard
