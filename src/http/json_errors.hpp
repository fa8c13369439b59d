#pragma once
#include <algorithm>
#include <nlohmann/json.hpp>
#include <string>
#include <utility>

// 1-based (line, column) of a byte offset in a request body.
inline std::pair<size_t, size_t> body_line_col(const std::string &body,
                                               size_t offset) {
  offset = std::min(offset, body.size());
  size_t line = 1, col = 1;
  for (size_t i = 0; i < offset; ++i) {
    if (body[i] == '\n') {
      ++line;
      col = 1;
    } else {
      ++col;
    }
  }
  return {line, col};
}

// Client facing description of a malformed body. nlohmann reports the byte
// just past the offending token.
inline std::string describe_parse_error(const std::string &body,
                                        const nlohmann::json::parse_error &e) {
  const size_t offset = e.byte > 0 ? e.byte - 1 : 0;
  auto [line, col] = body_line_col(body, offset);
  if (body.empty())
    return "Request body is empty.";
  return "Malformed JSON at line " + std::to_string(line) + ", column " +
         std::to_string(col) + ".";
}
