#include "docparse/Types.hpp"

#include "docparse/Geometry.hpp"

namespace docparse {

std::string TextBlock::toString() const {
  std::string result;
  for (const auto &line : text) {
    std::string stripped = trim(line);
    if (!result.empty()) {
      result += ' ';
    }
    result += stripped;
  }
  return result;
}

std::string blockTypeName(BlockType type) {
  switch (type) {
  case BlockType::Text:
    return "Text";
  case BlockType::Title:
    return "Title";
  case BlockType::List:
    return "List";
  case BlockType::Table:
    return "Table";
  case BlockType::Figure:
    return "Figure";
  case BlockType::InferredFromGap:
    return "Inferred from gaps";
  case BlockType::Ambiguous:
    return "Ambiguous";
  }
  return "Text";
}

std::optional<BlockType> blockTypeFromName(const std::string &name) {
  static const BlockType allTypes[] = {
      BlockType::Text,   BlockType::Title,           BlockType::List,
      BlockType::Table,  BlockType::Figure,          BlockType::InferredFromGap,
      BlockType::Ambiguous};
  for (BlockType type : allTypes) {
    if (blockTypeName(type) == name) {
      return type;
    }
  }
  return std::nullopt;
}

BlockType toBlockType(DetectionLabel label) {
  switch (label) {
  case DetectionLabel::Text:
    return BlockType::Text;
  case DetectionLabel::Title:
    return BlockType::Title;
  case DetectionLabel::List:
    return BlockType::List;
  case DetectionLabel::Table:
    return BlockType::Table;
  case DetectionLabel::Figure:
    return BlockType::Figure;
  }
  return BlockType::Text;
}

std::string contentTypeName(ContentType type) {
  switch (type) {
  case ContentType::Html:
    return "text/html";
  case ContentType::Pdf:
    return "application/pdf";
  }
  return "application/pdf";
}

std::optional<ContentType> contentTypeFromName(const std::string &name) {
  // Servers append parameters such as "; charset=utf-8"
  std::string mime = trim(name.substr(0, name.find(';')));
  if (mime == "text/html") {
    return ContentType::Html;
  }
  if (mime == "application/pdf") {
    return ContentType::Pdf;
  }
  return std::nullopt;
}

} // namespace docparse
