#include "LogErrors.h"

#include <utility>

MalformedLineError::MalformedLineError(std::string path,
                                       std::size_t lineNumber,
                                       std::string content)
    : std::runtime_error("Malformed value at " + path + ":" +
                         std::to_string(lineNumber) + ": '" + content + "'"),
      path_(std::move(path)), lineNumber_(lineNumber),
      content_(std::move(content)) {}
