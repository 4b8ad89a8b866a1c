#pragma once

#include <string>

namespace tablepod::core::util {

class AtomicFileWriter {
public:
    // Writes to "<path>.tmp" and renames over path. Parent directories are created.
    static bool Write(const std::string& path, const std::string& contents, std::string* error = nullptr);

    // Appends one line, creating the file and its parent directories when missing.
    static bool AppendLine(const std::string& path, const std::string& line, std::string* error = nullptr);
};

}  // namespace tablepod::core::util
