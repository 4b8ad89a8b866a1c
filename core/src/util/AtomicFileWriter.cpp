#include "tablepod/core/util/AtomicFileWriter.h"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <system_error>

namespace tablepod::core::util {

namespace {

bool EnsureParentDir(const std::string& path, std::string* error) {
    const std::filesystem::path fs_path(path);
    if (fs_path.parent_path().empty()) {
        return true;
    }
    std::error_code ec;
    std::filesystem::create_directories(fs_path.parent_path(), ec);
    if (ec) {
        if (error) {
            *error = "Failed to create directory " + fs_path.parent_path().string() + ": " + ec.message();
        }
        return false;
    }
    return true;
}

void Fail(std::string* error, const std::string& message) {
    std::cerr << "[atomic] " << message << '\n';
    if (error) {
        *error = message;
    }
}

}  // namespace

bool AtomicFileWriter::Write(const std::string& path, const std::string& contents, std::string* error) {
    if (!EnsureParentDir(path, error)) {
        return false;
    }
    const std::string temp_path = path + ".tmp";
    {
        std::ofstream output(temp_path, std::ios::binary | std::ios::trunc);
        if (!output) {
            Fail(error, "Failed to open temp file: " + temp_path);
            return false;
        }
        output.write(contents.data(), static_cast<std::streamsize>(contents.size()));
        output.flush();
        if (!output) {
            Fail(error, "Failed to write temp file: " + temp_path);
            return false;
        }
    }

    std::error_code ec;
    std::filesystem::rename(temp_path, path, ec);
    if (ec) {
        Fail(error, "rename failed for " + path + ": " + ec.message());
        std::filesystem::remove(temp_path, ec);
        return false;
    }
    return true;
}

bool AtomicFileWriter::AppendLine(const std::string& path, const std::string& line, std::string* error) {
    if (!EnsureParentDir(path, error)) {
        return false;
    }
    std::ofstream output(path, std::ios::binary | std::ios::app);
    if (!output) {
        Fail(error, "Failed to open for append: " + path);
        return false;
    }
    output << line << '\n';
    output.flush();
    if (!output) {
        Fail(error, "Failed to append to " + path);
        return false;
    }
    return true;
}

}  // namespace tablepod::core::util
