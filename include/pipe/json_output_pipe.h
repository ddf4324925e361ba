#pragma once

#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

namespace pyremote {

/**
 * File-backed JSON object used as a side channel: the remote command writes
 * named entries, the controller reads them back once the command returns.
 */
class JsonOutputPipe {
public:
    /// Environment variable naming the pipe file for both ends.
    static constexpr const char* kPathEnvVar = "PYREMOTE_JSON_PIPE_FILE";

    explicit JsonOutputPipe(std::filesystem::path path = default_path());

    /// $PYREMOTE_JSON_PIPE_FILE, or pyremote_output_pipe.json in the temp dir.
    static std::filesystem::path default_path();

    /// Set one entry and rewrite the file.
    void write(const std::string& key, const nlohmann::json& value);

    /// Read one entry from the file as it is now.
    [[nodiscard]] nlohmann::json read(const std::string& key,
                                      const nlohmann::json& fallback = nullptr) const;

    /// Reset the file to an empty object.
    void flush();

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

private:
    [[nodiscard]] nlohmann::json load() const;
    void store(const nlohmann::json& data) const;

    std::filesystem::path path_;
};

} // namespace pyremote
