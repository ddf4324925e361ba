/**
 * JsonOutputPipe — key/value results passed back outside the command socket.
 *
 * The whole document is rewritten on every write; readers always reparse the
 * file so they see what the other process wrote last.
 */

#include "pipe/json_output_pipe.h"

#include "errors.h"

#include <cstdlib>
#include <fstream>
#include <utility>

#include <spdlog/spdlog.h>

namespace pyremote {

JsonOutputPipe::JsonOutputPipe(std::filesystem::path path)
    : path_(std::move(path)) {
    const auto directory = path_.parent_path();
    if (!directory.empty())
        std::filesystem::create_directories(directory);
}

std::filesystem::path JsonOutputPipe::default_path() {
    if (const char* env = std::getenv(kPathEnvVar); env != nullptr && *env != '\0')
        return env;
    return std::filesystem::temp_directory_path() / "pyremote_output_pipe.json";
}

void JsonOutputPipe::write(const std::string& key, const nlohmann::json& value) {
    auto data = load();
    data[key] = value;
    store(data);
}

nlohmann::json JsonOutputPipe::read(const std::string& key, const nlohmann::json& fallback) const {
    const auto data = load();
    const auto it = data.find(key);
    return it == data.end() ? fallback : *it;
}

void JsonOutputPipe::flush() {
    store(nlohmann::json::object());
}

nlohmann::json JsonOutputPipe::load() const {
    std::ifstream file(path_);
    if (!file.is_open())
        return nlohmann::json::object();

    auto data = nlohmann::json::parse(file, nullptr, /*allow_exceptions=*/false);
    if (data.is_discarded() || !data.is_object()) {
        spdlog::warn("Output pipe {} does not hold a JSON object, ignoring it", path_.string());
        return nlohmann::json::object();
    }
    return data;
}

void JsonOutputPipe::store(const nlohmann::json& data) const {
    std::ofstream file(path_, std::ios::trunc);
    if (!file.is_open())
        throw Error("Cannot write output pipe " + path_.string());
    file << data.dump();
    if (!file)
        throw Error("Writing output pipe " + path_.string() + " failed");
}

} // namespace pyremote
