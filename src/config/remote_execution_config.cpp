/**
 * RemoteExecutionConfig — settings for discovering and talking to a peer.
 *
 * Values come from the built-in defaults, a JSON config file, or the python
 * plugin section of an editor project's DefaultEngine.ini.
 */

#include "config/remote_execution_config.h"

#include "errors.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <fstream>
#include <map>
#include <sstream>
#include <utility>

#include <asio.hpp>
#include <uuid/uuid.h>

namespace pyremote {

namespace {

using IniSection = std::map<std::string, std::string>;

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos)
        return {};
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

// Unreal ini files repeat keys and prefix array entries with +/-; the last
// plain assignment wins, array operations are ignored.
IniSection read_ini_section(const std::filesystem::path& path, const std::string& section) {
    std::ifstream file(path);
    if (!file.is_open())
        throw InvalidUprojectPathError("Cannot open " + path.string());

    IniSection values;
    bool in_section = false;
    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);
        if (line.empty() || line[0] == ';' || line[0] == '#')
            continue;
        if (line.front() == '[' && line.back() == ']') {
            in_section = line.substr(1, line.size() - 2) == section;
            continue;
        }
        if (!in_section || line[0] == '+' || line[0] == '-' || line[0] == '!')
            continue;
        const auto eq = line.find('=');
        if (eq == std::string::npos)
            continue;
        values[trim(line.substr(0, eq))] = trim(line.substr(eq + 1));
    }
    return values;
}

bool is_truthy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value == "true" || value == "1" || value == "yes" || value == "on";
}

template <typename T>
T parse_unsigned(const std::string& key, const std::string& text) {
    T value{};
    const auto* end = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc() || ptr != end)
        throw InvalidConfigError("Invalid value for " + key + ": '" + text + "'");
    return value;
}

std::string lookup(const IniSection& section, const std::string& key, const std::string& fallback) {
    const auto it = section.find(key);
    if (it == section.end() || it->second.empty())
        return fallback;
    return it->second;
}

} // namespace

Endpoint Endpoint::parse(const std::string& text) {
    const auto colon = text.rfind(':');
    if (colon == std::string::npos || colon == 0)
        throw InvalidConfigError("Expected 'ip:port', got '" + text + "'");

    Endpoint endpoint;
    endpoint.ip = trim(text.substr(0, colon));
    endpoint.port = parse_unsigned<uint16_t>("port", trim(text.substr(colon + 1)));

    asio::error_code ec;
    asio::ip::make_address_v4(endpoint.ip, ec);
    if (ec)
        throw InvalidConfigError("Invalid IPv4 address '" + endpoint.ip + "'");
    return endpoint;
}

std::string Endpoint::to_string() const {
    return ip + ":" + std::to_string(port);
}

RemoteExecutionConfig::RemoteExecutionConfig()
    : RemoteExecutionConfig(kDefaultBufferSize,
                            Endpoint{kDefaultMulticastIp, kDefaultMulticastPort},
                            kDefaultMulticastBindAddress,
                            kDefaultMulticastTtl) {}

RemoteExecutionConfig::RemoteExecutionConfig(std::size_t buffer_size,
                                             Endpoint multicast_group,
                                             std::string multicast_bind_address,
                                             unsigned multicast_ttl,
                                             std::string target_name,
                                             std::string local_id)
    : buffer_size_(buffer_size),
      multicast_group_(std::move(multicast_group)),
      multicast_bind_address_(std::move(multicast_bind_address)),
      multicast_ttl_(multicast_ttl),
      local_id_(local_id.empty() ? generate_uuid() : std::move(local_id)),
      command_address_(resolve_command_address()),
      target_name_(std::move(target_name)) {
    if (buffer_size_ == 0)
        throw InvalidConfigError("Receive buffer size must be positive");
    if (multicast_ttl_ > 255)
        throw InvalidConfigError("Multicast TTL must be within 0..255");
}

RemoteExecutionConfig RemoteExecutionConfig::from_json(const nlohmann::json& config) {
    if (!config.is_object())
        throw InvalidConfigError("Config must be a JSON object");

    try {
        const auto group = config.contains("multicast_group")
            ? Endpoint::parse(config.at("multicast_group").get<std::string>())
            : Endpoint{kDefaultMulticastIp, kDefaultMulticastPort};

        return RemoteExecutionConfig(
            config.value("buffer_size", kDefaultBufferSize),
            group,
            config.value("multicast_bind_address", std::string(kDefaultMulticastBindAddress)),
            config.value("multicast_ttl", kDefaultMulticastTtl),
            config.value("project_name", std::string()),
            config.value("local_id", std::string()));
    } catch (const nlohmann::json::exception& e) {
        throw InvalidConfigError(std::string("Invalid config: ") + e.what());
    }
}

RemoteExecutionConfig RemoteExecutionConfig::from_uproject_path(const std::filesystem::path& uproject_path) {
    if (!std::filesystem::is_regular_file(uproject_path) || uproject_path.extension() != ".uproject")
        throw InvalidUprojectPathError(uproject_path.string());

    const auto ini_path = uproject_path.parent_path() / "Config" / "DefaultEngine.ini";
    if (!std::filesystem::exists(ini_path))
        throw InvalidUprojectPathError("Can't find: " + ini_path.string());

    const auto settings = read_ini_section(ini_path, kPluginSettingsSection);

    if (!is_truthy(lookup(settings, "bRemoteExecution", "")))
        throw InvalidConfigError("Python remote execution is not enabled in the project settings");

    const auto group_text = lookup(settings, "RemoteExecutionMulticastGroupEndpoint", "");
    const auto group = group_text.empty() ? Endpoint{kDefaultMulticastIp, kDefaultMulticastPort}
                                          : Endpoint::parse(group_text);

    const auto ttl = parse_unsigned<unsigned>(
        "RemoteExecutionMulticastTtl",
        lookup(settings, "RemoteExecutionMulticastTtl", std::to_string(kDefaultMulticastTtl)));
    const auto buffer_size = parse_unsigned<std::size_t>(
        "RemoteExecutionReceiveBufferSizeBytes",
        lookup(settings, "RemoteExecutionReceiveBufferSizeBytes", std::to_string(kDefaultBufferSize)));

    return RemoteExecutionConfig(buffer_size,
                                 group,
                                 lookup(settings, "RemoteExecutionMulticastBindAddress",
                                        kDefaultMulticastBindAddress),
                                 ttl,
                                 uproject_path.stem().string());
}

RemoteExecutionConfig RemoteExecutionConfig::with_target_name(std::string target_name) const {
    RemoteExecutionConfig copy = *this;
    copy.target_name_ = std::move(target_name);
    return copy;
}

std::string RemoteExecutionConfig::to_string() const {
    std::ostringstream out;
    out << "buffer_size=" << buffer_size_
        << " multicast_group=" << multicast_group_.to_string()
        << " multicast_bind_address=" << multicast_bind_address_
        << " multicast_ttl=" << multicast_ttl_
        << " local_id=" << local_id_
        << " command_address=" << command_address_.to_string()
        << " target_name='" << target_name_ << "'";
    return out.str();
}

std::string generate_uuid() {
    uuid_t uuid;
    uuid_generate_random(uuid);
    char out[37] = {0};
    uuid_unparse_lower(uuid, out);
    return std::string(out);
}

Endpoint resolve_command_address() {
    asio::io_context io;
    asio::ip::tcp::acceptor acceptor(io, asio::ip::tcp::endpoint(asio::ip::address_v4::loopback(), 0));
    const auto port = acceptor.local_endpoint().port();
    acceptor.close();
    return Endpoint{"127.0.0.1", port};
}

} // namespace pyremote
