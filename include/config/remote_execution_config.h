#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

namespace pyremote {

/// An IPv4 address and port pair, as written in "ip:port" settings.
struct Endpoint {
    std::string ip;
    uint16_t port = 0;

    /// Parse "ip:port". Throws InvalidConfigError on malformed input.
    static Endpoint parse(const std::string& text);

    [[nodiscard]] std::string to_string() const;

    bool operator==(const Endpoint& other) const { return ip == other.ip && port == other.port; }
    bool operator!=(const Endpoint& other) const { return !(*this == other); }
};

/**
 * Immutable settings shared by the discovery and command channels.
 *
 * The local id and the command address are fixed at construction: copies of
 * a config keep the same identity and the same command port.
 */
class RemoteExecutionConfig {
public:
    static constexpr std::size_t kDefaultBufferSize = 2'097'152;
    static constexpr const char* kDefaultMulticastIp = "239.0.0.1";
    static constexpr uint16_t kDefaultMulticastPort = 6766;
    static constexpr const char* kDefaultMulticastBindAddress = "0.0.0.0";
    static constexpr unsigned kDefaultMulticastTtl = 0;

    /// Settings section read from <project>/Config/DefaultEngine.ini.
    static constexpr const char* kPluginSettingsSection =
        "/Script/PythonScriptPlugin.PythonScriptPluginSettings";

    /// Built-in defaults, no target project.
    RemoteExecutionConfig();

    RemoteExecutionConfig(std::size_t buffer_size,
                          Endpoint multicast_group,
                          std::string multicast_bind_address,
                          unsigned multicast_ttl,
                          std::string target_name = {},
                          std::string local_id = {});

    /// Build from a JSON object; absent keys fall back to the defaults.
    static RemoteExecutionConfig from_json(const nlohmann::json& config);

    /// Read the python plugin settings of the given .uproject and target it.
    static RemoteExecutionConfig from_uproject_path(const std::filesystem::path& uproject_path);

    /// Same identity and command address, different target project.
    [[nodiscard]] RemoteExecutionConfig with_target_name(std::string target_name) const;

    [[nodiscard]] std::size_t buffer_size() const { return buffer_size_; }
    [[nodiscard]] const Endpoint& multicast_group() const { return multicast_group_; }
    [[nodiscard]] const std::string& multicast_bind_address() const { return multicast_bind_address_; }
    [[nodiscard]] unsigned multicast_ttl() const { return multicast_ttl_; }
    [[nodiscard]] const std::string& local_id() const { return local_id_; }
    [[nodiscard]] const Endpoint& command_address() const { return command_address_; }
    [[nodiscard]] const std::string& target_name() const { return target_name_; }
    [[nodiscard]] bool has_target_name() const { return !target_name_.empty(); }

    [[nodiscard]] std::string to_string() const;

private:
    std::size_t buffer_size_;
    Endpoint multicast_group_;
    std::string multicast_bind_address_;
    unsigned multicast_ttl_;
    std::string local_id_;
    Endpoint command_address_;
    std::string target_name_;
};

/// Random (v4) UUID in lower-case canonical form.
std::string generate_uuid();

/// Bind an ephemeral loopback TCP port, release it and return the address.
Endpoint resolve_command_address();

} // namespace pyremote
