/**
 * @file config.hpp
 * @brief Configuration structures and YAML serialization for tproxy-compose
 * @author tproxy-compose Development Team
 * @date 2024
 *
 * This file contains the configuration of the traffic interception setup:
 * the ports and exclusions used to build the redirect ruleset, the owner of
 * the proxy process, and the settings of the BPF program loading path.
 * YAML serialization is provided through yaml-cpp template specializations.
 */

#pragma once

#include "logger.hpp"
#include <cstdint>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace tproxy {

/**
 * @enum ExecutionPolicy
 * @brief How a batch of loader programs is executed
 */
enum class ExecutionPolicy {
    Sequential,  ///< One program at a time in list order
    Concurrent   ///< All programs at once, output forwarded in list order
};

/**
 * @struct TrafficFlowConfig
 * @brief Redirection settings for one traffic direction
 */
struct TrafficFlowConfig {
    bool enabled = true;                  ///< Whether the direction is intercepted
    uint16_t port = 0;                    ///< Local proxy port traffic is redirected to
    std::vector<uint16_t> exclude_ports;  ///< Ports that bypass the proxy

    /**
     * @brief Validate the flow configuration
     * @return true if the redirect port and all excluded ports are usable
     */
    bool isValid() const;

    /**
     * @brief Get detailed error message for invalid configurations
     * @return Human-readable error description or empty string if valid
     */
    std::string getErrorMessage() const;
};

/**
 * @struct DnsConfig
 * @brief DNS redirection settings
 */
struct DnsConfig {
    bool enabled = false;   ///< Redirect UDP/53 to the proxy's DNS port
    uint16_t port = 15053;  ///< Local DNS proxy port
};

/**
 * @struct RedirectConfig
 * @brief Settings used to build the nat table redirect rules
 */
struct RedirectConfig {
    std::string chain_prefix = "MESH_";  ///< Prefix of all custom chain names
    TrafficFlowConfig inbound{true, 15006, {}};
    TrafficFlowConfig outbound{true, 15001, {}};
    DnsConfig dns;

    bool isValid() const;
    std::string getErrorMessage() const;
};

/**
 * @struct EbpfConfig
 * @brief Settings of the BPF based redirection path
 */
struct EbpfConfig {
    bool enabled = false;
    std::string bpffs_path = "/run/kuma/bpf";              ///< BPF filesystem mount point
    std::string programs_source_path = "/kuma/ebpf";       ///< Directory of loader executables
    uint32_t timeout_ms = 30000;                            ///< Per-program timeout, 0 = none
    ExecutionPolicy execution = ExecutionPolicy::Sequential;

    bool isValid() const;
    std::string getErrorMessage() const;
};

/**
 * @struct Config
 * @brief Root configuration structure for tproxy-compose
 */
struct Config {
    RedirectConfig redirect;
    std::string owner_uid = "5678";  ///< UID the proxy runs as
    bool verbose = false;            ///< Render annotated restore input
    LogLevel log_level = LogLevel::Info;
    EbpfConfig ebpf;

    /**
     * @brief Validate the complete configuration
     * @return true if all sections are valid and consistent
     *
     * Besides the per-section checks, inbound and outbound redirect ports
     * must differ when both directions are enabled.
     */
    bool isValid() const;

    /**
     * @brief Get detailed error message for invalid configurations
     * @return Human-readable error description or empty string if valid
     */
    std::string getErrorMessage() const;
};

}  // namespace tproxy

/**
 * @namespace YAML
 * @brief YAML serialization template specializations
 *
 * Decoding starts from the default values of each structure, so every key
 * is optional.
 */
namespace YAML {

/**
 * @brief YAML conversion for LogLevel enum
 *
 * "none", "error", "warning", "info", "debug"
 */
template<>
struct convert<tproxy::LogLevel> {
    static Node encode(const tproxy::LogLevel& level);
    static bool decode(const Node& node, tproxy::LogLevel& level);
};

/**
 * @brief YAML conversion for ExecutionPolicy enum
 *
 * "sequential", "concurrent"
 */
template<>
struct convert<tproxy::ExecutionPolicy> {
    static Node encode(const tproxy::ExecutionPolicy& policy);
    static bool decode(const Node& node, tproxy::ExecutionPolicy& policy);
};

template<>
struct convert<tproxy::TrafficFlowConfig> {
    static Node encode(const tproxy::TrafficFlowConfig& config);
    static bool decode(const Node& node, tproxy::TrafficFlowConfig& config);
};

template<>
struct convert<tproxy::DnsConfig> {
    static Node encode(const tproxy::DnsConfig& config);
    static bool decode(const Node& node, tproxy::DnsConfig& config);
};

template<>
struct convert<tproxy::RedirectConfig> {
    static Node encode(const tproxy::RedirectConfig& config);
    static bool decode(const Node& node, tproxy::RedirectConfig& config);
};

template<>
struct convert<tproxy::EbpfConfig> {
    static Node encode(const tproxy::EbpfConfig& config);
    static bool decode(const Node& node, tproxy::EbpfConfig& config);
};

/**
 * @brief YAML conversion for the root Config struct
 */
template<>
struct convert<tproxy::Config> {
    static Node encode(const tproxy::Config& config);
    static bool decode(const Node& node, tproxy::Config& config);
};

} // namespace YAML
