#include "config.hpp"
#include "chain.hpp"
#include <algorithm>
#include <cctype>

namespace tproxy {

// TrafficFlowConfig implementation
bool TrafficFlowConfig::isValid() const {
    return getErrorMessage().empty();
}

std::string TrafficFlowConfig::getErrorMessage() const {
    if (!enabled) {
        return "";
    }
    if (port == 0) {
        return "Redirect port must be between 1-65535";
    }
    for (uint16_t excluded : exclude_ports) {
        if (excluded == 0) {
            return "Excluded port must be between 1-65535";
        }
        if (excluded == port) {
            return "Redirect port " + std::to_string(port) + " cannot be excluded";
        }
    }
    return "";
}

// RedirectConfig implementation
bool RedirectConfig::isValid() const {
    return getErrorMessage().empty();
}

std::string RedirectConfig::getErrorMessage() const {
    // The longest chain name built from the prefix has to be acceptable to iptables
    std::string chain_error = Chain::getNameValidationError(chain_prefix + "OUTBOUND_REDIRECT");
    if (!chain_error.empty()) {
        return "Invalid chain prefix '" + chain_prefix + "': " + chain_error;
    }

    std::string error = inbound.getErrorMessage();
    if (!error.empty()) {
        return "Error in inbound: " + error;
    }
    error = outbound.getErrorMessage();
    if (!error.empty()) {
        return "Error in outbound: " + error;
    }
    if (inbound.enabled && outbound.enabled && inbound.port == outbound.port) {
        return "Inbound and outbound redirect ports must differ";
    }
    if (dns.enabled && dns.port == 0) {
        return "DNS port must be between 1-65535";
    }
    return "";
}

// EbpfConfig implementation
bool EbpfConfig::isValid() const {
    return getErrorMessage().empty();
}

std::string EbpfConfig::getErrorMessage() const {
    if (!enabled) {
        return "";
    }
    if (bpffs_path.empty()) {
        return "BPF filesystem path cannot be empty";
    }
    if (programs_source_path.empty()) {
        return "Programs source path cannot be empty";
    }
    return "";
}

// Config implementation
bool Config::isValid() const {
    return getErrorMessage().empty();
}

std::string Config::getErrorMessage() const {
    if (owner_uid.empty()) {
        return "Owner UID cannot be empty";
    }
    if (!std::all_of(owner_uid.begin(), owner_uid.end(),
                     [](unsigned char c) { return std::isdigit(c); })) {
        return "Owner UID must be numeric: " + owner_uid;
    }

    std::string error = redirect.getErrorMessage();
    if (!error.empty()) {
        return "Error in redirect: " + error;
    }
    error = ebpf.getErrorMessage();
    if (!error.empty()) {
        return "Error in ebpf: " + error;
    }
    return "";
}

} // namespace tproxy

// YAML conversion implementations
namespace YAML {

using namespace tproxy;

// LogLevel conversion
Node convert<LogLevel>::encode(const LogLevel& level) {
    switch (level) {
        case LogLevel::None: return Node("none");
        case LogLevel::Error: return Node("error");
        case LogLevel::Warning: return Node("warning");
        case LogLevel::Info: return Node("info");
        case LogLevel::Debug: return Node("debug");
        default: return Node("info");
    }
}

bool convert<LogLevel>::decode(const Node& node, LogLevel& level) {
    if (!node.IsScalar()) return false;

    std::string value = node.as<std::string>();
    std::transform(value.begin(), value.end(), value.begin(), ::tolower);

    if (value == "none") {
        level = LogLevel::None;
    } else if (value == "error") {
        level = LogLevel::Error;
    } else if (value == "warning" || value == "warn") {
        level = LogLevel::Warning;
    } else if (value == "info") {
        level = LogLevel::Info;
    } else if (value == "debug") {
        level = LogLevel::Debug;
    } else {
        return false;
    }
    return true;
}

// ExecutionPolicy conversion
Node convert<ExecutionPolicy>::encode(const ExecutionPolicy& policy) {
    Node node;
    switch (policy) {
        case ExecutionPolicy::Sequential:
            node = "sequential";
            break;
        case ExecutionPolicy::Concurrent:
            node = "concurrent";
            break;
    }
    return node;
}

bool convert<ExecutionPolicy>::decode(const Node& node, ExecutionPolicy& policy) {
    if (!node.IsScalar()) return false;

    std::string value = node.as<std::string>();
    if (value == "sequential") {
        policy = ExecutionPolicy::Sequential;
    } else if (value == "concurrent") {
        policy = ExecutionPolicy::Concurrent;
    } else {
        return false;
    }
    return true;
}

// TrafficFlowConfig conversion
Node convert<TrafficFlowConfig>::encode(const TrafficFlowConfig& config) {
    Node node;
    node["enabled"] = config.enabled;
    node["port"] = config.port;
    node["exclude_ports"] = config.exclude_ports;
    return node;
}

bool convert<TrafficFlowConfig>::decode(const Node& node, TrafficFlowConfig& config) {
    if (!node.IsMap()) return false;

    if (node["enabled"]) {
        config.enabled = node["enabled"].as<bool>();
    }
    if (node["port"]) {
        config.port = node["port"].as<uint16_t>();
    }
    if (node["exclude_ports"]) {
        config.exclude_ports = node["exclude_ports"].as<std::vector<uint16_t>>();
    }
    return true;
}

// DnsConfig conversion
Node convert<DnsConfig>::encode(const DnsConfig& config) {
    Node node;
    node["enabled"] = config.enabled;
    node["port"] = config.port;
    return node;
}

bool convert<DnsConfig>::decode(const Node& node, DnsConfig& config) {
    if (!node.IsMap()) return false;

    if (node["enabled"]) {
        config.enabled = node["enabled"].as<bool>();
    }
    if (node["port"]) {
        config.port = node["port"].as<uint16_t>();
    }
    return true;
}

// RedirectConfig conversion
Node convert<RedirectConfig>::encode(const RedirectConfig& config) {
    Node node;
    node["chain_prefix"] = config.chain_prefix;
    node["inbound"] = config.inbound;
    node["outbound"] = config.outbound;
    node["dns"] = config.dns;
    return node;
}

bool convert<RedirectConfig>::decode(const Node& node, RedirectConfig& config) {
    if (!node.IsMap()) return false;

    if (node["chain_prefix"]) {
        config.chain_prefix = node["chain_prefix"].as<std::string>();
    }
    if (node["inbound"]) {
        config.inbound = node["inbound"].as<TrafficFlowConfig>();
    }
    if (node["outbound"]) {
        config.outbound = node["outbound"].as<TrafficFlowConfig>();
    }
    if (node["dns"]) {
        config.dns = node["dns"].as<DnsConfig>();
    }
    return true;
}

// EbpfConfig conversion
Node convert<EbpfConfig>::encode(const EbpfConfig& config) {
    Node node;
    node["enabled"] = config.enabled;
    node["bpffs_path"] = config.bpffs_path;
    node["programs_source_path"] = config.programs_source_path;
    node["timeout_ms"] = config.timeout_ms;
    node["execution"] = config.execution;
    return node;
}

bool convert<EbpfConfig>::decode(const Node& node, EbpfConfig& config) {
    if (!node.IsMap()) return false;

    if (node["enabled"]) {
        config.enabled = node["enabled"].as<bool>();
    }
    if (node["bpffs_path"]) {
        config.bpffs_path = node["bpffs_path"].as<std::string>();
    }
    if (node["programs_source_path"]) {
        config.programs_source_path = node["programs_source_path"].as<std::string>();
    }
    if (node["timeout_ms"]) {
        config.timeout_ms = node["timeout_ms"].as<uint32_t>();
    }
    if (node["execution"]) {
        config.execution = node["execution"].as<ExecutionPolicy>();
    }
    return true;
}

// Config conversion
Node convert<Config>::encode(const Config& config) {
    Node node;
    node["redirect"] = config.redirect;
    node["owner_uid"] = config.owner_uid;
    node["verbose"] = config.verbose;
    node["log_level"] = config.log_level;
    node["ebpf"] = config.ebpf;
    return node;
}

bool convert<Config>::decode(const Node& node, Config& config) {
    // An empty document yields the default configuration
    if (node.IsNull()) return true;
    if (!node.IsMap()) return false;

    if (node["redirect"]) {
        config.redirect = node["redirect"].as<RedirectConfig>();
    }
    if (node["owner_uid"]) {
        config.owner_uid = node["owner_uid"].as<std::string>();
    }
    if (node["verbose"]) {
        config.verbose = node["verbose"].as<bool>();
    }
    if (node["log_level"]) {
        config.log_level = node["log_level"].as<LogLevel>();
    }
    if (node["ebpf"]) {
        config.ebpf = node["ebpf"].as<EbpfConfig>();
    }
    return true;
}

} // namespace YAML
