#include "device_discovery.hpp"
#include "logging/logs/startup_logs.hpp"
#include <algorithm>
#include <filesystem>
#include <set>
#include <system_error>
#include <glob.h>

namespace fs = std::filesystem;

namespace MeshBridge {
namespace Link {

namespace {
    constexpr int PROGRESS_LOG_INTERVAL_SECONDS = 5;

    void append_glob(std::vector<std::string>& out, const char* pattern) {
        glob_t glob_result{};
        if (glob(pattern, 0, nullptr, &glob_result) == 0) {
            for (std::size_t path_index = 0; path_index < glob_result.gl_pathc; ++path_index) {
                out.emplace_back(glob_result.gl_pathv[path_index]);
            }
        }
        globfree(&glob_result);
    }
}

std::vector<std::string> list_device_links(const std::string& directory) {
    std::vector<std::string> entries;
    std::error_code directory_error;
    if (!fs::is_directory(directory, directory_error)) {
        return entries;
    }
    // Devices can be unplugged mid-scan; stop quietly on the first iteration error
    fs::directory_iterator entry_iterator(directory, directory_error);
    for (; !directory_error && entry_iterator != fs::directory_iterator(); entry_iterator.increment(directory_error)) {
        entries.push_back(entry_iterator->path().string());
    }
    return entries;
}

std::vector<std::string> discover_serial_ports() {
    std::vector<std::string> candidates = list_device_links("/dev/serial/by-id");
    append_glob(candidates, "/dev/ttyUSB*");
    append_glob(candidates, "/dev/ttyACM*");

    std::set<std::string> resolved_ports;
    for (const std::string& candidate : candidates) {
        std::error_code canonical_error;
        fs::path resolved_path = fs::canonical(candidate, canonical_error);
        if (!canonical_error) {
            resolved_ports.insert(resolved_path.string());
        }
    }
    return std::vector<std::string>(resolved_ports.begin(), resolved_ports.end());
}

std::vector<std::string> wait_for_devices(int required_count, int max_wait_seconds, int check_interval_seconds,
                                          const TimeUtils::InterruptibleSleep& sleeper) {
    int interval_seconds = std::max(1, check_interval_seconds);
    int waited_seconds = 0;
    int last_progress_log_seconds = -PROGRESS_LOG_INTERVAL_SECONDS;

    std::vector<std::string> found_ports = discover_serial_ports();
    while (static_cast<int>(found_ports.size()) < required_count && waited_seconds < max_wait_seconds) {
        if (waited_seconds - last_progress_log_seconds >= PROGRESS_LOG_INTERVAL_SECONDS) {
            Logging::StartupLogs::log_device_wait(static_cast<int>(found_ports.size()), required_count, waited_seconds);
            last_progress_log_seconds = waited_seconds;
        }
        if (!sleeper(std::chrono::seconds(interval_seconds))) {
            break;
        }
        waited_seconds += interval_seconds;
        found_ports = discover_serial_ports();
    }
    return found_ports;
}

std::vector<std::string> select_unclaimed_ports(const std::vector<std::string>& discovered_ports,
                                                const std::vector<std::string>& claimed_ports,
                                                std::size_t count) {
    std::vector<std::string> resolved_claimed_ports;
    for (const std::string& claimed_port : claimed_ports) {
        std::error_code canonical_error;
        fs::path resolved_path = fs::canonical(claimed_port, canonical_error);
        resolved_claimed_ports.push_back(canonical_error ? claimed_port : resolved_path.string());
    }

    std::vector<std::string> selected_ports;
    for (const std::string& port : discovered_ports) {
        if (selected_ports.size() >= count) break;
        bool already_claimed = std::find(resolved_claimed_ports.begin(), resolved_claimed_ports.end(), port) != resolved_claimed_ports.end();
        if (!already_claimed) {
            selected_ports.push_back(port);
        }
    }
    return selected_ports;
}

bool verify_radio_port(const RadioLinkFactory& link_factory, const std::string& port) {
    RadioLinkPtr candidate_link = link_factory();
    if (!candidate_link) {
        return false;
    }

    bool verified = false;
    try {
        candidate_link->open(port);
        LinkIdentity identity = candidate_link->get_identity();
        verified = identity.is_known();
        if (verified) {
            Logging::StartupLogs::log_port_verified(port, identity.node_id);
        } else {
            Logging::StartupLogs::log_port_rejected(port, "no node identity reported");
        }
    } catch (const std::exception& verify_exception_error) {
        Logging::StartupLogs::log_port_rejected(port, verify_exception_error.what());
    }

    try {
        candidate_link->close();
    } catch (const std::exception& close_exception_error) {
        Logging::StartupLogs::log_port_rejected(port, std::string("close failed: ") + close_exception_error.what());
    }
    return verified;
}

std::vector<std::string> select_verified_ports(const std::vector<std::string>& discovered_ports,
                                               const std::vector<std::string>& claimed_ports,
                                               std::size_t count, const RadioLinkFactory& link_factory) {
    std::vector<std::string> unclaimed_ports = select_unclaimed_ports(discovered_ports, claimed_ports, discovered_ports.size());

    std::vector<std::string> verified_ports;
    for (const std::string& port : unclaimed_ports) {
        if (verified_ports.size() >= count) break;
        if (verify_radio_port(link_factory, port)) {
            verified_ports.push_back(port);
        }
    }
    return verified_ports;
}

} // namespace Link
} // namespace MeshBridge
