#include "connection_manager.hpp"
#include "logging/logger/async_logger.hpp"
#include "logging/logs/link_logs.hpp"
#include <cmath>
#include <stdexcept>

using MeshBridge::Logging::LinkLogs;

namespace MeshBridge {
namespace Bridge {

ConnectionManager::ConnectionManager(LinkState& link_state, Link::RadioLinkFactory link_factory,
                                     const Config::ConnectionConfig& connection_config,
                                     TimeUtils::InterruptibleSleep sleeper, const std::string& recovery_thread_tag)
    : link_state_(link_state),
      link_factory_(std::move(link_factory)),
      max_attempts_(connection_config.max_attempts),
      initial_retry_delay_seconds_(connection_config.initial_retry_delay_seconds),
      backoff_multiplier_(connection_config.backoff_multiplier),
      sleeper_(std::move(sleeper)),
      recovery_thread_tag_(recovery_thread_tag) {
    if (max_attempts_ < 1) {
        throw std::runtime_error("connection.max_attempts must be at least 1");
    }
    if (initial_retry_delay_seconds_ < 0) {
        throw std::runtime_error("connection.initial_retry_delay_seconds must not be negative");
    }
    if (backoff_multiplier_ < 1.0) {
        throw std::runtime_error("connection.backoff_multiplier must be at least 1.0");
    }
    if (!link_factory_) {
        throw std::runtime_error("ConnectionManager requires a link factory");
    }
    if (!sleeper_) {
        throw std::runtime_error("ConnectionManager requires a sleep function");
    }
}

ConnectionManager::~ConnectionManager() {
    begin_shutdown();
    wait_for_background_recovery();
    close_active_link();
}

void ConnectionManager::set_receive_handler(Link::ReceiveCallback handler) {
    receive_handler_ = std::move(handler);
}

void ConnectionManager::set_recovery_failure_handler(RecoveryFailureHandler handler) {
    recovery_failure_handler_ = std::move(handler);
}

std::chrono::milliseconds ConnectionManager::retry_delay_after_attempt(int failed_attempt) const {
    double delay_seconds = initial_retry_delay_seconds_ * std::pow(backoff_multiplier_, failed_attempt - 1);
    return std::chrono::milliseconds(static_cast<long long>(std::llround(delay_seconds * 1000.0)));
}

void ConnectionManager::connect() {
    std::lock_guard<std::mutex> lifecycle_lock(lifecycle_mutex_);
    connect_with_retries(LinkStatus::CONNECTING);
}

void ConnectionManager::reconnect(const std::string& reason) {
    std::lock_guard<std::mutex> lifecycle_lock(lifecycle_mutex_);
    LinkLogs::log_recovering(link_state_.get_label(), reason);
    link_state_.set_status(LinkStatus::RECOVERING);
    close_active_link();
    connect_with_retries(LinkStatus::RECOVERING);
}

void ConnectionManager::connect_with_retries(LinkStatus in_progress_status) {
    const std::string& link_label = link_state_.get_label();
    std::string port = link_state_.get_port();
    std::string last_error_message = "no attempt made";

    link_state_.set_status(in_progress_status);

    for (int attempt = 1; attempt <= max_attempts_; ++attempt) {
        if (shutting_down_.load()) {
            break;
        }
        LinkLogs::log_connect_attempt(link_label, port, attempt, max_attempts_);

        try {
            Link::RadioLinkPtr new_link = link_factory_();
            if (!new_link) {
                throw Link::LinkConnectionError("link factory produced no link");
            }
            Link::ReceiveCallback receive_handler = receive_handler_;
            new_link->register_receive_callback([receive_handler](const Link::MeshPacket& packet) {
                if (receive_handler) {
                    receive_handler(packet);
                }
            });
            new_link->register_connection_lost_callback([this](const std::string& reason) {
                handle_connection_lost(reason);
            });

            std::shared_ptr<Link::RadioLinkInterface> opening_link(std::move(new_link));
            {
                std::lock_guard<std::mutex> link_lock(link_mutex_);
                active_link_ = opening_link;
            }
            opening_link->open(port);

            Link::LinkIdentity identity = opening_link->get_identity();
            link_state_.set_node_id(identity.node_id);
            link_state_.clear_last_error();
            link_state_.set_status(LinkStatus::CONNECTED);
            LinkLogs::log_connect_success(link_label, port, identity.node_id);
            if (!identity.is_known()) {
                LinkLogs::log_identity_missing(link_label);
            }
            return;
        } catch (const std::exception& connect_exception_error) {
            last_error_message = connect_exception_error.what();
            link_state_.set_last_error(last_error_message);
            LinkLogs::log_connect_attempt_failed(link_label, attempt, max_attempts_, last_error_message);
            close_active_link();
        }

        if (attempt < max_attempts_) {
            std::chrono::milliseconds retry_delay = retry_delay_after_attempt(attempt);
            LinkLogs::log_retry_scheduled(link_label, retry_delay.count() / 1000.0);
            if (!sleeper_(retry_delay)) {
                break;
            }
        }
    }

    link_state_.set_status(LinkStatus::DISCONNECTED);
    if (shutting_down_.load()) {
        LinkLogs::log_connect_interrupted(link_label);
        throw Link::LinkConnectionError(link_label + ": connect to " + port + " abandoned during shutdown");
    }
    LinkLogs::log_connect_exhausted(link_label, port, max_attempts_);
    throw Link::LinkConnectionError(link_label + ": could not connect to " + port + " after " +
                                    std::to_string(max_attempts_) + " attempts: " + last_error_message);
}

void ConnectionManager::close_active_link() {
    std::shared_ptr<Link::RadioLinkInterface> closing_link;
    {
        std::lock_guard<std::mutex> link_lock(link_mutex_);
        closing_link.swap(active_link_);
    }
    if (!closing_link) {
        return;
    }
    try {
        closing_link->close();
    } catch (const std::exception& close_exception_error) {
        LinkLogs::log_close_error(link_state_.get_label(), close_exception_error.what());
    }
}

std::shared_ptr<Link::RadioLinkInterface> ConnectionManager::current_link() const {
    std::lock_guard<std::mutex> link_lock(link_mutex_);
    return active_link_;
}

void ConnectionManager::disconnect() {
    std::lock_guard<std::mutex> lifecycle_lock(lifecycle_mutex_);
    close_active_link();
    link_state_.set_status(LinkStatus::DISCONNECTED);
    LinkLogs::log_disconnected(link_state_.get_label());
}

void ConnectionManager::begin_shutdown() {
    shutting_down_.store(true);
}

void ConnectionManager::wait_for_background_recovery() {
    std::lock_guard<std::mutex> recovery_lock(recovery_thread_mutex_);
    if (recovery_thread_.joinable()) {
        recovery_thread_.join();
    }
}

void ConnectionManager::send(const Link::MeshPacket& packet) {
    std::shared_ptr<Link::RadioLinkInterface> link = current_link();
    if (!link) {
        throw Link::LinkSendError(link_state_.get_label() + " is not connected");
    }
    link->send(packet);
}

bool ConnectionManager::probe() {
    std::shared_ptr<Link::RadioLinkInterface> link = current_link();
    if (!link || !link->is_open()) {
        return false;
    }
    return link->is_responsive();
}

void ConnectionManager::request_reboot() {
    std::shared_ptr<Link::RadioLinkInterface> link = current_link();
    if (!link) {
        throw Link::LinkCommandError(link_state_.get_label() + " has no open link to reboot");
    }
    link->request_reboot();
}

Link::LinkIdentity ConnectionManager::get_identity() const {
    std::shared_ptr<Link::RadioLinkInterface> link = current_link();
    if (!link) {
        return Link::LinkIdentity();
    }
    return link->get_identity();
}

bool ConnectionManager::is_connected() const {
    std::shared_ptr<Link::RadioLinkInterface> link = current_link();
    return link && link->is_open();
}

std::string ConnectionManager::get_link_type() const {
    std::shared_ptr<Link::RadioLinkInterface> link = current_link();
    return link ? link->get_link_type() : std::string("none");
}

// Runs on the link's own I/O thread, which the reconnect will join; hand off to a recovery thread
void ConnectionManager::handle_connection_lost(const std::string& reason) {
    LinkLogs::log_connection_lost(link_state_.get_label(), reason);
    link_state_.set_last_error(reason);
    if (shutting_down_.load() || link_state_.get_status() != LinkStatus::CONNECTED) {
        return;
    }
    if (recovery_in_progress_.exchange(true)) {
        return;
    }

    std::lock_guard<std::mutex> recovery_lock(recovery_thread_mutex_);
    if (recovery_thread_.joinable()) {
        recovery_thread_.join();
    }
    recovery_thread_ = std::thread(&ConnectionManager::run_background_recovery, this, reason);
}

void ConnectionManager::run_background_recovery(const std::string& reason) {
    Logging::set_log_thread_tag(recovery_thread_tag_);
    try {
        reconnect("connection lost: " + reason);
    } catch (const Link::LinkConnectionError& reconnect_exception_error) {
        LinkLogs::log_reconnect_exhausted(link_state_.get_label(), reconnect_exception_error.what());
        if (recovery_failure_handler_ && !shutting_down_.load()) {
            recovery_failure_handler_(link_state_.get_label(), reconnect_exception_error.what());
        }
    } catch (const std::exception& recovery_exception_error) {
        LinkLogs::log_reconnect_exhausted(link_state_.get_label(), recovery_exception_error.what());
    }
    Logging::clear_log_thread_tag();
    recovery_in_progress_.store(false);
}

} // namespace Bridge
} // namespace MeshBridge
