#include "process_supervisor.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstring>
#include <exception>
#include <filesystem>
#include <system_error>
#include <utility>

#include "logging/logger.hpp"
#include "process_id.hpp"
#include "pty/pty_channel.hpp"

namespace trellico {
namespace process {

bool parse_process_mode(const std::string &value, ProcessMode &out) {
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "multi") {
        out = ProcessMode::MULTI;
        return true;
    }
    if (lower == "single") {
        out = ProcessMode::SINGLE;
        return true;
    }
    return false;
}

const char *process_mode_to_string(ProcessMode mode) { return mode == ProcessMode::SINGLE ? "single" : "multi"; }

ProcessSupervisor::ProcessSupervisor(const provider::ProviderCatalog &catalog, events::IEventSink &sink,
                                     SupervisorConfig config)
    : catalog_(catalog),
      sink_(sink),
      config_(config),
      registry_(config.mode == ProcessMode::SINGLE ? 1 : 0) {}

ProcessSupervisor::~ProcessSupervisor() { shutdown(); }

std::optional<std::string> ProcessSupervisor::start(const StartRequest &request, std::string &error) {
    if (request.message.empty()) {
        error = "message must not be empty";
        return std::nullopt;
    }
    if (request.folder_path.empty()) {
        error = "folder_path must not be empty";
        return std::nullopt;
    }

    auto descriptor = catalog_.get(request.provider_id);
    if (!descriptor) {
        error = "Unknown provider: " + request.provider_id;
        return std::nullopt;
    }

    reap_finished_workers();

    ProcessInfo info;
    info.process_id = generate_process_id();
    info.provider_id = request.provider_id;
    info.folder_path = request.folder_path;
    info.resume_session = request.resume_session;
    info.started_at_ms = events::now_ms();

    auto token = std::make_shared<CancellationToken>();

    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        if (shutting_down_) {
            error = "Supervisor is shutting down";
            return std::nullopt;
        }

        if (!registry_.add(info, token, error)) {
            return std::nullopt;
        }

        // The worker cannot mark itself done before its entry exists: it needs this lock
        try {
            Worker worker;
            worker.thread = std::thread([this, info, message = request.message, descriptor, token]() {
                try {
                    run_process(info, message, descriptor, token);
                } catch (const std::exception &e) {
                    LOG_ERROR("[Supervisor] " << info.process_id << " worker failed: " << e.what());
                    finish_with_error(info, descriptor->event_prefix(), std::string("Internal error: ") + e.what());
                }
                mark_worker_done(info.process_id);
            });
            workers_.emplace(info.process_id, std::move(worker));
        } catch (const std::system_error &e) {
            registry_.remove(info.process_id);
            error = std::string("Failed to start worker thread: ") + e.what();
            return std::nullopt;
        }
    }

    LOG_INFO("[Supervisor] Started " << info.provider_id << " process " << info.process_id << " in "
                                     << info.folder_path << (info.resume_session ? " (resume)" : ""));
    return info.process_id;
}

size_t ProcessSupervisor::stop(const std::optional<std::string> &process_id) {
    if (process_id) {
        if (registry_.cancel(*process_id)) {
            LOG_INFO("[Supervisor] Stop requested for " << *process_id);
            return 1;
        }
        LOG_DEBUG("[Supervisor] Stop for unknown process " << *process_id << " ignored");
        return 0;
    }

    const size_t count = registry_.cancel_all();
    if (count > 0) {
        LOG_INFO("[Supervisor] Stop requested for all " << count << " process(es)");
    }
    return count;
}

bool ProcessSupervisor::wait_idle(int timeout_ms) {
    std::unique_lock<std::mutex> lock(workers_mutex_);
    auto idle = [this] {
        return std::all_of(workers_.begin(), workers_.end(), [](const auto &entry) { return entry.second.done; });
    };

    if (timeout_ms < 0) {
        workers_cv_.wait(lock, idle);
        return true;
    }
    return workers_cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms), idle);
}

void ProcessSupervisor::shutdown() {
    std::vector<std::thread> threads;

    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        if (!shutting_down_) {
            LOG_INFO("[Supervisor] Shutting down (" << registry_.size() << " running)");
        }
        shutting_down_ = true;

        // Under the workers lock so no start() can slip in between
        registry_.cancel_all();

        for (auto &[id, worker] : workers_) {
            static_cast<void>(id);
            if (worker.thread.joinable()) {
                threads.push_back(std::move(worker.thread));
            }
        }
    }

    for (auto &thread : threads) {
        thread.join();
    }

    std::lock_guard<std::mutex> lock(workers_mutex_);
    workers_.clear();
}

void ProcessSupervisor::run_process(const ProcessInfo &info, const std::string &message,
                                    std::shared_ptr<provider::IProviderDescriptor> descriptor,
                                    std::shared_ptr<CancellationToken> token) {
    const std::string &prefix = descriptor->event_prefix();

    auto binary = descriptor->find_binary();
    if (!binary) {
        finish_with_error(info, prefix, descriptor->display_name() + " binary not found or not executable");
        return;
    }

    std::error_code ec;
    if (!std::filesystem::is_directory(info.folder_path, ec)) {
        finish_with_error(info, prefix, "Working directory does not exist: " + info.folder_path);
        return;
    }

    pty::PtyChannel channel;
    std::string error;
    if (!channel.open(config_.pty_rows, config_.pty_cols, error)) {
        finish_with_error(info, prefix, error);
        return;
    }

    const auto args = descriptor->build_args(message, info.resume_session);
    if (!channel.spawn(*binary, args, info.folder_path, error)) {
        finish_with_error(info, prefix, error);
        return;
    }

    Utf8ChunkDecoder decoder(config_.utf8_policy);
    std::vector<char> buffer(config_.read_chunk_bytes);
    std::string read_error;
    bool cancelled = false;

    while (true) {
        if (token->is_cancelled()) {
            LOG_INFO("[Supervisor] " << info.process_id << " cancelled, killing child");
            channel.kill();
            cancelled = true;
            break;
        }

        const auto result = channel.read(buffer.data(), buffer.size(), config_.cancel_poll_ms);
        if (result.status == pty::PtyChannel::ReadStatus::TIMEOUT) {
            continue;
        }
        if (result.status == pty::PtyChannel::ReadStatus::END) {
            break;
        }
        if (result.status == pty::PtyChannel::ReadStatus::ERROR) {
            read_error = std::string("I/O error while reading: ") + std::strerror(result.error_code);
            break;
        }

        auto text = decoder.decode(buffer.data(), result.bytes);
        if (!text) {
            LOG_DEBUG("[Supervisor] " << info.process_id << " dropped " << result.bytes
                                      << " byte(s) of undecodable output");
            continue;
        }

        events::ProcessOutputEvent event;
        event.event_prefix = prefix;
        event.process_id = info.process_id;
        event.data = std::move(*text);
        event.timestamp_ms = events::now_ms();
        sink_.publish(std::move(event));
    }

    if (decoder.pending() > 0) {
        LOG_DEBUG("[Supervisor] " << info.process_id << " discarding " << decoder.discard_pending()
                                  << " trailing byte(s) of an incomplete UTF-8 sequence");
    }

    if (!read_error.empty()) {
        // Reap before reporting so no zombie outlives the registry entry
        channel.kill();
        std::string wait_error;
        if (!channel.wait(wait_error)) {
            LOG_WARN("[Supervisor] " << info.process_id << " " << wait_error);
        }
        finish_with_error(info, prefix, read_error);
        return;
    }

    auto code = channel.wait(error);
    if (!code) {
        finish_with_error(info, prefix, error);
        return;
    }

    if (cancelled) {
        LOG_DEBUG("[Supervisor] " << info.process_id << " reaped after cancellation");
    }
    finish_with_exit(info, prefix, *code);
}

void ProcessSupervisor::finish_with_exit(const ProcessInfo &info, const std::string &event_prefix, int code) {
    if (!registry_.remove(info.process_id)) {
        return;
    }

    LOG_INFO("[Supervisor] " << info.process_id << " exited with code " << code);

    events::ProcessExitEvent event;
    event.event_prefix = event_prefix;
    event.process_id = info.process_id;
    event.code = code;
    event.timestamp_ms = events::now_ms();
    sink_.publish(std::move(event));
}

void ProcessSupervisor::finish_with_error(const ProcessInfo &info, const std::string &event_prefix,
                                          const std::string &error) {
    if (!registry_.remove(info.process_id)) {
        return;
    }

    LOG_WARN("[Supervisor] " << info.process_id << " failed: " << error);

    events::ProcessErrorEvent event;
    event.event_prefix = event_prefix;
    event.process_id = info.process_id;
    event.error = error;
    event.timestamp_ms = events::now_ms();
    sink_.publish(std::move(event));
}

void ProcessSupervisor::mark_worker_done(const std::string &process_id) {
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        auto it = workers_.find(process_id);
        if (it != workers_.end()) {
            it->second.done = true;
        }
    }
    workers_cv_.notify_all();
}

void ProcessSupervisor::reap_finished_workers() {
    std::vector<std::thread> finished;

    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        for (auto it = workers_.begin(); it != workers_.end();) {
            if (it->second.done) {
                if (it->second.thread.joinable()) {
                    finished.push_back(std::move(it->second.thread));
                }
                it = workers_.erase(it);
            } else {
                ++it;
            }
        }
    }

    for (auto &thread : finished) {
        thread.join();
    }
}

}  // namespace process
}  // namespace trellico
