#include "chunkwire/core/command_handler.hpp"
#include "chunkwire/core/config.hpp"
#include "chunkwire/core/identity.hpp"
#include "chunkwire/core/logger.hpp"
#include "chunkwire/core/utils.hpp"
#include "chunkwire/network/tcp_channel.hpp"
#include "chunkwire/storage/chunk_io.hpp"
#include "chunkwire/storage/memory_store.hpp"
#include "chunkwire/storage/sqlite_store.hpp"
#include "chunkwire/transfer/transfer_manager.hpp"
#include <boost/asio.hpp>
#include <csignal>
#include <iomanip>
#include <iostream>
#include <functional>
#include <optional>
#include <sstream>

namespace chunkwire::core {

using utils::FileUtils;
using utils::StringUtils;
using utils::TimeUtils;

namespace {

Result open_store(const Config& config, std::shared_ptr<storage::PersistentStore>& store) {
    auto backend = StringUtils::to_lower(config.get_string("storage.backend", "sqlite"));
    if (backend == "memory") {
        store = std::make_shared<storage::MemoryStore>();
        return Result();
    }
    if (backend != "sqlite") {
        return Result(TransferError::INVALID_ARGUMENT, "Unknown storage backend: " + backend);
    }

    auto directory = FileUtils::expand_user(config.get_string("storage.directory", "./chunkwire_data"));
    auto sqlite = std::make_shared<storage::SqliteStore>(directory / "chunkwire.db");
    auto initialized = sqlite->initialize();
    if (!initialized) {
        return initialized;
    }

    store = std::move(sqlite);
    return Result();
}

std::string local_peer_id(const Config& config) {
    auto configured = config.get_string("peer.id", "");
    return configured.empty() ? Identity::random_peer_id() : configured;
}

std::uint16_t configured_port(const Config& config) {
    auto port = config.get_int("server.port", 7480);
    if (port < 0 || port > 65535) {
        LOG_WARN("server.port {} out of range, using 7480", port);
        return 7480;
    }
    return static_cast<std::uint16_t>(port);
}

std::string format_percent(std::uint32_t received, std::uint32_t total) {
    double percent = total == 0 ? 100.0 : 100.0 * received / total;
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << percent << "%";
    return oss.str();
}

}

// SendCommandHandler Implementation
CommandResult SendCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        return CommandResult::error("Usage: " + get_usage());
    }

    auto file_path = FileUtils::expand_user(args[1]);
    if (!FileUtils::exists(file_path)) {
        return CommandResult::error("File does not exist: " + file_path.string());
    }

    try {
        auto& config = Config::instance();

        std::shared_ptr<storage::FileChunkSource> source;
        auto opened = storage::FileChunkSource::open(file_path, source);
        if (!opened) {
            return CommandResult::error("Failed to open file: " + opened.message);
        }
        const auto& metadata = source->metadata();

        // uploads keep nothing on disk
        auto store = std::make_shared<storage::MemoryStore>();

        boost::asio::io_context io_context;
        transfer::TransferManager manager(io_context, store,
            transfer::SessionConfig::from_config(config, transfer::SessionRole::SENDER));

        transfer::SessionEvents events;
        events.on_completed = []() {
            std::cout << "✓ A peer finished downloading\n";
        };
        events.on_error = [](transfer::ErrorReason reason, const std::string& message) {
            std::cout << "✗ Upload failed (" << transfer::to_string(reason) << "): " << message << "\n";
        };
        manager.set_session_events(std::move(events));
        manager.share(source);

        auto peer_id = local_peer_id(config);
        network::TcpListener listener(io_context, configured_port(config), peer_id);
        listener.start([&manager](std::shared_ptr<network::TcpChannel> channel) {
            auto served = manager.serve_channel(std::move(channel));
            if (!served) {
                LOG_WARN("Could not serve peer: {}", served.message);
            }
        });

        std::cout << "Sharing: " << metadata.name << "\n";
        std::cout << "  File ID: " << metadata.file_id << "\n";
        std::cout << "  Size: " << StringUtils::format_bytes(metadata.size) << "\n";
        std::cout << "  Chunks: " << metadata.total_chunks << " x " << StringUtils::format_bytes(metadata.chunk_size) << "\n";
        std::cout << "Listening on port " << listener.port() << " as peer " << peer_id << "\n";
        std::cout << "Press Ctrl+C to stop\n";

        boost::asio::signal_set signals(io_context, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code& ec, int) {
            if (ec) {
                return;
            }
            LOG_INFO("Stopping sender");
            listener.stop();
            io_context.stop();
        });

        io_context.run();

        auto stats = manager.stats();
        std::cout << "\nServed " << stats.uploads << " peers, " << stats.completed << " completed, "
                  << stats.paused << " paused\n";

        return CommandResult::ok("Sender stopped");

    } catch (const std::exception& e) {
        return CommandResult::error("Send failed: " + std::string(e.what()));
    }
}

// ReceiveCommandHandler Implementation
CommandResult ReceiveCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        return CommandResult::error("Usage: " + get_usage());
    }

    const std::string host = args[1];

    try {
        auto& config = Config::instance();

        std::shared_ptr<storage::PersistentStore> store;
        auto opened = open_store(config, store);
        if (!opened) {
            return CommandResult::error("Failed to open storage: " + opened.message);
        }

        auto output_dir = FileUtils::expand_user(config.get_string("download.directory", "./downloads"));
        if (!FileUtils::create_directories(output_dir)) {
            return CommandResult::error("Cannot create output directory: " + output_dir.string());
        }

        auto port = configured_port(config);
        auto peer_id = local_peer_id(config);
        int max_attempts = config.get_int("transfer.reconnect_attempts", 5);
        auto reconnect_delay = std::chrono::milliseconds(config.get_int("transfer.reconnect_delay_ms", 2000));

        auto session_config = transfer::SessionConfig::from_config(config, transfer::SessionRole::RECEIVER);
        session_config.auto_accept = true;

        // Everything below runs on this thread: io_context.run() is the only runner.
        boost::asio::io_context io_context;
        transfer::TransferManager manager(io_context, store, session_config);
        boost::asio::steady_timer reconnect_timer(io_context);
        boost::asio::steady_timer shutdown_timer(io_context);

        std::optional<storage::FileMetadata> offered;
        std::uint32_t received = 0;
        std::uint32_t total = 0;
        int attempts = 0;
        bool finished = false;
        CommandResult outcome = CommandResult::error("Interrupted, run receive again to resume");

        std::function<void()> connect;

        auto finish = [&](CommandResult result) {
            if (finished) {
                return;
            }
            finished = true;
            outcome = std::move(result);
            reconnect_timer.cancel();

            // let the final ACK/END drain before stopping
            shutdown_timer.expires_after(std::chrono::milliseconds(500));
            shutdown_timer.async_wait([&](const boost::system::error_code&) { io_context.stop(); });
        };

        auto schedule_reconnect = [&]() {
            if (finished) {
                return;
            }
            if (++attempts > max_attempts) {
                finish(CommandResult::error("Peer unreachable after " + std::to_string(max_attempts) +
                                            " reconnect attempts, progress kept"));
                return;
            }

            std::cout << "\nConnection lost, retrying in " << StringUtils::format_duration(reconnect_delay)
                      << " (attempt " << attempts << "/" << max_attempts << ")\n";
            reconnect_timer.expires_after(reconnect_delay);
            reconnect_timer.async_wait([&](const boost::system::error_code& ec) {
                if (!ec) {
                    connect();
                }
            });
        };

        transfer::SessionEvents events;
        events.on_offer = [&](const storage::FileMetadata& metadata) {
            offered = metadata;
            std::cout << "Receiving: " << metadata.name << " (" << StringUtils::format_bytes(metadata.size)
                      << ", " << metadata.total_chunks << " chunks)\n";
        };
        events.on_status = [&](transfer::SessionStatus status) {
            if (status == transfer::SessionStatus::TRANSFERRING) {
                attempts = 0;
            } else if (status == transfer::SessionStatus::PAUSED) {
                schedule_reconnect();
            }
        };
        events.on_progress = [&](std::uint32_t now_received, std::uint32_t now_total) {
            received = now_received;
            total = now_total;
        };
        events.on_eta = [&](const transfer::EtaEstimate& estimate) {
            std::cout << "\r  " << format_percent(received, total) << "  "
                      << StringUtils::format_bytes(static_cast<std::uint64_t>(estimate.current_bps)) << "/s  ETA ";
            if (estimate.stalled) {
                std::cout << "stalled";
            } else {
                std::cout << StringUtils::format_eta(estimate.eta);
                if (estimate.stable) {
                    std::cout << " (" << StringUtils::format_eta(estimate.eta_low) << " - "
                              << StringUtils::format_eta(estimate.eta_high) << ")";
                }
            }
            std::cout << "      " << std::flush;
        };
        events.on_degraded = [](const storage::Range& range) {
            LOG_WARN("Chunks {}-{} keep timing out", range.start, range.end);
        };
        events.on_error = [&](transfer::ErrorReason reason, const std::string& message) {
            finish(CommandResult::error(std::string("Transfer failed (") + transfer::to_string(reason) + "): " + message));
        };
        events.on_completed = [&]() {
            if (!offered) {
                finish(CommandResult::error("Transfer completed without metadata"));
                return;
            }

            auto target = output_dir / offered->name;
            auto assembled = storage::assemble_file(*store, *offered, target);
            if (!assembled) {
                finish(CommandResult::error("Failed to assemble " + target.string() + ": " + assembled.message));
                return;
            }

            std::cout << "\n✓ Download complete!\n";
            std::cout << "  File saved to: " << target.string() << "\n";
            finish(CommandResult::ok("File received"));
        };
        manager.set_session_events(std::move(events));

        connect = [&]() {
            LOG_INFO("Connecting to {}:{}", host, port);
            network::TcpChannel::connect(io_context, host, port, peer_id,
                [&](const boost::system::error_code& ec, std::shared_ptr<network::TcpChannel> channel) {
                    if (finished) {
                        if (channel) {
                            channel->close();
                        }
                        return;
                    }
                    if (ec || !channel) {
                        LOG_WARN("Connection to {}:{} failed: {}", host, port, ec.message());
                        schedule_reconnect();
                        return;
                    }
                    manager.receive_channel(std::move(channel));
                });
        };

        boost::asio::signal_set signals(io_context, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code& ec, int) {
            if (!ec) {
                io_context.stop();
            }
        });

        std::cout << "Connecting to " << host << ":" << port << "...\n";
        connect();
        io_context.run();

        return outcome;

    } catch (const std::exception& e) {
        return CommandResult::error("Receive failed: " + std::string(e.what()));
    }
}

// StatusCommandHandler Implementation
CommandResult StatusCommandHandler::execute(const std::vector<std::string>&) {
    try {
        std::shared_ptr<storage::PersistentStore> store;
        auto opened = open_store(Config::instance(), store);
        if (!opened) {
            return CommandResult::error("Failed to open storage: " + opened.message);
        }

        std::vector<storage::FileRecord> records;
        auto listed = store->list_file_records(records);
        if (!listed) {
            return CommandResult::error("Failed to list transfers: " + listed.message);
        }

        if (records.empty()) {
            std::cout << "No stored transfers.\n";
            return CommandResult::ok();
        }

        std::cout << "Stored transfers:\n";
        for (const auto& record : records) {
            const auto& metadata = record.metadata;
            bool complete = record.received_count == metadata.total_chunks;

            std::cout << "  " << (complete ? "✓ " : "… ") << metadata.name
                      << " (" << StringUtils::format_bytes(metadata.size) << ")\n";
            std::cout << "    File ID: " << metadata.file_id << "\n";
            std::cout << "    Progress: " << record.received_count << "/" << metadata.total_chunks
                      << " chunks, " << format_percent(record.received_count, metadata.total_chunks) << "\n";
            std::cout << "    Last active: " << TimeUtils::format_timestamp(record.last_accessed) << "\n";
        }

        return CommandResult::ok();

    } catch (const std::exception& e) {
        return CommandResult::error("Status failed: " + std::string(e.what()));
    }
}

// PurgeCommandHandler Implementation
CommandResult PurgeCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        return CommandResult::error("Usage: " + get_usage());
    }

    const auto& file_id = args[1];

    try {
        std::shared_ptr<storage::PersistentStore> store;
        auto opened = open_store(Config::instance(), store);
        if (!opened) {
            return CommandResult::error("Failed to open storage: " + opened.message);
        }

        storage::FileRecord record;
        auto found = store->get_file_record(file_id, record);
        if (found.error == TransferError::NOT_FOUND) {
            return CommandResult::error("No stored transfer with id " + file_id);
        }
        if (!found) {
            return CommandResult::error("Failed to read transfer: " + found.message);
        }

        auto deleted = store->delete_file(file_id);
        if (!deleted) {
            return CommandResult::error("Failed to purge: " + deleted.message);
        }

        std::cout << "✓ Purged " << record.metadata.name << " (" << record.received_count << " chunks)\n";
        return CommandResult::ok();

    } catch (const std::exception& e) {
        return CommandResult::error("Purge failed: " + std::string(e.what()));
    }
}

// GcCommandHandler Implementation
CommandResult GcCommandHandler::execute(const std::vector<std::string>& args) {
    auto& config = Config::instance();
    int hours = config.get_int("storage.gc_after_hours", 168);

    if (args.size() >= 2) {
        try {
            hours = std::stoi(args[1]);
        } catch (const std::exception&) {
            return CommandResult::error("Invalid hour count: " + args[1]);
        }
    }
    if (hours < 0) {
        return CommandResult::error("Hour count must not be negative");
    }

    try {
        std::shared_ptr<storage::PersistentStore> store;
        auto opened = open_store(config, store);
        if (!opened) {
            return CommandResult::error("Failed to open storage: " + opened.message);
        }

        std::size_t removed = 0;
        auto cutoff = TimeUtils::now() - std::chrono::hours(hours);
        auto collected = store->remove_stale_records(cutoff, removed);
        if (!collected) {
            return CommandResult::error("Garbage collection failed: " + collected.message);
        }

        std::cout << "Removed " << removed << " transfers idle for more than " << hours << "h\n";
        return CommandResult::ok();

    } catch (const std::exception& e) {
        return CommandResult::error("Garbage collection failed: " + std::string(e.what()));
    }
}

}
