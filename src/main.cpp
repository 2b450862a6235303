#include <iostream>
#include <string>
#include <cstdint>
#include <filesystem>
#include <atomic>
#include <functional>
#include <memory>
#include <thread>
#include <vector>
#include <boost/asio.hpp>
#include "catalog.hpp"
#include "config.hpp"
#include "networking.hpp"
#include "udp_mesh.hpp"

namespace fs = std::filesystem;

namespace {

void print_usage() {
    std::cout << "Usage:\n"
              << "  meshdrop serve <directory> [--config <file>]\n"
              << "  meshdrop ls <server-id> [--config <file>]\n"
              << "  meshdrop get <server-id> <filename> [save-dir] [--overwrite] [--config <file>]\n";
}

// Runs `on_signal` on SIGINT/SIGTERM from a helper io_context thread
class SignalWatcher {
public:
    explicit SignalWatcher(std::function<void()> on_signal) : signals_(io_context_, SIGINT, SIGTERM) {
        signals_.async_wait([on_signal](const boost::system::error_code& ec, int) {
            if (!ec) on_signal();
        });
        thread_ = std::thread([this]() { io_context_.run(); });
    }

    ~SignalWatcher() {
        io_context_.stop();
        if (thread_.joinable()) thread_.join();
    }

private:
    boost::asio::io_context io_context_;
    boost::asio::signal_set signals_;
    std::thread thread_;
};

int serve(const fs::path& directory, const config::Settings& settings) {
    if (!fs::is_directory(directory)) {
        std::cerr << "'" << directory.string() << "' is not a directory\n";
        return 1;
    }

    std::cout << "Preparing files from " << fs::absolute(directory).string() << "\n";
    transfer::Catalog catalog(transfer::scan_directory(directory), settings);
    for (const auto& warning : catalog.warnings()) {
        std::cerr << warning << "\n";
    }
    for (const auto& entry : catalog.entries()) {
        std::cout << "Processed: " << entry.name << " (" << entry.size << " bytes, "
                  << entry.chunk_count << " chunks)\n";
    }
    std::cout << "Prepared " << catalog.entries().size() << " file(s)\n";

    transfer::SteadyClock clock;
    networking::UdpMeshTransport transport(settings, clock);
    transport.start();

    std::cout << "Server Node ID: " << transport.local_id() << "\n";
    std::cout << "Connect a client with: meshdrop ls " << transport.local_id().substr(1) << "\n";
    std::cout << "Press Ctrl+C to exit\n";

    std::atomic<bool> running{true};
    SignalWatcher watcher([&running]() { running = false; });

    networking::ServerCallbacks callbacks;
    callbacks.on_status = [](const std::string& s) { std::cout << s << "\n"; };
    callbacks.on_error = [](const std::string& e) { std::cerr << e << "\n"; };

    networking::Server server(transport, catalog, settings, clock);
    server.run(running, callbacks);

    std::cout << "Shutting down server...\n";
    transport.stop();
    return 0;
}

networking::ClientCallbacks console_callbacks() {
    networking::ClientCallbacks callbacks;
    callbacks.on_status = [](const std::string& s) { std::cout << s << "\n"; };
    callbacks.on_progress = [](const std::string& name, uint64_t received, uint64_t total) {
        int percent = total > 0 ? static_cast<int>((received * 100) / total) : 100;
        std::cout << "\r" << name << ": chunk " << received << "/" << total << " (" << percent << "%)   "
                  << std::flush;
        if (received == total) std::cout << "\n";
    };
    callbacks.on_error = [](const std::string& e) { std::cerr << e << "\n"; };
    callbacks.cancel_flag = std::make_shared<std::atomic<bool>>(false);
    return callbacks;
}

int list(const std::string& server_id, const config::Settings& settings) {
    transfer::SteadyClock clock;
    networking::UdpMeshTransport transport(settings, clock);
    transport.start();

    networking::ClientCallbacks callbacks = console_callbacks();
    auto cancel_flag = callbacks.cancel_flag;
    SignalWatcher watcher([cancel_flag]() { cancel_flag->store(true); });

    networking::Client client(transport, server_id, settings, clock);
    std::cout << "Requesting file list from " << client.server_id() << "...\n";
    networking::DownloadResult result = client.list(callbacks);
    transport.stop();

    if (!result.ok()) {
        return 1;
    }
    std::cout << "\nAvailable files:\n";
    for (size_t i = 0; i < result.files.size(); ++i) {
        std::cout << "  " << (i + 1) << ". " << result.files[i].name << " (" << result.files[i].chunks
                  << " chunks)\n";
    }
    return 0;
}

int get(const std::string& server_id, const std::string& filename, const fs::path& save_dir, bool overwrite,
        const config::Settings& settings) {
    transfer::SteadyClock clock;
    networking::UdpMeshTransport transport(settings, clock);
    transport.start();

    networking::ClientCallbacks callbacks = console_callbacks();
    callbacks.on_complete = []() { std::cout << "Download complete!\n"; };
    auto cancel_flag = callbacks.cancel_flag;
    SignalWatcher watcher([cancel_flag]() { cancel_flag->store(true); });

    networking::Client client(transport, server_id, settings, clock);
    std::cout << "Server: " << client.server_id() << "\n";
    std::cout << "Saving to: " << fs::absolute(save_dir).string() << "\n";
    networking::DownloadResult result = client.download_to(filename, save_dir, overwrite, callbacks);
    transport.stop();

    if (!result.ok()) {
        std::cerr << "Download failed: " << result.message << "\n";
        return 1;
    }
    std::cout << "Saved " << result.saved_path.string() << " (" << result.content.size() << " bytes)\n";
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    std::vector<std::string> args;
    std::string config_path;
    bool overwrite = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--overwrite") {
            overwrite = true;
        } else {
            args.push_back(arg);
        }
    }

    try {
        config::Settings settings;
        if (!config_path.empty()) {
            settings = config::load(config_path);
        }

        if (args.size() == 2 && args[0] == "serve") {
            return serve(args[1], settings);
        } else if (args.size() == 2 && args[0] == "ls") {
            return list(args[1], settings);
        } else if ((args.size() == 3 || args.size() == 4) && args[0] == "get") {
            fs::path save_dir = args.size() == 4 ? fs::path(args[3]) : fs::current_path();
            return get(args[1], args[2], save_dir, overwrite, settings);
        }
    } catch (std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    print_usage();
    return 2;
}
