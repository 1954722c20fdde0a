/**
 * clipcloud-cli - drive the transfer engine from a shell
 *
 * Credentials come from CLIPCLOUD_* environment variables and may be
 * overridden with --user/--password/--bucket/--endpoint.
 *
 *   clipcloud-cli upload ./match.mp4
 *   clipcloud-cli download match.mp4 https://signed.example/... ./downloads
 *   clipcloud-cli watch
 */

#include "clipcloud/core/config.hpp"
#include "clipcloud/events/components.hpp"
#include "clipcloud/events/event_bus.hpp"
#include "clipcloud/events/events.hpp"
#include "clipcloud/network/curl_http_client.hpp"
#include "clipcloud/storage/signing_gateway.hpp"
#include "clipcloud/storage/video_catalog.hpp"
#include "clipcloud/sync/change_detector.hpp"
#include "clipcloud/transfer/transfer_engine.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <chrono>
#include <csignal>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace clipcloud;

namespace {

volatile std::sig_atomic_t g_running = 1;

void signal_handler(int signal) {
    if (signal == SIGINT) {
        g_running = 0;
    }
}

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [options] <command> [args]\n";
    std::cout << "\n";
    std::cout << "Commands:\n";
    std::cout << "  upload <file>                  Upload a .mp4 or .png file\n";
    std::cout << "  put-json <key> <file>          Store the contents of <file> as a JSON document\n";
    std::cout << "  download <key> <url> <dir>     Download <key> from a signed URL into <dir>\n";
    std::cout << "  delete <key>                   Delete an object\n";
    std::cout << "  usage                          Print bucket usage in bytes\n";
    std::cout << "  storage                        Print the bucket's storage limit in GB\n";
    std::cout << "  auth                           Check credentials\n";
    std::cout << "  housekeeping                   Run the authority's housekeeping job\n";
    std::cout << "  videos                         List video records\n";
    std::cout << "  watch                          Log remote changes until Ctrl+C\n";
    std::cout << "\n";
    std::cout << "Options:\n";
    std::cout << "  --user <name>        Overrides CLIPCLOUD_USER\n";
    std::cout << "  --password <secret>  Overrides CLIPCLOUD_PASSWORD\n";
    std::cout << "  --bucket <name>      Overrides CLIPCLOUD_BUCKET\n";
    std::cout << "  --endpoint <url>     Overrides CLIPCLOUD_API_ENDPOINT\n";
    std::cout << "  --poll <seconds>     Poll interval for watch\n";
    std::cout << "  --verbose            Debug logging\n";
    std::cout << "  --help               Show this message\n";
}

int fail(const Error& error) {
    spdlog::error("{}", error.describe());
    return 1;
}

void print_progress(int percent) {
    std::cout << "\r" << percent << "%" << std::flush;
    if (percent == 100) {
        std::cout << "\n";
    }
}

bool read_file(const std::string& path, std::string& out) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return false;
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    out = buffer.str();
    return true;
}

bool is_mutation(const std::string& command) {
    return command == "upload" || command == "put-json" || command == "delete";
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    auto env_config = core::read_config_from_env();
    if (env_config.is_error()) {
        return fail(env_config.error());
    }
    core::ClientConfig config = env_config.value();

    std::vector<std::string> positional;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--verbose") {
            spdlog::set_level(spdlog::level::debug);
        } else if (arg == "--user" || arg == "--password" || arg == "--bucket" ||
                   arg == "--endpoint" || arg == "--poll") {
            if (i + 1 >= argc) {
                spdlog::error("{} requires a value", arg);
                return 1;
            }
            std::string value = argv[++i];
            if (arg == "--user") {
                config.user = value;
            } else if (arg == "--password") {
                config.password = value;
            } else if (arg == "--bucket") {
                config.bucket = value;
            } else if (arg == "--endpoint") {
                config.api_endpoint = value;
            } else {
                try {
                    config.poll_interval = std::chrono::seconds(std::stoul(value));
                } catch (const std::exception&) {
                    spdlog::error("Invalid poll interval: {}", value);
                    return 1;
                }
            }
        } else if (!arg.empty() && arg[0] == '-') {
            spdlog::error("Unknown option: {}", arg);
            print_usage(argv[0]);
            return 1;
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    if (auto valid = core::validate(config); valid.is_error()) {
        return fail(valid.error());
    }

    const std::string command = positional[0];
    auto require_args = [&](std::size_t count) {
        if (positional.size() != count + 1) {
            spdlog::error("{} takes {} argument(s)", command, count);
            print_usage(argv[0]);
            return false;
        }
        return true;
    };

    network::CurlOptions curl_options;
    curl_options.connect_timeout = config.connect_timeout;
    curl_options.request_timeout = config.request_timeout;
    network::CurlHttpClient http(curl_options);

    events::EventBus bus;
    events::LoggerComponent logger(bus);
    events::MetricsComponent metrics(bus);

    storage::SigningGateway gateway(http, config);
    sync::ChangeDetector detector(gateway, bus);
    transfer::TransferEngine engine(http, gateway, detector, bus);

    // Adopt the remote clock first so our advance lands above it
    if (is_mutation(command)) {
        if (auto init = detector.poll_init(); init.is_error()) {
            return fail(init.error());
        }
    }

    if (command == "upload") {
        if (!require_args(1)) {
            return 1;
        }
        auto result = engine.upload(positional[1], print_progress);
        if (result.is_error()) {
            return fail(result.error());
        }
    } else if (command == "put-json") {
        if (!require_args(2)) {
            return 1;
        }
        std::string text;
        if (!read_file(positional[2], text)) {
            spdlog::error("Cannot read {}", positional[2]);
            return 1;
        }
        auto result = engine.put_json(text, positional[1]);
        if (result.is_error()) {
            return fail(result.error());
        }
    } else if (command == "download") {
        if (!require_args(3)) {
            return 1;
        }
        auto result = engine.download(positional[1], positional[2], positional[3], print_progress);
        if (result.is_error()) {
            return fail(result.error());
        }
    } else if (command == "delete") {
        if (!require_args(1)) {
            return 1;
        }
        auto result = engine.remove(positional[1]);
        if (result.is_error()) {
            return fail(result.error());
        }
    } else if (command == "usage") {
        auto result = gateway.usage();
        if (result.is_error()) {
            return fail(result.error());
        }
        std::cout << result.value() << "\n";
    } else if (command == "storage") {
        auto result = gateway.max_storage_gb();
        if (result.is_error()) {
            return fail(result.error());
        }
        std::cout << result.value() << "\n";
    } else if (command == "auth") {
        auto result = gateway.authenticate();
        if (result.is_error()) {
            return fail(result.error());
        }
        std::cout << "ok\n";
    } else if (command == "housekeeping") {
        auto result = gateway.run_housekeeping();
        if (result.is_error()) {
            return fail(result.error());
        }
        std::cout << result.value().dump(2) << "\n";
    } else if (command == "videos") {
        storage::VideoCatalog catalog(gateway, detector);
        auto result = catalog.list();
        if (result.is_error()) {
            return fail(result.error());
        }
        std::cout << result.value().dump(2) << "\n";
    } else if (command == "watch") {
        if (auto init = detector.poll_init(); init.is_error()) {
            return fail(init.error());
        }

        bus.subscribe<events::BucketChangedEvent>([](const events::BucketChangedEvent& e) {
            std::cout << "changed " << e.bucket << " " << e.previous << " -> " << e.current << std::endl;
        });

        std::signal(SIGINT, signal_handler);
        detector.start_polling(config.poll_interval);
        spdlog::info("Watching {} every {}s, Ctrl+C to stop", config.bucket, config.poll_interval.count());

        while (g_running) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        detector.stop_polling();
        spdlog::info("Saw {} change(s)", metrics.get_stats().bucket_changes.load());
    } else {
        spdlog::error("Unknown command: {}", command);
        print_usage(argv[0]);
        return 1;
    }

    return 0;
}
