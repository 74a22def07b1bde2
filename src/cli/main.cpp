#include "rdx_batch.hpp"
#include "rdx_client.hpp"
#include "rdx_compression.hpp"
#include "rdx_config.hpp"
#include "rdx_digest.hpp"
#include "rdx_discovery.hpp"
#include "rdx_errors.hpp"
#include "rdx_frame.hpp"
#include "rdx_logger.hpp"
#include "rdx_options.hpp"
#include "rdx_secure_memory.hpp"
#include "rdx_session.hpp"
#include "rdx_transport.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <functional>
#include <iomanip>
#include <iostream>
#include <map>
#include <string>
#include <vector>

using namespace rdx;

// ============================================================================
// Global state
// ============================================================================

static int g_exit_code = EXIT_SUCCESS;

// ============================================================================
// ArgumentParser
// ============================================================================

class ArgumentParser {
public:
    struct Command {
        std::string name;
        std::string description;
        std::function<void(const std::vector<std::string>&)> handler;
        std::vector<std::string> args_help;
    };

    ArgumentParser(const std::string& prog_name, const std::string& version)
        : prog_name_(prog_name), version_(version) {}

    void add_command(
        const std::string& name,
        const std::string& description,
        std::function<void(const std::vector<std::string>&)> handler,
        const std::vector<std::string>& args_help = {}
    ) {
        commands_[name] = {name, description, handler, args_help};
    }

    void parse_and_execute(int argc, char* argv[]) {
        if (argc < 2) {
            print_usage();
            return;
        }

        std::string cmd = argv[1];
        if (cmd == "help" || cmd == "--help" || cmd == "-h") {
            print_usage();
            return;
        }
        if (cmd == "version" || cmd == "--version" || cmd == "-v") {
            std::cout << prog_name_ << " " << version_ << std::endl;
            return;
        }

        auto it = commands_.find(cmd);
        if (it == commands_.end()) {
            std::cerr << "Unknown command: " << cmd << "\n";
            print_usage();
            g_exit_code = EXIT_FAILURE;
            return;
        }

        std::vector<std::string> args(argv + 2, argv + argc);
        it->second.handler(args);
    }

private:
    void print_usage() const {
        std::cout << prog_name_ << " " << version_ << " - Remote Display Exchange tools\n";
        std::cout << "\nUsage: " << prog_name_ << " <command> [options]\n\n";
        std::cout << "Commands:\n";
        for (const auto& [name, cmd] : commands_) {
            std::cout << "  " << cmd.name;
            for (const auto& arg : cmd.args_help)
                std::cout << " " << arg;
            std::cout << "\n    " << cmd.description << "\n\n";
        }
        std::cout << "  help\n    Show this help message\n\n";
        std::cout << "  version\n    Show version information\n";
    }

    std::string prog_name_;
    std::string version_;
    std::map<std::string, Command> commands_;
};

// ============================================================================
// Utility functions
// ============================================================================

static std::string get_arg(const std::vector<std::string>& args, size_t index, const std::string& default_val = "") {
    return index < args.size() && args[index].rfind("--", 0) != 0 ? args[index] : default_val;
}

static std::string get_option(const std::vector<std::string>& args, const std::string& option, const std::string& default_val = "") {
    auto it = std::find(args.begin(), args.end(), option);
    if (it != args.end() && ++it != args.end()) return *it;
    return default_val;
}

static int get_option_int(const std::vector<std::string>& args, const std::string& option, int default_val = 0) {
    std::string val = get_option(args, option);
    if (val.empty()) return default_val;
    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        return default_val;
    }
}

static std::shared_ptr<const ServerOptions> load_options() {
    const char* path = std::getenv("RDX_CONFIG");
    auto& cfg = Config::instance();
    cfg.loadFromFile(path ? path : "config/rdx.conf");
    return ServerOptions::load(*default_config_source(cfg));
}

// ============================================================================
// Forward declarations
// ============================================================================

void handle_header(const std::vector<std::string>& args);
void handle_digests(const std::vector<std::string>& args);
void handle_compressors(const std::vector<std::string>& args);
void handle_bounds(const std::vector<std::string>& args);
void handle_discovery(const std::vector<std::string>& args);
void handle_connect(const std::vector<std::string>& args);

// ============================================================================
// main()
// ============================================================================

int main(int argc, char* argv[]) {
    Logger::instance().setLevel(LogLevel::WARN);

    ArgumentParser parser("rdx", RDX_VERSION);

    parser.add_command("header", "Decode an 8-byte frame header", handle_header, {"<hex>"});
    parser.add_command("digests", "List supported authentication digests", handle_digests);
    parser.add_command("compressors", "List available compressors", handle_compressors);
    parser.add_command("bounds", "Show resolved damage batch bounds", handle_bounds, {"[<width>x<height>]"});
    parser.add_command("discovery", "Show the selected discovery back-end", handle_discovery);
    parser.add_command("connect", "Authenticate against a server and ping it", handle_connect,
                       {"<uri>", "[<username>]", "[<password>]", "[--key <k>]", "[--pings <n>]",
                        "[--timeout <ms>]"});

    parser.parse_and_execute(argc, argv);

    return g_exit_code;
}

// ============================================================================
// Handler implementations
// ============================================================================

void handle_header(const std::vector<std::string>& args) {
    std::string hex = get_arg(args, 0);
    if (hex.empty()) {
        std::cerr << "Usage: rdx header <hex>\n";
        g_exit_code = EXIT_FAILURE;
        return;
    }
    try {
        Bytes raw = SecureOps::from_hex(hex);
        FrameHeader h = decode_header(raw);
        std::cout << "magic:        '" << static_cast<char>(h.magic) << "'\n";
        std::cout << "flags:        0x" << std::hex << std::setw(2) << std::setfill('0')
                  << static_cast<int>(h.flags) << std::dec << std::setfill(' ')
                  << " (" << flags_to_string(h.flags) << ")\n";
        std::cout << "level:        " << static_cast<int>(h.level) << "\n";
        std::cout << "index:        " << static_cast<int>(h.index)
                  << (h.index ? " (raw chunk)" : " (main frame)") << "\n";
        std::cout << "payload size: " << h.payload_size << "\n";
    } catch (const std::invalid_argument& e) {
        std::cerr << "[!] Invalid hex: " << e.what() << "\n";
        g_exit_code = EXIT_FAILURE;
    } catch (const FormatError& e) {
        std::cerr << "[!] " << e.what() << "\n";
        g_exit_code = EXIT_FAILURE;
    }
}

void handle_digests(const std::vector<std::string>&) {
    for (const auto& d : supported_digests()) {
        std::cout << d << "\n";
    }
}

void handle_compressors(const std::vector<std::string>&) {
    for (Compressor c : {Compressor::NONE, Compressor::ZLIB, Compressor::LZ4, Compressor::LZO}) {
        std::cout << std::left << std::setw(6) << compressor_to_string(c)
                  << (compressor_available(c) ? "available" : "not available") << "\n";
    }
}

void handle_bounds(const std::vector<std::string>& args) {
    auto options = load_options();
    const BatchBounds& b = options->batch;

    std::cout << "batch.min_delay     = " << b.min_delay << " ms\n";
    std::cout << "batch.start_delay   = " << b.start_delay << " ms\n";
    std::cout << "batch.max_delay     = " << b.max_delay << " ms\n";
    std::cout << "batch.expire_delay  = " << b.expire_delay << " ms\n";
    std::cout << "batch.timeout_delay = " << b.timeout_delay << " ms\n";
    std::cout << "batch.max_events    = " << b.max_events << "\n";
    std::cout << "batch.time_unit     = " << b.time_unit << " s\n";
    std::cout << "batch.history_size  = " << b.history_size << "\n";

    std::string size = get_arg(args, 0);
    if (!size.empty()) {
        auto x = size.find('x');
        try {
            if (x == std::string::npos) throw std::invalid_argument(size);
            int64_t w = std::stoll(size.substr(0, x));
            int64_t h = std::stoll(size.substr(x + 1));
            DamageBatchConfig batch(b);
            std::cout << "initial delay for " << w << "x" << h << " = "
                      << batch.initial_delay_for(w * h) << " ms\n";
        } catch (const std::exception&) {
            std::cerr << "[!] Invalid window size: " << size << "\n";
            g_exit_code = EXIT_FAILURE;
        }
    }
}

void handle_discovery(const std::vector<std::string>&) {
    auto options = load_options();
    DiscoveryRegistry registry({
        make_static_backend(options->discovery_static, options->discovery_static_peers),
    });

    for (const auto& backend : registry.backends()) {
        std::cout << backend.name << (backend.enabled ? " (enabled)" : " (disabled)") << "\n";
    }
    auto listener_class = registry.get_listener_class();
    if (!listener_class) {
        std::cout << "[*] No discovery back-end available\n";
        return;
    }
    auto listener = listener_class->create();
    listener->start();
    std::cout << "[+] Using " << listener_class->backend << "\n";
    for (const auto& peer : listener->peers()) {
        std::cout << "    " << peer << "\n";
    }
    listener->stop();
}

void handle_connect(const std::vector<std::string>& args) {
    std::string uri = get_arg(args, 0);
    if (uri.empty()) {
        std::cerr << "Usage: rdx connect <uri> [username] [password]\n";
        g_exit_code = EXIT_FAILURE;
        return;
    }

    ClientOptions opts;
    opts.username = get_arg(args, 1);
    opts.password = get_arg(args, 2);
    opts.encryption_key = get_option(args, "--key");
    opts.timeout_ms = get_option_int(args, "--timeout", 10000);
    int pings = get_option_int(args, "--pings", 1);

    try {
        Client client(connect_transport(uri), opts);
        Value::Dict caps = client.connect();
        std::cout << "[+] Connected to " << uri << "\n";
        for (const auto& [key, value] : caps) {
            std::cout << "    " << key << " = ";
            if (value.is_int()) std::cout << value.as_int();
            else if (value.is_bytes()) std::cout << value.as_bytes();
            else std::cout << "...";
            std::cout << "\n";
        }

        using Clock = std::chrono::steady_clock;
        for (int i = 0; i < pings; ++i) {
            auto start = Clock::now();
            client.ping(std::chrono::duration_cast<std::chrono::milliseconds>(
                start.time_since_epoch()).count());
            bool answered = false;
            while (!answered) {
                auto packet = client.read(opts.timeout_ms);
                if (!packet) break;
                answered = packet->type() == "ping_echo";
            }
            if (!answered) {
                std::cerr << "[!] No ping_echo within " << opts.timeout_ms << " ms\n";
                g_exit_code = EXIT_FAILURE;
                break;
            }
            auto rtt = std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - start);
            std::cout << "[+] ping " << (i + 1) << ": " << rtt.count() / 1000.0 << " ms\n";
        }
        client.disconnect("done");
    } catch (const AuthenticationFailure& e) {
        std::cerr << "[!] Authentication failed: " << e.what() << "\n";
        g_exit_code = EXIT_FAILURE;
    } catch (const TransportError& e) {
        std::cerr << "[!] Connection error: " << e.what() << "\n";
        g_exit_code = EXIT_FAILURE;
    } catch (const ProtocolError& e) {
        std::cerr << "[!] Protocol error: " << e.what() << "\n";
        g_exit_code = EXIT_FAILURE;
    }
}
