// main.cpp - Main entry point
#include <getopt.h>
#include <unistd.h>
#include <cstdlib>
#include <iostream>
#include <iterator>
#include <memory>
#include <sstream>
#include "conf/config.hpp"
#include "core/android_fs.hpp"
#include "core/entry.hpp"
#include "core/error.hpp"
#include "core/local_bridge.hpp"
#include "core/runner.hpp"
#include "core/scratch.hpp"
#include "defs.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;
using namespace safio;

struct CliOptions {
    std::string config_file;
    std::string command;
    bool verbose = false;
    bool async = false;
    bool emulate = false;
    std::string output;
    std::vector<std::string> args;
};

static void print_help() {
    std::cout << "Usage: safio [OPTIONS] <command> [args...]\n\n";
    std::cout << "Entry Commands:\n";
    std::cout << "  resolve <base> <relpath> [file|dir]  Resolve a child reference\n";
    std::cout << "  read <ref>                           Print an entry's contents\n";
    std::cout << "  write <ref> <text|->                 Replace an entry's contents\n";
    std::cout << "                                       ('-' reads stdin)\n";
    std::cout << "  copy <src> <dest>                    Copy one entry onto another\n";
    std::cout << "  ls <dir>                             List a directory\n";
    std::cout << "  stat <ref>                           Show an entry's metadata\n";
    std::cout << "  touch <dir> <relpath> [mime]         Create a new empty file\n";
    std::cout << "  mkdir <dir> <relpath>                Create a directory and its parents\n";
    std::cout << "  rename <ref> <name>                  Rename an entry in place\n";
    std::cout << "  rm <ref>                             Remove a file\n";
    std::cout << "  rmdir <dir> [all]                    Remove an empty directory, or the\n";
    std::cout << "                                       whole tree with 'all'\n";
    std::cout << "  sweep                                Remove orphaned scratch files\n\n";

    std::cout << "Configuration Commands (config <subcommand>):\n";
    std::cout << "  config gen         Generate default config file\n";
    std::cout << "  config show        Show current configuration\n\n";

    std::cout << "References are file:// or content:// URIs, serialized entry\n";
    std::cout << "references ({\"uri\": ...}), or plain paths.\n\n";

    std::cout << "Options:\n";
    std::cout << "  -c, --config FILE       Config file path\n";
    std::cout << "  -v, --verbose           Verbose logging\n";
    std::cout << "  -a, --async             Offload blocking steps to worker threads\n";
    std::cout << "  -e, --emulate           Serve file:// references on a non-Android host\n";
    std::cout << "  -o, --output FILE       Output file (for config gen)\n";
    std::cout << "  -h, --help              Show this help\n";
}

static CliOptions parse_args(int argc, char* argv[]) {
    CliOptions opts;

    static struct option long_options[] = {{"config", required_argument, 0, 'c'},
                                           {"verbose", no_argument, 0, 'v'},
                                           {"async", no_argument, 0, 'a'},
                                           {"emulate", no_argument, 0, 'e'},
                                           {"output", required_argument, 0, 'o'},
                                           {"help", no_argument, 0, 'h'},
                                           {0, 0, 0, 0}};

    int opt;
    int option_index = 0;

    while ((opt = getopt_long(argc, argv, "c:vaeo:h", long_options, &option_index)) != -1) {
        switch (opt) {
        case 'c':
            opts.config_file = optarg;
            break;
        case 'v':
            opts.verbose = true;
            break;
        case 'a':
            opts.async = true;
            break;
        case 'e':
            opts.emulate = true;
            break;
        case 'o':
            opts.output = optarg;
            break;
        case 'h':
            print_help();
            exit(0);
        default:
            print_help();
            exit(1);
        }
    }

    if (optind < argc) {
        opts.command = argv[optind];
        optind++;
        while (optind < argc) {
            opts.args.push_back(argv[optind]);
            optind++;
        }
    }

    return opts;
}

static Config load_config(const CliOptions& opts) {
    if (!opts.config_file.empty()) {
        return Config::from_file(opts.config_file);
    }

    try {
        return Config::load_default();
    } catch (const std::exception& e) {
        std::cerr << "Error loading config: " << e.what() << "\n";
        return Config();
    }
}

static EntryRef parse_ref(const std::string& text) {
    if (starts_with(text, "{")) {
        return EntryRef::from_string(text);
    }
    if (starts_with(text, FILE_SCHEME) || starts_with(text, CONTENT_SCHEME)) {
        return EntryRef{text, std::nullopt};
    }
    return EntryRef::from_path(fs::absolute(text));
}

// Everything a command needs to reach storage. The pool is drained before
// any member goes away, since implicit disposals still reference the
// bridge and the scratch manager.
struct Session {
    std::unique_ptr<Bridge> bridge;
    WorkerPool pool;
    InlineRunner inline_runner;
    OffloadRunner offload_runner;
    Runner* runner;
    ScratchFiles scratch;
    AndroidFs storage;
    AsyncAndroidFs async_storage;
    bool async;

    Session(const Config& config, bool use_async)
        : bridge(open_host_bridge(config)),
          pool(config.async_workers),
          offload_runner(pool),
          runner(use_async ? static_cast<Runner*>(&offload_runner) : &inline_runner),
          scratch(make_scratch_resolver(*bridge, *runner, config)),
          storage(*bridge, scratch, *runner, pool, config.indirect_write_prefixes),
          async_storage(*bridge, scratch, pool, config.indirect_write_prefixes),
          async(use_async) {}

    ~Session() { pool.drain(); }

    // Orphans of a previous process that died before reflecting
    void sweep_orphans() {
        try {
            runner->run([this] { scratch.sweep_all(); });
        } catch (const std::exception& e) {
            LOG_WARN("Failed to sweep scratch files: " + std::string(e.what()));
        }
    }
};

int main(int argc, char* argv[]) {
    try {
        CliOptions cli = parse_args(argc, argv);

        // Initialize logger globally for all commands
        Logger::getInstance().init(cli.verbose, "");

        if (cli.command.empty()) {
            print_help();
            return 0;
        }

        // Map command string to enum for switch statement
        enum class Command {
            CONFIG,
            RESOLVE,
            READ,
            WRITE,
            COPY,
            LS,
            STAT,
            TOUCH,
            MKDIR,
            RENAME,
            RM,
            RMDIR,
            SWEEP,
            UNKNOWN
        };

        auto get_command = [](const std::string& cmd) -> Command {
            if (cmd == "config")
                return Command::CONFIG;
            if (cmd == "resolve")
                return Command::RESOLVE;
            if (cmd == "read")
                return Command::READ;
            if (cmd == "write")
                return Command::WRITE;
            if (cmd == "copy")
                return Command::COPY;
            if (cmd == "ls")
                return Command::LS;
            if (cmd == "stat")
                return Command::STAT;
            if (cmd == "touch")
                return Command::TOUCH;
            if (cmd == "mkdir")
                return Command::MKDIR;
            if (cmd == "rename")
                return Command::RENAME;
            if (cmd == "rm")
                return Command::RM;
            if (cmd == "rmdir")
                return Command::RMDIR;
            if (cmd == "sweep")
                return Command::SWEEP;
            return Command::UNKNOWN;
        };

        Command command = get_command(cli.command);

        if (command == Command::CONFIG) {
            if (cli.args.empty()) {
                std::cerr << "Usage: safio config <gen|show>\n";
                return 1;
            }
            std::string subcmd = cli.args[0];

            if (subcmd == "gen") {
                std::string output = cli.output.empty() ? CONFIG_FILENAME : cli.output;
                if (!Config().save_to_file(output)) {
                    std::cerr << "Failed to write config: " << output << "\n";
                    return 1;
                }
                std::cout << "Generated config: " << output << "\n";
                return 0;
            } else if (subcmd == "show") {
                Config config = load_config(cli);
                config.merge_with_cli(cli.verbose, cli.emulate, "");
                std::cout << "{\n";
                std::cout << "  \"verbose\": " << (config.verbose ? "true" : "false") << ",\n";
                std::cout << "  \"log_file\": \"" << config.log_file.string() << "\",\n";
                std::cout << "  \"api_level\": " << config.api_level << ",\n";
                std::cout << "  \"scratch_base_dir\": \"" << config.scratch_base_dir.string()
                          << "\",\n";
                std::cout << "  \"async_workers\": " << config.async_workers << ",\n";
                std::cout << "  \"emulate_host\": " << (config.emulate_host ? "true" : "false")
                          << ",\n";
                std::cout << "  \"indirect_write_prefixes\": [";
                for (size_t i = 0; i < config.indirect_write_prefixes.size(); ++i) {
                    std::cout << "\"" << config.indirect_write_prefixes[i] << "\"";
                    if (i < config.indirect_write_prefixes.size() - 1)
                        std::cout << ", ";
                }
                std::cout << "]\n";
                std::cout << "}\n";
                return 0;
            } else {
                std::cerr << "Unknown config subcommand: " << subcmd << "\n";
                std::cerr << "Available: gen, show\n";
                return 1;
            }
        }

        if (command == Command::UNKNOWN) {
            std::cerr << "Unknown command: " << cli.command << "\n";
            print_help();
            return 1;
        }

        // Load and merge configuration
        Config config = load_config(cli);
        config.merge_with_cli(cli.verbose, cli.emulate, "");

        // Re-initialize logger with merged config
        Logger::getInstance().init(config.verbose, config.log_file);

        Session session(config, cli.async);
        AndroidFs& afs = session.storage;
        LOG_DEBUG(std::string("Using ") + session.runner->name() + " runner");

        if (command == Command::SWEEP) {
            session.runner->run([&session] { session.scratch.sweep_all(); });
            std::cout << "Swept " << session.scratch.temp_root().string() << "\n";
            return 0;
        }

        session.sweep_orphans();

        switch (command) {
        case Command::RESOLVE: {
            if (cli.args.size() < 2) {
                std::cerr << "Usage: safio resolve <base> <relpath> [file|dir]\n";
                return 1;
            }
            EntryRef base = parse_ref(cli.args[0]);
            std::optional<EntryKind> expected;
            if (cli.args.size() >= 3) {
                if (cli.args[2] == "file") {
                    expected = EntryKind::File;
                } else if (cli.args[2] == "dir") {
                    expected = EntryKind::Dir;
                } else {
                    std::cerr << "Unknown entry kind: " << cli.args[2] << "\n";
                    return 1;
                }
            }

            EntryRef child;
            if (session.async) {
                child = session.async_storage.resolve_async(base, cli.args[1], expected).get();
            } else {
                child = afs.resolve(base, cli.args[1], expected);
            }
            std::cout << child.uri << "\n";
            break;
        }

        case Command::READ: {
            if (cli.args.empty()) {
                std::cerr << "Usage: safio read <ref>\n";
                return 1;
            }
            EntryRef ref = parse_ref(cli.args[0]);
            std::vector<uint8_t> data = session.async
                                            ? session.async_storage.read_file_async(ref).get()
                                            : afs.read_file(ref);
            std::cout.write(reinterpret_cast<const char*>(data.data()),
                            static_cast<std::streamsize>(data.size()));
            std::cout.flush();
            break;
        }

        case Command::WRITE: {
            if (cli.args.size() < 2) {
                std::cerr << "Usage: safio write <ref> <text|->\n";
                return 1;
            }
            EntryRef ref = parse_ref(cli.args[0]);
            std::string text = cli.args[1];
            if (text == "-") {
                text.assign(std::istreambuf_iterator<char>(std::cin),
                            std::istreambuf_iterator<char>());
            }

            if (session.async) {
                session.async_storage.write_file_async(ref, text).get();
            } else {
                afs.write_file(ref, text);
            }
            LOG_INFO("Wrote " + std::to_string(text.size()) + " bytes to " + ref.uri +
                     (afs.needs_indirect_write(ref) ? " via scratch file" : ""));
            break;
        }

        case Command::COPY: {
            if (cli.args.size() < 2) {
                std::cerr << "Usage: safio copy <src> <dest>\n";
                return 1;
            }
            EntryRef src = parse_ref(cli.args[0]);
            EntryRef dest = parse_ref(cli.args[1]);
            if (session.async) {
                session.async_storage.copy_file_async(src, dest).get();
            } else {
                afs.copy_file(src, dest);
            }
            LOG_INFO("Copied " + src.uri + " to " + dest.uri);
            break;
        }

        case Command::LS: {
            if (cli.args.empty()) {
                std::cerr << "Usage: safio ls <dir>\n";
                return 1;
            }
            EntryRef dir = parse_ref(cli.args[0]);
            std::vector<Entry> entries = session.async
                                             ? session.async_storage.read_dir_async(dir).get()
                                             : afs.read_dir(dir);
            for (const auto& entry : entries) {
                if (entry.kind == EntryKind::Dir) {
                    std::cout << "d " << entry.name << "/\n";
                } else {
                    std::cout << "f " << entry.name << "  " << entry.len << "  "
                              << entry.mime_type << "\n";
                }
            }
            break;
        }

        case Command::STAT: {
            if (cli.args.empty()) {
                std::cerr << "Usage: safio stat <ref>\n";
                return 1;
            }
            Entry entry = afs.get_metadata(parse_ref(cli.args[0]));
            std::cout << "{\n";
            std::cout << "  \"uri\": \"" << entry.ref.uri << "\",\n";
            std::cout << "  \"name\": \"" << entry.name << "\",\n";
            std::cout << "  \"type\": \"" << entry_kind_name(entry.kind) << "\",\n";
            if (entry.kind == EntryKind::File) {
                std::cout << "  \"mime_type\": \"" << entry.mime_type << "\",\n";
                std::cout << "  \"len\": " << entry.len << ",\n";
            }
            std::cout << "  \"last_modified\": "
                      << (entry.last_modified_ms ? std::to_string(*entry.last_modified_ms)
                                                 : std::string("null"))
                      << "\n";
            std::cout << "}\n";
            break;
        }

        case Command::TOUCH: {
            if (cli.args.size() < 2) {
                std::cerr << "Usage: safio touch <dir> <relpath> [mime]\n";
                return 1;
            }
            std::optional<std::string> mime;
            if (cli.args.size() >= 3)
                mime = cli.args[2];
            EntryRef created = afs.create_new_file(parse_ref(cli.args[0]), cli.args[1], mime);
            std::cout << created.uri << "\n";
            break;
        }

        case Command::MKDIR: {
            if (cli.args.size() < 2) {
                std::cerr << "Usage: safio mkdir <dir> <relpath>\n";
                return 1;
            }
            EntryRef created = afs.create_dir_all(parse_ref(cli.args[0]), cli.args[1]);
            std::cout << created.uri << "\n";
            break;
        }

        case Command::RENAME: {
            if (cli.args.size() < 2) {
                std::cerr << "Usage: safio rename <ref> <name>\n";
                return 1;
            }
            EntryRef renamed = afs.rename(parse_ref(cli.args[0]), cli.args[1]);
            std::cout << renamed.uri << "\n";
            break;
        }

        case Command::RM: {
            if (cli.args.empty()) {
                std::cerr << "Usage: safio rm <ref>\n";
                return 1;
            }
            EntryRef ref = parse_ref(cli.args[0]);
            afs.remove_file(ref);
            LOG_INFO("Removed " + ref.uri);
            break;
        }

        case Command::RMDIR: {
            if (cli.args.empty()) {
                std::cerr << "Usage: safio rmdir <dir> [all]\n";
                return 1;
            }
            EntryRef ref = parse_ref(cli.args[0]);
            if (cli.args.size() >= 2 && cli.args[1] == "all") {
                afs.remove_dir_all(ref);
            } else {
                afs.remove_dir(ref);
            }
            LOG_INFO("Removed " + ref.uri);
            break;
        }

        default:
            break;
        }
    } catch (const Error& e) {
        std::cerr << "Error [" << error_kind_name(e.kind()) << "]: " << e.what() << "\n";
        LOG_ERROR("Fatal Error: " + std::string(e.what()));
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Fatal Error: " << e.what() << "\n";
        LOG_ERROR("Fatal Error: " + std::string(e.what()));
        return 1;
    }
    return 0;
}
