#include "chunkpack/chunkpack.hpp"
#include <elio/io/io_context.hpp>
#include <elio/runtime/scheduler.hpp>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <functional>
#include <future>
#include <iostream>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>

using namespace chunkpack;

namespace {

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " <command> [options]\n"
              << "Commands:\n"
              << "  pack <input>           Pack a raw file of equal-shaped samples into chunks\n"
              << "  inspect <blob>         Print the indexes of one serialized chunk\n"
              << "  read <index>           Copy one sample out of a packed chain\n"
              << "Options:\n"
              << "  -c, --config <file>    Configuration file path\n"
              << "  -o, --output <path>    Chunk directory (pack, read) or sample file (read)\n"
              << "  -d, --dir <path>       Chunk directory to read from (read)\n"
              << "  -s, --shape <d0,d1..>  Sample shape (pack)\n"
              << "  -b, --batch <n>        Samples per append (pack, default: 1)\n"
              << "  -i, --item-size <n>    Bytes per element (pack, default: 1)\n"
              << "  -m, --max-bytes <n>    Chunk capacity in bytes\n"
              << "      --verbose          Log every chunk created\n"
              << "      --metrics          Print metrics as JSON when done\n"
              << "  -h, --help             Show this help\n"
              << "  -v, --version          Show version\n";
}

void print_version() {
    std::cout << "chunkpack version " << Version::string() << "\n"
              << "Chunked sample storage with overflow chaining\n";
}

std::optional<SampleShape> parse_shape(const std::string& text) {
    SampleShape shape;
    std::stringstream ss(text);
    std::string dim;
    while (std::getline(ss, dim, ',')) {
        if (dim.empty() || dim.find_first_not_of("0123456789") != std::string::npos) {
            return std::nullopt;
        }
        shape.push_back(std::stoull(dim));
    }
    if (shape.empty()) {
        return std::nullopt;
    }
    return shape;
}

std::optional<ByteBuffer> read_file(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::nullopt;
    }
    return ByteBuffer(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

// Run one coroutine to completion on a private scheduler
Status run_task(elio::io::io_context& io_ctx, const std::function<elio::coro::task<Status>()>& body) {
    elio::runtime::scheduler sched(1);
    sched.set_io_context(&io_ctx);
    sched.start();

    std::promise<Status> done;
    auto result = done.get_future();

    auto wrapper = [&]() -> elio::coro::task<void> {
        auto status = co_await body();
        done.set_value(std::move(status));
    };

    auto task = wrapper();
    sched.spawn(task.release());

    Status status = result.get();
    sched.shutdown();
    return status;
}

struct Options {
    std::string command;
    std::string target;
    std::string config_file;
    std::optional<std::string> output;
    std::optional<std::string> dir;
    std::optional<SampleShape> shape;
    uint64_t batch = 1;
    uint64_t item_size = 1;
    std::optional<size_t> max_bytes;
    bool verbose = false;
    bool print_metrics = false;
};

int run_pack(const Options& opts, const Config& config) {
    if (!opts.shape) {
        std::cerr << "pack requires --shape\n";
        return 1;
    }

    uint64_t sample_bytes = num_elements(*opts.shape) * opts.item_size;
    if (sample_bytes == 0) {
        std::cerr << "Samples of shape " << shape_to_string(*opts.shape) << " hold no bytes\n";
        return 1;
    }

    auto input = read_file(opts.target);
    if (!input) {
        std::cerr << "Failed to read " << opts.target << "\n";
        return 1;
    }
    if (input->size() % sample_bytes != 0) {
        std::cerr << "Input size " << input->size() << " is not a multiple of the sample size "
                  << sample_bytes << "\n";
        return 1;
    }

    ChunkChain chain(config.chunk);
    ByteView view(input->data(), input->size());
    uint64_t total_samples = input->size() / sample_bytes;

    for (uint64_t first = 0; first < total_samples; first += opts.batch) {
        uint64_t count = std::min(opts.batch, total_samples - first);
        auto result = chain.append(view.subspan(first * sample_bytes, count * sample_bytes),
                                   count, *opts.shape);
        if (!result.ok()) {
            std::cerr << "Append of samples " << first << ".." << (first + count)
                      << " failed: " << result.status.to_string() << "\n";
            return 1;
        }
        if (config.logging.verbose) {
            for (const auto& id : result.new_chunks) {
                std::cout << "[chunkpack] new chunk " << id.to_string()
                          << " at sample " << first << "\n";
            }
        }
    }

    elio::io::io_context io_ctx;
    DiskChunkStorage storage(config.storage, io_ctx);
    auto status = run_task(io_ctx, [&]() -> elio::coro::task<Status> {
        auto st = co_await storage.init();
        if (!st) {
            co_return st;
        }
        co_return co_await chain.flush(storage);
    });
    if (!status) {
        std::cerr << "Failed to store chunks: " << status.to_string() << "\n";
        return 1;
    }

    auto chain_file = config.storage.path / "chain.txt";
    std::ofstream out(chain_file);
    for (const auto& id : chain.chunk_ids()) {
        out << id.to_string() << "\n";
    }
    if (!out) {
        std::cerr << "Failed to write " << chain_file << "\n";
        return 1;
    }

    std::cout << "Packed " << total_samples << " samples of shape "
              << shape_to_string(*opts.shape) << " into " << chain.num_chunks()
              << " chunks at " << config.storage.path << "\n";
    return 0;
}

int run_inspect(const Options& opts) {
    auto blob = read_file(opts.target);
    if (!blob) {
        std::cerr << "Failed to read " << opts.target << "\n";
        return 1;
    }

    Chunk chunk;
    auto status = chunk.deserialize(*blob);
    if (!status) {
        std::cerr << "Invalid chunk blob: " << status.to_string() << "\n";
        return 1;
    }

    std::cout << "capacity:           " << chunk.max_data_bytes() << " bytes\n"
              << "payload:            " << chunk.num_data_bytes() << " bytes\n"
              << "continuation bytes: " << chunk.continuation_bytes() << "\n"
              << "samples:            " << chunk.num_samples() << "\n"
              << "has space:          " << (chunk.has_space() ? "yes" : "no") << "\n";

    std::cout << "shape runs:\n";
    for (const auto& run : chunk.shapes().runs()) {
        std::cout << "  " << shape_to_string(run.shape) << " x " << run.run_length << "\n";
    }
    std::cout << "byte range runs:\n";
    for (const auto& run : chunk.byte_ranges().runs()) {
        std::cout << "  " << run.bytes_per_sample << " bytes x " << run.run_length << "\n";
    }
    return 0;
}

int run_read(const Options& opts, const Config& config) {
    uint64_t index;
    try {
        index = std::stoull(opts.target);
    } catch (const std::exception&) {
        std::cerr << "Invalid sample index: " << opts.target << "\n";
        return 1;
    }

    std::filesystem::path dir = opts.dir ? std::filesystem::path(*opts.dir) : config.storage.path;
    std::ifstream chain_file(dir / "chain.txt");
    if (!chain_file) {
        std::cerr << "No chain.txt in " << dir << "\n";
        return 1;
    }

    std::vector<ChunkId> ids;
    std::string line;
    while (std::getline(chain_file, line)) {
        if (line.empty()) continue;
        auto id = ChunkId::from_string(line);
        if (!id) {
            std::cerr << "Bad chunk id in chain.txt: " << line << "\n";
            return 1;
        }
        ids.push_back(*id);
    }

    StorageConfig storage_config = config.storage;
    storage_config.path = dir;

    elio::io::io_context io_ctx;
    DiskChunkStorage storage(storage_config, io_ctx);
    ChunkChain chain(config.chunk);
    auto status = run_task(io_ctx, [&]() -> elio::coro::task<Status> {
        co_return co_await chain.load(storage, ids);
    });
    if (!status) {
        std::cerr << "Failed to load chain: " << status.to_string() << "\n";
        return 1;
    }

    auto sample = chain.read_sample(index);
    if (!sample.ok()) {
        std::cerr << "Failed to read sample " << index << ": " << sample.status.to_string() << "\n";
        return 1;
    }

    std::cout << "sample " << index << ": shape " << shape_to_string(sample.shape)
              << ", " << sample.data.size() << " bytes\n";

    if (opts.output) {
        std::ofstream out(*opts.output, std::ios::binary);
        out.write(reinterpret_cast<const char*>(sample.data.data()),
                  static_cast<std::streamsize>(sample.data.size()));
        if (!out) {
            std::cerr << "Failed to write " << *opts.output << "\n";
            return 1;
        }
    }
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    Options opts;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        }

        if (arg == "-v" || arg == "--version") {
            print_version();
            return 0;
        }

        try {
            if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
                opts.config_file = argv[++i];
            }
            else if ((arg == "-o" || arg == "--output") && i + 1 < argc) {
                opts.output = argv[++i];
            }
            else if ((arg == "-d" || arg == "--dir") && i + 1 < argc) {
                opts.dir = argv[++i];
            }
            else if ((arg == "-s" || arg == "--shape") && i + 1 < argc) {
                opts.shape = parse_shape(argv[++i]);
                if (!opts.shape) {
                    std::cerr << "Invalid shape: " << argv[i] << "\n";
                    return 1;
                }
            }
            else if ((arg == "-b" || arg == "--batch") && i + 1 < argc) {
                opts.batch = std::stoull(argv[++i]);
            }
            else if ((arg == "-i" || arg == "--item-size") && i + 1 < argc) {
                opts.item_size = std::stoull(argv[++i]);
            }
            else if ((arg == "-m" || arg == "--max-bytes") && i + 1 < argc) {
                opts.max_bytes = std::stoull(argv[++i]);
            }
            else if (arg == "--verbose") {
                opts.verbose = true;
            }
            else if (arg == "--metrics") {
                opts.print_metrics = true;
            }
            else if (!arg.empty() && arg[0] != '-' && opts.command.empty()) {
                opts.command = arg;
            }
            else if (!arg.empty() && arg[0] != '-' && opts.target.empty()) {
                opts.target = arg;
            }
            else {
                std::cerr << "Unknown option: " << arg << "\n";
                print_usage(argv[0]);
                return 1;
            }
        } catch (const std::exception& e) {
            std::cerr << "Invalid value for " << arg << ": " << e.what() << "\n";
            return 1;
        }
    }

    if (opts.command.empty() || opts.target.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    if (opts.batch == 0) {
        std::cerr << "--batch must be at least 1\n";
        return 1;
    }

    Config config;
    if (!opts.config_file.empty()) {
        try {
            config = Config::load(opts.config_file);
        } catch (const std::exception& e) {
            std::cerr << "Failed to load config: " << e.what() << "\n";
            return 1;
        }
    }

    // Command line overrides the config file
    if (opts.max_bytes) config.chunk.max_data_bytes = *opts.max_bytes;
    if (opts.output && opts.command == "pack") config.storage.path = *opts.output;
    if (opts.verbose) config.logging.verbose = true;

    auto status = config.validate();
    if (!status) {
        std::cerr << "Invalid configuration: " << status.message() << "\n";
        return 1;
    }

    int rc;
    try {
        if (opts.command == "pack") {
            rc = run_pack(opts, config);
        } else if (opts.command == "inspect") {
            rc = run_inspect(opts);
        } else if (opts.command == "read") {
            rc = run_read(opts, config);
        } else {
            std::cerr << "Unknown command: " << opts.command << "\n";
            print_usage(argv[0]);
            return 1;
        }
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }

    if (opts.print_metrics) {
        std::cout << MetricsExporter().export_json();
    }
    return rc;
}
