/**
 * @file fbr_readfile.cpp
 * @brief fbr_readfile: copy a byte range of a file through the transfer layer.
 *
 * ## Usage
 *
 *     fbr_readfile --file <path> [--config <json>] [--position N] [--count N]
 *                  [--chunk N] [--shared-buffer] [--faults N] [--out <path>] [--base64]
 *
 * The file is served by an in-process LocalProducerRuntime and read back in chunks through a
 * TransferCoordinator, exactly as a host application would read a producer-side file.
 *
 * Exit codes: 0 success, 1 usage / config / transfer error, 2 integrity error.
 */
#include "fbr_transfer.hpp"

#include <fstream>
#include <iostream>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

using namespace filebridge::utils;
using namespace filebridge::transfer;

namespace
{

constexpr int kExitError = 1;
constexpr int kExitIntegrity = 2;

struct ReadFileArgs
{
    std::string file_path;
    std::string config_path;
    std::string out_path;
    uint64_t position{0};
    uint64_t count{std::numeric_limits<uint64_t>::max()};
    uint32_t chunk{64 * 1024};
    std::optional<int> faults;
    bool shared_buffer{false};
    bool base64{false};
};

void print_usage(const char *prog)
{
    std::cout
        << "Usage:\n"
        << "  " << prog
        << " --file <path> [--config <json>] [--position N] [--count N]\n"
           "               [--chunk N] [--shared-buffer] [--faults N] [--out <path>] [--base64]\n\n"
        << "Options:\n"
        << "  --file <path>     File to serve and read back (required)\n"
        << "  --config <json>   Extra config file merged over config/filebridge.*.json\n"
        << "  --position N      First byte to read (default 0)\n"
        << "  --count N         Bytes to read (default: to end of file)\n"
        << "  --chunk N         Bytes per read call (default 65536)\n"
        << "  --shared-buffer   Read through the verified shared-buffer path\n"
        << "  --faults N        Corrupt the next N shared-buffer reads\n"
        << "  --out <path>      Write to <path> instead of stdout\n"
        << "  --base64          Emit base64 text, one line per chunk\n"
        << "  --help            Show this message\n";
}

uint64_t parse_number(std::string_view flag, const char *text)
{
    try
    {
        size_t used = 0;
        const unsigned long long value = std::stoull(text, &used);
        if (used != std::string_view(text).size())
        {
            throw std::invalid_argument("trailing characters");
        }
        return value;
    }
    catch (const std::exception &)
    {
        std::cerr << "Error: " << flag << " expects a non-negative integer, got '" << text
                  << "'\n";
        std::exit(kExitError);
    }
}

ReadFileArgs parse_args(int argc, char *argv[])
{
    ReadFileArgs args;
    for (int i = 1; i < argc; ++i)
    {
        std::string_view arg(argv[i]);
        const bool has_value = i + 1 < argc;
        if (arg == "--help" || arg == "-h")
        {
            print_usage(argv[0]);
            std::exit(0);
        }
        if (arg == "--file" && has_value)
        {
            args.file_path = argv[++i];
        }
        else if (arg == "--config" && has_value)
        {
            args.config_path = argv[++i];
        }
        else if (arg == "--out" && has_value)
        {
            args.out_path = argv[++i];
        }
        else if (arg == "--position" && has_value)
        {
            args.position = parse_number(arg, argv[++i]);
        }
        else if (arg == "--count" && has_value)
        {
            args.count = parse_number(arg, argv[++i]);
        }
        else if (arg == "--chunk" && has_value)
        {
            const uint64_t chunk = parse_number(arg, argv[++i]);
            if (chunk == 0 || chunk > std::numeric_limits<int32_t>::max())
            {
                std::cerr << "Error: --chunk must be between 1 and "
                          << std::numeric_limits<int32_t>::max() << "\n";
                std::exit(kExitError);
            }
            args.chunk = static_cast<uint32_t>(chunk);
        }
        else if (arg == "--faults" && has_value)
        {
            args.faults = static_cast<int>(
                std::min<uint64_t>(parse_number(arg, argv[++i]), std::numeric_limits<int>::max()));
        }
        else if (arg == "--shared-buffer")
        {
            args.shared_buffer = true;
        }
        else if (arg == "--base64")
        {
            args.base64 = true;
        }
        else
        {
            std::cerr << "Unknown argument: " << arg << "\n";
            print_usage(argv[0]);
            std::exit(kExitError);
        }
    }
    if (args.file_path.empty())
    {
        std::cerr << "Error: --file <path> is required\n\n";
        print_usage(argv[0]);
        std::exit(kExitError);
    }
    return args;
}

uint64_t copy_range(RemoteFileStream &stream, const ReadFileArgs &args, std::ostream &out)
{
    uint64_t remaining = args.count;
    uint64_t copied = 0;
    std::vector<uint8_t> buffer(args.chunk);

    while (remaining > 0)
    {
        const auto want = static_cast<uint32_t>(std::min<uint64_t>(remaining, args.chunk));
        if (args.base64)
        {
            const uint64_t before = stream.position();
            const std::string text = stream.read_base64(want);
            if (text.empty())
            {
                break;
            }
            out << text << '\n';
            copied += stream.position() - before;
            remaining -= stream.position() - before;
            continue;
        }

        const uint32_t n = stream.read(std::span<uint8_t>(buffer.data(), want));
        if (n == 0)
        {
            break;
        }
        out.write(reinterpret_cast<const char *>(buffer.data()), n);
        copied += n;
        remaining -= n;
    }
    out.flush();
    return copied;
}

} // anonymous namespace

int main(int argc, char *argv[])
{
    const ReadFileArgs args = parse_args(argc, argv);

    if (!args.config_path.empty())
    {
        TransferConfig::set_config_path(args.config_path);
    }

    LifecycleGuard lifecycle(MakeModDefList(Logger::GetLifecycleModule(),
                                            filebridge::crypto::GetLifecycleModule(),
                                            TransferConfig::GetLifecycleModule()));

    TransferConfig config = TransferConfig::current();
    if (args.shared_buffer)
    {
        config.use_shared_buffer = true;
    }

    std::ofstream file_out;
    if (!args.out_path.empty())
    {
        file_out.open(args.out_path, std::ios::binary | std::ios::trunc);
        if (!file_out)
        {
            std::cerr << "Error: cannot open '" << args.out_path << "' for writing\n";
            return kExitError;
        }
    }
    std::ostream &out = args.out_path.empty() ? std::cout : file_out;

    try
    {
        LocalProducerRuntime producer;
        producer.add_disk_file("input", args.file_path);
        if (args.faults)
        {
            producer.inject_shared_buffer_faults(*args.faults);
        }

        TransferCoordinator coordinator(producer, config);
        uint64_t copied = 0;
        {
            RemoteFileStream stream = RemoteFileStream::open(coordinator, "input", 0);
            stream.seek(static_cast<int64_t>(
                std::min<uint64_t>(args.position, std::numeric_limits<int64_t>::max())));
            copied = copy_range(stream, args, out);
        }

        const TransferStats stats = coordinator.stats();
        LOGGER_INFO("fbr_readfile: copied {} byte(s) in {} read(s) over the {} path "
                    "({} integrity failure(s), {} retr(ies)).",
                    copied, stats.reads,
                    coordinator.uses_shared_buffer() ? "shared-buffer" : "encoded",
                    stats.integrity_failures, stats.retries);
        coordinator.shutdown();
    }
    catch (const TransferIntegrityError &e)
    {
        LOGGER_ERROR("fbr_readfile: integrity error: {} (recovered on retry: {})", e.what(),
                     e.recovered_on_retry());
        std::cerr << "Integrity error: " << e.what() << "\n";
        return kExitIntegrity;
    }
    catch (const TransferError &e)
    {
        LOGGER_ERROR("fbr_readfile: transfer error: {}", e.what());
        std::cerr << "Transfer error: " << e.what() << "\n";
        return kExitError;
    }
    return 0;
}
