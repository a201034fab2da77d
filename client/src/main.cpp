#include <cstdint>
#include <exception>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include "config/cli_args.hpp"
#include "config/upload_config.hpp"
#include "net/chunked_upload.hpp"
#include "net/http.hpp"
#include "util/byte_utils.hpp"

namespace {
void print_usage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " [options] [<url>] <file|->\n"
              << "  <url> may be left out when the configuration sets \"url\"\n"
              << "  --config <file>       JSON configuration, overridden by the options below\n"
              << "  --method <verb>       HTTP method (default PUT)\n"
              << "  --chunk-size <size>   bytes per request, e.g. 1048576 or 4MB (default 1MB)\n"
              << "  --header \"Name: v\"    extra request header, repeatable\n"
              << "  --size <bytes>        payload size, required when reading stdin (-)\n"
              << "  --name <file name>    name sent in Content-Disposition\n"
              << "  --timeout <seconds>   per request timeout (default none)\n"
              << "  --verbose             log every chunk\n";
}
} // namespace

int main(int argc, char** argv) {
    cli_args args;
    std::string error;
    if (!parse_cli_args(argc, argv, args, error)) {
        std::cerr << error << std::endl;
        print_usage(argv[0]);
        return 2;
    }

    upload_config config;
    if (args.config_path) {
        auto loaded = load_upload_config(*args.config_path, error);
        if (!loaded) {
            std::cerr << error << std::endl;
            return 2;
        }
        config = *loaded;
    }
    if (!apply_cli_overrides(args, config, error)) {
        std::cerr << error << std::endl;
        print_usage(argv[0]);
        return 2;
    }

    std::shared_ptr<http_client> client;
    try {
        client = std::make_shared<http_client>();
    } catch (const std::exception& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }
    client->set_timeout(config.timeout_seconds);

    chunked_upload::options opts = config.to_options();
    if (args.name)
        opts.file_name = *args.name;

    const std::string& source = args.source;
    std::unique_ptr<chunked_upload> upload;
    if (source == "-") {
        std::optional<std::uint64_t> size;
        if (args.size)
            size = byte_utils::parse_size(*args.size);
        if (!size || *size > static_cast<std::uint64_t>(INT64_MAX)) {
            std::cerr << "reading stdin needs a valid --size" << std::endl;
            return 2;
        }
        upload = std::make_unique<chunked_upload>(std::cin, static_cast<std::int64_t>(*size), opts,
                                                  client);
    } else {
        upload = std::make_unique<chunked_upload>(source, opts, client);
    }

    if (auto err = upload->init()) {
        std::cerr << "Upload could not start: " << *err << std::endl;
        return 1;
    }

    const upload_status status = upload->status();
    if (status.failed) {
        std::cerr << "Upload " << upload->session_id() << " failed after "
                  << status.transferred_parts << " of " << status.total_parts << " part(s)"
                  << std::endl;
        return 1;
    }

    std::cout << "Upload " << upload->session_id() << " finished: "
              << byte_utils::format_bytes(static_cast<std::uint64_t>(status.transferred_size))
              << " in " << status.total_parts << " part(s)" << std::endl;
    return 0;
}
