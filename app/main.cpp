// ============================================================
// app/main.cpp -- seqferry entry point
// ============================================================

#include "../common/platform.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include "seqferry_app.hpp"
#include <csignal>
#include <cstring>
#include <iostream>
#include <string>

static void print_usage(const char* prog) {
    std::cerr
        << "Usage: " << prog << " -m MANIFEST -d DIR -b BUCKET [options]\n"
        << "\n"
        << "  -m, --manifest PATH    tab-delimited manifest (id, checksum, size, urls, sample)\n"
        << "  -d, --directory DIR    working directory for downloads\n"
        << "  -b, --bucket ID        destination bucket (gs:// is added if missing)\n"
        << "\nOptions:\n"
        << "  --no-verify            skip checksum verification\n"
        << "  --priority LIST        scheme priority order (default: " << DEFAULT_PRIORITIES << ")\n"
        << "  --block-size N         network read block in bytes (default: " << DEFAULT_BLOCK_SIZE << ")\n"
        << "  --retries N            download attempts per entry (default: " << DEFAULT_DOWNLOAD_ATTEMPTS << ")\n"
        << "  --workers N            entries processed in parallel (default: 1)\n"
        << "  --timeout SECS         stop the run after SECS seconds (default: none)\n"
        << "  --digest ALGO          force md5, sha1, sha256 or xxh3 (default: detect)\n"
        << "  --run-name NAME        run folder name; reuse one to resume (default: upload-<UTC time>)\n"
        << "  --rewrite-rules FILE   URL rewrite table (scheme, marker, template)\n"
        << "  --no-rewrite           disable URL rewriting\n"
        << "  --s3-gateway TEMPLATE  HTTPS gateway for s3:// URLs (default: " << DEFAULT_S3_GATEWAY << ")\n"
        << "  --uploader PROG        storage copy tool (default: " << DEFAULT_UPLOADER << ")\n"
        << "  --log-file PATH        also write the log to PATH\n"
        << "  --verbose              enable debug logging\n"
        << "\nExamples:\n"
        << "  " << prog << " -m manifest.tsv -d /data -b my-bucket\n"
        << "  " << prog << " -m manifest.tsv -d /data -b my-bucket --workers 4 --priority HTTP,S3\n"
        << "  " << prog << " -m manifest.tsv -d /data -b my-bucket --run-name upload-20261017T175400Z\n";
}

static bool parse_count(const char* s, u64 min, u64& out) {
    return utils::parse_u64(s, out) && out >= min;
}

int main(int argc, char* argv[]) {
    AppOptions opts;

    auto value = [&](int& i) -> const char* {
        if (i + 1 >= argc) {
            std::cerr << "Missing value for " << argv[i] << "\n";
            return nullptr;
        }
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        const char* a = argv[i];
        const char* v = nullptr;
        u64 n = 0;

        if (std::strcmp(a, "-h") == 0 || std::strcmp(a, "--help") == 0) {
            print_usage(argv[0]);
            return EXIT_CODE_OK;
        } else if (std::strcmp(a, "--no-verify") == 0) {
            opts.no_verify = true;
        } else if (std::strcmp(a, "--no-rewrite") == 0) {
            opts.no_rewrite = true;
        } else if (std::strcmp(a, "--verbose") == 0) {
            opts.verbose = true;
        } else if (!(v = value(i))) {
            print_usage(argv[0]);
            return EXIT_CODE_USAGE;
        } else if (std::strcmp(a, "-m") == 0 || std::strcmp(a, "--manifest") == 0) {
            opts.manifest_path = v;
        } else if (std::strcmp(a, "-d") == 0 || std::strcmp(a, "--directory") == 0) {
            opts.directory = v;
        } else if (std::strcmp(a, "-b") == 0 || std::strcmp(a, "--bucket") == 0) {
            opts.bucket = v;
        } else if (std::strcmp(a, "--priority") == 0) {
            opts.priorities = v;
        } else if (std::strcmp(a, "--block-size") == 0) {
            if (!parse_count(v, 1, n)) { std::cerr << "Invalid block size: " << v << "\n"; return EXIT_CODE_USAGE; }
            opts.block_size = (size_t)n;
        } else if (std::strcmp(a, "--retries") == 0) {
            if (!parse_count(v, 1, n) || n > 1000) { std::cerr << "Invalid retries: " << v << "\n"; return EXIT_CODE_USAGE; }
            opts.retries = (int)n;
        } else if (std::strcmp(a, "--workers") == 0) {
            if (!parse_count(v, 1, n) || n > 256) { std::cerr << "Invalid workers: " << v << "\n"; return EXIT_CODE_USAGE; }
            opts.workers = (size_t)n;
        } else if (std::strcmp(a, "--timeout") == 0) {
            if (!parse_count(v, 0, n) || n > 1000000000) { std::cerr << "Invalid timeout: " << v << "\n"; return EXIT_CODE_USAGE; }
            opts.timeout_s = (int)n;
        } else if (std::strcmp(a, "--digest") == 0) {
            opts.digest = v;
        } else if (std::strcmp(a, "--run-name") == 0) {
            opts.run_name = v;
        } else if (std::strcmp(a, "--rewrite-rules") == 0) {
            opts.rewrite_rules_path = v;
        } else if (std::strcmp(a, "--s3-gateway") == 0) {
            opts.s3_gateway = v;
        } else if (std::strcmp(a, "--uploader") == 0) {
            opts.uploader = v;
        } else if (std::strcmp(a, "--log-file") == 0) {
            Logger::get().set_log_file(v);
        } else {
            std::cerr << "Unknown option: " << a << "\n";
            print_usage(argv[0]);
            return EXIT_CODE_USAGE;
        }
    }

    if (opts.manifest_path.empty() || opts.directory.empty() || opts.bucket.empty()) {
        std::cerr << "ERROR: --manifest, --directory and --bucket are required\n";
        print_usage(argv[0]);
        return EXIT_CODE_USAGE;
    }
    if (!opts.run_name.empty() &&
        (opts.run_name.find('/') != std::string::npos || opts.run_name == "." || opts.run_name == "..")) {
        std::cerr << "ERROR: Invalid run name: " << opts.run_name << "\n";
        return EXIT_CODE_USAGE;
    }

    Logger::get().set_level(opts.verbose ? LogLevel::DEBUG : LogLevel::INFO);

    try {
        SeqferryApp app(opts);
        StopSignalScope signals(app);
        // Broken pipes to a dying uploader surface as write errors
        std::signal(SIGPIPE, SIG_IGN);

        return app.run();
    } catch (const std::exception& e) {
        std::cerr << "FATAL: " << e.what() << "\n";
        return EXIT_CODE_FATAL;
    }
}
