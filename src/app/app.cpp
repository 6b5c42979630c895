#include "app.hpp"
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <fstream>
#include <vector>

#include "../logger.hpp"
#include "../dlid/parser.hpp"
#include "capture.hpp"
#include "config.hpp"
#include "output.hpp"
#include "settings/store.hpp"

namespace app {

namespace {

struct Args {
    std::string config_path;
    std::string input = "-";
    config::Overrides overrides;
    bool init_config = false;
    bool help = false;
};

bool parse_size(const std::string& s, std::size_t& out) {
    if (s.empty() || s.find_first_not_of("0123456789") != std::string::npos) return false;
    try {
        out = static_cast<std::size_t>(std::stoull(s));
    } catch (const std::out_of_range&) {
        return false;
    }
    return true;
}

bool parse_args(int argc, char** argv, Args& a, std::string& err) {
    int i = 1;
    bool have_input = false;
    while (i < argc) {
        std::string opt = argv[i++];
        if (opt == "-h" || opt == "--help") a.help = true;
        else if (opt == "--config" && i < argc) a.config_path = argv[i++];
        else if (opt == "--chunk" && i < argc) {
            std::size_t n = 0;
            if (!parse_size(argv[i], n)) { err = std::string("invalid --chunk value: ") + argv[i]; return false; }
            ++i;
            a.overrides.chunk_size = n;
        }
        else if (opt == "--format" && i < argc) {
            std::string f = argv[i++];
            if (f != "json" && f != "text") { err = "invalid --format value: " + f; return false; }
            a.overrides.format = config::parse_format(f);
        }
        else if (opt == "--describe") a.overrides.describe_fields = true;
        else if (opt == "--capture") a.overrides.capture = true;
        else if (opt == "--log-file" && i < argc) a.overrides.log_file = std::string(argv[i++]);
        else if (opt == "--quiet") a.overrides.log_level = logger::Level::Error;
        else if (opt == "--verbose") a.overrides.log_level = logger::Level::Info;
        else if (opt == "--init-config") a.init_config = true;
        else if (!opt.empty() && opt[0] == '-' && opt != "-") { err = "unknown option: " + opt; return false; }
        else {
            if (have_input) { err = "more than one input given"; return false; }
            a.input = opt;
            have_input = true;
        }
    }
    return true;
}

bool read_input(const std::string& path, std::string& out) {
    if (path == "-") {
        out.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
        return !std::cin.bad();
    }
    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (!in.is_open()) return false;
    out.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    return !in.bad();
}

// Splits data into pieces of at most chunk characters (whole input when chunk is 0).
std::vector<std::string> chunks_of(const std::string& data, std::size_t chunk) {
    std::vector<std::string> out;
    if (chunk == 0 || data.size() <= chunk) {
        out.push_back(data);
        return out;
    }
    for (std::size_t pos = 0; pos < data.size(); pos += chunk) {
        out.push_back(data.substr(pos, chunk));
    }
    return out;
}

int decode(const config::AppConfig& cfg, const std::string& data) {
    dlid::Parser parser;
    bool awaiting = true;
    for (const auto& piece : chunks_of(data, cfg.chunk_size)) {
        awaiting = parser.append(piece);
        if (!awaiting) break;
    }

    if (parser.has_error()) {
        std::cerr << "dlid-decode: " << dlid::error_kind_name(parser.error_kind())
                  << " error: " << parser.error_message() << std::endl;
        return EXIT_PARSE_FAILED;
    }
    if (!parser.is_complete()) {
        std::cerr << "dlid-decode: input ended before the payload was complete ("
                  << parser.data().size() << " chars read)" << std::endl;
        return EXIT_INCOMPLETE;
    }

    if (cfg.format == config::OutputFormat::Text) {
        std::cout << output::render_text(parser.result(), cfg.describe_fields);
    } else {
        std::cout << output::render_json(parser.result(), cfg.indent) << std::endl;
    }
    return EXIT_OK;
}

int capture_mode(const config::AppConfig& cfg, const std::string& data) {
    capture::Session session({}, cfg.capture_timeout);
    std::vector<dlid::ParseResult> results;
    bool had_result = false;
    (void)session.subscribe([&results, &had_result](const capture::State& s) {
        if (s.result && !had_result) {
            results.push_back(*s.result);
        }
        had_result = s.result.has_value();
    });

    // Input is replayed without delays; only the final flush runs past the deadline.
    const auto start = capture::Clock::now();
    for (const auto& piece : chunks_of(data, cfg.chunk_size == 0 ? 1 : cfg.chunk_size)) {
        session.append(piece, start);
    }
    session.tick(start + cfg.capture_timeout);

    if (cfg.format == config::OutputFormat::Text) {
        for (const auto& r : results) {
            std::cout << output::render_text(r, cfg.describe_fields) << '\n';
        }
        std::cout << session.state().value;
    } else {
        std::cout << output::render_capture_json(results, session.state().value, cfg.indent) << std::endl;
    }
    return results.empty() ? EXIT_INCOMPLETE : EXIT_OK;
}

} // namespace

std::string usage() {
    return "usage: dlid-decode [--config PATH] [--chunk N] [--format json|text] [--describe]\n"
           "                   [--capture] [--log-file PATH] [--quiet|--verbose] [--init-config]\n"
           "                   [FILE|-]\n";
}

int App::run(int argc, char** argv) {
    // 1) Command line
    Args args;
    std::string err;
    if (!parse_args(argc, argv, args, err)) {
        std::cerr << "dlid-decode: " << err << '\n' << usage();
        return EXIT_USAGE;
    }
    if (args.help) {
        std::cout << usage();
        return EXIT_OK;
    }

    // 2) Config file (JSON). Missing file means defaults.
    const std::string cfgPath = args.config_path.empty() ? settings::store::default_path() : args.config_path;
    settings::Config fileCfg{};
    const bool cfgLoaded = settings::store::load_from(cfgPath, fileCfg);
    config::AppConfig cfg = config::merge(config::from_settings(fileCfg), args.overrides);

    // 3) Logger
    logger::set_level(cfg.log_level);
    if (!cfg.log_file.empty()) {
        if (logger::set_log_file(cfg.log_file)) {
            logger::info("Logging to file: " + cfg.log_file);
        } else {
            logger::warn("Cannot open log file " + cfg.log_file);
        }
    }
    logger::info(cfgLoaded ? "Config loaded: " + cfgPath : "Using default config");

    if (args.init_config) {
        if (!settings::store::save_to(cfgPath, config::to_settings(cfg))) {
            return EXIT_IO_ERROR;
        }
        logger::info("Config written: " + cfgPath);
        return EXIT_OK;
    }

    // 4) Input
    std::string data;
    if (!read_input(args.input, data)) {
        logger::error("Cannot read input " + args.input);
        return EXIT_IO_ERROR;
    }
    logger::info("Read " + std::to_string(data.size()) + " chars from " + (args.input == "-" ? "stdin" : args.input));

    // 5) Decode
    return cfg.capture ? capture_mode(cfg, data) : decode(cfg, data);
}

} // namespace app
