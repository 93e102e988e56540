// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <fstream>
#include <functional>
#include <iostream>
#include <iterator>
#include <map>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <system_error>
#include <unordered_map>
#include <vector>

#include "common/utils.hpp"
#include "configuration.hpp"
#include "exception.hpp"
#include "log.hpp"
#include "text_decoder.hpp"
#include "urlscrub.h"

using namespace urlscrub;

namespace {

struct option_def {
    std::string_view name;
    bool has_value;
};

using arguments = std::unordered_map<std::string, std::vector<std::string>>;

// Positional arguments are stored under an empty key
// NOLINTNEXTLINE
arguments parse_args(int argc, char *argv[])
{
    const std::map<std::string, option_def, std::less<>> arg_mapping{
        {"-o", {"--output", true}}, {"--output", {"--output", true}},
        {"-p", {"--parameters", true}}, {"--parameters", {"--parameters", true}},
        {"-r", {"--redaction_string", true}}, {"--redaction_string", {"--redaction_string", true}},
        {"-l", {"--log_level", true}}, {"--log_level", {"--log_level", true}},
        {"-c", {"--config", true}}, {"--config", {"--config", true}},
        {"-e", {"--encoding", true}}, {"--encoding", {"--encoding", true}},
        {"--canonical", {"--canonical", false}}, {"-h", {"--help", false}},
        {"--help", {"--help", false}}, {"--version", {"--version", false}}};

    arguments args;
    for (int i = 1; i < argc; i++) {
        std::string_view arg = argv[i];
        if (arg.size() < 2 || !arg.starts_with('-')) {
            // Includes "-" which stands for standard input
            args[""].emplace_back(arg);
            continue;
        }

        std::optional<std::string_view> inline_value;
        if (arg.starts_with("--")) {
            if (auto eq = arg.find('='); eq != std::string_view::npos) {
                inline_value = arg.substr(eq + 1);
                arg = arg.substr(0, eq);
            }
        }

        auto it = arg_mapping.find(arg);
        if (it == arg_mapping.end()) {
            throw configuration_error("unknown option '" + std::string{arg} + "'");
        }

        const auto &[name, has_value] = it->second;
        auto &values = args[std::string{name}];
        if (!has_value) {
            if (inline_value.has_value()) {
                throw configuration_error("option '" + std::string{name} + "' takes no value");
            }
            continue;
        }

        if (inline_value.has_value()) {
            values.emplace_back(*inline_value);
        } else if (i + 1 < argc) {
            values.emplace_back(argv[++i]);
        } else {
            throw configuration_error("option '" + std::string{name} + "' requires a value");
        }
    }
    return args;
}

// Only the last occurrence of an option is taken into account
std::optional<std::string> last_value(const arguments &args, const std::string &name)
{
    auto it = args.find(name);
    if (it == args.end() || it->second.empty()) {
        return std::nullopt;
    }
    return it->second.back();
}

void print_usage(std::ostream &out, const char *program)
{
    out << "Usage: " << program
        << " [input|-] [-o FILE] [-p LIST] [-r TOKEN] [-l LEVEL] [-c FILE]"
           " [-e ENCODING] [--canonical] [-h] [--version]\n\n"
           "Redact sensitive query parameters from the URLs found in a text stream.\n\n"
           "  input                      input file, '-' or nothing for standard input\n"
           "  -o, --output FILE          output file, standard output by default\n"
           "  -p, --parameters LIST      comma-separated parameter names to redact\n"
           "  -r, --redaction_string STR replacement value (default: REDACTED)\n"
           "  -l, --log_level LEVEL      trace, debug, info, warn, error or off\n"
           "  -c, --config FILE          YAML configuration file\n"
           "  -e, --encoding ENCODING    auto, utf-8, utf-16le, utf-16be or latin-1\n"
           "  --canonical                rebuild queries in canonical form\n"
           "  -h, --help                 show this message and exit\n"
           "  --version                  show the version and exit\n";
}

URLSCRUB_LOG_LEVEL to_c_level(log_level level) { return static_cast<URLSCRUB_LOG_LEVEL>(level); }

configuration resolve_configuration(const arguments &args)
{
    configuration config;

    if (auto path = last_value(args, "--config"); path.has_value()) {
        URLSCRUB_DEBUG("Loading configuration from {}", *path);
        load_configuration_file(*path, config);
    }

    if (auto list = last_value(args, "--parameters"); list.has_value()) {
        config.parameters = parse_parameter_list(*list);
    }

    if (auto token = last_value(args, "--redaction_string"); token.has_value()) {
        config.redaction_string = *token;
    }

    if (auto level = last_value(args, "--log_level"); level.has_value()) {
        config.level = parse_log_level(*level);
    }

    if (auto encoding = last_value(args, "--encoding"); encoding.has_value()) {
        config.encoding = parse_encoding(*encoding);
    }

    if (args.contains("--canonical")) {
        config.mode = query_mode::canonical;
    }

    validate_configuration(config);
    return config;
}

class output_sink {
public:
    explicit output_sink(const std::optional<std::string> &path)
    {
        if (path.has_value() && *path != "-") {
            file_ = std::make_unique<std::ofstream>(*path, std::ios::out | std::ios::binary);
            if (!*file_) {
                throw std::system_error(errno, std::generic_category());
            }
        }
    }

    std::ostream &stream() { return file_ ? *file_ : std::cout; }

private:
    std::unique_ptr<std::ofstream> file_;
};

struct run_summary {
    std::size_t lines{0};
    std::size_t urls_found{0};
    std::size_t urls_redacted{0};
    std::size_t urls_malformed{0};
    std::size_t errors{0};
};

void redact_line(urlscrub_handle handle, std::string_view line, bool newline, std::ostream &out,
    run_summary &summary)
{
    ++summary.lines;

    urlscrub_result result{};
    auto code = urlscrub_redact_line(handle, line.data(), line.size(), &result);
    if (code < URLSCRUB_OK) {
        URLSCRUB_ERROR("Failed to process line {}, error code {}", summary.lines,
            static_cast<int>(code));
        ++summary.errors;
        out.write(line.data(), static_cast<std::streamsize>(line.size()));
    } else {
        summary.urls_found += result.urls_found;
        summary.urls_redacted += result.urls_redacted;
        summary.urls_malformed += result.urls_malformed;
        out.write(result.text, static_cast<std::streamsize>(result.length));
        urlscrub_result_free(&result);
    }

    if (newline) {
        out.put('\n');
    }
}

void redact_buffer(urlscrub_handle handle, std::string_view buffer, std::ostream &out,
    run_summary &summary)
{
    while (!buffer.empty()) {
        auto end = buffer.find('\n');
        if (end == std::string_view::npos) {
            redact_line(handle, buffer, false, out, summary);
            break;
        }
        redact_line(handle, buffer.substr(0, end), true, out, summary);
        buffer.remove_prefix(end + 1);
    }
}

void redact_stream(urlscrub_handle handle, std::istream &in, std::ostream &out,
    run_summary &summary)
{
    std::string line;
    while (std::getline(in, line)) {
        // eof is only reached by getline when the last line has no terminator
        redact_line(handle, line, !in.eof(), out, summary);
    }
}

} // namespace

int main(int argc, char *argv[])
{
    // Errors only until the configured level is known
    urlscrub_set_log_cb(log_cb, URLSCRUB_LOG_ERROR);

    arguments args;
    configuration config;
    try {
        args = parse_args(argc, argv);
        if (args.contains("--help")) {
            print_usage(std::cout, argv[0]);
            return EXIT_SUCCESS;
        }

        if (args.contains("--version")) {
            std::cout << urlscrub_get_version() << '\n';
            return EXIT_SUCCESS;
        }

        // Honour the requested level before the configuration file is read
        if (auto level = last_value(args, "--log_level"); level.has_value()) {
            urlscrub_set_log_cb(log_cb, to_c_level(parse_log_level(*level)));
        }

        config = resolve_configuration(args);
    } catch (const std::exception &e) {
        std::cerr << argv[0] << ": " << e.what() << '\n';
        print_usage(std::cerr, argv[0]);
        return EXIT_FAILURE;
    }

    urlscrub_set_log_cb(log_cb, to_c_level(config.level));

    std::optional<std::string> input;
    if (auto it = args.find(""); it != args.end()) {
        if (it->second.size() > 1) {
            std::cerr << argv[0] << ": only one input can be provided\n";
            return EXIT_FAILURE;
        }
        if (it->second.front() != "-") {
            input = it->second.front();
        }
    }

    bool stream_input = !input.has_value() && (config.encoding == text_encoding::automatic ||
                                                  config.encoding == text_encoding::utf8);

    std::string buffer;
    if (input.has_value()) {
        URLSCRUB_INFO("Reading from {}", *input);
        std::string bytes;
        try {
            bytes = read_file(*input);
        } catch (const std::system_error &e) {
            URLSCRUB_ERROR("Failed to read {}: {}", *input, e.code().message());
            return EXIT_FAILURE;
        }

        URLSCRUB_DEBUG("Decoding {} as {}", *input, encoding_to_string(config.encoding));
        try {
            buffer = decode_to_utf8(bytes, config.encoding);
        } catch (const std::exception &e) {
            URLSCRUB_ERROR("Failed to decode {}: {}", *input, e.what());
            return EXIT_FAILURE;
        }
    } else {
        URLSCRUB_INFO("Reading from standard input");
        if (!stream_input) {
            std::string bytes{
                std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>()};
            try {
                buffer = decode_to_utf8(bytes, config.encoding);
            } catch (const std::exception &e) {
                URLSCRUB_ERROR("Failed to decode standard input: {}", e.what());
                return EXIT_FAILURE;
            }
        }
    }

    std::unique_ptr<output_sink> output;
    auto output_path = last_value(args, "--output");
    try {
        output = std::make_unique<output_sink>(output_path);
    } catch (const std::system_error &e) {
        URLSCRUB_ERROR("Failed to open {}: {}", output_path.value_or("-"), e.code().message());
        return EXIT_FAILURE;
    }

    std::vector<const char *> parameters;
    parameters.reserve(config.parameters.size());
    for (const auto &name : config.parameters) { parameters.emplace_back(name.c_str()); }

    const urlscrub_config handle_config{.parameters = parameters.data(),
        .parameters_size = static_cast<uint32_t>(parameters.size()),
        .redaction_string = config.redaction_string.c_str(),
        .query_mode = static_cast<URLSCRUB_QUERY_MODE>(config.mode)};

    urlscrub_handle handle = urlscrub_init(&handle_config);
    if (handle == nullptr) {
        std::cerr << argv[0] << ": failed to initialise redaction\n";
        return EXIT_FAILURE;
    }

    run_summary summary;
    auto &out = output->stream();
    if (stream_input) {
        redact_stream(handle, std::cin, out, summary);
    } else {
        redact_buffer(handle, buffer, out, summary);
    }
    out.flush();

    urlscrub_destroy(handle);

    URLSCRUB_INFO("Processed {} lines: {} URLs found, {} redacted, {} malformed, {} errors",
        summary.lines, summary.urls_found, summary.urls_redacted, summary.urls_malformed,
        summary.errors);

    if (!out) {
        URLSCRUB_ERROR("Failed to write output to {}", output_path.value_or("standard output"));
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
