#include "options.hpp"
#include <charconv>

namespace l2stream::config {

std::optional<uint32_t> parse_number(std::string_view text) {
    int base = 10;
    if (text.size() > 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
        text.remove_prefix(2);
        base = 16;
    }
    if (text.empty()) return std::nullopt;

    uint32_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value, base);
    if (ec != std::errc() || ptr != text.data() + text.size()) return std::nullopt;
    return value;
}

const char* options_help() {
    return "  --psm <n>             L2CAP PSM, decimal or 0x hex (default 0x0025)\n"
           "  --source mic|file     Data source (default mic)\n"
           "  --input <path>        File source (default input.pcm)\n"
           "  --output <path>       File sink (default output.pcm)\n"
           "  --playback            Play received audio (default)\n"
           "  --no-playback         Do not play received audio\n"
           "  --to-file             Write received data to the output file\n"
           "  --loopback            Echo received data back to the peer\n"
           "  --chunk <bytes>       Chunk size, 0 for automatic\n"
           "  --rate <hz>           Sample rate (default 48000)\n"
           "  --channels <1|2>      Channel count (default 1)\n"
           "  --format s16|u8|f32   Sample format (default s16)\n"
           "  --quantum <frames>    Audio buffer quantum (default 1024)\n"
           "  --no-pace             Send files as fast as the link allows\n"
           "  --connect <address>   Connect to a peer after start\n"
           "  --send                Send the source to the connected peer\n"
           "  --verbose             Log every chunk\n";
}

std::optional<Config> parse_options(const std::vector<std::string>& args, std::string& error) {
    Config config;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& opt = args[i];

        // Options taking a value
        auto value = [&]() -> std::optional<std::string> {
            if (i + 1 >= args.size()) {
                error = opt + " requires a value";
                return std::nullopt;
            }
            return args[++i];
        };
        auto number = [&](uint32_t min, uint32_t max) -> std::optional<uint32_t> {
            auto text = value();
            if (!text) return std::nullopt;
            auto n = parse_number(*text);
            if (!n || *n < min || *n > max) {
                error = opt + ": invalid value '" + *text + "'";
                return std::nullopt;
            }
            return n;
        };

        if (opt == "--psm") {
            auto n = number(1, 0xffff);
            if (!n) return std::nullopt;
            // Valid PSMs are odd with an even upper byte
            if ((*n & 0x0001) == 0 || (*n & 0x0100) != 0) {
                error = opt + ": " + args[i] + " is not a valid PSM";
                return std::nullopt;
            }
            config.psm = static_cast<uint16_t>(*n);
        } else if (opt == "--source") {
            auto text = value();
            if (!text) return std::nullopt;
            auto kind = source_kind_from_string(*text);
            if (!kind) {
                error = opt + ": expected mic or file, got '" + *text + "'";
                return std::nullopt;
            }
            config.source = *kind;
        } else if (opt == "--input") {
            auto text = value();
            if (!text) return std::nullopt;
            config.input_path = *text;
        } else if (opt == "--output") {
            auto text = value();
            if (!text) return std::nullopt;
            config.output_path = *text;
        } else if (opt == "--playback") {
            config.playback = true;
        } else if (opt == "--no-playback") {
            config.playback = false;
        } else if (opt == "--to-file") {
            config.to_file = true;
        } else if (opt == "--loopback") {
            config.loopback = true;
        } else if (opt == "--chunk") {
            auto n = number(0, 1 << 20);
            if (!n) return std::nullopt;
            config.chunk_size = *n;
        } else if (opt == "--rate") {
            auto n = number(8000, 192000);
            if (!n) return std::nullopt;
            config.audio.sample_rate = *n;
        } else if (opt == "--channels") {
            auto n = number(1, 2);
            if (!n) return std::nullopt;
            config.audio.channels = *n;
        } else if (opt == "--format") {
            auto text = value();
            if (!text) return std::nullopt;
            auto format = sample_format_from_string(*text);
            if (!format) {
                error = opt + ": expected s16, u8 or f32, got '" + *text + "'";
                return std::nullopt;
            }
            config.audio.format = *format;
        } else if (opt == "--quantum") {
            auto n = number(32, 8192);
            if (!n) return std::nullopt;
            config.quantum = *n;
        } else if (opt == "--no-pace") {
            config.pace_file = false;
        } else if (opt == "--connect") {
            auto text = value();
            if (!text) return std::nullopt;
            config.connect_address = *text;
        } else if (opt == "--send") {
            config.send = true;
        } else if (opt == "--verbose" || opt == "-v") {
            config.verbose = true;
        } else {
            error = "unknown option " + opt;
            return std::nullopt;
        }
    }

    if (config.send && config.connect_address.empty()) {
        error = "--send requires --connect";
        return std::nullopt;
    }

    return config;
}

} // namespace l2stream::config
