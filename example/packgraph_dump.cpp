// Core API - everything you always need
#include "packgraph/packgraph.hpp"

#include <cstdlib>
#include <format>
#include <iostream>
#include <string>

using namespace packgraph;

static void usage(const char* prog) {
    std::cerr << "usage: " << prog << " [--trim] [--strict] [--utf8] [--max-depth N] [-v] [file]\n"
              << "Decodes one MessagePack value (from file or stdin) and prints it as JSON.\n";
}

int main(int argc, char** argv) {
    Logger::inst().setLevel(LogLevel::Warn);

    DecoderOptions opts;
    std::string file;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--trim") opts.trimStrings = true;
        else if (arg == "--strict") opts.strict = true;
        else if (arg == "--utf8") opts.validateUtf8 = true;
        else if (arg == "-v") Logger::inst().setLevel(LogLevel::Trace);
        else if (arg == "--max-depth" && i + 1 < argc) opts.maxDepth = static_cast<uint32_t>(std::strtoul(argv[++i], nullptr, 10));
        else if (arg == "-h" || arg == "--help") { usage(argv[0]); return 0; }
        else if (!arg.empty() && arg[0] == '-') { usage(argv[0]); return 2; }
        else file = arg;
    }

    TypeRegistry registry;
    registry.setUnknownPropertyListener([](const UnknownFieldNotice& n) {
        LOG_INFO(std::format("unknown property '{}' on '{}'", n.name, n.recordType));
    });
    MsgPackParser parser(registry, opts);

    try {
        Value v = file.empty() ? parser.parse(std::cin, TypeDescriptor::any())
                               : parser.parseFile(file, TypeDescriptor::any());
        std::cout << toJson(v).dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << '\n';
    }
    catch (const DecodeError& e) {
        const auto& f = e.failure();
        LOG_ERROR(std::format("{} at {} (offset {}): {}", toString(f.code), f.path, f.offset, f.msg));
        return 1;
    }
    return 0;
}
